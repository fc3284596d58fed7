#include "restprobe/config/ConfigLoader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace restprobe::config {

namespace {

using json::Value;

struct Section {
    std::string_view name;
    std::vector<std::string_view> keys;
};

const std::vector<std::string_view>& scalar_keys() {
    static const std::vector<std::string_view> keys{"timeout_seconds"};
    return keys;
}

const std::vector<Section>& sections() {
    static const std::vector<Section> known{
        {"output", {"mode", "directory"}},
        {"auth", {"username", "password"}},
        {"tls", {"verify"}},
        {"logging", {"format", "enabled"}},
    };
    return known;
}

std::string trim_left(std::string value) {
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }));
    return value;
}

std::string trim_right(std::string value) {
    value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) {
                    return !std::isspace(ch);
                }).base(),
                value.end());
    return value;
}

std::string trim_copy(const std::string& value) {
    return trim_right(trim_left(value));
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return line.substr(0, i);
        }
    }
    return line;
}

Value parse_yaml_scalar(const std::string& text) {
    const std::string trimmed = trim_copy(text);
    if (trimmed.empty()) {
        return Value();
    }
    if (trimmed.size() >= 2 &&
        ((trimmed.front() == '"' && trimmed.back() == '"') || (trimmed.front() == '\'' && trimmed.back() == '\''))) {
        if (trimmed.front() == '\'') {
            return Value(trimmed.substr(1, trimmed.size() - 2));
        }
        Value parsed;
        std::string error;
        if (!json::try_parse(trimmed, parsed, error) || !parsed.is_string()) {
            throw ConfigError("E_CONFIG_PARSE", "Expected string literal in YAML value: " + trimmed);
        }
        return parsed;
    }
    if (trimmed == "true" || trimmed == "True") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False") {
        return Value(false);
    }
    if (trimmed == "null" || trimmed == "~") {
        return Value();
    }

    const char* begin = trimmed.data();
    const char* end = trimmed.data() + trimmed.size();
    if (*begin == '+') {
        ++begin;
    }
    std::int64_t integer{};
    auto int_result = std::from_chars(begin, end, integer);
    if (int_result.ec == std::errc{} && int_result.ptr == end) {
        return Value(integer);
    }
    double floating{};
    auto double_result = std::from_chars(begin, end, floating);
    if (double_result.ec == std::errc{} && double_result.ptr == end) {
        return Value(floating);
    }
    return Value(trimmed);
}

std::string join_path(const std::vector<std::string>& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& key : path) {
        if (!node->is_object()) {
            return nullptr;
        }
        node = node->find(key);
        if (!node || node->is_null()) {
            return nullptr;
        }
    }
    return node;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double() && node->number_literal.empty()) {
        const double value = node->double_value;
        const double rounded = std::floor(value + 0.5);
        if (std::abs(value - rounded) < 1e-9) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

void reject_unknown_keys(const Value& document) {
    const auto& known_sections = sections();
    const auto& known_scalars = scalar_keys();
    for (const auto& [key, value] : document.object_value) {
        if (std::find(known_scalars.begin(), known_scalars.end(), key) != known_scalars.end()) {
            continue;
        }
        const auto section = std::find_if(known_sections.begin(), known_sections.end(), [&](const Section& candidate) {
            return candidate.name == key;
        });
        if (section == known_sections.end()) {
            throw ConfigError("E_CONFIG_UNKNOWN_KEY", "Unknown configuration key: " + key,
                              "Supported keys: timeout_seconds, output.*, auth.*, tls.*, logging.*");
        }
        if (value.is_null()) {
            continue;
        }
        if (!value.is_object()) {
            throw ConfigError("E_CONFIG_TYPE", "'" + key + "' section must be a mapping");
        }
        for (const auto& entry : value.object_value) {
            if (std::find(section->keys.begin(), section->keys.end(), entry.first) == section->keys.end()) {
                throw ConfigError("E_CONFIG_UNKNOWN_KEY", "Unknown configuration key: " + key + "." + entry.first);
            }
        }
    }
}

}  // namespace

Value parse_yaml(std::string_view text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack;
    stack.push_back({0, &root});

    std::istringstream input{std::string(text)};
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string content_line = trim_right(strip_comment(trim_right(line)));
        if (content_line.empty() || content_line == "---") {
            continue;
        }

        std::size_t indent = 0;
        while (indent < content_line.size() && content_line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE",
                              "YAML indentation must be multiples of two spaces (line " + std::to_string(line_number) + ")");
        }
        const std::string content = content_line.substr(indent);

        while (!stack.empty() && indent < stack.back().indent) {
            stack.pop_back();
        }
        if (stack.empty() || indent > stack.back().indent) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid indentation in YAML config (line " + std::to_string(line_number) + ")");
        }

        if (content.front() == '-') {
            throw ConfigError("E_CONFIG_PARSE",
                              "YAML sequences are not supported in configuration files (line " +
                                  std::to_string(line_number) + ")");
        }

        const auto colon = content.find(':');
        if (colon == std::string::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected ':' in YAML mapping entry (line " + std::to_string(line_number) + ")");
        }
        const std::string key = trim_copy(content.substr(0, colon));
        const std::string value_part = trim_copy(content.substr(colon + 1));
        if (key.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Empty key in YAML mapping entry (line " + std::to_string(line_number) + ")");
        }

        auto& object = stack.back().node->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            child = Value::make_object();
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }

    return root;
}

Value load_document(const std::filesystem::path& path) {
    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    const auto shown = ec ? path.string() : absolute.string();
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + shown,
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    const std::string contents = buffer.str();

    const auto first_non_space = std::find_if(contents.begin(), contents.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    const bool looks_like_json = path.extension() == ".json" || (first_non_space != contents.end() && *first_non_space == '{');

    Value document;
    if (looks_like_json) {
        std::string error;
        if (!json::try_parse(contents, document, error)) {
            throw ConfigError("E_CONFIG_PARSE", "Invalid JSON in " + shown + ": " + error);
        }
    } else {
        document = parse_yaml(contents);
    }
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    return document;
}

void apply_document(const Value& document, Config& config) {
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }
    reject_unknown_keys(document);

    Config updated = config;

    if (const auto timeout = get_int64(document, {"timeout_seconds"})) {
        if (*timeout <= 0 || *timeout > kMaxTimeoutSeconds) {
            throw ConfigError("E_CONFIG_VALUE",
                              "timeout_seconds must be between 1 and " + std::to_string(kMaxTimeoutSeconds));
        }
        updated.timeout = std::chrono::seconds(*timeout);
    }
    if (const auto mode = get_string(document, {"output", "mode"})) {
        const auto parsed = parse_output_mode(*mode);
        if (!parsed) {
            throw ConfigError("E_CONFIG_VALUE", "output.mode must be 'file' or 'stdout'");
        }
        updated.output_mode = *parsed;
    }
    if (const auto directory = get_string(document, {"output", "directory"})) {
        if (directory->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "output.directory must not be empty");
        }
        updated.output_directory = *directory;
    }
    if (const auto username = get_string(document, {"auth", "username"})) {
        updated.username = *username;
    }
    if (const auto password = get_string(document, {"auth", "password"})) {
        updated.password = *password;
    }
    if (const auto verify = get_bool(document, {"tls", "verify"})) {
        updated.verify_tls = *verify;
    }
    if (const auto format = get_string(document, {"logging", "format"})) {
        const auto parsed = parse_log_format(*format);
        if (!parsed) {
            throw ConfigError("E_CONFIG_VALUE", "logging.format must be 'text' or 'json'");
        }
        updated.log_format = *parsed;
    }
    if (const auto enabled = get_bool(document, {"logging", "enabled"})) {
        updated.log_info_enabled = *enabled;
    }

    config = std::move(updated);
}

void load_config_file(const std::filesystem::path& path, Config& config) {
    apply_document(load_document(path), config);
}

}  // namespace restprobe::config

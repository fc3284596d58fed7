#include "restprobe/json/Render.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace restprobe::json {

namespace {

constexpr std::string_view kYamlIndicators = "-?:,[]{}#&*!|>'\"%@`";

// Compared case-insensitively against the whole scalar.
constexpr std::array<std::string_view, 16> kYamlReservedWords{
    "true", "false", "yes", "no", "on", "off", "null", "~", "y", "n",
    ".nan", ".inf", "+.inf", "-.inf", "=", "<<"};

std::string escape_json_string(std::string_view value) {
    std::string escaped;
    escaped.reserve(value.size() + 2);
    escaped.push_back('"');
    for (const unsigned char ch : value) {
        switch (ch) {
            case '"':
                escaped.append("\\\"");
                break;
            case '\\':
                escaped.append("\\\\");
                break;
            case '\b':
                escaped.append("\\b");
                break;
            case '\f':
                escaped.append("\\f");
                break;
            case '\n':
                escaped.append("\\n");
                break;
            case '\r':
                escaped.append("\\r");
                break;
            case '\t':
                escaped.append("\\t");
                break;
            default:
                if (ch < 0x20 || ch == 0x7F) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                        << static_cast<int>(ch);
                    escaped.append(oss.str());
                } else {
                    escaped.push_back(static_cast<char>(ch));
                }
                break;
        }
    }
    escaped.push_back('"');
    return escaped;
}

std::string format_double(double value) {
    if (std::isnan(value)) {
        return ".nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-.inf" : ".inf";
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    std::string text = oss.str();
    if (text.find_first_of(".eE") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

bool looks_numeric(std::string_view text) {
    std::size_t index = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        index = 1;
    }
    if (index >= text.size()) {
        return false;
    }
    bool digit_seen = false;
    for (; index < text.size(); ++index) {
        const auto ch = static_cast<unsigned char>(text[index]);
        if (std::isdigit(ch) != 0) {
            digit_seen = true;
            continue;
        }
        if (ch == '.' || ch == 'e' || ch == 'E' || ch == '_' || ch == ':' || ch == '+' || ch == '-') {
            continue;
        }
        return false;
    }
    return digit_seen;
}

// 0x1F, 0b101 and their signed forms, with '_' separators.
bool looks_radix_integer(std::string_view text) {
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        text.remove_prefix(1);
    }
    if (text.size() < 3 || text[0] != '0' || (text[1] != 'x' && text[1] != 'b')) {
        return false;
    }
    const bool hex = text[1] == 'x';
    return std::all_of(text.begin() + 2, text.end(), [hex](unsigned char ch) {
        return ch == '_' || (hex ? std::isxdigit(ch) != 0 : (ch == '0' || ch == '1'));
    });
}

bool has_control_characters(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](unsigned char ch) {
        return ch < 0x20 || ch == 0x7F;
    });
}

bool needs_quoting(std::string_view text) {
    if (text.empty()) {
        return true;
    }
    if (std::find(kYamlReservedWords.begin(), kYamlReservedWords.end(), to_lower(text)) != kYamlReservedWords.end()) {
        return true;
    }
    if (looks_numeric(text) || looks_radix_integer(text)) {
        return true;
    }
    if (kYamlIndicators.find(text.front()) != std::string_view::npos) {
        return true;
    }
    if (std::isspace(static_cast<unsigned char>(text.front())) != 0 ||
        std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        return true;
    }
    if (text.back() == ':') {
        return true;
    }
    return text.find(": ") != std::string_view::npos || text.find(" #") != std::string_view::npos;
}

std::string yaml_string(std::string_view text) {
    if (has_control_characters(text)) {
        return escape_json_string(text);
    }
    if (!needs_quoting(text)) {
        return std::string(text);
    }
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted.push_back('\'');
    for (const char ch : text) {
        if (ch == '\'') {
            quoted.push_back('\'');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('\'');
    return quoted;
}

std::string yaml_scalar(const Value& value) {
    switch (value.type) {
        case ValueType::Null:
            return "null";
        case ValueType::Boolean:
            return value.boolean_value ? "true" : "false";
        case ValueType::Integer:
            return std::to_string(value.integer_value);
        case ValueType::Double:
            if (!value.number_literal.empty()) {
                return value.number_literal;
            }
            return format_double(value.double_value);
        case ValueType::String:
            return yaml_string(value.string_value);
        case ValueType::Object:
            return "{}";
        case ValueType::Array:
            return "[]";
    }
    return "null";
}

bool is_inline(const Value& value) {
    return value.is_scalar() || (value.is_object() && value.object_value.empty()) ||
           (value.is_array() && value.array_value.empty());
}

class YamlWriter {
public:
    std::string render(const Value& root) {
        if (is_inline(root)) {
            out_.append(yaml_scalar(root));
            out_.push_back('\n');
        } else if (root.is_object()) {
            write_mapping(root, 0, {});
        } else {
            write_sequence(root, 0, {});
        }
        return std::move(out_);
    }

private:
    // first_prefix, when set, replaces the indentation of the first line so a
    // collection can start on the same line as its parent "- " marker.
    void write_mapping(const Value& mapping, std::size_t indent, std::string first_prefix) {
        bool first = true;
        for (const auto& [key, child] : mapping.object_value) {
            out_.append(first && !first_prefix.empty() ? first_prefix : std::string(indent, ' '));
            first = false;
            out_.append(yaml_string(key));
            out_.push_back(':');
            if (is_inline(child)) {
                out_.push_back(' ');
                out_.append(yaml_scalar(child));
                out_.push_back('\n');
            } else if (child.is_object()) {
                out_.push_back('\n');
                write_mapping(child, indent + 2, {});
            } else {
                out_.push_back('\n');
                write_sequence(child, indent, {});
            }
        }
    }

    void write_sequence(const Value& sequence, std::size_t indent, std::string first_prefix) {
        bool first = true;
        for (const auto& item : sequence.array_value) {
            std::string marker = first && !first_prefix.empty() ? first_prefix : std::string(indent, ' ');
            first = false;
            marker.append("- ");
            if (is_inline(item)) {
                out_.append(marker);
                out_.append(yaml_scalar(item));
                out_.push_back('\n');
            } else if (item.is_object()) {
                write_mapping(item, indent + 2, std::move(marker));
            } else {
                write_sequence(item, indent + 2, std::move(marker));
            }
        }
    }

    std::string out_;
};

void write_pretty(const Value& value, int indent_width, int depth, std::string& out) {
    const auto pad = [&](int level) {
        out.append(static_cast<std::size_t>(std::max(0, level * indent_width)), ' ');
    };
    switch (value.type) {
        case ValueType::Null:
            out.append("null");
            return;
        case ValueType::Boolean:
            out.append(value.boolean_value ? "true" : "false");
            return;
        case ValueType::Integer:
            out.append(std::to_string(value.integer_value));
            return;
        case ValueType::Double: {
            if (!value.number_literal.empty()) {
                out.append(value.number_literal);
                return;
            }
            if (!std::isfinite(value.double_value)) {
                out.append("null");
                return;
            }
            std::ostringstream oss;
            oss << std::setprecision(15) << value.double_value;
            out.append(oss.str());
            return;
        }
        case ValueType::String:
            out.append(escape_json_string(value.string_value));
            return;
        case ValueType::Object: {
            if (value.object_value.empty()) {
                out.append("{}");
                return;
            }
            out.append(indent_width > 0 ? "{\n" : "{");
            std::size_t index = 0;
            for (const auto& [key, child] : value.object_value) {
                pad(depth + 1);
                out.append(escape_json_string(key));
                out.append(indent_width > 0 ? ": " : ":");
                write_pretty(child, indent_width, depth + 1, out);
                if (++index < value.object_value.size()) {
                    out.push_back(',');
                }
                if (indent_width > 0) {
                    out.push_back('\n');
                }
            }
            pad(depth);
            out.push_back('}');
            return;
        }
        case ValueType::Array: {
            if (value.array_value.empty()) {
                out.append("[]");
                return;
            }
            out.append(indent_width > 0 ? "[\n" : "[");
            for (std::size_t i = 0; i < value.array_value.size(); ++i) {
                pad(depth + 1);
                write_pretty(value.array_value[i], indent_width, depth + 1, out);
                if (i + 1 < value.array_value.size()) {
                    out.push_back(',');
                }
                if (indent_width > 0) {
                    out.push_back('\n');
                }
            }
            pad(depth);
            out.push_back(']');
            return;
        }
    }
}

}  // namespace

std::string to_yaml(const Value& value) {
    YamlWriter writer;
    return writer.render(value);
}

std::string to_pretty_json(const Value& value, int indent_width) {
    std::string out;
    write_pretty(value, indent_width, 0, out);
    return out;
}

}  // namespace restprobe::json

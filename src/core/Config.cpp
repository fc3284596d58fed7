#include "restprobe/Config.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace restprobe {

namespace {

std::string to_lower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lowered;
}

}  // namespace

std::string_view output_mode_to_string(Config::OutputMode mode) {
    switch (mode) {
        case Config::OutputMode::Stdout:
            return "stdout";
        case Config::OutputMode::File:
            return "file";
    }
    return "stdout";
}

std::optional<Config::OutputMode> parse_output_mode(std::string_view text) {
    const auto value = to_lower(text);
    if (value == "stdout") {
        return Config::OutputMode::Stdout;
    }
    if (value == "file") {
        return Config::OutputMode::File;
    }
    return std::nullopt;
}

std::string_view log_format_to_string(Config::LogFormat format) {
    switch (format) {
        case Config::LogFormat::Text:
            return "text";
        case Config::LogFormat::Json:
            return "json";
    }
    return "text";
}

std::optional<Config::LogFormat> parse_log_format(std::string_view text) {
    const auto value = to_lower(text);
    if (value == "text") {
        return Config::LogFormat::Text;
    }
    if (value == "json") {
        return Config::LogFormat::Json;
    }
    return std::nullopt;
}

}  // namespace restprobe

#pragma once

#include "restprobe/Config.hpp"
#include "restprobe/json/Json.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace restprobe::config {

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {})
        : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
        if (!code.empty()) {
            formatted = "[" + code + "] " + message;
        } else {
            formatted = message;
        }
    }

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Indentation-based YAML limited to nested mappings and scalars.
json::Value parse_yaml(std::string_view text);

// JSON when the file is named *.json or starts with '{', YAML otherwise. The
// root must be a mapping.
json::Value load_document(const std::filesystem::path& path);

// Overlays the recognised keys of document onto config. Unknown keys, wrong
// types and out-of-range values throw ConfigError and leave config untouched.
void apply_document(const json::Value& document, Config& config);

void load_config_file(const std::filesystem::path& path, Config& config);

}  // namespace restprobe::config

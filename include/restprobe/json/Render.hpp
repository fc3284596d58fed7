#pragma once

#include "restprobe/json/Json.hpp"

#include <string>

namespace restprobe::json {

// Block-style YAML with sorted mapping keys and indentless sequences, the
// layout PyYAML's safe dump produces for the same document.
std::string to_yaml(const Value& value);

// Indented JSON for console display. An indent width of 0 yields a single line.
std::string to_pretty_json(const Value& value, int indent_width = 2);

}  // namespace restprobe::json

#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace execrelay {

// Human label for a generic tool invocation ("read: src/main.cpp", the raw
// command for shell tools, the tool name otherwise). Tool names compare
// case-insensitively; path arguments are read from file_path, filePath or path.
std::string tool_label(const std::string& tool_name, const nlohmann::json& input);

// Flatten a tool result payload (string, list of {text} blocks, {text} object)
// to plain text.
std::string tool_result_text(const nlohmann::json& content);

} // namespace execrelay

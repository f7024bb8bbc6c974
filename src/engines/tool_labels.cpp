#include "tool_labels.hpp"
#include "wire.hpp"
#include "../util.hpp"

namespace execrelay {

static std::string input_path(const nlohmann::json& input) {
    for (const char* key : {"file_path", "filePath", "path"}) {
        std::string value = string_field(input, key);
        if (!value.empty()) return value;
    }
    return {};
}

static std::string with_arg(const char* verb, const std::string& arg) {
    if (arg.empty()) return verb;
    return std::string(verb) + ": " + arg;
}

std::string tool_label(const std::string& tool_name, const nlohmann::json& input) {
    std::string name = to_lower(tool_name);

    if (name == "bash" || name == "shell" || name == "killshell") {
        std::string command = string_field(input, "command");
        return command.empty() ? tool_name : command;
    }
    if (name == "edit" || name == "write" || name == "multiedit" || name == "notebookedit") {
        return with_arg("edit", input_path(input));
    }
    if (name == "read") {
        return with_arg("read", input_path(input));
    }
    if (name == "glob") {
        return with_arg("glob", string_field(input, "pattern"));
    }
    if (name == "grep") {
        return with_arg("grep", string_field(input, "pattern"));
    }
    if (name == "websearch" || name == "web_search") {
        return with_arg("search", string_field(input, "query"));
    }
    if (name == "webfetch" || name == "web_fetch") {
        return with_arg("fetch", string_field(input, "url"));
    }
    if (name == "todowrite") return "update todos";
    if (name == "todoread") return "read todos";
    if (name == "task" || name == "agent") {
        std::string desc = string_field(input, "description");
        if (desc.empty()) desc = string_field(input, "prompt");
        return with_arg("task", desc);
    }
    return tool_name.empty() ? "tool" : tool_name;
}

std::string tool_result_text(const nlohmann::json& content) {
    if (content.is_null()) return {};
    if (content.is_string()) return content.get<std::string>();
    if (content.is_array()) {
        std::string out;
        for (const auto& part : content) {
            std::string text;
            if (part.is_string()) {
                text = part.get<std::string>();
            } else {
                text = string_field(part, "text");
            }
            if (text.empty()) continue;
            if (!out.empty()) out += '\n';
            out += text;
        }
        return out;
    }
    if (content.is_object()) {
        if (content.contains("text") && content["text"].is_string()) {
            return content["text"].get<std::string>();
        }
    }
    return content.dump();
}

} // namespace execrelay

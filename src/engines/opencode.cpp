#include "opencode.hpp"
#include "tool_labels.hpp"
#include "wire.hpp"
#include "../engine.hpp"
#include <regex>

static execrelay::EngineRegistrar reg_opencode(execrelay::EngineDescriptor{
    "opencode",
    execrelay::decode_opencode_event,
    "opencode",
    [](const std::string& prompt, const std::string& resume,
       const std::vector<std::string>& extra_args) {
        std::vector<std::string> args{"run", "--format", "json"};
        if (!resume.empty()) {
            args.insert(args.end(), {"--session", resume});
        }
        args.insert(args.end(), extra_args.begin(), extra_args.end());
        args.insert(args.end(), {"--", prompt});
        return args;
    },
    false,
    [](const std::string& token) { return "`opencode --session " + token + "`"; },
    [](const std::string& text) {
        static const std::regex re(
            R"(^\s*`?opencode(?:\s+run)?\s+(?:--session|-s)\s+(ses_[A-Za-z0-9]+)`?\s*$)",
            std::regex::icase);
        return execrelay::last_line_match(text, re);
    },
});

namespace execrelay {

static std::string error_message(const nlohmann::json& j) {
    const nlohmann::json* raw = nullptr;
    if (j.contains("message") && !j["message"].is_null()) {
        raw = &j["message"];
    } else if (j.contains("error") && !j["error"].is_null()) {
        raw = &j["error"];
    }
    if (raw == nullptr) return "opencode error";
    if (raw->is_string()) return raw->get<std::string>();
    if (raw->is_object()) {
        std::string nested = string_field(object_field(*raw, "data"), "message");
        if (!nested.empty()) return nested;
        std::string message = string_field(*raw, "message");
        if (!message.empty()) return message;
        std::string name = string_field(*raw, "name");
        if (!name.empty()) return name;
        return "opencode error";
    }
    return raw->dump();
}

static std::vector<Event> decode_tool_use(const nlohmann::json& j,
                                          const nlohmann::json& part) {
    std::string call_id = string_field(part, "callID");
    if (call_id.empty()) call_id = string_field(part, "id");
    if (call_id.empty()) {
        return {ItemCompleted{unknown_item("", "tool_use", j)}};
    }

    const auto& state = object_field(part, "state");
    std::string status = string_field(state, "status");

    CommandExecutionItem cmd;
    cmd.id = call_id;
    cmd.command = tool_label(string_field(part, "tool", "tool"), object_field(state, "input"));
    std::string title = string_field(state, "title");
    if (!title.empty()) cmd.command = title;

    if (status == "completed") {
        cmd.aggregated_output = string_field(state, "output");
        cmd.exit_code = int_field(object_field(state, "metadata"), "exit");
        bool failed = cmd.exit_code.has_value() && *cmd.exit_code != 0;
        cmd.status = failed ? ItemStatus::Failed : ItemStatus::Completed;
        return {ItemCompleted{cmd}};
    }
    if (status == "error") {
        const auto& err = state.contains("error") ? state["error"] : nlohmann::json();
        cmd.aggregated_output = err.is_string() ? err.get<std::string>()
                                                : (err.is_null() ? "" : err.dump());
        cmd.exit_code = int_field(object_field(state, "metadata"), "exit");
        cmd.status = ItemStatus::Failed;
        return {ItemCompleted{cmd}};
    }
    cmd.status = ItemStatus::InProgress;
    return {ItemStarted{cmd}};
}

std::vector<Event> decode_opencode_event(const std::string& line) {
    std::string type;
    nlohmann::json j = parse_envelope(line, "type", type);
    const auto& part = object_field(j, "part");

    if (type == "step_start") {
        return {TurnStarted{}};
    }
    if (type == "tool_use") {
        return decode_tool_use(j, part);
    }
    if (type == "text") {
        return {ItemCompleted{AgentMessageItem{string_field(part, "id"),
                                               string_field(part, "text")}}};
    }
    if (type == "step_finish") {
        if (string_field(part, "reason") == "tool-calls") {
            return {ItemCompleted{unknown_item(string_field(part, "id"), "step_finish", j)}};
        }
        const auto& tokens = object_field(part, "tokens");
        TokenUsage u;
        u.input_tokens = count_field(tokens, "input");
        u.cached_input_tokens = count_field(object_field(tokens, "cache"), "read");
        u.output_tokens = count_field(tokens, "output");
        return {TurnCompleted{u}};
    }
    if (type == "error") {
        return {StreamError{error_message(j)}};
    }
    throw DecodeError("unrecognized opencode event type: " + type);
}

} // namespace execrelay

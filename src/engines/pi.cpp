#include "pi.hpp"
#include "tool_labels.hpp"
#include "wire.hpp"
#include "../engine.hpp"
#include "../util.hpp"
#include <regex>

static execrelay::EngineRegistrar reg_pi(execrelay::EngineDescriptor{
    "pi",
    execrelay::decode_pi_event,
    "pi",
    [](const std::string& prompt, const std::string& resume,
       const std::vector<std::string>& extra_args) {
        std::vector<std::string> args = extra_args;
        args.insert(args.end(), {"--print", "--mode", "json"});
        if (!resume.empty()) {
            args.insert(args.end(), {"--session", resume});
        }
        // pi treats a leading "-" as an option even after other flags
        args.push_back(!prompt.empty() && prompt[0] == '-' ? " " + prompt : prompt);
        return args;
    },
    false,
    [](const std::string& token) {
        bool needs_quotes = token.find_first_of(" \t\n") != std::string::npos;
        return "`pi --session " + (needs_quotes ? "\"" + token + "\"" : token) + "`";
    },
    [](const std::string& text) -> std::optional<std::string> {
        static const std::regex re(R"(^\s*`?pi\s+--session\s+(.+?)`?\s*$)",
                                   std::regex::icase);
        auto token = execrelay::last_line_match(text, re);
        if (!token) return std::nullopt;
        std::string value = execrelay::trim(*token);
        if (value.size() >= 2 && value.front() == value.back() &&
            (value.front() == '"' || value.front() == '\'')) {
            value = value.substr(1, value.size() - 2);
        }
        return value;
    },
});

namespace execrelay {

static const std::vector<std::string> kProgressKinds = {
    "agent_start", "message_start", "message_update", "tool_execution_update",
    "auto_compaction_start", "auto_retry_start",
};

static const std::vector<std::string> kFinishedKinds = {
    "turn_end", "auto_compaction_end", "auto_retry_end",
};

static bool contains(const std::vector<std::string>& kinds, const std::string& kind) {
    for (const auto& k : kinds) {
        if (k == kind) return true;
    }
    return false;
}

// Joined text of all {"type":"text"} blocks, trimmed.
static std::string text_blocks(const nlohmann::json& content) {
    if (!content.is_array()) return {};
    std::string out;
    for (const auto& block : content) {
        if (string_field(block, "type") != "text") continue;
        out += string_field(block, "text");
    }
    return trim(out);
}

static TokenUsage usage_of(const nlohmann::json& message) {
    const auto& usage = object_field(message, "usage");
    TokenUsage u;
    u.input_tokens = count_field(usage, "input");
    u.cached_input_tokens = count_field(usage, "cacheRead");
    u.output_tokens = count_field(usage, "output");
    return u;
}

static std::string assistant_error(const nlohmann::json& message) {
    std::string stop_reason = string_field(message, "stopReason");
    if (stop_reason != "error" && stop_reason != "aborted") return {};
    std::string error = string_field(message, "errorMessage");
    return error.empty() ? "pi run " + stop_reason : error;
}

// Scopes reasoning ids to one message. Empty when the message carries
// neither a responseId nor a timestamp, so each entry is appended.
static std::string message_key(const nlohmann::json& message) {
    std::string response_id = string_field(message, "responseId");
    if (!response_id.empty()) return response_id;
    if (message.contains("timestamp")) {
        const auto& ts = message["timestamp"];
        if (ts.is_string()) return ts.get<std::string>();
        if (ts.is_number()) return ts.dump();
    }
    return {};
}

static std::vector<Event> decode_message_end(const nlohmann::json& j) {
    const auto& message = object_field(j, "message");
    std::string role = string_field(message, "role");
    if (role != "assistant") {
        return {ItemCompleted{unknown_item("", "message_end:" + role, j)}};
    }

    std::vector<Event> out;
    const nlohmann::json content = message.contains("content") ? message["content"]
                                                               : nlohmann::json();
    if (content.is_array()) {
        std::string key = message_key(message);
        size_t index = 0;
        for (const auto& block : content) {
            if (string_field(block, "type") != "thinking") continue;
            std::string thinking = string_field(block, "thinking");
            if (thinking.empty()) continue;
            std::string id = key.empty()
                ? std::string()
                : key + ".thinking." + std::to_string(index);
            ++index;
            out.push_back(ItemCompleted{ReasoningItem{id, thinking}});
        }
    }
    std::string text = text_blocks(content);
    if (!text.empty()) {
        out.push_back(ItemCompleted{AgentMessageItem{"", text}});
    }
    if (out.empty()) {
        out.push_back(ItemCompleted{unknown_item("", "message_end:assistant", j)});
    }
    return out;
}

static std::vector<Event> decode_agent_end(const nlohmann::json& j) {
    const nlohmann::json* last_assistant = nullptr;
    if (j.contains("messages") && j["messages"].is_array()) {
        for (const auto& m : j["messages"]) {
            if (string_field(m, "role") == "assistant") last_assistant = &m;
        }
    }
    if (last_assistant == nullptr) {
        return {TurnCompleted{}};
    }
    std::string error = assistant_error(*last_assistant);
    if (!error.empty()) {
        return {StreamError{error}};
    }
    return {TurnCompleted{usage_of(*last_assistant)}};
}

std::vector<Event> decode_pi_event(const std::string& line) {
    std::string type;
    nlohmann::json j = parse_envelope(line, "type", type);

    if (type == "session") {
        return {ThreadStarted{string_field(j, "id")}};
    }
    if (type == "turn_start") {
        return {TurnStarted{}};
    }
    if (type == "tool_execution_start" || type == "tool_execution_end") {
        std::string call_id = string_field(j, "toolCallId");
        if (call_id.empty()) throw DecodeError(type + " without toolCallId");

        CommandExecutionItem cmd;
        cmd.id = call_id;
        cmd.command = tool_label(string_field(j, "toolName", "tool"), object_field(j, "args"));
        if (type == "tool_execution_start") {
            return {ItemStarted{cmd}};
        }
        cmd.aggregated_output = j.contains("result") ? tool_result_text(j["result"])
                                                     : std::string();
        cmd.status = bool_field(j, "isError") ? ItemStatus::Failed : ItemStatus::Completed;
        return {ItemCompleted{cmd}};
    }
    if (type == "message_end") {
        return decode_message_end(j);
    }
    if (type == "agent_end") {
        return decode_agent_end(j);
    }
    if (contains(kProgressKinds, type)) {
        return {ItemStarted{unknown_item("", type, j)}};
    }
    if (contains(kFinishedKinds, type)) {
        return {ItemCompleted{unknown_item("", type, j)}};
    }
    throw DecodeError("unrecognized pi event type: " + type);
}

} // namespace execrelay

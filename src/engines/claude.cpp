#include "claude.hpp"
#include "tool_labels.hpp"
#include "wire.hpp"
#include "../engine.hpp"
#include <regex>

static execrelay::EngineRegistrar reg_claude(execrelay::EngineDescriptor{
    "claude",
    execrelay::decode_claude_event,
    "claude",
    [](const std::string& prompt, const std::string& resume,
       const std::vector<std::string>& extra_args) {
        std::vector<std::string> args{"-p", "--output-format", "stream-json", "--verbose"};
        if (!resume.empty()) {
            args.insert(args.end(), {"--resume", resume});
        }
        args.insert(args.end(), extra_args.begin(), extra_args.end());
        args.insert(args.end(), {"--", prompt});
        return args;
    },
    false,
    [](const std::string& token) { return "`claude --resume " + token + "`"; },
    [](const std::string& text) {
        static const std::regex re(R"(^\s*`?claude\s+(?:--resume|-r)\s+([^`\s]+)`?\s*$)",
                                   std::regex::icase);
        return execrelay::last_line_match(text, re);
    },
});

namespace execrelay {

static std::vector<Event> decode_assistant(const nlohmann::json& j) {
    const auto& message = object_field(j, "message");
    std::string message_id = string_field(message, "id");
    std::vector<Event> out;

    if (message.contains("content") && message["content"].is_array()) {
        size_t index = 0;
        for (const auto& block : message["content"]) {
            std::string block_type = string_field(block, "type");
            std::string block_id = message_id + "#" + std::to_string(index++);

            if (block_type == "tool_use") {
                CommandExecutionItem cmd;
                cmd.id = string_field(block, "id", block_id);
                cmd.command = tool_label(string_field(block, "name", "tool"),
                                         object_field(block, "input"));
                out.push_back(ItemStarted{cmd});
            } else if (block_type == "thinking") {
                // Without a message id the block index repeats across messages.
                std::string reasoning_id = message_id.empty() ? std::string() : block_id;
                out.push_back(ItemCompleted{
                    ReasoningItem{reasoning_id, string_field(block, "thinking")}});
            } else if (block_type == "text") {
                std::string text = string_field(block, "text");
                if (text.empty()) continue;
                out.push_back(ItemCompleted{AgentMessageItem{message_id, text}});
            } else {
                out.push_back(ItemCompleted{unknown_item(
                    block_id, block_type.empty() ? "content" : block_type, block)});
            }
        }
    }

    if (out.empty()) {
        out.push_back(ItemCompleted{unknown_item(message_id, "assistant", j)});
    }
    return out;
}

static std::vector<Event> decode_user(const nlohmann::json& j) {
    const auto& message = object_field(j, "message");
    if (!message.contains("content") || !message["content"].is_array()) {
        return {ItemCompleted{unknown_item("", "user", j)}};
    }

    std::vector<Event> out;
    for (const auto& block : message["content"]) {
        if (string_field(block, "type") != "tool_result") continue;
        CommandExecutionItem cmd;
        cmd.id = string_field(block, "tool_use_id");
        cmd.aggregated_output = block.contains("content")
            ? tool_result_text(block["content"]) : std::string();
        cmd.status = bool_field(block, "is_error") ? ItemStatus::Failed
                                                   : ItemStatus::Completed;
        out.push_back(ItemCompleted{cmd});
    }

    if (out.empty()) {
        out.push_back(ItemCompleted{unknown_item("", "user", j)});
    }
    return out;
}

static std::vector<Event> decode_result(const nlohmann::json& j) {
    std::string result = string_field(j, "result");

    if (bool_field(j, "is_error")) {
        if (!result.empty()) return {StreamError{result}};
        std::string subtype = string_field(j, "subtype");
        if (!subtype.empty()) return {StreamError{"claude run failed (" + subtype + ")"}};
        return {StreamError{"claude run failed"}};
    }

    std::vector<Event> out;
    if (!result.empty()) {
        out.push_back(ItemCompleted{AgentMessageItem{"result", result}});
    }
    const auto& usage = object_field(j, "usage");
    TokenUsage u;
    u.input_tokens = count_field(usage, "input_tokens");
    u.cached_input_tokens = count_field(usage, "cache_read_input_tokens");
    u.output_tokens = count_field(usage, "output_tokens");
    out.push_back(TurnCompleted{u});
    return out;
}

std::vector<Event> decode_claude_event(const std::string& line) {
    std::string type;
    nlohmann::json j = parse_envelope(line, "type", type);

    if (type == "system") {
        std::string subtype = string_field(j, "subtype");
        std::string session_id = string_field(j, "session_id");
        if (subtype == "init" && !session_id.empty()) {
            return {ThreadStarted{session_id}, TurnStarted{}};
        }
        return {ItemCompleted{unknown_item("", "system:" + subtype, j)}};
    }
    if (type == "assistant") return decode_assistant(j);
    if (type == "user") return decode_user(j);
    if (type == "result") return decode_result(j);
    if (type == "stream_event") {
        return {ItemStarted{unknown_item("", "stream_event", j)}};
    }
    throw DecodeError("unrecognized claude message type: " + type);
}

} // namespace execrelay

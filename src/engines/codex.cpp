#include "codex.hpp"
#include "wire.hpp"
#include "../engine.hpp"
#include <regex>

static execrelay::EngineRegistrar reg_codex(execrelay::EngineDescriptor{
    "codex",
    execrelay::decode_codex_event,
    "codex",
    [](const std::string& /*prompt*/, const std::string& resume,
       const std::vector<std::string>& extra_args) {
        std::vector<std::string> args = extra_args;
        args.insert(args.end(), {"exec", "--skip-git-repo-check", "--json"});
        if (!resume.empty()) {
            args.insert(args.end(), {"resume", resume});
        }
        args.push_back("-");
        return args;
    },
    true,
    [](const std::string& token) { return "`codex resume " + token + "`"; },
    [](const std::string& text) {
        static const std::regex re(R"(^\s*`?codex\s+resume\s+([^`\s]+)`?\s*$)",
                                   std::regex::icase);
        return execrelay::last_line_match(text, re);
    },
});

namespace execrelay {

static ItemStatus parse_status(const std::string& status) {
    if (status == "completed") return ItemStatus::Completed;
    if (status == "failed" || status == "declined") return ItemStatus::Failed;
    return ItemStatus::InProgress;
}

// "edit: a.cpp, b.cpp", or "updated N files" when no change names a path.
static std::string change_label(const nlohmann::json& item) {
    std::string paths;
    size_t total = 0;
    if (item.contains("changes") && item["changes"].is_array()) {
        for (const auto& change : item["changes"]) {
            ++total;
            std::string path = string_field(change, "path");
            if (path.empty()) continue;
            if (!paths.empty()) paths += ", ";
            paths += path;
        }
    }
    if (!paths.empty()) return "edit: " + paths;
    if (total == 0) return "updated files";
    return "updated " + std::to_string(total) + (total == 1 ? " file" : " files");
}

static std::string mcp_label(const nlohmann::json& item) {
    std::string server = string_field(item, "server");
    std::string tool = string_field(item, "tool");
    std::string name = server;
    if (!tool.empty()) name += (name.empty() ? "" : ".") + tool;
    return name.empty() ? "tool" : "tool: " + name;
}

static Item decode_item(const nlohmann::json& item) {
    std::string type = string_field(item, "type");
    std::string id = string_field(item, "id");

    // Non-shell work is tracked as an action under a readable label.
    if (type == "file_change" || type == "mcp_tool_call" || type == "web_search" ||
        type == "todo_list") {
        CommandExecutionItem action;
        action.id = id;
        action.status = parse_status(string_field(item, "status"));
        if (type == "file_change") {
            action.command = change_label(item);
        } else if (type == "mcp_tool_call") {
            action.command = mcp_label(item);
            if (item.contains("error") && item["error"].is_object()) {
                action.aggregated_output = string_field(item["error"], "message", "tool error");
                action.status = ItemStatus::Failed;
            }
        } else if (type == "web_search") {
            std::string query = string_field(item, "query");
            action.command = query.empty() ? "search" : "search: " + query;
        } else {
            action.command = "update todos";
        }
        return action;
    }

    if (type == "reasoning") {
        return ReasoningItem{id, string_field(item, "text")};
    }
    if (type == "command_execution") {
        CommandExecutionItem cmd;
        cmd.id = id;
        cmd.command = string_field(item, "command");
        cmd.aggregated_output = string_field(item, "aggregated_output");
        cmd.exit_code = int_field(item, "exit_code");
        cmd.status = parse_status(string_field(item, "status"));
        return cmd;
    }
    if (type == "agent_message") {
        return AgentMessageItem{id, string_field(item, "text")};
    }
    return unknown_item(id, type.empty() ? "item" : type, item);
}

static const nlohmann::json& require_item(const nlohmann::json& j) {
    if (!j.contains("item") || !j["item"].is_object()) {
        throw DecodeError("item event without an item object");
    }
    return j["item"];
}

// Transient "Reconnecting... 2/5" stream errors are progress, not failure.
static bool is_reconnect_message(const std::string& message) {
    static const std::regex re(R"(^Reconnecting\.{3}\s*\d+/\d+\s*$)", std::regex::icase);
    return std::regex_match(message, re);
}

std::vector<Event> decode_codex_event(const std::string& line) {
    std::string type;
    nlohmann::json j = parse_envelope(line, "type", type);

    if (type == "thread.started") {
        std::string thread_id = string_field(j, "thread_id");
        if (thread_id.empty()) throw DecodeError("thread.started without thread_id");
        return {ThreadStarted{thread_id}};
    }
    if (type == "turn.started") {
        return {TurnStarted{}};
    }
    if (type == "turn.completed") {
        const auto& usage = object_field(j, "usage");
        TokenUsage u;
        u.input_tokens = count_field(usage, "input_tokens");
        u.cached_input_tokens = count_field(usage, "cached_input_tokens");
        u.output_tokens = count_field(usage, "output_tokens");
        return {TurnCompleted{u}};
    }
    if (type == "turn.failed") {
        std::string message = string_field(object_field(j, "error"), "message",
                                           "turn failed");
        return {StreamError{message}};
    }
    if (type == "error") {
        std::string message = string_field(j, "message", "stream error");
        if (is_reconnect_message(message)) {
            return {ItemStarted{unknown_item("codex.reconnect", "reconnect", j)}};
        }
        return {StreamError{message}};
    }
    if (type == "item.started" || type == "item.updated") {
        return {ItemStarted{decode_item(require_item(j))}};
    }
    if (type == "item.completed") {
        return {ItemCompleted{decode_item(require_item(j))}};
    }
    throw DecodeError("unrecognized codex event type: " + type);
}

} // namespace execrelay

#include "renderer.hpp"
#include "util.hpp"
#include <cstdio>

namespace execrelay {

using Lines = std::vector<std::string>;

std::string format_elapsed(double elapsed_s) {
    long long total = elapsed_s > 0 ? static_cast<long long>(elapsed_s) : 0;
    long long seconds = total % 60;
    long long minutes = (total / 60) % 60;
    long long hours = total / 3600;

    char buf[48];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%lldh %02lldm", hours, minutes);
    } else if (minutes > 0) {
        std::snprintf(buf, sizeof(buf), "%lldm %02llds", minutes, seconds);
    } else {
        std::snprintf(buf, sizeof(buf), "%llds", seconds);
    }
    return buf;
}

std::string format_header(double elapsed_s, int turn, const std::string& label) {
    return label + kHeaderSep + format_elapsed(elapsed_s) + kHeaderSep +
           "turn " + std::to_string(turn);
}

static std::string format_command(const std::string& label, size_t width) {
    std::string command = one_line(label);
    if (width > 0) command = shorten(command, width);
    return "`" + command + "`";
}

static std::string exit_suffix(const std::optional<int>& exit_code) {
    if (!exit_code.has_value()) return {};
    return " (exit " + std::to_string(*exit_code) + ")";
}

static std::string numbered(size_t number, const std::string& rest) {
    return "[" + std::to_string(number) + "] " + rest;
}

static std::string action_line(size_t number, const std::string& label, ActionStatus status,
                               const std::optional<int>& exit_code, size_t width) {
    std::string command = format_command(label, width);
    switch (status) {
        case ActionStatus::Pending:
            return numbered(number, "· pending: " + command);
        case ActionStatus::Running:
            return numbered(number, std::string(kStatusRunning) + " running: " + command);
        case ActionStatus::Done:
            return numbered(number, std::string(kStatusDone) + " ran: " + command +
                                    exit_suffix(exit_code));
        case ActionStatus::Failed:
            return numbered(number, std::string(kStatusFailed) + " failed: " + command +
                                    exit_suffix(exit_code));
    }
    return numbered(number, command);
}

// ── CLI trace ───────────────────────────────────────────────────

static Lines cli_item_started(const Item& item, const RenderState& state) {
    return std::visit(overloaded{
        [&state](const CommandExecutionItem& cmd) -> Lines {
            return {action_line(state.action_number(cmd.id), cmd.command,
                                ActionStatus::Running, std::nullopt, 0)};
        },
        [](const ReasoningItem&) -> Lines { return {}; },
        [](const AgentMessageItem&) -> Lines { return {}; },
        [](const UnknownItem&) -> Lines { return {}; },
    }, item);
}

static Lines cli_item_completed(const Item& item, const RenderState& state) {
    return std::visit(overloaded{
        [&state](const CommandExecutionItem& cmd) -> Lines {
            std::string label = cmd.command;
            if (label.empty()) {
                const ActionRecord* record = state.find_action(cmd.id);
                label = record ? record->command_label : "tool result";
            }
            return {action_line(state.action_number(cmd.id), label,
                                completion_status(cmd), cmd.exit_code, 0)};
        },
        [](const ReasoningItem& reasoning) -> Lines {
            std::string first = trim(reasoning.text);
            first = first.substr(0, first.find('\n'));
            if (first.empty()) return {};
            return {"reasoning: " + trim(first)};
        },
        [](const AgentMessageItem& message) -> Lines {
            Lines lines{"assistant:"};
            for (const auto& line : split(message.text, '\n')) {
                std::string text = line;
                if (!text.empty() && text.back() == '\r') text.pop_back();
                lines.push_back(trim(text).empty() ? std::string() : "  " + text);
            }
            return lines;
        },
        [](const UnknownItem& unknown) -> Lines {
            return {"[?] " + unknown.raw_kind};
        },
    }, item);
}

std::vector<std::string> render_event_cli(const Event& event, const RenderState& state) {
    return std::visit(overloaded{
        [](const ThreadStarted&) -> Lines { return {"thread started"}; },
        [](const TurnStarted&) -> Lines { return {"turn started"}; },
        [](const TurnCompleted&) -> Lines { return {"turn completed"}; },
        [&state](const ItemStarted& e) { return cli_item_started(e.item, state); },
        [&state](const ItemCompleted& e) { return cli_item_completed(e.item, state); },
        [](const StreamError& e) -> Lines { return {"stream error: " + e.message}; },
    }, event);
}

// ── Progress / final ────────────────────────────────────────────

static std::string assemble(const std::string& header, const Lines& body) {
    if (body.empty()) return header;
    std::string out = header + "\n\n";
    for (size_t i = 0; i < body.size(); ++i) {
        if (i > 0) out += '\n';
        out += body[i];
    }
    return out;
}

std::string ProgressRenderer::render_progress(double elapsed_s) const {
    const RenderBudget& budget = state_.budget();
    const size_t max_chars = static_cast<size_t>(budget.max_chars);
    const size_t max_actions = static_cast<size_t>(budget.max_actions);
    const size_t width = static_cast<size_t>(budget.command_width);

    RunStatus status = state_.run_status();
    std::string label = (status == RunStatus::Working || status == RunStatus::Done)
        ? "working" : run_status_to_string(status);
    std::string header = format_header(elapsed_s, state_.turn_count(), label);

    const auto& actions = state_.actions();
    size_t first = actions.size() > max_actions ? actions.size() - max_actions : 0;
    Lines action_lines;
    for (size_t i = first; i < actions.size(); ++i) {
        const auto& a = actions[i];
        action_lines.push_back(action_line(i + 1, a.command_label, a.status, a.exit_code, width));
    }

    std::string preview;
    if (state_.answer_text() && !state_.answer_text()->empty()) {
        preview = "assistant: " + shorten(one_line(*state_.answer_text()), kPreviewWidth);
    }

    size_t start = 0;
    auto build = [&](const std::string& preview_line) {
        Lines body(action_lines.begin() + static_cast<std::ptrdiff_t>(start), action_lines.end());
        size_t hidden = first + start;
        if (hidden > 0) body.push_back("+" + std::to_string(hidden) + " more");
        if (!preview_line.empty()) body.push_back(preview_line);
        return assemble(header, body);
    };

    // Oldest actions go first, then the preview shrinks, then only the header remains.
    std::string out = build(preview);
    while (utf8_length(out) > max_chars && start < action_lines.size()) {
        ++start;
        out = build(preview);
    }
    if (utf8_length(out) > max_chars && !preview.empty()) {
        size_t without = utf8_length(build(""));
        size_t sep = 1;  // the newline joining the preview to the lines above
        if (without == utf8_length(header)) sep = 2;
        if (without + sep < max_chars) {
            out = build(shorten(preview, max_chars - without - sep));
        } else {
            out = build("");
        }
    }
    if (utf8_length(out) > max_chars) {
        return header;
    }
    return out;
}

std::string ProgressRenderer::render_final(double elapsed_s, const std::string& answer,
                                           RunStatus status) const {
    const size_t max_chars = static_cast<size_t>(state_.budget().max_chars);
    const size_t width = static_cast<size_t>(state_.budget().command_width);
    std::string header = format_header(elapsed_s, state_.turn_count(),
                                       run_status_to_string(status));

    Lines unfinished;
    if (status == RunStatus::Error || status == RunStatus::Cancelled) {
        const auto& actions = state_.actions();
        for (size_t i = 0; i < actions.size(); ++i) {
            const auto& a = actions[i];
            if (is_terminal(a.status)) continue;
            const char* note = a.status == ActionStatus::Running ? " (still running)"
                                                                 : " (not started)";
            unfinished.push_back(numbered(i + 1, std::string(kStatusRunning) + " " +
                                                 format_command(a.command_label, width) + note));
        }
    }

    std::string body_answer = trim(answer);
    size_t start = 0;
    auto build = [&](const std::string& answer_text) {
        std::string out = header;
        if (start < unfinished.size()) {
            out += "\n\n";
            for (size_t i = start; i < unfinished.size(); ++i) {
                if (i > start) out += '\n';
                out += unfinished[i];
            }
        }
        if (!answer_text.empty()) out += "\n\n" + answer_text;
        return out;
    };

    std::string out = build(body_answer);
    while (utf8_length(out) > max_chars && start < unfinished.size()) {
        ++start;
        out = build(body_answer);
    }
    if (utf8_length(out) > max_chars && !body_answer.empty()) {
        size_t without = utf8_length(build("")) + 2;  // "\n\n" before the answer
        if (without < max_chars) {
            out = build(shorten(body_answer, max_chars - without));
        } else {
            out = build("");
        }
    }
    return out;
}

std::string ProgressRenderer::render_final(double elapsed_s) const {
    const auto& answer = state_.answer_text();
    return render_final(elapsed_s, answer ? *answer : std::string(), state_.run_status());
}

} // namespace execrelay

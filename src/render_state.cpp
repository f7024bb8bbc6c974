#include "render_state.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace execrelay {

const char* run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Working: return "working";
        case RunStatus::Done: return "done";
        case RunStatus::Error: return "error";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "working";
}

ActionStatus completion_status(const CommandExecutionItem& cmd) {
    if (cmd.exit_code.has_value()) {
        return *cmd.exit_code == 0 ? ActionStatus::Done : ActionStatus::Failed;
    }
    return cmd.status == ItemStatus::Failed ? ActionStatus::Failed : ActionStatus::Done;
}

void validate_budget(const RenderBudget& budget) {
    if (budget.max_actions < 1) {
        throw ConfigError("max_actions must be >= 1, got " +
                          std::to_string(budget.max_actions));
    }
    if (budget.max_chars < 1) {
        throw ConfigError("max_chars must be >= 1, got " +
                          std::to_string(budget.max_chars));
    }
}

RenderState::RenderState(RenderBudget budget) : budget_(budget) {
    validate_budget(budget_);
    if (budget_.command_width < 1) {
        budget_.command_width = RenderBudget{}.command_width;
    }
}

bool RenderState::note_event(const Event& event) {
    return std::visit(overloaded{
        [this](const ThreadStarted& e) {
            thread_id_ = e.thread_id;
            return false;
        },
        [this](const TurnStarted&) {
            ++turn_count_;
            return true;
        },
        [this](const TurnCompleted& e) {
            usage_ = e.usage;
            if (run_status_ == RunStatus::Working) {
                run_status_ = RunStatus::Done;
            }
            return true;
        },
        [this](const ItemStarted& e) { return note_item_started(e.item); },
        [this](const ItemCompleted& e) { return note_item_completed(e.item); },
        [this](const StreamError& e) {
            last_error_ = e.message;
            if (run_status_ == RunStatus::Working) {
                run_status_ = RunStatus::Error;
                return true;
            }
            return false;
        },
    }, event);
}

void RenderState::note_stream_closed() {
    if (run_status_ == RunStatus::Working) {
        run_status_ = RunStatus::Error;
        terminated_early_ = true;
    }
}

void RenderState::cancel() {
    if (run_status_ == RunStatus::Working) {
        run_status_ = RunStatus::Cancelled;
    }
}

const ActionRecord* RenderState::find_action(const std::string& id) const {
    auto it = action_index_.find(id);
    if (it == action_index_.end()) return nullptr;
    return &actions_[it->second];
}

size_t RenderState::action_number(const std::string& id) const {
    auto it = action_index_.find(id);
    if (it == action_index_.end()) return actions_.size() + 1;
    return it->second + 1;
}

ActionRecord& RenderState::ensure_action(const std::string& id, const std::string& label) {
    auto it = action_index_.find(id);
    if (it != action_index_.end()) {
        return actions_[it->second];
    }
    ActionRecord record;
    record.id = id;
    record.command_label = label;
    action_index_[id] = actions_.size();
    actions_.push_back(std::move(record));
    return actions_.back();
}

static void upsert_reasoning(std::vector<ReasoningItem>& trace, const ReasoningItem& item) {
    if (item.text.empty()) return;
    if (!item.id.empty()) {
        for (auto it = trace.rbegin(); it != trace.rend(); ++it) {
            if (it->id == item.id) {
                it->text = item.text;
                return;
            }
        }
    }
    trace.push_back(item);
}

bool RenderState::note_item_started(const Item& item) {
    return std::visit(overloaded{
        [this](const CommandExecutionItem& cmd) {
            bool is_new = action_index_.count(cmd.id) == 0;
            ActionRecord& record = ensure_action(cmd.id, cmd.command);
            if (record.status == ActionStatus::Pending) {
                record.status = ActionStatus::Running;
                return true;
            }
            return is_new;
        },
        [this](const ReasoningItem& reasoning) {
            upsert_reasoning(reasoning_, reasoning);
            return false;
        },
        [](const AgentMessageItem&) { return false; },
        [](const UnknownItem&) { return false; },
    }, item);
}

bool RenderState::note_item_completed(const Item& item) {
    return std::visit(overloaded{
        [this](const CommandExecutionItem& cmd) {
            // Completion for an id never started: synthesize the record.
            ActionRecord& record = ensure_action(
                cmd.id, cmd.command.empty() ? std::string("tool result") : cmd.command);
            if (is_terminal(record.status)) {
                return false;
            }
            if (record.command_label.empty() && !cmd.command.empty()) {
                record.command_label = cmd.command;
            }
            record.exit_code = cmd.exit_code;
            record.status = completion_status(cmd);
            record.output_excerpt = utf8_prefix(cmd.aggregated_output, kMaxOutputExcerpt);
            return true;
        },
        [this](const ReasoningItem& reasoning) {
            upsert_reasoning(reasoning_, reasoning);
            return false;
        },
        [this](const AgentMessageItem& message) {
            if (message.text.empty()) return false;
            answer_text_ = message.text;
            return true;
        },
        [](const UnknownItem&) { return false; },
    }, item);
}

} // namespace execrelay

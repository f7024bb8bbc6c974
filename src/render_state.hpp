#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <cstddef>

namespace execrelay {

enum class ActionStatus { Pending, Running, Done, Failed };

enum class RunStatus { Working, Done, Error, Cancelled };

const char* run_status_to_string(RunStatus status);

inline bool is_terminal(ActionStatus status) {
    return status == ActionStatus::Done || status == ActionStatus::Failed;
}

inline bool is_terminal(RunStatus status) {
    return status != RunStatus::Working;
}

// Action status a completed command settles in: the exit code decides when
// the engine reports one, the item status otherwise.
ActionStatus completion_status(const CommandExecutionItem& cmd);

// Size limits for the progress and final renders. Validated when a
// RenderState is constructed.
struct RenderBudget {
    int max_actions = 5;
    int max_chars = 4000;
    int command_width = 120;  // progress lines shorten commands to this many code points
};

// Throws ConfigError if max_actions or max_chars is below 1.
void validate_budget(const RenderBudget& budget);

struct ActionRecord {
    std::string id;
    std::string command_label;
    ActionStatus status = ActionStatus::Pending;
    std::string output_excerpt;
    std::optional<int> exit_code;
};

// Per-run aggregation of canonical events. Owned and mutated by the single
// task consuming one run's event stream; never shared between runs.
class RenderState {
public:
    static constexpr size_t kMaxOutputExcerpt = 500;

    // Throws ConfigError if max_actions or max_chars is below 1.
    explicit RenderState(RenderBudget budget = {});

    // Apply one canonical event. Returns true when the progress render changed.
    bool note_event(const Event& event);

    // The underlying source closed. A run still working becomes an error
    // (it never saw its terminal event).
    void note_stream_closed();

    // The driving task gave up on the run.
    void cancel();

    const std::vector<ActionRecord>& actions() const { return actions_; }
    const ActionRecord* find_action(const std::string& id) const;

    // 1-based position of an action in arrival order; for an id not yet seen,
    // the position it would take.
    size_t action_number(const std::string& id) const;

    int turn_count() const { return turn_count_; }
    RunStatus run_status() const { return run_status_; }
    const std::optional<std::string>& answer_text() const { return answer_text_; }
    const std::string& thread_id() const { return thread_id_; }
    const TokenUsage& usage() const { return usage_; }
    const std::vector<ReasoningItem>& reasoning() const { return reasoning_; }
    const std::string& last_error() const { return last_error_; }
    bool terminated_early() const { return terminated_early_; }
    const RenderBudget& budget() const { return budget_; }

private:
    bool note_item_started(const Item& item);
    bool note_item_completed(const Item& item);
    ActionRecord& ensure_action(const std::string& id, const std::string& label);

    RenderBudget budget_;
    std::vector<ActionRecord> actions_;
    std::unordered_map<std::string, size_t> action_index_;
    int turn_count_ = 0;
    RunStatus run_status_ = RunStatus::Working;
    std::optional<std::string> answer_text_;
    std::string thread_id_;
    TokenUsage usage_;
    std::vector<ReasoningItem> reasoning_;  // CLI trace only, never rendered in summaries
    std::string last_error_;
    bool terminated_early_ = false;
};

} // namespace execrelay

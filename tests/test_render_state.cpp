#include <catch2/catch.hpp>
#include "render_state.hpp"
#include "errors.hpp"

using namespace execrelay;

namespace {

CommandExecutionItem command(const std::string& id, const std::string& cmd,
                             std::optional<int> exit_code = std::nullopt,
                             ItemStatus status = ItemStatus::InProgress) {
    CommandExecutionItem item;
    item.id = id;
    item.command = cmd;
    item.exit_code = exit_code;
    item.status = status;
    return item;
}

} // namespace

// ── Construction ─────────────────────────────────────────────────

TEST_CASE("RenderState: rejects non-positive budgets", "[render_state]") {
    RenderBudget no_actions;
    no_actions.max_actions = 0;
    REQUIRE_THROWS_AS(RenderState(no_actions), ConfigError);

    RenderBudget no_chars;
    no_chars.max_chars = -1;
    REQUIRE_THROWS_AS(RenderState(no_chars), ConfigError);

    REQUIRE_NOTHROW(RenderState(RenderBudget{}));
}

TEST_CASE("RenderState: starts working with nothing recorded", "[render_state]") {
    RenderState state;
    REQUIRE(state.run_status() == RunStatus::Working);
    REQUIRE(state.turn_count() == 0);
    REQUIRE(state.actions().empty());
    REQUIRE_FALSE(state.answer_text().has_value());
}

// ── Transitions ─────────────────────────────────────────────────

TEST_CASE("RenderState: lifecycle events", "[render_state]") {
    RenderState state;
    REQUIRE_FALSE(state.note_event(ThreadStarted{"thread-1"}));
    REQUIRE(state.thread_id() == "thread-1");

    REQUIRE(state.note_event(TurnStarted{}));
    REQUIRE(state.turn_count() == 1);

    TokenUsage usage{100, 40, 7};
    REQUIRE(state.note_event(TurnCompleted{usage}));
    REQUIRE(state.run_status() == RunStatus::Done);
    REQUIRE(state.usage().input_tokens == 100);
    REQUIRE(state.usage().cached_input_tokens == 40);
    REQUIRE(state.usage().output_tokens == 7);
}

TEST_CASE("RenderState: command start and completion", "[render_state]") {
    RenderState state;
    REQUIRE(state.note_event(ItemStarted{command("c1", "make")}));
    REQUIRE(state.actions().size() == 1);
    REQUIRE(state.actions()[0].status == ActionStatus::Running);
    REQUIRE(state.actions()[0].command_label == "make");

    auto done = command("c1", "make", 0, ItemStatus::Completed);
    done.aggregated_output = "built";
    REQUIRE(state.note_event(ItemCompleted{done}));
    const auto* record = state.find_action("c1");
    REQUIRE(record != nullptr);
    REQUIRE(record->status == ActionStatus::Done);
    REQUIRE(record->exit_code == 0);
    REQUIRE(record->output_excerpt == "built");
}

TEST_CASE("RenderState: nonzero exit or failed status is a failure", "[render_state]") {
    RenderState state;
    state.note_event(ItemCompleted{command("a", "false", 1, ItemStatus::Completed)});
    state.note_event(ItemCompleted{command("b", "edit: x", std::nullopt, ItemStatus::Failed)});
    state.note_event(ItemCompleted{command("c", "read: y", std::nullopt, ItemStatus::Completed)});
    REQUIRE(state.find_action("a")->status == ActionStatus::Failed);
    REQUIRE(state.find_action("b")->status == ActionStatus::Failed);
    REQUIRE(state.find_action("c")->status == ActionStatus::Done);
}

TEST_CASE("RenderState: completion without start synthesizes a record", "[render_state]") {
    RenderState state;
    state.note_event(ItemCompleted{command("orphan", "", std::nullopt, ItemStatus::Completed)});
    REQUIRE(state.actions().size() == 1);
    REQUIRE(state.actions()[0].command_label == "tool result");
    REQUIRE(state.actions()[0].status == ActionStatus::Done);
}

TEST_CASE("RenderState: completion with empty command keeps the started label", "[render_state]") {
    RenderState state;
    state.note_event(ItemStarted{command("t1", "read: a.cpp")});
    state.note_event(ItemCompleted{command("t1", "", std::nullopt, ItemStatus::Completed)});
    REQUIRE(state.actions()[0].command_label == "read: a.cpp");
}

TEST_CASE("RenderState: action status never reverts", "[render_state]") {
    RenderState state;
    state.note_event(ItemStarted{command("c1", "ls")});
    state.note_event(ItemCompleted{command("c1", "ls", 0, ItemStatus::Completed)});

    REQUIRE_FALSE(state.note_event(ItemStarted{command("c1", "ls")}));
    REQUIRE(state.actions()[0].status == ActionStatus::Done);

    REQUIRE_FALSE(state.note_event(ItemCompleted{command("c1", "ls", 2, ItemStatus::Failed)}));
    REQUIRE(state.actions()[0].status == ActionStatus::Done);
    REQUIRE(state.actions()[0].exit_code == 0);
}

TEST_CASE("RenderState: repeated start keeps one record", "[render_state]") {
    RenderState state;
    state.note_event(ItemStarted{command("c1", "ls")});
    REQUIRE_FALSE(state.note_event(ItemStarted{command("c1", "ls")}));
    REQUIRE(state.actions().size() == 1);
    REQUIRE(state.action_number("c1") == 1);
    REQUIRE(state.action_number("unseen") == 2);
}

TEST_CASE("RenderState: output excerpt is bounded", "[render_state]") {
    RenderState state;
    auto big = command("c1", "yes", 0, ItemStatus::Completed);
    big.aggregated_output = std::string(2000, 'y');
    state.note_event(ItemCompleted{big});
    REQUIRE(state.actions()[0].output_excerpt.size() == RenderState::kMaxOutputExcerpt);
}

TEST_CASE("RenderState: last agent message wins", "[render_state]") {
    RenderState state;
    state.note_event(ItemCompleted{AgentMessageItem{"m1", "first"}});
    state.note_event(ItemCompleted{AgentMessageItem{"m2", "second"}});
    REQUIRE_FALSE(state.note_event(ItemCompleted{AgentMessageItem{"m3", ""}}));
    REQUIRE(state.answer_text() == std::optional<std::string>("second"));
}

TEST_CASE("RenderState: reasoning is traced but not an action", "[render_state]") {
    RenderState state;
    REQUIRE_FALSE(state.note_event(ItemStarted{ReasoningItem{"r1", "draft"}}));
    REQUIRE_FALSE(state.note_event(ItemCompleted{ReasoningItem{"r1", "final"}}));
    state.note_event(ItemCompleted{ReasoningItem{"r2", "more"}});
    REQUIRE(state.actions().empty());
    REQUIRE(state.reasoning().size() == 2);
    REQUIRE(state.reasoning()[0].text == "final");
}

TEST_CASE("RenderState: unknown items change nothing", "[render_state]") {
    RenderState state;
    UnknownItem unknown{"u", "file_change", nlohmann::json::object()};
    REQUIRE_FALSE(state.note_event(ItemStarted{unknown}));
    REQUIRE_FALSE(state.note_event(ItemCompleted{unknown}));
    REQUIRE(state.actions().empty());
}

// ── Run status ──────────────────────────────────────────────────

TEST_CASE("RenderState: stream error is terminal", "[render_state]") {
    RenderState state;
    state.note_event(TurnStarted{});
    REQUIRE(state.note_event(StreamError{"boom"}));
    REQUIRE(state.run_status() == RunStatus::Error);
    REQUIRE(state.last_error() == "boom");

    state.note_event(TurnCompleted{});
    REQUIRE(state.run_status() == RunStatus::Error);

    state.note_event(TurnStarted{});
    REQUIRE(state.run_status() == RunStatus::Error);
    REQUIRE(state.turn_count() == 2);
}

TEST_CASE("RenderState: done is not overwritten by later errors", "[render_state]") {
    RenderState state;
    state.note_event(TurnCompleted{});
    REQUIRE_FALSE(state.note_event(StreamError{"late"}));
    REQUIRE(state.run_status() == RunStatus::Done);
}

TEST_CASE("RenderState: stream closed before completion is an error", "[render_state]") {
    RenderState state;
    state.note_event(TurnStarted{});
    state.note_event(ItemStarted{command("c1", "sleep 100")});
    state.note_stream_closed();
    REQUIRE(state.run_status() == RunStatus::Error);
    REQUIRE(state.terminated_early());
    REQUIRE(state.actions()[0].status == ActionStatus::Running);
}

TEST_CASE("RenderState: closing a finished run changes nothing", "[render_state]") {
    RenderState state;
    state.note_event(TurnCompleted{});
    state.note_stream_closed();
    REQUIRE(state.run_status() == RunStatus::Done);
    REQUIRE_FALSE(state.terminated_early());
}

TEST_CASE("RenderState: cancel only applies to a working run", "[render_state]") {
    RenderState working;
    working.cancel();
    REQUIRE(working.run_status() == RunStatus::Cancelled);

    RenderState done;
    done.note_event(TurnCompleted{});
    done.cancel();
    REQUIRE(done.run_status() == RunStatus::Done);
}

TEST_CASE("RenderState: zero command width falls back to default", "[render_state]") {
    RenderBudget budget;
    budget.command_width = 0;
    RenderState state(budget);
    REQUIRE(state.budget().command_width == RenderBudget{}.command_width);
}

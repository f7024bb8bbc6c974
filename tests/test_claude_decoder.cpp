#include <catch2/catch.hpp>
#include "engines/claude.hpp"
#include "render_state.hpp"
#include "fixture_corpus.hpp"

using namespace execrelay;

TEST_CASE("claude decoder: fixture corpus decodes with zero errors", "[claude]") {
    std::vector<Event> events;
    auto errors = execrelay_test::decode_corpus(decode_claude_event,
                                                "claude_stream_json_session.jsonl", events);
    INFO((errors.empty() ? std::string() : errors.front()));
    REQUIRE(errors.empty());
    REQUIRE(events.size() == 18);
    REQUIRE(std::holds_alternative<TurnCompleted>(events.back()));
}

TEST_CASE("claude decoder: system init starts thread and turn", "[claude]") {
    auto events = decode_claude_event(
        R"({"type":"system","subtype":"init","session_id":"s-1","tools":[]})");
    REQUIRE(events.size() == 2);
    REQUIRE(std::get<ThreadStarted>(events[0]).thread_id == "s-1");
    REQUIRE(std::holds_alternative<TurnStarted>(events[1]));
}

TEST_CASE("claude decoder: other system subtypes are opaque", "[claude]") {
    auto events = decode_claude_event(R"({"type":"system","subtype":"compact_boundary"})");
    REQUIRE(events.size() == 1);
    const auto& item = std::get<ItemCompleted>(events[0]).item;
    REQUIRE(std::get<UnknownItem>(item).raw_kind == "system:compact_boundary");
}

TEST_CASE("claude decoder: one event per assistant content block", "[claude]") {
    auto events = decode_claude_event(R"({"type":"assistant","message":{"id":"msg_1","content":[
        {"type":"thinking","thinking":"plan"},
        {"type":"text","text":"Looking."},
        {"type":"tool_use","id":"toolu_1","name":"Bash","input":{"command":"ls -la"}}]}})");
    REQUIRE(events.size() == 3);

    const auto& reasoning = std::get<ReasoningItem>(std::get<ItemCompleted>(events[0]).item);
    REQUIRE(reasoning.text == "plan");
    REQUIRE(reasoning.id == "msg_1#0");

    const auto& message = std::get<AgentMessageItem>(std::get<ItemCompleted>(events[1]).item);
    REQUIRE(message.text == "Looking.");

    const auto& cmd = std::get<CommandExecutionItem>(std::get<ItemStarted>(events[2]).item);
    REQUIRE(cmd.id == "toolu_1");
    REQUIRE(cmd.command == "ls -la");
}

TEST_CASE("claude decoder: thinking without a message id is not merged", "[claude]") {
    RenderState state;
    for (const char* line : {
             R"({"type":"assistant","message":{"role":"assistant","content":[{"type":"thinking","thinking":"look first"}]}})",
             R"({"type":"assistant","message":{"role":"assistant","content":[{"type":"thinking","thinking":"then answer"}]}})"}) {
        for (const auto& ev : decode_claude_event(line)) state.note_event(ev);
    }
    REQUIRE(state.reasoning().size() == 2);
    REQUIRE(state.reasoning()[0].text == "look first");
}

TEST_CASE("claude decoder: non-shell tools get a descriptive label", "[claude]") {
    auto events = decode_claude_event(R"({"type":"assistant","message":{"id":"m","content":[
        {"type":"tool_use","id":"t1","name":"Read","input":{"file_path":"src/main.cpp"}}]}})");
    const auto& cmd = std::get<CommandExecutionItem>(std::get<ItemStarted>(events[0]).item);
    REQUIRE(cmd.command == "read: src/main.cpp");
}

TEST_CASE("claude decoder: tool results complete the matching command", "[claude]") {
    auto events = decode_claude_event(R"({"type":"user","message":{"role":"user","content":[
        {"type":"tool_result","tool_use_id":"t1","content":[{"type":"text","text":"ok"}]},
        {"type":"tool_result","tool_use_id":"t2","content":"denied","is_error":true}]}})");
    REQUIRE(events.size() == 2);

    const auto& ok = std::get<CommandExecutionItem>(std::get<ItemCompleted>(events[0]).item);
    REQUIRE(ok.id == "t1");
    REQUIRE(ok.command.empty());
    REQUIRE(ok.aggregated_output == "ok");
    REQUIRE(ok.status == ItemStatus::Completed);

    const auto& failed = std::get<CommandExecutionItem>(std::get<ItemCompleted>(events[1]).item);
    REQUIRE(failed.status == ItemStatus::Failed);
    REQUIRE(failed.aggregated_output == "denied");
}

TEST_CASE("claude decoder: user message with plain text content is opaque", "[claude]") {
    auto events = decode_claude_event(R"({"type":"user","message":{"role":"user","content":"hi"}})");
    REQUIRE(events.size() == 1);
    const auto& item = std::get<ItemCompleted>(events[0]).item;
    REQUIRE(std::get<UnknownItem>(item).raw_kind == "user");
}

TEST_CASE("claude decoder: successful result yields answer then turn completion", "[claude]") {
    auto events = decode_claude_event(R"({"type":"result","subtype":"success","is_error":false,
        "result":"All done.","usage":{"input_tokens":5,"cache_read_input_tokens":7,"output_tokens":2}})");
    REQUIRE(events.size() == 2);
    REQUIRE(std::get<AgentMessageItem>(std::get<ItemCompleted>(events[0]).item).text == "All done.");
    const auto& usage = std::get<TurnCompleted>(events[1]).usage;
    REQUIRE(usage.input_tokens == 5);
    REQUIRE(usage.cached_input_tokens == 7);
    REQUIRE(usage.output_tokens == 2);
}

TEST_CASE("claude decoder: error result becomes a stream error", "[claude]") {
    auto with_text = decode_claude_event(
        R"({"type":"result","subtype":"error_during_execution","is_error":true,"result":"API Error: 500"})");
    REQUIRE(std::get<StreamError>(with_text[0]).message == "API Error: 500");

    auto without_text = decode_claude_event(
        R"({"type":"result","subtype":"error_max_turns","is_error":true})");
    REQUIRE(std::get<StreamError>(without_text[0]).message ==
            "claude run failed (error_max_turns)");
}

TEST_CASE("claude decoder: malformed lines are rejected", "[claude]") {
    REQUIRE_THROWS_AS(decode_claude_event(""), DecodeError);
    REQUIRE_THROWS_AS(decode_claude_event(R"({"subtype":"init"})"), DecodeError);
    REQUIRE_THROWS_AS(decode_claude_event(R"({"type":"control_request"})"), DecodeError);
}

TEST_CASE("claude engine: argv puts the prompt after --", "[claude]") {
    auto engine = EngineRegistry::instance().resolve("claude");
    REQUIRE_FALSE(engine.prompt_on_stdin);
    auto args = engine.build_args("-rf question", "sess-9", {"--model", "opus"});
    std::vector<std::string> expected{"-p", "--output-format", "stream-json", "--verbose",
                                      "--resume", "sess-9", "--model", "opus",
                                      "--", "-rf question"};
    REQUIRE(args == expected);
    REQUIRE(engine.extract_resume(engine.format_resume("sess-9")) ==
            std::optional<std::string>("sess-9"));
}

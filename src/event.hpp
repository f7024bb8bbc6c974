#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <optional>
#include <variant>
#include <cstdint>

namespace execrelay {

// Canonical event model. Every engine decoder emits into this vocabulary;
// nothing downstream of a decoder knows which engine produced an event.

struct TokenUsage {
    uint64_t input_tokens = 0;
    uint64_t cached_input_tokens = 0;
    uint64_t output_tokens = 0;
};

enum class ItemStatus { InProgress, Completed, Failed };

inline const char* item_status_to_string(ItemStatus status) {
    switch (status) {
        case ItemStatus::InProgress: return "in_progress";
        case ItemStatus::Completed: return "completed";
        case ItemStatus::Failed: return "failed";
    }
    return "in_progress";
}

// ── Items ───────────────────────────────────────────────────────

struct ReasoningItem {
    std::string id;
    std::string text;
};

struct CommandExecutionItem {
    std::string id;
    std::string command;
    std::string aggregated_output;
    std::optional<int> exit_code;
    ItemStatus status = ItemStatus::InProgress;
};

struct AgentMessageItem {
    std::string id;
    std::string text;
};

// Forward-compatible catch-all: an item kind this build does not model.
// Carries the raw payload untouched; consumers must not guess its shape.
struct UnknownItem {
    std::string id;
    std::string raw_kind;
    nlohmann::json raw_payload;
};

using Item = std::variant<ReasoningItem, CommandExecutionItem, AgentMessageItem, UnknownItem>;

const std::string& item_id(const Item& item);

// ── Events ──────────────────────────────────────────────────────

struct ThreadStarted {
    std::string thread_id;
};

struct TurnStarted {};

struct TurnCompleted {
    TokenUsage usage;
};

struct ItemStarted {
    Item item;
};

struct ItemCompleted {
    Item item;
};

struct StreamError {
    std::string message;
};

using Event = std::variant<ThreadStarted, TurnStarted, TurnCompleted,
                           ItemStarted, ItemCompleted, StreamError>;

// Short name of the event kind ("thread.started", "item.completed", ...)
const char* event_kind(const Event& event);

// Helper for std::visit with a set of lambdas.
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace execrelay

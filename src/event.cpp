#include "event.hpp"

namespace execrelay {

const std::string& item_id(const Item& item) {
    return std::visit([](const auto& it) -> const std::string& { return it.id; }, item);
}

const char* event_kind(const Event& event) {
    return std::visit(overloaded{
        [](const ThreadStarted&) { return "thread.started"; },
        [](const TurnStarted&) { return "turn.started"; },
        [](const TurnCompleted&) { return "turn.completed"; },
        [](const ItemStarted&) { return "item.started"; },
        [](const ItemCompleted&) { return "item.completed"; },
        [](const StreamError&) { return "error"; },
    }, event);
}

} // namespace execrelay

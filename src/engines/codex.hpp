#pragma once
#include "../event.hpp"
#include <string>
#include <vector>

namespace execrelay {

// Decoder for `codex exec --json`. Each line is a thread event whose `type`
// is one of thread.started, turn.started, turn.completed, turn.failed,
// item.started, item.updated, item.completed or error.
std::vector<Event> decode_codex_event(const std::string& line);

} // namespace execrelay

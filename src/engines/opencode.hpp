#pragma once
#include "../event.hpp"
#include <string>
#include <vector>

namespace execrelay {

// Decoder for `opencode run --format json`. Envelope `type` is step_start,
// tool_use, text, step_finish or error, with the payload under `part`.
std::vector<Event> decode_opencode_event(const std::string& line);

} // namespace execrelay

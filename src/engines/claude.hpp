#pragma once
#include "../event.hpp"
#include <string>
#include <vector>

namespace execrelay {

// Decoder for `claude -p --output-format stream-json --verbose`.
// Envelope `type` is system, assistant, user, result or stream_event.
// One assistant line can carry several content blocks; each becomes its
// own canonical event, in block order.
std::vector<Event> decode_claude_event(const std::string& line);

} // namespace execrelay

#pragma once
#include "../event.hpp"
#include <string>
#include <vector>

namespace execrelay {

// Decoder for `pi --print --mode json`. Envelope `type` covers the session
// header, agent/turn/message lifecycle, tool execution and the
// auto-compaction/auto-retry notices.
std::vector<Event> decode_pi_event(const std::string& line);

} // namespace execrelay

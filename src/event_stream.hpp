#pragma once
#include "engine.hpp"
#include "event.hpp"
#include "line_source.hpp"
#include <deque>
#include <functional>
#include <optional>
#include <string>

namespace execrelay {

// Receives every line the decoder rejected. line_number is 1-based and
// counts blank lines too.
using ErrorSink = std::function<void(size_t line_number, const std::string& line,
                                     const std::string& reason)>;

// Logs "[stream] <engine>: dropped line <n>: <reason>" to stderr.
ErrorSink stderr_error_sink(const std::string& engine_id);

// Pulls lines from a source and hands back canonical events in arrival
// order. Undecodable lines are reported to the sink and skipped; nothing is
// synthesized when the source closes.
class EventStream {
public:
    EventStream(LineSource& source, DecodeFn decode, std::string engine_id,
                ErrorSink sink = {});
    EventStream(LineSource& source, const EngineDescriptor& engine, ErrorSink sink = {});

    // Blocks on the source until an event is available. nullopt once the
    // source is closed and every decoded event has been delivered.
    std::optional<Event> next();

    const std::string& engine_id() const { return engine_id_; }
    size_t lines_read() const { return lines_read_; }
    size_t dropped_lines() const { return dropped_lines_; }

private:
    LineSource& source_;
    DecodeFn decode_;
    std::string engine_id_;
    ErrorSink sink_;
    std::deque<Event> pending_;
    size_t lines_read_ = 0;
    size_t dropped_lines_ = 0;
};

} // namespace execrelay

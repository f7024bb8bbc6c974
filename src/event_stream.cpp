#include "event_stream.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <iostream>

namespace execrelay {

ErrorSink stderr_error_sink(const std::string& engine_id) {
    return [engine_id](size_t line_number, const std::string&, const std::string& reason) {
        std::cerr << "[stream] " << engine_id << ": dropped line " << line_number
                  << ": " << reason << "\n";
    };
}

EventStream::EventStream(LineSource& source, DecodeFn decode, std::string engine_id,
                         ErrorSink sink)
    : source_(source), decode_(std::move(decode)), engine_id_(std::move(engine_id)),
      sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = stderr_error_sink(engine_id_);
    }
}

EventStream::EventStream(LineSource& source, const EngineDescriptor& engine, ErrorSink sink)
    : EventStream(source, engine.decode, engine.id, std::move(sink)) {}

std::optional<Event> EventStream::next() {
    while (pending_.empty()) {
        auto line = source_.next_line();
        if (!line) return std::nullopt;
        ++lines_read_;
        if (trim(*line).empty()) continue;

        try {
            for (auto& event : decode_(*line)) {
                pending_.push_back(std::move(event));
            }
        } catch (const DecodeError& e) {
            ++dropped_lines_;
            sink_(lines_read_, *line, e.what());
        }
    }
    Event event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

} // namespace execrelay

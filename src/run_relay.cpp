#include "run_relay.hpp"

namespace execrelay {

RunRelay::RunRelay(EventStream& stream, RenderBudget budget, RunCallbacks callbacks,
                   std::chrono::milliseconds progress_interval)
    : stream_(stream), state_(budget), renderer_(state_),
      callbacks_(std::move(callbacks)), progress_interval_(progress_interval),
      started_(std::chrono::steady_clock::now()), last_progress_(started_)
{}

double RunRelay::elapsed() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - started_).count();
}

void RunRelay::flush_progress() {
    if (!progress_pending_ || !callbacks_.on_progress) return;
    callbacks_.on_progress(renderer_.render_progress(elapsed()));
    last_progress_ = std::chrono::steady_clock::now();
    progress_sent_ = true;
    progress_pending_ = false;
}

RunStatus RunRelay::run(const std::atomic<bool>* cancel_flag) {
    auto cancelled = [cancel_flag]() {
        return cancel_flag != nullptr && cancel_flag->load();
    };

    while (!cancelled()) {
        auto event = stream_.next();
        if (!event) break;

        if (state_.note_event(*event)) {
            progress_pending_ = true;
        }
        if (callbacks_.on_trace) {
            callbacks_.on_trace(render_event_cli(*event, state_));
        }

        auto now = std::chrono::steady_clock::now();
        if (!progress_sent_ || now - last_progress_ >= progress_interval_) {
            flush_progress();
        }
    }

    // A change held back by the interval is still shown once.
    flush_progress();

    if (cancelled()) {
        state_.cancel();
    }
    state_.note_stream_closed();
    return state_.run_status();
}

} // namespace execrelay

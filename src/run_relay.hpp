#pragma once
#include "event_stream.hpp"
#include "render_state.hpp"
#include "renderer.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace execrelay {

struct RunCallbacks {
    // CLI-trace lines for each event, possibly empty.
    std::function<void(const std::vector<std::string>& lines)> on_trace;
    // Progress render after a visible change, throttled by progress_interval.
    std::function<void(const std::string& progress)> on_progress;
};

// Drives one run: pulls events off the stream into its own RenderState and
// reports trace lines and progress renders as they change. Owned by the single
// task consuming the run.
class RunRelay {
public:
    RunRelay(EventStream& stream, RenderBudget budget, RunCallbacks callbacks = {},
             std::chrono::milliseconds progress_interval = std::chrono::milliseconds(0));

    // renderer_ refers to state_, so a copy would render the original's state.
    RunRelay(const RunRelay&) = delete;
    RunRelay& operator=(const RunRelay&) = delete;

    // Consumes the stream until the source closes or cancel_flag is set.
    // A run left working becomes cancelled or an early-terminated error.
    RunStatus run(const std::atomic<bool>* cancel_flag = nullptr);

    // Seconds since construction.
    double elapsed() const;

    std::string render_progress() const { return renderer_.render_progress(elapsed()); }
    std::string render_final() const { return renderer_.render_final(elapsed()); }

    const RenderState& state() const { return state_; }

private:
    void flush_progress();

    EventStream& stream_;
    RenderState state_;
    ProgressRenderer renderer_;
    RunCallbacks callbacks_;
    std::chrono::milliseconds progress_interval_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_progress_;
    bool progress_sent_ = false;
    bool progress_pending_ = false;
};

} // namespace execrelay

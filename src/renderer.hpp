#pragma once
#include "event.hpp"
#include "render_state.hpp"
#include <string>
#include <vector>

namespace execrelay {

constexpr const char* kStatusRunning = "▸";
constexpr const char* kStatusDone = "✓";
constexpr const char* kStatusFailed = "✗";
constexpr const char* kHeaderSep = " · ";

// "42s", "3m 07s", "1h 02m". Negative values clamp to zero.
std::string format_elapsed(double elapsed_s);

// "<label> · <elapsed> · turn <n>"
std::string format_header(double elapsed_s, int turn, const std::string& label);

// Human-readable trace lines for the event just processed. Call after
// state.note_event(event) so action numbering includes the event's action.
std::vector<std::string> render_event_cli(const Event& event, const RenderState& state);

// Projections of a RenderState into the bounded strings a chat transport
// edits in place. Holds a reference; the state must outlive the renderer.
class ProgressRenderer {
public:
    static constexpr size_t kPreviewWidth = 80;

    explicit ProgressRenderer(const RenderState& state) : state_(state) {}

    // Header plus the most recent actions, a "+k more" marker for dropped
    // ones and a short answer preview. Fits in max_chars except when the
    // header alone is longer; the header is never cut.
    std::string render_progress(double elapsed_s) const;

    // Header plus the answer, without action markers. Error and cancelled
    // runs also list actions that never finished.
    std::string render_final(double elapsed_s, const std::string& answer,
                             RunStatus status) const;

    // Same, using the state's own answer text and run status.
    std::string render_final(double elapsed_s) const;

private:
    const RenderState& state_;
};

} // namespace execrelay

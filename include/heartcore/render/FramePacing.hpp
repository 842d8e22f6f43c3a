#pragma once

#include <heartcore/config/RuntimeOptions.hpp>
#include <heartcore/core/Clock.hpp>

#include <optional>

namespace HC {

/**
 * Target frame interval in milliseconds: the largest of min_interval_ms, 1000 / max_fps (when
 * max_fps > 0) and, under the adaptive strategy only, estimated_cost_ms / utilization_target.
 */
[[nodiscard]] auto compute_target_interval_ms(PacingOptions const& options, std::optional<double> estimated_cost_ms) -> double;

// Decides whether enough time passed since the last rendered frame.
class FramePacer {
public:
    FramePacer(PacingOptions options, Clock const& clock = SteadyClock::Instance());

    [[nodiscard]] auto should_render(std::optional<double> estimated_cost_ms = std::nullopt) const -> bool;
    void mark_rendered();
    // Records a frame that started at frame_start, so the next interval runs from that start.
    void mark_rendered(Clock::TimePoint frame_start);
    [[nodiscard]] auto target_interval_ms(std::optional<double> estimated_cost_ms = std::nullopt) const -> double;
    [[nodiscard]] auto last_rendered() const -> std::optional<Clock::TimePoint> { return last_render_; }

private:
    PacingOptions const options_;
    Clock const& clock_;
    std::optional<Clock::TimePoint> last_render_;
};

/**
 * Sleeps out the rest of the frame. A late frame sleeps zero; the loop never skips frames to
 * catch up.
 */
class RenderLoopPacer {
public:
    RenderLoopPacer(PacingOptions options, Clock& clock = SteadyClock::Instance());

    // Returns the time slept in milliseconds.
    auto pace(Clock::TimePoint frame_start, std::optional<double> estimated_cost_ms = std::nullopt) -> double;

private:
    PacingOptions const options_;
    Clock& clock_;
};

} // namespace HC

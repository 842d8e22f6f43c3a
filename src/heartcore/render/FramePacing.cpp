#include <heartcore/render/FramePacing.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace HC {

namespace {

auto validated(PacingOptions options) -> PacingOptions {
    if (auto error = ValidatePacingOptions(options)) {
        throw std::invalid_argument("frame pacing: " + describeError(*error));
    }
    return options;
}

} // namespace

auto compute_target_interval_ms(PacingOptions const& options, std::optional<double> estimated_cost_ms) -> double {
    auto interval_ms = std::max(options.min_interval_ms, 0.0);
    if (options.max_fps > 0.0) {
        interval_ms = std::max(interval_ms, 1000.0 / options.max_fps);
    }
    if (options.strategy == FramePacingStrategy::Adaptive && estimated_cost_ms && std::isfinite(*estimated_cost_ms)) {
        interval_ms = std::max(interval_ms, *estimated_cost_ms / options.utilization_target);
    }
    return interval_ms;
}

FramePacer::FramePacer(PacingOptions options, Clock const& clock)
    : options_(validated(options)), clock_(clock) {}

auto FramePacer::target_interval_ms(std::optional<double> estimated_cost_ms) const -> double {
    return compute_target_interval_ms(options_, estimated_cost_ms);
}

auto FramePacer::should_render(std::optional<double> estimated_cost_ms) const -> bool {
    if (!last_render_) {
        return true;
    }
    auto const interval_ms = target_interval_ms(estimated_cost_ms);
    if (interval_ms <= 0.0) {
        return true;
    }
    return toMilliseconds(clock_.now() - *last_render_) >= interval_ms;
}

void FramePacer::mark_rendered() {
    last_render_ = clock_.now();
}

void FramePacer::mark_rendered(Clock::TimePoint frame_start) {
    last_render_ = frame_start;
}

RenderLoopPacer::RenderLoopPacer(PacingOptions options, Clock& clock)
    : options_(validated(options)), clock_(clock) {}

auto RenderLoopPacer::pace(Clock::TimePoint frame_start, std::optional<double> estimated_cost_ms) -> double {
    auto const interval_ms = compute_target_interval_ms(options_, estimated_cost_ms);
    auto const remaining_ms = interval_ms - toMilliseconds(clock_.now() - frame_start);
    if (remaining_ms <= 0.0) {
        return 0.0;
    }
    hc_log("RenderLoopPacer sleeping " + std::to_string(remaining_ms) + " ms", "RenderFrame");
    clock_.sleepFor(fromMilliseconds(remaining_ms));
    return remaining_ms;
}

} // namespace HC

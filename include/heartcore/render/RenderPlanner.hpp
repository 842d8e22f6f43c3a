#pragma once

#include <heartcore/config/RuntimeOptions.hpp>
#include <heartcore/core/Clock.hpp>
#include <heartcore/render/RenderPlan.hpp>
#include <heartcore/render/RendererTimingTracker.hpp>

namespace HC {

/**
 * Chooses collection and merge strategies from the measured render cost.
 *
 * An override wins outright. AUTO renders sets smaller than parallel_threshold iteratively and
 * switches to the binary reduction once the estimated serial cost reaches
 * parallel_cost_threshold_ms (a portion of the frame budget; 0 always parallelizes).
 * Unmeasured sets stay iterative. The adaptive merge strategy follows the same rule with the
 * merge thresholds.
 */
class RenderPlanner final : public Planner {
public:
    RenderPlanner(RendererTimingTracker const& timing, RenderOptions options, Clock const& clock = SteadyClock::Instance());

    auto plan(RendererList const& renderers,
              RendererVariant default_variant,
              std::optional<RendererVariant> override_variant,
              RenderPlanSignature const& signature) -> RenderPlanPtr override;
    [[nodiscard]] auto timing_version() const -> std::uint64_t override { return timing_.version(); }

    [[nodiscard]] auto resolve_variant(RendererList const& renderers,
                                       RendererVariant default_variant,
                                       std::optional<RendererVariant> override_variant) const -> RendererVariant;
    [[nodiscard]] auto resolve_merge_strategy(RendererList const& renderers) const -> RenderMergeStrategy;
    [[nodiscard]] auto options() const -> RenderOptions const& { return options_; }

private:
    RendererTimingTracker const& timing_;
    RenderOptions const options_;
    Clock const& clock_;
};

} // namespace HC

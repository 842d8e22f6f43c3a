#include <heartcore/render/RenderPlanner.hpp>

#include "log/TaggedLogger.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace HC {

RenderPlanner::RenderPlanner(RendererTimingTracker const& timing, RenderOptions options, Clock const& clock)
    : timing_(timing), options_(std::move(options)), clock_(clock) {
    if (auto error = ValidateRenderOptions(options_)) {
        throw std::invalid_argument("RenderPlanner: " + describeError(*error));
    }
}

auto RenderPlanner::resolve_variant(RendererList const& renderers,
                                    RendererVariant default_variant,
                                    std::optional<RendererVariant> override_variant) const -> RendererVariant {
    auto const variant = override_variant.value_or(default_variant);
    if (variant != RendererVariant::Auto) {
        return variant;
    }
    if (renderers.size() < options_.parallel_threshold) {
        return RendererVariant::Iterative;
    }
    if (options_.parallel_cost_threshold_ms == 0.0) {
        return RendererVariant::Binary;
    }
    auto const estimate = timing_.estimate_total(renderers);
    if (estimate.has_samples && estimate.total_ms >= options_.parallel_cost_threshold_ms) {
        return RendererVariant::Binary;
    }
    return RendererVariant::Iterative;
}

auto RenderPlanner::resolve_merge_strategy(RendererList const& renderers) const -> RenderMergeStrategy {
    if (options_.merge_strategy != RenderMergeStrategy::Adaptive) {
        return options_.merge_strategy;
    }
    if (renderers.size() < options_.merge_surface_threshold) {
        return RenderMergeStrategy::InPlace;
    }
    if (options_.merge_cost_threshold_ms == 0.0) {
        return RenderMergeStrategy::Batched;
    }
    auto const estimate = timing_.estimate_total(renderers);
    if (estimate.has_samples && estimate.total_ms >= options_.merge_cost_threshold_ms) {
        return RenderMergeStrategy::Batched;
    }
    return RenderMergeStrategy::InPlace;
}

auto RenderPlanner::plan(RendererList const& renderers,
                         RendererVariant default_variant,
                         std::optional<RendererVariant> override_variant,
                         RenderPlanSignature const& signature) -> RenderPlanPtr {
    auto plan = std::make_shared<RenderPlan>();
    plan->variant = resolve_variant(renderers, default_variant, override_variant);
    plan->merge_strategy = resolve_merge_strategy(renderers);
    auto const estimate = timing_.estimate_total(renderers);
    plan->estimated_cost_ms = estimate.total_ms;
    plan->has_samples = estimate.has_samples;
    auto timings = timing_.snapshot(renderers);
    plan->timing_snapshots = std::move(timings.snapshots);
    plan->timing_missing = std::move(timings.missing);
    plan->generated_at = clock_.now();
    plan->input_signature = signature;

#ifdef HC_LOG_DEBUG
    char cost[32];
    std::snprintf(cost, sizeof(cost), "%.2f", plan->estimated_cost_ms);
    hc_log(std::string("render.plan variant=") + std::string(toString(plan->variant))
               + " merge_strategy=" + std::string(toString(plan->merge_strategy))
               + " renderer_count=" + std::to_string(renderers.size())
               + " estimated_cost_ms=" + cost
               + " has_samples=" + (plan->has_samples ? "true" : "false")
               + " missing=" + std::to_string(plan->timing_missing.size()),
           "RenderPlan");
#endif
    return plan;
}

} // namespace HC

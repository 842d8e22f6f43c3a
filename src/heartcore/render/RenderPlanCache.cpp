#include <heartcore/render/RenderPlanCache.hpp>

#include "log/TaggedLogger.hpp"

#include <stdexcept>

namespace HC {

RenderPlanCache::RenderPlanCache(Planner& planner, RenderPlanCacheOptions options, Clock const& clock)
    : planner_(planner), options_(options), clock_(clock) {
    if (options_.refresh_ms < 0) {
        throw std::invalid_argument("render plan refresh interval must be >= 0 ms");
    }
}

auto RenderPlanCache::get_plan(RendererList const& renderers,
                               RendererVariant default_variant,
                               std::optional<RendererVariant> override_variant) -> RenderPlanPtr {
    Key key{
        .signature = RenderPlanSignature::from(renderers, options_.signature_strategy),
        .override_variant = override_variant,
        .default_variant = default_variant,
        .timing_version = planner_.timing_version(),
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (plan_ && key_ && *key_ == key && accepts_age(planned_at_)) {
        check_plan(*plan_, key.signature);
        return plan_;
    }

    auto plan = planner_.plan(renderers, default_variant, override_variant, key.signature);
    if (!plan) {
        throw std::logic_error("planner returned no render plan");
    }
    check_plan(*plan, key.signature);
    // Planning reads the tracker; a record racing with it bumps the version and forces a replan next frame.
    key_ = std::move(key);
    plan_ = plan;
    planned_at_ = clock_.now();
    hc_log("RenderPlanCache replanned", "RenderPlan");
    return plan;
}

void RenderPlanCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    key_.reset();
    plan_.reset();
}

auto RenderPlanCache::cached() const -> RenderPlanPtr {
    std::lock_guard<std::mutex> lock(mutex_);
    return plan_;
}

auto RenderPlanCache::accepts_age(Clock::TimePoint planned_at) const -> bool {
    if (options_.refresh_strategy == RenderPlanRefreshStrategy::OnChange) {
        return true;
    }
    if (options_.refresh_ms <= 0) {
        return false;
    }
    return toMilliseconds(clock_.now() - planned_at) < static_cast<double>(options_.refresh_ms);
}

void RenderPlanCache::check_plan(RenderPlan const& plan, RenderPlanSignature const& signature) {
    if (plan.variant == RendererVariant::Auto) {
        throw std::logic_error("render plan left the AUTO variant unresolved");
    }
    if (plan.merge_strategy == RenderMergeStrategy::Adaptive) {
        throw std::logic_error("render plan left the adaptive merge strategy unresolved");
    }
    if (!(plan.input_signature == signature)) {
        throw std::logic_error("render plan signature does not match the renderer set");
    }
}

} // namespace HC

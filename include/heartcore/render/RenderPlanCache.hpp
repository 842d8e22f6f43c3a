#pragma once

#include <heartcore/core/Clock.hpp>
#include <heartcore/render/RenderPlan.hpp>

#include <cstdint>
#include <mutex>
#include <optional>

namespace HC {

struct RenderPlanCacheOptions {
    RenderPlanRefreshStrategy refresh_strategy = RenderPlanRefreshStrategy::TimeBoxed;
    std::int64_t refresh_ms = 100; // time-boxed only; 0 never reuses a plan
    RenderPlanSignatureStrategy signature_strategy = RenderPlanSignatureStrategy::Identity;
};

/**
 * Holds the last plan and hands the same object back while the renderer signature, override,
 * default variant and timing version are unchanged and the refresh policy accepts its age.
 * Readers share the cached plan; replanning is serialized.
 */
class RenderPlanCache {
public:
    RenderPlanCache(Planner& planner, RenderPlanCacheOptions options, Clock const& clock = SteadyClock::Instance());

    auto get_plan(RendererList const& renderers,
                  RendererVariant default_variant,
                  std::optional<RendererVariant> override_variant = std::nullopt) -> RenderPlanPtr;

    void invalidate();
    [[nodiscard]] auto cached() const -> RenderPlanPtr;
    [[nodiscard]] auto options() const -> RenderPlanCacheOptions const& { return options_; }

private:
    struct Key {
        RenderPlanSignature signature;
        std::optional<RendererVariant> override_variant;
        RendererVariant default_variant;
        std::uint64_t timing_version;

        auto operator==(Key const&) const -> bool = default;
    };

    [[nodiscard]] auto accepts_age(Clock::TimePoint planned_at) const -> bool;
    static void check_plan(RenderPlan const& plan, RenderPlanSignature const& signature);

    Planner& planner_;
    RenderPlanCacheOptions const options_;
    Clock const& clock_;

    mutable std::mutex mutex_;
    std::optional<Key> key_;
    RenderPlanPtr plan_;
    Clock::TimePoint planned_at_{};
};

} // namespace HC

#pragma once

#include <heartcore/core/Clock.hpp>
#include <heartcore/render/RenderStrategies.hpp>
#include <heartcore/render/Renderer.hpp>
#include <heartcore/render/RendererTimingTracker.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <typeindex>
#include <vector>

namespace HC {

/**
 * Identifies a renderer set for plan caching. Identity signatures list every renderer
 * instance; type signatures list only concrete types, so same-typed renderers are
 * interchangeable.
 */
struct RenderPlanSignature {
    RenderPlanSignatureStrategy strategy = RenderPlanSignatureStrategy::Identity;
    std::vector<std::uintptr_t> instances;
    std::vector<std::type_index> types;

    [[nodiscard]] static auto from(RendererList const& renderers, RenderPlanSignatureStrategy strategy) -> RenderPlanSignature;

    auto operator==(RenderPlanSignature const&) const -> bool = default;
};

// The strategy chosen for one frame. Immutable once planned; caches hand out the same object.
struct RenderPlan {
    RendererVariant variant = RendererVariant::Iterative; // never Auto
    RenderMergeStrategy merge_strategy = RenderMergeStrategy::InPlace; // never Adaptive
    double estimated_cost_ms = 0.0;
    bool has_samples = false;
    std::vector<RendererTimingSnapshot> timing_snapshots;
    std::vector<std::string> timing_missing;
    Clock::TimePoint generated_at{};
    RenderPlanSignature input_signature;
};

using RenderPlanPtr = std::shared_ptr<RenderPlan const>;

class Planner {
public:
    virtual ~Planner() = default;

    virtual auto plan(RendererList const& renderers,
                      RendererVariant default_variant,
                      std::optional<RendererVariant> override_variant,
                      RenderPlanSignature const& signature) -> RenderPlanPtr = 0;
    // Changes whenever the cost model behind plan() changes.
    [[nodiscard]] virtual auto timing_version() const -> std::uint64_t = 0;
};

} // namespace HC

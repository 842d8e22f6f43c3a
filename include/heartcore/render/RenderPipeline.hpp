#pragma once

#include <heartcore/config/RuntimeOptions.hpp>
#include <heartcore/render/RenderPlan.hpp>
#include <heartcore/render/RenderPlanCache.hpp>
#include <heartcore/render/RenderPlanner.hpp>
#include <heartcore/render/RenderSurfaceCollector.hpp>
#include <heartcore/render/Renderer.hpp>
#include <heartcore/render/RendererProcessor.hpp>
#include <heartcore/render/RendererSurfaceProvider.hpp>
#include <heartcore/render/RendererTimingTracker.hpp>
#include <heartcore/render/SurfaceComposer.hpp>
#include <heartcore/render/SurfaceMerger.hpp>
#include <heartcore/task/WorkerPool.hpp>

#include <memory>
#include <optional>

namespace HC {

struct RenderResult {
    SurfacePtr surface; // null when no renderer produced a surface
    RenderPlanPtr plan;
};

/**
 * One frame: plan, collect, compose.
 *
 * ITERATIVE plans collect and merge on the calling thread; BINARY plans collect on the worker
 * pool and merge pairwise there, or batched when the plan says so. A renderer exception fails
 * the whole frame and propagates out of render().
 */
class RenderPipeline {
public:
    // context.window and context.orientation size every surface of the pipeline.
    RenderPipeline(RenderOptions options, RendererContext context);
    ~RenderPipeline();

    RenderPipeline(RenderPipeline const&) = delete;
    auto operator=(RenderPipeline const&) -> RenderPipeline& = delete;

    auto render(RendererList const& renderers, std::optional<RendererVariant> override_variant = std::nullopt) -> RenderResult;

    // Lets in-flight worker tasks finish and stops the pool. Later BINARY frames fail.
    void shutdown();

    [[nodiscard]] auto options() const -> RenderOptions const& { return options_; }
    [[nodiscard]] auto timing() -> RendererTimingTracker& { return timing_; }
    [[nodiscard]] auto timing() const -> RendererTimingTracker const& { return timing_; }
    [[nodiscard]] auto plan_cache() -> RenderPlanCache& { return plan_cache_; }
    [[nodiscard]] auto surface_provider() -> RendererSurfaceProvider& { return provider_; }
    [[nodiscard]] auto worker_pool() -> WorkerPool& { return *pool_; }

private:
    RenderOptions const options_;
    Clock const& clock_;
    RendererTimingTracker timing_;
    RenderPlanner planner_;
    RenderPlanCache plan_cache_;
    RendererSurfaceProvider provider_;
    RendererProcessor processor_;
    std::unique_ptr<WorkerPool> pool_;
    RenderSurfaceCollector collector_;
    SurfaceComposer composer_;
    SurfaceMerger merger_;
};

} // namespace HC

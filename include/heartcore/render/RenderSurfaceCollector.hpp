#pragma once

#include <heartcore/render/Renderer.hpp>
#include <heartcore/render/Surface.hpp>
#include <heartcore/task/WorkerPool.hpp>

#include <functional>
#include <vector>

namespace HC {

/**
 * Produces one surface per renderer. Null results are skipped; the remaining surfaces keep
 * the order of their renderers in both the serial and the parallel collection.
 */
class RenderSurfaceCollector {
public:
    using ProcessRenderer = std::function<SurfacePtr(RendererPtr const&)>;

    RenderSurfaceCollector(ProcessRenderer process, WorkerPool& pool);

    auto collect(RendererList const& renderers, bool parallel) -> std::vector<SurfacePtr>;
    auto collect_serial(RendererList const& renderers) -> std::vector<SurfacePtr>;
    auto collect_parallel(RendererList const& renderers) -> std::vector<SurfacePtr>;

private:
    ProcessRenderer process_;
    WorkerPool& pool_;
};

} // namespace HC

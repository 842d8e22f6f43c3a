#include <heartcore/render/RenderSurfaceCollector.hpp>

#include <stdexcept>

namespace HC {

RenderSurfaceCollector::RenderSurfaceCollector(ProcessRenderer process, WorkerPool& pool)
    : process_(std::move(process)), pool_(pool) {
    if (!process_) {
        throw std::invalid_argument("RenderSurfaceCollector requires a renderer callback");
    }
}

auto RenderSurfaceCollector::collect(RendererList const& renderers, bool parallel) -> std::vector<SurfacePtr> {
    return parallel ? collect_parallel(renderers) : collect_serial(renderers);
}

auto RenderSurfaceCollector::collect_serial(RendererList const& renderers) -> std::vector<SurfacePtr> {
    std::vector<SurfacePtr> surfaces;
    surfaces.reserve(renderers.size());
    for (auto const& renderer : renderers) {
        if (auto surface = process_(renderer)) {
            surfaces.push_back(std::move(surface));
        }
    }
    return surfaces;
}

auto RenderSurfaceCollector::collect_parallel(RendererList const& renderers) -> std::vector<SurfacePtr> {
    if (renderers.empty()) {
        return {};
    }
    auto results = pool_.parallelMap(renderers, [this](RendererPtr const& renderer) { return process_(renderer); });
    std::vector<SurfacePtr> surfaces;
    surfaces.reserve(results.size());
    for (auto& surface : results) {
        if (surface) {
            surfaces.push_back(std::move(surface));
        }
    }
    return surfaces;
}

} // namespace HC

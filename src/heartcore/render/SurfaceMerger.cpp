#include <heartcore/render/SurfaceMerger.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace HC {

namespace {

void require_surfaces(std::vector<SurfacePtr> const& surfaces) {
    if (std::any_of(surfaces.begin(), surfaces.end(), [](SurfacePtr const& surface) { return !surface; })) {
        throw std::invalid_argument("SurfaceMerger cannot merge a missing surface");
    }
}

} // namespace

void merge_in_place(CompositeBuffer& base, CompositeBuffer const& overlay) {
    base.composite(overlay);
}

SurfaceMerger::SurfaceMerger(SurfaceComposer& composer, MergePair merge_pair)
    : composer_(composer), merge_pair_(std::move(merge_pair)) {
    if (!merge_pair_) {
        throw std::invalid_argument("SurfaceMerger requires a merge function");
    }
}

auto SurfaceMerger::compose_serial(std::vector<SurfacePtr> surfaces, RenderMergeStrategy strategy) -> SurfacePtr {
    if (surfaces.empty()) {
        return nullptr;
    }
    require_surfaces(surfaces);
    if (strategy == RenderMergeStrategy::Batched) {
        return composer_.compose_batched(surfaces);
    }
    auto base = surfaces.front();
    if (surfaces.size() == 1) {
        return base;
    }
    CompositeBuffer accumulated(*base);
    for (std::size_t i = 1; i < surfaces.size(); ++i) {
        merge_pair_(accumulated, CompositeBuffer(*surfaces[i]));
    }
    accumulated.resolve_into(*base);
    return base;
}

auto SurfaceMerger::compose_parallel(std::vector<SurfacePtr> surfaces, RenderMergeStrategy strategy, WorkerPool& pool) -> SurfacePtr {
    if (surfaces.empty()) {
        return nullptr;
    }
    require_surfaces(surfaces);
    if (strategy == RenderMergeStrategy::Batched) {
        return composer_.compose_batched(surfaces);
    }
    return reduce_pairwise(std::move(surfaces), pool);
}

auto SurfaceMerger::reduce_pairwise(std::vector<SurfacePtr> surfaces, WorkerPool& pool) -> SurfacePtr {
    auto base = surfaces.front();
    if (surfaces.size() == 1) {
        return base;
    }

    using Pair = std::pair<CompositeBufferPtr, CompositeBufferPtr>;
    auto buffers = pool.parallelMap(surfaces, [](SurfacePtr const& surface) { return std::make_shared<CompositeBuffer>(*surface); });
    while (buffers.size() > 1) {
        std::vector<Pair> pairs;
        pairs.reserve(buffers.size() / 2);
        for (std::size_t i = 0; i + 1 < buffers.size(); i += 2) {
            pairs.emplace_back(buffers[i], buffers[i + 1]);
        }
        auto merged = pool.parallelMap(pairs, [this](Pair const& pair) {
            merge_pair_(*pair.first, *pair.second);
            return pair.first;
        });
        if (buffers.size() % 2 == 1) {
            merged.push_back(buffers.back());
        }
        hc_log("SurfaceMerger round " + std::to_string(buffers.size()) + " -> " + std::to_string(merged.size()), "RenderFrame");
        buffers = std::move(merged);
    }
    buffers.front()->resolve_into(*base);
    return base;
}

} // namespace HC

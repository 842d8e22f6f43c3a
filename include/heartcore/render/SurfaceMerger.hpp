#pragma once

#include <heartcore/render/CompositeBuffer.hpp>
#include <heartcore/render/RenderStrategies.hpp>
#include <heartcore/render/Surface.hpp>
#include <heartcore/render/SurfaceComposer.hpp>
#include <heartcore/task/WorkerPool.hpp>

#include <functional>
#include <vector>

namespace HC {

// Composites overlay onto base. Throws std::invalid_argument when sizes differ.
void merge_in_place(CompositeBuffer& base, CompositeBuffer const& overlay);

/**
 * Reduces a frame's surfaces to one.
 *
 * Serial composition merges left to right (or batches through the composer). Parallel
 * composition merges adjacent pairs on the worker pool round by round, carrying an odd tail into
 * the next round, so the merge operator must be associative and every buffer is only written by
 * the one task merging into it. Both merge premultiplied CompositeBuffers and round into the
 * first surface once, which keeps the two paths pixel-identical for translucent layers.
 */
class SurfaceMerger {
public:
    using MergePair = std::function<void(CompositeBuffer&, CompositeBuffer const&)>;

    explicit SurfaceMerger(SurfaceComposer& composer, MergePair merge_pair = merge_in_place);

    auto compose_serial(std::vector<SurfacePtr> surfaces, RenderMergeStrategy strategy) -> SurfacePtr;
    auto compose_parallel(std::vector<SurfacePtr> surfaces, RenderMergeStrategy strategy, WorkerPool& pool) -> SurfacePtr;

private:
    auto reduce_pairwise(std::vector<SurfacePtr> surfaces, WorkerPool& pool) -> SurfacePtr;

    SurfaceComposer& composer_;
    MergePair merge_pair_;
};

} // namespace HC

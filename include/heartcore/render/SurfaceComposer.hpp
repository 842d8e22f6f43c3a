#pragma once

#include <heartcore/render/FrameAccumulator.hpp>
#include <heartcore/render/Surface.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace HC {

/**
 * Batched composition: every surface is blitted, in order, onto one transparent destination of
 * the first surface's size. With the screen cache enabled the destination for a size is kept
 * and cleared between frames, so the result is only valid until the next compose.
 */
class SurfaceComposer {
public:
    explicit SurfaceComposer(bool screen_cache = false);

    auto compose_batched(std::vector<SurfacePtr> const& surfaces) -> SurfacePtr;

    [[nodiscard]] auto cached_surface_count() const -> std::size_t;

private:
    auto composite_for(SurfaceSize size) -> SurfacePtr;

    bool const screen_cache_;
    mutable std::mutex mutex_;
    std::map<std::pair<int, int>, SurfacePtr> composites_;
    std::unique_ptr<FrameAccumulator> accumulator_;
};

} // namespace HC

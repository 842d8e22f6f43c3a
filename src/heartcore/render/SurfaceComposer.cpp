#include <heartcore/render/SurfaceComposer.hpp>

namespace HC {

SurfaceComposer::SurfaceComposer(bool screen_cache)
    : screen_cache_(screen_cache) {}

auto SurfaceComposer::composite_for(SurfaceSize size) -> SurfacePtr {
    if (!screen_cache_) {
        return std::make_shared<Surface>(size);
    }
    auto& cached = composites_[{size.width, size.height}];
    if (!cached) {
        cached = std::make_shared<Surface>(size);
    }
    return cached;
}

auto SurfaceComposer::compose_batched(std::vector<SurfacePtr> const& surfaces) -> SurfacePtr {
    if (surfaces.empty() || !surfaces.front()) {
        return nullptr;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto composite = composite_for(surfaces.front()->size());
    if (!accumulator_ || accumulator_->target() != composite) {
        accumulator_ = std::make_unique<FrameAccumulator>(composite);
    } else {
        accumulator_->reset();
    }
    for (auto const& surface : surfaces) {
        accumulator_->queue_blit(surface);
    }
    // A new surface starts transparent; a cached one is cleared here.
    return accumulator_->flush(screen_cache_);
}

auto SurfaceComposer::cached_surface_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return composites_.size();
}

} // namespace HC

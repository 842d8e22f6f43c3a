#include <heartcore/render/RendererSurfaceProvider.hpp>

#include <stdexcept>
#include <vector>

namespace HC {

RendererSurfaceProvider::RendererSurfaceProvider(SurfaceSize window, Orientation orientation, Options options)
    : window_(window), orientation_(orientation), options_(options) {
    if (window.width <= 0 || window.height <= 0) {
        throw std::invalid_argument("render window must have a positive size");
    }
    if (orientation.columns <= 0 || orientation.rows <= 0) {
        throw std::invalid_argument("orientation needs at least one column and one row");
    }
    if (window.width < orientation.columns || window.height < orientation.rows) {
        throw std::invalid_argument("render window is smaller than one pixel per mirrored tile");
    }
}

auto RendererSurfaceProvider::input_size(DisplayMode mode) const -> SurfaceSize {
    if (mode == DisplayMode::Mirrored) {
        return SurfaceSize{window_.width / orientation_.columns, window_.height / orientation_.rows};
    }
    return window_;
}

auto RendererSurfaceProvider::acquire(Renderer const& renderer, Slot slot, SurfaceSize size) -> SurfacePtr {
    if (!options_.surface_cache) {
        return std::make_shared<Surface>(size);
    }
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto& cached = cache_[CacheKey{&renderer, slot, size.width, size.height}];
    if (!cached) {
        cached = std::make_shared<Surface>(size);
    } else {
        cached->clear();
    }
    return cached;
}

auto RendererSurfaceProvider::prepare(Renderer const& renderer) -> SurfacePtr {
    return acquire(renderer, Slot::Input, input_size(renderer.display_mode()));
}

auto RendererSurfaceProvider::postprocess(Renderer const& renderer, SurfacePtr input) -> SurfacePtr {
    if (!input || renderer.display_mode() != DisplayMode::Mirrored) {
        return input;
    }
    if (orientation_.columns == 1 && orientation_.rows == 1 && input->size() == window_) {
        return input;
    }
    auto tiled = acquire(renderer, Slot::Tiled, window_);
    tile_into(*input, *tiled);
    return tiled;
}

void RendererSurfaceProvider::tile_into(Surface const& tile, Surface& target) const {
    auto const tile_width = tile.width();
    auto const tile_height = tile.height();

    if (options_.tile_strategy == RenderTileStrategy::Blits) {
        std::vector<std::pair<int, int>> positions;
        positions.reserve(static_cast<std::size_t>(orientation_.rows) * static_cast<std::size_t>(orientation_.columns));
        for (int row = 0; row < orientation_.rows; ++row) {
            for (int column = 0; column < orientation_.columns; ++column) {
                positions.emplace_back(column * tile_width, row * tile_height);
            }
        }
        for (auto const& [x, y] : positions) {
            target.blit(tile, x, y);
        }
        return;
    }

    for (int row = 0; row < orientation_.rows; ++row) {
        for (int column = 0; column < orientation_.columns; ++column) {
            target.blit(tile, column * tile_width, row * tile_height);
        }
    }
}

auto RendererSurfaceProvider::cached_surface_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

void RendererSurfaceProvider::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

} // namespace HC

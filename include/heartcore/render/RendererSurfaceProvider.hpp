#pragma once

#include <heartcore/render/RenderStrategies.hpp>
#include <heartcore/render/Renderer.hpp>
#include <heartcore/render/Surface.hpp>

#include <cstddef>
#include <map>
#include <mutex>
#include <tuple>

namespace HC {

/**
 * Surfaces handed to renderers and the post-processing of their output.
 *
 * Mirrored renderers draw a single tile of window / (columns, rows) which is then repeated
 * across the window; full and OpenGL renderers draw the whole window. With the surface cache
 * enabled a renderer gets the same surfaces back every frame, cleared rather than
 * reallocated, so a frame's output is only valid until that renderer renders again.
 */
class RendererSurfaceProvider {
public:
    struct Options {
        RenderTileStrategy tile_strategy = RenderTileStrategy::Blits;
        bool surface_cache = false;
    };

    RendererSurfaceProvider(SurfaceSize window, Orientation orientation, Options options);

    [[nodiscard]] auto input_size(DisplayMode mode) const -> SurfaceSize;
    [[nodiscard]] auto prepare(Renderer const& renderer) -> SurfacePtr;
    [[nodiscard]] auto postprocess(Renderer const& renderer, SurfacePtr input) -> SurfacePtr;
    // Repeats tile columns x rows times from the top-left corner of a window-sized surface.
    void tile_into(Surface const& tile, Surface& target) const;

    [[nodiscard]] auto window() const -> SurfaceSize { return window_; }
    [[nodiscard]] auto orientation() const -> Orientation const& { return orientation_; }
    [[nodiscard]] auto options() const -> Options const& { return options_; }
    [[nodiscard]] auto cached_surface_count() const -> std::size_t;
    void clear_cache();

private:
    enum class Slot { Input, Tiled };
    using CacheKey = std::tuple<Renderer const*, Slot, int, int>;

    [[nodiscard]] auto acquire(Renderer const& renderer, Slot slot, SurfaceSize size) -> SurfacePtr;

    SurfaceSize const window_;
    Orientation const orientation_;
    Options const options_;

    mutable std::mutex cache_mutex_;
    std::map<CacheKey, SurfacePtr> cache_;
};

} // namespace HC

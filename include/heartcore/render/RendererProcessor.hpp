#pragma once

#include <heartcore/core/Clock.hpp>
#include <heartcore/render/Renderer.hpp>
#include <heartcore/render/RendererSurfaceProvider.hpp>
#include <heartcore/render/RendererTimingTracker.hpp>

namespace HC {

/**
 * Runs one renderer for one frame: initializes it on first use, renders into a prepared
 * surface, records the render time and returns the post-processed surface. Renderer
 * exceptions propagate to the caller.
 */
class RendererProcessor {
public:
    RendererProcessor(RendererSurfaceProvider& provider, RendererTimingTracker& timing, RendererContext context);

    auto process(RendererPtr const& renderer) -> SurfacePtr;

    [[nodiscard]] auto context() const -> RendererContext const& { return context_; }

private:
    RendererSurfaceProvider& provider_;
    RendererTimingTracker& timing_;
    RendererContext context_;
    Clock const& clock_;
};

} // namespace HC

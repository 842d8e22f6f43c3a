#include <heartcore/render/RendererProcessor.hpp>

#include "log/TaggedLogger.hpp"

namespace HC {

RendererProcessor::RendererProcessor(RendererSurfaceProvider& provider, RendererTimingTracker& timing, RendererContext context)
    : provider_(provider)
    , timing_(timing)
    , context_(context)
    , clock_(context.clock ? *context.clock : SteadyClock::Instance()) {
    context_.clock = &clock_;
    context_.orientation = provider.orientation();
    context_.window = provider.window();
}

auto RendererProcessor::process(RendererPtr const& renderer) -> SurfacePtr {
    if (!renderer) {
        return nullptr;
    }
    auto const start = clock_.now();
    auto surface = provider_.prepare(*renderer);
    if (!renderer->is_initialized()) {
        hc_log("Initializing renderer " + renderer->name(), "Renderer");
        renderer->initialize(context_);
    }
    renderer->render(*surface, context_.orientation);
    auto const duration_ms = toMilliseconds(clock_.now() - start);

    if (auto error = timing_.record(renderer->name(), duration_ms)) {
        hc_log("Dropped render timing for " + renderer->name() + ": " + describeError(*error), "Renderer", "Error");
    }
    hc_log("render.loop renderer=" + renderer->name() + " duration_ms=" + std::to_string(duration_ms)
               + " display_mode=" + to_string(renderer->display_mode()),
           "RenderFrame");
    return provider_.postprocess(*renderer, std::move(surface));
}

} // namespace HC

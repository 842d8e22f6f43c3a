#include <heartcore/runtime/RenderLoop.hpp>
#include <heartcore/events/PeripheralStreams.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>

namespace HC {

RenderLoop::RenderLoop(RenderPipeline& pipeline, FrameSink& sink, PacingOptions pacing, RenderLoopOptions options, Clock& clock, PeripheralStreams* streams)
    : pipeline(pipeline), sink(sink), clock(clock), streams(streams), options(options), framePacer(pacing, clock), loopPacer(pacing, clock) {}

RenderLoop::~RenderLoop() {
    this->shutdown();
}

auto RenderLoop::setRenderers(RendererList renderers) -> void {
    std::lock_guard<std::mutex> lock(this->renderersMutex);
    this->renderers_ = std::move(renderers);
}

auto RenderLoop::renderers() const -> RendererList {
    std::lock_guard<std::mutex> lock(this->renderersMutex);
    return this->renderers_;
}

auto RenderLoop::tick(std::optional<RendererVariant> overrideVariant) -> Expected<FrameOutcome> {
    if (this->stopping)
        return std::unexpected(Error{Error::Code::ShuttingDown, "render loop is shut down"});

    auto const frameStart = this->clock.now();
    auto const active     = this->renderers();

    std::optional<double> estimate;
    if (auto const timing = this->pipeline.timing().estimate_total(active); timing.has_samples)
        estimate = timing.total_ms;

    FrameOutcome outcome;
    if (!this->framePacer.should_render(estimate)) {
        outcome.frame_index = this->frameIndex.load();
        return outcome;
    }

    RenderResult result;
    try {
        result = this->pipeline.render(active, overrideVariant);
    } catch (std::exception const& error) {
        this->framePacer.mark_rendered(frameStart);
        return std::unexpected(Error{Error::Code::RendererFailed, error.what()});
    }

    if (result.surface)
        this->sink.present(*result.surface);
    this->framePacer.mark_rendered(frameStart);

    outcome.rendered    = true;
    outcome.plan        = std::move(result.plan);
    outcome.frame_index = ++this->frameIndex;
    outcome.frame_ms    = toMilliseconds(this->clock.now() - frameStart);

    if (this->streams != nullptr)
        this->streams->publishFrameTick(FrameTick{.frame_index = outcome.frame_index, .time_point = frameStart, .frame_ms = outcome.frame_ms});
    hc_log("RenderLoop frame " + std::to_string(outcome.frame_index) + " took " + std::to_string(outcome.frame_ms) + " ms", "RenderFrame");

    outcome.slept_ms = this->loopPacer.pace(frameStart, estimate);
    return outcome;
}

auto RenderLoop::run(std::stop_token stop) -> std::optional<Error> {
    std::lock_guard<std::mutex> running(this->runMutex);
#ifdef HC_LOG_DEBUG
    set_thread_name("RenderLoop");
#endif
    hc_log("RenderLoop started", "RenderLoop");
    while (!stop.stop_requested() && !this->stopping) {
        auto outcome = this->tick();
        if (!outcome) {
            if (outcome.error().code == Error::Code::ShuttingDown)
                break;
            if (this->options.failure_policy == FrameFailurePolicy::Halt) {
                hc_log("RenderLoop halted: " + describeError(outcome.error()), "RenderLoop", "Error");
                return outcome.error();
            }
            ++this->dropped;
            hc_log("RenderLoop dropped frame: " + describeError(outcome.error()), "RenderLoop", "Error");
            continue;
        }
        if (!outcome->rendered)
            this->clock.sleepFor(std::chrono::milliseconds(1));
    }
    hc_log("RenderLoop stopped", "RenderLoop");
    return std::nullopt;
}

auto RenderLoop::shutdown() -> void {
    std::lock_guard<std::mutex> lock(this->shutdownMutex);
    if (this->closed)
        return;
    this->stopping = true;
    {
        // Waits for a running loop to finish its current frame.
        std::lock_guard<std::mutex> running(this->runMutex);
    }
    this->pipeline.shutdown();
    this->sink.close();
    this->closed = true;
    hc_log("RenderLoop shut down", "RenderLoop");
}

} // namespace HC

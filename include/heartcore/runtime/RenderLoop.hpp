#pragma once
#include <heartcore/config/RuntimeOptions.hpp>
#include <heartcore/core/Clock.hpp>
#include <heartcore/core/Error.hpp>
#include <heartcore/render/FramePacing.hpp>
#include <heartcore/render/RenderPipeline.hpp>
#include <heartcore/runtime/FrameSink.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>

namespace HC {

class PeripheralStreams;

enum class FrameFailurePolicy { Halt, Drop };

struct RenderLoopOptions {
    FrameFailurePolicy failure_policy = FrameFailurePolicy::Halt;
};

struct FrameOutcome {
    bool          rendered    = false; // false when the pacer skipped this tick
    std::uint64_t frame_index = 0;
    RenderPlanPtr plan;
    double        frame_ms = 0.0;
    double        slept_ms = 0.0;
};

/**
 * The single driving frame loop. A tick never presents before collection and composition of
 * its frame completed, and a frame in progress is never cancelled. A renderer exception turns
 * into Error{RendererFailed}; run() then halts or drops the frame according to the policy.
 */
class RenderLoop {
public:
    RenderLoop(RenderPipeline& pipeline,
               FrameSink& sink,
               PacingOptions pacing,
               RenderLoopOptions options = {},
               Clock& clock = SteadyClock::Instance(),
               PeripheralStreams* streams = nullptr);
    ~RenderLoop();

    RenderLoop(RenderLoop const&)                    = delete;
    auto operator=(RenderLoop const&) -> RenderLoop& = delete;

    auto setRenderers(RendererList renderers) -> void;
    auto renderers() const -> RendererList;

    auto tick(std::optional<RendererVariant> overrideVariant = std::nullopt) -> Expected<FrameOutcome>;
    // Ticks until stop is requested or shutdown() is called. Returns the error that halted the loop.
    auto run(std::stop_token stop) -> std::optional<Error>;
    // Stops the loop, drains the worker pool, then closes the sink.
    auto shutdown() -> void;

    auto framesRendered() const -> std::uint64_t { return this->frameIndex.load(); }
    auto framesDropped() const -> std::uint64_t { return this->dropped.load(); }

private:
    RenderPipeline&         pipeline;
    FrameSink&              sink;
    Clock&                  clock;
    PeripheralStreams*      streams;
    RenderLoopOptions const options;
    FramePacer              framePacer;
    RenderLoopPacer         loopPacer;

    mutable std::mutex         renderersMutex;
    RendererList               renderers_;
    std::mutex                 runMutex;
    std::mutex                 shutdownMutex;
    std::atomic<bool>          stopping{false};
    bool                       closed = false;
    std::atomic<std::uint64_t> frameIndex{0};
    std::atomic<std::uint64_t> dropped{0};
};

} // namespace HC

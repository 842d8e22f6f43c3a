#include "HeartcoreTestHelper.hpp"
#include <doctest/doctest.h>
#include <heartcore/events/PeripheralStreams.hpp>
#include <heartcore/runtime/RenderLoop.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace HC;
using namespace HC::Test;
using namespace std::chrono_literals;

namespace {

// Takes a fixed amount of manual-clock time per frame.
class SlowRenderer final : public Renderer {
public:
    SlowRenderer(ManualClock& clock, std::chrono::milliseconds cost) : clock(clock), cost(cost) {}

    auto name() const -> std::string override { return "slow"; }
    auto display_mode() const -> DisplayMode override { return DisplayMode::Full; }
    void initialize(RendererContext const&) override { initialized = true; }
    void render(Surface& surface, Orientation const&) override {
        clock.advance(cost);
        surface.fill(Blue);
    }
    void reset() override { initialized = false; }
    auto is_initialized() const -> bool override { return initialized; }

private:
    ManualClock&                    clock;
    std::chrono::milliseconds const cost;
    bool                            initialized = false;
};

// Fails every odd frame and asks the loop to stop on its sixth call.
class FlakyRenderer final : public Renderer {
public:
    explicit FlakyRenderer(std::stop_source& stop) : stop(stop) {}

    auto name() const -> std::string override { return "flaky"; }
    auto display_mode() const -> DisplayMode override { return DisplayMode::Full; }
    void initialize(RendererContext const&) override { initialized = true; }
    void render(Surface& surface, Orientation const&) override {
        ++calls;
        if (calls == 6)
            stop.request_stop();
        if (calls % 2 == 1)
            throw std::runtime_error("dropped packet");
        surface.fill(Green);
    }
    void reset() override { initialized = false; }
    auto is_initialized() const -> bool override { return initialized; }

    int calls = 0;

private:
    std::stop_source& stop;
    bool              initialized = false;
};

auto fixed_pacing(double fps) -> PacingOptions {
    PacingOptions pacing;
    pacing.max_fps = fps;
    return pacing;
}

struct Fixture {
    ManualClock     clock;
    RenderOptions   options = [] {
        RenderOptions render;
        render.max_workers = 2;
        return render;
    }();
    RenderPipeline  pipeline{options, RendererContext{.clock = &clock, .window = SurfaceSize{4, 4}}};
    MemoryFrameSink sink;
};

} // namespace

TEST_SUITE("runtime.render_loop") {

TEST_CASE("Ticks render, present and pace") {
    Fixture    f;
    RenderLoop loop(f.pipeline, f.sink, fixed_pacing(50.0), {}, f.clock);
    loop.setRenderers({std::make_shared<PatchRenderer>("patch", Red, SurfaceRect{0, 0, 4, 4})});
    CHECK(loop.renderers().size() == 1);

    auto first = loop.tick();
    REQUIRE(first.has_value());
    CHECK(first->rendered);
    CHECK(first->frame_index == 1);
    REQUIRE(first->plan);
    CHECK(first->slept_ms == doctest::Approx(20.0));
    CHECK(f.sink.presentedCount() == 1);
    REQUIRE(f.sink.lastFrame());
    CHECK(f.sink.lastFrame()->pixel(3, 3) == Red);

    auto second = loop.tick();
    REQUIRE(second.has_value());
    CHECK(second->rendered);
    CHECK(second->frame_index == 2);
    CHECK(loop.framesRendered() == 2);
    CHECK(f.clock.sleptMs().size() == 2);
}

TEST_CASE("Adaptive pacing skips ticks that come too early") {
    Fixture       f;
    PacingOptions pacing        = fixed_pacing(50.0);
    pacing.strategy             = FramePacingStrategy::Adaptive;
    pacing.utilization_target   = 0.5;
    RenderLoop loop(f.pipeline, f.sink, pacing, {}, f.clock);
    loop.setRenderers({std::make_shared<SlowRenderer>(f.clock, 15ms)});

    // No samples yet: the 20 ms fps interval applies and 15 ms of it were spent rendering.
    auto first = loop.tick();
    REQUIRE(first.has_value());
    CHECK(first->frame_ms == doctest::Approx(15.0));
    CHECK(first->slept_ms == doctest::Approx(5.0));

    // A 15 ms estimate at 50% utilization stretches the interval to 30 ms.
    auto early = loop.tick();
    REQUIRE(early.has_value());
    CHECK_FALSE(early->rendered);
    CHECK(early->frame_index == 1);
    CHECK(f.sink.presentedCount() == 1);

    // The 30 ms interval runs from the start of the first frame, not from its end.
    f.clock.advance(10ms);
    auto late = loop.tick();
    REQUIRE(late.has_value());
    CHECK(late->rendered);
    CHECK(late->frame_index == 2);
}

TEST_CASE("Frame starts are one interval apart when rendering has a cost") {
    Fixture    f;
    RenderLoop loop(f.pipeline, f.sink, fixed_pacing(50.0), {}, f.clock);
    loop.setRenderers({std::make_shared<SlowRenderer>(f.clock, 8ms)});

    auto const origin = f.clock.now();
    for (int frame = 0; frame < 50; ++frame) {
        CHECK(f.clock.now() - origin == frame * 20ms);
        auto outcome = loop.tick();
        REQUIRE(outcome.has_value());
        REQUIRE(outcome->rendered);
        CHECK(outcome->frame_ms == doctest::Approx(8.0));
        CHECK(outcome->slept_ms == doctest::Approx(12.0));
    }
    CHECK(loop.framesRendered() == 50);
    CHECK(f.sink.presentedCount() == 50);
}

TEST_CASE("Empty frames present nothing") {
    Fixture    f;
    RenderLoop loop(f.pipeline, f.sink, fixed_pacing(0.0), {}, f.clock);
    auto       outcome = loop.tick();
    REQUIRE(outcome.has_value());
    CHECK(outcome->rendered);
    CHECK(f.sink.presentedCount() == 0);
    CHECK(outcome->slept_ms == doctest::Approx(0.0));
}

TEST_CASE("Renderer faults") {
    Fixture f;

    SUBCASE("tick reports RendererFailed") {
        RenderLoop loop(f.pipeline, f.sink, fixed_pacing(50.0), {}, f.clock);
        loop.setRenderers({std::make_shared<ThrowingRenderer>("projector")});
        auto outcome = loop.tick();
        REQUIRE_FALSE(outcome.has_value());
        CHECK(outcome.error().code == Error::Code::RendererFailed);
        CHECK(outcome.error().message == std::optional<std::string>{"projector lost its device"});
        CHECK(f.sink.presentedCount() == 0);
        CHECK(loop.framesRendered() == 0);
    }
    SUBCASE("Halt stops run at the first failure") {
        RenderLoop loop(f.pipeline, f.sink, fixed_pacing(50.0), {.failure_policy = FrameFailurePolicy::Halt}, f.clock);
        loop.setRenderers({std::make_shared<ThrowingRenderer>()});
        auto error = loop.run(std::stop_token{});
        REQUIRE(error);
        CHECK(error->code == Error::Code::RendererFailed);
        CHECK(loop.framesDropped() == 0);
    }
    SUBCASE("Drop keeps running") {
        std::stop_source stop;
        auto             flaky = std::make_shared<FlakyRenderer>(stop);
        RenderLoop       loop(f.pipeline, f.sink, fixed_pacing(50.0), {.failure_policy = FrameFailurePolicy::Drop}, f.clock);
        loop.setRenderers({flaky});
        auto error = loop.run(stop.get_token());
        CHECK_FALSE(error);
        CHECK(flaky->calls == 6);
        CHECK(loop.framesDropped() == 3);
        CHECK(loop.framesRendered() == 3);
        CHECK(f.sink.presentedCount() == 3);
    }
}

TEST_CASE("Frame ticks reach the peripheral streams") {
    Fixture           f;
    EventBus          bus;
    ManualScheduler   scheduler;
    PeripheralStreams streams(bus, StreamShareSettings{.strategy = StreamShareStrategy::Share}, scheduler, f.clock);
    RenderLoop        loop(f.pipeline, f.sink, fixed_pacing(50.0), {}, f.clock, &streams);
    loop.setRenderers({std::make_shared<PatchRenderer>("patch", Red, SurfaceRect{0, 0, 1, 1})});

    std::vector<FrameTick> ticks;
    auto subscription = streams.frameTicks()->subscribe([&](FrameTick const& tick) { ticks.push_back(tick); });
    auto const start  = f.clock.now();
    REQUIRE(loop.tick());
    REQUIRE(loop.tick());
    REQUIRE(ticks.size() == 2);
    CHECK(ticks[0].frame_index == 1);
    CHECK(ticks[0].time_point == start);
    CHECK(ticks[1].frame_index == 2);
    CHECK(ticks[1].time_point == start + 20ms);
}

TEST_CASE("Shutdown") {
    Fixture    f;
    RenderLoop loop(f.pipeline, f.sink, fixed_pacing(50.0), {}, f.clock);
    loop.setRenderers({std::make_shared<PatchRenderer>("patch", Red, SurfaceRect{0, 0, 1, 1})});
    REQUIRE(loop.tick());

    loop.shutdown();
    CHECK(f.sink.isClosed());
    CHECK(f.pipeline.worker_pool().isShuttingDown());
    loop.shutdown();

    auto late = loop.tick();
    REQUIRE_FALSE(late.has_value());
    CHECK(late.error().code == Error::Code::ShuttingDown);
    CHECK_FALSE(loop.run(std::stop_token{}));
    CHECK(f.sink.presentedCount() == 1);
}

TEST_CASE("Shutdown from another thread lets the running frame finish") {
    EventBus        bus;
    RenderOptions   options;
    options.max_workers = 2;
    RenderPipeline  pipeline(options, RendererContext{.events = &bus, .window = SurfaceSize{4, 4}});
    MemoryFrameSink sink;
    RenderLoop      loop(pipeline, sink, fixed_pacing(500.0));
    loop.setRenderers({std::make_shared<PatchRenderer>("patch", Green, SurfaceRect{0, 0, 4, 4})});

    std::optional<Error> result;
    std::jthread         runner([&](std::stop_token stop) { result = loop.run(stop); });
    for (int i = 0; i < 400 && loop.framesRendered() < 3; ++i)
        std::this_thread::sleep_for(5ms);
    REQUIRE(loop.framesRendered() >= 3);

    loop.shutdown();
    runner.join();
    CHECK_FALSE(result);
    CHECK(sink.isClosed());
    CHECK(sink.presentedCount() == loop.framesRendered());
    CHECK(sink.lastFrame()->pixel(0, 0) == Green);
}

} // TEST_SUITE

#include "HeartcoreTestHelper.hpp"
#include <doctest/doctest.h>
#include <heartcore/render/RenderPipeline.hpp>
#include <heartcore/render/SolidFillRenderer.hpp>

#include <memory>
#include <stdexcept>
#include <string>

using namespace HC;
using namespace HC::Test;

namespace {

auto make_context(Clock const& clock, SurfaceSize window = {8, 8}, Orientation orientation = {}) -> RendererContext {
    return RendererContext{.clock = &clock, .orientation = orientation, .window = window};
}

auto small_pool(RenderOptions options = {}) -> RenderOptions {
    options.max_workers = 3;
    return options;
}

auto make_renderers() -> RendererList {
    return RendererList{
            std::make_shared<PatchRenderer>("red", Red, SurfaceRect{0, 0, 5, 5}),
            std::make_shared<PatchRenderer>("green", Green, SurfaceRect{3, 3, 5, 5}),
            std::make_shared<PatchRenderer>("blue", Blue, SurfaceRect{1, 4, 6, 2}),
            std::make_shared<PatchRenderer>("white", White, SurfaceRect{6, 0, 2, 8}),
            std::make_shared<PatchRenderer>("dark", Color{10, 20, 30, 255}, SurfaceRect{2, 2, 2, 2}),
    };
}

} // namespace

TEST_SUITE("render.pipeline") {

TEST_CASE("Iterative and binary frames are identical") {
    ManualClock    clock;
    RenderPipeline iterative(small_pool(), make_context(clock));

    auto serial = iterative.render(make_renderers());
    REQUIRE(serial.surface);
    REQUIRE(serial.plan);
    CHECK(serial.plan->variant == RendererVariant::Iterative);
    CHECK(serial.surface->pixel(0, 0) == Red);
    CHECK(serial.surface->pixel(7, 7) == White);
    CHECK(serial.surface->pixel(2, 2) == Color{10, 20, 30, 255});

    SUBCASE("Binary with in-place merging") {
        auto parallel = iterative.render(make_renderers(), RendererVariant::Binary);
        CHECK(parallel.plan->variant == RendererVariant::Binary);
        CHECK(*parallel.surface == *serial.surface);
    }
    SUBCASE("Binary with batched merging") {
        auto options           = small_pool();
        options.merge_strategy = RenderMergeStrategy::Batched;
        RenderPipeline batched(options, make_context(clock));
        auto           result = batched.render(make_renderers(), RendererVariant::Binary);
        CHECK(result.plan->merge_strategy == RenderMergeStrategy::Batched);
        CHECK(*result.surface == *serial.surface);
    }
    SUBCASE("Caches do not change the output") {
        auto options          = small_pool();
        options.surface_cache = true;
        options.screen_cache  = true;
        RenderPipeline cached(options, make_context(clock));
        auto           renderers = make_renderers();
        auto           first     = cached.render(renderers, RendererVariant::Binary);
        CHECK(*first.surface == *serial.surface);
        auto second = cached.render(renderers, RendererVariant::Binary);
        CHECK(*second.surface == *serial.surface);
    }
}

TEST_CASE("Renderers are initialized lazily and timed") {
    ManualClock    clock;
    RenderPipeline pipeline(small_pool(), make_context(clock));
    auto           patch = std::make_shared<PatchRenderer>("patch", Red, SurfaceRect{0, 0, 2, 2});
    RendererList   renderers{patch};

    pipeline.render(renderers);
    pipeline.render(renderers);
    CHECK(patch->initializations.load() == 1);
    CHECK(patch->renders.load() == 2);

    auto timing = pipeline.timing().get("patch");
    REQUIRE(timing);
    CHECK(timing->sample_count == 2);
    CHECK(pipeline.timing().estimate_total(renderers).has_samples);

    patch->reset();
    pipeline.render(renderers);
    CHECK(patch->initializations.load() == 2);
}

TEST_CASE("Recorded timings invalidate cached plans") {
    ManualClock    clock;
    auto           options        = small_pool();
    options.plan_refresh_strategy = RenderPlanRefreshStrategy::OnChange;
    RenderPipeline pipeline(options, make_context(clock));
    auto           renderers = make_renderers();

    auto first  = pipeline.render(renderers);
    auto second = pipeline.render(renderers);
    CHECK(pipeline.timing().version() == 10);
    CHECK(second.plan != first.plan);
    CHECK(second.plan->has_samples);
    CHECK_FALSE(first.plan->has_samples);
    CHECK(second.plan->input_signature == first.plan->input_signature);
}

TEST_CASE("Mirrored renderers are tiled over the window") {
    ManualClock    clock;
    RenderPipeline pipeline(small_pool(), make_context(clock, SurfaceSize{8, 4}, Orientation{.columns = 2, .rows = 1}));
    auto           tile = std::make_shared<PatchRenderer>("tile", Blue, SurfaceRect{0, 0, 1, 1}, DisplayMode::Mirrored);
    auto           full = std::make_shared<PatchRenderer>("full", Red, SurfaceRect{7, 3, 1, 1}, DisplayMode::Full);

    auto result = pipeline.render(RendererList{tile, full});
    REQUIRE(result.surface);
    CHECK(result.surface->size() == SurfaceSize{8, 4});
    CHECK(result.surface->pixel(0, 0) == Blue);
    CHECK(result.surface->pixel(4, 0) == Blue);
    CHECK(result.surface->pixel(1, 0) == Clear);
    CHECK(result.surface->pixel(7, 3) == Red);
}

TEST_CASE("Solid fill renderer") {
    ManualClock       clock;
    RenderPipeline    pipeline(small_pool(), make_context(clock, SurfaceSize{4, 4}));
    auto              fill = std::make_shared<SolidFillRenderer>("fill", Green);
    CHECK(fill->display_mode() == DisplayMode::Mirrored);
    Surface           scratch(1, 1);
    CHECK_THROWS_AS(fill->render(scratch, Orientation{}), std::logic_error);

    auto result = pipeline.render(RendererList{fill});
    Surface expected(4, 4);
    expected.fill(Green);
    CHECK(*result.surface == expected);
}

TEST_CASE("Renderer failures propagate out of the frame") {
    ManualClock    clock;
    RenderPipeline pipeline(small_pool(), make_context(clock));
    RendererList   renderers{std::make_shared<PatchRenderer>("ok", Red, SurfaceRect{0, 0, 1, 1}), std::make_shared<ThrowingRenderer>("broken")};

    CHECK_THROWS_WITH_AS(pipeline.render(renderers), "broken lost its device", std::runtime_error);
    CHECK_THROWS_WITH_AS(pipeline.render(renderers, RendererVariant::Binary), "broken lost its device", std::runtime_error);
}

TEST_CASE("Empty frames and shutdown") {
    ManualClock    clock;
    RenderPipeline pipeline(small_pool(), make_context(clock));
    auto           empty = pipeline.render(RendererList{});
    CHECK_FALSE(empty.surface);
    REQUIRE(empty.plan);

    CHECK(pipeline.worker_pool().size() == 3);
    pipeline.shutdown();
    CHECK(pipeline.worker_pool().isShuttingDown());
    CHECK_THROWS(pipeline.render(make_renderers(), RendererVariant::Binary));
    // Iterative frames never touch the pool.
    CHECK(pipeline.render(make_renderers()).surface);
}

TEST_CASE("Invalid geometry is rejected") {
    ManualClock clock;
    CHECK_THROWS_AS(RenderPipeline(small_pool(), make_context(clock, SurfaceSize{0, 4})), std::invalid_argument);
}

} // TEST_SUITE

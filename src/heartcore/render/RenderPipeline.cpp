#include <heartcore/render/RenderPipeline.hpp>

#include "log/TaggedLogger.hpp"

#include <thread>

namespace HC {

namespace {

auto worker_count(RenderOptions const& options) -> std::size_t {
    if (options.max_workers > 0) {
        return options.max_workers;
    }
    auto const hardware = std::thread::hardware_concurrency();
    return hardware > 0 ? hardware : 1;
}

} // namespace

RenderPipeline::RenderPipeline(RenderOptions options, RendererContext context)
    : options_(std::move(options))
    , clock_(context.clock ? *context.clock : SteadyClock::Instance())
    , timing_(options_.timing_strategy, options_.timing_ema_alpha)
    , planner_(timing_, options_, clock_)
    , plan_cache_(planner_,
                  RenderPlanCacheOptions{
                      .refresh_strategy = options_.plan_refresh_strategy,
                      .refresh_ms = options_.plan_refresh_ms,
                      .signature_strategy = options_.plan_signature_strategy,
                  },
                  clock_)
    , provider_(context.window,
                context.orientation,
                RendererSurfaceProvider::Options{.tile_strategy = options_.tile_strategy, .surface_cache = options_.surface_cache})
    , processor_(provider_, timing_, context)
    , pool_(std::make_unique<WorkerPool>(worker_count(options_)))
    , collector_([this](RendererPtr const& renderer) { return processor_.process(renderer); }, *pool_)
    , composer_(options_.screen_cache)
    , merger_(composer_) {
    hc_log("RenderPipeline ready: variant=" + std::string(toString(options_.default_variant))
               + " merge=" + std::string(toString(options_.merge_strategy)) + " workers=" + std::to_string(pool_->size()),
           "RenderPipeline");
}

RenderPipeline::~RenderPipeline() {
    shutdown();
}

auto RenderPipeline::render(RendererList const& renderers, std::optional<RendererVariant> override_variant) -> RenderResult {
    auto plan = plan_cache_.get_plan(renderers, options_.default_variant, override_variant);

    SurfacePtr surface;
    if (plan->variant == RendererVariant::Binary) {
        auto surfaces = collector_.collect_parallel(renderers);
        surface = merger_.compose_parallel(std::move(surfaces), plan->merge_strategy, *pool_);
    } else {
        auto surfaces = collector_.collect_serial(renderers);
        surface = merger_.compose_serial(std::move(surfaces), plan->merge_strategy);
    }
    return RenderResult{.surface = std::move(surface), .plan = std::move(plan)};
}

void RenderPipeline::shutdown() {
    if (pool_) {
        pool_->shutdown();
    }
}

} // namespace HC

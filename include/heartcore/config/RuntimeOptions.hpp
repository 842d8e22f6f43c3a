#pragma once
#include <heartcore/core/Error.hpp>
#include <heartcore/events/EventBusOptions.hpp>
#include <heartcore/render/RenderStrategies.hpp>
#include <heartcore/stream/StreamShareSettings.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace HC {

struct RenderOptions {
    RendererVariant             default_variant{RendererVariant::Iterative};
    RenderMergeStrategy         merge_strategy{RenderMergeStrategy::InPlace};
    double                      merge_cost_threshold_ms{6.0};
    std::size_t                 merge_surface_threshold{3};
    RenderTileStrategy          tile_strategy{RenderTileStrategy::Blits};
    RenderPlanRefreshStrategy   plan_refresh_strategy{RenderPlanRefreshStrategy::TimeBoxed};
    std::int64_t                plan_refresh_ms{100};
    RenderPlanSignatureStrategy plan_signature_strategy{RenderPlanSignatureStrategy::Identity};
    std::size_t                 parallel_threshold{4};
    double                      parallel_cost_threshold_ms{12.0};
    std::size_t                 max_workers{0}; // 0 selects the hardware concurrency
    bool                        surface_cache{false};
    bool                        screen_cache{false};
    RendererTimingStrategy      timing_strategy{RendererTimingStrategy::Ema};
    double                      timing_ema_alpha{0.2};
};

struct PacingOptions {
    FramePacingStrategy strategy{FramePacingStrategy::Off};
    double              max_fps{60.0}; // 0 disables the fps-derived interval
    double              min_interval_ms{0.0};
    double              utilization_target{0.9};
};

struct RuntimeOptions {
    RenderOptions       render;
    PacingOptions       pacing;
    StreamShareSettings streams;
    EventBusOptions     events;
};

auto ValidateRenderOptions(RenderOptions const& options) -> std::optional<Error>;
auto ValidatePacingOptions(PacingOptions const& options) -> std::optional<Error>;
auto ValidateRuntimeOptions(RuntimeOptions const& options) -> std::optional<Error>;

/**
 * Applies HEART_* environment variables on top of the given options. Unknown enum values and
 * out-of-range numbers are reported, never replaced by defaults.
 */
auto ApplyRuntimeEnvOverrides(RuntimeOptions& options) -> std::optional<Error>;

// Keys mirror the environment names in lower case, grouped by section:
// {"render": {"merge_strategy": "batched"}, "pacing": {...}, "streams": {...}, "events": {...}}
auto RuntimeOptionsFromJson(nlohmann::json const& document, RuntimeOptions base = {}) -> Expected<RuntimeOptions>;
auto LoadRuntimeOptions(std::filesystem::path const& path) -> Expected<RuntimeOptions>;

auto RuntimeOptionsToJson(RuntimeOptions const& options) -> nlohmann::json;

} // namespace HC

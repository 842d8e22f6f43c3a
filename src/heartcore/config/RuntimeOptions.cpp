#include <heartcore/config/RuntimeOptions.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

namespace HC {

namespace {

using json = nlohmann::json;

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

template <typename T>
bool parse_integer(std::string_view text, T& out) {
    text = trim(text);
    T    value{};
    auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parse_double(std::string_view text, double& out) {
    text = trim(text);
    double value{};
    auto   result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

std::optional<bool> parse_bool(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::string normalized;
    normalized.reserve(text.size());
    std::transform(text.begin(), text.end(), std::back_inserter(normalized), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
        return false;
    }
    return std::nullopt;
}

auto invalid(std::string_view key, std::string_view requirement, std::string_view value) -> Error {
    return Error{Error::Code::InvalidConfiguration,
                 std::string{key} + " " + std::string{requirement} + " (got '" + std::string{value} + "')"};
}

template <typename T>
auto set_integer(T& target, T minimum) {
    return [&target, minimum](std::string_view key, std::string_view value) -> std::optional<Error> {
        T parsed{};
        if (!parse_integer(value, parsed) || parsed < minimum) {
            return invalid(key, "must be an integer >= " + std::to_string(minimum), value);
        }
        target = parsed;
        return std::nullopt;
    };
}

// lowerExclusive: the value must be strictly greater than minimum.
auto set_double(double& target, double minimum, double maximum, bool lowerExclusive) {
    return [&target, minimum, maximum, lowerExclusive](std::string_view key, std::string_view value) -> std::optional<Error> {
        double parsed{};
        bool   ok = parse_double(value, parsed);
        ok        = ok && (lowerExclusive ? parsed > minimum : parsed >= minimum) && parsed <= maximum;
        if (!ok) {
            std::ostringstream requirement;
            requirement << "must be a number in " << (lowerExclusive ? "(" : "[") << minimum << ", ";
            if (maximum == std::numeric_limits<double>::max())
                requirement << "inf)";
            else
                requirement << maximum << "]";
            return invalid(key, requirement.str(), value);
        }
        target = parsed;
        return std::nullopt;
    };
}

auto set_bool(bool& target) {
    return [&target](std::string_view key, std::string_view value) -> std::optional<Error> {
        auto parsed = parse_bool(value);
        if (!parsed) {
            return invalid(key, "must be a boolean flag", value);
        }
        target = *parsed;
        return std::nullopt;
    };
}

template <typename Enum, typename Parser>
auto set_enum(Enum& target, Parser parser) {
    return [&target, parser](std::string_view key, std::string_view value) -> std::optional<Error> {
        auto parsed = parser(trim(value));
        if (!parsed) {
            return Error{Error::Code::InvalidConfiguration, std::string{key} + ": " + parsed.error().message.value_or("")};
        }
        target = *parsed;
        return std::nullopt;
    };
}

using FieldSetter = std::function<std::optional<Error>(std::string_view key, std::string_view value)>;

struct OptionField {
    std::string_view section;
    std::string_view key;
    std::string_view env;
    FieldSetter      apply;
};

// Every configurable field, addressable by JSON section/key and by environment name.
auto option_fields(RuntimeOptions& options) -> std::vector<OptionField> {
    auto& render  = options.render;
    auto& pacing  = options.pacing;
    auto& streams = options.streams;
    auto  max     = std::numeric_limits<double>::max();

    std::vector<OptionField> fields;
    fields.push_back({"render", "variant", "HEART_RENDER_VARIANT", set_enum(render.default_variant, ParseRendererVariant)});
    fields.push_back({"render", "merge_strategy", "HEART_RENDER_MERGE_STRATEGY", set_enum(render.merge_strategy, ParseRenderMergeStrategy)});
    fields.push_back({"render", "merge_cost_threshold_ms", "HEART_RENDER_MERGE_COST_THRESHOLD_MS", set_double(render.merge_cost_threshold_ms, 0.0, max, false)});
    fields.push_back({"render", "merge_surface_threshold", "HEART_RENDER_MERGE_SURFACE_THRESHOLD", set_integer<std::size_t>(render.merge_surface_threshold, 1)});
    fields.push_back({"render", "tile_strategy", "HEART_RENDER_TILE_STRATEGY", set_enum(render.tile_strategy, ParseRenderTileStrategy)});
    fields.push_back({"render", "plan_refresh_strategy", "HEART_RENDER_PLAN_REFRESH_STRATEGY", set_enum(render.plan_refresh_strategy, ParseRenderPlanRefreshStrategy)});
    fields.push_back({"render", "plan_refresh_ms", "HEART_RENDER_PLAN_REFRESH_MS", set_integer<std::int64_t>(render.plan_refresh_ms, 0)});
    fields.push_back({"render", "plan_signature_strategy", "HEART_RENDER_PLAN_SIGNATURE_STRATEGY", set_enum(render.plan_signature_strategy, ParseRenderPlanSignatureStrategy)});
    fields.push_back({"render", "parallel_threshold", "HEART_RENDER_PARALLEL_THRESHOLD", set_integer<std::size_t>(render.parallel_threshold, 1)});
    fields.push_back({"render", "parallel_cost_threshold_ms", "HEART_RENDER_PARALLEL_COST_THRESHOLD_MS", set_double(render.parallel_cost_threshold_ms, 0.0, max, false)});
    fields.push_back({"render", "max_workers", "HEART_RENDER_MAX_WORKERS", set_integer<std::size_t>(render.max_workers, 1)});
    fields.push_back({"render", "surface_cache", "HEART_RENDER_SURFACE_CACHE", set_bool(render.surface_cache)});
    fields.push_back({"render", "screen_cache", "HEART_RENDER_SCREEN_CACHE", set_bool(render.screen_cache)});
    fields.push_back({"render", "timing_strategy", "HEART_RENDER_TIMING_STRATEGY", set_enum(render.timing_strategy, ParseRendererTimingStrategy)});
    fields.push_back({"render", "timing_ema_alpha", "HEART_RENDER_TIMING_EMA_ALPHA", set_double(render.timing_ema_alpha, 0.0, 1.0, true)});

    fields.push_back({"pacing", "strategy", "HEART_RENDER_LOOP_PACING_STRATEGY", set_enum(pacing.strategy, ParseFramePacingStrategy)});
    fields.push_back({"pacing", "max_fps", "HEART_RENDER_MAX_FPS", set_double(pacing.max_fps, 0.0, max, false)});
    fields.push_back({"pacing", "min_interval_ms", "HEART_RENDER_LOOP_PACING_MIN_INTERVAL_MS", set_double(pacing.min_interval_ms, 0.0, max, false)});
    fields.push_back({"pacing", "utilization_target", "HEART_RENDER_LOOP_PACING_UTILIZATION", set_double(pacing.utilization_target, 0.0, 1.0, true)});

    fields.push_back({"streams", "share_strategy", "HEART_RX_STREAM_SHARE_STRATEGY", set_enum(streams.strategy, ParseStreamShareStrategy)});
    fields.push_back({"streams", "replay_buffer", "HEART_RX_STREAM_REPLAY_BUFFER", set_integer<std::size_t>(streams.replay_buffer_size, 1)});
    fields.push_back({"streams", "replay_window_ms", "HEART_RX_STREAM_REPLAY_WINDOW_MS", [&streams](std::string_view key, std::string_view value) -> std::optional<Error> {
                          std::int64_t parsed{};
                          if (!parse_integer(value, parsed) || parsed < 1) {
                              return invalid(key, "must be an integer >= 1", value);
                          }
                          streams.replay_window_ms = parsed;
                          return std::nullopt;
                      }});
    fields.push_back({"streams", "auto_connect_min_subscribers", "HEART_RX_STREAM_AUTO_CONNECT_MIN_SUBSCRIBERS", set_integer<std::int64_t>(streams.auto_connect_min_subscribers, 1)});
    fields.push_back({"streams", "refcount_min_subscribers", "HEART_RX_STREAM_REFCOUNT_MIN_SUBSCRIBERS", set_integer<std::int64_t>(streams.refcount_min_subscribers, 1)});
    fields.push_back({"streams", "refcount_grace_ms", "HEART_RX_STREAM_REFCOUNT_GRACE_MS", set_integer<std::int64_t>(streams.refcount_grace_ms, 0)});
    fields.push_back({"streams", "connect_mode", "HEART_RX_STREAM_CONNECT_MODE", set_enum(streams.connect_mode, ParseStreamConnectMode)});
    fields.push_back({"streams", "coalesce_window_ms", "HEART_RX_STREAM_COALESCE_WINDOW_MS", set_integer<std::int64_t>(streams.coalesce_window_ms, 0)});

    fields.push_back({"events", "dispatch", "HEART_EVENT_BUS_DISPATCH", set_enum(options.events.dispatch, ParseEventBusDispatch)});
    return fields;
}

auto scalar_text(json const& value) -> std::optional<std::string> {
    if (value.is_string())
        return value.get<std::string>();
    if (value.is_boolean())
        return value.get<bool>() ? std::string{"true"} : std::string{"false"};
    if (value.is_number())
        return value.dump();
    return std::nullopt;
}

} // namespace

auto ValidateRenderOptions(RenderOptions const& options) -> std::optional<Error> {
    if (options.plan_refresh_ms < 0) {
        return Error{Error::Code::InvalidConfiguration, "render plan refresh must be >= 0 ms"};
    }
    if (!(options.timing_ema_alpha > 0.0 && options.timing_ema_alpha <= 1.0)) {
        return Error{Error::Code::InvalidConfiguration, "renderer timing EMA alpha must be in (0, 1]"};
    }
    if (!std::isfinite(options.parallel_cost_threshold_ms) || options.parallel_cost_threshold_ms < 0.0) {
        return Error{Error::Code::InvalidConfiguration, "render parallel cost threshold must be a finite value >= 0"};
    }
    if (!std::isfinite(options.merge_cost_threshold_ms) || options.merge_cost_threshold_ms < 0.0) {
        return Error{Error::Code::InvalidConfiguration, "render merge cost threshold must be a finite value >= 0"};
    }
    if (options.parallel_threshold < 1) {
        return Error{Error::Code::InvalidConfiguration, "render parallel threshold must be >= 1"};
    }
    if (options.merge_surface_threshold < 1) {
        return Error{Error::Code::InvalidConfiguration, "render merge surface threshold must be >= 1"};
    }
    return std::nullopt;
}

auto ValidatePacingOptions(PacingOptions const& options) -> std::optional<Error> {
    if (!std::isfinite(options.max_fps) || options.max_fps < 0.0) {
        return Error{Error::Code::InvalidConfiguration, "max fps must be a finite value >= 0"};
    }
    if (!std::isfinite(options.min_interval_ms) || options.min_interval_ms < 0.0) {
        return Error{Error::Code::InvalidConfiguration, "pacing minimum interval must be a finite value >= 0 ms"};
    }
    if (!(options.utilization_target > 0.0 && options.utilization_target <= 1.0)) {
        return Error{Error::Code::InvalidConfiguration, "pacing utilization target must be in (0, 1]"};
    }
    return std::nullopt;
}

auto ValidateRuntimeOptions(RuntimeOptions const& options) -> std::optional<Error> {
    if (auto error = ValidateRenderOptions(options.render))
        return error;
    if (auto error = ValidatePacingOptions(options.pacing))
        return error;
    return ValidateStreamShareSettings(options.streams);
}

auto ApplyRuntimeEnvOverrides(RuntimeOptions& options) -> std::optional<Error> {
    for (auto const& field : option_fields(options)) {
        std::string const env{field.env};
        if (const char* raw = std::getenv(env.c_str())) {
            if (auto error = field.apply(field.env, std::string_view{raw})) {
                hc_log("Rejected environment override " + env + ": " + describeError(*error), "Config", "Error");
                return error;
            }
            hc_log("Applied environment override " + env + "=" + raw, "Config");
        }
    }
    return ValidateRuntimeOptions(options);
}

auto RuntimeOptionsFromJson(json const& document, RuntimeOptions base) -> Expected<RuntimeOptions> {
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "runtime options document must be a JSON object"});
    }
    auto fields = option_fields(base);
    for (auto const& [section, entries] : document.items()) {
        if (!entries.is_object()) {
            return std::unexpected(Error{Error::Code::InvalidConfiguration, "section '" + section + "' must be a JSON object"});
        }
        for (auto const& [key, value] : entries.items()) {
            auto field = std::find_if(fields.begin(), fields.end(), [&](OptionField const& candidate) {
                return candidate.section == section && candidate.key == key;
            });
            if (field == fields.end()) {
                return std::unexpected(Error{Error::Code::InvalidConfiguration, "unknown option '" + section + "." + key + "'"});
            }
            auto text = scalar_text(value);
            if (!text) {
                return std::unexpected(Error{Error::Code::InvalidConfiguration, "option '" + section + "." + key + "' must be a scalar"});
            }
            auto const qualified = section + "." + key;
            if (auto error = field->apply(qualified, *text)) {
                return std::unexpected(*error);
            }
        }
    }
    if (auto error = ValidateRuntimeOptions(base)) {
        return std::unexpected(*error);
    }
    return base;
}

auto LoadRuntimeOptions(std::filesystem::path const& path) -> Expected<RuntimeOptions> {
    std::ifstream input(path);
    if (!input) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open runtime options file " + path.string()});
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "runtime options file " + path.string() + " is not valid JSON"});
    }
    return RuntimeOptionsFromJson(document);
}

auto RuntimeOptionsToJson(RuntimeOptions const& options) -> json {
    auto const& render = options.render;
    json        document;
    document["render"] = {
            {"variant", std::string{toString(render.default_variant)}},
            {"merge_strategy", std::string{toString(render.merge_strategy)}},
            {"merge_cost_threshold_ms", render.merge_cost_threshold_ms},
            {"merge_surface_threshold", render.merge_surface_threshold},
            {"tile_strategy", std::string{toString(render.tile_strategy)}},
            {"plan_refresh_strategy", std::string{toString(render.plan_refresh_strategy)}},
            {"plan_refresh_ms", render.plan_refresh_ms},
            {"plan_signature_strategy", std::string{toString(render.plan_signature_strategy)}},
            {"parallel_threshold", render.parallel_threshold},
            {"parallel_cost_threshold_ms", render.parallel_cost_threshold_ms},
            {"surface_cache", render.surface_cache},
            {"screen_cache", render.screen_cache},
            {"timing_strategy", std::string{toString(render.timing_strategy)}},
            {"timing_ema_alpha", render.timing_ema_alpha},
    };
    if (render.max_workers > 0)
        document["render"]["max_workers"] = render.max_workers;
    document["pacing"] = {
            {"strategy", std::string{toString(options.pacing.strategy)}},
            {"max_fps", options.pacing.max_fps},
            {"min_interval_ms", options.pacing.min_interval_ms},
            {"utilization_target", options.pacing.utilization_target},
    };
    auto const& streams = options.streams;
    document["streams"] = {
            {"share_strategy", std::string{toString(streams.strategy)}},
            {"replay_buffer", streams.replay_buffer_size},
            {"auto_connect_min_subscribers", streams.auto_connect_min_subscribers},
            {"refcount_min_subscribers", streams.refcount_min_subscribers},
            {"refcount_grace_ms", streams.refcount_grace_ms},
            {"connect_mode", std::string{toString(streams.connect_mode)}},
            {"coalesce_window_ms", streams.coalesce_window_ms},
    };
    if (streams.replay_window_ms)
        document["streams"]["replay_window_ms"] = *streams.replay_window_ms;
    document["events"] = {{"dispatch", std::string{toString(options.events.dispatch)}}};
    return document;
}

} // namespace HC

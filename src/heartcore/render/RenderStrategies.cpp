#include <heartcore/render/RenderStrategies.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace HC {

namespace {

auto normalize(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (unsigned char ch : text) {
        if (ch == '-')
            out.push_back('_');
        else
            out.push_back(static_cast<char>(std::tolower(ch)));
    }
    return out;
}

template <typename Enum, std::size_t N>
auto parse_named(std::string_view text, std::array<std::pair<std::string_view, Enum>, N> const& names, std::string_view what)
        -> Expected<Enum> {
    auto const key = normalize(text);
    auto const it  = std::find_if(names.begin(), names.end(), [&](auto const& entry) { return entry.first == key; });
    if (it != names.end())
        return it->second;

    std::string expected;
    for (auto const& [name, _] : names) {
        if (!expected.empty())
            expected.append(", ");
        expected.append(name);
    }
    return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                 "unknown " + std::string{what} + " '" + std::string{text} + "' (expected one of: " + expected + ")"});
}

constexpr std::array<std::pair<std::string_view, RendererVariant>, 3> kVariants{{
        {"auto", RendererVariant::Auto},
        {"binary", RendererVariant::Binary},
        {"iterative", RendererVariant::Iterative},
}};

constexpr std::array<std::pair<std::string_view, RenderMergeStrategy>, 3> kMergeStrategies{{
        {"in_place", RenderMergeStrategy::InPlace},
        {"batched", RenderMergeStrategy::Batched},
        {"adaptive", RenderMergeStrategy::Adaptive},
}};

constexpr std::array<std::pair<std::string_view, RenderTileStrategy>, 2> kTileStrategies{{
        {"blits", RenderTileStrategy::Blits},
        {"loop", RenderTileStrategy::Loop},
}};

constexpr std::array<std::pair<std::string_view, RenderPlanRefreshStrategy>, 2> kRefreshStrategies{{
        {"on_change", RenderPlanRefreshStrategy::OnChange},
        {"time_boxed", RenderPlanRefreshStrategy::TimeBoxed},
}};

constexpr std::array<std::pair<std::string_view, RenderPlanSignatureStrategy>, 3> kSignatureStrategies{{
        {"identity", RenderPlanSignatureStrategy::Identity},
        {"type", RenderPlanSignatureStrategy::Type},
        {"instance", RenderPlanSignatureStrategy::Identity},
}};

constexpr std::array<std::pair<std::string_view, RendererTimingStrategy>, 2> kTimingStrategies{{
        {"ema", RendererTimingStrategy::Ema},
        {"cumulative", RendererTimingStrategy::Cumulative},
}};

constexpr std::array<std::pair<std::string_view, FramePacingStrategy>, 2> kPacingStrategies{{
        {"off", FramePacingStrategy::Off},
        {"adaptive", FramePacingStrategy::Adaptive},
}};

template <typename Enum, std::size_t N>
auto name_of(Enum value, std::array<std::pair<std::string_view, Enum>, N> const& names) -> std::string_view {
    for (auto const& [name, candidate] : names) {
        if (candidate == value)
            return name;
    }
    return "unknown";
}

} // namespace

auto ParseRendererVariant(std::string_view text) -> Expected<RendererVariant> {
    return parse_named(text, kVariants, "renderer variant");
}

auto ParseRenderMergeStrategy(std::string_view text) -> Expected<RenderMergeStrategy> {
    return parse_named(text, kMergeStrategies, "render merge strategy");
}

auto ParseRenderTileStrategy(std::string_view text) -> Expected<RenderTileStrategy> {
    return parse_named(text, kTileStrategies, "render tile strategy");
}

auto ParseRenderPlanRefreshStrategy(std::string_view text) -> Expected<RenderPlanRefreshStrategy> {
    return parse_named(text, kRefreshStrategies, "render plan refresh strategy");
}

auto ParseRenderPlanSignatureStrategy(std::string_view text) -> Expected<RenderPlanSignatureStrategy> {
    return parse_named(text, kSignatureStrategies, "render plan signature strategy");
}

auto ParseRendererTimingStrategy(std::string_view text) -> Expected<RendererTimingStrategy> {
    return parse_named(text, kTimingStrategies, "renderer timing strategy");
}

auto ParseFramePacingStrategy(std::string_view text) -> Expected<FramePacingStrategy> {
    return parse_named(text, kPacingStrategies, "frame pacing strategy");
}

auto toString(RendererVariant variant) -> std::string_view {
    return name_of(variant, kVariants);
}

auto toString(RenderMergeStrategy strategy) -> std::string_view {
    return name_of(strategy, kMergeStrategies);
}

auto toString(RenderTileStrategy strategy) -> std::string_view {
    return name_of(strategy, kTileStrategies);
}

auto toString(RenderPlanRefreshStrategy strategy) -> std::string_view {
    return name_of(strategy, kRefreshStrategies);
}

auto toString(RenderPlanSignatureStrategy strategy) -> std::string_view {
    return name_of(strategy, kSignatureStrategies);
}

auto toString(RendererTimingStrategy strategy) -> std::string_view {
    return name_of(strategy, kTimingStrategies);
}

auto toString(FramePacingStrategy strategy) -> std::string_view {
    return name_of(strategy, kPacingStrategies);
}

} // namespace HC

#pragma once
#include <heartcore/core/Error.hpp>

#include <string_view>

namespace HC {

// AUTO is resolved by the planner; a RenderPlan only ever carries Binary or Iterative.
enum class RendererVariant { Auto, Binary, Iterative };

enum class RenderMergeStrategy { InPlace, Batched, Adaptive };

enum class RenderTileStrategy { Blits, Loop };

enum class RenderPlanRefreshStrategy { OnChange, TimeBoxed };

enum class RenderPlanSignatureStrategy { Identity, Type };

enum class RendererTimingStrategy { Ema, Cumulative };

enum class FramePacingStrategy { Off, Adaptive };

auto ParseRendererVariant(std::string_view text) -> Expected<RendererVariant>;
auto ParseRenderMergeStrategy(std::string_view text) -> Expected<RenderMergeStrategy>;
auto ParseRenderTileStrategy(std::string_view text) -> Expected<RenderTileStrategy>;
auto ParseRenderPlanRefreshStrategy(std::string_view text) -> Expected<RenderPlanRefreshStrategy>;
auto ParseRenderPlanSignatureStrategy(std::string_view text) -> Expected<RenderPlanSignatureStrategy>;
auto ParseRendererTimingStrategy(std::string_view text) -> Expected<RendererTimingStrategy>;
auto ParseFramePacingStrategy(std::string_view text) -> Expected<FramePacingStrategy>;

auto toString(RendererVariant variant) -> std::string_view;
auto toString(RenderMergeStrategy strategy) -> std::string_view;
auto toString(RenderTileStrategy strategy) -> std::string_view;
auto toString(RenderPlanRefreshStrategy strategy) -> std::string_view;
auto toString(RenderPlanSignatureStrategy strategy) -> std::string_view;
auto toString(RendererTimingStrategy strategy) -> std::string_view;
auto toString(FramePacingStrategy strategy) -> std::string_view;

} // namespace HC

#pragma once

#include <heartcore/render/Renderer.hpp>

#include <atomic>
#include <string>

namespace HC {

// Stateless renderer covering its surface with one color.
class SolidFillRenderer final : public Renderer {
public:
    SolidFillRenderer(std::string name, Color color, DisplayMode mode = DisplayMode::Mirrored);

    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto display_mode() const -> DisplayMode override { return mode_; }
    [[nodiscard]] auto color() const -> Color { return color_; }

    void initialize(RendererContext const& context) override;
    void render(Surface& surface, Orientation const& orientation) override;
    void reset() override;
    [[nodiscard]] auto is_initialized() const -> bool override { return initialized_.load(); }

private:
    std::string const name_;
    Color const color_;
    DisplayMode const mode_;
    std::atomic<bool> initialized_{false};
};

} // namespace HC

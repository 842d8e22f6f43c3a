#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace HC {

struct SurfaceSize {
    int width = 0;
    int height = 0;

    [[nodiscard]] auto area() const -> std::size_t {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
    }
    auto operator==(SurfaceSize const&) const -> bool = default;
};

struct SurfaceRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 0;

    auto operator==(Color const&) const -> bool = default;
};

// Color with alpha multiplied in, every channel in [0, 1].
struct PremultipliedColor {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 0.0;
};

[[nodiscard]] auto premultiply(Color color) -> PremultipliedColor;
// Rounds to the nearest RGBA8 value; a zero alpha gives transparent black.
[[nodiscard]] auto unpremultiply(PremultipliedColor color) -> Color;
[[nodiscard]] auto composite_over(PremultipliedColor destination, PremultipliedColor source) -> PremultipliedColor;

/**
 * RGBA8 pixel buffer with straight alpha. Renderers draw into it; a single blit blends with
 * source-over and rounds per pixel. Stacks of layers are merged through CompositeBuffer so the
 * rounding happens once per frame.
 */
class Surface {
public:
    explicit Surface(SurfaceSize size);
    Surface(int width, int height);

    [[nodiscard]] auto size() const -> SurfaceSize { return size_; }
    [[nodiscard]] auto width() const -> int { return size_.width; }
    [[nodiscard]] auto height() const -> int { return size_.height; }

    [[nodiscard]] auto pixel(int x, int y) const -> Color;
    void set_pixel(int x, int y, Color color);

    void fill(Color color);
    void fill_rect(SurfaceRect rect, Color color);
    // Resets every pixel to transparent black without reallocating.
    void clear();

    // Source-over blit of source at (dest_x, dest_y), clipped to this surface.
    void blit(Surface const& source, int dest_x, int dest_y);

    [[nodiscard]] auto pixels() const -> std::span<Color const> { return pixels_; }
    [[nodiscard]] auto pixels() -> std::span<Color> { return pixels_; }

    auto operator==(Surface const& other) const -> bool;

private:
    [[nodiscard]] auto index(int x, int y) const -> std::size_t;

    SurfaceSize        size_;
    std::vector<Color> pixels_;
};

using SurfacePtr = std::shared_ptr<Surface>;

[[nodiscard]] auto blend_over(Color destination, Color source) -> Color;

} // namespace HC

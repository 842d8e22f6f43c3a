#include <heartcore/render/Surface.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace HC {

namespace {

auto validate_size(SurfaceSize size) -> SurfaceSize {
    if (size.width <= 0 || size.height <= 0) {
        throw std::invalid_argument("Surface dimensions must be positive (got "
                                    + std::to_string(size.width) + "x" + std::to_string(size.height) + ")");
    }
    return size;
}

} // namespace

Surface::Surface(SurfaceSize size)
    : size_(validate_size(size))
    , pixels_(size_.area()) {}

Surface::Surface(int width, int height)
    : Surface(SurfaceSize{width, height}) {}

auto Surface::index(int x, int y) const -> std::size_t {
    if (x < 0 || y < 0 || x >= size_.width || y >= size_.height) {
        throw std::out_of_range("Surface pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") outside "
                                + std::to_string(size_.width) + "x" + std::to_string(size_.height));
    }
    return static_cast<std::size_t>(y) * static_cast<std::size_t>(size_.width) + static_cast<std::size_t>(x);
}

auto Surface::pixel(int x, int y) const -> Color {
    return pixels_[index(x, y)];
}

void Surface::set_pixel(int x, int y, Color color) {
    pixels_[index(x, y)] = color;
}

void Surface::fill(Color color) {
    std::fill(pixels_.begin(), pixels_.end(), color);
}

void Surface::fill_rect(SurfaceRect rect, Color color) {
    auto const x0 = std::max(rect.x, 0);
    auto const y0 = std::max(rect.y, 0);
    auto const x1 = std::min(rect.x + rect.width, size_.width);
    auto const y1 = std::min(rect.y + rect.height, size_.height);
    for (int y = y0; y < y1; ++y) {
        auto row = pixels_.begin() + static_cast<std::ptrdiff_t>(y) * size_.width;
        std::fill(row + x0, row + x1, color);
    }
}

void Surface::clear() {
    fill(Color{});
}

void Surface::blit(Surface const& source, int dest_x, int dest_y) {
    auto const x0 = std::max(dest_x, 0);
    auto const y0 = std::max(dest_y, 0);
    auto const x1 = std::min(dest_x + source.width(), size_.width);
    auto const y1 = std::min(dest_y + source.height(), size_.height);
    for (int y = y0; y < y1; ++y) {
        auto const* src = source.pixels_.data() + static_cast<std::size_t>(y - dest_y) * source.width();
        auto*       dst = pixels_.data() + static_cast<std::size_t>(y) * size_.width;
        for (int x = x0; x < x1; ++x) {
            dst[x] = blend_over(dst[x], src[x - dest_x]);
        }
    }
}

auto Surface::operator==(Surface const& other) const -> bool {
    return size_ == other.size_ && pixels_ == other.pixels_;
}

auto premultiply(Color color) -> PremultipliedColor {
    auto const alpha = color.a / 255.0;
    return PremultipliedColor{color.r / 255.0 * alpha, color.g / 255.0 * alpha, color.b / 255.0 * alpha, alpha};
}

auto unpremultiply(PremultipliedColor color) -> Color {
    if (color.a <= 0.0) {
        return Color{};
    }
    auto quantize = [](double value) -> std::uint8_t {
        return static_cast<std::uint8_t>(std::clamp(value * 255.0 + 0.5, 0.0, 255.0));
    };
    return Color{quantize(color.r / color.a), quantize(color.g / color.a), quantize(color.b / color.a), quantize(color.a)};
}

auto composite_over(PremultipliedColor destination, PremultipliedColor source) -> PremultipliedColor {
    auto const keep = 1.0 - source.a;
    return PremultipliedColor{source.r + destination.r * keep,
                              source.g + destination.g * keep,
                              source.b + destination.b * keep,
                              source.a + destination.a * keep};
}

auto blend_over(Color destination, Color source) -> Color {
    if (source.a == 255)
        return source;
    if (source.a == 0)
        return destination;
    return unpremultiply(composite_over(premultiply(destination), premultiply(source)));
}

} // namespace HC

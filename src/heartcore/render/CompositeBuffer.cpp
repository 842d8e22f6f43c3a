#include <heartcore/render/CompositeBuffer.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace HC {

namespace {

auto describe(SurfaceSize size) -> std::string {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

} // namespace

CompositeBuffer::CompositeBuffer(SurfaceSize size)
    : size_(size) {
    if (size.width <= 0 || size.height <= 0) {
        throw std::invalid_argument("CompositeBuffer dimensions must be positive (got " + describe(size) + ")");
    }
    pixels_.resize(size.area());
}

CompositeBuffer::CompositeBuffer(Surface const& surface)
    : size_(surface.size()) {
    auto const source = surface.pixels();
    pixels_.reserve(source.size());
    for (auto const& color : source) {
        pixels_.push_back(premultiply(color));
    }
}

void CompositeBuffer::composite(Surface const& surface, int dest_x, int dest_y) {
    auto const x0 = std::max(dest_x, 0);
    auto const y0 = std::max(dest_y, 0);
    auto const x1 = std::min(dest_x + surface.width(), size_.width);
    auto const y1 = std::min(dest_y + surface.height(), size_.height);
    auto const source = surface.pixels();
    for (int y = y0; y < y1; ++y) {
        auto const src_row = static_cast<std::size_t>(y - dest_y) * static_cast<std::size_t>(surface.width());
        auto const dst_row = static_cast<std::size_t>(y) * static_cast<std::size_t>(size_.width);
        for (int x = x0; x < x1; ++x) {
            auto const color = source[src_row + static_cast<std::size_t>(x - dest_x)];
            if (color.a == 0) {
                continue;
            }
            auto& destination = pixels_[dst_row + static_cast<std::size_t>(x)];
            destination = composite_over(destination, premultiply(color));
        }
    }
}

void CompositeBuffer::composite(CompositeBuffer const& overlay) {
    if (overlay.size_ != size_) {
        throw std::invalid_argument("cannot composite a " + describe(overlay.size_) + " buffer onto " + describe(size_));
    }
    for (std::size_t i = 0; i < pixels_.size(); ++i) {
        pixels_[i] = composite_over(pixels_[i], overlay.pixels_[i]);
    }
}

void CompositeBuffer::fill(Color color, std::optional<SurfaceRect> rect) {
    auto const value = premultiply(color);
    auto const area  = rect.value_or(SurfaceRect{0, 0, size_.width, size_.height});
    auto const x0 = std::max(area.x, 0);
    auto const y0 = std::max(area.y, 0);
    auto const x1 = std::min(area.x + area.width, size_.width);
    auto const y1 = std::min(area.y + area.height, size_.height);
    for (int y = y0; y < y1; ++y) {
        auto row = pixels_.begin() + static_cast<std::ptrdiff_t>(y) * size_.width;
        std::fill(row + x0, row + x1, value);
    }
}

void CompositeBuffer::clear() {
    std::fill(pixels_.begin(), pixels_.end(), PremultipliedColor{});
}

void CompositeBuffer::resolve_into(Surface& target) const {
    if (target.size() != size_) {
        throw std::invalid_argument("cannot resolve a " + describe(size_) + " buffer into a " + describe(target.size()) + " surface");
    }
    auto destination = target.pixels();
    for (std::size_t i = 0; i < pixels_.size(); ++i) {
        destination[i] = unpremultiply(pixels_[i]);
    }
}

auto CompositeBuffer::pixel(int x, int y) const -> PremultipliedColor {
    if (x < 0 || y < 0 || x >= size_.width || y >= size_.height) {
        throw std::out_of_range("CompositeBuffer pixel (" + std::to_string(x) + ", " + std::to_string(y) + ") outside " + describe(size_));
    }
    return pixels_[static_cast<std::size_t>(y) * static_cast<std::size_t>(size_.width) + static_cast<std::size_t>(x)];
}

} // namespace HC

#pragma once

#include <heartcore/render/Surface.hpp>

#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace HC {

/**
 * Premultiplied RGBA in double precision, used while several layers are being composited.
 *
 * Source-over on premultiplied values is associative, so merging layers left to right or as a
 * pairwise tree yields the same buffer up to floating point noise far below one RGBA8 step.
 * Quantizing happens once, in resolve_into().
 */
class CompositeBuffer {
public:
    explicit CompositeBuffer(SurfaceSize size);
    explicit CompositeBuffer(Surface const& surface);

    [[nodiscard]] auto size() const -> SurfaceSize { return size_; }

    // Source-over of surface at (dest_x, dest_y), clipped to this buffer.
    void composite(Surface const& surface, int dest_x = 0, int dest_y = 0);
    // Source-over of an equally sized buffer. Throws std::invalid_argument when sizes differ.
    void composite(CompositeBuffer const& overlay);

    // Replaces the pixels of rect, or of the whole buffer when rect is empty.
    void fill(Color color, std::optional<SurfaceRect> rect = std::nullopt);
    void clear();

    // Writes the buffer into target as straight-alpha RGBA8. Sizes must match.
    void resolve_into(Surface& target) const;
    [[nodiscard]] auto pixel(int x, int y) const -> PremultipliedColor;

private:
    SurfaceSize size_;
    std::vector<PremultipliedColor> pixels_;
};

using CompositeBufferPtr = std::shared_ptr<CompositeBuffer>;

} // namespace HC

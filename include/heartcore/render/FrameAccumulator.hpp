#pragma once

#include <heartcore/render/Surface.hpp>

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace HC {

// Queues draw operations against one target surface and applies them in order on flush(),
// blending in a CompositeBuffer and rounding into the target once.
class FrameAccumulator {
public:
    explicit FrameAccumulator(SurfacePtr target);

    void queue_blit(SurfacePtr source, int x = 0, int y = 0);
    // Fills rect, or the whole target when rect is empty.
    void queue_fill(Color color, std::optional<SurfaceRect> rect = std::nullopt);

    // Clears the target first when clear is set, applies the queue and empties it.
    auto flush(bool clear = true) -> SurfacePtr;
    void reset();

    [[nodiscard]] auto target() const -> SurfacePtr const& { return target_; }
    [[nodiscard]] auto pending() const -> std::size_t { return operations_.size(); }

private:
    struct Blit {
        SurfacePtr source;
        int x = 0;
        int y = 0;
    };
    struct Fill {
        Color color;
        std::optional<SurfaceRect> rect;
    };

    SurfacePtr target_;
    std::vector<std::variant<Blit, Fill>> operations_;
};

} // namespace HC

#include <heartcore/render/FrameAccumulator.hpp>
#include <heartcore/render/CompositeBuffer.hpp>

#include <stdexcept>

namespace HC {

FrameAccumulator::FrameAccumulator(SurfacePtr target)
    : target_(std::move(target)) {
    if (!target_) {
        throw std::invalid_argument("FrameAccumulator requires a target surface");
    }
}

void FrameAccumulator::queue_blit(SurfacePtr source, int x, int y) {
    if (!source) {
        return;
    }
    operations_.emplace_back(Blit{std::move(source), x, y});
}

void FrameAccumulator::queue_fill(Color color, std::optional<SurfaceRect> rect) {
    operations_.emplace_back(Fill{color, rect});
}

auto FrameAccumulator::flush(bool clear) -> SurfacePtr {
    if (operations_.empty()) {
        if (clear) {
            target_->clear();
        }
        return target_;
    }
    CompositeBuffer buffer = clear ? CompositeBuffer(target_->size()) : CompositeBuffer(*target_);
    for (auto const& operation : operations_) {
        if (auto const* blit = std::get_if<Blit>(&operation)) {
            buffer.composite(*blit->source, blit->x, blit->y);
        } else {
            auto const& fill = std::get<Fill>(operation);
            buffer.fill(fill.color, fill.rect);
        }
    }
    buffer.resolve_into(*target_);
    operations_.clear();
    return target_;
}

void FrameAccumulator::reset() {
    operations_.clear();
}

} // namespace HC

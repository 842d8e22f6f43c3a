#include <heartcore/runtime/FrameSink.hpp>

namespace HC {

auto MemoryFrameSink::present(Surface const& frame) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->last = frame;
    ++this->presented;
}

auto MemoryFrameSink::close() -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    this->closed = true;
}

auto MemoryFrameSink::lastFrame() const -> std::optional<Surface> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->last;
}

auto MemoryFrameSink::presentedCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->presented;
}

auto MemoryFrameSink::isClosed() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->closed;
}

} // namespace HC

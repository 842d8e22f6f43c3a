#pragma once
#include <heartcore/render/Surface.hpp>

#include <cstddef>
#include <mutex>
#include <optional>

namespace HC {

// The display device. present() is called from the render loop thread only.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    virtual auto present(Surface const& frame) -> void = 0;
    // Releases the device; called once after the worker pool has drained.
    virtual auto close() -> void = 0;
};

// Keeps the last presented frame in memory.
class MemoryFrameSink final : public FrameSink {
public:
    auto present(Surface const& frame) -> void override;
    auto close() -> void override;

    auto lastFrame() const -> std::optional<Surface>;
    auto presentedCount() const -> std::size_t;
    auto isClosed() const -> bool;

private:
    mutable std::mutex     mutex;
    std::optional<Surface> last;
    std::size_t            presented = 0;
    bool                   closed    = false;
};

} // namespace HC

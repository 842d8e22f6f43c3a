#pragma once

#include <heartcore/core/Clock.hpp>
#include <heartcore/render/Surface.hpp>

#include <memory>
#include <string>
#include <vector>

namespace HC {

class EventBus;
class PeripheralStreams;

enum class DisplayMode { Full, Mirrored, OpenGL };

// Grid of mirrored tiles covering the window.
struct Orientation {
    int columns = 1;
    int rows = 1;

    auto operator==(Orientation const&) const -> bool = default;
};

struct RendererContext {
    EventBus* events = nullptr;
    PeripheralStreams* streams = nullptr;
    Clock const* clock = nullptr;
    Orientation orientation{};
    SurfaceSize window{};
};

/**
 * A unit producing one surface per frame.
 *
 * initialize() establishes the renderer's first state, render() draws from that state only,
 * and reset() releases subscriptions and returns the renderer to the uninitialized state.
 * render() before initialize() is a programming error and throws std::logic_error.
 * Renderers may be rendered from a worker thread but never from two threads at once.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto display_mode() const -> DisplayMode { return DisplayMode::Mirrored; }

    virtual void initialize(RendererContext const& context) = 0;
    virtual void render(Surface& surface, Orientation const& orientation) = 0;
    virtual void reset() = 0;
    [[nodiscard]] virtual auto is_initialized() const -> bool = 0;
};

using RendererPtr = std::shared_ptr<Renderer>;
using RendererList = std::vector<RendererPtr>;

[[nodiscard]] auto resolve_display_mode(RendererList const& renderers) -> DisplayMode;
[[nodiscard]] auto to_string(DisplayMode mode) -> char const*;

} // namespace HC

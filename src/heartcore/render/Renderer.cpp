#include <heartcore/render/Renderer.hpp>

#include <algorithm>

namespace HC {

auto resolve_display_mode(RendererList const& renderers) -> DisplayMode {
    auto has = [&](DisplayMode mode) {
        return std::any_of(renderers.begin(), renderers.end(), [&](RendererPtr const& renderer) {
            return renderer && renderer->display_mode() == mode;
        });
    };
    if (has(DisplayMode::OpenGL)) {
        return DisplayMode::OpenGL;
    }
    if (has(DisplayMode::Full)) {
        return DisplayMode::Full;
    }
    return DisplayMode::Mirrored;
}

auto to_string(DisplayMode mode) -> char const* {
    switch (mode) {
    case DisplayMode::Full:
        return "full";
    case DisplayMode::Mirrored:
        return "mirrored";
    case DisplayMode::OpenGL:
        return "opengl";
    }
    return "mirrored";
}

} // namespace HC

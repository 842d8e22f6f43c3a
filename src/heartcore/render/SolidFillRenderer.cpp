#include <heartcore/render/SolidFillRenderer.hpp>

#include <stdexcept>

namespace HC {

SolidFillRenderer::SolidFillRenderer(std::string name, Color color, DisplayMode mode)
    : name_(std::move(name)), color_(color), mode_(mode) {}

void SolidFillRenderer::initialize(RendererContext const&) {
    initialized_ = true;
}

void SolidFillRenderer::render(Surface& surface, Orientation const&) {
    if (!initialized_) {
        throw std::logic_error(name_ + " rendered before initialize()");
    }
    surface.fill(color_);
}

void SolidFillRenderer::reset() {
    initialized_ = false;
}

} // namespace HC

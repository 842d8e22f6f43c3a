#include <heartcore/render/EventMeterRenderer.hpp>

#include <heartcore/events/PeripheralStreams.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace HC {

namespace {

auto event_value(InputEvent const& event) -> std::optional<double> {
    if (event.data.is_number()) {
        return event.data.get<double>();
    }
    if (event.data.is_object()) {
        auto it = event.data.find("value");
        if (it != event.data.end() && it->is_number()) {
            return it->get<double>();
        }
    }
    return std::nullopt;
}

} // namespace

EventMeterRenderer::EventMeterRenderer(std::string name, Options options)
    : name_(std::move(name)), options_(std::move(options)) {
    if (options_.event_type.empty()) {
        throw std::invalid_argument("EventMeterRenderer requires an event type");
    }
    if (!std::isfinite(options_.max_value) || options_.max_value <= 0.0) {
        throw std::invalid_argument("EventMeterRenderer max value must be positive");
    }
}

void EventMeterRenderer::initialize(RendererContext const& context) {
    if (context.streams == nullptr) {
        throw std::invalid_argument(name_ + " needs peripheral streams to initialize");
    }
    state_.publish(State{});
    auto const max_value = options_.max_value;
    auto const producer = options_.producer_id;
    state_.follow(context.streams->eventsOfType(options_.event_type),
                  [max_value, producer](StateHolder<State>::Snapshot const& previous, InputEvent const& event) {
                      State next = previous ? *previous : State{};
                      if (producer && event.producer_id != *producer) {
                          return next;
                      }
                      auto value = event_value(event);
                      if (!value || !std::isfinite(*value)) {
                          return next;
                      }
                      next.level = std::clamp(*value / max_value, 0.0, 1.0);
                      next.events_seen += 1;
                      return next;
                  });
}

void EventMeterRenderer::render(Surface& surface, Orientation const&) {
    auto const state = state_.require(name_);
    surface.fill(options_.background);
    auto const bar_height = static_cast<int>(std::lround(state->level * surface.height()));
    if (bar_height > 0) {
        surface.fill_rect(SurfaceRect{0, surface.height() - bar_height, surface.width(), bar_height}, options_.bar_color);
    }
}

void EventMeterRenderer::reset() {
    state_.reset();
}

} // namespace HC

#pragma once

#include <heartcore/render/Renderer.hpp>
#include <heartcore/render/StateHolder.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace HC {

/**
 * Level bar driven by peripheral events.
 *
 * Follows the shared stream of one event type and keeps the latest numeric "value" (or a bare
 * number payload) scaled by max_value as its state. The bar grows from the bottom edge.
 */
class EventMeterRenderer final : public Renderer {
public:
    struct Options {
        std::string event_type;
        Color bar_color{255, 255, 255, 255};
        Color background{0, 0, 0, 0};
        double max_value = 1.0;
        std::optional<std::int64_t> producer_id; // every producer when empty
        DisplayMode display_mode = DisplayMode::Mirrored;
    };

    struct State {
        double level = 0.0; // 0..1
        std::uint64_t events_seen = 0;
    };

    EventMeterRenderer(std::string name, Options options);

    [[nodiscard]] auto name() const -> std::string override { return name_; }
    [[nodiscard]] auto display_mode() const -> DisplayMode override { return options_.display_mode; }

    // Requires context.streams.
    void initialize(RendererContext const& context) override;
    void render(Surface& surface, Orientation const& orientation) override;
    void reset() override;
    [[nodiscard]] auto is_initialized() const -> bool override { return state_.has_state(); }

    [[nodiscard]] auto state() const -> StateHolder<State>::Snapshot { return state_.snapshot(); }
    [[nodiscard]] auto is_following() const -> bool { return state_.is_following(); }

private:
    std::string const name_;
    Options const options_;
    StateHolder<State> state_;
};

} // namespace HC

#pragma once
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace HC {

/**
 * One device event. Immutable once emitted; the bus shares it as InputEventPtr.
 * (event_type, producer_id, sequence) identifies an event; timestamps may collide.
 */
struct InputEvent {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string    event_type;
    nlohmann::json data;
    std::int64_t   producer_id = 0;
    TimePoint      timestamp{};
    std::uint64_t  sequence = 0; // assigned by the EventBus in emission order
};

using InputEventPtr = std::shared_ptr<InputEvent const>;

auto MakeInputEvent(std::string eventType, nlohmann::json data = nlohmann::json::object(), std::int64_t producerId = 0) -> InputEvent;

// {"event_type", "producer_id", "data", "timestamp_ms", "sequence"}
auto describeEvent(InputEvent const& event) -> nlohmann::json;

} // namespace HC

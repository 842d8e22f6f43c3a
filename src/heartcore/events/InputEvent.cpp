#include <heartcore/events/InputEvent.hpp>

namespace HC {

auto MakeInputEvent(std::string eventType, nlohmann::json data, std::int64_t producerId) -> InputEvent {
    return InputEvent{.event_type  = std::move(eventType),
                      .data        = std::move(data),
                      .producer_id = producerId,
                      .timestamp   = std::chrono::system_clock::now(),
                      .sequence    = 0};
}

auto describeEvent(InputEvent const& event) -> nlohmann::json {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(event.timestamp.time_since_epoch()).count();
    return nlohmann::json{
            {"event_type", event.event_type},
            {"producer_id", event.producer_id},
            {"data", event.data},
            {"timestamp_ms", millis},
            {"sequence", event.sequence},
    };
}

} // namespace HC

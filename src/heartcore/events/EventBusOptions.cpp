#include <heartcore/events/EventBusOptions.hpp>

#include <string>

namespace HC {

auto ParseEventBusDispatch(std::string_view text) -> Expected<EventBusDispatch> {
    if (text == "inline")
        return EventBusDispatch::Inline;
    if (text == "queued" || text == "background")
        return EventBusDispatch::Queued;
    return std::unexpected(Error{Error::Code::InvalidConfiguration, "unknown event bus dispatch mode '" + std::string{text} + "' (expected inline or queued)"});
}

auto toString(EventBusDispatch dispatch) -> std::string_view {
    return dispatch == EventBusDispatch::Queued ? "queued" : "inline";
}

} // namespace HC

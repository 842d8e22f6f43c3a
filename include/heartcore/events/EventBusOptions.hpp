#pragma once
#include <heartcore/core/Error.hpp>

#include <string_view>

namespace HC {

enum class EventBusDispatch {
    Inline, // handlers run on the emitting thread before emit returns
    Queued  // handlers run on the bus dispatcher thread in emission order
};

struct EventBusOptions {
    EventBusDispatch dispatch{EventBusDispatch::Inline};
};

auto ParseEventBusDispatch(std::string_view text) -> Expected<EventBusDispatch>;
auto toString(EventBusDispatch dispatch) -> std::string_view;

} // namespace HC

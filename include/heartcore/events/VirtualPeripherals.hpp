#pragma once
#include <heartcore/events/VirtualPeripheral.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace HC {

// Two events from one producer within the window emit {"events": [first, second]} for that producer.
struct DoubleTapOptions {
    std::string               source_event_type;
    std::string               output_event_type;
    std::chrono::milliseconds window{300};
    std::string               name; // defaults to "<source>.double_tap"
    int                       priority = 50;
    nlohmann::json            metadata;
};

// Events of one type from at least required_sources distinct producers within the window emit
// {"events": [...]} (oldest first) with producer 0.
struct SimultaneousOptions {
    std::string               event_type;
    std::string               output_event_type;
    std::chrono::milliseconds window{10};
    std::size_t               required_sources = 2;
    std::string               name; // defaults to "<type>.simultaneous"
    int                       priority = 50;
    nlohmann::json            metadata;
};

struct SequenceStep {
    std::string                             event_type;
    std::function<bool(InputEvent const&)> predicate; // empty matches every event of the type
};

// Steps matched in order per producer emit {"sequence": [...]}; progress older than the timeout restarts.
struct SequenceOptions {
    std::string                              name;
    std::vector<SequenceStep>                steps;
    std::string                              output_event_type;
    std::optional<std::chrono::milliseconds> timeout = std::chrono::milliseconds{1000};
    int                                      priority = 50;
    nlohmann::json                           metadata;
};

using GatePredicate = std::function<bool(VirtualPeripheralContext const&, InputEvent const&)>;

// Reads "pressed", "state", "enabled" or "value" (first present wins), else the truthiness of the data.
auto DefaultGatePredicate(VirtualPeripheralContext const& context, InputEvent const& event) -> bool;

// Gate events switch forwarding on or off; while on, mirror events are re-emitted unchanged for output_producer_id.
struct GatedMirrorOptions {
    std::string              name;
    std::vector<std::string> gate_event_types;
    std::vector<std::string> mirror_event_types;
    std::int64_t             output_producer_id = 0;
    GatePredicate            gate_predicate; // DefaultGatePredicate when empty
    bool                     initial_state = false;
    int                      priority      = 0;
    nlohmann::json           metadata;
};

// Each factory validates its options and throws std::invalid_argument on bad ones.
auto MakeDoubleTapDefinition(DoubleTapOptions options) -> VirtualPeripheralDefinition;
auto MakeSimultaneousDefinition(SimultaneousOptions options) -> VirtualPeripheralDefinition;
auto MakeSequenceDefinition(SequenceOptions options) -> VirtualPeripheralDefinition;
auto MakeGatedMirrorDefinition(GatedMirrorOptions options) -> VirtualPeripheralDefinition;

// JSON truthiness: null, false, 0, "" and empty containers are false.
auto isTruthy(nlohmann::json const& value) -> bool;

} // namespace HC

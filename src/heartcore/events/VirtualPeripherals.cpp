#include <heartcore/events/VirtualPeripherals.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace HC {

namespace {

class DoubleTapVirtualPeripheral final : public VirtualPeripheral {
public:
    DoubleTapVirtualPeripheral(VirtualPeripheralContext& context, Clock::Duration window, std::string outputEventType)
        : VirtualPeripheral(context), window(window), outputEventType(std::move(outputEventType)) {}

    auto handle(InputEvent const& event) -> void override {
        auto const now = this->context.now();
        auto       it  = this->lastTap.find(event.producer_id);
        if (it != this->lastTap.end() && now - it->second.at <= this->window) {
            nlohmann::json payload = {{"events", nlohmann::json::array({describeEvent(it->second.event), describeEvent(event)})}};
            this->lastTap.erase(it);
            this->context.emit(this->outputEventType, std::move(payload), event.producer_id);
            return;
        }
        this->lastTap.insert_or_assign(event.producer_id, Tap{now, event});
    }

    auto shutdown() -> void override { this->lastTap.clear(); }

private:
    struct Tap {
        Clock::TimePoint at;
        InputEvent       event;
    };

    Clock::Duration const                  window;
    std::string const                      outputEventType;
    std::unordered_map<std::int64_t, Tap> lastTap;
};

class SimultaneousVirtualPeripheral final : public VirtualPeripheral {
public:
    SimultaneousVirtualPeripheral(VirtualPeripheralContext& context, Clock::Duration window, std::size_t requiredSources, std::string outputEventType)
        : VirtualPeripheral(context), window(window), requiredSources(requiredSources), outputEventType(std::move(outputEventType)) {}

    auto handle(InputEvent const& event) -> void override {
        auto const now    = this->context.now();
        auto&      bucket = this->pending[event.event_type];
        while (!bucket.empty() && now - bucket.front().at > this->window)
            bucket.pop_front();
        bucket.push_back(Pending{now, event});

        // Latest event per producer, newest first.
        std::vector<InputEvent const*>   latest;
        std::unordered_set<std::int64_t> seen;
        for (auto it = bucket.rbegin(); it != bucket.rend(); ++it) {
            if (seen.insert(it->event.producer_id).second)
                latest.push_back(&it->event);
        }
        if (latest.size() < this->requiredSources)
            return;

        nlohmann::json events = nlohmann::json::array();
        for (auto it = latest.rbegin(); it != latest.rend(); ++it)
            events.push_back(describeEvent(**it));
        bucket.clear();
        this->context.emit(this->outputEventType, {{"events", std::move(events)}}, 0);
    }

    auto shutdown() -> void override { this->pending.clear(); }

private:
    struct Pending {
        Clock::TimePoint at;
        InputEvent       event;
    };

    Clock::Duration const                                 window;
    std::size_t const                                     requiredSources;
    std::string const                                     outputEventType;
    std::unordered_map<std::string, std::deque<Pending>> pending;
};

class SequenceVirtualPeripheral final : public VirtualPeripheral {
public:
    SequenceVirtualPeripheral(VirtualPeripheralContext& context,
                              std::vector<SequenceStep> steps,
                              std::optional<Clock::Duration> timeout,
                              std::string outputEventType)
        : VirtualPeripheral(context), steps(std::move(steps)), timeout(timeout), outputEventType(std::move(outputEventType)) {}

    auto handle(InputEvent const& event) -> void override {
        auto const now = this->context.now();

        Progress current;
        if (auto it = this->progress.find(event.producer_id); it != this->progress.end()) {
            current = it->second;
            if (this->timeout && now - current.lastAt > *this->timeout)
                current = Progress{};
        }

        if (this->matches(current.index, event)) {
            current.history.push_back(event);
            current.index += 1;
            current.lastAt = now;
            if (current.index == this->steps.size()) {
                nlohmann::json sequence = nlohmann::json::array();
                for (auto const& item : current.history)
                    sequence.push_back(describeEvent(item));
                this->progress.erase(event.producer_id);
                this->context.emit(this->outputEventType, {{"sequence", std::move(sequence)}}, event.producer_id);
            } else {
                this->progress.insert_or_assign(event.producer_id, std::move(current));
            }
            return;
        }

        // A mismatch may still start a new attempt.
        if (this->matches(0, event))
            this->progress.insert_or_assign(event.producer_id, Progress{.index = 1, .lastAt = now, .history = {event}});
        else
            this->progress.erase(event.producer_id);
    }

    auto shutdown() -> void override { this->progress.clear(); }

private:
    struct Progress {
        std::size_t             index = 0;
        Clock::TimePoint        lastAt{};
        std::vector<InputEvent> history;
    };

    auto matches(std::size_t index, InputEvent const& event) const -> bool {
        if (index >= this->steps.size())
            return false;
        auto const& step = this->steps[index];
        if (step.event_type != event.event_type)
            return false;
        return !step.predicate || step.predicate(event);
    }

    std::vector<SequenceStep> const            steps;
    std::optional<Clock::Duration> const       timeout;
    std::string const                          outputEventType;
    std::unordered_map<std::int64_t, Progress> progress;
};

class GatedMirrorVirtualPeripheral final : public VirtualPeripheral {
public:
    GatedMirrorVirtualPeripheral(VirtualPeripheralContext& context,
                                 std::set<std::string, std::less<>> gateTypes,
                                 std::set<std::string, std::less<>> mirrorTypes,
                                 std::int64_t outputProducerId,
                                 GatePredicate predicate,
                                 bool enabled)
        : VirtualPeripheral(context), gateTypes(std::move(gateTypes)), mirrorTypes(std::move(mirrorTypes)), outputProducerId(outputProducerId),
          predicate(std::move(predicate)), enabled(enabled) {}

    auto handle(InputEvent const& event) -> void override {
        // Mirrored output re-enters this peripheral; it must not be mirrored again.
        if (this->context.isOwnEvent(event))
            return;
        if (this->gateTypes.contains(event.event_type)) {
            this->enabled = this->predicate(this->context, event);
            return;
        }
        if (this->enabled && this->mirrorTypes.contains(event.event_type))
            this->context.emit(event.event_type, event.data, this->outputProducerId);
    }

private:
    std::set<std::string, std::less<>> const gateTypes;
    std::set<std::string, std::less<>> const mirrorTypes;
    std::int64_t const                       outputProducerId;
    GatePredicate const                      predicate;
    bool                                     enabled;
};

auto requirePositive(std::chrono::milliseconds window, char const* what) -> void {
    if (window <= std::chrono::milliseconds::zero())
        throw std::invalid_argument(std::string(what) + " window must be positive");
}

} // namespace

auto isTruthy(nlohmann::json const& value) -> bool {
    switch (value.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded:
        return false;
    case nlohmann::json::value_t::boolean:
        return value.get<bool>();
    case nlohmann::json::value_t::number_integer:
        return value.get<std::int64_t>() != 0;
    case nlohmann::json::value_t::number_unsigned:
        return value.get<std::uint64_t>() != 0;
    case nlohmann::json::value_t::number_float:
        return value.get<double>() != 0.0;
    case nlohmann::json::value_t::string:
    case nlohmann::json::value_t::array:
    case nlohmann::json::value_t::object:
    case nlohmann::json::value_t::binary:
        return !value.empty();
    }
    return false;
}

auto DefaultGatePredicate(VirtualPeripheralContext const&, InputEvent const& event) -> bool {
    if (event.data.is_object()) {
        for (auto const* key : {"pressed", "state", "enabled", "value"}) {
            if (auto it = event.data.find(key); it != event.data.end())
                return isTruthy(*it);
        }
    }
    return isTruthy(event.data);
}

auto MakeDoubleTapDefinition(DoubleTapOptions options) -> VirtualPeripheralDefinition {
    if (options.source_event_type.empty() || options.output_event_type.empty())
        throw std::invalid_argument("double tap requires source and output event types");
    requirePositive(options.window, "double tap");

    auto name   = options.name.empty() ? options.source_event_type + ".double_tap" : options.name;
    auto window = std::chrono::duration_cast<Clock::Duration>(options.window);
    return VirtualPeripheralDefinition{
            .name        = std::move(name),
            .event_types = {options.source_event_type},
            .factory     = [window, output = options.output_event_type](VirtualPeripheralContext& context) -> std::unique_ptr<VirtualPeripheral> {
                return std::make_unique<DoubleTapVirtualPeripheral>(context, window, output);
            },
            .priority    = options.priority,
            .metadata    = std::move(options.metadata),
    };
}

auto MakeSimultaneousDefinition(SimultaneousOptions options) -> VirtualPeripheralDefinition {
    if (options.event_type.empty() || options.output_event_type.empty())
        throw std::invalid_argument("simultaneous requires source and output event types");
    requirePositive(options.window, "simultaneous");
    if (options.required_sources < 2)
        throw std::invalid_argument("simultaneous requires at least two sources");

    auto name     = options.name.empty() ? options.event_type + ".simultaneous" : options.name;
    auto window   = std::chrono::duration_cast<Clock::Duration>(options.window);
    auto required = options.required_sources;
    return VirtualPeripheralDefinition{
            .name        = std::move(name),
            .event_types = {options.event_type},
            .factory     = [window, required, output = options.output_event_type](VirtualPeripheralContext& context) -> std::unique_ptr<VirtualPeripheral> {
                return std::make_unique<SimultaneousVirtualPeripheral>(context, window, required, output);
            },
            .priority    = options.priority,
            .metadata    = std::move(options.metadata),
    };
}

auto MakeSequenceDefinition(SequenceOptions options) -> VirtualPeripheralDefinition {
    if (options.steps.empty())
        throw std::invalid_argument("sequence requires at least one step");
    if (options.output_event_type.empty())
        throw std::invalid_argument("sequence requires an output event type");
    if (options.timeout)
        requirePositive(*options.timeout, "sequence");

    std::vector<std::string> eventTypes;
    for (auto const& step : options.steps) {
        if (step.event_type.empty())
            throw std::invalid_argument("sequence step requires an event type");
        if (std::find(eventTypes.begin(), eventTypes.end(), step.event_type) == eventTypes.end())
            eventTypes.push_back(step.event_type);
    }

    std::optional<Clock::Duration> timeout;
    if (options.timeout)
        timeout = std::chrono::duration_cast<Clock::Duration>(*options.timeout);
    return VirtualPeripheralDefinition{
            .name        = std::move(options.name),
            .event_types = std::move(eventTypes),
            .factory     = [steps = std::move(options.steps), timeout, output = options.output_event_type](VirtualPeripheralContext& context)
                    -> std::unique_ptr<VirtualPeripheral> {
                return std::make_unique<SequenceVirtualPeripheral>(context, steps, timeout, output);
            },
            .priority    = options.priority,
            .metadata    = std::move(options.metadata),
    };
}

auto MakeGatedMirrorDefinition(GatedMirrorOptions options) -> VirtualPeripheralDefinition {
    if (options.gate_event_types.empty())
        throw std::invalid_argument("gated mirror requires gate event types");
    if (options.mirror_event_types.empty())
        throw std::invalid_argument("gated mirror requires mirror event types");

    std::vector<std::string> eventTypes;
    for (auto const* group : {&options.gate_event_types, &options.mirror_event_types}) {
        for (auto const& type : *group) {
            if (std::find(eventTypes.begin(), eventTypes.end(), type) == eventTypes.end())
                eventTypes.push_back(type);
        }
    }

    std::set<std::string, std::less<>> gateTypes(options.gate_event_types.begin(), options.gate_event_types.end());
    std::set<std::string, std::less<>> mirrorTypes(options.mirror_event_types.begin(), options.mirror_event_types.end());
    GatePredicate                      predicate = options.gate_predicate ? std::move(options.gate_predicate) : GatePredicate{DefaultGatePredicate};
    return VirtualPeripheralDefinition{
            .name        = std::move(options.name),
            .event_types = std::move(eventTypes),
            .factory     = [gateTypes, mirrorTypes, producer = options.output_producer_id, predicate, initial = options.initial_state](
                               VirtualPeripheralContext& context) -> std::unique_ptr<VirtualPeripheral> {
                return std::make_unique<GatedMirrorVirtualPeripheral>(context, gateTypes, mirrorTypes, producer, predicate, initial);
            },
            .priority    = options.priority,
            .metadata    = std::move(options.metadata),
    };
}

} // namespace HC

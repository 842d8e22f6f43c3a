#include <heartcore/events/PeripheralStreams.hpp>

#include "log/TaggedLogger.hpp"

#include <stdexcept>

namespace HC {

PeripheralStreams::PeripheralStreams(EventBus& bus, StreamShareSettings settings, Scheduler& scheduler, Clock const& clock)
    : bus(bus), settings_(settings), scheduler(scheduler), clock(clock) {
    if (auto error = ValidateStreamShareSettings(this->settings_))
        throw std::invalid_argument("PeripheralStreams: " + describeError(*error));
}

PeripheralStreams::~PeripheralStreams() {
    this->close();
}

auto PeripheralStreams::busSource(std::optional<std::string> eventType) -> StreamSource<InputEvent> {
    EventBus* target = &this->bus;
    return [target, eventType](StreamEmitter<InputEvent> emitter) -> std::function<void()> {
        auto next   = emitter.next;
        auto handle = eventType ? target->subscribe(*eventType, [next](InputEvent const& event) { next(event); })
                                : target->subscribeAll([next](InputEvent const& event) { next(event); });
        return [target, handle] { target->unsubscribe(handle); };
    };
}

auto PeripheralStreams::events() -> std::shared_ptr<SharedStream<InputEvent>> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (!this->allEvents)
        this->allEvents = SharedStream<InputEvent>::Create("events", this->busSource(std::nullopt), this->settings_, this->scheduler, this->clock);
    return this->allEvents;
}

auto PeripheralStreams::eventsOfType(std::string const& eventType) -> std::shared_ptr<SharedStream<InputEvent>> {
    if (eventType.empty())
        throw std::invalid_argument("PeripheralStreams::eventsOfType requires an event type");
    std::lock_guard<std::mutex> lock(this->mutex);
    auto&                       stream = this->byType[eventType];
    if (!stream) {
        stream = SharedStream<InputEvent>::Create("events:" + eventType, this->busSource(eventType), this->settings_, this->scheduler, this->clock);
        hc_log("PeripheralStreams created stream for " + eventType, "Stream");
    }
    return stream;
}

auto PeripheralStreams::frameTicks() -> std::shared_ptr<SharedStream<FrameTick>> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (!this->ticks)
        this->ticks = SharedStream<FrameTick>::Create("frame_ticks", this->frameTickSubject.source(), this->settings_, this->scheduler, this->clock);
    return this->ticks;
}

auto PeripheralStreams::publishFrameTick(FrameTick const& tick) -> void {
    this->frameTickSubject.publish(tick);
}

auto PeripheralStreams::close() -> void {
    std::shared_ptr<SharedStream<InputEvent>>                        all;
    std::map<std::string, std::shared_ptr<SharedStream<InputEvent>>> typed;
    std::shared_ptr<SharedStream<FrameTick>>                         frames;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        all    = this->allEvents;
        typed  = this->byType;
        frames = this->ticks;
    }
    if (all)
        all->close();
    for (auto const& [_, stream] : typed)
        stream->close();
    if (frames)
        frames->close();
}

} // namespace HC

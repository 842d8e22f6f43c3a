#pragma once
#include <heartcore/core/Clock.hpp>
#include <heartcore/events/EventBus.hpp>
#include <heartcore/stream/FrameTick.hpp>
#include <heartcore/stream/SharedStream.hpp>
#include <heartcore/stream/StreamShareSettings.hpp>
#include <heartcore/stream/StreamSubject.hpp>
#include <heartcore/task/Scheduler.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace HC {

/**
 * Shared streams over the bus, all created with the same share settings. The event streams
 * hold a bus subscription only while connected; streams of one type are created once and reused.
 */
class PeripheralStreams {
public:
    PeripheralStreams(EventBus& bus, StreamShareSettings settings, Scheduler& scheduler, Clock const& clock = SteadyClock::Instance());
    ~PeripheralStreams();

    PeripheralStreams(PeripheralStreams const&)                    = delete;
    auto operator=(PeripheralStreams const&) -> PeripheralStreams& = delete;

    auto events() -> std::shared_ptr<SharedStream<InputEvent>>;
    auto eventsOfType(std::string const& eventType) -> std::shared_ptr<SharedStream<InputEvent>>;
    auto frameTicks() -> std::shared_ptr<SharedStream<FrameTick>>;

    auto publishFrameTick(FrameTick const& tick) -> void;
    auto settings() const -> StreamShareSettings const& { return this->settings_; }

    // Completes every stream handed out so far.
    auto close() -> void;

private:
    auto busSource(std::optional<std::string> eventType) -> StreamSource<InputEvent>;

    EventBus&                 bus;
    StreamShareSettings const settings_;
    Scheduler&                scheduler;
    Clock const&              clock;

    std::mutex                                                        mutex;
    std::shared_ptr<SharedStream<InputEvent>>                         allEvents;
    std::map<std::string, std::shared_ptr<SharedStream<InputEvent>>> byType;
    StreamSubject<FrameTick>                                          frameTickSubject;
    std::shared_ptr<SharedStream<FrameTick>>                          ticks;
};

} // namespace HC

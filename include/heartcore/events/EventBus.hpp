#pragma once
#include <heartcore/core/Clock.hpp>
#include <heartcore/core/Error.hpp>
#include <heartcore/events/EventBusOptions.hpp>
#include <heartcore/events/InputEvent.hpp>
#include <heartcore/events/StateStore.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace HC {

class DelayScheduler;
class EventPlaylistManager;
class Scheduler;
class VirtualPeripheralManager;

using EventHandler = std::function<void(InputEvent const&)>;

struct SubscriptionHandle {
    std::uint64_t              id = 0;
    std::optional<std::string> event_type; // nullopt subscribes to every event type
    int                        priority = 0;

    explicit operator bool() const { return id != 0; }
};

struct HandlerFailure {
    std::uint64_t subscription_id = 0;
    Error         error;
};

// Outcome of one emit. Handler failures are collected here instead of being thrown.
struct DispatchReport {
    std::uint64_t               sequence  = 0;
    std::size_t                 delivered = 0;
    bool                        queued    = false;
    std::vector<HandlerFailure> failures;
    std::optional<Error>        rejected;

    [[nodiscard]] auto ok() const -> bool { return failures.empty() && !rejected; }
};

/**
 * Pub/sub dispatcher for InputEvents backed by a StateStore.
 *
 * Handlers for an event run in priority order (higher first, then subscription order), with
 * wildcard and type-specific subscriptions merged. Each handler runs inside its own error
 * boundary; after every handler ran the event is recorded in the StateStore. In queued mode
 * emit only enqueues and one dispatcher thread delivers events in emission order.
 */
class EventBus {
public:
    // Playlists run on playlistScheduler; the bus starts its own DelayScheduler on first use when it is null.
    explicit EventBus(EventBusOptions options = {}, Clock const& clock = SteadyClock::Instance(), Scheduler* playlistScheduler = nullptr);
    ~EventBus();

    EventBus(EventBus const&)                    = delete;
    auto operator=(EventBus const&) -> EventBus& = delete;

    auto subscribe(std::string eventType, EventHandler handler, int priority = 0) -> SubscriptionHandle;
    auto subscribeAll(EventHandler handler, int priority = 0) -> SubscriptionHandle;
    auto unsubscribe(SubscriptionHandle const& handle) -> bool;

    auto emit(InputEvent event) -> DispatchReport;
    auto emit(std::string eventType, nlohmann::json data, std::int64_t producerId = 0) -> DispatchReport;

    // Blocks until every queued event has been dispatched. No-op in inline mode.
    auto flush() -> void;
    // Drains the queue and stops the dispatcher; later emits are rejected.
    auto shutdown() -> void;

    auto stateStore() -> StateStore& { return this->store; }
    auto stateStore() const -> StateStore const& { return this->store; }
    auto virtualPeripherals() -> VirtualPeripheralManager&;
    auto playlists() -> EventPlaylistManager&;
    auto clock() const -> Clock const& { return this->clock_; }
    auto options() const -> EventBusOptions const& { return this->options_; }

    auto subscriberCount() const -> std::size_t;
    auto handlerFailureCount() const -> std::uint64_t { return this->handlerFailures.load(); }

private:
    struct Subscriber {
        std::uint64_t              id;
        std::optional<std::string> eventType;
        int                        priority;
        EventHandler               handler;
    };
    using SubscriberPtr = std::shared_ptr<Subscriber const>;

    auto addSubscriber(std::optional<std::string> eventType, EventHandler handler, int priority) -> SubscriptionHandle;
    auto stamp(InputEvent event) -> InputEventPtr;
    auto dispatch(InputEventPtr const& event) -> DispatchReport;
    auto targetsFor(std::string const& eventType) const -> std::vector<SubscriberPtr>;
    auto dispatcherLoop(std::stop_token stop) -> void;

    EventBusOptions const options_;
    Clock const&          clock_;
    StateStore            store;

    mutable std::shared_mutex                                   subscribersMutex;
    std::unordered_map<std::string, std::vector<SubscriberPtr>> byType;
    std::vector<SubscriberPtr>                                  wildcard;
    std::atomic<std::uint64_t>                                  nextSubscriptionId{1};
    std::atomic<std::uint64_t>                                  nextSequence{1};
    std::atomic<std::uint64_t>                                  handlerFailures{0};

    std::mutex                  queueMutex;
    std::condition_variable_any queueCV;
    std::deque<InputEventPtr>   queue;
    bool                        dispatching = false;
    bool                        stopped     = false;
    std::jthread                dispatcher;

    std::unique_ptr<VirtualPeripheralManager> virtualPeripheralManager;

    std::mutex                            playlistsMutex;
    Scheduler*                            playlistScheduler;
    std::unique_ptr<DelayScheduler>       ownedPlaylistScheduler;
    std::unique_ptr<EventPlaylistManager> playlistManager;
};

} // namespace HC

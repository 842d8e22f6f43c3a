#include <heartcore/events/EventBus.hpp>
#include <heartcore/events/EventPlaylists.hpp>
#include <heartcore/events/VirtualPeripheral.hpp>
#include <heartcore/task/DelayScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace HC {

EventBus::EventBus(EventBusOptions options, Clock const& clock, Scheduler* playlistScheduler)
    : options_(options), clock_(clock), virtualPeripheralManager(std::make_unique<VirtualPeripheralManager>(*this)), playlistScheduler(playlistScheduler) {
    if (this->options_.dispatch == EventBusDispatch::Queued) {
        this->dispatcher = std::jthread([this](std::stop_token stop) { this->dispatcherLoop(stop); });
    }
}

EventBus::~EventBus() {
    // Playlist runs report their cancellation while the bus still delivers.
    this->virtualPeripheralManager->clear();
    this->playlistManager.reset();
    this->shutdown();
    this->virtualPeripheralManager.reset();
    this->ownedPlaylistScheduler.reset();
}

auto EventBus::virtualPeripherals() -> VirtualPeripheralManager& {
    return *this->virtualPeripheralManager;
}

auto EventBus::playlists() -> EventPlaylistManager& {
    std::lock_guard<std::mutex> lock(this->playlistsMutex);
    if (!this->playlistManager) {
        if (this->playlistScheduler == nullptr) {
            this->ownedPlaylistScheduler = std::make_unique<DelayScheduler>();
            this->playlistScheduler      = this->ownedPlaylistScheduler.get();
        }
        this->playlistManager = std::make_unique<EventPlaylistManager>(*this, *this->playlistScheduler);
    }
    return *this->playlistManager;
}

auto EventBus::subscribe(std::string eventType, EventHandler handler, int priority) -> SubscriptionHandle {
    if (eventType.empty())
        throw std::invalid_argument("EventBus::subscribe requires an event type; use subscribeAll for every type");
    return this->addSubscriber(std::move(eventType), std::move(handler), priority);
}

auto EventBus::subscribeAll(EventHandler handler, int priority) -> SubscriptionHandle {
    return this->addSubscriber(std::nullopt, std::move(handler), priority);
}

auto EventBus::addSubscriber(std::optional<std::string> eventType, EventHandler handler, int priority) -> SubscriptionHandle {
    if (!handler)
        throw std::invalid_argument("EventBus subscription requires a handler");
    auto subscriber = std::make_shared<Subscriber const>(Subscriber{
            .id        = this->nextSubscriptionId++,
            .eventType = eventType,
            .priority  = priority,
            .handler   = std::move(handler),
    });
    {
        std::unique_lock<std::shared_mutex> lock(this->subscribersMutex);
        if (eventType)
            this->byType[*eventType].push_back(subscriber);
        else
            this->wildcard.push_back(subscriber);
    }
    hc_log("EventBus subscribed " + std::to_string(subscriber->id) + " to " + eventType.value_or("*"), "EventBus");
    return SubscriptionHandle{.id = subscriber->id, .event_type = std::move(eventType), .priority = priority};
}

auto EventBus::unsubscribe(SubscriptionHandle const& handle) -> bool {
    if (!handle)
        return false;
    std::unique_lock<std::shared_mutex> lock(this->subscribersMutex);
    auto remove = [&](std::vector<SubscriberPtr>& bucket) {
        auto it = std::find_if(bucket.begin(), bucket.end(), [&](SubscriberPtr const& s) { return s->id == handle.id; });
        if (it == bucket.end())
            return false;
        bucket.erase(it);
        return true;
    };
    if (!handle.event_type)
        return remove(this->wildcard);
    auto bucket = this->byType.find(*handle.event_type);
    if (bucket == this->byType.end() || !remove(bucket->second))
        return false;
    if (bucket->second.empty())
        this->byType.erase(bucket);
    return true;
}

auto EventBus::subscriberCount() const -> std::size_t {
    std::shared_lock<std::shared_mutex> lock(this->subscribersMutex);
    std::size_t                         total = this->wildcard.size();
    for (auto const& [_, bucket] : this->byType)
        total += bucket.size();
    return total;
}

auto EventBus::emit(std::string eventType, nlohmann::json data, std::int64_t producerId) -> DispatchReport {
    return this->emit(MakeInputEvent(std::move(eventType), std::move(data), producerId));
}

auto EventBus::emit(InputEvent event) -> DispatchReport {
    if (event.event_type.empty())
        throw std::invalid_argument("EventBus::emit requires an event type");
    auto stamped = this->stamp(std::move(event));

    DispatchReport report{.sequence = stamped->sequence};
    if (this->options_.dispatch == EventBusDispatch::Inline) {
        {
            std::lock_guard<std::mutex> lock(this->queueMutex);
            if (this->stopped) {
                report.rejected = Error{Error::Code::ShuttingDown, "EventBus is shut down"};
                return report;
            }
        }
        return this->dispatch(stamped);
    }

    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        if (this->stopped) {
            report.rejected = Error{Error::Code::ShuttingDown, "EventBus is shut down"};
            return report;
        }
        this->queue.push_back(std::move(stamped));
        report.queued = true;
    }
    this->queueCV.notify_all();
    return report;
}

auto EventBus::stamp(InputEvent event) -> InputEventPtr {
    event.sequence = this->nextSequence++;
    if (event.timestamp == InputEvent::TimePoint{})
        event.timestamp = std::chrono::system_clock::now();
    return std::make_shared<InputEvent const>(std::move(event));
}

auto EventBus::targetsFor(std::string const& eventType) const -> std::vector<SubscriberPtr> {
    std::vector<SubscriberPtr> targets;
    {
        std::shared_lock<std::shared_mutex> lock(this->subscribersMutex);
        targets = this->wildcard;
        if (auto it = this->byType.find(eventType); it != this->byType.end())
            targets.insert(targets.end(), it->second.begin(), it->second.end());
    }
    std::sort(targets.begin(), targets.end(), [](SubscriberPtr const& lhs, SubscriberPtr const& rhs) {
        if (lhs->priority != rhs->priority)
            return lhs->priority > rhs->priority;
        return lhs->id < rhs->id;
    });
    return targets;
}

auto EventBus::dispatch(InputEventPtr const& event) -> DispatchReport {
    DispatchReport report{.sequence = event->sequence};
    for (auto const& subscriber : this->targetsFor(event->event_type)) {
        std::optional<Error> failure;
        try {
            subscriber->handler(*event);
            ++report.delivered;
        } catch (std::exception const& error) {
            failure = Error{Error::Code::HandlerFailed, error.what()};
        } catch (...) {
            failure = Error{Error::Code::HandlerFailed, "non-standard exception"};
        }
        if (failure) {
            ++this->handlerFailures;
            hc_log("EventBus subscriber " + std::to_string(subscriber->id) + " failed for " + event->event_type + ": "
                           + describeError(*failure),
                   "EventBus", "Error");
            report.failures.push_back(HandlerFailure{.subscription_id = subscriber->id, .error = std::move(*failure)});
        }
    }
    this->store.update(event);
    hc_log("EventBus dispatched " + event->event_type + " from producer " + std::to_string(event->producer_id) + " to "
                   + std::to_string(report.delivered) + " subscriber(s)",
           "Dispatch");
    return report;
}

auto EventBus::flush() -> void {
    if (this->options_.dispatch == EventBusDispatch::Inline)
        return;
    if (this->dispatcher.get_id() == std::this_thread::get_id())
        return;
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->queueCV.wait(lock, [this] { return (this->queue.empty() && !this->dispatching) || this->stopped; });
}

auto EventBus::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        if (this->stopped)
            return;
        this->stopped = true;
    }
    this->queueCV.notify_all();
    if (this->dispatcher.joinable() && this->dispatcher.get_id() != std::this_thread::get_id()) {
        this->dispatcher.request_stop();
        this->dispatcher.join();
    }
    hc_log("EventBus shut down", "EventBus");
}

auto EventBus::dispatcherLoop(std::stop_token stop) -> void {
#ifdef HC_LOG_DEBUG
    set_thread_name("EventBus");
#endif
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->queueCV.wait(lock, stop, [this] { return !this->queue.empty() || this->stopped; });
        // Shutdown drains whatever was accepted before it.
        if (this->queue.empty() && (this->stopped || stop.stop_requested()))
            return;
        if (this->queue.empty())
            continue;
        auto event = std::move(this->queue.front());
        this->queue.pop_front();
        this->dispatching = true;
        lock.unlock();
        this->dispatch(event);
        lock.lock();
        this->dispatching = false;
        this->queueCV.notify_all();
    }
}

} // namespace HC

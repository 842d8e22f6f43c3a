#include <heartcore/events/EventPlaylists.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <exception>
#include <numeric>
#include <set>
#include <stdexcept>

namespace HC {

namespace {

auto describeTrigger(InputEvent const& event) -> nlohmann::json {
    return {{"event_type", event.event_type}, {"producer_id", event.producer_id}, {"data", event.data}};
}

} // namespace

auto ValidateEventPlaylist(EventPlaylist const& playlist) -> std::optional<Error> {
    if (playlist.name.empty())
        return Error{Error::Code::InvalidArgument, "event playlist requires a name"};
    if (playlist.steps.empty())
        return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "' requires at least one step"};
    for (auto const& step : playlist.steps) {
        if (step.event_type.empty())
            return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "' has a step without an event type"};
        if (step.offset < std::chrono::milliseconds::zero())
            return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "': step offset must be >= 0"};
        if (step.repeat < 1)
            return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "': step repeat must be >= 1"};
        if (step.repeat > 1 && (!step.interval || *step.interval <= std::chrono::milliseconds::zero()))
            return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "': repeated steps need a positive interval"};
    }
    if (playlist.trigger_event_type && playlist.trigger_event_type->empty())
        return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "' has an empty trigger event type"};
    for (auto const& type : playlist.interrupt_events) {
        if (type.empty())
            return Error{Error::Code::InvalidArgument, "event playlist '" + playlist.name + "' has an empty interrupt event type"};
    }
    return std::nullopt;
}

auto toString(PlaylistStopReason reason) -> std::string_view {
    switch (reason) {
        case PlaylistStopReason::Completed:
            return "completed";
        case PlaylistStopReason::Cancelled:
            return "cancelled";
        case PlaylistStopReason::Interrupted:
            return "interrupted";
    }
    return "unknown";
}

EventPlaylistManager::EventPlaylistManager(EventBus& bus, Scheduler& scheduler)
    : bus(bus), scheduler(scheduler) {}

EventPlaylistManager::~EventPlaylistManager() {
    std::vector<std::string> active;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        for (auto const& [id, _] : this->runs)
            active.push_back(id);
    }
    for (auto const& id : active)
        this->stopRun(id, PlaylistStopReason::Cancelled, std::nullopt);

    std::vector<SubscriptionHandle> subscriptions;
    {
        std::unique_lock<std::mutex> lock(this->mutex);
        this->finished.wait(lock, [this] { return this->runs.empty(); });
        for (auto& [_, handle] : this->triggers)
            subscriptions.push_back(std::move(handle));
        for (auto& [_, handle] : this->interruptSubscriptions)
            subscriptions.push_back(std::move(handle));
        this->triggers.clear();
        this->interruptSubscriptions.clear();
    }
    for (auto const& subscription : subscriptions)
        this->bus.unsubscribe(subscription);
}

auto EventPlaylistManager::registerPlaylist(EventPlaylist playlist) -> Expected<PlaylistHandle> {
    if (auto error = ValidateEventPlaylist(playlist))
        return std::unexpected(*error);

    PlaylistHandle handle;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        handle.id = "playlist-" + std::to_string(this->nextPlaylistId++);
        this->playlists.emplace(handle.id, playlist);
    }
    if (playlist.trigger_event_type) {
        auto trigger = this->subscribeTrigger(handle.id, playlist);
        std::lock_guard<std::mutex> lock(this->mutex);
        this->triggers[handle.id] = std::move(trigger);
    }
    hc_log("EventPlaylistManager registered " + playlist.name + " as " + handle.id, "EventPlaylist");
    return handle;
}

auto EventPlaylistManager::update(PlaylistHandle const& handle, EventPlaylist playlist) -> std::optional<Error> {
    if (auto error = ValidateEventPlaylist(playlist))
        return error;

    std::optional<SubscriptionHandle> previous;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->playlists.contains(handle.id))
            return Error{Error::Code::NotFound, "unknown playlist id: " + handle.id};
        if (auto it = this->triggers.find(handle.id); it != this->triggers.end()) {
            previous = std::move(it->second);
            this->triggers.erase(it);
        }
    }
    if (previous)
        this->bus.unsubscribe(*previous);

    std::optional<SubscriptionHandle> trigger;
    if (playlist.trigger_event_type)
        trigger = this->subscribeTrigger(handle.id, playlist);

    std::lock_guard<std::mutex> lock(this->mutex);
    this->playlists[handle.id] = std::move(playlist);
    if (trigger)
        this->triggers[handle.id] = std::move(*trigger);
    return std::nullopt;
}

auto EventPlaylistManager::remove(PlaylistHandle const& handle) -> bool {
    std::optional<SubscriptionHandle> trigger;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->playlists.erase(handle.id) == 0)
            return false;
        if (auto it = this->triggers.find(handle.id); it != this->triggers.end()) {
            trigger = std::move(it->second);
            this->triggers.erase(it);
        }
    }
    if (trigger)
        this->bus.unsubscribe(*trigger);
    return true;
}

auto EventPlaylistManager::definitions() const -> std::map<std::string, EventPlaylist> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->playlists;
}

auto EventPlaylistManager::start(PlaylistHandle const& handle, std::optional<InputEvent> triggerEvent) -> Expected<std::string> {
    auto run     = std::make_shared<Run>();
    run->trigger = std::move(triggerEvent);
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->playlists.find(handle.id);
        if (it == this->playlists.end())
            return std::unexpected(Error{Error::Code::NotFound, "unknown playlist id: " + handle.id});
        run->id           = "run-" + std::to_string(this->nextRunId++);
        run->definitionId = handle.id;
        run->playlist     = it->second;
    }

    std::vector<std::size_t> order(run->playlist.steps.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
        return run->playlist.steps[lhs].offset < run->playlist.steps[rhs].offset;
    });
    auto at = std::chrono::milliseconds::zero();
    for (auto index : order) {
        auto const& step      = run->playlist.steps[index];
        auto        scheduled = step.offset;
        for (int repeat = 0; repeat < step.repeat; ++repeat) {
            if (repeat > 0)
                scheduled += *step.interval;
            at = std::max(at, scheduled);
            run->dispatches.push_back(Dispatch{.stepIndex = index, .repeatIndex = repeat, .offset = scheduled, .at = at});
        }
    }

    auto created     = this->describeRun(*run);
    created["steps"] = nlohmann::json::array();
    for (auto const& step : run->playlist.steps) {
        created["steps"].push_back({{"event_type", step.event_type},
                                    {"offset_ms", step.offset.count()},
                                    {"repeat", step.repeat},
                                    {"interval_ms", step.interval ? nlohmann::json(step.interval->count()) : nlohmann::json()},
                                    {"producer_id", step.producer_id},
                                    {"data", step.data}});
    }

    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->runs.emplace(run->id, run);
        for (auto const& eventType : run->playlist.interrupt_events) {
            this->runsByInterrupt[eventType].push_back(run->id);
            if (!this->interruptSubscriptions.contains(eventType)) {
                this->interruptSubscriptions[eventType] = this->bus.subscribe(
                        eventType, [this, eventType](InputEvent const& event) { this->handleInterrupt(eventType, event); }, 100);
            }
        }
    }
    this->bus.emit(std::string{CreatedEvent}, std::move(created));
    hc_log("EventPlaylistManager started " + run->playlist.name + " as " + run->id, "EventPlaylist");

    // Stopped while the created event was dispatched: fire() finalizes right away.
    std::lock_guard<std::mutex> lock(this->mutex);
    this->scheduleLocked(run, run->stopReason ? std::chrono::milliseconds::zero() : run->dispatches.front().at);
    return run->id;
}

auto EventPlaylistManager::stop(std::string const& runId, PlaylistStopReason reason) -> bool {
    if (reason == PlaylistStopReason::Completed)
        throw std::invalid_argument("EventPlaylistManager::stop: a run can only be cancelled or interrupted");
    return this->stopRun(runId, reason, std::nullopt);
}

auto EventPlaylistManager::join(std::string const& runId, std::chrono::milliseconds timeout) -> bool {
    std::unique_lock<std::mutex> lock(this->mutex);
    return this->finished.wait_for(lock, timeout, [&] { return !this->runs.contains(runId); });
}

auto EventPlaylistManager::activeRunCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->runs.size();
}

auto EventPlaylistManager::subscribeTrigger(std::string const& definitionId, EventPlaylist const& playlist) -> SubscriptionHandle {
    return this->bus.subscribe(
            *playlist.trigger_event_type,
            [this, definitionId](InputEvent const& event) {
                auto run = this->start(PlaylistHandle{definitionId}, event);
                if (!run)
                    hc_log("EventPlaylistManager trigger for " + definitionId + " failed: " + describeError(run.error()), "EventPlaylist", "Error");
            },
            100);
}

auto EventPlaylistManager::scheduleLocked(RunPtr const& run, std::chrono::milliseconds delay) -> void {
    std::weak_ptr<Run> weak = run;
    run->timer              = this->scheduler.scheduleAfter(delay, [this, weak] {
        if (auto target = weak.lock())
            this->fire(target);
    });
}

auto EventPlaylistManager::fire(RunPtr const& run) -> void {
    std::optional<std::chrono::milliseconds> batch;
    while (true) {
        Dispatch dispatch{};
        {
            std::lock_guard<std::mutex> lock(this->mutex);
            run->timer.reset();
            if (run->finalized)
                return;
            if (run->stopReason)
                break;
            if (run->next == run->dispatches.size())
                break;
            dispatch = run->dispatches[run->next];
            if (batch && dispatch.at > *batch) {
                this->scheduleLocked(run, dispatch.at - *batch);
                return;
            }
            batch = dispatch.at;
            ++run->next;
        }

        auto const& step = run->playlist.steps[dispatch.stepIndex];
        this->bus.emit(InputEvent{.event_type = step.event_type, .data = step.data, .producer_id = step.producer_id});

        auto emitted            = this->describeRun(*run);
        emitted["step_index"]   = dispatch.stepIndex;
        emitted["repeat_index"] = dispatch.repeatIndex;
        emitted["event_type"]   = step.event_type;
        emitted["producer_id"]  = step.producer_id;
        emitted["offset_ms"]    = dispatch.offset.count();
        emitted["data"]         = step.data;
        this->bus.emit(std::string{EmittedEvent}, std::move(emitted));
    }

    PlaylistStopReason reason = PlaylistStopReason::Completed;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (run->stopReason)
            reason = *run->stopReason;
    }
    this->finalize(run, reason);
}

auto EventPlaylistManager::stopRun(std::string const& runId, PlaylistStopReason reason, std::optional<InputEvent> interruptEvent) -> bool {
    RunPtr run;
    bool   cancelled = false;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->runs.find(runId);
        if (it == this->runs.end() || it->second->finalized || it->second->stopReason)
            return false;
        run                 = it->second;
        run->stopReason     = reason;
        run->interruptEvent = std::move(interruptEvent);
        // A timer that can no longer be cancelled is firing; fire() sees the stop reason.
        if (run->timer && this->scheduler.cancel(*run->timer)) {
            run->timer.reset();
            cancelled = true;
        }
    }
    if (cancelled)
        this->finalize(run, reason);
    return true;
}

auto EventPlaylistManager::handleInterrupt(std::string const& eventType, InputEvent const& event) -> void {
    std::vector<std::string> affected;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (auto it = this->runsByInterrupt.find(eventType); it != this->runsByInterrupt.end())
            affected = it->second;
    }
    for (auto const& runId : affected)
        this->stopRun(runId, PlaylistStopReason::Interrupted, event);
}

auto EventPlaylistManager::finalize(RunPtr const& run, PlaylistStopReason reason) -> void {
    std::vector<SubscriptionHandle> released;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (run->finalized)
            return;
        run->finalized = true;
        for (auto const& eventType : run->playlist.interrupt_events) {
            auto it = this->runsByInterrupt.find(eventType);
            if (it == this->runsByInterrupt.end())
                continue;
            std::erase(it->second, run->id);
            if (!it->second.empty())
                continue;
            this->runsByInterrupt.erase(it);
            if (auto subscription = this->interruptSubscriptions.find(eventType); subscription != this->interruptSubscriptions.end()) {
                released.push_back(std::move(subscription->second));
                this->interruptSubscriptions.erase(subscription);
            }
        }
    }
    for (auto const& subscription : released)
        this->bus.unsubscribe(subscription);

    auto stopped      = this->describeRun(*run);
    stopped["reason"] = std::string{toString(reason)};
    if (run->interruptEvent)
        stopped["interrupt_event"] = describeTrigger(*run->interruptEvent);
    this->bus.emit(std::string{StoppedEvent}, std::move(stopped));

    if (reason == PlaylistStopReason::Completed && run->playlist.completion_event_type) {
        auto completion = nlohmann::json{{"playlist_id", run->id}, {"definition_id", run->definitionId}, {"playlist_name", run->playlist.name}};
        if (!run->playlist.metadata.is_null())
            completion["playlist_metadata"] = run->playlist.metadata;
        if (run->trigger)
            completion["trigger_event"] = describeTrigger(*run->trigger);
        this->bus.emit(*run->playlist.completion_event_type, std::move(completion));
    }
    hc_log("EventPlaylistManager " + run->id + " stopped: " + std::string{toString(reason)}, "EventPlaylist");

    // Notified under the lock: the destructor may be waiting to free the manager.
    std::lock_guard<std::mutex> lock(this->mutex);
    this->runs.erase(run->id);
    this->finished.notify_all();
}

auto EventPlaylistManager::describeRun(Run const& run) const -> nlohmann::json {
    nlohmann::json payload = {{"playlist_id", run.id}, {"definition_id", run.definitionId}, {"playlist_name", run.playlist.name}};
    if (!run.playlist.metadata.is_null())
        payload["playlist_metadata"] = run.playlist.metadata;
    if (run.trigger)
        payload["trigger_event"] = describeTrigger(*run.trigger);
    return payload;
}

namespace {

class PlaylistTriggerVirtualPeripheral final : public VirtualPeripheral {
public:
    PlaylistTriggerVirtualPeripheral(VirtualPeripheralContext& context,
                                     std::set<std::string> gateEventTypes,
                                     EventPlaylist const& playlist,
                                     PlaylistGatePredicate predicate,
                                     bool cancelActiveRuns)
        : VirtualPeripheral(context), gateEventTypes(std::move(gateEventTypes)), predicate(std::move(predicate)), cancelActiveRuns(cancelActiveRuns) {
        auto registered = context.playlists().registerPlaylist(playlist);
        if (!registered)
            throw std::invalid_argument(describeError(registered.error()));
        this->playlist = *registered;
    }

    auto handle(InputEvent const& event) -> void override {
        if (event.event_type == EventPlaylistManager::StoppedEvent) {
            if (event.data.is_object() && event.data.value("definition_id", std::string{}) == this->playlist.id)
                this->activeRuns.erase(event.data.value("playlist_id", std::string{}));
            return;
        }
        if (!this->gateEventTypes.contains(event.event_type))
            return;

        if (this->predicate) {
            try {
                if (!this->predicate(this->context, event))
                    return;
            } catch (std::exception const& error) {
                hc_log("VirtualPeripheral " + this->context.name() + " gate predicate failed: " + error.what(), "VirtualPeripheral", "Error");
                return;
            }
        }

        if (this->cancelActiveRuns) {
            // Stopping emits the stopped event, which erases from activeRuns on this thread.
            auto const previous = this->activeRuns;
            for (auto const& runId : previous)
                this->context.playlists().stop(runId);
        }

        auto run = this->context.playlists().start(this->playlist, event);
        if (!run) {
            hc_log("VirtualPeripheral " + this->context.name() + " failed to start playlist: " + describeError(run.error()), "VirtualPeripheral", "Error");
            return;
        }
        this->activeRuns.insert(*run);
    }

    auto shutdown() -> void override {
        auto const previous = this->activeRuns;
        for (auto const& runId : previous)
            this->context.playlists().stop(runId);
        this->activeRuns.clear();
        this->context.playlists().remove(this->playlist);
    }

private:
    std::set<std::string> const gateEventTypes;
    PlaylistGatePredicate const predicate;
    bool const                  cancelActiveRuns;
    PlaylistHandle              playlist;
    std::set<std::string>       activeRuns;
};

} // namespace

auto MakePlaylistTriggerDefinition(PlaylistTriggerOptions options) -> VirtualPeripheralDefinition {
    if (options.gate_event_types.empty())
        throw std::invalid_argument("playlist trigger requires gate event types");
    if (options.playlist.trigger_event_type)
        throw std::invalid_argument("playlist trigger: playlist '" + options.playlist.name + "' must not have a trigger event type");
    if (auto error = ValidateEventPlaylist(options.playlist))
        throw std::invalid_argument(describeError(*error));

    std::vector<std::string> eventTypes;
    for (auto const& type : options.gate_event_types) {
        if (std::find(eventTypes.begin(), eventTypes.end(), type) == eventTypes.end())
            eventTypes.push_back(type);
    }
    std::string const stopped{EventPlaylistManager::StoppedEvent};
    if (std::find(eventTypes.begin(), eventTypes.end(), stopped) == eventTypes.end())
        eventTypes.push_back(stopped);

    std::set<std::string> gates(options.gate_event_types.begin(), options.gate_event_types.end());
    auto                  name = options.name.empty() ? options.playlist.name + ".gated" : options.name;
    return VirtualPeripheralDefinition{
            .name        = std::move(name),
            .event_types = std::move(eventTypes),
            .factory     = [gates = std::move(gates),
                        playlist  = std::move(options.playlist),
                        predicate = std::move(options.predicate),
                        cancel    = options.cancel_active_runs](VirtualPeripheralContext& context) -> std::unique_ptr<VirtualPeripheral> {
                return std::make_unique<PlaylistTriggerVirtualPeripheral>(context, gates, playlist, predicate, cancel);
            },
            .priority = options.priority,
            .metadata = std::move(options.metadata),
    };
}

} // namespace HC

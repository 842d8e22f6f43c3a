#pragma once
#include <heartcore/core/Error.hpp>
#include <heartcore/events/VirtualPeripheral.hpp>
#include <heartcore/task/Scheduler.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace HC {

// One scheduled event. With repeat > 1 it is emitted again every interval after offset.
struct PlaylistStep {
    std::string                              event_type;
    nlohmann::json                           data;
    std::chrono::milliseconds                offset{0};
    int                                      repeat = 1;
    std::optional<std::chrono::milliseconds> interval;
    std::int64_t                             producer_id = 0;
};

struct EventPlaylist {
    std::string                name;
    std::vector<PlaylistStep>  steps;
    std::optional<std::string> trigger_event_type;    // starts a run whenever this type is emitted
    std::vector<std::string>   interrupt_events;      // any of these stops every run of the playlist
    std::optional<std::string> completion_event_type; // emitted after a run played every step
    nlohmann::json             metadata;              // null when absent
};

auto ValidateEventPlaylist(EventPlaylist const& playlist) -> std::optional<Error>;

struct PlaylistHandle {
    std::string id;

    explicit operator bool() const { return !id.empty(); }
    auto operator==(PlaylistHandle const&) const -> bool = default;
};

enum class PlaylistStopReason { Completed, Cancelled, Interrupted };

auto toString(PlaylistStopReason reason) -> std::string_view;

/**
 * Plays registered playlists on the bus.
 *
 * A run emits its steps in offset order (ties keep definition order); the repeats of one step
 * are emitted before the next step, so a step whose offset already passed fires right after
 * the previous one. Every run announces itself with event.playlist.created, reports each step
 * with event.playlist.emitted and ends with exactly one event.playlist.stopped carrying the
 * reason. Timing is driven by the scheduler; start() never emits a step on the calling thread.
 */
class EventPlaylistManager {
public:
    static constexpr std::string_view CreatedEvent = "event.playlist.created";
    static constexpr std::string_view EmittedEvent = "event.playlist.emitted";
    static constexpr std::string_view StoppedEvent = "event.playlist.stopped";

    EventPlaylistManager(EventBus& bus, Scheduler& scheduler);
    // Cancels the runs still playing and waits for steps being emitted on other threads.
    ~EventPlaylistManager();

    EventPlaylistManager(EventPlaylistManager const&)                    = delete;
    auto operator=(EventPlaylistManager const&) -> EventPlaylistManager& = delete;

    auto registerPlaylist(EventPlaylist playlist) -> Expected<PlaylistHandle>;
    // Replaces the definition; runs already playing keep the one they started with.
    auto update(PlaylistHandle const& handle, EventPlaylist playlist) -> std::optional<Error>;
    auto remove(PlaylistHandle const& handle) -> bool;
    auto definitions() const -> std::map<std::string, EventPlaylist>;

    // Returns the run id.
    auto start(PlaylistHandle const& handle, std::optional<InputEvent> triggerEvent = std::nullopt) -> Expected<std::string>;
    // Returns false when the run already finished or is unknown.
    auto stop(std::string const& runId, PlaylistStopReason reason = PlaylistStopReason::Cancelled) -> bool;
    // Waits until the run finished. Returns true when it did within timeout.
    auto join(std::string const& runId, std::chrono::milliseconds timeout) -> bool;

    auto activeRunCount() const -> std::size_t;

private:
    struct Dispatch {
        std::size_t               stepIndex;
        int                       repeatIndex;
        std::chrono::milliseconds offset; // as scheduled
        std::chrono::milliseconds at;     // when it is emitted, never before the previous dispatch
    };

    struct Run {
        std::string                       id;
        std::string                       definitionId;
        EventPlaylist                     playlist;
        std::optional<InputEvent>         trigger;
        std::vector<Dispatch>             dispatches;
        std::size_t                       next = 0;
        std::optional<TimerId>            timer;
        std::optional<PlaylistStopReason> stopReason;
        std::optional<InputEvent>         interruptEvent;
        bool                              finalized = false;
    };
    using RunPtr = std::shared_ptr<Run>;

    auto subscribeTrigger(std::string const& definitionId, EventPlaylist const& playlist) -> SubscriptionHandle;
    auto scheduleLocked(RunPtr const& run, std::chrono::milliseconds delay) -> void;
    auto fire(RunPtr const& run) -> void;
    auto stopRun(std::string const& runId, PlaylistStopReason reason, std::optional<InputEvent> interruptEvent) -> bool;
    auto handleInterrupt(std::string const& eventType, InputEvent const& event) -> void;
    auto finalize(RunPtr const& run, PlaylistStopReason reason) -> void;
    auto describeRun(Run const& run) const -> nlohmann::json;

    EventBus&  bus;
    Scheduler& scheduler;

    mutable std::mutex                              mutex;
    std::condition_variable                         finished;
    std::map<std::string, EventPlaylist>            playlists;
    std::map<std::string, SubscriptionHandle>       triggers;
    std::map<std::string, RunPtr>                   runs;
    std::map<std::string, std::vector<std::string>> runsByInterrupt;
    std::map<std::string, SubscriptionHandle>       interruptSubscriptions;
    std::uint64_t                                   nextPlaylistId{1};
    std::uint64_t                                   nextRunId{1};
};

using PlaylistGatePredicate = std::function<bool(VirtualPeripheralContext const&, InputEvent const&)>;

// Starts playlist whenever a gate event passes predicate (every gate event when empty).
struct PlaylistTriggerOptions {
    std::string              name; // defaults to "<playlist>.gated"
    std::vector<std::string> gate_event_types;
    EventPlaylist            playlist; // must have no trigger_event_type of its own
    PlaylistGatePredicate    predicate;
    bool                     cancel_active_runs = false; // a new run cancels the ones this peripheral started
    int                      priority           = 50;
    nlohmann::json           metadata;
};

// The playlist is registered when the peripheral is bound and removed, with its runs cancelled, on unbind.
auto MakePlaylistTriggerDefinition(PlaylistTriggerOptions options) -> VirtualPeripheralDefinition;

} // namespace HC

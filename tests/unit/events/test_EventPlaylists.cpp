#include "HeartcoreTestHelper.hpp"
#include <doctest/doctest.h>
#include <heartcore/events/EventPlaylists.hpp>
#include <heartcore/events/VirtualPeripherals.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

using namespace HC;
using namespace HC::Test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

struct Recorder {
    std::vector<InputEvent> events;

    auto attach(EventBus& bus, std::string type) -> SubscriptionHandle {
        return bus.subscribe(std::move(type), [this](InputEvent const& event) { this->events.push_back(event); }, -100);
    }

    auto values() const -> std::vector<int> {
        std::vector<int> result;
        for (auto const& event : this->events)
            result.push_back(event.data.value("v", -1));
        return result;
    }
};

// Timers scheduled while advancing are due relative to the advanced time, so step one ms at a time.
auto runFor(ManualScheduler& scheduler, std::chrono::milliseconds duration) -> void {
    for (auto elapsed = 0ms; elapsed < duration; elapsed += 1ms)
        scheduler.advance(1ms);
}

auto lightShow() -> EventPlaylist {
    return EventPlaylist{
            .name  = "light-show",
            .steps = {PlaylistStep{.event_type = "led", .data = {{"v", 1}}},
                      PlaylistStep{.event_type = "led", .data = {{"v", 2}}, .offset = 50ms, .repeat = 3, .interval = 10ms, .producer_id = 4},
                      PlaylistStep{.event_type = "beep", .data = {{"v", 9}}, .offset = 20ms}},
            .completion_event_type = "show.done",
            .metadata              = {{"scene", "intro"}},
    };
}

} // namespace

TEST_SUITE("events.playlists") {

TEST_CASE("A playlist plays its steps in offset order") {
    ManualScheduler scheduler;
    EventBus        bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
    Recorder        leds, beeps, created, emitted, stopped, done;
    leds.attach(bus, "led");
    beeps.attach(bus, "beep");
    created.attach(bus, "event.playlist.created");
    emitted.attach(bus, "event.playlist.emitted");
    stopped.attach(bus, "event.playlist.stopped");
    done.attach(bus, "show.done");

    auto handle = bus.playlists().registerPlaylist(lightShow());
    REQUIRE(handle.has_value());
    CHECK(bus.playlists().definitions().at(handle->id).name == "light-show");

    auto run = bus.playlists().start(*handle);
    REQUIRE(run.has_value());
    REQUIRE(created.events.size() == 1);
    CHECK(created.events[0].data["playlist_id"] == *run);
    CHECK(created.events[0].data["definition_id"] == handle->id);
    CHECK(created.events[0].data["steps"].size() == 3);
    CHECK(created.events[0].data["playlist_metadata"]["scene"] == "intro");
    // Nothing is emitted on the starting thread.
    CHECK(leds.events.empty());
    CHECK(bus.playlists().activeRunCount() == 1);

    scheduler.advance(0ms);
    CHECK(leds.values() == std::vector<int>{1});
    scheduler.advance(19ms);
    CHECK(beeps.events.empty());
    scheduler.advance(1ms);
    CHECK(beeps.values() == std::vector<int>{9});

    scheduler.advance(30ms);
    CHECK(leds.values() == std::vector<int>{1, 2});
    CHECK(leds.events[1].producer_id == 4);
    scheduler.advance(10ms);
    scheduler.advance(10ms);
    CHECK(leds.values() == std::vector<int>{1, 2, 2, 2});

    std::vector<std::int64_t> offsets;
    for (auto const& event : emitted.events)
        offsets.push_back(event.data["offset_ms"].get<std::int64_t>());
    CHECK(offsets == std::vector<std::int64_t>{0, 20, 50, 60, 70});
    CHECK(emitted.events[4].data["step_index"] == 1);
    CHECK(emitted.events[4].data["repeat_index"] == 2);

    REQUIRE(stopped.events.size() == 1);
    CHECK(stopped.events[0].data["reason"] == "completed");
    REQUIRE(done.events.size() == 1);
    CHECK(done.events[0].data["playlist_id"] == *run);
    CHECK_FALSE(done.events[0].data.contains("trigger_event"));
    CHECK(bus.playlists().activeRunCount() == 0);
    CHECK(bus.playlists().join(*run, 0ms));
    CHECK(scheduler.pending() == 0);
}

TEST_CASE("A step whose offset already passed follows the previous one") {
    ManualScheduler scheduler;
    EventBus        bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
    Recorder        ticks, emitted;
    ticks.attach(bus, "tick");
    emitted.attach(bus, "event.playlist.emitted");

    auto handle = bus.playlists().registerPlaylist(EventPlaylist{
            .name  = "overlap",
            .steps = {PlaylistStep{.event_type = "tick", .data = {{"v", 1}}, .offset = 30ms, .repeat = 3, .interval = 20ms},
                      PlaylistStep{.event_type = "tick", .data = {{"v", 2}}, .offset = 40ms}},
    });
    REQUIRE(handle.has_value());
    REQUIRE(bus.playlists().start(*handle).has_value());

    scheduler.advance(30ms);
    scheduler.advance(20ms);
    CHECK(ticks.values() == std::vector<int>{1, 1});
    scheduler.advance(20ms);
    CHECK(ticks.values() == std::vector<int>{1, 1, 1, 2});
    CHECK(emitted.events.back().data["offset_ms"] == 40);
    CHECK(bus.playlists().activeRunCount() == 0);
}

TEST_CASE("Stopping a run") {
    ManualScheduler scheduler;
    EventBus        bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
    Recorder        leds, stopped, done;
    leds.attach(bus, "led");
    stopped.attach(bus, "event.playlist.stopped");
    done.attach(bus, "show.done");

    auto show = lightShow();
    show.interrupt_events = {"button"};
    auto handle = bus.playlists().registerPlaylist(show);
    REQUIRE(handle.has_value());
    auto const baseline = bus.subscriberCount();

    SUBCASE("Cancelling reports once and emits nothing more") {
        auto run = bus.playlists().start(*handle);
        REQUIRE(run.has_value());
        scheduler.advance(0ms);
        CHECK(bus.playlists().stop(*run));
        CHECK_FALSE(bus.playlists().stop(*run));
        REQUIRE(stopped.events.size() == 1);
        CHECK(stopped.events[0].data["reason"] == "cancelled");
        CHECK(scheduler.pending() == 0);

        scheduler.advance(100ms);
        CHECK(leds.values() == std::vector<int>{1});
        CHECK(done.events.empty());
        CHECK(bus.subscriberCount() == baseline);
    }
    SUBCASE("An interrupt event stops every run of the playlist") {
        auto first  = bus.playlists().start(*handle);
        auto second = bus.playlists().start(*handle);
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(bus.subscriberCount() == baseline + 1);

        bus.emit("button", {{"pressed", true}}, 3);
        REQUIRE(stopped.events.size() == 2);
        for (auto const& event : stopped.events) {
            CHECK(event.data["reason"] == "interrupted");
            CHECK(event.data["interrupt_event"]["event_type"] == "button");
            CHECK(event.data["interrupt_event"]["producer_id"] == 3);
        }
        CHECK(bus.playlists().activeRunCount() == 0);
        CHECK(bus.subscriberCount() == baseline);
        scheduler.advance(100ms);
        CHECK(leds.events.empty());
    }
    SUBCASE("Stopping a finished or unknown run does nothing") {
        CHECK_FALSE(bus.playlists().stop("run-404"));
        CHECK(bus.playlists().join("run-404", 0ms));
        CHECK_THROWS_AS(bus.playlists().stop("run-404", PlaylistStopReason::Completed), std::invalid_argument);
    }
}

TEST_CASE("Trigger events start runs") {
    ManualScheduler scheduler;
    EventBus        bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
    Recorder        created, done;
    created.attach(bus, "event.playlist.created");
    done.attach(bus, "show.done");

    auto show               = lightShow();
    show.trigger_event_type = "go";
    auto handle             = bus.playlists().registerPlaylist(show);
    REQUIRE(handle.has_value());

    bus.emit("go", {{"cue", 12}}, 5);
    REQUIRE(created.events.size() == 1);
    CHECK(created.events[0].data["trigger_event"]["data"]["cue"] == 12);
    runFor(scheduler, 100ms);
    REQUIRE(done.events.size() == 1);
    CHECK(done.events[0].data["trigger_event"]["producer_id"] == 5);

    SUBCASE("Updating without a trigger stops listening") {
        show.trigger_event_type.reset();
        CHECK_FALSE(bus.playlists().update(*handle, show));
        bus.emit("go", json::object());
        CHECK(created.events.size() == 1);
    }
    SUBCASE("Removing the playlist stops listening") {
        CHECK(bus.playlists().remove(*handle));
        CHECK_FALSE(bus.playlists().remove(*handle));
        bus.emit("go", json::object());
        CHECK(created.events.size() == 1);
        CHECK(bus.playlists().start(*handle).error().code == Error::Code::NotFound);
        CHECK(bus.playlists().update(*handle, show)->code == Error::Code::NotFound);
    }
}

TEST_CASE("Playlist validation") {
    ManualScheduler scheduler;
    EventBus        bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
    auto            show = lightShow();

    SUBCASE("No steps") {
        show.steps.clear();
    }
    SUBCASE("Negative offset") {
        show.steps[0].offset = -1ms;
    }
    SUBCASE("Repeat without interval") {
        show.steps[1].interval.reset();
    }
    SUBCASE("Zero repeat") {
        show.steps[2].repeat = 0;
    }
    SUBCASE("Unnamed") {
        show.name.clear();
    }
    auto handle = bus.playlists().registerPlaylist(show);
    REQUIRE_FALSE(handle.has_value());
    CHECK(handle.error().code == Error::Code::InvalidArgument);
    CHECK(bus.playlists().definitions().empty());
}

TEST_CASE("Gated playlist virtual peripheral") {
    ManualScheduler scheduler;
    EventBus        bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
    Recorder        created, stopped;
    created.attach(bus, "event.playlist.created");
    stopped.attach(bus, "event.playlist.stopped");

    auto gate = bus.virtualPeripherals().registerDefinition(MakePlaylistTriggerDefinition({
            .gate_event_types   = {"switch"},
            .playlist           = lightShow(),
            .predicate          = DefaultGatePredicate,
            .cancel_active_runs = true,
    }));
    REQUIRE(gate.has_value());
    CHECK(bus.virtualPeripherals().definitions().at(gate->id).name == "light-show.gated");
    CHECK(bus.playlists().definitions().size() == 1);

    bus.emit("switch", {{"pressed", false}});
    CHECK(created.events.empty());

    bus.emit("switch", {{"pressed", true}}, 2);
    REQUIRE(created.events.size() == 1);
    CHECK(created.events[0].data["trigger_event"]["producer_id"] == 2);
    auto const firstRun = created.events[0].data["playlist_id"].get<std::string>();

    // A second gate event cancels the run it started before starting a new one.
    bus.emit("switch", {{"pressed", true}}, 2);
    REQUIRE(created.events.size() == 2);
    REQUIRE(stopped.events.size() == 1);
    CHECK(stopped.events[0].data["playlist_id"] == firstRun);
    CHECK(stopped.events[0].data["reason"] == "cancelled");
    CHECK(bus.playlists().activeRunCount() == 1);

    CHECK(bus.virtualPeripherals().remove(*gate));
    CHECK(stopped.events.size() == 2);
    CHECK(bus.playlists().activeRunCount() == 0);
    CHECK(bus.playlists().definitions().empty());

    SUBCASE("A playlist with its own trigger is rejected") {
        auto show               = lightShow();
        show.trigger_event_type = "go";
        CHECK_THROWS_AS(MakePlaylistTriggerDefinition({.gate_event_types = {"switch"}, .playlist = show}), std::invalid_argument);
        CHECK_THROWS_AS(MakePlaylistTriggerDefinition({.playlist = lightShow()}), std::invalid_argument);
    }
}

TEST_CASE("Destroying the bus cancels runs still playing") {
    ManualScheduler scheduler;
    Recorder        stopped;
    {
        EventBus bus(EventBusOptions{}, SteadyClock::Instance(), &scheduler);
        stopped.attach(bus, "event.playlist.stopped");
        auto handle = bus.playlists().registerPlaylist(lightShow());
        REQUIRE(handle.has_value());
        REQUIRE(bus.playlists().start(*handle).has_value());
        scheduler.advance(0ms);
    }
    REQUIRE(stopped.events.size() == 1);
    CHECK(stopped.events[0].data["reason"] == "cancelled");
    CHECK(scheduler.pending() == 0);
}

TEST_CASE("Playlists run on the bus timer thread by default") {
    EventBus bus;
    Recorder ticks;
    ticks.attach(bus, "tick");
    auto handle = bus.playlists().registerPlaylist(EventPlaylist{
            .name  = "threaded",
            .steps = {PlaylistStep{.event_type = "tick", .data = {{"v", 1}}},
                      PlaylistStep{.event_type = "tick", .data = {{"v", 2}}, .offset = 5ms}},
    });
    REQUIRE(handle.has_value());
    auto run = bus.playlists().start(*handle);
    REQUIRE(run.has_value());
    REQUIRE(bus.playlists().join(*run, 2000ms));
    CHECK(ticks.values() == std::vector<int>{1, 2});
}

} // TEST_SUITE

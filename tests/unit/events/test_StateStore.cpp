#include <doctest/doctest.h>
#include <heartcore/events/StateStore.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace HC;
using json = nlohmann::json;

namespace {

auto event(std::string type, std::int64_t producer, std::uint64_t sequence, json data = json::object()) -> InputEvent {
    auto result     = MakeInputEvent(std::move(type), std::move(data), producer);
    result.sequence = sequence;
    return result;
}

} // namespace

TEST_SUITE("events.state_store") {

TEST_CASE("Latest event per type and producer") {
    StateStore store;
    store.update(event("button", 1, 1, {{"pressed", true}}));
    store.update(event("button", 2, 2, {{"pressed", false}}));
    store.update(event("button", 1, 3, {{"pressed", false}}));

    auto producerOne = store.getLatest("button", 1);
    REQUIRE(producerOne);
    CHECK(producerOne->sequence == 3);
    CHECK(producerOne->data["pressed"] == false);
    CHECK(store.getLatest("button", 2)->sequence == 2);
    CHECK_FALSE(store.getLatest("button", 7));
    CHECK_FALSE(store.getLatest("knob", 1));

    auto all = store.getAll("button");
    CHECK(all.size() == 2);
    CHECK(store.size() == 2);
}

TEST_CASE("Older sequence never replaces a newer one") {
    StateStore store;
    store.update(event("knob", 4, 10, {{"value", 0.9}}));
    store.update(event("knob", 4, 9, {{"value", 0.1}}));
    CHECK(store.getLatest("knob", 4)->data["value"] == 0.9);
}

TEST_CASE("Newest event across producers") {
    StateStore store;
    auto       early = event("touch", 1, 5);
    auto       late  = event("touch", 2, 6);
    early.timestamp  = InputEvent::TimePoint{std::chrono::milliseconds(100)};
    late.timestamp   = InputEvent::TimePoint{std::chrono::milliseconds(200)};
    store.update(late);
    store.update(early);
    CHECK(store.getLatest("touch")->producer_id == 2);

    SUBCASE("Equal timestamps fall back to the sequence") {
        auto tie      = event("touch", 3, 7);
        tie.timestamp = late.timestamp;
        store.update(tie);
        CHECK(store.getLatest("touch")->producer_id == 3);
    }
}

TEST_CASE("Snapshot and clear") {
    StateStore store;
    store.update(event("a", 0, 1));
    store.update(event("b", 0, 2));
    store.update(event("b", 1, 3));
    auto snapshot = store.snapshot();
    REQUIRE(snapshot.size() == 2);
    CHECK(snapshot["b"].size() == 2);

    store.clear();
    CHECK(store.size() == 0);
    CHECK(snapshot["a"].size() == 1);
}

TEST_CASE("Concurrent writers keep the newest event of every producer") {
    StateStore                store;
    std::atomic<std::uint64_t> sequence{1};
    std::vector<std::thread>  writers;
    for (int producer = 0; producer < 4; ++producer) {
        writers.emplace_back([&, producer] {
            for (int i = 0; i < 500; ++i) {
                store.update(event("fader", producer, sequence++, {{"value", i}}));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    CHECK(store.size() == 4);
    for (int producer = 0; producer < 4; ++producer) {
        CHECK(store.getLatest("fader", producer)->data["value"] == 499);
    }
}

TEST_CASE("describeEvent") {
    auto e        = event("button", 3, 11, {{"pressed", true}});
    auto described = describeEvent(e);
    CHECK(described["event_type"] == "button");
    CHECK(described["producer_id"] == 3);
    CHECK(described["sequence"] == 11);
    CHECK(described["data"]["pressed"] == true);
    CHECK(described.contains("timestamp_ms"));
}

} // TEST_SUITE

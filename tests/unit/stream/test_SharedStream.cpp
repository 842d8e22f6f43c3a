#include "HeartcoreTestHelper.hpp"
#include <doctest/doctest.h>
#include <heartcore/stream/IntervalSource.hpp>
#include <heartcore/stream/SharedStream.hpp>
#include <heartcore/stream/StreamSubject.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace HC;
using namespace HC::Test;
using namespace std::chrono_literals;

namespace {

struct Collector {
    std::vector<int> values;
    int              completions = 0;

    auto observer() -> StreamObserver<int> {
        return StreamObserver<int>{.on_next = [this](int const& value) { this->values.push_back(value); },
                                   .on_completed = [this] { ++this->completions; }};
    }
};

auto settingsFor(StreamShareStrategy strategy) -> StreamShareSettings {
    StreamShareSettings settings;
    settings.strategy = strategy;
    return settings;
}

} // namespace

TEST_SUITE("stream.shared_stream") {

TEST_CASE("Share multicasts one connection") {
    ManualScheduler  scheduler;
    StreamSubject<int> subject;
    auto stream = SharedStream<int>::Create("numbers", subject.source(), settingsFor(StreamShareStrategy::Share), scheduler);
    CHECK_FALSE(stream->isConnected());

    Collector first;
    Collector second;
    auto      a = stream->subscribe(first.observer());
    CHECK(stream->isConnected());
    auto b = stream->subscribe(second.observer());
    CHECK(subject.connectedCount() == 1);
    CHECK(stream->connectCount() == 1);

    subject.publish(1);
    subject.publish(2);
    CHECK(first.values == std::vector<int>{1, 2});
    CHECK(second.values == std::vector<int>{1, 2});

    SUBCASE("Late subscribers get no replay") {
        Collector late;
        auto      c = stream->subscribe(late.observer());
        CHECK(late.values.empty());
        CHECK_FALSE(stream->latest());
    }
    SUBCASE("The last unsubscribe disconnects") {
        a.dispose();
        CHECK(stream->isConnected());
        b.dispose();
        CHECK_FALSE(stream->isConnected());
        CHECK(stream->disconnectCount() == 1);
        CHECK(subject.connectedCount() == 0);

        // Values published while disconnected are never seen.
        subject.publish(3);
        auto again = stream->subscribe(first.observer());
        subject.publish(4);
        CHECK(first.values == std::vector<int>{1, 2, 4});
        CHECK(stream->connectCount() == 2);
    }
}

TEST_CASE("Replay policies") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;

    SUBCASE("Replay latest") {
        auto      stream = SharedStream<int>::Create("latest", subject.source(), settingsFor(StreamShareStrategy::ReplayLatest), scheduler);
        Collector early;
        auto      a = stream->subscribe(early.observer());
        subject.publish(1);
        subject.publish(2);
        CHECK(stream->latest() == 2);

        Collector late;
        auto      b = stream->subscribe(late.observer());
        CHECK(late.values == std::vector<int>{2});
        subject.publish(3);
        CHECK(late.values == std::vector<int>{2, 3});
    }
    SUBCASE("Replay buffer keeps the last n values") {
        auto settings               = settingsFor(StreamShareStrategy::ReplayBuffer);
        settings.replay_buffer_size = 3;
        auto      stream            = SharedStream<int>::Create("buffer", subject.source(), settings, scheduler);
        Collector early;
        auto      a = stream->subscribe(early.observer());
        for (int i = 1; i <= 5; ++i)
            subject.publish(i);

        Collector late;
        auto      b = stream->subscribe(late.observer());
        CHECK(late.values == std::vector<int>{3, 4, 5});
    }
    SUBCASE("Replay window drops old values") {
        ManualClock clock;
        auto        settings          = settingsFor(StreamShareStrategy::ReplayBuffer);
        settings.replay_window_ms     = 100;
        auto        stream            = SharedStream<int>::Create("window", subject.source(), settings, scheduler, clock);
        Collector   early;
        auto        a = stream->subscribe(early.observer());
        subject.publish(1);
        clock.advance(60ms);
        subject.publish(2);
        clock.advance(60ms);

        Collector late;
        auto      b = stream->subscribe(late.observer());
        CHECK(late.values == std::vector<int>{2});
        clock.advance(50ms);
        CHECK_FALSE(stream->latest());
    }
    SUBCASE("Replay buffer persists across reconnects") {
        auto      stream = SharedStream<int>::Create("sticky", subject.source(), settingsFor(StreamShareStrategy::ReplayLatest), scheduler);
        Collector first;
        {
            auto a = stream->subscribe(first.observer());
            subject.publish(7);
        }
        CHECK_FALSE(stream->isConnected());
        Collector second;
        auto      b = stream->subscribe(second.observer());
        CHECK(second.values == std::vector<int>{7});
    }
}

TEST_CASE("Ref-count grace period") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto               settings  = settingsFor(StreamShareStrategy::Share);
    settings.refcount_grace_ms   = 50;
    auto               stream    = SharedStream<int>::Create("grace", subject.source(), settings, scheduler);

    auto a = stream->subscribe([](int const&) {});
    a.dispose();
    CHECK(stream->isConnected());
    CHECK(scheduler.pending() == 1);

    SUBCASE("Resubscribing inside the grace period keeps the connection") {
        scheduler.advance(30ms);
        auto b = stream->subscribe([](int const&) {});
        CHECK(scheduler.pending() == 0);
        scheduler.advance(100ms);
        CHECK(stream->isConnected());
        CHECK(stream->connectCount() == 1);
        CHECK(stream->disconnectCount() == 0);
    }
    SUBCASE("The grace period expiring disconnects") {
        scheduler.advance(49ms);
        CHECK(stream->isConnected());
        scheduler.advance(1ms);
        CHECK_FALSE(stream->isConnected());
        CHECK(subject.connectedCount() == 0);
    }
}

TEST_CASE("Ref-count minimum subscribers") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto               settings       = settingsFor(StreamShareStrategy::Share);
    settings.refcount_min_subscribers = 2;
    auto stream = SharedStream<int>::Create("pair", subject.source(), settings, scheduler);

    auto a = stream->subscribe([](int const&) {});
    CHECK_FALSE(stream->isConnected());
    auto b = stream->subscribe([](int const&) {});
    CHECK(stream->isConnected());
    b.dispose();
    CHECK_FALSE(stream->isConnected());
    CHECK(stream->subscriberCount() == 1);
}

TEST_CASE("A subscriber leaving while another connects leaves no stale connection") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto               settings       = settingsFor(StreamShareStrategy::Share);
    settings.refcount_min_subscribers = 2;

    for (int round = 0; round < 200; ++round) {
        auto         stream   = SharedStream<int>::Create("churn", subject.source(), settings, scheduler);
        auto         resident = stream->subscribe([](int const&) {});
        Subscription joined;
        {
            std::jthread joiner([&] { joined = stream->subscribe([](int const&) {}); });
            std::jthread leaver([&] { resident.dispose(); });
        }
        CHECK(stream->subscriberCount() == 1);
        CHECK_FALSE(stream->isConnected());
        CHECK(subject.connectedCount() == 0);
        CHECK(stream->connectCount() == stream->disconnectCount());
    }
}

TEST_CASE("Auto-connect") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto               settings           = settingsFor(StreamShareStrategy::ShareAutoConnect);
    settings.auto_connect_min_subscribers = 2;
    auto stream = SharedStream<int>::Create("auto", subject.source(), settings, scheduler);

    auto a = stream->subscribe([](int const&) {});
    CHECK_FALSE(stream->isConnected());
    auto b = stream->subscribe([](int const&) {});
    CHECK(stream->isConnected());

    // Stays connected with no subscribers left, and never reconnects.
    a.dispose();
    b.dispose();
    CHECK(stream->isConnected());
    CHECK(stream->subscriberCount() == 0);
    auto c = stream->subscribe([](int const&) {});
    auto d = stream->subscribe([](int const&) {});
    CHECK(stream->connectCount() == 1);
    CHECK(scheduler.pending() == 0);

    stream->close();
    CHECK_FALSE(stream->isConnected());
    CHECK(subject.connectedCount() == 0);
}

TEST_CASE("Connect mode") {
    ManualScheduler scheduler;
    std::vector<std::string> trace;
    StreamSource<int> source = [&](StreamEmitter<int> emitter) -> std::function<void()> {
        trace.push_back("connect");
        emitter.next(42);
        return [] {};
    };

    SUBCASE("Lazy attaches the subscriber first") {
        auto stream = SharedStream<int>::Create("lazy", source, settingsFor(StreamShareStrategy::Share), scheduler);
        auto sub    = stream->subscribe([&](int const& value) { trace.push_back("value " + std::to_string(value)); });
        CHECK(trace == std::vector<std::string>{"connect", "value 42"});
    }
    SUBCASE("Eager connects before attaching") {
        auto settings         = settingsFor(StreamShareStrategy::Share);
        settings.connect_mode = StreamConnectMode::Eager;
        auto stream           = SharedStream<int>::Create("eager", source, settings, scheduler);
        auto sub              = stream->subscribe([&](int const& value) { trace.push_back("value " + std::to_string(value)); });
        CHECK(trace == std::vector<std::string>{"connect"});
    }
    SUBCASE("Eager with replay still hands over the first value") {
        auto settings         = settingsFor(StreamShareStrategy::ReplayLatest);
        settings.connect_mode = StreamConnectMode::Eager;
        auto stream           = SharedStream<int>::Create("eager-replay", source, settings, scheduler);
        auto sub              = stream->subscribe([&](int const& value) { trace.push_back("value " + std::to_string(value)); });
        CHECK(trace == std::vector<std::string>{"connect", "value 42"});
    }
}

TEST_CASE("Close and completion") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto stream = SharedStream<int>::Create("closing", subject.source(), settingsFor(StreamShareStrategy::ReplayLatest), scheduler);
    Collector first;
    auto      a = stream->subscribe(first.observer());
    subject.publish(5);

    SUBCASE("close completes subscribers once") {
        stream->close();
        stream->close();
        CHECK(first.completions == 1);
        CHECK(stream->isClosed());
        CHECK(stream->subscriberCount() == 0);

        Collector late;
        auto      b = stream->subscribe(late.observer());
        CHECK_FALSE(b);
        CHECK(late.values == std::vector<int>{5});
        CHECK(late.completions == 1);
    }
    SUBCASE("Source completion closes the stream") {
        subject.complete();
        CHECK(first.completions == 1);
        CHECK(stream->isClosed());
        subject.publish(6);
        CHECK(first.values == std::vector<int>{5});
    }
}

TEST_CASE("Coalescing window") {
    ManualClock        clock;
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto               settings = settingsFor(StreamShareStrategy::Share);
    settings.coalesce_window_ms = 20;
    auto stream = SharedStream<int>::Create("coalesced", subject.source(), settings, scheduler, clock);

    Collector collector;
    auto      subscription = stream->subscribe(collector.observer());
    auto      step         = [&](std::chrono::milliseconds delta) {
        clock.advance(delta);
        scheduler.advance(delta);
    };

    SUBCASE("A burst emits only its latest value when the window closes") {
        subject.publish(1);
        step(5ms);
        subject.publish(2);
        subject.publish(3);
        CHECK(collector.values.empty());
        CHECK(scheduler.pending() == 1);

        step(15ms);
        CHECK(collector.values == std::vector<int>{3});
        CHECK(scheduler.pending() == 0);

        subject.publish(4);
        step(20ms);
        CHECK(collector.values == std::vector<int>{3, 4});
    }
    SUBCASE("A value arriving after a late timer flushes the held value first") {
        subject.publish(1);
        clock.advance(25ms);
        subject.publish(2);
        CHECK(collector.values == std::vector<int>{1});
        CHECK(scheduler.pending() == 1);

        step(20ms);
        CHECK(collector.values == std::vector<int>{1, 2});
    }
    SUBCASE("Completion emits the held value before completing") {
        subject.publish(7);
        subject.complete();
        CHECK(collector.values == std::vector<int>{7});
        CHECK(collector.completions == 1);
        CHECK(scheduler.pending() == 0);
    }
    SUBCASE("Disconnecting drops the held value") {
        subject.publish(8);
        subscription.dispose();
        CHECK_FALSE(stream->isConnected());
        CHECK(scheduler.pending() == 0);

        Collector next;
        auto      again = stream->subscribe(next.observer());
        step(20ms);
        CHECK(next.values.empty());
        CHECK(collector.values.empty());
    }
}

TEST_CASE("A zero coalescing window passes every value through") {
    ManualScheduler    scheduler;
    StreamSubject<int> subject;
    auto stream = SharedStream<int>::Create("direct", subject.source(), settingsFor(StreamShareStrategy::Share), scheduler);
    Collector collector;
    auto      subscription = stream->subscribe(collector.observer());
    subject.publish(1);
    subject.publish(2);
    CHECK(collector.values == std::vector<int>{1, 2});
    CHECK(scheduler.pending() == 0);
}

TEST_CASE("A failing source leaves the stream disconnected") {
    ManualScheduler   scheduler;
    StreamSource<int> source = [](StreamEmitter<int>) -> std::function<void()> { throw std::runtime_error("device busy"); };
    auto              stream = SharedStream<int>::Create("broken", source, settingsFor(StreamShareStrategy::Share), scheduler);
    CHECK_THROWS_AS(stream->subscribe([](int const&) {}), std::runtime_error);
    CHECK_FALSE(stream->isConnected());
}

TEST_CASE("Settings") {
    StreamShareSettings settings;
    CHECK(settings.strategy == StreamShareStrategy::ReplayLatest);
    CHECK(settings.replayCapacity() == 1);
    CHECK_FALSE(settings.isAutoConnect());
    CHECK(settingsFor(StreamShareStrategy::ReplayBufferAutoConnect).isAutoConnect());
    CHECK(settingsFor(StreamShareStrategy::ReplayBuffer).replayCapacity() == 16);
    CHECK(settingsFor(StreamShareStrategy::ShareAutoConnect).replayCapacity() == 0);

    SUBCASE("Validation") {
        CHECK_FALSE(ValidateStreamShareSettings(settings));
        settings.replay_window_ms = 0;
        CHECK(ValidateStreamShareSettings(settings)->code == Error::Code::InvalidConfiguration);
        settings.replay_window_ms = std::nullopt;
        settings.refcount_grace_ms = -1;
        CHECK(ValidateStreamShareSettings(settings));
        settings.refcount_grace_ms = 0;
        settings.auto_connect_min_subscribers = 0;
        CHECK(ValidateStreamShareSettings(settings));
        settings.auto_connect_min_subscribers = 1;
        settings.coalesce_window_ms = -1;
        CHECK(ValidateStreamShareSettings(settings)->code == Error::Code::InvalidConfiguration);

        ManualScheduler scheduler;
        CHECK_THROWS_AS(SharedStream<int>::Create("bad", StreamSubject<int>{}.source(), settings, scheduler), std::invalid_argument);
        CHECK_THROWS_AS(SharedStream<int>::Create("null", StreamSource<int>{}, StreamShareSettings{}, scheduler), std::invalid_argument);
    }
    SUBCASE("Parsing") {
        CHECK(ParseStreamShareStrategy("replay_buffer_auto_connect").value() == StreamShareStrategy::ReplayBufferAutoConnect);
        CHECK(ParseStreamConnectMode("eager").value() == StreamConnectMode::Eager);
        CHECK_FALSE(ParseStreamShareStrategy("broadcast"));
        CHECK_FALSE(ParseStreamConnectMode("sometimes"));
        CHECK(toString(StreamShareStrategy::ShareAutoConnect) == "share_auto_connect");
        CHECK(toString(StreamConnectMode::Lazy) == "lazy");
    }
}

TEST_CASE("Interval source") {
    ManualScheduler scheduler;
    auto stream = SharedStream<std::uint64_t>::Create("interval", MakeIntervalSource(2ms), settingsFor(StreamShareStrategy::Share), scheduler);

    std::atomic<std::uint64_t> seen{0};
    auto                       sub = stream->subscribe([&](std::uint64_t const&) { ++seen; });
    for (int i = 0; i < 500 && seen.load() < 3; ++i)
        std::this_thread::sleep_for(2ms);
    CHECK(seen.load() >= 3);
    sub.dispose();
    CHECK_FALSE(stream->isConnected());

    CHECK_THROWS_AS(MakeIntervalSource(0ms), std::invalid_argument);
}

} // TEST_SUITE

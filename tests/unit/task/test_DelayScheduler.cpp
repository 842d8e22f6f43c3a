#include <doctest/doctest.h>
#include <heartcore/task/DelayScheduler.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace HC;
using namespace std::chrono_literals;

TEST_SUITE("task.delay_scheduler") {

TEST_CASE("Callbacks fire in deadline order") {
    DelayScheduler          scheduler;
    std::mutex              mutex;
    std::condition_variable cv;
    std::vector<int>        order;

    auto record = [&](int value) {
        return [&, value] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(value);
            cv.notify_all();
        };
    };
    scheduler.scheduleAfter(40ms, record(3));
    scheduler.scheduleAfter(5ms, record(1));
    scheduler.scheduleAfter(20ms, record(2));

    std::unique_lock<std::mutex> lock(mutex);
    REQUIRE(cv.wait_for(lock, 2s, [&] { return order.size() == 3; }));
    CHECK(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Callbacks run on the timer thread") {
    DelayScheduler               scheduler;
    std::promise<std::thread::id> ran;
    auto                          future = ran.get_future();
    scheduler.scheduleAfter(1ms, [&] { ran.set_value(std::this_thread::get_id()); });
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get() != std::this_thread::get_id());
}

TEST_CASE("Cancel") {
    DelayScheduler    scheduler;
    std::atomic<bool> fired{false};
    auto              id = scheduler.scheduleAfter(50ms, [&] { fired = true; });
    CHECK(scheduler.pending() == 1);
    CHECK(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(id));
    CHECK_FALSE(scheduler.cancel(12345));
    CHECK(scheduler.pending() == 0);
    std::this_thread::sleep_for(80ms);
    CHECK_FALSE(fired.load());
}

TEST_CASE("A failing callback does not stop the timer thread") {
    DelayScheduler    scheduler;
    std::atomic<bool> later{false};
    scheduler.scheduleAfter(1ms, [] { throw std::runtime_error("timer failure"); });
    scheduler.scheduleAfter(10ms, [&] { later = true; });
    for (int i = 0; i < 200 && !later.load(); ++i)
        std::this_thread::sleep_for(5ms);
    CHECK(later.load());
}

TEST_CASE("Shutdown drops pending timers") {
    DelayScheduler    scheduler;
    std::atomic<bool> fired{false};
    scheduler.scheduleAfter(1h, [&] { fired = true; });
    scheduler.shutdown();
    CHECK(scheduler.pending() == 0);
    CHECK_FALSE(fired.load());
    scheduler.shutdown();
}

} // TEST_SUITE

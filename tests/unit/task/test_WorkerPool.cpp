#include <doctest/doctest.h>
#include <heartcore/task/WorkerPool.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace HC;
using namespace std::chrono_literals;

namespace {

// Blocks workers until the test opens it.
class Gate {
public:
    void wait() {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this] { return open; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mtx);
        open = true;
        cv.notify_all();
    }

private:
    std::mutex              mtx;
    std::condition_variable cv;
    bool                    open = false;
};

} // namespace

TEST_SUITE("task.worker_pool") {

TEST_CASE("Jobs run and report their state") {
    WorkerPool       pool(2);
    std::atomic<int> counter{0};
    CHECK(pool.size() == 2);

    auto job = pool.submit([&] { ++counter; });
    REQUIRE(job.has_value());
    (*job)->get();
    CHECK(counter.load() == 1);
    CHECK((*job)->state() == JobState::Completed);
    CHECK_FALSE((*job)->hasFailed());
    CHECK(toString(JobState::Failed) == "failed");
}

TEST_CASE("Failed jobs keep their exception") {
    WorkerPool pool(1);
    auto       job = pool.submit([] { throw std::runtime_error("no device"); });
    REQUIRE(job.has_value());
    (*job)->wait();
    CHECK((*job)->hasFailed());
    CHECK((*job)->failure() != nullptr);
    CHECK_THROWS_WITH_AS((*job)->get(), "no device", std::runtime_error);

    // The worker survives the failure.
    std::atomic<bool> ran{false};
    (*pool.submit([&] { ran = true; }))->get();
    CHECK(ran.load());
}

TEST_CASE("Submitting an empty function is rejected") {
    WorkerPool pool(1);
    auto       job = pool.submit(Job::Function{});
    REQUIRE_FALSE(job.has_value());
    CHECK(job.error().code == Error::Code::InvalidArgument);
    CHECK_THROWS_AS(Job::Create(Job::Function{}), std::invalid_argument);
}

TEST_CASE("Zero threads still gives one worker") {
    WorkerPool pool(0);
    CHECK(pool.size() == 1);
}

TEST_CASE("Full pool queues work") {
    WorkerPool       pool(1);
    Gate             gate;
    std::atomic<int> finished{0};
    auto             blocker = pool.submit([&] {
        gate.wait();
        ++finished;
    });
    REQUIRE(blocker.has_value());
    std::vector<std::shared_ptr<Job>> queued;
    for (int i = 0; i < 3; ++i)
        queued.push_back(*pool.submit([&] { ++finished; }));

    CHECK(pool.pending() >= 3);
    for (auto const& job : queued)
        CHECK_FALSE(job->isDone());

    gate.release();
    for (auto const& job : queued)
        job->wait();
    CHECK(finished.load() == 4);
}

TEST_CASE("Shutdown drains queued jobs and rejects new ones") {
    WorkerPool       pool(2);
    std::atomic<int> counter{0};
    std::vector<std::shared_ptr<Job>> jobs;
    for (int i = 0; i < 20; ++i) {
        jobs.push_back(*pool.submit([&] {
            std::this_thread::sleep_for(1ms);
            ++counter;
        }));
    }
    pool.shutdown();
    CHECK(counter.load() == 20);
    CHECK(pool.isShuttingDown());
    for (auto const& job : jobs)
        CHECK(job->state() == JobState::Completed);

    auto rejected = pool.submit([] {});
    REQUIRE_FALSE(rejected.has_value());
    CHECK(rejected.error().code == Error::Code::ShuttingDown);

    // A second shutdown is harmless.
    pool.shutdown();
}

TEST_CASE("parallelMap") {
    WorkerPool pool(4);

    SUBCASE("Results keep input order") {
        std::vector<int> input(64);
        for (int i = 0; i < 64; ++i)
            input[i] = i;
        auto squares = pool.parallelMap(input, [](int const& value) { return value * value; });
        REQUIRE(squares.size() == input.size());
        for (int i = 0; i < 64; ++i)
            CHECK(squares[i] == i * i);
    }
    SUBCASE("Work is spread across threads") {
        std::mutex                 mutex;
        std::set<std::thread::id>  threads;
        std::vector<int>           input(32, 0);
        pool.parallelMap(input, [&](int const&) {
            std::this_thread::sleep_for(2ms);
            std::lock_guard<std::mutex> lock(mutex);
            threads.insert(std::this_thread::get_id());
            return 0;
        });
        CHECK(threads.size() > 1);
        CHECK_FALSE(threads.contains(std::this_thread::get_id()));
    }
    SUBCASE("The first failure in input order is rethrown after every job finished") {
        std::atomic<int> completed{0};
        std::vector<int> input{0, 1, 2, 3, 4, 5};
        auto             mapOnce = [&] {
            pool.parallelMap(input, [&](int const& value) -> int {
                if (value == 4)
                    throw std::runtime_error("item 4");
                if (value == 2)
                    throw std::runtime_error("item 2");
                ++completed;
                return value;
            });
        };
        CHECK_THROWS_WITH_AS(mapOnce(), "item 2", std::runtime_error);
        CHECK(completed.load() == 4);
    }
    SUBCASE("Empty input") {
        std::vector<std::string> input;
        auto                     out = pool.parallelMap(input, [](std::string const& s) { return s.size(); });
        CHECK(out.empty());
    }
    SUBCASE("A shut down pool rejects the map") {
        pool.shutdown();
        std::vector<int> input{1, 2};
        CHECK_THROWS_AS(pool.parallelMap(input, [](int const& value) { return value; }), std::runtime_error);
    }
}

} // TEST_SUITE

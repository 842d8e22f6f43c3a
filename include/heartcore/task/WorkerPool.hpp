#pragma once
#include <heartcore/core/Error.hpp>
#include <heartcore/task/Job.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace HC {

/**
 * Bounded pool of worker threads fed from one FIFO queue. A full pool applies backpressure by
 * queuing. Failed jobs are never retried.
 */
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threadCount = std::thread::hardware_concurrency());
    ~WorkerPool();

    WorkerPool(WorkerPool const&)                    = delete;
    auto operator=(WorkerPool const&) -> WorkerPool& = delete;

    auto submit(Job::Function function) -> Expected<std::shared_ptr<Job>>;

    /**
     * Runs fn(item) for every item on the pool and returns the results in input order.
     * Waits for every job before returning; the first failure (in input order) is rethrown.
     */
    template <typename T, typename Fn>
    auto parallelMap(std::vector<T> const& items, Fn&& fn) -> std::vector<std::invoke_result_t<Fn&, T const&>>;

    // Stops accepting work, lets queued and running jobs finish, then joins the workers.
    auto shutdown() -> void;
    auto size() const -> std::size_t;
    auto isShuttingDown() const -> bool;
    auto pending() const -> std::size_t;

private:
    auto workerFunction(std::size_t index) -> void;

    std::vector<std::jthread>        workers;
    std::queue<std::shared_ptr<Job>> jobs;
    mutable std::mutex               mutex;
    std::condition_variable          jobCV;
    std::atomic<bool>                shuttingDown{false};
    std::atomic<std::size_t>         activeJobs{0};
};

template <typename T, typename Fn>
auto WorkerPool::parallelMap(std::vector<T> const& items, Fn&& fn) -> std::vector<std::invoke_result_t<Fn&, T const&>> {
    using Result = std::invoke_result_t<Fn&, T const&>;

    std::vector<Result>               results(items.size());
    std::vector<std::shared_ptr<Job>> submitted;
    submitted.reserve(items.size());

    std::exception_ptr firstFailure;
    for (std::size_t i = 0; i < items.size(); ++i) {
        auto job = this->submit([&results, &items, &fn, i] { results[i] = fn(items[i]); });
        if (!job) {
            // Jobs already queued still reference results; wait for them before reporting.
            for (auto const& pendingJob : submitted)
                pendingJob->wait();
            throw std::runtime_error("WorkerPool rejected job: " + describeError(job.error()));
        }
        submitted.push_back(std::move(*job));
    }

    for (auto const& job : submitted) {
        job->wait();
        if (!firstFailure && job->hasFailed())
            firstFailure = job->failure();
    }
    if (firstFailure)
        std::rethrow_exception(firstFailure);
    return results;
}

} // namespace HC

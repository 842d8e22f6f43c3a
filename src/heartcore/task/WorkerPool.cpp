#include <heartcore/task/WorkerPool.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <system_error>

namespace HC {

WorkerPool::WorkerPool(std::size_t threadCount) {
    hc_log("WorkerPool::WorkerPool constructing", "WorkerPool");
    if (threadCount == 0)
        threadCount = 1;
    for (std::size_t i = 0; i < threadCount; ++i) {
        try {
            workers.emplace_back(&WorkerPool::workerFunction, this, i);
        } catch (std::system_error const& error) {
            hc_log(std::string("WorkerPool::WorkerPool failed to spawn worker: ") + error.what(), "WorkerPool", "Error");
            break;
        }
    }
    if (workers.empty())
        throw std::runtime_error("WorkerPool could not start any worker thread");
    hc_log("WorkerPool::WorkerPool constructed with workers=" + std::to_string(workers.size()), "WorkerPool");
}

WorkerPool::~WorkerPool() {
    hc_log("WorkerPool::~WorkerPool", "WorkerPool");
    shutdown();
}

auto WorkerPool::submit(Job::Function function) -> Expected<std::shared_ptr<Job>> {
    if (!function) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "WorkerPool::submit requires a callable"});
    }
    auto job = Job::Create(std::move(function));
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shuttingDown) {
            hc_log("WorkerPool::submit refused: shutting down", "WorkerPool");
            return std::unexpected(Error{Error::Code::ShuttingDown, "WorkerPool is shutting down"});
        }
        jobs.push(job);
    }
    jobCV.notify_one();
    return job;
}

auto WorkerPool::shutdown() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->shuttingDown) {
            hc_log("WorkerPool::shutdown begin", "WorkerPool");
            this->shuttingDown = true;
        }
    }
    this->jobCV.notify_all();

    // Workers drain the queue before exiting, so in-flight frames always finish.
    for (auto& worker : this->workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id())
            worker.join();
    }
    this->workers.clear();

    std::lock_guard<std::mutex> lock(this->mutex);
    while (!this->jobs.empty()) {
        this->jobs.front()->cancel(Error{Error::Code::ShuttingDown, "WorkerPool shut down before the job ran"});
        this->jobs.pop();
    }
    hc_log("WorkerPool::shutdown complete", "WorkerPool");
}

auto WorkerPool::size() const -> std::size_t {
    return this->workers.size();
}

auto WorkerPool::isShuttingDown() const -> bool {
    return this->shuttingDown.load();
}

auto WorkerPool::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->jobs.size() + this->activeJobs.load();
}

auto WorkerPool::workerFunction(std::size_t index) -> void {
#ifdef HC_LOG_DEBUG
    set_thread_name("Worker " + std::to_string(index));
#else
    (void)index;
#endif
    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });
            if (this->jobs.empty()) {
                hc_log("WorkerPool::workerFunction exiting on shutdown", "WorkerPool");
                return;
            }
            job = std::move(this->jobs.front());
            this->jobs.pop();
            ++this->activeJobs;
        }

        job->execute();
        if (job->hasFailed())
            hc_log("WorkerPool job failed", "WorkerPool", "Error");
        --this->activeJobs;
    }
}

} // namespace HC

#pragma once
#include <heartcore/core/Error.hpp>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>

namespace HC {

enum class JobState {
    Queued,
    Running,
    Completed,
    Failed
};

auto toString(JobState state) -> std::string_view;

/**
 * One unit of work executed by a WorkerPool.
 * A failing job keeps its exception so the submitter can rethrow it on its own thread.
 */
class Job {
public:
    using Function = std::function<void()>;

    static auto Create(Function function) -> std::shared_ptr<Job>;

    Job(Job const&)                    = delete;
    auto operator=(Job const&) -> Job& = delete;

    auto state() const -> JobState;
    auto isDone() const -> bool;
    auto hasFailed() const -> bool;

    // Blocks until the job completed or failed.
    auto wait() const -> void;
    auto failure() const -> std::exception_ptr;
    // Waits, then rethrows the captured exception if the job failed.
    auto get() const -> void;

private:
    explicit Job(Function function);

    auto execute() -> void;
    auto cancel(Error const& reason) -> void;

    friend class WorkerPool;

    Function                        function_;
    std::atomic<JobState>           state_{JobState::Queued};
    std::exception_ptr              failure_;
    mutable std::mutex              mutex_;
    mutable std::condition_variable done_;
};

} // namespace HC

#include <heartcore/task/Job.hpp>

#include <stdexcept>

namespace HC {

auto toString(JobState state) -> std::string_view {
    switch (state) {
    case JobState::Queued:
        return "queued";
    case JobState::Running:
        return "running";
    case JobState::Completed:
        return "completed";
    case JobState::Failed:
        return "failed";
    }
    return "unknown";
}

Job::Job(Function function)
    : function_(std::move(function)) {}

auto Job::Create(Function function) -> std::shared_ptr<Job> {
    if (!function)
        throw std::invalid_argument("Job requires a callable");
    return std::shared_ptr<Job>(new Job(std::move(function)));
}

auto Job::state() const -> JobState {
    return this->state_.load(std::memory_order_acquire);
}

auto Job::isDone() const -> bool {
    auto const current = this->state();
    return current == JobState::Completed || current == JobState::Failed;
}

auto Job::hasFailed() const -> bool {
    return this->state() == JobState::Failed;
}

auto Job::wait() const -> void {
    std::unique_lock<std::mutex> lock(this->mutex_);
    this->done_.wait(lock, [this] { return this->isDone(); });
}

auto Job::failure() const -> std::exception_ptr {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->failure_;
}

auto Job::get() const -> void {
    this->wait();
    if (auto error = this->failure())
        std::rethrow_exception(error);
}

auto Job::execute() -> void {
    this->state_.store(JobState::Running, std::memory_order_release);
    std::exception_ptr caught;
    try {
        this->function_();
    } catch (...) {
        caught = std::current_exception();
    }
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->failure_ = caught;
        this->state_.store(caught ? JobState::Failed : JobState::Completed, std::memory_order_release);
    }
    this->done_.notify_all();
}

auto Job::cancel(Error const& reason) -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        this->failure_ = std::make_exception_ptr(std::runtime_error(describeError(reason)));
        this->state_.store(JobState::Failed, std::memory_order_release);
    }
    this->done_.notify_all();
}

} // namespace HC

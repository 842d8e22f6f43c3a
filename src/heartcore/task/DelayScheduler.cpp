#include <heartcore/task/DelayScheduler.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>

namespace HC {

DelayScheduler::DelayScheduler()
    : thread_([this](std::stop_token stop) { this->run(stop); }) {}

DelayScheduler::~DelayScheduler() {
    this->shutdown();
}

auto DelayScheduler::scheduleAfter(std::chrono::milliseconds delay, Callback callback) -> TimerId {
    auto const deadline = std::chrono::steady_clock::now() + delay;
    TimerId    id;
    {
        std::lock_guard<std::mutex> lock(this->mutex_);
        id = this->nextId_++;
        this->timers_.emplace(std::make_pair(deadline, id), std::move(callback));
        this->deadlines_.emplace(id, deadline);
    }
    this->wake_.notify_all();
    return id;
}

auto DelayScheduler::cancel(TimerId id) -> bool {
    std::lock_guard<std::mutex> lock(this->mutex_);
    auto                        it = this->deadlines_.find(id);
    if (it == this->deadlines_.end())
        return false;
    this->timers_.erase(std::make_pair(it->second, id));
    this->deadlines_.erase(it);
    return true;
}

auto DelayScheduler::shutdown() -> void {
    if (!this->thread_.joinable())
        return;
    this->thread_.request_stop();
    this->wake_.notify_all();
    if (this->thread_.get_id() != std::this_thread::get_id())
        this->thread_.join();
    std::lock_guard<std::mutex> lock(this->mutex_);
    this->timers_.clear();
    this->deadlines_.clear();
}

auto DelayScheduler::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex_);
    return this->timers_.size();
}

auto DelayScheduler::run(std::stop_token stop) -> void {
#ifdef HC_LOG_DEBUG
    set_thread_name("DelayScheduler");
#endif
    std::unique_lock<std::mutex> lock(this->mutex_);
    while (!stop.stop_requested()) {
        if (this->timers_.empty()) {
            this->wake_.wait(lock, stop, [this] { return !this->timers_.empty(); });
            continue;
        }
        auto const deadline = this->timers_.begin()->first.first;
        if (std::chrono::steady_clock::now() < deadline) {
            this->wake_.wait_until(lock, stop, deadline, [this, deadline] {
                return !this->timers_.empty() && this->timers_.begin()->first.first < deadline;
            });
            continue;
        }
        auto node = this->timers_.extract(this->timers_.begin());
        this->deadlines_.erase(node.key().second);
        lock.unlock();
        try {
            node.mapped()();
        } catch (std::exception const& error) {
            hc_log(std::string("DelayScheduler callback failed: ") + error.what(), "DelayScheduler", "Error");
        }
        lock.lock();
    }
}

} // namespace HC

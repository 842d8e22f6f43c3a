#pragma once
#include <heartcore/task/Scheduler.hpp>

#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace HC {

// Single timer thread ordering callbacks by deadline; callbacks run on that thread.
class DelayScheduler final : public Scheduler {
public:
    DelayScheduler();
    ~DelayScheduler() override;

    DelayScheduler(DelayScheduler const&)                    = delete;
    auto operator=(DelayScheduler const&) -> DelayScheduler& = delete;

    auto scheduleAfter(std::chrono::milliseconds delay, Callback callback) -> TimerId override;
    auto cancel(TimerId id) -> bool override;

    // Drops pending timers and joins the timer thread.
    auto shutdown() -> void;
    auto pending() const -> std::size_t;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    auto run(std::stop_token stop) -> void;

    mutable std::mutex                               mutex_;
    std::condition_variable_any                      wake_;
    std::map<std::pair<Deadline, TimerId>, Callback> timers_;
    std::map<TimerId, Deadline>                      deadlines_;
    TimerId                                          nextId_{1};
    std::jthread                                     thread_;
};

} // namespace HC

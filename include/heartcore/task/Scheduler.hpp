#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace HC {

using TimerId = std::uint64_t;

/**
 * Runs callbacks after a delay. Cancelling a timer that already fired, or was never scheduled,
 * returns false.
 */
class Scheduler {
public:
    using Callback = std::function<void()>;

    virtual ~Scheduler() = default;

    virtual auto scheduleAfter(std::chrono::milliseconds delay, Callback callback) -> TimerId = 0;
    virtual auto cancel(TimerId id) -> bool                                                  = 0;
};

} // namespace HC

#include <heartcore/core/Clock.hpp>

#include <thread>

namespace HC {

auto SteadyClock::Instance() -> SteadyClock& {
    static SteadyClock instance;
    return instance;
}

auto SteadyClock::now() const -> TimePoint {
    return std::chrono::steady_clock::now();
}

auto SteadyClock::sleepFor(Duration duration) -> void {
    if (duration <= Duration::zero())
        return;
    std::this_thread::sleep_for(duration);
}

} // namespace HC

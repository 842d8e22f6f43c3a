#pragma once
#include <chrono>

namespace HC {

/**
 * Monotonic time source shared by pacers, caches and virtual peripherals.
 * Production code uses SteadyClock; tests substitute a manually advanced clock.
 */
class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration  = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;

    virtual auto now() const -> TimePoint            = 0;
    virtual auto sleepFor(Duration duration) -> void = 0;
};

class SteadyClock final : public Clock {
public:
    static auto Instance() -> SteadyClock&;

    auto now() const -> TimePoint override;
    auto sleepFor(Duration duration) -> void override;
};

inline auto toMilliseconds(Clock::Duration duration) -> double {
    return std::chrono::duration<double, std::milli>(duration).count();
}

inline auto fromMilliseconds(double milliseconds) -> Clock::Duration {
    return std::chrono::duration_cast<Clock::Duration>(std::chrono::duration<double, std::milli>(milliseconds));
}

} // namespace HC

#pragma once
#include <heartcore/core/Clock.hpp>

#include <cstdint>

namespace HC {

// Published once per presented frame.
struct FrameTick {
    std::uint64_t    frame_index = 0;
    Clock::TimePoint time_point{};
    double           frame_ms = 0.0;
};

} // namespace HC

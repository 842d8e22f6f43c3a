#pragma once
#include <heartcore/stream/SharedStream.hpp>

#include <chrono>
#include <cstdint>

namespace HC {

/**
 * Ticker source emitting 0, 1, 2, ... every period on its own thread while connected.
 * Every connect starts counting from zero.
 */
auto MakeIntervalSource(std::chrono::milliseconds period) -> StreamSource<std::uint64_t>;

} // namespace HC

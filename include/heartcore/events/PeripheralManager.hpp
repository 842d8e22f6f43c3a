#pragma once
#include <heartcore/core/Error.hpp>
#include <heartcore/events/Peripheral.hpp>

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace HC {

/**
 * Owns detected peripherals and their background threads. Every added peripheral is attached
 * to the bus; start() runs each one on its own std::jthread and close() stops and joins them.
 */
class PeripheralManager {
public:
    explicit PeripheralManager(EventBus& bus);
    ~PeripheralManager();

    PeripheralManager(PeripheralManager const&)                    = delete;
    auto operator=(PeripheralManager const&) -> PeripheralManager& = delete;

    // Returns how many peripherals the detectors produced.
    auto detect(std::vector<PeripheralDetector> const& detectors) -> std::size_t;
    auto add(PeripheralPtr peripheral) -> void;

    auto start() -> std::optional<Error>;
    auto close() -> void;

    auto peripherals() const -> std::vector<PeripheralPtr>;
    auto isStarted() const -> bool;
    // Peripherals whose run() ended with an exception.
    auto failureCount() const -> std::size_t { return this->failures.load(); }

private:
    EventBus&                  bus;
    mutable std::mutex         mutex;
    std::vector<PeripheralPtr> peripherals_;
    std::vector<std::jthread>  threads;
    bool                       started = false;
    std::atomic<std::size_t>   failures{0};
};

} // namespace HC

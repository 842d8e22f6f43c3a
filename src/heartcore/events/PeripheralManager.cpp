#include <heartcore/events/PeripheralManager.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <stdexcept>

namespace HC {

PeripheralManager::PeripheralManager(EventBus& bus)
    : bus(bus) {}

PeripheralManager::~PeripheralManager() {
    this->close();
}

auto PeripheralManager::detect(std::vector<PeripheralDetector> const& detectors) -> std::size_t {
    std::size_t found = 0;
    for (auto const& detector : detectors) {
        if (!detector)
            continue;
        for (auto& peripheral : detector()) {
            if (!peripheral)
                continue;
            this->add(std::move(peripheral));
            ++found;
        }
    }
    hc_log("PeripheralManager detected " + std::to_string(found) + " peripheral(s)", "Peripheral");
    return found;
}

auto PeripheralManager::add(PeripheralPtr peripheral) -> void {
    if (!peripheral)
        throw std::invalid_argument("PeripheralManager::add requires a peripheral");
    peripheral->attach(this->bus);
    std::lock_guard<std::mutex> lock(this->mutex);
    this->peripherals_.push_back(std::move(peripheral));
}

auto PeripheralManager::start() -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->started)
        return Error{Error::Code::AlreadyExists, "PeripheralManager has already been started"};
    this->started = true;
    for (auto const& peripheral : this->peripherals_) {
        hc_log("Starting peripheral thread for " + peripheral->name(), "Peripheral");
        this->threads.emplace_back([this, peripheral](std::stop_token stop) {
#ifdef HC_LOG_DEBUG
            set_thread_name("Peripheral - " + peripheral->name());
#endif
            try {
                peripheral->run(stop);
            } catch (std::exception const& error) {
                ++this->failures;
                hc_log("Peripheral " + peripheral->name() + " failed: " + error.what(), "Peripheral", "Error");
            }
        });
    }
    return std::nullopt;
}

auto PeripheralManager::close() -> void {
    std::vector<std::jthread> running;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        running.swap(this->threads);
    }
    for (auto& thread : running)
        thread.request_stop();
    for (auto& thread : running) {
        if (thread.joinable())
            thread.join();
    }
}

auto PeripheralManager::peripherals() const -> std::vector<PeripheralPtr> {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->peripherals_;
}

auto PeripheralManager::isStarted() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->started;
}

} // namespace HC

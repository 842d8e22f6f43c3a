#include <heartcore/events/Peripheral.hpp>

#include "log/TaggedLogger.hpp"

#include <condition_variable>

namespace HC {

Peripheral::Peripheral(std::string name, std::int64_t producerId)
    : name_(std::move(name)), producerId_(producerId) {}

Peripheral::~Peripheral() {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->bus == nullptr)
        return;
    for (auto const& subscription : this->subscriptions)
        this->bus->unsubscribe(subscription);
}

auto Peripheral::attach(EventBus& target) -> void {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->bus != nullptr && this->bus != &target) {
        for (auto const& subscription : this->subscriptions)
            this->bus->unsubscribe(subscription);
        this->subscriptions.clear();
    }
    this->bus = &target;
    hc_log("Peripheral " + this->name_ + " attached as producer " + std::to_string(this->producerId_), "Peripheral");
}

auto Peripheral::isAttached() const -> bool {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->bus != nullptr;
}

auto Peripheral::emit(std::string eventType, nlohmann::json data) -> Expected<DispatchReport> {
    EventBus* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        target = this->bus;
    }
    if (target == nullptr)
        return std::unexpected(Error{Error::Code::NotInitialized, "peripheral '" + this->name_ + "' is not attached to a bus"});
    return target->emit(std::move(eventType), std::move(data), this->producerId_);
}

auto Peripheral::subscribe(std::string eventType, EventHandler handler) -> Expected<SubscriptionHandle> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->bus == nullptr)
        return std::unexpected(Error{Error::Code::NotInitialized, "peripheral '" + this->name_ + "' is not attached to a bus"});
    auto handle = this->bus->subscribe(std::move(eventType), std::move(handler));
    this->subscriptions.push_back(handle);
    return handle;
}

ScriptedPeripheral::ScriptedPeripheral(std::string name, std::int64_t producerId, std::vector<ScriptedStep> steps, bool repeat)
    : Peripheral(std::move(name), producerId), steps(std::move(steps)), repeat(repeat) {}

auto ScriptedPeripheral::run(std::stop_token stop) -> void {
    std::mutex                  waitMutex;
    std::condition_variable_any waitCV;
    do {
        for (auto const& step : this->steps) {
            if (step.delay.count() > 0) {
                std::unique_lock<std::mutex> lock(waitMutex);
                waitCV.wait_for(lock, stop, step.delay, [] { return false; });
            }
            if (stop.stop_requested())
                return;
            auto report = this->emit(step.event_type, step.data);
            if (!report) {
                hc_log("ScriptedPeripheral " + this->name() + " stopped: " + describeError(report.error()), "Peripheral", "Error");
                return;
            }
            ++this->emitted;
        }
    } while (this->repeat && !this->steps.empty() && !stop.stop_requested());
}

} // namespace HC

#pragma once
#include <heartcore/core/Error.hpp>
#include <heartcore/events/EventBus.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace HC {

/**
 * A device feeding the bus. Concrete drivers poll or listen in run() on a background thread
 * owned by the PeripheralManager and publish through emit(); they never block the render loop.
 */
class Peripheral {
public:
    explicit Peripheral(std::string name, std::int64_t producerId = 0);
    virtual ~Peripheral();

    Peripheral(Peripheral const&)                    = delete;
    auto operator=(Peripheral const&) -> Peripheral& = delete;

    auto name() const -> std::string const& { return this->name_; }
    auto producerId() const -> std::int64_t { return this->producerId_; }

    auto attach(EventBus& bus) -> void;
    auto isAttached() const -> bool;

    // Publishes under this peripheral's producer id. Fails with NotInitialized before attach().
    auto emit(std::string eventType, nlohmann::json data = nlohmann::json::object()) -> Expected<DispatchReport>;
    // Inbound events, e.g. commands for an output device. Released when the peripheral is destroyed.
    auto subscribe(std::string eventType, EventHandler handler) -> Expected<SubscriptionHandle>;

    // Background work; must return promptly once stop is requested.
    virtual auto run(std::stop_token stop) -> void = 0;

private:
    std::string const               name_;
    std::int64_t const              producerId_;
    mutable std::mutex              mutex;
    EventBus*                       bus = nullptr;
    std::vector<SubscriptionHandle> subscriptions;
};

using PeripheralPtr = std::shared_ptr<Peripheral>;
// Discovery hook supplied by the hardware layer.
using PeripheralDetector = std::function<std::vector<PeripheralPtr>()>;

struct ScriptedStep {
    std::chrono::milliseconds delay{0}; // waited before the event is emitted
    std::string               event_type;
    nlohmann::json            data = nlohmann::json::object();
};

// Replays a fixed list of events; stands in for hardware in demos and tests.
class ScriptedPeripheral final : public Peripheral {
public:
    ScriptedPeripheral(std::string name, std::int64_t producerId, std::vector<ScriptedStep> steps, bool repeat = false);

    auto run(std::stop_token stop) -> void override;
    auto emittedCount() const -> std::size_t { return this->emitted.load(); }

private:
    std::vector<ScriptedStep> const steps;
    bool const                      repeat;
    std::atomic<std::size_t>        emitted{0};
};

} // namespace HC

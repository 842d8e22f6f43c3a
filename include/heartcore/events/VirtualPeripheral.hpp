#pragma once
#include <heartcore/core/Clock.hpp>
#include <heartcore/core/Error.hpp>
#include <heartcore/events/EventBus.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace HC {

class EventPlaylistManager;
struct VirtualPeripheralDefinition;

struct VirtualPeripheralHandle {
    std::string id;

    explicit operator bool() const { return !id.empty(); }
    auto operator==(VirtualPeripheralHandle const&) const -> bool = default;
};

/**
 * What a virtual peripheral instance sees of the bus. Emitted payloads are tagged with
 * "virtual_peripheral": {"id", "name", "metadata"} so consumers can tell derived events apart.
 */
class VirtualPeripheralContext {
public:
    VirtualPeripheralContext(EventBus& bus, VirtualPeripheralHandle handle, std::string name, nlohmann::json metadata);

    // Non-object data is wrapped as {"value": data}.
    auto emit(std::string const& eventType, nlohmann::json data, std::int64_t producerId = 0) -> DispatchReport;

    auto now() const -> Clock::TimePoint;
    auto stateStore() const -> StateStore const&;
    auto playlists() -> EventPlaylistManager&;
    auto handle() const -> VirtualPeripheralHandle const& { return this->handle_; }
    auto name() const -> std::string const& { return this->name_; }

    // True when the event was emitted by this context.
    auto isOwnEvent(InputEvent const& event) const -> bool;

private:
    EventBus&                     bus;
    VirtualPeripheralHandle const handle_;
    std::string const             name_;
    nlohmann::json const          metadata;
};

// Runtime instance of one definition. Its state is owned by the instance and only touched from handle().
class VirtualPeripheral {
public:
    explicit VirtualPeripheral(VirtualPeripheralContext& context)
        : context(context) {}
    virtual ~VirtualPeripheral() = default;

    virtual auto handle(InputEvent const& event) -> void = 0;
    virtual auto shutdown() -> void {}

protected:
    VirtualPeripheralContext& context;
};

using VirtualPeripheralFactory = std::function<std::unique_ptr<VirtualPeripheral>(VirtualPeripheralContext& context)>;

struct VirtualPeripheralDefinition {
    std::string              name;
    std::vector<std::string> event_types;
    VirtualPeripheralFactory factory;
    int                      priority = 0;
    nlohmann::json           metadata; // null when absent
};

auto ValidateVirtualPeripheralDefinition(VirtualPeripheralDefinition const& definition) -> std::optional<Error>;

/**
 * Binds virtual peripheral definitions to the bus that owns the manager. Each registration
 * gets its own instance and one subscription per source event type. Events for one
 * registration are handed to its instance one at a time; an instance that re-enters the bus
 * from handle() may see its own output on the same thread.
 */
class VirtualPeripheralManager {
public:
    explicit VirtualPeripheralManager(EventBus& bus);
    ~VirtualPeripheralManager();

    VirtualPeripheralManager(VirtualPeripheralManager const&)                    = delete;
    auto operator=(VirtualPeripheralManager const&) -> VirtualPeripheralManager& = delete;

    auto registerDefinition(VirtualPeripheralDefinition definition) -> Expected<VirtualPeripheralHandle>;
    // Rebinds the handle to a new definition; the previous instance is shut down and its state dropped.
    auto update(VirtualPeripheralHandle const& handle, VirtualPeripheralDefinition definition) -> std::optional<Error>;
    auto remove(VirtualPeripheralHandle const& handle) -> bool;

    auto definitions() const -> std::map<std::string, VirtualPeripheralDefinition>;
    auto size() const -> std::size_t;
    auto clear() -> void;

private:
    struct Registration {
        VirtualPeripheralHandle                   handle;
        VirtualPeripheralDefinition               definition;
        std::unique_ptr<VirtualPeripheralContext> context;
        std::unique_ptr<VirtualPeripheral>        instance;
        std::vector<SubscriptionHandle>           subscriptions;
        std::recursive_mutex                      mutex;
        bool                                      active = true;
    };
    using RegistrationPtr = std::shared_ptr<Registration>;

    auto bind(VirtualPeripheralHandle handle, VirtualPeripheralDefinition definition) -> Expected<RegistrationPtr>;
    auto unbind(RegistrationPtr const& registration) -> void;

    EventBus&                              bus;
    mutable std::mutex                     mutex;
    std::map<std::string, RegistrationPtr> registrations;
    std::uint64_t                          nextId{1};
};

// Returns zero or more payloads to emit for one source event.
using VirtualPeripheralTransform = std::function<std::vector<nlohmann::json>(InputEvent const& event, VirtualPeripheralContext& context)>;

/**
 * Stateless adapter: every payload returned by transform is emitted as outputEventType with the
 * source producer id, or outputProducerId when given.
 */
auto MakeTransformVirtualPeripheral(std::string name,
                                    std::vector<std::string> eventTypes,
                                    std::string outputEventType,
                                    VirtualPeripheralTransform transform,
                                    std::optional<std::int64_t> outputProducerId = std::nullopt) -> VirtualPeripheralDefinition;

} // namespace HC

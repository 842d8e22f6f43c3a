#include <heartcore/events/VirtualPeripheral.hpp>
#include <heartcore/events/EventPlaylists.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <stdexcept>

namespace HC {

VirtualPeripheralContext::VirtualPeripheralContext(EventBus& bus, VirtualPeripheralHandle handle, std::string name, nlohmann::json metadata)
    : bus(bus), handle_(std::move(handle)), name_(std::move(name)), metadata(std::move(metadata)) {}

auto VirtualPeripheralContext::emit(std::string const& eventType, nlohmann::json data, std::int64_t producerId) -> DispatchReport {
    nlohmann::json payload = data.is_object() ? std::move(data) : nlohmann::json{{"value", std::move(data)}};
    if (!payload.contains("virtual_peripheral")) {
        nlohmann::json descriptor = {{"id", this->handle_.id}, {"name", this->name_}};
        if (!this->metadata.is_null())
            descriptor["metadata"] = this->metadata;
        payload["virtual_peripheral"] = std::move(descriptor);
    }
    return this->bus.emit(eventType, std::move(payload), producerId);
}

auto VirtualPeripheralContext::now() const -> Clock::TimePoint {
    return this->bus.clock().now();
}

auto VirtualPeripheralContext::stateStore() const -> StateStore const& {
    return this->bus.stateStore();
}

auto VirtualPeripheralContext::playlists() -> EventPlaylistManager& {
    return this->bus.playlists();
}

auto VirtualPeripheralContext::isOwnEvent(InputEvent const& event) const -> bool {
    if (!event.data.is_object())
        return false;
    auto descriptor = event.data.find("virtual_peripheral");
    if (descriptor == event.data.end() || !descriptor->is_object())
        return false;
    auto id = descriptor->find("id");
    return id != descriptor->end() && id->is_string() && id->get<std::string>() == this->handle_.id;
}

auto ValidateVirtualPeripheralDefinition(VirtualPeripheralDefinition const& definition) -> std::optional<Error> {
    if (definition.name.empty())
        return Error{Error::Code::InvalidArgument, "virtual peripheral requires a name"};
    if (definition.event_types.empty())
        return Error{Error::Code::InvalidArgument, "virtual peripheral '" + definition.name + "' requires event types"};
    for (auto const& type : definition.event_types) {
        if (type.empty())
            return Error{Error::Code::InvalidArgument, "virtual peripheral '" + definition.name + "' has an empty event type"};
    }
    if (!definition.factory)
        return Error{Error::Code::InvalidArgument, "virtual peripheral '" + definition.name + "' requires a factory"};
    return std::nullopt;
}

VirtualPeripheralManager::VirtualPeripheralManager(EventBus& bus)
    : bus(bus) {}

VirtualPeripheralManager::~VirtualPeripheralManager() {
    this->clear();
}

auto VirtualPeripheralManager::registerDefinition(VirtualPeripheralDefinition definition) -> Expected<VirtualPeripheralHandle> {
    if (auto error = ValidateVirtualPeripheralDefinition(definition))
        return std::unexpected(*error);

    VirtualPeripheralHandle handle;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        handle.id = "vp-" + std::to_string(this->nextId++);
    }
    auto registration = this->bind(handle, std::move(definition));
    if (!registration)
        return std::unexpected(registration.error());
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        this->registrations.emplace(handle.id, *registration);
    }
    hc_log("VirtualPeripheralManager registered " + (*registration)->definition.name + " as " + handle.id, "VirtualPeripheral");
    return handle;
}

auto VirtualPeripheralManager::update(VirtualPeripheralHandle const& handle, VirtualPeripheralDefinition definition) -> std::optional<Error> {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (!this->registrations.contains(handle.id))
            return Error{Error::Code::NotFound, "unknown virtual peripheral id: " + handle.id};
    }
    if (auto error = ValidateVirtualPeripheralDefinition(definition))
        return error;

    auto replacement = this->bind(handle, std::move(definition));
    if (!replacement)
        return replacement.error();

    RegistrationPtr previous;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->registrations.find(handle.id);
        if (it != this->registrations.end()) {
            previous   = std::move(it->second);
            it->second = *replacement;
        } else {
            // Removed concurrently; the replacement must not outlive the removal.
            previous = *replacement;
        }
    }
    this->unbind(previous);
    if (previous == *replacement)
        return Error{Error::Code::NotFound, "virtual peripheral removed during update: " + handle.id};
    return std::nullopt;
}

auto VirtualPeripheralManager::remove(VirtualPeripheralHandle const& handle) -> bool {
    RegistrationPtr registration;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        auto it = this->registrations.find(handle.id);
        if (it == this->registrations.end())
            return false;
        registration = std::move(it->second);
        this->registrations.erase(it);
    }
    this->unbind(registration);
    return true;
}

auto VirtualPeripheralManager::definitions() const -> std::map<std::string, VirtualPeripheralDefinition> {
    std::lock_guard<std::mutex>                        lock(this->mutex);
    std::map<std::string, VirtualPeripheralDefinition> result;
    for (auto const& [id, registration] : this->registrations)
        result.emplace(id, registration->definition);
    return result;
}

auto VirtualPeripheralManager::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->registrations.size();
}

auto VirtualPeripheralManager::clear() -> void {
    std::map<std::string, RegistrationPtr> removed;
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        removed.swap(this->registrations);
    }
    for (auto const& [_, registration] : removed)
        this->unbind(registration);
}

auto VirtualPeripheralManager::bind(VirtualPeripheralHandle handle, VirtualPeripheralDefinition definition) -> Expected<RegistrationPtr> {
    auto registration        = std::make_shared<Registration>();
    registration->handle     = handle;
    registration->definition = std::move(definition);
    registration->context    = std::make_unique<VirtualPeripheralContext>(this->bus,
                                                                       handle,
                                                                       registration->definition.name,
                                                                       registration->definition.metadata);
    try {
        registration->instance = registration->definition.factory(*registration->context);
    } catch (std::exception const& error) {
        return std::unexpected(Error{Error::Code::InvalidArgument,
                                     "virtual peripheral '" + registration->definition.name + "' factory failed: " + error.what()});
    }
    if (!registration->instance)
        return std::unexpected(Error{Error::Code::InvalidArgument, "virtual peripheral '" + registration->definition.name + "' factory returned null"});

    std::weak_ptr<Registration> weak = registration;
    for (auto const& eventType : registration->definition.event_types) {
        auto subscription = this->bus.subscribe(
                eventType,
                [weak](InputEvent const& event) {
                    auto target = weak.lock();
                    if (!target)
                        return;
                    std::lock_guard<std::recursive_mutex> lock(target->mutex);
                    if (!target->active || !target->instance)
                        return;
                    target->instance->handle(event);
                },
                registration->definition.priority);
        registration->subscriptions.push_back(std::move(subscription));
    }
    return registration;
}

auto VirtualPeripheralManager::unbind(RegistrationPtr const& registration) -> void {
    for (auto const& subscription : registration->subscriptions)
        this->bus.unsubscribe(subscription);

    std::lock_guard<std::recursive_mutex> lock(registration->mutex);
    if (!registration->active)
        return;
    registration->active = false;
    if (registration->instance) {
        try {
            registration->instance->shutdown();
        } catch (std::exception const& error) {
            hc_log("VirtualPeripheral " + registration->handle.id + " shutdown failed: " + error.what(), "VirtualPeripheral", "Error");
        }
    }
    hc_log("VirtualPeripheralManager unregistered " + registration->definition.name, "VirtualPeripheral");
}

namespace {

class TransformVirtualPeripheral final : public VirtualPeripheral {
public:
    TransformVirtualPeripheral(VirtualPeripheralContext& context,
                               std::string outputEventType,
                               VirtualPeripheralTransform transform,
                               std::optional<std::int64_t> outputProducerId)
        : VirtualPeripheral(context), outputEventType(std::move(outputEventType)), transform(std::move(transform)), outputProducerId(outputProducerId) {}

    auto handle(InputEvent const& event) -> void override {
        if (this->context.isOwnEvent(event))
            return;
        for (auto& payload : this->transform(event, this->context))
            this->context.emit(this->outputEventType, std::move(payload), this->outputProducerId.value_or(event.producer_id));
    }

private:
    std::string const                 outputEventType;
    VirtualPeripheralTransform const  transform;
    std::optional<std::int64_t> const outputProducerId;
};

} // namespace

auto MakeTransformVirtualPeripheral(std::string name,
                                    std::vector<std::string> eventTypes,
                                    std::string outputEventType,
                                    VirtualPeripheralTransform transform,
                                    std::optional<std::int64_t> outputProducerId) -> VirtualPeripheralDefinition {
    if (outputEventType.empty())
        throw std::invalid_argument("transform virtual peripheral requires an output event type");
    if (!transform)
        throw std::invalid_argument("transform virtual peripheral requires a transform");
    return VirtualPeripheralDefinition{
            .name        = std::move(name),
            .event_types = std::move(eventTypes),
            .factory     = [outputEventType = std::move(outputEventType), transform = std::move(transform), outputProducerId](VirtualPeripheralContext& context)
                    -> std::unique_ptr<VirtualPeripheral> {
                return std::make_unique<TransformVirtualPeripheral>(context, outputEventType, transform, outputProducerId);
            },
    };
}

} // namespace HC

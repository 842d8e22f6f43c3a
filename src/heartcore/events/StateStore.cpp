#include <heartcore/events/StateStore.hpp>

#include <stdexcept>
#include <tuple>

namespace HC {

namespace {

auto store_newest(StateStore::ProducerMap& producers, InputEventPtr const& event) -> void {
    auto [it, inserted] = producers.try_emplace(event->producer_id, event);
    if (!inserted && it->second->sequence <= event->sequence)
        it->second = event;
}

auto newer(InputEventPtr const& lhs, InputEventPtr const& rhs) -> bool {
    return std::tie(lhs->timestamp, lhs->sequence) > std::tie(rhs->timestamp, rhs->sequence);
}

} // namespace

auto StateStore::update(InputEvent event) -> InputEventPtr {
    return this->update(std::make_shared<InputEvent const>(std::move(event)));
}

auto StateStore::update(InputEventPtr event) -> InputEventPtr {
    if (!event)
        throw std::invalid_argument("StateStore::update requires an event");
    this->entries.try_emplace_l(
            event->event_type,
            [&](auto& entry) { store_newest(entry.second, event); },
            ProducerMap{{event->producer_id, event}});
    return event;
}

auto StateStore::getLatest(std::string_view eventType, std::int64_t producerId) const -> InputEventPtr {
    InputEventPtr result;
    this->entries.if_contains(eventType, [&](auto const& entry) {
        if (auto it = entry.second.find(producerId); it != entry.second.end())
            result = it->second;
    });
    return result;
}

auto StateStore::getLatest(std::string_view eventType) const -> InputEventPtr {
    InputEventPtr result;
    this->entries.if_contains(eventType, [&](auto const& entry) {
        for (auto const& [_, event] : entry.second) {
            if (!result || newer(event, result))
                result = event;
        }
    });
    return result;
}

auto StateStore::getAll(std::string_view eventType) const -> ProducerMap {
    ProducerMap result;
    this->entries.if_contains(eventType, [&](auto const& entry) { result = entry.second; });
    return result;
}

auto StateStore::snapshot() const -> Snapshot {
    Snapshot result;
    this->entries.for_each([&](auto const& entry) { result.emplace(entry.first, entry.second); });
    return result;
}

auto StateStore::size() const -> std::size_t {
    std::size_t total = 0;
    this->entries.for_each([&](auto const& entry) { total += entry.second.size(); });
    return total;
}

auto StateStore::clear() -> void {
    this->entries.clear();
}

} // namespace HC

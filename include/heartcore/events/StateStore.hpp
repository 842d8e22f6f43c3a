#pragma once
#include <heartcore/events/InputEvent.hpp>

#include <parallel_hashmap/phmap.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace HC {

/**
 * Latest event per (event_type, producer_id).
 *
 * Writers for one event type are serialized by the owning submap lock, so an update is never
 * torn and readers copy a consistent view. An event with an older emission sequence never
 * replaces a newer one, which keeps the most recent event of every producer under concurrent
 * writers. Reads hand out shared pointers to immutable events.
 */
class StateStore {
public:
    using ProducerMap = std::map<std::int64_t, InputEventPtr>;
    using Snapshot    = std::map<std::string, ProducerMap, std::less<>>;

    StateStore() = default;

    StateStore(StateStore const&)                    = delete;
    auto operator=(StateStore const&) -> StateStore& = delete;

    auto update(InputEvent event) -> InputEventPtr;
    auto update(InputEventPtr event) -> InputEventPtr;

    auto getLatest(std::string_view eventType, std::int64_t producerId) const -> InputEventPtr;
    // Newest event of the type across all producers, by timestamp then sequence.
    auto getLatest(std::string_view eventType) const -> InputEventPtr;
    auto getAll(std::string_view eventType) const -> ProducerMap;
    auto snapshot() const -> Snapshot;
    auto size() const -> std::size_t;
    auto clear() -> void;

private:
    static constexpr int DefaultSubmaps = 4;

    struct TransparentStringHash {
        using is_transparent = void;
        auto operator()(std::string_view value) const -> std::size_t { return std::hash<std::string_view>{}(value); }
    };

    using EntryMap = phmap::parallel_node_hash_map<
            std::string,
            ProducerMap,
            TransparentStringHash,
            std::equal_to<>,
            std::allocator<std::pair<const std::string, ProducerMap>>,
            DefaultSubmaps,
            std::mutex>;

    EntryMap entries;
};

} // namespace HC

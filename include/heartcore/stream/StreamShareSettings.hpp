#pragma once
#include <heartcore/core/Error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace HC {

enum class StreamShareStrategy {
    Share,
    ShareAutoConnect,
    ReplayLatest,
    ReplayLatestAutoConnect,
    ReplayBuffer,
    ReplayBufferAutoConnect
};

enum class StreamConnectMode {
    Lazy,  // attach the subscriber first, then connect the source
    Eager  // connect the source before attaching the subscriber
};

/**
 * Sharing policy of one SharedStream. Resolved once when the stream is created and never
 * changed afterwards.
 */
struct StreamShareSettings {
    StreamShareStrategy         strategy{StreamShareStrategy::ReplayLatest};
    std::size_t                 replay_buffer_size{16};
    std::optional<std::int64_t> replay_window_ms{};
    std::int64_t                auto_connect_min_subscribers{1};
    std::int64_t                refcount_min_subscribers{1};
    std::int64_t                refcount_grace_ms{0};
    StreamConnectMode           connect_mode{StreamConnectMode::Lazy};
    // Values arriving within this window of the first pending one collapse to the latest; 0 passes everything.
    std::int64_t                coalesce_window_ms{0};

    [[nodiscard]] auto isAutoConnect() const -> bool;
    // Number of values kept for late subscribers: 0, 1 or replay_buffer_size.
    [[nodiscard]] auto replayCapacity() const -> std::size_t;
};

auto ValidateStreamShareSettings(StreamShareSettings const& settings) -> std::optional<Error>;

auto ParseStreamShareStrategy(std::string_view text) -> Expected<StreamShareStrategy>;
auto ParseStreamConnectMode(std::string_view text) -> Expected<StreamConnectMode>;
auto toString(StreamShareStrategy strategy) -> std::string_view;
auto toString(StreamConnectMode mode) -> std::string_view;

} // namespace HC

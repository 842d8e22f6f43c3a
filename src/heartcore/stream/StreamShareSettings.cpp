#include <heartcore/stream/StreamShareSettings.hpp>

#include <string>

namespace HC {

auto StreamShareSettings::isAutoConnect() const -> bool {
    switch (strategy) {
    case StreamShareStrategy::ShareAutoConnect:
    case StreamShareStrategy::ReplayLatestAutoConnect:
    case StreamShareStrategy::ReplayBufferAutoConnect:
        return true;
    default:
        return false;
    }
}

auto StreamShareSettings::replayCapacity() const -> std::size_t {
    switch (strategy) {
    case StreamShareStrategy::Share:
    case StreamShareStrategy::ShareAutoConnect:
        return 0;
    case StreamShareStrategy::ReplayLatest:
    case StreamShareStrategy::ReplayLatestAutoConnect:
        return 1;
    case StreamShareStrategy::ReplayBuffer:
    case StreamShareStrategy::ReplayBufferAutoConnect:
        return replay_buffer_size;
    }
    return 0;
}

auto ValidateStreamShareSettings(StreamShareSettings const& settings) -> std::optional<Error> {
    if (settings.replay_buffer_size < 1) {
        return Error{Error::Code::InvalidConfiguration, "stream replay buffer size must be >= 1"};
    }
    if (settings.replay_window_ms && *settings.replay_window_ms < 1) {
        return Error{Error::Code::InvalidConfiguration, "stream replay window must be >= 1 ms"};
    }
    if (settings.auto_connect_min_subscribers < 1) {
        return Error{Error::Code::InvalidConfiguration, "stream auto-connect minimum subscribers must be >= 1"};
    }
    if (settings.refcount_min_subscribers < 1) {
        return Error{Error::Code::InvalidConfiguration, "stream ref-count minimum subscribers must be >= 1"};
    }
    if (settings.refcount_grace_ms < 0) {
        return Error{Error::Code::InvalidConfiguration, "stream ref-count grace period must be >= 0 ms"};
    }
    if (settings.coalesce_window_ms < 0) {
        return Error{Error::Code::InvalidConfiguration, "stream coalesce window must be >= 0 ms"};
    }
    return std::nullopt;
}

auto ParseStreamShareStrategy(std::string_view text) -> Expected<StreamShareStrategy> {
    if (text == "share")
        return StreamShareStrategy::Share;
    if (text == "share_auto_connect")
        return StreamShareStrategy::ShareAutoConnect;
    if (text == "replay_latest")
        return StreamShareStrategy::ReplayLatest;
    if (text == "replay_latest_auto_connect")
        return StreamShareStrategy::ReplayLatestAutoConnect;
    if (text == "replay_buffer")
        return StreamShareStrategy::ReplayBuffer;
    if (text == "replay_buffer_auto_connect")
        return StreamShareStrategy::ReplayBufferAutoConnect;
    return std::unexpected(Error{Error::Code::InvalidConfiguration, "unknown stream share strategy '" + std::string{text} + "'"});
}

auto ParseStreamConnectMode(std::string_view text) -> Expected<StreamConnectMode> {
    if (text == "lazy")
        return StreamConnectMode::Lazy;
    if (text == "eager")
        return StreamConnectMode::Eager;
    return std::unexpected(Error{Error::Code::InvalidConfiguration, "unknown stream connect mode '" + std::string{text} + "'"});
}

auto toString(StreamShareStrategy strategy) -> std::string_view {
    switch (strategy) {
    case StreamShareStrategy::Share:
        return "share";
    case StreamShareStrategy::ShareAutoConnect:
        return "share_auto_connect";
    case StreamShareStrategy::ReplayLatest:
        return "replay_latest";
    case StreamShareStrategy::ReplayLatestAutoConnect:
        return "replay_latest_auto_connect";
    case StreamShareStrategy::ReplayBuffer:
        return "replay_buffer";
    case StreamShareStrategy::ReplayBufferAutoConnect:
        return "replay_buffer_auto_connect";
    }
    return "share";
}

auto toString(StreamConnectMode mode) -> std::string_view {
    return mode == StreamConnectMode::Eager ? "eager" : "lazy";
}

} // namespace HC

#pragma once

#include <heartcore/stream/SharedStream.hpp>
#include <heartcore/stream/Subscription.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace HC {

/**
 * Immutable state snapshots for a stateful renderer.
 *
 * Each publish replaces the whole snapshot, so render() can read the current snapshot without
 * locking while an upstream stream publishes the next one. follow() keeps exactly one live
 * subscription; following again or calling reset() disposes the previous one.
 */
template <typename State>
class StateHolder {
public:
    using Snapshot = std::shared_ptr<State const>;

    StateHolder() = default;
    ~StateHolder() { reset(); }

    StateHolder(StateHolder const&) = delete;
    auto operator=(StateHolder const&) -> StateHolder& = delete;

    void publish(State state) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        snapshot_.store(std::make_shared<State const>(std::move(state)));
    }

    // Copy-on-write update of the current snapshot; a default State seeds an empty holder.
    template <typename Fn>
    void update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = snapshot_.load();
        State next = current ? *current : State{};
        fn(next);
        snapshot_.store(std::make_shared<State const>(std::move(next)));
    }

    [[nodiscard]] auto snapshot() const -> Snapshot { return snapshot_.load(); }
    [[nodiscard]] auto has_state() const -> bool { return static_cast<bool>(snapshot_.load()); }

    [[nodiscard]] auto require(std::string const& owner) const -> Snapshot {
        auto current = snapshot_.load();
        if (!current) {
            throw std::logic_error(owner + " rendered before initialize()");
        }
        return current;
    }

    /**
     * Subscribes to stream; every value is folded into the snapshot with
     * reducer(previous snapshot or null, value). A replaying stream delivers its first value
     * during this call, which then becomes the initial snapshot.
     */
    template <typename T, typename Reducer>
    void follow(std::shared_ptr<SharedStream<T>> const& stream, Reducer reducer) {
        if (!stream) {
            throw std::invalid_argument("StateHolder::follow requires a stream");
        }
        std::lock_guard<std::mutex> follow_lock(follow_mutex_);
        subscription_.dispose();
        subscription_ = stream->subscribe([this, reducer = std::move(reducer)](T const& value) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            State next = reducer(snapshot_.load(), value);
            snapshot_.store(std::make_shared<State const>(std::move(next)));
        });
    }

    [[nodiscard]] auto is_following() const -> bool {
        std::lock_guard<std::mutex> lock(follow_mutex_);
        return subscription_.active();
    }

    // Disposes the subscription and clears the snapshot.
    void reset() {
        {
            std::lock_guard<std::mutex> lock(follow_mutex_);
            subscription_.dispose();
        }
        std::lock_guard<std::mutex> lock(write_mutex_);
        snapshot_.store(nullptr);
    }

private:
    std::atomic<Snapshot> snapshot_{};
    std::mutex write_mutex_;
    mutable std::mutex follow_mutex_;
    Subscription subscription_;
};

} // namespace HC

#pragma once
#include <heartcore/core/Clock.hpp>
#include <heartcore/stream/Coalesce.hpp>
#include <heartcore/stream/StreamLog.hpp>
#include <heartcore/stream/StreamShareSettings.hpp>
#include <heartcore/stream/StreamSource.hpp>
#include <heartcore/stream/Subscription.hpp>
#include <heartcore/task/Scheduler.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace HC {

template <typename T>
struct StreamObserver {
    std::function<void(T const&)> on_next;
    std::function<void()>         on_completed;
};

/**
 * Multiplexes one underlying source to many subscribers.
 *
 * The replay policy (none, latest value, last n values, optionally bounded by age) decides what
 * a late subscriber receives. The connect lifecycle decides when the source runs:
 * ref-counted strategies connect once refcount_min_subscribers are attached and disconnect
 * when the count drops below it (after refcount_grace_ms when positive); auto-connect
 * strategies connect once auto_connect_min_subscribers are attached and stay connected until
 * the stream is closed. Closing disconnects the source and completes every subscriber.
 * A positive coalesce_window_ms collapses source bursts to their latest value (CoalesceLatest).
 */
template <typename T>
class SharedStream : public std::enable_shared_from_this<SharedStream<T>> {
    struct Private {};

public:
    using Observer = StreamObserver<T>;

    SharedStream(Private, std::string name, StreamSource<T> source, StreamShareSettings settings, Scheduler& scheduler, Clock const& clock)
        : name_(std::move(name)), source_(std::move(source)), settings_(settings), scheduler_(scheduler), clock_(clock) {}

    ~SharedStream() {
        std::function<void()> disconnect;
        {
            std::lock_guard<std::mutex> lock(this->stateMutex_);
            this->cancelGraceLocked();
            if (this->connected_)
                disconnect = this->takeDisconnectLocked();
        }
        if (disconnect)
            disconnect();
    }

    SharedStream(SharedStream const&)                    = delete;
    auto operator=(SharedStream const&) -> SharedStream& = delete;

    static auto Create(std::string name,
                       StreamSource<T> source,
                       StreamShareSettings settings,
                       Scheduler& scheduler,
                       Clock const& clock = SteadyClock::Instance()) -> std::shared_ptr<SharedStream> {
        if (!source)
            throw std::invalid_argument("SharedStream '" + name + "' requires a source");
        if (auto error = ValidateStreamShareSettings(settings))
            throw std::invalid_argument("SharedStream '" + name + "': " + describeError(*error));
        if (settings.coalesce_window_ms > 0)
            source = CoalesceLatest(std::move(source), std::chrono::milliseconds(settings.coalesce_window_ms), scheduler, clock, name);
        return std::make_shared<SharedStream>(Private{}, std::move(name), std::move(source), settings, scheduler, clock);
    }

    auto subscribe(Observer observer) -> Subscription;
    auto subscribe(std::function<void(T const&)> onNext) -> Subscription {
        return this->subscribe(Observer{.on_next = std::move(onNext), .on_completed = {}});
    }

    auto close() -> void;

    auto name() const -> std::string const& { return this->name_; }
    auto settings() const -> StreamShareSettings const& { return this->settings_; }
    auto isConnected() const -> bool;
    auto isClosed() const -> bool;
    auto subscriberCount() const -> std::size_t;
    auto connectCount() const -> std::uint64_t;
    auto disconnectCount() const -> std::uint64_t;
    auto latest() const -> std::optional<T>;

private:
    struct Entry {
        Clock::TimePoint at;
        T                value;
    };

    using ObserverPtr = std::shared_ptr<Observer>;

    auto unsubscribe(std::uint64_t id) -> void;
    auto connect() -> void;
    auto emit(std::uint64_t generation, T const& value) -> void;
    auto completeFromSource(std::uint64_t generation) -> void;
    auto finish(std::optional<std::uint64_t> generation) -> void;
    auto onGraceExpired(std::uint64_t token) -> void;

    auto shouldConnectLocked() -> bool;
    // Disconnects, or arms the grace timer, when a ref-counted stream fell below its minimum.
    auto releaseIfUnderusedLocked() -> std::function<void()>;
    auto takeDisconnectLocked() -> std::function<void()>;
    auto cancelGraceLocked() -> void;
    auto replayValuesLocked() const -> std::vector<T>;
    auto trimReplayLocked() -> void;
    auto snapshotObserversLocked() const -> std::vector<ObserverPtr>;

    std::string const         name_;
    StreamSource<T> const     source_;
    StreamShareSettings const settings_;
    Scheduler&                scheduler_;
    Clock const&              clock_;

    mutable std::mutex           stateMutex_;
    // Serializes value delivery against subscriber attachment so replay and live values never
    // interleave out of order for one subscriber.
    mutable std::recursive_mutex deliveryMutex_;

    std::map<std::uint64_t, ObserverPtr> observers_;
    std::uint64_t                        nextObserverId_{1};
    std::size_t                          subscriberCount_{0};
    std::deque<Entry>                    replay_;
    bool                                 connected_{false};
    bool                                 connecting_{false};
    bool                                 everConnected_{false};
    bool                                 closed_{false};
    std::uint64_t                        generation_{0};
    std::function<void()>                disconnect_;
    std::optional<TimerId>               graceTimer_;
    std::uint64_t                        graceToken_{0};
    std::uint64_t                        connects_{0};
    std::uint64_t                        disconnects_{0};
};

template <typename T>
auto SharedStream<T>::subscribe(Observer observer) -> Subscription {
    auto observerPtr = std::make_shared<Observer>(std::move(observer));

    bool connectFirst = false;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        if (!this->closed_) {
            ++this->subscriberCount_;
            this->cancelGraceLocked();
            if (!this->settings_.isAutoConnect() && this->settings_.connect_mode == StreamConnectMode::Eager)
                connectFirst = this->shouldConnectLocked();
        }
    }
    if (connectFirst)
        this->connect();

    std::uint64_t id       = 0;
    bool          isClosed = false;
    {
        std::lock_guard<std::recursive_mutex> delivery(this->deliveryMutex_);
        std::vector<T>                        replay;
        {
            std::lock_guard<std::mutex> lock(this->stateMutex_);
            isClosed = this->closed_;
            replay   = this->replayValuesLocked();
            if (!isClosed) {
                id = this->nextObserverId_++;
                this->observers_.emplace(id, observerPtr);
            }
        }
        if (observerPtr->on_next) {
            for (auto const& value : replay)
                observerPtr->on_next(value);
        }
    }

    if (isClosed) {
        if (observerPtr->on_completed)
            observerPtr->on_completed();
        return Subscription{};
    }

    bool connectAfter = false;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        connectAfter = this->shouldConnectLocked();
    }
    if (connectAfter)
        this->connect();

    std::weak_ptr<SharedStream> weak = this->weak_from_this();
    return Subscription{[weak, id] {
        if (auto self = weak.lock())
            self->unsubscribe(id);
    }};
}

template <typename T>
auto SharedStream<T>::close() -> void {
    this->finish(std::nullopt);
}

template <typename T>
auto SharedStream<T>::isConnected() const -> bool {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->connected_;
}

template <typename T>
auto SharedStream<T>::isClosed() const -> bool {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->closed_;
}

template <typename T>
auto SharedStream<T>::subscriberCount() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->subscriberCount_;
}

template <typename T>
auto SharedStream<T>::connectCount() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->connects_;
}

template <typename T>
auto SharedStream<T>::disconnectCount() const -> std::uint64_t {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    return this->disconnects_;
}

template <typename T>
auto SharedStream<T>::latest() const -> std::optional<T> {
    std::lock_guard<std::mutex> lock(this->stateMutex_);
    auto                        values = this->replayValuesLocked();
    if (values.empty())
        return std::nullopt;
    return values.back();
}

template <typename T>
auto SharedStream<T>::unsubscribe(std::uint64_t id) -> void {
    std::function<void()> disconnect;
    {
        std::lock_guard<std::recursive_mutex> delivery(this->deliveryMutex_);
        std::lock_guard<std::mutex>           lock(this->stateMutex_);
        if (this->observers_.erase(id) == 0)
            return;
        --this->subscriberCount_;
        // A connect in flight re-checks the count once the source is running.
        disconnect = this->releaseIfUnderusedLocked();
    }
    if (disconnect)
        disconnect();
}

template <typename T>
auto SharedStream<T>::releaseIfUnderusedLocked() -> std::function<void()> {
    auto const minimum = static_cast<std::size_t>(this->settings_.refcount_min_subscribers);
    if (this->settings_.isAutoConnect() || this->closed_ || !this->connected_ || this->subscriberCount_ >= minimum)
        return nullptr;

    if (this->settings_.refcount_grace_ms <= 0)
        return this->takeDisconnectLocked();

    this->cancelGraceLocked();
    auto const token = ++this->graceToken_;
    std::weak_ptr<SharedStream> weak = this->weak_from_this();
    this->graceTimer_ = this->scheduler_.scheduleAfter(std::chrono::milliseconds(this->settings_.refcount_grace_ms), [weak, token] {
        if (auto self = weak.lock())
            self->onGraceExpired(token);
    });
    detail::logStreamTransition(this->name_, "grace disconnect scheduled");
    return nullptr;
}

template <typename T>
auto SharedStream<T>::connect() -> void {
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        generation           = ++this->generation_;
        this->connected_     = true;
        this->connecting_    = false;
        this->everConnected_ = true;
        ++this->connects_;
    }
    detail::logStreamTransition(this->name_, "connect");

    std::weak_ptr<SharedStream> weak = this->weak_from_this();
    StreamEmitter<T>            emitter;
    emitter.next = [weak, generation](T const& value) {
        if (auto self = weak.lock())
            self->emit(generation, value);
    };
    emitter.complete = [weak, generation] {
        if (auto self = weak.lock())
            self->completeFromSource(generation);
    };

    std::function<void()> disconnect;
    try {
        disconnect = this->source_(std::move(emitter));
    } catch (...) {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        if (this->generation_ == generation) {
            this->connected_ = false;
            ++this->generation_;
        }
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        if (this->generation_ == generation && this->connected_) {
            this->disconnect_ = std::move(disconnect);
            // Subscribers may have left between the connect decision and now.
            disconnect = this->releaseIfUnderusedLocked();
        }
    }
    // Disconnected or closed while the source was starting: stop it right away.
    if (disconnect)
        disconnect();
}

template <typename T>
auto SharedStream<T>::emit(std::uint64_t generation, T const& value) -> void {
    std::lock_guard<std::recursive_mutex> delivery(this->deliveryMutex_);
    std::vector<ObserverPtr>              targets;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        if (generation != this->generation_ || !this->connected_ || this->closed_)
            return;
        auto const capacity = this->settings_.replayCapacity();
        if (capacity > 0) {
            this->replay_.push_back(Entry{this->clock_.now(), value});
            while (this->replay_.size() > capacity)
                this->replay_.pop_front();
            this->trimReplayLocked();
        }
        targets = this->snapshotObserversLocked();
    }
    for (auto const& observer : targets) {
        if (observer->on_next)
            observer->on_next(value);
    }
}

template <typename T>
auto SharedStream<T>::completeFromSource(std::uint64_t generation) -> void {
    this->finish(generation);
}

template <typename T>
auto SharedStream<T>::finish(std::optional<std::uint64_t> generation) -> void {
    std::function<void()>    disconnect;
    std::vector<ObserverPtr> targets;
    {
        std::lock_guard<std::recursive_mutex> delivery(this->deliveryMutex_);
        std::lock_guard<std::mutex>           lock(this->stateMutex_);
        if (this->closed_ || (generation && *generation != this->generation_))
            return;
        this->closed_ = true;
        this->cancelGraceLocked();
        if (this->connected_)
            disconnect = this->takeDisconnectLocked();
        targets = this->snapshotObserversLocked();
        this->observers_.clear();
        this->subscriberCount_ = 0;
    }
    detail::logStreamTransition(this->name_, "closed");
    if (disconnect)
        disconnect();
    for (auto const& observer : targets) {
        if (observer->on_completed)
            observer->on_completed();
    }
}

template <typename T>
auto SharedStream<T>::onGraceExpired(std::uint64_t token) -> void {
    std::function<void()> disconnect;
    {
        std::lock_guard<std::mutex> lock(this->stateMutex_);
        if (token != this->graceToken_ || !this->graceTimer_)
            return;
        this->graceTimer_.reset();
        auto const minimum = static_cast<std::size_t>(this->settings_.refcount_min_subscribers);
        if (this->closed_ || !this->connected_ || this->subscriberCount_ >= minimum)
            return;
        disconnect = this->takeDisconnectLocked();
    }
    if (disconnect)
        disconnect();
}

template <typename T>
auto SharedStream<T>::shouldConnectLocked() -> bool {
    if (this->closed_ || this->connected_ || this->connecting_)
        return false;
    std::size_t threshold = 0;
    if (this->settings_.isAutoConnect()) {
        if (this->everConnected_)
            return false;
        threshold = static_cast<std::size_t>(this->settings_.auto_connect_min_subscribers);
    } else {
        threshold = static_cast<std::size_t>(this->settings_.refcount_min_subscribers);
    }
    if (this->subscriberCount_ < threshold)
        return false;
    this->connecting_ = true;
    return true;
}

template <typename T>
auto SharedStream<T>::takeDisconnectLocked() -> std::function<void()> {
    this->connected_  = false;
    this->connecting_ = false;
    ++this->generation_;
    ++this->disconnects_;
    detail::logStreamTransition(this->name_, "disconnect");
    auto disconnect = std::exchange(this->disconnect_, nullptr);
    if (!disconnect)
        disconnect = [] {};
    return disconnect;
}

template <typename T>
auto SharedStream<T>::cancelGraceLocked() -> void {
    if (!this->graceTimer_)
        return;
    this->scheduler_.cancel(*this->graceTimer_);
    this->graceTimer_.reset();
    ++this->graceToken_;
}

template <typename T>
auto SharedStream<T>::trimReplayLocked() -> void {
    if (!this->settings_.replay_window_ms)
        return;
    auto const cutoff = this->clock_.now() - std::chrono::milliseconds(*this->settings_.replay_window_ms);
    while (!this->replay_.empty() && this->replay_.front().at < cutoff)
        this->replay_.pop_front();
}

template <typename T>
auto SharedStream<T>::replayValuesLocked() const -> std::vector<T> {
    std::optional<Clock::TimePoint> cutoff;
    if (this->settings_.replay_window_ms)
        cutoff = this->clock_.now() - std::chrono::milliseconds(*this->settings_.replay_window_ms);
    std::vector<T> values;
    values.reserve(this->replay_.size());
    for (auto const& entry : this->replay_) {
        if (!cutoff || entry.at >= *cutoff)
            values.push_back(entry.value);
    }
    return values;
}

template <typename T>
auto SharedStream<T>::snapshotObserversLocked() const -> std::vector<ObserverPtr> {
    std::vector<ObserverPtr> targets;
    targets.reserve(this->observers_.size());
    for (auto const& [_, observer] : this->observers_)
        targets.push_back(observer);
    return targets;
}

} // namespace HC

#pragma once
#include <functional>

namespace HC {

/**
 * Move-only handle to one live subscription. Disposing (explicitly or on destruction)
 * detaches the subscriber; disposing twice is a no-op.
 */
class Subscription {
public:
    using Disposer = std::function<void()>;

    Subscription() = default;
    explicit Subscription(Disposer disposer);
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    auto operator=(Subscription&& other) noexcept -> Subscription&;

    Subscription(Subscription const&)                    = delete;
    auto operator=(Subscription const&) -> Subscription& = delete;

    auto dispose() -> void;
    auto active() const -> bool;
    explicit operator bool() const { return this->active(); }

private:
    Disposer disposer_;
};

} // namespace HC

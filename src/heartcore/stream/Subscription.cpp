#include <heartcore/stream/Subscription.hpp>

#include <utility>

namespace HC {

Subscription::Subscription(Disposer disposer)
    : disposer_(std::move(disposer)) {}

Subscription::~Subscription() {
    this->dispose();
}

Subscription::Subscription(Subscription&& other) noexcept
    : disposer_(std::exchange(other.disposer_, nullptr)) {}

auto Subscription::operator=(Subscription&& other) noexcept -> Subscription& {
    if (this != &other) {
        this->dispose();
        this->disposer_ = std::exchange(other.disposer_, nullptr);
    }
    return *this;
}

auto Subscription::dispose() -> void {
    auto disposer = std::exchange(this->disposer_, nullptr);
    if (disposer)
        disposer();
}

auto Subscription::active() const -> bool {
    return static_cast<bool>(this->disposer_);
}

} // namespace HC

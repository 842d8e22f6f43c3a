#include <heartcore/render/RendererTimingTracker.hpp>

#include <cmath>
#include <mutex>
#include <stdexcept>

namespace HC {

RendererTimingTracker::RendererTimingTracker(RendererTimingStrategy strategy, double ema_alpha)
    : strategy_(strategy), ema_alpha_(ema_alpha) {
    if (!std::isfinite(ema_alpha) || ema_alpha <= 0.0 || ema_alpha > 1.0) {
        throw std::invalid_argument("renderer timing EMA alpha must be in (0, 1]");
    }
}

auto RendererTimingTracker::record(std::string const& name, double duration_ms) -> std::optional<Error> {
    if (!std::isfinite(duration_ms) || duration_ms < 0.0) {
        return Error{Error::Code::InvalidArgument, "render duration for '" + name + "' must be finite and non-negative"};
    }
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& stats = stats_[name];
        stats.sample_count += 1;
        if (stats.sample_count == 1) {
            stats.average_ms = duration_ms;
        } else if (strategy_ == RendererTimingStrategy::Ema) {
            stats.average_ms += ema_alpha_ * (duration_ms - stats.average_ms);
        } else {
            stats.average_ms += (duration_ms - stats.average_ms) / static_cast<double>(stats.sample_count);
        }
        stats.last_ms = duration_ms;
    }
    version_.fetch_add(1, std::memory_order_acq_rel);
    return std::nullopt;
}

auto RendererTimingTracker::estimate_total(RendererList const& renderers) const -> TimingEstimate {
    TimingEstimate estimate;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto const& renderer : renderers) {
        if (!renderer) {
            continue;
        }
        auto it = stats_.find(renderer->name());
        if (it == stats_.end()) {
            estimate.unestimated += 1;
            continue;
        }
        estimate.total_ms += it->second.average_ms;
        estimate.has_samples = true;
    }
    return estimate;
}

auto RendererTimingTracker::snapshot(RendererList const& renderers) const -> TimingSnapshotSet {
    TimingSnapshotSet result;
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto const& renderer : renderers) {
        if (!renderer) {
            continue;
        }
        auto name = renderer->name();
        auto it = stats_.find(name);
        if (it == stats_.end()) {
            result.missing.push_back(std::move(name));
            continue;
        }
        result.snapshots.push_back(RendererTimingSnapshot{
            .name = std::move(name),
            .average_ms = it->second.average_ms,
            .last_ms = it->second.last_ms,
            .sample_count = it->second.sample_count,
        });
    }
    return result;
}

auto RendererTimingTracker::get(std::string const& name) const -> std::optional<RendererTimingSnapshot> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = stats_.find(name);
    if (it == stats_.end()) {
        return std::nullopt;
    }
    return RendererTimingSnapshot{
        .name = name,
        .average_ms = it->second.average_ms,
        .last_ms = it->second.last_ms,
        .sample_count = it->second.sample_count,
    };
}

void RendererTimingTracker::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        stats_.clear();
    }
    version_.fetch_add(1, std::memory_order_acq_rel);
}

} // namespace HC

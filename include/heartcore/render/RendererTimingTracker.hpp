#pragma once

#include <heartcore/core/Error.hpp>
#include <heartcore/render/RenderStrategies.hpp>
#include <heartcore/render/Renderer.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace HC {

struct RendererTimingSnapshot {
    std::string name;
    double average_ms = 0.0;
    double last_ms = 0.0;
    std::uint64_t sample_count = 0;
};

struct TimingEstimate {
    double total_ms = 0.0;
    bool has_samples = false;    // at least one renderer has been measured
    std::size_t unestimated = 0; // renderers without samples; they contribute 0 ms
};

struct TimingSnapshotSet {
    std::vector<RendererTimingSnapshot> snapshots;
    std::vector<std::string> missing;
};

/**
 * Per-renderer render cost, keyed by renderer name.
 *
 * The first sample seeds the average; later samples update either an exponential moving
 * average or the cumulative mean. version() increases on every record so caches can detect a
 * changed cost model without comparing averages.
 */
class RendererTimingTracker {
public:
    explicit RendererTimingTracker(RendererTimingStrategy strategy = RendererTimingStrategy::Ema, double ema_alpha = 0.2);

    auto record(std::string const& name, double duration_ms) -> std::optional<Error>;

    [[nodiscard]] auto estimate_total(RendererList const& renderers) const -> TimingEstimate;
    [[nodiscard]] auto snapshot(RendererList const& renderers) const -> TimingSnapshotSet;
    [[nodiscard]] auto get(std::string const& name) const -> std::optional<RendererTimingSnapshot>;
    [[nodiscard]] auto version() const -> std::uint64_t { return version_.load(std::memory_order_acquire); }

    [[nodiscard]] auto strategy() const -> RendererTimingStrategy { return strategy_; }
    [[nodiscard]] auto ema_alpha() const -> double { return ema_alpha_; }

    void clear();

private:
    struct Stats {
        double average_ms = 0.0;
        double last_ms = 0.0;
        std::uint64_t sample_count = 0;
    };

    RendererTimingStrategy const strategy_;
    double const ema_alpha_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Stats> stats_;
    std::atomic<std::uint64_t> version_{0};
};

} // namespace HC

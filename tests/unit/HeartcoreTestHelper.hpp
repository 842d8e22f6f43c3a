#pragma once

#include <heartcore/core/Clock.hpp>
#include <heartcore/render/RenderPlan.hpp>
#include <heartcore/render/Renderer.hpp>
#include <heartcore/task/Scheduler.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace HC::Test {

// Sets or unsets one environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(std::string key, const char* value) : key(std::move(key)) {
        if (const char* existing = std::getenv(this->key.c_str()))
            original = std::string(existing);
        if (value)
            setenv(this->key.c_str(), value, 1);
        else
            unsetenv(this->key.c_str());
    }

    EnvGuard(EnvGuard const&)            = delete;
    EnvGuard& operator=(EnvGuard const&) = delete;

    ~EnvGuard() {
        if (original)
            setenv(key.c_str(), original->c_str(), 1);
        else
            unsetenv(key.c_str());
    }

private:
    std::string                key;
    std::optional<std::string> original;
};

// Time only moves when a test advances it or something sleeps on it.
class ManualClock final : public Clock {
public:
    auto now() const -> TimePoint override {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    }

    auto sleepFor(Duration duration) -> void override {
        std::lock_guard<std::mutex> lock(mutex);
        sleeps.push_back(toMilliseconds(duration));
        current += duration;
    }

    auto advance(Duration duration) -> void {
        std::lock_guard<std::mutex> lock(mutex);
        current += duration;
    }

    auto sleptMs() const -> std::vector<double> {
        std::lock_guard<std::mutex> lock(mutex);
        return sleeps;
    }

private:
    mutable std::mutex  mutex;
    TimePoint           current{std::chrono::seconds(1000)};
    std::vector<double> sleeps;
};

// Timers fire only from advance(), on the calling thread.
class ManualScheduler final : public Scheduler {
public:
    auto scheduleAfter(std::chrono::milliseconds delay, Callback callback) -> TimerId override {
        std::lock_guard<std::mutex> lock(mutex);
        auto const id = nextId++;
        timers.emplace(id, Timer{elapsed + delay, std::move(callback)});
        return id;
    }

    auto cancel(TimerId id) -> bool override {
        std::lock_guard<std::mutex> lock(mutex);
        return timers.erase(id) > 0;
    }

    auto advance(std::chrono::milliseconds delta) -> void {
        std::vector<Callback> due;
        {
            std::lock_guard<std::mutex> lock(mutex);
            elapsed += delta;
            for (auto it = timers.begin(); it != timers.end();) {
                if (it->second.deadline <= elapsed) {
                    due.push_back(std::move(it->second.callback));
                    it = timers.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& callback : due)
            callback();
    }

    auto pending() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex);
        return timers.size();
    }

private:
    struct Timer {
        std::chrono::milliseconds deadline;
        Callback                  callback;
    };

    mutable std::mutex        mutex;
    std::map<TimerId, Timer>  timers;
    TimerId                   nextId{1};
    std::chrono::milliseconds elapsed{0};
};

// Resolves every plan to a fixed variant and counts how often it was asked.
class CountingPlanner final : public Planner {
public:
    explicit CountingPlanner(Clock const& clock, RendererVariant variant = RendererVariant::Iterative)
        : clock(clock), variant(variant) {}

    auto plan(RendererList const&, RendererVariant, std::optional<RendererVariant>, RenderPlanSignature const& signature) -> RenderPlanPtr override {
        ++calls;
        auto plan             = std::make_shared<RenderPlan>();
        plan->variant         = variant;
        plan->generated_at    = clock.now();
        plan->input_signature = signature;
        return plan;
    }

    auto timing_version() const -> std::uint64_t override { return version.load(); }

    Clock const&               clock;
    RendererVariant            variant;
    std::atomic<int>           calls{0};
    std::atomic<std::uint64_t> version{0};
};

// Paints a color over a rectangle of its surface and counts its calls.
class PatchRenderer : public Renderer {
public:
    PatchRenderer(std::string name, Color color, SurfaceRect patch, DisplayMode mode = DisplayMode::Full)
        : name_(std::move(name)), color(color), patch(patch), mode(mode) {}

    auto name() const -> std::string override { return name_; }
    auto display_mode() const -> DisplayMode override { return mode; }

    void initialize(RendererContext const&) override {
        ++initializations;
        initialized = true;
    }

    void render(Surface& surface, Orientation const&) override {
        if (!initialized)
            throw std::logic_error(name_ + " rendered before initialize()");
        ++renders;
        surface.fill_rect(patch, color);
    }

    void reset() override { initialized = false; }
    auto is_initialized() const -> bool override { return initialized.load(); }

    std::atomic<int> initializations{0};
    std::atomic<int> renders{0};

private:
    std::string const name_;
    Color const       color;
    SurfaceRect const patch;
    DisplayMode const mode;
    std::atomic<bool> initialized{false};
};

class ThrowingRenderer final : public Renderer {
public:
    explicit ThrowingRenderer(std::string name = "faulty") : name_(std::move(name)) {}

    auto name() const -> std::string override { return name_; }
    auto display_mode() const -> DisplayMode override { return DisplayMode::Full; }
    void initialize(RendererContext const&) override { initialized = true; }
    void render(Surface&, Orientation const&) override { throw std::runtime_error(name_ + " lost its device"); }
    void reset() override { initialized = false; }
    auto is_initialized() const -> bool override { return initialized.load(); }

private:
    std::string const name_;
    std::atomic<bool> initialized{false};
};

inline constexpr Color Red{255, 0, 0, 255};
inline constexpr Color Green{0, 255, 0, 255};
inline constexpr Color Blue{0, 0, 255, 255};
inline constexpr Color White{255, 255, 255, 255};
inline constexpr Color Clear{0, 0, 0, 0};

} // namespace HC::Test

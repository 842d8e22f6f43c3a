#pragma once
#include <heartcore/core/Clock.hpp>
#include <heartcore/stream/StreamLog.hpp>
#include <heartcore/stream/StreamSource.hpp>
#include <heartcore/task/Scheduler.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace HC {

/**
 * Wraps source so that bursts collapse to their latest value.
 *
 * The first value of a burst arms a timer of length window; whatever value is pending when it
 * fires is emitted. A value arriving after the window already elapsed (the timer is late) first
 * emits the pending value, so nothing older than one window is held back. Completion emits the
 * pending value before completing. Stopping the wrapped source drops the pending value.
 * A window of zero or less returns source unchanged.
 */
template <typename T>
auto CoalesceLatest(StreamSource<T> source,
                    std::chrono::milliseconds window,
                    Scheduler& scheduler,
                    Clock const& clock,
                    std::string name) -> StreamSource<T> {
    if (window <= std::chrono::milliseconds::zero())
        return source;

    struct State {
        std::mutex                      mutex;
        StreamEmitter<T>                downstream;
        std::optional<T>                pending;
        std::optional<TimerId>          timer;
        std::optional<Clock::TimePoint> due;
        bool                            active = true;
    };

    return [source = std::move(source), window, &scheduler, &clock, name = std::move(name)](StreamEmitter<T> downstream) {
        auto state        = std::make_shared<State>();
        state->downstream = std::move(downstream);

        auto flush = [state]() {
            std::optional<T> value;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (!state->active)
                    return;
                value.swap(state->pending);
                state->timer.reset();
                state->due.reset();
            }
            if (value)
                state->downstream.next(*value);
        };

        StreamEmitter<T> upstream{
                .next =
                        [state, flush, window, &scheduler, &clock](T const& value) {
                            auto             now = clock.now();
                            std::optional<T> overdue;
                            {
                                std::lock_guard<std::mutex> lock(state->mutex);
                                if (!state->active)
                                    return;
                                if (state->pending && state->due && now >= *state->due) {
                                    overdue.swap(state->pending);
                                    if (state->timer)
                                        scheduler.cancel(*state->timer);
                                    state->timer.reset();
                                    state->due.reset();
                                }
                                state->pending = value;
                                if (!state->timer) {
                                    state->due   = now + window;
                                    state->timer = scheduler.scheduleAfter(window, flush);
                                }
                            }
                            if (overdue)
                                state->downstream.next(*overdue);
                        },
                .complete =
                        [state, flush, &scheduler]() {
                            {
                                std::lock_guard<std::mutex> lock(state->mutex);
                                if (!state->active)
                                    return;
                                if (state->timer)
                                    scheduler.cancel(*state->timer);
                                state->timer.reset();
                                state->due.reset();
                            }
                            flush();
                            state->downstream.complete();
                        },
        };

        detail::logStreamTransition(name, "coalescing every " + std::to_string(window.count()) + " ms");
        auto stop = source(std::move(upstream));
        return std::function<void()>{[state, stop = std::move(stop), &scheduler]() {
            if (stop)
                stop();
            std::lock_guard<std::mutex> lock(state->mutex);
            state->active = false;
            state->pending.reset();
            state->due.reset();
            if (state->timer) {
                scheduler.cancel(*state->timer);
                state->timer.reset();
            }
        }};
    };
}

} // namespace HC

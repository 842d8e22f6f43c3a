#include <heartcore/stream/IntervalSource.hpp>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace HC {

auto MakeIntervalSource(std::chrono::milliseconds period) -> StreamSource<std::uint64_t> {
    if (period <= std::chrono::milliseconds::zero())
        throw std::invalid_argument("interval source period must be positive");

    return [period](StreamEmitter<std::uint64_t> emitter) -> std::function<void()> {
        auto ticker = std::make_shared<std::jthread>([period, emitter = std::move(emitter)](std::stop_token stop) {
            std::mutex                   mutex;
            std::condition_variable_any  wake;
            std::uint64_t                tick = 0;
            auto                         next = std::chrono::steady_clock::now() + period;
            std::unique_lock<std::mutex> lock(mutex);
            while (!stop.stop_requested()) {
                if (wake.wait_until(lock, stop, next, [] { return false; }))
                    break;
                if (stop.stop_requested())
                    break;
                lock.unlock();
                emitter.next(tick++);
                lock.lock();
                next += period;
            }
        });
        return [ticker] {
            ticker->request_stop();
            // A subscriber may drop the last reference from inside a tick.
            if (ticker->get_id() == std::this_thread::get_id())
                ticker->detach();
            else if (ticker->joinable())
                ticker->join();
        };
    };
}

} // namespace HC

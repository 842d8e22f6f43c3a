#pragma once
#include <heartcore/stream/SharedStream.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace HC {

/**
 * Push-driven source. Values published while no SharedStream is connected are dropped, so the
 * producer does no work that nobody observes.
 */
template <typename T>
class StreamSubject {
public:
    StreamSubject()
        : state_(std::make_shared<State>()) {}

    auto publish(T const& value) -> void {
        for (auto const& emitter : this->state_->snapshot()) {
            emitter->next(value);
        }
    }

    auto complete() -> void {
        for (auto const& emitter : this->state_->snapshot()) {
            emitter->complete();
        }
    }

    auto connectedCount() const -> std::size_t {
        std::lock_guard<std::mutex> lock(this->state_->mutex);
        return this->state_->emitters.size();
    }

    // The returned source keeps the subject state alive on its own.
    auto source() const -> StreamSource<T> {
        std::shared_ptr<State> state = this->state_;
        return [state](StreamEmitter<T> emitter) -> std::function<void()> {
            std::uint64_t id = 0;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                id = state->nextId++;
                state->emitters.emplace(id, std::make_shared<StreamEmitter<T>>(std::move(emitter)));
            }
            return [state, id] {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->emitters.erase(id);
            };
        };
    }

private:
    struct State {
        mutable std::mutex                                         mutex;
        std::map<std::uint64_t, std::shared_ptr<StreamEmitter<T>>> emitters;
        std::uint64_t                                              nextId{1};

        auto snapshot() const -> std::vector<std::shared_ptr<StreamEmitter<T>>> {
            std::lock_guard<std::mutex>                    lock(this->mutex);
            std::vector<std::shared_ptr<StreamEmitter<T>>> out;
            out.reserve(this->emitters.size());
            for (auto const& [_, emitter] : this->emitters)
                out.push_back(emitter);
            return out;
        }
    };

    std::shared_ptr<State> state_;
};

} // namespace HC

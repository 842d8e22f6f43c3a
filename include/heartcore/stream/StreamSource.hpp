#pragma once
#include <functional>

namespace HC {

// Handed to a source when the stream connects. Both callbacks may be called from any thread.
template <typename T>
struct StreamEmitter {
    std::function<void(T const&)> next;
    std::function<void()>         complete;
};

// Starts the underlying work and returns the function that stops it.
template <typename T>
using StreamSource = std::function<std::function<void()>(StreamEmitter<T> emitter)>;

} // namespace HC

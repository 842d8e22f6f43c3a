#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace HC {

struct Error {
    enum class Code {
        UnknownError = 0,
        InvalidConfiguration,
        InvalidArgument,
        NotInitialized,
        NotFound,
        AlreadyExists,
        SizeMismatch,
        HandlerFailed,
        RendererFailed,
        TaskFailed,
        ShuttingDown,
        Closed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}
    explicit Error(Code c)
        : code(c) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidConfiguration:
        return "invalid_configuration";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::NotInitialized:
        return "not_initialized";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::AlreadyExists:
        return "already_exists";
    case Error::Code::SizeMismatch:
        return "size_mismatch";
    case Error::Code::HandlerFailed:
        return "handler_failed";
    case Error::Code::RendererFailed:
        return "renderer_failed";
    case Error::Code::TaskFailed:
        return "task_failed";
    case Error::Code::ShuttingDown:
        return "shutting_down";
    case Error::Code::Closed:
        return "closed";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    std::string description{errorCodeToString(error.code)};
    if (error.message && !error.message->empty()) {
        description.append(": ");
        description.append(*error.message);
    }
    return description;
}

} // namespace HC

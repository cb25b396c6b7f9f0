#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace MS {

struct Error {
    enum class Code {
        UnknownError = 0,
        Destroyed,
        NoTarget,
        Rejected,
        Superseded,
        Aborted,
        HandlerError,
        Timeout,
        NoSuchRequest,
        TypeMismatch
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::Destroyed:
        return "destroyed";
    case Error::Code::NoTarget:
        return "no_target";
    case Error::Code::Rejected:
        return "rejected";
    case Error::Code::Superseded:
        return "superseded";
    case Error::Code::Aborted:
        return "aborted";
    case Error::Code::HandlerError:
        return "handler_error";
    case Error::Code::Timeout:
        return "timeout";
    case Error::Code::NoSuchRequest:
        return "no_such_request";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

// Superseded and Aborted are both cancellations: the task lost its slot rather than failing.
[[nodiscard]] inline auto isCancellation(Error const& error) -> bool {
    return error.code == Error::Code::Superseded || error.code == Error::Code::Aborted;
}

} // namespace MS

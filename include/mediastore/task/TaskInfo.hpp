#pragma once
#include <mediastore/core/Error.hpp>
#include <mediastore/core/Value.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace MS {

enum class TaskStatus {
    Idle,
    Pending,
    Success,
    Error
};

enum class TaskMode {
    Exclusive, // a new task cancels every live task under its key
    Shared     // runs alongside live tasks under its key
};

enum class TaskOutcome {
    Success,
    Error,
    Cancelled
};

[[nodiscard]] auto taskStatusToString(TaskStatus status) -> std::string_view;
[[nodiscard]] auto taskModeToString(TaskMode mode) -> std::string_view;
[[nodiscard]] auto taskOutcomeToString(TaskOutcome outcome) -> std::string_view;

/**
 * RequestMeta: optional provenance attached to a request call.
 * Handlers receive it through their context and task records keep it.
 */
struct RequestMeta {
    std::string               source;
    std::string               reason;
    std::chrono::milliseconds timestamp{0};
    Value                     context;

    // source is "user" for trusted events and "system" otherwise; reason is the event type.
    static auto FromEvent(std::string type, bool trusted, std::chrono::milliseconds timestamp = {}, Value context = {}) -> RequestMeta;
};

/**
 * TaskInfo: the introspection record for one task.
 *
 * Records are stored by task name. A task that is superseded by another task
 * with the same name only updates the record while it is still the current one.
 */
struct TaskInfo {
    std::uint64_t              id = 0;
    std::string                name;
    std::string                key;
    TaskMode                   mode   = TaskMode::Exclusive;
    TaskStatus                 status = TaskStatus::Idle;
    Value                      input;
    std::optional<RequestMeta> meta;
    bool                       started   = false;
    bool                       cancelled = false;
    std::optional<Value>       output;
    std::optional<Error>       error;
    std::chrono::milliseconds  enqueuedAt{0};
    std::chrono::milliseconds  startedAt{0};
    std::chrono::milliseconds  settledAt{0};

    [[nodiscard]] auto pending() const -> bool { return status == TaskStatus::Pending; }
    [[nodiscard]] auto settled() const -> bool { return status == TaskStatus::Success || status == TaskStatus::Error; }
};

} // namespace MS

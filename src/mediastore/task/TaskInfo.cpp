#include <mediastore/task/TaskInfo.hpp>

#include <utility>

namespace MS {

auto taskStatusToString(TaskStatus status) -> std::string_view {
    switch (status) {
    case TaskStatus::Idle:
        return "idle";
    case TaskStatus::Pending:
        return "pending";
    case TaskStatus::Success:
        return "success";
    case TaskStatus::Error:
        return "error";
    }
    return "idle";
}

auto taskModeToString(TaskMode mode) -> std::string_view {
    return mode == TaskMode::Shared ? "shared" : "exclusive";
}

auto taskOutcomeToString(TaskOutcome outcome) -> std::string_view {
    switch (outcome) {
    case TaskOutcome::Success:
        return "success";
    case TaskOutcome::Error:
        return "error";
    case TaskOutcome::Cancelled:
        return "cancelled";
    }
    return "error";
}

auto RequestMeta::FromEvent(std::string type, bool trusted, std::chrono::milliseconds timestamp, Value context) -> RequestMeta {
    return RequestMeta{.source    = trusted ? "user" : "system",
                       .reason    = std::move(type),
                       .timestamp = timestamp,
                       .context   = std::move(context)};
}

} // namespace MS

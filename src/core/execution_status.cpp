/**
 * @file execution_status.cpp
 * @brief Lifecycle state graph
 *
 * @date 2025
 */

#include "taskbox/core/execution_status.hpp"

namespace taskbox {
namespace core {

StatusKind KindOf(const ExecutionStatus& status) {
    return static_cast<StatusKind>(status.index());
}

const char* StatusKindName(StatusKind kind) {
    switch (kind) {
        case StatusKind::PENDING:   return "pending";
        case StatusKind::CREATING:  return "creating";
        case StatusKind::RUNNING:   return "running";
        case StatusKind::COMPLETED: return "completed";
        case StatusKind::FAILED:    return "failed";
        case StatusKind::TIMEOUT:   return "timeout";
    }
    return "unknown";
}

bool IsTerminal(const ExecutionStatus& status) {
    StatusKind kind = KindOf(status);
    return kind == StatusKind::COMPLETED ||
           kind == StatusKind::FAILED ||
           kind == StatusKind::TIMEOUT;
}

bool IsValidTransition(const ExecutionStatus& from, const ExecutionStatus& to) {
    StatusKind target = KindOf(to);

    switch (KindOf(from)) {
        case StatusKind::PENDING:
            return target == StatusKind::CREATING || target == StatusKind::FAILED;
        case StatusKind::CREATING:
            return target == StatusKind::RUNNING || target == StatusKind::FAILED;
        case StatusKind::RUNNING:
            return target == StatusKind::COMPLETED ||
                   target == StatusKind::FAILED ||
                   target == StatusKind::TIMEOUT;
        case StatusKind::COMPLETED:
        case StatusKind::FAILED:
        case StatusKind::TIMEOUT:
            return false;
    }
    return false;
}

std::string ToString(const ExecutionStatus& status) {
    if (const auto* completed = std::get_if<CompletedState>(&status)) {
        return "completed(" + std::to_string(completed->exit_code) + ")";
    }
    if (const auto* failed = std::get_if<FailedState>(&status)) {
        return "failed: " + failed->reason;
    }
    return StatusKindName(KindOf(status));
}

bool operator==(const CompletedState& lhs, const CompletedState& rhs) {
    return lhs.exit_code == rhs.exit_code;
}

bool operator==(const FailedState& lhs, const FailedState& rhs) {
    return lhs.reason == rhs.reason;
}

} // namespace core
} // namespace taskbox

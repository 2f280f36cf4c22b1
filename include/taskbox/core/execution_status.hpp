/**
 * @file execution_status.hpp
 * @brief Closed lifecycle state of an execution unit
 *
 * State graph:
 * ```
 * Pending --create()--> Creating --start()--> Running
 * Pending --image unresolvable--> Failed(reason)
 * Creating --create/start fails--> Failed(reason)
 * Running --process exits N--> Completed(N)
 * Running --resource/runtime error--> Failed(reason)
 * Running --wall-clock timeout--> Timeout
 * ```
 * Completed, Failed and Timeout are terminal.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <variant>

namespace taskbox {
namespace core {

struct PendingState {};
struct CreatingState {};
struct RunningState {};

struct CompletedState {
    int exit_code{0};
};

struct FailedState {
    std::string reason;
};

struct TimeoutState {};

/// Tagged lifecycle status; the alternative is the state
using ExecutionStatus = std::variant<PendingState,
                                     CreatingState,
                                     RunningState,
                                     CompletedState,
                                     FailedState,
                                     TimeoutState>;

/**
 * @enum StatusKind
 * @brief Discriminator of ExecutionStatus, in variant order
 */
enum class StatusKind {
    PENDING,
    CREATING,
    RUNNING,
    COMPLETED,
    FAILED,
    TIMEOUT
};

StatusKind KindOf(const ExecutionStatus& status);

const char* StatusKindName(StatusKind kind);

bool IsTerminal(const ExecutionStatus& status);

/**
 * @brief True if @p from -> @p to is an edge of the state graph
 */
bool IsValidTransition(const ExecutionStatus& from, const ExecutionStatus& to);

/// "pending", "completed(7)", "failed: oom", ...
std::string ToString(const ExecutionStatus& status);

bool operator==(const CompletedState& lhs, const CompletedState& rhs);
bool operator==(const FailedState& lhs, const FailedState& rhs);
inline bool operator==(const PendingState&, const PendingState&) { return true; }
inline bool operator==(const CreatingState&, const CreatingState&) { return true; }
inline bool operator==(const RunningState&, const RunningState&) { return true; }
inline bool operator==(const TimeoutState&, const TimeoutState&) { return true; }

} // namespace core
} // namespace taskbox

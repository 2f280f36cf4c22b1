/**
 * @file execution_unit.hpp
 * @brief One container's full lifecycle as an explicit state machine
 *
 * An ExecutionUnit resolves its image, creates and starts a container through
 * the RuntimeGateway, runs a command (exec) or observes the primary process
 * (wait) under a wall-clock budget, and releases every daemon-side resource
 * on cleanup. Status only ever moves forward along the graph in
 * execution_status.hpp.
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/container_config.hpp"
#include "taskbox/core/execution_status.hpp"
#include "taskbox/runtime/runtime_gateway.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace taskbox {
namespace core {

/**
 * @enum PullPolicy
 * @brief When the unit asks the daemon to pull its image
 */
enum class PullPolicy {
    IF_MISSING,  ///< Pull only if the image is not present locally
    ALWAYS,      ///< Pull before every unit
    NEVER        ///< Never pull; a missing image is an ImageError
};

const char* PullPolicyName(PullPolicy policy);

/// @throws ConfigError on anything but "if-missing" / "always" / "never"
PullPolicy ParsePullPolicy(const std::string& value);

/**
 * @struct UnitOptions
 * @brief Engine-side knobs of a unit (not part of the tier profile)
 */
struct UnitOptions {
    PullPolicy pull_policy{PullPolicy::IF_MISSING};
    std::chrono::seconds cleanup_timeout{30};        ///< Upper bound on one cleanup() round trip
    std::chrono::milliseconds poll_interval{50};     ///< Cancellation / deadline check period
    std::chrono::milliseconds kill_grace{5000};      ///< Bound on forced stop+remove after timeout
    std::chrono::seconds stop_grace{10};             ///< SIGTERM -> SIGKILL delay of stop()
};

/**
 * @struct ExecResult
 * @brief Sole successful output of a unit
 *
 * A nonzero exit_code is a normal result, not an error.
 */
struct ExecResult {
    int exit_code{0};
    std::string stdout_data;
    std::string stderr_data;
    std::chrono::milliseconds duration{0};  ///< Wall-clock time of the command
    bool stdout_truncated{false};
    bool stderr_truncated{false};
};

struct TransitionRecord {
    ExecutionStatus from;
    ExecutionStatus to;
    std::chrono::system_clock::time_point at;
};

/**
 * @struct InvocationRecord
 * @brief One command issued inside the unit, for audit
 */
struct InvocationRecord {
    std::vector<std::string> argv;
    std::chrono::system_clock::time_point started_at;
    std::chrono::milliseconds duration{0};
    std::optional<int> exit_code;  ///< Set when the command ran to completion
    std::string error;             ///< Set when it did not
};

/**
 * @struct UnitSnapshot
 * @brief Read-only copy of a unit's lifecycle
 */
struct UnitSnapshot {
    std::string id;
    std::string name;
    std::string image;
    std::vector<std::string> command;
    ExecutionStatus status;
    std::chrono::system_clock::time_point created_at;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> completed_at;
    std::vector<TransitionRecord> transitions;
    std::vector<InvocationRecord> invocations;
};

/**
 * @class ExecutionUnit
 * @brief Lifecycle of one container
 *
 * Exclusively owned by the caller that created it. Lifecycle operations must
 * be issued sequentially; calling one from a state that does not allow it
 * throws InvalidStateError. The destructor calls Cleanup().
 *
 * **Usage Example**:
 * @code
 * auto gateway = std::make_shared<runtime::DockerGateway>();
 * ResourceProfileResolver resolver;
 *
 * ExecutionUnit unit(gateway, ContainerBuilder()
 *                                 .WithImage("alpine:3.19")
 *                                 .WithLimits(resolver.Resolve("easy"))
 *                                 .Build());
 * unit.Start();
 * ExecResult result = unit.Exec({"echo", "hi"});
 * unit.Cleanup();
 * @endcode
 *
 * **Thread Safety**: RequestCancel(), Status() and Snapshot() may be called
 * from any thread; everything else from the owning thread only.
 */
class ExecutionUnit {
public:
    ExecutionUnit(std::shared_ptr<runtime::RuntimeGateway> gateway,
                  ContainerConfig config,
                  UnitOptions options = {});

    ~ExecutionUnit();

    ExecutionUnit(const ExecutionUnit&) = delete;
    ExecutionUnit& operator=(const ExecutionUnit&) = delete;

    /**
     * @brief Resolve the image, create and start the container
     *
     * Pending -> Creating -> Running. An unresolvable image fails the unit
     * before Creating; any later gateway error moves it to Failed.
     * RequestCancel() interrupts every step, including a pull; the unit then
     * ends Failed("cancelled") with any created container removed.
     *
     * @throws InvalidStateError if not Pending
     * @throws ImageError, ConnectionError, CreateError, StartError, CancelledError
     */
    void Start();

    /**
     * @brief Run a command inside the running container
     *
     * The deadline is min(@p timeout, limits.timeout). On expiry the
     * container is stopped and removed before TimeoutError is thrown.
     *
     * @return Result of the command (unit is then Completed(exit_code))
     * @throws InvalidStateError if not Running
     * @throws TimeoutError, OutOfMemoryError, CancelledError, ExecError, ConnectionError
     */
    ExecResult Exec(const std::vector<std::string>& argv,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Wait for the primary process (the config's command) to exit
     *
     * The deadline is started_at + limits.timeout.
     *
     * @throws InvalidStateError if not Running or the config has no command
     * @throws TimeoutError, OutOfMemoryError, CancelledError, ExecError, ConnectionError
     */
    ExecResult Wait();

    /**
     * @brief Ask the primary process to terminate (not a transition)
     *
     * The outcome is still decided by the Exec()/Wait() that follows. A
     * cancellation while waiting for the daemon abandons the unit.
     * @throws InvalidStateError if not Running
     * @throws CancelledError, ConnectionError, CleanupError
     */
    void Stop();

    /**
     * @brief Release every daemon-side resource of the unit
     *
     * Callable from any state; a no-op when nothing was created or when
     * called again. Failures are logged, never thrown. Status is retained.
     */
    void Cleanup() noexcept;

    /// Make an in-flight or future Start()/Exec()/Wait()/Stop() abort with CancelledError
    void RequestCancel() noexcept;

    ExecutionStatus Status() const;

    /**
     * @brief Result of the completed command
     * @throws InvalidStateError if the unit did not reach Completed
     */
    const ExecResult& Result() const;

    UnitSnapshot Snapshot() const;

    /// Runtime-assigned container id (empty until created)
    std::string Id() const;

    const std::string& Name() const { return name_; }
    const ContainerConfig& Config() const { return config_; }
    bool IsCleanedUp() const;

private:
    void ResolveImage();

    /// Create the container; on interruption remove whatever was made under our name
    void CreateContainer();
    void AdoptHandle(runtime::RuntimeHandle handle);

    /**
     * @brief Wait for a daemon call, racing it against cancellation and @p bound
     *
     * On interruption the call is aborted and CancelledError (or
     * ConnectionError when @p bound elapsed) is thrown.
     */
    template <typename T>
    T AwaitDaemon(std::future<T>& future, std::optional<std::chrono::milliseconds> bound,
                  const char* step);

    void ThrowInterrupted(bool cancelled, const char* step, std::chrono::milliseconds bound) const;

    /// Handle of the container, named even before it was created
    runtime::RuntimeHandle CurrentHandle() const;

    void TransitionTo(ExecutionStatus next);
    void RequireStatus(StatusKind expected, const char* operation) const;

    /// Forcibly stop and remove the container, each step bounded by @p bound
    bool ReleaseContainer(std::chrono::milliseconds bound) noexcept;

    /// Timeout / cancellation path: abort calls, release, move to @p terminal
    void Abandon(ExecutionStatus terminal);

    void RecordInvocation(InvocationRecord record);

    std::shared_ptr<runtime::RuntimeGateway> gateway_;
    ContainerConfig config_;
    UnitOptions options_;
    std::string name_;

    mutable std::mutex mutex_;  ///< Guards everything below except cancel_requested_
    ExecutionStatus status_{PendingState{}};
    runtime::RuntimeHandle handle_;
    bool removed_{false};
    bool cleaned_up_{false};
    std::optional<ExecResult> result_;
    std::chrono::system_clock::time_point created_at_;
    std::optional<std::chrono::system_clock::time_point> started_at_;
    std::optional<std::chrono::system_clock::time_point> completed_at_;
    std::chrono::steady_clock::time_point running_since_;
    std::vector<TransitionRecord> transitions_;
    std::vector<InvocationRecord> invocations_;

    std::atomic<bool> cancel_requested_{false};
};

} // namespace core
} // namespace taskbox

/**
 * @file execution_unit.cpp
 * @brief Execution unit lifecycle
 *
 * **Lifecycle**:
 * ```
 * Start:   resolve image -> Creating -> create -> start -> Running
 *          (each daemon call raced against cancellation)
 * Exec:    gateway exec raced against min(timeout, limits.timeout)
 * Wait:    gateway wait raced against started_at + limits.timeout
 * Expiry:  abort in-flight calls -> stop -> remove -> Timeout
 * Cleanup: abort in-flight calls -> stop -> remove (once, never throws)
 * ```
 *
 * Gateway futures are polled in poll_interval slices so that a deadline or
 * a cancellation request is noticed within one slice. Forced termination is
 * bounded by kill_grace per daemon call, which bounds how far past its
 * budget a unit can be observed.
 *
 * @date 2025
 */

#include "taskbox/core/execution_unit.hpp"
#include "taskbox/core/errors.hpp"
#include "taskbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <future>
#include <random>

namespace taskbox {
namespace core {

using std::chrono::milliseconds;
using std::chrono::steady_clock;
using std::chrono::system_clock;

namespace {

enum class AwaitOutcome {
    READY,
    DEADLINE,
    CANCELLED
};

template <typename T>
AwaitOutcome AwaitFuture(std::future<T>& future,
                         steady_clock::time_point deadline,
                         milliseconds poll_interval,
                         const std::atomic<bool>& cancel_requested) {
    while (true) {
        steady_clock::duration slice = poll_interval;
        auto remaining = deadline - steady_clock::now();
        if (remaining < slice) {
            slice = remaining > steady_clock::duration::zero() ? remaining
                                                               : steady_clock::duration::zero();
        }

        if (future.wait_for(slice) == std::future_status::ready) {
            return AwaitOutcome::READY;
        }
        if (cancel_requested.load()) {
            return AwaitOutcome::CANCELLED;
        }
        if (steady_clock::now() >= deadline) {
            return AwaitOutcome::DEADLINE;
        }
    }
}

void LogCleanupFailure(const std::string& message) {
    CleanupError error(message);
    spdlog::warn("[{}] {}", ErrorKindName(error.Kind()), error.what());
}

/// Wait for a release call; failures are logged, never thrown
template <typename T>
bool WaitQuietly(std::future<T>& future, milliseconds bound, const std::string& what) {
    try {
        if (future.wait_for(bound) != std::future_status::ready) {
            LogCleanupFailure(what + " did not complete within " + std::to_string(bound.count()) + " ms");
            return false;
        }
        future.get();
        return true;
    }
    catch (const std::exception& e) {
        LogCleanupFailure(what + " failed: " + e.what());
        return false;
    }
}

std::string GenerateUnitName(const std::string& prefix = "taskbox") {
    static std::atomic<unsigned> sequence{0};
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(1000, 9999);

    auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        system_clock::now().time_since_epoch()).count();

    return prefix + "_" + std::to_string(timestamp) + "_" +
           std::to_string(sequence.fetch_add(1)) + "_" + std::to_string(dis(gen));
}

} // anonymous namespace

const char* PullPolicyName(PullPolicy policy) {
    switch (policy) {
        case PullPolicy::IF_MISSING: return "if-missing";
        case PullPolicy::ALWAYS:     return "always";
        case PullPolicy::NEVER:      return "never";
    }
    return "unknown";
}

PullPolicy ParsePullPolicy(const std::string& value) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    if (lower == "if-missing" || lower == "missing") return PullPolicy::IF_MISSING;
    if (lower == "always") return PullPolicy::ALWAYS;
    if (lower == "never") return PullPolicy::NEVER;
    throw ConfigError("Unknown pull policy: '" + value + "' (expected if-missing, always or never)");
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ExecutionUnit::ExecutionUnit(std::shared_ptr<runtime::RuntimeGateway> gateway,
                             ContainerConfig config,
                             UnitOptions options)
    : gateway_(std::move(gateway))
    , config_(std::move(config))
    , options_(options)
    , created_at_(system_clock::now()) {

    if (!gateway_) {
        throw ConfigError("Execution unit requires a runtime gateway");
    }

    config_.Validate();

    if (!config_.name) {
        config_.name = GenerateUnitName();
    }
    name_ = *config_.name;

    spdlog::debug("Unit {} created (image: {}, memory: {}, cpus: {}, pids: {}, network: {}, timeout: {}s)",
                  name_, config_.image, config_.limits.MemoryString(), config_.limits.cpu_cores,
                  config_.limits.max_processes, NetworkModeName(config_.EffectiveNetworkMode()),
                  config_.limits.timeout.count());
}

ExecutionUnit::~ExecutionUnit() {
    Cleanup();
}

// ============================================================================
// DAEMON CALLS
// ============================================================================

template <typename T>
T ExecutionUnit::AwaitDaemon(std::future<T>& future,
                             std::optional<milliseconds> bound,
                             const char* step) {
    auto deadline = bound ? steady_clock::now() + *bound : steady_clock::time_point::max();
    AwaitOutcome outcome = AwaitFuture(future, deadline, options_.poll_interval, cancel_requested_);

    if (outcome != AwaitOutcome::READY) {
        gateway_->AbortInFlight(CurrentHandle());
        ThrowInterrupted(outcome == AwaitOutcome::CANCELLED, step, bound.value_or(milliseconds(0)));
    }
    return future.get();
}

void ExecutionUnit::ThrowInterrupted(bool cancelled, const char* step, milliseconds bound) const {
    if (cancelled) {
        throw CancelledError("Unit " + name_ + " cancelled during " + step);
    }
    throw ConnectionError("Unit " + name_ + ": daemon did not answer " + step + " within " +
                          std::to_string(bound.count()) + " ms");
}

runtime::RuntimeHandle ExecutionUnit::CurrentHandle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    runtime::RuntimeHandle handle = handle_;
    if (handle.name.empty()) {
        handle.name = name_;
    }
    return handle;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void ExecutionUnit::Start() {
    RequireStatus(StatusKind::PENDING, "start");

    spdlog::info("Starting unit {} (image: {})", name_, config_.image);

    try {
        ResolveImage();
    }
    catch (const CancelledError&) {
        spdlog::warn("Unit {}: cancelled while resolving image", name_);
        TransitionTo(FailedState{"cancelled"});
        throw;
    }
    catch (const std::exception& e) {
        spdlog::error("Unit {}: image resolution failed: {}", name_, e.what());
        TransitionTo(FailedState{e.what()});
        throw;
    }

    TransitionTo(CreatingState{});

    try {
        CreateContainer();

        auto started = gateway_->Start(CurrentHandle());
        AwaitDaemon(started, options_.cleanup_timeout, "start");
    }
    catch (const CancelledError&) {
        spdlog::warn("Unit {}: cancelled while starting", name_);
        ReleaseContainer(options_.kill_grace);
        TransitionTo(FailedState{"cancelled"});
        throw;
    }
    catch (const std::exception& e) {
        spdlog::error("Unit {} failed to start: {}", name_, e.what());
        TransitionTo(FailedState{e.what()});
        throw;
    }

    TransitionTo(RunningState{});
}

void ExecutionUnit::ResolveImage() {
    const std::string& image = config_.image;

    switch (options_.pull_policy) {
        case PullPolicy::ALWAYS: {
            auto pulled = gateway_->Pull(image, name_);
            AwaitDaemon(pulled, std::nullopt, "pull");
            return;
        }

        case PullPolicy::IF_MISSING: {
            auto exists = gateway_->ImageExists(image, name_);
            if (!AwaitDaemon(exists, options_.cleanup_timeout, "image inspect")) {
                spdlog::info("Image {} not present locally, pulling...", image);
                auto pulled = gateway_->Pull(image, name_);
                AwaitDaemon(pulled, std::nullopt, "pull");
            }
            return;
        }

        case PullPolicy::NEVER: {
            auto exists = gateway_->ImageExists(image, name_);
            if (!AwaitDaemon(exists, options_.cleanup_timeout, "image inspect")) {
                throw ImageError("Image not present locally and pull policy is never: " + image);
            }
            return;
        }
    }
}

void ExecutionUnit::CreateContainer() {
    auto created = gateway_->Create(config_);
    AwaitOutcome outcome = AwaitFuture(created, steady_clock::now() + options_.cleanup_timeout,
                                       options_.poll_interval, cancel_requested_);

    if (outcome != AwaitOutcome::READY) {
        // Give an answer already on its way the chance to land, so the container is known
        if (created.wait_for(options_.kill_grace) == std::future_status::ready) {
            try {
                AdoptHandle(created.get());
            }
            catch (const std::exception& e) {
                spdlog::debug("Unit {}: interrupted create ended with: {}", name_, e.what());
            }
        } else {
            gateway_->AbortInFlight(CurrentHandle());

            // The daemon may have created it after the client was killed
            runtime::RuntimeHandle orphan{name_, name_};
            auto remove = gateway_->Remove(orphan);
            WaitQuietly(remove, options_.kill_grace, "remove of " + name_);
        }
        ThrowInterrupted(outcome == AwaitOutcome::CANCELLED, "create",
                         std::chrono::duration_cast<milliseconds>(options_.cleanup_timeout));
    }

    AdoptHandle(created.get());
}

void ExecutionUnit::AdoptHandle(runtime::RuntimeHandle handle) {
    if (handle.name.empty()) {
        handle.name = name_;
    }
    spdlog::info("✓ Container created: {}", handle.id.substr(0, 12));

    std::lock_guard<std::mutex> lock(mutex_);
    handle_ = std::move(handle);
}

ExecResult ExecutionUnit::Exec(const std::vector<std::string>& argv,
                               std::optional<milliseconds> timeout) {
    RequireStatus(StatusKind::RUNNING, "exec");

    milliseconds budget = std::chrono::duration_cast<milliseconds>(config_.limits.timeout);
    if (timeout && *timeout < budget) {
        budget = *timeout;
    }

    runtime::RuntimeHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = handle_;
    }

    InvocationRecord record;
    record.argv = argv;
    record.started_at = system_clock::now();
    auto started = steady_clock::now();

    spdlog::info("[{}] exec: {}", name_, utils::StringUtils::FormatCommand(argv));

    auto future = gateway_->Exec(handle, argv);
    AwaitOutcome outcome = AwaitFuture(future, started + budget, options_.poll_interval,
                                       cancel_requested_);
    record.duration = std::chrono::duration_cast<milliseconds>(steady_clock::now() - started);

    if (outcome == AwaitOutcome::DEADLINE) {
        spdlog::warn("⏱ Timeout reached ({} ms), stopping container...", budget.count());
        record.error = "timeout";
        RecordInvocation(std::move(record));
        Abandon(TimeoutState{});
        throw TimeoutError("Unit " + name_ + " exceeded its " + std::to_string(budget.count()) +
                           " ms budget");
    }

    if (outcome == AwaitOutcome::CANCELLED) {
        record.error = "cancelled";
        RecordInvocation(std::move(record));
        Abandon(FailedState{"cancelled"});
        throw CancelledError("Unit " + name_ + " cancelled during exec");
    }

    runtime::ExecOutput output;
    try {
        output = future.get();
    }
    catch (const std::exception& e) {
        spdlog::error("Unit {}: exec failed: {}", name_, e.what());
        record.error = e.what();
        RecordInvocation(std::move(record));
        TransitionTo(FailedState{e.what()});
        throw;
    }

    if (output.oom_killed) {
        std::string reason = "oom: memory limit " + config_.limits.MemoryString() + " exceeded";
        record.error = reason;
        RecordInvocation(std::move(record));
        TransitionTo(FailedState{reason});
        throw OutOfMemoryError("Unit " + name_ + ": " + reason);
    }

    record.exit_code = output.exit_code;
    RecordInvocation(std::move(record));

    ExecResult result;
    result.exit_code = output.exit_code;
    result.stdout_data = std::move(output.stdout_data);
    result.stderr_data = std::move(output.stderr_data);
    result.stdout_truncated = output.stdout_truncated;
    result.stderr_truncated = output.stderr_truncated;
    result.duration = std::chrono::duration_cast<milliseconds>(steady_clock::now() - started);

    if (result.stdout_truncated || result.stderr_truncated) {
        spdlog::warn("Unit {}: command output truncated", name_);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = result;
    }
    TransitionTo(CompletedState{result.exit_code});
    return result;
}

ExecResult ExecutionUnit::Wait() {
    RequireStatus(StatusKind::RUNNING, "wait");

    if (config_.command.empty()) {
        throw InvalidStateError("wait() on unit " + name_ +
                                " which has no primary command; use exec()");
    }

    runtime::RuntimeHandle handle;
    steady_clock::time_point running_since;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = handle_;
        running_since = running_since_;
    }

    InvocationRecord record;
    record.argv = config_.command;
    record.started_at = system_clock::now();
    auto started = steady_clock::now();

    auto future = gateway_->Wait(handle);
    AwaitOutcome outcome = AwaitFuture(future, running_since + config_.limits.timeout,
                                       options_.poll_interval, cancel_requested_);
    record.duration = std::chrono::duration_cast<milliseconds>(steady_clock::now() - started);

    if (outcome == AwaitOutcome::DEADLINE) {
        spdlog::warn("⏱ Timeout reached ({}s), stopping container...", config_.limits.timeout.count());
        record.error = "timeout";
        RecordInvocation(std::move(record));
        Abandon(TimeoutState{});
        throw TimeoutError("Unit " + name_ + " exceeded its " +
                           std::to_string(config_.limits.timeout.count()) + " s budget");
    }

    if (outcome == AwaitOutcome::CANCELLED) {
        record.error = "cancelled";
        RecordInvocation(std::move(record));
        Abandon(FailedState{"cancelled"});
        throw CancelledError("Unit " + name_ + " cancelled during wait");
    }

    runtime::ExitInfo exit_info;
    try {
        exit_info = future.get();
    }
    catch (const std::exception& e) {
        spdlog::error("Unit {}: wait failed: {}", name_, e.what());
        record.error = e.what();
        RecordInvocation(std::move(record));
        TransitionTo(FailedState{e.what()});
        throw;
    }

    if (exit_info.oom_killed) {
        std::string reason = "oom: memory limit " + config_.limits.MemoryString() + " exceeded";
        record.error = reason;
        RecordInvocation(std::move(record));
        TransitionTo(FailedState{reason});
        throw OutOfMemoryError("Unit " + name_ + ": " + reason);
    }

    record.exit_code = exit_info.exit_code;
    RecordInvocation(std::move(record));
    TransitionTo(CompletedState{exit_info.exit_code});

    ExecResult result;
    result.exit_code = exit_info.exit_code;
    result.duration = std::chrono::duration_cast<milliseconds>(steady_clock::now() - running_since);

    // Output is best effort once the exit status is known
    try {
        auto logs = gateway_->Logs(handle);
        if (logs.wait_for(options_.cleanup_timeout) == std::future_status::ready) {
            runtime::LogOutput output = logs.get();
            result.stdout_data = std::move(output.stdout_data);
            result.stderr_data = std::move(output.stderr_data);
        } else {
            spdlog::warn("Unit {}: logs not available within {}s", name_,
                         options_.cleanup_timeout.count());
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Unit {}: could not fetch logs: {}", name_, e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    result_ = result;
    return result;
}

void ExecutionUnit::Stop() {
    RequireStatus(StatusKind::RUNNING, "stop");

    runtime::RuntimeHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = handle_;
    }

    spdlog::warn("Stopping unit {} (grace: {}s)", name_, options_.stop_grace.count());

    auto stopped = gateway_->Stop(handle, options_.stop_grace);
    try {
        AwaitDaemon(stopped, options_.stop_grace + options_.cleanup_timeout, "stop");
    }
    catch (const CancelledError&) {
        Abandon(FailedState{"cancelled"});
        throw;
    }
}

void ExecutionUnit::Cleanup() noexcept {
    runtime::RuntimeHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cleaned_up_) {
            spdlog::debug("Unit {} already cleaned up", name_);
            return;
        }
        cleaned_up_ = true;

        if (!handle_.Valid() || removed_) {
            spdlog::debug("Unit {}: no container to release", name_);
            return;
        }
        handle = handle_;
    }

    spdlog::info("Cleaning up unit {} ({})", name_, handle.id.substr(0, 12));

    try {
        gateway_->AbortInFlight(handle);
    }
    catch (const std::exception& e) {
        LogCleanupFailure("abort of in-flight calls for " + name_ + " failed: " + e.what());
    }

    ReleaseContainer(std::chrono::duration_cast<milliseconds>(options_.cleanup_timeout));
}

void ExecutionUnit::RequestCancel() noexcept {
    if (!cancel_requested_.exchange(true)) {
        spdlog::warn("Cancellation requested for unit {}", name_);
    }
}

// ============================================================================
// TIMEOUT / CANCELLATION
// ============================================================================

void ExecutionUnit::Abandon(ExecutionStatus terminal) {
    std::size_t aborted = gateway_->AbortInFlight(CurrentHandle());
    spdlog::debug("Unit {}: aborted {} in-flight call(s)", name_, aborted);

    ReleaseContainer(options_.kill_grace);
    TransitionTo(std::move(terminal));
}

bool ExecutionUnit::ReleaseContainer(milliseconds bound) noexcept {
    try {
        runtime::RuntimeHandle handle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!handle_.Valid() || removed_) {
                return true;
            }
            handle = handle_;
        }

        auto stop = gateway_->Stop(handle, std::chrono::seconds(0));
        WaitQuietly(stop, bound, "stop of " + name_);

        auto remove = gateway_->Remove(handle);
        if (!WaitQuietly(remove, bound, "remove of " + name_)) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        removed_ = true;
        spdlog::info("✓ Container removed: {}", handle.id.substr(0, 12));
        return true;
    }
    catch (const std::exception& e) {
        LogCleanupFailure("release of " + name_ + " failed: " + e.what());
        return false;
    }
}

// ============================================================================
// STATE
// ============================================================================

void ExecutionUnit::TransitionTo(ExecutionStatus next) {
    ExecutionStatus previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!IsValidTransition(status_, next)) {
            throw InvalidStateError("Invalid transition " + ToString(status_) + " -> " +
                                    ToString(next) + " in unit " + name_);
        }

        auto now = system_clock::now();
        previous = status_;
        transitions_.push_back({status_, next, now});
        status_ = next;

        if (KindOf(next) == StatusKind::RUNNING) {
            started_at_ = now;
            running_since_ = steady_clock::now();
        }
        if (IsTerminal(next)) {
            completed_at_ = now;
        }
    }

    spdlog::info("[{}] {} -> {}", name_, ToString(previous), ToString(next));
}

void ExecutionUnit::RequireStatus(StatusKind expected, const char* operation) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (cleaned_up_) {
        throw InvalidStateError(std::string(operation) + "() on unit " + name_ +
                                " after cleanup()");
    }
    if (KindOf(status_) != expected) {
        throw InvalidStateError(std::string(operation) + "() on unit " + name_ + " in state " +
                                ToString(status_) + " (requires " + StatusKindName(expected) + ")");
    }
}

void ExecutionUnit::RecordInvocation(InvocationRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    invocations_.push_back(std::move(record));
}

ExecutionStatus ExecutionUnit::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

const ExecResult& ExecutionUnit::Result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!result_) {
        throw InvalidStateError("No result for unit " + name_ + " in state " + ToString(status_));
    }
    return *result_;
}

UnitSnapshot ExecutionUnit::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    UnitSnapshot snapshot;
    snapshot.id = handle_.id;
    snapshot.name = name_;
    snapshot.image = config_.image;
    snapshot.command = config_.command;
    snapshot.status = status_;
    snapshot.created_at = created_at_;
    snapshot.started_at = started_at_;
    snapshot.completed_at = completed_at_;
    snapshot.transitions = transitions_;
    snapshot.invocations = invocations_;
    return snapshot;
}

std::string ExecutionUnit::Id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_.id;
}

bool ExecutionUnit::IsCleanedUp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cleaned_up_;
}

} // namespace core
} // namespace taskbox

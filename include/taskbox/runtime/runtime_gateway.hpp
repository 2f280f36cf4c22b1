/**
 * @file runtime_gateway.hpp
 * @brief Asynchronous facade over the container-runtime daemon
 *
 * Translates lifecycle intents (create/start/exec/wait/stop/remove/pull/logs)
 * into daemon calls and normalizes responses and errors. Every operation
 * returns a future; the daemon round trip never occupies the calling thread.
 *
 * Failures are delivered through the future as taskbox::core exceptions
 * (ConnectionError, ImageError, CreateError, StartError, ExecError,
 * CleanupError).
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/container_config.hpp"

#include <chrono>
#include <cstddef>
#include <future>
#include <string>
#include <vector>

namespace taskbox {
namespace runtime {

/**
 * @struct RuntimeHandle
 * @brief Daemon-side identity of one container
 */
struct RuntimeHandle {
    std::string id;    ///< Runtime-assigned container id
    std::string name;  ///< Caller-assigned container name

    bool Valid() const { return !id.empty(); }
};

/**
 * @struct ExecOutput
 * @brief Raw outcome of a command run inside a container
 */
struct ExecOutput {
    int exit_code{0};
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    bool oom_killed{false};                 ///< Killed by the memory ceiling
    std::chrono::milliseconds duration{0};
};

/**
 * @struct ExitInfo
 * @brief Exit of a container's primary process
 */
struct ExitInfo {
    int exit_code{0};
    bool oom_killed{false};
};

struct LogOutput {
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @struct ContainerState
 * @brief Daemon view of a container
 */
struct ContainerState {
    std::string status;      ///< "created", "running", "exited", ...
    bool running{false};
    int exit_code{0};
    bool oom_killed{false};
};

/**
 * @class RuntimeGateway
 * @brief Backend-neutral container lifecycle interface
 *
 * Implementations own the daemon connection and hold no per-unit state, so
 * one instance is shared by every concurrently active unit.
 *
 * **Thread Safety**: all methods may be called concurrently.
 */
class RuntimeGateway {
public:
    virtual ~RuntimeGateway() = default;

    /**
     * @brief Create (but do not start) a container
     *
     * The call is abandoned by AbortInFlight() of a handle named config.name.
     * @throws ConnectionError, ImageError, CreateError (through the future)
     */
    virtual std::future<RuntimeHandle> Create(const core::ContainerConfig& config) = 0;

    /**
     * @brief Start a created container
     * @throws StartError if the handle is unknown or already started
     */
    virtual std::future<void> Start(const RuntimeHandle& handle) = 0;

    /**
     * @brief Run @p argv inside a running container
     *
     * A nonzero exit code is a normal result. Output is capped per stream.
     * @throws ExecError if the daemon could not run the command
     */
    virtual std::future<ExecOutput> Exec(const RuntimeHandle& handle,
                                         const std::vector<std::string>& argv) = 0;

    /// Resolves when the primary process exits
    virtual std::future<ExitInfo> Wait(const RuntimeHandle& handle) = 0;

    /**
     * @brief Graceful-then-forceful termination
     *
     * Idempotent: an already stopped or missing container is not an error.
     */
    virtual std::future<void> Stop(const RuntimeHandle& handle, std::chrono::seconds grace) = 0;

    /// Release every daemon-side resource of the container; idempotent
    virtual std::future<void> Remove(const RuntimeHandle& handle) = 0;

    /**
     * @brief Make @p image present locally
     *
     * @param owner Name of the unit the pull is for; AbortInFlight() of a
     *        handle with that name abandons the pull
     * @throws ImageError if the reference cannot be resolved
     */
    virtual std::future<void> Pull(const std::string& image, const std::string& owner) = 0;

    virtual std::future<bool> ImageExists(const std::string& image, const std::string& owner) = 0;

    /// Best-effort retrieval of the primary process output
    virtual std::future<LogOutput> Logs(const RuntimeHandle& handle) = 0;

    virtual std::future<ContainerState> Inspect(const RuntimeHandle& handle) = 0;

    /// Ids of every container (running or not) carrying @p label
    virtual std::future<std::vector<std::string>> List(const std::string& label) = 0;

    /// Daemon server version
    virtual std::future<std::string> Ping() = 0;

    /**
     * @brief Abandon every in-flight daemon call of @p handle
     *
     * Calls issued before the id was known (image checks, pulls, create) are
     * matched by handle.name. Pending futures of those calls still resolve
     * (with an error).
     * @return Number of calls aborted
     */
    virtual std::size_t AbortInFlight(const RuntimeHandle& handle) = 0;
};

} // namespace runtime
} // namespace taskbox

/**
 * @file docker_gateway.hpp
 * @brief RuntimeGateway backed by the docker command-line client
 *
 * Each daemon call is one docker client process launched through the
 * ProcessReactor; completion handlers parse the client output and fulfil the
 * operation's promise. Containers created here are labelled so that leaked
 * ones can be listed and reaped.
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/errors.hpp"
#include "taskbox/runtime/runtime_gateway.hpp"
#include "taskbox/utils/process_reactor.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace taskbox {
namespace runtime {

/**
 * @enum DiskQuotaMode
 * @brief How the disk ceiling of a tier is enforced
 */
enum class DiskQuotaMode {
    TMPFS,        ///< Size-capped tmpfs scratch directory (works on every storage driver)
    STORAGE_OPT,  ///< --storage-opt size= on the writable layer (overlay2 on xfs+pquota)
    NONE          ///< Not enforced
};

const char* DiskQuotaModeName(DiskQuotaMode mode);

/// @throws ConfigError on anything but "tmpfs" / "storage-opt" / "none"
DiskQuotaMode ParseDiskQuotaMode(const std::string& value);

/**
 * @struct GatewayOptions
 * @brief Settings of the docker backend
 */
struct GatewayOptions {
    std::string binary{"docker"};                     ///< Client executable (PATH lookup)
    std::string endpoint;                             ///< Daemon address (empty = DOCKER_HOST / default)
    std::size_t output_limit{16 * 1024 * 1024};       ///< Per-stream capture cap (bytes)
    std::string internal_network{"taskbox-internal"}; ///< Bridge used for NetworkMode::INTERNAL
    DiskQuotaMode disk_quota{DiskQuotaMode::TMPFS};
    std::string scratch_path{"/tmp"};                 ///< tmpfs mount point for DiskQuotaMode::TMPFS
    std::vector<std::string> keepalive_command{"sleep", "infinity"};
    std::string label{"taskbox.managed"};             ///< Label key marking engine-owned resources
    std::vector<std::string> cap_drop{"ALL"};         ///< Capabilities dropped from every container
    std::vector<std::string> security_opts{"no-new-privileges"}; ///< --security-opt values
};

/**
 * @class DockerGateway
 * @brief Docker implementation of RuntimeGateway
 *
 * **Usage Example**:
 * @code
 * auto gateway = std::make_shared<DockerGateway>();
 * std::cout << gateway->Ping().get() << std::endl;
 * @endcode
 *
 * **Thread Safety**: all operations are thread-safe.
 */
class DockerGateway : public RuntimeGateway {
public:
    /**
     * @brief Construct the gateway
     *
     * An empty @c options.endpoint is replaced by DOCKER_HOST, read once here.
     */
    explicit DockerGateway(GatewayOptions options = {});
    ~DockerGateway() override;

    DockerGateway(const DockerGateway&) = delete;
    DockerGateway& operator=(const DockerGateway&) = delete;

    std::future<RuntimeHandle> Create(const core::ContainerConfig& config) override;
    std::future<void> Start(const RuntimeHandle& handle) override;
    std::future<ExecOutput> Exec(const RuntimeHandle& handle,
                                 const std::vector<std::string>& argv) override;
    std::future<ExitInfo> Wait(const RuntimeHandle& handle) override;
    std::future<void> Stop(const RuntimeHandle& handle, std::chrono::seconds grace) override;
    std::future<void> Remove(const RuntimeHandle& handle) override;
    std::future<void> Pull(const std::string& image, const std::string& owner) override;
    std::future<bool> ImageExists(const std::string& image, const std::string& owner) override;
    std::future<LogOutput> Logs(const RuntimeHandle& handle) override;
    std::future<ContainerState> Inspect(const RuntimeHandle& handle) override;
    std::future<std::vector<std::string>> List(const std::string& label) override;
    std::future<std::string> Ping() override;
    std::size_t AbortInFlight(const RuntimeHandle& handle) override;

    const GatewayOptions& Options() const { return options_; }

    /**
     * @brief Arguments of `docker create` for @p config (without the client binary)
     *
     * Memory, CPU, PID, network and disk flags are derived from
     * config.limits exactly; no value is rounded.
     */
    static std::vector<std::string> BuildCreateArgs(const core::ContainerConfig& config,
                                                    const GatewayOptions& options);

    /**
     * @brief Map client stderr to an error kind
     * @param fallback Kind reported when nothing more specific matches
     */
    static core::ErrorKind ClassifyError(const std::string& stderr_text, core::ErrorKind fallback);

    /**
     * @brief True if `docker exec` stderr comes from the client/daemon
     *        rather than from the command itself
     */
    static bool IsDaemonExecFailure(const std::string& stderr_text);

    /// True if a memory.events / memory.oom_control dump reports an OOM kill
    static bool ParseOomKillCount(const std::string& cgroup_text);

private:
    using ResultHandler = std::function<void(utils::ProcessResult&&)>;

    /// Launch `<binary> [--host ep] args...`, tagged with @p tag
    void Invoke(std::vector<std::string> args, const std::string& tag, ResultHandler handler);

    /// Invoke and turn @p parse (ProcessResult -> T, may throw) into a future
    template <typename T, typename Parse>
    std::future<T> Submit(std::vector<std::string> args, const std::string& tag, Parse parse);

    /// Make sure the internal bridge exists, then call @p next (with nullptr on success)
    void EnsureInternalNetwork(const std::string& tag, std::function<void(std::exception_ptr)> next);

    /// Decide whether a container suffered an OOM kill; @p done gets the verdict
    void CheckOomKilled(const RuntimeHandle& handle, std::function<void(bool)> done);

    std::exception_ptr ToError(const utils::ProcessResult& result,
                               core::ErrorKind fallback,
                               const std::string& operation) const;

    GatewayOptions options_;
    std::atomic<bool> network_ready_{false};

    // Declared last: destroyed first, so in-flight handlers never outlive the members above
    utils::ProcessReactor reactor_;
};

} // namespace runtime
} // namespace taskbox

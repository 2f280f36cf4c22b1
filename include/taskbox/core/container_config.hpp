/**
 * @file container_config.hpp
 * @brief Description of the isolated environment a unit runs in
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/resource_profiles.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace taskbox {
namespace core {

/**
 * @struct VolumeMount
 * @brief Host path -> container path binding
 */
struct VolumeMount {
    std::string host_path;       ///< Path on the host
    std::string container_path;  ///< Absolute path inside the container
    bool read_only{false};       ///< Mount read-only

    /// "host:container" or "host:container:ro"
    std::string ToBindString() const;

    /**
     * @brief Parse "host:container[:ro|:rw]"
     * @throws ConfigError on malformed input
     */
    static VolumeMount Parse(const std::string& spec);
};

/**
 * @struct ContainerConfig
 * @brief Complete, immutable description of one execution request
 *
 * An empty @c command means the container's primary process is the gateway's
 * keep-alive command and work is issued with ExecutionUnit::Exec(). A
 * non-empty command is the primary process and is observed with
 * ExecutionUnit::Wait().
 */
struct ContainerConfig {
    std::string image;                               ///< Image reference
    std::vector<std::string> command;                ///< Primary process argv (may be empty)
    std::map<std::string, std::string> environment;  ///< Environment variables
    std::vector<VolumeMount> mounts;                 ///< Ordered volume mounts
    ResourceLimits limits;                           ///< Resolved tier profile
    std::optional<NetworkMode> network_mode;         ///< Overrides limits.network_mode
    std::optional<std::string> name;                 ///< Caller-assigned container name
    std::string working_dir;                         ///< Working directory (empty = image default)
    std::string user;                                ///< User to run as (empty = image default)
    std::map<std::string, std::string> labels;       ///< Extra runtime labels

    /// Network mode actually applied
    NetworkMode EffectiveNetworkMode() const {
        return network_mode.value_or(limits.network_mode);
    }

    /**
     * @brief Check the configuration is complete and consistent
     * @throws ConfigError describing the first problem found
     */
    void Validate() const;
};

/**
 * @class ContainerBuilder
 * @brief Fluent API for building container configurations
 *
 * **Usage Example**:
 * @code
 * ResourceProfileResolver resolver;
 * auto config = ContainerBuilder()
 *     .WithImage("python:3.11-slim")
 *     .WithLimits(resolver.Resolve("medium"))
 *     .WithEnvironment("PYTHONUNBUFFERED", "1")
 *     .WithMount("/srv/task/repo", "/workspace")
 *     .WithReadOnlyMount("/srv/task/deps", "/task-deps")
 *     .Build();
 * @endcode
 */
class ContainerBuilder {
public:
    ContainerBuilder& WithImage(const std::string& image);
    ContainerBuilder& WithCommand(const std::vector<std::string>& command);
    ContainerBuilder& WithEnvironment(const std::string& key, const std::string& value);
    ContainerBuilder& WithMount(const std::string& host_path, const std::string& container_path);
    ContainerBuilder& WithReadOnlyMount(const std::string& host_path,
                                        const std::string& container_path);
    ContainerBuilder& WithMount(const VolumeMount& mount);
    ContainerBuilder& WithLimits(const ResourceLimits& limits);
    ContainerBuilder& WithNetwork(NetworkMode mode);
    ContainerBuilder& WithName(const std::string& name);
    ContainerBuilder& WithWorkingDir(const std::string& dir);
    ContainerBuilder& WithUser(const std::string& user);
    ContainerBuilder& WithLabel(const std::string& key, const std::string& value);

    /**
     * @brief Validate and return the configuration
     * @throws ConfigError if the configuration is invalid
     */
    ContainerConfig Build() const;

private:
    ContainerConfig config_;  ///< Configuration being built
};

} // namespace core
} // namespace taskbox

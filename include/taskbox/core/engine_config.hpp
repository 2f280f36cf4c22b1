/**
 * @file engine_config.hpp
 * @brief Engine configuration file
 *
 * Example:
 * @code{.json}
 * {
 *   "logging": { "level": "debug" },
 *   "docker":  { "endpoint": "unix:///run/docker.sock", "disk_quota": "storage-opt",
 *              "cap_drop": ["ALL"], "security_opts": ["no-new-privileges"] },
 *   "unit":    { "pull_policy": "never", "cleanup_timeout_seconds": 20 },
 *   "tiers": [
 *     { "name": "small", "memory_bytes": 268435456, "cpu_cores": 0.25,
 *       "disk_bytes": 1073741824, "max_processes": 32,
 *       "network": "none", "timeout_seconds": 120 }
 *   ]
 * }
 * @endcode
 *
 * Unknown keys are ignored; a known key with the wrong type is a ConfigError.
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/execution_unit.hpp"
#include "taskbox/core/resource_profiles.hpp"
#include "taskbox/runtime/docker_gateway.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace taskbox {
namespace core {

struct LoggingOptions {
    std::string level{"info"};
    std::string pattern{"[%H:%M:%S] [%^%l%$] %v"};
};

/**
 * @struct EngineConfig
 * @brief Everything the CLI needs to build a gateway, a resolver and units
 */
struct EngineConfig {
    LoggingOptions logging;
    runtime::GatewayOptions docker;
    UnitOptions unit;
    std::optional<ResourceProfileResolver::TierTable> tiers;  ///< Replaces the built-in tiers

    /**
     * @brief Parse a configuration document
     * @throws ConfigError naming the offending key
     */
    static EngineConfig FromJson(const nlohmann::json& document);

    /**
     * @brief Load and parse a configuration file
     * @throws ConfigError if the file is unreadable or invalid
     */
    static EngineConfig LoadFromFile(const std::string& path);

    /// Resolver over the configured tiers (built-in ones if none)
    ResourceProfileResolver MakeResolver() const;

    /**
     * @brief Apply level and pattern to the default spdlog logger
     * @throws ConfigError on an unknown level name
     */
    void ApplyLogging() const;
};

} // namespace core
} // namespace taskbox

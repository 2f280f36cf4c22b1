/**
 * @file engine_config.cpp
 * @brief JSON configuration loading
 *
 * @date 2025
 */

#include "taskbox/core/engine_config.hpp"
#include "taskbox/core/errors.hpp"
#include "taskbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <type_traits>

using json = nlohmann::json;

namespace taskbox {
namespace core {

namespace {

const json* Section(const json& document, const char* name) {
    if (!document.contains(name)) {
        return nullptr;
    }
    const json& section = document.at(name);
    if (!section.is_object()) {
        throw ConfigError(std::string("Config section '") + name + "' must be an object");
    }
    return &section;
}

/// Upper bound of every duration key
constexpr std::int64_t kMaxDurationSeconds = 7 * 24 * 3600;

/// Integers are range-checked against T instead of wrapping
template <typename T>
T Convert(const json& value, const std::string& name) {
    if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
        if (!value.is_number_integer()) {
            throw ConfigError("Config key '" + name + "' must be an integer");
        }

        bool in_range;
        if (value.is_number_unsigned()) {
            in_range = value.get<std::uint64_t>() <=
                       static_cast<std::uint64_t>(std::numeric_limits<T>::max());
        } else {
            auto number = value.get<std::int64_t>();
            if constexpr (std::is_signed_v<T>) {
                in_range = number >= std::numeric_limits<T>::min() &&
                           number <= std::numeric_limits<T>::max();
            } else {
                in_range = number >= 0 &&
                           static_cast<std::uint64_t>(number) <= std::numeric_limits<T>::max();
            }
        }
        if (!in_range) {
            throw ConfigError("Config key '" + name + "' is out of range: " + value.dump());
        }
        return value.get<T>();
    } else {
        try {
            return value.get<T>();
        }
        catch (const json::exception& e) {
            throw ConfigError("Config key '" + name + "' has the wrong type: " + e.what());
        }
    }
}

/// Read @p key into @p out if present
template <typename T>
void Read(const json* section, const std::string& path, const char* key, T& out) {
    if (!section || !section->contains(key)) {
        return;
    }
    out = Convert<T>(section->at(key), path + "." + key);
}

template <typename T>
T Required(const json& object, const std::string& path, const char* key) {
    if (!object.contains(key)) {
        throw ConfigError("Config key '" + path + "." + key + "' is required");
    }
    return Convert<T>(object.at(key), path + "." + key);
}

void RequireAtMost(std::int64_t value, std::int64_t limit, const std::string& name) {
    if (value > limit) {
        throw ConfigError("Config key '" + name + "' exceeds the maximum of " +
                          std::to_string(limit));
    }
}

ResourceProfileResolver::TierTable ParseTiers(const json& tiers) {
    if (!tiers.is_array()) {
        throw ConfigError("Config key 'tiers' must be an array");
    }

    ResourceProfileResolver::TierTable table;
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        const json& entry = tiers.at(i);
        std::string path = "tiers[" + std::to_string(i) + "]";
        if (!entry.is_object()) {
            throw ConfigError("Config key '" + path + "' must be an object");
        }

        ResourceLimits limits;
        std::string name = Required<std::string>(entry, path, "name");
        limits.memory_bytes = Required<std::uint64_t>(entry, path, "memory_bytes");
        limits.cpu_cores = Required<double>(entry, path, "cpu_cores");
        limits.disk_bytes = Required<std::uint64_t>(entry, path, "disk_bytes");
        limits.max_processes = Required<std::uint32_t>(entry, path, "max_processes");
        limits.network_mode = ParseNetworkMode(Required<std::string>(entry, path, "network"));

        auto timeout = Required<std::int64_t>(entry, path, "timeout_seconds");
        RequireAtMost(timeout, kMaxDurationSeconds, path + ".timeout_seconds");
        limits.timeout = std::chrono::seconds(timeout);

        table.emplace_back(utils::StringUtils::ToLower(name), limits);
    }

    ResourceProfileResolver::Validate(table);
    return table;
}

} // anonymous namespace

EngineConfig EngineConfig::FromJson(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    EngineConfig config;

    // logging
    const json* logging = Section(document, "logging");
    Read(logging, "logging", "level", config.logging.level);
    Read(logging, "logging", "pattern", config.logging.pattern);

    // docker
    const json* docker = Section(document, "docker");
    Read(docker, "docker", "binary", config.docker.binary);
    Read(docker, "docker", "endpoint", config.docker.endpoint);
    Read(docker, "docker", "output_limit_bytes", config.docker.output_limit);
    Read(docker, "docker", "internal_network", config.docker.internal_network);
    Read(docker, "docker", "scratch_path", config.docker.scratch_path);
    Read(docker, "docker", "keepalive_command", config.docker.keepalive_command);
    Read(docker, "docker", "label", config.docker.label);
    Read(docker, "docker", "cap_drop", config.docker.cap_drop);
    Read(docker, "docker", "security_opts", config.docker.security_opts);

    std::string disk_quota = runtime::DiskQuotaModeName(config.docker.disk_quota);
    Read(docker, "docker", "disk_quota", disk_quota);
    config.docker.disk_quota = runtime::ParseDiskQuotaMode(disk_quota);

    std::int64_t stop_grace = config.unit.stop_grace.count();
    Read(docker, "docker", "stop_grace_seconds", stop_grace);
    config.unit.stop_grace = std::chrono::seconds(stop_grace);

    // unit
    const json* unit = Section(document, "unit");
    std::string pull_policy = PullPolicyName(config.unit.pull_policy);
    Read(unit, "unit", "pull_policy", pull_policy);
    config.unit.pull_policy = ParsePullPolicy(pull_policy);

    std::int64_t cleanup_timeout = config.unit.cleanup_timeout.count();
    Read(unit, "unit", "cleanup_timeout_seconds", cleanup_timeout);
    config.unit.cleanup_timeout = std::chrono::seconds(cleanup_timeout);

    std::int64_t poll_interval = config.unit.poll_interval.count();
    Read(unit, "unit", "poll_interval_ms", poll_interval);
    config.unit.poll_interval = std::chrono::milliseconds(poll_interval);

    std::int64_t kill_grace = config.unit.kill_grace.count();
    Read(unit, "unit", "kill_grace_ms", kill_grace);
    config.unit.kill_grace = std::chrono::milliseconds(kill_grace);

    if (config.docker.binary.empty()) {
        throw ConfigError("Config key 'docker.binary' must not be empty");
    }
    if (config.docker.keepalive_command.empty()) {
        throw ConfigError("Config key 'docker.keepalive_command' must not be empty");
    }
    if (config.docker.output_limit == 0) {
        throw ConfigError("Config key 'docker.output_limit_bytes' must be > 0");
    }
    if (stop_grace < 0) {
        throw ConfigError("Config key 'docker.stop_grace_seconds' must be >= 0");
    }
    if (cleanup_timeout <= 0) {
        throw ConfigError("Config key 'unit.cleanup_timeout_seconds' must be > 0");
    }
    if (poll_interval <= 0) {
        throw ConfigError("Config key 'unit.poll_interval_ms' must be > 0");
    }
    if (kill_grace <= 0) {
        throw ConfigError("Config key 'unit.kill_grace_ms' must be > 0");
    }
    RequireAtMost(stop_grace, kMaxDurationSeconds, "docker.stop_grace_seconds");
    RequireAtMost(cleanup_timeout, kMaxDurationSeconds, "unit.cleanup_timeout_seconds");
    RequireAtMost(poll_interval, kMaxDurationSeconds * 1000, "unit.poll_interval_ms");
    RequireAtMost(kill_grace, kMaxDurationSeconds * 1000, "unit.kill_grace_ms");

    // tiers
    if (document.contains("tiers")) {
        config.tiers = ParseTiers(document.at("tiers"));
    }

    return config;
}

EngineConfig EngineConfig::LoadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open config file: " + path);
    }

    json document;
    try {
        file >> document;
    }
    catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path + ": " + e.what());
    }

    spdlog::debug("Loaded config file: {}", path);
    return FromJson(document);
}

ResourceProfileResolver EngineConfig::MakeResolver() const {
    if (tiers) {
        return ResourceProfileResolver(*tiers);
    }
    return ResourceProfileResolver();
}

void EngineConfig::ApplyLogging() const {
    static const char* const kLevels[] = {
        "trace", "debug", "info", "warn", "warning", "error", "critical", "off"
    };

    std::string level = utils::StringUtils::ToLower(logging.level);
    bool known = false;
    for (const char* candidate : kLevels) {
        if (level == candidate) {
            known = true;
        }
    }
    if (!known) {
        throw ConfigError("Unknown log level: '" + logging.level + "'");
    }

    spdlog::set_level(spdlog::level::from_str(level == "warning" ? "warn" : level));
    spdlog::set_pattern(logging.pattern);
}

} // namespace core
} // namespace taskbox

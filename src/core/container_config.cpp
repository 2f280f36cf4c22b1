/**
 * @file container_config.cpp
 * @brief Container configuration validation and builder
 *
 * @date 2025
 */

#include "taskbox/core/container_config.hpp"
#include "taskbox/core/errors.hpp"
#include "taskbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <set>

namespace taskbox {
namespace core {

namespace {

// Smallest memory ceiling the docker daemon accepts
constexpr std::uint64_t kMinMemoryBytes = 6ULL * 1024ULL * 1024ULL;

bool IsValidEnvKey(const std::string& key) {
    if (key.empty() || std::isdigit(static_cast<unsigned char>(key[0]))) {
        return false;
    }
    for (char c : key) {
        if (c == '=' || c == '\0' || std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool IsValidContainerName(const std::string& name) {
    // [a-zA-Z0-9][a-zA-Z0-9_.-]*
    if (name.empty() || !std::isalnum(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// VOLUME MOUNTS
// ============================================================================

std::string VolumeMount::ToBindString() const {
    if (read_only) {
        return host_path + ":" + container_path + ":ro";
    }
    return host_path + ":" + container_path;
}

VolumeMount VolumeMount::Parse(const std::string& spec) {
    auto parts = utils::StringUtils::Split(spec, ':', true);

    if (parts.size() < 2 || parts.size() > 3 || parts[0].empty() || parts[1].empty()) {
        throw ConfigError("Invalid mount '" + spec + "' (expected host:container[:ro])");
    }

    VolumeMount mount;
    mount.host_path = parts[0];
    mount.container_path = parts[1];

    if (parts.size() == 3) {
        if (parts[2] == "ro") {
            mount.read_only = true;
        } else if (parts[2] != "rw") {
            throw ConfigError("Invalid mount mode '" + parts[2] + "' in '" + spec + "'");
        }
    }

    return mount;
}

// ============================================================================
// VALIDATION
// ============================================================================

void ContainerConfig::Validate() const {
    if (utils::StringUtils::Trim(image).empty()) {
        throw ConfigError("Container image not specified");
    }

    for (const auto& [key, value] : environment) {
        if (!IsValidEnvKey(key)) {
            throw ConfigError("Invalid environment variable name: '" + key + "'");
        }
    }

    std::set<std::string> targets;
    for (const auto& mount : mounts) {
        if (mount.host_path.empty()) {
            throw ConfigError("Mount for '" + mount.container_path + "' has no host path");
        }
        if (!utils::StringUtils::StartsWith(mount.container_path, "/")) {
            throw ConfigError("Mount target must be absolute: '" + mount.container_path + "'");
        }
        if (!targets.insert(mount.container_path).second) {
            throw ConfigError("Duplicate mount target: '" + mount.container_path + "'");
        }
    }

    if (limits.memory_bytes < kMinMemoryBytes) {
        throw ConfigError("Memory limit below runtime minimum: " +
                          utils::StringUtils::FormatBytes(limits.memory_bytes));
    }
    if (limits.cpu_cores <= 0.0) {
        throw ConfigError("CPU limit must be > 0");
    }
    if (limits.max_processes == 0) {
        throw ConfigError("Process limit must be > 0");
    }
    if (limits.timeout.count() <= 0 || limits.timeout > kMaxTimeout) {
        throw ConfigError("Timeout must be > 0 and at most " + std::to_string(kMaxTimeout.count()) +
                          "h, got " + std::to_string(limits.timeout.count()) + "s");
    }

    if (name && !IsValidContainerName(*name)) {
        throw ConfigError("Invalid container name: '" + *name + "'");
    }

    if (!working_dir.empty() && !utils::StringUtils::StartsWith(working_dir, "/")) {
        throw ConfigError("Working directory must be absolute: '" + working_dir + "'");
    }
}

// ============================================================================
// BUILDER
// ============================================================================

ContainerBuilder& ContainerBuilder::WithImage(const std::string& image) {
    config_.image = image;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithCommand(const std::vector<std::string>& command) {
    config_.command = command;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithEnvironment(const std::string& key,
                                                    const std::string& value) {
    config_.environment[key] = value;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const std::string& host_path,
                                              const std::string& container_path) {
    config_.mounts.push_back({host_path, container_path, false});
    return *this;
}

ContainerBuilder& ContainerBuilder::WithReadOnlyMount(const std::string& host_path,
                                                      const std::string& container_path) {
    config_.mounts.push_back({host_path, container_path, true});
    return *this;
}

ContainerBuilder& ContainerBuilder::WithMount(const VolumeMount& mount) {
    config_.mounts.push_back(mount);
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLimits(const ResourceLimits& limits) {
    config_.limits = limits;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithNetwork(NetworkMode mode) {
    config_.network_mode = mode;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithName(const std::string& name) {
    config_.name = name;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithWorkingDir(const std::string& dir) {
    config_.working_dir = dir;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithUser(const std::string& user) {
    config_.user = user;
    return *this;
}

ContainerBuilder& ContainerBuilder::WithLabel(const std::string& key, const std::string& value) {
    config_.labels[key] = value;
    return *this;
}

ContainerConfig ContainerBuilder::Build() const {
    config_.Validate();
    if (config_.network_mode && *config_.network_mode != config_.limits.network_mode) {
        spdlog::debug("Network mode overridden: {} -> {}",
                      NetworkModeName(config_.limits.network_mode),
                      NetworkModeName(*config_.network_mode));
    }
    return config_;
}

} // namespace core
} // namespace taskbox

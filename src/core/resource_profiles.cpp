/**
 * @file resource_profiles.cpp
 * @brief Built-in difficulty tiers and tier resolution
 *
 * **Built-in tiers**:
 * ```
 * tier       memory  cpus  disk   pids  network   timeout
 * easy       512M    0.5   2G     50    none      10 min
 * medium     1G      1.0   5G     100   internal  20 min
 * hard       2G      2.0   10G    200   internal  40 min
 * expert     4G      4.0   20G    500   internal  80 min
 * nightmare  8G      8.0   50G    1000  internal  150 min
 * ```
 *
 * @date 2025
 */

#include "taskbox/core/resource_profiles.hpp"
#include "taskbox/core/errors.hpp"
#include "taskbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <set>

namespace taskbox {
namespace core {

namespace {

constexpr std::uint64_t kMiB = 1024ULL * 1024ULL;
constexpr std::uint64_t kGiB = 1024ULL * kMiB;

} // anonymous namespace

// ============================================================================
// NETWORK MODE / TIER NAMES
// ============================================================================

const char* NetworkModeName(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::NONE:     return "none";
        case NetworkMode::INTERNAL: return "internal";
        case NetworkMode::EXTERNAL: return "external";
    }
    return "none";
}

NetworkMode ParseNetworkMode(const std::string& value) {
    std::string lower = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    if (lower == "none") {
        return NetworkMode::NONE;
    }
    if (lower == "internal") {
        return NetworkMode::INTERNAL;
    }
    if (lower == "external" || lower == "bridge") {
        return NetworkMode::EXTERNAL;
    }
    throw ConfigError("Unknown network mode: '" + value + "'");
}

const char* DifficultyTierName(DifficultyTier tier) {
    switch (tier) {
        case DifficultyTier::EASY:      return "easy";
        case DifficultyTier::MEDIUM:    return "medium";
        case DifficultyTier::HARD:      return "hard";
        case DifficultyTier::EXPERT:    return "expert";
        case DifficultyTier::NIGHTMARE: return "nightmare";
    }
    return "medium";
}

// ============================================================================
// RESOURCE LIMITS
// ============================================================================

std::string ResourceLimits::MemoryString() const {
    std::uint64_t mb = memory_bytes / kMiB;
    if (mb >= 1024 && mb % 1024 == 0) {
        return std::to_string(mb / 1024) + "G";
    }
    return std::to_string(mb) + "M";
}

std::string ResourceLimits::DiskString() const {
    return std::to_string(disk_bytes / kGiB) + "G";
}

std::int64_t ResourceLimits::CpuQuota() const {
    return static_cast<std::int64_t>(static_cast<double>(CpuPeriod()) * cpu_cores);
}

bool ResourceLimits::operator==(const ResourceLimits& other) const {
    return memory_bytes == other.memory_bytes &&
           cpu_cores == other.cpu_cores &&
           disk_bytes == other.disk_bytes &&
           max_processes == other.max_processes &&
           network_mode == other.network_mode &&
           timeout == other.timeout;
}

bool IsNonDecreasing(const ResourceLimits& lower, const ResourceLimits& higher) {
    return higher.memory_bytes >= lower.memory_bytes &&
           higher.cpu_cores >= lower.cpu_cores &&
           higher.disk_bytes >= lower.disk_bytes &&
           higher.max_processes >= lower.max_processes &&
           static_cast<int>(higher.network_mode) >= static_cast<int>(lower.network_mode) &&
           higher.timeout >= lower.timeout;
}

// ============================================================================
// RESOLVER
// ============================================================================

ResourceProfileResolver::ResourceProfileResolver()
    : tiers_(DefaultTable()) {
}

ResourceProfileResolver::ResourceProfileResolver(TierTable tiers)
    : tiers_(std::move(tiers)) {
    Validate(tiers_);
    spdlog::debug("Resource profile resolver loaded {} custom tiers", tiers_.size());
}

ResourceLimits ResourceProfileResolver::Resolve(const std::string& tier) const {
    std::string key = utils::StringUtils::ToLower(utils::StringUtils::Trim(tier));

    for (const auto& [name, limits] : tiers_) {
        if (name == key) {
            return limits;
        }
    }

    throw ConfigError("Unknown difficulty tier: '" + tier + "' (known: " +
                      utils::StringUtils::Join(TierNames(), ", ") + ")");
}

ResourceLimits ResourceProfileResolver::Resolve(DifficultyTier tier) const {
    return Resolve(std::string(DifficultyTierName(tier)));
}

bool ResourceProfileResolver::HasTier(const std::string& tier) const {
    std::string key = utils::StringUtils::ToLower(utils::StringUtils::Trim(tier));
    for (const auto& entry : tiers_) {
        if (entry.first == key) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ResourceProfileResolver::TierNames() const {
    std::vector<std::string> names;
    names.reserve(tiers_.size());
    for (const auto& entry : tiers_) {
        names.push_back(entry.first);
    }
    return names;
}

ResourceLimits ResourceProfileResolver::DefaultLimits(DifficultyTier tier) {
    ResourceLimits limits;

    switch (tier) {
        case DifficultyTier::EASY:
            limits.memory_bytes = 512 * kMiB;
            limits.cpu_cores = 0.5;
            limits.disk_bytes = 2 * kGiB;
            limits.max_processes = 50;
            limits.network_mode = NetworkMode::NONE;
            limits.timeout = std::chrono::seconds(600);
            break;
        case DifficultyTier::MEDIUM:
            limits.memory_bytes = 1 * kGiB;
            limits.cpu_cores = 1.0;
            limits.disk_bytes = 5 * kGiB;
            limits.max_processes = 100;
            limits.network_mode = NetworkMode::INTERNAL;
            limits.timeout = std::chrono::seconds(1200);
            break;
        case DifficultyTier::HARD:
            limits.memory_bytes = 2 * kGiB;
            limits.cpu_cores = 2.0;
            limits.disk_bytes = 10 * kGiB;
            limits.max_processes = 200;
            limits.network_mode = NetworkMode::INTERNAL;
            limits.timeout = std::chrono::seconds(2400);
            break;
        case DifficultyTier::EXPERT:
            limits.memory_bytes = 4 * kGiB;
            limits.cpu_cores = 4.0;
            limits.disk_bytes = 20 * kGiB;
            limits.max_processes = 500;
            limits.network_mode = NetworkMode::INTERNAL;
            limits.timeout = std::chrono::seconds(4800);
            break;
        case DifficultyTier::NIGHTMARE:
            limits.memory_bytes = 8 * kGiB;
            limits.cpu_cores = 8.0;
            limits.disk_bytes = 50 * kGiB;
            limits.max_processes = 1000;
            limits.network_mode = NetworkMode::INTERNAL;
            limits.timeout = std::chrono::seconds(9000);
            break;
    }

    return limits;
}

ResourceProfileResolver::TierTable ResourceProfileResolver::DefaultTable() {
    TierTable table;
    for (auto tier : {DifficultyTier::EASY, DifficultyTier::MEDIUM, DifficultyTier::HARD,
                      DifficultyTier::EXPERT, DifficultyTier::NIGHTMARE}) {
        table.emplace_back(DifficultyTierName(tier), DefaultLimits(tier));
    }
    return table;
}

void ResourceProfileResolver::Validate(const TierTable& tiers) {
    if (tiers.empty()) {
        throw ConfigError("Tier table is empty");
    }

    std::set<std::string> seen;
    for (std::size_t i = 0; i < tiers.size(); ++i) {
        const auto& [name, limits] = tiers[i];

        if (name.empty()) {
            throw ConfigError("Tier at position " + std::to_string(i) + " has no name");
        }
        if (name != utils::StringUtils::ToLower(name)) {
            throw ConfigError("Tier name must be lowercase: '" + name + "'");
        }
        if (!seen.insert(name).second) {
            throw ConfigError("Duplicate tier: '" + name + "'");
        }
        if (limits.memory_bytes == 0 || limits.cpu_cores <= 0.0 ||
            limits.max_processes == 0 || limits.timeout.count() <= 0) {
            throw ConfigError("Tier '" + name + "' has a zero memory, cpu, process or timeout limit");
        }
        if (limits.timeout > kMaxTimeout) {
            throw ConfigError("Tier '" + name + "' timeout exceeds " +
                              std::to_string(kMaxTimeout.count()) + "h");
        }
        if (i > 0 && !IsNonDecreasing(tiers[i - 1].second, limits)) {
            throw ConfigError("Tier '" + name + "' has a lower limit than the preceding tier '" +
                              tiers[i - 1].first + "'");
        }
    }
}

} // namespace core
} // namespace taskbox

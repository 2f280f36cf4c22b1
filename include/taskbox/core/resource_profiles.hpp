/**
 * @file resource_profiles.hpp
 * @brief Difficulty tiers and the resource ceilings assigned to them
 *
 * Maps a difficulty tier identifier to an immutable ResourceLimits value.
 * Pure and side-effect free: no daemon interaction happens here.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace taskbox {
namespace core {

/**
 * @enum NetworkMode
 * @brief Network isolation level of a unit, ordered from most to least isolated
 */
enum class NetworkMode {
    NONE,      ///< No network at all
    INTERNAL,  ///< Isolated bridge, no outbound route
    EXTERNAL   ///< Default bridge, outbound-capable
};

const char* NetworkModeName(NetworkMode mode);

/**
 * @brief Parse "none" / "internal" / "external" (case-insensitive)
 * @throws ConfigError on any other value
 */
NetworkMode ParseNetworkMode(const std::string& value);

/**
 * @enum DifficultyTier
 * @brief Built-in tiers, in increasing order of resources
 */
enum class DifficultyTier {
    EASY,
    MEDIUM,
    HARD,
    EXPERT,
    NIGHTMARE
};

const char* DifficultyTierName(DifficultyTier tier);

/// Longest wall-clock budget a unit may be given
inline constexpr std::chrono::hours kMaxTimeout{24 * 7};

/**
 * @struct ResourceLimits
 * @brief Resource ceilings enforced on one execution unit
 */
struct ResourceLimits {
    std::uint64_t memory_bytes{0};               ///< Hard memory ceiling (OOM kill on exceed)
    double cpu_cores{0.0};                       ///< Fractional-core throttle
    std::uint64_t disk_bytes{0};                 ///< Writable layer / scratch size cap
    std::uint32_t max_processes{0};              ///< PID ceiling
    NetworkMode network_mode{NetworkMode::NONE}; ///< Network isolation
    std::chrono::seconds timeout{0};             ///< Wall-clock budget

    /// Memory limit as "512M" / "2G"
    std::string MemoryString() const;

    /// Disk limit as "2G"
    std::string DiskString() const;

    /// CFS period in microseconds (fixed at 100ms)
    std::int64_t CpuPeriod() const { return 100000; }

    /// CFS quota in microseconds: period * cores
    std::int64_t CpuQuota() const;

    bool operator==(const ResourceLimits& other) const;
    bool operator!=(const ResourceLimits& other) const { return !(*this == other); }
};

/**
 * @brief True if every dimension of @p higher is >= the one of @p lower
 */
bool IsNonDecreasing(const ResourceLimits& lower, const ResourceLimits& higher);

/**
 * @class ResourceProfileResolver
 * @brief Pure mapping tier -> ResourceLimits
 *
 * The default table holds the five built-in tiers. A custom table may be
 * supplied (e.g. from the configuration file); it is validated on
 * construction so that the tier order stays monotonic in every dimension.
 *
 * **Usage Example**:
 * @code
 * ResourceProfileResolver resolver;
 * ResourceLimits limits = resolver.Resolve("hard");
 * // limits.memory_bytes == 2 GiB, limits.timeout == 2400s
 * @endcode
 *
 * **Thread Safety**: immutable after construction, safe to share.
 */
class ResourceProfileResolver {
public:
    using TierTable = std::vector<std::pair<std::string, ResourceLimits>>;

    /// Resolver over the built-in tiers
    ResourceProfileResolver();

    /**
     * @brief Resolver over a custom, ordered tier table
     * @throws ConfigError if the table is empty, has duplicate names or is not monotonic
     */
    explicit ResourceProfileResolver(TierTable tiers);

    /**
     * @brief Resolve a tier name (case-insensitive)
     * @return Copy of the tier's limits
     * @throws ConfigError naming the tier if it is unknown
     */
    ResourceLimits Resolve(const std::string& tier) const;

    ResourceLimits Resolve(DifficultyTier tier) const;

    bool HasTier(const std::string& tier) const;

    /// Tier names in increasing order
    std::vector<std::string> TierNames() const;

    const TierTable& Tiers() const { return tiers_; }

    /// Built-in limits of one tier
    static ResourceLimits DefaultLimits(DifficultyTier tier);

    /// Built-in table (easy .. nightmare)
    static TierTable DefaultTable();

    /**
     * @brief Check ordering and uniqueness of a tier table
     * @throws ConfigError describing the first violation
     */
    static void Validate(const TierTable& tiers);

private:
    TierTable tiers_;
};

} // namespace core
} // namespace taskbox

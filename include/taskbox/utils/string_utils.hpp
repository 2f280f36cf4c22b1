/**
 * @file string_utils.hpp
 * @brief String helpers shared by the gateway, resolver and CLI
 *
 * @date 2025
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace taskbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * Covers the small set of operations the engine needs when talking to the
 * runtime client: trimming client output, case-insensitive tier lookup,
 * parsing `KEY=VALUE` / `host:container[:ro]` arguments and rendering argv
 * vectors for logs.
 */
class StringUtils {
public:
    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter
     * @param keep_empty Keep empty tokens (default: drop them)
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter,
                                          bool keep_empty = false);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /// Case-insensitive substring test
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Render an argv vector as a single shell-like line for logging
     *
     * Arguments containing whitespace or quotes are single-quoted.
     */
    static std::string FormatCommand(const std::vector<std::string>& argv);

    /// Human readable byte count ("512.00 MB")
    static std::string FormatBytes(std::uint64_t bytes);

    static std::string Truncate(const std::string& str, std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace taskbox

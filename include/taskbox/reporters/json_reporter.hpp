/**
 * @file json_reporter.hpp
 * @brief JSON rendering of unit results, lifecycle snapshots and tier tables
 *
 * Output of this reporter is what the CLI prints and what audit consumers
 * read: the ExecResult, the status history and every command issued.
 *
 * @date 2025
 */

#pragma once

#include "taskbox/core/execution_unit.hpp"
#include "taskbox/core/resource_profiles.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace taskbox {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    bool pretty_print{true};     ///< Pretty print JSON
    int indent_size{2};          ///< Indentation spaces
    bool include_output{true};   ///< Include captured stdout/stderr
    bool include_history{true};  ///< Include transitions and invocations
};

/**
 * @class JsonReporter
 * @brief Machine-readable JSON report generator
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::cout << reporter.Dump(reporter.RunReport(unit.Snapshot(), result, "")) << std::endl;
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    nlohmann::json ToJson(const core::ExecResult& result) const;
    nlohmann::json ToJson(const core::UnitSnapshot& snapshot) const;
    nlohmann::json ToJson(const core::ResourceLimits& limits) const;
    nlohmann::json ToJson(const core::ExecutionStatus& status) const;

    /// Ordered array of {name, limits...}
    nlohmann::json TierTable(const core::ResourceProfileResolver& resolver) const;

    /**
     * @brief Report of one run: snapshot plus result or error
     * @param error Empty on success
     */
    nlohmann::json RunReport(const core::UnitSnapshot& snapshot,
                             const std::optional<core::ExecResult>& result,
                             const std::string& error) const;

    /// Serialize; invalid UTF-8 in captured output is replaced, not rejected
    std::string Dump(const nlohmann::json& document) const;

    /**
     * @brief Write a document to @p path, creating parent directories
     * @throws std::runtime_error if the file cannot be written
     */
    void WriteToFile(const nlohmann::json& document, const std::filesystem::path& path) const;

    /// ISO-8601 UTC with milliseconds ("2025-01-31T12:00:00.250Z")
    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace taskbox

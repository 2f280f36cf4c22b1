/**
 * @file json_reporter.cpp
 * @brief JSON report generation
 *
 * Report layout:
 * ```
 * {
 *   "unit":   { id, name, image, command, status, created_at, started_at,
 *               completed_at, transitions[], invocations[] },
 *   "result": { exit_code, stdout, stderr, duration_ms, ... } | null,
 *   "error":  "..." | null
 * }
 * ```
 *
 * @date 2025
 */

#include "taskbox/reporters/json_reporter.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace taskbox {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

json JsonReporter::ToJson(const core::ExecResult& result) const {
    json j = {
        {"exit_code", result.exit_code},
        {"duration_ms", result.duration.count()},
        {"stdout_truncated", result.stdout_truncated},
        {"stderr_truncated", result.stderr_truncated}
    };

    if (config_.include_output) {
        j["stdout"] = result.stdout_data;
        j["stderr"] = result.stderr_data;
    }
    return j;
}

json JsonReporter::ToJson(const core::ExecutionStatus& status) const {
    json j = {{"state", core::StatusKindName(core::KindOf(status))}};

    if (const auto* completed = std::get_if<core::CompletedState>(&status)) {
        j["exit_code"] = completed->exit_code;
    } else if (const auto* failed = std::get_if<core::FailedState>(&status)) {
        j["reason"] = failed->reason;
    }
    return j;
}

json JsonReporter::ToJson(const core::ResourceLimits& limits) const {
    return {
        {"memory_bytes", limits.memory_bytes},
        {"memory", limits.MemoryString()},
        {"cpu_cores", limits.cpu_cores},
        {"cpu_period_us", limits.CpuPeriod()},
        {"cpu_quota_us", limits.CpuQuota()},
        {"disk_bytes", limits.disk_bytes},
        {"disk", limits.DiskString()},
        {"max_processes", limits.max_processes},
        {"network", core::NetworkModeName(limits.network_mode)},
        {"timeout_seconds", limits.timeout.count()}
    };
}

json JsonReporter::ToJson(const core::UnitSnapshot& snapshot) const {
    auto optional_time = [](const auto& time) -> json {
        return time ? json(FormatTimestamp(*time)) : json(nullptr);
    };

    json j = {
        {"id", snapshot.id},
        {"name", snapshot.name},
        {"image", snapshot.image},
        {"command", snapshot.command},
        {"status", ToJson(snapshot.status)},
        {"created_at", FormatTimestamp(snapshot.created_at)},
        {"started_at", optional_time(snapshot.started_at)},
        {"completed_at", optional_time(snapshot.completed_at)}
    };

    if (!config_.include_history) {
        return j;
    }

    json transitions = json::array();
    for (const auto& transition : snapshot.transitions) {
        transitions.push_back({
            {"from", core::ToString(transition.from)},
            {"to", core::ToString(transition.to)},
            {"at", FormatTimestamp(transition.at)}
        });
    }
    j["transitions"] = transitions;

    json invocations = json::array();
    for (const auto& invocation : snapshot.invocations) {
        json entry = {
            {"argv", invocation.argv},
            {"started_at", FormatTimestamp(invocation.started_at)},
            {"duration_ms", invocation.duration.count()}
        };
        if (invocation.exit_code) {
            entry["exit_code"] = *invocation.exit_code;
        } else {
            entry["error"] = invocation.error;
        }
        invocations.push_back(entry);
    }
    j["invocations"] = invocations;

    return j;
}

json JsonReporter::TierTable(const core::ResourceProfileResolver& resolver) const {
    json tiers = json::array();
    for (const auto& [name, limits] : resolver.Tiers()) {
        json entry = ToJson(limits);
        entry["name"] = name;
        tiers.push_back(entry);
    }
    return tiers;
}

json JsonReporter::RunReport(const core::UnitSnapshot& snapshot,
                             const std::optional<core::ExecResult>& result,
                             const std::string& error) const {
    json report = {
        {"generated_at", FormatTimestamp(std::chrono::system_clock::now())},
        {"unit", ToJson(snapshot)},
        {"result", result ? ToJson(*result) : json(nullptr)},
        {"error", error.empty() ? json(nullptr) : json(error)}
    };
    return report;
}

std::string JsonReporter::Dump(const json& document) const {
    return document.dump(config_.pretty_print ? config_.indent_size : -1, ' ', false,
                         json::error_handler_t::replace);
}

void JsonReporter::WriteToFile(const json& document, const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write report: " + path.string());
    }
    file << Dump(document) << '\n';

    spdlog::info("[REPORT] JSON report saved: {}", path.string());
}

std::string JsonReporter::FormatTimestamp(const std::chrono::system_clock::time_point& time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace reporters
} // namespace taskbox

/**
 * @file test_json_reporter.cpp
 * @brief Unit tests for JSON run reports.
 */

#include "taskbox/reporters/json_reporter.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace taskbox;
using namespace taskbox::core;
using taskbox::reporters::JsonReporter;
using taskbox::reporters::JsonReporterConfig;
using json = nlohmann::json;

namespace {

UnitSnapshot CompletedSnapshot() {
    UnitSnapshot snapshot;
    snapshot.id = "c0ffee";
    snapshot.name = "taskbox_1";
    snapshot.image = "alpine:3.19";
    snapshot.status = CompletedState{7};
    snapshot.created_at = std::chrono::system_clock::now();
    snapshot.started_at = snapshot.created_at;
    snapshot.completed_at = snapshot.created_at;
    snapshot.transitions.push_back({PendingState{}, CreatingState{}, snapshot.created_at});
    snapshot.transitions.push_back({CreatingState{}, RunningState{}, snapshot.created_at});
    snapshot.transitions.push_back({RunningState{}, CompletedState{7}, snapshot.created_at});

    InvocationRecord invocation;
    invocation.argv = {"sh", "-c", "exit 7"};
    invocation.started_at = snapshot.created_at;
    invocation.exit_code = 7;
    snapshot.invocations.push_back(invocation);
    return snapshot;
}

} // namespace

TEST(JsonReporterTest, StatusCarriesPayload) {
    JsonReporter reporter;
    EXPECT_EQ(reporter.ToJson(ExecutionStatus(CompletedState{7})),
              (json{{"state", "completed"}, {"exit_code", 7}}));
    EXPECT_EQ(reporter.ToJson(ExecutionStatus(FailedState{"cancelled"})),
              (json{{"state", "failed"}, {"reason", "cancelled"}}));
    EXPECT_EQ(reporter.ToJson(ExecutionStatus(TimeoutState{})), (json{{"state", "timeout"}}));
}

TEST(JsonReporterTest, RunReportWithResult) {
    JsonReporter reporter;
    ExecResult result;
    result.exit_code = 7;
    result.stdout_data = "out\n";

    json report = reporter.RunReport(CompletedSnapshot(), result, "");

    EXPECT_TRUE(report["error"].is_null());
    EXPECT_EQ(report["result"]["exit_code"], 7);
    EXPECT_EQ(report["result"]["stdout"], "out\n");
    EXPECT_EQ(report["unit"]["status"]["state"], "completed");
    EXPECT_EQ(report["unit"]["transitions"].size(), 3u);
    EXPECT_EQ(report["unit"]["transitions"][2]["to"], "completed(7)");
    EXPECT_EQ(report["unit"]["invocations"][0]["exit_code"], 7);
}

TEST(JsonReporterTest, RunReportWithError) {
    JsonReporter reporter;
    UnitSnapshot snapshot = CompletedSnapshot();
    snapshot.status = TimeoutState{};

    json report = reporter.RunReport(snapshot, std::nullopt, "Unit exceeded its budget");
    EXPECT_TRUE(report["result"].is_null());
    EXPECT_EQ(report["error"], "Unit exceeded its budget");
}

TEST(JsonReporterTest, OutputAndHistoryCanBeOmitted) {
    JsonReporterConfig config;
    config.include_output = false;
    config.include_history = false;
    JsonReporter reporter(config);

    ExecResult result;
    result.stdout_data = "secret";
    json report = reporter.RunReport(CompletedSnapshot(), result, "");

    EXPECT_FALSE(report["result"].contains("stdout"));
    EXPECT_FALSE(report["unit"].contains("transitions"));
}

TEST(JsonReporterTest, InvalidUtf8IsReplacedOnDump) {
    JsonReporter reporter(JsonReporterConfig{false, 2, true, true});
    ExecResult result;
    result.stdout_data = std::string("bad \xff byte");

    std::string text;
    ASSERT_NO_THROW(text = reporter.Dump(reporter.ToJson(result)));
    EXPECT_NE(text.find("\xEF\xBF\xBD"), std::string::npos);
}

TEST(JsonReporterTest, TierTableListsEveryTier) {
    JsonReporter reporter;
    json tiers = reporter.TierTable(ResourceProfileResolver());
    ASSERT_EQ(tiers.size(), 5u);
    EXPECT_EQ(tiers[0]["name"], "easy");
    EXPECT_EQ(tiers[0]["memory"], "512M");
    EXPECT_EQ(tiers[0]["network"], "none");
    EXPECT_EQ(tiers[4]["name"], "nightmare");
}

TEST(JsonReporterTest, TimestampFormat) {
    auto epoch = std::chrono::system_clock::time_point(std::chrono::milliseconds(1250));
    EXPECT_EQ(JsonReporter::FormatTimestamp(epoch), "1970-01-01T00:00:01.250Z");
}

TEST(JsonReporterTest, WriteToFileCreatesDirectories) {
    auto dir = std::filesystem::temp_directory_path() /
               ("taskbox_test_report_" + std::to_string(::getpid()));
    auto path = dir / "nested" / "report.json";

    JsonReporter reporter;
    reporter.WriteToFile(json{{"ok", true}}, path);

    std::ifstream in(path);
    json loaded = json::parse(in);
    EXPECT_EQ(loaded["ok"], true);

    std::filesystem::remove_all(dir);
}

/**
 * @file test_docker_gateway.cpp
 * @brief Unit tests for the Docker gateway: argument building, error
 *        classification and the client round trip against a scripted fake
 *        docker executable.
 */

#include "taskbox/core/errors.hpp"
#include "taskbox/runtime/docker_gateway.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <future>
#include <thread>
#include <unistd.h>

using namespace taskbox;
using namespace taskbox::core;
using namespace taskbox::runtime;
using namespace std::chrono_literals;

namespace {

bool HasArg(const std::vector<std::string>& args, const std::string& arg) {
    return std::find(args.begin(), args.end(), arg) != args.end();
}

/// Value following @p flag, or "" if absent
std::string ArgAfter(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || std::next(it) == args.end()) {
        return "";
    }
    return *std::next(it);
}

ContainerConfig TierConfig(const std::string& tier) {
    return ContainerBuilder()
        .WithImage("alpine:3.19")
        .WithLimits(ResourceProfileResolver().Resolve(tier))
        .WithName("t1")
        .Build();
}

template <typename T>
T GetWithin(std::future<T>& future) {
    if (future.wait_for(10s) != std::future_status::ready) {
        throw std::runtime_error("gateway call did not complete in time");
    }
    return future.get();
}

inline void GetWithin(std::future<void>& future) {
    if (future.wait_for(10s) != std::future_status::ready) {
        throw std::runtime_error("gateway call did not complete in time");
    }
    future.get();
}

} // namespace

// ============================================================================
// CREATE ARGUMENTS
// ============================================================================

TEST(DockerCreateArgsTest, EasyTierTranslatesEveryLimit) {
    auto args = DockerGateway::BuildCreateArgs(TierConfig("easy"), GatewayOptions{});

    std::vector<std::string> expected{
        "create",
        "--label", "taskbox.managed=true",
        "--label", "taskbox.unit=t1",
        "--name", "t1",
        "--memory=536870912b", "--memory-swap=536870912b",
        "--cpus=0.5",
        "--pids-limit=50",
        "--network=none",
        "--tmpfs", "/tmp:rw,size=2147483648",
        "--cap-drop=ALL",
        "--security-opt=no-new-privileges",
        "alpine:3.19",
        "sleep", "infinity",
    };
    EXPECT_EQ(args, expected);
}

TEST(DockerCreateArgsTest, CallerLabelsCannotOverrideOwnership) {
    ContainerConfig config = ContainerBuilder()
        .WithImage("alpine:3.19")
        .WithLimits(ResourceProfileResolver().Resolve("easy"))
        .WithName("t1")
        .WithLabel("taskbox.managed", "false")
        .WithLabel("taskbox.unit", "other")
        .Build();

    auto args = DockerGateway::BuildCreateArgs(config, GatewayOptions{});

    // docker keeps the last value of a repeated label key
    std::vector<std::string> managed;
    std::vector<std::string> unit;
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] != "--label") {
            continue;
        }
        if (args[i + 1].rfind("taskbox.managed=", 0) == 0) {
            managed.push_back(args[i + 1]);
        }
        if (args[i + 1].rfind("taskbox.unit=", 0) == 0) {
            unit.push_back(args[i + 1]);
        }
    }
    ASSERT_FALSE(managed.empty());
    ASSERT_FALSE(unit.empty());
    EXPECT_EQ(managed.back(), "taskbox.managed=true");
    EXPECT_EQ(unit.back(), "taskbox.unit=t1");
}

TEST(DockerCreateArgsTest, PrivilegeHardeningFollowsOptions) {
    GatewayOptions options;
    options.cap_drop = {"NET_RAW", "SYS_ADMIN"};
    options.security_opts = {"no-new-privileges", "seccomp=/etc/taskbox/seccomp.json"};

    auto args = DockerGateway::BuildCreateArgs(TierConfig("easy"), options);
    EXPECT_TRUE(HasArg(args, "--cap-drop=NET_RAW"));
    EXPECT_TRUE(HasArg(args, "--cap-drop=SYS_ADMIN"));
    EXPECT_FALSE(HasArg(args, "--cap-drop=ALL"));
    EXPECT_TRUE(HasArg(args, "--security-opt=seccomp=/etc/taskbox/seccomp.json"));

    options.cap_drop.clear();
    options.security_opts.clear();
    auto bare = DockerGateway::BuildCreateArgs(TierConfig("easy"), options);
    for (const auto& arg : bare) {
        EXPECT_EQ(arg.rfind("--cap-drop", 0), std::string::npos) << arg;
        EXPECT_EQ(arg.rfind("--security-opt", 0), std::string::npos) << arg;
    }
}

TEST(DockerCreateArgsTest, HigherTiersUseInternalNetwork) {
    GatewayOptions options;
    options.internal_network = "sandbox-net";

    auto medium = DockerGateway::BuildCreateArgs(TierConfig("medium"), options);
    EXPECT_TRUE(HasArg(medium, "--memory=1073741824b"));
    EXPECT_TRUE(HasArg(medium, "--cpus=1"));
    EXPECT_TRUE(HasArg(medium, "--pids-limit=100"));
    EXPECT_TRUE(HasArg(medium, "--network=sandbox-net"));

    auto nightmare = DockerGateway::BuildCreateArgs(TierConfig("nightmare"), options);
    EXPECT_TRUE(HasArg(nightmare, "--memory=8589934592b"));
    EXPECT_TRUE(HasArg(nightmare, "--cpus=8"));
    EXPECT_TRUE(HasArg(nightmare, "--pids-limit=1000"));
    EXPECT_EQ(ArgAfter(nightmare, "--tmpfs"), "/tmp:rw,size=53687091200");
}

TEST(DockerCreateArgsTest, NetworkOverrideWins) {
    ContainerConfig config = TierConfig("easy");
    config.network_mode = NetworkMode::EXTERNAL;

    auto args = DockerGateway::BuildCreateArgs(config, GatewayOptions{});
    EXPECT_TRUE(HasArg(args, "--network=bridge"));
    EXPECT_FALSE(HasArg(args, "--network=none"));
}

TEST(DockerCreateArgsTest, EnvironmentMountsWorkdirAndUser) {
    ContainerConfig config = ContainerBuilder()
        .WithImage("python:3.12-slim")
        .WithLimits(ResourceProfileResolver().Resolve("easy"))
        .WithEnvironment("MODE", "grading")
        .WithEnvironment("SEED", "42")
        .WithReadOnlyMount("/srv/tasks/7", "/task")
        .WithMount("/srv/out/7", "/out")
        .WithWorkingDir("/task")
        .WithUser("1000:1000")
        .WithLabel("course", "os101")
        .WithCommand({"python3", "main.py"})
        .Build();

    auto args = DockerGateway::BuildCreateArgs(config, GatewayOptions{});

    EXPECT_TRUE(HasArg(args, "MODE=grading"));
    EXPECT_TRUE(HasArg(args, "SEED=42"));
    EXPECT_TRUE(HasArg(args, "/srv/tasks/7:/task:ro"));
    EXPECT_TRUE(HasArg(args, "/srv/out/7:/out"));
    EXPECT_EQ(ArgAfter(args, "-w"), "/task");
    EXPECT_EQ(ArgAfter(args, "--user"), "1000:1000");
    EXPECT_TRUE(HasArg(args, "course=os101"));
    EXPECT_FALSE(HasArg(args, "--name"));

    // Image is followed by the primary command, not the keep-alive
    ASSERT_GE(args.size(), 3u);
    EXPECT_EQ(args[args.size() - 3], "python:3.12-slim");
    EXPECT_EQ(args[args.size() - 2], "python3");
    EXPECT_EQ(args.back(), "main.py");
}

TEST(DockerCreateArgsTest, DiskQuotaModes) {
    GatewayOptions options;

    options.disk_quota = DiskQuotaMode::STORAGE_OPT;
    auto storage = DockerGateway::BuildCreateArgs(TierConfig("easy"), options);
    EXPECT_EQ(ArgAfter(storage, "--storage-opt"), "size=2147483648");
    EXPECT_FALSE(HasArg(storage, "--tmpfs"));

    options.disk_quota = DiskQuotaMode::NONE;
    auto none = DockerGateway::BuildCreateArgs(TierConfig("easy"), options);
    EXPECT_FALSE(HasArg(none, "--tmpfs"));
    EXPECT_FALSE(HasArg(none, "--storage-opt"));

    options.disk_quota = DiskQuotaMode::TMPFS;
    options.scratch_path = "/scratch";
    auto tmpfs = DockerGateway::BuildCreateArgs(TierConfig("easy"), options);
    EXPECT_EQ(ArgAfter(tmpfs, "--tmpfs"), "/scratch:rw,size=2147483648");
}

TEST(DockerCreateArgsTest, ParseDiskQuotaMode) {
    EXPECT_EQ(ParseDiskQuotaMode("tmpfs"), DiskQuotaMode::TMPFS);
    EXPECT_EQ(ParseDiskQuotaMode("Storage-Opt"), DiskQuotaMode::STORAGE_OPT);
    EXPECT_EQ(ParseDiskQuotaMode("none"), DiskQuotaMode::NONE);
    EXPECT_THROW(ParseDiskQuotaMode("quota"), ConfigError);
}

// ============================================================================
// ERROR CLASSIFICATION
// ============================================================================

TEST(DockerErrorTest, ConnectionFailuresWinOverFallback) {
    const std::string daemon_down =
        "Cannot connect to the Docker daemon at unix:///var/run/docker.sock. "
        "Is the docker daemon running?";
    EXPECT_EQ(DockerGateway::ClassifyError(daemon_down, ErrorKind::EXEC), ErrorKind::CONNECTION);
    EXPECT_EQ(DockerGateway::ClassifyError(daemon_down, ErrorKind::CREATE), ErrorKind::CONNECTION);
    EXPECT_EQ(DockerGateway::ClassifyError(
                  "error during connect: Get \"http://%2F%2F.%2Fpipe%2Fdocker_engine/v1.24/version\"",
                  ErrorKind::START),
              ErrorKind::CONNECTION);
}

TEST(DockerErrorTest, ImageFailuresOnlyDuringCreateOrPull) {
    const std::string missing = "Unable to find image 'nope:latest' locally";
    EXPECT_EQ(DockerGateway::ClassifyError(missing, ErrorKind::CREATE), ErrorKind::IMAGE);
    EXPECT_EQ(DockerGateway::ClassifyError(missing, ErrorKind::IMAGE), ErrorKind::IMAGE);
    EXPECT_EQ(DockerGateway::ClassifyError(missing, ErrorKind::START), ErrorKind::START);
    EXPECT_EQ(DockerGateway::ClassifyError(
                  "Error response from daemon: pull access denied for nope, "
                  "repository does not exist or may require 'docker login'",
                  ErrorKind::IMAGE),
              ErrorKind::IMAGE);
}

TEST(DockerErrorTest, RegistryRefusalRelayedByDaemonIsImageError) {
    const std::string refused =
        "Error response from daemon: Get \"https://registry.local/v2/\": "
        "dial tcp 10.0.0.5:443: connect: connection refused";
    EXPECT_EQ(DockerGateway::ClassifyError(refused, ErrorKind::IMAGE), ErrorKind::IMAGE);
    EXPECT_EQ(DockerGateway::ClassifyError(refused, ErrorKind::CREATE), ErrorKind::CREATE);

    // Without a daemon answer the refusal is the daemon socket itself
    EXPECT_EQ(DockerGateway::ClassifyError("dial unix /var/run/docker.sock: connect: connection refused",
                                           ErrorKind::IMAGE),
              ErrorKind::CONNECTION);
}

TEST(DockerErrorTest, UnknownErrorsKeepFallback) {
    EXPECT_EQ(DockerGateway::ClassifyError("Error response from daemon: conflict", ErrorKind::CREATE),
              ErrorKind::CREATE);
    EXPECT_EQ(DockerGateway::ClassifyError("", ErrorKind::CLEANUP), ErrorKind::CLEANUP);
}

TEST(DockerErrorTest, DaemonExecFailureDetection) {
    EXPECT_TRUE(DockerGateway::IsDaemonExecFailure(
        "Error response from daemon: Container abc is not running\n"));
    EXPECT_TRUE(DockerGateway::IsDaemonExecFailure(
        "OCI runtime exec failed: exec failed: unable to start container process: "
        "exec: \"nope\": executable file not found in $PATH: unknown"));
    EXPECT_FALSE(DockerGateway::IsDaemonExecFailure("ls: cannot access '/missing'"));
    EXPECT_FALSE(DockerGateway::IsDaemonExecFailure(""));
}

TEST(DockerErrorTest, OomKillCounter) {
    EXPECT_TRUE(DockerGateway::ParseOomKillCount("low 0\nhigh 0\nmax 4\noom 1\noom_kill 1\n"));
    EXPECT_TRUE(DockerGateway::ParseOomKillCount("oom_kill_disable 0\nunder_oom 0\noom_kill 2\n"));
    EXPECT_FALSE(DockerGateway::ParseOomKillCount("low 0\nhigh 0\nmax 0\noom 0\noom_kill 0\n"));
    EXPECT_FALSE(DockerGateway::ParseOomKillCount(""));
}

// ============================================================================
// CLIENT ROUND TRIP (scripted docker executable)
// ============================================================================

class DockerGatewayClientTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;
    std::filesystem::path log_path_;
    GatewayOptions options_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir_ = std::filesystem::temp_directory_path() /
                    ("taskbox_fake_docker_" + std::to_string(::getpid()) + "_" + info->name());
        std::filesystem::create_directories(temp_dir_);
        log_path_ = temp_dir_ / "calls.log";

        auto script = temp_dir_ / "docker";
        {
            std::ofstream out(script);
            out << "#!/bin/sh\n"
                << "if [ \"$1\" = \"--host\" ]; then shift 2; fi\n"
                << "echo \"$*\" >> '" << log_path_.string() << "'\n"
                << "cmd=\"$1\"; shift\n"
                << "for last; do :; done\n"
                << "case \"$cmd\" in\n"
                << "  version) echo '24.0.7' ;;\n"
                << "  create) case \"$*\" in *'--name slow'*) sleep 30 ;; esac; echo 'c0ffee0123456789' ;;\n"
                << "  start) ;;\n"
                << "  network) [ \"$1\" = inspect ] && echo true ;;\n"
                << "  inspect)\n"
                << "    case \"$last\" in\n"
                << "      oomed*) echo '{\"Status\":\"exited\",\"Running\":false,\"ExitCode\":137,\"OOMKilled\":true}' ;;\n"
                << "      running*) echo '{\"Status\":\"running\",\"Running\":true,\"ExitCode\":0,\"OOMKilled\":false}' ;;\n"
                << "      *) echo '{\"Status\":\"created\",\"Running\":false,\"ExitCode\":0,\"OOMKilled\":false}' ;;\n"
                << "    esac ;;\n"
                << "  wait) case \"$last\" in oomed*) echo 137 ;; *) echo 3 ;; esac ;;\n"
                << "  stop)\n"
                << "    case \"$last\" in\n"
                << "      stuck*) echo 'Error response from daemon: cannot stop container' >&2; exit 1 ;;\n"
                << "      *) echo \"Error response from daemon: No such container: $last\" >&2; exit 1 ;;\n"
                << "    esac ;;\n"
                << "  rm) echo \"Error response from daemon: No such container: $last\" >&2; exit 1 ;;\n"
                << "  exec) shift; exec \"$@\" ;;\n"
                << "  logs) echo 'log out'; echo 'log err' >&2 ;;\n"
                << "  pull) case \"$last\" in slow/*) sleep 30 ;; esac\n"
                << "        echo \"Error response from daemon: pull access denied for $last, repository does not exist\" >&2; exit 1 ;;\n"
                << "  image) echo \"Error: No such image: $last\" >&2; exit 1 ;;\n"
                << "  ps) printf '%s\\n' '{\"ID\":\"aaa111\",\"Names\":\"one\"}' '{\"ID\":\"bbb222\",\"Names\":\"two\"}' ;;\n"
                << "  *) echo \"unknown command $cmd\" >&2; exit 1 ;;\n"
                << "esac\n";
        }
        std::filesystem::permissions(script, std::filesystem::perms::owner_all);

        options_.binary = script.string();
        options_.endpoint = "unix:///tmp/taskbox-test.sock";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir_, ec);
    }

    std::vector<std::string> LoggedCalls() const {
        std::vector<std::string> lines;
        std::ifstream in(log_path_);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    static RuntimeHandle Handle(const std::string& id) {
        RuntimeHandle handle;
        handle.id = id;
        handle.name = id;
        return handle;
    }
};

TEST_F(DockerGatewayClientTest, PingReturnsServerVersion) {
    DockerGateway gateway(options_);
    auto version = gateway.Ping();
    EXPECT_EQ(GetWithin(version), "24.0.7");
}

TEST_F(DockerGatewayClientTest, MissingClientIsConnectionError) {
    options_.binary = (temp_dir_ / "no-such-docker").string();
    DockerGateway gateway(options_);

    auto version = gateway.Ping();
    EXPECT_THROW(GetWithin(version), ConnectionError);

    auto handle = gateway.Create(TierConfig("easy"));
    EXPECT_THROW(GetWithin(handle), ConnectionError);
}

TEST_F(DockerGatewayClientTest, CreateReturnsTrimmedId) {
    DockerGateway gateway(options_);
    auto created = gateway.Create(TierConfig("easy"));
    RuntimeHandle handle = GetWithin(created);

    EXPECT_EQ(handle.id, "c0ffee0123456789");
    EXPECT_EQ(handle.name, "t1");

    auto calls = LoggedCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].rfind("create --label taskbox.managed=true", 0), 0u);
    EXPECT_NE(calls[0].find("--memory=536870912b"), std::string::npos);
}

TEST_F(DockerGatewayClientTest, InternalNetworkIsCheckedBeforeCreate) {
    DockerGateway gateway(options_);
    auto created = gateway.Create(TierConfig("medium"));
    GetWithin(created);

    auto calls = LoggedCalls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "network inspect --format {{.Internal}} taskbox-internal");
    EXPECT_NE(calls[1].find("--network=taskbox-internal"), std::string::npos);

    // Cached after the first success
    auto again = gateway.Create(TierConfig("medium"));
    GetWithin(again);
    EXPECT_EQ(LoggedCalls().size(), 3u);
}

TEST_F(DockerGatewayClientTest, InvalidConfigIsCreateError) {
    DockerGateway gateway(options_);
    ContainerConfig config = TierConfig("easy");
    config.image.clear();

    auto created = gateway.Create(config);
    EXPECT_THROW(GetWithin(created), CreateError);
    EXPECT_TRUE(LoggedCalls().empty());
}

TEST_F(DockerGatewayClientTest, StartRejectsRunningContainer) {
    DockerGateway gateway(options_);

    auto fresh = gateway.Start(Handle("created-1"));
    EXPECT_NO_THROW(GetWithin(fresh));

    auto running = gateway.Start(Handle("running-1"));
    EXPECT_THROW(GetWithin(running), StartError);
}

TEST_F(DockerGatewayClientTest, ExecPassesOutputAndExitCodeThrough) {
    DockerGateway gateway(options_);
    auto exec = gateway.Exec(Handle("plain-1"), {"sh", "-c", "echo hi; echo oops >&2; exit 5"});
    ExecOutput output = GetWithin(exec);

    EXPECT_EQ(output.exit_code, 5);
    EXPECT_EQ(output.stdout_data, "hi\n");
    EXPECT_EQ(output.stderr_data, "oops\n");
    EXPECT_FALSE(output.oom_killed);
}

TEST_F(DockerGatewayClientTest, ExecDaemonFailureIsExecError) {
    DockerGateway gateway(options_);
    auto exec = gateway.Exec(Handle("plain-1"),
        {"sh", "-c", "echo 'Error response from daemon: Container plain-1 is not running' >&2; exit 1"});
    EXPECT_THROW(GetWithin(exec), ExecError);

    auto empty = gateway.Exec(Handle("plain-1"), {});
    EXPECT_THROW(GetWithin(empty), ExecError);
}

TEST_F(DockerGatewayClientTest, ExecKilledInOomContainerIsFlagged) {
    DockerGateway gateway(options_);
    auto exec = gateway.Exec(Handle("oomed-1"), {"sh", "-c", "exit 137"});
    ExecOutput output = GetWithin(exec);

    EXPECT_EQ(output.exit_code, 137);
    EXPECT_TRUE(output.oom_killed);
}

TEST_F(DockerGatewayClientTest, AbortInFlightCancelsExec) {
    DockerGateway gateway(options_);
    RuntimeHandle handle = Handle("plain-2");

    auto exec = gateway.Exec(handle, {"sleep", "30"});
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(gateway.AbortInFlight(handle), 1u);

    EXPECT_THROW(GetWithin(exec), CancelledError);
    EXPECT_EQ(gateway.AbortInFlight(handle), 0u);
}

TEST_F(DockerGatewayClientTest, AbortInFlightReachesCreateAndPullByName) {
    DockerGateway gateway(options_);
    ContainerConfig config = TierConfig("easy");
    config.name = "slow-1";

    auto created = gateway.Create(config);
    auto pulled = gateway.Pull("slow/image:1", "slow-1");
    auto other = gateway.Pull("slow/image:1", "slow-2");
    std::this_thread::sleep_for(100ms);

    RuntimeHandle pending;
    pending.name = "slow-1";
    EXPECT_EQ(gateway.AbortInFlight(pending), 2u);
    EXPECT_THROW(GetWithin(created), CancelledError);
    EXPECT_THROW(GetWithin(pulled), CancelledError);

    // Another unit's pull of the same image is untouched
    EXPECT_EQ(other.wait_for(0ms), std::future_status::timeout);
    RuntimeHandle unrelated;
    unrelated.name = "slow-2";
    EXPECT_EQ(gateway.AbortInFlight(unrelated), 1u);
    EXPECT_THROW(GetWithin(other), CancelledError);
}

TEST_F(DockerGatewayClientTest, WaitReportsExitAndOom) {
    DockerGateway gateway(options_);

    auto normal = gateway.Wait(Handle("plain-3"));
    ExitInfo info = GetWithin(normal);
    EXPECT_EQ(info.exit_code, 3);
    EXPECT_FALSE(info.oom_killed);

    auto oomed = gateway.Wait(Handle("oomed-2"));
    info = GetWithin(oomed);
    EXPECT_EQ(info.exit_code, 137);
    EXPECT_TRUE(info.oom_killed);
}

TEST_F(DockerGatewayClientTest, StopAndRemoveOfMissingContainerSucceed) {
    DockerGateway gateway(options_);

    auto stop = gateway.Stop(Handle("gone-1"), 0s);
    EXPECT_NO_THROW(GetWithin(stop));
    auto remove = gateway.Remove(Handle("gone-1"));
    EXPECT_NO_THROW(GetWithin(remove));

    auto stuck = gateway.Stop(Handle("stuck-1"), 1s);
    EXPECT_THROW(GetWithin(stuck), CleanupError);

    auto calls = LoggedCalls();
    EXPECT_TRUE(std::find(calls.begin(), calls.end(), "stop -t 0 gone-1") != calls.end());
    EXPECT_TRUE(std::find(calls.begin(), calls.end(), "rm -f -v gone-1") != calls.end());
}

TEST_F(DockerGatewayClientTest, PullDeniedIsImageError) {
    DockerGateway gateway(options_);
    auto pull = gateway.Pull("nope/nothing:1", "");
    EXPECT_THROW(GetWithin(pull), ImageError);

    auto exists = gateway.ImageExists("nope/nothing:1", "");
    EXPECT_FALSE(GetWithin(exists));
}

TEST_F(DockerGatewayClientTest, LogsSeparateStreams) {
    DockerGateway gateway(options_);
    auto logs = gateway.Logs(Handle("plain-4"));
    LogOutput output = GetWithin(logs);
    EXPECT_EQ(output.stdout_data, "log out\n");
    EXPECT_EQ(output.stderr_data, "log err\n");
}

TEST_F(DockerGatewayClientTest, InspectParsesState) {
    DockerGateway gateway(options_);
    auto inspect = gateway.Inspect(Handle("oomed-3"));
    ContainerState state = GetWithin(inspect);
    EXPECT_EQ(state.status, "exited");
    EXPECT_FALSE(state.running);
    EXPECT_EQ(state.exit_code, 137);
    EXPECT_TRUE(state.oom_killed);
}

TEST_F(DockerGatewayClientTest, ListReturnsLabelledIds) {
    DockerGateway gateway(options_);
    auto list = gateway.List("taskbox.managed");
    EXPECT_EQ(GetWithin(list), (std::vector<std::string>{"aaa111", "bbb222"}));

    auto calls = LoggedCalls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].find("--filter label=taskbox.managed"), std::string::npos);
}

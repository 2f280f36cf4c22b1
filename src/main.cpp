/**
 * @file main.cpp
 * @brief taskbox - command-line front end of the execution engine
 *
 * Subcommands:
 * - run:   execute one command in a fresh tiered container, print the JSON report
 * - tiers: print the resolved tier table
 * - ping:  check the container daemon is reachable
 *
 * Logs go to stderr; stdout carries only JSON (or the daemon version).
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "taskbox/core/engine_config.hpp"
#include "taskbox/core/errors.hpp"
#include "taskbox/core/scoped_unit.hpp"
#include "taskbox/reporters/json_reporter.hpp"
#include "taskbox/runtime/docker_gateway.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <thread>

using namespace taskbox;

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
    g_interrupted.store(true);
}

/// Process exit code reported for an engine failure (command exit codes pass through)
int ExitCodeFor(core::ErrorKind kind) {
    switch (kind) {
        case core::ErrorKind::CONNECTION:    return 201;
        case core::ErrorKind::IMAGE:         return 202;
        case core::ErrorKind::CREATE:        return 203;
        case core::ErrorKind::START:         return 204;
        case core::ErrorKind::EXEC:          return 205;
        case core::ErrorKind::OUT_OF_MEMORY: return 206;
        case core::ErrorKind::TIMEOUT:       return 207;
        case core::ErrorKind::CANCELLED:     return 208;
        case core::ErrorKind::CLEANUP:       return 209;
        case core::ErrorKind::CONFIG:        return 210;
    }
    return 1;
}

struct RunArguments {
    std::string tier{"easy"};
    std::string image;
    std::vector<std::string> env;
    std::vector<std::string> mounts;
    std::string name;
    std::string network;
    std::string workdir;
    std::string user;
    int timeout_seconds{0};
    bool wait_mode{false};
    std::string output_file;
    std::vector<std::string> command;
};

core::ContainerConfig BuildContainerConfig(const RunArguments& args,
                                           const core::EngineConfig& config) {
    core::ResourceLimits limits = config.MakeResolver().Resolve(args.tier);
    if (args.timeout_seconds > 0 && std::chrono::seconds(args.timeout_seconds) < limits.timeout) {
        limits.timeout = std::chrono::seconds(args.timeout_seconds);
    }

    core::ContainerBuilder builder;
    builder.WithImage(args.image).WithLimits(limits);

    for (const auto& entry : args.env) {
        auto separator = entry.find('=');
        if (separator == std::string::npos || separator == 0) {
            throw core::ConfigError("Invalid environment entry '" + entry + "' (expected KEY=VALUE)");
        }
        builder.WithEnvironment(entry.substr(0, separator), entry.substr(separator + 1));
    }
    for (const auto& mount : args.mounts) {
        builder.WithMount(core::VolumeMount::Parse(mount));
    }
    if (!args.name.empty()) {
        builder.WithName(args.name);
    }
    if (!args.network.empty()) {
        builder.WithNetwork(core::ParseNetworkMode(args.network));
    }
    if (!args.workdir.empty()) {
        builder.WithWorkingDir(args.workdir);
    }
    if (!args.user.empty()) {
        builder.WithUser(args.user);
    }
    if (args.wait_mode) {
        builder.WithCommand(args.command);
    }

    return builder.Build();
}

int RunSubcommand(const RunArguments& args, const core::EngineConfig& config) {
    if (args.command.empty()) {
        throw core::ConfigError("No command given (usage: taskbox run --image IMG -- CMD...)");
    }

    core::ContainerConfig container = BuildContainerConfig(args, config);
    auto gateway = std::make_shared<runtime::DockerGateway>(config.docker);

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[START] tier: {}, image: {}", args.tier, args.image);

    core::ScopedUnit unit(gateway, container, config.unit);

    // Forward Ctrl-C to the unit
    std::atomic<bool> finished{false};
    std::thread watcher([&unit, &finished]() {
        while (!finished.load()) {
            if (g_interrupted.load()) {
                unit->RequestCancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    std::optional<core::ExecResult> result;
    std::string error;
    int exit_code = 0;

    try {
        unit->Start();
        result = args.wait_mode ? unit->Wait() : unit->Exec(args.command);
        exit_code = result->exit_code;
    }
    catch (const core::EngineError& e) {
        spdlog::error("[FAIL] {} ({})", e.what(), core::ErrorKindName(e.Kind()));
        error = e.what();
        exit_code = ExitCodeFor(e.Kind());
    }
    catch (const std::exception& e) {
        spdlog::error("[FAIL] {}", e.what());
        error = e.what();
        exit_code = 1;
    }

    finished.store(true);
    watcher.join();

    unit->Cleanup();

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[DONE] {}", core::ToString(unit->Status()));

    reporters::JsonReporter reporter;
    auto report = reporter.RunReport(unit->Snapshot(), result, error);
    std::cout << reporter.Dump(report) << std::endl;

    if (!args.output_file.empty()) {
        reporter.WriteToFile(report, args.output_file);
    }

    return exit_code;
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{"taskbox - sandboxed task execution engine"};
    app.require_subcommand(1);

    bool verbose = false;
    std::string config_path;

    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("-c,--config", config_path, "Engine configuration file (JSON)")
        ->check(CLI::ExistingFile);

    // run
    RunArguments run_args;
    auto* run = app.add_subcommand("run", "Run a command in a fresh tiered container");
    run->add_option("-t,--tier", run_args.tier, "Difficulty tier")
        ->capture_default_str();
    run->add_option("-i,--image", run_args.image, "Container image")
        ->required();
    run->add_option("-e,--env", run_args.env, "Environment variable KEY=VALUE (repeatable)");
    run->add_option("-m,--mount", run_args.mounts, "Bind mount host:container[:ro] (repeatable)");
    run->add_option("-n,--name", run_args.name, "Container name");
    run->add_option("--network", run_args.network, "Override the tier network (none|internal|external)");
    run->add_option("-w,--workdir", run_args.workdir, "Working directory inside the container");
    run->add_option("-u,--user", run_args.user, "User to run as");
    run->add_option("--timeout", run_args.timeout_seconds, "Lower the tier timeout (seconds)")
        ->check(CLI::PositiveNumber);
    run->add_flag("--wait", run_args.wait_mode,
                  "Run the command as the container's primary process and wait for it");
    run->add_option("-o,--output", run_args.output_file, "Also write the JSON report to this file");
    run->add_option("command", run_args.command, "Command and arguments (after --)");

    // tiers
    auto* tiers = app.add_subcommand("tiers", "Print the resolved tier table");

    // ping
    auto* ping = app.add_subcommand("ping", "Check the container daemon is reachable");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_default_logger(spdlog::stderr_color_mt("taskbox"));

    try {
        core::EngineConfig config;
        if (!config_path.empty()) {
            config = core::EngineConfig::LoadFromFile(config_path);
        }
        if (verbose) {
            config.logging.level = "debug";
        }
        config.ApplyLogging();
        spdlog::debug("[DEBUG] Verbose logging enabled");

        if (*run) {
            std::signal(SIGINT, HandleSignal);
            std::signal(SIGTERM, HandleSignal);
            return RunSubcommand(run_args, config);
        }

        if (*tiers) {
            reporters::JsonReporter reporter;
            std::cout << reporter.Dump(reporter.TierTable(config.MakeResolver())) << std::endl;
            return 0;
        }

        if (*ping) {
            runtime::DockerGateway gateway(config.docker);
            std::string version = gateway.Ping().get();
            std::cout << version << std::endl;
            spdlog::info("✓ Docker daemon reachable (server {})", version);
            return 0;
        }

        return 1;

    } catch (const core::EngineError& e) {
        spdlog::error("[ERROR] {}", e.what());
        return ExitCodeFor(e.Kind());
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}

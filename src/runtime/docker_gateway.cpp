/**
 * @file docker_gateway.cpp
 * @brief Docker client driven through the process reactor
 *
 * **Call chains** (each arrow is one client process, no thread waits):
 * ```
 * Create:  [network inspect -> network create]? -> create
 * Start:   inspect (reject running) -> start
 * Exec:    exec -> [exit 137: inspect -> cat memory.events]?
 * Wait:    wait -> inspect (OOMKilled)
 * ```
 *
 * **Limit translation**:
 * - memory: --memory=<bytes>b, --memory-swap equal (no swap: exceed = OOM kill)
 * - cpu:    --cpus=<fractional cores>
 * - pids:   --pids-limit=<n>
 * - net:    none / internal bridge / bridge
 * - disk:   --tmpfs <scratch>:size=<bytes> or --storage-opt size=<bytes>
 * - privileges: --cap-drop / --security-opt from GatewayOptions
 *
 * @date 2025
 */

#include "taskbox/runtime/docker_gateway.hpp"
#include "taskbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <sstream>
#include <type_traits>

using json = nlohmann::json;

namespace taskbox {
namespace runtime {

using core::ErrorKind;
using utils::ProcessResult;
using utils::StringUtils;

namespace {

constexpr int kSigkillExitCode = 137;

std::string FormatCores(double cores) {
    std::ostringstream oss;
    oss << cores;
    return oss.str();
}

std::string FirstLine(const std::string& text) {
    std::string trimmed = StringUtils::Trim(text);
    auto newline = trimmed.find('\n');
    return StringUtils::Truncate(newline == std::string::npos ? trimmed : trimmed.substr(0, newline),
                                 512);
}

bool IsMissingContainer(const std::string& stderr_text) {
    return StringUtils::ContainsIgnoreCase(stderr_text, "no such container");
}

/// Tag of calls made on behalf of a unit before its container id is known
std::string OwnerTag(const std::string& owner, const std::string& fallback) {
    return owner.empty() ? fallback : "unit:" + owner;
}

std::exception_ptr MakeError(ErrorKind kind, const std::string& message) {
    switch (kind) {
        case ErrorKind::CONNECTION:    return std::make_exception_ptr(core::ConnectionError(message));
        case ErrorKind::IMAGE:         return std::make_exception_ptr(core::ImageError(message));
        case ErrorKind::CREATE:        return std::make_exception_ptr(core::CreateError(message));
        case ErrorKind::START:         return std::make_exception_ptr(core::StartError(message));
        case ErrorKind::EXEC:          return std::make_exception_ptr(core::ExecError(message));
        case ErrorKind::OUT_OF_MEMORY: return std::make_exception_ptr(core::OutOfMemoryError(message));
        case ErrorKind::TIMEOUT:       return std::make_exception_ptr(core::TimeoutError(message));
        case ErrorKind::CANCELLED:     return std::make_exception_ptr(core::CancelledError(message));
        case ErrorKind::CLEANUP:       return std::make_exception_ptr(core::CleanupError(message));
        case ErrorKind::CONFIG:        return std::make_exception_ptr(core::ConfigError(message));
    }
    return std::make_exception_ptr(core::EngineError(kind, message));
}

ContainerState ParseState(const std::string& output) {
    json j = json::parse(StringUtils::Trim(output));

    ContainerState state;
    state.status = j.value("Status", "");
    state.running = j.value("Running", false);
    state.exit_code = j.value("ExitCode", 0);
    state.oom_killed = j.value("OOMKilled", false);
    return state;
}

} // anonymous namespace

const char* DiskQuotaModeName(DiskQuotaMode mode) {
    switch (mode) {
        case DiskQuotaMode::TMPFS:       return "tmpfs";
        case DiskQuotaMode::STORAGE_OPT: return "storage-opt";
        case DiskQuotaMode::NONE:        return "none";
    }
    return "unknown";
}

DiskQuotaMode ParseDiskQuotaMode(const std::string& value) {
    std::string lower = StringUtils::ToLower(StringUtils::Trim(value));
    if (lower == "tmpfs") return DiskQuotaMode::TMPFS;
    if (lower == "storage-opt") return DiskQuotaMode::STORAGE_OPT;
    if (lower == "none") return DiskQuotaMode::NONE;
    throw core::ConfigError("Unknown disk quota mode: '" + value +
                            "' (expected tmpfs, storage-opt or none)");
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerGateway::DockerGateway(GatewayOptions options)
    : options_(std::move(options)) {

    if (options_.endpoint.empty()) {
        if (const char* host = std::getenv("DOCKER_HOST")) {
            options_.endpoint = host;
        }
    }

    spdlog::info("Docker gateway initialized (client: {}, endpoint: {})",
                 options_.binary,
                 options_.endpoint.empty() ? "default" : options_.endpoint);
}

DockerGateway::~DockerGateway() {
    spdlog::debug("Docker gateway shutting down");
}

// ============================================================================
// INVOCATION PLUMBING
// ============================================================================

void DockerGateway::Invoke(std::vector<std::string> args, const std::string& tag,
                           ResultHandler handler) {
    utils::ProcessSpec spec;
    spec.argv.reserve(args.size() + 3);
    spec.argv.push_back(options_.binary);
    if (!options_.endpoint.empty()) {
        spec.argv.push_back("--host");
        spec.argv.push_back(options_.endpoint);
    }
    for (auto& arg : args) {
        spec.argv.push_back(std::move(arg));
    }
    spec.output_limit = options_.output_limit;
    spec.tag = tag;

    spdlog::debug("Executing: {}", StringUtils::FormatCommand(spec.argv));
    reactor_.Launch(std::move(spec), std::move(handler));
}

template <typename T, typename Parse>
std::future<T> DockerGateway::Submit(std::vector<std::string> args, const std::string& tag,
                                     Parse parse) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    Invoke(std::move(args), tag, [promise, parse](ProcessResult&& result) {
        try {
            if constexpr (std::is_void_v<T>) {
                parse(result);
                promise->set_value();
            } else {
                promise->set_value(parse(result));
            }
        }
        catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    return future;
}

std::exception_ptr DockerGateway::ToError(const ProcessResult& result,
                                          ErrorKind fallback,
                                          const std::string& operation) const {
    if (!result.Spawned()) {
        return MakeError(ErrorKind::CONNECTION,
                         operation + ": cannot run docker client: " + result.spawn_error);
    }
    if (result.cancelled) {
        return MakeError(ErrorKind::CANCELLED, operation + ": aborted");
    }

    std::string detail = FirstLine(result.stderr_data);
    if (detail.empty()) {
        detail = "docker exited with code " + std::to_string(result.exit_code);
    }
    return MakeError(ClassifyError(result.stderr_data, fallback), operation + ": " + detail);
}

// ============================================================================
// ERROR CLASSIFICATION
// ============================================================================

ErrorKind DockerGateway::ClassifyError(const std::string& stderr_text, ErrorKind fallback) {
    static const char* const kConnectionMarkers[] = {
        "cannot connect to the docker daemon",
        "is the docker daemon running",
        "error during connect",
        "permission denied while trying to connect",
        "connection refused",
    };
    static const char* const kImageMarkers[] = {
        "no such image",
        "unable to find image",
        "pull access denied",
        "manifest unknown",
        "repository does not exist",
        "invalid reference format",
        "not found: manifest",
    };

    // A daemon that answered is reachable, whatever it reports about registries
    if (!StringUtils::ContainsIgnoreCase(stderr_text, "error response from daemon")) {
        for (const char* marker : kConnectionMarkers) {
            if (StringUtils::ContainsIgnoreCase(stderr_text, marker)) {
                return ErrorKind::CONNECTION;
            }
        }
    }

    if (fallback == ErrorKind::CREATE || fallback == ErrorKind::IMAGE) {
        for (const char* marker : kImageMarkers) {
            if (StringUtils::ContainsIgnoreCase(stderr_text, marker)) {
                return ErrorKind::IMAGE;
            }
        }
    }

    return fallback;
}

bool DockerGateway::IsDaemonExecFailure(const std::string& stderr_text) {
    std::string head = StringUtils::ToLower(StringUtils::Trim(stderr_text));
    return StringUtils::StartsWith(head, "error response from daemon") ||
           StringUtils::StartsWith(head, "oci runtime exec failed") ||
           StringUtils::StartsWith(head, "cannot connect to the docker daemon") ||
           StringUtils::StartsWith(head, "error during connect");
}

bool DockerGateway::ParseOomKillCount(const std::string& cgroup_text) {
    std::istringstream stream(cgroup_text);
    std::string line;
    while (std::getline(stream, line)) {
        auto fields = StringUtils::Split(StringUtils::Trim(line), ' ');
        if (fields.size() == 2 && fields[0] == "oom_kill") {
            try {
                return std::stoull(fields[1]) > 0;
            }
            catch (const std::exception&) {
                return false;
            }
        }
    }
    return false;
}

// ============================================================================
// ARGUMENT BUILDING
// ============================================================================

std::vector<std::string> DockerGateway::BuildCreateArgs(const core::ContainerConfig& config,
                                                        const GatewayOptions& options) {
    const core::ResourceLimits& limits = config.limits;
    std::vector<std::string> args;

    args.push_back("create");

    // Caller labels first: on a repeated key the last one wins, so ownership cannot be overridden
    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back("--label");
    args.push_back(options.label + "=true");
    if (config.name) {
        args.push_back("--label");
        args.push_back("taskbox.unit=" + *config.name);
        args.push_back("--name");
        args.push_back(*config.name);
    }

    // Memory ceiling, swap disabled
    std::string memory = std::to_string(limits.memory_bytes) + "b";
    args.push_back("--memory=" + memory);
    args.push_back("--memory-swap=" + memory);

    args.push_back("--cpus=" + FormatCores(limits.cpu_cores));
    args.push_back("--pids-limit=" + std::to_string(limits.max_processes));

    switch (config.EffectiveNetworkMode()) {
        case core::NetworkMode::NONE:
            args.push_back("--network=none");
            break;
        case core::NetworkMode::INTERNAL:
            args.push_back("--network=" + options.internal_network);
            break;
        case core::NetworkMode::EXTERNAL:
            args.push_back("--network=bridge");
            break;
    }

    switch (options.disk_quota) {
        case DiskQuotaMode::TMPFS:
            args.push_back("--tmpfs");
            args.push_back(options.scratch_path + ":rw,size=" + std::to_string(limits.disk_bytes));
            break;
        case DiskQuotaMode::STORAGE_OPT:
            args.push_back("--storage-opt");
            args.push_back("size=" + std::to_string(limits.disk_bytes));
            break;
        case DiskQuotaMode::NONE:
            break;
    }

    // Security: privilege hardening
    for (const auto& cap : options.cap_drop) {
        args.push_back("--cap-drop=" + cap);
    }
    for (const auto& opt : options.security_opts) {
        args.push_back("--security-opt=" + opt);
    }

    for (const auto& [key, value] : config.environment) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.ToBindString());
    }

    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    if (!config.user.empty()) {
        args.push_back("--user");
        args.push_back(config.user);
    }

    args.push_back(config.image);

    const auto& command = config.command.empty() ? options.keepalive_command : config.command;
    args.insert(args.end(), command.begin(), command.end());

    return args;
}

// ============================================================================
// LIFECYCLE OPERATIONS
// ============================================================================

std::future<RuntimeHandle> DockerGateway::Create(const core::ContainerConfig& config) {
    auto promise = std::make_shared<std::promise<RuntimeHandle>>();
    auto future = promise->get_future();

    std::vector<std::string> args;
    try {
        config.Validate();
        args = BuildCreateArgs(config, options_);
    }
    catch (const core::ConfigError& e) {
        promise->set_exception(std::make_exception_ptr(core::CreateError(e.what())));
        return future;
    }

    std::string name = config.name.value_or("");
    std::string tag = OwnerTag(name, "create");

    auto launch = [this, promise, args, name, tag]() {
        Invoke(args, tag, [this, promise, name](ProcessResult&& result) {
            if (!result.Succeeded()) {
                promise->set_exception(ToError(result, ErrorKind::CREATE, "create"));
                return;
            }

            RuntimeHandle handle;
            handle.id = StringUtils::Trim(result.stdout_data);
            handle.name = name;
            if (handle.id.empty()) {
                promise->set_exception(std::make_exception_ptr(
                    core::CreateError("create: daemon returned no container id")));
                return;
            }

            spdlog::debug("Created container {} ({})", handle.name, handle.id.substr(0, 12));
            promise->set_value(std::move(handle));
        });
    };

    if (config.EffectiveNetworkMode() == core::NetworkMode::INTERNAL) {
        EnsureInternalNetwork(tag, [promise, launch](std::exception_ptr error) {
            if (error) {
                promise->set_exception(error);
                return;
            }
            launch();
        });
    } else {
        launch();
    }

    return future;
}

void DockerGateway::EnsureInternalNetwork(const std::string& tag,
                                          std::function<void(std::exception_ptr)> next) {
    if (network_ready_.load()) {
        next(nullptr);
        return;
    }

    const std::string network = options_.internal_network;

    Invoke({"network", "inspect", "--format", "{{.Internal}}", network}, tag,
           [this, network, tag, next](ProcessResult&& inspected) {
        if (inspected.Succeeded()) {
            if (StringUtils::Trim(inspected.stdout_data) != "true") {
                spdlog::warn("Network '{}' exists but is not internal", network);
            }
            network_ready_.store(true);
            next(nullptr);
            return;
        }

        if (!inspected.Spawned() ||
            ClassifyError(inspected.stderr_data, ErrorKind::CREATE) == ErrorKind::CONNECTION) {
            next(ToError(inspected, ErrorKind::CREATE, "network inspect"));
            return;
        }

        spdlog::info("Creating internal network '{}'", network);
        Invoke({"network", "create", "--internal",
                "--label", options_.label + "=true", network},
               tag,
               [this, network, next](ProcessResult&& created) {
            if (created.Succeeded() ||
                StringUtils::ContainsIgnoreCase(created.stderr_data, "already exists")) {
                network_ready_.store(true);
                next(nullptr);
                return;
            }
            next(ToError(created, ErrorKind::CREATE, "network create " + network));
        });
    });
}

std::future<void> DockerGateway::Start(const RuntimeHandle& handle) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    const std::string id = handle.id;

    Invoke({"inspect", "--type", "container", "--format", "{{json .State}}", id}, id,
           [this, promise, id](ProcessResult&& inspected) {
        if (!inspected.Succeeded()) {
            promise->set_exception(ToError(inspected, ErrorKind::START, "start"));
            return;
        }

        bool running = false;
        try {
            running = ParseState(inspected.stdout_data).running;
        }
        catch (const json::exception& e) {
            promise->set_exception(std::make_exception_ptr(
                core::StartError(std::string("start: unreadable container state: ") + e.what())));
            return;
        }
        if (running) {
            promise->set_exception(std::make_exception_ptr(
                core::StartError("start: container " + id.substr(0, 12) + " is already running")));
            return;
        }

        Invoke({"start", id}, id, [this, promise](ProcessResult&& started) {
            if (!started.Succeeded()) {
                promise->set_exception(ToError(started, ErrorKind::START, "start"));
                return;
            }
            promise->set_value();
        });
    });

    return future;
}

std::future<ExecOutput> DockerGateway::Exec(const RuntimeHandle& handle,
                                            const std::vector<std::string>& argv) {
    auto promise = std::make_shared<std::promise<ExecOutput>>();
    auto future = promise->get_future();

    if (argv.empty()) {
        promise->set_exception(std::make_exception_ptr(core::ExecError("exec: empty command")));
        return future;
    }

    std::vector<std::string> args{"exec", handle.id};
    args.insert(args.end(), argv.begin(), argv.end());

    RuntimeHandle target = handle;

    Invoke(std::move(args), handle.id, [this, promise, target](ProcessResult&& result) {
        if (!result.Spawned() || result.cancelled ||
            (result.exit_code != 0 && IsDaemonExecFailure(result.stderr_data))) {
            promise->set_exception(ToError(result, ErrorKind::EXEC, "exec"));
            return;
        }

        auto output = std::make_shared<ExecOutput>();
        output->exit_code = result.exit_code;
        output->stdout_data = std::move(result.stdout_data);
        output->stderr_data = std::move(result.stderr_data);
        output->stdout_truncated = result.stdout_truncated;
        output->stderr_truncated = result.stderr_truncated;
        output->duration = result.duration;

        if (output->exit_code != kSigkillExitCode) {
            promise->set_value(std::move(*output));
            return;
        }

        CheckOomKilled(target, [promise, output](bool oom_killed) {
            output->oom_killed = oom_killed;
            promise->set_value(std::move(*output));
        });
    });

    return future;
}

void DockerGateway::CheckOomKilled(const RuntimeHandle& handle, std::function<void(bool)> done) {
    const std::string id = handle.id;

    Invoke({"inspect", "--type", "container", "--format", "{{json .State}}", id}, id,
           [this, id, done](ProcessResult&& inspected) {
        bool oom_killed = false;
        bool running = false;

        if (inspected.Succeeded()) {
            try {
                ContainerState state = ParseState(inspected.stdout_data);
                oom_killed = state.oom_killed;
                running = state.running;
            }
            catch (const json::exception& e) {
                spdlog::debug("OOM check: unreadable state of {}: {}", id, e.what());
            }
        }

        if (oom_killed || !running) {
            done(oom_killed);
            return;
        }

        // The primary process survived; the cgroup counter still records exec'd victims
        Invoke({"exec", id, "cat",
                "/sys/fs/cgroup/memory.events",
                "/sys/fs/cgroup/memory/memory.oom_control"},
               id, [done](ProcessResult&& events) {
            done(events.Spawned() && ParseOomKillCount(events.stdout_data));
        });
    });
}

std::future<ExitInfo> DockerGateway::Wait(const RuntimeHandle& handle) {
    auto promise = std::make_shared<std::promise<ExitInfo>>();
    auto future = promise->get_future();

    const std::string id = handle.id;

    Invoke({"wait", id}, id, [this, promise, id](ProcessResult&& waited) {
        if (!waited.Succeeded()) {
            promise->set_exception(ToError(waited, ErrorKind::EXEC, "wait"));
            return;
        }

        ExitInfo info;
        try {
            info.exit_code = std::stoi(StringUtils::Trim(waited.stdout_data));
        }
        catch (const std::exception&) {
            promise->set_exception(std::make_exception_ptr(core::ExecError(
                "wait: unexpected output '" + StringUtils::Trim(waited.stdout_data) + "'")));
            return;
        }

        Invoke({"inspect", "--type", "container", "--format", "{{json .State}}", id}, id,
               [promise, info, id](ProcessResult&& inspected) mutable {
            if (inspected.Succeeded()) {
                try {
                    info.oom_killed = ParseState(inspected.stdout_data).oom_killed;
                }
                catch (const json::exception& e) {
                    spdlog::debug("wait: unreadable state of {}: {}", id, e.what());
                }
            }
            promise->set_value(info);
        });
    });

    return future;
}

std::future<void> DockerGateway::Stop(const RuntimeHandle& handle, std::chrono::seconds grace) {
    return Submit<void>({"stop", "-t", std::to_string(grace.count()), handle.id}, "stop:" + handle.id,
                        [this](const ProcessResult& result) {
        if (result.Succeeded() || IsMissingContainer(result.stderr_data) ||
            StringUtils::ContainsIgnoreCase(result.stderr_data, "is not running")) {
            return;
        }
        std::rethrow_exception(ToError(result, ErrorKind::CLEANUP, "stop"));
    });
}

std::future<void> DockerGateway::Remove(const RuntimeHandle& handle) {
    return Submit<void>({"rm", "-f", "-v", handle.id}, "remove:" + handle.id,
                        [this](const ProcessResult& result) {
        if (result.Succeeded() || IsMissingContainer(result.stderr_data) ||
            StringUtils::ContainsIgnoreCase(result.stderr_data, "already in progress")) {
            return;
        }
        std::rethrow_exception(ToError(result, ErrorKind::CLEANUP, "remove"));
    });
}

// ============================================================================
// IMAGES
// ============================================================================

std::future<void> DockerGateway::Pull(const std::string& image, const std::string& owner) {
    spdlog::info("Pulling image: {}", image);
    return Submit<void>({"pull", "--quiet", image}, OwnerTag(owner, "pull:" + image),
                        [this, image](const ProcessResult& result) {
        if (!result.Succeeded()) {
            std::rethrow_exception(ToError(result, ErrorKind::IMAGE, "pull " + image));
        }
    });
}

std::future<bool> DockerGateway::ImageExists(const std::string& image, const std::string& owner) {
    return Submit<bool>({"image", "inspect", "--format", "{{.Id}}", image},
                        OwnerTag(owner, "image:" + image),
                        [this, image](const ProcessResult& result) {
        if (result.Succeeded()) {
            return true;
        }
        if (!result.Spawned() ||
            ClassifyError(result.stderr_data, ErrorKind::IMAGE) == ErrorKind::CONNECTION) {
            std::rethrow_exception(ToError(result, ErrorKind::IMAGE, "image inspect " + image));
        }
        return false;
    });
}

// ============================================================================
// OBSERVATION
// ============================================================================

std::future<LogOutput> DockerGateway::Logs(const RuntimeHandle& handle) {
    return Submit<LogOutput>({"logs", handle.id}, handle.id,
                             [this](ProcessResult& result) {
        if (!result.Succeeded()) {
            std::rethrow_exception(ToError(result, ErrorKind::EXEC, "logs"));
        }
        LogOutput logs;
        logs.stdout_data = std::move(result.stdout_data);
        logs.stderr_data = std::move(result.stderr_data);
        return logs;
    });
}

std::future<ContainerState> DockerGateway::Inspect(const RuntimeHandle& handle) {
    return Submit<ContainerState>(
        {"inspect", "--type", "container", "--format", "{{json .State}}", handle.id}, handle.id,
        [this](const ProcessResult& result) {
        if (!result.Succeeded()) {
            std::rethrow_exception(ToError(result, ErrorKind::EXEC, "inspect"));
        }
        try {
            return ParseState(result.stdout_data);
        }
        catch (const json::exception& e) {
            throw core::ExecError(std::string("inspect: unreadable container state: ") + e.what());
        }
    });
}

std::future<std::vector<std::string>> DockerGateway::List(const std::string& label) {
    return Submit<std::vector<std::string>>(
        {"ps", "--all", "--no-trunc", "--filter", "label=" + label, "--format", "{{json .}}"}, "list",
        [this](const ProcessResult& result) {
        if (!result.Succeeded()) {
            std::rethrow_exception(ToError(result, ErrorKind::CONNECTION, "list"));
        }

        std::vector<std::string> ids;
        std::istringstream stream(result.stdout_data);
        std::string line;

        // One JSON object per line
        while (std::getline(stream, line)) {
            if (StringUtils::Trim(line).empty()) continue;

            try {
                json j = json::parse(line);
                std::string id = j.value("ID", "");
                if (!id.empty()) {
                    ids.push_back(id);
                }
            }
            catch (const json::exception& e) {
                spdlog::warn("Failed to parse container info: {}", e.what());
            }
        }
        return ids;
    });
}

std::future<std::string> DockerGateway::Ping() {
    return Submit<std::string>({"version", "--format", "{{.Server.Version}}"}, "ping",
                               [this](const ProcessResult& result) {
        if (!result.Succeeded()) {
            std::rethrow_exception(ToError(result, ErrorKind::CONNECTION, "ping"));
        }
        return StringUtils::Trim(result.stdout_data);
    });
}

std::size_t DockerGateway::AbortInFlight(const RuntimeHandle& handle) {
    std::size_t aborted = 0;
    if (!handle.id.empty()) {
        aborted += reactor_.CancelTagged(handle.id);
    }
    if (!handle.name.empty()) {
        aborted += reactor_.CancelTagged(OwnerTag(handle.name, ""));
    }
    if (aborted > 0) {
        spdlog::debug("Aborted {} in-flight call(s) for {}", aborted, handle.name);
    }
    return aborted;
}

} // namespace runtime
} // namespace taskbox

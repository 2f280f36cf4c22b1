/**
 * @file process_reactor.cpp
 * @brief fork/exec child processes and multiplex their output with poll()
 *
 * **Launch sequence**:
 * ```
 * pipe2(stdout) pipe2(stderr) pipe2(exec-status, CLOEXEC)
 * fork()
 *  child:  setpgid, stdin </dev/null, dup2 pipes, execvp
 *          on failure write errno to exec-status pipe, _exit(127)
 *  parent: read exec-status (EOF == exec succeeded), register job, wake loop
 * ```
 *
 * **Loop**:
 * One thread polls the wake pipe plus every open output pipe, appends data
 * up to the per-stream cap, reaps exited children with WNOHANG and hands the
 * finished result to the job's completion handler outside the lock.
 *
 * All descriptors are created close-on-exec so that children launched
 * concurrently never inherit each other's pipes (which would delay EOF).
 *
 * @date 2025
 */

#include "taskbox/utils/process_reactor.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace taskbox {
namespace utils {

namespace {

// Poll timeout while children are alive; bounds reap latency
constexpr int kReapIntervalMs = 20;

// How long to keep reading after the child exited while a grandchild still
// holds the pipes open
constexpr std::chrono::milliseconds kDrainGrace{200};

// Reads per descriptor per loop iteration, so one chatty child cannot starve others
constexpr int kMaxReadsPerPass = 64;

std::string ErrnoString(int err) {
    return std::string(std::strerror(err));
}

void KillGroup(pid_t pid) {
    if (::kill(-pid, SIGKILL) < 0 && ::kill(pid, SIGKILL) < 0 && errno != ESRCH) {
        spdlog::warn("Failed to kill process {}: {}", pid, ErrnoString(errno));
    }
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

ProcessReactor::ProcessReactor() {
    int fds[2];
    if (::pipe2(fds, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::runtime_error("Failed to create reactor wake pipe: " + ErrnoString(errno));
    }
    wake_read_fd_ = fds[0];
    wake_write_fd_ = fds[1];

    thread_ = std::thread([this]() { Loop(); });
    spdlog::debug("Process reactor started");
}

ProcessReactor::~ProcessReactor() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (auto& entry : jobs_) {
            Job& job = *entry.second;
            if (!job.reaped) {
                job.result.cancelled = true;
                KillGroup(job.pid);
            }
        }
    }

    Wake();
    if (thread_.joinable()) {
        thread_.join();
    }

    CloseFd(wake_read_fd_);
    CloseFd(wake_write_fd_);
    spdlog::debug("Process reactor stopped");
}

// ============================================================================
// LAUNCH / CANCEL
// ============================================================================

ProcessReactor::JobId ProcessReactor::Launch(ProcessSpec spec, CompletionHandler on_exit) {
    auto fail = [&on_exit](const std::string& message) {
        ProcessResult result;
        result.spawn_error = message;
        spdlog::debug("Spawn failed: {}", message);
        on_exit(std::move(result));
    };

    if (spec.argv.empty()) {
        fail("empty argument vector");
        return 0;
    }

    bool stopping;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping = stopping_;
    }
    if (stopping) {
        fail("process reactor is shutting down");
        return 0;
    }

    // Everything the child touches is prepared before fork()
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(out_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                        &status_pipe[0], &status_pipe[1]}) {
            CloseFd(*fd);
        }
        fail("failed to create pipes: " + ErrnoString(err));
        return 0;
    }

    int dev_null = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        ::setpgid(0, 0);

        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        ::sigprocmask(SIG_SETMASK, &empty_mask, nullptr);
        ::signal(SIGPIPE, SIG_DFL);

        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        int exec_errno = errno;
        [[maybe_unused]] ssize_t written = ::write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        ::_exit(127);
    }

    int fork_errno = errno;

    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(status_pipe[1]);
    CloseFd(dev_null);

    if (pid < 0) {
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        CloseFd(status_pipe[0]);
        fail("fork failed: " + ErrnoString(fork_errno));
        return 0;
    }

    // Mirror the child's setpgid so kill(-pid) works even before it ran
    if (::setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH) {
        spdlog::debug("setpgid({}) failed: {}", pid, ErrnoString(errno));
    }

    // EOF means execvp succeeded (the CLOEXEC end closed on exec)
    int child_errno = 0;
    ssize_t status_read;
    do {
        status_read = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (status_read < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (status_read == static_cast<ssize_t>(sizeof(child_errno))) {
        int wait_status = 0;
        while (::waitpid(pid, &wait_status, 0) < 0 && errno == EINTR) {
        }
        CloseFd(out_pipe[0]);
        CloseFd(err_pipe[0]);
        fail("failed to execute '" + spec.argv.front() + "': " + ErrnoString(child_errno));
        return 0;
    }

    for (int fd : {out_pipe[0], err_pipe[0]}) {
        int flags = ::fcntl(fd, F_GETFL);
        if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
            spdlog::warn("Failed to make pipe non-blocking: {}", ErrnoString(errno));
        }
    }

    auto job = std::make_unique<Job>();
    job->pid = pid;
    job->stdout_fd = out_pipe[0];
    job->stderr_fd = err_pipe[0];
    job->output_limit = spec.output_limit;
    job->tag = std::move(spec.tag);
    job->on_exit = std::move(on_exit);
    job->started_at = std::chrono::steady_clock::now();

    JobId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        job->id = id;
        jobs_.emplace(id, std::move(job));
    }

    spdlog::trace("Launched job {} (pid {})", id, pid);
    Wake();
    return id;
}

std::future<ProcessResult> ProcessReactor::LaunchAsync(ProcessSpec spec) {
    auto promise = std::make_shared<std::promise<ProcessResult>>();
    auto future = promise->get_future();

    Launch(std::move(spec), [promise](ProcessResult&& result) {
        promise->set_value(std::move(result));
    });

    return future;
}

bool ProcessReactor::Cancel(JobId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(id);
    if (it == jobs_.end() || it->second->reaped) {
        return false;
    }

    it->second->result.cancelled = true;
    KillGroup(it->second->pid);
    spdlog::debug("Cancelled job {} (pid {})", id, it->second->pid);
    return true;
}

std::size_t ProcessReactor::CancelTagged(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::size_t count = 0;
    for (auto& entry : jobs_) {
        Job& job = *entry.second;
        if (job.tag == tag && !job.reaped) {
            job.result.cancelled = true;
            KillGroup(job.pid);
            ++count;
        }
    }

    if (count > 0) {
        spdlog::debug("Cancelled {} job(s) tagged '{}'", count, tag);
    }
    return count;
}

std::size_t ProcessReactor::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

// ============================================================================
// EVENT LOOP
// ============================================================================

void ProcessReactor::Loop() {
    std::vector<pollfd> fds;

    while (true) {
        int timeout_ms = -1;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && jobs_.empty()) {
                break;
            }

            fds.clear();
            fds.push_back({wake_read_fd_, POLLIN, 0});
            for (const auto& entry : jobs_) {
                const Job& job = *entry.second;
                if (job.stdout_fd >= 0) {
                    fds.push_back({job.stdout_fd, POLLIN, 0});
                }
                if (job.stderr_fd >= 0) {
                    fds.push_back({job.stderr_fd, POLLIN, 0});
                }
            }
            if (!jobs_.empty()) {
                timeout_ms = kReapIntervalMs;
            }
        }

        int ready = ::poll(fds.data(), fds.size(), timeout_ms);
        if (ready < 0 && errno != EINTR) {
            spdlog::error("poll() failed: {}", ErrnoString(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(kReapIntervalMs));
        }

        if (fds[0].revents & POLLIN) {
            DrainWakePipe();
        }

        std::vector<std::unique_ptr<Job>> finished;
        {
            std::lock_guard<std::mutex> lock(mutex_);

            for (auto& entry : jobs_) {
                Job& job = *entry.second;
                ReadAvailable(job, job.stdout_fd, job.result.stdout_data, job.result.stdout_truncated);
                ReadAvailable(job, job.stderr_fd, job.result.stderr_data, job.result.stderr_truncated);
            }

            auto now = std::chrono::steady_clock::now();
            ReapExited(now);

            for (auto it = jobs_.begin(); it != jobs_.end();) {
                Job& job = *it->second;
                bool streams_closed = job.stdout_fd < 0 && job.stderr_fd < 0;
                bool drain_expired = job.reaped && (now - job.reaped_at) > kDrainGrace;

                if (job.reaped && (streams_closed || drain_expired)) {
                    CloseFd(job.stdout_fd);
                    CloseFd(job.stderr_fd);
                    job.result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now - job.started_at);
                    finished.push_back(std::move(it->second));
                    it = jobs_.erase(it);
                } else {
                    ++it;
                }
            }
        }

        for (auto& job : finished) {
            spdlog::trace("Job {} finished with exit code {}", job->id, job->result.exit_code);
            try {
                job->on_exit(std::move(job->result));
            }
            catch (const std::exception& e) {
                spdlog::error("Completion handler of job {} threw: {}", job->id, e.what());
            }
        }
    }
}

void ProcessReactor::ReadAvailable(Job& job, int& fd, std::string& sink, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[8192];
    for (int pass = 0; pass < kMaxReadsPerPass; ++pass) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));

        if (n > 0) {
            std::size_t room = job.output_limit > sink.size() ? job.output_limit - sink.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            if (take < static_cast<std::size_t>(n)) {
                truncated = true;
            }
            sink.append(buffer, take);
            continue;
        }

        if (n == 0) {
            CloseFd(fd);
            return;
        }

        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::warn("Read from job {} failed: {}", job.id, ErrnoString(errno));
            CloseFd(fd);
        }
        return;
    }
}

void ProcessReactor::ReapExited(std::chrono::steady_clock::time_point now) {
    for (auto& entry : jobs_) {
        Job& job = *entry.second;
        if (job.reaped) {
            continue;
        }

        int status = 0;
        pid_t result = ::waitpid(job.pid, &status, WNOHANG);

        if (result == job.pid) {
            if (WIFEXITED(status)) {
                job.result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                job.result.term_signal = WTERMSIG(status);
                job.result.exit_code = 128 + job.result.term_signal;
            }
            job.reaped = true;
            job.reaped_at = now;
        } else if (result < 0 && errno == ECHILD) {
            // Reaped elsewhere (e.g. SIGCHLD ignored); exit status is lost
            spdlog::warn("Exit status of pid {} unavailable", job.pid);
            job.reaped = true;
            job.reaped_at = now;
        }
    }
}

// ============================================================================
// HELPERS
// ============================================================================

void ProcessReactor::Wake() {
    char byte = 1;
    if (::write(wake_write_fd_, &byte, 1) < 0 && errno != EAGAIN) {
        spdlog::warn("Failed to wake process reactor: {}", ErrnoString(errno));
    }
}

void ProcessReactor::DrainWakePipe() {
    char buffer[64];
    while (::read(wake_read_fd_, buffer, sizeof(buffer)) > 0) {
    }
}

void ProcessReactor::CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace utils
} // namespace taskbox

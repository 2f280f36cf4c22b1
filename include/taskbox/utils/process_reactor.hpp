/**
 * @file process_reactor.hpp
 * @brief Asynchronous child-process execution over a single poll() loop
 *
 * Launches client processes (fork/exec with stdout/stderr pipes) and
 * multiplexes all of their output on one background thread. Callers get a
 * completion callback or a future; no caller thread blocks for the lifetime
 * of the child.
 *
 * @date 2025
 */

#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace taskbox {
namespace utils {

/**
 * @struct ProcessSpec
 * @brief What to run
 */
struct ProcessSpec {
    std::vector<std::string> argv;                  ///< argv[0] is looked up in PATH
    std::size_t output_limit{16 * 1024 * 1024};     ///< Per-stream capture cap (bytes)
    std::string tag;                                ///< Grouping key for CancelTagged()
};

/**
 * @struct ProcessResult
 * @brief Outcome of one child process
 */
struct ProcessResult {
    int exit_code{-1};                      ///< Exit status, 128+signal if killed
    int term_signal{0};                     ///< Terminating signal (0 if exited)
    std::string stdout_data;                ///< Captured stdout (capped)
    std::string stderr_data;                ///< Captured stderr (capped)
    bool stdout_truncated{false};           ///< stdout exceeded the cap
    bool stderr_truncated{false};           ///< stderr exceeded the cap
    bool cancelled{false};                  ///< Killed through Cancel()/shutdown
    std::string spawn_error;                ///< Non-empty if the process never ran
    std::chrono::milliseconds duration{0};  ///< Launch to reap

    bool Spawned() const { return spawn_error.empty(); }
    bool Succeeded() const { return Spawned() && !cancelled && exit_code == 0; }
};

using CompletionHandler = std::function<void(ProcessResult&&)>;

/**
 * @class ProcessReactor
 * @brief Runs child processes and reports their completion asynchronously
 *
 * Completion handlers run on the reactor thread (or inline on the launching
 * thread if the process could not be spawned) and must not block.
 *
 * **Usage Example**:
 * @code
 * ProcessReactor reactor;
 * auto future = reactor.LaunchAsync({{"docker", "version"}});
 * ProcessResult result = future.get();
 * @endcode
 *
 * **Thread Safety**: all public methods are thread-safe.
 */
class ProcessReactor {
public:
    using JobId = std::uint64_t;

    ProcessReactor();

    /// Kills every remaining child and joins the reactor thread
    ~ProcessReactor();

    ProcessReactor(const ProcessReactor&) = delete;
    ProcessReactor& operator=(const ProcessReactor&) = delete;

    /**
     * @brief Launch a process; @p on_exit receives its result exactly once
     * @return Job id usable with Cancel()
     */
    JobId Launch(ProcessSpec spec, CompletionHandler on_exit);

    /// Launch a process and return a future of its result
    std::future<ProcessResult> LaunchAsync(ProcessSpec spec);

    /**
     * @brief Kill a running job (its process group) with SIGKILL
     * @return false if the job already finished
     */
    bool Cancel(JobId id);

    /// Cancel every job launched with @p tag; returns how many were signalled
    std::size_t CancelTagged(const std::string& tag);

    /// Number of jobs not yet reaped
    std::size_t ActiveCount() const;

private:
    struct Job {
        JobId id{0};
        pid_t pid{-1};
        int stdout_fd{-1};
        int stderr_fd{-1};
        std::size_t output_limit{0};
        std::string tag;
        CompletionHandler on_exit;
        ProcessResult result;
        bool reaped{false};
        std::chrono::steady_clock::time_point started_at;
        std::chrono::steady_clock::time_point reaped_at;
    };

    void Loop();
    void Wake();
    void DrainWakePipe();
    void ReadAvailable(Job& job, int& fd, std::string& sink, bool& truncated);
    void ReapExited(std::chrono::steady_clock::time_point now);
    static void CloseFd(int& fd);

    mutable std::mutex mutex_;
    std::map<JobId, std::unique_ptr<Job>> jobs_;  ///< Active jobs, guarded by mutex_
    JobId next_id_{1};
    bool stopping_{false};
    int wake_read_fd_{-1};
    int wake_write_fd_{-1};
    std::thread thread_;
};

} // namespace utils
} // namespace taskbox

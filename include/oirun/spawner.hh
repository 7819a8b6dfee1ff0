#pragma once

#include <chrono>
#include <csignal>
#include <cstdint>
#include <ctime>
#include <functional>
#include <linux/filter.h>
#include <optional>
#include <string>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>
#include <vector>

class Spawner {
protected:
    Spawner() = default;

public:
    struct ExitStat {
        std::chrono::nanoseconds runtime{0};
        std::chrono::nanoseconds cpu_runtime{0};

        struct {
            int code; // si_code field from siginfo_t from waitid(2)
            int status; // si_status field from siginfo_t from waitid(2)
        } si{};

        struct rusage rusage = {}; // resource information
        uint64_t peak_rss = 0; // highest sampled resident set size (in bytes)
        bool real_time_limit_exceeded = false; // the timer killed the process group
        bool rss_limit_exceeded = false; // the memory watcher killed the process group
        std::string message;

        [[nodiscard]] bool exited_normally() const noexcept {
            return si.code == CLD_EXITED and si.status == 0;
        }
    };

    struct Options {
        int new_stdin_fd = STDIN_FILENO; // negative - close, STDIN_FILENO - do not change
        int new_stdout_fd = STDOUT_FILENO; // negative - close, STDOUT_FILENO - do not change
        int new_stderr_fd = STDERR_FILENO; // negative - close, STDERR_FILENO - do not change
        std::optional<std::chrono::nanoseconds> real_time_limit;
        // if not set and real time limit is set, then RLIMIT_CPU is set to
        // round(real time limit + 1.5s), the hard limit is one second above it
        // so SIGXCPU arrives before SIGKILL
        std::optional<std::chrono::nanoseconds> cpu_time_limit;
        std::optional<uint64_t> address_space_limit; // in bytes, RLIMIT_AS and RLIMIT_STACK
        std::optional<uint64_t> rss_limit; // in bytes, enforced by sampling
        std::chrono::nanoseconds rss_sampling_interval = std::chrono::milliseconds{100};
        std::optional<uint64_t> file_size_limit; // in bytes, RLIMIT_FSIZE
        std::string working_dir; // empty - do not change
        // installed with PR_SET_NO_NEW_PRIVS right before exec, nullptr - none
        const sock_fprog* seccomp_filter = nullptr;
    };

    /**
     * @brief Runs @p exec with arguments @p exec_args and limits from @p opts
     * @details @p exec is called via execvp(). The child is placed in a new
     *   process group and the whole group is killed once the child exits,
     *   so no descendant outlives the call.
     *   This function is thread-safe.
     *   IMPORTANT: To function properly this function uses internally signal
     *     SIGRTMIN and installs handler for it. So be aware that using this
     *     signal while this function runs (in any thread) is not safe.
     *
     * @param exec path to file will be executed
     * @param exec_args arguments passed to exec (including argv[0])
     * @param opts options, see Options
     * @param do_in_parent_after_fork function taking child's pid as an argument
     *   that will be called in the parent process just after the child is ready
     *   to exec
     *
     * @return ExitStat, message is "exited with N" or "killed by signal N - ..."
     *   for an unsuccessful exit and empty otherwise
     *
     * @errors Throws an exception std::runtime_error with appropriate
     *   information if any syscall fails or @p exec cannot be executed
     */
    static ExitStat run(
        const std::string& exec,
        const std::vector<std::string>& exec_args,
        const Options& opts,
        const std::function<void(pid_t)>& do_in_parent_after_fork = [](pid_t /*unused*/) {}
    );

protected:
    // Sends @p errnum followed by @p str_parts through @p fd and _exits with -1.
    // Async-signal-safe.
    [[noreturn]] static void send_error_message_and_exit(
        int fd, int errnum, const char* str1, const char* str2 = "", const char* str3 = ""
    ) noexcept;

    /**
     * @brief Receives error message from @p fd
     * @details Throws the message if the child reported one, otherwise
     *   describes the exit
     *
     * @param si sig_info from waitid(2)
     * @param fd file descriptor to read from
     */
    static std::string receive_error_message(const siginfo_t& si, int fd);

    // Initializes child process which will execute @p exec, this function
    // does not return
    [[noreturn]] static void run_child(
        const char* exec, const char* const* argv, const Options& opts, int fd
    ) noexcept;

    // Kills the process group @p pgid with SIGKILL once the time limit passes
    class Timer {
        struct SignalHandlerContext {
            const pid_t pgid;
            volatile std::sig_atomic_t fired;
        };

        const pid_t creator_thread_id_;
        timer_t timer_id_{};
        bool armed_ = false;
        SignalHandlerContext context_;

    public:
        Timer(pid_t pgid, std::chrono::nanoseconds time_limit);

        Timer(const Timer&) = delete;
        Timer(Timer&&) = delete;
        Timer& operator=(const Timer&) = delete;
        Timer& operator=(Timer&&) = delete;

        // Waits for the signal handler if the timer has already expired
        void disarm() noexcept;

        [[nodiscard]] bool fired() const noexcept;

        ~Timer() { disarm(); }
    };

    // Samples resident set size of the child and kills its process group once
    // it exceeds the limit
    class RssWatcher;
};

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <linux/close_range.h>
#include <linux/seccomp.h>
#include <mutex>
#include <oirun/call_in_destructor.hh>
#include <oirun/errmsg.hh>
#include <oirun/file_descriptor.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/macros/throw.hh>
#include <oirun/proc_status_file.hh>
#include <oirun/spawner.hh>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>

using std::string;
using std::vector;

namespace {

timespec to_timespec(std::chrono::nanoseconds dur) noexcept {
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    auto secs = duration_cast<seconds>(dur);
    return {secs.count(), (dur - secs).count()};
}

std::chrono::nanoseconds to_nanoseconds(const timeval& tv) noexcept {
    return std::chrono::seconds{tv.tv_sec} + std::chrono::microseconds{tv.tv_usec};
}

std::chrono::nanoseconds monotonic_now() {
    timespec ts{};
    if (clock_gettime(CLOCK_MONOTONIC, &ts)) {
        THROW("clock_gettime()", errmsg());
    }
    return std::chrono::seconds{ts.tv_sec} + std::chrono::nanoseconds{ts.tv_nsec};
}

// waitid() that is retried on EINTR. Unlike glibc's wrapper the raw syscall
// fills @p ru.
void wait_for_child(pid_t pid, siginfo_t& si, int options, struct rusage* ru) {
    for (;;) {
        if (syscall(SYS_waitid, P_PID, pid, &si, options, ru) == 0) {
            return;
        }
        if (errno != EINTR) {
            THROW("waitid()", errmsg());
        }
    }
}

} // namespace

class Spawner::RssWatcher {
    const pid_t pid_;
    const uint64_t limit_;
    const std::chrono::nanoseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::atomic<bool> exceeded_{false};
    std::atomic<uint64_t> peak_{0};
    std::thread thread_;

    void sample_loop() noexcept {
        std::unique_lock lock{mutex_};
        for (;;) {
            // The first sample is taken one interval after the start, the
            // child has replaced its image by then
            if (cv_.wait_for(lock, interval_, [this] { return stop_; })) {
                return;
            }

            uint64_t rss = 0;
            try {
                rss = resident_set_size(pid_);
            } catch (const std::exception& e) {
                debuglog("memory watcher of pid ", pid_, " finished: ", e.what());
                return;
            }

            if (rss > peak_.load()) {
                peak_ = rss;
            }
            if (rss > limit_) {
                exceeded_ = true;
                (void)kill(-pid_, SIGKILL);
                return;
            }
        }
    }

public:
    RssWatcher(pid_t pid, uint64_t limit, std::chrono::nanoseconds interval)
    : pid_(pid)
    , limit_(limit)
    , interval_(interval)
    , thread_([this] { sample_loop(); }) {}

    RssWatcher(const RssWatcher&) = delete;
    RssWatcher(RssWatcher&&) = delete;
    RssWatcher& operator=(const RssWatcher&) = delete;
    RssWatcher& operator=(RssWatcher&&) = delete;

    void stop() noexcept {
        {
            std::lock_guard lock{mutex_};
            stop_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] bool limit_exceeded() const noexcept { return exceeded_; }

    [[nodiscard]] uint64_t peak() const noexcept { return peak_; }

    ~RssWatcher() { stop(); }
};

void Spawner::send_error_message_and_exit(
    int fd, int errnum, const char* str1, const char* str2, const char* str3
) noexcept {
    (void)write_all(fd, &errnum, sizeof(errnum));
    for (const char* str : {str1, str2, str3}) {
        (void)write_all(fd, str, strlen(str));
    }
    _exit(-1);
}

string Spawner::receive_error_message(const siginfo_t& si, int fd) {
    STACK_UNWINDING_MARK;

    string message;
    std::array<char, 4096> buff{};
    ssize_t rc = 0;
    while ((rc = read(fd, buff.data(), buff.size())) > 0) {
        message.append(buff.data(), rc);
    }

    if (message.size() >= sizeof(int)) { // Error in the child before exec
        int errnum = 0;
        std::memcpy(&errnum, message.data(), sizeof(errnum));
        message.erase(0, sizeof(errnum));
        THROW(message, (errnum == 0 ? string{} : errmsg(errnum)));
    }

    switch (si.si_code) {
    case CLD_EXITED: return concat_tostr("exited with ", si.si_status);
    case CLD_KILLED:
        return concat_tostr("killed by signal ", si.si_status, " - ", strsignal(si.si_status));
    case CLD_DUMPED:
        return concat_tostr(
            "killed and dumped by signal ", si.si_status, " - ", strsignal(si.si_status)
        );
    default: THROW("Invalid siginfo_t.si_code: ", si.si_code);
    }
}

Spawner::Timer::Timer(pid_t pgid, std::chrono::nanoseconds time_limit)
: creator_thread_id_(static_cast<pid_t>(syscall(SYS_gettid)))
, context_{pgid, false} {
    STACK_UNWINDING_MARK;

    // It is OK to use static, since the class and constructor is not a template
    static constexpr auto timeout_handler = [](int /*unused*/,
                                               siginfo_t* si,
                                               void* /*unused*/) noexcept {
        if (si->si_code != SI_TIMER) {
            return; // Ignore other signals
        }

        int errnum = errno;
        auto& context = *static_cast<SignalHandlerContext*>(si->si_value.sival_ptr);
        (void)kill(-context.pgid, SIGKILL); // signal safe
        context.fired = true;
        errno = errnum;
    };

    struct sigaction sa = {};
    sa.sa_flags = SA_SIGINFO | SA_RESTART;
    sa.sa_sigaction = timeout_handler;
    if (sigaction(SIGRTMIN, &sa, nullptr)) {
        THROW("sigaction()", errmsg());
    }

    sigevent sev{};
    sev.sigev_notify = SIGEV_THREAD_ID;
    sev._sigev_un._tid = creator_thread_id_; // sigev_notify_thread_id
    sev.sigev_signo = SIGRTMIN;
    sev.sigev_value.sival_ptr = &context_;
    if (timer_create(CLOCK_MONOTONIC, &sev, &timer_id_)) {
        THROW("timer_create()", errmsg());
    }
    armed_ = true;

    itimerspec its{{0, 0}, to_timespec(time_limit)};
    if (timer_settime(timer_id_, 0, &its, nullptr)) {
        int errnum = errno;
        disarm();
        THROW("timer_settime()", errmsg(errnum));
    }
}

void Spawner::Timer::disarm() noexcept {
    if (not armed_) {
        return;
    }
    armed_ = false;

    itimerspec new_its{{0, 0}, {0, 0}};
    itimerspec old_its{};
    if (timer_settime(timer_id_, 0, &new_its, &old_its) == 0 and
        old_its.it_value.tv_sec == 0 and old_its.it_value.tv_nsec == 0)
    {
        // The timer has expired, so the handler was or is about to be run in
        // this thread
        while (not context_.fired) {
            pause();
        }
    }
    (void)timer_delete(timer_id_);
}

bool Spawner::Timer::fired() const noexcept { return context_.fired != 0; }

Spawner::ExitStat Spawner::run(
    const string& exec,
    const vector<string>& exec_args,
    const Spawner::Options& opts,
    const std::function<void(pid_t)>& do_in_parent_after_fork
) {
    STACK_UNWINDING_MARK;

    using std::chrono_literals::operator""ns;

    if (opts.real_time_limit.has_value() and opts.real_time_limit.value() <= 0ns) {
        THROW("If set, real_time_limit has to be greater than 0");
    }
    if (opts.cpu_time_limit.has_value() and opts.cpu_time_limit.value() <= 0ns) {
        THROW("If set, cpu_time_limit has to be greater than 0");
    }
    if (opts.address_space_limit.has_value() and opts.address_space_limit.value() == 0) {
        THROW("If set, address_space_limit has to be greater than 0");
    }
    if (opts.rss_limit.has_value() and opts.rss_sampling_interval <= 0ns) {
        THROW("rss_sampling_interval has to be greater than 0");
    }
    if (exec_args.empty()) {
        THROW("exec_args has to contain at least argv[0]");
    }

    // The child must not allocate, so argv is prepared here
    vector<const char*> argv;
    argv.reserve(exec_args.size() + 1);
    for (const auto& arg : exec_args) {
        argv.emplace_back(arg.c_str());
    }
    argv.emplace_back(nullptr);

    // Error stream from child via pipe
    std::array<int, 2> pfd{};
    if (pipe2(pfd.data(), O_CLOEXEC) == -1) {
        THROW("pipe2()", errmsg());
    }

    pid_t cpid = fork();
    if (cpid == -1) {
        int errnum = errno;
        (void)close(pfd[0]);
        (void)close(pfd[1]);
        THROW("fork()", errmsg(errnum));
    }
    if (cpid == 0) {
        (void)close(pfd[0]);
        run_child(exec.c_str(), argv.data(), opts, pfd[1]);
    }

    (void)close(pfd[1]);
    FileDescriptor error_fd{pfd[0]};

    // Wait for child to be ready
    siginfo_t si{};
    rusage ru{};
    wait_for_child(cpid, si, WSTOPPED | WEXITED, &ru);

    if (si.si_code != CLD_STOPPED) {
        ExitStat es;
        es.si = {si.si_code, si.si_status};
        es.rusage = ru;
        es.message = receive_error_message(si, error_fd);
        return es;
    }

    // Useful when exception is thrown
    CallInDtor kill_and_wait_child_guard([&] {
        (void)kill(-cpid, SIGKILL);
        (void)syscall(SYS_waitid, P_PID, cpid, &si, WEXITED, nullptr);
    });

    do_in_parent_after_fork(cpid);

    std::optional<Timer> timer;
    if (opts.real_time_limit) {
        timer.emplace(cpid, *opts.real_time_limit);
    }

    auto start_time = monotonic_now();
    (void)kill(cpid, SIGCONT); // There is only one process now, so '-' is not needed

    std::optional<RssWatcher> rss_watcher;
    if (opts.rss_limit) {
        rss_watcher.emplace(cpid, *opts.rss_limit, opts.rss_sampling_interval);
    }

    // Wait for death of the child, it stays a zombie so its pid cannot be reused
    wait_for_child(cpid, si, WEXITED | WNOWAIT, nullptr);
    auto end_time = monotonic_now();

    ExitStat es;
    es.runtime = end_time - start_time;
    if (timer) {
        timer->disarm();
        es.real_time_limit_exceeded = timer->fired();
    }
    if (rss_watcher) {
        rss_watcher->stop();
        es.rss_limit_exceeded = rss_watcher->limit_exceeded();
        es.peak_rss = rss_watcher->peak();
    }

    // Descendants of the child must not outlive it
    (void)kill(-cpid, SIGKILL);

    kill_and_wait_child_guard.cancel();
    wait_for_child(cpid, si, WEXITED, &ru);

    es.si = {si.si_code, si.si_status};
    es.rusage = ru;
    es.cpu_runtime = to_nanoseconds(ru.ru_utime) + to_nanoseconds(ru.ru_stime);
    if (not es.exited_normally()) {
        es.message = receive_error_message(si, error_fd);
    }
    return es;
}

void Spawner::run_child(
    const char* exec, const char* const* argv, const Options& opts, int fd
) noexcept {
    // Only async-signal-safe functions may be used here
    auto fail = [fd](const char* str) { send_error_message_and_exit(fd, errno, str); };

    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        fail("setpgid()");
    }

    if (not opts.working_dir.empty() and chdir(opts.working_dir.c_str()) == -1) {
        send_error_message_and_exit(fd, errno, "chdir('", opts.working_dir.c_str(), "')");
    }

    auto set_limit = [&](int resource, rlim_t value, const char* name, rlim_t hard_slack = 0) {
        rlimit limit{};
        limit.rlim_cur = value;
        limit.rlim_max = value + hard_slack;
        if (setrlimit(resource, &limit)) {
            send_error_message_and_exit(fd, errno, "setrlimit(", name, ")");
        }
    };

    // Virtual memory and stack size are limited to the same value
    if (opts.address_space_limit) {
        set_limit(RLIMIT_AS, *opts.address_space_limit, "RLIMIT_AS");
        set_limit(RLIMIT_STACK, *opts.address_space_limit, "RLIMIT_STACK");
    }

    // Useful when the spawned process becomes orphaned
    using std::chrono::duration_cast;
    using std::chrono::seconds;
    using std::chrono_literals::operator""ms;
    if (auto cpu_tl = opts.cpu_time_limit ? opts.cpu_time_limit : opts.real_time_limit; cpu_tl) {
        // + 1.5s to avoid premature death. SIGXCPU is sent at the soft limit,
        // SIGKILL only a second later at the hard one.
        set_limit(
            RLIMIT_CPU, duration_cast<seconds>(*cpu_tl + 1500ms).count(), "RLIMIT_CPU", 1
        );
    }

    if (opts.file_size_limit) {
        set_limit(RLIMIT_FSIZE, *opts.file_size_limit, "RLIMIT_FSIZE");
    }
    set_limit(RLIMIT_CORE, 0, "RLIMIT_CORE");

    auto change_fd = [&](int new_fd, int target_fd) {
        if (new_fd < 0) {
            (void)close(target_fd);
        } else if (new_fd != target_fd) {
            while (dup2(new_fd, target_fd) == -1) {
                if (errno != EINTR) {
                    fail("dup2()");
                }
            }
        }
    };
    change_fd(opts.new_stdin_fd, STDIN_FILENO);
    change_fd(opts.new_stdout_fd, STDOUT_FILENO);
    change_fd(opts.new_stderr_fd, STDERR_FILENO);

    // Other file descriptors must not leak into the executed program, they
    // are marked close-on-exec so that fd (error pipe) still works until exec
    bool fds_marked = false;
#if defined(SYS_close_range) and defined(CLOSE_RANGE_CLOEXEC)
    fds_marked = (syscall(SYS_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC) == 0);
#endif
    if (not fds_marked) {
        rlimit nofile{};
        rlim_t max_fd = 1024;
        if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 and nofile.rlim_cur != RLIM_INFINITY) {
            max_fd = std::min<rlim_t>(nofile.rlim_cur, 1 << 16);
        }
        for (int i = 3; i < static_cast<int>(max_fd); ++i) {
            (void)fcntl(i, F_SETFD, FD_CLOEXEC);
        }
    }

    if (opts.seccomp_filter) {
        if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
            fail("prctl(PR_SET_NO_NEW_PRIVS)");
        }
        if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, opts.seccomp_filter)) {
            fail("prctl(PR_SET_SECCOMP)");
        }
    }

    // Signal parent process that child is ready to execute @p exec
    (void)kill(getpid(), SIGSTOP);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    execvp(exec, const_cast<char* const*>(argv));
    send_error_message_and_exit(fd, errno, "execvp('", exec, "')");
}

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <oirun/backend/container_backend.hh>
#include <oirun/concat_tostr.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/string_transform.hh>
#include <oirun/temporary_directory.hh>
#include <random>
#include <thread>

using std::string;
using std::string_view;

namespace {

string_view without_trailing_slash(string_view dir) noexcept {
    while (dir.size() > 1 and dir.back() == '/') {
        dir.remove_suffix(1);
    }
    return dir;
}

// Kills the container by name once the deadline passes
class Watchdog {
    oirun::CommandRunner& runner_;
    const string container_name_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::atomic<bool> fired_{false};
    std::thread thread_;

public:
    Watchdog(oirun::CommandRunner& runner, string container_name, std::chrono::nanoseconds deadline)
    : runner_(runner)
    , container_name_(std::move(container_name))
    , thread_([this, deadline] { watch(deadline); }) {}

    Watchdog(const Watchdog&) = delete;
    Watchdog(Watchdog&&) = delete;
    Watchdog& operator=(const Watchdog&) = delete;
    Watchdog& operator=(Watchdog&&) = delete;

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

    [[nodiscard]] bool fired() const noexcept { return fired_; }

    ~Watchdog() { stop(); }

private:
    void watch(std::chrono::nanoseconds deadline) noexcept {
        {
            std::unique_lock lock{mutex_};
            if (cv_.wait_for(lock, deadline, [this] { return stop_; })) {
                return;
            }
        }

        fired_ = true;
        debuglog("container: killing ", container_name_);
        try {
            auto out = runner_.run(
                {.argv = {"docker", "kill", container_name_}, .timeout = std::chrono::seconds{30}}
            );
            if (not out.success()) {
                debuglog("container: docker kill ", container_name_, " failed: ", trim(out.err));
            }
        } catch (const std::exception& e) {
            errlog("Cannot kill container ", container_name_, ": ", e.what());
        }
    }
};

} // namespace

namespace oirun::backend {

std::vector<string> docker_run_args(
    string_view container_name,
    uint64_t memory_limit_mb,
    string_view host_source_dir,
    string_view host_scratch_dir,
    string_view image,
    string_view shell_command
) {
    auto memory = concat_tostr(memory_limit_mb, 'm');
    return {
        "docker",
        "run",
        "--rm",
        "-i",
        "--name",
        string{container_name},
        "--network=none",
        "--read-only",
        concat_tostr("--memory=", memory),
        concat_tostr("--memory-swap=", memory),
        "--cpus=1.0",
        "--pids-limit=64",
        "-v",
        concat_tostr(
            without_trailing_slash(host_source_dir),
            ':',
            without_trailing_slash(container_source_dir),
            ":ro"
        ),
        "-v",
        concat_tostr(
            without_trailing_slash(host_scratch_dir),
            ':',
            without_trailing_slash(container_scratch_dir),
            ":rw"
        ),
        string{image},
        "bash",
        "-c",
        string{shell_command},
    };
}

string unique_container_name() {
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist{0, 999};
    auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch()
    )
                        .count();
    return concat_tostr("oi-task-", epoch_ms, '-', dist(gen));
}

ContainerBackend::ContainerBackend(
    CommandRunner& runner,
    DockerDaemon& daemon,
    ContainerBackendOptions options,
    std::unique_ptr<ViolationClassifier> classifier
)
: runner_(runner)
, daemon_(daemon)
, options_(std::move(options))
, classifier_(std::move(classifier))
, sanitizer_({options_.scratch_root}) {}

const string& ContainerBackend::image_for(Language lang) const noexcept {
    const std::optional<string>* image = nullptr;
    switch (lang) {
    case Language::C: image = &options_.c_image; break;
    case Language::CPP: image = &options_.cpp_image; break;
    case Language::PYTHON: image = &options_.python_image; break;
    }
    return (image and image->has_value() ? **image : options_.default_image);
}

ExecutionResult ContainerBackend::run(const RunSpec& spec) {
    STACK_UNWINDING_MARK;

    daemon_.ensure_ready();
    const auto& image = image_for(spec.language);
    daemon_.ensure_image(image);

    // Removed on every path out of this function
    std::optional<TemporaryDirectory> own_scratch;
    string scratch_dir = spec.mounts.scratch_dir;
    if (scratch_dir.empty()) {
        own_scratch.emplace(concat_tostr(options_.scratch_root, "oi-container-XXXXXX"));
        scratch_dir = own_scratch->path();
    }
    string source_dir = (spec.mounts.source_dir.empty() ? scratch_dir : spec.mounts.source_dir);

    auto cwd = (spec.cwd.empty() ? string{container_source_dir} : spec.cwd);
    auto shell_command = concat_tostr(
        "cd ", shell_quote(sanitize_argument(cwd)), " && ", sanitizer_.build(spec.command, spec.args)
    );
    auto container_name = unique_container_name();

    Command cmd;
    cmd.argv = docker_run_args(
        container_name, spec.memory_limit_mb, source_dir, scratch_dir, image, shell_command
    );
    cmd.input = spec.input;
    cmd.timeout = spec.time_limit + options_.kill_grace + options_.client_grace;

    debuglog("container: ", container_name, " runs: ", shell_command);
    CommandOutput out;
    bool killed = false;
    {
        Watchdog watchdog{runner_, container_name, spec.time_limit + options_.kill_grace};
        try {
            out = runner_.run(cmd);
        } catch (const std::exception& e) {
            throw BackendError(concat_tostr("Cannot run docker: ", e.what()));
        }
        watchdog.stop();
        killed = watchdog.fired();
    }

    RawOutcome raw;
    raw.exit_status = out.exit_code;
    raw.timer_fired = killed or out.timed_out;
    // 125: the docker client failed before the workload started
    if (out.exit_code == 125 and not raw.timer_fired) {
        throw BackendError(concat_tostr("docker run failed: ", trim(out.err)));
    }

    ExecutionResult res;
    res.stdout_str = std::move(out.out);
    res.stderr_str = std::move(out.err);
    classifier_->classify(raw, res);
    debuglog(
        "container: ",
        container_name,
        " finished with ",
        res.exit_code,
        (res.timed_out ? " timed out" : ""),
        (res.memory_exceeded ? " memory exceeded" : "")
    );
    return res;
}

} // namespace oirun::backend

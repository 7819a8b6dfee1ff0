#include <cerrno>
#include <oirun/backend/process_backend.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/spawner.hh>
#include <sys/socket.h>

using std::string;

namespace oirun::backend {

std::unique_ptr<sandbox::seccomp::Program> build_network_filter() {
    STACK_UNWINDING_MARK;

    using sandbox::seccomp::ARG0_EQ;
    sandbox::seccomp::BpfBuilder bpf{SCMP_ACT_ALLOW};
    bpf.err_syscall(EPERM, SCMP_SYS(socket), ARG0_EQ{AF_INET});
    bpf.err_syscall(EPERM, SCMP_SYS(socket), ARG0_EQ{AF_INET6});
    return std::make_unique<sandbox::seccomp::Program>(bpf.export_instructions());
}

ProcessBackend::ProcessBackend(
    ProcessBackendOptions options, std::unique_ptr<ViolationClassifier> classifier
)
: options_(options)
, classifier_(std::move(classifier)) {
    if (options_.block_network) {
        network_filter_ = build_network_filter();
    }
}

ExecutionResult ProcessBackend::run(const RunSpec& spec) {
    STACK_UNWINDING_MARK;

    uint64_t memory_limit = spec.memory_limit_mb << 20;
    ExecutionResult res;
    RawOutcome raw;
    try {
        auto in = open_staging_file(spec.input);
        auto out = open_staging_file();
        auto err = open_staging_file();

        std::vector<string> argv{spec.command};
        argv.insert(argv.end(), spec.args.begin(), spec.args.end());

        Spawner::Options opts;
        opts.new_stdin_fd = in;
        opts.new_stdout_fd = out;
        opts.new_stderr_fd = err;
        opts.real_time_limit = spec.time_limit;
        if (options_.address_space_limit) {
            opts.address_space_limit = memory_limit;
        }
        opts.rss_limit = memory_limit;
        opts.rss_sampling_interval = options_.memory_poll_interval;
        opts.file_size_limit = options_.max_output_size;
        opts.working_dir = (spec.cwd.empty() ? spec.mounts.source_dir : spec.cwd);
        opts.seccomp_filter = (network_filter_ ? network_filter_->fprog() : nullptr);

        debuglog(
            "native: running ",
            spec.command,
            " (time limit ",
            std::chrono::duration_cast<std::chrono::milliseconds>(spec.time_limit).count(),
            " ms, memory limit ",
            spec.memory_limit_mb,
            " MiB)"
        );
        auto es = Spawner::run(spec.command, argv, opts);

        res.stdout_str = read_whole_file(out);
        res.stderr_str = read_whole_file(err);
        res.runtime = es.runtime;
        res.peak_memory = es.peak_rss;
        if (es.si.code == CLD_EXITED) {
            raw.exit_status = es.si.status;
        } else {
            raw.signal = es.si.status;
        }
        raw.timer_fired = es.real_time_limit_exceeded;
        raw.memory_watcher_fired = es.rss_limit_exceeded;
        raw.cpu_time_limit_reached = (es.cpu_runtime >= spec.time_limit);
        raw.address_space_limited = opts.address_space_limit.has_value();
    } catch (const std::runtime_error& e) {
        throw BackendError(concat_tostr("Cannot run ", spec.command, ": ", e.what()));
    }

    classifier_->classify(raw, res);
    debuglog(
        "native: ",
        spec.command,
        " finished with ",
        res.exit_code,
        (res.timed_out ? " timed out" : ""),
        (res.memory_exceeded ? " memory exceeded" : ""),
        (res.space_exceeded ? " space exceeded" : "")
    );
    return res;
}

} // namespace oirun::backend

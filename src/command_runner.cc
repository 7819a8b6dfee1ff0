#include <oirun/command_runner.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/macros/throw.hh>
#include <oirun/spawner.hh>

namespace oirun {

CommandOutput SpawnerCommandRunner::run(const Command& cmd) {
    STACK_UNWINDING_MARK;

    if (cmd.argv.empty()) {
        THROW("Cannot run an empty command");
    }

    auto in = open_staging_file(cmd.input);
    auto out = open_staging_file();
    auto err = open_staging_file();

    if (debuglog.is_active()) {
        auto log = debuglog("spawn:");
        for (const auto& arg : cmd.argv) {
            log(' ', arg);
        }
    }

    Spawner::Options opts;
    opts.new_stdin_fd = in;
    opts.new_stdout_fd = out;
    opts.new_stderr_fd = err;
    opts.real_time_limit = cmd.timeout;
    opts.working_dir = cmd.working_dir;
    auto es = Spawner::run(cmd.argv[0], cmd.argv, opts);

    CommandOutput res;
    res.timed_out = es.real_time_limit_exceeded;
    res.exit_code = (es.si.code == CLD_EXITED ? es.si.status : 128 + es.si.status);
    res.out = read_whole_file(out);
    res.err = read_whole_file(err);
    debuglog(
        "spawn: ", cmd.argv[0], " finished with ", res.exit_code, (res.timed_out ? " (timed out)" : "")
    );
    return res;
}

} // namespace oirun

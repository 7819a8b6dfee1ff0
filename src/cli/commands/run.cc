#include "../cli_error.hh"
#include "../render.hh"
#include "commands.hh"
#include "run_options.hh"

#include <cstdio>
#include <oirun/file_manip.hh>
#include <oirun/macros/stack_unwinding.hh>

namespace commands {

int run(CliContext& ctx, ArgvParser args) {
    STACK_UNWINDING_MARK;

    auto opts = parse_run_options(args, 1);
    oirun::ExecutionRequest req;
    req.source_path = opts.sources[0];
    req.language = language_of(opts, req.source_path);
    req.compiler_or_backend_choice = opts.choice();
    req.input = std::move(opts.input);
    req.time_limit_seconds = opts.time_limit_seconds;
    req.memory_limit_mb = opts.memory_limit_mb;
    req.optimization_level = opts.optimization;
    req.language_standard = opts.standard;

    oirun::RunReport rep;
    try {
        rep = ctx.engine().run(req);
    } catch (const oirun::InvalidRequest& e) {
        throw CliError(e.what());
    }

    fputs(render_run_report(rep, ctx.json).c_str(), stdout);
    if (ctx.json) {
        putchar('\n');
    }
    return rep.verdict == oirun::Verdict::AC ? 0 : 2;
}

int pair(CliContext& ctx, ArgvParser args) {
    STACK_UNWINDING_MARK;

    auto opts = parse_run_options(args, 2);
    auto lang = language_of(opts, opts.sources[0]);
    if (language_of(opts, opts.sources[1]) != lang) {
        throw CliError("pair: both sources have to be in the same language");
    }

    oirun::pair_check::PairRequest req;
    try {
        req.source_a = get_file_contents(opts.sources[0]);
        req.source_b = get_file_contents(opts.sources[1]);
    } catch (const std::exception& e) {
        throw CliError("pair: cannot read the sources: ", e.what());
    }
    req.language = lang;
    req.input = std::move(opts.input);
    if (opts.time_limit_seconds > 0) {
        req.time_limit_seconds = opts.time_limit_seconds;
    }
    if (opts.memory_limit_mb > 0) {
        req.memory_limit_mb = opts.memory_limit_mb;
    }
    req.optimization_level = opts.optimization;
    req.language_standard = opts.standard;
    req.compiler_choice = opts.choice();

    oirun::pair_check::PairCheckResult res;
    try {
        res = ctx.engine().run_pair(req);
    } catch (const oirun::InvalidRequest& e) {
        throw CliError(e.what());
    } catch (const oirun::backend::BackendError& e) {
        throw CliError("system error: ", e.what());
    }

    fputs(render_pair_result(res, ctx.json).c_str(), stdout);
    if (ctx.json) {
        putchar('\n');
    }
    return res.equal ? 0 : 2;
}

} // namespace commands

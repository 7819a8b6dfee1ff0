#include "../cli_error.hh"
#include "../render.hh"
#include "commands.hh"

#include <cstdio>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>

namespace commands {

int detect(CliContext& ctx, ArgvParser args) {
    STACK_UNWINDING_MARK;

    bool rescan = false;
    while (args.size() > 0) {
        auto arg = args.extract_next();
        if (arg == "--rescan") {
            rescan = true;
        } else {
            throw CliError("detect: unknown argument: ", arg);
        }
    }

    auto res = ctx.engine().detect(rescan);
    fputs(render_detection(res, ctx.json).c_str(), stdout);
    if (ctx.json) {
        putchar('\n');
    }
    return res.success ? 0 : 1;
}

int clear_cache(CliContext& ctx, ArgvParser args) {
    STACK_UNWINDING_MARK;

    if (args.size() > 0) {
        throw CliError("clear-cache: unexpected argument: ", args.next());
    }
    ctx.engine().clear_cache();
    stdlog("Compiler cache cleared");
    return 0;
}

int compilers(CliContext& ctx, ArgvParser args) {
    STACK_UNWINDING_MARK;

    if (args.size() != 1) {
        throw CliError("compilers: expected exactly one argument: c or cpp");
    }
    auto lang = oirun::language_from_id(args.next());
    if (not lang or not oirun::is_compiled(*lang)) {
        throw CliError("compilers: invalid language: ", args.next(), " (expected c or cpp)");
    }

    auto list = ctx.engine().suitable_compilers(*lang);
    fputs(render_compilers(list, ctx.json).c_str(), stdout);
    if (ctx.json) {
        putchar('\n');
    }
    return list.empty() ? 1 : 0;
}

} // namespace commands

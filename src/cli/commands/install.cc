#include "../cli_error.hh"
#include "../render.hh"
#include "commands.hh"

#include <cstdio>
#include <oirun/macros/stack_unwinding.hh>

namespace commands {

int install(CliContext& ctx, ArgvParser args) {
    STACK_UNWINDING_MARK;

    auto mode = oirun::installer::InstallMode::AUTOMATIC;
    while (args.size() > 0) {
        auto arg = args.extract_next();
        if (arg == "--manual") {
            mode = oirun::installer::InstallMode::MANUAL;
        } else {
            throw CliError("install: unknown argument: ", arg);
        }
    }

    auto outcome = ctx.engine().install(mode);
    fputs(render_install_outcome(outcome, ctx.json).c_str(), stdout);
    if (ctx.json) {
        putchar('\n');
    }
    return (outcome.success or mode == oirun::installer::InstallMode::MANUAL) ? 0 : 1;
}

} // namespace commands

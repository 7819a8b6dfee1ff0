#include "cli_error.hh"
#include "commands/commands.hh"
#include "context.hh"

#include <cstdio>
#include <cstring>
#include <oirun/config_file.hh>
#include <oirun/engine_config.hh>
#include <oirun/errmsg.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <unistd.h>

namespace {

/**
 * Parses options passed to oirun via arguments
 * @param argc like in main (will be modified to hold the number of non-option
 *   parameters)
 * @param argv like in main (holds arguments)
 * @param ctx receives --config and --json
 */
void parse_options(int& argc, char** argv, CliContext& ctx) {
    STACK_UNWINDING_MARK;

    int new_argc = 1;
    bool commands_started = false;
    for (int i = 1; i < argc; ++i) {
        // Options of commands are parsed by the commands
        if (commands_started or argv[i][0] != '-') {
            commands_started = true;
            argv[new_argc++] = argv[i];
            continue;
        }

        if (0 == strcmp(argv[i], "-C") and i + 1 < argc) {
            // Working directory
            if (chdir(argv[++i]) == -1) {
                (void)fprintf(stderr, "Error: chdir()%s\n", errmsg().c_str());
                _exit(1);
            }

        } else if (0 == strcmp(argv[i], "--config") and i + 1 < argc) {
            ctx.config_path = argv[++i];

        } else if (0 == strcmp(argv[i], "--json")) {
            ctx.json = true;

        } else if (0 == strcmp(argv[i], "-h") or 0 == strcmp(argv[i], "--help")) {
            commands::help(argv[0]); // argv[0] is valid (argc > 1)
            _exit(0);

        } else if (0 == strcmp(argv[i], "-V") or 0 == strcmp(argv[i], "--version")) {
            commands::version();
            _exit(0);

        } else if (0 == strcmp(argv[i], "-v") or 0 == strcmp(argv[i], "--verbose")) {
            debuglog.use(stderr);
            debuglog.label(false);

        } else if (0 == strcmp(argv[i], "-q") or 0 == strcmp(argv[i], "--quiet")) {
            stdlog.open("/dev/null");

        } else { // Unknown
            (void)fprintf(stderr, "Unknown option: '%s'\n", argv[i]);
        }
    }

    argc = new_argc;
    argv[argc] = nullptr;
}

int run_command(int argc, char** argv, CliContext& ctx) {
    STACK_UNWINDING_MARK;

    ArgvParser args(argc - 1, argv + 1);
    auto command = args.extract_next();

    if (command == "clear-cache") {
        return commands::clear_cache(ctx, args);
    }
    if (command == "compilers") {
        return commands::compilers(ctx, args);
    }
    if (command == "detect") {
        return commands::detect(ctx, args);
    }
    if (command == "help") {
        commands::help(argv[0]);
        return 0;
    }
    if (command == "install") {
        return commands::install(ctx, args);
    }
    if (command == "pair") {
        return commands::pair(ctx, args);
    }
    if (command == "run") {
        return commands::run(ctx, args);
    }
    if (command == "version") {
        commands::version();
        return 0;
    }

    throw CliError("unknown command: ", command);
}

} // namespace

int main(int argc, char** argv) {
    stdlog.label(false);
    errlog.label(false);

    CliContext ctx;
    parse_options(argc, argv, ctx);

    if (argc < 2) {
        commands::help(argv[0]);
        return 1;
    }

    try {
        return run_command(argc, argv, ctx);
    } catch (const CliError& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    } catch (const ConfigFile::ParseError& e) {
        errlog("\033[1;31mError\033[m: config: ", e.what(), '\n', e.diagnostics());
        return 1;
    } catch (const oirun::ConfigError& e) {
        errlog("\033[1;31mError\033[m: ", e.what());
        return 1;
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        return 1;
    }
}

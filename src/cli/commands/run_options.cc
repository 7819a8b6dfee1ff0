#include "../cli_error.hh"
#include "run_options.hh"

#include <cmath>
#include <exception>
#include <oirun/execution.hh>
#include <oirun/file_manip.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/string_transform.hh>
#include <unistd.h>

using std::string;
using std::string_view;

namespace commands {

RunOptions parse_run_options(ArgvParser args, size_t sources_num) {
    STACK_UNWINDING_MARK;

    RunOptions opts;
    auto value_of = [&](string_view option) {
        if (args.size() == 0) {
            throw CliError("option ", option, " requires a value");
        }
        return args.extract_next();
    };

    while (args.size() > 0) {
        auto arg = args.extract_next();
        if (not has_prefix(arg, "--")) {
            opts.sources.emplace_back(arg);
        } else if (arg == "--input") {
            auto path = value_of(arg);
            try {
                opts.input = (path == "-" ? get_file_contents(STDIN_FILENO)
                                          : get_file_contents(string{path}));
            } catch (const std::exception& e) {
                throw CliError("cannot read input file ", path, ": ", e.what());
            }
        } else if (arg == "--time") {
            auto val = value_of(arg);
            auto time = str2num<double>(val);
            if (not time or not std::isfinite(*time) or *time <= 0 or
                *time > oirun::max_time_limit_seconds)
            {
                throw CliError("invalid time limit: ", val);
            }
            opts.time_limit_seconds = *time;
        } else if (arg == "--memory") {
            auto val = value_of(arg);
            auto mem = str2num<uint64_t>(val);
            if (not mem or *mem == 0 or *mem > oirun::max_memory_limit_mb) {
                throw CliError("invalid memory limit: ", val);
            }
            opts.memory_limit_mb = *mem;
        } else if (arg == "--opt") {
            opts.optimization = value_of(arg);
        } else if (arg == "--std") {
            opts.standard = value_of(arg);
        } else if (arg == "--backend") {
            auto val = value_of(arg);
            if (val != "native" and val != "container") {
                throw CliError("invalid backend: ", val, " (expected native or container)");
            }
            opts.backend = val;
        } else if (arg == "--compiler") {
            opts.compiler = value_of(arg);
            if (opts.compiler.find('/') == string::npos) {
                if (auto path = find_executable_in_path(opts.compiler)) {
                    opts.compiler = std::move(*path);
                } else {
                    throw CliError("compiler not found in PATH: ", opts.compiler);
                }
            }
        } else if (arg == "--lang") {
            auto val = value_of(arg);
            opts.language = oirun::language_from_id(val);
            if (not opts.language) {
                throw CliError("unknown language: ", val);
            }
        } else {
            throw CliError("unknown option: ", arg);
        }
    }

    if (opts.sources.size() != sources_num) {
        throw CliError("expected ", sources_num, " source file(s), got ", opts.sources.size());
    }
    if (not opts.backend.empty() and not opts.compiler.empty()) {
        throw CliError("options --backend and --compiler cannot be used together");
    }
    return opts;
}

oirun::Language language_of(const RunOptions& opts, const string& source_path) {
    if (opts.language) {
        return *opts.language;
    }
    if (auto lang = oirun::language_from_path(source_path)) {
        return *lang;
    }
    throw CliError("cannot deduce the language of ", source_path, ", use --lang");
}

} // namespace commands

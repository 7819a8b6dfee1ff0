#pragma once

#include <cstdint>
#include <oirun/argv_parser.hh>
#include <oirun/language.hh>
#include <optional>
#include <string>
#include <vector>

namespace commands {

// Options shared by the run and pair commands
struct RunOptions {
    std::vector<std::string> sources;
    std::optional<oirun::Language> language; // nullopt - from the extension
    std::string input;
    double time_limit_seconds = 0; // 0 - configured default
    uint64_t memory_limit_mb = 0; // 0 - configured default
    std::string optimization;
    std::string standard;
    std::string backend; // "native", "container" or empty
    std::string compiler; // path or empty

    // Value of ExecutionRequest::compiler_or_backend_choice
    [[nodiscard]] const std::string& choice() const noexcept {
        return compiler.empty() ? backend : compiler;
    }
};

/**
 * @brief Parses @p args: exactly @p sources_num source paths mixed with
 *   --input, --time, --memory, --opt, --std, --backend, --compiler and --lang
 *
 * @errors Throws CliError on invalid arguments and if the input file cannot
 *   be read
 */
RunOptions parse_run_options(ArgvParser args, size_t sources_num);

// Language given with --lang or deduced from @p source_path, throws CliError
// if unknown
oirun::Language language_of(const RunOptions& opts, const std::string& source_path);

} // namespace commands

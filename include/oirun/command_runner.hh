#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace oirun {

struct Command {
    std::vector<std::string> argv; // argv[0] is looked up in PATH
    std::string input;
    std::optional<std::chrono::nanoseconds> timeout;
    std::string working_dir; // empty - inherit
};

struct CommandOutput {
    int exit_code = 0; // exit status, or 128 + signal number
    bool timed_out = false;
    std::string out;
    std::string err;

    [[nodiscard]] bool success() const noexcept { return exit_code == 0 and not timed_out; }
};

// Runs helper programs (compilers being probed, docker, curl, tar). Exists
// so that components driving external tools can be tested with fakes.
class CommandRunner {
public:
    CommandRunner() = default;
    CommandRunner(const CommandRunner&) = delete;
    CommandRunner(CommandRunner&&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;
    CommandRunner& operator=(CommandRunner&&) = delete;
    virtual ~CommandRunner() = default;

    // Throws if the command cannot be started at all
    virtual CommandOutput run(const Command& cmd) = 0;
};

class SpawnerCommandRunner final : public CommandRunner {
public:
    CommandOutput run(const Command& cmd) override;
};

} // namespace oirun

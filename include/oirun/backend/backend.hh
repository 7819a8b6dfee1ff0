#pragma once

#include <chrono>
#include <cstdint>
#include <oirun/execution.hh>
#include <oirun/language.hh>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::backend {

// The backend itself failed: cannot spawn, daemon unreachable, image missing
class BackendError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    BackendError(const BackendError&) = default;
    BackendError(BackendError&&) noexcept = default;
    BackendError& operator=(const BackendError&) = default;
    BackendError& operator=(BackendError&&) noexcept = default;

    ~BackendError() override = default;
};

// Directories with trailing '/'
struct Mounts {
    std::string source_dir; // read-only for the workload
    std::string scratch_dir; // writable, holds build artifacts
};

struct RunSpec {
    std::string command;
    std::vector<std::string> args;
    std::string cwd; // as seen by the workload, empty - source_dir
    std::string input;
    std::chrono::nanoseconds time_limit{0};
    uint64_t memory_limit_mb = 0;
    Mounts mounts; // host paths
    Language language = Language::CPP; // selects the container image
};

class Backend {
public:
    Backend() = default;
    Backend(const Backend&) = delete;
    Backend(Backend&&) = delete;
    Backend& operator=(const Backend&) = delete;
    Backend& operator=(Backend&&) = delete;
    virtual ~Backend() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    // Where the workload sees the @p host directories
    [[nodiscard]] virtual Mounts visible_mounts(const Mounts& host) const = 0;

    // Tool names are resolved by the backend (e.g. "clang++" in the image),
    // paths have to be valid under visible_mounts()
    [[nodiscard]] virtual bool uses_image_toolchain() const noexcept = 0;

    /**
     * @brief Runs @p spec.command with limits from @p spec
     * @details Resource violations are reported through the result flags
     *
     * @errors Throws BackendError if the workload could not be run at all
     */
    virtual ExecutionResult run(const RunSpec& spec) = 0;
};

} // namespace oirun::backend

#pragma once

#include <chrono>
#include <cstdint>
#include <oirun/backend/backend.hh>
#include <oirun/command_runner.hh>
#include <oirun/execution.hh>
#include <oirun/registry/registry.hh>
#include <string>

namespace oirun::pipeline {

struct PipelineOptions {
    std::string scratch_root; // with trailing '/'
    uint64_t min_free_disk_mb = 100;
    // Compilation gets at least these limits, 0 - same limits as the run
    std::chrono::nanoseconds compile_time_limit{0};
    uint64_t compile_memory_limit_mb = 0;
    std::string python_interpreter = "python3";
    // Used when the request leaves the field empty or zero
    double default_time_limit_seconds = 20;
    uint64_t default_memory_limit_mb = 512;
    std::string default_optimization = "O2";
    std::string default_cpp_standard = "c++17";
    std::string default_c_standard = "c17";
};

/**
 * Compiles (unless the language is interpreted) and runs a single source
 * inside a private scratch directory, which is removed on every path out.
 */
class Pipeline {
public:
    Pipeline(registry::Registry& registry, CommandRunner& runner, PipelineOptions options);

    Pipeline(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline& operator=(Pipeline&&) = delete;
    ~Pipeline() = default;

    /**
     * @brief Runs @p req on @p backend
     * @details A failed compilation yields compile_failed = true, empty
     *   stdout and the diagnostics in stderr; nothing is run then.
     *
     * @errors Throws InvalidRequest if @p req is malformed and
     *   backend::BackendError on infrastructure failures (including no
     *   suitable compiler)
     */
    ExecutionResult compile_and_run(const ExecutionRequest& req, backend::Backend& backend);

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    registry::CompilerDescriptor
    choose_compiler(const ExecutionRequest& req, const backend::Backend& backend);

    registry::Registry& registry_;
    CommandRunner& runner_;
    PipelineOptions options_;
};

// Free space of the filesystem holding @p path, in bytes
uint64_t free_disk_space(const std::string& path);

} // namespace oirun::pipeline

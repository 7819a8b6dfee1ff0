#pragma once

#include <chrono>
#include <cstdint>
#include <oirun/language.hh>
#include <stdexcept>
#include <string>

namespace oirun {

struct ExecutionRequest {
    std::string source_path;
    Language language = Language::CPP;
    // Empty: configured default, "native" or "container": backend, otherwise
    // a path to a compiler
    std::string compiler_or_backend_choice;
    std::string input;
    double time_limit_seconds = 0; // 0 - configured default
    uint64_t memory_limit_mb = 0; // 0 - configured default
    std::string optimization_level; // e.g. "O2", empty - configured default
    std::string language_standard; // e.g. "c++17", empty - configured default
};

struct ExecutionResult {
    std::string stdout_str;
    std::string stderr_str;
    int exit_code = 0; // exit status, or 128 + signal number for a killed process
    bool timed_out = false;
    bool memory_exceeded = false; // detected by sampling, not guaranteed instant
    bool space_exceeded = false;
    bool compile_failed = false; // set by the pipeline, the run step was skipped
    std::chrono::nanoseconds runtime{0};
    uint64_t peak_memory = 0; // in bytes, 0 if unknown
};

// Upper bounds of the limits, larger values are rejected
constexpr double max_time_limit_seconds = 1e6;
constexpr uint64_t max_memory_limit_mb = uint64_t{1} << 24; // 16 TiB

// The request is malformed: non-positive limits, wrong extension, missing file
class InvalidRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    InvalidRequest(const InvalidRequest&) = default;
    InvalidRequest(InvalidRequest&&) noexcept = default;
    InvalidRequest& operator=(const InvalidRequest&) = default;
    InvalidRequest& operator=(InvalidRequest&&) noexcept = default;

    ~InvalidRequest() override = default;
};

} // namespace oirun

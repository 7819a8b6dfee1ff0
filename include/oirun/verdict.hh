#pragma once

#include <oirun/execution.hh>
#include <optional>
#include <string_view>

namespace oirun {

enum class Verdict {
    AC,
    COMPILE_ERROR,
    TLE,
    RE,
    MLE,
    SYSTEM_ERROR,
};

constexpr std::string_view to_str(Verdict verdict) noexcept {
    switch (verdict) {
    case Verdict::AC: return "AC";
    case Verdict::COMPILE_ERROR: return "COMPILE_ERROR";
    case Verdict::TLE: return "TLE";
    case Verdict::RE: return "RE";
    case Verdict::MLE: return "MLE";
    case Verdict::SYSTEM_ERROR: return "SYSTEM_ERROR";
    }
    return "UNKNOWN";
}

// Human readable description of the verdict
constexpr std::string_view description(Verdict verdict) noexcept {
    switch (verdict) {
    case Verdict::AC: return "Accepted";
    case Verdict::COMPILE_ERROR: return "Compilation error";
    case Verdict::TLE: return "Time limit exceeded";
    case Verdict::RE: return "Runtime error";
    case Verdict::MLE: return "Memory limit exceeded";
    case Verdict::SYSTEM_ERROR: return "System error";
    }
    return "Unknown";
}

std::optional<Verdict> verdict_from_str(std::string_view str) noexcept;

// Time-out dominates memory, memory dominates any exit status
constexpr Verdict verdict_of(const ExecutionResult& res) noexcept {
    if (res.compile_failed) {
        return Verdict::COMPILE_ERROR;
    }
    if (res.timed_out) {
        return Verdict::TLE;
    }
    if (res.memory_exceeded) {
        return Verdict::MLE;
    }
    if (res.space_exceeded or res.exit_code != 0) {
        return Verdict::RE;
    }
    return Verdict::AC;
}

} // namespace oirun

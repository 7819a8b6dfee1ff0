#pragma once

#include <oirun/execution.hh>
#include <optional>
#include <string_view>

namespace oirun::backend {

// What the backend observed about a finished workload
struct RawOutcome {
    std::optional<int> exit_status; // set if the workload exited
    std::optional<int> signal; // set if it was killed
    bool timer_fired = false;
    bool memory_watcher_fired = false;
    bool cpu_time_limit_reached = false; // used CPU time is not below the time limit
    bool address_space_limited = false; // RLIMIT_AS was in effect
};

/**
 * Turns a RawOutcome and the collected stderr into exit_code, timed_out,
 * memory_exceeded and space_exceeded of an ExecutionResult. Best effort:
 * partly based on matching stderr text.
 */
class ViolationClassifier {
public:
    ViolationClassifier() = default;
    ViolationClassifier(const ViolationClassifier&) = delete;
    ViolationClassifier(ViolationClassifier&&) = delete;
    ViolationClassifier& operator=(const ViolationClassifier&) = delete;
    ViolationClassifier& operator=(ViolationClassifier&&) = delete;
    virtual ~ViolationClassifier() = default;

    // res.stderr_str has to be filled before the call
    virtual void classify(const RawOutcome& raw, ExecutionResult& res) const = 0;
};

// Native processes: timer and memory watcher flags, signals, stderr hints
class ProcessViolationClassifier final : public ViolationClassifier {
public:
    void classify(const RawOutcome& raw, ExecutionResult& res) const override;
};

// Containers: exit code 137 and the daemon's messages
class ContainerViolationClassifier final : public ViolationClassifier {
public:
    void classify(const RawOutcome& raw, ExecutionResult& res) const override;
};

// "No space left on device" or "disk quota exceeded" (case-insensitive)
bool mentions_disk_exhaustion(std::string_view stderr_str);

} // namespace oirun::backend

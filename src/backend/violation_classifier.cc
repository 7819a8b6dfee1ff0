#include <csignal>
#include <oirun/backend/violation_classifier.hh>
#include <oirun/string_transform.hh>

namespace {

int exit_code_of(const oirun::backend::RawOutcome& raw) noexcept {
    if (raw.exit_status) {
        return *raw.exit_status;
    }
    return raw.signal ? 128 + *raw.signal : 0;
}

bool contains(std::string_view str, std::string_view needle) noexcept {
    return str.find(needle) != std::string_view::npos;
}

} // namespace

namespace oirun::backend {

bool mentions_disk_exhaustion(std::string_view stderr_str) {
    return contains_ignoring_case(stderr_str, "No space left on device") or
        contains_ignoring_case(stderr_str, "disk quota exceeded");
}

void ProcessViolationClassifier::classify(const RawOutcome& raw, ExecutionResult& res) const {
    res.exit_code = exit_code_of(raw);
    // SIGXCPU and a SIGKILL at the hard limit come from the RLIMIT_CPU backstop
    res.timed_out = raw.timer_fired or raw.signal == SIGXCPU or raw.cpu_time_limit_reached;
    if (res.timed_out) {
        return;
    }

    bool killed_externally = (raw.signal == SIGKILL);
    bool allocation_failed = raw.address_space_limited and
        (contains(res.stderr_str, "std::bad_alloc") or contains(res.stderr_str, "MemoryError"));
    res.memory_exceeded = raw.memory_watcher_fired or killed_externally or allocation_failed;
    if (res.memory_exceeded) {
        return;
    }

    res.space_exceeded = raw.signal == SIGXFSZ or mentions_disk_exhaustion(res.stderr_str);
}

void ContainerViolationClassifier::classify(const RawOutcome& raw, ExecutionResult& res) const {
    res.exit_code = exit_code_of(raw);
    res.timed_out = raw.timer_fired;
    res.memory_exceeded = not res.timed_out and
        (res.exit_code == 137 or contains(res.stderr_str, "Out of memory") or
         contains(res.stderr_str, "Killed process"));
    res.space_exceeded = mentions_disk_exhaustion(res.stderr_str);
}

} // namespace oirun::backend

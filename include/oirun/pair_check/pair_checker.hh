#pragma once

#include <cstdint>
#include <oirun/backend/backend.hh>
#include <oirun/execution.hh>
#include <oirun/pair_check/line_diff.hh>
#include <oirun/pipeline/pipeline.hh>
#include <oirun/verdict.hh>
#include <optional>
#include <string>
#include <vector>

namespace oirun::pair_check {

struct PairRequest {
    std::string source_a; // source code, not a path
    std::string source_b;
    Language language = Language::CPP;
    std::string input;
    double time_limit_seconds = 20;
    uint64_t memory_limit_mb = 512;
    std::string optimization_level; // empty - configured default
    std::string language_standard; // empty - configured default
    std::string compiler_choice; // empty - the recommended compiler
};

struct PairCheckResult {
    std::string output1; // normalized display string of the first program
    std::string output2;
    bool equal = false;
    std::optional<std::vector<DiffSegment>> diff; // set only if outputs differ
    Verdict verdict1 = Verdict::SYSTEM_ERROR;
    Verdict verdict2 = Verdict::SYSTEM_ERROR;
};

/**
 * @brief The text shown for a run
 * @details "TIMEOUT", "MEMORY_EXCEEDED" and "SPACE_EXCEEDED" in this order of
 *   precedence, then "ERROR:\n" followed by stderr if stderr is not empty,
 *   otherwise stdout.
 */
std::string display_string(const ExecutionResult& res);

/**
 * Runs two programs on the same input concurrently and compares what they
 * show. Both sources live in a private directory that is removed afterwards.
 */
class PairChecker {
public:
    PairChecker(pipeline::Pipeline& pipeline, std::string scratch_root);

    PairChecker(const PairChecker&) = delete;
    PairChecker(PairChecker&&) = delete;
    PairChecker& operator=(const PairChecker&) = delete;
    PairChecker& operator=(PairChecker&&) = delete;
    ~PairChecker() = default;

    /**
     * @brief Compiles and runs both sources of @p req on @p backend
     * @details Both runs are awaited before returning, even if one of them
     *   fails.
     *
     * @errors Rethrows the first exception thrown by either run
     *   (InvalidRequest, backend::BackendError, ...)
     */
    PairCheckResult run_pair(const PairRequest& req, backend::Backend& backend);

private:
    pipeline::Pipeline& pipeline_;
    std::string scratch_root_; // with trailing '/'
};

} // namespace oirun::pair_check

#include <exception>
#include <mutex>
#include <oirun/errmsg.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/pair_check/pair_checker.hh>
#include <oirun/string_transform.hh>
#include <oirun/temporary_directory.hh>
#include <thread>

using std::string;

namespace oirun::pair_check {

string display_string(const ExecutionResult& res) {
    if (res.timed_out) {
        return "TIMEOUT";
    }
    if (res.memory_exceeded) {
        return "MEMORY_EXCEEDED";
    }
    if (res.space_exceeded) {
        return "SPACE_EXCEEDED";
    }
    if (not res.stderr_str.empty()) {
        return concat_tostr("ERROR:\n", res.stderr_str);
    }
    return res.stdout_str;
}

PairChecker::PairChecker(pipeline::Pipeline& pipeline, string scratch_root)
: pipeline_(pipeline)
, scratch_root_(std::move(scratch_root)) {
    if (not has_suffix(scratch_root_, "/")) {
        scratch_root_ += '/';
    }
}

PairCheckResult PairChecker::run_pair(const PairRequest& req, backend::Backend& backend) {
    STACK_UNWINDING_MARK;

    if (mkdir_r(scratch_root_, 0700) == -1) {
        throw backend::BackendError(concat_tostr("mkdir_r(", scratch_root_, ')', errmsg()));
    }
    TemporaryDirectory tmp_dir{concat_tostr(scratch_root_, "pair-XXXXXX")};
    auto ext = default_extension(req.language);

    auto make_request = [&](const string& source, std::string_view name) {
        ExecutionRequest er;
        er.source_path = concat_tostr(tmp_dir.path(), name, '.', ext);
        put_file_contents(er.source_path, source, 0644);
        er.language = req.language;
        er.compiler_or_backend_choice = req.compiler_choice;
        er.input = req.input;
        er.time_limit_seconds = req.time_limit_seconds;
        er.memory_limit_mb = req.memory_limit_mb;
        er.optimization_level = req.optimization_level;
        er.language_standard = req.language_standard;
        return er;
    };
    const ExecutionRequest requests[2] = {
        make_request(req.source_a, "code1"), make_request(req.source_b, "code2")
    };

    ExecutionResult results[2];
    std::mutex error_mtx;
    std::exception_ptr first_error;
    auto leg = [&](size_t idx) {
        try {
            results[idx] = pipeline_.compile_and_run(requests[idx], backend);
        } catch (...) {
            std::lock_guard lock{error_mtx};
            if (not first_error) {
                first_error = std::current_exception();
            }
        }
    };

    {
        std::thread second{leg, 1};
        leg(0);
        second.join();
    }
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    PairCheckResult res;
    res.output1 = normalize_output(display_string(results[0]));
    res.output2 = normalize_output(display_string(results[1]));
    res.equal = (res.output1 == res.output2);
    if (not res.equal) {
        res.diff = line_diff(res.output1, res.output2);
    }
    res.verdict1 = verdict_of(results[0]);
    res.verdict2 = verdict_of(results[1]);
    debuglog(
        "pair check: ", to_str(res.verdict1), " vs ", to_str(res.verdict2),
        res.equal ? " equal" : " differ"
    );
    return res;
}

} // namespace oirun::pair_check

#include "render.hh"

#include <oirun/json_str.hh>
#include <oirun/registry/detection_cache.hh>
#include <oirun/time.hh>

using oirun::registry::CompilerDescriptor;
using std::string;

namespace {

string join(const std::vector<string>& strs, std::string_view sep) {
    string res;
    for (const auto& str : strs) {
        if (not res.empty()) {
            res += sep;
        }
        res += str;
    }
    return res;
}

void append_compiler_line(string& out, const CompilerDescriptor& desc, bool recommended) {
    back_insert(
        out,
        recommended ? "* " : "  ",
        desc.display_name(),
        "  ",
        desc.path,
        "  [",
        join(desc.supported_standards, " "),
        "]",
        desc.is_64bit ? "" : " 32-bit",
        "  priority ",
        desc.priority_score,
        '\n'
    );
}

void append_compiler_obj(json_str::ObjectBuilder& obj, const CompilerDescriptor& desc) {
    obj.prop("path", desc.path);
    obj.prop("kind", oirun::registry::to_str(desc.kind));
    obj.prop("family", oirun::registry::to_str(desc.family()));
    obj.prop("version", desc.version);
    obj.prop("displayName", desc.display_name());
    obj.prop("supportedStandards", desc.supported_standards);
    obj.prop("is64Bit", desc.is_64bit);
    obj.prop("priority", desc.priority_score);
}

// Prefixes every line of @p text with @p prefix
void append_prefixed(string& out, std::string_view prefix, std::string_view text) {
    while (not text.empty()) {
        auto nl = text.find('\n');
        auto line = text.substr(0, nl);
        back_insert(out, prefix, line, '\n');
        if (nl == std::string_view::npos) {
            break;
        }
        text.remove_prefix(nl + 1);
    }
}

void append_section(string& out, std::string_view title, std::string_view text) {
    if (text.empty()) {
        return;
    }
    back_insert(out, "--- ", title, " ---\n", text);
    if (text.back() != '\n') {
        out += '\n';
    }
}

} // namespace

string render_detection(const oirun::registry::DetectionResult& res, bool json) {
    if (json) {
        return oirun::registry::serialize_detection_result(res);
    }

    string out;
    if (not res.success) {
        out += "Compiler detection failed\n";
    } else if (res.compilers.empty()) {
        out += "No compilers found\n";
    } else {
        out += "Compilers (* = recommended):\n";
        for (const auto& desc : res.compilers) {
            append_compiler_line(out, desc, res.recommended and *res.recommended == desc);
        }
    }
    for (const auto& err : res.errors) {
        back_insert(out, "Error: ", err, '\n');
    }
    if (not res.suggestions.empty()) {
        out += "Suggestions:\n";
        for (const auto& suggestion : res.suggestions) {
            back_insert(out, "  - ", suggestion, '\n');
        }
    }
    if (res.success) {
        back_insert(out, "Detected at ", utc_iso8601(res.cache_timestamp), '\n');
    }
    return out;
}

string render_compilers(const std::vector<CompilerDescriptor>& compilers, bool json) {
    if (json) {
        json_str::Array arr;
        for (const auto& desc : compilers) {
            arr.val_obj([&](auto& obj) { append_compiler_obj(obj, desc); });
        }
        return std::move(arr).into_str();
    }

    string out;
    for (size_t i = 0; i < compilers.size(); ++i) {
        append_compiler_line(out, compilers[i], i == 0);
    }
    if (compilers.empty()) {
        out += "No suitable compiler found\n";
    }
    return out;
}

string render_run_report(const oirun::RunReport& rep, bool json) {
    const auto& res = rep.result;
    auto runtime_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(res.runtime).count();
    if (json) {
        json_str::Object obj;
        obj.prop("verdict", oirun::to_str(rep.verdict));
        obj.prop("backend", rep.backend);
        obj.prop("exitCode", res.exit_code);
        obj.prop("timedOut", res.timed_out);
        obj.prop("memoryExceeded", res.memory_exceeded);
        obj.prop("spaceExceeded", res.space_exceeded);
        obj.prop("compileFailed", res.compile_failed);
        obj.prop("runtimeMs", runtime_ms);
        obj.prop("peakMemory", res.peak_memory);
        obj.prop("stdout", res.stdout_str);
        obj.prop("stderr", res.stderr_str);
        return std::move(obj).into_str();
    }

    string out = concat_tostr(
        "Verdict: ", oirun::to_str(rep.verdict), " (", oirun::description(rep.verdict), ")\n"
    );
    back_insert(out, "Backend: ", rep.backend, '\n');
    if (rep.verdict != oirun::Verdict::COMPILE_ERROR and rep.verdict != oirun::Verdict::SYSTEM_ERROR) {
        back_insert(out, "Time: ", runtime_ms, " ms\n");
        if (res.peak_memory > 0) {
            back_insert(out, "Memory: ", (res.peak_memory + 1023) >> 10, " KiB\n");
        }
        back_insert(out, "Exit code: ", res.exit_code, '\n');
    }
    if (res.space_exceeded) {
        out += "Disk space or output size limit exceeded\n";
    }
    append_section(out, "stdout", res.stdout_str);
    append_section(out, "stderr", res.stderr_str);
    return out;
}

string render_pair_result(const oirun::pair_check::PairCheckResult& res, bool json) {
    using oirun::pair_check::DiffSegment;
    if (json) {
        json_str::Object obj;
        obj.prop("equal", res.equal);
        obj.prop("verdict1", oirun::to_str(res.verdict1));
        obj.prop("verdict2", oirun::to_str(res.verdict2));
        obj.prop("output1", res.output1);
        obj.prop("output2", res.output2);
        if (res.diff) {
            obj.prop_arr("diff", [&](auto& arr) {
                for (const auto& seg : *res.diff) {
                    arr.val_obj([&](auto& seg_obj) {
                        seg_obj.prop("kind", oirun::pair_check::to_str(seg.kind));
                        seg_obj.prop("text", seg.text);
                    });
                }
            });
        } else {
            obj.prop("diff", nullptr);
        }
        return std::move(obj).into_str();
    }

    string out = concat_tostr(
        "First: ", oirun::to_str(res.verdict1), ", second: ", oirun::to_str(res.verdict2), '\n'
    );
    if (res.equal) {
        out += "Outputs are equal\n";
        return out;
    }
    out += "Outputs differ (- first, + second):\n";
    for (const auto& seg : *res.diff) {
        switch (seg.kind) {
        case DiffSegment::Kind::UNCHANGED: append_prefixed(out, "  ", seg.text); break;
        case DiffSegment::Kind::REMOVED: append_prefixed(out, "- ", seg.text); break;
        case DiffSegment::Kind::ADDED: append_prefixed(out, "+ ", seg.text); break;
        }
    }
    return out;
}

string render_install_outcome(const oirun::installer::InstallOutcome& outcome, bool json) {
    if (json) {
        json_str::Object obj;
        obj.prop("success", outcome.success);
        obj.prop("message", outcome.message);
        obj.prop("restartRequired", outcome.restart_required);
        obj.prop("nextSteps", outcome.next_steps);
        obj.prop("guide", outcome.guide);
        return std::move(obj).into_str();
    }

    string out = concat_tostr(outcome.message, '\n');
    if (not outcome.next_steps.empty()) {
        out += "Next steps:\n";
        for (size_t i = 0; i < outcome.next_steps.size(); ++i) {
            back_insert(out, "  ", i + 1, ". ", outcome.next_steps[i], '\n');
        }
    }
    if (outcome.restart_required) {
        out += "A restart is required for the changes to take effect\n";
    }
    if (not outcome.guide.empty()) {
        back_insert(out, '\n', outcome.guide);
    }
    return out;
}

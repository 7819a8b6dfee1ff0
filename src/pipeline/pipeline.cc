#include <algorithm>
#include <cmath>
#include <oirun/errmsg.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/macros/throw.hh>
#include <oirun/pipeline/compiler_invocation.hh>
#include <oirun/pipeline/pipeline.hh>
#include <oirun/registry/version_probe.hh>
#include <oirun/string_transform.hh>
#include <oirun/temporary_directory.hh>
#include <sys/stat.h>
#include <sys/statvfs.h>

using std::string;

namespace {

using oirun::backend::BackendError;
using oirun::registry::CompilerDescriptor;
using oirun::registry::Kind;

constexpr std::string_view executable_name = "program";

bool is_safe_filename(std::string_view name) noexcept {
    return not name.empty() and name.front() != '.' and
        std::all_of(name.begin(), name.end(), [](char c) {
               return is_alnum(c) or c == '.' or c == '_' or c == '-' or c == '+';
           });
}

std::chrono::nanoseconds to_duration(double seconds) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::duration<double>{seconds}
    );
}

void make_dir(const string& path, mode_t mode) {
    if (mkdir(path.c_str(), mode) == -1) {
        THROW("mkdir(", path, ')', errmsg());
    }
    // Not affected by umask
    if (chmod(path.c_str(), mode) == -1) {
        THROW("chmod(", path, ')', errmsg());
    }
}

} // namespace

namespace oirun::pipeline {

uint64_t free_disk_space(const string& path) {
    struct statvfs st = {};
    if (statvfs(path.c_str(), &st) == -1) {
        THROW("statvfs(", path, ')', errmsg());
    }
    return static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
}

Pipeline::Pipeline(registry::Registry& registry, CommandRunner& runner, PipelineOptions options)
: registry_(registry)
, runner_(runner)
, options_(std::move(options)) {
    if (not has_suffix(options_.scratch_root, "/")) {
        options_.scratch_root += '/';
    }
}

CompilerDescriptor
Pipeline::choose_compiler(const ExecutionRequest& req, const backend::Backend& backend) {
    STACK_UNWINDING_MARK;

    if (backend.uses_image_toolchain()) {
        CompilerDescriptor desc;
        desc.kind = (req.language == Language::C ? Kind::CLANG : Kind::CLANGXX);
        desc.path = string{to_str(desc.kind)};
        desc.version = "unknown";
        return desc;
    }

    const auto& choice = req.compiler_or_backend_choice;
    if (choice.find('/') != string::npos) {
        auto detected = registry_.detect(false);
        auto it = std::find_if(
            detected.compilers.begin(),
            detected.compilers.end(),
            [&](const CompilerDescriptor& desc) { return desc.path == choice; }
        );
        if (it != detected.compilers.end()) {
            return *it;
        }
        if (auto desc = registry::probe_compiler(runner_, choice, std::chrono::seconds{10})) {
            return *desc;
        }
        throw BackendError(concat_tostr("Compiler ", choice, " cannot be used"));
    }

    auto suitable = registry_.filter_suitable(req.language);
    if (suitable.empty()) {
        auto detected = registry_.detect(false);
        string msg = concat_tostr("No suitable ", to_str(req.language), " compiler found");
        for (const auto& suggestion : detected.suggestions) {
            back_insert(msg, "\n  - ", suggestion);
        }
        throw BackendError(msg);
    }
    return suitable.front();
}

ExecutionResult Pipeline::compile_and_run(const ExecutionRequest& req, backend::Backend& backend) {
    STACK_UNWINDING_MARK;

    double time_limit_seconds =
        (req.time_limit_seconds == 0 ? options_.default_time_limit_seconds
                                     : req.time_limit_seconds);
    uint64_t memory_limit_mb =
        (req.memory_limit_mb == 0 ? options_.default_memory_limit_mb : req.memory_limit_mb);
    if (not std::isfinite(time_limit_seconds) or time_limit_seconds <= 0) {
        throw InvalidRequest("Time limit has to be greater than 0");
    }
    if (time_limit_seconds > max_time_limit_seconds) {
        throw InvalidRequest(concat_tostr(
            "Time limit cannot exceed ", static_cast<uint64_t>(max_time_limit_seconds), " seconds"
        ));
    }
    if (memory_limit_mb == 0) {
        throw InvalidRequest("Memory limit has to be greater than 0");
    }
    if (memory_limit_mb > max_memory_limit_mb) {
        throw InvalidRequest(
            concat_tostr("Memory limit cannot exceed ", max_memory_limit_mb, " MiB")
        );
    }
    auto filename = path_filename(req.source_path);
    if (not extension_matches(req.language, path_extension(filename))) {
        throw InvalidRequest(concat_tostr(
            "File ", filename, " does not have an extension of language ", to_str(req.language)
        ));
    }
    if (not is_regular_file(req.source_path)) {
        throw InvalidRequest(concat_tostr("Source file ", req.source_path, " does not exist"));
    }
    auto optimization =
        (req.optimization_level.empty() ? options_.default_optimization : req.optimization_level);
    if (is_compiled(req.language) and not is_valid_optimization_level(optimization)) {
        throw InvalidRequest(concat_tostr("Invalid optimization level: ", optimization));
    }

    if (mkdir_r(options_.scratch_root, 0700) == -1) {
        throw BackendError(concat_tostr("mkdir_r(", options_.scratch_root, ')', errmsg()));
    }
    if (options_.min_free_disk_mb > 0) {
        auto free_space = free_disk_space(options_.scratch_root);
        if ((free_space >> 20) < options_.min_free_disk_mb) {
            ExecutionResult res;
            res.exit_code = 1;
            res.space_exceeded = true;
            res.stderr_str = concat_tostr(
                "Not enough free disk space in ",
                options_.scratch_root,
                ": ",
                free_space >> 20,
                " MiB available, ",
                options_.min_free_disk_mb,
                " MiB required"
            );
            return res;
        }
    }

    TemporaryDirectory scratch{concat_tostr(options_.scratch_root, "oi-run-XXXXXX")};
    // The container workload may run as another user
    bool shared = backend.uses_image_toolchain();
    backend::Mounts host{
        concat_tostr(scratch.path(), "src/"), concat_tostr(scratch.path(), "build/")
    };
    make_dir(host.source_dir, shared ? 0755 : 0700);
    make_dir(host.scratch_dir, shared ? 0777 : 0700);

    auto source_name = (is_safe_filename(filename)
                            ? string{filename}
                            : concat_tostr("main.", default_extension(req.language)));
    copy_file(req.source_path, concat_tostr(host.source_dir, source_name), 0644);

    auto visible = backend.visible_mounts(host);
    backend::RunSpec run_spec;
    run_spec.cwd = visible.scratch_dir;
    run_spec.input = req.input;
    run_spec.time_limit = to_duration(time_limit_seconds);
    run_spec.memory_limit_mb = memory_limit_mb;
    run_spec.mounts = host;
    run_spec.language = req.language;

    if (not is_compiled(req.language)) {
        run_spec.command =
            (backend.uses_image_toolchain() ? string{"python3"} : options_.python_interpreter);
        run_spec.args = {concat_tostr(visible.source_dir, source_name)};
        return backend.run(run_spec);
    }

    auto compiler = choose_compiler(req, backend);
    auto standard = req.language_standard;
    if (standard.empty()) {
        standard =
            (req.language == Language::C ? options_.default_c_standard
                                         : options_.default_cpp_standard);
    }
    standard = effective_standard(compiler, standard);

    backend::RunSpec compile_spec = run_spec;
    compile_spec.command = compiler.path;
    compile_spec.args = compile_args(
        compiler,
        req.language,
        optimization,
        standard,
        concat_tostr(visible.scratch_dir, executable_name),
        concat_tostr(visible.source_dir, source_name)
    );
    compile_spec.cwd = visible.source_dir;
    compile_spec.input.clear();
    compile_spec.time_limit = std::max(run_spec.time_limit, options_.compile_time_limit);
    compile_spec.memory_limit_mb = std::max(memory_limit_mb, options_.compile_memory_limit_mb);

    debuglog(
        "pipeline: compiling ", source_name, " with ", compiler.display_name(), " -std=", standard
    );
    auto compiled = backend.run(compile_spec);
    auto executable = concat_tostr(host.scratch_dir, executable_name);
    if (compiled.exit_code != 0 or compiled.timed_out or compiled.memory_exceeded or
        not is_regular_file(executable))
    {
        ExecutionResult res;
        res.compile_failed = true;
        res.exit_code = (compiled.exit_code != 0 ? compiled.exit_code : 1);
        res.stderr_str = std::move(compiled.stderr_str);
        if (compiled.timed_out) {
            back_insert(res.stderr_str, "\nCompilation timed out");
        } else if (compiled.memory_exceeded) {
            back_insert(res.stderr_str, "\nCompilation exceeded the memory limit");
        } else if (compiled.exit_code == 0) {
            back_insert(res.stderr_str, "\nThe compiler did not produce an executable");
        }
        res.runtime = compiled.runtime;
        return res;
    }
    if (chmod(executable.c_str(), 0755) == -1) {
        THROW("chmod(", executable, ')', errmsg());
    }

    run_spec.command = concat_tostr(visible.scratch_dir, executable_name);
    return backend.run(run_spec);
}

} // namespace oirun::pipeline

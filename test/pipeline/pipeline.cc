#include "../fakes.hh"

#include <chrono>
#include <limits>
#include <oirun/file_manip.hh>
#include <oirun/pipeline/pipeline.hh>
#include <oirun/temporary_directory.hh>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using oirun::ExecutionRequest;
using oirun::ExecutionResult;
using oirun::InvalidRequest;
using oirun::Language;
using oirun::backend::BackendError;
using oirun::backend::RunSpec;
using oirun::pipeline::Pipeline;
using oirun::pipeline::PipelineOptions;
using oirun::registry::MemoryCacheStore;
using oirun::registry::Registry;
using std::string;
using std::vector;
using std::chrono::seconds;
using ::testing::HasSubstr;

namespace {

constexpr const char* gcc = "/usr/bin/gcc-13";
constexpr const char* clangxx = "/usr/lib/llvm-18/bin/clang++";

bool is_compilation(const RunSpec& spec) {
    return spec.args.size() >= 4 and spec.args[2] == "-o";
}

// Compiles by creating the output file, runs by echoing the input
ExecutionResult compile_and_echo(const RunSpec& spec) {
    ExecutionResult res;
    if (is_compilation(spec)) {
        put_file_contents(spec.args[3], "binary", 0644);
        res.stderr_str = "warning: unused variable\n";
    } else {
        res.stdout_str = "ran:" + spec.input;
    }
    return res;
}

struct Fixture {
    TemporaryDirectory tmp_dir{"/tmp/oirun-test.XXXXXX"};
    FakeScanner scanner;
    FakeCommandRunner runner{compilers_handler({
        {gcc, "gcc (Ubuntu 13.2.0-23ubuntu4) 13.2.0\n"},
        {clangxx, "Ubuntu clang version 18.1.3 (1ubuntu1)\n"},
        {"/opt/llvm-20/bin/clang++", "clang version 20.1.0\n"},
    })};
    MemoryCacheStore store;
    Registry registry{scanner, runner, store};

    Fixture() { scanner.candidates = {gcc, clangxx}; }

    PipelineOptions options() {
        PipelineOptions opts;
        opts.scratch_root = tmp_dir.path() + "scratch";
        opts.min_free_disk_mb = 0;
        opts.python_interpreter = "/usr/bin/python3.12";
        return opts;
    }

    string source(const string& name, const string& contents = "int main() {}\n") {
        auto path = tmp_dir.path() + name;
        put_file_contents(path, contents);
        return path;
    }

    ExecutionRequest request(const string& name, Language lang = Language::CPP) {
        ExecutionRequest req;
        req.source_path = source(name);
        req.language = lang;
        req.input = "5\n";
        req.time_limit_seconds = 2;
        req.memory_limit_mb = 256;
        return req;
    }
};

} // namespace

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, compile_and_run) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto res = pipeline.compile_and_run(f.request("sol.cpp"), backend);
    EXPECT_FALSE(res.compile_failed);
    EXPECT_EQ(res.stdout_str, "ran:5\n");
    EXPECT_EQ(res.exit_code, 0);

    auto specs = backend.specs();
    ASSERT_EQ(specs.size(), 2);
    const auto& compile = specs[0];
    const auto& run = specs[1];
    auto src = compile.mounts.source_dir;
    auto build = compile.mounts.scratch_dir;
    EXPECT_EQ(src.substr(0, f.tmp_dir.path().size() + 15), f.tmp_dir.path() + "scratch/oi-run-");
    EXPECT_EQ(path_filename(src.substr(0, src.size() - 1)), "src");
    EXPECT_EQ(path_filename(build.substr(0, build.size() - 1)), "build");

    EXPECT_EQ(compile.command, clangxx);
    EXPECT_EQ(
        compile.args, (vector<string>{"-O2", "-std=c++17", "-o", build + "program", src + "sol.cpp"})
    );
    EXPECT_EQ(compile.cwd, src);
    EXPECT_EQ(compile.input, "");
    // Compilation runs under the limits of the run
    EXPECT_EQ(compile.time_limit, seconds{2});
    EXPECT_EQ(compile.memory_limit_mb, 256);

    EXPECT_EQ(run.command, build + "program");
    EXPECT_EQ(run.args, vector<string>{});
    EXPECT_EQ(run.cwd, build);
    EXPECT_EQ(run.input, "5\n");
    EXPECT_EQ(run.time_limit, seconds{2});
    EXPECT_EQ(run.memory_limit_mb, 256);
    EXPECT_EQ(run.language, Language::CPP);

    // The scratch directory is gone
    EXPECT_FALSE(path_exists(src));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, request_overrides) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto req = f.request("sol.c", Language::C);
    req.optimization_level = "O0";
    req.language_standard = "c11";
    (void)pipeline.compile_and_run(req, backend);
    auto compile = backend.specs().at(0);
    EXPECT_EQ(compile.command, gcc);
    EXPECT_EQ(compile.args[0], "-O0");
    EXPECT_EQ(compile.args[1], "-std=c11");
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, defaults) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    auto opts = f.options();
    opts.default_time_limit_seconds = 1.5;
    opts.default_memory_limit_mb = 64;
    opts.default_c_standard = "c99";
    Pipeline pipeline{f.registry, f.runner, opts};

    auto req = f.request("sol.c", Language::C);
    req.time_limit_seconds = 0;
    req.memory_limit_mb = 0;
    (void)pipeline.compile_and_run(req, backend);
    auto specs = backend.specs();
    ASSERT_EQ(specs.size(), 2);
    EXPECT_EQ(specs[0].args[1], "-std=c99");
    EXPECT_EQ(specs[1].time_limit, std::chrono::milliseconds{1500});
    EXPECT_EQ(specs[1].memory_limit_mb, 64);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, compile_limit_floors) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    auto opts = f.options();
    opts.compile_time_limit = seconds{30};
    opts.compile_memory_limit_mb = 2048;
    Pipeline pipeline{f.registry, f.runner, opts};

    (void)pipeline.compile_and_run(f.request("sol.cpp"), backend);
    auto specs = backend.specs();
    ASSERT_EQ(specs.size(), 2);
    EXPECT_EQ(specs[0].time_limit, seconds{30});
    EXPECT_EQ(specs[0].memory_limit_mb, 2048);
    EXPECT_EQ(specs[1].time_limit, seconds{2});
    EXPECT_EQ(specs[1].memory_limit_mb, 256);

    // Limits of the run above the floors apply to the compilation too
    auto req = f.request("sol.cpp");
    req.time_limit_seconds = 40;
    req.memory_limit_mb = 4096;
    (void)pipeline.compile_and_run(req, backend);
    specs = backend.specs();
    ASSERT_EQ(specs.size(), 4);
    EXPECT_EQ(specs[2].time_limit, seconds{40});
    EXPECT_EQ(specs[2].memory_limit_mb, 4096);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, explicit_compiler) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    // Not found by the scanner, probed on demand; clang 20 gets c++14
    auto req = f.request("sol.cpp");
    req.compiler_or_backend_choice = "/opt/llvm-20/bin/clang++";
    (void)pipeline.compile_and_run(req, backend);
    auto compile = backend.specs().at(0);
    EXPECT_EQ(compile.command, "/opt/llvm-20/bin/clang++");
    EXPECT_EQ(compile.args[1], "-std=c++14");

    req.compiler_or_backend_choice = "/usr/bin/not-a-compiler";
    EXPECT_THROW(pipeline.compile_and_run(req, backend), BackendError);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, compile_error) {
    Fixture f;
    FakeBackend backend{[](const RunSpec& /*unused*/) {
        ExecutionResult res;
        res.exit_code = 1;
        res.stdout_str = "ignored";
        res.stderr_str = "sol.cpp:1:1: error: expected ';'";
        return res;
    }};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto res = pipeline.compile_and_run(f.request("sol.cpp"), backend);
    EXPECT_TRUE(res.compile_failed);
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_EQ(res.stdout_str, "");
    EXPECT_EQ(res.stderr_str, "sol.cpp:1:1: error: expected ';'");
    EXPECT_EQ(backend.specs().size(), 1);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, compiler_produced_nothing) {
    Fixture f;
    FakeBackend backend{[](const RunSpec& /*unused*/) { return ExecutionResult{}; }};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto res = pipeline.compile_and_run(f.request("sol.cpp"), backend);
    EXPECT_TRUE(res.compile_failed);
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_THAT(res.stderr_str, HasSubstr("did not produce an executable"));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, compilation_timed_out) {
    Fixture f;
    FakeBackend backend{[](const RunSpec& /*unused*/) {
        ExecutionResult res;
        res.exit_code = 137;
        res.timed_out = true;
        return res;
    }};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto res = pipeline.compile_and_run(f.request("sol.cpp"), backend);
    EXPECT_TRUE(res.compile_failed);
    EXPECT_FALSE(res.timed_out);
    EXPECT_THAT(res.stderr_str, HasSubstr("Compilation timed out"));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, python) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto req = f.request("brute.py", Language::PYTHON);
    req.optimization_level = "whatever";
    auto res = pipeline.compile_and_run(req, backend);
    EXPECT_EQ(res.stdout_str, "ran:5\n");
    auto specs = backend.specs();
    ASSERT_EQ(specs.size(), 1);
    EXPECT_EQ(specs[0].command, "/usr/bin/python3.12");
    EXPECT_EQ(specs[0].args, vector<string>{specs[0].mounts.source_dir + "brute.py"});
    EXPECT_EQ(specs[0].language, Language::PYTHON);
    EXPECT_EQ(f.scanner.scans, 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, image_toolchain) {
    Fixture f;
    FakeBackend backend{compile_and_echo, true};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    (void)pipeline.compile_and_run(f.request("sol.cpp"), backend);
    (void)pipeline.compile_and_run(f.request("sol.c", Language::C), backend);
    (void)pipeline.compile_and_run(f.request("brute.py", Language::PYTHON), backend);
    auto specs = backend.specs();
    ASSERT_EQ(specs.size(), 5);
    EXPECT_EQ(specs[0].command, "clang++");
    EXPECT_EQ(specs[2].command, "clang");
    EXPECT_EQ(specs[4].command, "python3");
    EXPECT_EQ(f.scanner.scans, 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, unusual_file_name) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    (void)pipeline.compile_and_run(f.request("my solution.cpp"), backend);
    auto compile = backend.specs().at(0);
    EXPECT_EQ(compile.args.back(), compile.mounts.source_dir + "main.cpp");
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, no_suitable_compiler) {
    Fixture f;
    f.scanner.candidates = {gcc};
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};
    try {
        (void)pipeline.compile_and_run(f.request("sol.cpp"), backend);
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_THAT(e.what(), HasSubstr("No suitable cpp compiler found"));
        EXPECT_THAT(e.what(), HasSubstr("Consider installing Clang"));
    }
    EXPECT_EQ(backend.specs().size(), 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, invalid_requests) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    Pipeline pipeline{f.registry, f.runner, f.options()};

    auto req = f.request("sol.cpp");
    req.time_limit_seconds = -1;
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    req = f.request("sol.cpp");
    req.time_limit_seconds = 1e12;
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    req = f.request("sol.cpp");
    req.time_limit_seconds = std::numeric_limits<double>::infinity();
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    // Would wrap to 0 and to 1 MiB when converted to bytes
    for (uint64_t memory_limit_mb :
         {uint64_t{1} << 44, (uint64_t{1} << 44) + 1, (uint64_t{1} << 24) + 1})
    {
        req = f.request("sol.cpp");
        req.memory_limit_mb = memory_limit_mb;
        EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);
    }

    req = f.request("sol.cpp");
    req.optimization_level = "O9";
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    req = f.request("sol.txt");
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    req = f.request("sol.cpp", Language::C);
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    req = f.request("sol.cpp");
    req.source_path = f.tmp_dir.path() + "missing.cpp";
    EXPECT_THROW(pipeline.compile_and_run(req, backend), InvalidRequest);

    EXPECT_EQ(backend.specs().size(), 0);
    EXPECT_FALSE(path_exists(f.tmp_dir.path() + "scratch"));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(pipeline, not_enough_disk_space) {
    Fixture f;
    FakeBackend backend{compile_and_echo};
    auto opts = f.options();
    opts.min_free_disk_mb = uint64_t{1} << 40;
    Pipeline pipeline{f.registry, f.runner, opts};

    auto res = pipeline.compile_and_run(f.request("sol.cpp"), backend);
    EXPECT_TRUE(res.space_exceeded);
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_THAT(res.stderr_str, HasSubstr("Not enough free disk space"));
    EXPECT_EQ(backend.specs().size(), 0);
}

#include <chrono>
#include <fcntl.h>
#include <oirun/backend/process_backend.hh>
#include <oirun/file_descriptor.hh>
#include <oirun/file_manip.hh>
#include <oirun/string_transform.hh>
#include <oirun/temporary_directory.hh>
#include <thread>

#include <gtest/gtest.h>

using oirun::backend::BackendError;
using oirun::backend::ProcessBackend;
using oirun::backend::ProcessBackendOptions;
using oirun::backend::RunSpec;
using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;

namespace {

RunSpec shell(const TemporaryDirectory& dir, std::string script) {
    RunSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", std::move(script)};
    spec.time_limit = 5s;
    spec.memory_limit_mb = 256;
    spec.mounts = {dir.path(), dir.path()};
    return spec;
}

// State letter from /proc/<pid>/stat, '\0' if there is no such process
char process_state(std::string_view pid) {
    FileDescriptor fd{concat_tostr("/proc/", pid, "/stat"), O_RDONLY};
    if (not fd.is_open()) {
        return '\0';
    }
    auto stat = get_file_contents(fd);
    auto pos = stat.rfind(')');
    return (pos == std::string::npos or pos + 2 >= stat.size() ? '\0' : stat[pos + 2]);
}

// Gives the kernel and the new parent a moment to deliver SIGKILL and reap
bool process_is_gone(std::string_view pid) {
    for (int i = 0; i < 100; ++i) {
        auto state = process_state(pid);
        if (state == '\0' or state == 'Z' or state == 'X') {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return false;
}

} // namespace

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, streams_and_exit_code) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackend backend{ProcessBackendOptions{}};
    auto spec = shell(tmp_dir, "cat; echo oops >&2; exit 3");
    spec.input = "1 2\n";
    auto res = backend.run(spec);
    EXPECT_EQ(res.stdout_str, "1 2\n");
    EXPECT_EQ(res.stderr_str, "oops\n");
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_FALSE(res.timed_out);
    EXPECT_FALSE(res.memory_exceeded);
    EXPECT_FALSE(res.space_exceeded);
    EXPECT_GT(res.runtime.count(), 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, working_directory) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackend backend{ProcessBackendOptions{}};
    auto expected = tmp_dir.path();
    expected.back() = '\n';
    EXPECT_EQ(backend.run(shell(tmp_dir, "pwd")).stdout_str, expected);

    auto spec = shell(tmp_dir, "pwd");
    spec.cwd = "/";
    EXPECT_EQ(backend.run(spec).stdout_str, "/\n");
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, time_limit) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackend backend{ProcessBackendOptions{}};
    auto spec = shell(tmp_dir, "sleep 10");
    spec.time_limit = 200ms;
    auto res = backend.run(spec);
    EXPECT_TRUE(res.timed_out);
    EXPECT_FALSE(res.memory_exceeded);
    EXPECT_LT(res.runtime, 5s);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, timeout_kills_descendants) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackend backend{ProcessBackendOptions{}};
    auto spec = shell(tmp_dir, "sleep 100 & echo $!; sleep 100");
    spec.time_limit = 300ms;
    auto res = backend.run(spec);
    EXPECT_TRUE(res.timed_out);
    auto pid = trim(res.stdout_str);
    ASSERT_TRUE(str2num<pid_t>(pid).has_value()) << res.stdout_str;
    EXPECT_TRUE(process_is_gone(pid));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, background_processes_do_not_outlive_the_run) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackend backend{ProcessBackendOptions{}};
    auto res = backend.run(shell(tmp_dir, "sleep 100 & echo $!"));
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_FALSE(res.timed_out);
    auto pid = trim(res.stdout_str);
    ASSERT_TRUE(str2num<pid_t>(pid).has_value()) << res.stdout_str;
    EXPECT_TRUE(process_is_gone(pid));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, resident_memory_limit) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackendOptions opts;
    opts.address_space_limit = false; // only the watcher enforces the limit
    opts.memory_poll_interval = 10ms;
    ProcessBackend backend{opts};
    // The shell keeps the whole command substitution in its own memory
    auto spec = shell(tmp_dir, "x=$(head -c 200000000 /dev/zero | tr '\\0' a); sleep 5");
    spec.memory_limit_mb = 32;
    spec.time_limit = 20s;
    auto res = backend.run(spec);
    EXPECT_TRUE(res.memory_exceeded);
    EXPECT_FALSE(res.timed_out);
    EXPECT_EQ(res.exit_code, 137);
    EXPECT_GT(res.peak_memory, uint64_t{32} << 20);
    EXPECT_LT(res.runtime, 5s);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, address_space_limit) {
    if (not path_exists("/usr/bin/python3")) {
        GTEST_SKIP() << "python3 is not installed";
    }
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackendOptions opts;
    opts.block_network = false;
    ProcessBackend backend{opts};
    RunSpec spec = shell(tmp_dir, "");
    spec.command = "/usr/bin/python3";
    spec.args = {"-c", "x = bytearray(1 << 30)"};
    spec.memory_limit_mb = 256;
    auto res = backend.run(spec);
    EXPECT_TRUE(res.memory_exceeded) << res.stderr_str;
    EXPECT_FALSE(res.timed_out);
    EXPECT_NE(res.exit_code, 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, output_size_limit) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackendOptions opts;
    opts.max_output_size = 1 << 20;
    ProcessBackend backend{opts};
    RunSpec spec = shell(tmp_dir, "");
    spec.command = "head";
    spec.args = {"-c", "4000000", "/dev/zero"};
    auto res = backend.run(spec);
    EXPECT_TRUE(res.space_exceeded);
    EXPECT_FALSE(res.timed_out);
    EXPECT_LE(res.stdout_str.size(), 1 << 20);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, cannot_run) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    ProcessBackend backend{ProcessBackendOptions{}};
    auto spec = shell(tmp_dir, "");
    spec.command = tmp_dir.path() + "missing-program";
    EXPECT_THROW(backend.run(spec), BackendError);

    spec = shell(tmp_dir, "true");
    spec.cwd = tmp_dir.path() + "no/such/dir";
    EXPECT_THROW(backend.run(spec), BackendError);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(process_backend, interface) {
    ProcessBackendOptions opts;
    opts.block_network = false;
    ProcessBackend backend{opts};
    EXPECT_EQ(backend.name(), "native");
    EXPECT_FALSE(backend.uses_image_toolchain());
    auto visible = backend.visible_mounts({"/a/", "/b/"});
    EXPECT_EQ(visible.source_dir, "/a/");
    EXPECT_EQ(visible.scratch_dir, "/b/");
    EXPECT_NE(oirun::backend::build_network_filter(), nullptr);
}

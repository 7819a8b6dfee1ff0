#include <chrono>
#include <csignal>
#include <oirun/command_runner.hh>
#include <oirun/spawner.hh>
#include <oirun/temporary_directory.hh>

#include <gtest/gtest.h>
#include <stdexcept>

using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""s;

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(spawner, exit_status) {
    auto es = Spawner::run("/bin/sh", {"sh", "-c", "exit 0"}, {});
    EXPECT_TRUE(es.exited_normally());
    EXPECT_EQ(es.message, "");

    es = Spawner::run("sh", {"sh", "-c", "exit 3"}, {});
    EXPECT_FALSE(es.exited_normally());
    EXPECT_EQ(es.si.code, CLD_EXITED);
    EXPECT_EQ(es.si.status, 3);
    EXPECT_EQ(es.message, "exited with 3");
    EXPECT_FALSE(es.real_time_limit_exceeded);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(spawner, real_time_limit) {
    Spawner::Options opts;
    opts.real_time_limit = 200ms;
    auto es = Spawner::run("/bin/sh", {"sh", "-c", "sleep 10"}, opts);
    EXPECT_TRUE(es.real_time_limit_exceeded);
    EXPECT_EQ(es.si.code, CLD_KILLED);
    EXPECT_EQ(es.si.status, SIGKILL);
    EXPECT_LT(es.runtime, 5s);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(spawner, cpu_time_limit_sends_sigxcpu) {
    Spawner::Options opts;
    opts.real_time_limit = 20s;
    opts.cpu_time_limit = 1ms; // RLIMIT_CPU of 1 s
    auto es = Spawner::run("/bin/sh", {"sh", "-c", "while :; do :; done"}, opts);
    EXPECT_FALSE(es.real_time_limit_exceeded);
    EXPECT_NE(es.si.code, CLD_EXITED);
    EXPECT_EQ(es.si.status, SIGXCPU);
    EXPECT_GE(es.cpu_runtime, 1s);
    EXPECT_LT(es.cpu_runtime, 2s);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(spawner, invalid_arguments) {
    EXPECT_THROW(Spawner::run("/bin/sh", {}, {}), std::runtime_error);
    Spawner::Options opts;
    opts.real_time_limit = 0ms;
    EXPECT_THROW(Spawner::run("/bin/sh", {"sh"}, opts), std::runtime_error);
    EXPECT_THROW(
        Spawner::run("/nonexistent/program", {"program"}, {}), std::runtime_error
    );
    opts = {};
    opts.working_dir = "/nonexistent/dir";
    EXPECT_THROW(Spawner::run("/bin/sh", {"sh", "-c", "true"}, opts), std::runtime_error);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(spawner, command_runner) {
    oirun::SpawnerCommandRunner runner;
    auto res = runner.run(oirun::Command{
        .argv = {"sh", "-c", "cat; echo err >&2; exit 5"},
        .input = "hello\n",
    });
    EXPECT_EQ(res.exit_code, 5);
    EXPECT_EQ(res.out, "hello\n");
    EXPECT_EQ(res.err, "err\n");
    EXPECT_FALSE(res.timed_out);
    EXPECT_FALSE(res.success());

    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    res = runner.run(oirun::Command{
        .argv = {"sh", "-c", "pwd"},
        .working_dir = tmp_dir.path(),
    });
    EXPECT_TRUE(res.success());
    auto dir = tmp_dir.path();
    dir.back() = '\n';
    EXPECT_EQ(res.out, dir);

    res = runner.run(oirun::Command{.argv = {"sh", "-c", "kill -9 $$"}});
    EXPECT_EQ(res.exit_code, 128 + SIGKILL);

    res = runner.run(oirun::Command{.argv = {"sleep", "10"}, .timeout = 200ms});
    EXPECT_TRUE(res.timed_out);
    EXPECT_FALSE(res.success());

    EXPECT_THROW(runner.run(oirun::Command{}), std::runtime_error);
}

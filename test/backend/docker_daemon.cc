#include "../fakes.hh"

#include <chrono>
#include <oirun/backend/backend.hh>
#include <oirun/backend/docker_daemon.hh>
#include <oirun/file_manip.hh>
#include <oirun/temporary_directory.hh>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using oirun::Command;
using oirun::CommandOutput;
using oirun::backend::BackendError;
using oirun::backend::DockerDaemon;
using oirun::backend::DockerDaemonOptions;
using std::string;
using std::vector;
using std::chrono::nanoseconds;
using std::chrono::seconds;
using ::testing::HasSubstr;

namespace {

using Argv = vector<string>;

struct Fixture {
    vector<nanoseconds> sleeps;
    FakeCommandRunner runner;

    DockerDaemonOptions options() {
        DockerDaemonOptions opts;
        opts.ready_timeout = seconds{15};
        opts.poll_interval = seconds{5};
        opts.sleep = [this](nanoseconds d) { sleeps.push_back(d); };
        return opts;
    }
};

} // namespace

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, os_release_id) {
    EXPECT_EQ(oirun::backend::os_release_id("NAME=\"Ubuntu\"\nID=ubuntu\n"), "ubuntu");
    EXPECT_EQ(
        oirun::backend::os_release_id("ID=\"linuxmint\"\nID_LIKE=\"ubuntu debian\"\n"), "ubuntu"
    );
    EXPECT_EQ(oirun::backend::os_release_id("ID=EndeavourOS\nID_LIKE=arch\n"), "arch");
    EXPECT_EQ(oirun::backend::os_release_id("ID='fedora'\n"), "fedora");
    EXPECT_EQ(oirun::backend::os_release_id("ID=alpine\n"), "alpine");
    EXPECT_EQ(oirun::backend::os_release_id(""), "");
    EXPECT_EQ(oirun::backend::docker_install_commands("alpine").size(), 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, ready_is_remembered) {
    Fixture f;
    DockerDaemon daemon{f.runner, f.options()};
    daemon.ensure_ready();
    daemon.ensure_ready();
    EXPECT_EQ(f.runner.argvs(), (vector<Argv>{{"docker", "info"}}));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, unreachable_without_auto_install) {
    Fixture f;
    f.runner.set_handler([](const Command& /*unused*/) {
        return output(1, "", "Cannot connect to the Docker daemon");
    });
    auto opts = f.options();
    opts.auto_install = false;
    DockerDaemon daemon{f.runner, opts};
    try {
        daemon.ensure_ready();
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Cannot connect to the Docker daemon"));
        EXPECT_THAT(e.what(), HasSubstr("native backend"));
    }
    EXPECT_EQ(f.runner.argvs().size(), 1);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, installs_missing_client) {
    TemporaryDirectory tmp_dir("/tmp/oirun-test.XXXXXX");
    put_file_contents(tmp_dir.path() + "os-release", "ID=debian\n");

    Fixture f;
    int ps_calls = 0;
    f.runner.set_handler([&](const Command& cmd) -> CommandOutput {
        if (cmd.argv == Argv{"docker", "info"}) {
            throw std::runtime_error("execvp('docker') - No such file or directory");
        }
        if (cmd.argv == Argv{"docker", "ps"}) {
            return (++ps_calls < 2 ? output(1, "", "not yet") : output(0));
        }
        return output(0);
    });
    auto opts = f.options();
    opts.os_release_path = tmp_dir.path() + "os-release";
    DockerDaemon daemon{f.runner, opts};
    daemon.ensure_ready();

    EXPECT_EQ(
        f.runner.argvs(),
        (vector<Argv>{
            {"docker", "info"},
            {"sudo", "-n", "apt-get", "update"},
            {"sudo", "-n", "apt-get", "install", "-y", "docker.io"},
            {"sudo", "-n", "systemctl", "enable", "docker"},
            {"sudo", "-n", "systemctl", "start", "docker"},
            {"docker", "ps"},
            {"docker", "ps"},
        })
    );
    EXPECT_EQ(f.sleeps, vector<nanoseconds>{seconds{5}});

    daemon.ensure_ready();
    EXPECT_EQ(ps_calls, 2);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, never_ready) {
    Fixture f;
    f.runner.set_handler([](const Command& cmd) {
        if (cmd.argv[0] == "docker") {
            return output(1, "", "daemon down");
        }
        return output(1, "", "sudo: a password is required");
    });
    DockerDaemon daemon{f.runner, f.options()};
    try {
        daemon.ensure_ready();
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Steps attempted"));
        EXPECT_THAT(e.what(), HasSubstr("sudo -n systemctl start docker: exited with 1"));
        EXPECT_THAT(e.what(), HasSubstr("not ready after 3 check(s), last error: daemon down"));
    }
    EXPECT_EQ(f.runner.count_with_prefix({"docker", "ps"}), 3);
    EXPECT_EQ(f.sleeps.size(), 2);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, ensure_image_pulls_with_backoff) {
    Fixture f;
    int pulls = 0;
    f.runner.set_handler([&](const Command& cmd) {
        if (cmd.argv == Argv{"docker", "pull", "img:1"}) {
            return (++pulls < 3 ? output(1, "", "TLS handshake timeout") : output(0));
        }
        if (cmd.argv == Argv{"docker", "images", "-q", "img:1"}) {
            return output(0, pulls >= 3 ? "0123456789ab\n" : "");
        }
        return output(1);
    });
    DockerDaemon daemon{f.runner, f.options()};
    daemon.ensure_image("img:1");
    EXPECT_EQ(pulls, 3);
    EXPECT_EQ(f.sleeps, (vector<nanoseconds>{seconds{2}, seconds{4}}));

    auto calls = f.runner.commands().size();
    daemon.ensure_image("img:1");
    EXPECT_EQ(f.runner.commands().size(), calls);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, ensure_image_present) {
    Fixture f;
    f.runner.set_handler([](const Command& /*unused*/) { return output(0, "0123456789ab\n"); });
    DockerDaemon daemon{f.runner, f.options()};
    daemon.ensure_image("img:2");
    EXPECT_EQ(f.runner.argvs(), (vector<Argv>{{"docker", "images", "-q", "img:2"}}));
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(docker_daemon, ensure_image_gives_up) {
    Fixture f;
    f.runner.set_handler([](const Command& cmd) {
        if (cmd.argv[1] == "pull") {
            return output(1, "", "manifest unknown");
        }
        return output(0);
    });
    DockerDaemon daemon{f.runner, f.options()};
    try {
        daemon.ensure_image("img:3");
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_THAT(e.what(), HasSubstr("Image 'img:3'"));
        EXPECT_THAT(e.what(), HasSubstr("manifest unknown"));
    }
    EXPECT_EQ(f.runner.count_with_prefix({"docker", "pull"}), 4);
    EXPECT_EQ(f.sleeps, (vector<nanoseconds>{seconds{2}, seconds{4}, seconds{8}}));

    // A failed pull is not remembered
    EXPECT_THROW(daemon.ensure_image("img:3"), BackendError);
}

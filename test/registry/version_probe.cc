#include "../fakes.hh"

#include <chrono>
#include <oirun/registry/version_probe.hh>

#include <gtest/gtest.h>

using oirun::registry::Kind;
using std::string;
using std::vector;
using std::chrono_literals::operator""s;

namespace registry = oirun::registry;

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, classify_kind_by_name) {
    EXPECT_EQ(registry::classify_kind("C:\\VS\\bin\\cl.exe", ""), Kind::MSVC);
    EXPECT_EQ(registry::classify_kind("/usr/bin/clang++-18", ""), Kind::CLANGXX);
    EXPECT_EQ(registry::classify_kind("/usr/bin/clang", "clang version 18.1.3"), Kind::CLANG);
    EXPECT_EQ(
        registry::classify_kind("/usr/bin/clang", "Apple clang version 15.0.0"), Kind::APPLE_CLANG
    );
    EXPECT_EQ(registry::classify_kind("/usr/bin/g++-13", ""), Kind::GXX);
    EXPECT_EQ(registry::classify_kind("/usr/bin/c++", ""), Kind::GXX);
    EXPECT_EQ(registry::classify_kind("/usr/bin/x86_64-linux-gnu-gcc-13", ""), Kind::GCC);
    EXPECT_EQ(registry::classify_kind("/usr/bin/cc", ""), Kind::GCC);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, classify_kind_by_output) {
    EXPECT_EQ(registry::classify_kind("/opt/bin/compiler", "Ubuntu clang version 14"), Kind::CLANG);
    EXPECT_EQ(
        registry::classify_kind("/opt/bin/compiler", "Copyright (C) 2023 Free Software"), Kind::GCC
    );
    EXPECT_EQ(registry::classify_kind("/opt/bin/x++", "GCC 13"), Kind::GXX);
    EXPECT_EQ(registry::classify_kind("/usr/bin/python3", "Python 3.12.3"), std::nullopt);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, extract_version) {
    EXPECT_EQ(
        registry::extract_version("g++ (Ubuntu 13.2.0-23ubuntu4) 13.2.0\nCopyright (C) 2023"),
        "13.2.0"
    );
    EXPECT_EQ(registry::extract_version("Ubuntu clang version 18.1.3 (1ubuntu1)"), "18.1.3");
    EXPECT_EQ(registry::extract_version("Apple clang version 15.0"), "15.0");
    EXPECT_EQ(
        registry::extract_version("Microsoft (R) C/C++ Optimizing Compiler Version 19.38.33134"),
        "19.38.33134"
    );
    EXPECT_EQ(registry::extract_version("no version here"), "unknown");
    EXPECT_EQ(registry::extract_version("version 7"), "unknown");

    EXPECT_EQ(registry::major_version("13.2.0"), 13);
    EXPECT_EQ(registry::major_version("unknown"), 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, supported_standards) {
    EXPECT_EQ(
        registry::supported_standards(Kind::GCC, 13), (vector<string>{"c89", "c99", "c11", "c17"})
    );
    EXPECT_EQ(
        registry::supported_standards(Kind::GXX, 10),
        (vector<string>{"c++98", "c++11", "c++14", "c++17"})
    );
    EXPECT_EQ(
        registry::supported_standards(Kind::GXX, 11),
        (vector<string>{"c++98", "c++11", "c++14", "c++17", "c++20"})
    );
    EXPECT_EQ(
        registry::supported_standards(Kind::CLANGXX, 17),
        (vector<string>{"c++98", "c++11", "c++14", "c++17", "c++20", "c++23"})
    );
    EXPECT_EQ(
        registry::supported_standards(Kind::APPLE_CLANG, 8),
        (vector<string>{"c89", "c99", "c11", "c17", "c++98", "c++11", "c++14", "c++17"})
    );
    auto msvc = registry::supported_standards(Kind::MSVC, 19);
    EXPECT_EQ(msvc.size(), 9);
    EXPECT_EQ(msvc.back(), "c++20");
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, priority_score) {
    EXPECT_EQ(registry::priority_score(Kind::CLANGXX, 18, "/usr/bin/clang++-18"), 260);
    EXPECT_EQ(registry::priority_score(Kind::GCC, 13, "/opt/gcc/bin/gcc"), 215);
    EXPECT_EQ(registry::priority_score(Kind::GXX, 13, "/home/u/bin/g++"), 210);
    EXPECT_EQ(registry::priority_score(Kind::APPLE_CLANG, 15, "/usr/local/bin/clang"), 245);
    EXPECT_EQ(
        registry::priority_score(Kind::MSVC, 19, "C:\\Program Files\\VS\\bin\\cl.exe"), 265
    );
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, probe_compiler) {
    FakeCommandRunner runner{compilers_handler({
        {"/usr/bin/g++-13", "g++ (Ubuntu 13.2.0-23ubuntu4) 13.2.0\n"},
        {"/usr/bin/python3", "Python 3.12.3\n"},
    })};

    auto desc = registry::probe_compiler(runner, "/usr/bin/g++-13", 10s);
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->path, "/usr/bin/g++-13");
    EXPECT_EQ(desc->kind, Kind::GXX);
    EXPECT_EQ(desc->version, "13.2.0");
    EXPECT_EQ(desc->major_version(), 13);
    EXPECT_EQ(desc->display_name(), "G++ 13.2.0");
    EXPECT_TRUE(desc->is_64bit);
    EXPECT_EQ(desc->priority_score, 80 + 130 - 20);
    EXPECT_EQ(desc->supported_standards.back(), "c++23");

    auto cmds = runner.commands();
    ASSERT_EQ(cmds.size(), 2);
    EXPECT_EQ(cmds[0].argv, (vector<string>{"/usr/bin/g++-13", "--version"}));
    EXPECT_EQ(cmds[0].timeout, std::chrono::nanoseconds{10s});
    EXPECT_EQ(cmds[1].argv, (vector<string>{"/usr/bin/g++-13", "-dumpmachine"}));

    EXPECT_EQ(registry::probe_compiler(runner, "/usr/bin/python3", 10s), std::nullopt);
    EXPECT_EQ(registry::probe_compiler(runner, "/usr/bin/gcc", 10s), std::nullopt);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(version_probe, probe_compiler_failures) {
    FakeCommandRunner runner{[](const oirun::Command& cmd) -> oirun::CommandOutput {
        if (cmd.argv[0] == "/bin/throwing-gcc") {
            throw std::runtime_error("execvp failed");
        }
        if (cmd.argv[1] == "-dumpmachine") {
            return output(0, "i686-linux-gnu\n");
        }
        oirun::CommandOutput res;
        res.timed_out = (cmd.argv[0] == "/bin/slow-gcc");
        res.out = "gcc 12.1.0";
        return res;
    }};

    EXPECT_EQ(registry::probe_compiler(runner, "/bin/throwing-gcc", 1s), std::nullopt);
    EXPECT_EQ(registry::probe_compiler(runner, "/bin/slow-gcc", 1s), std::nullopt);

    auto desc = registry::probe_compiler(runner, "/bin/gcc32", 1s);
    ASSERT_TRUE(desc.has_value());
    EXPECT_FALSE(desc->is_64bit);
}

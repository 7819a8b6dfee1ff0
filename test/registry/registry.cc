#include "../fakes.hh"

#include <chrono>
#include <oirun/registry/registry.hh>

#include <gtest/gtest.h>

using oirun::Language;
using oirun::registry::DetectionResult;
using oirun::registry::Kind;
using oirun::registry::MemoryCacheStore;
using oirun::registry::Registry;
using oirun::registry::RegistryOptions;
using std::string;
using std::vector;
using std::chrono::hours;
using std::chrono::seconds;
using std::chrono::system_clock;

namespace {

constexpr const char* gcc = "/usr/bin/gcc-13";
constexpr const char* gxx = "/usr/bin/g++-13";
constexpr const char* clangxx = "/usr/lib/llvm-18/bin/clang++";

FakeCommandRunner::Handler host_compilers() {
    return compilers_handler({
        {gcc, "gcc (Ubuntu 13.2.0-23ubuntu4) 13.2.0\n"},
        {gxx, "g++ (Ubuntu 13.2.0-23ubuntu4) 13.2.0\n"},
        {clangxx, "Ubuntu clang version 18.1.3 (1ubuntu1)\n"},
        {"/opt/gcc/bin/g++-13", "g++ (GCC) 13.2.0\n"},
    });
}

struct Fixture {
    system_clock::time_point now{seconds{1700000000}};
    FakeScanner scanner;
    FakeCommandRunner runner{host_compilers()};
    MemoryCacheStore store;

    RegistryOptions options() {
        RegistryOptions opts;
        opts.now = [this] { return now; };
        return opts;
    }
};

vector<string> paths_of(const DetectionResult& res) {
    vector<string> paths;
    for (const auto& desc : res.compilers) {
        paths.emplace_back(desc.path);
    }
    return paths;
}

} // namespace

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, detect_sorts_by_priority) {
    Fixture f;
    f.scanner.candidates = {gcc, "/usr/bin/python3", gxx, clangxx};
    Registry reg{f.scanner, f.runner, f.store, f.options()};

    auto res = reg.detect();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(paths_of(res), (vector<string>{clangxx, gxx, gcc}));
    ASSERT_TRUE(res.recommended.has_value());
    EXPECT_EQ(res.recommended->path, clangxx);
    EXPECT_EQ(res.recommended->kind, Kind::CLANGXX);
    EXPECT_EQ(res.recommended->priority_score, 280);
    EXPECT_EQ(res.suggestions, vector<string>{});
    EXPECT_EQ(res.errors, vector<string>{});
    EXPECT_EQ(res.cache_version, "1.0");
    EXPECT_EQ(res.cache_timestamp, f.now);
    EXPECT_EQ(f.scanner.deep_scans, 0);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, in_memory_cache) {
    Fixture f;
    f.scanner.candidates = {gcc};
    Registry reg{f.scanner, f.runner, f.store, f.options()};

    auto first = reg.detect();
    auto probes = f.runner.commands().size();
    f.now += hours{1};
    EXPECT_EQ(reg.detect(), first);
    EXPECT_EQ(f.scanner.scans, 1);
    EXPECT_EQ(f.runner.commands().size(), probes);

    reg.detect(true);
    EXPECT_EQ(f.scanner.scans, 2);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, persisted_cache_and_ttl) {
    Fixture f;
    f.scanner.candidates = {gcc, clangxx};
    auto first = Registry{f.scanner, f.runner, f.store, f.options()}.detect();
    ASSERT_TRUE(f.store.load().has_value());
    EXPECT_EQ(*f.store.load(), first);

    // A fresh registry (e.g. a new process) reuses the persisted record
    f.now += hours{23};
    Registry reg{f.scanner, f.runner, f.store, f.options()};
    EXPECT_EQ(reg.detect(), first);
    EXPECT_EQ(f.scanner.scans, 1);

    // Expired in memory and in the store
    f.now += hours{2};
    auto rescanned = reg.detect();
    EXPECT_EQ(f.scanner.scans, 2);
    EXPECT_EQ(rescanned.cache_timestamp, f.now);
    EXPECT_EQ(f.store.load()->cache_timestamp, f.now);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, schema_mismatch_forces_rescan) {
    Fixture f;
    DetectionResult old;
    old.cache_version = "0.9";
    old.cache_timestamp = f.now;
    f.store.store(old);

    f.scanner.candidates = {gcc};
    Registry reg{f.scanner, f.runner, f.store, f.options()};
    auto res = reg.detect();
    EXPECT_EQ(f.scanner.scans, 1);
    EXPECT_EQ(res.cache_version, "1.0");
    EXPECT_EQ(f.store.load()->cache_version, "1.0");
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, clear_cache) {
    Fixture f;
    f.scanner.candidates = {gcc};
    Registry reg{f.scanner, f.runner, f.store, f.options()};
    reg.detect();
    reg.clear_cache();
    EXPECT_EQ(f.store.load(), std::nullopt);
    reg.detect();
    EXPECT_EQ(f.scanner.scans, 2);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, duplicates_keep_higher_priority) {
    Fixture f;
    f.scanner.candidates = {gxx, "/opt/gcc/bin/g++-13", gxx};
    Registry reg{f.scanner, f.runner, f.store, f.options()};
    auto res = reg.detect();
    EXPECT_EQ(paths_of(res), vector<string>{"/opt/gcc/bin/g++-13"});
    EXPECT_EQ(res.compilers[0].priority_score, 80 + 130 + 5);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, nothing_found) {
    Fixture f;
    f.scanner.candidates = {"/usr/bin/python3"};
    f.scanner.deep_candidates = {"/nonexistent/cc"};
    Registry reg{f.scanner, f.runner, f.store, f.options()};

    auto res = reg.detect();
    EXPECT_EQ(f.scanner.deep_scans, 1);
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.compilers.size(), 0);
    EXPECT_EQ(res.recommended, std::nullopt);
    ASSERT_EQ(res.suggestions.size(), 3);
    EXPECT_EQ(res.suggestions[0], "Install a C/C++ compiler (LLVM, GCC, or MSVC)");

    // An empty result is still a successful detection
    reg.detect();
    EXPECT_EQ(f.scanner.scans, 1);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, deep_scan_fallback) {
    Fixture f;
    f.scanner.deep_candidates = {clangxx};
    Registry reg{f.scanner, f.runner, f.store, f.options()};
    auto res = reg.detect();
    EXPECT_EQ(f.scanner.deep_scans, 1);
    EXPECT_EQ(paths_of(res), vector<string>{clangxx});
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, gcc_only_suggestion) {
    Fixture f;
    f.scanner.candidates = {gcc, gxx};
    Registry reg{f.scanner, f.runner, f.store, f.options()};
    EXPECT_EQ(
        reg.detect().suggestions,
        vector<string>{"Consider installing Clang for better standards compliance"}
    );
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, failed_scan_is_not_cached) {
    Fixture f;
    f.scanner.fail = true;
    Registry reg{f.scanner, f.runner, f.store, f.options()};

    auto res = reg.detect();
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.compilers.size(), 0);
    ASSERT_EQ(res.errors.size(), 1);
    EXPECT_EQ(res.errors[0], "cannot list directories");
    EXPECT_EQ(res.suggestions.size(), 3);
    EXPECT_EQ(f.store.load(), std::nullopt);

    f.scanner.fail = false;
    f.scanner.candidates = {gcc};
    EXPECT_TRUE(reg.detect().success);
    EXPECT_EQ(f.scanner.scans, 2);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, filter_suitable) {
    Fixture f;
    f.scanner.candidates = {gcc, gxx, clangxx};
    Registry reg{f.scanner, f.runner, f.store, f.options()};

    auto paths = [](const vector<oirun::registry::CompilerDescriptor>& compilers) {
        vector<string> res;
        for (const auto& desc : compilers) {
            res.emplace_back(desc.path);
        }
        return res;
    };
    EXPECT_EQ(paths(reg.filter_suitable(Language::C)), vector<string>{gcc});
    EXPECT_EQ(paths(reg.filter_suitable(Language::CPP)), (vector<string>{clangxx, gxx}));
    EXPECT_EQ(reg.filter_suitable(Language::PYTHON).size(), 0);
    EXPECT_EQ(f.scanner.scans, 1);
}

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
TEST(registry, is_suitable) {
    using oirun::registry::is_suitable;
    EXPECT_TRUE(is_suitable(Kind::APPLE_CLANG, Language::C));
    EXPECT_TRUE(is_suitable(Kind::APPLE_CLANG, Language::CPP));
    EXPECT_TRUE(is_suitable(Kind::MSVC, Language::CPP));
    EXPECT_FALSE(is_suitable(Kind::GCC, Language::CPP));
    EXPECT_FALSE(is_suitable(Kind::CLANGXX, Language::C));
    EXPECT_FALSE(is_suitable(Kind::CLANG, Language::PYTHON));
}

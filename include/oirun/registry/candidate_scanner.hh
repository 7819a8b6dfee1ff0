#pragma once

#include <chrono>
#include <oirun/command_runner.hh>
#include <string>
#include <vector>

namespace oirun::registry {

// Finds binaries worth probing
class CandidateScanner {
public:
    CandidateScanner() = default;
    CandidateScanner(const CandidateScanner&) = delete;
    CandidateScanner(CandidateScanner&&) = delete;
    CandidateScanner& operator=(const CandidateScanner&) = delete;
    CandidateScanner& operator=(CandidateScanner&&) = delete;
    virtual ~CandidateScanner() = default;

    // Cheap search: PATH, conventional directories and platform locators.
    // Returns paths in discovery order without duplicates.
    virtual std::vector<std::string> scan() = 0;

    // Broad time-bounded filesystem search, used only if scan() found nothing
    virtual std::vector<std::string> deep_scan() = 0;
};

class HostCandidateScanner final : public CandidateScanner {
public:
    struct Options {
        std::vector<std::string> names; // binary names looked up in every directory
        std::vector<std::string> directories; // searched after PATH
        std::vector<std::string> directory_globs; // e.g. "/usr/lib/llvm-*/bin"
        std::vector<std::string> deep_scan_roots;
        std::chrono::nanoseconds deep_scan_timeout = std::chrono::seconds{60};
        size_t deep_scan_limit = 50;
        std::chrono::nanoseconds locator_timeout = std::chrono::seconds{10};
    };

    // Defaults for the host OS
    static Options default_options();

    HostCandidateScanner(CommandRunner& runner, Options options)
    : runner_(runner)
    , options_(std::move(options)) {}

    std::vector<std::string> scan() override;

    std::vector<std::string> deep_scan() override;

private:
    CommandRunner& runner_;
    Options options_;
};

// True for names like "gcc-13" or "clang++-18" derived from @p names
bool is_versioned_name(std::string_view filename, const std::vector<std::string>& names) noexcept;

} // namespace oirun::registry

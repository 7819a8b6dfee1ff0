#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::registry {

enum class Family { GCC_LIKE, CLANG_LIKE, MSVC_LIKE };

// Finer than Family, tells which languages the binary drives
enum class Kind { GCC, GXX, CLANG, CLANGXX, APPLE_CLANG, MSVC };

constexpr Family family_of(Kind kind) noexcept {
    switch (kind) {
    case Kind::GCC:
    case Kind::GXX: return Family::GCC_LIKE;
    case Kind::CLANG:
    case Kind::CLANGXX:
    case Kind::APPLE_CLANG: return Family::CLANG_LIKE;
    case Kind::MSVC: return Family::MSVC_LIKE;
    }
    return Family::GCC_LIKE;
}

constexpr std::string_view to_str(Family family) noexcept {
    switch (family) {
    case Family::GCC_LIKE: return "gcc-like";
    case Family::CLANG_LIKE: return "clang-like";
    case Family::MSVC_LIKE: return "msvc-like";
    }
    return "unknown";
}

constexpr std::string_view to_str(Kind kind) noexcept {
    switch (kind) {
    case Kind::GCC: return "gcc";
    case Kind::GXX: return "g++";
    case Kind::CLANG: return "clang";
    case Kind::CLANGXX: return "clang++";
    case Kind::APPLE_CLANG: return "apple-clang";
    case Kind::MSVC: return "msvc";
    }
    return "unknown";
}

std::optional<Kind> kind_from_str(std::string_view str) noexcept;

struct CompilerDescriptor {
    std::string path;
    Kind kind = Kind::GCC;
    std::string version; // "unknown" if the probe output had none
    std::vector<std::string> supported_standards;
    bool is_64bit = true;
    int priority_score = 0;

    [[nodiscard]] Family family() const noexcept { return family_of(kind); }

    // 0 if the version is unknown
    [[nodiscard]] int major_version() const noexcept;

    // e.g. "Clang++ 18.1.3"
    [[nodiscard]] std::string display_name() const;

    bool operator==(const CompilerDescriptor&) const = default;
};

// Descending priority, ties broken by path ascending
constexpr bool ranks_before(const CompilerDescriptor& a, const CompilerDescriptor& b) noexcept {
    if (a.priority_score != b.priority_score) {
        return a.priority_score > b.priority_score;
    }
    return a.path < b.path;
}

struct DetectionResult {
    bool success = true;
    std::vector<CompilerDescriptor> compilers; // sorted with ranks_before()
    std::optional<CompilerDescriptor> recommended; // compilers.front() if any
    std::vector<std::string> suggestions;
    std::vector<std::string> errors;
    std::chrono::system_clock::time_point cache_timestamp; // millisecond precision
    std::string cache_version;

    bool operator==(const DetectionResult&) const = default;
};

} // namespace oirun::registry

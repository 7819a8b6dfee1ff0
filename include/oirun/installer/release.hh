#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::installer {

enum class Platform { LINUX, MACOS, WINDOWS };

constexpr Platform host_platform() noexcept {
#if defined(__APPLE__)
    return Platform::MACOS;
#elif defined(_WIN32)
    return Platform::WINDOWS;
#else
    return Platform::LINUX;
#endif
}

constexpr std::string_view to_str(Platform platform) noexcept {
    switch (platform) {
    case Platform::LINUX: return "linux";
    case Platform::MACOS: return "macos";
    case Platform::WINDOWS: return "windows";
    }
    return "unknown";
}

// Extracts the version from the "tag_name" (e.g. "llvmorg-18.1.8" -> "18.1.8")
// of the latest release document, nullopt if the document is malformed
std::optional<std::string> parse_latest_version(std::string_view release_json);

struct Artifact {
    std::string file_name;
    std::string url;
    std::string checksum_url;
    // Arguments of the silent installation, empty for archives
    std::vector<std::string> silent_install_args;
};

// Prebuilt toolchain of @p version for @p platform, nullopt if there is no
// prebuilt artifact (macOS uses its package manager)
std::optional<Artifact>
release_artifact(Platform platform, std::string_view version, std::string_view download_base);

/**
 * @brief Parses the contents of a published checksum file
 * @details The digest is the first whitespace-separated token, as written by
 *   sha256sum(1). Returned in lowercase, nullopt if the token is not 64 hex
 *   digits.
 */
std::optional<std::string> parse_checksum_file(std::string_view contents);

} // namespace oirun::installer

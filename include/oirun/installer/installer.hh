#pragma once

#include <chrono>
#include <oirun/command_runner.hh>
#include <oirun/installer/downloader.hh>
#include <oirun/installer/release.hh>
#include <oirun/result.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::installer {

enum class InstallMode { AUTOMATIC, MANUAL };

struct InstallOutcome {
    bool success = false;
    std::string message;
    bool restart_required = false;
    std::vector<std::string> next_steps;
    std::string guide; // Markdown, set when the user has to install manually
};

struct InstallerOptions {
    std::string install_prefix; // archives are unpacked here
    std::string release_feed_url =
        "https://api.github.com/repos/llvm/llvm-project/releases/latest";
    std::string release_download_base = "https://github.com/llvm/llvm-project/releases/download";
    std::string download_dir; // parent of the temporary download directory
    std::chrono::nanoseconds installer_timeout = std::chrono::minutes{5};
    Platform platform = host_platform();
};

// Markdown installation instructions for @p platform
std::string manual_guide(Platform platform);

/**
 * @brief Checks the SHA-256 digest of @p artifact_path against the checksum
 *   file @p checksum_path
 * @details The artifact is deleted if it does not match.
 */
Result<void, std::string>
verify_artifact(const std::string& artifact_path, const std::string& checksum_path);

class Installer {
public:
    Installer(CommandRunner& runner, Downloader& downloader, InstallerOptions options);

    Installer(const Installer&) = delete;
    Installer(Installer&&) = delete;
    Installer& operator=(const Installer&) = delete;
    Installer& operator=(Installer&&) = delete;
    ~Installer() = default;

    /**
     * @brief Installs the toolchain or describes how to do it manually
     * @details Any failure of the automatic installation yields the manual
     *   guide (success = false) with the reason in the message. Never throws
     *   because of a failed step.
     */
    InstallOutcome install(InstallMode mode);

    // Whether the automatic installation has already been done
    [[nodiscard]] bool is_installed() const;

    Result<std::string, std::string> latest_version();

    [[nodiscard]] const InstallerOptions& options() const noexcept { return options_; }

private:
    Result<InstallOutcome, std::string> install_automatically();

    Result<InstallOutcome, std::string> install_with_homebrew();

    Result<InstallOutcome, std::string> install_artifact(const Artifact& artifact);

    // Downloads @p artifact with its checksum into @p dir and verifies it,
    // returns the artifact's path
    Result<std::string, std::string> fetch_artifact(const Artifact& artifact, const std::string& dir);

    Result<void, std::string> run_step(std::string_view what, Command cmd);

    CommandRunner& runner_;
    Downloader& downloader_;
    InstallerOptions options_;
};

InstallOutcome manual_outcome(Platform platform, std::optional<std::string> failure_reason);

} // namespace oirun::installer

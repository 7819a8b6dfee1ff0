#pragma once

#include <chrono>
#include <cstdint>
#include <oirun/config_file.hh>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace oirun {

// A config variable has a value of a wrong type or out of range
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    ConfigError(const ConfigError&) = default;
    ConfigError(ConfigError&&) noexcept = default;
    ConfigError& operator=(const ConfigError&) = default;
    ConfigError& operator=(ConfigError&&) noexcept = default;

    ~ConfigError() override = default;
};

struct EngineConfig {
    std::string backend = "native"; // "native" or "container"
    double time_limit_seconds = 20;
    uint64_t memory_limit_mb = 512;
    std::string optimization = "O2";
    std::string cpp_standard = "c++17";
    std::string c_standard = "c17";

    std::chrono::milliseconds memory_poll_interval{100};
    bool address_space_limit = true;
    uint64_t max_output_size_mb = 64;
    uint64_t min_free_disk_mb = 100;
    bool native_network = false;
    // Lower bounds of the compilation limits, 0 - the limits of the run
    std::chrono::seconds compile_time_limit{0};
    uint64_t compile_memory_limit_mb = 0;

    std::string scratch_root; // absolute
    std::string cache_db; // absolute
    std::string python_interpreter = "python3";

    std::string container_image = "flowerrealm/oi-code-clang:latest";
    std::optional<std::string> container_image_c;
    std::optional<std::string> container_image_cpp;
    std::optional<std::string> container_image_python;
    std::chrono::milliseconds container_kill_grace{1000};
    bool container_auto_install = true;
    std::chrono::seconds daemon_ready_timeout{300};
    std::chrono::seconds daemon_poll_interval{5};
    int image_pull_attempts = 4;

    std::string install_prefix; // absolute
    std::string release_feed_url = "https://api.github.com/repos/llvm/llvm-project/releases/latest";
    std::string release_download_base = "https://github.com/llvm/llvm-project/releases/download";
    std::chrono::seconds installer_timeout{300};

    std::optional<std::string> log_file;

    // Defaults with paths resolved against the home directory
    static EngineConfig defaults();

    /**
     * @brief Applies variables set in @p cf on top of defaults()
     *
     * @errors Throws ConfigError on a value of a wrong type or out of range
     */
    static EngineConfig from_config_file(const ConfigFile& cf);

    // Like from_config_file() but loads @p path first (may throw
    // ConfigFile::ParseError or std::runtime_error if it cannot be read)
    static EngineConfig load(const std::string& path);
};

/**
 * @brief Finds the config file
 * @details @p explicit_path if not empty, then $OIRUN_CONFIG, then
 *   $XDG_CONFIG_HOME/oirun/oirun.conf or ~/.config/oirun/oirun.conf if it
 *   exists.
 *
 * @return path or nullopt if there is no config file to load
 */
std::optional<std::string> locate_config_file(std::string_view explicit_path);

} // namespace oirun

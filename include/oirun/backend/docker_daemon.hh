#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <oirun/command_runner.hh>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::backend {

struct DockerDaemonOptions {
    bool auto_install = true; // install and start the daemon when it is unreachable
    std::chrono::nanoseconds ready_timeout = std::chrono::seconds{300};
    std::chrono::nanoseconds poll_interval = std::chrono::seconds{5};
    int image_pull_attempts = 4;
    std::chrono::nanoseconds first_pull_backoff = std::chrono::seconds{2}; // doubled every retry
    std::chrono::nanoseconds command_timeout = std::chrono::seconds{30};
    std::chrono::nanoseconds pull_timeout = std::chrono::minutes{15};
    std::chrono::nanoseconds install_timeout = std::chrono::minutes{10};
    std::string os_release_path = "/etc/os-release";
    std::function<void(std::chrono::nanoseconds)> sleep; // empty - std::this_thread::sleep_for
};

// "ID" (or the first known "ID_LIKE" entry) of an os-release(5) file
std::string os_release_id(std::string_view os_release_contents);

// Commands installing the docker engine on the distribution @p id, empty if
// the distribution is not supported
std::vector<std::vector<std::string>> docker_install_commands(std::string_view id);

// Commands starting an installed but stopped daemon
std::vector<std::vector<std::string>> docker_start_commands();

// Keeps the docker daemon reachable and images present. Thread-safe.
class DockerDaemon {
public:
    DockerDaemon(CommandRunner& runner, DockerDaemonOptions options);

    DockerDaemon(const DockerDaemon&) = delete;
    DockerDaemon(DockerDaemon&&) = delete;
    DockerDaemon& operator=(const DockerDaemon&) = delete;
    DockerDaemon& operator=(DockerDaemon&&) = delete;
    ~DockerDaemon() = default;

    /**
     * @brief Makes sure the daemon answers
     * @details If it does not, installs (when the client is missing) and
     *   starts it, then polls `docker ps` until it answers or the ready
     *   timeout passes.
     *
     * @errors Throws BackendError listing the steps attempted
     */
    void ensure_ready();

    /**
     * @brief Makes sure @p image is present locally, pulling it if needed
     * @details Pulls are retried with exponential backoff. Concurrent calls
     *   for the same image wait for a single pull.
     *
     * @errors Throws BackendError if the image cannot be obtained
     */
    void ensure_image(const std::string& image);

private:
    void sleep(std::chrono::nanoseconds duration);

    CommandOutput run(std::vector<std::string> argv, std::chrono::nanoseconds timeout);

    void install_and_start(bool client_missing, std::vector<std::string>& steps);

    bool wait_until_ready(std::vector<std::string>& steps);

    bool image_present(const std::string& image);

    void pull(const std::string& image);

    CommandRunner& runner_;
    DockerDaemonOptions options_;

    std::mutex ready_mutex_;
    bool ready_ = false;

    std::mutex images_mutex_;
    std::condition_variable images_cv_;
    std::set<std::string, std::less<>> present_images_;
    std::set<std::string, std::less<>> pulls_in_progress_;
};

} // namespace oirun::backend

#pragma once

#include <chrono>
#include <memory>
#include <oirun/backend/backend.hh>
#include <oirun/backend/command_sanitizer.hh>
#include <oirun/backend/docker_daemon.hh>
#include <oirun/backend/violation_classifier.hh>
#include <oirun/command_runner.hh>
#include <optional>
#include <string>
#include <vector>

namespace oirun::backend {

constexpr std::string_view container_source_dir = "/tmp/source/";
constexpr std::string_view container_scratch_dir = "/tmp/";

struct ContainerBackendOptions {
    std::string default_image = "flowerrealm/oi-code-clang:latest";
    std::optional<std::string> c_image;
    std::optional<std::string> cpp_image;
    std::optional<std::string> python_image;
    std::chrono::nanoseconds kill_grace = std::chrono::seconds{1};
    // Hard ceiling of the docker client beyond the kill deadline
    std::chrono::nanoseconds client_grace = std::chrono::seconds{30};
    std::string scratch_root; // parent of temporary directories made by the backend
};

/**
 * @brief Arguments of `docker run`, in this exact order: `--rm -i --name
 *   <name> --network=none --read-only --memory=<N>m --memory-swap=<N>m
 *   --cpus=1.0 --pids-limit=64`, the read-only source mount, the writable
 *   scratch mount, the image, `bash -c <shell_command>`
 */
std::vector<std::string> docker_run_args(
    std::string_view container_name,
    uint64_t memory_limit_mb,
    std::string_view host_source_dir,
    std::string_view host_scratch_dir,
    std::string_view image,
    std::string_view shell_command
);

// "oi-task-<epoch ms>-<random 0..999>"
std::string unique_container_name();

// Runs the workload in a fresh, auto-removed docker container
class ContainerBackend final : public Backend {
public:
    ContainerBackend(
        CommandRunner& runner,
        DockerDaemon& daemon,
        ContainerBackendOptions options,
        std::unique_ptr<ViolationClassifier> classifier =
            std::make_unique<ContainerViolationClassifier>()
    );

    [[nodiscard]] std::string_view name() const noexcept override { return "container"; }

    [[nodiscard]] Mounts visible_mounts(const Mounts& /*host*/) const override {
        return {std::string{container_source_dir}, std::string{container_scratch_dir}};
    }

    [[nodiscard]] bool uses_image_toolchain() const noexcept override { return true; }

    [[nodiscard]] const std::string& image_for(Language lang) const noexcept;

    ExecutionResult run(const RunSpec& spec) override;

private:
    CommandRunner& runner_;
    DockerDaemon& daemon_;
    ContainerBackendOptions options_;
    std::unique_ptr<ViolationClassifier> classifier_;
    CommandSanitizer sanitizer_;
};

} // namespace oirun::backend

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <oirun/backend/backend.hh>
#include <oirun/backend/violation_classifier.hh>
#include <oirun/seccomp/bpf_builder.hh>

namespace oirun::backend {

struct ProcessBackendOptions {
    // Resident memory is sampled, spikes shorter than this may go unnoticed
    std::chrono::nanoseconds memory_poll_interval = std::chrono::milliseconds{100};
    bool address_space_limit = true; // RLIMIT_AS set to the memory limit
    uint64_t max_output_size = uint64_t{64} << 20; // per stream, in bytes
    bool block_network = true; // socket(AF_INET/AF_INET6) fails with EPERM
};

// Makes socket(2) fail with EPERM for internet address families
std::unique_ptr<sandbox::seccomp::Program> build_network_filter();

// Runs the workload as a native child process
class ProcessBackend final : public Backend {
public:
    explicit ProcessBackend(
        ProcessBackendOptions options,
        std::unique_ptr<ViolationClassifier> classifier =
            std::make_unique<ProcessViolationClassifier>()
    );

    [[nodiscard]] std::string_view name() const noexcept override { return "native"; }

    [[nodiscard]] Mounts visible_mounts(const Mounts& host) const override { return host; }

    [[nodiscard]] bool uses_image_toolchain() const noexcept override { return false; }

    ExecutionResult run(const RunSpec& spec) override;

private:
    ProcessBackendOptions options_;
    std::unique_ptr<ViolationClassifier> classifier_;
    std::unique_ptr<sandbox::seccomp::Program> network_filter_;
};

} // namespace oirun::backend

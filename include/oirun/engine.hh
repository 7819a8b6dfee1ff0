#pragma once

#include <memory>
#include <oirun/backend/backend.hh>
#include <oirun/backend/docker_daemon.hh>
#include <oirun/command_runner.hh>
#include <oirun/engine_config.hh>
#include <oirun/execution.hh>
#include <oirun/installer/downloader.hh>
#include <oirun/installer/installer.hh>
#include <oirun/pair_check/pair_checker.hh>
#include <oirun/pipeline/pipeline.hh>
#include <oirun/registry/candidate_scanner.hh>
#include <oirun/registry/detection_cache.hh>
#include <oirun/registry/registry.hh>
#include <oirun/verdict.hh>
#include <string>
#include <string_view>
#include <vector>

namespace oirun {

struct RunReport {
    Verdict verdict = Verdict::SYSTEM_ERROR;
    ExecutionResult result;
    std::string backend; // name of the backend that ran the request
};

// Collaborators of the engine, the ones left empty are built from the config.
// Members are destroyed in reverse order, so the ones declared later may
// refer to the earlier ones.
struct EngineServices {
    std::unique_ptr<CommandRunner> runner;
    std::unique_ptr<backend::DockerDaemon> docker_daemon;
    std::unique_ptr<registry::CandidateScanner> scanner;
    std::unique_ptr<registry::DetectionCacheStore> cache_store;
    std::unique_ptr<installer::Downloader> downloader;
    std::unique_ptr<backend::Backend> native_backend;
    std::unique_ptr<backend::Backend> container_backend;
};

/**
 * Owns every service of a session: the compiler registry, both backends, the
 * pipeline, the pair checker and the installer. Nothing is process-global, so
 * independent engines do not share state.
 */
class Engine {
public:
    explicit Engine(EngineConfig config) : Engine(std::move(config), EngineServices{}) {}

    Engine(EngineConfig config, EngineServices services);

    Engine(const Engine&) = delete;
    Engine(Engine&&) = delete;
    Engine& operator=(const Engine&) = delete;
    Engine& operator=(Engine&&) = delete;
    ~Engine() = default;

    registry::DetectionResult detect(bool force_rescan) { return registry_->detect(force_rescan); }

    void clear_cache() { registry_->clear_cache(); }

    std::vector<registry::CompilerDescriptor> suitable_compilers(Language lang) {
        return registry_->filter_suitable(lang);
    }

    /**
     * @brief Picks the backend for a request
     * @details "native" or "container" select it explicitly, an empty choice
     *   or a compiler path (containing '/') selects the configured one.
     *
     * @errors Throws InvalidRequest on any other @p choice
     */
    backend::Backend& select_backend(std::string_view choice);

    /**
     * @brief Compiles and runs @p req
     * @details Failures of the backend itself are reported as SYSTEM_ERROR
     *   with the reason in stderr.
     *
     * @errors Throws InvalidRequest if @p req is malformed
     */
    RunReport run(const ExecutionRequest& req);

    /**
     * @brief Runs both programs of @p req and compares their outputs
     *
     * @errors Throws InvalidRequest if @p req is malformed and
     *   backend::BackendError (or another std::runtime_error) if any of the
     *   runs could not be performed
     */
    pair_check::PairCheckResult run_pair(const pair_check::PairRequest& req);

    // Clears the compiler cache after a successful installation
    installer::InstallOutcome install(installer::InstallMode mode);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    EngineConfig config_;
    EngineServices services_;
    std::unique_ptr<registry::Registry> registry_;
    std::unique_ptr<pipeline::Pipeline> pipeline_;
    std::unique_ptr<pair_check::PairChecker> pair_checker_;
    std::unique_ptr<installer::Installer> installer_;
};

} // namespace oirun

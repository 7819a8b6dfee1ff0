#include <oirun/backend/container_backend.hh>
#include <oirun/backend/process_backend.hh>
#include <oirun/engine.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>

using std::make_unique;
using std::string;

namespace {

void fill_default_services(const oirun::EngineConfig& conf, oirun::EngineServices& services) {
    STACK_UNWINDING_MARK;
    using namespace oirun; // NOLINT(google-build-using-namespace)

    if (not services.runner) {
        services.runner = make_unique<SpawnerCommandRunner>();
    }
    auto& runner = *services.runner;

    if (not services.docker_daemon) {
        backend::DockerDaemonOptions opts;
        opts.auto_install = conf.container_auto_install;
        opts.ready_timeout = conf.daemon_ready_timeout;
        opts.poll_interval = conf.daemon_poll_interval;
        opts.image_pull_attempts = conf.image_pull_attempts;
        services.docker_daemon = make_unique<backend::DockerDaemon>(runner, std::move(opts));
    }

    if (not services.scanner) {
        auto opts = registry::HostCandidateScanner::default_options();
        // Toolchain unpacked by the installer
        opts.directories.emplace_back(concat_tostr(conf.install_prefix, "/bin"));
        services.scanner = make_unique<registry::HostCandidateScanner>(runner, std::move(opts));
    }

    if (not services.cache_store) {
        services.cache_store = make_unique<registry::SqliteCacheStore>(conf.cache_db);
    }

    if (not services.downloader) {
        services.downloader = make_unique<installer::CurlDownloader>(runner);
    }

    if (not services.native_backend) {
        backend::ProcessBackendOptions opts;
        opts.memory_poll_interval = conf.memory_poll_interval;
        opts.address_space_limit = conf.address_space_limit;
        opts.max_output_size = conf.max_output_size_mb << 20;
        opts.block_network = not conf.native_network;
        services.native_backend = make_unique<backend::ProcessBackend>(std::move(opts));
    }

    if (not services.container_backend) {
        backend::ContainerBackendOptions opts;
        opts.default_image = conf.container_image;
        opts.c_image = conf.container_image_c;
        opts.cpp_image = conf.container_image_cpp;
        opts.python_image = conf.container_image_python;
        opts.kill_grace = conf.container_kill_grace;
        opts.scratch_root = conf.scratch_root;
        services.container_backend = make_unique<backend::ContainerBackend>(
            runner, *services.docker_daemon, std::move(opts)
        );
    }
}

} // namespace

namespace oirun {

Engine::Engine(EngineConfig config, EngineServices services)
: config_(std::move(config))
, services_(std::move(services)) {
    STACK_UNWINDING_MARK;

    fill_default_services(config_, services_);
    registry_ = make_unique<registry::Registry>(
        *services_.scanner, *services_.runner, *services_.cache_store
    );

    pipeline::PipelineOptions popts;
    popts.scratch_root = config_.scratch_root;
    popts.min_free_disk_mb = config_.min_free_disk_mb;
    popts.compile_time_limit = config_.compile_time_limit;
    popts.compile_memory_limit_mb = config_.compile_memory_limit_mb;
    popts.python_interpreter = config_.python_interpreter;
    popts.default_time_limit_seconds = config_.time_limit_seconds;
    popts.default_memory_limit_mb = config_.memory_limit_mb;
    popts.default_optimization = config_.optimization;
    popts.default_cpp_standard = config_.cpp_standard;
    popts.default_c_standard = config_.c_standard;
    pipeline_ = make_unique<pipeline::Pipeline>(*registry_, *services_.runner, std::move(popts));

    pair_checker_ = make_unique<pair_check::PairChecker>(*pipeline_, config_.scratch_root);

    installer::InstallerOptions iopts;
    iopts.install_prefix = config_.install_prefix;
    iopts.release_feed_url = config_.release_feed_url;
    iopts.release_download_base = config_.release_download_base;
    iopts.download_dir = config_.scratch_root;
    iopts.installer_timeout = config_.installer_timeout;
    installer_ = make_unique<installer::Installer>(
        *services_.runner, *services_.downloader, std::move(iopts)
    );
}

backend::Backend& Engine::select_backend(std::string_view choice) {
    if (choice.empty() or choice.find('/') != std::string_view::npos) {
        choice = config_.backend;
    }
    if (choice == "container") {
        return *services_.container_backend;
    }
    if (choice == "native") {
        return *services_.native_backend;
    }
    throw InvalidRequest(concat_tostr(
        "Unknown backend or compiler: ", choice, " (expected native, container or a compiler path)"
    ));
}

RunReport Engine::run(const ExecutionRequest& req) {
    STACK_UNWINDING_MARK;

    auto& backend = select_backend(req.compiler_or_backend_choice);
    RunReport rep;
    rep.backend = string{backend.name()};
    auto system_error = [&](const char* what) {
        rep.verdict = Verdict::SYSTEM_ERROR;
        rep.result = ExecutionResult{};
        rep.result.exit_code = 1;
        rep.result.stderr_str = what;
    };

    try {
        rep.result = pipeline_->compile_and_run(req, backend);
        rep.verdict = verdict_of(rep.result);
    } catch (const InvalidRequest&) {
        throw;
    } catch (const backend::BackendError& e) {
        errlog("Backend ", backend.name(), " failed: ", e.what());
        system_error(e.what());
    } catch (const std::runtime_error& e) {
        ERRLOG_CATCH(e);
        system_error(e.what());
    }
    debuglog("run ", req.source_path, " on ", rep.backend, ": ", to_str(rep.verdict));
    return rep;
}

pair_check::PairCheckResult Engine::run_pair(const pair_check::PairRequest& req) {
    STACK_UNWINDING_MARK;
    return pair_checker_->run_pair(req, select_backend(req.compiler_choice));
}

installer::InstallOutcome Engine::install(installer::InstallMode mode) {
    STACK_UNWINDING_MARK;

    auto outcome = installer_->install(mode);
    if (outcome.success) {
        registry_->clear_cache();
    }
    return outcome;
}

} // namespace oirun

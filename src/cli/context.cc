#include "context.hh"

#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>

oirun::Engine& CliContext::engine() {
    STACK_UNWINDING_MARK;

    if (engine_) {
        return *engine_;
    }

    auto conf = oirun::EngineConfig::defaults();
    if (auto path = oirun::locate_config_file(config_path)) {
        debuglog("config: loading ", *path);
        conf = oirun::EngineConfig::load(*path);
    }
    if (conf.log_file) {
        stdlog.open(*conf.log_file);
        errlog.open(*conf.log_file);
    }
    engine_ = std::make_unique<oirun::Engine>(std::move(conf));
    return *engine_;
}

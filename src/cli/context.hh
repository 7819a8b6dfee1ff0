#pragma once

#include <memory>
#include <oirun/engine.hh>
#include <string>

struct CliContext {
    bool json = false;
    std::string config_path; // from --config, empty - look up the default locations

    // Loads the config and creates the engine on first use
    oirun::Engine& engine();

private:
    std::unique_ptr<oirun::Engine> engine_;
};

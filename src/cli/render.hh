#pragma once

#include <oirun/engine.hh>
#include <string>
#include <vector>

// Rendering of engine results for the terminal and as JSON documents

std::string render_detection(const oirun::registry::DetectionResult& res, bool json);

std::string
render_compilers(const std::vector<oirun::registry::CompilerDescriptor>& compilers, bool json);

std::string render_run_report(const oirun::RunReport& rep, bool json);

std::string render_pair_result(const oirun::pair_check::PairCheckResult& res, bool json);

std::string render_install_outcome(const oirun::installer::InstallOutcome& outcome, bool json);

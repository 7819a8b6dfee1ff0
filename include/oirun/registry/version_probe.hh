#pragma once

#include <chrono>
#include <oirun/command_runner.hh>
#include <oirun/registry/compiler.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::registry {

/**
 * @brief Tells what kind of compiler @p path is
 * @details The file name decides first (cl.exe, clang++, clang, g++/c++,
 *   gcc/cc), then the `--version` output. A clang whose output mentions
 *   "Apple" is apple-clang.
 *
 * @return std::nullopt if neither the name nor the output is recognized
 */
std::optional<Kind> classify_kind(std::string_view path, std::string_view version_output);

// First "X.Y.Z", then "X.Y" found in @p output, "unknown" if none
std::string extract_version(std::string_view output);

// Leading number of @p version, 0 if there is none
int major_version(std::string_view version) noexcept;

std::vector<std::string> supported_standards(Kind kind, int major);

// family weight * 100 + major * 10 + install path bonus
int priority_score(Kind kind, int major, std::string_view path) noexcept;

// Interprets `-dumpmachine` output
bool is_64bit_target(std::string_view dumpmachine_output) noexcept;

/**
 * @brief Runs `<path> --version` (and `-dumpmachine`) and builds a descriptor
 *
 * @return std::nullopt if the binary fails to run, times out or its output is
 *   not recognized; the reason is logged to debuglog
 */
std::optional<CompilerDescriptor>
probe_compiler(CommandRunner& runner, const std::string& path, std::chrono::nanoseconds timeout);

} // namespace oirun::registry

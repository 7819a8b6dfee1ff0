#pragma once

#include <oirun/language.hh>
#include <oirun/registry/compiler.hh>
#include <string>
#include <string_view>
#include <vector>

namespace oirun::pipeline {

constexpr bool is_valid_optimization_level(std::string_view level) noexcept {
    return level == "O0" or level == "O1" or level == "O2" or level == "O3" or level == "Os";
}

/**
 * @brief Returns @p standard, or a substitute for toolchain versions known to
 *   mishandle it
 * @details Clang-like compilers from major version 20 get c++14 instead of
 *   c++17. No other substitutions are made.
 */
std::string effective_standard(const registry::CompilerDescriptor& compiler, std::string_view standard);

/**
 * @brief Compiler arguments in the fixed order: optimization, standard,
 *   output, source
 * @details `-O<level> -std=<std> -o <output> <source>` or, for MSVC-like
 *   compilers, `/<level> /std:<std> /Fe:<output> <source>`. Apple clang
 *   building C++ additionally links `-lc++`.
 */
std::vector<std::string> compile_args(
    const registry::CompilerDescriptor& compiler,
    Language lang,
    std::string_view optimization_level,
    std::string_view standard,
    std::string_view output,
    std::string_view source
);

} // namespace oirun::pipeline

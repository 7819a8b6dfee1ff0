#include <oirun/concat_tostr.hh>
#include <oirun/logger.hh>
#include <oirun/pipeline/compiler_invocation.hh>

namespace oirun::pipeline {

std::string
effective_standard(const registry::CompilerDescriptor& compiler, std::string_view standard) {
    if (compiler.family() == registry::Family::CLANG_LIKE and compiler.major_version() >= 20 and
        standard == "c++17")
    {
        debuglog(
            "pipeline: ", compiler.display_name(), " does not handle c++17 well, using c++14"
        );
        return "c++14";
    }
    return std::string{standard};
}

std::vector<std::string> compile_args(
    const registry::CompilerDescriptor& compiler,
    Language lang,
    std::string_view optimization_level,
    std::string_view standard,
    std::string_view output,
    std::string_view source
) {
    if (compiler.family() == registry::Family::MSVC_LIKE) {
        return {
            concat_tostr('/', optimization_level),
            concat_tostr("/std:", standard),
            concat_tostr("/Fe:", output),
            std::string{source},
        };
    }

    std::vector<std::string> args = {
        concat_tostr('-', optimization_level),
        concat_tostr("-std=", standard),
        "-o",
        std::string{output},
        std::string{source},
    };
    if (compiler.kind == registry::Kind::APPLE_CLANG and lang == Language::CPP) {
        args.emplace_back("-lc++");
    }
    return args;
}

} // namespace oirun::pipeline

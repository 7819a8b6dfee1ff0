#include <oirun/concat_tostr.hh>
#include <oirun/registry/compiler.hh>
#include <oirun/registry/version_probe.hh>

namespace oirun::registry {

std::optional<Kind> kind_from_str(std::string_view str) noexcept {
    for (auto kind :
         {Kind::GCC, Kind::GXX, Kind::CLANG, Kind::CLANGXX, Kind::APPLE_CLANG, Kind::MSVC})
    {
        if (to_str(kind) == str) {
            return kind;
        }
    }
    return std::nullopt;
}

int CompilerDescriptor::major_version() const noexcept {
    return registry::major_version(version);
}

std::string CompilerDescriptor::display_name() const {
    std::string_view name = [&]() -> std::string_view {
        switch (kind) {
        case Kind::GCC: return "GCC";
        case Kind::GXX: return "G++";
        case Kind::CLANG: return "Clang";
        case Kind::CLANGXX: return "Clang++";
        case Kind::APPLE_CLANG: return "Apple Clang";
        case Kind::MSVC: return "MSVC";
        }
        return "Unknown";
    }();

    if (version.empty() or version == "unknown") {
        return std::string{name};
    }
    return concat_tostr(name, ' ', version);
}

} // namespace oirun::registry

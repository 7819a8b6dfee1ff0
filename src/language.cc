#include <oirun/file_manip.hh>
#include <oirun/language.hh>

namespace oirun {

std::optional<Language> language_from_id(std::string_view id) noexcept {
    if (id == "c") {
        return Language::C;
    }
    if (id == "cpp" or id == "cxx" or id == "cc" or id == "c++") {
        return Language::CPP;
    }
    if (id == "python" or id == "py") {
        return Language::PYTHON;
    }
    return std::nullopt;
}

std::optional<Language> language_from_path(std::string_view path) noexcept {
    auto ext = path_extension(path);
    for (auto lang : {Language::C, Language::CPP, Language::PYTHON}) {
        if (extension_matches(lang, ext)) {
            return lang;
        }
    }
    return std::nullopt;
}

bool extension_matches(Language lang, std::string_view extension) noexcept {
    switch (lang) {
    case Language::C: return extension == "c";
    case Language::CPP: return extension == "cpp" or extension == "cc" or extension == "cxx";
    case Language::PYTHON: return extension == "py";
    }
    return false;
}

} // namespace oirun

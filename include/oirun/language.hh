#pragma once

#include <optional>
#include <string_view>

namespace oirun {

enum class Language { C, CPP, PYTHON };

// Accepts "c", "cpp" and its aliases "cxx", "cc", "c++", and "python"/"py"
std::optional<Language> language_from_id(std::string_view id) noexcept;

// Guesses the language from the extension of @p path
std::optional<Language> language_from_path(std::string_view path) noexcept;

constexpr std::string_view to_str(Language lang) noexcept {
    switch (lang) {
    case Language::C: return "c";
    case Language::CPP: return "cpp";
    case Language::PYTHON: return "python";
    }
    return "unknown";
}

// Extension used for files the engine writes itself, e.g. "cpp"
constexpr std::string_view default_extension(Language lang) noexcept {
    switch (lang) {
    case Language::C: return "c";
    case Language::CPP: return "cpp";
    case Language::PYTHON: return "py";
    }
    return "";
}

[[nodiscard]] bool extension_matches(Language lang, std::string_view extension) noexcept;

constexpr bool is_compiled(Language lang) noexcept { return lang != Language::PYTHON; }

} // namespace oirun

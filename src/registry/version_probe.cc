#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/registry/version_probe.hh>
#include <oirun/string_transform.hh>

using std::string;
using std::string_view;

namespace {

bool contains(string_view str, string_view needle) noexcept {
    return str.find(needle) != string_view::npos;
}

// Matches <digits>(.<digits>){dots} at @p pos, returns the match length or 0
size_t match_dotted_number(string_view str, size_t pos, int dots) noexcept {
    size_t i = pos;
    for (int part = 0; part <= dots; ++part) {
        if (part > 0) {
            if (i >= str.size() or str[i] != '.') {
                return 0;
            }
            ++i;
        }
        size_t beg = i;
        while (i < str.size() and is_digit(str[i])) {
            ++i;
        }
        if (i == beg) {
            return 0;
        }
    }
    return i - pos;
}

std::optional<string_view> find_dotted_number(string_view str, int dots) noexcept {
    for (size_t pos = 0; pos < str.size(); ++pos) {
        // Only maximal runs of digits start a match
        if (not is_digit(str[pos]) or (pos > 0 and is_digit(str[pos - 1]))) {
            continue;
        }
        if (auto len = match_dotted_number(str, pos, dots); len > 0) {
            return str.substr(pos, len);
        }
    }
    return std::nullopt;
}

} // namespace

namespace oirun::registry {

std::optional<Kind> classify_kind(string_view path, string_view version_output) {
    auto filename = to_lower(path_filename(path));

    if (contains(filename, "cl.exe")) {
        return Kind::MSVC;
    }
    if (contains(filename, "clang++")) {
        return Kind::CLANGXX;
    }
    if (contains(filename, "clang")) {
        return contains(version_output, "Apple") ? Kind::APPLE_CLANG : Kind::CLANG;
    }
    if (contains(filename, "g++") or filename == "c++") {
        return Kind::GXX;
    }
    if (contains(filename, "gcc") or contains(filename, "cc")) {
        return Kind::GCC;
    }

    if (contains(version_output, "clang")) {
        return contains(version_output, "Apple") ? Kind::APPLE_CLANG : Kind::CLANG;
    }
    if (contains(version_output, "GCC") or contains(version_output, "gcc") or
        contains(version_output, "Ubuntu") or contains(version_output, "Copyright (C)"))
    {
        return contains(filename, "++") ? Kind::GXX : Kind::GCC;
    }
    return std::nullopt;
}

string extract_version(string_view output) {
    if (auto ver = find_dotted_number(output, 2)) {
        return string{*ver};
    }
    if (auto ver = find_dotted_number(output, 1)) {
        return string{*ver};
    }
    return "unknown";
}

int major_version(string_view version) noexcept {
    size_t len = 0;
    while (len < version.size() and is_digit(version[len])) {
        ++len;
    }
    return str2num<int>(version.substr(0, len)).value_or(0);
}

std::vector<string> supported_standards(Kind kind, int major) {
    std::vector<string> c_standards = {"c89", "c99", "c11", "c17"};
    std::vector<string> cpp_standards = {"c++98", "c++11", "c++14", "c++17"};

    int cpp20_since = 0;
    int cpp23_since = 0;
    switch (family_of(kind)) {
    case Family::CLANG_LIKE:
        cpp20_since = 9;
        cpp23_since = 17;
        break;
    case Family::GCC_LIKE:
        cpp20_since = 11;
        cpp23_since = 13;
        break;
    case Family::MSVC_LIKE:
        cpp20_since = 19;
        cpp23_since = 20;
        break;
    }
    if (major >= cpp20_since) {
        cpp_standards.emplace_back("c++20");
    }
    if (major >= cpp23_since) {
        cpp_standards.emplace_back("c++23");
    }

    switch (kind) {
    case Kind::GCC:
    case Kind::CLANG: return c_standards;
    case Kind::GXX:
    case Kind::CLANGXX: return cpp_standards;
    case Kind::APPLE_CLANG:
    case Kind::MSVC: break;
    }
    // Drives both languages
    c_standards.insert(c_standards.end(), cpp_standards.begin(), cpp_standards.end());
    return c_standards;
}

int priority_score(Kind kind, int major, string_view path) noexcept {
    int family_weight = [&] {
        switch (kind) {
        case Kind::CLANG:
        case Kind::CLANGXX: return 100;
        case Kind::APPLE_CLANG: return 90;
        case Kind::GCC:
        case Kind::GXX: return 80;
        case Kind::MSVC: return 70;
        }
        return 0;
    }();

    int path_bonus = 0;
    if (contains(path, "/usr/bin") or contains(path, "C:\\Windows")) {
        path_bonus = -20;
    } else if (contains(path, "/opt/") or contains(path, "/usr/local/") or
               contains(path, "Program Files"))
    {
        path_bonus = 5;
    }
    return family_weight + major * 10 + path_bonus;
}

bool is_64bit_target(string_view dumpmachine_output) noexcept {
    return contains(dumpmachine_output, "64") or contains(dumpmachine_output, "amd64");
}

std::optional<CompilerDescriptor>
probe_compiler(CommandRunner& runner, const string& path, std::chrono::nanoseconds timeout) {
    STACK_UNWINDING_MARK;

    CommandOutput version_out;
    try {
        version_out = runner.run({.argv = {path, "--version"}, .timeout = timeout});
    } catch (const std::exception& e) {
        debuglog("registry: dropping ", path, ": ", e.what());
        return std::nullopt;
    }
    if (not version_out.success()) {
        debuglog(
            "registry: dropping ",
            path,
            ": --version ",
            (version_out.timed_out ? string{"timed out"}
                                   : concat_tostr("exited with ", version_out.exit_code))
        );
        return std::nullopt;
    }

    auto output = concat_tostr(version_out.out, version_out.err);
    auto kind = classify_kind(path, output);
    if (not kind) {
        debuglog("registry: dropping ", path, ": unrecognized --version output");
        return std::nullopt;
    }

    CompilerDescriptor desc;
    desc.path = path;
    desc.kind = *kind;
    desc.version = extract_version(output);
    int major = major_version(desc.version);
    desc.supported_standards = supported_standards(*kind, major);
    desc.priority_score = priority_score(*kind, major, path);

    desc.is_64bit = true; // Assumed if -dumpmachine does not work
    if (*kind != Kind::MSVC) {
        try {
            auto machine = runner.run({.argv = {path, "-dumpmachine"}, .timeout = timeout});
            if (machine.success()) {
                desc.is_64bit = is_64bit_target(machine.out);
            }
        } catch (const std::exception& e) {
            debuglog("registry: -dumpmachine of ", path, " failed: ", e.what());
        }
    }

    debuglog(
        "registry: found ",
        desc.display_name(),
        " (",
        to_str(desc.kind),
        ") at ",
        path,
        ", priority ",
        desc.priority_score
    );
    return desc;
}

} // namespace oirun::registry

#include <algorithm>
#include <array>
#include <cstdlib>
#include <oirun/backend/backend.hh>
#include <oirun/backend/command_sanitizer.hh>
#include <oirun/concat_tostr.hh>
#include <oirun/file_manip.hh>
#include <oirun/string_transform.hh>

using std::string;
using std::string_view;

namespace {

constexpr std::array<string_view, 19> allowed_commands = {
    "clang",
    "clang++",
    "gcc",
    "g++",
    "cc",
    "c++",
    "cl",
    "python",
    "python3",
    "which",
    "find",
    "ps",
    "df",
    "make",
    "cmake",
    "ninja",
    "sh",
    "bash",
    "zsh",
};

constexpr std::array<string_view, 1> allowed_script_extensions = {"sh"};

constexpr bool is_shell_metacharacter(char c) noexcept {
    switch (c) {
    case ';':
    case '&':
    case '|':
    case '`':
    case '$':
    case '(':
    case ')':
    case '{':
    case '}':
    case '<':
    case '>': return true;
    default: return false;
    }
}

// "gcc-13" or "clang++-18.1" -> "gcc" or "clang++"
string_view strip_version_suffix(string_view name) noexcept {
    auto dash = name.rfind('-');
    if (dash == string_view::npos or dash + 1 == name.size()) {
        return name;
    }
    auto suffix = name.substr(dash + 1);
    if (is_digit(suffix.front()) and std::all_of(suffix.begin(), suffix.end(), [](char c) {
            return is_digit(c) or c == '.';
        }))
    {
        return name.substr(0, dash);
    }
    return name;
}

string with_trailing_slash(string_view dir) {
    return concat_tostr(dir, (has_suffix(dir, "/") ? "" : "/"));
}

} // namespace

namespace oirun::backend {

string sanitize_argument(string_view arg) {
    string res;
    res.reserve(arg.size());
    for (char c : arg) {
        if (not is_shell_metacharacter(c) and not is_cntrl(c)) {
            res += c;
        }
    }
    return string{trim(res)};
}

string shell_quote(string_view arg) {
    string res = "'";
    for (char c : arg) {
        if (c == '\'') {
            res += "'\\''";
        } else {
            res += c;
        }
    }
    res += '\'';
    return res;
}

CommandSanitizer::CommandSanitizer(const std::vector<string>& extra_safe_dirs) {
    safe_dirs_ = {"/tmp/", "/var/tmp/"};
    if (const char* tmpdir = getenv("TMPDIR"); tmpdir and *tmpdir == '/') {
        safe_dirs_.emplace_back(with_trailing_slash(tmpdir));
    }
    for (const auto& dir : extra_safe_dirs) {
        if (not dir.empty()) {
            safe_dirs_.emplace_back(with_trailing_slash(dir));
        }
    }
}

bool CommandSanitizer::is_allowed_command(string_view command) const {
    if (command.empty()) {
        return false;
    }

    if (command.front() != '/') {
        // Bare tool name, looked up in the image's PATH
        if (command.find('/') != string_view::npos) {
            return false;
        }
        auto base = to_lower(strip_version_suffix(command));
        return std::find(allowed_commands.begin(), allowed_commands.end(), base) !=
            allowed_commands.end();
    }

    if (command.find("/../") != string_view::npos or has_suffix(command, "/..")) {
        return false;
    }
    bool in_safe_dir = std::any_of(safe_dirs_.begin(), safe_dirs_.end(), [&](const auto& dir) {
        return has_prefix(command, dir);
    });
    auto ext = path_extension(command);
    bool allowed_ext = ext.empty() or
        std::find(allowed_script_extensions.begin(), allowed_script_extensions.end(), ext) !=
            allowed_script_extensions.end();
    return in_safe_dir and allowed_ext;
}

string CommandSanitizer::build(string_view command, const std::vector<string>& args) const {
    if (not is_allowed_command(command)) {
        throw BackendError(concat_tostr("Command is not allowed in a container: ", command));
    }

    string res{command};
    for (const auto& arg : args) {
        back_insert(res, ' ', shell_quote(sanitize_argument(arg)));
    }
    return res;
}

} // namespace oirun::backend

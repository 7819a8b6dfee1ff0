#include <algorithm>
#include <dirent.h>
#include <glob.h>
#include <memory>
#include <oirun/call_in_destructor.hh>
#include <oirun/concat_tostr.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/registry/candidate_scanner.hh>
#include <oirun/string_transform.hh>
#include <set>

using std::string;
using std::string_view;
using std::vector;

namespace {

string with_trailing_slash(string_view dir) {
    return concat_tostr(dir, (has_suffix(dir, "/") ? "" : "/"));
}

// Unreadable directories yield nothing
vector<string> list_directory(const string& dir) {
    vector<string> res;
    std::unique_ptr<DIR, decltype(&closedir)> d{opendir(dir.c_str()), closedir};
    if (not d) {
        return res;
    }
    while (dirent* file = readdir(d.get())) {
        string_view name = file->d_name;
        if (name != "." and name != "..") {
            res.emplace_back(name);
        }
    }
    std::sort(res.begin(), res.end());
    return res;
}

vector<string> expand_glob(const string& pattern) {
    vector<string> res;
    glob_t g{};
    CallInDtor release{[&] { globfree(&g); }};
    if (glob(pattern.c_str(), GLOB_ONLYDIR, nullptr, &g) == 0) {
        for (size_t i = 0; i < g.gl_pathc; ++i) {
            res.emplace_back(g.gl_pathv[i]);
        }
    }
    return res;
}

class CandidateList {
    vector<string> paths_;
    std::set<string, std::less<>> seen_;

public:
    void add(string path) {
        if (is_executable_file(path) and seen_.emplace(path).second) {
            debuglog("registry: candidate ", path);
            paths_.emplace_back(std::move(path));
        }
    }

    vector<string> into_vector() && { return std::move(paths_); }
};

} // namespace

namespace oirun::registry {

bool is_versioned_name(string_view filename, const vector<string>& names) noexcept {
    for (const auto& name : names) {
        if (filename.size() > name.size() + 1 and has_prefix(filename, name) and
            filename[name.size()] == '-')
        {
            auto suffix = filename.substr(name.size() + 1);
            if (std::all_of(suffix.begin(), suffix.end(), [](char c) {
                    return is_digit(c) or c == '.';
                }) and
                is_digit(suffix.front()))
            {
                return true;
            }
        }
    }
    return false;
}

HostCandidateScanner::Options HostCandidateScanner::default_options() {
    Options opts;
    opts.names = {"clang", "clang++", "gcc", "g++", "cc", "c++"};
    opts.directories = {"/usr/bin", "/usr/local/bin", "/opt/bin", "/opt/local/bin", "/bin"};
    opts.directory_globs = {"/usr/lib/llvm-*/bin", "/opt/llvm-*/bin", "/usr/local/llvm-*/bin"};
#ifdef __APPLE__
    for (const char* dir :
         {"/opt/homebrew/bin",
          "/usr/local/opt/llvm/bin",
          "/opt/homebrew/opt/llvm/bin",
          "/Library/Developer/CommandLineTools/usr/bin"})
    {
        opts.directories.emplace_back(dir);
    }
#endif
    opts.deep_scan_roots = {"/usr", "/usr/local", "/opt", "/home"};
    return opts;
}

vector<string> HostCandidateScanner::scan() {
    STACK_UNWINDING_MARK;

    CandidateList candidates;
    auto add_from_dir = [&](string_view dir) {
        auto prefix = with_trailing_slash(dir);
        for (const auto& name : options_.names) {
            candidates.add(concat_tostr(prefix, name));
        }
    };

    if (const char* path_env = getenv("PATH")) {
        for (auto dir : split(path_env, ':')) {
            add_from_dir(dir);
        }
    }

    vector<string> dirs = options_.directories;
    for (const auto& pattern : options_.directory_globs) {
        auto matched = expand_glob(pattern);
        dirs.insert(dirs.end(), matched.begin(), matched.end());
    }
    for (const auto& dir : dirs) {
        add_from_dir(dir);
        for (const auto& filename : list_directory(dir)) {
            if (is_versioned_name(filename, options_.names)) {
                candidates.add(concat_tostr(with_trailing_slash(dir), filename));
            }
        }
    }

#ifdef __APPLE__
    for (const char* tool : {"clang", "clang++"}) {
        try {
            auto out = runner_.run(
                {.argv = {"xcrun", "--find", tool}, .timeout = options_.locator_timeout}
            );
            if (out.success()) {
                candidates.add(string{trim(out.out)});
            }
        } catch (const std::exception& e) {
            debuglog("registry: xcrun failed: ", e.what());
        }
    }
#endif

    return std::move(candidates).into_vector();
}

vector<string> HostCandidateScanner::deep_scan() {
    STACK_UNWINDING_MARK;

    Command cmd{.argv = {"find"}, .timeout = options_.deep_scan_timeout};
    for (const auto& root : options_.deep_scan_roots) {
        if (is_directory(root)) {
            cmd.argv.emplace_back(root);
        }
    }
    if (cmd.argv.size() == 1) {
        return {};
    }

    cmd.argv.insert(cmd.argv.end(), {"-type", "f", "("});
    for (size_t i = 0; i < options_.names.size(); ++i) {
        if (i > 0) {
            cmd.argv.emplace_back("-o");
        }
        cmd.argv.insert(cmd.argv.end(), {"-name", options_.names[i]});
    }
    cmd.argv.emplace_back(")");

    stdlog("Searching the filesystem for compilers, this may take a while...");
    // find exits with non-zero on unreadable directories, the hits still count
    auto out = runner_.run(cmd);
    if (out.timed_out) {
        debuglog("registry: deep scan timed out, using partial results");
    }

    CandidateList candidates;
    size_t hits = 0;
    for (auto line : split(out.out, '\n')) {
        if (hits++ == options_.deep_scan_limit) {
            break;
        }
        candidates.add(string{trim(line)});
    }
    return std::move(candidates).into_vector();
}

} // namespace oirun::registry

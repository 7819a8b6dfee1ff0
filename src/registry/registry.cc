#include <algorithm>
#include <map>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/registry/registry.hh>
#include <oirun/registry/version_probe.hh>
#include <set>

using std::string;
using std::vector;

namespace {

std::chrono::system_clock::time_point truncate_to_millis(std::chrono::system_clock::time_point t
) noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(t);
}

} // namespace

namespace oirun::registry {

bool is_suitable(Kind kind, Language lang) noexcept {
    switch (lang) {
    case Language::C:
        return kind == Kind::CLANG or kind == Kind::GCC or kind == Kind::MSVC or
            kind == Kind::APPLE_CLANG;
    case Language::CPP:
        return kind == Kind::CLANGXX or kind == Kind::GXX or kind == Kind::MSVC or
            kind == Kind::APPLE_CLANG;
    case Language::PYTHON: return false;
    }
    return false;
}

bool Registry::is_fresh(const DetectionResult& res) const {
    if (res.cache_version != cache_schema_version) {
        debuglog("registry: cache schema ", res.cache_version, " is stale");
        return false;
    }
    auto age = options_.now() - res.cache_timestamp;
    if (age > options_.ttl or age < std::chrono::nanoseconds{0}) {
        debuglog("registry: cache record expired");
        return false;
    }
    return true;
}

DetectionResult Registry::detect(bool force_rescan) {
    STACK_UNWINDING_MARK;

    std::lock_guard lock{mutex_};
    if (not force_rescan) {
        if (cached_ and is_fresh(*cached_)) {
            debuglog("registry: in-memory cache hit");
            return *cached_;
        }
        if (auto persisted = store_.load(); persisted and is_fresh(*persisted)) {
            debuglog("registry: persisted cache hit");
            cached_ = std::move(persisted);
            return *cached_;
        }
    }

    auto res = scan();
    if (res.success) {
        try {
            store_.store(res);
        } catch (const std::exception& e) {
            // The in-memory cache still works
            errlog("Cannot persist compiler cache: ", e.what());
        }
        cached_ = res;
    }
    return res;
}

void Registry::clear_cache() {
    STACK_UNWINDING_MARK;

    std::lock_guard lock{mutex_};
    cached_.reset();
    store_.clear();
    debuglog("registry: cache cleared");
}

vector<CompilerDescriptor> Registry::filter_suitable(Language lang) {
    auto res = detect(false);
    vector<CompilerDescriptor> suitable;
    std::copy_if(
        res.compilers.begin(),
        res.compilers.end(),
        std::back_inserter(suitable),
        [lang](const CompilerDescriptor& desc) { return is_suitable(desc.kind, lang); }
    );
    return suitable;
}

std::optional<DetectionResult> Registry::probe_all(const vector<string>& paths) {
    vector<CompilerDescriptor> compilers;
    // (kind-version) => index in compilers
    std::map<string, size_t> by_kind_version;
    std::set<std::pair<string, string>> seen_real_paths; // (real path, kind-version)

    for (const auto& path : paths) {
        auto desc = probe_compiler(runner_, path, options_.probe_timeout);
        if (not desc) {
            continue;
        }

        auto key = concat_tostr(to_str(desc->kind), '-', desc->version);
        auto real = real_path(path).value_or(path);
        if (not seen_real_paths.emplace(real, key).second) {
            debuglog("registry: skipping duplicate ", path, " -> ", real);
            continue;
        }

        if (auto it = by_kind_version.find(key); it != by_kind_version.end()) {
            auto& existing = compilers[it->second];
            if (desc->priority_score <= existing.priority_score) {
                debuglog("registry: ", path, " loses to ", existing.path);
            } else {
                debuglog("registry: ", path, " replaces ", existing.path);
                existing = std::move(*desc);
            }
            continue;
        }

        by_kind_version.emplace(std::move(key), compilers.size());
        compilers.emplace_back(std::move(*desc));
    }

    if (compilers.empty()) {
        return std::nullopt;
    }
    DetectionResult res;
    res.compilers = std::move(compilers);
    return res;
}

DetectionResult Registry::scan() {
    STACK_UNWINDING_MARK;

    DetectionResult res;
    try {
        auto found = probe_all(scanner_.scan());
        if (not found) {
            debuglog("registry: nothing found, falling back to the deep scan");
            found = probe_all(scanner_.deep_scan());
        }
        if (found) {
            res = std::move(*found);
        }
    } catch (const std::exception& e) {
        ERRLOG_CATCH(e);
        res = {};
        res.success = false;
        res.errors = {e.what()};
        res.suggestions = {
            "Make sure C/C++ compilers are installed",
            "Check that compiler directories are in PATH",
            "Try running compiler setup command",
        };
        res.cache_timestamp = truncate_to_millis(options_.now());
        res.cache_version = cache_schema_version;
        return res;
    }

    std::sort(res.compilers.begin(), res.compilers.end(), ranks_before);
    if (not res.compilers.empty()) {
        res.recommended = res.compilers.front();
    }

    auto all_of_family = [&](Family family) {
        return not res.compilers.empty() and
            std::all_of(res.compilers.begin(), res.compilers.end(), [&](const auto& desc) {
                   return desc.family() == family;
               });
    };
    if (res.compilers.empty()) {
        res.suggestions = {
            "Install a C/C++ compiler (LLVM, GCC, or MSVC)",
            "Ensure compiler directories are in PATH",
            "Run the compiler setup command for automatic installation",
        };
    } else if (all_of_family(Family::MSVC_LIKE)) {
        res.suggestions = {"Consider installing LLVM/Clang for better cross-platform compatibility"
        };
    } else if (all_of_family(Family::GCC_LIKE)) {
        res.suggestions = {"Consider installing Clang for better standards compliance"};
    }

    res.success = true;
    res.cache_timestamp = truncate_to_millis(options_.now());
    res.cache_version = cache_schema_version;
    stdlog("Detected ", res.compilers.size(), " compiler(s)");
    return res;
}

} // namespace oirun::registry

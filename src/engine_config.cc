#include <cmath>
#include <cstdlib>
#include <limits>
#include <oirun/engine_config.hh>
#include <oirun/execution.hh>
#include <oirun/file_manip.hh>
#include <oirun/language.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/pipeline/compiler_invocation.hh>

using std::string;

namespace {

const char* const config_vars[] = {
    "backend",
    "time_limit",
    "memory_limit",
    "optimization",
    "cpp_standard",
    "c_standard",
    "memory_poll_interval_ms",
    "address_space_limit",
    "max_output_size",
    "min_free_disk_mb",
    "native_network",
    "compile_time_limit",
    "compile_memory_limit",
    "scratch_root",
    "cache_db",
    "python_interpreter",
    "container_image",
    "container_image.c",
    "container_image.cpp",
    "container_image.python",
    "container_kill_grace_ms",
    "container_auto_install",
    "daemon_ready_timeout",
    "daemon_poll_interval",
    "image_pull_attempts",
    "install_prefix",
    "release_feed_url",
    "release_download_base",
    "installer_timeout",
    "log_file",
};

template <class Duration>
constexpr uint64_t max_duration_count = static_cast<uint64_t>(
    std::chrono::duration_cast<Duration>(
        std::chrono::seconds{static_cast<int64_t>(oirun::max_time_limit_seconds)}
    )
        .count()
);

const ConfigFile::Variable* get_set(const ConfigFile& cf, std::string_view name) {
    const auto& var = cf[name];
    if (not var.is_set()) {
        return nullptr;
    }
    if (var.is_array()) {
        throw oirun::ConfigError(concat_tostr("config: ", name, " cannot be an array"));
    }
    return &var;
}

template <class T>
void load_num(
    const ConfigFile& cf,
    std::string_view name,
    T& dest,
    T min_val,
    T max_val = std::numeric_limits<T>::max()
) {
    auto* var = get_set(cf, name);
    if (not var) {
        return;
    }
    auto val = var->as<T>();
    if (not val or *val < min_val) {
        throw oirun::ConfigError(concat_tostr(
            "config: invalid value of ", name, ": `", var->as_string(), "` (expected a number >= ",
            min_val, ')'
        ));
    }
    if (*val > max_val) {
        throw oirun::ConfigError(concat_tostr(
            "config: invalid value of ", name, ": `", var->as_string(), "` (expected a number <= ",
            max_val, ')'
        ));
    }
    dest = *val;
}

template <class Duration>
void load_duration(const ConfigFile& cf, std::string_view name, Duration& dest, uint64_t min_val) {
    uint64_t count = static_cast<uint64_t>(dest.count());
    // Has to fit in std::chrono::nanoseconds
    load_num<uint64_t>(cf, name, count, min_val, max_duration_count<Duration>);
    dest = Duration{count};
}

void load_bool(const ConfigFile& cf, std::string_view name, bool& dest) {
    auto* var = get_set(cf, name);
    if (not var) {
        return;
    }
    auto val = to_lower(var->as_string());
    if (val == "1" or val == "on" or val == "true" or val == "yes") {
        dest = true;
    } else if (val == "0" or val == "off" or val == "false" or val == "no") {
        dest = false;
    } else {
        throw oirun::ConfigError(concat_tostr(
            "config: invalid value of ", name, ": `", var->as_string(), "` (expected true or false)"
        ));
    }
}

void load_str(const ConfigFile& cf, std::string_view name, string& dest) {
    if (auto* var = get_set(cf, name)) {
        if (var->as_string().empty()) {
            throw oirun::ConfigError(concat_tostr("config: ", name, " cannot be empty"));
        }
        dest = var->as_string();
    }
}

void load_str(const ConfigFile& cf, std::string_view name, std::optional<string>& dest) {
    string val;
    load_str(cf, name, val);
    if (not val.empty()) {
        dest = std::move(val);
    }
}

void load_path(const ConfigFile& cf, std::string_view name, string& dest) {
    load_str(cf, name, dest);
    dest = expand_home(dest);
}

} // namespace

namespace oirun {

EngineConfig EngineConfig::defaults() {
    STACK_UNWINDING_MARK;

    EngineConfig conf;
    conf.scratch_root = expand_home("~/.oi-code-tests/tmp");
    conf.cache_db = expand_home("~/.cache/oirun/state.db");
    conf.install_prefix = expand_home("~/.local/llvm");
    return conf;
}

EngineConfig EngineConfig::from_config_file(const ConfigFile& cf) {
    STACK_UNWINDING_MARK;

    auto conf = defaults();
    load_str(cf, "backend", conf.backend);
    if (conf.backend != "native" and conf.backend != "container") {
        throw ConfigError(concat_tostr(
            "config: invalid value of backend: `", conf.backend, "` (expected native or container)"
        ));
    }

    load_num(cf, "time_limit", conf.time_limit_seconds, 0.001, max_time_limit_seconds);
    if (not std::isfinite(conf.time_limit_seconds)) {
        throw ConfigError("config: time_limit has to be finite");
    }
    load_num<uint64_t>(cf, "memory_limit", conf.memory_limit_mb, 1, max_memory_limit_mb);
    load_str(cf, "optimization", conf.optimization);
    if (not pipeline::is_valid_optimization_level(conf.optimization)) {
        throw ConfigError(concat_tostr(
            "config: invalid value of optimization: `", conf.optimization, "` (expected O0, O1, O2, O3 or Os)"
        ));
    }
    load_str(cf, "cpp_standard", conf.cpp_standard);
    load_str(cf, "c_standard", conf.c_standard);

    load_duration(cf, "memory_poll_interval_ms", conf.memory_poll_interval, 1);
    load_bool(cf, "address_space_limit", conf.address_space_limit);
    load_num<uint64_t>(cf, "max_output_size", conf.max_output_size_mb, 1, max_memory_limit_mb);
    load_num<uint64_t>(cf, "min_free_disk_mb", conf.min_free_disk_mb, 0, max_memory_limit_mb);
    load_bool(cf, "native_network", conf.native_network);
    load_duration(cf, "compile_time_limit", conf.compile_time_limit, 0);
    load_num<uint64_t>(
        cf, "compile_memory_limit", conf.compile_memory_limit_mb, 0, max_memory_limit_mb
    );

    load_path(cf, "scratch_root", conf.scratch_root);
    load_path(cf, "cache_db", conf.cache_db);
    load_str(cf, "python_interpreter", conf.python_interpreter);

    load_str(cf, "container_image", conf.container_image);
    load_str(cf, "container_image.c", conf.container_image_c);
    load_str(cf, "container_image.cpp", conf.container_image_cpp);
    load_str(cf, "container_image.python", conf.container_image_python);
    load_duration(cf, "container_kill_grace_ms", conf.container_kill_grace, 0);
    load_bool(cf, "container_auto_install", conf.container_auto_install);
    load_duration(cf, "daemon_ready_timeout", conf.daemon_ready_timeout, 1);
    load_duration(cf, "daemon_poll_interval", conf.daemon_poll_interval, 1);
    load_num(cf, "image_pull_attempts", conf.image_pull_attempts, 1);

    load_path(cf, "install_prefix", conf.install_prefix);
    load_str(cf, "release_feed_url", conf.release_feed_url);
    load_str(cf, "release_download_base", conf.release_download_base);
    load_duration(cf, "installer_timeout", conf.installer_timeout, 1);

    string log_file;
    load_path(cf, "log_file", log_file);
    if (not log_file.empty()) {
        conf.log_file = std::move(log_file);
    }
    return conf;
}

EngineConfig EngineConfig::load(const string& path) {
    STACK_UNWINDING_MARK;

    ConfigFile cf;
    for (const char* name : config_vars) {
        cf.add_vars(name);
    }
    cf.load_config_from_file(path);
    return from_config_file(cf);
}

std::optional<string> locate_config_file(std::string_view explicit_path) {
    STACK_UNWINDING_MARK;

    if (not explicit_path.empty()) {
        return expand_home(explicit_path);
    }
    if (const char* env = std::getenv("OIRUN_CONFIG"); env and *env != '\0') { // NOLINT(concurrency-mt-unsafe)
        return expand_home(env);
    }

    string path;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg and *xdg != '\0') { // NOLINT(concurrency-mt-unsafe)
        path = concat_tostr(xdg, "/oirun/oirun.conf");
    } else {
        path = concat_tostr(home_dir(), "/.config/oirun/oirun.conf");
    }
    if (is_regular_file(path)) {
        return path;
    }
    return std::nullopt;
}

} // namespace oirun

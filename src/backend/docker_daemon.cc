#include <algorithm>
#include <cstdlib>
#include <oirun/backend/backend.hh>
#include <oirun/backend/docker_daemon.hh>
#include <oirun/call_in_destructor.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/string_transform.hh>
#include <pwd.h>
#include <thread>
#include <unistd.h>

using std::string;
using std::string_view;
using std::vector;

namespace {

string_view unquote(string_view val) noexcept {
    if (val.size() >= 2 and (val.front() == '"' or val.front() == '\'') and
        val.back() == val.front())
    {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

string current_user() {
    if (const char* user = getenv("USER"); user and *user) {
        return user;
    }
    if (const passwd* pw = getpwuid(getuid())) {
        return pw->pw_name;
    }
    return {};
}

string join(const vector<string>& argv) {
    string res;
    for (const auto& arg : argv) {
        back_insert(res, (res.empty() ? "" : " "), arg);
    }
    return res;
}

} // namespace

namespace oirun::backend {

string os_release_id(string_view os_release_contents) {
    string id;
    vector<string> id_like;
    for (auto line : split(os_release_contents, '\n')) {
        line = trim(line);
        if (has_prefix(line, "ID=")) {
            id = to_lower(unquote(line.substr(3)));
        } else if (has_prefix(line, "ID_LIKE=")) {
            for (auto like : split(unquote(line.substr(8)), ' ')) {
                id_like.emplace_back(to_lower(like));
            }
        }
    }

    if (not docker_install_commands(id).empty()) {
        return id;
    }
    for (const auto& like : id_like) {
        if (not docker_install_commands(like).empty()) {
            return like;
        }
    }
    return id;
}

vector<vector<string>> docker_install_commands(string_view id) {
#ifdef __APPLE__
    (void)id;
    return {{"brew", "install", "--cask", "docker"}};
#else
    if (id == "ubuntu" or id == "debian") {
        return {
            {"sudo", "-n", "apt-get", "update"},
            {"sudo", "-n", "apt-get", "install", "-y", "docker.io"},
        };
    }
    if (id == "arch" or id == "manjaro") {
        return {{"sudo", "-n", "pacman", "-Syu", "--noconfirm", "docker"}};
    }
    if (id == "fedora") {
        return {
            {"sudo", "-n", "dnf", "install", "-y", "dnf-plugins-core"},
            {"sudo",
             "-n",
             "dnf",
             "config-manager",
             "--add-repo",
             "https://download.docker.com/linux/fedora/docker-ce.repo"},
            {"sudo", "-n", "dnf", "install", "-y", "docker-ce", "docker-ce-cli", "containerd.io"},
        };
    }
    return {};
#endif
}

vector<vector<string>> docker_start_commands() {
#ifdef __APPLE__
    return {{"open", "-a", "Docker"}};
#else
    return {
        {"sudo", "-n", "systemctl", "enable", "docker"},
        {"sudo", "-n", "systemctl", "start", "docker"},
    };
#endif
}

DockerDaemon::DockerDaemon(CommandRunner& runner, DockerDaemonOptions options)
: runner_(runner)
, options_(std::move(options)) {}

void DockerDaemon::sleep(std::chrono::nanoseconds duration) {
    if (options_.sleep) {
        options_.sleep(duration);
    } else {
        std::this_thread::sleep_for(duration);
    }
}

CommandOutput DockerDaemon::run(vector<string> argv, std::chrono::nanoseconds timeout) {
    return runner_.run({.argv = std::move(argv), .timeout = timeout});
}

void DockerDaemon::ensure_ready() {
    STACK_UNWINDING_MARK;

    std::lock_guard lock{ready_mutex_};
    if (ready_) {
        return;
    }

    bool client_missing = false;
    string reason;
    try {
        auto info = run({"docker", "info"}, options_.command_timeout);
        if (info.success()) {
            debuglog("docker: daemon is reachable");
            ready_ = true;
            return;
        }
        reason = string{trim(info.err)};
    } catch (const std::exception& e) {
        client_missing = true;
        reason = e.what();
    }
    debuglog("docker: daemon is not reachable: ", reason);

    if (not options_.auto_install) {
        throw BackendError(concat_tostr(
            "Docker daemon is not reachable (", reason, "). Start it or use the native backend."
        ));
    }

    vector<string> steps;
    install_and_start(client_missing, steps);
    if (not wait_until_ready(steps)) {
        string msg = "Docker daemon is not available. Steps attempted:";
        for (const auto& step : steps) {
            back_insert(msg, "\n  - ", step);
        }
        throw BackendError(msg);
    }
    ready_ = true;
}

void DockerDaemon::install_and_start(bool client_missing, vector<string>& steps) {
    STACK_UNWINDING_MARK;

    vector<vector<string>> commands;
    if (client_missing) {
        string id;
        try {
            id = os_release_id(get_file_contents(options_.os_release_path));
        } catch (const std::exception& e) {
            debuglog("docker: cannot read ", options_.os_release_path, ": ", e.what());
        }
        commands = docker_install_commands(id);
        if (commands.empty()) {
            steps.emplace_back(concat_tostr(
                "no automatic installation for '",
                id,
                "', see https://docs.docker.com/engine/install/"
            ));
        }
    }
    auto start = docker_start_commands();
    commands.insert(commands.end(), start.begin(), start.end());

    stdlog("Docker is not running, trying to ", (client_missing ? "install and " : ""), "start it");
    for (const auto& argv : commands) {
        auto step = join(argv);
        try {
            auto out = run(argv, options_.install_timeout);
            if (out.success()) {
                steps.emplace_back(concat_tostr(step, ": ok"));
            } else {
                steps.emplace_back(concat_tostr(
                    step,
                    ": ",
                    (out.timed_out ? string{"timed out"}
                                   : concat_tostr("exited with ", out.exit_code)),
                    (out.err.empty() ? "" : " - "),
                    trim(out.err)
                ));
            }
        } catch (const std::exception& e) {
            steps.emplace_back(concat_tostr(step, ": ", e.what()));
        }
        debuglog("docker: ", steps.back());
    }
}

bool DockerDaemon::wait_until_ready(vector<string>& steps) {
    STACK_UNWINDING_MARK;

    auto attempts =
        std::max<int64_t>(1, options_.ready_timeout.count() / options_.poll_interval.count());
    bool tried_usermod = false;
    for (int64_t attempt = 1; attempt <= attempts; ++attempt) {
        string last_error;
        try {
            auto ps = run({"docker", "ps"}, options_.command_timeout);
            if (ps.success()) {
                debuglog("docker: ready after ", attempt, " readiness check(s)");
                return true;
            }
            last_error = string{trim(ps.err)};
        } catch (const std::exception& e) {
            last_error = e.what();
        }
        debuglog("docker: readiness check #", attempt, " failed: ", last_error);

        if (not tried_usermod and contains_ignoring_case(last_error, "permission denied")) {
            tried_usermod = true;
            auto user = current_user();
            if (not user.empty()) {
                try {
                    auto out = run(
                        {"sudo", "-n", "usermod", "-aG", "docker", user}, options_.command_timeout
                    );
                    steps.emplace_back(concat_tostr(
                        "sudo -n usermod -aG docker ",
                        user,
                        (out.success() ? ": ok (takes effect in the next session)" : ": failed")
                    ));
                } catch (const std::exception& e) {
                    steps.emplace_back(concat_tostr("sudo -n usermod -aG docker: ", e.what()));
                }
            }
        }

        if (attempt < attempts) {
            sleep(options_.poll_interval);
        } else {
            steps.emplace_back(concat_tostr(
                "docker ps: not ready after ", attempts, " check(s), last error: ", last_error
            ));
        }
    }
    return false;
}

bool DockerDaemon::image_present(const string& image) {
    auto out = run({"docker", "images", "-q", image}, options_.command_timeout);
    return out.success() and not trim(out.out).empty();
}

void DockerDaemon::pull(const string& image) {
    STACK_UNWINDING_MARK;

    if (image_present(image)) {
        return;
    }

    stdlog("Pulling docker image ", image, "...");
    auto backoff = options_.first_pull_backoff;
    string last_error;
    for (int attempt = 1; attempt <= options_.image_pull_attempts; ++attempt) {
        auto out = run({"docker", "pull", image}, options_.pull_timeout);
        if (out.success() and image_present(image)) {
            stdlog("Pulled docker image ", image);
            return;
        }
        last_error = (out.timed_out ? string{"timed out"} : string{trim(out.err)});
        debuglog("docker: pull #", attempt, " of ", image, " failed: ", last_error);
        if (attempt < options_.image_pull_attempts) {
            sleep(backoff);
            backoff *= 2;
        }
    }

    throw BackendError(concat_tostr(
        "Image '",
        image,
        "' is not available locally and could not be pulled: ",
        last_error,
        "\nCheck the network connection and that the image exists: docker pull ",
        image
    ));
}

void DockerDaemon::ensure_image(const string& image) {
    STACK_UNWINDING_MARK;

    {
        std::unique_lock lock{images_mutex_};
        images_cv_.wait(lock, [&] { return pulls_in_progress_.count(image) == 0; });
        if (present_images_.count(image)) {
            return;
        }
        pulls_in_progress_.emplace(image);
    }

    CallInDtor finish_pull{[&] {
        {
            std::lock_guard lock{images_mutex_};
            pulls_in_progress_.erase(image);
        }
        images_cv_.notify_all();
    }};

    pull(image);
    std::lock_guard lock{images_mutex_};
    present_images_.emplace(image);
}

} // namespace oirun::backend

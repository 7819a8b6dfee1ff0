#include <cerrno>
#include <exception>
#include <oirun/errmsg.hh>
#include <oirun/file_manip.hh>
#include <oirun/installer/installer.hh>
#include <oirun/logger.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/sha.hh>
#include <oirun/string_transform.hh>
#include <oirun/temporary_directory.hh>
#include <unistd.h>

using std::string;

namespace oirun::installer {

string manual_guide(Platform platform) {
    switch (platform) {
    case Platform::LINUX:
        return R"GUIDE(# Linux LLVM Installation Guide

## Debian/Ubuntu
```bash
sudo apt update
sudo apt install clang lld
```

## Fedora
```bash
sudo dnf install clang lld
```

## Arch Linux
```bash
sudo pacman -S clang lld
```

## openSUSE
```bash
sudo zypper install clang lld
```

## Prebuilt archive
Download `clang+llvm-<version>-x86_64-linux-gnu-ubuntu-22.04.tar.xz` from
https://github.com/llvm/llvm-project/releases, verify it against the
published `.sha256` file, unpack it and add its `bin` directory to PATH.

After installation, run `oirun detect --rescan`.
)GUIDE";
    case Platform::MACOS:
        return R"GUIDE(# macOS LLVM Installation Guide

## Homebrew (recommended)
```bash
/bin/bash -c "$(curl -fsSL https://raw.githubusercontent.com/Homebrew/install/HEAD/install.sh)"
brew install llvm
```

## MacPorts
```bash
sudo port install clang
```

## Xcode Command Line Tools
```bash
xcode-select --install
```

After installation, add LLVM to your PATH:
```bash
echo 'export PATH="/usr/local/opt/llvm/bin:$PATH"' >> ~/.zshrc
source ~/.zshrc
```
)GUIDE";
    case Platform::WINDOWS:
        return R"GUIDE(# Windows LLVM Installation Guide

## Installer (recommended)
1. Visit https://github.com/llvm/llvm-project/releases
2. Download `LLVM-<version>-win64.exe`
3. Run the installer with default settings
4. Add LLVM to your PATH if not already done

## Winget
```powershell
winget install LLVM.LLVM
```

## Chocolatey
```powershell
choco install llvm
```
)GUIDE";
    }
    return "Please visit https://llvm.org/docs/GettingStarted.html\n";
}

InstallOutcome manual_outcome(Platform platform, std::optional<string> failure_reason) {
    InstallOutcome res;
    res.success = false;
    res.message =
        (failure_reason ? concat_tostr("Automatic installation failed: ", *failure_reason)
                        : string{"Follow the guide to install the toolchain manually"});
    res.next_steps = {"Follow the installation steps", "Restart after installation"};
    res.guide = manual_guide(platform);
    return res;
}

Result<void, string> verify_artifact(const string& artifact_path, const string& checksum_path) {
    STACK_UNWINDING_MARK;

    std::optional<string> expected;
    string actual;
    try {
        expected = parse_checksum_file(get_file_contents(checksum_path));
        actual = sha256_file(artifact_path);
    } catch (const std::exception& e) {
        return Err{concat_tostr("Cannot verify ", artifact_path, ": ", e.what())};
    }

    if (expected == actual) {
        debuglog("installer: checksum of ", artifact_path, " matches");
        return Ok{};
    }
    if (unlink(artifact_path.c_str()) == -1 and errno != ENOENT) {
        errlog("unlink(", artifact_path, ')', errmsg());
    }
    if (not expected) {
        return Err{concat_tostr("Malformed checksum file ", path_filename(checksum_path))};
    }
    return Err{concat_tostr(
        "Checksum mismatch for ",
        path_filename(artifact_path),
        ": expected ",
        *expected,
        ", got ",
        actual,
        ". The file was deleted."
    )};
}

Installer::Installer(CommandRunner& runner, Downloader& downloader, InstallerOptions options)
: runner_(runner)
, downloader_(downloader)
, options_(std::move(options)) {
    while (has_suffix(options_.install_prefix, "/") and options_.install_prefix.size() > 1) {
        options_.install_prefix.pop_back();
    }
}

bool Installer::is_installed() const {
    switch (options_.platform) {
    case Platform::LINUX:
        return is_executable_file(concat_tostr(options_.install_prefix, "/bin/clang"));
    case Platform::MACOS:
        return is_executable_file("/opt/homebrew/opt/llvm/bin/clang") or
            is_executable_file("/usr/local/opt/llvm/bin/clang");
    case Platform::WINDOWS: return is_regular_file("C:\\LLVM\\bin\\clang.exe");
    }
    return false;
}

Result<string, string> Installer::latest_version() {
    STACK_UNWINDING_MARK;

    TemporaryDirectory tmp_dir;
    string feed_path;
    string feed;
    try {
        tmp_dir = TemporaryDirectory{concat_tostr(options_.download_dir, "/feed-XXXXXX")};
        feed_path = concat_tostr(tmp_dir.path(), "release.json");
    } catch (const std::exception& e) {
        return Err{concat_tostr("Cannot create a download directory: ", e.what())};
    }

    auto dl = downloader_.download(options_.release_feed_url, feed_path);
    if (dl.is_err()) {
        return Err{std::move(dl).unwrap_err()};
    }
    try {
        feed = get_file_contents(feed_path);
    } catch (const std::exception& e) {
        return Err{concat_tostr("Cannot read the release feed: ", e.what())};
    }

    auto version = parse_latest_version(feed);
    if (not version) {
        return Err{concat_tostr("Malformed release feed at ", options_.release_feed_url)};
    }
    debuglog("installer: latest release is ", *version);
    return Ok{std::move(*version)};
}

Result<void, string> Installer::run_step(std::string_view what, Command cmd) {
    STACK_UNWINDING_MARK;

    debuglog("installer: ", what);
    cmd.timeout = options_.installer_timeout;
    CommandOutput out;
    try {
        out = runner_.run(cmd);
    } catch (const std::exception& e) {
        return Err{concat_tostr(what, " failed: ", e.what())};
    }
    if (out.timed_out) {
        return Err{concat_tostr(
            what,
            " timed out after ",
            std::chrono::duration_cast<std::chrono::seconds>(options_.installer_timeout).count(),
            " s"
        )};
    }
    if (not out.success()) {
        return Err{concat_tostr(what, " failed with exit code ", out.exit_code, ": ", trim(out.err))};
    }
    return Ok{};
}

Result<string, string>
Installer::fetch_artifact(const Artifact& artifact, const string& dir) {
    STACK_UNWINDING_MARK;

    auto artifact_path = concat_tostr(dir, artifact.file_name);
    auto checksum_path = concat_tostr(artifact_path, ".sha256");

    stdlog("Downloading ", artifact.url);
    if (auto res = downloader_.download(artifact.url, artifact_path); res.is_err()) {
        return Err{std::move(res).unwrap_err()};
    }
    if (auto res = downloader_.download(artifact.checksum_url, checksum_path); res.is_err()) {
        return Err{std::move(res).unwrap_err()};
    }
    if (auto res = verify_artifact(artifact_path, checksum_path); res.is_err()) {
        return Err{std::move(res).unwrap_err()};
    }
    return Ok{std::move(artifact_path)};
}

Result<InstallOutcome, string> Installer::install_artifact(const Artifact& artifact) {
    STACK_UNWINDING_MARK;

    TemporaryDirectory tmp_dir;
    try {
        if (mkdir_r(options_.download_dir, 0700) == -1) {
            return Err{concat_tostr("mkdir_r(", options_.download_dir, ')', errmsg())};
        }
        tmp_dir = TemporaryDirectory{concat_tostr(options_.download_dir, "/install-XXXXXX")};
    } catch (const std::exception& e) {
        return Err{concat_tostr("Cannot create a download directory: ", e.what())};
    }

    auto fetched = fetch_artifact(artifact, tmp_dir.path());
    if (fetched.is_err()) {
        return Err{std::move(fetched).unwrap_err()};
    }
    auto artifact_path = std::move(fetched).unwrap();

    InstallOutcome res;
    res.success = true;
    res.restart_required = true;
    if (artifact.silent_install_args.empty()) {
        if (mkdir_r(options_.install_prefix, 0755) == -1) {
            return Err{concat_tostr("mkdir_r(", options_.install_prefix, ')', errmsg())};
        }
        auto step = run_step(
            "Unpacking the toolchain",
            Command{
                .argv = {"tar", "-xJf", artifact_path, "-C", options_.install_prefix,
                         "--strip-components=1"},
            }
        );
        if (step.is_err()) {
            return Err{std::move(step).unwrap_err()};
        }
        auto bin_dir = concat_tostr(options_.install_prefix, "/bin");
        res.message = concat_tostr("LLVM has been installed into ", options_.install_prefix);
        res.next_steps = {
            concat_tostr("Add to PATH: export PATH=\"", bin_dir, ":$PATH\""),
            "Restart your shell and run: oirun detect --rescan",
        };
    } else {
        Command cmd{.argv = {artifact_path}};
        cmd.argv.insert(
            cmd.argv.end(), artifact.silent_install_args.begin(), artifact.silent_install_args.end()
        );
        if (auto step = run_step("Running the toolchain installer", std::move(cmd)); step.is_err()) {
            return Err{std::move(step).unwrap_err()};
        }
        res.message = "LLVM has been installed into C:\\LLVM";
        res.next_steps = {
            "Add C:\\LLVM\\bin to PATH if not already added",
            "Restart and run: oirun detect --rescan",
        };
    }
    return Ok{std::move(res)};
}

Result<InstallOutcome, string> Installer::install_with_homebrew() {
    STACK_UNWINDING_MARK;

    if (not find_executable_in_path("brew")) {
        return Err{string{"Homebrew is not installed"}};
    }
    auto step = run_step("Installing LLVM with Homebrew", Command{.argv = {"brew", "install", "llvm"}});
    if (step.is_err()) {
        return Err{std::move(step).unwrap_err()};
    }
    InstallOutcome res;
    res.success = true;
    res.restart_required = true;
    res.message = "LLVM has been installed with Homebrew";
    res.next_steps = {
        R"(Run: echo 'export PATH="/opt/homebrew/opt/llvm/bin:$PATH"' >> ~/.zshrc)",
        "Restart your shell and run: oirun detect --rescan",
    };
    return Ok{std::move(res)};
}

Result<InstallOutcome, string> Installer::install_automatically() {
    STACK_UNWINDING_MARK;

    if (is_installed()) {
        InstallOutcome res;
        res.success = true;
        res.message = "LLVM is already installed";
        if (options_.platform == Platform::LINUX) {
            res.next_steps = {concat_tostr(
                "Add to PATH if not already added: export PATH=\"",
                options_.install_prefix,
                "/bin:$PATH\""
            )};
        }
        return Ok{std::move(res)};
    }

    if (options_.platform == Platform::MACOS) {
        return install_with_homebrew();
    }

    auto version = latest_version();
    if (version.is_err()) {
        return Err{std::move(version).unwrap_err()};
    }
    auto artifact = release_artifact(
        options_.platform, version.ok(), options_.release_download_base
    );
    if (not artifact) {
        return Err{concat_tostr("No prebuilt toolchain for ", to_str(options_.platform))};
    }
    return install_artifact(*artifact);
}

InstallOutcome Installer::install(InstallMode mode) {
    STACK_UNWINDING_MARK;

    if (mode == InstallMode::MANUAL) {
        return manual_outcome(options_.platform, std::nullopt);
    }

    auto res = install_automatically();
    if (res.is_err()) {
        auto reason = std::move(res).unwrap_err();
        errlog("Toolchain installation failed: ", reason);
        return manual_outcome(options_.platform, std::move(reason));
    }
    auto outcome = std::move(res).unwrap();
    stdlog(outcome.message);
    return outcome;
}

} // namespace oirun::installer

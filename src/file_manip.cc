#include <array>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <dirent.h>
#include <oirun/errmsg.hh>
#include <oirun/file_descriptor.hh>
#include <oirun/file_manip.hh>
#include <oirun/macros/stack_unwinding.hh>
#include <oirun/macros/throw.hh>
#include <oirun/string_transform.hh>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

using std::string;

int mkdir_r(string path, mode_t mode) noexcept {
    if (path.size() >= PATH_MAX) {
        errno = ENAMETOOLONG;
        return -1;
    }

    if (path.empty() or path.back() != '/') {
        path += '/';
    }

    size_t end = 1; // A leading slash is skipped
    while (end < path.size()) {
        while (path[end] != '/') {
            ++end;
        }

        path[end] = '\0';
        if (mkdir(path.data(), mode) == -1 and errno != EEXIST) {
            return -1;
        }

        path[end++] = '/';
    }

    return 0;
}

namespace {

int remove_at(int dirfd, const char* path) noexcept {
    int fd = openat(dirfd, path, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (fd == -1) {
        return unlinkat(dirfd, path, 0);
    }

    DIR* dir = fdopendir(fd);
    if (dir == nullptr) {
        int ec = errno;
        (void)close(fd);
        errno = ec;
        return -1;
    }

    int rc = 0;
    int ec = 0;
    for (;;) {
        errno = 0;
        dirent* file = readdir(dir);
        if (file == nullptr) {
            if (errno != 0) {
                ec = errno;
                rc = -1;
            }
            break;
        }

        std::string_view name = file->d_name;
        if (name == "." or name == "..") {
            continue;
        }

        if (file->d_type == DT_DIR or file->d_type == DT_UNKNOWN) {
            rc = remove_at(fd, file->d_name);
        } else {
            rc = unlinkat(fd, file->d_name, 0);
        }
        if (rc == -1) {
            ec = errno;
            break;
        }
    }

    (void)closedir(dir);
    if (rc == -1) {
        errno = ec;
        return -1;
    }

    return unlinkat(dirfd, path, AT_REMOVEDIR);
}

} // namespace

int remove_r(const string& path) noexcept { return remove_at(AT_FDCWD, path.c_str()); }

bool path_exists(const string& path) noexcept {
    struct stat64 st = {};
    return stat64(path.c_str(), &st) == 0;
}

bool is_directory(const string& path) noexcept {
    struct stat64 st = {};
    return (stat64(path.c_str(), &st) == 0 and S_ISDIR(st.st_mode));
}

bool is_regular_file(const string& path) noexcept {
    struct stat64 st = {};
    return (stat64(path.c_str(), &st) == 0 and S_ISREG(st.st_mode));
}

bool is_executable_file(const string& path) noexcept {
    return (is_regular_file(path) and access(path.c_str(), X_OK) == 0);
}

size_t write_all(int fd, const void* buff, size_t len) noexcept {
    const auto* data = static_cast<const char*>(buff);
    size_t pos = 0;
    while (pos < len) {
        ssize_t rc = write(fd, data + pos, len - pos);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        pos += rc;
    }
    return pos;
}

string get_file_contents(int fd) {
    string res;
    std::array<char, 65536> buff{};
    for (;;) {
        ssize_t rc = read(fd, buff.data(), buff.size());
        if (rc == 0) {
            return res;
        }
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read()", errmsg());
        }
        res.append(buff.data(), rc);
    }
}

string get_file_contents(const string& path) {
    STACK_UNWINDING_MARK;

    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    return get_file_contents(fd);
}

void put_file_contents(const string& path, std::string_view data, mode_t mode) {
    STACK_UNWINDING_MARK;

    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (not fd.is_open()) {
        THROW("open('", path, "')", errmsg());
    }
    if (write_all(fd, data) != data.size()) {
        THROW("write('", path, "')", errmsg());
    }
    if (fd.close()) {
        THROW("close('", path, "')", errmsg());
    }
}

void copy_file(const string& src, const string& dest, mode_t mode) {
    STACK_UNWINDING_MARK;
    put_file_contents(dest, get_file_contents(src), mode);
}

FileDescriptor open_staging_file(std::string_view contents) {
    STACK_UNWINDING_MARK;

    FileDescriptor fd{"/tmp", O_TMPFILE | O_RDWR | O_EXCL, S_IRUSR | S_IWUSR};
    if (not fd.is_open()) {
        // O_TMPFILE is not supported on every filesystem
        std::array<char, 32> templ{"/tmp/oirun.XXXXXX"};
        fd.reset(mkostemp(templ.data(), O_CLOEXEC));
        if (not fd.is_open()) {
            THROW("mkostemp()", errmsg());
        }
        (void)unlink(templ.data());
    }

    if (write_all(fd, contents) != contents.size()) {
        THROW("write()", errmsg());
    }
    if (fd.rewind()) {
        THROW("lseek()", errmsg());
    }
    return fd;
}

string read_whole_file(FileDescriptor& fd) {
    if (fd.rewind()) {
        THROW("lseek()", errmsg());
    }
    return get_file_contents(fd);
}

string home_dir() {
    if (const char* home = getenv("HOME"); home and *home != '\0') {
        return home;
    }

    struct passwd pwd = {};
    struct passwd* result = nullptr;
    std::array<char, 4096> buff{};
    if (getpwuid_r(getuid(), &pwd, buff.data(), buff.size(), &result) != 0 or
        result == nullptr)
    {
        THROW("cannot determine home directory");
    }
    return pwd.pw_dir;
}

string expand_home(std::string_view path) {
    if (path == "~") {
        return home_dir();
    }
    if (has_prefix(path, "~/")) {
        return concat_tostr(home_dir(), path.substr(1));
    }
    return string(path);
}

std::string_view path_dirpath(std::string_view path) noexcept {
    auto pos = path.rfind('/');
    return (pos == std::string_view::npos ? std::string_view{} : path.substr(0, pos + 1));
}

std::string_view path_filename(std::string_view path) noexcept {
    auto pos = path.rfind('/');
    return (pos == std::string_view::npos ? path : path.substr(pos + 1));
}

std::string_view path_extension(std::string_view path) noexcept {
    auto filename = path_filename(path);
    auto pos = filename.rfind('.');
    return (pos == std::string_view::npos ? std::string_view{} : filename.substr(pos + 1));
}

std::optional<string> real_path(const string& path) {
    std::array<char, PATH_MAX> buff{};
    if (realpath(path.c_str(), buff.data()) == nullptr) {
        return std::nullopt;
    }
    return string(buff.data());
}

std::optional<string> find_executable_in_path(std::string_view name) {
    const char* path_env = getenv("PATH");
    if (path_env == nullptr) {
        return std::nullopt;
    }

    for (auto dir : split(path_env, ':')) {
        auto candidate = concat_tostr(dir, (has_suffix(dir, "/") ? "" : "/"), name);
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

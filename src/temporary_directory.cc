#include <cstdlib>
#include <oirun/errmsg.hh>
#include <oirun/file_manip.hh>
#include <oirun/logger.hh>
#include <oirun/macros/throw.hh>
#include <oirun/string_transform.hh>
#include <oirun/temporary_directory.hh>
#include <vector>

TemporaryDirectory::TemporaryDirectory(const std::string& templ) {
    if (not has_suffix(templ, "XXXXXX")) {
        THROW("invalid temporary directory template: ", templ);
    }

    auto parent = std::string(path_dirpath(templ));
    if (not parent.empty() and mkdir_r(parent, 0700) == -1) {
        THROW("mkdir_r('", parent, "')", errmsg());
    }

    std::vector<char> name(templ.begin(), templ.end());
    name.push_back('\0');
    // Creates the directory with mode 0700
    if (mkdtemp(name.data()) == nullptr) {
        THROW("mkdtemp('", templ, "')", errmsg());
    }

    auto abs_path = real_path(name.data());
    if (not abs_path) {
        int errnum = errno;
        (void)remove_r(name.data());
        THROW("realpath('", name.data(), "')", errmsg(errnum));
    }
    path_ = std::move(*abs_path);
    path_ += '/';
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    remove();
    path_ = std::exchange(td.path_, {});
    return *this;
}

void TemporaryDirectory::remove() {
    if (exists()) {
        if (remove_r(path_) == -1 and errno != ENOENT) {
            THROW("remove_r('", path_, "')", errmsg());
        }
        path_.clear();
    }
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() and remove_r(path_) == -1 and errno != ENOENT) {
        // Throwing from the destructor is not an option
        errlog("Error: remove_r('", path_, "')", errmsg());
    }
}

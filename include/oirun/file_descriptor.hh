#pragma once

#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

// Owns a file descriptor. Every descriptor opened through it is close-on-exec,
// spawned processes get only the ones dup2()-ed into place.
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() noexcept = default;

    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    FileDescriptor(const std::string& path, int flags, mode_t mode = 0644) noexcept
    : fd_(::open(path.c_str(), flags | O_CLOEXEC, mode)) {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(other.release()) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~FileDescriptor() { reset(-1); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept = delete;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    [[nodiscard]] int release() noexcept {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd) noexcept {
        if (fd_ >= 0) {
            (void)::close(fd_);
        }
        fd_ = fd;
    }

    // Moves the offset back to the start, returns -1 on error
    int rewind() noexcept { return (::lseek(fd_, 0, SEEK_SET) == -1 ? -1 : 0); }

    // Returns the result of close(2), 0 if nothing was open
    [[nodiscard]] int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }
};

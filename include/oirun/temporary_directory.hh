#pragma once

#include <string>
#include <utility>

class TemporaryDirectory {
    std::string path_; // absolute path with trailing '/', empty if nothing is held

public:
    TemporaryDirectory() = default; // Does NOT create a temporary directory

    // @p templ has to end with "XXXXXX", missing parent directories are created
    explicit TemporaryDirectory(const std::string& templ);

    TemporaryDirectory(const TemporaryDirectory&) = delete;

    TemporaryDirectory(TemporaryDirectory&& td) noexcept : path_(std::exchange(td.path_, {})) {}

    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
    // NOLINTNEXTLINE(performance-noexcept-move-constructor)
    TemporaryDirectory& operator=(TemporaryDirectory&& td);

    // Removes the directory now, throws on failure
    void remove();

    ~TemporaryDirectory();

    // Returns true if object holds a real temporary directory
    [[nodiscard]] bool exists() const noexcept { return not path_.empty(); }

    // Directory absolute path with trailing '/'
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};

#pragma once

#include <fcntl.h>
#include <oirun/file_descriptor.hh>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

/**
 * @brief Creates directory @p path together with its missing parents
 *
 * @return 0 on success, -1 on error (errno is set by mkdir(2))
 */
int mkdir_r(std::string path, mode_t mode = 0755) noexcept;

/**
 * @brief Removes @p path recursively (does not follow symlinks)
 *
 * @return 0 on success, -1 on error (errno is set by the failing call)
 */
int remove_r(const std::string& path) noexcept;

[[nodiscard]] bool path_exists(const std::string& path) noexcept;

[[nodiscard]] bool is_directory(const std::string& path) noexcept;

[[nodiscard]] bool is_regular_file(const std::string& path) noexcept;

[[nodiscard]] bool is_executable_file(const std::string& path) noexcept;

// Writes exactly @p len bytes unless an error occurs, returns number of bytes written
size_t write_all(int fd, const void* buff, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads everything from @p fd starting at its current offset. Throws on error
std::string get_file_contents(int fd);

// Throws on error
std::string get_file_contents(const std::string& path);

// Creates or truncates @p path and writes @p data to it. Throws on error
void put_file_contents(const std::string& path, std::string_view data, mode_t mode = 0644);

// Copies a regular file. Throws on error
void copy_file(const std::string& src, const std::string& dest, mode_t mode = 0644);

/**
 * @brief Opens an unnamed read-write file in /tmp holding @p contents
 * @details The offset is left at the beginning, so the file can serve as the
 *   standard input of a child process. Throws on error.
 */
FileDescriptor open_staging_file(std::string_view contents = {});

// Reads the whole file behind @p fd whatever its offset is. Throws on error
std::string read_whole_file(FileDescriptor& fd);

// Returns $HOME or the home directory from the password database
std::string home_dir();

// Replaces leading "~/" with the home directory
std::string expand_home(std::string_view path);

// "a/b/c.cpp" -> "a/b/", "c.cpp" -> ""
std::string_view path_dirpath(std::string_view path) noexcept;

// "a/b/c.cpp" -> "c.cpp"
std::string_view path_filename(std::string_view path) noexcept;

// "a/b/c.cpp" -> "cpp", "a/b/c" -> ""
std::string_view path_extension(std::string_view path) noexcept;

// Resolves symlinks and relative components, std::nullopt if @p path does not exist
std::optional<std::string> real_path(const std::string& path);

// Searches directories from $PATH for executable @p name
std::optional<std::string> find_executable_in_path(std::string_view name);

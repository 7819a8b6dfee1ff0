#pragma once

#include <chrono>
#include <oirun/command_runner.hh>
#include <oirun/result.hh>
#include <string>

namespace oirun::installer {

class Downloader {
public:
    Downloader() = default;
    Downloader(const Downloader&) = delete;
    Downloader(Downloader&&) = delete;
    Downloader& operator=(const Downloader&) = delete;
    Downloader& operator=(Downloader&&) = delete;
    virtual ~Downloader() = default;

    // Saves the resource at @p url as @p dest_path, on failure returns a
    // human-readable reason
    virtual Result<void, std::string> download(const std::string& url, const std::string& dest_path) = 0;
};

// Downloads with the curl command line tool
class CurlDownloader final : public Downloader {
public:
    explicit CurlDownloader(
        CommandRunner& runner, std::chrono::nanoseconds timeout = std::chrono::minutes{10}
    )
    : runner_(runner)
    , timeout_(timeout) {}

    Result<void, std::string> download(const std::string& url, const std::string& dest_path) override;

private:
    CommandRunner& runner_;
    std::chrono::nanoseconds timeout_;
};

} // namespace oirun::installer

#include <exception>
#include <oirun/installer/downloader.hh>
#include <oirun/logger.hh>
#include <oirun/string_transform.hh>

namespace oirun::installer {

Result<void, std::string>
CurlDownloader::download(const std::string& url, const std::string& dest_path) {
    debuglog("download: ", url, " -> ", dest_path);
    CommandOutput out;
    try {
        out = runner_.run(Command{
            .argv = {"curl", "-fsSL", "--retry", "2", "-o", dest_path, url},
            .timeout = timeout_,
        });
    } catch (const std::exception& e) {
        return Err{concat_tostr("Cannot run curl: ", e.what())};
    }

    if (out.timed_out) {
        return Err{concat_tostr("Download of ", url, " timed out")};
    }
    if (not out.success()) {
        return Err{concat_tostr(
            "Download of ", url, " failed (curl exited with ", out.exit_code, "): ", trim(out.err)
        )};
    }
    return Ok{};
}

} // namespace oirun::installer

#include <algorithm>
#include <nlohmann/json.hpp>
#include <oirun/concat_tostr.hh>
#include <oirun/installer/release.hh>
#include <oirun/string_transform.hh>

using std::string;
using std::string_view;

namespace oirun::installer {

std::optional<string> parse_latest_version(string_view release_json) {
    auto doc = nlohmann::json::parse(release_json, nullptr, false);
    if (doc.is_discarded() or not doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find("tag_name");
    if (it == doc.end() or not it->is_string()) {
        return std::nullopt;
    }
    string_view tag = it->get_ref<const string&>();
    if (has_prefix(tag, "llvmorg-")) {
        tag.remove_prefix(std::string_view{"llvmorg-"}.size());
    }
    tag = trim(tag);
    if (tag.empty() or not is_digit(tag.front())) {
        return std::nullopt;
    }
    return string{tag};
}

std::optional<Artifact>
release_artifact(Platform platform, string_view version, string_view download_base) {
    while (has_suffix(download_base, "/")) {
        download_base.remove_suffix(1);
    }
    Artifact art;
    switch (platform) {
    case Platform::LINUX:
        art.file_name =
            concat_tostr("clang+llvm-", version, "-x86_64-linux-gnu-ubuntu-22.04.tar.xz");
        break;
    case Platform::WINDOWS:
        art.file_name = concat_tostr("LLVM-", version, "-win64.exe");
        art.silent_install_args = {"/S", "/D=C:\\LLVM"};
        break;
    case Platform::MACOS: return std::nullopt;
    }
    art.url = concat_tostr(download_base, "/llvmorg-", version, '/', art.file_name);
    art.checksum_url = concat_tostr(art.url, ".sha256");
    return art;
}

std::optional<string> parse_checksum_file(string_view contents) {
    contents = trim(contents);
    auto end = std::find_if(contents.begin(), contents.end(), is_space);
    auto token = contents.substr(0, static_cast<size_t>(end - contents.begin()));
    if (token.size() != 64) {
        return std::nullopt;
    }
    string digest = to_lower(token);
    if (not std::all_of(digest.begin(), digest.end(), [](char c) {
            return is_digit(c) or (c >= 'a' and c <= 'f');
        }))
    {
        return std::nullopt;
    }
    return digest;
}

} // namespace oirun::installer

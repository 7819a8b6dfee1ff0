#include <oirun/concat_tostr.hh>
#include <oirun/file_manip.hh>
#include <oirun/macros/throw.hh>
#include <oirun/proc_status_file.hh>
#include <oirun/string_transform.hh>

std::optional<std::string> field_from_proc_status(pid_t pid, std::string_view field_name) {
    auto contents = get_file_contents(concat_tostr("/proc/", pid, "/status"));
    for (auto line : split(contents, '\n')) {
        auto colon = line.find(':');
        if (colon != std::string_view::npos and line.substr(0, colon) == field_name) {
            return std::string(trim(line.substr(colon + 1)));
        }
    }
    return std::nullopt;
}

uint64_t resident_set_size(pid_t pid) {
    auto field = field_from_proc_status(pid, "VmRSS");
    if (not field) {
        return 0;
    }

    std::string_view val = *field;
    if (not has_suffix(val, " kB")) {
        THROW("unexpected VmRSS format: ", val);
    }
    auto kib = str2num<uint64_t>(val.substr(0, val.size() - 3));
    if (not kib) {
        THROW("unexpected VmRSS format: ", val);
    }
    return *kib << 10;
}

#include <cstring>
#include <oirun/file_manip.hh>
#include <oirun/seccomp/bpf_builder.hh>
#include <unistd.h>

namespace sandbox::seccomp {

std::vector<sock_filter> BpfBuilder::export_instructions() const {
    auto mfd = export_to_fd();
    if (lseek(mfd, 0, SEEK_SET) == -1) {
        THROW("lseek()", errmsg());
    }

    auto bytes = get_file_contents(mfd);
    if (bytes.empty() or bytes.size() % sizeof(sock_filter) != 0) {
        THROW("seccomp_export_bpf() produced a malformed program of ", bytes.size(), " bytes");
    }

    std::vector<sock_filter> res(bytes.size() / sizeof(sock_filter));
    std::memcpy(res.data(), bytes.data(), bytes.size());
    return res;
}

} // namespace sandbox::seccomp

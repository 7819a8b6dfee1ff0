#pragma once

#include <cstdint>
#include <linux/filter.h>
#include <oirun/errmsg.hh>
#include <oirun/file_descriptor.hh>
#include <oirun/macros/throw.hh>
#include <seccomp.h>
#include <sys/mman.h>
#include <utility>
#include <vector>

namespace sandbox::seccomp {

#define DECLARE_FOR_ARG(arg_num)      \
    struct ARG##arg_num##_EQ {        \
        uint64_t datum;               \
    };                                \
    struct ARG##arg_num##_MASKED_EQ { \
        uint64_t mask;                \
        uint64_t datum;               \
    };

DECLARE_FOR_ARG(0)
DECLARE_FOR_ARG(1)
DECLARE_FOR_ARG(2)
#undef DECLARE_FOR_ARG

// Compiled filter ready to be installed with PR_SET_SECCOMP
class Program {
    std::vector<sock_filter> instructions_;
    sock_fprog fprog_{};

public:
    explicit Program(std::vector<sock_filter> instructions)
    : instructions_(std::move(instructions)) {
        fprog_.len = static_cast<unsigned short>(instructions_.size());
        fprog_.filter = instructions_.data();
    }

    Program(const Program&) = delete;
    Program(Program&&) = delete;
    Program& operator=(const Program&) = delete;
    Program& operator=(Program&&) = delete;

    [[nodiscard]] const sock_fprog* fprog() const noexcept { return &fprog_; }

    [[nodiscard]] size_t size() const noexcept { return instructions_.size(); }

    ~Program() = default;
};

class BpfBuilder {
    scmp_filter_ctx seccomp_ctx_;

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wc99-extensions"
#pragma clang diagnostic ignored "-Wmissing-field-initializers"
#endif

#define DEFINE_FOR_ARG(arg_num)                                                                  \
    static constexpr auto arg_cmp_to_seccomp_native(const ARG##arg_num##_EQ& arg_cmp) noexcept { \
        return SCMP_A##arg_num(SCMP_CMP_EQ, arg_cmp.datum);                                      \
    }                                                                                            \
    static constexpr auto arg_cmp_to_seccomp_native(const ARG##arg_num##_MASKED_EQ& arg_cmp      \
    ) noexcept {                                                                                 \
        return SCMP_A##arg_num(SCMP_CMP_MASKED_EQ, arg_cmp.mask, arg_cmp.datum);                 \
    }

    DEFINE_FOR_ARG(0)
    DEFINE_FOR_ARG(1)
    DEFINE_FOR_ARG(2)
#undef DEFINE_FOR_ARG

#ifdef __clang__
#pragma clang diagnostic pop
#endif

public:
    explicit BpfBuilder(uint32_t def_action) : seccomp_ctx_{seccomp_init(def_action)} {
        if (!seccomp_ctx_) {
            THROW("seccomp_init() failed");
        }
    }

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    template <class... Args>
    void err_syscall(int errnum, int syscall, Args&&... args) {
        int err = seccomp_rule_add(
            seccomp_ctx_,
            SCMP_ACT_ERRNO(errnum),
            syscall,
            sizeof...(args),
            arg_cmp_to_seccomp_native(std::forward<Args>(args))...
        );
        if (err) {
            THROW("seccomp_rule_add()", errmsg(-err));
        }
    }

    [[nodiscard]] FileDescriptor export_to_fd() const {
        auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
        if (!mfd.is_open()) {
            THROW("memfd_create()", errmsg());
        }

        int err = seccomp_export_bpf(seccomp_ctx_, mfd);
        if (err) {
            THROW("seccomp_export_bpf()", errmsg(-err));
        }

        return mfd;
    }

    // Exports the filter and loads it back as BPF instructions
    [[nodiscard]] std::vector<sock_filter> export_instructions() const;

    ~BpfBuilder() { seccomp_release(seccomp_ctx_); }
};

} // namespace sandbox::seccomp

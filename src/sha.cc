#include <array>
#include <memory>
#include <oirun/file_descriptor.hh>
#include <oirun/macros/throw.hh>
#include <oirun/errmsg.hh>
#include <oirun/sha.hh>
#include <openssl/evp.h>

namespace {

class Sha256Context {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx_{EVP_MD_CTX_new(), EVP_MD_CTX_free};

public:
    Sha256Context() {
        if (not ctx_ or EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            THROW("EVP_DigestInit_ex() failed");
        }
    }

    void update(const void* data, size_t len) {
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            THROW("EVP_DigestUpdate() failed");
        }
    }

    std::string hex_digest() {
        std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
        unsigned len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), md.data(), &len) != 1) {
            THROW("EVP_DigestFinal_ex() failed");
        }

        constexpr std::string_view digits = "0123456789abcdef";
        std::string res;
        res.reserve(len * 2);
        for (unsigned i = 0; i < len; ++i) {
            res += digits[md[i] >> 4];
            res += digits[md[i] & 15];
        }
        return res;
    }
};

} // namespace

std::string sha256(std::string_view data) {
    Sha256Context ctx;
    ctx.update(data.data(), data.size());
    return ctx.hex_digest();
}

std::string sha256_file(const std::string& path) {
    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW("open(", path, ')', errmsg());
    }

    Sha256Context ctx;
    std::array<char, 1 << 16> buff{};
    for (;;) {
        auto len = read(fd, buff.data(), buff.size());
        if (len == 0) {
            break;
        }
        if (len < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("read(", path, ')', errmsg());
        }
        ctx.update(buff.data(), static_cast<size_t>(len));
    }
    return ctx.hex_digest();
}

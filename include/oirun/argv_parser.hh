#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

class ArgvParser {
    size_t argc_;
    const char* const* argv_;

public:
    ArgvParser(int argc, const char* const* argv)
    : argc_(static_cast<size_t>(std::max(argc, 0)))
    , argv_(argv) {}

    [[nodiscard]] size_t size() const noexcept { return argc_; }

    std::string_view operator[](size_t n) const noexcept {
        return (n < argc_ ? std::string_view(argv_[n]) : std::string_view());
    }

    [[nodiscard]] std::string_view next() const noexcept { return operator[](0); }

    std::string_view extract_next() noexcept {
        if (argc_ > 0) {
            --argc_;
            return argv_++[0];
        }
        return {};
    }
};

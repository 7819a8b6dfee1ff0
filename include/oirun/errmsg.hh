#pragma once

#include <cerrno>
#include <array>
#include <cstring>
#include <oirun/concat_tostr.hh>
#include <string>

// Renders " - <description> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    std::array<char, 128> buff{};
    // GNU strerror_r() may return a static string instead of filling buff
    const char* description = strerror_r(errnum, buff.data(), buff.size());
    if (description == nullptr) {
        description = "Unknown error";
    }
    return concat_tostr(" - ", description, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }

#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

constexpr bool is_digit(char c) noexcept { return (c >= '0' and c <= '9'); }

constexpr bool is_alpha(char c) noexcept {
    return ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z'));
}

constexpr bool is_alnum(char c) noexcept { return (is_digit(c) or is_alpha(c)); }

constexpr bool is_space(char c) noexcept {
    return (c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\v' or c == '\f');
}

constexpr bool is_cntrl(char c) noexcept {
    return (static_cast<unsigned char>(c) < 32 or c == 127);
}

constexpr char to_lower(char c) noexcept { return (c >= 'A' and c <= 'Z' ? c - 'A' + 'a' : c); }

std::string to_lower(std::string_view str);

constexpr bool has_prefix(std::string_view str, std::string_view prefix) noexcept {
    return str.substr(0, prefix.size()) == prefix;
}

constexpr bool has_suffix(std::string_view str, std::string_view suffix) noexcept {
    return (
        str.size() >= suffix.size() and str.substr(str.size() - suffix.size()) == suffix
    );
}

// Case-insensitive search of @p needle in @p haystack
bool contains_ignoring_case(std::string_view haystack, std::string_view needle);

// Removes leading and trailing white-spaces
std::string_view trim(std::string_view str) noexcept;

// Splits @p str on every @p delim, empty parts are dropped
std::vector<std::string_view> split(std::string_view str, char delim);

/**
 * @brief Converts @p str to a number
 * @details Whole @p str has to be a number, '+' sign is not accepted
 *
 * @return converted number or std::nullopt on error
 */
template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
std::optional<T> str2num(std::string_view str) noexcept {
    if (str.empty()) {
        return std::nullopt;
    }

    T res{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), res);
    if (ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return res;
}

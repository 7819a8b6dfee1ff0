#pragma once

#include <array>
#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace detail {

template <class T>
constexpr inline bool is_stringifiable_integer =
    std::is_integral_v<std::decay_t<T>> and not std::is_same_v<std::decay_t<T>, bool> and
    not std::is_same_v<std::decay_t<T>, char>;

// Decimal representation of an integer kept on the stack
struct IntegerStr {
    std::array<char, 24> buff{};
    size_t len = 0;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator std::string_view() const noexcept { return {buff.data(), len}; }
};

} // namespace detail

template <class T>
constexpr inline bool is_string_argument =
    std::is_convertible_v<T, std::string_view> or std::is_same_v<std::decay_t<T>, char> or
    detail::is_stringifiable_integer<T>;

template <class T, std::enable_if_t<is_string_argument<T>, int> = 0>
auto stringify(T&& x) noexcept {
    using DT = std::decay_t<T>;
    if constexpr (std::is_same_v<DT, char>) {
        return std::string_view{&x, 1};
    } else if constexpr (detail::is_stringifiable_integer<T>) {
        detail::IntegerStr res;
        auto [ptr, ec] = std::to_chars(res.buff.data(), res.buff.data() + res.buff.size(), x);
        (void)ec; // buffer is always big enough
        res.len = ptr - res.buff.data();
        return res;
    } else {
        return std::string_view{x};
    }
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string concat_tostr(Args&&... args) {
    return [](auto&&... str) {
        size_t total_length = (0 + ... + std::string_view(str).size());
        std::string res;
        res.reserve(total_length);
        (void)(res += ... += std::string_view(str));
        return res;
    }(stringify(std::forward<Args>(args))...);
}

template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
std::string& back_insert(std::string& str, Args&&... args) {
    return [&str](auto&&... xx) -> std::string& {
        str.reserve(str.size() + (0 + ... + std::string_view(xx).size()));
        return (str += ... += std::string_view(xx));
    }(stringify(std::forward<Args>(args))...);
}

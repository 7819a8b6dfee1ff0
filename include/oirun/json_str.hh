#pragma once

#include <cstddef>
#include <oirun/concat_tostr.hh>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace json_str {

namespace detail {

template <class...>
constexpr inline bool is_std_optional = false;
template <class T>
constexpr inline bool is_std_optional<std::optional<T>> = true;

template <class...>
constexpr inline bool is_std_vector = false;
template <class T, class A>
constexpr inline bool is_std_vector<std::vector<T, A>> = true;

} // namespace detail

// Appends @p val as a quoted JSON string
void append_quoted(std::string& str, std::string_view val);

class Builder {
protected:
    std::string& str;

    explicit Builder(std::string& str) : str{str} {}

    template <class... Arg>
    void append_raw_value(Arg&&... arg) {
        back_insert(str, std::forward<Arg>(arg)..., ',');
    }

    template <class T>
    void append_value(T&& val) {
        using DT = std::decay_t<T>;
        if constexpr (std::is_same_v<DT, bool>) {
            append_raw_value(val ? "true" : "false");
        } else if constexpr (std::is_same_v<DT, std::nullptr_t> or
                             std::is_same_v<DT, std::nullopt_t>)
        {
            append_raw_value("null");
        } else if constexpr (std::is_integral_v<DT> and not std::is_same_v<DT, char>) {
            append_raw_value(val);
        } else if constexpr (detail::is_std_optional<DT>) {
            if (val) {
                append_value(*val);
            } else {
                append_raw_value("null");
            }
        } else if constexpr (detail::is_std_vector<DT>) {
            append_arr([&](auto& arr) {
                for (const auto& elem : val) {
                    arr.val(elem);
                }
            });
        } else {
            append_quoted(str, std::string_view(val));
            str += ',';
        }
    }

    template <class Func>
    void append_arr(Func&& func);

    template <class Func>
    void append_obj(Func&& func);
};

class ArrayBuilder : Builder {
    friend class Builder;
    friend class Array;

    explicit ArrayBuilder(std::string& str) : Builder{str} { str += '['; }

    void end() {
        if (str.back() == ',') {
            str.back() = ']';
        } else {
            str += ']';
        }
    }

public:
    template <class T>
    void val(T&& val) {
        append_value(std::forward<T>(val));
    }

    template <class Func>
    void val_arr(Func&& func) {
        append_arr(std::forward<Func>(func));
    }

    template <class Func>
    void val_obj(Func&& func) {
        append_obj(std::forward<Func>(func));
    }
};

class ObjectBuilder : Builder {
    friend class Builder;
    friend class Object;

    explicit ObjectBuilder(std::string& str) : Builder{str} { str += '{'; }

    void end() {
        if (str.back() == ',') {
            str.back() = '}';
        } else {
            str += '}';
        }
    }

    void append_prop_name(std::string_view name) {
        append_quoted(str, name);
        str += ':';
    }

public:
    template <class T>
    void prop(std::string_view name, T&& val) {
        append_prop_name(name);
        append_value(std::forward<T>(val));
    }

    template <class Func>
    void prop_arr(std::string_view name, Func&& func) {
        append_prop_name(name);
        append_arr(std::forward<Func>(func));
    }

    template <class Func>
    void prop_obj(std::string_view name, Func&& func) {
        append_prop_name(name);
        append_obj(std::forward<Func>(func));
    }
};

template <class Func>
void Builder::append_arr(Func&& func) {
    static_assert(std::is_invocable_v<Func&&, ArrayBuilder&>);
    auto arr = ArrayBuilder{str};
    std::forward<Func>(func)(arr);
    arr.end();
    str += ',';
}

template <class Func>
void Builder::append_obj(Func&& func) {
    static_assert(std::is_invocable_v<Func&&, ObjectBuilder&>);
    auto obj = ObjectBuilder{str};
    std::forward<Func>(func)(obj);
    obj.end();
    str += ',';
}

namespace detail {
struct StringWrapper {
    std::string str;
};
} // namespace detail

class Object
: detail::StringWrapper
, public ObjectBuilder {
public:
    Object() : ObjectBuilder{StringWrapper::str} {}

    std::string into_str() && {
        end();
        return std::move(StringWrapper::str);
    }
};

class Array
: detail::StringWrapper
, public ArrayBuilder {
public:
    Array() : ArrayBuilder{StringWrapper::str} {}

    std::string into_str() && {
        end();
        return std::move(StringWrapper::str);
    }
};

} // namespace json_str

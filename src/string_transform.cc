#include <algorithm>
#include <oirun/string_transform.hh>

std::string to_lower(std::string_view str) {
    std::string res(str);
    for (auto& c : res) {
        c = to_lower(c);
    }
    return res;
}

bool contains_ignoring_case(std::string_view haystack, std::string_view needle) {
    auto it = std::search(
        haystack.begin(),
        haystack.end(),
        needle.begin(),
        needle.end(),
        [](char a, char b) { return to_lower(a) == to_lower(b); }
    );
    return it != haystack.end() or needle.empty();
}

std::string_view trim(std::string_view str) noexcept {
    while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

std::vector<std::string_view> split(std::string_view str, char delim) {
    std::vector<std::string_view> res;
    size_t beg = 0;
    while (beg <= str.size()) {
        size_t end = str.find(delim, beg);
        if (end == std::string_view::npos) {
            end = str.size();
        }
        if (end > beg) {
            res.push_back(str.substr(beg, end - beg));
        }
        beg = end + 1;
    }
    return res;
}

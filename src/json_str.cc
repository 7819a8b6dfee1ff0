#include <oirun/json_str.hh>

namespace json_str {

void append_quoted(std::string& str, std::string_view val) {
    constexpr std::string_view hex_digits = "0123456789abcdef";
    str.reserve(str.size() + val.size() + 2);
    str += '"';
    for (char c : val) {
        switch (c) {
        case '"': str += "\\\""; break;
        case '\\': str += "\\\\"; break;
        case '\b': str += "\\b"; break;
        case '\f': str += "\\f"; break;
        case '\n': str += "\\n"; break;
        case '\r': str += "\\r"; break;
        case '\t': str += "\\t"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20 or c == 0x7f) {
                auto uc = static_cast<unsigned char>(c);
                back_insert(str, "\\u00", hex_digits[uc >> 4], hex_digits[uc & 15]);
            } else {
                str += c;
            }
        }
    }
    str += '"';
}

} // namespace json_str

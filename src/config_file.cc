#include <algorithm>
#include <oirun/config_file.hh>
#include <oirun/file_manip.hh>
#include <oirun/macros/stack_unwinding.hh>

using std::string;
using std::string_view;

namespace {

constexpr size_t diagnostics_context = 32;

constexpr bool is_name_char(char c) noexcept {
    return (is_alnum(c) or c == '-' or c == '_' or c == '.');
}

constexpr int hex_value(char c) noexcept {
    if (is_digit(c)) {
        return c - '0';
    }
    c = to_lower(c);
    return (c >= 'a' and c <= 'f' ? c - 'a' + 10 : -1);
}

class Parser {
    string_view text_;
    size_t pos_ = 0;

public:
    explicit Parser(string_view text) noexcept : text_(text) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    // '\n' past the end, so every line ends with a newline
    [[nodiscard]] char peek(size_t offset = 0) const noexcept {
        return (pos_ + offset < text_.size() ? text_[pos_ + offset] : '\n');
    }

    void advance(size_t n = 1) noexcept { pos_ = std::min(pos_ + n, text_.size()); }

    void skip_blanks() noexcept {
        while (not at_end() and peek() != '\n' and is_space(peek())) {
            advance();
        }
    }

    void skip_to_newline() noexcept {
        while (not at_end() and peek() != '\n') {
            advance();
        }
    }

    string_view take_while(bool (*pred)(char) noexcept) noexcept {
        size_t beg = pos_;
        while (not at_end() and pred(peek())) {
            advance();
        }
        return text_.substr(beg, pos_ - beg);
    }

    template <class... Args>
    [[noreturn]] void fail(Args&&... msg) const {
        size_t line_beg = 0;
        if (pos_ > 0) {
            if (auto nl = text_.rfind('\n', pos_ - 1); nl != string_view::npos) {
                line_beg = nl + 1;
            }
        }
        size_t line = 1 + std::count(text_.begin(), text_.begin() + line_beg, '\n');
        size_t col = pos_ - line_beg + 1;

        string diags;
        auto append_char = [&](char c) {
            if (is_cntrl(c)) {
                constexpr std::string_view digits = "0123456789abcdef";
                auto uc = static_cast<unsigned char>(c);
                back_insert(diags, "\\x", digits[uc >> 4], digits[uc & 15]);
            } else {
                diags += c;
            }
        };

        size_t left = line_beg;
        if (pos_ - line_beg > diagnostics_context) {
            left = pos_ - diagnostics_context;
            diags += "...";
        }
        for (size_t k = left; k < pos_; ++k) {
            append_char(text_[k]);
        }

        size_t padding = diags.size();
        size_t stress_len = 1;
        if (peek() != '\n') {
            append_char(peek());
            stress_len = diags.size() - padding;
            size_t k = pos_ + 1;
            size_t right_end = std::min(text_.size(), pos_ + diagnostics_context + 1);
            for (; k < right_end and text_[k] != '\n'; ++k) {
                append_char(text_[k]);
            }
            if (k < text_.size() and text_[k] != '\n') {
                diags += "...";
            }
        }
        diags += '\n';
        diags.append(padding, ' ');
        diags += '^';
        diags.append(stress_len - 1, '~');

        throw ConfigFile::ParseError(line, col, std::move(diags), std::forward<Args>(msg)...);
    }

    string parse_single_quoted() {
        string res;
        advance(); // '
        for (;;) {
            if (peek() == '\n') {
                fail("Missing terminating ' character");
            }
            if (peek() == '\'') {
                if (peek(1) != '\'') {
                    advance();
                    return res;
                }
                advance(); // '' stands for '
            }
            res += peek();
            advance();
        }
    }

    string parse_double_quoted() {
        string res;
        advance(); // "
        for (;;) {
            char c = peek();
            if (c == '\n') {
                fail("Missing terminating \" character");
            }
            advance();
            if (c == '"') {
                return res;
            }
            if (c != '\\') {
                res += c;
                continue;
            }

            c = peek();
            switch (c) {
            case '\'':
            case '"':
            case '?':
            case '\\': res += c; break;
            case 't': res += '\t'; break;
            case 'n': res += '\n'; break;
            case 'r': res += '\r'; break;
            case 'a': res += '\a'; break;
            case 'b': res += '\b'; break;
            case 'f': res += '\f'; break;
            case 'v': res += '\v'; break;
            case 'x': {
                advance();
                int hi = hex_value(peek());
                if (hi < 0) {
                    fail("Invalid hexadecimal digit: `", peek(), '`');
                }
                advance();
                int lo = hex_value(peek());
                if (lo < 0) {
                    fail("Invalid hexadecimal digit: `", peek(), '`');
                }
                res += static_cast<char>((hi << 4) | lo);
                break;
            }
            default: fail("Unknown escape sequence: `\\", c, '`');
            }
            advance();
        }
    }

    // Unquoted value ends at a comment, a newline and in arrays also at ',' or ']'
    string parse_literal(bool in_array) {
        char c = peek();
        if (c == '[' or (in_array and (c == ',' or c == ']'))) {
            fail("Invalid beginning of the string literal: `", c, '`');
        }

        size_t beg = pos_;
        while (not at_end()) {
            c = peek();
            if (c == '\n' or c == '#' or (in_array and (c == ',' or c == ']'))) {
                break;
            }
            advance();
        }
        return string(trim(text_.substr(beg, pos_ - beg)));
    }

    string parse_value(bool in_array) {
        switch (peek()) {
        case '\'': return parse_single_quoted();
        case '"': return parse_double_quoted();
        default: return parse_literal(in_array);
        }
    }

    std::vector<string> parse_array() {
        std::vector<string> res;
        advance(); // [
        for (;;) {
            while (not at_end() and is_space(peek())) {
                advance();
            }
            if (at_end()) {
                fail("Missing terminating ] character at the end of an array");
            }

            switch (peek()) {
            case ']': advance(); return res;
            case '#': skip_to_newline(); continue;
            case ',': advance(); continue; // Extra delimiters are ignored
            default: break;
            }

            res.emplace_back(parse_value(true));
            skip_blanks();
            switch (peek()) {
            case ',':
            case '\n': advance(); continue;
            case '#': skip_to_newline(); continue;
            case ']': advance(); return res;
            default: fail("Unknown sequence after the value: `", peek(), '`');
            }
        }
    }
};

} // namespace

void ConfigFile::load_config_from_file(const string& path, bool load_all) {
    STACK_UNWINDING_MARK;
    load_config_from_string(get_file_contents(path), load_all);
}

void ConfigFile::load_config_from_string(string_view config, bool load_all) {
    STACK_UNWINDING_MARK;

    for (auto& [name, var] : vars_) {
        var = Variable{};
    }

    Variable ignored;
    Parser parser{config};
    while (not parser.at_end()) {
        parser.skip_blanks();
        if (parser.peek() == '\n') {
            parser.advance();
            continue;
        }
        if (parser.peek() == '#') {
            parser.skip_to_newline();
            continue;
        }

        auto name = parser.take_while(is_name_char);
        if (name.empty()) {
            parser.fail("Invalid or missing variable's name");
        }

        parser.skip_blanks();
        if (parser.peek() == '\n' or parser.peek() == '#') {
            parser.fail("Incomplete directive: `", name, '`');
        }
        if (parser.peek() != '=' and parser.peek() != ':') {
            parser.fail("Invalid assignment operator: `", parser.peek(), '`');
        }
        parser.advance();
        parser.skip_blanks();

        Variable* var = &ignored;
        if (load_all) {
            var = &vars_[string(name)];
        } else if (auto it = vars_.find(name); it != vars_.end()) {
            var = &it->second;
        }
        *var = Variable{};
        var->set_ = true;

        if (parser.peek() == '[') {
            var->array_ = true;
            var->arr_ = parser.parse_array();
        } else if (parser.peek() != '\n' and parser.peek() != '#') {
            var->str_ = parser.parse_value(false);
        }

        parser.skip_blanks();
        if (parser.peek() == '#') {
            parser.skip_to_newline();
        } else if (parser.peek() != '\n') {
            parser.fail("Unknown sequence after the value: `", parser.peek(), '`');
        }
        parser.advance();
    }
}

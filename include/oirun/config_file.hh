#pragma once

#include <map>
#include <oirun/concat_tostr.hh>
#include <oirun/string_transform.hh>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * Config of the form:
 *   # comment
 *   name: value
 *   name = 'single quoted, '' is a quote'
 *   name = "double quoted with \t \n \x41 escapes"
 *   name: [a, 'b', "c"]   # arrays may span multiple lines
 */
class ConfigFile {
public:
    class ParseError : public std::runtime_error {
        std::string diagnostics_;

    public:
        template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
        ParseError(size_t line, size_t pos, std::string diagnostics, Args&&... msg)
        : runtime_error(concat_tostr("line ", line, ':', pos, ": ", std::forward<Args>(msg)...))
        , diagnostics_(std::move(diagnostics)) {}

        ParseError(const ParseError& pe) = default;
        ParseError(ParseError&&) noexcept = default;
        ParseError& operator=(const ParseError& pe) = default;
        ParseError& operator=(ParseError&&) noexcept = default;

        // Faulty line with the faulty position marked below it
        [[nodiscard]] const std::string& diagnostics() const noexcept { return diagnostics_; }

        ~ParseError() noexcept override = default;
    };

    class Variable {
        bool set_ = false;
        bool array_ = false;
        std::string str_;
        std::vector<std::string> arr_;

        friend class ConfigFile;

    public:
        Variable() {} // NOLINT(modernize-use-equals-default): compiler bug

        [[nodiscard]] bool is_set() const noexcept { return set_; }

        [[nodiscard]] bool is_array() const noexcept { return array_; }

        // Returns value as bool, false if it is not a true-like value
        [[nodiscard]] bool as_bool() const {
            auto val = to_lower(str_);
            return (val == "1" or val == "on" or val == "true" or val == "yes");
        }

        template <class T, std::enable_if_t<std::is_arithmetic_v<T>, int> = 0>
        [[nodiscard]] std::optional<T> as() const noexcept {
            return str2num<T>(str_);
        }

        // Returns value as string (empty if not a string or variable isn't set)
        [[nodiscard]] const std::string& as_string() const noexcept { return str_; }

        // Returns value as array (empty if not an array or variable isn't set)
        [[nodiscard]] const std::vector<std::string>& as_array() const noexcept { return arr_; }
    };

private:
    std::map<std::string, Variable, std::less<>> vars_; // (name => value)
    static inline const Variable null_var{};

public:
    // Adds variables @p names to variable set, ignores duplications
    template <class... Args>
    void add_vars(Args&&... names) {
        (vars_.try_emplace(std::string(std::forward<Args>(names))), ...);
    }

    // Returns a reference to a variable @p name from variable set or to a null_var
    const Variable& operator[](std::string_view name) const noexcept {
        auto it = vars_.find(name);
        return (it != vars_.end() ? it->second : null_var);
    }

    [[nodiscard]] const auto& get_vars() const noexcept { return vars_; }

    /**
     * @brief Loads config (variables) from file @p path
     *
     * @param load_all whether load all variables or only these from the
     *   variable set
     *
     * @errors Throws std::runtime_error if the file cannot be read and
     *   ParseError if its contents are invalid
     */
    void load_config_from_file(const std::string& path, bool load_all = false);

    // Like load_config_from_file(), but parses @p config
    void load_config_from_string(std::string_view config, bool load_all = false);
};

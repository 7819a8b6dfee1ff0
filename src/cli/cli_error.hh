#pragma once

#include <oirun/concat_tostr.hh>
#include <stdexcept>

// Error caused by the user, reported without the stack unwinding marks
class CliError : protected std::runtime_error {
public:
    template <class... Args, std::enable_if_t<(is_string_argument<Args> and ...), int> = 0>
    explicit CliError(Args&&... args)
    : std::runtime_error(concat_tostr(std::forward<Args>(args)...)) {}

    CliError(const CliError&) = default;
    CliError(CliError&&) = default;
    CliError& operator=(const CliError&) = default;
    CliError& operator=(CliError&&) = default;

    using std::runtime_error::what;

    ~CliError() override = default;
};

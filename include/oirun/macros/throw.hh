#pragma once

#include <oirun/concat_tostr.hh>
#include <oirun/macros/stringify.hh>
#include <stdexcept>

// Includes the exception origin in the message
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )

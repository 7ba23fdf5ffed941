#pragma once

#include <gradelib/concat_tostr.hh>
#include <gradelib/macros/stringify.hh>
#include <stdexcept>
#include <system_error>

// Very useful - includes exception origin
#define THROW(...)                                                                     \
    throw std::runtime_error(                                                          \
        concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")") \
    )

// Like THROW() but throws std::system_error with @p errnum, which is evaluated
// before the message (so reading errno is safe). Do not append errmsg(), the
// description of @p errnum is appended by std::system_error.
#define THROW_ERRNO(errnum, ...)                                                             \
    do {                                                                                     \
        int throw_errno_errnum_ = (errnum);                                                  \
        throw std::system_error(                                                             \
            throw_errno_errnum_,                                                             \
            std::generic_category(),                                                         \
            concat_tostr(__VA_ARGS__, " (thrown at " __FILE__ ":" STRINGIFY(__LINE__) ")")   \
        );                                                                                   \
    } while (false)

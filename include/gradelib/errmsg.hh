#pragma once

#include <cerrno>
#include <cstring>
#include <gradelib/concat_tostr.hh>
#include <string>

// Returns " - <description of errnum> (os error <errnum>)"
inline std::string errmsg(int errnum) {
    // At the time of writing, longest error description is 50 bytes in size
    // (including null terminator)
    char buff[64];
    const char* errstr = strerror_r(errnum, buff, sizeof(buff));
    if (errstr == nullptr) {
        errstr = "Unknown error";
    }
    return concat_tostr(" - ", errstr, " (os error ", errnum, ')');
}

inline std::string errmsg() { return errmsg(errno); }

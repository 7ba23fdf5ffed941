#pragma once

#include <string>
#include <sys/stat.h>

// Returns true if a file/directory @p path exists (symlinks are not followed)
inline bool path_exists(const std::string& path) noexcept {
    struct stat64 st {};
    return lstat64(path.c_str(), &st) == 0;
}

inline bool is_directory(const std::string& path) noexcept {
    struct stat64 st {};
    return stat64(path.c_str(), &st) == 0 and S_ISDIR(st.st_mode);
}

inline bool is_regular_file(const std::string& path) noexcept {
    struct stat64 st {};
    return stat64(path.c_str(), &st) == 0 and S_ISREG(st.st_mode);
}

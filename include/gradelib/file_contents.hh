#pragma once

#include <cstddef>
#include <gradelib/file_perms.hh>
#include <limits>
#include <string>
#include <string_view>
#include <sys/types.h>

// Writes all @p count bytes unless write(2) fails (EINTR is retried). Returns
// the number of bytes written; if it is less than @p count, errno describes
// the error.
[[nodiscard]] size_t write_all(int fd, const void* buff, size_t count) noexcept;

[[nodiscard]] inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Throws std::system_error if the write fails
void write_all_throw(int fd, std::string_view str);

// Reads from @p fd until EOF or until @p max_bytes bytes are read, throws
// std::system_error on errors
std::string get_file_contents(int fd, size_t max_bytes = std::numeric_limits<size_t>::max());

std::string get_file_contents(const std::string& path);

// Creates or truncates @p path
void put_file_contents(const std::string& path, std::string_view data, mode_t mode = S_0644);

#pragma once

#include <fcntl.h>
#include <string>

/**
 * @brief Removes recursively file/directory @p pathname relative to the
 *   directory file descriptor @p dirfd
 *
 * @param dirfd directory file descriptor
 * @param pathname file/directory pathname (relative to @p dirfd)
 *
 * Directories lacking owner rwx permissions (e.g. after chmod 0) get them
 * restored before descending.
 *
 * @return 0 on success, -1 on error
 *
 * @errors The same that occur for openat(2), unlinkat(2), fdopendir(3),
 *   fchmodat(2)
 */
[[nodiscard]] int remove_rat(int dirfd, const char* pathname) noexcept;

// Removes recursively file/directory @p pathname, uses remove_rat()
[[nodiscard]] inline int remove_r(const std::string& pathname) noexcept {
    return remove_rat(AT_FDCWD, pathname.c_str());
}

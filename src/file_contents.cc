#include <algorithm>
#include <array>
#include <cerrno>
#include <gradelib/file_contents.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/macros/throw.hh>
#include <unistd.h>

size_t write_all(int fd, const void* buff, size_t count) noexcept {
    const auto* ptr = static_cast<const char*>(buff);
    size_t pos = 0;
    errno = 0;
    while (pos < count) {
        ssize_t rc = write(fd, ptr + pos, count - pos);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        pos += rc;
    }
    if (pos == count) {
        errno = 0;
    }
    return pos;
}

void write_all_throw(int fd, std::string_view str) {
    if (write_all(fd, str) != str.size()) {
        THROW_ERRNO(errno, "write()");
    }
}

std::string get_file_contents(int fd, size_t max_bytes) {
    std::string res;
    std::array<char, 65536> buff; // NOLINT(cppcoreguidelines-pro-type-member-init)
    while (max_bytes > 0) {
        ssize_t rc = read(fd, buff.data(), std::min(max_bytes, buff.size()));
        if (rc == 0) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW_ERRNO(errno, "read()");
        }
        res.append(buff.data(), rc);
        max_bytes -= rc;
    }
    return res;
}

std::string get_file_contents(const std::string& path) {
    FileDescriptor fd{path, O_RDONLY | O_CLOEXEC};
    if (not fd.is_open()) {
        THROW_ERRNO(errno, "open('", path, "')");
    }
    return get_file_contents(fd);
}

void put_file_contents(const std::string& path, std::string_view data, mode_t mode) {
    FileDescriptor fd{path, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode};
    if (not fd.is_open()) {
        THROW_ERRNO(errno, "open('", path, "')");
    }
    write_all_throw(fd, data);
    if (fd.close()) {
        THROW_ERRNO(errno, "close('", path, "')");
    }
}

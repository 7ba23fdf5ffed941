#pragma once

#include <fcntl.h>
#include <gradelib/file_perms.hh>
#include <string>
#include <unistd.h>
#include <utility>

// Owned file descriptor, closed on destruction. Negative value means that
// nothing is owned.
class FileDescriptor {
    int fd_ = -1;

public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) noexcept
    : fd_{fd} {}

    // On failure is_open() is false and errno is set
    FileDescriptor(const std::string& path, int flags, mode_t mode = S_0644) noexcept
    : fd_{::open(path.c_str(), flags, mode)} {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)} {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~FileDescriptor() { (void)close(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // Use is_open() instead
    explicit operator bool() const noexcept = delete;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }

    // Adds @p flags to the file status flags (e.g. O_NONBLOCK), returns -1 and
    // sets errno on error
    [[nodiscard]] int add_status_flags(int flags) const noexcept {
        int current = fcntl(fd_, F_GETFL);
        if (current == -1) {
            return -1;
        }
        return fcntl(fd_, F_SETFL, current | flags);
    }

    // Returns the result of close(2), closing an unopened descriptor is a no-op
    [[nodiscard]] int close() noexcept {
        if (fd_ < 0) {
            return 0;
        }
        return ::close(std::exchange(fd_, -1));
    }
};

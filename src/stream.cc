#include <algorithm>
#include <cerrno>
#include <cstring>
#include <gradelib/file_contents.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/stream.hh>
#include <unistd.h>

namespace gradelib {

size_t FileStream::read(void* buff, size_t count) {
    if (not readable_) {
        throw UnsupportedOperation("read");
    }
    for (;;) {
        ssize_t rc = ::read(fd_, buff, count);
        if (rc >= 0) {
            return rc;
        }
        if (errno != EINTR) {
            THROW_ERRNO(errno, "read()");
        }
    }
}

void FileStream::write(const void* buff, size_t count) {
    if (not writable_) {
        throw UnsupportedOperation("write");
    }
    if (write_all(fd_, buff, count) != count) {
        THROW_ERRNO(errno, "write()");
    }
}

uint64_t FileStream::seek(int64_t offset, Whence whence) {
    off64_t pos = lseek64(fd_, offset, static_cast<int>(whence));
    if (pos == -1) {
        THROW_ERRNO(errno, "lseek64()");
    }
    return pos;
}

void FileStream::close() {
    if (fd_.close()) {
        THROW_ERRNO(errno, "close()");
    }
}

size_t MemoryStream::read(void* buff, size_t count) {
    if (pos_ >= data_.size()) {
        return 0;
    }
    size_t len = std::min(count, data_.size() - pos_);
    std::memcpy(buff, data_.data() + pos_, len);
    pos_ += len;
    return len;
}

void MemoryStream::write(const void* buff, size_t count) {
    if (pos_ > data_.size()) {
        data_.resize(pos_, '\0');
    }
    data_.replace(pos_, std::min(count, data_.size() - pos_), static_cast<const char*>(buff), count);
    pos_ += count;
}

uint64_t MemoryStream::seek(int64_t offset, Whence whence) {
    int64_t base = 0;
    switch (whence) {
    case Whence::SET: base = 0; break;
    case Whence::CUR: base = static_cast<int64_t>(pos_); break;
    case Whence::END: base = static_cast<int64_t>(data_.size()); break;
    }
    if (base + offset < 0) {
        THROW_ERRNO(EINVAL, "seek() to a negative position");
    }
    pos_ = base + offset;
    return pos_;
}

std::string read_to_string(Stream& stream, std::optional<size_t> maxlen) {
    std::string res;
    char buff[65536];
    size_t left = maxlen.value_or(static_cast<size_t>(-1));
    while (left > 0) {
        size_t len = stream.read(buff, std::min(left, sizeof(buff)));
        if (len == 0) {
            break;
        }
        res.append(buff, len);
        left -= len;
    }
    return res;
}

uint64_t copy_stream(Stream& src, Stream& dest) {
    char buff[65536];
    uint64_t total = 0;
    for (;;) {
        size_t len = src.read(buff, sizeof(buff));
        if (len == 0) {
            return total;
        }
        dest.write(buff, len);
        total += len;
    }
}

} // namespace gradelib

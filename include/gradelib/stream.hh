#pragma once

#include <cstdint>
#include <cstdio>
#include <gradelib/file_descriptor.hh>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/types.h>

namespace gradelib {

enum class Whence : int {
    SET = SEEK_SET,
    CUR = SEEK_CUR,
    END = SEEK_END,
};

// Thrown when an operation is not supported by the stream (e.g. write to a
// read-only view)
class UnsupportedOperation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Byte stream interface shared by files inside the sandbox, the storage and
// the truncated views
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class Stream {
public:
    Stream() = default;
    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;
    Stream(Stream&&) noexcept = default;
    Stream& operator=(Stream&&) noexcept = default;

    virtual ~Stream() = default;

    // Returns number of bytes read, 0 means end of stream
    virtual size_t read(void* buff, size_t count) = 0;

    // Writes all @p count bytes or throws
    virtual void write(const void* buff, size_t count) = 0;

    void write(std::string_view str) { write(str.data(), str.size()); }

    // Returns the new position
    virtual uint64_t seek(int64_t offset, Whence whence = Whence::SET) = 0;

    [[nodiscard]] virtual uint64_t tell() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool closed() const noexcept = 0;
};

// Stream over an owned file descriptor, the descriptor is closed upon
// destruction
class FileStream final : public Stream {
    FileDescriptor fd_;
    bool readable_;
    bool writable_;

public:
    FileStream(FileDescriptor fd, bool readable, bool writable) noexcept
    : fd_{std::move(fd)}
    , readable_{readable}
    , writable_{writable} {}

    size_t read(void* buff, size_t count) override;

    void write(const void* buff, size_t count) override;

    using Stream::write;

    uint64_t seek(int64_t offset, Whence whence = Whence::SET) override;

    [[nodiscard]] uint64_t tell() override { return seek(0, Whence::CUR); }

    // Throws std::system_error if close(2) fails
    void close() override;

    [[nodiscard]] bool closed() const noexcept override { return not fd_.is_open(); }

    [[nodiscard]] int fd() const noexcept { return fd_; }
};

// Stream over an in-memory buffer
class MemoryStream final : public Stream {
    std::string data_;
    size_t pos_ = 0;
    bool closed_ = false;

public:
    MemoryStream() = default;

    explicit MemoryStream(std::string data) noexcept
    : data_{std::move(data)} {}

    size_t read(void* buff, size_t count) override;

    void write(const void* buff, size_t count) override;

    using Stream::write;

    uint64_t seek(int64_t offset, Whence whence = Whence::SET) override;

    [[nodiscard]] uint64_t tell() override { return pos_; }

    void close() override { closed_ = true; }

    [[nodiscard]] bool closed() const noexcept override { return closed_; }

    [[nodiscard]] const std::string& data() const noexcept { return data_; }
};

// Reads from @p stream until its end or until @p maxlen bytes are read
std::string read_to_string(Stream& stream, std::optional<size_t> maxlen = std::nullopt);

// Copies everything from @p src to @p dest, returns the number of bytes copied
uint64_t copy_stream(Stream& src, Stream& dest);

} // namespace gradelib

#pragma once

#include <algorithm>
#include <cstdint>
#include <gradelib/stream.hh>
#include <type_traits>
#include <utility>

namespace gradelib {

/**
 * @brief Read-only view of at most the first @p size bytes of an underlying
 *   stream
 * @details The underlying stream (and the file behind it) is never modified.
 *   @p Underlying has to provide read(void*, size_t), seek(int64_t, Whence),
 *   tell(), close() and closed(). The wrapped stream is owned by the
 *   Truncator.
 */
template <class Underlying>
class Truncator final : public Stream {
    Underlying underlying_;
    uint64_t size_;

public:
    Truncator(Underlying underlying, uint64_t size) noexcept(
        std::is_nothrow_move_constructible_v<Underlying>
    )
    : underlying_{std::move(underlying)}
    , size_{size} {}

    [[nodiscard]] uint64_t size_limit() const noexcept { return size_; }

    // The buffer is clipped so that it does not overflow into the hidden part
    // of the stream
    size_t read(void* buff, size_t count) override {
        uint64_t pos = underlying_.tell();
        uint64_t allowance = (pos < size_ ? size_ - pos : 0);
        if (allowance == 0 or count == 0) {
            return 0;
        }
        return underlying_.read(buff, static_cast<size_t>(std::min<uint64_t>(count, allowance)));
    }

    [[noreturn]] void write(const void* /*buff*/, size_t /*count*/) override {
        throw UnsupportedOperation("write");
    }

    using Stream::write;

    uint64_t seek(int64_t offset, Whence whence = Whence::SET) override {
        // Seeks relative to the end have to respect the imposed size
        if (whence == Whence::END) {
            if (underlying_.seek(0, Whence::END) > size_) {
                underlying_.seek(static_cast<int64_t>(size_), Whence::SET);
            }
            return underlying_.seek(offset, Whence::CUR);
        }
        return underlying_.seek(offset, whence);
    }

    [[nodiscard]] uint64_t tell() override { return underlying_.tell(); }

    void close() override { underlying_.close(); }

    [[nodiscard]] bool closed() const noexcept override { return underlying_.closed(); }
};

} // namespace gradelib

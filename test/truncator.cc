#include "gradelib/truncator.hh"

#include <array>
#include <gtest/gtest.h>
#include <string>

using gradelib::MemoryStream;
using gradelib::Truncator;
using gradelib::UnsupportedOperation;
using gradelib::Whence;

namespace {

std::string read_chunk(gradelib::Stream& stream, size_t count) {
    std::string res(count, '\0');
    res.resize(stream.read(res.data(), res.size()));
    return res;
}

} // namespace

// NOLINTNEXTLINE
TEST(truncator, read_stops_at_the_limit) {
    Truncator<MemoryStream> trunc{MemoryStream{"0123456789"}, 4};
    EXPECT_EQ(trunc.size_limit(), 4);
    EXPECT_EQ(read_chunk(trunc, 3), "012");
    EXPECT_EQ(read_chunk(trunc, 3), "3");
    EXPECT_EQ(read_chunk(trunc, 3), "");
    EXPECT_EQ(trunc.tell(), 4);
}

// NOLINTNEXTLINE
TEST(truncator, limit_above_underlying_size) {
    Truncator<MemoryStream> trunc{MemoryStream{"abc"}, 100};
    EXPECT_EQ(read_chunk(trunc, 10), "abc");
    EXPECT_EQ(read_chunk(trunc, 10), "");
}

// NOLINTNEXTLINE
TEST(truncator, zero_limit) {
    Truncator<MemoryStream> trunc{MemoryStream{"abc"}, 0};
    EXPECT_EQ(read_chunk(trunc, 10), "");
}

// NOLINTNEXTLINE
TEST(truncator, seek_from_end_is_clamped) {
    Truncator<MemoryStream> trunc{MemoryStream{"0123456789"}, 4};
    EXPECT_EQ(trunc.seek(0, Whence::END), 4);
    EXPECT_EQ(read_chunk(trunc, 5), "");
    EXPECT_EQ(trunc.seek(-2, Whence::END), 2);
    EXPECT_EQ(read_chunk(trunc, 5), "23");

    Truncator<MemoryStream> short_trunc{MemoryStream{"01"}, 4};
    EXPECT_EQ(short_trunc.seek(0, Whence::END), 2);
}

// NOLINTNEXTLINE
TEST(truncator, other_seeks_pass_through) {
    Truncator<MemoryStream> trunc{MemoryStream{"0123456789"}, 4};
    // Positioning past the limit is allowed, reading is not
    EXPECT_EQ(trunc.seek(7, Whence::SET), 7);
    EXPECT_EQ(read_chunk(trunc, 5), "");
    EXPECT_EQ(trunc.seek(1, Whence::SET), 1);
    EXPECT_EQ(trunc.seek(1, Whence::CUR), 2);
    EXPECT_EQ(read_chunk(trunc, 5), "23");
}

// NOLINTNEXTLINE
TEST(truncator, write_is_rejected) {
    Truncator<MemoryStream> trunc{MemoryStream{"abc"}, 2};
    EXPECT_THROW(trunc.write("x"), UnsupportedOperation);
    trunc.seek(0);
    EXPECT_EQ(read_chunk(trunc, 5), "ab");
}

// NOLINTNEXTLINE
TEST(truncator, close) {
    Truncator<MemoryStream> trunc{MemoryStream{"abc"}, 2};
    EXPECT_FALSE(trunc.closed());
    trunc.close();
    EXPECT_TRUE(trunc.closed());
}

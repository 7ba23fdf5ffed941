#include "gradelib/stream.hh"

#include <cstdio>
#include <gradelib/file_contents.hh>
#include <gradelib/temporary_directory.hh>
#include <gtest/gtest.h>
#include <system_error>

using gradelib::FileStream;
using gradelib::MemoryStream;
using gradelib::UnsupportedOperation;
using gradelib::Whence;

// NOLINTNEXTLINE
TEST(stream, MemoryStream) {
    MemoryStream ms;
    ms.write("hello");
    EXPECT_EQ(ms.data(), "hello");
    EXPECT_EQ(ms.tell(), 5);
    EXPECT_EQ(ms.seek(1), 1);
    ms.write("EL");
    EXPECT_EQ(ms.data(), "hELlo");
    EXPECT_EQ(ms.seek(-1, Whence::END), 4);
    EXPECT_EQ(gradelib::read_to_string(ms), "o");
    EXPECT_THROW(ms.seek(-10, Whence::CUR), std::system_error);
}

// NOLINTNEXTLINE
TEST(stream, read_to_string) {
    MemoryStream ms{"0123456789"};
    EXPECT_EQ(gradelib::read_to_string(ms, 3), "012");
    EXPECT_EQ(gradelib::read_to_string(ms), "3456789");
    EXPECT_EQ(gradelib::read_to_string(ms, 3), "");
}

// NOLINTNEXTLINE
TEST(stream, copy_stream) {
    std::string big(200000, 'x');
    MemoryStream src{big};
    MemoryStream dest;
    EXPECT_EQ(gradelib::copy_stream(src, dest), big.size());
    EXPECT_EQ(dest.data(), big);
}

// NOLINTNEXTLINE
TEST(stream, FileStream) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    auto path = tmp_dir.path() + "file";
    {
        FileStream out{FileDescriptor{path, O_WRONLY | O_CREAT | O_CLOEXEC}, false, true};
        out.write("abcdef");
        EXPECT_THROW(out.read(nullptr, 0), UnsupportedOperation);
        out.close();
        EXPECT_TRUE(out.closed());
    }
    EXPECT_EQ(get_file_contents(path), "abcdef");

    FileStream in{FileDescriptor{path, O_RDONLY | O_CLOEXEC}, true, false};
    EXPECT_EQ(in.seek(0, Whence::END), 6);
    EXPECT_EQ(in.seek(2), 2);
    EXPECT_EQ(gradelib::read_to_string(in), "cdef");
    EXPECT_THROW(in.write("x"), UnsupportedOperation);
}

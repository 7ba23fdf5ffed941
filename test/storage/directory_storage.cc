#include "gradelib/storage/directory_storage.hh"

#include <gradelib/file_info.hh>
#include <gradelib/sha.hh>
#include <gradelib/stream.hh>
#include <gradelib/temporary_directory.hh>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <system_error>

using gradelib::MemoryStream;
using gradelib::storage::DirectoryStorage;

// NOLINTNEXTLINE
TEST(directory_storage, put_and_get) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    DirectoryStorage storage{tmp_dir.path()};

    MemoryStream src{"int main() {}\n"};
    auto digest = storage.put_file_from_stream(src, "source of a.cpp");
    EXPECT_EQ(digest, sha1("int main() {}\n"));
    EXPECT_TRUE(storage.has_file(digest));
    EXPECT_EQ(storage.describe(digest), "source of a.cpp");

    struct stat64 st = {};
    ASSERT_EQ(stat64(storage.blob_path(digest).c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0444);

    MemoryStream dest;
    storage.get_file_to_stream(digest, dest);
    EXPECT_EQ(dest.data(), "int main() {}\n");
}

// NOLINTNEXTLINE
TEST(directory_storage, same_content_is_stored_once) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    DirectoryStorage storage{tmp_dir.path()};

    MemoryStream first{"data"};
    MemoryStream second{"data"};
    auto digest = storage.put_file_from_stream(first, "first");
    EXPECT_EQ(storage.put_file_from_stream(second, "second"), digest);
    EXPECT_EQ(storage.describe(digest), "first");
}

// NOLINTNEXTLINE
TEST(directory_storage, empty_blob) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    DirectoryStorage storage{tmp_dir.path()};
    MemoryStream src;
    auto digest = storage.put_file_from_stream(src, "");
    EXPECT_EQ(digest, "da39a3ee5e6b4b0d3255bfef95601890afd80709");
    MemoryStream dest;
    storage.get_file_to_stream(digest, dest);
    EXPECT_EQ(dest.data(), "");
}

// NOLINTNEXTLINE
TEST(directory_storage, unknown_digest) {
    TemporaryDirectory tmp_dir("/tmp/gradelib-test.XXXXXX");
    DirectoryStorage storage{tmp_dir.path()};
    MemoryStream dest;
    try {
        storage.get_file_to_stream("0123456789abcdef0123456789abcdef01234567", dest);
        FAIL() << "expected std::system_error";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
    }
    EXPECT_FALSE(storage.has_file("0123456789abcdef0123456789abcdef01234567"));
    EXPECT_THROW(storage.get_file_to_stream("../etc/passwd", dest), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(directory_storage, invalid_root) {
    EXPECT_THROW(DirectoryStorage{"/nonexistent/gradelib/storage"}, std::system_error);
}

// NOLINTNEXTLINE
TEST(directory_storage, is_valid_digest) {
    EXPECT_TRUE(DirectoryStorage::is_valid_digest("da39a3ee5e6b4b0d3255bfef95601890afd80709"));
    EXPECT_FALSE(DirectoryStorage::is_valid_digest("DA39A3EE5E6B4B0D3255BFEF95601890AFD80709"));
    EXPECT_FALSE(DirectoryStorage::is_valid_digest("da39a3ee"));
    EXPECT_FALSE(DirectoryStorage::is_valid_digest(""));
}

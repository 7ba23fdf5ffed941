#include "gradelib/macros/throw.hh"

#include <cerrno>
#include <cstring>
#include <gtest/gtest.h>
#include <string>

// NOLINTNEXTLINE
TEST(macros, THROW_MACRO) {
    try {
        THROW("a ", 1, -42, "c", '.', false, ";");
        ADD_FAILURE();
    } catch (const std::runtime_error& e) {
        constexpr auto line = __LINE__;
        EXPECT_EQ(
            e.what(),
            concat_tostr("a 1-42c.false; (thrown at ", __FILE__, ':', line - 3, ')')
        );
    }
}

// NOLINTNEXTLINE
TEST(macros, THROW_ERRNO_MACRO) {
    try {
        THROW_ERRNO(EACCES, "open('", "x", "')");
        ADD_FAILURE();
    } catch (const std::system_error& e) {
        constexpr auto line = __LINE__;
        EXPECT_EQ(e.code().value(), EACCES);
        std::string what = e.what();
        EXPECT_EQ(
            what.rfind(concat_tostr("open('x') (thrown at ", __FILE__, ':', line - 3, ')'), 0), 0
        ) << what;
        // The error description appears exactly once
        std::string description = std::strerror(EACCES);
        auto pos = what.find(description);
        ASSERT_NE(pos, std::string::npos) << what;
        EXPECT_EQ(what.find(description, pos + 1), std::string::npos) << what;
    }
}

// NOLINTNEXTLINE
TEST(macros, THROW_ERRNO_reads_errno_before_building_message) {
    auto clobber_errno = [] {
        errno = 0;
        return "message";
    };
    errno = ENOENT;
    try {
        THROW_ERRNO(errno, clobber_errno());
        ADD_FAILURE();
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code().value(), ENOENT);
    }
}

#include "gradelib/sandbox/exit_status.hh"

#include <gtest/gtest.h>

using gradelib::sandbox::ExitStatus;

// NOLINTNEXTLINE
TEST(sandbox_exit_status, to_string) {
    static_assert(to_string(ExitStatus::OK) == "ok");
    EXPECT_EQ(to_string(ExitStatus::SIGNAL), "signal");
    EXPECT_EQ(to_string(ExitStatus::TIMEOUT), "timeout");
    EXPECT_EQ(to_string(ExitStatus::TIMEOUT_WALL), "wall timeout");
    EXPECT_EQ(to_string(ExitStatus::NONZERO_RETURN), "nonzero return");
    EXPECT_EQ(to_string(ExitStatus::SANDBOX_ERROR), "sandbox error");
}

// NOLINTNEXTLINE
TEST(sandbox_exit_status, predicates) {
    for (auto status :
         {ExitStatus::OK,
          ExitStatus::SIGNAL,
          ExitStatus::TIMEOUT,
          ExitStatus::TIMEOUT_WALL,
          ExitStatus::NONZERO_RETURN,
          ExitStatus::SANDBOX_ERROR})
    {
        EXPECT_EQ(is_sandbox_error(status), status == ExitStatus::SANDBOX_ERROR) << to_string(status);
        EXPECT_EQ(
            is_timeout(status), status == ExitStatus::TIMEOUT or status == ExitStatus::TIMEOUT_WALL
        ) << to_string(status);
    }
}

#include "gradelib/command.hh"

#include <gtest/gtest.h>

using gradelib::to_shell_str;

// NOLINTNEXTLINE
TEST(command, to_shell_str) {
    EXPECT_EQ(to_shell_str({}), "");
    EXPECT_EQ(to_shell_str({"/usr/bin/gcc", "-O2", "-o", "prog", "a.c"}), "/usr/bin/gcc -O2 -o prog a.c");
    EXPECT_EQ(to_shell_str({"echo", "a b"}), "echo 'a b'");
    EXPECT_EQ(to_shell_str({"echo", ""}), "echo ''");
    EXPECT_EQ(to_shell_str({"echo", "it's"}), "echo 'it'\"'\"'s'");
    EXPECT_EQ(to_shell_str({"sh", "-c", "exit $x"}), "sh -c 'exit $x'");
}

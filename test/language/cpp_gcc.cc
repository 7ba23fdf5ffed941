#include "gradelib/language/cpp_gcc.hh"

#include <gtest/gtest.h>

using gradelib::Command;
using gradelib::language::cpp_gcc;
using gradelib::language::CppStandard;
using std::vector;

// NOLINTNEXTLINE
TEST(language_cpp_gcc, names) {
    EXPECT_EQ(cpp_gcc(CppStandard::Cpp11).name, "C++11 / g++");
    EXPECT_EQ(cpp_gcc(CppStandard::Cpp17).name, "C++17 / g++");
    EXPECT_EQ(cpp_gcc(CppStandard::Gnupp20).name, "GNU++20 / g++");
    EXPECT_EQ(cpp_gcc(CppStandard::Gnupp23).name, "GNU++23 / g++");
}

// NOLINTNEXTLINE
TEST(language_cpp_gcc, extensions) {
    auto lang = cpp_gcc(CppStandard::Gnupp17);
    EXPECT_EQ(lang.source_extensions, (vector<std::string>{".cpp", ".cc", ".cxx", ".c++", ".C"}));
    EXPECT_EQ(lang.header_extensions, (vector<std::string>{".h", ".hpp", ".hxx", ".h++"}));
    EXPECT_EQ(lang.object_extension(), ".o");
    EXPECT_TRUE(lang.is_source_file("a.cc"));
    EXPECT_TRUE(lang.is_source_file("A.C"));
    EXPECT_FALSE(lang.is_source_file("a.c"));
    EXPECT_FALSE(lang.is_source_file("a.hpp"));
}

// NOLINTNEXTLINE
TEST(language_cpp_gcc, compilation_commands) {
    auto lang = cpp_gcc(CppStandard::Gnupp17);
    EXPECT_EQ(
        lang.get_compilation_commands({"main.cpp", "lib.cpp"}, "sol", true),
        (vector<Command>{{
            "/usr/bin/g++",
            "-DEVAL",
            "-std=gnu++17",
            "-O2",
            "-pipe",
            "-static",
            "-s",
            "-o",
            "sol",
            "main.cpp",
            "lib.cpp",
        }})
    );
    EXPECT_EQ(
        cpp_gcc(CppStandard::Cpp20).get_compilation_commands({"main.cpp"}, "sol", false),
        (vector<Command>{
            {"/usr/bin/g++", "-std=c++20", "-O2", "-pipe", "-static", "-s", "-o", "sol", "main.cpp"}
        })
    );
    EXPECT_EQ(lang.get_evaluation_commands("sol", "ignored", {"x"}), (vector<Command>{{"./sol", "x"}}));
}

#include "gradelib/language/language.hh"

#include <gtest/gtest.h>

using gradelib::Command;
using gradelib::language::Language;
using gradelib::language::native_evaluation_commands;
using std::vector;

namespace {

Language pascal() {
    return {
        .name = "Pascal / fpc",
        .source_extensions = {".pas", ".pp"},
        .object_extensions = {".o", ".ppu"},
        .compilation_commands =
            [](const vector<std::string>& sources, const std::string& exe, bool for_evaluation) {
                Command command{"/usr/bin/fpc", "-O2"};
                if (for_evaluation) {
                    command.emplace_back("-dEVAL");
                }
                command.emplace_back("-o" + exe);
                command.emplace_back(sources.front());
                return vector<Command>{std::move(command)};
            },
        .evaluation_commands = native_evaluation_commands,
    };
}

} // namespace

// NOLINTNEXTLINE
TEST(language, extension_accessors) {
    auto lang = pascal();
    EXPECT_EQ(lang.source_extension(), ".pas");
    EXPECT_FALSE(lang.header_extension().has_value());
    EXPECT_EQ(lang.object_extension(), ".o");
}

// NOLINTNEXTLINE
TEST(language, is_source_file) {
    auto lang = pascal();
    EXPECT_TRUE(lang.is_source_file("a.pas"));
    EXPECT_TRUE(lang.is_source_file("x/y.z/a.pp"));
    EXPECT_FALSE(lang.is_source_file("a.PAS"));
    EXPECT_FALSE(lang.is_source_file("a.pas.txt"));
    EXPECT_FALSE(lang.is_source_file(".pas"));
    EXPECT_FALSE(lang.is_source_file("pas"));
    EXPECT_FALSE(lang.is_source_file("x.pas/a"));
    EXPECT_FALSE(lang.is_source_file(""));
}

// NOLINTNEXTLINE
TEST(language, commands) {
    auto lang = pascal();
    EXPECT_EQ(
        lang.get_compilation_commands({"a.pas", "b.pas"}, "exe"),
        (vector<Command>{{"/usr/bin/fpc", "-O2", "-dEVAL", "-oexe", "a.pas"}})
    );
    EXPECT_EQ(
        lang.get_compilation_commands({"a.pas"}, "exe", false),
        (vector<Command>{{"/usr/bin/fpc", "-O2", "-oexe", "a.pas"}})
    );
    EXPECT_EQ(lang.get_evaluation_commands("exe"), (vector<Command>{{"./exe"}}));
}

// NOLINTNEXTLINE
TEST(language, missing_functions) {
    Language lang{.name = "Nothing"};
    EXPECT_THROW((void)lang.get_compilation_commands({"a"}, "b"), std::runtime_error);
    EXPECT_THROW((void)lang.get_evaluation_commands("b"), std::runtime_error);
}

// NOLINTNEXTLINE
TEST(language, native_evaluation_commands) {
    EXPECT_EQ(
        native_evaluation_commands("prog", "Main", {"1", "2"}), (vector<Command>{{"./prog", "1", "2"}})
    );
}

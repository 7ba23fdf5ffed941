#include "gradelib/language/python.hh"

#include <gtest/gtest.h>

using gradelib::Command;
using gradelib::language::python_cpython;
using gradelib::language::PythonVersion;
using std::vector;

// NOLINTNEXTLINE
TEST(language_python, properties) {
    auto py3 = python_cpython(PythonVersion::PY3);
    EXPECT_EQ(py3.name, "Python 3 / CPython");
    EXPECT_EQ(python_cpython(PythonVersion::PY2).name, "Python 2 / CPython");
    EXPECT_EQ(py3.source_extension(), ".py");
    EXPECT_FALSE(py3.header_extension().has_value());
    EXPECT_FALSE(py3.object_extension().has_value());
    EXPECT_EQ(py3.executable_extension, ".zip");
    EXPECT_TRUE(py3.is_source_file("main.py"));
}

// NOLINTNEXTLINE
TEST(language_python, compilation_commands_python2) {
    auto lang = python_cpython(PythonVersion::PY2);
    EXPECT_EQ(
        lang.get_compilation_commands({"main.py", "helper.py"}, "main.zip", true),
        (vector<Command>{
            {"/usr/bin/python2", "-m", "compileall", "."},
            {"/bin/mv", "main.pyc", "__main__.pyc"},
            {"/usr/bin/zip", "main.zip", "__main__.pyc", "helper.pyc"},
        })
    );
}

// NOLINTNEXTLINE
TEST(language_python, compilation_commands_python3) {
    auto lang = python_cpython(PythonVersion::PY3);
    auto commands = lang.get_compilation_commands({"dir/main.py"}, "prog.zip", false);
    EXPECT_EQ(
        commands,
        (vector<Command>{
            {"/usr/bin/python3", "-m", "compileall", "-b", "."},
            {"/bin/mv", "main.pyc", "__main__.pyc"},
            {"/usr/bin/zip", "prog.zip", "__main__.pyc"},
        })
    );
    // The evaluation flag does not matter
    EXPECT_EQ(lang.get_compilation_commands({"dir/main.py"}, "prog.zip", true), commands);
}

// NOLINTNEXTLINE
TEST(language_python, evaluation_commands) {
    auto lang = python_cpython(PythonVersion::PY3);
    EXPECT_EQ(
        lang.get_evaluation_commands("prog.zip", std::nullopt, {"a", "b"}),
        (vector<Command>{{"/usr/bin/python3", "prog.zip", "a", "b"}})
    );
    EXPECT_EQ(
        python_cpython(PythonVersion::PY2).get_evaluation_commands("prog.zip"),
        (vector<Command>{{"/usr/bin/python2", "prog.zip"}})
    );
}

#pragma once

#include <cstdint>
#include <gradelib/language/language.hh>

namespace gradelib::language {

enum class PythonVersion : uint8_t {
    PY2,
    PY3,
};

/**
 * @brief Python run by the system CPython interpreter
 * @details Sources are byte-compiled and packed into a zip archive (the
 *   executable), in which the entry point (the first source) is named
 *   __main__.pyc, so the interpreter can run the archive directly.
 */
Language python_cpython(PythonVersion version);

} // namespace gradelib::language

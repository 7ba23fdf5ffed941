#pragma once

#include <gradelib/language/language.hh>

namespace gradelib::language {

// "C11 / gcc", statically linked with the math library
Language c11_gcc();

} // namespace gradelib::language

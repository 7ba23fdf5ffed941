#pragma once

#include <cstdint>
#include <gradelib/language/language.hh>
#include <string_view>

namespace gradelib::language {

enum class CppStandard : uint8_t {
    Cpp11,
    Cpp14,
    Cpp17,
    Cpp20,
    Cpp23,
    Gnupp11,
    Gnupp14,
    Gnupp17,
    Gnupp20,
    Gnupp23,
};

// Value of the -std= flag, e.g. "c++17"
constexpr std::string_view std_flag_value(CppStandard standard) noexcept {
    switch (standard) {
    case CppStandard::Cpp11: return "c++11";
    case CppStandard::Cpp14: return "c++14";
    case CppStandard::Cpp17: return "c++17";
    case CppStandard::Cpp20: return "c++20";
    case CppStandard::Cpp23: return "c++23";
    case CppStandard::Gnupp11: return "gnu++11";
    case CppStandard::Gnupp14: return "gnu++14";
    case CppStandard::Gnupp17: return "gnu++17";
    case CppStandard::Gnupp20: return "gnu++20";
    case CppStandard::Gnupp23: return "gnu++23";
    }
    __builtin_unreachable();
}

// E.g. "C++17 / g++" or "GNU++17 / g++"
Language cpp_gcc(CppStandard standard);

} // namespace gradelib::language

#pragma once

#include <gradelib/language/language.hh>
#include <string>
#include <string_view>
#include <vector>

namespace gradelib::language {

// Set of languages available to the evaluation pipeline, in priority order
class LanguageRegistry {
    std::vector<Language> languages_;

public:
    LanguageRegistry() = default;

    // C11 (gcc), GNU++20/17/14/11 (g++), Python 3 and Python 2
    static LanguageRegistry with_builtin_languages();

    // Throws if a language with the same name is already registered
    void add(Language language);

    // Throws if there is no language named @p name
    [[nodiscard]] const Language& get(std::string_view name) const;

    // Returns the first language that recognizes @p filename as a source file
    // or nullptr if there is none
    [[nodiscard]] const Language* find_by_filename(std::string_view filename) const noexcept;

    [[nodiscard]] std::vector<std::string> names() const;
};

} // namespace gradelib::language

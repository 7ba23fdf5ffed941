#include <gradelib/language/c_gcc.hh>
#include <gradelib/language/cpp_gcc.hh>
#include <gradelib/language/python.hh>
#include <gradelib/language/registry.hh>
#include <gradelib/macros/throw.hh>

namespace gradelib::language {

LanguageRegistry LanguageRegistry::with_builtin_languages() {
    LanguageRegistry registry;
    registry.add(c11_gcc());
    // The newest standard wins in find_by_filename()
    registry.add(cpp_gcc(CppStandard::Gnupp20));
    registry.add(cpp_gcc(CppStandard::Gnupp17));
    registry.add(cpp_gcc(CppStandard::Gnupp14));
    registry.add(cpp_gcc(CppStandard::Gnupp11));
    registry.add(python_cpython(PythonVersion::PY3));
    registry.add(python_cpython(PythonVersion::PY2));
    return registry;
}

void LanguageRegistry::add(Language language) {
    for (const auto& lang : languages_) {
        if (lang.name == language.name) {
            THROW("Language ", language.name, " is already registered");
        }
    }
    languages_.emplace_back(std::move(language));
}

const Language& LanguageRegistry::get(std::string_view name) const {
    for (const auto& lang : languages_) {
        if (lang.name == name) {
            return lang;
        }
    }
    THROW("Unknown language: ", name);
}

const Language* LanguageRegistry::find_by_filename(std::string_view filename) const noexcept {
    for (const auto& lang : languages_) {
        if (lang.is_source_file(filename)) {
            return &lang;
        }
    }
    return nullptr;
}

std::vector<std::string> LanguageRegistry::names() const {
    std::vector<std::string> res;
    res.reserve(languages_.size());
    for (const auto& lang : languages_) {
        res.emplace_back(lang.name);
    }
    return res;
}

} // namespace gradelib::language

#include <gradelib/concat_tostr.hh>
#include <gradelib/language/language.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/path.hh>

namespace {

std::optional<std::string> first_of(const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return std::nullopt;
    }
    return extensions.front();
}

} // namespace

namespace gradelib::language {

std::vector<Command> Language::get_compilation_commands(
    const std::vector<std::string>& source_filenames,
    const std::string& executable_filename,
    bool for_evaluation
) const {
    if (not compilation_commands) {
        THROW("Language ", name, " has no compilation commands");
    }
    if (source_filenames.empty()) {
        THROW("Language ", name, ": no source files to compile");
    }
    return compilation_commands(source_filenames, executable_filename, for_evaluation);
}

std::vector<Command> Language::get_evaluation_commands(
    const std::string& executable_filename,
    const std::optional<std::string>& main,
    const std::vector<std::string>& args
) const {
    if (not evaluation_commands) {
        THROW("Language ", name, " has no evaluation commands");
    }
    return evaluation_commands(executable_filename, main, args);
}

std::optional<std::string> Language::source_extension() const {
    return first_of(source_extensions);
}

std::optional<std::string> Language::header_extension() const {
    return first_of(header_extensions);
}

std::optional<std::string> Language::object_extension() const {
    return first_of(object_extensions);
}

bool Language::is_source_file(std::string_view filename) const noexcept {
    auto ext = path_extension(filename);
    if (ext.empty()) {
        return false;
    }
    for (const auto& source_ext : source_extensions) {
        if (ext == source_ext) {
            return true;
        }
    }
    return false;
}

std::vector<Command> native_evaluation_commands(
    const std::string& executable_filename,
    const std::optional<std::string>& /*main*/,
    const std::vector<std::string>& args
) {
    Command command{concat_tostr("./", executable_filename)};
    command.insert(command.end(), args.begin(), args.end());
    return {std::move(command)};
}

} // namespace gradelib::language

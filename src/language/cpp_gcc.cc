#include <cctype>
#include <gradelib/concat_tostr.hh>
#include <gradelib/language/cpp_gcc.hh>

namespace gradelib::language {

Language cpp_gcc(CppStandard standard) {
    auto std_flag = concat_tostr("-std=", std_flag_value(standard));
    std::string display_name{std_flag_value(standard)};
    for (char& c : display_name) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    return {
        .name = concat_tostr(display_name, " / g++"),
        .source_extensions = {".cpp", ".cc", ".cxx", ".c++", ".C"},
        .header_extensions = {".h", ".hpp", ".hxx", ".h++"},
        .object_extensions = {".o"},
        .compilation_commands =
            [std_flag = std::move(std_flag)](
                const std::vector<std::string>& source_filenames,
                const std::string& executable_filename,
                bool for_evaluation
            ) {
                Command command{"/usr/bin/g++"};
                if (for_evaluation) {
                    command.emplace_back("-DEVAL");
                }
                command.insert(command.end(), {std_flag, "-O2", "-pipe", "-static", "-s", "-o"});
                command.emplace_back(executable_filename);
                command.insert(command.end(), source_filenames.begin(), source_filenames.end());
                return std::vector<Command>{std::move(command)};
            },
        .evaluation_commands = native_evaluation_commands,
    };
}

} // namespace gradelib::language

#include <gradelib/language/c_gcc.hh>

namespace gradelib::language {

Language c11_gcc() {
    return {
        .name = "C11 / gcc",
        .source_extensions = {".c"},
        .header_extensions = {".h"},
        .object_extensions = {".o"},
        .compilation_commands =
            [](const std::vector<std::string>& source_filenames,
               const std::string& executable_filename,
               bool for_evaluation) {
                Command command{"/usr/bin/gcc"};
                if (for_evaluation) {
                    command.emplace_back("-DEVAL");
                }
                command.insert(
                    command.end(), {"-std=gnu11", "-O2", "-pipe", "-static", "-s", "-o"}
                );
                command.emplace_back(executable_filename);
                command.insert(command.end(), source_filenames.begin(), source_filenames.end());
                command.emplace_back("-lm");
                return std::vector<Command>{std::move(command)};
            },
        .evaluation_commands = native_evaluation_commands,
    };
}

} // namespace gradelib::language

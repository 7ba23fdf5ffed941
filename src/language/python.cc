#include <gradelib/concat_tostr.hh>
#include <gradelib/language/python.hh>
#include <gradelib/path.hh>

namespace {

constexpr const char MAIN_FILENAME[] = "__main__.pyc";

} // namespace

namespace gradelib::language {

Language python_cpython(PythonVersion version) {
    bool py2 = (version == PythonVersion::PY2);
    std::string interpreter = py2 ? "/usr/bin/python2" : "/usr/bin/python3";

    return {
        .name = py2 ? "Python 2 / CPython" : "Python 3 / CPython",
        .source_extensions = {".py"},
        .executable_extension = ".zip",
        .compilation_commands =
            [interpreter, py2](
                const std::vector<std::string>& source_filenames,
                const std::string& executable_filename,
                bool /*for_evaluation*/
            ) {
                std::vector<Command> commands;
                // -b places the .pyc files beside the sources (Python 3 uses
                // __pycache__/ by default)
                if (py2) {
                    commands.push_back({interpreter, "-m", "compileall", "."});
                } else {
                    commands.push_back({interpreter, "-m", "compileall", "-b", "."});
                }

                Command zip{"/usr/bin/zip", executable_filename};
                for (size_t i = 0; i < source_filenames.size(); ++i) {
                    auto pyc_filename = concat_tostr(path_stem(source_filenames[i]), ".pyc");
                    // The file with the entry point is the first one
                    if (i == 0) {
                        commands.push_back({"/bin/mv", pyc_filename, MAIN_FILENAME});
                        zip.emplace_back(MAIN_FILENAME);
                    } else {
                        zip.emplace_back(std::move(pyc_filename));
                    }
                }
                commands.emplace_back(std::move(zip));
                return commands;
            },
        .evaluation_commands =
            [interpreter](
                const std::string& executable_filename,
                const std::optional<std::string>& /*main*/,
                const std::vector<std::string>& args
            ) {
                Command command{interpreter, executable_filename};
                command.insert(command.end(), args.begin(), args.end());
                return std::vector<Command>{std::move(command)};
            },
    };
}

} // namespace gradelib::language

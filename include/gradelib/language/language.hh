#pragma once

#include <functional>
#include <gradelib/command.hh>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gradelib::language {

/**
 * @brief Describes how submissions in one programming language (toolchain)
 *   are compiled and run
 * @details Only data and two pure functions, nothing here touches the
 *   filesystem. The caller executes the returned commands one after another
 *   inside a sandbox.
 */
struct Language {
    // Source filenames (the first one is the entry point for the bundled
    // languages), executable filename, for_evaluation
    using CompilationCommandsFn = std::function<std::vector<Command>(
        const std::vector<std::string>&, const std::string&, bool
    )>;
    // Executable filename, entry point override, runtime arguments
    using EvaluationCommandsFn = std::function<std::vector<Command>(
        const std::string&, const std::optional<std::string>&, const std::vector<std::string>&
    )>;

    std::string name;
    std::vector<std::string> source_extensions;
    std::vector<std::string> header_extensions;
    std::vector<std::string> object_extensions;
    std::string executable_extension;
    bool requires_multithreading = false;
    CompilationCommandsFn compilation_commands;
    EvaluationCommandsFn evaluation_commands;

    // @p for_evaluation adds the EVAL define for the languages having one
    [[nodiscard]] std::vector<Command> get_compilation_commands(
        const std::vector<std::string>& source_filenames,
        const std::string& executable_filename,
        bool for_evaluation = true
    ) const;

    [[nodiscard]] std::vector<Command> get_evaluation_commands(
        const std::string& executable_filename,
        const std::optional<std::string>& main = std::nullopt,
        const std::vector<std::string>& args = {}
    ) const;

    // The first (default) extension of each kind, std::nullopt if the
    // language has none
    [[nodiscard]] std::optional<std::string> source_extension() const;
    [[nodiscard]] std::optional<std::string> header_extension() const;
    [[nodiscard]] std::optional<std::string> object_extension() const;

    [[nodiscard]] bool is_source_file(std::string_view filename) const noexcept;
};

// "./<executable> <args>...", the evaluation of natively compiled programs
std::vector<Command> native_evaluation_commands(
    const std::string& executable_filename,
    const std::optional<std::string>& main,
    const std::vector<std::string>& args
);

} // namespace gradelib::language

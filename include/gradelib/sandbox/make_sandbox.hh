#pragma once

#include <gradelib/config.hh>
#include <gradelib/sandbox/sandbox_base.hh>
#include <gradelib/storage/storage.hh>
#include <memory>
#include <optional>
#include <string>

namespace gradelib::sandbox {

// Creates the sandbox backend named by config.sandbox_implementation, throws
// on unknown names
std::unique_ptr<SandboxBase> make_sandbox(
    const Config& config, storage::Storage& storage, std::optional<std::string> name = std::nullopt
);

enum class RunClass {
    // Compilers and other tools run on behalf of the submission
    COMPILATION,
    // Trusted helpers, e.g. checkers
    TRUSTED,
};

// Sets processes, time, memory and file size limits of @p run_class
void apply_run_class_limits(SandboxBase& sandbox, const Config& config, RunClass run_class);

// Deletes the sandbox root unless keep_sandbox is set and the job failed (the
// directory is left for inspection then)
void cleanup_sandbox(SandboxBase& sandbox, const Config& config, bool job_succeeded);

} // namespace gradelib::sandbox

#include <chrono>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/sandbox/make_sandbox.hh>
#include <gradelib/sandbox/rlimit_sandbox.hh>

namespace gradelib::sandbox {

std::unique_ptr<SandboxBase> make_sandbox(
    const Config& config, storage::Storage& storage, std::optional<std::string> name
) {
    if (config.sandbox_implementation == "rlimit") {
        return std::make_unique<RlimitSandbox>(storage, config, std::move(name));
    }
    THROW("Unknown sandbox implementation: ", config.sandbox_implementation);
}

void apply_run_class_limits(SandboxBase& sandbox, const Config& config, RunClass run_class) {
    uint32_t max_processes = 0;
    double time_limit_s = 0;
    uint64_t memory_kib = 0;
    switch (run_class) {
    case RunClass::COMPILATION:
        max_processes = config.compilation_sandbox_max_processes;
        time_limit_s = config.compilation_sandbox_max_time_s;
        memory_kib = config.compilation_sandbox_max_memory_kib;
        break;
    case RunClass::TRUSTED:
        max_processes = config.trusted_sandbox_max_processes;
        time_limit_s = config.trusted_sandbox_max_time_s;
        memory_kib = config.trusted_sandbox_max_memory_kib;
        break;
    }

    using std::chrono::duration;
    using std::chrono::duration_cast;
    using std::chrono::nanoseconds;
    sandbox.max_processes = max_processes;
    sandbox.cpu_time_limit = duration_cast<nanoseconds>(duration<double>(time_limit_s));
    // 2 * CPU time limit + 1 s
    sandbox.wall_time_limit = duration_cast<nanoseconds>(duration<double>(2 * time_limit_s + 1));
    sandbox.memory_limit = memory_kib * 1024;
    sandbox.fsize = config.max_file_size * 1024;
}

void cleanup_sandbox(SandboxBase& sandbox, const Config& config, bool job_succeeded) {
    bool delete_root = job_succeeded or not config.keep_sandbox;
    if (not delete_root) {
        stdlog("Keeping sandbox ", sandbox.name(), " in ", sandbox.get_root_path());
    }
    sandbox.cleanup(delete_root);
}

} // namespace gradelib::sandbox

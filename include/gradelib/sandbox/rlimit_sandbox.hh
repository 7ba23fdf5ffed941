#pragma once

#include <chrono>
#include <cstdint>
#include <gradelib/config.hh>
#include <gradelib/sandbox/sandbox_base.hh>
#include <linux/filter.h>
#include <optional>
#include <string>
#include <vector>

namespace gradelib::sandbox {

/**
 * @brief Sandbox backend that relies only on an unprivileged fork(): resource
 *   limits via setrlimit(2), a seccomp filter denying dangerous syscalls and a
 *   watchdog enforcing wall and CPU time limits
 * @details The root is a fresh directory under the configured temp_dir. The
 *   filesystem is not isolated, so directory rules and cgroups are not
 *   supported (a warning is logged if they are set).
 */
class RlimitSandbox final : public SandboxBase {
public:
    static constexpr int BOX_EXIT_OK = 0;
    // The program misbehaved, but the sandbox worked correctly
    static constexpr int BOX_EXIT_PROGRAM_FAILED = 1;
    static constexpr int BOX_EXIT_INTERNAL_ERROR = 2;

    struct RunInfo {
        ExitStatus status = ExitStatus::SANDBOX_ERROR;
        int box_exitcode = BOX_EXIT_INTERNAL_ERROR;
        int exit_code = 0;
        int killing_signal = 0;
        std::optional<std::chrono::nanoseconds> cpu_time;
        std::optional<std::chrono::nanoseconds> wall_time;
        std::optional<uint64_t> memory_used; // in bytes
        std::string error_message; // set for SANDBOX_ERROR
    };

private:
    class Process;

    std::string root_path_;
    std::vector<sock_filter> seccomp_program_;
    std::optional<RunInfo> last_run_;
    Process* running_ = nullptr;
    bool unsupported_options_reported_ = false;

public:
    RlimitSandbox(
        storage::Storage& storage,
        const Config& config,
        std::optional<std::string> name = std::nullopt
    );

    // Kills the command that is still running, but never deletes the root
    ~RlimitSandbox() override;

    [[nodiscard]] const std::string& get_root_path() const override { return root_path_; }

    std::optional<std::chrono::nanoseconds> get_execution_time() override;

    std::optional<std::chrono::nanoseconds> get_execution_wall_clock_time();

    std::optional<uint64_t> get_memory_used() override;

    int get_killing_signal() override;

    ExitStatus get_exit_status() override;

    int get_exit_code() override;

    std::string get_human_exit_description() override;

    // std::nullopt before the first run
    [[nodiscard]] const std::optional<RunInfo>& last_run() const noexcept { return last_run_; }

    ExecuteResult execute_without_std(const Command& command, bool wait) override;

    bool translate_box_exitcode(int box_exitcode) override;

    void cleanup(bool delete_root = false) override;

private:
    const RunInfo& last_run_or_throw() const;

    void report_unsupported_options();

    // Failures are logged, they do not fail the run
    void append_to_command_log(const Command& command);

    void record_run(RunInfo info);
};

} // namespace gradelib::sandbox

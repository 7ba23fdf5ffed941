#pragma once

#include <chrono>
#include <cstdint>
#include <gradelib/command.hh>
#include <gradelib/sandbox/exit_status.hh>
#include <gradelib/storage/storage.hh>
#include <gradelib/stream.hh>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <sys/types.h>
#include <variant>
#include <vector>

namespace gradelib::sandbox {

// Additional directory made visible inside the sandbox (honoured only by the
// backends that isolate the filesystem)
struct DirectoryRule {
    std::string src; // path on the host
    std::string dest; // path inside the sandbox
    std::string options; // backend specific, e.g. "rw" or "noexec"
};

// Handle to a command started without waiting for it
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class RunningProcess {
public:
    virtual ~RunningProcess() = default;

    [[nodiscard]] virtual pid_t pid() const noexcept = 0;

    // Returns std::nullopt while the process is still running, otherwise the
    // same value as wait()
    virtual std::optional<bool> poll() = 0;

    // Blocks until the process terminates, returns false iff the sandbox
    // failed internally. The outcome becomes visible through the sandbox's
    // get_exit_status() and friends.
    virtual bool wait() = 0;
};

using ExecuteResult = std::variant<bool, std::unique_ptr<RunningProcess>>;

/**
 * @brief Isolated working directory with resource limits in which untrusted
 *   commands are executed
 * @details One instance is used for one lifecycle: create, populate with files,
 *   run one or more commands (one at a time), inspect the outcome and the
 *   produced files, cleanup. Different instances are independent and may be
 *   used from different threads. Resource settings are public fields that
 *   apply to every subsequent execution. Paths taken by the file operations
 *   are relative to the sandbox root.
 */
class SandboxBase {
public:
    static constexpr uint32_t MULTIPROCESS_MAX_PROCESSES = 1000;

protected:
    storage::Storage& storage_;
    std::string name_;
    std::string temp_dir_;

public:
    std::string cmd_file = "commands.log";
    uint64_t box_id = 0;

    uint32_t max_processes = 1;
    std::optional<std::chrono::nanoseconds> cpu_time_limit;
    std::optional<std::chrono::nanoseconds> wall_time_limit;
    std::optional<uint64_t> memory_limit; // address space, in bytes
    std::optional<uint64_t> fsize; // maximum size of a created file, in bytes
    std::vector<DirectoryRule> dirs;
    bool cgroup = false;
    bool preserve_env = false;
    std::vector<std::string> inherit_env;
    std::map<std::string, std::string, std::less<>> set_env;
    int verbosity = 0;

    SandboxBase(
        storage::Storage& storage, std::optional<std::string> name, std::string temp_dir
    );

    SandboxBase(const SandboxBase&) = delete;
    SandboxBase(SandboxBase&&) = delete;
    SandboxBase& operator=(const SandboxBase&) = delete;
    SandboxBase& operator=(SandboxBase&&) = delete;

    virtual ~SandboxBase() = default;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const std::string& temp_dir() const noexcept { return temp_dir_; }

    [[nodiscard]] storage::Storage& storage() const noexcept { return storage_; }

    void set_multiprocess(bool multiprocess) noexcept {
        max_processes = (multiprocess ? MULTIPROCESS_MAX_PROCESSES : 1);
    }

    // E.g. "[0.124 sec - 3.52 MB]"
    std::string get_stats();

    // Absolute path without trailing '/'
    [[nodiscard]] virtual const std::string& get_root_path() const = 0;

    // CPU time of the last run
    virtual std::optional<std::chrono::nanoseconds> get_execution_time() = 0;

    // Peak memory of the last run, in bytes
    virtual std::optional<uint64_t> get_memory_used() = 0;

    // 0 if the last run was not killed by a signal
    virtual int get_killing_signal() = 0;

    virtual ExitStatus get_exit_status() = 0;

    virtual int get_exit_code() = 0;

    virtual std::string get_human_exit_description() = 0;

    // Maps @p path (taken as if the root was "/") to the path on the host.
    // ".." components never lead outside of the root.
    [[nodiscard]] std::string relative_path(std::string_view path) const;

    // Fails with std::errc::file_exists if @p path already exists
    FileStream create_file(std::string_view path, bool executable = false);

    void create_file_from_storage(
        std::string_view path, std::string_view digest, bool executable = false
    );

    void create_file_from_string(
        std::string_view path, std::string_view content, bool executable = false
    );

    // Read-only stream, limited to @p trunc_len bytes if given
    std::unique_ptr<Stream>
    get_file(std::string_view path, std::optional<uint64_t> trunc_len = std::nullopt);

    // Throws Utf8DecodeError if the contents are not valid UTF-8
    std::string
    get_file_text(std::string_view path, std::optional<uint64_t> trunc_len = std::nullopt);

    std::string
    get_file_to_string(std::string_view path, std::optional<size_t> maxlen = 1024);

    // Returns digest of the stored file
    std::string get_file_to_storage(
        std::string_view path,
        std::string_view description = "",
        std::optional<uint64_t> trunc_len = std::nullopt
    );

    // Symlinks are not followed (as in get_file())
    struct stat64 stat_file(std::string_view path);

    // True also for a dangling symlink
    bool file_exists(std::string_view path);

    void remove_file(std::string_view path);

    // Environment for the executed commands in the "NAME=value" form
    [[nodiscard]] std::vector<std::string> build_environment() const;

    /**
     * @brief Runs @p command inside the sandbox with stdin closed and
     *   stdout/stderr discarded
     *
     * @return If @p wait is true, the bool from translate_box_exitcode() (false
     *   means the sandbox failed, not the program). Otherwise a handle to the
     *   running process. The handle must not outlive the sandbox.
     */
    virtual ExecuteResult execute_without_std(const Command& command, bool wait) = 0;

    // Returns true iff @p box_exitcode means that the sandbox worked fine,
    // throws on codes unknown to the backend
    virtual bool translate_box_exitcode(int box_exitcode) = 0;

    // Kills the running command (if any) and optionally deletes the root.
    // Calling it multiple times is fine.
    virtual void cleanup(bool delete_root = false) = 0;
};

} // namespace gradelib::sandbox

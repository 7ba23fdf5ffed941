#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <gradelib/call_in_destructor.hh>
#include <gradelib/errmsg.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/file_info.hh>
#include <gradelib/file_manip.hh>
#include <gradelib/file_perms.hh>
#include <gradelib/logger.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/sandbox/rlimit_sandbox.hh>
#include <gradelib/sandbox/seccomp/bpf_builder.hh>
#include <linux/seccomp.h>
#include <mutex>
#include <poll.h>
#include <stop_token>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>

using std::string;
using std::chrono::milliseconds;
using std::chrono::nanoseconds;
using std::chrono::steady_clock;

namespace gradelib::sandbox {

namespace {

// How often the watchdog looks at the child's CPU clock
constexpr milliseconds WATCHDOG_INTERVAL{10};

std::vector<sock_filter> build_seccomp_program() {
    seccomp::BpfBuilder bpf{SCMP_ACT_ALLOW};
    for (int syscall_nr : {
             SCMP_SYS(ptrace),
             SCMP_SYS(mount),
             SCMP_SYS(umount2),
             SCMP_SYS(reboot),
             SCMP_SYS(kexec_load),
             SCMP_SYS(init_module),
             SCMP_SYS(delete_module),
             SCMP_SYS(pivot_root),
             SCMP_SYS(chroot),
             SCMP_SYS(swapon),
             SCMP_SYS(swapoff),
         })
    {
        bpf.err_syscall(EPERM, syscall_nr);
    }
    return bpf.export_program();
}

string sanitize_for_filename(const string& str) {
    string res = str;
    for (char& c : res) {
        bool ok = (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
            c == '-' or c == '_';
        if (not ok) {
            c = '_';
        }
    }
    return res;
}

// Everything the child needs, prepared before fork() so that the child does
// not allocate
struct ChildArgs {
    const char* root;
    char* const* argv;
    char* const* envp;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;
    int error_fd;
    std::optional<rlim_t> nproc;
    std::optional<rlim_t> address_space;
    std::optional<rlim_t> fsize;
    std::optional<rlim_t> cpu_seconds;
    const sock_fprog* seccomp_filter;
};

// Sends errno followed by the name of the failed operation to the parent
[[noreturn]] void send_error_message_and_exit(int fd, int errnum, const char* what) noexcept {
    (void)write(fd, &errnum, sizeof(errnum));
    (void)write(fd, what, strlen(what));
    _exit(127);
}

[[noreturn]] void run_child(const ChildArgs& args) noexcept {
    auto send_error_and_exit = [fd = args.error_fd](const char* what) {
        send_error_message_and_exit(fd, errno, what);
    };

    // Create new process group (useful for killing the whole process group)
    if (setpgid(0, 0)) {
        send_error_and_exit("setpgid()");
    }

    sigset_t empty_set;
    sigemptyset(&empty_set);
    if (sigprocmask(SIG_SETMASK, &empty_set, nullptr)) {
        send_error_and_exit("sigprocmask()");
    }

    for (auto [from, to] : {
             std::pair{args.stdin_fd, STDIN_FILENO},
             std::pair{args.stdout_fd, STDOUT_FILENO},
             std::pair{args.stderr_fd, STDERR_FILENO},
         })
    {
        while (dup2(from, to) == -1) {
            if (errno != EINTR) {
                send_error_and_exit("dup2()");
            }
        }
    }

    if (chdir(args.root)) {
        send_error_and_exit("chdir()");
    }

    auto set_limit = [&](int resource, rlim_t value, const char* what) {
        rlimit limit{};
        limit.rlim_cur = limit.rlim_max = value;
        if (setrlimit(resource, &limit)) {
            send_error_and_exit(what);
        }
    };
    set_limit(RLIMIT_CORE, 0, "setrlimit(RLIMIT_CORE)");
    if (args.nproc) {
        set_limit(RLIMIT_NPROC, *args.nproc, "setrlimit(RLIMIT_NPROC)");
    }
    if (args.address_space) {
        set_limit(RLIMIT_AS, *args.address_space, "setrlimit(RLIMIT_AS)");
    }
    if (args.fsize) {
        set_limit(RLIMIT_FSIZE, *args.fsize, "setrlimit(RLIMIT_FSIZE)");
    }
    if (args.cpu_seconds) {
        // Useful when the parent dies, otherwise the watchdog is first
        set_limit(RLIMIT_CPU, *args.cpu_seconds, "setrlimit(RLIMIT_CPU)");
    }

    // Close file descriptors that are not needed (for security reasons), the
    // error pipe is kept just after stderr (it has the FD_CLOEXEC flag set)
    int error_fd = args.error_fd;
    if (error_fd != STDERR_FILENO + 1) {
        error_fd = dup3(error_fd, STDERR_FILENO + 1, O_CLOEXEC);
        if (error_fd == -1) {
            send_error_and_exit("dup3()");
        }
    }
    auto send_error = [error_fd](const char* what) {
        send_error_message_and_exit(error_fd, errno, what);
    };
    if (syscall(SYS_close_range, static_cast<unsigned>(error_fd + 1), ~0U, 0U)) {
        send_error("close_range()");
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0)) {
        send_error("prctl(PR_SET_NO_NEW_PRIVS)");
    }
    if (syscall(SYS_seccomp, SECCOMP_SET_MODE_FILTER, 0, args.seccomp_filter)) {
        send_error("seccomp()");
    }

    execve(args.argv[0], args.argv, args.envp);
    send_error_message_and_exit(error_fd, errno, "execve()");
}

std::pair<FileDescriptor, FileDescriptor> make_pipe() {
    std::array<int, 2> pfd{};
    if (pipe2(pfd.data(), O_CLOEXEC) == -1) {
        THROW("pipe2()", errmsg());
    }
    return {FileDescriptor{pfd[0]}, FileDescriptor{pfd[1]}};
}

nanoseconds to_nanoseconds(const timeval& tv) noexcept {
    return std::chrono::seconds{tv.tv_sec} + std::chrono::microseconds{tv.tv_usec};
}

} // namespace

class RlimitSandbox::Process final : public RunningProcess {
    RlimitSandbox* sandbox_;
    pid_t pid_ = -1;
    FileDescriptor pidfd_;
    FileDescriptor stdout_;
    FileDescriptor stderr_;
    FileDescriptor error_;
    std::optional<clockid_t> cpu_clock_;
    std::optional<nanoseconds> cpu_time_limit_;
    std::optional<nanoseconds> wall_time_limit_;
    steady_clock::time_point start_;
    std::atomic<bool> cpu_time_limit_exceeded_{false};
    std::atomic<bool> wall_time_limit_exceeded_{false};
    std::optional<bool> result_;
    // Enforces the time limits whether or not the owner polls
    std::jthread watchdog_;

public:
    Process(RlimitSandbox& sandbox, const Command& command);

    Process(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(const Process&) = delete;
    Process& operator=(Process&&) = delete;

    ~Process() override;

    [[nodiscard]] pid_t pid() const noexcept override { return pid_; }

    std::optional<bool> poll() override {
        if (step(milliseconds{0})) {
            return result_;
        }
        return std::nullopt;
    }

    bool wait() override {
        while (not step(std::nullopt)) {
        }
        return *result_;
    }

    // Used when the sandbox is cleaned up or destroyed before the process
    // finished
    void kill_and_reap() noexcept;

    void detach() noexcept { sandbox_ = nullptr; }

private:
    void spawn(const Command& command);

    void fail(string message);

    void kill_group() const noexcept {
        if (pid_ <= 0) {
            return;
        }
        (void)kill(-pid_, SIGKILL);
        (void)kill(pid_, SIGKILL); // the child may have not called setpgid() yet
    }

    void check_limits() noexcept;

    void start_watchdog();

    // Has to be called before the child is reaped, so that a recycled pid
    // is never killed
    void stop_watchdog() noexcept {
        if (watchdog_.joinable()) {
            watchdog_.request_stop();
            watchdog_.join();
        }
    }

    // Returns true iff the process has finished
    bool step(std::optional<milliseconds> max_wait);

    void finish();

    void complete(RunInfo info);
};

RlimitSandbox::Process::Process(RlimitSandbox& sandbox, const Command& command)
: sandbox_{&sandbox} {
    sandbox_->running_ = this;
    try {
        spawn(command);
    } catch (const std::exception& e) {
        // spawn() does not leave the child alive when it throws
        fail(e.what());
    }
}

RlimitSandbox::Process::~Process() {
    if (not result_) {
        kill_and_reap();
    }
    if (sandbox_ and sandbox_->running_ == this) {
        sandbox_->running_ = nullptr;
    }
}

void RlimitSandbox::Process::spawn(const Command& command) {
    auto& sandbox = *sandbox_;
    sandbox.append_to_command_log(command);

    std::vector<char*> argv;
    argv.reserve(command.size() + 1);
    for (const auto& arg : command) {
        argv.emplace_back(const_cast<char*>(arg.c_str()));
    }
    argv.emplace_back(nullptr);

    auto env = sandbox.build_environment();
    std::vector<char*> envp;
    envp.reserve(env.size() + 1);
    for (auto& var : env) {
        envp.emplace_back(var.data());
    }
    envp.emplace_back(nullptr);

    auto& program = sandbox.seccomp_program_;
    sock_fprog seccomp_filter{
        .len = static_cast<decltype(sock_fprog::len)>(program.size()),
        .filter = program.data(),
    };

    auto [stdin_r, stdin_w] = make_pipe();
    auto [stdout_r, stdout_w] = make_pipe();
    auto [stderr_r, stderr_w] = make_pipe();
    auto [error_r, error_w] = make_pipe();

    cpu_time_limit_ = sandbox.cpu_time_limit;
    wall_time_limit_ = sandbox.wall_time_limit;

    ChildArgs args{
        .root = sandbox.root_path_.c_str(),
        .argv = argv.data(),
        .envp = envp.data(),
        .stdin_fd = stdin_r,
        .stdout_fd = stdout_w,
        .stderr_fd = stderr_w,
        .error_fd = error_w,
        .nproc = std::nullopt,
        .address_space = sandbox.memory_limit,
        .fsize = sandbox.fsize,
        .cpu_seconds = std::nullopt,
        .seccomp_filter = &seccomp_filter,
    };
    // RLIMIT_NPROC counts all processes of the user and does not apply to root
    if (geteuid() != 0) {
        args.nproc = sandbox.max_processes;
    }
    if (cpu_time_limit_) {
        args.cpu_seconds =
            static_cast<rlim_t>(std::ceil(std::chrono::duration<double>(*cpu_time_limit_).count())) +
            1;
    }

    pid_t pid = fork();
    if (pid == -1) {
        THROW("fork()", errmsg());
    }
    if (pid == 0) {
        run_child(args);
    }
    start_ = steady_clock::now();
    pid_ = pid;

    // Useful when exception is thrown
    CallInDtor kill_and_wait_child_guard{[&]() noexcept {
        kill_group();
        while (waitpid(pid_, nullptr, 0) == -1 and errno == EINTR) {
        }
        pid_ = -1;
    }};

    // The ends used by the child, stdin is closed just after the start
    (void)stdin_r.close();
    (void)stdin_w.close();
    (void)stdout_w.close();
    (void)stderr_w.close();
    (void)error_w.close();

    pidfd_ = FileDescriptor{static_cast<int>(syscall(SYS_pidfd_open, pid_, 0))};
    if (not pidfd_.is_open()) {
        THROW("pidfd_open()", errmsg());
    }
    if (stdout_r.add_status_flags(O_NONBLOCK) or stderr_r.add_status_flags(O_NONBLOCK)) {
        THROW("fcntl()", errmsg());
    }
    if (clockid_t clock_id = 0; clock_getcpuclockid(pid_, &clock_id) == 0) {
        cpu_clock_ = clock_id;
    }

    stdout_ = std::move(stdout_r);
    stderr_ = std::move(stderr_r);
    error_ = std::move(error_r);
    start_watchdog();
    kill_and_wait_child_guard.cancel();
}

void RlimitSandbox::Process::start_watchdog() {
    if (not wall_time_limit_ and not(cpu_time_limit_ and cpu_clock_)) {
        return;
    }
    watchdog_ = std::jthread{[this](std::stop_token stop) {
        std::mutex mtx;
        std::condition_variable_any cv;
        std::unique_lock lock{mtx};
        while (not cv.wait_for(lock, stop, WATCHDOG_INTERVAL, [&stop] {
            return stop.stop_requested();
        }))
        {
            check_limits();
        }
    }};
}

void RlimitSandbox::Process::fail(string message) {
    RunInfo info;
    info.status = ExitStatus::SANDBOX_ERROR;
    info.box_exitcode = BOX_EXIT_INTERNAL_ERROR;
    info.error_message = std::move(message);
    complete(std::move(info));
}

void RlimitSandbox::Process::kill_and_reap() noexcept {
    if (result_) {
        return;
    }
    stop_watchdog();
    if (pid_ > 0) {
        kill_group();
        while (waitpid(pid_, nullptr, 0) == -1 and errno == EINTR) {
        }
    }
    result_ = false;
    if (sandbox_) {
        RunInfo info;
        info.error_message = "execution was cancelled";
        sandbox_->record_run(std::move(info));
    }
}

void RlimitSandbox::Process::check_limits() noexcept {
    if (wall_time_limit_ and not wall_time_limit_exceeded_ and
        steady_clock::now() - start_ >= *wall_time_limit_)
    {
        wall_time_limit_exceeded_ = true;
        kill_group();
    }

    if (cpu_time_limit_ and cpu_clock_ and not cpu_time_limit_exceeded_) {
        timespec ts{};
        // On failure the rusage decides after the child exits
        if (clock_gettime(*cpu_clock_, &ts) == 0 and
            std::chrono::seconds{ts.tv_sec} + nanoseconds{ts.tv_nsec} >= *cpu_time_limit_)
        {
            cpu_time_limit_exceeded_ = true;
            kill_group();
        }
    }
}

bool RlimitSandbox::Process::step(std::optional<milliseconds> max_wait) {
    if (result_) {
        return true;
    }

    auto step_start = steady_clock::now();
    // Output is discarded, but the pipes have to be drained so that the child
    // does not block on a full pipe
    std::array<char, 65536> buff{};
    auto drain = [&](FileDescriptor& fd) {
        for (;;) {
            ssize_t rc = read(fd, buff.data(), buff.size());
            if (rc > 0) {
                continue;
            }
            if (rc == 0) {
                (void)fd.close(); // EOF
                return;
            }
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN) {
                return;
            }
            THROW("read()", errmsg());
        }
    };

    for (;;) {
        int timeout = -1; // the watchdog kills the child on timeout
        if (max_wait) {
            auto waited = std::chrono::duration_cast<milliseconds>(steady_clock::now() - step_start);
            timeout = static_cast<int>(std::max(milliseconds{0}, *max_wait - waited).count());
        }

        // Closed pipes have negative descriptors and are ignored by poll()
        std::array<pollfd, 3> pfds{{
            {.fd = stdout_, .events = POLLIN, .revents = 0},
            {.fd = stderr_, .events = POLLIN, .revents = 0},
            {.fd = pidfd_, .events = POLLIN, .revents = 0},
        }};
        int rc = ::poll(pfds.data(), pfds.size(), timeout);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }

        if (pfds[0].revents) {
            drain(stdout_);
        }
        if (pfds[1].revents) {
            drain(stderr_);
        }
        if (pfds[2].revents & POLLIN) {
            finish();
            return true;
        }

        if (max_wait and steady_clock::now() - step_start >= *max_wait) {
            return false;
        }
    }
}

void RlimitSandbox::Process::finish() {
    stop_watchdog();
    // Remaining members of the process group (the child itself is a zombie now)
    kill_group();

    int status = 0;
    rusage ru{};
    while (wait4(pid_, &status, 0, &ru) == -1) {
        if (errno != EINTR) {
            THROW("wait4()", errmsg());
        }
    }
    auto wall_time = steady_clock::now() - start_;
    (void)stdout_.close();
    (void)stderr_.close();
    (void)pidfd_.close();

    auto error_report = get_file_contents(error_);
    (void)error_.close();

    RunInfo info;
    info.wall_time = std::chrono::duration_cast<nanoseconds>(wall_time);
    info.cpu_time = to_nanoseconds(ru.ru_utime) + to_nanoseconds(ru.ru_stime);
    info.memory_used = static_cast<uint64_t>(ru.ru_maxrss) * 1024;

    if (not error_report.empty()) {
        int errnum = 0;
        if (error_report.size() >= sizeof(errnum)) {
            std::memcpy(&errnum, error_report.data(), sizeof(errnum));
            info.error_message = concat_tostr(
                "sandboxed process setup failed: ",
                std::string_view{error_report}.substr(sizeof(errnum)),
                errmsg(errnum)
            );
        } else {
            info.error_message = "sandboxed process setup failed";
        }
        info.status = ExitStatus::SANDBOX_ERROR;
        info.box_exitcode = BOX_EXIT_INTERNAL_ERROR;
    } else if (wall_time_limit_exceeded_) {
        info.status = ExitStatus::TIMEOUT_WALL;
    } else if (cpu_time_limit_exceeded_ or (WIFSIGNALED(status) and WTERMSIG(status) == SIGXCPU) or
               (cpu_time_limit_ and *info.cpu_time > *cpu_time_limit_))
    {
        info.status = ExitStatus::TIMEOUT;
    } else if (WIFSIGNALED(status)) {
        info.status = ExitStatus::SIGNAL;
        info.killing_signal = WTERMSIG(status);
    } else if (WEXITSTATUS(status) != 0) {
        info.status = ExitStatus::NONZERO_RETURN;
        info.exit_code = WEXITSTATUS(status);
    } else {
        info.status = ExitStatus::OK;
    }

    if (info.status != ExitStatus::SANDBOX_ERROR) {
        info.box_exitcode = (info.status == ExitStatus::OK ? BOX_EXIT_OK : BOX_EXIT_PROGRAM_FAILED);
    }
    complete(std::move(info));
}

void RlimitSandbox::Process::complete(RunInfo info) {
    int box_exitcode = info.box_exitcode;
    if (sandbox_) {
        sandbox_->record_run(std::move(info));
        result_ = sandbox_->translate_box_exitcode(box_exitcode);
    } else {
        result_ = (box_exitcode != BOX_EXIT_INTERNAL_ERROR);
    }
}

RlimitSandbox::RlimitSandbox(
    storage::Storage& storage, const Config& config, std::optional<std::string> name
)
: SandboxBase{storage, std::move(name), config.temp_dir}
, seccomp_program_{build_seccomp_program()} {
    cgroup = config.use_cgroups;

    std::string_view dir = temp_dir_;
    while (dir.size() > 1 and dir.back() == '/') {
        dir.remove_suffix(1);
    }
    auto templ = concat_tostr(dir, "/gradelib-", sanitize_for_filename(name_), "-XXXXXX");
    if (mkdtemp(templ.data()) == nullptr) {
        THROW_ERRNO(errno, "mkdtemp('", templ, "')");
    }
    root_path_ = std::move(templ);
    if (chmod(root_path_.c_str(), S_0755)) {
        int errnum = errno;
        (void)remove_r(root_path_);
        THROW_ERRNO(errnum, "chmod('", root_path_, "')");
    }
    debuglog("Sandbox ", name_, " created in ", root_path_);
}

RlimitSandbox::~RlimitSandbox() {
    if (auto* process = running_; process) {
        process->kill_and_reap();
        process->detach();
        running_ = nullptr;
    }
}

const RlimitSandbox::RunInfo& RlimitSandbox::last_run_or_throw() const {
    if (not last_run_) {
        THROW("No command has been executed in sandbox ", name_, " yet");
    }
    return *last_run_;
}

std::optional<nanoseconds> RlimitSandbox::get_execution_time() {
    return last_run_ ? last_run_->cpu_time : std::nullopt;
}

std::optional<nanoseconds> RlimitSandbox::get_execution_wall_clock_time() {
    return last_run_ ? last_run_->wall_time : std::nullopt;
}

std::optional<uint64_t> RlimitSandbox::get_memory_used() {
    return last_run_ ? last_run_->memory_used : std::nullopt;
}

int RlimitSandbox::get_killing_signal() { return last_run_or_throw().killing_signal; }

ExitStatus RlimitSandbox::get_exit_status() { return last_run_or_throw().status; }

int RlimitSandbox::get_exit_code() { return last_run_or_throw().exit_code; }

std::string RlimitSandbox::get_human_exit_description() {
    const auto& run = last_run_or_throw();
    switch (run.status) {
    case ExitStatus::OK:
        return concat_tostr("Execution successfully finished (with exit code ", run.exit_code, ')');
    case ExitStatus::SANDBOX_ERROR: return "Execution failed because of sandbox error";
    case ExitStatus::SIGNAL:
        return concat_tostr("Execution killed with signal ", run.killing_signal);
    case ExitStatus::TIMEOUT: return "Execution timed out";
    case ExitStatus::TIMEOUT_WALL: return "Execution timed out (wall clock limit exceeded)";
    case ExitStatus::NONZERO_RETURN:
        return "Execution failed because the return code was nonzero";
    }
    THROW("Invalid exit status: ", static_cast<int>(run.status));
}

ExecuteResult RlimitSandbox::execute_without_std(const Command& command, bool wait) {
    if (command.empty()) {
        THROW("Cannot execute an empty command");
    }
    if (running_) {
        THROW("Another command is still running in sandbox ", name_);
    }
    report_unsupported_options();
    debuglog("Executing in sandbox ", name_, ": ", to_shell_str(command));

    auto process = std::make_unique<Process>(*this, command);
    if (wait) {
        return process->wait();
    }
    return std::unique_ptr<RunningProcess>{std::move(process)};
}

bool RlimitSandbox::translate_box_exitcode(int box_exitcode) {
    switch (box_exitcode) {
    case BOX_EXIT_OK:
    case BOX_EXIT_PROGRAM_FAILED: return true;
    case BOX_EXIT_INTERNAL_ERROR: return false;
    default: THROW("Sandbox exit status (", box_exitcode, ") unknown");
    }
}

void RlimitSandbox::cleanup(bool delete_root) {
    if (running_) {
        running_->kill_and_reap();
    }
    if (delete_root and path_exists(root_path_)) {
        debuglog("Deleting sandbox ", name_, " in ", root_path_);
        if (remove_r(root_path_)) {
            int errnum = errno;
            errlog("Failed to delete sandbox ", name_, " in ", root_path_, errmsg(errnum));
            THROW_ERRNO(errnum, "remove_r('", root_path_, "')");
        }
    }
}

void RlimitSandbox::report_unsupported_options() {
    if (unsupported_options_reported_) {
        return;
    }
    if (not dirs.empty()) {
        stdlog(
            "Warning: sandbox ",
            name_,
            ": directory rules are not supported by the rlimit sandbox, ignoring them"
        );
        unsupported_options_reported_ = true;
    }
    if (cgroup) {
        stdlog(
            "Warning: sandbox ",
            name_,
            ": cgroups are not supported by the rlimit sandbox, ignoring them"
        );
        unsupported_options_reported_ = true;
    }
}

void RlimitSandbox::append_to_command_log(const Command& command) {
    auto path = concat_tostr(root_path_, '/', cmd_file);
    FileDescriptor fd{path, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC | O_NOFOLLOW, S_0644};
    if (not fd.is_open()) {
        errlog("Sandbox ", name_, ": failed to open command log: open('", path, "')", errmsg());
        return;
    }
    auto line = concat_tostr(to_shell_str(command), '\n');
    if (write_all(fd, line) != line.size()) {
        errlog("Sandbox ", name_, ": failed to append to command log '", path, "'", errmsg());
    }
}

void RlimitSandbox::record_run(RunInfo info) {
    last_run_ = std::move(info);
    if (running_) {
        running_ = nullptr;
    }
    if (last_run_->status == ExitStatus::SANDBOX_ERROR) {
        errlog(
            "Sandbox ",
            name_,
            ": ",
            last_run_->error_message,
            ". This is an internal error, not a fault of the executed program."
        );
    }
    debuglog("Sandbox ", name_, ": ", get_human_exit_description(), ' ', get_stats());
}

} // namespace gradelib::sandbox

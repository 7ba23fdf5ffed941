#pragma once

#include <cstdint>
#include <linux/filter.h>
#include <seccomp.h>
#include <vector>

namespace gradelib::sandbox::seccomp {

// Builds a classic BPF seccomp program for the native architecture. The
// exported program is installed with seccomp(2) directly, after fork().
class BpfBuilder {
    scmp_filter_ctx seccomp_ctx;

public:
    explicit BpfBuilder(uint32_t def_action);

    BpfBuilder(const BpfBuilder&) = delete;
    BpfBuilder(BpfBuilder&&) = delete;
    BpfBuilder& operator=(const BpfBuilder&) = delete;
    BpfBuilder& operator=(BpfBuilder&&) = delete;

    // @p syscall will fail with @p errnum instead of being executed
    void err_syscall(int errnum, int syscall);

    [[nodiscard]] std::vector<sock_filter> export_program() const;

    ~BpfBuilder() { seccomp_release(seccomp_ctx); }
};

} // namespace gradelib::sandbox::seccomp

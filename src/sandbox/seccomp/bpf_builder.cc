#include <algorithm>
#include <gradelib/errmsg.hh>
#include <gradelib/file_contents.hh>
#include <gradelib/file_descriptor.hh>
#include <gradelib/macros/throw.hh>
#include <gradelib/sandbox/seccomp/bpf_builder.hh>
#include <sys/mman.h>

namespace gradelib::sandbox::seccomp {

BpfBuilder::BpfBuilder(uint32_t def_action)
: seccomp_ctx{seccomp_init(def_action)} {
    if (!seccomp_ctx) {
        THROW("seccomp_init() failed");
    }

    // Enable binary tree sorted syscalls in the filter
    int err = seccomp_attr_set(seccomp_ctx, SCMP_FLTATR_CTL_OPTIMIZE, 2);
    if (err) {
        seccomp_release(seccomp_ctx);
        THROW("seccomp_attr_set()", errmsg(-err));
    }
}

void BpfBuilder::err_syscall(int errnum, int syscall) {
    int err = seccomp_rule_add(seccomp_ctx, SCMP_ACT_ERRNO(errnum), syscall, 0);
    if (err) {
        THROW("seccomp_rule_add()", errmsg(-err));
    }
}

std::vector<sock_filter> BpfBuilder::export_program() const {
    auto mfd = FileDescriptor{memfd_create("seccomp bpf", MFD_CLOEXEC)};
    if (!mfd.is_open()) {
        THROW("memfd_create()", errmsg());
    }

    int err = seccomp_export_bpf(seccomp_ctx, mfd);
    if (err) {
        THROW("seccomp_export_bpf()", errmsg(-err));
    }

    if (lseek64(mfd, 0, SEEK_SET) < 0) {
        THROW("lseek64()", errmsg());
    }
    auto bpf = get_file_contents(mfd);
    if (bpf.size() % sizeof(sock_filter) != 0) {
        THROW(
            "invalid exported seccomp filter length: ",
            bpf.size(),
            " is not a multiple of ",
            sizeof(sock_filter)
        );
    }

    std::vector<sock_filter> program(bpf.size() / sizeof(sock_filter));
    std::copy(bpf.begin(), bpf.end(), reinterpret_cast<char*>(program.data()));
    return program;
}

} // namespace gradelib::sandbox::seccomp

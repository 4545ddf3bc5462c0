#include "patchbench/seccomp.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstring>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/syscall.h>

#if defined(__x86_64__)
  #define PATCHBENCH_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define PATCHBENCH_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define PATCHBENCH_AUDIT_ARCH 0
#endif

#define PB_STMT(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define PB_JUMP(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace patchbench {

std::string install_network_deny_filter() {
#if PATCHBENCH_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
#ifdef __NR_io_uring_setup
    const unsigned int uring_nr = __NR_io_uring_setup;
#else
    const unsigned int uring_nr = 0xffffffffu;
#endif
    // args[0] low word; both supported targets are little-endian.
    const unsigned int arg0 = offsetof(struct seccomp_data, args);

    struct sock_filter filter[] = {
        // [0] foreign ABI (e.g. i386 via int 0x80) could bypass the nr checks
        PB_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)),
        PB_JUMP(BPF_JMP | BPF_JEQ | BPF_K, PATCHBENCH_AUDIT_ARCH, 1, 0),
        PB_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA)),
        // [3] x32 syscalls (nr | 0x40000000) share AUDIT_ARCH_X86_64
        PB_STMT(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)),
        PB_JUMP(BPF_JMP | BPF_JGE | BPF_K, 0x40000000u, 0, 1),
        PB_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA)),
        // [6]
        PB_JUMP(BPF_JMP | BPF_JEQ | BPF_K, uring_nr, 0, 1),
        PB_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (ENOSYS & SECCOMP_RET_DATA)),
        // [8]
        PB_JUMP(BPF_JMP | BPF_JEQ | BPF_K, __NR_socket, 1, 0),
        PB_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        // [10] socket(domain, ...)
        PB_STMT(BPF_LD | BPF_W | BPF_ABS, arg0),
        PB_JUMP(BPF_JMP | BPF_JEQ | BPF_K, AF_INET, 3, 0),
        PB_JUMP(BPF_JMP | BPF_JEQ | BPF_K, AF_INET6, 2, 0),
        PB_JUMP(BPF_JMP | BPF_JEQ | BPF_K, AF_PACKET, 1, 0),
        PB_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW),
        // [15]
        PB_STMT(BPF_RET | BPF_K, SECCOMP_RET_ERRNO | (EACCES & SECCOMP_RET_DATA)),
    };

    struct sock_fprog prog;
    prog.len = (unsigned short)(sizeof(filter) / sizeof(filter[0]));
    prog.filter = filter;

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // PR_GET_SECCOMP returns the current mode (0 = disabled) or fails with
    // EINVAL when the kernel was built without it.
    return prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

} // namespace patchbench

#else // !__linux__

namespace patchbench {

std::string install_network_deny_filter() { return "seccomp: not supported on this platform"; }
bool seccomp_available() { return false; }

} // namespace patchbench

#endif

#pragma once

// Network isolation for sandboxed commands via seccomp-BPF.
//
// Unlike a full syscall allowlist this filter only targets egress: socket()
// for AF_INET, AF_INET6 and AF_PACKET fails with EACCES, and io_uring setup
// fails with ENOSYS so sockets cannot be created through a ring either.
// Local AF_UNIX sockets keep working (test runners use them).

#include <string>

namespace patchbench {

// Install the filter in the calling process. Must be called after
// prctl(PR_SET_NO_NEW_PRIVS, 1). Returns empty string on success.
std::string install_network_deny_filter();

bool seccomp_available();

} // namespace patchbench

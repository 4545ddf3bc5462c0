#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace patchbench {

// Cooperative cancellation flag shared between an operator signal handler
// and the attempt thread. Checked at every wait slice of a running child.
class CancelToken {
public:
    void cancel() { flag_.store(true, std::memory_order_relaxed); }
    bool cancelled() const { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

struct ProcLimits {
    int timeout_ms{30000};
    size_t output_max_bytes{8 * 1024 * 1024}; // per stream, on disk
    size_t capture_max_bytes{256 * 1024};     // per stream, in memory

    int rlimit_cpu_sec{0};          // 0 = leave inherited
    size_t rlimit_as_mb{4096};      // virtual memory MB
    size_t rlimit_fsize_mb{256};    // max file size MB
    int rlimit_nofile{1024};        // max open fds
    int rlimit_nproc{512};          // max processes (per uid, best-effort)

    bool no_new_privs{true};

    // Install the socket-deny seccomp filter before exec. Failure to install
    // is a start failure, not a silent downgrade.
    bool deny_network{false};
};

struct ProcSpec {
    std::vector<std::string> argv;
    std::string cwd;
    std::vector<std::string> env;   // "KEY=VALUE", applied after scrubbing
    bool inherit_env{false};        // false: child sees only `env`
    std::string stdin_data;         // callers must ignore SIGPIPE
    std::string stdout_path;        // optional durable capture
    std::string stderr_path;
};

struct ProcResult {
    int exit_code{127};
    bool started{false};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string stdout_text;        // first capture_max_bytes of stdout
    std::string stderr_text;
    int elapsed_ms{0};
    std::string error;              // runner error, not child stderr
};

// Fork/exec argv in its own process group with rlimits, no_new_privs and an
// optional network-deny filter. stdout/stderr are streamed to the ProcSpec
// capture files as they arrive so a kill never loses what was written.
// Returns false only when the child could not be started (res->error set).
bool proc_run(const ProcSpec& spec, const ProcLimits& lim, const CancelToken* cancel, ProcResult* res);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace patchbench

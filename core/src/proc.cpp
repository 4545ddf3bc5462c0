#include "patchbench/proc.h"
#include "patchbench/seccomp.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace patchbench {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have) out.push_back(cur);
                cur.clear();
                have = false;
                continue;
            }
            have = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) { cur.push_back(c); esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    if (have) out.push_back(cur);
    return out;
}

namespace {

void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

// Report a pre-exec failure to the parent over the status pipe and exit.
[[noreturn]] void child_fail(int status_fd, const char* what) {
    int saved = errno;
    char msg[256];
    int n = std::snprintf(msg, sizeof(msg), "%s: %s", what, saved ? std::strerror(saved) : "failed");
    if (n > 0) (void)!write(status_fd, msg, std::min<size_t>((size_t)n, sizeof(msg) - 1));
    _exit(127);
}

int open_capture(const std::string& path) {
    if (path.empty()) return -1;
    return ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

void set_nonblock(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

struct Sink {
    int pipe_fd{-1};
    int file_fd{-1};
    size_t on_disk{0};
    std::string* mem{nullptr};
    bool truncated{false};

    void append(const char* buf, size_t n, const ProcLimits& lim) {
        if (mem) {
            size_t room = lim.capture_max_bytes > mem->size() ? lim.capture_max_bytes - mem->size() : 0;
            mem->append(buf, std::min(room, n));
        }
        if (file_fd >= 0) {
            size_t room = lim.output_max_bytes > on_disk ? lim.output_max_bytes - on_disk : 0;
            size_t take = std::min(room, n);
            size_t off = 0;
            while (off < take) {
                ssize_t w = ::write(file_fd, buf + off, take - off);
                if (w < 0 && errno == EINTR) continue;
                if (w <= 0) break;
                off += (size_t)w;
            }
            on_disk += off;
            if (take < n) truncated = true;
        } else if (mem && mem->size() >= lim.capture_max_bytes) {
            truncated = true;
        }
    }

    // Returns false once the pipe reached EOF.
    bool drain(const ProcLimits& lim) {
        char buf[8192];
        while (true) {
            ssize_t n = ::read(pipe_fd, buf, sizeof(buf));
            if (n > 0) { append(buf, (size_t)n, lim); continue; }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            return false;
        }
    }
};

void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

} // namespace

bool proc_run(const ProcSpec& spec, const ProcLimits& lim, const CancelToken* cancel, ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (spec.argv.empty() || spec.argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int in_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&]() {
        for (int* p : {out_pipe, err_pipe, in_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0 ||
        pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return false;
    }

    Sink out_sink, err_sink;
    out_sink.file_fd = open_capture(spec.stdout_path);
    err_sink.file_fd = open_capture(spec.stderr_path);
    if ((!spec.stdout_path.empty() && out_sink.file_fd < 0) ||
        (!spec.stderr_path.empty() && err_sink.file_fd < 0)) {
        res->error = std::string("cannot open capture file: ") + std::strerror(errno);
        close_fd(out_sink.file_fd);
        close_fd(err_sink.file_fd);
        close_all();
        return false;
    }

    // argv/env are materialized before fork; the child only touches them.
    std::vector<char*> cargv;
    cargv.reserve(spec.argv.size() + 1);
    for (const auto& s : spec.argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(out_sink.file_fd);
        close_fd(err_sink.file_fd);
        close_all();
        return false;
    }

    if (pid == 0) {
        const int sfd = status_pipe[1];
        if (dup2(in_pipe[0], STDIN_FILENO) < 0 || dup2(out_pipe[1], STDOUT_FILENO) < 0 ||
            dup2(err_pipe[1], STDERR_FILENO) < 0) {
            child_fail(sfd, "dup2");
        }

        // own process group so a deadline kills the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != sfd) (void)close(fd);
        }

        if (!spec.cwd.empty() && chdir(spec.cwd.c_str()) != 0) {
            child_fail(sfd, "chdir");
        }

        if (!spec.inherit_env) {
            (void)clearenv();
        }
        unsetenv("LD_PRELOAD");
        unsetenv("LD_LIBRARY_PATH");
        for (const auto& kv : spec.env) {
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) continue;
            (void)setenv(kv.substr(0, eq).c_str(), kv.substr(eq + 1).c_str(), 1);
        }

#ifdef __linux__
        if (lim.no_new_privs || lim.deny_network) {
            if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) child_fail(sfd, "no_new_privs");
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc);
#endif

        if (lim.deny_network) {
            std::string err = install_network_deny_filter();
            if (!err.empty()) {
                errno = 0;
                child_fail(sfd, err.c_str());
            }
        }

        execvp(cargv[0], cargv.data());
        child_fail(sfd, "exec");
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(in_pipe[0]);
    close_fd(status_pipe[1]);

    out_sink.pipe_fd = out_pipe[0];
    out_sink.mem = &res->stdout_text;
    err_sink.pipe_fd = err_pipe[0];
    err_sink.mem = &res->stderr_text;
    set_nonblock(out_sink.pipe_fd);
    set_nonblock(err_sink.pipe_fd);

    int in_fd = in_pipe[1];
    in_pipe[1] = -1;
    size_t write_off = 0;
    if (spec.stdin_data.empty()) close_fd(in_fd);
    else set_nonblock(in_fd);

    const auto start = std::chrono::steady_clock::now();
    bool out_open = true, err_open = true;
    bool child_exited = false;
    int status = 0;

    auto kill_group = [&]() {
        (void)kill(-pid, SIGKILL);
        (void)kill(pid, SIGKILL);
    };

    while (!child_exited) {
        int elapsed = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (lim.timeout_ms > 0 && elapsed >= lim.timeout_ms) {
            res->timed_out = true;
            kill_group();
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }
        if (cancel && cancel->cancelled()) {
            res->cancelled = true;
            kill_group();
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        struct pollfd fds[3];
        int nfds = 0, out_idx = -1, err_idx = -1, in_idx = -1;
        if (out_open) { out_idx = nfds; fds[nfds++] = {out_sink.pipe_fd, POLLIN, 0}; }
        if (err_open) { err_idx = nfds; fds[nfds++] = {err_sink.pipe_fd, POLLIN, 0}; }
        if (in_fd >= 0) { in_idx = nfds; fds[nfds++] = {in_fd, POLLOUT, 0}; }

        int slice = 50;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed));
        int pr = poll(fds, (nfds_t)nfds, slice);
        if (pr < 0 && errno != EINTR) {
            res->error = std::string("poll failed: ") + std::strerror(errno);
            kill_group();
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        if (pr > 0) {
            if (out_idx >= 0 && fds[out_idx].revents) out_open = out_sink.drain(lim);
            if (err_idx >= 0 && fds[err_idx].revents) err_open = err_sink.drain(lim);
            if (in_idx >= 0 && fds[in_idx].revents) {
                while (write_off < spec.stdin_data.size()) {
                    ssize_t n = ::write(in_fd, spec.stdin_data.data() + write_off,
                                        spec.stdin_data.size() - write_off);
                    if (n > 0) { write_off += (size_t)n; continue; }
                    if (n < 0 && errno == EINTR) continue;
                    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                    write_off = spec.stdin_data.size(); // reader gone
                }
                if (write_off >= spec.stdin_data.size()) close_fd(in_fd);
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) child_exited = true;
    }
    close_fd(in_fd);

    // Reap stragglers that inherited the group, then flush what they left.
    kill_group();
    if (out_open) (void)out_sink.drain(lim);
    if (err_open) (void)err_sink.drain(lim);
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    if (out_sink.file_fd >= 0) (void)fsync(out_sink.file_fd);
    if (err_sink.file_fd >= 0) (void)fsync(err_sink.file_fd);
    close_fd(out_sink.file_fd);
    close_fd(err_sink.file_fd);

    res->output_truncated = out_sink.truncated || err_sink.truncated;
    res->elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    char sbuf[512];
    ssize_t sn = ::read(status_pipe[0], sbuf, sizeof(sbuf));
    close_fd(status_pipe[0]);
    if (sn > 0) {
        res->error = std::string(sbuf, (size_t)sn);
        res->exit_code = 127;
        return false;
    }

    res->started = true;
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace patchbench

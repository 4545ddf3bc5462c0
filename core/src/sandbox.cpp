#include "patchbench/sandbox.h"
#include "patchbench/fileio.h"

#include <filesystem>
#include <random>
#include <regex>
#include <sstream>

#include <unistd.h>

namespace patchbench {

namespace fs = std::filesystem;

std::vector<std::pair<std::string, std::string>> deterministic_env() {
    return {
        {"PYTHONHASHSEED", "0"},
        {"TZ", "UTC"},
        {"LC_ALL", "C"},
        {"LANG", "C"},
        {"PIP_DISABLE_PIP_VERSION_CHECK", "1"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
    };
}

std::string timeout_marker(int timeout_ms) {
    int secs = (timeout_ms + 999) / 1000;
    return "\nExecution timed out after " + std::to_string(secs) + " seconds\n";
}

std::string normalize_setup_command(const std::string& cmd, const std::string& site_packages) {
    static const std::regex pip_install(R"(\bpip3?\s+install\b)");
    static const std::regex editable(R"((^|\s)(-e|--editable)(\s|=|$))");
    static const std::regex target(R"((^|\s)(--target|-t)(\s|=|$))");
    static const std::regex upgrade(R"((^|\s)(--upgrade|-U)(\s|$))");
    static const std::regex force(R"((^|\s)--force-reinstall(\s|$))");

    if (!std::regex_search(cmd, pip_install)) return cmd;
    if (std::regex_search(cmd, editable)) return cmd;

    std::string out = cmd;
    if (!std::regex_search(out, target)) out += " --target=" + site_packages;
    if (!std::regex_search(out, upgrade)) out += " --upgrade";
    if (!std::regex_search(out, force)) out += " --force-reinstall";
    return out;
}

std::string join_setup_commands(const std::vector<std::string>& cmds, const std::string& site_packages) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& c : cmds) {
        if (c.find_first_not_of(" \t\r\n") == std::string::npos) continue;
        if (!first) oss << " && ";
        oss << normalize_setup_command(c, site_packages);
        first = false;
    }
    return oss.str();
}

namespace {

// Record an infra failure in the capture file too, so the log on disk
// explains the missing output.
void note_infra(SandboxResult* r, const std::string& msg) {
    r->infra_fault = true;
    r->error = msg;
    r->stderr_head += "sandbox: " + msg + "\n";
    if (!r->stderr_path.empty()) {
        std::string err = append_to_file(r->stderr_path, "sandbox: " + msg + "\n");
        if (!err.empty()) r->error += " (" + err + ")";
    }
}

void finish_from_proc(const ProcResult& pr, int timeout_ms, SandboxResult* r) {
    r->exit_code = pr.exit_code;
    r->timed_out = pr.timed_out;
    r->cancelled = pr.cancelled;
    r->output_truncated = pr.output_truncated;
    r->elapsed_ms = pr.elapsed_ms;
    r->stdout_head = pr.stdout_text;
    r->stderr_head = pr.stderr_text;

    std::string marker;
    if (pr.timed_out) {
        r->exit_code = kTimeoutExitCode;
        marker = timeout_marker(timeout_ms);
    } else if (pr.cancelled) {
        marker = "\nExecution cancelled\n";
    }
    if (!marker.empty()) {
        r->stderr_head += marker;
        std::string err = append_to_file(r->stderr_path, marker);
        if (!err.empty()) note_infra(r, "cannot append marker: " + err);
    }
}

bool check_spec(const SandboxRunSpec& spec, SandboxResult* r) {
    r->stdout_path = spec.stdout_path;
    r->stderr_path = spec.stderr_path;
    if (spec.stdout_path.empty() || spec.stderr_path.empty()) {
        r->infra_fault = true;
        r->error = "capture paths are required";
        return false;
    }
    std::error_code ec;
    if (!fs::is_directory(spec.workspace, ec)) {
        note_infra(r, "workspace missing: " + spec.workspace);
        return false;
    }
    if (spec.timeout_ms <= 0) {
        note_infra(r, "timeout must be positive");
        return false;
    }
    return true;
}

std::string random_suffix() {
    std::random_device rd;
    std::ostringstream oss;
    oss << std::hex << rd() << rd();
    return oss.str();
}

} // namespace

SandboxResult LocalSandboxExecutor::execute(const SandboxRunSpec& spec, const CancelToken* cancel) {
    SandboxResult r;
    if (!check_spec(spec, &r)) return r;

    std::vector<std::string> wrapper;
    if (!cfg_.wrapper.empty()) {
        wrapper = split_argv_quoted(cfg_.wrapper);
        if (wrapper.empty()) {
            note_infra(&r, "cannot parse sandbox wrapper: " + cfg_.wrapper);
            return r;
        }
    }
    // rlimits and the socket filter do not confine the filesystem; root
    // would own the host.
    if (spec.agent_authored && wrapper.empty() && ::geteuid() == 0 && !cfg_.allow_unconfined_root) {
        note_infra(&r, "refusing to run an agent command as root without confinement; "
                       "use the docker backend or configure sandbox.wrapper");
        return r;
    }

    fs::path cwd = fs::path(spec.workspace);
    if (!spec.workdir.empty()) cwd /= spec.workdir;

    // Scratch space lives exactly as long as this call.
    fs::path scratch;
    std::string err = make_private_dir(fs::temp_directory_path(), "patchbench-scratch-", &scratch);
    if (!err.empty()) {
        note_infra(&r, err);
        return r;
    }

    ProcSpec ps;
    ps.argv = wrapper;
    ps.argv.insert(ps.argv.end(), {cfg_.shell, "-c", spec.command});
    ps.cwd = cwd.string();
    ps.inherit_env = false;
    ps.env.push_back("PATH=" + cfg_.path_env);
    ps.env.push_back("HOME=" + scratch.string());
    ps.env.push_back("TMPDIR=" + scratch.string());
    ps.env.push_back("PYTHONPATH=" + (fs::path(spec.workspace) / "site-packages").string());
    for (const auto& kv : deterministic_env()) ps.env.push_back(kv.first + "=" + kv.second);
    for (const auto& kv : spec.env) ps.env.push_back(kv.first + "=" + kv.second);
    ps.stdout_path = spec.stdout_path;
    ps.stderr_path = spec.stderr_path;

    ProcLimits lim = cfg_.limits;
    lim.timeout_ms = spec.timeout_ms;
    lim.deny_network = (spec.network == NetworkMode::ISOLATED);

    ProcResult pr;
    bool started = proc_run(ps, lim, cancel, &pr);

    std::error_code ec;
    fs::remove_all(scratch, ec);

    if (!started) {
        note_infra(&r, pr.error);
        return r;
    }
    finish_from_proc(pr, spec.timeout_ms, &r);
    if (ec) r.stderr_head += "sandbox: scratch cleanup failed: " + ec.message() + "\n";
    return r;
}

std::vector<std::string> DockerSandboxExecutor::build_argv(const SandboxRunSpec& spec,
                                                           const std::string& container_name) const {
    const bool isolated = (spec.network == NetworkMode::ISOLATED);
    std::vector<std::string> av = {
        cfg_.docker_binary, "run", "--rm",
        "--name", container_name,
        "--cap-drop=ALL",
        "--security-opt", "no-new-privileges",
        "--pids-limit=" + std::to_string(cfg_.pids_limit),
        "--ipc=none",
        "--tmpfs", "/tmp",
    };
    if (cfg_.limits.rlimit_as_mb > 0) av.push_back("--memory=" + std::to_string(cfg_.limits.rlimit_as_mb) + "m");
    if (isolated) av.push_back("--read-only");
    av.push_back("--network");
    av.push_back(isolated ? "none" : "bridge");

    auto add_env = [&av](const std::string& k, const std::string& v) {
        av.push_back("-e");
        av.push_back(k + "=" + v);
    };
    for (const auto& kv : deterministic_env()) add_env(kv.first, kv.second);
    add_env("PYTHONPATH", cfg_.container_workdir + "/site-packages");
    for (const auto& kv : spec.env) add_env(kv.first, kv.second);

    std::string wd = cfg_.container_workdir;
    if (!spec.workdir.empty()) wd += "/" + spec.workdir;
    av.push_back("-v");
    av.push_back(fs::absolute(spec.workspace).string() + ":" + cfg_.container_workdir);
    av.push_back("-w");
    av.push_back(wd);
    av.push_back(spec.image);
    av.push_back("sh");
    av.push_back("-c");
    av.push_back(spec.command);
    return av;
}

SandboxResult DockerSandboxExecutor::execute(const SandboxRunSpec& spec, const CancelToken* cancel) {
    SandboxResult r;
    if (!check_spec(spec, &r)) return r;
    if (spec.image.empty()) {
        note_infra(&r, "docker backend requires an image");
        return r;
    }

    const std::string name = "patchbench-" + random_suffix();

    ProcSpec ps;
    ps.argv = build_argv(spec, name);
    ps.inherit_env = true; // docker CLI needs DOCKER_HOST and friends
    ps.stdout_path = spec.stdout_path;
    ps.stderr_path = spec.stderr_path;

    // The CLI itself is trusted; isolation comes from the container flags.
    ProcLimits lim;
    lim.timeout_ms = spec.timeout_ms;
    lim.output_max_bytes = cfg_.limits.output_max_bytes;
    lim.capture_max_bytes = cfg_.limits.capture_max_bytes;
    lim.rlimit_as_mb = 0;
    lim.rlimit_fsize_mb = cfg_.limits.rlimit_fsize_mb;
    lim.rlimit_nproc = 0;

    ProcResult pr;
    bool started = proc_run(ps, lim, cancel, &pr);
    if (!started) {
        note_infra(&r, "cannot start docker: " + pr.error);
        return r;
    }

    if (pr.timed_out || pr.cancelled) {
        // Killing the CLI leaves the container running; stop it explicitly.
        ProcSpec ks;
        ks.argv = {cfg_.docker_binary, "kill", name};
        ks.inherit_env = true;
        ProcLimits klim;
        klim.timeout_ms = 30000;
        klim.rlimit_as_mb = 0;
        klim.rlimit_nproc = 0;
        ProcResult kr;
        if (!proc_run(ks, klim, nullptr, &kr)) {
            r.stderr_head += "sandbox: docker kill failed: " + kr.error + "\n";
        }
    }

    finish_from_proc(pr, spec.timeout_ms, &r);
    // 125: the docker CLI failed before the container command ran.
    if (!pr.timed_out && !pr.cancelled && pr.exit_code == 125) {
        note_infra(&r, "docker run failed: " + pr.stderr_text.substr(0, 500));
    }
    return r;
}

std::unique_ptr<ISandboxExecutor> make_sandbox_executor(const SandboxConfig& cfg) {
    switch (cfg.backend) {
        case SandboxBackend::DOCKER: return std::make_unique<DockerSandboxExecutor>(cfg);
        case SandboxBackend::LOCAL: break;
    }
    return std::make_unique<LocalSandboxExecutor>(cfg);
}

} // namespace patchbench

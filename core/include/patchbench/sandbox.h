#pragma once

#include "config.h"
#include "proc.h"
#include "types.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace patchbench {

struct SandboxRunSpec {
    std::string workspace;              // host directory, the only shared state
    std::string workdir;                // optional subdirectory to start in
    std::string command;                // run through `sh -c`
    NetworkMode network{NetworkMode::ISOLATED};
    int timeout_ms{30000};
    std::vector<std::pair<std::string, std::string>> env;
    std::string image;                  // container backends only
    std::string stdout_path;            // required: durable capture targets
    std::string stderr_path;
    bool agent_authored{false};         // the agent chose the command (run tool)
};

struct SandboxResult {
    int exit_code{-1};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    int elapsed_ms{0};
    std::string stdout_path;
    std::string stderr_path;
    std::string stdout_head;            // bounded in-memory copy
    std::string stderr_head;

    // Set when the sandbox itself could not run the command (missing
    // workspace, fork/exec failure, container runtime error). Distinct from
    // the command failing.
    bool infra_fault{false};
    std::string error;
};

// One fresh isolated process (or container) per call. Timeouts and nonzero
// exits are normal results; only infra_fault marks the harness as broken.
class ISandboxExecutor {
public:
    virtual ~ISandboxExecutor() = default;
    virtual SandboxResult execute(const SandboxRunSpec& spec, const CancelToken* cancel) = 0;
    virtual const char* name() const = 0;
};

class LocalSandboxExecutor : public ISandboxExecutor {
public:
    explicit LocalSandboxExecutor(const SandboxConfig& cfg) : cfg_(cfg) {}
    SandboxResult execute(const SandboxRunSpec& spec, const CancelToken* cancel) override;
    const char* name() const override { return "local"; }

private:
    SandboxConfig cfg_;
};

class DockerSandboxExecutor : public ISandboxExecutor {
public:
    explicit DockerSandboxExecutor(const SandboxConfig& cfg) : cfg_(cfg) {}
    SandboxResult execute(const SandboxRunSpec& spec, const CancelToken* cancel) override;
    const char* name() const override { return "docker"; }

    // Exposed for tests: the full `docker run ...` argv for a spec.
    std::vector<std::string> build_argv(const SandboxRunSpec& spec, const std::string& container_name) const;

private:
    SandboxConfig cfg_;
};

std::unique_ptr<ISandboxExecutor> make_sandbox_executor(const SandboxConfig& cfg);

// Environment every sandboxed command starts from (reproducible hashing,
// timezone and locale).
std::vector<std::pair<std::string, std::string>> deterministic_env();

// Setup-phase helpers: pip installs are redirected into a workspace-local
// site-packages directory; commands are joined into one shell invocation.
std::string normalize_setup_command(const std::string& cmd, const std::string& site_packages);
std::string join_setup_commands(const std::vector<std::string>& cmds, const std::string& site_packages);

std::string timeout_marker(int timeout_ms);

} // namespace patchbench

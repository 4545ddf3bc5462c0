#include "patchbench/tools.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <string>

namespace patchbench {

std::string step_log_name(int step, const char* stream) {
    char name[48];
    std::snprintf(name, sizeof(name), "step_%04d_%s.txt", step, stream);
    return std::string("logs/") + name;
}

// run: one sandboxed shell command, always network-isolated.
ToolResult tool_run(const RunParams& p, const ToolContext& ctx, const EngineConfig& cfg,
                    ISandboxExecutor& sandbox) {
    using Clock = std::chrono::steady_clock;

    if (p.network && *p.network == NetworkMode::EGRESS) {
        return tool_failure(ToolKind::RUN, "network_denied",
                            "network egress is not available to agent commands");
    }

    long long remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ctx.deadline - Clock::now()).count();
    if (ctx.deadline == Clock::time_point::max()) remaining_ms = cfg.run_timeout_cap_ms;
    if (remaining_ms <= 0) {
        return tool_failure(ToolKind::RUN, "timeout", "attempt time budget exhausted before the command started");
    }
    long long timeout = p.timeout_ms.value_or(ctx.default_run_timeout_ms);
    timeout = std::min<long long>({timeout, cfg.run_timeout_cap_ms, remaining_ms});

    SandboxRunSpec spec;
    spec.workspace = ctx.workspace.string();
    spec.workdir = ctx.workdir;
    spec.command = p.command;
    spec.network = NetworkMode::ISOLATED;
    spec.timeout_ms = (int)timeout;
    spec.env = p.env;
    spec.image = ctx.image;
    spec.agent_authored = true;
    const std::string out_rel = step_log_name(ctx.step, "stdout");
    const std::string err_rel = step_log_name(ctx.step, "stderr");
    spec.stdout_path = (ctx.attempt_dir / out_rel).string();
    spec.stderr_path = (ctx.attempt_dir / err_rel).string();

    SandboxResult sr = sandbox.execute(spec, ctx.cancel);

    ToolResult res;
    res.stdout_path = out_rel;
    res.stderr_path = err_rel;
    if (sr.infra_fault) {
        res = tool_failure(ToolKind::RUN, "infra_error", sr.error);
        res.infra_fault = true;
        res.stdout_path = out_rel;
        res.stderr_path = err_rel;
        return res;
    }

    // Nonzero exits and timeouts are ordinary results for the agent to read.
    res.ok = true;
    res.exit_code = sr.exit_code;
    res.timed_out = sr.timed_out;

    std::string combined = sr.stdout_head;
    if (!sr.stderr_head.empty()) {
        if (!combined.empty() && combined.back() != '\n') combined += "\n";
        combined += sr.stderr_head;
    }
    bool cut = false;
    res.output = cfg.full_logs_mode ? combined : truncate_middle(combined, cfg.max_log_chars, &cut);
    res.truncated = cut || sr.output_truncated;

    std::ostringstream payload;
    payload << "{";
    payload << "\"command\":" << json_mini::quote(p.command) << ",";
    payload << "\"exit_code\":" << sr.exit_code << ",";
    payload << "\"timed_out\":" << (sr.timed_out ? "true" : "false") << ",";
    payload << "\"cancelled\":" << (sr.cancelled ? "true" : "false") << ",";
    payload << "\"timeout_ms\":" << timeout << ",";
    payload << "\"stdout_path\":" << json_mini::quote(out_rel) << ",";
    payload << "\"stderr_path\":" << json_mini::quote(err_rel) << ",";
    payload << "\"output\":" << json_mini::quote(res.output);
    payload << "}";
    res.payload_json = payload.str();
    return res;
}

} // namespace patchbench

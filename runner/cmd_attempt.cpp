#include "runner_utils.h"

#include "patchbench/agent.h"
#include "patchbench/attempt.h"
#include "patchbench/config.h"
#include "patchbench/loop.h"
#include "patchbench/sandbox.h"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace patchbench {

static void attempt_usage() {
    std::cerr << "usage: patchbench_cli attempt --task <task.json> --workspace <dir> --out <dir>\n"
                 "                              --agent scripted:<file>|process:<cmd> [--config <cfg.json>]\n";
}

int cmd_attempt(int argc, char** argv) {
    std::string task_path, workspace, out_dir, agent_spec, config_path;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "missing value for " << a << "\n";
            attempt_usage();
            return 2;
        }
        if (a == "--task") task_path = argv[++i];
        else if (a == "--workspace") workspace = argv[++i];
        else if (a == "--out") out_dir = argv[++i];
        else if (a == "--agent") agent_spec = argv[++i];
        else if (a == "--config") config_path = argv[++i];
        else {
            std::cerr << "unknown option: " << a << "\n";
            attempt_usage();
            return 2;
        }
    }
    if (task_path.empty() || workspace.empty() || out_dir.empty() || agent_spec.empty()) {
        attempt_usage();
        return 2;
    }

    // The only place the environment is consulted.
    const char* prof = std::getenv("PATCHBENCH_PROFILE");
    EngineConfig cfg = config_for_profile(parse_profile(prof ? prof : ""));
    if (!config_path.empty()) {
        std::string err = load_config_file(config_path, &cfg);
        if (!err.empty()) {
            std::cerr << "config error: " << err << "\n";
            return 2;
        }
    }

    TaskSpec task;
    std::string err = load_task_file(task_path, &task);
    if (!err.empty()) {
        std::cerr << err << "\n";
        return 2;
    }

    std::error_code ec;
    std::filesystem::path ws = std::filesystem::canonical(workspace, ec);
    if (ec || !std::filesystem::is_directory(ws)) {
        std::cerr << "workspace does not exist: " << workspace << "\n";
        return 2;
    }

    AgentConfig ac;
    if (!parse_agent_spec(agent_spec, &ac, &err)) {
        std::cerr << err << "\n";
        return 2;
    }
    ac.cwd = std::filesystem::current_path(ec).string();
    ac.turn_timeout_ms = cfg.run_timeout_cap_ms;

    std::optional<AgentAdapter> agent;
    try {
        agent.emplace(make_agent_adapter(ac));
    } catch (const std::runtime_error& e) {
        std::cerr << "agent error: " << e.what() << "\n";
        return 2;
    }

    auto sandbox = make_sandbox_executor(cfg.sandbox);
    const CancelToken& cancel = install_cancel_signals();

    const std::string run_id = gen_run_id();
    std::cerr << "[patchbench] run " << run_id << " task " << task.task_id
              << " profile " << profile_name(cfg.profile) << " sandbox " << sandbox->name() << "\n";

    try {
        AttemptRecorder recorder(out_dir, EventHeader{run_id, task.task_id}, cfg.fsync_events);
        AgentLoop loop(cfg, task, ws, *sandbox, *agent, recorder, &cancel);
        AttemptOutcome outcome = loop.run();

        std::cout << task.task_id << " " << failure_reason_name(outcome.failure_reason)
                  << " (stop=" << loop_state_name(outcome.stop_reason)
                  << ", tool_calls=" << outcome.record.tool_calls
                  << ", patches=" << outcome.record.patches.size() << ")\n";
        for (const auto& e : outcome.record.infra_errors) std::cerr << "[patchbench] infra: " << e << "\n";

        if (outcome.failure_reason == FailureReason::SUCCESS) return 0;
        if (outcome.failure_reason == FailureReason::INFRA_ERROR) return 2;
        return 1;
    } catch (const RecorderError& e) {
        std::cerr << "recorder error: " << e.what() << "\n";
        return 2;
    }
}

} // namespace patchbench

#pragma once

#include "agent.h"
#include "agent_state.h"
#include "attempt.h"
#include "config.h"
#include "sandbox.h"
#include "tools.h"
#include "types.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

struct AttemptOutcome {
    LoopState stop_reason{LoopState::INFRA_ERROR};
    FailureReason failure_reason{FailureReason::INFRA_ERROR};
    AttemptRecord record;
};

// Drives one attempt: setup, baseline, then one agent action per iteration
// until a terminal state. Tool failures, timeouts and budget exhaustion are
// normal returns; only a recorder failure (RecorderError) propagates.
class AgentLoop {
public:
    AgentLoop(const EngineConfig& cfg,
              const TaskSpec& task,
              const std::filesystem::path& workspace,
              ISandboxExecutor& sandbox,
              const AgentAdapter& agent,
              AttemptRecorder& recorder,
              const CancelToken* cancel = nullptr);

    AttemptOutcome run();

    // Valid after run().
    const AgentState& state() const { return *state_; }

private:
    struct TestRun {
        TestRunResult result;
        bool infra_fault{false};
        bool cancelled{false};
        std::string error;
    };

    bool interrupted() const { return cancel_ && cancel_->cancelled(); }
    int current_step() const;

    void transition(LoopState to);
    bool run_setup();
    TestRun run_tests(const std::string& phase, int step);
    void record_test(const TestRun& t);

    // Returns the terminal state the step forces, if any.
    std::optional<LoopState> execute_step(const ToolRequest& req, const std::optional<ToolResult>& rejected,
                                          const std::string& raw_args);
    // Adds a patch that changed files to the state and the event log.
    bool record_patch(int step, const ToolResult& res, const ApplyPatchParams& p);
    std::optional<LoopState> test_after_patch(int step);

    // Re-run stale tests before a non-failure stop; may turn into INFRA_ERROR
    // or INTERRUPTED.
    LoopState settle(LoopState reason);
    AttemptOutcome finish(LoopState reason);

    std::string log_output(const std::string& text) const;

    const EngineConfig& cfg_;
    const TaskSpec& task_;
    std::filesystem::path workspace_;
    ISandboxExecutor& sandbox_;
    const AgentAdapter& agent_;
    AttemptRecorder& recorder_;
    const CancelToken* cancel_;
    ToolRunner runner_;

    std::unique_ptr<AgentState> state_;
    LoopState current_{LoopState::INIT};
    std::string started_at_;
    std::chrono::steady_clock::time_point started_;
    std::optional<int> baseline_exit_;
    bool baseline_passed_{false};
    bool malformed_stop_{false};
    std::vector<std::string> infra_errors_;
};

} // namespace patchbench

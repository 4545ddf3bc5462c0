#pragma once

#include "agent_state.h"
#include "config.h"
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace patchbench {

class CancelToken;

struct TestFailureSummary {
    int exit_code{-1};
    std::optional<int> failed_count;
    std::vector<std::string> failed_tests;   // pytest node ids / unittest names
    std::vector<std::string> error_lines;
    std::vector<std::string> file_hints;     // source files mentioned, failing tests first
};

// Best-effort scrape of pytest/unittest output.
TestFailureSummary parse_test_output(const std::string& output, int exit_code);

// One-line description of a finished call, e.g. "search -> 4 matches".
std::string summarize_result(const ToolResult& r);

// The bounded view of AgentState handed to the agent each turn.
struct AgentObservation {
    std::string task_id;
    std::string test_command;
    int step{0};
    int steps_remaining{0};
    long long time_remaining_ms{0};

    std::vector<std::string> recent;      // last observation_window summaries, oldest first
    std::string last_result_json;         // full result of the previous call, "" on the first turn

    std::optional<TestRunResult> last_test;
    bool last_test_fresh{false};
    TestFailureSummary failure;

    std::string corrective;               // set after malformed output

    // Not serialized. Adapters that block should stop when it fires and keep
    // the turn within time_remaining_ms.
    const CancelToken* cancel{nullptr};

    std::string to_json() const;
};

AgentObservation build_observation(const AgentState& state, const TaskSpec& task,
                                   const EngineConfig& cfg, int step);

} // namespace patchbench

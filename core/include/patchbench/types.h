#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

inline constexpr const char* kSchemaVersion = "0.1.0";

// Exit code reported when the sandbox kills a command at its deadline.
inline constexpr int kTimeoutExitCode = 124;

enum class ToolKind {
    LIST_FILES,
    READ_FILE,
    SEARCH,
    APPLY_PATCH,
    RUN,
};

enum class NetworkMode {
    ISOLATED,
    EGRESS,
};

// Loop states. Everything except INIT and RUNNING is terminal.
enum class LoopState {
    INIT,
    RUNNING,
    SUCCESS,
    STEP_BUDGET_EXCEEDED,
    TIME_BUDGET_EXCEEDED,
    REPEATED_FAILURE,
    AGENT_STOPPED,
    SETUP_FAILED,
    INTERRUPTED,
    INFRA_ERROR,
};

enum class FailureReason {
    SUCCESS,
    BASELINE_NOT_FAILING,
    STILL_FAILING,
    TIMEOUT,
    SETUP_FAILED,
    STEP_BUDGET_EXCEEDED,
    TIME_BUDGET_EXCEEDED,
    REPEATED_FAILURE,
    AGENT_MALFORMED_OUTPUT,
    INTERRUPTED,
    INFRA_ERROR,
};

const char* tool_kind_name(ToolKind k);
std::optional<ToolKind> parse_tool_kind(const std::string& s);

const char* network_mode_name(NetworkMode m);
std::optional<NetworkMode> parse_network_mode(const std::string& s);

const char* loop_state_name(LoopState s);
std::optional<LoopState> parse_loop_state(const std::string& s);
bool is_terminal(LoopState s);

const char* failure_reason_name(FailureReason r);
std::optional<FailureReason> parse_failure_reason(const std::string& s);

// Read-only task input handed to the loop by the task provider.
struct TaskSpec {
    std::string task_id;
    std::string repo_location;
    std::string pinned_revision;
    std::string container_image;
    std::string workdir;
    int per_command_timeout_ms{300000};
    std::vector<std::string> setup_commands;
    std::string test_command;
};

// Outcome of one execution of the task's test command.
struct TestRunResult {
    int exit_code{-1};
    bool timed_out{false};
    std::string output;       // combined stdout+stderr, truncated
    std::string stdout_path;
    std::string stderr_path;
    std::string finished_at;  // ISO-8601 UTC
    int patch_seq{0};         // number of patches applied when this ran
};

std::string iso_now();

} // namespace patchbench

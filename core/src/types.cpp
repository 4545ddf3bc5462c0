#include "patchbench/types.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace patchbench {

namespace {

template <typename E, size_t N>
std::optional<E> lookup(const std::string& s, const char* const (&names)[N]) {
    for (size_t i = 0; i < N; i++) {
        if (s == names[i]) return static_cast<E>(i);
    }
    return std::nullopt;
}

const char* const kToolNames[] = {"list_files", "read_file", "search", "apply_patch", "run"};
const char* const kNetNames[] = {"isolated", "egress"};
const char* const kStateNames[] = {
    "INIT", "RUNNING", "SUCCESS", "STEP_BUDGET_EXCEEDED", "TIME_BUDGET_EXCEEDED",
    "REPEATED_FAILURE", "AGENT_STOPPED", "SETUP_FAILED", "INTERRUPTED", "INFRA_ERROR",
};
const char* const kReasonNames[] = {
    "SUCCESS", "BASELINE_NOT_FAILING", "STILL_FAILING", "TIMEOUT", "SETUP_FAILED",
    "STEP_BUDGET_EXCEEDED", "TIME_BUDGET_EXCEEDED", "REPEATED_FAILURE",
    "AGENT_MALFORMED_OUTPUT", "INTERRUPTED", "INFRA_ERROR",
};

} // namespace

const char* tool_kind_name(ToolKind k) { return kToolNames[static_cast<int>(k)]; }
std::optional<ToolKind> parse_tool_kind(const std::string& s) { return lookup<ToolKind>(s, kToolNames); }

const char* network_mode_name(NetworkMode m) { return kNetNames[static_cast<int>(m)]; }
std::optional<NetworkMode> parse_network_mode(const std::string& s) { return lookup<NetworkMode>(s, kNetNames); }

const char* loop_state_name(LoopState s) { return kStateNames[static_cast<int>(s)]; }
std::optional<LoopState> parse_loop_state(const std::string& s) { return lookup<LoopState>(s, kStateNames); }

bool is_terminal(LoopState s) {
    return s != LoopState::INIT && s != LoopState::RUNNING;
}

const char* failure_reason_name(FailureReason r) { return kReasonNames[static_cast<int>(r)]; }
std::optional<FailureReason> parse_failure_reason(const std::string& s) {
    return lookup<FailureReason>(s, kReasonNames);
}

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

} // namespace patchbench

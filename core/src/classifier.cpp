#include "patchbench/classifier.h"

namespace patchbench {

FailureReason classify(const ClassifierInput& in) {
    if (!in.infra_errors.empty() || in.terminal == LoopState::INFRA_ERROR || !is_terminal(in.terminal)) {
        return FailureReason::INFRA_ERROR;
    }
    if (in.terminal == LoopState::INTERRUPTED) return FailureReason::INTERRUPTED;
    if (in.terminal == LoopState::SETUP_FAILED) return FailureReason::SETUP_FAILED;
    if (in.baseline_passed) return FailureReason::BASELINE_NOT_FAILING;

    if (in.last_test_exit_code && *in.last_test_exit_code == 0 && in.last_test_fresh && !in.last_test_timed_out) {
        return FailureReason::SUCCESS;
    }

    switch (in.terminal) {
        case LoopState::STEP_BUDGET_EXCEEDED: return FailureReason::STEP_BUDGET_EXCEEDED;
        case LoopState::TIME_BUDGET_EXCEEDED: return FailureReason::TIME_BUDGET_EXCEEDED;
        case LoopState::REPEATED_FAILURE: return FailureReason::REPEATED_FAILURE;
        default: break;
    }
    if (in.terminal == LoopState::AGENT_STOPPED && in.malformed_output) {
        return FailureReason::AGENT_MALFORMED_OUTPUT;
    }
    if (in.last_test_timed_out) return FailureReason::TIMEOUT;
    return FailureReason::STILL_FAILING;
}

} // namespace patchbench

#pragma once

#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace patchbench {

struct ClassifierInput {
    LoopState terminal{LoopState::INIT};
    bool baseline_passed{false};
    std::optional<int> last_test_exit_code;
    bool last_test_timed_out{false};
    bool last_test_fresh{false};      // ran after the most recent applied patch
    bool malformed_output{false};     // agent stopped on repeated malformed output
    std::vector<std::string> infra_errors;
};

// Total, order-sensitive and pure: the same input always maps to the same
// reason. A state that never became terminal counts as a harness fault.
FailureReason classify(const ClassifierInput& in);

} // namespace patchbench

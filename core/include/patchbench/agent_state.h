#pragma once

#include "tools.h"
#include "types.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

struct HistoryEntry {
    int step{0};
    ToolRequest request;
    ToolResult result;
};

struct AppliedPatch {
    int seq{0};
    int step{0};
    std::string artifact;
};

// Mutable per-attempt state, owned by the loop. History only grows, step and
// time budgets only shrink, and the stop reason is set exactly once.
class AgentState {
public:
    AgentState(int max_steps, std::chrono::steady_clock::time_point deadline)
        : steps_remaining_(max_steps), deadline_(deadline) {}

    const std::vector<HistoryEntry>& history() const { return history_; }
    void append(HistoryEntry e);

    const std::optional<TestRunResult>& last_test() const { return last_test_; }
    void set_last_test(TestRunResult r);

    // True when the last test ran after the most recent workspace change.
    bool tests_fresh() const { return tests_fresh_; }
    void mark_tests_stale() { tests_fresh_ = false; }

    const std::vector<AppliedPatch>& patches() const { return patches_; }
    const AppliedPatch& add_patch(int step, const std::string& artifact);

    int steps_remaining() const { return steps_remaining_; }
    void consume_step();

    std::chrono::steady_clock::time_point deadline() const { return deadline_; }
    long long time_remaining_ms() const;
    bool time_exhausted() const;

    // Consecutive identical failures. An empty signature (success) resets.
    int note_outcome(const std::string& failure_signature);
    int consecutive_failures() const { return consecutive_failures_; }

    std::optional<LoopState> stop_reason() const { return stop_reason_; }
    // Throws std::logic_error if already set or `s` is not terminal.
    void set_stop_reason(LoopState s);

private:
    std::vector<HistoryEntry> history_;
    std::optional<TestRunResult> last_test_;
    bool tests_fresh_{false};
    std::vector<AppliedPatch> patches_;
    int steps_remaining_{0};
    std::chrono::steady_clock::time_point deadline_;
    std::string last_signature_;
    int consecutive_failures_{0};
    std::optional<LoopState> stop_reason_;
};

// Normalized identity of a failed call, used for repeated-failure detection.
// Empty for results that count as progress.
std::string failure_signature(const ToolResult& r);

} // namespace patchbench

#include "patchbench/agent_state.h"
#include "patchbench/hash.h"

#include <cctype>
#include <stdexcept>

namespace patchbench {

void AgentState::append(HistoryEntry e) {
    history_.push_back(std::move(e));
}

void AgentState::set_last_test(TestRunResult r) {
    tests_fresh_ = r.patch_seq == (int)patches_.size();
    last_test_ = std::move(r);
}

const AppliedPatch& AgentState::add_patch(int step, const std::string& artifact) {
    AppliedPatch p;
    p.seq = (int)patches_.size() + 1;
    p.step = step;
    p.artifact = artifact;
    patches_.push_back(p);
    tests_fresh_ = false;
    return patches_.back();
}

void AgentState::consume_step() {
    if (steps_remaining_ > 0) steps_remaining_--;
}

long long AgentState::time_remaining_ms() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - std::chrono::steady_clock::now()).count();
    return left > 0 ? left : 0;
}

bool AgentState::time_exhausted() const {
    return std::chrono::steady_clock::now() >= deadline_;
}

int AgentState::note_outcome(const std::string& failure_signature) {
    if (failure_signature.empty()) {
        last_signature_.clear();
        consecutive_failures_ = 0;
    } else if (failure_signature == last_signature_) {
        consecutive_failures_++;
    } else {
        last_signature_ = failure_signature;
        consecutive_failures_ = 1;
    }
    return consecutive_failures_;
}

void AgentState::set_stop_reason(LoopState s) {
    if (!is_terminal(s)) {
        throw std::logic_error(std::string("stop reason must be terminal, got ") + loop_state_name(s));
    }
    if (stop_reason_) {
        throw std::logic_error(std::string("stop reason already set to ") + loop_state_name(*stop_reason_));
    }
    stop_reason_ = s;
}

namespace {

// Digits vary between otherwise identical runs (timings, addresses, pids).
std::string collapse_digits(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool in_num = false;
    for (char c : s) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            if (!in_num) out.push_back('#');
            in_num = true;
        } else {
            out.push_back(c);
            in_num = false;
        }
    }
    return out;
}

} // namespace

std::string failure_signature(const ToolResult& r) {
    std::string kind = tool_kind_name(r.kind);
    if (!r.ok) return kind + "|" + r.error_type + "|" + collapse_digits(r.error_message);
    if (r.kind == ToolKind::RUN && r.exit_code && *r.exit_code != 0) {
        return kind + "|exit=" + std::to_string(*r.exit_code) + "|" +
               hash::hex64(hash::fnv1a64(collapse_digits(r.output)));
    }
    return "";
}

} // namespace patchbench

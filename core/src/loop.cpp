#include "patchbench/loop.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <variant>

namespace patchbench {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Placeholder parameters for a request whose arguments failed validation,
// so the failed result still pairs with a request of the right kind.
ToolRequest rejected_request(ToolKind kind, const std::string& id) {
    ToolRequest req;
    req.id = id;
    switch (kind) {
        case ToolKind::LIST_FILES: req.params = ListFilesParams{}; break;
        case ToolKind::READ_FILE: req.params = ReadFileParams{}; break;
        case ToolKind::SEARCH: req.params = SearchParams{}; break;
        case ToolKind::APPLY_PATCH: req.params = ApplyPatchParams{}; break;
        case ToolKind::RUN: req.params = RunParams{}; break;
    }
    return req;
}

std::string test_log_name(const std::string& phase, int step, const char* stream) {
    if (phase == "baseline" || phase == "final") return "logs/" + phase + "_test_" + stream + ".txt";
    char name[48];
    std::snprintf(name, sizeof(name), "logs/step_%04d_test_%s.txt", step, stream);
    return name;
}

const char* action_name(const AgentAction& a) {
    return std::visit(overloaded{
        [](const ToolRequest&) { return "tool_call"; },
        [](const StopSignal&) { return "stop"; },
        [](const MalformedOutput&) { return "malformed"; },
    }, a);
}

} // namespace

AgentLoop::AgentLoop(const EngineConfig& cfg, const TaskSpec& task, const fs::path& workspace,
                     ISandboxExecutor& sandbox, const AgentAdapter& agent, AttemptRecorder& recorder,
                     const CancelToken* cancel)
    : cfg_(cfg), task_(task), workspace_(workspace), sandbox_(sandbox), agent_(agent),
      recorder_(recorder), cancel_(cancel), runner_(cfg, sandbox) {}

int AgentLoop::current_step() const {
    return state_ ? (int)state_->history().size() : 0;
}

std::string AgentLoop::log_output(const std::string& text) const {
    if (cfg_.full_logs_mode) return text;
    return truncate_middle(text, cfg_.max_log_chars, nullptr);
}

void AgentLoop::transition(LoopState to) {
    std::ostringstream p;
    p << "{\"from\":" << json_mini::quote(loop_state_name(current_))
      << ",\"to\":" << json_mini::quote(loop_state_name(to)) << "}";
    recorder_.events().event(current_step(), "state_transition", p.str());
    current_ = to;
}

bool AgentLoop::run_setup() {
    std::vector<std::string> cmds;
    for (const auto& c : task_.setup_commands) {
        if (c.find_first_not_of(" \t\r\n") != std::string::npos) cmds.push_back(c);
    }
    if (cmds.empty()) return true;

    const std::string site_packages = cfg_.sandbox.backend == SandboxBackend::DOCKER
        ? cfg_.sandbox.container_workdir + "/site-packages"
        : (workspace_ / "site-packages").string();

    SandboxRunSpec spec;
    spec.workspace = workspace_.string();
    spec.workdir = task_.workdir;
    spec.command = join_setup_commands(cmds, site_packages);
    spec.network = NetworkMode::EGRESS;
    spec.timeout_ms = std::max(task_.per_command_timeout_ms, cfg_.sandbox.setup_min_timeout_ms);
    spec.image = task_.container_image;
    spec.stdout_path = (recorder_.dir() / "logs/setup_stdout.txt").string();
    spec.stderr_path = (recorder_.dir() / "logs/setup_stderr.txt").string();

    recorder_.events().event(0, "setup_started",
        "{\"command\":" + json_mini::quote(spec.command) + ",\"timeout_ms\":" + std::to_string(spec.timeout_ms) + "}");

    SandboxResult sr = sandbox_.execute(spec, cancel_);

    std::ostringstream p;
    p << "{\"exit_code\":" << sr.exit_code
      << ",\"timed_out\":" << (sr.timed_out ? "true" : "false")
      << ",\"elapsed_ms\":" << sr.elapsed_ms
      << ",\"stdout_path\":\"logs/setup_stdout.txt\",\"stderr_path\":\"logs/setup_stderr.txt\""
      << ",\"stderr\":" << json_mini::quote(log_output(sr.stderr_head));
    if (sr.infra_fault) p << ",\"error\":" << json_mini::quote(sr.error);
    p << "}";
    recorder_.events().event(0, "setup_finished", p.str());

    if (sr.infra_fault) {
        infra_errors_.push_back("setup: " + sr.error);
        return false;
    }
    return !sr.cancelled && sr.exit_code == 0;
}

AgentLoop::TestRun AgentLoop::run_tests(const std::string& phase, int step) {
    TestRun t;
    const std::string out_rel = test_log_name(phase, step, "stdout");
    const std::string err_rel = test_log_name(phase, step, "stderr");

    long long timeout = task_.per_command_timeout_ms;
    timeout = std::min<long long>(timeout, cfg_.run_timeout_cap_ms);
    if (state_) timeout = std::min<long long>(timeout, std::max<long long>(state_->time_remaining_ms(), 1));

    SandboxRunSpec spec;
    spec.workspace = workspace_.string();
    spec.workdir = task_.workdir;
    spec.command = task_.test_command;
    spec.network = NetworkMode::ISOLATED;
    spec.timeout_ms = (int)timeout;
    spec.image = task_.container_image;
    spec.stdout_path = (recorder_.dir() / out_rel).string();
    spec.stderr_path = (recorder_.dir() / err_rel).string();

    recorder_.events().event(current_step(), "tests_started",
        "{\"phase\":" + json_mini::quote(phase) + ",\"command\":" + json_mini::quote(spec.command) +
        ",\"timeout_ms\":" + std::to_string(timeout) + "}");

    SandboxResult sr = sandbox_.execute(spec, cancel_);

    std::string combined = sr.stdout_head;
    if (!sr.stderr_head.empty()) {
        if (!combined.empty() && combined.back() != '\n') combined += "\n";
        combined += sr.stderr_head;
    }

    t.infra_fault = sr.infra_fault;
    t.cancelled = sr.cancelled;
    t.error = sr.error;
    t.result.exit_code = sr.exit_code;
    t.result.timed_out = sr.timed_out;
    t.result.output = truncate_middle(combined, cfg_.max_log_chars, nullptr);
    t.result.stdout_path = out_rel;
    t.result.stderr_path = err_rel;
    t.result.finished_at = iso_now();
    t.result.patch_seq = state_ ? (int)state_->patches().size() : 0;

    std::ostringstream p;
    p << "{\"phase\":" << json_mini::quote(phase)
      << ",\"exit_code\":" << sr.exit_code
      << ",\"timed_out\":" << (sr.timed_out ? "true" : "false")
      << ",\"cancelled\":" << (sr.cancelled ? "true" : "false")
      << ",\"elapsed_ms\":" << sr.elapsed_ms
      << ",\"patch_seq\":" << t.result.patch_seq
      << ",\"stdout_path\":" << json_mini::quote(out_rel)
      << ",\"stderr_path\":" << json_mini::quote(err_rel)
      << ",\"output\":" << json_mini::quote(log_output(combined));
    if (sr.infra_fault) p << ",\"error\":" << json_mini::quote(sr.error);
    p << "}";
    recorder_.events().event(current_step(), "tests_finished", p.str());
    return t;
}

void AgentLoop::record_test(const TestRun& t) {
    if (t.infra_fault) {
        infra_errors_.push_back("test command: " + t.error);
        return;
    }
    if (!t.cancelled) state_->set_last_test(t.result);
}

bool AgentLoop::record_patch(int step, const ToolResult& res, const ApplyPatchParams& p) {
    if (res.changed_files.empty()) return false;

    const AppliedPatch& ap = state_->add_patch(step, res.artifact_path);
    std::ostringstream ev;
    ev << "{\"seq\":" << ap.seq
       << ",\"artifact\":" << json_mini::quote(ap.artifact)
       << ",\"origin\":" << json_mini::quote(patch_origin_name(p.origin))
       << ",\"complete\":" << (res.ok ? "true" : "false")
       << ",\"changed_files\":" << json_mini::string_array(res.changed_files) << "}";
    recorder_.events().event(step, "patch_applied", ev.str());
    return true;
}

std::optional<LoopState> AgentLoop::test_after_patch(int step) {
    // Keep the agent's view current without waiting to be asked.
    TestRun t = run_tests("after_patch", step);
    record_test(t);
    if (t.infra_fault) return LoopState::INFRA_ERROR;
    if (t.cancelled) return LoopState::INTERRUPTED;
    if (t.result.exit_code == 0 && !t.result.timed_out) return LoopState::SUCCESS;
    return std::nullopt;
}

std::optional<LoopState> AgentLoop::execute_step(const ToolRequest& req, const std::optional<ToolResult>& rejected,
                                                 const std::string& raw_args) {
    const int step = current_step() + 1;
    const ToolKind kind = req.kind();

    std::string args = rejected ? json_mini::quote(log_output(raw_args)) : req.args_json();
    if (!cfg_.full_logs_mode && args.size() > cfg_.max_log_chars) {
        args = json_mini::quote(truncate_middle(args, cfg_.max_log_chars, nullptr));
    }
    recorder_.events().event(step, "tool_call_started",
        "{\"id\":" + json_mini::quote(req.id) + ",\"tool\":" + json_mini::quote(tool_kind_name(kind)) +
        ",\"args\":" + args + "}");

    ToolResult res;
    if (rejected) {
        res = *rejected;
    } else {
        ToolContext ctx;
        ctx.workspace = workspace_;
        ctx.workdir = task_.workdir;
        ctx.image = task_.container_image;
        ctx.attempt_dir = recorder_.dir();
        ctx.step = step;
        ctx.default_run_timeout_ms = task_.per_command_timeout_ms;
        ctx.deadline = state_->deadline();
        ctx.cancel = cancel_;
        res = runner_.run(req, ctx);
    }

    state_->append(HistoryEntry{step, req, res});
    state_->consume_step();

    std::ostringstream ev;
    ev << "{\"id\":" << json_mini::quote(req.id)
       << ",\"tool\":" << json_mini::quote(tool_kind_name(kind))
       << ",\"ok\":" << (res.ok ? "true" : "false")
       << ",\"elapsed_ms\":" << res.elapsed_ms
       << ",\"summary\":" << json_mini::quote(summarize_result(res));
    if (cfg_.full_logs_mode) {
        ev << ",\"result\":" << res.to_json();
    } else {
        ev << ",\"truncated\":" << (res.truncated ? "true" : "false");
        if (!res.ok) {
            ev << ",\"error\":{\"type\":" << json_mini::quote(res.error_type)
               << ",\"message\":" << json_mini::quote(log_output(res.error_message)) << "}";
        }
        if (res.exit_code) {
            ev << ",\"exit_code\":" << *res.exit_code
               << ",\"timed_out\":" << (res.timed_out ? "true" : "false")
               << ",\"stdout_path\":" << json_mini::quote(res.stdout_path)
               << ",\"stderr_path\":" << json_mini::quote(res.stderr_path)
               << ",\"output\":" << json_mini::quote(log_output(res.output));
        }
        if (!res.artifact_path.empty()) ev << ",\"artifact\":" << json_mini::quote(res.artifact_path);
    }
    ev << "}";
    recorder_.events().event(step, "tool_call_finished", ev.str());

    // The workspace changed whatever happens next; the record must reference the artifact.
    const auto* patch = rejected ? nullptr : std::get_if<ApplyPatchParams>(&req.params);
    const bool patched = patch && record_patch(step, res, *patch);

    if (res.infra_fault) {
        infra_errors_.push_back(std::string(tool_kind_name(kind)) + ": " + res.error_message);
        return LoopState::INFRA_ERROR;
    }
    if (interrupted()) return LoopState::INTERRUPTED;

    std::optional<LoopState> forced;
    if (patched) {
        forced = test_after_patch(step);
    } else if (const auto* r = std::get_if<RunParams>(&req.params); r && !rejected && res.ok) {
        if (r->command == task_.test_command) {
            TestRunResult t;
            t.exit_code = res.exit_code.value_or(-1);
            t.timed_out = res.timed_out;
            t.output = res.output;
            t.stdout_path = res.stdout_path;
            t.stderr_path = res.stderr_path;
            t.finished_at = iso_now();
            t.patch_seq = (int)state_->patches().size();
            state_->set_last_test(t);
            if (t.exit_code == 0 && !t.timed_out) forced = LoopState::SUCCESS;
        } else {
            // Arbitrary commands may edit the workspace.
            state_->mark_tests_stale();
        }
    }
    if (forced) return forced;

    const int repeats = state_->note_outcome(failure_signature(res));
    if (repeats >= cfg_.budget.repeated_failure_threshold) return LoopState::REPEATED_FAILURE;
    return std::nullopt;
}

LoopState AgentLoop::settle(LoopState reason) {
    const bool wants_fresh = reason == LoopState::AGENT_STOPPED ||
                             reason == LoopState::STEP_BUDGET_EXCEEDED ||
                             reason == LoopState::REPEATED_FAILURE;
    if (!wants_fresh || state_->tests_fresh()) return reason;
    if (state_->time_exhausted()) return reason;

    TestRun t = run_tests("final", current_step());
    record_test(t);
    if (t.infra_fault) return LoopState::INFRA_ERROR;
    if (t.cancelled) return LoopState::INTERRUPTED;
    return reason;
}

AttemptOutcome AgentLoop::finish(LoopState reason) {
    if (reason == LoopState::INTERRUPTED) {
        recorder_.events().event(current_step(), "attempt_interrupted",
            "{\"during\":" + json_mini::quote(loop_state_name(current_)) + "}");
    }
    state_->set_stop_reason(reason);
    transition(reason);

    ClassifierInput in;
    in.terminal = reason;
    in.baseline_passed = baseline_passed_;
    in.malformed_output = malformed_stop_;
    in.infra_errors = infra_errors_;
    if (const auto& lt = state_->last_test()) {
        in.last_test_exit_code = lt->exit_code;
        in.last_test_timed_out = lt->timed_out;
        in.last_test_fresh = state_->tests_fresh();
    }
    const FailureReason fr = classify(in);

    AttemptRecord rec;
    rec.run_id = recorder_.header().run_id;
    rec.task_id = task_.task_id;
    rec.agent = agent_.name();
    rec.started_at = started_at_;
    rec.ended_at = iso_now();
    rec.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_).count();
    rec.stop_reason = reason;
    rec.failure_reason = fr;
    rec.baseline_exit_code = baseline_exit_;
    rec.baseline_passed = baseline_passed_;
    rec.last_test_exit_code = in.last_test_exit_code;
    rec.last_test_timed_out = in.last_test_timed_out;
    rec.last_test_after_patch = in.last_test_fresh;
    rec.malformed_output = malformed_stop_;
    rec.max_steps = cfg_.budget.max_steps;
    rec.steps_used = cfg_.budget.max_steps - state_->steps_remaining();
    rec.max_time_ms = cfg_.budget.max_time_ms;
    rec.time_used_ms = rec.duration_ms;
    rec.tool_calls = (int)state_->history().size();
    for (const auto& p : state_->patches()) rec.patches.push_back(PatchRef{p.seq, p.step, p.artifact});
    rec.infra_errors = infra_errors_;
    rec.config_json = config_summary_json(cfg_);

    std::ostringstream ev;
    ev << "{\"stop_reason\":" << json_mini::quote(loop_state_name(reason))
       << ",\"failure_reason\":" << json_mini::quote(failure_reason_name(fr))
       << ",\"tool_calls\":" << rec.tool_calls
       << ",\"patches\":" << rec.patches.size()
       << ",\"duration_ms\":" << rec.duration_ms << "}";
    recorder_.events().event(current_step(), "attempt_finished", ev.str());
    recorder_.finalize(rec);

    AttemptOutcome out;
    out.stop_reason = reason;
    out.failure_reason = fr;
    out.record = std::move(rec);
    return out;
}

AttemptOutcome AgentLoop::run() {
    started_ = Clock::now();
    started_at_ = iso_now();
    state_ = std::make_unique<AgentState>(cfg_.budget.max_steps,
                                          started_ + std::chrono::milliseconds(cfg_.budget.max_time_ms));

    AttemptRecord placeholder;
    placeholder.run_id = recorder_.header().run_id;
    placeholder.task_id = task_.task_id;
    placeholder.agent = agent_.name();
    placeholder.started_at = started_at_;
    placeholder.max_steps = cfg_.budget.max_steps;
    placeholder.max_time_ms = cfg_.budget.max_time_ms;
    placeholder.config_json = config_summary_json(cfg_);
    recorder_.start(placeholder);

    std::ostringstream ev;
    ev << "{\"agent\":" << json_mini::quote(agent_.name())
       << ",\"sandbox\":" << json_mini::quote(sandbox_.name())
       << ",\"test_command\":" << json_mini::quote(task_.test_command)
       << ",\"max_steps\":" << cfg_.budget.max_steps
       << ",\"max_time_ms\":" << cfg_.budget.max_time_ms
       << ",\"config\":" << config_summary_json(cfg_) << "}";
    recorder_.events().event(0, "attempt_started", ev.str());
    recorder_.events().event(0, "state_transition", "{\"from\":null,\"to\":\"INIT\"}");

    if (!run_setup()) {
        if (!infra_errors_.empty()) return finish(LoopState::INFRA_ERROR);
        if (interrupted()) return finish(LoopState::INTERRUPTED);
        return finish(LoopState::SETUP_FAILED);
    }
    if (interrupted()) return finish(LoopState::INTERRUPTED);

    TestRun baseline = run_tests("baseline", 0);
    record_test(baseline);
    if (baseline.infra_fault) return finish(LoopState::INFRA_ERROR);
    if (baseline.cancelled) return finish(LoopState::INTERRUPTED);
    baseline_exit_ = baseline.result.exit_code;
    if (baseline.result.exit_code == 0 && !baseline.result.timed_out) {
        baseline_passed_ = true;
        return finish(LoopState::SUCCESS);
    }

    transition(LoopState::RUNNING);

    int malformed_in_a_row = 0;
    std::string corrective;
    while (true) {
        if (interrupted()) return finish(LoopState::INTERRUPTED);
        if (state_->steps_remaining() <= 0) return finish(settle(LoopState::STEP_BUDGET_EXCEEDED));
        if (state_->time_exhausted()) return finish(LoopState::TIME_BUDGET_EXCEEDED);

        const int step = current_step() + 1;
        AgentObservation obs;
        try {
            obs = build_observation(*state_, task_, cfg_, step);
        } catch (const std::exception& e) {
            infra_errors_.push_back(std::string("observation: ") + e.what());
            return finish(LoopState::INFRA_ERROR);
        }
        obs.corrective = corrective;
        obs.cancel = cancel_;

        recorder_.events().event(step, "agent_turn_started",
            "{\"steps_remaining\":" + std::to_string(obs.steps_remaining) +
            ",\"time_remaining_ms\":" + std::to_string(obs.time_remaining_ms) + "}");

        std::optional<AgentAction> action;
        try {
            action = agent_.next_action(obs);
        } catch (const std::exception& e) {
            recorder_.events().event(step, "agent_turn_finished",
                "{\"action\":\"error\",\"error\":" + json_mini::quote(e.what()) + "}");
            // A turn cut short by the operator or the attempt deadline is not a harness fault.
            if (interrupted()) return finish(LoopState::INTERRUPTED);
            if (state_->time_exhausted()) return finish(LoopState::TIME_BUDGET_EXCEEDED);
            infra_errors_.push_back(std::string("agent: ") + e.what());
            return finish(LoopState::INFRA_ERROR);
        }
        std::string turn = "{\"action\":" + json_mini::quote(action_name(*action));
        if (const auto* s = std::get_if<StopSignal>(&*action)) turn += ",\"reason\":" + json_mini::quote(s->reason);
        recorder_.events().event(step, "agent_turn_finished", turn + "}");

        if (interrupted()) return finish(LoopState::INTERRUPTED);
        if (state_->time_exhausted()) return finish(LoopState::TIME_BUDGET_EXCEEDED);

        std::optional<LoopState> stop;
        bool retry = false;
        std::visit(overloaded{
            [&](const StopSignal&) {
                stop = settle(LoopState::AGENT_STOPPED);
            },
            [&](const MalformedOutput& m) {
                if (m.kind) {
                    // A real tool with bad arguments: a failed call, not a parse failure.
                    malformed_in_a_row = 0;
                    corrective.clear();
                    ToolResult rejected = tool_failure(*m.kind, "invalid_request", m.error);
                    stop = execute_step(rejected_request(*m.kind, "call_" + std::to_string(step)), rejected, m.raw);
                    return;
                }
                malformed_in_a_row++;
                recorder_.events().event(step, "agent_malformed_output",
                    "{\"error\":" + json_mini::quote(m.error) +
                    ",\"consecutive\":" + std::to_string(malformed_in_a_row) +
                    ",\"raw\":" + json_mini::quote(log_output(m.raw)) + "}");
                if (malformed_in_a_row > cfg_.malformed_retry_limit) {
                    malformed_stop_ = true;
                    stop = settle(LoopState::AGENT_STOPPED);
                    return;
                }
                corrective = "Your previous response could not be used (" + m.error +
                             "). Reply with exactly one JSON object: {\"tool\": <name>, \"args\": {...}}, "
                             "or {\"stop\": true, \"reason\": <text>}, or a unified diff.";
                retry = true;
            },
            [&](const ToolRequest& req) {
                malformed_in_a_row = 0;
                corrective.clear();
                stop = execute_step(req, std::nullopt, "");
            },
        }, *action);

        if (retry) continue;
        if (stop) {
            if (*stop == LoopState::REPEATED_FAILURE) return finish(settle(*stop));
            return finish(*stop);
        }
    }
}

} // namespace patchbench

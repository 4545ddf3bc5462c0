#include "test_common.h"
#include "patchbench/attempt.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"
#include "patchbench/loop.h"

#include <chrono>
#include <climits>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace patchbench;

namespace fs = std::filesystem;

static const char* kBroken = "def add(a, b):\n    return a - b\n";
static const char* kFixed = "def add(a, b):\n    return a + b\n";

static const char* kFixDiff =
    "--- a/calc.py\n"
    "+++ b/calc.py\n"
    "@@ -1,2 +1,2 @@\n"
    " def add(a, b):\n"
    "-    return a - b\n"
    "+    return a + b\n";

static std::string tool(const std::string& name, const std::string& args) {
    return "{\"tool\":" + json_mini::quote(name) + ",\"args\":" + args + "}";
}

static std::string stop() { return R"({"stop":true,"reason":"done"})"; }

static std::string apply_fix() {
    return tool("apply_patch", "{\"diff\":" + json_mini::quote(kFixDiff) + "}");
}

// One attempt directory plus a tiny workspace whose "test suite" passes once
// calc.py adds instead of subtracts.
struct Fixture {
    fs::path dir;
    fs::path ws;
    fs::path attempt;
    EngineConfig cfg;
    TaskSpec task;
    std::unique_ptr<LocalSandboxExecutor> sandbox;
    std::unique_ptr<AttemptRecorder> recorder;
    std::unique_ptr<AgentLoop> loop;

    explicit Fixture(const std::string& content) {
        std::string err = make_private_dir(fs::temp_directory_path(), "patchbench-loop-", &dir);
        if (!err.empty()) die("private dir: " + err);
        ws = dir / "ws";
        attempt = dir / "attempt";
        fs::create_directories(ws);
        err = atomic_write_file(ws / "calc.py", content);
        if (!err.empty()) die("write calc.py: " + err);

        cfg.budget.max_steps = 10;
        cfg.budget.max_time_ms = 60000;
        cfg.sandbox.allow_unconfined_root = true;   // scripted commands only
        task.task_id = "calc-add";
        task.test_command = "grep -q 'return a + b' calc.py";
        task.per_command_timeout_ms = 10000;
    }

    ~Fixture() {
        loop.reset();
        recorder.reset();
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    AttemptOutcome run(const AgentAdapter& agent, const CancelToken* cancel = nullptr) {
        sandbox = std::make_unique<LocalSandboxExecutor>(cfg.sandbox);
        recorder = std::make_unique<AttemptRecorder>(attempt, EventHeader{"run-test", task.task_id}, false);
        loop = std::make_unique<AgentLoop>(cfg, task, ws, *sandbox, agent, *recorder, cancel);
        AttemptOutcome out = loop->run();

        ChainCheck c = verify_event_log(attempt / "events.jsonl");
        expect_true(c.ok, "event chain verifies: " + c.error);
        expect_true(recorder->finalized(), "record finalized");
        expect_true(out.record.failure_reason == out.failure_reason, "record carries the failure reason");
        expect_true(classify(classifier_input(out.record)) == out.failure_reason, "record re-classifies identically");

        // History only grows by one numbered step per tool call.
        const auto& h = loop->state().history();
        for (size_t i = 0; i < h.size(); i++) expect_eq_ll(h[i].step, (long long)i + 1, "history step numbering");
        expect_eq_ll(out.record.tool_calls, (long long)h.size(), "tool_calls matches history");
        return out;
    }

    std::vector<std::string> event_names() const {
        std::vector<std::string> names;
        std::ifstream in(attempt / "events.jsonl");
        std::string line;
        while (std::getline(in, line)) {
            json_mini::Doc d = json_mini::parse(line);
            names.push_back(json_mini::get_string(d.root, "event").value_or(""));
        }
        return names;
    }

    bool has_event(const std::string& name) const {
        for (const auto& n : event_names()) {
            if (n == name) return true;
        }
        return false;
    }
};

static void expect_outcome(const AttemptOutcome& o, LoopState stop_state, FailureReason reason, const std::string& msg) {
    if (o.stop_reason != stop_state || o.failure_reason != reason) {
        die(msg + " (got " + loop_state_name(o.stop_reason) + "/" + failure_reason_name(o.failure_reason) +
            ", want " + loop_state_name(stop_state) + "/" + failure_reason_name(reason) + ")");
    }
}

static std::string slurp_file(const fs::path& p) {
    std::string out;
    std::string err = read_whole_file(p, &out);
    return err.empty() ? out : "";
}

// Cancels `tok` once `p` contains `needle`, or after five seconds.
static std::thread cancel_when(CancelToken& tok, fs::path p, std::string needle) {
    return std::thread([&tok, p, needle] {
        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (std::chrono::steady_clock::now() < until) {
            if (slurp_file(p).find(needle) != std::string::npos) break;
            std::this_thread::yield();
        }
        tok.cancel();
    });
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    // Test 1: a task whose tests already pass is not a fix
    {
        Fixture f(kFixed);
        AgentAdapter agent = scripted_agent({apply_fix()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::SUCCESS, FailureReason::BASELINE_NOT_FAILING, "baseline pass");
        expect_eq_ll(o.record.tool_calls, 0, "agent never consulted");
        expect_true(o.record.baseline_passed, "baseline flag recorded");
        expect_true(fs::exists(f.attempt / "logs/baseline_test_stdout.txt"), "baseline log kept");
    }

    // Test 2: read, patch, tests pass
    {
        Fixture f(kBroken);
        AgentAdapter agent = scripted_agent({tool("read_file", R"({"path":"calc.py"})"), apply_fix(), stop()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::SUCCESS, FailureReason::SUCCESS, "patch fixes the task");
        expect_eq_ll(o.record.tool_calls, 2, "stop never reached");
        expect_eq_ll((long long)o.record.patches.size(), 1, "one patch recorded");
        expect_true(o.record.patches[0].artifact == "diffs/step_0002.patch", "artifact named after the step");
        expect_true(fs::exists(f.attempt / "diffs/step_0002.patch"), "artifact on disk");
        expect_true(fs::exists(f.attempt / "logs/step_0002_test_stdout.txt"), "after-patch test log kept");
        expect_true(o.record.last_test_after_patch, "passing test ran after the patch");

        auto names = f.event_names();
        expect_true(names.front() == "attempt_started", "first event");
        expect_true(names.back() == "attempt_finished", "last event");
        expect_true(f.has_event("patch_applied"), "patch event recorded");

        std::string raw;
        expect_true(read_whole_file(f.attempt / "attempt.json", &raw).empty(), "record readable");
        AttemptRecord rec;
        std::string err;
        expect_true(parse_attempt_record(raw, &rec, &err) && rec.finalized, "record on disk is final");
    }

    // Test 3: the step budget allows exactly max_steps calls
    {
        Fixture f(kBroken);
        f.cfg.budget.max_steps = 3;
        std::vector<std::string> script(6, tool("list_files", "{}"));
        AgentAdapter agent = scripted_agent(script);
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::STEP_BUDGET_EXCEEDED, FailureReason::STEP_BUDGET_EXCEEDED, "step budget");
        expect_eq_ll(o.record.tool_calls, 3, "exactly max_steps calls");
        expect_eq_ll(o.record.steps_used, 3, "steps used");
        expect_true(!fs::exists(f.attempt / "logs/final_test_stdout.txt"), "fresh tests are not re-run");
    }

    // Test 4: escapes are ordinary tool failures
    {
        Fixture f(kBroken);
        AgentAdapter agent = scripted_agent({tool("read_file", R"({"path":"../../etc/passwd"})"), stop()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::AGENT_STOPPED, FailureReason::STILL_FAILING, "agent gave up");
        const auto& h = f.loop->state().history();
        expect_true(!h[0].result.ok && h[0].result.error_type == "path_escape", "escape reported to the agent");
    }

    // Test 5: identical failures stop the attempt at the threshold
    {
        Fixture f(kBroken);
        std::vector<std::string> script(5, tool("read_file", R"({"path":"missing.py"})"));
        AgentAdapter agent = scripted_agent(script);
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::REPEATED_FAILURE, FailureReason::REPEATED_FAILURE, "repeated failure");
        expect_eq_ll(o.record.tool_calls, 3, "stopped on the third identical failure");
    }

    // Test 5b: the same failing command three times; tests are re-run before stopping
    {
        Fixture f(kBroken);
        std::vector<std::string> script(5, tool("run", R"({"command":"echo boom; exit 3"})"));
        AgentAdapter agent = scripted_agent(script);
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::REPEATED_FAILURE, FailureReason::REPEATED_FAILURE, "repeated run failure");
        expect_eq_ll(o.record.tool_calls, 3, "not before the third repeat");
        const auto& h = f.loop->state().history();
        expect_true(h[2].result.exit_code && *h[2].result.exit_code == 3, "exit code surfaced");
        expect_true(fs::exists(f.attempt / "logs/final_test_stdout.txt"), "stale tests re-run");
    }

    // Test 6: malformed output beyond the retry limit
    {
        Fixture f(kBroken);
        AgentAdapter agent = scripted_agent({"I think the bug is somewhere.", "Still thinking.", apply_fix()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::AGENT_STOPPED, FailureReason::AGENT_MALFORMED_OUTPUT, "malformed twice");
        expect_eq_ll(o.record.tool_calls, 0, "malformed output is not a tool call");
        expect_true(o.record.malformed_output, "malformed flag recorded");
    }

    // Test 7: one malformed reply is retried without spending a step
    {
        Fixture f(kBroken);
        auto script = std::make_shared<std::vector<std::string>>(
            std::vector<std::string>{"no idea", apply_fix()});
        auto cursor = std::make_shared<size_t>(0);
        auto corrections = std::make_shared<std::vector<std::string>>();
        AgentAdapter agent("recording", [script, cursor, corrections](const AgentObservation& obs) -> AgentAction {
            corrections->push_back(obs.corrective);
            if (*cursor >= script->size()) return StopSignal{"done"};
            return parse_agent_response((*script)[(*cursor)++], "call_" + std::to_string(obs.step));
        });
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::SUCCESS, FailureReason::SUCCESS, "recovered after correction");
        expect_eq_ll(o.record.steps_used, 1, "retry did not consume a step");
        expect_true(corrections->size() == 2, "two agent turns");
        expect_true((*corrections)[0].empty() && !(*corrections)[1].empty(), "corrective message on the retry");
        expect_true(f.has_event("agent_malformed_output"), "malformed output logged");
    }

    // Test 8: bad arguments for a real tool consume a step
    {
        Fixture f(kBroken);
        AgentAdapter agent = scripted_agent({tool("read_file", "{}"), stop()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::AGENT_STOPPED, FailureReason::STILL_FAILING, "invalid request then stop");
        expect_eq_ll(o.record.tool_calls, 1, "invalid request counted");
        const auto& h = f.loop->state().history();
        expect_true(h[0].result.error_type == "invalid_request", "invalid request error type");
        expect_true(h[0].request.kind() == ToolKind::READ_FILE, "rejected call keeps its tool kind");
    }

    // Test 9: adapter failure is a harness fault
    {
        Fixture f(kBroken);
        AgentAdapter agent("broken", [](const AgentObservation&) -> AgentAction {
            throw std::runtime_error("model endpoint unreachable");
        });
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::INFRA_ERROR, FailureReason::INFRA_ERROR, "adapter exception");
        expect_true(!o.record.infra_errors.empty(), "infra error recorded");
    }

    // Test 10: setup failure
    {
        Fixture f(kBroken);
        f.task.setup_commands = {"echo preparing", "exit 7"};
        AgentAdapter agent = scripted_agent({apply_fix()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::SETUP_FAILED, FailureReason::SETUP_FAILED, "setup failed");
        expect_true(!f.has_event("tests_started"), "no tests after failed setup");
        expect_true(fs::exists(f.attempt / "logs/setup_stdout.txt"), "setup log kept");
    }

    // Test 11: operator cancellation
    {
        Fixture f(kBroken);
        CancelToken tok;
        AgentAdapter agent("cancel", [&tok](const AgentObservation& obs) -> AgentAction {
            tok.cancel();
            return parse_agent_response(tool("list_files", "{}"), "call_" + std::to_string(obs.step));
        });
        AttemptOutcome o = f.run(agent, &tok);
        expect_outcome(o, LoopState::INTERRUPTED, FailureReason::INTERRUPTED, "cancelled");
        expect_true(f.has_event("attempt_interrupted"), "interruption logged");
    }

    // Test 12: a shell command edits the workspace; tests are re-run before stopping
    {
        Fixture f(kBroken);
        std::string fix_cmd = "printf 'def add(a, b):\\n    return a + b\\n' > calc.py";
        AgentAdapter agent = scripted_agent({tool("run", "{\"command\":" + json_mini::quote(fix_cmd) + "}"), stop()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::AGENT_STOPPED, FailureReason::SUCCESS, "final re-run sees the fix");
        expect_true(fs::exists(f.attempt / "logs/final_test_stdout.txt"), "final test log kept");
        expect_true(fs::exists(f.attempt / "logs/step_0001_stdout.txt"), "run log kept");
    }

    // Test 13: the agent running the test command itself counts
    {
        Fixture f(kFixed);
        f.task.test_command = "grep -q 'return a + b' calc.py && test -f ready";
        AgentAdapter agent = scripted_agent({
            tool("run", R"({"command":"touch ready"})"),
            tool("run", "{\"command\":" + json_mini::quote(f.task.test_command) + "}"),
            stop(),
        });
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::SUCCESS, FailureReason::SUCCESS, "agent-run test passes");
        expect_eq_ll(o.record.tool_calls, 2, "stopped right after the passing test");
    }

    // Test 14: time budget
    {
        Fixture f(kBroken);
        f.cfg.budget.max_time_ms = 1;
        AgentAdapter agent = scripted_agent({apply_fix()});
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::TIME_BUDGET_EXCEEDED, FailureReason::TIME_BUDGET_EXCEEDED, "time budget");
        expect_eq_ll(o.record.tool_calls, 0, "no calls after the deadline");
    }

    // Test 15: hostile test output does not take the attempt down
    {
        Fixture f(kBroken);
        f.task.test_command =
            "echo '== 99999999999 failed in 0.1s =='; head -c 200000 /dev/zero | tr '\\0' x; echo; "
            "grep -q 'return a + b' calc.py";
        auto counts = std::make_shared<std::vector<int>>();
        AgentAdapter agent("observer", [counts](const AgentObservation& obs) -> AgentAction {
            counts->push_back(obs.failure.failed_count.value_or(-1));
            return StopSignal{"looked"};
        });
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::AGENT_STOPPED, FailureReason::STILL_FAILING, "oversized failure count");
        expect_true(counts->size() == 1 && (*counts)[0] == INT_MAX, "failure count clamped in the observation");
    }

    // Test 16: a slow agent turn cannot outlive the attempt's time budget
    {
        Fixture f(kBroken);
        f.cfg.budget.max_time_ms = 1500;
        AgentConfig ac;
        ac.kind = AgentConfig::Kind::PROCESS;
        ac.command = "/bin/sh -c 'sleep 30'";
        ac.turn_timeout_ms = 600000;
        AgentAdapter agent = make_agent_adapter(ac);
        auto t0 = std::chrono::steady_clock::now();
        AttemptOutcome o = f.run(agent);
        expect_outcome(o, LoopState::TIME_BUDGET_EXCEEDED, FailureReason::TIME_BUDGET_EXCEEDED, "slow agent");
        expect_true(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(10), "turn cut at the deadline");
        expect_true(o.record.infra_errors.empty(), "deadline is not a harness fault");
    }

    // Test 17: cancellation reaches a blocked agent turn
    {
        Fixture f(kBroken);
        AgentConfig ac;
        ac.kind = AgentConfig::Kind::PROCESS;
        ac.command = "/bin/sh -c 'sleep 30'";
        ac.turn_timeout_ms = 600000;
        AgentAdapter agent = make_agent_adapter(ac);
        CancelToken tok;
        std::thread t = cancel_when(tok, f.attempt / "events.jsonl", "agent_turn_started");
        auto t0 = std::chrono::steady_clock::now();
        AttemptOutcome o = f.run(agent, &tok);
        t.join();
        expect_outcome(o, LoopState::INTERRUPTED, FailureReason::INTERRUPTED, "cancel during agent turn");
        expect_true(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(10), "turn stopped promptly");
    }

    // Test 18: a patch that landed before the cancel is still on record
    {
        Fixture f(kBroken);
        expect_true(atomic_write_file(f.ws / "notes.txt", "draft\n").empty(), "notes.txt");
        const std::string diff = "--- a/notes.txt\n+++ b/notes.txt\n@@ -1 +1 @@\n-draft\n+final\n";
        CancelToken tok;
        std::thread t = cancel_when(tok, f.ws / "notes.txt", "final");
        auto turns = std::make_shared<int>(0);
        AgentAdapter agent("patch-then-wait", [turns, diff, &tok](const AgentObservation& obs) -> AgentAction {
            if ((*turns)++ == 0) {
                return parse_agent_response(tool("apply_patch", "{\"diff\":" + json_mini::quote(diff) + "}"),
                                            "call_" + std::to_string(obs.step));
            }
            auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
            while (!tok.cancelled() && std::chrono::steady_clock::now() < until) std::this_thread::yield();
            return StopSignal{"waited"};
        });
        AttemptOutcome o = f.run(agent, &tok);
        t.join();
        expect_outcome(o, LoopState::INTERRUPTED, FailureReason::INTERRUPTED, "cancelled around a patch");
        expect_eq_ll((long long)o.record.patches.size(), 1, "applied patch recorded");
        expect_true(o.record.patches[0].artifact == "diffs/step_0001.patch", "artifact referenced");
        expect_true(fs::exists(f.attempt / "diffs/step_0001.patch"), "artifact on disk");
        expect_true(f.has_event("patch_applied"), "patch event recorded");
    }

    // Test 19: a cancelled command leaves its partial output in the attempt logs
    {
        Fixture f(kBroken);
        CancelToken tok;
        std::thread t = cancel_when(tok, f.attempt / "logs/step_0001_stdout.txt", "partial");
        AgentAdapter agent = scripted_agent({tool("run", R"({"command":"echo partial; sleep 5"})"), stop()});
        AttemptOutcome o = f.run(agent, &tok);
        t.join();
        expect_outcome(o, LoopState::INTERRUPTED, FailureReason::INTERRUPTED, "cancelled during run");
        expect_true(slurp_file(f.attempt / "logs/step_0001_stdout.txt") == "partial\n", "partial stdout kept");
        expect_true(slurp_file(f.attempt / "logs/step_0001_stderr.txt").find("Execution cancelled") != std::string::npos,
                    "cancel marker kept");
        expect_eq_ll(o.record.tool_calls, 1, "cancelled call is in the history");
    }

    std::cerr << "test_agent_loop: ALL PASSED" << std::endl;
    return 0;
}

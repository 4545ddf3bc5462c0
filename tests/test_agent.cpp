#include "test_common.h"
#include "patchbench/agent.h"
#include "patchbench/agent_state.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"
#include "patchbench/observation.h"

#include <chrono>
#include <climits>
#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

using namespace patchbench;

namespace fs = std::filesystem;

static ToolResult run_result(int exit_code, const std::string& output) {
    ToolResult r;
    r.kind = ToolKind::RUN;
    r.ok = true;
    r.exit_code = exit_code;
    r.output = output;
    return r;
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);

    // Test 1: structured responses
    {
        AgentAction a = parse_agent_response(R"({"tool":"read_file","args":{"path":"x.py"}})", "call_1");
        expect_true(std::holds_alternative<ToolRequest>(a), "tool call parsed");
        const ToolRequest& req = std::get<ToolRequest>(a);
        expect_true(req.id == "call_1" && req.kind() == ToolKind::READ_FILE, "request id and kind");

        a = parse_agent_response(R"({"stop":true,"reason":"done"})", "call_2");
        expect_true(std::holds_alternative<StopSignal>(a) && std::get<StopSignal>(a).reason == "done", "stop parsed");

        a = parse_agent_response(R"({"tool":"read_file","args":{}})", "call_3");
        expect_true(std::holds_alternative<MalformedOutput>(a), "bad args are malformed");
        expect_true(std::get<MalformedOutput>(a).kind == ToolKind::READ_FILE, "known tool keeps its kind");

        a = parse_agent_response(R"({"tool":"format_disk"})", "call_4");
        expect_true(std::holds_alternative<MalformedOutput>(a) && !std::get<MalformedOutput>(a).kind,
                    "unknown tool has no kind");

        a = parse_agent_response(R"({"thought":"hmm"})", "call_5");
        expect_true(std::holds_alternative<MalformedOutput>(a), "object without tool or stop");

        a = parse_agent_response("   ", "call_6");
        expect_true(std::holds_alternative<MalformedOutput>(a), "empty response");
    }

    // Test 2: free text falls back to diff extraction
    {
        std::string text = "The bug is in calc.\n```diff\n--- a/calc.py\n+++ b/calc.py\n@@ -1 +1 @@\n-a\n+b\n```\n";
        AgentAction a = parse_agent_response(text, "call_7");
        expect_true(std::holds_alternative<ToolRequest>(a), "diff in prose becomes a tool call");
        const auto& p = std::get<ApplyPatchParams>(std::get<ToolRequest>(a).params);
        expect_true(p.origin == PatchOrigin::EXTRACTED, "extracted origin");
        expect_true(p.diff.find("+++ b/calc.py") != std::string::npos, "diff body kept");

        a = parse_agent_response("I am not sure what to do next.", "call_8");
        expect_true(std::holds_alternative<MalformedOutput>(a), "plain prose is malformed");
    }

    // Test 3: script loading and replay
    {
        std::vector<std::string> responses;
        std::string err;
        expect_true(load_agent_script(R"([{"tool":"list_files"},"plain text",{"stop":true}])", &responses, &err),
                    "array script loads: " + err);
        expect_eq_ll((long long)responses.size(), 3, "three scripted responses");
        expect_true(responses[1] == "plain text", "string entries kept verbatim");

        expect_true(load_agent_script(R"({"actions":[{"stop":true}]})", &responses, &err), "wrapped script loads");
        expect_true(!load_agent_script("[1,2]", &responses, &err), "numeric entries rejected");
        expect_true(!load_agent_script("{oops", &responses, &err), "invalid JSON rejected");

        AgentAdapter agent = scripted_agent({R"({"tool":"list_files"})"}, "unit");
        expect_true(agent.name() == "unit", "adapter name");
        AgentObservation obs;
        obs.step = 1;
        AgentAction a = agent.next_action(obs);
        expect_true(std::holds_alternative<ToolRequest>(a), "first scripted action");
        expect_true(std::get<ToolRequest>(a).id == "call_1", "call id from step");
        a = agent.next_action(obs);
        expect_true(std::holds_alternative<StopSignal>(a), "exhausted script stops");
    }

    // Test 4: agent specs and adapters
    {
        AgentConfig c;
        std::string err;
        expect_true(parse_agent_spec("scripted:/tmp/s.json", &c, &err) && c.kind == AgentConfig::Kind::SCRIPTED,
                    "scripted spec");
        expect_true(parse_agent_spec("process:python3 agent.py", &c, &err) && c.command == "python3 agent.py",
                    "process spec");
        expect_true(!parse_agent_spec("http://x", &c, &err), "unknown agent kind");
        expect_true(!parse_agent_spec("scripted:", &c, &err), "missing argument");

        AgentConfig missing;
        missing.script_path = "/nonexistent/script.json";
        bool threw = false;
        try {
            make_agent_adapter(missing);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        expect_true(threw, "missing script throws");

        AgentConfig proc;
        proc.kind = AgentConfig::Kind::PROCESS;
        proc.command = "/bin/sh -c 'grep -q task_id && echo \"{\\\"stop\\\":true,\\\"reason\\\":\\\"seen\\\"}\"'";
        proc.turn_timeout_ms = 5000;
        AgentAdapter pa = make_agent_adapter(proc);
        AgentObservation obs;
        obs.task_id = "t";
        obs.time_remaining_ms = 5000;
        AgentAction a = pa.next_action(obs);
        expect_true(std::holds_alternative<StopSignal>(a), "process agent reads the observation and answers");
        expect_true(std::get<StopSignal>(a).reason == "seen", "process agent reply parsed");

        AgentConfig failing = proc;
        failing.command = "/bin/sh -c 'exit 3'";
        AgentAdapter fa = make_agent_adapter(failing);
        threw = false;
        try {
            fa.next_action(obs);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        expect_true(threw, "failing agent process throws");

        // A slow agent turn stops when the attempt is cancelled.
        AgentConfig slow = proc;
        slow.command = "/bin/sh -c 'sleep 30'";
        AgentAdapter sa = make_agent_adapter(slow);
        CancelToken tok;
        tok.cancel();
        AgentObservation cobs = obs;
        cobs.cancel = &tok;
        auto t0 = std::chrono::steady_clock::now();
        threw = false;
        try {
            sa.next_action(cobs);
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()).find("cancelled") != std::string::npos;
        }
        expect_true(threw, "cancelled agent turn throws");
        expect_true(std::chrono::steady_clock::now() - t0 < std::chrono::seconds(10), "cancelled turn returns promptly");
    }

    // Test 5: test output scraping
    {
        std::string pytest =
            "tests/test_calc.py F.\n"
            "    def test_add():\n"
            ">       assert add(1, 2) == 3\n"
            "E       assert -1 == 3\n"
            "calc/core.py:3: AssertionError\n"
            "FAILED tests/test_calc.py::test_add - assert -1 == 3\n"
            "1 failed, 1 passed in 0.02s\n";
        TestFailureSummary s = parse_test_output(pytest, 1);
        expect_eq_ll(s.exit_code, 1, "exit code kept");
        expect_true(s.failed_count && *s.failed_count == 1, "one failure counted");
        expect_true(s.failed_tests.size() == 1 && s.failed_tests[0] == "tests/test_calc.py::test_add", "node id");
        expect_true(!s.error_lines.empty(), "error lines collected");
        expect_true(!s.file_hints.empty() && s.file_hints[0] == "tests/test_calc.py", "failing test file first");
        bool has_src = false;
        for (const auto& f : s.file_hints) has_src |= (f == "calc/core.py");
        expect_true(has_src, "source file hinted");

        TestFailureSummary u = parse_test_output("FAIL: test_x (mod.Tests)\nFAILED (failures=2)\n", 1);
        expect_true(u.failed_tests.size() == 1 && u.failed_tests[0] == "test_x (mod.Tests)", "unittest name");

        TestFailureSummary e = parse_test_output("", 0);
        expect_true(!e.failed_count && e.failed_tests.empty(), "empty output");

        TestFailureSummary huge = parse_test_output("== 99999999999 failed in 0.1s ==\n", 1);
        expect_true(huge.failed_count && *huge.failed_count == INT_MAX, "oversized count clamps");

        std::string noisy = std::string(200000, 'x') + "\nFAILED tests/test_calc.py::test_add - assert 0\n";
        TestFailureSummary n = parse_test_output(noisy, 1);
        expect_true(n.failed_tests.size() == 1 && n.failed_tests[0] == "tests/test_calc.py::test_add",
                    "long lines do not hide later failures");
    }

    // Test 6: repeated-failure signatures
    {
        expect_true(failure_signature(run_result(0, "ok")).empty(), "passing run is progress");
        std::string a = failure_signature(run_result(1, "failed in 0.12s"));
        std::string b = failure_signature(run_result(1, "failed in 0.98s"));
        std::string c = failure_signature(run_result(1, "other failure"));
        expect_true(!a.empty() && a == b, "timings do not change the signature");
        expect_true(a != c, "different output changes the signature");
        ToolResult f = tool_failure(ToolKind::READ_FILE, "file_not_found", "file not found: x.py");
        expect_true(failure_signature(f).find("read_file|file_not_found|") == 0, "failure signature format");
    }

    // Test 7: agent state invariants
    {
        AgentState st(2, std::chrono::steady_clock::now() + std::chrono::hours(1));
        expect_eq_ll(st.steps_remaining(), 2, "initial steps");
        st.consume_step();
        st.consume_step();
        st.consume_step();
        expect_eq_ll(st.steps_remaining(), 0, "steps never go negative");

        expect_eq_ll(st.note_outcome("x"), 1, "first failure");
        expect_eq_ll(st.note_outcome("x"), 2, "repeat counted");
        expect_eq_ll(st.note_outcome("y"), 1, "new signature restarts");
        expect_eq_ll(st.note_outcome(""), 0, "success resets");

        TestRunResult t;
        t.exit_code = 1;
        t.patch_seq = 0;
        st.set_last_test(t);
        expect_true(st.tests_fresh(), "test with no patches is fresh");
        st.add_patch(1, "diffs/step_0001.patch");
        expect_true(!st.tests_fresh(), "patch makes tests stale");
        expect_eq_ll(st.patches()[0].seq, 1, "patch seq starts at one");
        t.patch_seq = 1;
        st.set_last_test(t);
        expect_true(st.tests_fresh(), "test after patch is fresh");

        bool threw = false;
        try {
            st.set_stop_reason(LoopState::RUNNING);
        } catch (const std::logic_error&) {
            threw = true;
        }
        expect_true(threw, "non-terminal stop reason rejected");
        st.set_stop_reason(LoopState::AGENT_STOPPED);
        threw = false;
        try {
            st.set_stop_reason(LoopState::SUCCESS);
        } catch (const std::logic_error&) {
            threw = true;
        }
        expect_true(threw, "stop reason is set once");

        AgentState late(5, std::chrono::steady_clock::now() - std::chrono::seconds(1));
        expect_true(late.time_exhausted() && late.time_remaining_ms() == 0, "past deadline");
    }

    // Test 8: observations stay bounded
    {
        EngineConfig cfg;
        cfg.observation_window = 2;
        TaskSpec task;
        task.task_id = "t1";
        task.test_command = "pytest -q";
        AgentState st(10, std::chrono::steady_clock::now() + std::chrono::hours(1));
        for (int i = 1; i <= 4; i++) {
            HistoryEntry e;
            e.step = i;
            e.request.id = "call_" + std::to_string(i);
            e.request.params = RunParams{"pytest -q", std::nullopt, {}, std::nullopt};
            e.result = run_result(1, "1 failed");
            st.append(e);
        }
        TestRunResult t;
        t.exit_code = 1;
        t.output = "FAILED tests/test_a.py::test_b - boom\n";
        st.set_last_test(t);

        AgentObservation obs = build_observation(st, task, cfg, 5);
        expect_eq_ll((long long)obs.recent.size(), 2, "recent window bounded");
        expect_true(obs.recent.back() == "step 4: run -> exit_code=1", "latest summary last: " + obs.recent.back());
        expect_true(obs.failure.failed_tests.size() == 1, "failure summary attached");
        json_mini::Doc d = json_mini::parse(obs.to_json());
        expect_true(d.is_object(), "observation serializes to JSON");
        expect_true(json_mini::get_string(d.root, "test_command").value_or("") == "pytest -q", "test command shown");
    }

    std::cerr << "test_agent: ALL PASSED" << std::endl;
    return 0;
}

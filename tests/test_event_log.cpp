#include "test_common.h"
#include "patchbench/attempt.h"
#include "patchbench/event_log.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace patchbench;

namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream in(p);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

static void write_lines(const fs::path& p, const std::vector<std::string>& lines) {
    std::ostringstream o;
    for (const auto& l : lines) o << l << "\n";
    std::string err = atomic_write_file(p, o.str());
    if (!err.empty()) die("rewrite " + p.string() + ": " + err);
}

int main() {
    fs::path tmp;
    std::string err = make_private_dir(fs::temp_directory_path(), "patchbench-events-", &tmp);
    expect_true(err.empty(), "private dir: " + err);

    EventHeader hdr{"run-1", "task-1"};

    // Test 1: canonical JSON sorts keys recursively
    {
        bool ok = false;
        std::string c = canonical_json(R"({"b":1,"a":{"d":[2,{"z":0,"y":1}],"c":"x"}})", &ok);
        expect_true(ok, "canonical_json parses");
        expect_true(c == R"({"a":{"c":"x","d":[2,{"y":1,"z":0}]},"b":1})", "sorted keys: " + c);
        canonical_json("{not json", &ok);
        expect_true(!ok, "invalid JSON flagged");
    }

    // Test 2: chain of records verifies
    fs::path log = tmp / "events.jsonl";
    {
        EventLog ev(hdr, log, false);
        ev.event(0, "attempt_started", R"({"agent":"scripted"})");
        ev.event(1, "tool_call_started", R"({"tool":"read_file"})");
        ev.event(1, "tool_call_finished", "plain text payload");
        expect_eq_ll(ev.records(), 3, "three records written");
        expect_true(ev.last_hash().size() == 64, "hash is hex sha256");
    }
    {
        ChainCheck c = verify_event_log(log);
        expect_true(c.ok, "intact chain verifies: " + c.error);
        expect_eq_ll(c.records, 3, "records counted");

        auto lines = read_lines(log);
        json_mini::Doc first = json_mini::parse(lines[0]);
        expect_true(json_mini::get_string(first.root, "chain_prev").value_or("") == std::string(64, '0'),
                    "first record chains from genesis");
        expect_true(json_mini::get_string(first.root, "run_id").value_or("") == "run-1", "run id stamped");
        expect_eq_ll(json_mini::get_int(first.root, "seq").value_or(-1), 0, "sequence starts at zero");
        json_mini::Doc third = json_mini::parse(lines[2]);
        expect_true(json_mini::get_string(third.root, "payload").value_or("") == "plain text payload",
                    "non-JSON payload stored as a string");
    }

    // Test 3: an existing log is never reopened
    {
        bool threw = false;
        try {
            EventLog again(hdr, log, false);
        } catch (const RecorderError&) {
            threw = true;
        }
        expect_true(threw, "opening an existing event log must fail");
    }

    // Test 4: tampering is detected at the edited line
    {
        auto lines = read_lines(log);
        auto pos = lines[1].find("read_file");
        expect_true(pos != std::string::npos, "fixture contains the tool name");
        lines[1].replace(pos, 9, "run_cmds!");
        write_lines(log, lines);
        ChainCheck c = verify_event_log(log);
        expect_true(!c.ok, "edited payload breaks the chain");
        expect_eq_ll(c.bad_line, 2, "bad line reported");

        auto orig = read_lines(log);
        orig.erase(orig.begin() + 1);
        write_lines(log, orig);
        c = verify_event_log(log);
        expect_true(!c.ok, "deleted record breaks the chain");
    }

    // Test 5: recorder lifecycle
    {
        fs::path dir = tmp / "attempt";
        AttemptRecorder rec(dir, hdr, false);
        expect_true(fs::is_directory(rec.logs_dir()) && fs::is_directory(rec.diffs_dir()), "layout created");

        AttemptRecord placeholder;
        placeholder.run_id = hdr.run_id;
        placeholder.task_id = hdr.task_id;
        placeholder.agent = "scripted";
        rec.start(placeholder);

        std::string raw;
        expect_true(read_whole_file(rec.record_path(), &raw).empty(), "placeholder written");
        AttemptRecord parsed;
        std::string perr;
        expect_true(parse_attempt_record(raw, &parsed, &perr), "placeholder parses: " + perr);
        expect_true(!parsed.finalized && !parsed.stop_reason, "placeholder is not final");

        AttemptRecord fin = placeholder;
        fin.stop_reason = LoopState::AGENT_STOPPED;
        fin.failure_reason = FailureReason::STILL_FAILING;
        fin.baseline_exit_code = 1;
        fin.last_test_exit_code = 1;
        fin.last_test_after_patch = true;
        fin.tool_calls = 4;
        fin.patches = {{1, 2, "diffs/step_0002.patch"}};
        fin.config_json = R"({"profile":"dev"})";
        rec.finalize(fin);
        expect_true(rec.finalized(), "recorder finalized");

        bool threw = false;
        try {
            rec.finalize(fin);
        } catch (const std::logic_error&) {
            threw = true;
        }
        expect_true(threw, "second finalize must throw");

        raw.clear();
        expect_true(read_whole_file(rec.record_path(), &raw).empty(), "final record readable");
        expect_true(parse_attempt_record(raw, &parsed, &perr), "final record parses: " + perr);
        expect_true(parsed.finalized, "final flag set");
        expect_true(parsed.stop_reason == LoopState::AGENT_STOPPED, "stop reason round-trips");
        expect_true(parsed.failure_reason == FailureReason::STILL_FAILING, "failure reason round-trips");
        expect_eq_ll(parsed.tool_calls, 4, "tool calls round-trip");
        expect_true(parsed.patches.size() == 1 && parsed.patches[0].artifact == "diffs/step_0002.patch",
                    "patches round-trip");
        expect_true(classify(classifier_input(parsed)) == FailureReason::STILL_FAILING,
                    "stored reason matches re-classification");
    }

    // Test 6: malformed records are rejected
    {
        AttemptRecord r;
        std::string perr;
        expect_true(!parse_attempt_record("[]", &r, &perr), "array is not a record");
        expect_true(!parse_attempt_record(R"({"stop_reason":"EXPLODED"})", &r, &perr), "unknown stop reason");
        expect_true(!parse_attempt_record(R"({"infra_errors":[1]})", &r, &perr), "non-string infra errors");
    }

    fs::remove_all(tmp);
    std::cerr << "test_event_log: ALL PASSED" << std::endl;
    return 0;
}

#include "patchbench/attempt.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"

#include <sstream>
#include <stdexcept>
#include <system_error>

namespace patchbench {

namespace fs = std::filesystem;

namespace {

std::string opt_int(const std::optional<int>& v) {
    return v ? std::to_string(*v) : "null";
}

const char* b(bool v) { return v ? "true" : "false"; }

std::optional<int> read_opt_int(json_object* o, const char* key) {
    auto v = json_mini::get_int(o, key);
    if (!v) return std::nullopt;
    return (int)*v;
}

} // namespace

std::string AttemptRecord::to_json() const {
    using json_mini::quote;
    std::ostringstream o;
    o << "{";
    o << "\"schema_version\":" << quote(kSchemaVersion) << ",";
    o << "\"run_id\":" << quote(run_id) << ",";
    o << "\"task_id\":" << quote(task_id) << ",";
    o << "\"agent\":" << quote(agent) << ",";
    o << "\"finalized\":" << b(finalized) << ",";
    o << "\"started_at\":" << quote(started_at) << ",";
    o << "\"ended_at\":" << (ended_at.empty() ? "null" : quote(ended_at)) << ",";
    o << "\"duration_ms\":" << duration_ms << ",";
    o << "\"stop_reason\":" << (stop_reason ? quote(loop_state_name(*stop_reason)) : "null") << ",";
    o << "\"failure_reason\":" << (failure_reason ? quote(failure_reason_name(*failure_reason)) : "null") << ",";
    o << "\"baseline\":{\"exit_code\":" << opt_int(baseline_exit_code)
      << ",\"passed\":" << b(baseline_passed) << "},";
    o << "\"last_test\":{\"exit_code\":" << opt_int(last_test_exit_code)
      << ",\"timed_out\":" << b(last_test_timed_out)
      << ",\"after_patch\":" << b(last_test_after_patch) << "},";
    o << "\"agent_malformed_output\":" << b(malformed_output) << ",";
    o << "\"budgets\":{\"max_steps\":" << max_steps << ",\"steps_used\":" << steps_used
      << ",\"max_time_ms\":" << max_time_ms << ",\"time_used_ms\":" << time_used_ms << "},";
    o << "\"tool_calls\":" << tool_calls << ",";
    o << "\"patches\":[";
    for (size_t i = 0; i < patches.size(); i++) {
        if (i) o << ",";
        o << "{\"seq\":" << patches[i].seq << ",\"step\":" << patches[i].step
          << ",\"artifact\":" << quote(patches[i].artifact) << "}";
    }
    o << "],";
    o << "\"artifacts\":{\"events\":\"events.jsonl\",\"logs_dir\":\"logs\",\"diffs_dir\":\"diffs\"},";
    o << "\"config\":" << (config_json.empty() ? "{}" : config_json) << ",";
    o << "\"infra_errors\":" << json_mini::string_array(infra_errors);
    o << "}";
    return o.str();
}

bool parse_attempt_record(const std::string& json, AttemptRecord* out, std::string* err) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d.is_object()) {
        *err = "attempt record is not a JSON object";
        return false;
    }
    AttemptRecord r;
    r.run_id = json_mini::get_string(d.root, "run_id").value_or("");
    r.task_id = json_mini::get_string(d.root, "task_id").value_or("");
    r.agent = json_mini::get_string(d.root, "agent").value_or("");
    r.started_at = json_mini::get_string(d.root, "started_at").value_or("");
    r.ended_at = json_mini::get_string(d.root, "ended_at").value_or("");
    r.duration_ms = json_mini::get_int(d.root, "duration_ms").value_or(0);
    r.finalized = json_mini::get_bool(d.root, "finalized").value_or(false);
    r.malformed_output = json_mini::get_bool(d.root, "agent_malformed_output").value_or(false);
    r.tool_calls = (int)json_mini::get_int(d.root, "tool_calls").value_or(0);

    if (auto s = json_mini::get_string(d.root, "stop_reason")) {
        r.stop_reason = parse_loop_state(*s);
        if (!r.stop_reason) {
            *err = "unknown stop_reason: " + *s;
            return false;
        }
    }
    if (auto s = json_mini::get_string(d.root, "failure_reason")) {
        r.failure_reason = parse_failure_reason(*s);
        if (!r.failure_reason) {
            *err = "unknown failure_reason: " + *s;
            return false;
        }
    }

    json_object* baseline = json_mini::field(d.root, "baseline");
    r.baseline_exit_code = read_opt_int(baseline, "exit_code");
    r.baseline_passed = json_mini::get_bool(baseline, "passed").value_or(false);

    json_object* last = json_mini::field(d.root, "last_test");
    r.last_test_exit_code = read_opt_int(last, "exit_code");
    r.last_test_timed_out = json_mini::get_bool(last, "timed_out").value_or(false);
    r.last_test_after_patch = json_mini::get_bool(last, "after_patch").value_or(false);

    json_object* budgets = json_mini::field(d.root, "budgets");
    r.max_steps = (int)json_mini::get_int(budgets, "max_steps").value_or(0);
    r.steps_used = (int)json_mini::get_int(budgets, "steps_used").value_or(0);
    r.max_time_ms = json_mini::get_int(budgets, "max_time_ms").value_or(0);
    r.time_used_ms = json_mini::get_int(budgets, "time_used_ms").value_or(0);

    json_object* patches = json_mini::field(d.root, "patches");
    if (patches && json_object_is_type(patches, json_type_array)) {
        for (size_t i = 0; i < json_object_array_length(patches); i++) {
            json_object* el = json_object_array_get_idx(patches, i);
            PatchRef p;
            p.seq = (int)json_mini::get_int(el, "seq").value_or(0);
            p.step = (int)json_mini::get_int(el, "step").value_or(0);
            p.artifact = json_mini::get_string(el, "artifact").value_or("");
            r.patches.push_back(p);
        }
    }

    auto infra = json_mini::get_strings(d.root, "infra_errors");
    if (json_mini::field(d.root, "infra_errors") && !infra) {
        *err = "infra_errors must be an array of strings";
        return false;
    }
    if (infra) r.infra_errors = *infra;

    if (json_object* cfg = json_mini::field(d.root, "config")) r.config_json = json_mini::to_json(cfg);

    *out = std::move(r);
    return true;
}

ClassifierInput classifier_input(const AttemptRecord& rec) {
    ClassifierInput in;
    in.terminal = rec.stop_reason.value_or(LoopState::INIT);
    in.baseline_passed = rec.baseline_passed;
    in.last_test_exit_code = rec.last_test_exit_code;
    in.last_test_timed_out = rec.last_test_timed_out;
    in.last_test_fresh = rec.last_test_after_patch;
    in.malformed_output = rec.malformed_output;
    in.infra_errors = rec.infra_errors;
    return in;
}

AttemptRecorder::AttemptRecorder(const fs::path& dir, const EventHeader& hdr, bool fsync_events) : dir_(dir), hdr_(hdr) {
    std::error_code ec;
    fs::create_directories(dir_ / "logs", ec);
    if (!ec) fs::create_directories(dir_ / "diffs", ec);
    if (ec) throw RecorderError("cannot create attempt directory " + dir_.string() + ": " + ec.message());
    events_ = std::make_unique<EventLog>(hdr, dir_ / "events.jsonl", fsync_events);
}

void AttemptRecorder::start(const AttemptRecord& placeholder) {
    AttemptRecord r = placeholder;
    r.finalized = false;
    std::string err = atomic_write_file(record_path(), r.to_json() + "\n");
    if (!err.empty()) throw RecorderError("cannot write attempt record: " + err);
}

void AttemptRecorder::finalize(const AttemptRecord& rec) {
    if (finalized_) throw std::logic_error("attempt record already finalized");
    AttemptRecord r = rec;
    r.finalized = true;
    std::string err = atomic_write_file(record_path(), r.to_json() + "\n");
    if (!err.empty()) throw RecorderError("cannot finalize attempt record: " + err);
    finalized_ = true;
}

} // namespace patchbench

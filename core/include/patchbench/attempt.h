#pragma once

#include "classifier.h"
#include "event_log.h"
#include "types.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

struct PatchRef {
    int seq{0};              // 1-based order of application
    int step{0};
    std::string artifact;    // attempt-relative, e.g. diffs/step_0004.patch
};

struct AttemptRecord {
    std::string run_id;
    std::string task_id;
    std::string agent;
    std::string started_at;
    std::string ended_at;
    long long duration_ms{0};

    std::optional<LoopState> stop_reason;
    std::optional<FailureReason> failure_reason;

    std::optional<int> baseline_exit_code;
    bool baseline_passed{false};

    std::optional<int> last_test_exit_code;
    bool last_test_timed_out{false};
    bool last_test_after_patch{false};
    bool malformed_output{false};

    int max_steps{0};
    int steps_used{0};
    long long max_time_ms{0};
    long long time_used_ms{0};
    int tool_calls{0};

    std::vector<PatchRef> patches;
    std::vector<std::string> infra_errors;
    std::string config_json{"{}"};
    bool finalized{false};

    std::string to_json() const;
};

bool parse_attempt_record(const std::string& json, AttemptRecord* out, std::string* err);

ClassifierInput classifier_input(const AttemptRecord& rec);

// Owns one attempt directory:
//   events.jsonl  append-only, hash-chained
//   logs/         per-call stdout/stderr
//   diffs/        immutable patch artifacts
//   attempt.json  placeholder at start, replaced once by the final record
class AttemptRecorder {
public:
    AttemptRecorder(const std::filesystem::path& dir, const EventHeader& hdr, bool fsync_events);

    const std::filesystem::path& dir() const { return dir_; }
    const EventHeader& header() const { return hdr_; }
    std::filesystem::path logs_dir() const { return dir_ / "logs"; }
    std::filesystem::path diffs_dir() const { return dir_ / "diffs"; }
    std::filesystem::path record_path() const { return dir_ / "attempt.json"; }

    EventLog& events() { return *events_; }

    // Write the not-yet-finalized record. Throws RecorderError.
    void start(const AttemptRecord& placeholder);

    // Atomically replace attempt.json with the final record. A second call
    // throws std::logic_error; I/O failure throws RecorderError.
    void finalize(const AttemptRecord& rec);
    bool finalized() const { return finalized_; }

private:
    std::filesystem::path dir_;
    EventHeader hdr_;
    std::unique_ptr<EventLog> events_;
    bool finalized_{false};
};

} // namespace patchbench

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace patchbench {

// The recorder itself failed (disk full, directory gone). Nothing about the
// attempt can be trusted past this point, so it propagates to the caller.
class RecorderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EventHeader {
    std::string run_id;
    std::string task_id;
};

// Append-only JSONL event stream. Each line is canonical JSON (sorted keys)
// carrying chain_prev/chain_hash, where
//   chain_hash = SHA256(chain_prev || canonical record without chain fields).
class EventLog {
public:
    EventLog(const EventHeader& hdr, const std::filesystem::path& path, bool fsync_each);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Throws RecorderError if the line cannot be written.
    void event(int step, const std::string& name, const std::string& payload_json);

    const std::filesystem::path& path() const { return path_; }
    long long records() const { return seq_; }
    const std::string& last_hash() const { return chain_prev_; }

private:
    EventHeader hdr_;
    std::filesystem::path path_;
    bool fsync_each_{false};
    int fd_{-1};
    long long seq_{0};
    std::string chain_prev_;
};

struct ChainCheck {
    bool ok{false};
    long long records{0};
    long long bad_line{0};   // 1-based, 0 when ok
    std::string error;
};

// Recompute the hash chain and sequence numbers of an events.jsonl file.
ChainCheck verify_event_log(const std::filesystem::path& path);

// Parse then re-serialize with sorted keys. *ok is false if raw is not JSON.
std::string canonical_json(const std::string& raw, bool* ok);

} // namespace patchbench

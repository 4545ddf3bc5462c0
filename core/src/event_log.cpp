#include "patchbench/event_log.h"
#include "patchbench/hash.h"
#include "patchbench/json_mini.h"
#include "patchbench/types.h"

#include <json-c/json.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace patchbench {

namespace {

const std::string kGenesisHash(64, '0');

// Recursively serialize JSON with sorted keys (RFC 8785 JCS subset).
void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_mini::quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    case json_type_string:
        out << json_mini::quote(json_object_get_string(obj));
        break;
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string serialize(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

// Record fields shared by the hashed body and the output line.
void add_record_fields(json_object* rec, const EventHeader& hdr, long long seq, int step,
                       const std::string& ts, const std::string& name, const std::string& payload) {
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_mini::Doc p = json_mini::parse(payload);
    if (p) {
        json_object_object_add(rec, "payload", p.root);
        p.root = nullptr;
    } else {
        json_object_object_add(rec, "payload", json_object_new_string(payload.c_str()));
    }
    json_object_object_add(rec, "run_id", json_object_new_string(hdr.run_id.c_str()));
    json_object_object_add(rec, "schema_version", json_object_new_string(kSchemaVersion));
    json_object_object_add(rec, "seq", json_object_new_int64(seq));
    json_object_object_add(rec, "step", json_object_new_int(step));
    json_object_object_add(rec, "task_id", json_object_new_string(hdr.task_id.c_str()));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));
}

} // namespace

std::string canonical_json(const std::string& raw, bool* ok) {
    json_mini::Doc d = json_mini::parse(raw);
    if (ok) *ok = static_cast<bool>(d) || raw == "null";
    if (!d) return raw;
    return serialize(d.root);
}

EventLog::EventLog(const EventHeader& hdr, const std::filesystem::path& path, bool fsync_each)
    : hdr_(hdr), path_(path), fsync_each_(fsync_each), chain_prev_(kGenesisHash) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw RecorderError("cannot create event log " + path_.string() + ": " + std::strerror(errno));
    }
}

EventLog::~EventLog() {
    if (fd_ >= 0) ::close(fd_);
}

void EventLog::event(int step, const std::string& name, const std::string& payload_json) {
    const std::string ts = iso_now();
    const long long seq = seq_;

    json_mini::Doc rec(json_object_new_object());
    add_record_fields(rec.root, hdr_, seq, step, ts, name, payload_json);
    const std::string record = serialize(rec.root);

    const std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    json_object_object_add(rec.root, "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(rec.root, "chain_prev", json_object_new_string(chain_prev_.c_str()));
    const std::string line = serialize(rec.root) + "\n";

    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::write(fd_, line.data() + off, line.size() - off);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) throw RecorderError("event log write failed: " + std::string(std::strerror(errno)));
        off += (size_t)n;
    }
    if (fsync_each_ && ::fsync(fd_) != 0) {
        throw RecorderError("event log fsync failed: " + std::string(std::strerror(errno)));
    }

    chain_prev_ = chain_hash;
    seq_++;
}

ChainCheck verify_event_log(const std::filesystem::path& path) {
    ChainCheck res;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        res.error = "cannot open " + path.string();
        return res;
    }

    std::string prev = kGenesisHash;
    std::string line;
    long long lineno = 0;
    auto fail = [&](const std::string& msg) {
        res.ok = false;
        res.bad_line = lineno;
        res.error = "line " + std::to_string(lineno) + ": " + msg;
        return res;
    };

    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) return fail("empty line");
        json_mini::Doc d = json_mini::parse(line);
        if (!d.is_object()) return fail("not a JSON object");

        auto stored_prev = json_mini::get_string(d.root, "chain_prev");
        auto stored_hash = json_mini::get_string(d.root, "chain_hash");
        auto seq = json_mini::get_int(d.root, "seq");
        if (!stored_prev || !stored_hash || !seq) return fail("missing chain fields");
        if (*stored_prev != prev) return fail("chain_prev does not match previous record");
        if (*seq != lineno - 1) return fail("sequence gap (expected " + std::to_string(lineno - 1) + ")");

        json_object_object_del(d.root, "chain_prev");
        json_object_object_del(d.root, "chain_hash");
        const std::string expect = hash::sha256_hex(prev + serialize(d.root));
        if (expect != *stored_hash) return fail("chain_hash mismatch");

        prev = *stored_hash;
        res.records++;
    }
    res.ok = true;
    return res;
}

} // namespace patchbench

#include "patchbench/tools.h"
#include "patchbench/fs_guard.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <map>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

constexpr size_t kMaxLineChars = 400;
// std::regex recurses per character; longer lines would exhaust the stack.
constexpr size_t kMaxRegexLineChars = 4096;

struct Match {
    std::string path;
    int line{0};
    std::string text;
    std::vector<std::string> before;
    std::vector<std::string> after;
};

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

std::string clip(const std::string& s) {
    if (s.size() <= kMaxLineChars) return s;
    return s.substr(0, kMaxLineChars) + "...";
}

bool load_text(const fs::path& root, const fs::path& p, size_t max_bytes, std::string* out) {
    std::string err;
    int fd = patchbench::open_under_root_nofollow(root, p, &err);
    if (fd < 0) return false;
    char buf[65536];
    bool ok = true;
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            ok = false;
            break;
        }
        if (n == 0) break;
        out->append(buf, (size_t)n);
        if (out->size() > max_bytes) {
            ok = false;
            break;
        }
    }
    ::close(fd);
    if (!ok) return false;
    return out->find('\0') >= std::min<size_t>(out->size(), 8192);
}

std::string match_json(const Match& m) {
    std::ostringstream o;
    o << "{\"path\":" << patchbench::json_mini::quote(m.path)
      << ",\"line\":" << m.line
      << ",\"text\":" << patchbench::json_mini::quote(m.text);
    if (!m.before.empty() || !m.after.empty()) {
        o << ",\"before\":" << patchbench::json_mini::string_array(m.before)
          << ",\"after\":" << patchbench::json_mini::string_array(m.after);
    }
    o << "}";
    return o.str();
}

} // namespace

namespace patchbench {

// search: literal or regex over text files, ranked by per-file match count.
ToolResult tool_search(const SearchParams& p, const ToolContext& ctx, const EngineConfig& cfg) {
    const PathPolicy policy = path_policy(cfg);
    PathResolution r = resolve_safe_path(ctx.workspace, p.path, policy);
    if (!r.ok) return tool_failure(ToolKind::SEARCH, r.error_type, r.message);

    std::regex re;
    if (p.regex) {
        try {
            auto flags = std::regex::ECMAScript;
            if (p.ignore_case) flags |= std::regex::icase;
            re = std::regex(p.query, flags);
        } catch (const std::regex_error& e) {
            return tool_failure(ToolKind::SEARCH, "invalid_regex", std::string("invalid regex: ") + e.what());
        }
    }
    const std::string needle = p.ignore_case ? lower_ascii(p.query) : p.query;

    const Clock::time_point deadline =
        std::min(ctx.deadline, Clock::now() + std::chrono::milliseconds(cfg.search_timeout_ms));

    std::vector<std::string> files;
    std::error_code ec;
    if (fs::is_regular_file(r.path, ec)) {
        files.push_back(r.rel);
    } else {
        ListResult lr = safe_list(ctx.workspace, r.path, p.glob, policy, cfg.list_max_entries, deadline);
        if (!lr.ok) return tool_failure(ToolKind::SEARCH, lr.error_type, lr.message);
        files = std::move(lr.files);
    }

    std::vector<Match> matches;
    std::map<std::string, int> per_file;
    size_t skipped_lines = 0;
    bool timed_out = false;
    for (const auto& rel : files) {
        if (Clock::now() > deadline) {
            timed_out = true;
            break;
        }
        std::string content;
        if (!load_text(ctx.workspace, ctx.workspace / rel, cfg.read_max_bytes, &content)) continue;
        std::vector<std::string> lines = split_lines(content, nullptr);
        for (size_t i = 0; i < lines.size(); i++) {
            bool hit = false;
            if (p.regex) {
                if (lines[i].size() > kMaxRegexLineChars) {
                    skipped_lines++;
                    continue;
                }
                try {
                    hit = std::regex_search(lines[i], re);
                } catch (const std::regex_error&) {
                    // error_complexity / error_stack on pathological input
                    skipped_lines++;
                    continue;
                }
            } else {
                hit = (p.ignore_case ? lower_ascii(lines[i]) : lines[i]).find(needle) != std::string::npos;
            }
            if (!hit) continue;
            Match m;
            m.path = rel;
            m.line = (int)i + 1;
            m.text = clip(lines[i]);
            const size_t ctxn = (size_t)p.context_lines;
            for (size_t b = (i >= ctxn ? i - ctxn : 0); b < i; b++) m.before.push_back(clip(lines[b]));
            for (size_t a = i + 1; a < lines.size() && a <= i + ctxn; a++) m.after.push_back(clip(lines[a]));
            matches.push_back(std::move(m));
            per_file[rel]++;
        }
    }

    if (timed_out) return tool_failure(ToolKind::SEARCH, "timeout", "search exceeded its time limit");

    std::sort(matches.begin(), matches.end(), [&](const Match& a, const Match& b) {
        int ca = per_file[a.path], cb = per_file[b.path];
        if (ca != cb) return ca > cb;
        if (a.path != b.path) return a.path < b.path;
        return a.line < b.line;
    });

    const size_t total = matches.size();
    size_t limit = (size_t)cfg.search_max_results;
    if (p.max_results) limit = std::min(limit, (size_t)*p.max_results);
    bool truncated = false;
    if (matches.size() > limit) {
        matches.resize(limit);
        truncated = true;
    }

    ToolResult res;
    res.ok = true;
    res.truncated = truncated;
    std::ostringstream payload;
    payload << "{";
    payload << "\"query\":" << json_mini::quote(p.query) << ",";
    payload << "\"total_matches\":" << total << ",";
    payload << "\"files_matched\":" << per_file.size() << ",";
    payload << "\"truncated\":" << (truncated ? "true" : "false") << ",";
    if (p.regex) payload << "\"skipped_long_lines\":" << skipped_lines << ",";
    payload << "\"matches\":[";
    for (size_t i = 0; i < matches.size(); i++) {
        if (i) payload << ",";
        payload << match_json(matches[i]);
    }
    payload << "]}";
    res.payload_json = payload.str();
    return res;
}

} // namespace patchbench

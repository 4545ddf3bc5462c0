#include "patchbench/tools.h"
#include "patchbench/fs_guard.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

Clock::time_point tool_deadline(const patchbench::ToolContext& ctx, int timeout_ms) {
    return std::min(ctx.deadline, Clock::now() + std::chrono::milliseconds(timeout_ms));
}

size_t edit_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); j++) prev[j] = j;
    for (size_t i = 1; i <= a.size(); i++) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); j++) {
            size_t sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, sub});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

// Up to five near misses: same base name first, then closest by edit distance.
std::vector<std::string> suggest_paths(const fs::path& root, const std::string& wanted,
                                       const patchbench::PathPolicy& policy, Clock::time_point deadline) {
    patchbench::ListResult all = patchbench::safe_list(root, root, std::nullopt, policy, 20000, deadline);
    if (!all.ok) return {};
    const std::string base = fs::path(wanted).filename().string();

    struct Cand { bool same_base; size_t dist; std::string path; };
    std::vector<Cand> cands;
    cands.reserve(all.files.size());
    for (const auto& f : all.files) {
        bool same = fs::path(f).filename().string() == base;
        cands.push_back({same, edit_distance(wanted, f), f});
    }
    std::sort(cands.begin(), cands.end(), [](const Cand& x, const Cand& y) {
        if (x.same_base != y.same_base) return x.same_base;
        if (x.dist != y.dist) return x.dist < y.dist;
        return x.path < y.path;
    });

    std::vector<std::string> out;
    for (const auto& c : cands) {
        if (out.size() >= 5) break;
        if (!c.same_base && c.dist > std::max<size_t>(wanted.size(), c.path.size()) / 2) continue;
        out.push_back(c.path);
    }
    return out;
}

bool read_fd(int fd, std::string* out, std::string* err) {
    char buf[65536];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            *err = "read error";
            return false;
        }
        if (n == 0) return true;
        out->append(buf, (size_t)n);
    }
}

} // namespace

namespace patchbench {

// list_files
ToolResult tool_list_files(const ListFilesParams& p, const ToolContext& ctx, const EngineConfig& cfg) {
    const PathPolicy policy = path_policy(cfg);
    PathResolution r = resolve_safe_path(ctx.workspace, p.root, policy);
    if (!r.ok) return tool_failure(ToolKind::LIST_FILES, r.error_type, r.message);

    ListResult lr = safe_list(ctx.workspace, r.path, p.glob, policy, cfg.list_max_entries,
                              tool_deadline(ctx, cfg.list_files_timeout_ms));
    if (!lr.ok) return tool_failure(ToolKind::LIST_FILES, lr.error_type, lr.message);

    ToolResult res;
    res.ok = true;
    res.truncated = lr.truncated;
    std::ostringstream payload;
    payload << "{";
    payload << "\"root\":" << json_mini::quote(r.rel.empty() ? "." : r.rel) << ",";
    payload << "\"count\":" << lr.files.size() << ",";
    payload << "\"truncated\":" << (lr.truncated ? "true" : "false") << ",";
    payload << "\"files\":" << json_mini::string_array(lr.files);
    payload << "}";
    res.payload_json = payload.str();
    return res;
}

// read_file
ToolResult tool_read_file(const ReadFileParams& p, const ToolContext& ctx, const EngineConfig& cfg) {
    const PathPolicy policy = path_policy(cfg);
    PathResolution r = resolve_safe_path(ctx.workspace, p.path, policy);
    if (!r.ok) return tool_failure(ToolKind::READ_FILE, r.error_type, r.message);

    std::error_code ec;
    if (!fs::exists(r.path, ec)) {
        auto sugg = suggest_paths(ctx.workspace, r.rel, policy, tool_deadline(ctx, cfg.read_file_timeout_ms));
        std::string msg = "file not found: " + r.rel;
        if (!sugg.empty()) {
            msg += " (did you mean: ";
            for (size_t i = 0; i < sugg.size(); i++) msg += (i ? ", " : "") + sugg[i];
            msg += ")";
        }
        ToolResult res = tool_failure(ToolKind::READ_FILE, "file_not_found", msg);
        res.payload_json = "{\"suggestions\":" + json_mini::string_array(sugg) + "}";
        return res;
    }
    if (fs::is_directory(r.path, ec)) {
        return tool_failure(ToolKind::READ_FILE, "is_directory", r.rel + " is a directory; use list_files");
    }

    std::string open_err;
    int fd = open_under_root_nofollow(ctx.workspace, r.path, &open_err);
    if (fd < 0) return tool_failure(ToolKind::READ_FILE, "io_error", open_err);

    struct stat st;
    if (::fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd);
        return tool_failure(ToolKind::READ_FILE, "io_error", "not a regular file: " + r.rel);
    }
    const bool ranged = p.start_line || p.end_line;
    if (!ranged && (size_t)st.st_size > cfg.read_max_bytes) {
        ::close(fd);
        return tool_failure(ToolKind::READ_FILE, "too_large",
                            r.rel + " is " + std::to_string((long long)st.st_size) +
                            " bytes; request a line range (start_line/end_line)");
    }

    std::string content;
    std::string read_err;
    bool read_ok = read_fd(fd, &content, &read_err);
    ::close(fd);
    if (!read_ok) return tool_failure(ToolKind::READ_FILE, "io_error", read_err + ": " + r.rel);

    if (content.find('\0', 0) < std::min<size_t>(content.size(), 8192)) {
        return tool_failure(ToolKind::READ_FILE, "binary_file", r.rel + " looks binary");
    }

    bool trailing = false;
    std::vector<std::string> lines = split_lines(content, &trailing);
    const int total = (int)lines.size();

    int start = p.start_line.value_or(1);
    int end = p.end_line.value_or(total);
    if (end > total) end = total;
    if (total > 0 && start > total) {
        return tool_failure(ToolKind::READ_FILE, "invalid_range",
                            "start_line " + std::to_string(start) + " is past end of file (" +
                            std::to_string(total) + " lines)");
    }

    std::string text;
    bool truncated = false;
    const int count = std::max(0, end - start + 1);
    if (!ranged && count > cfg.read_max_lines) {
        const int head = cfg.read_max_lines * 2 / 5;
        const int tail = cfg.read_max_lines - head;
        for (int i = 0; i < head; i++) text += lines[(size_t)i] + "\n";
        text += "... [" + std::to_string(count - head - tail) + " lines omitted] ...\n";
        for (int i = total - tail; i < total; i++) text += lines[(size_t)i] + "\n";
        truncated = true;
    } else {
        // Ranged reads are capped from start_line; end_line reports where the slice stopped.
        if (count > cfg.read_max_lines) {
            end = start + cfg.read_max_lines - 1;
            truncated = true;
        }
        for (int i = start; i <= end; i++) {
            const std::string& line = lines[(size_t)(i - 1)];
            if (i > start && text.size() + line.size() + 1 > cfg.read_max_bytes) {
                end = i - 1;
                truncated = true;
                break;
            }
            text += line;
            if (i < total || trailing) text += "\n";
        }
        if (text.size() > cfg.read_max_bytes) {
            text.resize(cfg.read_max_bytes);
            truncated = true;
        }
    }

    ToolResult res;
    res.ok = true;
    res.truncated = truncated;
    std::ostringstream payload;
    payload << "{";
    payload << "\"path\":" << json_mini::quote(r.rel) << ",";
    payload << "\"start_line\":" << (total ? start : 0) << ",";
    payload << "\"end_line\":" << end << ",";
    payload << "\"total_lines\":" << total << ",";
    payload << "\"truncated\":" << (truncated ? "true" : "false") << ",";
    payload << "\"content\":" << json_mini::quote(text);
    payload << "}";
    res.payload_json = payload.str();
    return res;
}

} // namespace patchbench

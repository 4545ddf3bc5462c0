#include "patchbench/patch.h"
#include "patchbench/fileio.h"

#include <algorithm>
#include <cstring>

namespace patchbench {

namespace fs = std::filesystem;

const char* file_apply_status_name(FileApplyStatus s) {
    switch (s) {
        case FileApplyStatus::APPLIED: return "applied";
        case FileApplyStatus::CREATED: return "created";
        case FileApplyStatus::DELETED: return "deleted";
        case FileApplyStatus::RENAMED: return "renamed";
        case FileApplyStatus::FAILED: return "failed";
    }
    return "failed";
}

bool PatchApplyOutcome::all_ok() const {
    return !files.empty() && std::all_of(files.begin(), files.end(),
        [](const FileApplyResult& f) { return f.status != FileApplyStatus::FAILED; });
}

bool PatchApplyOutcome::any_ok() const {
    return std::any_of(files.begin(), files.end(),
        [](const FileApplyResult& f) { return f.status != FileApplyStatus::FAILED; });
}

std::vector<std::string> PatchApplyOutcome::changed_files() const {
    std::vector<std::string> out;
    for (const auto& f : files) {
        if (f.status != FileApplyStatus::FAILED) out.push_back(f.path);
    }
    return out;
}

namespace {

std::string join_lines(const std::vector<std::string>& lines, bool trailing_newline) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i) out += '\n';
        out += lines[i];
    }
    if (trailing_newline && !lines.empty()) out += '\n';
    return out;
}

bool looks_binary(const std::string& content) {
    size_t n = std::min<size_t>(content.size(), 8192);
    return std::memchr(content.data(), '\0', n) != nullptr;
}

// Apply hunks to `lines`, searching up to `fuzz` lines around each hunk's
// recorded position. Returns false with *err on the first mismatch.
bool apply_hunks(const FilePatch& fp, const std::vector<std::string>& lines, bool trailing_nl, int fuzz,
                 std::vector<std::string>* out, bool* out_trailing, int* applied, std::string* err) {
    size_t src = 0;
    *out_trailing = trailing_nl;
    for (size_t hi = 0; hi < fp.hunks.size(); hi++) {
        const Hunk& h = fp.hunks[hi];
        std::vector<std::string> old_side, new_side;
        for (const auto& l : h.lines) {
            if (l.op != '+') old_side.push_back(l.text);
            if (l.op != '-') new_side.push_back(l.text);
        }
        const long expected = old_side.empty() ? h.old_start : h.old_start - 1;

        long pos = -1;
        for (int d = 0; d <= fuzz && pos < 0; d++) {
            for (int sign : {1, -1}) {
                if (d == 0 && sign < 0) continue;
                long cand = expected + sign * d;
                if (cand < (long)src || cand + (long)old_side.size() > (long)lines.size()) continue;
                if (std::equal(old_side.begin(), old_side.end(), lines.begin() + cand)) {
                    pos = cand;
                    break;
                }
            }
        }
        if (pos < 0) {
            *err = "hunk " + std::to_string(hi + 1) + " context does not match near line " +
                   std::to_string(expected + 1);
            return false;
        }

        out->insert(out->end(), lines.begin() + src, lines.begin() + pos);
        out->insert(out->end(), new_side.begin(), new_side.end());
        src = (size_t)pos + old_side.size();
        (*applied)++;

        if (src == lines.size()) {
            if (h.new_no_eol) *out_trailing = false;
            else if (h.old_no_eol || !new_side.empty()) *out_trailing = true;
        }
    }
    out->insert(out->end(), lines.begin() + src, lines.end());
    return true;
}

FileApplyResult apply_one(const FilePatch& fp, const PatchOptions& opt) {
    FileApplyResult r;
    r.path = fp.op == FileOp::DELETE ? fp.old_path : fp.new_path;
    r.hunks_total = (int)fp.hunks.size();

    auto failed = [&r](const std::string& type, const std::string& msg) {
        r.status = FileApplyStatus::FAILED;
        r.error_type = type;
        r.error = msg;
        return r;
    };

    std::error_code ec;
    std::vector<std::string> lines;
    bool trailing_nl = true;
    fs::perms mode = fs::perms::owner_read | fs::perms::owner_write | fs::perms::group_read | fs::perms::others_read;

    if (fp.op == FileOp::CREATE) {
        if (fs::exists(fp.new_abs, ec)) return failed("file_exists", "cannot create, file exists: " + fp.new_path);
        trailing_nl = false;
    } else {
        if (!fs::is_regular_file(fp.old_abs, ec)) return failed("file_not_found", "missing target: " + fp.old_path);
        std::string content;
        std::string rerr = read_whole_file(fp.old_abs, &content);
        if (!rerr.empty()) return failed("io_error", rerr);
        if (looks_binary(content)) return failed("binary_file", "cannot patch binary file: " + fp.old_path);
        lines = split_lines(content, &trailing_nl);
        mode = fs::status(fp.old_abs, ec).permissions();
    }
    if (fp.op == FileOp::RENAME && fp.new_abs != fp.old_abs && fs::exists(fp.new_abs, ec)) {
        return failed("file_exists", "rename target exists: " + fp.new_path);
    }

    std::vector<std::string> out;
    bool out_trailing = trailing_nl;
    std::string herr;
    if (!apply_hunks(fp, lines, trailing_nl, opt.fuzz_lines, &out, &out_trailing, &r.hunks_applied, &herr)) {
        return failed("patch_hunk_fail", fp.old_path.empty() ? herr : fp.old_path + ": " + herr);
    }
    if (fp.op == FileOp::CREATE) {
        out_trailing = fp.hunks.empty() || !fp.hunks.back().new_no_eol;
    }

    if (fp.op == FileOp::DELETE) {
        if (!out.empty()) return failed("patch_hunk_fail", "delete does not cover the whole file: " + fp.old_path);
        fs::remove(fp.old_abs, ec);
        if (ec) return failed("io_error", "cannot delete " + fp.old_path + ": " + ec.message());
        if (fs::exists(fp.old_abs, ec)) return failed("io_error", "file still present after delete: " + fp.old_path);
        r.status = FileApplyStatus::DELETED;
        return r;
    }

    const std::string expected = join_lines(out, out_trailing);
    fs::create_directories(fp.new_abs.parent_path(), ec);
    if (ec) return failed("io_error", "cannot create directory for " + fp.new_path + ": " + ec.message());
    std::string werr = atomic_write_file(fp.new_abs, expected);
    if (!werr.empty()) return failed("io_error", werr);
    fs::permissions(fp.new_abs, mode, ec);

    if (fp.op == FileOp::RENAME && fp.new_abs != fp.old_abs) {
        fs::remove(fp.old_abs, ec);
        if (ec) return failed("io_error", "cannot remove rename source " + fp.old_path + ": " + ec.message());
    }

    // Post-validation: the target exists and holds exactly what we computed.
    std::string back;
    std::string rerr = read_whole_file(fp.new_abs, &back);
    if (!rerr.empty() || back != expected) {
        return failed("io_error", "post-apply verification failed for " + fp.new_path);
    }

    switch (fp.op) {
        case FileOp::CREATE: r.status = FileApplyStatus::CREATED; break;
        case FileOp::RENAME: r.status = FileApplyStatus::RENAMED; break;
        default: r.status = FileApplyStatus::APPLIED; break;
    }
    return r;
}

} // namespace

PatchApplyOutcome apply_normalized_patch(const NormalizedPatch& patch, const fs::path& root,
                                         const PatchOptions& opt) {
    PatchApplyOutcome outcome;
    for (const auto& fp : patch.files) {
        // Paths were resolved during normalization; re-check in case the
        // tree changed in between (a directory swapped for a symlink).
        const fs::path& target = fp.op == FileOp::DELETE ? fp.old_abs : fp.new_abs;
        if (!is_path_under(target, root) || (fp.op != FileOp::CREATE && !is_path_under(fp.old_abs, root))) {
            FileApplyResult r;
            r.path = fp.op == FileOp::DELETE ? fp.old_path : fp.new_path;
            r.hunks_total = (int)fp.hunks.size();
            r.error_type = "path_escape";
            r.error = "target resolves outside workspace: " + r.path;
            outcome.files.push_back(r);
            continue;
        }
        outcome.files.push_back(apply_one(fp, opt));
    }
    return outcome;
}

} // namespace patchbench

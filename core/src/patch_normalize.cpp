#include "patchbench/patch.h"
#include "patchbench/fileio.h"

#include <algorithm>
#include <regex>
#include <sstream>

namespace patchbench {

namespace fs = std::filesystem;

const char* patch_dialect_name(PatchDialect d) {
    switch (d) {
        case PatchDialect::UNIFIED: return "unified";
        case PatchDialect::UNIFIED_REPAIRED: return "unified_repaired";
        case PatchDialect::CONTEXT_HUNKS: return "context_hunks";
        case PatchDialect::BEGIN_PATCH: return "begin_patch";
    }
    return "unified";
}

const char* patch_origin_name(PatchOrigin o) {
    return o == PatchOrigin::EXTRACTED ? "extracted" : "tool_call";
}

int Hunk::old_count() const {
    return (int)std::count_if(lines.begin(), lines.end(), [](const HunkLine& l) { return l.op != '+'; });
}

int Hunk::new_count() const {
    return (int)std::count_if(lines.begin(), lines.end(), [](const HunkLine& l) { return l.op != '-'; });
}

std::vector<std::string> split_lines(const std::string& text, bool* trailing_newline) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            out.push_back(text.substr(start));
            break;
        }
        out.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    if (trailing_newline) *trailing_newline = !text.empty() && text.back() == '\n';
    return out;
}

namespace {

bool starts_with(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

std::string rstrip(const std::string& s) {
    size_t e = s.find_last_not_of(" \t\r");
    return e == std::string::npos ? "" : s.substr(0, e + 1);
}

bool is_git_metadata(const std::string& l) {
    static const char* const prefixes[] = {
        "diff --git ", "index ", "new file mode ", "deleted file mode ", "old mode ", "new mode ",
        "similarity index ", "dissimilarity index ", "rename from ", "rename to ", "copy from ", "copy to ",
    };
    for (const char* p : prefixes) {
        if (starts_with(l, p)) return true;
    }
    return false;
}

class Normalizer {
public:
    Normalizer(const fs::path& root, const PatchOptions& opt, PatchError* err)
        : root_(root), opt_(opt), err_(err) {}

    bool run(const std::string& raw, NormalizedPatch* out);

private:
    bool fail(const std::string& type, const std::string& msg) {
        err_->type = type;
        err_->message = msg;
        return false;
    }

    void note(const std::string& r) {
        if (std::find(rewrites_.begin(), rewrites_.end(), r) == rewrites_.end()) rewrites_.push_back(r);
    }

    std::vector<std::string> preclean(const std::vector<std::string>& lines);
    bool parse_unified(const std::vector<std::string>& lines);
    bool parse_begin_patch(const std::vector<std::string>& lines);
    bool is_file_header(const std::vector<std::string>& lines, size_t i) const;
    std::string header_path(const std::string& field, const char* git_prefix);
    void read_body(const std::vector<std::string>& lines, size_t* i, Hunk* h, bool has_counts,
                   int want_old, int want_new);
    bool resolve_paths(FilePatch* fp);
    bool locate_hunks(FilePatch* fp);

    fs::path root_;
    const PatchOptions& opt_;
    PatchError* err_;
    std::vector<std::string> rewrites_;
    std::vector<FilePatch> files_;
    bool context_hunks_{false};
    bool envelope_{false};
};

std::vector<std::string> Normalizer::preclean(const std::vector<std::string>& lines) {
    std::vector<std::string> out;
    out.reserve(lines.size());
    // Inside a hunk body a line led by ' ', '+' or '-' is file content, even
    // when that content is a Markdown fence.
    bool in_hunk = false;
    for (size_t i = 0; i < lines.size(); i++) {
        std::string l = lines[i];
        const bool body_line = !l.empty() && (l[0] == ' ' || l[0] == '+' || l[0] == '-' || l[0] == '\\');
        if (in_hunk && (body_line || l.empty()) && !is_file_header(lines, i) && l != "---" && l != "+++") {
            out.push_back(l);
            continue;
        }
        in_hunk = false;
        if (starts_with(trim(l), "```")) {
            note("strip_code_fence");
            continue;
        }
        if (l.size() > 1 && (l[0] == ':' || l[0] == '>')) {
            std::string rest = l.substr(1);
            size_t b = rest.find_first_not_of(' ');
            rest = b == std::string::npos ? "" : rest.substr(b);
            if (starts_with(rest, "---") || starts_with(rest, "+++") || starts_with(rest, "@@")) {
                l = rest;
                note("strip_quote_prefix");
            }
        }
        if ((l == "---" || l == "+++") && i + 1 < lines.size()) {
            const std::string& nxt = lines[i + 1];
            if (!nxt.empty() && std::string(" -+@\\").find(nxt[0]) == std::string::npos) {
                l += " " + trim(nxt);
                i++;
                note("join_split_header");
            }
        }
        in_hunk = starts_with(l, "@@");
        out.push_back(l);
    }
    return out;
}

bool Normalizer::is_file_header(const std::vector<std::string>& lines, size_t i) const {
    return i + 1 < lines.size() && starts_with(lines[i], "--- ") && starts_with(lines[i + 1], "+++ ");
}

std::string Normalizer::header_path(const std::string& field, const char* git_prefix) {
    std::string p = field;
    size_t tab = p.find('\t');
    if (tab != std::string::npos) p = p.substr(0, tab);
    p = trim(p);
    if (p.size() >= 2 && p.front() == '"' && p.back() == '"') p = p.substr(1, p.size() - 2);
    if (p == "/dev/null") return "";
    if (starts_with(p, git_prefix)) p = p.substr(2);

    static const char* const container_prefixes[] = {"/workspace/repo/", "/workspace/", "repo/", "./"};
    for (const char* cp : container_prefixes) {
        if (starts_with(p, cp) && p.size() > std::string(cp).size()) {
            p = p.substr(std::string(cp).size());
            note("strip_path_prefix");
            break;
        }
    }
    return p;
}

void Normalizer::read_body(const std::vector<std::string>& lines, size_t* i, Hunk* h, bool has_counts,
                           int want_old, int want_new) {
    int seen_old = 0, seen_new = 0;
    auto delim = [&](size_t k) {
        const std::string& l = lines[k];
        return starts_with(l, "@@") || is_file_header(lines, k) || starts_with(l, "diff --git ") ||
               starts_with(l, "*** ");
    };
    auto prefixed_ahead = [&](size_t k) {
        for (size_t j = k + 1; j < lines.size() && !delim(j); j++) {
            const std::string& l = lines[j];
            if (!l.empty() && (l[0] == ' ' || l[0] == '-' || l[0] == '+')) return true;
        }
        return false;
    };

    while (*i < lines.size() && !delim(*i)) {
        const std::string& l = lines[*i];
        char c = l.empty() ? '\0' : l[0];
        if (c == ' ' || c == '-' || c == '+') {
            h->lines.push_back({c, l.substr(1)});
            if (c != '+') seen_old++;
            if (c != '-') seen_new++;
            (*i)++;
            continue;
        }
        if (c == '\\') {
            if (!h->lines.empty()) {
                char prev = h->lines.back().op;
                if (prev != '+') h->old_no_eol = true;
                if (prev != '-') h->new_no_eol = true;
            }
            (*i)++;
            continue;
        }
        bool counts_pending = has_counts && (seen_old < want_old || seen_new < want_new);
        if (counts_pending || prefixed_ahead(*i)) {
            h->lines.push_back({' ', l});
            seen_old++;
            seen_new++;
            note(l.empty() ? "blank_context_line" : "add_context_prefix");
            (*i)++;
            continue;
        }
        break;
    }
    if (has_counts && (seen_old != want_old || seen_new != want_new)) note("recount_hunk");
}

bool Normalizer::parse_unified(const std::vector<std::string>& lines) {
    static const std::regex hunk_re(R"(^@@ -(\d+)(?:,(\d+))? \+(\d+)(?:,(\d+))? @@.*$)");
    size_t i = 0;
    while (i < lines.size()) {
        const std::string& l = lines[i];
        if (is_file_header(lines, i)) {
            FilePatch fp;
            fp.old_path = header_path(l.substr(4), "a/");
            fp.new_path = header_path(lines[i + 1].substr(4), "b/");
            i += 2;
            if (fp.old_path.empty() && fp.new_path.empty()) {
                return fail("malformed_diff", "both sides of a file header are /dev/null");
            }
            if (fp.old_path.empty()) fp.op = FileOp::CREATE;
            else if (fp.new_path.empty()) fp.op = FileOp::DELETE;
            else if (fp.old_path != fp.new_path) fp.op = FileOp::RENAME;

            while (i < lines.size() && starts_with(lines[i], "@@")) {
                Hunk h;
                std::smatch m;
                bool numbered = std::regex_match(lines[i], m, hunk_re);
                int want_old = 0, want_new = 0;
                if (numbered) {
                    h.old_start = std::stoi(m[1].str());
                    want_old = m[2].matched ? std::stoi(m[2].str()) : 1;
                    h.new_start = std::stoi(m[3].str());
                    want_new = m[4].matched ? std::stoi(m[4].str()) : 1;
                } else {
                    std::string anchor = trim(lines[i].substr(2));
                    if (starts_with(anchor, "@@")) anchor = trim(anchor.substr(2));
                    if (anchor.size() >= 2 && anchor.compare(anchor.size() - 2, 2, "@@") == 0) {
                        anchor = trim(anchor.substr(0, anchor.size() - 2));
                    }
                    h.anchor = anchor;
                    h.located = false;
                    context_hunks_ = true;
                }
                i++;
                read_body(lines, &i, &h, numbered, want_old, want_new);
                if (h.lines.empty()) return fail("malformed_diff", "empty hunk in " + fp.new_path + fp.old_path);
                fp.hunks.push_back(std::move(h));
            }
            if (fp.hunks.empty() && fp.op != FileOp::RENAME) {
                return fail("malformed_diff", "file header without hunks: " +
                            (fp.new_path.empty() ? fp.old_path : fp.new_path));
            }
            files_.push_back(std::move(fp));
            continue;
        }
        if (is_git_metadata(l) || trim(l).empty()) {
            i++;
            continue;
        }
        if (starts_with(l, "@@")) {
            return fail("malformed_diff", "hunk before any file header");
        }
        note(files_.empty() ? "drop_preamble" : "drop_trailing_text");
        i++;
    }
    return true;
}

bool Normalizer::parse_begin_patch(const std::vector<std::string>& lines) {
    size_t i = 0;
    while (i < lines.size() && trim(lines[i]) != "*** Begin Patch") i++;
    i++;
    bool ended = false;

    while (i < lines.size()) {
        const std::string l = rstrip(lines[i]);
        if (l == "*** End Patch") { ended = true; break; }
        if (l.empty()) { i++; continue; }

        FilePatch fp;
        if (starts_with(l, "*** Update File: ")) {
            fp.op = FileOp::MODIFY;
            fp.old_path = fp.new_path = header_path(l.substr(17), "a/");
            i++;
            if (i < lines.size() && starts_with(lines[i], "*** Move to: ")) {
                fp.op = FileOp::RENAME;
                fp.new_path = header_path(rstrip(lines[i]).substr(13), "b/");
                i++;
            }
            Hunk cur;
            cur.located = false;
            auto flush = [&]() {
                if (!cur.lines.empty()) fp.hunks.push_back(cur);
                cur = Hunk{};
                cur.located = false;
            };
            while (i < lines.size()) {
                const std::string& b = lines[i];
                if (rstrip(b) == "*** End of File") { cur.at_eof = true; i++; continue; }
                if (starts_with(b, "*** ")) break;
                if (starts_with(b, "@@")) {
                    flush();
                    cur.anchor = trim(b.substr(2));
                    i++;
                    continue;
                }
                char c = b.empty() ? '\0' : b[0];
                if (c == ' ' || c == '-' || c == '+') cur.lines.push_back({c, b.substr(1)});
                else {
                    cur.lines.push_back({' ', b});
                    note(b.empty() ? "blank_context_line" : "add_context_prefix");
                }
                i++;
            }
            flush();
            if (fp.hunks.empty() && fp.op == FileOp::MODIFY) {
                return fail("malformed_diff", "update without changes: " + fp.old_path);
            }
        } else if (starts_with(l, "*** Add File: ")) {
            fp.op = FileOp::CREATE;
            fp.new_path = header_path(l.substr(14), "b/");
            i++;
            Hunk h;
            h.old_start = 0;
            h.new_start = 1;
            while (i < lines.size() && !starts_with(lines[i], "*** ")) {
                const std::string& b = lines[i];
                if (!b.empty() && b[0] == '+') h.lines.push_back({'+', b.substr(1)});
                else {
                    h.lines.push_back({'+', b});
                    note("add_added_prefix");
                }
                i++;
            }
            if (!h.lines.empty()) fp.hunks.push_back(std::move(h));
        } else if (starts_with(l, "*** Delete File: ")) {
            fp.op = FileOp::DELETE;
            fp.old_path = header_path(l.substr(17), "a/");
            i++;
        } else {
            return fail("malformed_diff", "unexpected line in patch envelope: " + l.substr(0, 120));
        }
        files_.push_back(std::move(fp));
    }
    if (!ended) note("missing_end_marker");
    return true;
}

bool Normalizer::resolve_paths(FilePatch* fp) {
    auto resolve = [&](const std::string& rel, fs::path* abs, std::string* norm) -> bool {
        PathResolution r = resolve_safe_path(root_, rel, opt_.paths);
        if (!r.ok) return fail(r.error_type, r.message);
        if (r.rel.empty()) return fail("invalid_path", "patch targets the workspace root");
        *abs = r.path;
        *norm = r.rel;
        return true;
    };

    if (fp->op != FileOp::CREATE) {
        if (!resolve(fp->old_path, &fp->old_abs, &fp->old_path)) return false;
        std::error_code ec;
        if (!fs::exists(fp->old_abs, ec) && !opt_.strict) {
            // Agents often get the leading directory wrong.
            std::vector<std::string> candidates;
            auto slash = fp->old_path.find('/');
            if (slash != std::string::npos) candidates.push_back(fp->old_path.substr(slash + 1));
            candidates.push_back("src/" + fp->old_path);
            for (const auto& c : candidates) {
                PathResolution r = resolve_safe_path(root_, c, opt_.paths);
                if (r.ok && fs::is_regular_file(r.path, ec)) {
                    if (fp->new_path == fp->old_path) fp->new_path = r.rel;
                    fp->old_path = r.rel;
                    fp->old_abs = r.path;
                    note("relocate_path");
                    break;
                }
            }
        }
    }
    if (fp->op != FileOp::DELETE) {
        if (!resolve(fp->new_path, &fp->new_abs, &fp->new_path)) return false;
    }
    return true;
}

bool Normalizer::locate_hunks(FilePatch* fp) {
    if (fp->op == FileOp::CREATE) {
        for (auto& h : fp->hunks) {
            if (h.old_count() != 0) return fail("malformed_diff", "new file hunk removes lines: " + fp->new_path);
            h.old_start = 0;
            h.new_start = 1;
            h.located = true;
        }
        return true;
    }

    std::string content;
    std::error_code ec;
    if (!fs::is_regular_file(fp->old_abs, ec)) {
        return fail("file_not_found", "patch target does not exist: " + fp->old_path);
    }
    std::string rerr = read_whole_file(fp->old_abs, &content);
    if (!rerr.empty()) return fail("io_error", rerr);
    bool trailing_nl = true;
    std::vector<std::string> file = split_lines(content, &trailing_nl);

    if (fp->op == FileOp::DELETE && fp->hunks.empty()) {
        Hunk h;
        h.old_start = file.empty() ? 0 : 1;
        h.new_start = 0;
        for (const auto& l : file) h.lines.push_back({'-', l});
        h.old_no_eol = !trailing_nl && !file.empty();
        fp->hunks.push_back(std::move(h));
        return true;
    }

    size_t cursor = 0;
    for (size_t hi = 0; hi < fp->hunks.size(); hi++) {
        Hunk& h = fp->hunks[hi];
        if (h.located) {
            int pos = h.old_count() == 0 ? h.old_start : h.old_start - 1;
            cursor = (size_t)std::max(0, pos + h.old_count());
            continue;
        }
        std::vector<std::string> old_side;
        for (const auto& l : h.lines) {
            if (l.op != '+') old_side.push_back(l.text);
        }

        size_t start = cursor;
        if (!h.anchor.empty()) {
            const std::string a = trim(h.anchor);
            for (size_t k = cursor; k < file.size(); k++) {
                if (trim(file[k]).find(a) != std::string::npos) { start = k; break; }
            }
        }

        long found = -1;
        if (old_side.empty()) {
            if (!h.anchor.empty() && start < file.size()) found = (long)start + 1;
            else if (h.at_eof || file.empty()) found = (long)file.size();
            else return fail("malformed_diff", "hunk without context in " + fp->old_path);
        } else {
            auto matches_at = [&](size_t k, bool loose) {
                if (k + old_side.size() > file.size()) return false;
                for (size_t j = 0; j < old_side.size(); j++) {
                    if (loose ? rstrip(file[k + j]) != rstrip(old_side[j]) : file[k + j] != old_side[j]) return false;
                }
                return true;
            };
            if (h.at_eof && file.size() >= old_side.size() && matches_at(file.size() - old_side.size(), false)) {
                found = (long)(file.size() - old_side.size());
            }
            for (int pass = 0; pass < 4 && found < 0; pass++) {
                bool loose = pass >= 2;
                size_t from = (pass % 2 == 0) ? start : 0;
                for (size_t k = from; k + old_side.size() <= file.size(); k++) {
                    if (matches_at(k, loose)) { found = (long)k; break; }
                }
                if (found >= 0 && loose) {
                    // Adopt the file's whitespace so application matches exactly.
                    size_t j = 0;
                    for (auto& l : h.lines) {
                        if (l.op != '+') l.text = file[(size_t)found + j++];
                    }
                    note("whitespace_context_match");
                }
            }
            if (found < 0) {
                return fail("patch_hunk_fail", "could not locate hunk " + std::to_string(hi + 1) +
                            " context in " + fp->old_path);
            }
        }
        h.old_start = old_side.empty() ? (int)found : (int)found + 1;
        h.located = true;
        cursor = (size_t)found + old_side.size();
    }
    return true;
}

void assign_new_starts(FilePatch* fp) {
    int delta = 0;
    for (auto& h : fp->hunks) {
        int oc = h.old_count(), nc = h.new_count();
        int pos0 = oc == 0 ? h.old_start : h.old_start - 1;
        int npos0 = pos0 + delta;
        if (fp->op == FileOp::DELETE) h.new_start = 0;
        else h.new_start = nc == 0 ? npos0 : npos0 + 1;
        delta += nc - oc;
    }
}

bool Normalizer::run(const std::string& raw, NormalizedPatch* out) {
    if (raw.find_first_not_of(" \t\r\n") == std::string::npos) {
        return fail("malformed_diff", "empty patch");
    }
    std::vector<std::string> lines = split_lines(raw, nullptr);

    envelope_ = std::any_of(lines.begin(), lines.end(),
                            [](const std::string& l) { return trim(l) == "*** Begin Patch"; });
    if (envelope_) {
        if (opt_.strict) return fail("patch_not_canonical", "Begin Patch envelope is not a unified diff");
        if (!parse_begin_patch(lines)) return false;
    } else {
        if (!parse_unified(preclean(lines))) return false;
    }
    if (files_.empty()) return fail("malformed_diff", "no file changes found in patch");

    if (opt_.strict && context_hunks_) {
        return fail("patch_not_canonical", "hunk headers without line numbers");
    }

    for (auto& fp : files_) {
        if (!resolve_paths(&fp)) return false;
        if (!locate_hunks(&fp)) return false;
        std::vector<int> before;
        for (const auto& h : fp.hunks) before.push_back(h.new_start);
        assign_new_starts(&fp);
        for (size_t k = 0; k < fp.hunks.size() && !envelope_ && !context_hunks_; k++) {
            if (fp.hunks[k].new_start != before[k]) note("recount_hunk");
        }
    }

    if (opt_.strict && !rewrites_.empty()) {
        std::string list;
        for (const auto& r : rewrites_) list += (list.empty() ? "" : ", ") + r;
        return fail("patch_not_canonical", "patch requires normalization: " + list);
    }

    out->files = std::move(files_);
    out->rewrites = rewrites_;
    if (envelope_) out->dialect = PatchDialect::BEGIN_PATCH;
    else if (context_hunks_) out->dialect = PatchDialect::CONTEXT_HUNKS;
    else if (!rewrites_.empty()) out->dialect = PatchDialect::UNIFIED_REPAIRED;
    else out->dialect = PatchDialect::UNIFIED;
    out->canonical_text = render_unified(out->files);
    return true;
}

} // namespace

std::string render_unified(const std::vector<FilePatch>& files) {
    std::ostringstream oss;
    for (const auto& fp : files) {
        oss << "--- " << (fp.op == FileOp::CREATE ? "/dev/null" : "a/" + fp.old_path) << "\n";
        oss << "+++ " << (fp.op == FileOp::DELETE ? "/dev/null" : "b/" + fp.new_path) << "\n";
        for (const auto& h : fp.hunks) {
            oss << "@@ -" << h.old_start << "," << h.old_count()
                << " +" << h.new_start << "," << h.new_count() << " @@\n";
            // The no-newline marker follows the last line of its side.
            int last_old = -1, last_new = -1;
            for (int k = 0; k < (int)h.lines.size(); k++) {
                if (h.lines[k].op != '+') last_old = k;
                if (h.lines[k].op != '-') last_new = k;
            }
            for (int k = 0; k < (int)h.lines.size(); k++) {
                oss << h.lines[k].op << h.lines[k].text << "\n";
                bool mark = (h.old_no_eol && k == last_old) || (h.new_no_eol && k == last_new);
                if (mark) oss << "\\ No newline at end of file\n";
            }
        }
    }
    return oss.str();
}

bool normalize_patch(const std::string& raw, const fs::path& root, const PatchOptions& opt,
                     NormalizedPatch* out, PatchError* err) {
    Normalizer n(root, opt, err);
    return n.run(raw, out);
}

} // namespace patchbench

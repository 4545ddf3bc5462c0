#pragma once

#include "fs_guard.h"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

enum class PatchDialect {
    UNIFIED,          // canonical unified diff
    UNIFIED_REPAIRED, // unified diff that needed cosmetic repairs
    CONTEXT_HUNKS,    // "@@" hunks without line numbers
    BEGIN_PATCH,      // *** Begin Patch / *** Update File: envelope
};

enum class PatchOrigin { TOOL_CALL, EXTRACTED };

const char* patch_dialect_name(PatchDialect d);
const char* patch_origin_name(PatchOrigin o);

struct HunkLine {
    char op{' '};    // ' ', '-', '+'
    std::string text;
};

struct Hunk {
    int old_start{0};       // 1-based; 0 for an empty old side
    int new_start{0};
    bool located{true};     // false until a context-only hunk is placed
    std::string anchor;     // "@@ anchor" text from context dialects
    std::vector<HunkLine> lines;
    bool old_no_eol{false}; // "\ No newline at end of file" after old side
    bool new_no_eol{false};
    bool at_eof{false};     // "*** End of File": hunk must end at EOF

    int old_count() const;
    int new_count() const;
};

enum class FileOp { MODIFY, CREATE, DELETE, RENAME };

struct FilePatch {
    FileOp op{FileOp::MODIFY};
    std::string old_path;           // workspace-relative
    std::string new_path;
    std::filesystem::path old_abs;  // resolved through the safety layer
    std::filesystem::path new_abs;
    std::vector<Hunk> hunks;
};

struct NormalizedPatch {
    PatchDialect dialect{PatchDialect::UNIFIED};
    std::vector<FilePatch> files;
    std::string canonical_text;
    std::vector<std::string> rewrites;   // repairs applied, in order
};

struct PatchOptions {
    bool strict{false};
    int fuzz_lines{3};
    PathPolicy paths;
};

struct PatchError {
    std::string type;   // malformed_diff | patch_not_canonical | path_escape | patch_hunk_fail | file_not_found | ...
    std::string message;
};

// Parse any supported dialect, repair it (unless strict) and canonicalize it
// to a unified diff with verified hunk positions.
bool normalize_patch(const std::string& raw,
                     const std::filesystem::path& root,
                     const PatchOptions& opt,
                     NormalizedPatch* out,
                     PatchError* err);

std::string render_unified(const std::vector<FilePatch>& files);

enum class FileApplyStatus { APPLIED, CREATED, DELETED, RENAMED, FAILED };

const char* file_apply_status_name(FileApplyStatus s);

struct FileApplyResult {
    std::string path;
    FileApplyStatus status{FileApplyStatus::FAILED};
    int hunks_total{0};
    int hunks_applied{0};
    std::string error_type;
    std::string error;
};

struct PatchApplyOutcome {
    std::vector<FileApplyResult> files;
    bool all_ok() const;
    bool any_ok() const;
    std::vector<std::string> changed_files() const;
};

// Validate and apply per file. Each file is written atomically; a failing
// file leaves its target untouched while others may still apply.
PatchApplyOutcome apply_normalized_patch(const NormalizedPatch& patch,
                                         const std::filesystem::path& root,
                                         const PatchOptions& opt);

// Fallback stage for unstructured agent output: pull a diff out of prose,
// markdown fences or a Begin Patch envelope.
std::optional<std::string> extract_patch_from_text(const std::string& text);

// Split into lines; *trailing_newline reports whether the text ended in '\n'.
std::vector<std::string> split_lines(const std::string& text, bool* trailing_newline);

} // namespace patchbench

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace patchbench {

struct PathPolicy {
    bool allow_hidden{false};
    // Container-side mount point agents tend to use in paths; mapped onto
    // the workspace root.
    std::string container_workdir{"/workspace"};
};

struct PathResolution {
    bool ok{false};
    std::filesystem::path path;   // absolute, symlinks in existing prefix resolved
    std::string rel;              // normalized workspace-relative path ("" = root)
    std::string error_type;       // path_escape | symlink_escape | hidden_path | invalid_path | no_root
    std::string message;
};

// Confine `requested` to `root`. Never touches anything outside the root:
// escapes are detected lexically before any filesystem access, symlink
// escapes by canonicalizing the existing prefix.
PathResolution resolve_safe_path(const std::filesystem::path& root,
                                 const std::string& requested,
                                 const PathPolicy& policy);

bool is_path_under(const std::filesystem::path& p, const std::filesystem::path& root);

// Directory names never listed or searched.
bool is_ignored_dir_name(const std::string& name);

// fnmatch-like matcher. `*` and `?` stop at '/', `**` crosses directories.
// A pattern without '/' is matched against the base name only.
bool glob_match(const std::string& pattern, const std::string& rel_path);

struct ListResult {
    bool ok{false};
    std::vector<std::string> files;   // workspace-relative, sorted
    bool truncated{false};
    std::string error_type;
    std::string message;
};

// Recursively list regular files under `dir` (already resolved), skipping
// symlinks, ignored directories and hidden entries unless allowed.
ListResult safe_list(const std::filesystem::path& root,
                     const std::filesystem::path& dir,
                     const std::optional<std::string>& glob,
                     const PathPolicy& policy,
                     size_t max_entries,
                     std::chrono::steady_clock::time_point deadline);

// Open for reading with O_NOFOLLOW, then verify via /proc/self/fd that the
// opened inode still lives under root. Returns fd >= 0 or -1 with *err set.
int open_under_root_nofollow(const std::filesystem::path& root,
                             const std::filesystem::path& p,
                             std::string* err);

} // namespace patchbench

#pragma once

#include <filesystem>
#include <string>

namespace patchbench {

// All helpers return empty string on success, error message on failure.

std::string read_whole_file(const std::filesystem::path& p, std::string* out);

// Two-phase write: tmp -> fsync -> rename -> fsync(parent). Readers see
// either the old or the new content, never a prefix.
std::string atomic_write_file(const std::filesystem::path& p, const std::string& data);

// O_CREAT|O_EXCL write for immutable artifacts; fails if the path exists.
std::string write_file_exclusive(const std::filesystem::path& p, const std::string& data);

std::string append_to_file(const std::filesystem::path& p, const std::string& data);

// Create a fresh private directory under `parent` (mkdtemp).
std::string make_private_dir(const std::filesystem::path& parent, const std::string& prefix,
                             std::filesystem::path* out);

} // namespace patchbench

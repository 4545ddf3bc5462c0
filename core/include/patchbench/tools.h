#pragma once

#include "config.h"
#include "patch.h"
#include "sandbox.h"
#include "types.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace patchbench {

struct ListFilesParams {
    std::string root{"."};
    std::optional<std::string> glob;
};

struct ReadFileParams {
    std::string path;
    std::optional<int> start_line;  // 1-based, inclusive
    std::optional<int> end_line;
};

struct SearchParams {
    std::string query;
    bool regex{false};
    bool ignore_case{false};
    std::string path{"."};
    std::optional<std::string> glob;
    std::optional<int> max_results;
    int context_lines{0};
};

struct ApplyPatchParams {
    std::string diff;
    PatchOrigin origin{PatchOrigin::TOOL_CALL};
};

struct RunParams {
    std::string command;
    std::optional<int> timeout_ms;
    std::vector<std::pair<std::string, std::string>> env;
    std::optional<NetworkMode> network;
};

// Closed set of tool kinds. Adding one means a new alternative here and a
// new overload wherever the variant is visited.
using ToolParams = std::variant<ListFilesParams, ReadFileParams, SearchParams, ApplyPatchParams, RunParams>;

struct ToolRequest {
    std::string id;
    ToolParams params;

    ToolKind kind() const;
    std::string args_json() const;
};

struct ToolResult {
    ToolKind kind{ToolKind::LIST_FILES};
    bool ok{false};
    std::string error_type;
    std::string error_message;
    std::string payload_json{"{}"};
    int elapsed_ms{0};
    bool truncated{false};

    // run and test-command results
    std::optional<int> exit_code;
    bool timed_out{false};
    std::string stdout_path;
    std::string stderr_path;
    std::string output;               // stdout + stderr, bounded

    // apply_patch results
    std::string artifact_path;
    std::vector<std::string> changed_files;

    // The harness, not the agent, failed (sandbox could not start).
    bool infra_fault{false};

    std::string to_json() const;
};

// Everything a tool needs about the current attempt.
struct ToolContext {
    std::filesystem::path workspace;
    std::string workdir;
    std::string image;
    std::filesystem::path attempt_dir;   // holds logs/ and diffs/
    int step{0};                         // artifact sequence number
    int default_run_timeout_ms{300000};
    std::chrono::steady_clock::time_point deadline{std::chrono::steady_clock::time_point::max()};
    const CancelToken* cancel{nullptr};
};

// Build a typed request from an agent's tool name and JSON arguments.
// On failure *err describes the problem and *kind (if the name was known)
// is set so the rejection can still be recorded against the right tool.
bool parse_tool_request(const std::string& name,
                        const std::string& args_json,
                        const std::string& id,
                        ToolRequest* out,
                        std::optional<ToolKind>* kind,
                        std::string* err);

ToolResult tool_failure(ToolKind kind, const std::string& type, const std::string& message);

// Keep head and tail of long text around a truncation marker.
std::string truncate_middle(const std::string& text, size_t max_chars, bool* truncated);

inline constexpr const char* kTruncationMarker = "\n... [truncated] ...\n";

class ToolRunner {
public:
    ToolRunner(const EngineConfig& cfg, ISandboxExecutor& sandbox) : cfg_(cfg), sandbox_(sandbox) {}

    // Never throws: every failure comes back as a ToolResult.
    ToolResult run(const ToolRequest& req, const ToolContext& ctx) const;

private:
    const EngineConfig& cfg_;
    ISandboxExecutor& sandbox_;
};

// Built-in tool implementations (tools/builtin/).
ToolResult tool_list_files(const ListFilesParams& p, const ToolContext& ctx, const EngineConfig& cfg);
ToolResult tool_read_file(const ReadFileParams& p, const ToolContext& ctx, const EngineConfig& cfg);
ToolResult tool_search(const SearchParams& p, const ToolContext& ctx, const EngineConfig& cfg);
ToolResult tool_apply_patch(const ApplyPatchParams& p, const ToolContext& ctx, const EngineConfig& cfg);
ToolResult tool_run(const RunParams& p, const ToolContext& ctx, const EngineConfig& cfg,
                    ISandboxExecutor& sandbox);

PathPolicy path_policy(const EngineConfig& cfg);

// Attempt-relative artifact names: diffs/step_0003.patch, logs/step_0003_stdout.txt.
std::string patch_artifact_name(int step);
std::string step_log_name(int step, const char* stream);

} // namespace patchbench

#include "patchbench/tools.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>

namespace patchbench {

namespace {

std::string file_result_json(const FileApplyResult& f) {
    std::ostringstream o;
    o << "{\"path\":" << json_mini::quote(f.path)
      << ",\"status\":" << json_mini::quote(file_apply_status_name(f.status))
      << ",\"hunks_total\":" << f.hunks_total
      << ",\"hunks_applied\":" << f.hunks_applied;
    if (f.status == FileApplyStatus::FAILED) {
        o << ",\"error_type\":" << json_mini::quote(f.error_type)
          << ",\"error\":" << json_mini::quote(f.error);
    }
    o << "}";
    return o.str();
}

} // namespace

std::string patch_artifact_name(int step) {
    char name[32];
    std::snprintf(name, sizeof(name), "step_%04d.patch", step);
    return std::string("diffs/") + name;
}

// apply_patch: normalize, persist the canonical diff, then apply per file.
ToolResult tool_apply_patch(const ApplyPatchParams& p, const ToolContext& ctx, const EngineConfig& cfg) {
    using Clock = std::chrono::steady_clock;
    const Clock::time_point deadline =
        std::min(ctx.deadline, Clock::now() + std::chrono::milliseconds(cfg.apply_patch_timeout_ms));

    PatchOptions opt;
    opt.strict = cfg.strict_patch_mode;
    opt.paths = path_policy(cfg);

    NormalizedPatch np;
    PatchError perr;
    if (!normalize_patch(p.diff, ctx.workspace, opt, &np, &perr)) {
        return tool_failure(ToolKind::APPLY_PATCH, perr.type, perr.message);
    }

    const std::string artifact = patch_artifact_name(ctx.step);
    std::string werr = write_file_exclusive(ctx.attempt_dir / artifact, np.canonical_text);
    if (!werr.empty()) {
        ToolResult res = tool_failure(ToolKind::APPLY_PATCH, "io_error", "cannot persist patch artifact: " + werr);
        res.infra_fault = true;
        return res;
    }

    if (Clock::now() > deadline) {
        ToolResult res = tool_failure(ToolKind::APPLY_PATCH, "timeout", "patch normalization exceeded its time limit");
        res.artifact_path = artifact;
        return res;
    }

    PatchApplyOutcome outcome = apply_normalized_patch(np, ctx.workspace, opt);

    ToolResult res;
    res.ok = outcome.all_ok();
    res.artifact_path = artifact;
    res.changed_files = outcome.changed_files();
    if (!res.ok) {
        for (const auto& f : outcome.files) {
            if (f.status != FileApplyStatus::FAILED) continue;
            res.error_type = f.error_type.empty() ? "patch_hunk_fail" : f.error_type;
            res.error_message = f.path + ": " + f.error;
            break;
        }
    }

    std::ostringstream payload;
    payload << "{";
    payload << "\"dialect\":" << json_mini::quote(patch_dialect_name(np.dialect)) << ",";
    payload << "\"origin\":" << json_mini::quote(patch_origin_name(p.origin)) << ",";
    payload << "\"rewrites\":" << json_mini::string_array(np.rewrites) << ",";
    payload << "\"patch_size_bytes\":" << np.canonical_text.size() << ",";
    payload << "\"artifact\":" << json_mini::quote(artifact) << ",";
    payload << "\"changed_files\":" << json_mini::string_array(res.changed_files) << ",";
    payload << "\"files\":[";
    for (size_t i = 0; i < outcome.files.size(); i++) {
        if (i) payload << ",";
        payload << file_result_json(outcome.files[i]);
    }
    payload << "]}";
    res.payload_json = payload.str();
    return res;
}

} // namespace patchbench

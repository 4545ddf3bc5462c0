#pragma once
#include "proc.h"

#include <string>

namespace patchbench {

enum class Profile { DEV, PROD };

// Parse a profile name ("dev", "prod", "production"; case-insensitive).
// Unknown or empty values fall back to DEV.
Profile parse_profile(const std::string& value);

const char* profile_name(Profile p);

enum class SandboxBackend { LOCAL, DOCKER };

struct BudgetConfig {
    int max_steps{20};
    int max_time_ms{600000};
    int repeated_failure_threshold{3};
};

struct SandboxConfig {
    SandboxBackend backend{SandboxBackend::LOCAL};
    std::string docker_binary{"docker"};
    std::string container_workdir{"/workspace"};
    std::string shell{"/bin/sh"};
    std::string path_env{"/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin"};
    int setup_min_timeout_ms{180000};
    int pids_limit{512};
    ProcLimits limits;

    // Local backend only. Operator-provided confinement (bwrap, nsjail,
    // firejail) prepended to `sh -c <cmd>`, e.g.
    // "bwrap --ro-bind / / --bind /srv/ws /srv/ws --unshare-all --die-with-parent".
    std::string wrapper;
    // Without a wrapper the local backend refuses agent-authored commands
    // while running as root. Set only where the harness itself is disposable.
    bool allow_unconfined_root{false};
};

// Everything the engine reads at runtime. Built once at the edge and passed
// by const reference into every component.
struct EngineConfig {
    Profile profile{Profile::DEV};

    bool strict_patch_mode{false};
    bool full_logs_mode{false};
    size_t max_log_chars{10000};

    BudgetConfig budget;
    int malformed_retry_limit{1};
    int observation_window{5};
    bool allow_hidden_paths{false};

    int list_files_timeout_ms{10000};
    int read_file_timeout_ms{10000};
    int search_timeout_ms{30000};
    int apply_patch_timeout_ms{30000};
    int run_timeout_cap_ms{600000};

    size_t read_max_bytes{2 * 1024 * 1024};
    int read_max_lines{10000};
    int search_max_results{200};
    size_t list_max_entries{5000};

    bool fsync_events{false};

    SandboxConfig sandbox;
};

// Profile presets.
// DEV: no fsync, generous timeouts.
// PROD: fsync on, tighter rlimits and run cap, docker backend.
EngineConfig config_for_profile(Profile p);

// Apply overrides from a JSON object onto *cfg. Unknown keys are errors so a
// typo never silently runs with defaults. Returns empty string on success.
std::string apply_config_json(const std::string& json, EngineConfig* cfg);

// Read a JSON file and apply it. Returns empty string on success.
std::string load_config_file(const std::string& path, EngineConfig* cfg);

// Snapshot of the fields that change measured outcomes, for attempt records.
std::string config_summary_json(const EngineConfig& cfg);

// Cross-field checks (positive budgets, timeouts within caps).
std::string validate_config(const EngineConfig& cfg);

} // namespace patchbench

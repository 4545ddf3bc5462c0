#include "patchbench/config.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace patchbench {

Profile parse_profile(const std::string& value) {
    std::string val = value;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

EngineConfig config_for_profile(Profile p) {
    EngineConfig cfg;
    cfg.profile = p;
    switch (p) {
        case Profile::DEV:
            cfg.fsync_events = false;
            cfg.run_timeout_cap_ms = 600000;
            break;
        case Profile::PROD:
            cfg.fsync_events = true;
            cfg.run_timeout_cap_ms = 300000;
            cfg.sandbox.backend = SandboxBackend::DOCKER;
            cfg.sandbox.limits.rlimit_as_mb = 2048;
            cfg.sandbox.limits.rlimit_nproc = 256;
            cfg.sandbox.limits.rlimit_fsize_mb = 64;
            cfg.sandbox.limits.output_max_bytes = 2 * 1024 * 1024;
            break;
    }
    return cfg;
}

namespace {

using Setter = std::function<std::string(json_object*)>;

Setter int_field(int* dst) {
    return [dst](json_object* v) -> std::string {
        if (!json_object_is_type(v, json_type_int)) return "expected integer";
        *dst = json_object_get_int(v);
        return "";
    };
}

Setter size_field(size_t* dst) {
    return [dst](json_object* v) -> std::string {
        if (!json_object_is_type(v, json_type_int)) return "expected integer";
        int64_t x = json_object_get_int64(v);
        if (x < 0) return "expected non-negative integer";
        *dst = static_cast<size_t>(x);
        return "";
    };
}

Setter bool_field(bool* dst) {
    return [dst](json_object* v) -> std::string {
        if (!json_object_is_type(v, json_type_boolean)) return "expected boolean";
        *dst = json_object_get_boolean(v) != 0;
        return "";
    };
}

Setter string_field(std::string* dst) {
    return [dst](json_object* v) -> std::string {
        if (!json_object_is_type(v, json_type_string)) return "expected string";
        *dst = json_object_get_string(v);
        return "";
    };
}

std::string apply_object(json_object* obj, const std::map<std::string, Setter>& fields,
                         const std::string& prefix) {
    if (!json_object_is_type(obj, json_type_object)) return prefix + ": expected object";
    json_object_object_foreach(obj, key, val) {
        auto it = fields.find(key);
        if (it == fields.end()) return "unknown config key: " + prefix + key;
        std::string err = it->second(val);
        if (!err.empty()) return prefix + key + ": " + err;
    }
    return "";
}

} // namespace

std::string apply_config_json(const std::string& json, EngineConfig* cfg) {
    if (!cfg) return "null config";
    json_mini::Doc doc = json_mini::parse(json);
    if (!doc.is_object()) return "config must be a JSON object";

    // Work on a copy so a failed override leaves *cfg untouched.
    EngineConfig c = *cfg;

    std::map<std::string, Setter> limits = {
        {"timeout_ms", int_field(&c.sandbox.limits.timeout_ms)},
        {"output_max_bytes", size_field(&c.sandbox.limits.output_max_bytes)},
        {"capture_max_bytes", size_field(&c.sandbox.limits.capture_max_bytes)},
        {"rlimit_cpu_sec", int_field(&c.sandbox.limits.rlimit_cpu_sec)},
        {"rlimit_as_mb", size_field(&c.sandbox.limits.rlimit_as_mb)},
        {"rlimit_fsize_mb", size_field(&c.sandbox.limits.rlimit_fsize_mb)},
        {"rlimit_nofile", int_field(&c.sandbox.limits.rlimit_nofile)},
        {"rlimit_nproc", int_field(&c.sandbox.limits.rlimit_nproc)},
        {"no_new_privs", bool_field(&c.sandbox.limits.no_new_privs)},
    };

    std::map<std::string, Setter> sandbox = {
        {"backend", [&c](json_object* v) -> std::string {
            if (!json_object_is_type(v, json_type_string)) return "expected string";
            std::string b = json_object_get_string(v);
            if (b == "local") c.sandbox.backend = SandboxBackend::LOCAL;
            else if (b == "docker") c.sandbox.backend = SandboxBackend::DOCKER;
            else return "expected \"local\" or \"docker\"";
            return "";
        }},
        {"docker_binary", string_field(&c.sandbox.docker_binary)},
        {"container_workdir", string_field(&c.sandbox.container_workdir)},
        {"shell", string_field(&c.sandbox.shell)},
        {"path_env", string_field(&c.sandbox.path_env)},
        {"setup_min_timeout_ms", int_field(&c.sandbox.setup_min_timeout_ms)},
        {"pids_limit", int_field(&c.sandbox.pids_limit)},
        {"wrapper", string_field(&c.sandbox.wrapper)},
        {"allow_unconfined_root", bool_field(&c.sandbox.allow_unconfined_root)},
        {"limits", [&limits](json_object* v) { return apply_object(v, limits, "sandbox.limits."); }},
    };

    std::map<std::string, Setter> budget = {
        {"max_steps", int_field(&c.budget.max_steps)},
        {"max_time_ms", int_field(&c.budget.max_time_ms)},
        {"repeated_failure_threshold", int_field(&c.budget.repeated_failure_threshold)},
    };

    std::map<std::string, Setter> top = {
        {"profile", [&c](json_object* v) -> std::string {
            if (!json_object_is_type(v, json_type_string)) return "expected string";
            c.profile = parse_profile(json_object_get_string(v));
            return "";
        }},
        {"strict_patch_mode", bool_field(&c.strict_patch_mode)},
        {"full_logs_mode", bool_field(&c.full_logs_mode)},
        {"max_log_chars", size_field(&c.max_log_chars)},
        {"malformed_retry_limit", int_field(&c.malformed_retry_limit)},
        {"observation_window", int_field(&c.observation_window)},
        {"allow_hidden_paths", bool_field(&c.allow_hidden_paths)},
        {"list_files_timeout_ms", int_field(&c.list_files_timeout_ms)},
        {"read_file_timeout_ms", int_field(&c.read_file_timeout_ms)},
        {"search_timeout_ms", int_field(&c.search_timeout_ms)},
        {"apply_patch_timeout_ms", int_field(&c.apply_patch_timeout_ms)},
        {"run_timeout_cap_ms", int_field(&c.run_timeout_cap_ms)},
        {"read_max_bytes", size_field(&c.read_max_bytes)},
        {"read_max_lines", int_field(&c.read_max_lines)},
        {"search_max_results", int_field(&c.search_max_results)},
        {"list_max_entries", size_field(&c.list_max_entries)},
        {"fsync_events", bool_field(&c.fsync_events)},
        {"budget", [&budget](json_object* v) { return apply_object(v, budget, "budget."); }},
        {"sandbox", [&sandbox](json_object* v) { return apply_object(v, sandbox, "sandbox."); }},
    };

    std::string err = apply_object(doc.root, top, "");
    if (!err.empty()) return err;
    err = validate_config(c);
    if (!err.empty()) return err;
    *cfg = c;
    return "";
}

std::string load_config_file(const std::string& path, EngineConfig* cfg) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "cannot open config file: " + path;
    std::ostringstream ss;
    ss << in.rdbuf();
    std::string err = apply_config_json(ss.str(), cfg);
    if (!err.empty()) return path + ": " + err;
    return "";
}

std::string validate_config(const EngineConfig& cfg) {
    if (cfg.budget.max_steps <= 0) return "budget.max_steps must be positive";
    if (cfg.budget.max_time_ms <= 0) return "budget.max_time_ms must be positive";
    if (cfg.budget.repeated_failure_threshold <= 0) return "budget.repeated_failure_threshold must be positive";
    if (cfg.malformed_retry_limit < 0) return "malformed_retry_limit must be >= 0";
    if (cfg.observation_window <= 0) return "observation_window must be positive";
    if (cfg.run_timeout_cap_ms <= 0) return "run_timeout_cap_ms must be positive";
    if (cfg.read_max_lines < 2) return "read_max_lines must be >= 2";
    if (cfg.search_max_results <= 0) return "search_max_results must be positive";
    if (cfg.max_log_chars < 64) return "max_log_chars must be >= 64";
    if (cfg.sandbox.shell.empty()) return "sandbox.shell must not be empty";
    if (!cfg.sandbox.wrapper.empty() && split_argv_quoted(cfg.sandbox.wrapper).empty()) {
        return "sandbox.wrapper is not a valid argv string";
    }
    return "";
}

std::string config_summary_json(const EngineConfig& cfg) {
    std::ostringstream o;
    o << "{";
    o << "\"profile\":" << json_mini::quote(profile_name(cfg.profile)) << ",";
    o << "\"strict_patch_mode\":" << (cfg.strict_patch_mode ? "true" : "false") << ",";
    o << "\"full_logs_mode\":" << (cfg.full_logs_mode ? "true" : "false") << ",";
    o << "\"max_log_chars\":" << cfg.max_log_chars << ",";
    o << "\"malformed_retry_limit\":" << cfg.malformed_retry_limit << ",";
    o << "\"repeated_failure_threshold\":" << cfg.budget.repeated_failure_threshold << ",";
    o << "\"allow_hidden_paths\":" << (cfg.allow_hidden_paths ? "true" : "false") << ",";
    o << "\"run_timeout_cap_ms\":" << cfg.run_timeout_cap_ms << ",";
    o << "\"sandbox_backend\":"
      << json_mini::quote(cfg.sandbox.backend == SandboxBackend::DOCKER ? "docker" : "local") << ",";
    o << "\"sandbox_wrapper\":" << (cfg.sandbox.wrapper.empty() ? "false" : "true");
    o << "}";
    return o.str();
}

} // namespace patchbench

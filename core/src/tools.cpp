#include "patchbench/tools.h"
#include "patchbench/json_mini.h"

#include <chrono>
#include <climits>
#include <sstream>
#include <stdexcept>

namespace patchbench {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string opt_int_json(const std::optional<int>& v) {
    return v ? std::to_string(*v) : "null";
}

std::string opt_str_json(const std::optional<std::string>& v) {
    return v ? json_mini::quote(*v) : "null";
}

} // namespace

ToolKind ToolRequest::kind() const {
    return std::visit(overloaded{
        [](const ListFilesParams&) { return ToolKind::LIST_FILES; },
        [](const ReadFileParams&) { return ToolKind::READ_FILE; },
        [](const SearchParams&) { return ToolKind::SEARCH; },
        [](const ApplyPatchParams&) { return ToolKind::APPLY_PATCH; },
        [](const RunParams&) { return ToolKind::RUN; },
    }, params);
}

std::string ToolRequest::args_json() const {
    using json_mini::quote;
    std::ostringstream o;
    std::visit(overloaded{
        [&](const ListFilesParams& p) {
            o << "{\"root\":" << quote(p.root) << ",\"glob\":" << opt_str_json(p.glob) << "}";
        },
        [&](const ReadFileParams& p) {
            o << "{\"path\":" << quote(p.path) << ",\"start_line\":" << opt_int_json(p.start_line)
              << ",\"end_line\":" << opt_int_json(p.end_line) << "}";
        },
        [&](const SearchParams& p) {
            o << "{\"query\":" << quote(p.query) << ",\"regex\":" << (p.regex ? "true" : "false")
              << ",\"ignore_case\":" << (p.ignore_case ? "true" : "false")
              << ",\"path\":" << quote(p.path) << ",\"glob\":" << opt_str_json(p.glob)
              << ",\"max_results\":" << opt_int_json(p.max_results)
              << ",\"context_lines\":" << p.context_lines << "}";
        },
        [&](const ApplyPatchParams& p) {
            o << "{\"diff\":" << quote(p.diff) << ",\"origin\":" << quote(patch_origin_name(p.origin)) << "}";
        },
        [&](const RunParams& p) {
            o << "{\"command\":" << quote(p.command) << ",\"timeout_ms\":" << opt_int_json(p.timeout_ms)
              << ",\"network\":" << (p.network ? quote(network_mode_name(*p.network)) : "null") << ",\"env\":{";
            for (size_t i = 0; i < p.env.size(); i++) {
                if (i) o << ",";
                o << quote(p.env[i].first) << ":" << quote(p.env[i].second);
            }
            o << "}}";
        },
    }, params);
    return o.str();
}

std::string ToolResult::to_json() const {
    using json_mini::quote;
    std::ostringstream o;
    o << "{\"tool\":" << quote(tool_kind_name(kind))
      << ",\"ok\":" << (ok ? "true" : "false")
      << ",\"elapsed_ms\":" << elapsed_ms
      << ",\"truncated\":" << (truncated ? "true" : "false");
    if (!ok) {
        o << ",\"error\":{\"type\":" << quote(error_type) << ",\"message\":" << quote(error_message) << "}";
    }
    if (exit_code) {
        o << ",\"exit_code\":" << *exit_code << ",\"timed_out\":" << (timed_out ? "true" : "false")
          << ",\"stdout_path\":" << quote(stdout_path) << ",\"stderr_path\":" << quote(stderr_path);
    }
    if (!artifact_path.empty()) o << ",\"artifact\":" << quote(artifact_path);
    if (infra_fault) o << ",\"infra_fault\":true";
    o << ",\"payload\":" << (payload_json.empty() ? "{}" : payload_json) << "}";
    return o.str();
}

ToolResult tool_failure(ToolKind kind, const std::string& type, const std::string& message) {
    ToolResult r;
    r.kind = kind;
    r.ok = false;
    r.error_type = type;
    r.error_message = message;
    return r;
}

std::string truncate_middle(const std::string& text, size_t max_chars, bool* truncated) {
    const std::string marker = kTruncationMarker;
    if (text.size() <= max_chars || max_chars <= marker.size()) {
        if (truncated) *truncated = false;
        return text;
    }
    if (truncated) *truncated = true;
    size_t budget = max_chars - marker.size();
    size_t head = budget * 2 / 5;
    size_t tail = budget - head;
    return text.substr(0, head) + marker + text.substr(text.size() - tail);
}

PathPolicy path_policy(const EngineConfig& cfg) {
    PathPolicy p;
    p.allow_hidden = cfg.allow_hidden_paths;
    p.container_workdir = cfg.sandbox.container_workdir;
    return p;
}

namespace {

bool read_opt_string(json_object* o, const char* key, std::optional<std::string>* out, std::string* err) {
    json_object* v = json_mini::field(o, key);
    if (!v || json_object_is_type(v, json_type_null)) return true;
    if (!json_object_is_type(v, json_type_string)) {
        *err = std::string("'") + key + "' must be a string";
        return false;
    }
    *out = std::string(json_object_get_string(v));
    return true;
}

bool read_opt_int(json_object* o, const char* key, std::optional<int>* out, std::string* err) {
    json_object* v = json_mini::field(o, key);
    if (!v || json_object_is_type(v, json_type_null)) return true;
    if (!json_object_is_type(v, json_type_int)) {
        *err = std::string("'") + key + "' must be an integer";
        return false;
    }
    const int64_t n = json_object_get_int64(v);
    if (n < INT_MIN || n > INT_MAX) {
        *err = std::string("'") + key + "' is out of range";
        return false;
    }
    *out = (int)n;
    return true;
}

bool read_opt_bool(json_object* o, const char* key, bool* out, std::string* err) {
    json_object* v = json_mini::field(o, key);
    if (!v || json_object_is_type(v, json_type_null)) return true;
    if (!json_object_is_type(v, json_type_boolean)) {
        *err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    *out = json_object_get_boolean(v) != 0;
    return true;
}

bool require_string(json_object* o, const char* key, std::string* out, std::string* err) {
    std::optional<std::string> v;
    if (!read_opt_string(o, key, &v, err)) return false;
    if (!v || v->empty()) {
        *err = std::string("missing required '") + key + "'";
        return false;
    }
    *out = *v;
    return true;
}

} // namespace

bool parse_tool_request(const std::string& name, const std::string& args_json, const std::string& id,
                        ToolRequest* out, std::optional<ToolKind>* kind, std::string* err) {
    *kind = parse_tool_kind(name);
    if (!*kind) {
        *err = "unknown tool: " + name;
        return false;
    }

    json_mini::Doc doc = json_mini::parse(args_json.empty() ? "{}" : args_json);
    if (!doc.is_object()) {
        *err = "arguments must be a JSON object";
        return false;
    }
    json_object* o = doc.root;
    out->id = id;

    switch (**kind) {
        case ToolKind::LIST_FILES: {
            ListFilesParams p;
            std::optional<std::string> root;
            if (!read_opt_string(o, "root", &root, err)) return false;
            if (!root && !read_opt_string(o, "path", &root, err)) return false;
            if (root && !root->empty()) p.root = *root;
            if (!read_opt_string(o, "glob", &p.glob, err)) return false;
            out->params = p;
            return true;
        }
        case ToolKind::READ_FILE: {
            ReadFileParams p;
            if (!require_string(o, "path", &p.path, err)) return false;
            if (!read_opt_int(o, "start_line", &p.start_line, err)) return false;
            if (!read_opt_int(o, "end_line", &p.end_line, err)) return false;
            if ((p.start_line && *p.start_line < 1) || (p.end_line && *p.end_line < 1)) {
                *err = "line numbers are 1-based";
                return false;
            }
            if (p.start_line && p.end_line && *p.end_line < *p.start_line) {
                *err = "end_line must be >= start_line";
                return false;
            }
            out->params = p;
            return true;
        }
        case ToolKind::SEARCH: {
            SearchParams p;
            if (!require_string(o, "query", &p.query, err)) return false;
            if (!read_opt_bool(o, "regex", &p.regex, err)) return false;
            if (!read_opt_bool(o, "ignore_case", &p.ignore_case, err)) return false;
            std::optional<std::string> path;
            if (!read_opt_string(o, "path", &path, err)) return false;
            if (path && !path->empty()) p.path = *path;
            if (!read_opt_string(o, "glob", &p.glob, err)) return false;
            if (!read_opt_int(o, "max_results", &p.max_results, err)) return false;
            std::optional<int> ctx;
            if (!read_opt_int(o, "context_lines", &ctx, err)) return false;
            if (p.max_results && *p.max_results < 1) {
                *err = "max_results must be positive";
                return false;
            }
            if (ctx) {
                if (*ctx < 0 || *ctx > 20) {
                    *err = "context_lines must be between 0 and 20";
                    return false;
                }
                p.context_lines = *ctx;
            }
            out->params = p;
            return true;
        }
        case ToolKind::APPLY_PATCH: {
            ApplyPatchParams p;
            std::optional<std::string> diff;
            if (!read_opt_string(o, "diff", &diff, err)) return false;
            if (!diff && !read_opt_string(o, "patch", &diff, err)) return false;
            if (!diff || diff->empty()) {
                *err = "missing required 'diff'";
                return false;
            }
            p.diff = *diff;
            out->params = p;
            return true;
        }
        case ToolKind::RUN: {
            RunParams p;
            if (!require_string(o, "command", &p.command, err)) return false;
            std::optional<int> secs, ms;
            if (!read_opt_int(o, "timeout_sec", &secs, err)) return false;
            if (!read_opt_int(o, "timeout_ms", &ms, err)) return false;
            if ((secs && *secs <= 0) || (ms && *ms <= 0)) {
                *err = "timeout must be positive";
                return false;
            }
            if (secs && *secs > INT_MAX / 1000) {
                *err = "timeout_sec is out of range";
                return false;
            }
            if (ms) p.timeout_ms = *ms;
            else if (secs) p.timeout_ms = *secs * 1000;
            std::optional<std::string> net;
            if (!read_opt_string(o, "network", &net, err)) return false;
            if (net) {
                p.network = parse_network_mode(*net);
                if (!p.network) {
                    *err = "network must be \"isolated\" or \"egress\"";
                    return false;
                }
            }
            json_object* env = json_mini::field(o, "env");
            if (env && !json_object_is_type(env, json_type_null)) {
                if (!json_object_is_type(env, json_type_object)) {
                    *err = "'env' must be an object of strings";
                    return false;
                }
                json_object_object_foreach(env, k, v) {
                    if (!json_object_is_type(v, json_type_string)) {
                        *err = std::string("env value for '") + k + "' must be a string";
                        return false;
                    }
                    p.env.emplace_back(k, json_object_get_string(v));
                }
            }
            out->params = p;
            return true;
        }
    }
    *err = "unhandled tool kind";
    return false;
}

ToolResult ToolRunner::run(const ToolRequest& req, const ToolContext& ctx) const {
    const auto start = std::chrono::steady_clock::now();
    ToolResult res;
    try {
        res = std::visit(overloaded{
            [&](const ListFilesParams& p) { return tool_list_files(p, ctx, cfg_); },
            [&](const ReadFileParams& p) { return tool_read_file(p, ctx, cfg_); },
            [&](const SearchParams& p) { return tool_search(p, ctx, cfg_); },
            [&](const ApplyPatchParams& p) { return tool_apply_patch(p, ctx, cfg_); },
            [&](const RunParams& p) { return tool_run(p, ctx, cfg_, sandbox_); },
        }, req.params);
    } catch (const std::exception& e) {
        res = tool_failure(req.kind(), "internal_error", e.what());
    }
    res.kind = req.kind();
    res.elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    return res;
}

} // namespace patchbench

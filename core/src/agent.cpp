#include "patchbench/agent.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"
#include "patchbench/patch.h"

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace patchbench {

namespace {

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

AgentAction from_object(json_object* o, const std::string& raw, const std::string& call_id) {
    if (json_mini::get_bool(o, "stop").value_or(false)) {
        return StopSignal{json_mini::get_string(o, "reason").value_or("agent requested stop")};
    }

    auto tool = json_mini::get_string(o, "tool");
    if (!tool) return MalformedOutput{raw, "expected a \"tool\" name or \"stop\": true", std::nullopt};

    json_object* args = json_mini::field(o, "args");
    if (args && !json_object_is_type(args, json_type_object)) {
        return MalformedOutput{raw, "\"args\" must be an object", parse_tool_kind(*tool)};
    }

    ToolRequest req;
    std::optional<ToolKind> kind;
    std::string err;
    if (!parse_tool_request(*tool, args ? json_mini::to_json(args) : "{}", call_id, &req, &kind, &err)) {
        return MalformedOutput{raw, err, kind};
    }
    return req;
}

} // namespace

AgentAction parse_agent_response(const std::string& raw, const std::string& call_id) {
    const std::string body = trim(raw);
    if (body.empty()) return MalformedOutput{raw, "empty response", std::nullopt};

    if (body.front() == '{') {
        json_mini::Doc d = json_mini::parse(body);
        if (d.is_object()) return from_object(d.root, raw, call_id);
    }

    // Fallback stage: a diff somewhere in prose goes through the same
    // apply_patch path as a structured call.
    if (auto diff = extract_patch_from_text(raw)) {
        ToolRequest req;
        req.id = call_id;
        req.params = ApplyPatchParams{*diff, PatchOrigin::EXTRACTED};
        return req;
    }
    return MalformedOutput{raw, "response is neither a tool call, a stop signal nor a diff", std::nullopt};
}

bool load_agent_script(const std::string& json, std::vector<std::string>* responses, std::string* err) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d) {
        *err = "script is not valid JSON";
        return false;
    }
    json_object* arr = d.root;
    if (json_object_is_type(arr, json_type_object)) arr = json_mini::field(arr, "actions");
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        *err = "script must be an array of actions (or {\"actions\": [...]})";
        return false;
    }
    responses->clear();
    for (size_t i = 0; i < json_object_array_length(arr); i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            responses->emplace_back(json_object_get_string(el));
        } else if (el && json_object_is_type(el, json_type_object)) {
            responses->push_back(json_mini::to_json(el));
        } else {
            *err = "script entry " + std::to_string(i) + " must be an object or a string";
            return false;
        }
    }
    return true;
}

AgentAdapter scripted_agent(std::vector<std::string> responses, std::string name) {
    auto script = std::make_shared<std::vector<std::string>>(std::move(responses));
    auto cursor = std::make_shared<size_t>(0);
    return AgentAdapter(std::move(name), [script, cursor](const AgentObservation& obs) -> AgentAction {
        if (*cursor >= script->size()) return StopSignal{"script exhausted"};
        const std::string& raw = (*script)[(*cursor)++];
        return parse_agent_response(raw, "call_" + std::to_string(obs.step));
    });
}

bool parse_agent_spec(const std::string& spec, AgentConfig* out, std::string* err) {
    const auto colon = spec.find(':');
    if (colon == std::string::npos || colon + 1 >= spec.size()) {
        *err = "agent must be scripted:<file> or process:<command>";
        return false;
    }
    const std::string kind = spec.substr(0, colon);
    const std::string arg = spec.substr(colon + 1);
    if (kind == "scripted") {
        out->kind = AgentConfig::Kind::SCRIPTED;
        out->script_path = arg;
    } else if (kind == "process") {
        out->kind = AgentConfig::Kind::PROCESS;
        out->command = arg;
    } else {
        *err = "unknown agent kind: " + kind;
        return false;
    }
    return true;
}

AgentAdapter make_agent_adapter(const AgentConfig& cfg) {
    if (cfg.kind == AgentConfig::Kind::SCRIPTED) {
        std::string body;
        std::string err = read_whole_file(cfg.script_path, &body);
        if (!err.empty()) throw std::runtime_error("cannot read agent script: " + err);
        std::vector<std::string> responses;
        if (!load_agent_script(body, &responses, &err)) {
            throw std::runtime_error(cfg.script_path + ": " + err);
        }
        return scripted_agent(std::move(responses), "scripted:" + cfg.script_path);
    }

    std::vector<std::string> argv = split_argv_quoted(cfg.command);
    if (argv.empty()) throw std::runtime_error("cannot parse agent command: " + cfg.command);

    // The agent process is trusted harness code: it keeps the caller's
    // environment (credentials, PATH) and network access.
    AgentConfig c = cfg;
    return AgentAdapter("process:" + argv[0], [c, argv](const AgentObservation& obs) -> AgentAction {
        ProcSpec ps;
        ps.argv = argv;
        ps.cwd = c.cwd;
        ps.inherit_env = true;
        ps.stdin_data = obs.to_json() + "\n";

        ProcLimits lim = c.limits;
        // +1: time_remaining_ms rounds down; the kill must land at or past the attempt deadline.
        lim.timeout_ms = (int)std::min<long long>(c.turn_timeout_ms, obs.time_remaining_ms + 1);
        lim.deny_network = false;

        ProcResult pr;
        if (!proc_run(ps, lim, obs.cancel, &pr)) {
            throw std::runtime_error("agent process failed to start: " + pr.error);
        }
        if (pr.cancelled) throw std::runtime_error("agent turn cancelled");
        if (pr.timed_out) {
            throw std::runtime_error("agent process timed out after " + std::to_string(lim.timeout_ms) + " ms");
        }
        if (pr.exit_code != 0) {
            throw std::runtime_error("agent process exited with " + std::to_string(pr.exit_code) + ": " +
                                     pr.stderr_text.substr(0, 500));
        }
        return parse_agent_response(pr.stdout_text, "call_" + std::to_string(obs.step));
    });
}

} // namespace patchbench

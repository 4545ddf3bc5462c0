#pragma once

#include "observation.h"
#include "proc.h"
#include "tools.h"

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace patchbench {

struct StopSignal {
    std::string reason;
};

// The agent said something the loop could not act on. When `kind` is set
// the agent named a real tool with bad arguments; that is recorded as a
// failed call instead of being retried.
struct MalformedOutput {
    std::string raw;
    std::string error;
    std::optional<ToolKind> kind;
};

using AgentAction = std::variant<ToolRequest, StopSignal, MalformedOutput>;

// Accepts {"tool": name, "args": {...}}, {"stop": true, "reason": ...}, or
// free-form text from which a diff can be extracted.
AgentAction parse_agent_response(const std::string& raw, const std::string& call_id);

// Any policy that maps an observation to the next action. May throw
// std::exception when its backend fails.
class AgentAdapter {
public:
    using NextAction = std::function<AgentAction(const AgentObservation&)>;

    AgentAdapter(std::string name, NextAction next) : name_(std::move(name)), next_(std::move(next)) {}

    const std::string& name() const { return name_; }
    AgentAction next_action(const AgentObservation& obs) const { return next_(obs); }

private:
    std::string name_;
    NextAction next_;
};

struct AgentConfig {
    enum class Kind { SCRIPTED, PROCESS };
    Kind kind{Kind::SCRIPTED};
    std::string script_path;          // scripted: JSON array of responses
    std::string command;              // process: argv string, observation on stdin
    std::string cwd;
    int turn_timeout_ms{300000};
    ProcLimits limits;
};

// "scripted:<file>" or "process:<command>".
bool parse_agent_spec(const std::string& spec, AgentConfig* out, std::string* err);

// Throws std::runtime_error if a script cannot be loaded.
AgentAdapter make_agent_adapter(const AgentConfig& cfg);

// Replays raw responses in order, then stops.
AgentAdapter scripted_agent(std::vector<std::string> responses, std::string name = "scripted");

// Parse a script file body: a JSON array (or {"actions": [...]}) whose
// elements are action objects or raw text strings.
bool load_agent_script(const std::string& json, std::vector<std::string>* responses, std::string* err);

} // namespace patchbench

#include "patchbench/observation.h"
#include "patchbench/json_mini.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <regex>
#include <sstream>

namespace patchbench {

namespace {

const char* const kErrorKeywords[] = {
    "AssertionError", "TypeError", "ValueError", "AttributeError", "KeyError",
    "IndexError", "ImportError", "ModuleNotFoundError", "NameError",
};

constexpr size_t kMaxSummaryItems = 20;
// Regexes only ever see this much of a line; std::regex recurses per character.
constexpr size_t kMaxScanLineChars = 1024;

void push_unique(std::vector<std::string>* v, const std::string& s) {
    if (v->size() >= kMaxSummaryItems) return;
    if (std::find(v->begin(), v->end(), s) == v->end()) v->push_back(s);
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

// Digits from test output, clamped to int.
int parse_count(const std::string& digits) {
    errno = 0;
    long long v = std::strtoll(digits.c_str(), nullptr, 10);
    if (errno == ERANGE || v > INT_MAX) return INT_MAX;
    return (int)std::max(0LL, v);
}

} // namespace

TestFailureSummary parse_test_output(const std::string& output, int exit_code) {
    static const std::regex failed_re(R"(^(FAILED|ERROR)\s+([^(\s].*?)(?:\s+-\s+.*)?$)");
    static const std::regex unittest_re(R"(^(FAIL|ERROR):\s+(.+)$)");
    static const std::regex traceback_re(R"re(File "([^"]+\.py)")re");
    static const std::regex path_re(R"(([A-Za-z0-9_./-]+\.py))");
    static const std::regex pytest_count_re(R"((\d+)\s+failed)");
    static const std::regex unittest_count_re(R"(failures=(\d+))");

    TestFailureSummary s;
    s.exit_code = exit_code;
    if (output.empty()) return s;

    std::vector<std::string> paths;
    std::istringstream in(output);
    std::string raw;
    std::optional<int> reported_count;
    while (std::getline(in, raw)) {
        if (raw.size() > kMaxScanLineChars) raw.resize(kMaxScanLineChars);
        const std::string line = trim(raw);
        if (line.empty()) continue;
        std::smatch m;
        if (std::regex_match(line, m, failed_re) || std::regex_match(line, m, unittest_re)) {
            push_unique(&s.failed_tests, trim(m[2].str()));
        }
        if (std::regex_search(line, m, pytest_count_re) || std::regex_search(line, m, unittest_count_re)) {
            reported_count = parse_count(m[1].str());
        }

        if (line.rfind("E   ", 0) == 0) {
            push_unique(&s.error_lines, line.substr(4));
        } else {
            for (const char* kw : kErrorKeywords) {
                if (line.find(kw) != std::string::npos) {
                    push_unique(&s.error_lines, line);
                    break;
                }
            }
        }

        for (const std::regex* re : {&traceback_re, &path_re}) {
            for (auto it = std::sregex_iterator(line.begin(), line.end(), *re); it != std::sregex_iterator(); ++it) {
                if (std::find(paths.begin(), paths.end(), (*it)[1].str()) == paths.end()) {
                    paths.push_back((*it)[1].str());
                }
            }
        }
    }

    if (!s.failed_tests.empty()) {
        s.failed_count = (int)s.failed_tests.size();
    } else if (reported_count) {
        s.failed_count = reported_count;
    }

    for (const auto& t : s.failed_tests) {
        std::string file = t.substr(0, t.find("::"));
        if (!file.empty()) push_unique(&s.file_hints, file);
    }
    for (const auto& p : paths) push_unique(&s.file_hints, p);
    return s;
}

std::string summarize_result(const ToolResult& r) {
    std::string tool = tool_kind_name(r.kind);
    if (!r.ok) return tool + " -> ERROR (" + r.error_type + ")";

    json_mini::Doc d = json_mini::parse(r.payload_json);
    switch (r.kind) {
        case ToolKind::LIST_FILES: {
            auto n = json_mini::get_int(d.root, "count").value_or(0);
            return tool + " -> " + std::to_string(n) + " files found";
        }
        case ToolKind::READ_FILE: {
            auto p = json_mini::get_string(d.root, "path").value_or("");
            auto n = json_mini::get_int(d.root, "total_lines").value_or(0);
            return tool + " " + p + " -> " + std::to_string(n) + " lines";
        }
        case ToolKind::SEARCH: {
            auto n = json_mini::get_int(d.root, "total_matches").value_or(0);
            return tool + " -> " + std::to_string(n) + " matches";
        }
        case ToolKind::APPLY_PATCH: {
            std::string files;
            for (const auto& f : r.changed_files) files += (files.empty() ? "" : ", ") + f;
            return tool + " -> changed [" + files + "]";
        }
        case ToolKind::RUN:
            return tool + " -> exit_code=" + std::to_string(r.exit_code.value_or(-1)) +
                   (r.timed_out ? " (timed out)" : "");
    }
    return tool;
}

std::string AgentObservation::to_json() const {
    using json_mini::quote;
    std::ostringstream o;
    o << "{";
    o << "\"task_id\":" << quote(task_id) << ",";
    o << "\"test_command\":" << quote(test_command) << ",";
    o << "\"step\":" << step << ",";
    o << "\"budget\":{\"steps_remaining\":" << steps_remaining
      << ",\"time_remaining_ms\":" << time_remaining_ms << "},";
    o << "\"recent\":" << json_mini::string_array(recent) << ",";
    o << "\"last_result\":" << (last_result_json.empty() ? "null" : last_result_json) << ",";
    if (last_test) {
        o << "\"last_test\":{\"exit_code\":" << last_test->exit_code
          << ",\"timed_out\":" << (last_test->timed_out ? "true" : "false")
          << ",\"fresh\":" << (last_test_fresh ? "true" : "false")
          << ",\"output\":" << quote(last_test->output)
          << ",\"failed_count\":" << (failure.failed_count ? std::to_string(*failure.failed_count) : "null")
          << ",\"failed_tests\":" << json_mini::string_array(failure.failed_tests)
          << ",\"error_lines\":" << json_mini::string_array(failure.error_lines)
          << ",\"file_hints\":" << json_mini::string_array(failure.file_hints) << "},";
    } else {
        o << "\"last_test\":null,";
    }
    o << "\"corrective\":" << (corrective.empty() ? "null" : quote(corrective));
    o << "}";
    return o.str();
}

AgentObservation build_observation(const AgentState& state, const TaskSpec& task,
                                   const EngineConfig& cfg, int step) {
    AgentObservation obs;
    obs.task_id = task.task_id;
    obs.test_command = task.test_command;
    obs.step = step;
    obs.steps_remaining = state.steps_remaining();
    obs.time_remaining_ms = state.time_remaining_ms();

    const auto& h = state.history();
    size_t window = (size_t)std::max(cfg.observation_window, 1);
    size_t first = h.size() > window ? h.size() - window : 0;
    for (size_t i = first; i < h.size(); i++) {
        obs.recent.push_back("step " + std::to_string(h[i].step) + ": " + summarize_result(h[i].result));
    }
    if (!h.empty()) obs.last_result_json = h.back().result.to_json();

    obs.last_test = state.last_test();
    obs.last_test_fresh = state.tests_fresh();
    if (obs.last_test) obs.failure = parse_test_output(obs.last_test->output, obs.last_test->exit_code);
    return obs;
}

} // namespace patchbench

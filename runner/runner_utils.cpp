#include "runner_utils.h"

#include "patchbench/json_mini.h"

#include <chrono>
#include <climits>
#include <csignal>
#include <fstream>
#include <random>
#include <sstream>

namespace patchbench {

namespace {

CancelToken g_cancel;

void on_cancel_signal(int) {
    g_cancel.cancel();
}

} // namespace

std::string gen_run_id() {
    uint64_t t = (uint64_t)std::chrono::system_clock::now().time_since_epoch().count();
    std::random_device rd;
    uint64_t r = ((uint64_t)rd() << 32) ^ (uint64_t)rd();
    std::mt19937_64 rng{t ^ r};
    std::ostringstream oss;
    oss << std::hex << rng() << rng();
    return oss.str();
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

std::string load_task_file(const std::string& path, TaskSpec* out) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return "cannot open task file: " + path;
    std::ostringstream ss;
    ss << f.rdbuf();

    json_mini::Doc d = json_mini::parse(ss.str());
    if (!d.is_object()) return path + ": task must be a JSON object";

    TaskSpec t;
    t.task_id = json_mini::get_string(d.root, "task_id").value_or("");
    if (t.task_id.empty()) t.task_id = json_mini::get_string(d.root, "id").value_or("");
    if (t.task_id.empty()) return path + ": missing task_id";

    t.test_command = json_mini::get_string(d.root, "test_command").value_or("");
    if (t.test_command.empty()) return path + ": missing test_command";

    t.container_image = json_mini::get_string(d.root, "container_image").value_or("");
    t.workdir = json_mini::get_string(d.root, "workdir").value_or("");

    if (json_mini::field(d.root, "per_command_timeout_sec")) {
        auto secs = json_mini::get_int(d.root, "per_command_timeout_sec");
        if (!secs || *secs <= 0) return path + ": per_command_timeout_sec must be a positive integer";
        if (*secs > INT_MAX / 1000) return path + ": per_command_timeout_sec is out of range";
        t.per_command_timeout_ms = (int)(*secs * 1000);
    }

    if (json_mini::field(d.root, "setup_commands")) {
        auto cmds = json_mini::get_strings(d.root, "setup_commands");
        if (!cmds) return path + ": setup_commands must be an array of strings";
        t.setup_commands = *cmds;
    }

    if (json_object* repo = json_mini::field(d.root, "repo")) {
        t.repo_location = json_mini::get_string(repo, "url").value_or("");
        t.pinned_revision = json_mini::get_string(repo, "commit").value_or("");
    }

    *out = std::move(t);
    return "";
}

const CancelToken& install_cancel_signals() {
    std::signal(SIGINT, on_cancel_signal);
    std::signal(SIGTERM, on_cancel_signal);
    // An agent process that exits before reading its observation must not
    // kill the runner.
    std::signal(SIGPIPE, SIG_IGN);
    return g_cancel;
}

} // namespace patchbench

#include "test_common.h"
#include "patchbench/fileio.h"
#include "patchbench/json_mini.h"
#include "patchbench/tools.h"

#include <filesystem>
#include <string>

using namespace patchbench;

namespace fs = std::filesystem;

static ToolRequest make(const std::string& name, const std::string& args) {
    ToolRequest req;
    std::optional<ToolKind> kind;
    std::string err;
    if (!parse_tool_request(name, args, "t1", &req, &kind, &err)) die("parse " + name + ": " + err);
    return req;
}

static bool rejects(const std::string& name, const std::string& args, const std::string& needle) {
    ToolRequest req;
    std::optional<ToolKind> kind;
    std::string err;
    if (parse_tool_request(name, args, "t1", &req, &kind, &err)) return false;
    return err.find(needle) != std::string::npos;
}

static json_object* payload_field(const json_mini::Doc& doc, const char* key) {
    json_object* v = json_mini::field(doc.root, key);
    if (!v) die(std::string("payload missing ") + key);
    return v;
}

int main() {
    // Test 1: request parsing and validation
    {
        ToolRequest req;
        std::optional<ToolKind> kind;
        std::string err;
        expect_true(!parse_tool_request("delete_repo", "{}", "x", &req, &kind, &err), "unknown tool rejected");
        expect_true(!kind.has_value(), "unknown tool has no kind");

        expect_true(!parse_tool_request("read_file", "[1]", "x", &req, &kind, &err), "array args rejected");
        expect_true(kind && *kind == ToolKind::READ_FILE, "known tool keeps its kind on failure");

        expect_true(rejects("read_file", "{}", "missing required 'path'"), "read_file requires path");
        expect_true(rejects("read_file", R"({"path":"a","start_line":0})", "1-based"), "zero start_line");
        expect_true(rejects("read_file", R"({"path":"a","start_line":5,"end_line":2})", "end_line"), "inverted range");
        expect_true(rejects("search", R"({"query":"x","context_lines":50})", "context_lines"), "context bound");
        expect_true(rejects("search", R"({"query":"x","max_results":0})", "max_results"), "max_results bound");
        expect_true(rejects("run", R"({"command":"ls","timeout_sec":-1})", "timeout"), "negative timeout");
        expect_true(rejects("run", R"({"command":"ls","timeout_sec":3000000})", "out of range"), "timeout_sec overflows ms");
        expect_true(rejects("run", R"({"command":"ls","timeout_ms":99999999999})", "out of range"), "timeout_ms beyond int");
        expect_true(rejects("read_file", R"({"path":"a","start_line":4294967297})", "out of range"), "start_line beyond int");
        expect_true(rejects("run", R"({"command":"ls","network":"internet"})", "network"), "bad network mode");
        expect_true(rejects("run", R"({"command":"ls","env":{"A":1}})", "env value"), "non-string env value");
        expect_true(rejects("apply_patch", "{}", "diff"), "apply_patch requires diff");

        ToolRequest lf = make("list_files", R"({"path":"src","glob":"*.py"})");
        expect_true(lf.kind() == ToolKind::LIST_FILES, "list_files kind");
        expect_true(std::get<ListFilesParams>(lf.params).root == "src", "path is an alias for root");

        ToolRequest ap = make("apply_patch", R"({"patch":"--- a/x\n"})");
        expect_true(std::get<ApplyPatchParams>(ap.params).diff == "--- a/x\n", "patch is an alias for diff");

        ToolRequest run = make("run", R"({"command":"pytest","timeout_sec":3,"env":{"A":"b"}})");
        const auto& rp = std::get<RunParams>(run.params);
        expect_true(rp.timeout_ms && *rp.timeout_ms == 3000, "timeout_sec converted to ms");
        expect_true(rp.env.size() == 1 && rp.env[0].second == "b", "env parsed");

        json_mini::Doc args = json_mini::parse(run.args_json());
        expect_true(args.is_object(), "args_json is valid JSON");
    }

    // Test 2: truncation keeps head and tail
    {
        std::string text(1000, 'a');
        text.replace(0, 5, "HEAD_");
        text.replace(995, 5, "_TAIL");
        bool cut = false;
        std::string t = truncate_middle(text, 200, &cut);
        expect_true(cut, "long text is truncated");
        expect_eq_ll((long long)t.size(), 200, "truncated size equals budget");
        expect_true(t.find("HEAD_") == 0, "head kept");
        expect_true(t.find("_TAIL") == t.size() - 5, "tail kept");
        expect_true(t.find(kTruncationMarker) != std::string::npos, "marker present");
        expect_true(truncate_middle("short", 200, &cut) == "short" && !cut, "short text unchanged");
    }

    fs::path tmp;
    std::string err = make_private_dir(fs::temp_directory_path(), "patchbench-tools-", &tmp);
    expect_true(err.empty(), "private dir: " + err);
    fs::path ws = tmp / "ws";
    fs::path attempt = tmp / "attempt";
    fs::create_directories(ws / "src");
    fs::create_directories(attempt / "logs");
    fs::create_directories(attempt / "diffs");
    expect_true(atomic_write_file(ws / "src" / "util.py", "def helper():\n    return 1\n\n# helper used twice\n").empty(), "util.py");
    expect_true(atomic_write_file(ws / "src" / "main.py", "from util import helper\n").empty(), "main.py");
    expect_true(atomic_write_file(ws / "README.md", "docs\n").empty(), "README");
    expect_true(atomic_write_file(ws / "blob.bin", std::string("ab\0cd", 5)).empty(), "blob");
    {
        std::string big;
        for (int i = 1; i <= 50; i++) big += "line " + std::to_string(i) + "\n";
        expect_true(atomic_write_file(ws / "long.txt", big).empty(), "long.txt");
    }

    EngineConfig cfg;
    cfg.read_max_lines = 10;
    cfg.max_log_chars = 100;
    cfg.sandbox.allow_unconfined_root = true;   // throwaway workspace, trusted commands
    LocalSandboxExecutor sandbox(cfg.sandbox);
    ToolRunner runner(cfg, sandbox);

    ToolContext ctx;
    ctx.workspace = ws;
    ctx.attempt_dir = attempt;
    ctx.default_run_timeout_ms = 5000;

    // Test 3: list_files
    {
        ToolResult r = runner.run(make("list_files", "{}"), ctx);
        expect_true(r.ok, "list_files ok: " + r.error_message);
        json_mini::Doc d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "count").value_or(-1), 5, "five files listed");

        r = runner.run(make("list_files", R"({"glob":"*.py"})"), ctx);
        d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "count").value_or(-1), 2, "glob narrows listing");

        r = runner.run(make("list_files", R"({"root":"../"})"), ctx);
        expect_true(!r.ok && r.error_type == "path_escape", "list_files escape rejected");
    }

    // Test 4: read_file
    {
        ToolResult r = runner.run(make("read_file", R"({"path":"src/util.py","start_line":2,"end_line":2})"), ctx);
        expect_true(r.ok, "ranged read ok: " + r.error_message);
        json_mini::Doc d = json_mini::parse(r.payload_json);
        expect_true(json_mini::get_string(d.root, "content").value_or("") == "    return 1\n", "ranged content");
        expect_eq_ll(json_mini::get_int(d.root, "total_lines").value_or(-1), 4, "total lines");

        r = runner.run(make("read_file", R"({"path":"long.txt"})"), ctx);
        expect_true(r.ok && r.truncated, "long file truncated");
        d = json_mini::parse(r.payload_json);
        std::string content = json_mini::get_string(d.root, "content").value_or("");
        expect_true(content.find("line 1\n") == 0, "head of long file kept");
        expect_true(content.find("[40 lines omitted]") != std::string::npos, "omission marker: " + content);
        expect_true(content.find("line 50\n") != std::string::npos, "tail of long file kept");

        r = runner.run(make("read_file", R"({"path":"long.txt","start_line":45})"), ctx);
        expect_true(r.ok && !r.truncated, "explicit range is not truncated");

        r = runner.run(make("read_file", R"({"path":"long.txt","start_line":99})"), ctx);
        expect_true(!r.ok && r.error_type == "invalid_range", "range past EOF");

        r = runner.run(make("read_file", R"({"path":"blob.bin"})"), ctx);
        expect_true(!r.ok && r.error_type == "binary_file", "binary file rejected");

        r = runner.run(make("read_file", R"({"path":"src"})"), ctx);
        expect_true(!r.ok && r.error_type == "is_directory", "directory rejected");

        r = runner.run(make("read_file", R"({"path":"util.py"})"), ctx);
        expect_true(!r.ok && r.error_type == "file_not_found", "missing file");
        d = json_mini::parse(r.payload_json);
        auto sugg = json_mini::get_strings(d.root, "suggestions");
        expect_true(sugg && !sugg->empty() && (*sugg)[0] == "src/util.py", "same basename suggested first");

        r = runner.run(make("read_file", R"({"path":"../../etc/passwd"})"), ctx);
        expect_true(!r.ok && r.error_type == "path_escape", "read escape rejected");

        EngineConfig small = cfg;
        small.read_max_bytes = 16;
        ToolResult big = tool_read_file(std::get<ReadFileParams>(make("read_file", R"({"path":"long.txt"})").params),
                                        ctx, small);
        expect_true(!big.ok && big.error_type == "too_large", "oversized file without range");

        r = runner.run(make("read_file", R"({"path":"long.txt","start_line":1,"end_line":2147483647})"), ctx);
        expect_true(r.ok && r.truncated, "open-ended range is capped");
        d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "end_line").value_or(-1), 10, "range cut at read_max_lines");
        content = json_mini::get_string(d.root, "content").value_or("");
        expect_true(content.find("line 10\n") != std::string::npos && content.find("line 11") == std::string::npos,
                    "ranged slice holds the first ten lines: " + content);

        ToolResult slice = tool_read_file(
            std::get<ReadFileParams>(make("read_file", R"({"path":"long.txt","start_line":1,"end_line":5})").params),
            ctx, small);
        expect_true(slice.ok && slice.truncated, "ranged read honours the byte cap");
        d = json_mini::parse(slice.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "end_line").value_or(-1), 2, "byte cap stops after two lines");
        expect_true(json_mini::get_string(d.root, "content").value_or("") == "line 1\nline 2\n", "byte-capped slice");
    }

    // Test 5: search ranks files by match count
    {
        ToolResult r = runner.run(make("search", R"({"query":"helper","context_lines":1})"), ctx);
        expect_true(r.ok, "search ok: " + r.error_message);
        json_mini::Doc d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "total_matches").value_or(-1), 3, "three matches");
        json_object* matches = payload_field(d, "matches");
        json_object* first = json_object_array_get_idx(matches, 0);
        expect_true(json_mini::get_string(first, "path").value_or("") == "src/util.py", "busiest file ranked first");
        expect_eq_ll(json_mini::get_int(first, "line").value_or(-1), 1, "first match line");

        r = runner.run(make("search", R"({"query":"HELPER","ignore_case":true,"max_results":1})"), ctx);
        d = json_mini::parse(r.payload_json);
        expect_true(r.ok && r.truncated, "max_results truncates");
        expect_eq_ll((long long)json_object_array_length(payload_field(d, "matches")), 1, "one match returned");

        r = runner.run(make("search", R"({"query":"def\\s+\\w+","regex":true,"path":"src/util.py"})"), ctx);
        d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "total_matches").value_or(-1), 1, "regex search in one file");

        r = runner.run(make("search", R"({"query":"(unclosed","regex":true})"), ctx);
        expect_true(!r.ok && r.error_type == "invalid_regex", "invalid regex rejected");

        // A minified file: one very long line must not take the process down.
        fs::create_directories(ws / "dist");
        expect_true(atomic_write_file(ws / "dist" / "app.min.js",
                                      std::string(200000, 'a') + "\nfunction helper(){}\n").empty(), "app.min.js");
        r = runner.run(make("search", R"({"query":"(a|b)*c|helper","regex":true,"path":"dist"})"), ctx);
        expect_true(r.ok, "regex search over a long line: " + r.error_message);
        d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "total_matches").value_or(-1), 1, "short line still searched");
        expect_eq_ll(json_mini::get_int(d.root, "skipped_long_lines").value_or(-1), 1, "long line skipped");

        r = runner.run(make("search", R"({"query":"aaaa","path":"dist"})"), ctx);
        expect_true(r.ok, "literal search over a long line");
        d = json_mini::parse(r.payload_json);
        expect_eq_ll(json_mini::get_int(d.root, "total_matches").value_or(-1), 1, "literal search still matches it");
        fs::remove_all(ws / "dist");
    }

    // Test 6: apply_patch persists the canonical diff
    {
        ctx.step = 3;
        std::string diff =
            "--- a/src/util.py\n+++ b/src/util.py\n@@ -1,2 +1,2 @@\n def helper():\n-    return 1\n+    return 2\n";
        ToolResult r = runner.run(make("apply_patch", "{\"diff\":" + json_mini::quote(diff) + "}"), ctx);
        expect_true(r.ok, "apply_patch ok: " + r.error_message);
        expect_true(r.artifact_path == "diffs/step_0003.patch", "artifact name: " + r.artifact_path);
        std::string saved;
        expect_true(read_whole_file(attempt / r.artifact_path, &saved).empty(), "artifact readable");
        expect_true(saved == diff, "artifact holds the canonical diff");
        expect_true(r.changed_files.size() == 1 && r.changed_files[0] == "src/util.py", "changed files");

        ctx.step = 4;
        r = runner.run(make("apply_patch", R"({"diff":"not a diff"})"), ctx);
        expect_true(!r.ok && r.error_type == "malformed_diff", "garbage patch rejected");
    }

    // Test 7: run
    {
        ctx.step = 5;
        ToolResult r = runner.run(make("run", R"({"command":"echo out; echo err 1>&2; exit 2"})"), ctx);
        expect_true(r.ok, "run ok: " + r.error_message);
        expect_true(r.exit_code && *r.exit_code == 2, "nonzero exit is a normal result");
        expect_true(r.stdout_path == "logs/step_0005_stdout.txt", "stdout log name");
        std::string logged;
        expect_true(read_whole_file(attempt / r.stdout_path, &logged).empty() && logged == "out\n", "stdout log content");
        expect_true(r.output.find("out") != std::string::npos && r.output.find("err") != std::string::npos,
                    "combined output");

        ctx.step = 6;
        r = runner.run(make("run", R"({"command":"sleep 5","timeout_ms":300})"), ctx);
        expect_true(r.ok && r.timed_out, "timed out run");
        expect_eq_ll(*r.exit_code, kTimeoutExitCode, "timeout exit code");

        ctx.step = 7;
        r = runner.run(make("run", R"({"command":"true","network":"egress"})"), ctx);
        expect_true(!r.ok && r.error_type == "network_denied", "egress denied to agents");

        ctx.step = 8;
        r = runner.run(make("run", R"({"command":"i=0; while [ $i -lt 100 ]; do echo 0123456789; i=$((i+1)); done"})"), ctx);
        expect_true(r.ok && r.truncated, "long output truncated");
        expect_true(r.output.size() <= cfg.max_log_chars, "output bounded");

        ctx.step = 9;
        ctx.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
        r = runner.run(make("run", R"({"command":"true"})"), ctx);
        expect_true(!r.ok && r.error_type == "timeout", "no time left for a run");
    }

    fs::remove_all(tmp);
    std::cerr << "test_tools: ALL PASSED" << std::endl;
    return 0;
}

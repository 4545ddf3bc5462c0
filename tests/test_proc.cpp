#include "test_common.h"
#include "patchbench/fileio.h"
#include "patchbench/proc.h"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <thread>

using namespace patchbench;

namespace fs = std::filesystem;

static ProcSpec sh(const std::string& script) {
    ProcSpec ps;
    ps.argv = {"/bin/sh", "-c", script};
    ps.env = {"PATH=/usr/bin:/bin"};
    return ps;
}

int main() {
    ProcLimits lim;
    lim.timeout_ms = 5000;

    // Test 1: stdout capture and exit code
    {
        ProcResult r;
        expect_true(proc_run(sh("echo hello; exit 3"), lim, nullptr, &r), "proc should start");
        expect_true(r.started, "started flag");
        expect_eq_ll(r.exit_code, 3, "exit code propagated");
        expect_true(r.stdout_text == "hello\n", "stdout captured");
        expect_true(!r.timed_out, "no timeout");
    }

    // Test 2: stdin is delivered
    {
        ProcSpec ps = sh("cat");
        ps.stdin_data = "from-stdin";
        ProcResult r;
        expect_true(proc_run(ps, lim, nullptr, &r), "cat should start");
        expect_true(r.stdout_text == "from-stdin", "stdin echoed back");
    }

    // Test 3: timeout kills the group
    {
        ProcLimits t = lim;
        t.timeout_ms = 300;
        ProcResult r;
        expect_true(proc_run(sh("sleep 5"), t, nullptr, &r), "sleep should start");
        expect_true(r.timed_out, "sleep should time out");
        expect_true(r.elapsed_ms < 4000, "timeout should fire well before the sleep ends");
    }

    // Test 4: death by signal maps to 128+N
    {
        ProcResult r;
        expect_true(proc_run(sh("kill -9 $$"), lim, nullptr, &r), "self-kill should start");
        expect_eq_ll(r.exit_code, 128 + 9, "SIGKILL exit code");
    }

    // Test 5: capture files hold both streams
    {
        fs::path dir;
        std::string err = make_private_dir(fs::temp_directory_path(), "patchbench-proc-", &dir);
        expect_true(err.empty(), "private dir: " + err);
        ProcSpec ps = sh("echo out; echo err 1>&2");
        ps.stdout_path = (dir / "out.txt").string();
        ps.stderr_path = (dir / "err.txt").string();
        ProcResult r;
        expect_true(proc_run(ps, lim, nullptr, &r), "capture run should start");
        std::string out, errs;
        expect_true(read_whole_file(ps.stdout_path, &out).empty(), "read stdout capture");
        expect_true(read_whole_file(ps.stderr_path, &errs).empty(), "read stderr capture");
        expect_true(out == "out\n", "stdout capture content");
        expect_true(errs == "err\n", "stderr capture content");
        fs::remove_all(dir);
    }

    // Test 6: environment is scrubbed unless inherited
    {
        setenv("PATCHBENCH_TEST_SECRET", "leak", 1);
        ProcSpec ps = sh("echo \"[$PATCHBENCH_TEST_SECRET][$FOO]\"");
        ps.env.push_back("FOO=bar");
        ProcResult r;
        expect_true(proc_run(ps, lim, nullptr, &r), "env run should start");
        expect_true(r.stdout_text == "[][bar]\n", "parent env should not leak: " + r.stdout_text);

        ps.inherit_env = true;
        expect_true(proc_run(ps, lim, nullptr, &r), "inherit run should start");
        expect_true(r.stdout_text == "[leak][bar]\n", "inherited env should be visible");
        unsetenv("PATCHBENCH_TEST_SECRET");
    }

    // Test 7: cancellation keeps partial output
    {
        fs::path dir;
        std::string err = make_private_dir(fs::temp_directory_path(), "patchbench-proc-", &dir);
        expect_true(err.empty(), "private dir: " + err);
        ProcSpec ps = sh("echo partial; sleep 5");
        ps.stdout_path = (dir / "out.txt").string();
        ps.stderr_path = (dir / "err.txt").string();

        CancelToken tok;
        std::thread t([&tok, &ps] {
            for (int i = 0; i < 500; i++) {
                std::string out;
                if (read_whole_file(ps.stdout_path, &out).empty() && !out.empty()) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            tok.cancel();
        });
        ProcResult r;
        bool started = proc_run(ps, lim, &tok, &r);
        t.join();
        expect_true(started, "cancellable run should start");
        expect_true(r.cancelled, "run should be cancelled");
        expect_true(!r.timed_out, "cancel is not a timeout");
        expect_true(r.elapsed_ms < 4000, "cancel should not wait for the sleep");
        std::string out;
        expect_true(read_whole_file(ps.stdout_path, &out).empty(), "stdout capture survives the kill");
        expect_true(out == "partial\n", "partial stdout on disk: " + out);
        expect_true(r.stdout_text == "partial\n", "partial stdout in memory");
        fs::remove_all(dir);
    }

    // Test 8: exec failure is a start failure
    {
        ProcSpec ps;
        ps.argv = {"/nonexistent/binary"};
        ProcResult r;
        expect_true(!proc_run(ps, lim, nullptr, &r), "missing binary should fail to start");
        expect_true(!r.error.empty(), "start failure should carry an error");
    }

    // Test 9: argv splitting
    {
        auto av = split_argv_quoted("pytest -k \"a b\" 'c d'");
        expect_eq_ll((long long)av.size(), 4, "quoted tokens");
        expect_true(av[2] == "a b" && av[3] == "c d", "quotes preserved as one token");
        expect_true(split_argv_quoted("echo \"unterminated").empty(), "unterminated quote is an error");
    }

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}

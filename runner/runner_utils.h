#pragma once

#include "patchbench/proc.h"
#include "patchbench/types.h"

#include <string>

namespace patchbench {

int cmd_attempt(int argc, char** argv);
int cmd_verify(int argc, char** argv);
int cmd_classify(int argc, char** argv);

std::string gen_run_id();
std::string slurp(const std::string& path);

// Task file: {"task_id", "container_image", "workdir", "per_command_timeout_sec",
// "setup_commands": [...], "test_command", optional "repo": {"url", "commit"}}.
// Returns empty string on success.
std::string load_task_file(const std::string& path, TaskSpec* out);

// SIGINT/SIGTERM set the returned token; the attempt winds down cooperatively.
const CancelToken& install_cancel_signals();

} // namespace patchbench

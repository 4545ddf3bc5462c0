#include "runner_utils.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "patchbench_cli <attempt|verify|classify> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "attempt") return patchbench::cmd_attempt(argc, argv);
    if (cmd == "verify") return patchbench::cmd_verify(argc, argv);
    if (cmd == "classify") return patchbench::cmd_classify(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}

#include "runner_utils.h"

#include "patchbench/attempt.h"
#include "patchbench/classifier.h"
#include "patchbench/event_log.h"

#include <iostream>
#include <string>

namespace patchbench {

int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: patchbench_cli verify <events.jsonl>\n";
        return 2;
    }
    ChainCheck c = verify_event_log(argv[2]);
    if (!c.ok) {
        std::cout << "VERIFY FAIL: " << c.error << "\n";
        return 1;
    }
    std::cout << "VERIFY OK (" << c.records << " records)\n";
    return 0;
}

// Re-derive the failure reason from a stored record and compare.
int cmd_classify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: patchbench_cli classify <attempt.json>\n";
        return 2;
    }
    const std::string body = slurp(argv[2]);
    if (body.empty()) {
        std::cerr << "cannot read " << argv[2] << "\n";
        return 2;
    }
    AttemptRecord rec;
    std::string err;
    if (!parse_attempt_record(body, &rec, &err)) {
        std::cerr << argv[2] << ": " << err << "\n";
        return 2;
    }
    if (!rec.finalized) {
        std::cout << "attempt not finalized (stop_reason unset)\n";
        return 1;
    }

    FailureReason fr = classify(classifier_input(rec));
    std::cout << failure_reason_name(fr) << "\n";
    if (rec.failure_reason && *rec.failure_reason != fr) {
        std::cout << "MISMATCH: record says " << failure_reason_name(*rec.failure_reason) << "\n";
        return 1;
    }
    return 0;
}

} // namespace patchbench

/**
 * Blocking child-process helper
 *
 * fork/exec with separate stdin, stdout and stderr pipes. Output is
 * collected with poll() so a chatty stderr cannot stall stdout. Pipes
 * are close-on-exec so concurrent spawns never inherit each other's.
 */
#pragma once
#include <string>
#include <vector>

namespace warden::util {

struct ProcessResult {
    bool spawned = false;       // fork/exec succeeded
    int exit_code = -1;         // 128+signo if killed by a signal
    bool timed_out = false;     // killed with SIGKILL at the deadline
    std::string stdout_data;
    std::string stderr_data;
    std::string error;          // set when spawned == false
};

// Run argv[0] (PATH lookup) to completion, feeding `input` on stdin.
// With timeout_ms > 0 the child is killed once the deadline passes and
// whatever output arrived until then is returned.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input = {},
                          int timeout_ms = 0);

} // namespace warden::util

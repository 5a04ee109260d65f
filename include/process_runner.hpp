//
//  process_runner.hpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace chaptify {

enum class ProcessOutcome {
    Exited,       ///< exited normally; see exit_code
    Signaled,     ///< killed by a signal not sent by us
    TimedOut,     ///< exceeded the timeout and was terminated
    SpawnFailed,  ///< could not be started (fork/pipe failure or exec failure)
    StatusLost,   ///< reaped elsewhere (ECHILD); success cannot be established
};

struct ProcessResult {
    ProcessOutcome outcome = ProcessOutcome::SpawnFailed;
    int exit_code = -1;
    int signal_number = 0;
    std::string stderr_tail;  ///< last bytes the child wrote to stderr
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return outcome == ProcessOutcome::Exited && exit_code == 0; }
};

const char *process_outcome_name(ProcessOutcome outcome);

/**
 * @brief Run argv[0] (PATH lookup) synchronously with a timeout.
 *
 * stdin and stdout are bound to /dev/null, stderr is captured. On timeout the child receives
 * SIGTERM and, if still alive after a grace period, SIGKILL; it is always reaped.
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout);

}  // namespace chaptify

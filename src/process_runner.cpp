//
//  process_runner.cpp
//  Chaptify
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "process_runner.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "logging.hpp"

namespace chaptify {

namespace {

constexpr size_t kStderrTailBytes = 4096;
constexpr auto kPollInterval = std::chrono::milliseconds(20);
constexpr auto kTermGrace = std::chrono::milliseconds(2000);
// Exit status the child uses when exec itself fails.
constexpr int kExecFailed = 127;

void drain(int fd, std::string &tail) {
    char buf[1024];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0) {
            return;
        }
        tail.append(buf, static_cast<size_t>(n));
        if (tail.size() > kStderrTailBytes) {
            tail.erase(0, tail.size() - kStderrTailBytes);
        }
    }
}

// Returns true once the child has been reaped, or once it can no longer be waited for; the
// latter sets `lost` since the exit status is gone.
bool try_reap(pid_t pid, int &status, bool &lost) {
    for (;;) {
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return true;
        }
        if (r == -1 && errno == EINTR) {
            continue;
        }
        if (r == -1) {
            lost = true;
            return true;
        }
        return false;
    }
}

void terminate_child(pid_t pid, int &status, bool &lost) {
    ::kill(pid, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap(pid, status, lost)) {
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    CY_LOG("warn", "child " << pid << " ignored SIGTERM; sending SIGKILL");
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            lost = true;
            return;
        }
    }
}

}  // namespace

const char *process_outcome_name(ProcessOutcome outcome) {
    switch (outcome) {
        case ProcessOutcome::Exited:
            return "exited";
        case ProcessOutcome::Signaled:
            return "signaled";
        case ProcessOutcome::TimedOut:
            return "timed out";
        case ProcessOutcome::SpawnFailed:
            return "spawn failed";
        case ProcessOutcome::StatusLost:
            return "exit status lost";
    }
    return "unknown";
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout) {
    ProcessResult result;
    if (argv.empty()) {
        result.stderr_tail = "empty command line";
        return result;
    }

    int err_pipe[2] = {-1, -1};
    // CLOEXEC keeps the write end out of children spawned concurrently by other threads.
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.stderr_tail = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    // Build argv before forking; the child must not allocate.
    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv) {
        args.push_back(const_cast<char *>(a.c_str()));
    }
    args.push_back(nullptr);

    const auto start = std::chrono::steady_clock::now();
    const pid_t pid = ::fork();
    if (pid == -1) {
        result.stderr_tail = std::string("fork failed: ") + std::strerror(errno);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
        }
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::execvp(args[0], args.data());
        _exit(kExecFailed);
    }

    ::close(err_pipe[1]);
    ::fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);
    CY_LOG("remux", "spawned pid=" << pid << " " << argv[0]);

    int status = 0;
    bool timed_out = false;
    bool status_lost = false;
    for (;;) {
        drain(err_pipe[0], result.stderr_tail);
        if (try_reap(pid, status, status_lost)) {
            break;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            timed_out = true;
            terminate_child(pid, status, status_lost);
            break;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    drain(err_pipe[0], result.stderr_tail);
    ::close(err_pipe[0]);
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (timed_out) {
        result.outcome = ProcessOutcome::TimedOut;
    } else if (status_lost) {
        // Someone else reaped the child (SIGCHLD ignored or a foreign waitpid).
        result.outcome = ProcessOutcome::StatusLost;
        CY_LOG("error", "pid=" << pid << " was reaped elsewhere (ECHILD); exit status unknown");
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.outcome = result.exit_code == kExecFailed && result.stderr_tail.empty()
                             ? ProcessOutcome::SpawnFailed
                             : ProcessOutcome::Exited;
    } else if (WIFSIGNALED(status)) {
        result.outcome = ProcessOutcome::Signaled;
        result.signal_number = WTERMSIG(status);
    }
    CY_LOG("remux", "pid=" << pid << " " << process_outcome_name(result.outcome)
                           << " exit=" << result.exit_code << " after "
                           << result.elapsed.count() << "ms");
    return result;
}

}  // namespace chaptify

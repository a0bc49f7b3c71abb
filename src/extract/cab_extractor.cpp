/**
 * xcp360 - Xbox 360 XCP package converter
 *
 * Subprocess cabinet extractor implementation
 */

#include "cab_extractor.h"
#include "core/log_buffer.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstring>
#include <thread>
#include <vector>

#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace xcp360 {

using Clock = std::chrono::steady_clock;

static long long ms_until(Clock::time_point deadline) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
}

SubprocessCabExtractor::SubprocessCabExtractor(std::string program, u32 timeout_ms)
    : program_(std::move(program)), timeout_ms_(timeout_ms) {}

Status SubprocessCabExtractor::extract(const std::string& archive_path,
                                       const std::string& dest_dir,
                                       std::string& output) {
    output.clear();

    if (program_.empty()) {
        XCP360_LOG_E(LogComponent::Extract, "No extractor program configured");
        return Status::ExtractionFailed;
    }

    std::vector<std::string> args = { program_, "-d", dest_dir, "-F", "*", archive_path };
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fds[2];
    if (pipe(fds) != 0) {
        XCP360_LOG_E(LogComponent::Extract, "pipe() failed: %s", strerror(errno));
        return Status::ExtractionFailed;
    }

    pid_t pid = fork();
    if (pid < 0) {
        XCP360_LOG_E(LogComponent::Extract, "fork() failed: %s", strerror(errno));
        close(fds[0]);
        close(fds[1]);
        return Status::ExtractionFailed;
    }

    if (pid == 0) {
        // Child: stdout and stderr both go to the pipe
        dup2(fds[1], STDOUT_FILENO);
        dup2(fds[1], STDERR_FILENO);
        close(fds[0]);
        close(fds[1]);
        execvp(argv[0], argv.data());
        dprintf(STDERR_FILENO, "%s: %s\n", argv[0], strerror(errno));
        _exit(EXEC_FAILED);
    }

    close(fds[1]);
    XCP360_LOG_D(LogComponent::Extract, "Started %s (pid %d)", program_.c_str(), static_cast<int>(pid));

    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(timeout_ms_);
    bool timed_out = false;
    char buf[4096];

    // Drain output until EOF or timeout
    for (;;) {
        long long remaining = ms_until(deadline);
        if (remaining <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfd = { fds[0], POLLIN, 0 };
        int rc = poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining, INT_MAX)));
        if (rc < 0) {
            if (errno == EINTR) continue;
            XCP360_LOG_W(LogComponent::Extract, "poll() failed: %s", strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t n = read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            output.append(buf, static_cast<usize>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            XCP360_LOG_W(LogComponent::Extract, "read() failed: %s", strerror(errno));
            break;
        }
    }
    close(fds[0]);

    // Reap the child, still bounded by the deadline
    int wstatus = 0;
    for (;;) {
        if (timed_out) {
            kill(pid, SIGKILL);
            while (waitpid(pid, &wstatus, 0) < 0 && errno == EINTR) {}
            break;
        }

        pid_t done = waitpid(pid, &wstatus, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            XCP360_LOG_E(LogComponent::Extract, "waitpid() failed: %s", strerror(errno));
            return Status::ExtractionFailed;
        }
        if (ms_until(deadline) <= 0) {
            timed_out = true;
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        XCP360_LOG_E(LogComponent::Extract, "%s timed out after %u ms",
                     program_.c_str(), timeout_ms_);
        return Status::ExtractionFailed;
    }

    if (WIFSIGNALED(wstatus)) {
        XCP360_LOG_E(LogComponent::Extract, "%s killed by signal %d:\n%s",
                     program_.c_str(), WTERMSIG(wstatus), output.c_str());
        return Status::ExtractionFailed;
    }

    int code = WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1;
    if (code == EXEC_FAILED) {
        XCP360_LOG_E(LogComponent::Extract, "Could not run %s: %s",
                     program_.c_str(), output.c_str());
        return Status::ExtractionFailed;
    }
    if (code != 0) {
        XCP360_LOG_E(LogComponent::Extract, "%s exited with code %d:\n%s",
                     program_.c_str(), code, output.c_str());
        return Status::ExtractionFailed;
    }

    XCP360_LOG_D(LogComponent::Extract, "%s", output.c_str());
    return Status::Ok;
}

} // namespace xcp360

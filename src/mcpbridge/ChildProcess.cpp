//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: POSIX fork/exec process spawning with piped standard streams
//==========================================================================================================

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <map>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcpbridge/ChildProcess.hpp"
#include "mcpbridge/errors/Errors.h"

extern char** environ;

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

namespace {

// Writes to a child whose stdin is gone must surface as EPIPE, not kill the bridge.
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        ::sigemptyset(&sa.sa_mask);
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
            LOG_WARN("ChildProcess: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

void closeQuietly(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int fds[2]{-1, -1};
    ~PipePair() { closeQuietly(fds[0]); closeQuietly(fds[1]); }
    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int release(int end) { int fd = fds[end]; fds[end] = -1; return fd; }
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        const char* eq = std::strchr(*e, '=');
        if (eq == nullptr) {
            continue;
        }
        merged[std::string(*e, static_cast<std::size_t>(eq - *e))] = std::string(eq + 1);
    }
    for (const auto& [key, value] : overrides) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

[[noreturn]] void execChild(int stdinRead, int stdoutWrite, int stderrWrite, int statusWrite,
                            char* const argv[], char* const envp[]) {
    // Only async-signal-safe calls between fork and exec
    ::setpgid(0, 0);
    struct sigaction sa{};
    sa.sa_handler = SIG_DFL;
    ::sigemptyset(&sa.sa_mask);
    ::sigaction(SIGPIPE, &sa, nullptr);
    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    if (::dup2(stdinRead, STDIN_FILENO) < 0 || ::dup2(stdoutWrite, STDOUT_FILENO) < 0 ||
        ::dup2(stderrWrite, STDERR_FILENO) < 0) {
        int err = errno;
        (void)!::write(statusWrite, &err, sizeof(err));
        ::_exit(127);
    }
    ::execvpe(argv[0], argv, envp);
    int err = errno;
    (void)!::write(statusWrite, &err, sizeof(err));
    ::_exit(127);
}

} // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const ServerDefinition& def) {
    FUNC_SCOPE();
    ignoreSigpipeOnce();

    // Everything the child needs is prepared before fork
    std::vector<std::string> argStrings;
    argStrings.push_back(def.command);
    argStrings.insert(argStrings.end(), def.args.begin(), def.args.end());
    std::vector<char*> argv;
    for (auto& a : argStrings) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStrings = buildEnvironment(def.env);
    std::vector<char*> envp;
    for (auto& e : envStrings) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    PipePair in, out, err, status;
    if (!in.open() || !out.open() || !err.open() || !status.open()) {
        throw BridgeError(ErrorKind::SpawnError,
                          "failed to create pipes for '" + def.command + "': " + ::strerror(errno), def.name);
    }

    pid_t child = ::fork();
    if (child < 0) {
        throw BridgeError(ErrorKind::SpawnError,
                          "fork failed for '" + def.command + "': " + ::strerror(errno), def.name);
    }
    if (child == 0) {
        execChild(in.fds[0], out.fds[1], err.fds[1], status.fds[1], argv.data(), envp.data());
    }

    // Parent: both sides race to set the group so signals reach it either way
    ::setpgid(child, child);
    closeQuietly(in.fds[0]);
    closeQuietly(out.fds[1]);
    closeQuietly(err.fds[1]);
    closeQuietly(status.fds[1]);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(status.fds[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int ws = 0;
        while (::waitpid(child, &ws, 0) < 0 && errno == EINTR) {}
        LOG_WARN("ChildProcess: exec of '{}' failed (errno={} msg={})", def.command, childErrno, ::strerror(childErrno));
        throw BridgeError(ErrorKind::SpawnError,
                          "failed to launch '" + def.command + "': " + ::strerror(childErrno), def.name);
    }

    std::unique_ptr<ChildProcess> proc(new ChildProcess());
    proc->pid = child;
    proc->stdinFd = in.release(1);
    proc->stdoutFd = out.release(0);
    proc->stderrFd = err.release(0);
    LOG_INFO("ChildProcess: launched '{}' for server '{}' (pid={})", def.command, def.name, static_cast<long>(child));
    return proc;
}

ChildProcess::~ChildProcess() {
    Terminate(std::chrono::milliseconds(2000));
}

void ChildProcess::closeFds() {
    closeQuietly(stdinFd);
    closeQuietly(stdoutFd);
    closeQuietly(stderrFd);
}

void ChildProcess::CloseStdin() {
    closeQuietly(stdinFd);
}

std::optional<int> ChildProcess::TryWait() {
    std::lock_guard<std::mutex> lock(waitMutex);
    if (exitStatus.has_value() || pid <= 0) {
        return exitStatus;
    }
    int ws = 0;
    pid_t r;
    do {
        r = ::waitpid(pid, &ws, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid) {
        exitStatus = ws;
    } else if (r < 0) {
        LOG_WARN("ChildProcess: waitpid({}) failed (errno={} msg={})", static_cast<long>(pid), errno, ::strerror(errno));
        exitStatus = 0;
    }
    return exitStatus;
}

std::string ChildProcess::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    if (pid <= 0) {
        return "not started";
    }
    if (auto st = TryWait()) {
        closeFds();
        return DescribeStatus(*st);
    }

    // Closing stdin first lets a well-behaved server exit on its own
    CloseStdin();
    if (::kill(-pid, SIGTERM) != 0 && ::kill(pid, SIGTERM) != 0 && errno != ESRCH) {
        LOG_WARN("ChildProcess: SIGTERM to pid {} failed (errno={} msg={})", static_cast<long>(pid), errno, ::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto st = TryWait()) {
            closeFds();
            return DescribeStatus(*st);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    LOG_WARN("ChildProcess: pid {} ignored SIGTERM for {} ms; sending SIGKILL", static_cast<long>(pid),
             static_cast<long long>(grace.count()));
    if (::kill(-pid, SIGKILL) != 0) {
        (void)::kill(pid, SIGKILL);
    }
    std::string description;
    {
        std::lock_guard<std::mutex> lock(waitMutex);
        if (!exitStatus.has_value()) {
            int ws = 0;
            pid_t r;
            do {
                r = ::waitpid(pid, &ws, 0);
            } while (r < 0 && errno == EINTR);
            exitStatus = (r == pid) ? ws : 0;
        }
        description = DescribeStatus(*exitStatus);
    }
    closeFds();
    return description;
}

std::string ChildProcess::DescribeStatus(int status) {
    if (WIFEXITED(status)) {
        return "exited with code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "terminated (status " + std::to_string(status) + ")";
}

} // namespace mcpbridge

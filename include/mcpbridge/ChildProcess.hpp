//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: RAII handle for a spawned MCP server process and its three standard-stream pipes
//==========================================================================================================
#pragma once

#include <sys/types.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "mcpbridge/ServerDefinition.h"

namespace mcpbridge {

//==========================================================================================================
// ChildProcess
// Purpose: Owns one child process (in its own process group) plus the parent ends of its stdin,
//          stdout and stderr pipes. Destruction terminates and reaps the child.
//==========================================================================================================
class ChildProcess {
public:
    //==========================================================================================================
    // Spawn
    // Purpose: fork/exec the definition's command with its args and the merged environment.
    // Args:
    //   def: Launch description; command is resolved through PATH when it has no '/'.
    // Returns:
    //   Running child; exec failures are detected synchronously through a close-on-exec status pipe.
    // Throws:
    //   errors::BridgeError(SpawnError) when pipes cannot be created, fork fails, or exec fails
    //   (ENOENT, EACCES, ...).
    //==========================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(const ServerDefinition& def);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid; }
    int StdinFd() const { return stdinFd; }
    int StdoutFd() const { return stdoutFd; }
    int StderrFd() const { return stderrFd; }

    // Closes the write end of the child's stdin (signals EOF to well-behaved servers).
    void CloseStdin();

    //==========================================================================================================
    // TryWait
    // Purpose: Non-blocking reap.
    // Returns:
    //   Raw wait status once the child has exited, std::nullopt while it is still running.
    //==========================================================================================================
    std::optional<int> TryWait();

    //==========================================================================================================
    // Terminate
    // Purpose: SIGTERM to the process group, SIGKILL after `grace`, then reap. Idempotent.
    // Returns:
    //   Human readable exit description ("exited with code 0", "killed by signal 9").
    //==========================================================================================================
    std::string Terminate(std::chrono::milliseconds grace);

    static std::string DescribeStatus(int status);

private:
    ChildProcess() = default;
    void closeFds();

    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    std::mutex waitMutex;
    std::optional<int> exitStatus;
};

} // namespace mcpbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Newline-delimited JSON-RPC channel over a child process's stdin/stdout
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "mcpbridge/ChildProcess.hpp"
#include "mcpbridge/JSONRPCTypes.h"

namespace mcpbridge {

//==========================================================================================================
// ProcessTransportOptions
// Fields:
//   requestTimeout: Default per-request deadline (a call may override it).
//   terminateGrace: Time between SIGTERM and SIGKILL on Close().
//   maxLineBytes: Longest accepted stdout line; longer lines are dropped up to the next newline.
//   writeQueueMaxBytes: Backpressure clamp on frames waiting to be written to the child.
//==========================================================================================================
struct ProcessTransportOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds terminateGrace{2000};
    std::size_t maxLineBytes{4 * 1024 * 1024};
    std::size_t writeQueueMaxBytes{4 * 1024 * 1024};
};

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process and correlates JSON-RPC requests with responses by id.
// Threads:
//   reader (stdout), stderr reader, writer, timeout scanner. All are joined by Close().
// Failure model:
//   Timed-out requests resolve with a RequestTimeout error response; the child keeps running.
//   When the child closes stdout every pending request resolves with a TransportClosed error
//   response and the close handler fires once with the exit reason.
//==========================================================================================================
class ProcessTransport {
public:
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using StderrHandler = std::function<void(const std::string& line)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    ProcessTransport(std::string serverName, std::unique_ptr<ChildProcess> process,
                     ProcessTransportOptions options = {});
    ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    //==========================================================================================================
    // Launch
    // Purpose: Spawns the definition's process and wraps it (loops not yet started).
    // Throws:
    //   errors::BridgeError(SpawnError) from ChildProcess::Spawn.
    //==========================================================================================================
    static std::shared_ptr<ProcessTransport> Launch(const ServerDefinition& def, ProcessTransportOptions options = {});

    // Starts the loops. Handlers must be registered before Start().
    void Start();

    //==========================================================================================================
    // Close
    // Purpose: Stops the loops, terminates the child (SIGTERM, then SIGKILL after the grace period),
    //          and fails outstanding requests with TransportClosed. Idempotent; safe from any thread.
    //==========================================================================================================
    void Close();

    bool IsConnected() const;
    pid_t Pid() const;
    const std::string& ServerName() const;

    //==========================================================================================================
    // SendRequest
    // Purpose: Assigns a fresh correlation id, writes the request as one line, and registers it as pending.
    // Args:
    //   request: Request to send; its id is overwritten.
    //   timeout: Optional deadline override for this call.
    // Returns:
    //   Future resolving with the child's response, or with a local error response
    //   (RequestTimeout, TransportClosed) tagged with data.origin.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Writes a notification line; dropped with a debug log when disconnected.
    void SendNotification(std::unique_ptr<JSONRPCNotification> notification);

    void SetNotificationHandler(NotificationHandler handler);
    void SetRequestHandler(RequestHandler handler);
    void SetStderrHandler(StderrHandler handler);
    void SetCloseHandler(CloseHandler handler);

    // Counters for diagnostics and tests.
    std::uint64_t RequestsSent() const;
    std::size_t PendingCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpbridge

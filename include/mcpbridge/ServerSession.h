//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSession.h
// Purpose: Lifecycle, handshake and tool cache of one supervised MCP server process
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpbridge/Protocol.h"
#include "mcpbridge/ProcessTransport.hpp"
#include "mcpbridge/ServerDefinition.h"
#include "mcpbridge/async/Task.h"

namespace mcpbridge {

enum class ServerStatus {
    Starting,
    Running,
    Failed,
    Stopped
};

const char* serverStatusName(ServerStatus status);

//==========================================================================================================
// ServerStatusInfo
// Purpose: Read-only snapshot of a session, safe to hand across threads.
// Fields:
//   toolCount: Number of cached tools; only meaningful while Running.
//   lastError: Diagnostic of the most recent failure.
//   pid: Process id while a process is attached.
//   uptime: Time since the session reached Running.
//   serverInfo: name/version reported by the child in its initialize result.
//==========================================================================================================
struct ServerStatusInfo {
    std::string name;
    ServerStatus status{ServerStatus::Stopped};
    std::size_t toolCount{0};
    std::optional<std::string> lastError;
    std::optional<pid_t> pid;
    std::optional<std::chrono::milliseconds> uptime;
    std::optional<Implementation> serverInfo;
    std::uint64_t requestsSent{0};

    JSONValue ToJSON() const;
};

//==========================================================================================================
// SessionOptions
// Fields:
//   handshakeTimeout: Bound on the initialize round-trip.
//   requestTimeout: Default deadline for tools/list, tools/call and forwarded requests.
//   terminateGrace: SIGTERM to SIGKILL delay when the process is stopped.
//   logTailLines: Number of stderr lines retained for GetServerLogs.
//   clientInfo: Implementation advertised in initialize.
//==========================================================================================================
struct SessionOptions {
    std::chrono::milliseconds handshakeTimeout{30000};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds terminateGrace{2000};
    std::size_t logTailLines{1000};
    Implementation clientInfo{"mcp-bridge", "0.0.0"};
};

//==========================================================================================================
// ServerSession
// Purpose: Owns one child process from spawn to termination.
// Notes:
//   Status and the tool cache are written only by the session's own transitions.
//   Tool calls are not serialized: concurrent calls interleave on the transport.
//==========================================================================================================
class ServerSession : public std::enable_shared_from_this<ServerSession> {
public:
    using NotificationSink = std::function<void(const std::string& server, const JSONRPCNotification&)>;

    static std::shared_ptr<ServerSession> Create(ServerDefinition definition, SessionOptions options = {});
    ~ServerSession();

    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Spawn, initialize handshake, notifications/initialized, tools/list (all pages), Running.
    // Returns:
    //   Future with the Running snapshot.
    // Errors (through the future, as errors::BridgeError):
    //   SpawnError, HandshakeError, DiscoveryError. The process is killed and status becomes Failed
    //   unless the session was stopped meanwhile, in which case it stays Stopped.
    //==========================================================================================================
    std::future<ServerStatusInfo> Start();

    // Cached tool descriptors. Throws errors::BridgeError(NotRunning) unless Running.
    std::vector<Tool> ListTools() const;

    //==========================================================================================================
    // CallTool
    // Purpose: tools/call on the child; the result payload is returned verbatim.
    // Errors (through the future):
    //   NotRunning, ToolNotFound (no process I/O), Timeout (session stays Running),
    //   TransportClosed (child exited), UpstreamError (child error object in data()).
    //==========================================================================================================
    std::future<JSONValue> CallTool(const std::string& toolName, const JSONValue& arguments,
                                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    //==========================================================================================================
    // ForwardRequest
    // Purpose: Relays an arbitrary JSON-RPC request; the reply carries the caller's original id.
    //          Child error responses are returned as-is; bridge timeouts/closures raise errors.
    //==========================================================================================================
    std::future<JSONValue> ForwardRequest(const JSONRPCRequest& request);

    // Relays a JSON-RPC notification. Throws errors::BridgeError(NotRunning) unless Running.
    void ForwardNotification(const JSONRPCNotification& notification);

    // MCP ping round-trip.
    std::future<void> Ping();

    // Terminates the process and marks the session Stopped. Idempotent.
    void Stop();

    // Waits for start/call/forward/ping coroutines to finish. False if some are still running after `limit`.
    bool WaitForTasks(std::chrono::milliseconds limit) const;

    ServerStatus Status() const;
    ServerStatusInfo Snapshot() const;
    const ServerDefinition& Definition() const { return definition; }
    const std::string& Name() const { return definition.name; }

    // Up to `lines` most recent stderr lines, oldest first.
    std::vector<std::string> RecentLogs(std::size_t lines) const;

    // Receives every notification from the child. Set before Start().
    void SetNotificationSink(NotificationSink sink);

private:
    ServerSession(ServerDefinition definition, SessionOptions options);

    async::Task<ServerStatusInfo> coStart();
    async::Task<JSONValue> coCallTool(std::string toolName, JSONValue arguments,
                                      std::optional<std::chrono::milliseconds> timeout);
    async::Task<JSONValue> coForwardRequest(JSONRPCRequest request);
    async::Task<void> coPing();

    void wireTransport(const std::shared_ptr<ProcessTransport>& transport);
    void failStart(const std::shared_ptr<ProcessTransport>& transport, const std::string& message);
    void onTransportClosed(const ProcessTransport* transport, const std::string& reason);
    void onNotification(const JSONRPCNotification& notification);
    std::unique_ptr<JSONRPCResponse> onServerRequest(const JSONRPCRequest& request);
    void appendLog(const std::string& line);
    std::shared_ptr<ProcessTransport> runningTransport(const char* operation) const;
    ServerStatusInfo snapshotLocked() const;

    const ServerDefinition definition;
    const SessionOptions options;

    mutable std::mutex stateMutex;
    bool startRequested{false};
    ServerStatus status{ServerStatus::Starting};
    std::shared_ptr<ProcessTransport> transport;
    std::vector<Tool> tools;
    std::optional<std::string> lastError;
    std::optional<pid_t> pid;
    std::optional<std::chrono::steady_clock::time_point> runningSince;
    std::optional<Implementation> serverInfo;
    std::uint64_t requestsBeforeStop{0};

    mutable std::mutex logMutex;
    std::deque<std::string> logTail;

    NotificationSink notificationSink;
    const std::shared_ptr<async::TaskCounter> inFlight{std::make_shared<async::TaskCounter>()};
};

} // namespace mcpbridge

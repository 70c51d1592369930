//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BridgeRegistry.h
// Purpose: Name-keyed collection of server sessions with start/stop deduplication
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpbridge/ServerDefinition.h"
#include "mcpbridge/ServerSession.h"

namespace mcpbridge {

// Tool of one Running server as exposed in the aggregated catalog ("server__tool").
struct QualifiedTool {
    std::string id;
    std::string server;
    Tool tool;

    JSONValue ToJSON() const;
};

//==========================================================================================================
// BridgeRegistry
// Purpose: Process-wide front door for managing and calling MCP tool servers.
// Notes:
//   For a given name at most one session is Starting or Running. Bookkeeping is done under a per-name
//   lock that is never held across process I/O.
//   All errors are errors::BridgeError, delivered through the returned futures where there is one.
//==========================================================================================================
class BridgeRegistry {
public:
    using NotificationSink = ServerSession::NotificationSink;

    explicit BridgeRegistry(SessionOptions sessionOptions = {});
    ~BridgeRegistry();

    BridgeRegistry(const BridgeRegistry&) = delete;
    BridgeRegistry& operator=(const BridgeRegistry&) = delete;

    //==========================================================================================================
    // StartServer
    // Purpose: Starts (or joins the start of) the named server.
    // Args:
    //   name: Registry key; must equal definition.name.
    //   definition: Launch parameters, copied into the new session.
    // Returns:
    //   Running: an already satisfied future with the current snapshot.
    //   Starting: the in-flight start's future (shared by all concurrent callers).
    //   Otherwise: the future of a fresh session's start, replacing the Failed/Stopped one.
    // Throws:
    //   errors::BridgeError(InvalidArgument) synchronously for a name mismatch or invalid definition.
    //==========================================================================================================
    std::shared_future<ServerStatusInfo> StartServer(const std::string& name, const ServerDefinition& definition);

    // Stops the named session; the entry remains with status Stopped. Throws NotFound.
    void StopServer(const std::string& name);

    // Snapshots; never wait on process I/O. GetStatus throws NotFound.
    ServerStatusInfo GetStatus(const std::string& name) const;
    std::vector<ServerStatusInfo> ListStatuses() const;

    // Cached tools of a Running server. Throws NotFound or NotRunning.
    std::vector<Tool> ListTools(const std::string& name) const;

    // tools/call on the named server. NotFound is raised synchronously; session errors through the future.
    std::future<JSONValue> ExecuteTool(const std::string& name, const std::string& tool, const JSONValue& arguments,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Relays a caller-built JSON-RPC request; the reply keeps the caller's id.
    std::future<JSONValue> ForwardRawRequest(const std::string& name, const JSONRPCRequest& request);

    // Relays a caller-built JSON-RPC notification.
    void ForwardRawNotification(const std::string& name, const JSONRPCNotification& notification);

    std::future<void> Ping(const std::string& name);

    // Every Running server's tools, ordered by server name then advertisement order.
    std::vector<QualifiedTool> ListAllTools() const;

    //==========================================================================================================
    // ExecuteQualifiedTool
    // Purpose: Executes "server__tool"; the id is split at the first "__".
    // Throws:
    //   errors::BridgeError(InvalidArgument) when the id has no separator or an empty half.
    //==========================================================================================================
    std::future<JSONValue> ExecuteQualifiedTool(const std::string& qualifiedId, const JSONValue& arguments);

    // Most recent stderr lines of the named server (oldest first). Throws NotFound.
    std::vector<std::string> GetServerLogs(const std::string& name, std::size_t lines) const;

    // Definition the named session was started with. Throws NotFound.
    ServerDefinition GetDefinition(const std::string& name) const;

    bool Contains(const std::string& name) const;
    std::size_t Size() const;

    // Receives notifications from every session created after the call.
    void SetNotificationSink(NotificationSink sink);

    // Stops all sessions concurrently and waits for them. Runs from the destructor too.
    void ShutdownAll();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpbridge

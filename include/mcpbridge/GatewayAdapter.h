//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayAdapter.h
// Purpose: Maps gateway routes and UI commands onto registry operations and errors onto HTTP statuses
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "mcpbridge/BridgeRegistry.h"
#include "mcpbridge/DefinitionSource.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

// Result of one dispatched route. An empty body is sent as a bodiless response.
struct GatewayResponse {
    int status{200};
    std::optional<JSONValue> body;
};

//==========================================================================================================
// GatewayAdapter
// Purpose: Thin validation and translation layer in front of a BridgeRegistry.
// Notes:
//   The typed helpers throw errors::BridgeError; Dispatch() turns every error into a JSON error body
//   { "error": { kind, message, server?, data? } } with the status from HttpStatusFor().
//   The adapter does not own the registry or the definition source.
//==========================================================================================================
class GatewayAdapter {
public:
    GatewayAdapter(BridgeRegistry& registry, const IDefinitionSource* definitions = nullptr);

    //==========================================================================================================
    // Dispatch
    // Purpose: Routes one request.
    // Args:
    //   method: HTTP verb ("GET", "POST").
    //   target: Request target including an optional query string ("/servers/a/logs?lines=20").
    //   body: Raw request body (JSON or empty).
    // Returns:
    //   Status and JSON body. Never throws for request-level problems.
    //==========================================================================================================
    GatewayResponse Dispatch(const std::string& method, const std::string& target, const std::string& body);

    JSONValue Health() const;
    JSONValue ListServers() const;
    JSONValue GetServer(const std::string& name) const;

    // Start and restart take `definition` if given, else the source's current definition, else the one
    // the registry last ran under that name.
    JSONValue StartServer(const std::string& name, const std::optional<ServerDefinition>& definition = std::nullopt);
    JSONValue StopServer(const std::string& name);
    JSONValue RestartServer(const std::string& name, const std::optional<ServerDefinition>& definition = std::nullopt);

    JSONValue ListTools(const std::string& name) const;
    JSONValue CallTool(const std::string& name, const std::string& tool, const JSONValue& arguments);
    JSONValue GetLogs(const std::string& name, std::size_t lines) const;
    JSONValue Ping(const std::string& name);
    JSONValue ListAllTools() const;
    JSONValue CallQualifiedTool(const std::string& qualifiedId, const JSONValue& arguments);

    // JSON-RPC passthrough. Returns std::nullopt for notifications.
    std::optional<JSONValue> Proxy(const std::string& name, const JSONValue& message);

    static int HttpStatusFor(errors::ErrorKind kind);
    static GatewayResponse ErrorResponse(const errors::BridgeError& error);

    static constexpr std::size_t DefaultLogLines = 100;

private:
    ServerDefinition resolveDefinition(const std::string& name, const std::optional<ServerDefinition>& given) const;

    BridgeRegistry& registry;
    const IDefinitionSource* definitions;
};

} // namespace mcpbridge

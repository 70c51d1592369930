//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol structures and constants needed to supervise and call tool servers
//==========================================================================================================

#pragma once

#include "mcpbridge/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace mcpbridge {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol revision offered in initialize
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

// Separator between server and tool name in aggregated tool ids ("server__tool")
constexpr const char* TOOL_ID_SEPARATOR = "__";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor as advertised by tools/list
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters
    std::optional<JSONValue> meta; // carried as _meta

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{},
         std::optional<JSONValue> metaValue = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), meta(std::move(metaValue)) {}
};

// One page of a tools/list result
struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

//==========================================================================================================
// ParseToolsListResult
// Purpose: Reads { tools: [...], nextCursor? } from a tools/list result.
// Throws:
//   std::runtime_error when the result is not an object with a tools array or a tool lacks a name.
//==========================================================================================================
ToolsListResult ParseToolsListResult(const JSONValue& result);

// Serializes a tool descriptor back to its wire shape (name, description, inputSchema, _meta?).
JSONValue ToolToJSON(const Tool& tool);

// Builds the initialize params advertised to child servers.
JSONValue MakeInitializeParams(const Implementation& clientInfo);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Bridge to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";

    // Server to bridge
    constexpr const char* ListRoots = "roots/list";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
}

} // namespace mcpbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDefinition.h
// Purpose: Launch description of one MCP tool server (name, command, args, env)
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <vector>

#include "mcpbridge/JSONRPCTypes.h"

namespace mcpbridge {

//==========================================================================================================
// ServerDefinition
// Purpose: Immutable launch parameters supplied by the caller when a server is started.
// Fields:
//   name: Unique, stable registry key.
//   command: Executable path, or a name resolved through PATH.
//   args: Ordered argument vector (argv[1..]).
//   env: Variables overlaid on the bridge's own environment for the child.
//   transport: Only "stdio" is supported.
//==========================================================================================================
struct ServerDefinition {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string transport{"stdio"};

    // Throws errors::BridgeError(InvalidArgument) naming the first offending field.
    void Validate() const;

    JSONValue ToJSON() const;

    //==========================================================================================================
    // FromJSON
    // Purpose: Reads { name?, command, args?, env?, transport? }.
    // Args:
    //   value: Definition object.
    //   fallbackName: Used when the object carries no name (e.g. the mcpServers map layout).
    // Throws:
    //   errors::BridgeError(InvalidArgument) on a wrong shape.
    //==========================================================================================================
    static ServerDefinition FromJSON(const JSONValue& value, const std::string& fallbackName = {});
};

} // namespace mcpbridge

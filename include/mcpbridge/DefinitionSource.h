//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DefinitionSource.h
// Purpose: Read-only sources of server definitions (in-memory, JSON file)
//==========================================================================================================

#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcpbridge/ServerDefinition.h"

namespace mcpbridge {

//==========================================================================================================
// IDefinitionSource
// Purpose: Boundary to wherever server definitions are stored. The bridge only reads through it.
//==========================================================================================================
class IDefinitionSource {
public:
    virtual ~IDefinitionSource() = default;
    virtual std::vector<ServerDefinition> ListDefinitions() const = 0;
    virtual std::optional<ServerDefinition> GetDefinition(const std::string& name) const = 0;
};

// Definitions held in memory, in insertion order.
class InMemoryDefinitionSource : public IDefinitionSource {
public:
    InMemoryDefinitionSource() = default;
    explicit InMemoryDefinitionSource(std::vector<ServerDefinition> definitions);

    // Adds or replaces the definition with the same name. Throws errors::BridgeError(InvalidArgument).
    void Put(ServerDefinition definition);

    std::vector<ServerDefinition> ListDefinitions() const override;
    std::optional<ServerDefinition> GetDefinition(const std::string& name) const override;

private:
    mutable std::mutex mutex;
    std::vector<ServerDefinition> definitions;
};

//==========================================================================================================
// JsonFileDefinitionSource
// Purpose: Reads definitions from a JSON document on every call, so edits show up without a restart.
// Formats:
//   { "servers": [ { "name", "command", "args", "env", "transport" }, ... ] }
//   { "mcpServers": { "<name>": { "command", "args", "env" }, ... } }
// Throws:
//   errors::BridgeError(InvalidArgument) when the file cannot be read or has neither layout.
//==========================================================================================================
class JsonFileDefinitionSource : public IDefinitionSource {
public:
    explicit JsonFileDefinitionSource(std::string path);

    std::vector<ServerDefinition> ListDefinitions() const override;
    std::optional<ServerDefinition> GetDefinition(const std::string& name) const override;

    const std::string& Path() const { return path; }

    // Parses document text in either layout; used by the file reader and by tests.
    static std::vector<ServerDefinition> ParseDocument(const std::string& text);

private:
    std::string path;
};

} // namespace mcpbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DefinitionSource.cpp
// Purpose: In-memory and JSON file definition sources
//==========================================================================================================

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

#include "logging/Logger.h"
#include "mcpbridge/DefinitionSource.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

InMemoryDefinitionSource::InMemoryDefinitionSource(std::vector<ServerDefinition> defs) {
    for (auto& def : defs) {
        Put(std::move(def));
    }
}

void InMemoryDefinitionSource::Put(ServerDefinition definition) {
    definition.Validate();
    std::lock_guard<std::mutex> lock(mutex);
    auto it = std::find_if(definitions.begin(), definitions.end(),
                           [&](const ServerDefinition& d) { return d.name == definition.name; });
    if (it != definitions.end()) {
        *it = std::move(definition);
    } else {
        definitions.push_back(std::move(definition));
    }
}

std::vector<ServerDefinition> InMemoryDefinitionSource::ListDefinitions() const {
    std::lock_guard<std::mutex> lock(mutex);
    return definitions;
}

std::optional<ServerDefinition> InMemoryDefinitionSource::GetDefinition(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& d : definitions) {
        if (d.name == name) {
            return d;
        }
    }
    return std::nullopt;
}

JsonFileDefinitionSource::JsonFileDefinitionSource(std::string p) : path(std::move(p)) {}

std::vector<ServerDefinition> JsonFileDefinitionSource::ParseDocument(const std::string& text) {
    JSONValue doc;
    try {
        doc = parseJSON(text);
    } catch (const std::runtime_error& e) {
        throw BridgeError(ErrorKind::InvalidArgument, std::string("invalid definitions document: ") + e.what());
    }

    std::vector<ServerDefinition> out;
    std::set<std::string> names;
    auto add = [&](ServerDefinition def) {
        def.Validate();
        if (!names.insert(def.name).second) {
            throw BridgeError(ErrorKind::InvalidArgument, "duplicate server definition '" + def.name + "'", def.name);
        }
        out.push_back(std::move(def));
    };

    if (const JSONValue* servers = findMember(doc, "servers")) {
        if (!servers->IsArray()) {
            throw BridgeError(ErrorKind::InvalidArgument, "'servers' must be an array");
        }
        for (const auto& entry : std::get<JSONValue::Array>(servers->value)) {
            if (!entry) {
                continue;
            }
            add(ServerDefinition::FromJSON(*entry));
        }
        return out;
    }
    if (const JSONValue* mcpServers = findMember(doc, "mcpServers")) {
        if (!mcpServers->IsObject()) {
            throw BridgeError(ErrorKind::InvalidArgument, "'mcpServers' must be an object");
        }
        // Object members are unordered; list them by name for a stable launch order
        std::vector<std::string> keys;
        const auto& obj = std::get<JSONValue::Object>(mcpServers->value);
        for (const auto& kv : obj) {
            keys.push_back(kv.first);
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& key : keys) {
            const auto& entry = obj.at(key);
            if (!entry) {
                continue;
            }
            auto def = ServerDefinition::FromJSON(*entry, key);
            def.name = key;
            add(std::move(def));
        }
        return out;
    }
    throw BridgeError(ErrorKind::InvalidArgument, "definitions document has neither 'servers' nor 'mcpServers'");
}

std::vector<ServerDefinition> JsonFileDefinitionSource::ListDefinitions() const {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw BridgeError(ErrorKind::InvalidArgument, "cannot open definitions file '" + path + "'");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    auto defs = ParseDocument(ss.str());
    LOG_DEBUG("Loaded {} server definition(s) from {}", defs.size(), path);
    return defs;
}

std::optional<ServerDefinition> JsonFileDefinitionSource::GetDefinition(const std::string& name) const {
    for (auto& d : ListDefinitions()) {
        if (d.name == name) {
            return std::move(d);
        }
    }
    return std::nullopt;
}

} // namespace mcpbridge

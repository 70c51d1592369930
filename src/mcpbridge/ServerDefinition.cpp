//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDefinition.cpp
// Purpose: Validation and JSON mapping for ServerDefinition
//==========================================================================================================

#include "mcpbridge/ServerDefinition.h"
#include "mcpbridge/Protocol.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

void ServerDefinition::Validate() const {
    if (name.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, "server definition has an empty name");
    }
    if (name.find(TOOL_ID_SEPARATOR) != std::string::npos) {
        throw BridgeError(ErrorKind::InvalidArgument, "server name must not contain '__'", name);
    }
    if (command.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, "server definition has an empty command", name);
    }
    if (transport != "stdio") {
        throw BridgeError(ErrorKind::InvalidArgument, "unsupported transport '" + transport + "'", name);
    }
    for (const auto& [key, value] : env) {
        if (key.empty() || key.find('=') != std::string::npos) {
            throw BridgeError(ErrorKind::InvalidArgument, "invalid environment variable name '" + key + "'", name);
        }
    }
}

JSONValue ServerDefinition::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["command"] = std::make_shared<JSONValue>(command);
    JSONValue::Array argv;
    for (const auto& a : args) {
        argv.push_back(std::make_shared<JSONValue>(a));
    }
    obj["args"] = std::make_shared<JSONValue>(std::move(argv));
    JSONValue::Object envObj;
    for (const auto& [key, value] : env) {
        envObj[key] = std::make_shared<JSONValue>(value);
    }
    obj["env"] = std::make_shared<JSONValue>(std::move(envObj));
    obj["transport"] = std::make_shared<JSONValue>(transport);
    return JSONValue(std::move(obj));
}

ServerDefinition ServerDefinition::FromJSON(const JSONValue& value, const std::string& fallbackName) {
    if (!value.IsObject()) {
        throw BridgeError(ErrorKind::InvalidArgument, "server definition must be a JSON object", fallbackName);
    }
    ServerDefinition def;
    def.name = getStringMember(value, "name").value_or(fallbackName);

    const JSONValue* command = findMember(value, "command");
    if (command == nullptr || !command->IsString()) {
        throw BridgeError(ErrorKind::InvalidArgument, "server definition requires a string 'command'", def.name);
    }
    def.command = std::get<std::string>(command->value);

    if (const JSONValue* args = findMember(value, "args")) {
        if (!args->IsArray()) {
            throw BridgeError(ErrorKind::InvalidArgument, "'args' must be an array of strings", def.name);
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->IsString()) {
                throw BridgeError(ErrorKind::InvalidArgument, "'args' must be an array of strings", def.name);
            }
            def.args.push_back(std::get<std::string>(a->value));
        }
    }

    if (const JSONValue* env = findMember(value, "env")) {
        if (!env->IsObject()) {
            throw BridgeError(ErrorKind::InvalidArgument, "'env' must be an object of strings", def.name);
        }
        for (const auto& [key, v] : std::get<JSONValue::Object>(env->value)) {
            if (!v || !v->IsString()) {
                throw BridgeError(ErrorKind::InvalidArgument, "env value for '" + key + "' must be a string", def.name);
            }
            def.env[key] = std::get<std::string>(v->value);
        }
    }

    if (auto transport = getStringMember(value, "transport")) {
        def.transport = *transport;
    }
    return def;
}

} // namespace mcpbridge

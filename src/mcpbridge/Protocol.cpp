//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: tools/list parsing and initialize parameter construction
//==========================================================================================================

#include <stdexcept>
#include "mcpbridge/Protocol.h"

namespace mcpbridge {

ToolsListResult ParseToolsListResult(const JSONValue& result) {
    const JSONValue* toolsVal = findMember(result, "tools");
    if (toolsVal == nullptr || !toolsVal->IsArray()) {
        throw std::runtime_error("tools/list result has no tools array");
    }
    ToolsListResult out;
    for (const auto& toolJson : std::get<JSONValue::Array>(toolsVal->value)) {
        if (!toolJson) {
            continue;
        }
        auto name = getStringMember(*toolJson, "name");
        if (!name.has_value() || name->empty()) {
            throw std::runtime_error("tools/list entry without a name");
        }
        Tool tool;
        tool.name = std::move(*name);
        tool.description = getStringMember(*toolJson, "description").value_or("");
        if (const JSONValue* schema = findMember(*toolJson, "inputSchema")) {
            tool.inputSchema = *schema;
        }
        if (const JSONValue* meta = findMember(*toolJson, "_meta")) {
            tool.meta = *meta;
        }
        out.tools.push_back(std::move(tool));
    }
    auto cursor = getStringMember(result, "nextCursor");
    if (cursor.has_value() && !cursor->empty()) {
        out.nextCursor = std::move(cursor);
    }
    return out;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    if (tool.inputSchema.IsNull()) {
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>("object");
        obj["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    } else {
        obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    }
    if (tool.meta.has_value()) {
        obj["_meta"] = std::make_shared<JSONValue>(tool.meta.value());
    }
    return JSONValue(std::move(obj));
}

JSONValue MakeInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object paramsObj;
    paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    JSONValue::Object caps;
    JSONValue::Object roots;
    roots["listChanged"] = std::make_shared<JSONValue>(false);
    caps["roots"] = std::make_shared<JSONValue>(std::move(roots));
    paramsObj["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
    JSONValue::Object ci;
    ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
    ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
    paramsObj["clientInfo"] = std::make_shared<JSONValue>(std::move(ci));
    return JSONValue(std::move(paramsObj));
}

} // namespace mcpbridge

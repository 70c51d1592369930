//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: BridgeError serialization and error object parsing
//==========================================================================================================

#include <cmath>
#include <limits>

#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {
namespace errors {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SpawnError: return "SpawnError";
        case ErrorKind::HandshakeError: return "HandshakeError";
        case ErrorKind::DiscoveryError: return "DiscoveryError";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::TransportClosed: return "TransportClosed";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::NotRunning: return "NotRunning";
        case ErrorKind::ToolNotFound: return "ToolNotFound";
        case ErrorKind::UpstreamError: return "UpstreamError";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

JSONValue BridgeError::ToJSON() const {
    JSONValue::Object obj;
    obj["kind"] = std::make_shared<JSONValue>(errorKindName(errorKind));
    obj["message"] = std::make_shared<JSONValue>(std::string(what()));
    if (!serverName.empty()) {
        obj["server"] = std::make_shared<JSONValue>(serverName);
    }
    if (payload.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(payload.value());
    }
    return JSONValue(std::move(obj));
}

std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = findMember(errVal, "code");
    auto message = getStringMember(errVal, "message");
    if (code == nullptr || !message.has_value()) {
        return std::nullopt;
    }
    McpError e;
    constexpr auto minCode = std::numeric_limits<int>::min();
    constexpr auto maxCode = std::numeric_limits<int>::max();
    if (std::holds_alternative<int64_t>(code->value)) {
        const int64_t v = std::get<int64_t>(code->value);
        if (v < minCode || v > maxCode) {
            return std::nullopt;
        }
        e.code = static_cast<int>(v);
    } else if (std::holds_alternative<double>(code->value)) {
        // A non-integral code, or one outside int, makes the object malformed
        const double v = std::get<double>(code->value);
        if (!std::isfinite(v) || v != std::trunc(v) || v < static_cast<double>(minCode) ||
            v > static_cast<double>(maxCode)) {
            return std::nullopt;
        }
        e.code = static_cast<int>(v);
    } else {
        return std::nullopt;
    }
    e.message = std::move(*message);
    if (const JSONValue* data = findMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

JSONValue makeLocalErrorValue(int code, const std::string& message) {
    JSONValue::Object data;
    data["origin"] = std::make_shared<JSONValue>(BRIDGE_ERROR_ORIGIN);
    return CreateErrorObject(code, message, JSONValue(std::move(data)));
}

BridgeError bridgeErrorFromResponse(const std::string& server, const JSONRPCResponse& response,
                                    ErrorKind upstreamKind) {
    auto err = mcpErrorFromResponse(response);
    if (!err.has_value()) {
        return BridgeError(upstreamKind, "malformed error object from " + server, server, response.error);
    }
    // Only errors the bridge synthesized carry the origin marker; a child may reuse the same codes.
    const bool local = err->data.has_value() && getStringMember(err->data.value(), "origin").value_or("") == BRIDGE_ERROR_ORIGIN;
    if (!local) {
        return BridgeError(upstreamKind, err->message, server, response.error);
    }
    switch (err->category) {
        case ErrorCategory::BridgeTimeout:
            return BridgeError(ErrorKind::Timeout, err->message, server);
        case ErrorCategory::BridgeTransportClosed:
            return BridgeError(ErrorKind::TransportClosed, err->message, server);
        default:
            return BridgeError(upstreamKind, err->message, server, response.error);
    }
}

} // namespace errors
} // namespace mcpbridge

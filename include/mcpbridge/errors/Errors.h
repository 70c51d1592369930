//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed bridge errors and JSON-RPC error object mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpbridge/JSONRPCTypes.h"

namespace mcpbridge {
namespace errors {

// Value of data.origin on error objects the bridge synthesizes itself (timeouts, closed transports).
constexpr const char* BRIDGE_ERROR_ORIGIN = "mcpbridge";

// Failure kinds surfaced by sessions, the registry and the gateway.
enum class ErrorKind {
    SpawnError,       // executable missing or not runnable
    HandshakeError,   // initialize failed, timed out, or the child died during it
    DiscoveryError,   // tools/list failed after a successful handshake
    Timeout,          // no response within the call deadline; session stays usable
    TransportClosed,  // child exited; every pending call on the session fails
    NotFound,         // unknown server name
    NotRunning,       // session exists but is not Running
    ToolNotFound,     // tool name absent from the cached tool list
    UpstreamError,    // child answered with a JSON-RPC error object
    InvalidArgument   // malformed caller input
};

// Stable wire name for an ErrorKind ("SpawnError", "Timeout", ...).
const char* errorKindName(ErrorKind kind);

//==========================================================================================================
// BridgeError
// Purpose: Exception carried through the futures returned by sessions and the registry.
// Fields:
//   kind(): Failure category.
//   server(): Server name the failure belongs to (empty when not tied to one server).
//   data(): Optional structured payload, e.g. the child's JSON-RPC error object for UpstreamError.
//==========================================================================================================
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorKind kind, const std::string& message, std::string server = {},
                std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), errorKind(kind), serverName(std::move(server)), payload(std::move(data)) {}

    ErrorKind kind() const noexcept { return errorKind; }
    const std::string& server() const noexcept { return serverName; }
    const std::optional<JSONValue>& data() const noexcept { return payload; }

    // { kind, message, server?, data? }
    JSONValue ToJSON() const;

private:
    ErrorKind errorKind;
    std::string serverName;
    std::optional<JSONValue> payload;
};

// Categorization of JSON-RPC error codes received from child servers.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    BridgeTimeout,
    BridgeTransportClosed,
    Unknown
};

// Typed view of a JSON-RPC error object.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::RequestTimeout: return ErrorCategory::BridgeTimeout;
        case JSONRPCErrorCodes::TransportClosed: return ErrorCategory::BridgeTransportClosed;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal);

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Error object for failures the bridge produces locally; tagged with data.origin.
JSONValue makeLocalErrorValue(int code, const std::string& message);

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

//==========================================================================================================
// bridgeErrorFromResponse
// Purpose: Maps an error response from a child call onto a BridgeError.
// Args:
//   server: Owning server name.
//   response: Response whose error member is set.
//   upstreamKind: Kind to use for errors the child itself produced (UpstreamError, HandshakeError, ...).
// Notes:
//   Bridge-generated timeouts and transport closures (data.origin == BRIDGE_ERROR_ORIGIN) keep their own
//   kinds regardless of upstreamKind.
//==========================================================================================================
BridgeError bridgeErrorFromResponse(const std::string& server, const JSONRPCResponse& response,
                                    ErrorKind upstreamKind);

} // namespace errors
} // namespace mcpbridge

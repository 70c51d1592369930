//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayAdapter.cpp
// Purpose: Gateway routing, request validation and error to status translation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>

#include "logging/Logger.h"
#include "mcpbridge/GatewayAdapter.h"
#include "mcpbridge/version.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::stringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '/')) {
        if (!item.empty()) {
            parts.push_back(percentDecode(item));
        }
    }
    return parts;
}

std::optional<std::string> queryParam(const std::string& query, const std::string& key) {
    std::stringstream ss(query);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        auto eq = kv.find('=');
        std::string k = (eq == std::string::npos) ? kv : kv.substr(0, eq);
        if (k == key) {
            return eq == std::string::npos ? std::string() : percentDecode(kv.substr(eq + 1));
        }
    }
    return std::nullopt;
}

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

JSONValue parseBody(const std::string& body) {
    try {
        return parseJSON(body);
    } catch (const std::runtime_error& e) {
        throw BridgeError(ErrorKind::InvalidArgument, std::string("request body is not valid JSON: ") + e.what());
    }
}

// Empty body means "no arguments".
JSONValue parseArguments(const std::string& body) {
    if (isBlank(body)) {
        return JSONValue(JSONValue::Object{});
    }
    JSONValue args = parseBody(body);
    if (!args.IsObject()) {
        throw BridgeError(ErrorKind::InvalidArgument, "tool arguments must be a JSON object");
    }
    return args;
}

std::optional<ServerDefinition> parseDefinitionBody(const std::string& name, const std::string& body) {
    if (isBlank(body)) {
        return std::nullopt;
    }
    return ServerDefinition::FromJSON(parseBody(body), name);
}

std::size_t parseLines(const std::optional<std::string>& raw) {
    if (!raw.has_value() || raw->empty()) {
        return GatewayAdapter::DefaultLogLines;
    }
    if (!std::all_of(raw->begin(), raw->end(), [](unsigned char c) { return std::isdigit(c) != 0; }) ||
        raw->size() > 9) {
        throw BridgeError(ErrorKind::InvalidArgument, "'lines' must be a non-negative integer");
    }
    return static_cast<std::size_t>(std::stoul(*raw));
}

void requireName(const std::string& value, const char* what) {
    if (value.empty()) {
        throw BridgeError(ErrorKind::InvalidArgument, std::string(what) + " must not be empty");
    }
}

JSONValue toolsToJSON(const std::vector<Tool>& tools) {
    JSONValue::Array arr;
    for (const auto& t : tools) {
        arr.push_back(std::make_shared<JSONValue>(ToolToJSON(t)));
    }
    JSONValue::Object obj;
    obj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue(std::move(obj));
}

GatewayResponse routeError(int status, const std::string& message) {
    JSONValue::Object err;
    const char* kind = "InvalidArgument";
    if (status == 404) {
        kind = "NotFound";
    } else if (status == 405) {
        kind = "MethodNotAllowed";
    } else if (status >= 500) {
        kind = "InternalError";
    }
    err["kind"] = std::make_shared<JSONValue>(kind);
    err["message"] = std::make_shared<JSONValue>(message);
    JSONValue::Object body;
    body["error"] = std::make_shared<JSONValue>(std::move(err));
    return GatewayResponse{status, JSONValue(std::move(body))};
}

} // namespace

GatewayAdapter::GatewayAdapter(BridgeRegistry& reg, const IDefinitionSource* defs)
    : registry(reg), definitions(defs) {}

int GatewayAdapter::HttpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidArgument: return 400;
        case ErrorKind::NotFound:
        case ErrorKind::ToolNotFound: return 404;
        case ErrorKind::NotRunning:
        case ErrorKind::TransportClosed: return 503;
        case ErrorKind::SpawnError:
        case ErrorKind::HandshakeError:
        case ErrorKind::DiscoveryError:
        case ErrorKind::UpstreamError: return 502;
        case ErrorKind::Timeout: return 504;
    }
    return 500;
}

GatewayResponse GatewayAdapter::ErrorResponse(const BridgeError& error) {
    JSONValue::Object body;
    body["error"] = std::make_shared<JSONValue>(error.ToJSON());
    return GatewayResponse{HttpStatusFor(error.kind()), JSONValue(std::move(body))};
}

JSONValue GatewayAdapter::Health() const {
    const auto statuses = registry.ListStatuses();
    const auto running = std::count_if(statuses.begin(), statuses.end(),
                                       [](const ServerStatusInfo& s) { return s.status == ServerStatus::Running; });
    JSONValue::Object obj;
    obj["status"] = std::make_shared<JSONValue>("ok");
    obj["version"] = std::make_shared<JSONValue>(getVersionString());
    obj["servers"] = std::make_shared<JSONValue>(static_cast<int64_t>(statuses.size()));
    obj["running"] = std::make_shared<JSONValue>(static_cast<int64_t>(running));
    return JSONValue(std::move(obj));
}

JSONValue GatewayAdapter::ListServers() const {
    JSONValue::Array arr;
    for (const auto& s : registry.ListStatuses()) {
        arr.push_back(std::make_shared<JSONValue>(s.ToJSON()));
    }
    JSONValue::Object obj;
    obj["servers"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue(std::move(obj));
}

JSONValue GatewayAdapter::GetServer(const std::string& name) const {
    requireName(name, "server name");
    return registry.GetStatus(name).ToJSON();
}

ServerDefinition GatewayAdapter::resolveDefinition(const std::string& name,
                                                   const std::optional<ServerDefinition>& given) const {
    if (given.has_value()) {
        return given.value();
    }
    if (definitions != nullptr) {
        if (auto def = definitions->GetDefinition(name)) {
            return std::move(def.value());
        }
    }
    if (registry.Contains(name)) {
        return registry.GetDefinition(name);
    }
    throw BridgeError(ErrorKind::NotFound, "no definition known for server '" + name + "'", name);
}

JSONValue GatewayAdapter::StartServer(const std::string& name, const std::optional<ServerDefinition>& definition) {
    requireName(name, "server name");
    const ServerDefinition def = resolveDefinition(name, definition);
    return registry.StartServer(name, def).get().ToJSON();
}

JSONValue GatewayAdapter::StopServer(const std::string& name) {
    requireName(name, "server name");
    registry.StopServer(name);
    return registry.GetStatus(name).ToJSON();
}

JSONValue GatewayAdapter::RestartServer(const std::string& name, const std::optional<ServerDefinition>& definition) {
    requireName(name, "server name");
    const ServerDefinition def = resolveDefinition(name, definition);
    if (registry.Contains(name)) {
        registry.StopServer(name);
    }
    return registry.StartServer(name, def).get().ToJSON();
}

JSONValue GatewayAdapter::ListTools(const std::string& name) const {
    requireName(name, "server name");
    return toolsToJSON(registry.ListTools(name));
}

JSONValue GatewayAdapter::CallTool(const std::string& name, const std::string& tool, const JSONValue& arguments) {
    requireName(name, "server name");
    requireName(tool, "tool name");
    if (!arguments.IsObject()) {
        throw BridgeError(ErrorKind::InvalidArgument, "tool arguments must be a JSON object", name);
    }
    return registry.ExecuteTool(name, tool, arguments).get();
}

JSONValue GatewayAdapter::GetLogs(const std::string& name, std::size_t lines) const {
    requireName(name, "server name");
    JSONValue::Array arr;
    for (auto& line : registry.GetServerLogs(name, lines)) {
        arr.push_back(std::make_shared<JSONValue>(std::move(line)));
    }
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["lines"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue(std::move(obj));
}

JSONValue GatewayAdapter::Ping(const std::string& name) {
    requireName(name, "server name");
    const auto started = std::chrono::steady_clock::now();
    registry.Ping(name).get();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["ok"] = std::make_shared<JSONValue>(true);
    obj["latencyMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(elapsed.count()));
    return JSONValue(std::move(obj));
}

JSONValue GatewayAdapter::ListAllTools() const {
    JSONValue::Array arr;
    for (const auto& q : registry.ListAllTools()) {
        arr.push_back(std::make_shared<JSONValue>(q.ToJSON()));
    }
    JSONValue::Object obj;
    obj["tools"] = std::make_shared<JSONValue>(std::move(arr));
    return JSONValue(std::move(obj));
}

JSONValue GatewayAdapter::CallQualifiedTool(const std::string& qualifiedId, const JSONValue& arguments) {
    requireName(qualifiedId, "tool id");
    if (!arguments.IsObject()) {
        throw BridgeError(ErrorKind::InvalidArgument, "tool arguments must be a JSON object");
    }
    return registry.ExecuteQualifiedTool(qualifiedId, arguments).get();
}

std::optional<JSONValue> GatewayAdapter::Proxy(const std::string& name, const JSONValue& message) {
    requireName(name, "server name");
    if (!message.IsObject() || findMember(message, "method") == nullptr) {
        throw BridgeError(ErrorKind::InvalidArgument, "proxy body must be a JSON-RPC request or notification", name);
    }
    if (findMember(message, "id") == nullptr) {
        JSONRPCNotification notification;
        if (!notification.FromJSONValue(message)) {
            throw BridgeError(ErrorKind::InvalidArgument, "malformed JSON-RPC notification", name);
        }
        registry.ForwardRawNotification(name, notification);
        return std::nullopt;
    }
    JSONRPCRequest request;
    if (!request.FromJSONValue(message)) {
        throw BridgeError(ErrorKind::InvalidArgument, "malformed JSON-RPC request", name);
    }
    return registry.ForwardRawRequest(name, request).get();
}

GatewayResponse GatewayAdapter::Dispatch(const std::string& method, const std::string& target, const std::string& body) {
    FUNC_SCOPE();
    std::string path = target;
    std::string query;
    if (auto q = target.find('?'); q != std::string::npos) {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }
    const auto parts = splitPath(path);
    const bool isGet = method == "GET";
    const bool isPost = method == "POST";
    LOG_DEBUG("gateway {} {}", method, target);

    try {
        const std::size_t n = parts.size();
        if (n == 1 && parts[0] == "health") {
            if (isGet) return GatewayResponse{200, Health()};
        } else if (n == 1 && parts[0] == "servers") {
            if (isGet) return GatewayResponse{200, ListServers()};
        } else if (n == 2 && parts[0] == "servers") {
            if (isGet) return GatewayResponse{200, GetServer(parts[1])};
        } else if (n == 3 && parts[0] == "servers") {
            const std::string& name = parts[1];
            const std::string& action = parts[2];
            if (action == "start" && isPost) {
                return GatewayResponse{200, StartServer(name, parseDefinitionBody(name, body))};
            }
            if (action == "stop" && isPost) {
                return GatewayResponse{200, StopServer(name)};
            }
            if (action == "restart" && isPost) {
                return GatewayResponse{200, RestartServer(name, parseDefinitionBody(name, body))};
            }
            if (action == "ping" && isPost) {
                return GatewayResponse{200, Ping(name)};
            }
            if (action == "tools" && isGet) {
                return GatewayResponse{200, ListTools(name)};
            }
            if (action == "logs" && isGet) {
                return GatewayResponse{200, GetLogs(name, parseLines(queryParam(query, "lines")))};
            }
            if (action != "start" && action != "stop" && action != "restart" && action != "ping" &&
                action != "tools" && action != "logs") {
                return routeError(404, "no route for " + path);
            }
        } else if (n == 4 && parts[0] == "servers" && parts[2] == "tools") {
            if (isPost) return GatewayResponse{200, CallTool(parts[1], parts[3], parseArguments(body))};
        } else if (n == 1 && parts[0] == "tools") {
            if (isGet) return GatewayResponse{200, ListAllTools()};
        } else if (n == 2 && parts[0] == "tools") {
            if (isPost) return GatewayResponse{200, CallQualifiedTool(parts[1], parseArguments(body))};
        } else if (n == 2 && parts[0] == "proxy") {
            if (isPost) {
                auto reply = Proxy(parts[1], parseBody(body));
                return reply.has_value() ? GatewayResponse{200, std::move(reply)} : GatewayResponse{202, std::nullopt};
            }
        } else {
            return routeError(404, "no route for " + path);
        }
        return routeError(405, "method " + method + " not allowed for " + path);
    } catch (const BridgeError& e) {
        LOG_DEBUG("gateway {} {} -> {}: {}", method, path, errors::errorKindName(e.kind()), e.what());
        return ErrorResponse(e);
    } catch (const std::exception& e) {
        LOG_ERROR("gateway {} {} failed: {}", method, path, e.what());
        return routeError(500, e.what());
    }
}

} // namespace mcpbridge

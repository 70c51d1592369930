//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerSession.cpp
// Purpose: Server session lifecycle (spawn, handshake, discovery, calls, stop)
//==========================================================================================================

#include <algorithm>
#include <unordered_set>

#include "logging/Logger.h"
#include "mcpbridge/ServerSession.h"
#include "mcpbridge/async/FutureAwaitable.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

namespace {

// Guards against servers that hand out cursors forever.
constexpr int MaxToolPages = 100;

std::unique_ptr<JSONRPCRequest> makeRequest(const char* method, std::optional<JSONValue> params = std::nullopt) {
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = method;
    req->params = std::move(params);
    return req;
}

std::optional<Implementation> parseImplementation(const JSONValue& initResult) {
    const JSONValue* info = findMember(initResult, "serverInfo");
    if (info == nullptr) {
        return std::nullopt;
    }
    return Implementation(getStringMember(*info, "name").value_or(""),
                          getStringMember(*info, "version").value_or(""));
}

std::string logPayloadText(const JSONValue& params) {
    const JSONValue* data = findMember(params, "data");
    if (data == nullptr) {
        return {};
    }
    if (data->IsString()) {
        return std::get<std::string>(data->value);
    }
    return serializeJSONValue(*data);
}

} // namespace

const char* serverStatusName(ServerStatus status) {
    switch (status) {
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Failed: return "failed";
        case ServerStatus::Stopped: return "stopped";
    }
    return "unknown";
}

JSONValue ServerStatusInfo::ToJSON() const {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(name);
    obj["status"] = std::make_shared<JSONValue>(serverStatusName(status));
    if (status == ServerStatus::Running) {
        obj["toolCount"] = std::make_shared<JSONValue>(static_cast<int64_t>(toolCount));
    }
    if (lastError.has_value()) {
        obj["lastError"] = std::make_shared<JSONValue>(lastError.value());
    }
    if (pid.has_value()) {
        obj["pid"] = std::make_shared<JSONValue>(static_cast<int64_t>(pid.value()));
    }
    if (uptime.has_value()) {
        obj["uptimeMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(uptime->count()));
    }
    if (serverInfo.has_value()) {
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(serverInfo->name);
        info["version"] = std::make_shared<JSONValue>(serverInfo->version);
        obj["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
    }
    obj["requestsSent"] = std::make_shared<JSONValue>(static_cast<int64_t>(requestsSent));
    return JSONValue(std::move(obj));
}

std::shared_ptr<ServerSession> ServerSession::Create(ServerDefinition definition, SessionOptions options) {
    return std::shared_ptr<ServerSession>(new ServerSession(std::move(definition), std::move(options)));
}

ServerSession::ServerSession(ServerDefinition def, SessionOptions opts)
    : definition(std::move(def)), options(std::move(opts)) {}

ServerSession::~ServerSession() {
    Stop();
}

void ServerSession::SetNotificationSink(NotificationSink sink) {
    notificationSink = std::move(sink);
}

std::future<ServerStatusInfo> ServerSession::Start() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (startRequested) {
            throw BridgeError(ErrorKind::InvalidArgument, "session for '" + definition.name + "' was already started",
                              definition.name);
        }
        startRequested = true;
    }
    return coStart().toFuture();
}

async::Task<ServerStatusInfo> ServerSession::coStart() {
    auto running = inFlight->Enter();
    auto self = shared_from_this();
    const std::string& name = definition.name;
    LOG_INFO("[{}] starting: {} ({} args)", name, definition.command, definition.args.size());

    std::shared_ptr<ProcessTransport> t;
    try {
        ProcessTransportOptions topts;
        topts.requestTimeout = options.requestTimeout;
        topts.terminateGrace = options.terminateGrace;
        t = ProcessTransport::Launch(definition, topts);
    } catch (const BridgeError& e) {
        failStart(nullptr, e.what());
        throw;
    }

    wireTransport(t);
    bool stoppedMeanwhile = false;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (status == ServerStatus::Stopped) {
            stoppedMeanwhile = true;
        } else {
            transport = t;
            pid = t->Pid();
        }
    }
    if (stoppedMeanwhile) {
        t->Close();
        throw BridgeError(ErrorKind::NotRunning, "server '" + name + "' was stopped while starting", name);
    }
    t->Start();

    // initialize handshake
    std::optional<Implementation> reportedInfo;
    try {
        auto resp = co_await async::makeFutureAwaitable(
            t->SendRequest(makeRequest(Methods::Initialize, MakeInitializeParams(options.clientInfo)),
                           options.handshakeTimeout));
        if (resp->IsError()) {
            auto cause = errors::bridgeErrorFromResponse(name, *resp, ErrorKind::HandshakeError);
            throw BridgeError(ErrorKind::HandshakeError, std::string("initialize failed: ") + cause.what(), name,
                              cause.data());
        }
        if (!resp->result.has_value() || !resp->result->IsObject()) {
            throw BridgeError(ErrorKind::HandshakeError, "initialize failed: result is not an object", name);
        }
        reportedInfo = parseImplementation(resp->result.value());
        auto negotiated = getStringMember(resp->result.value(), "protocolVersion");
        if (negotiated.has_value() && *negotiated != PROTOCOL_VERSION) {
            LOG_INFO("[{}] server negotiated protocol version {}", name, *negotiated);
        }
    } catch (const BridgeError& e) {
        failStart(t, e.what());
        throw;
    } catch (const std::exception& e) {
        failStart(t, std::string("initialize failed: ") + e.what());
        throw BridgeError(ErrorKind::HandshakeError, std::string("initialize failed: ") + e.what(), name);
    }

    t->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized));

    // tools/list, following nextCursor
    std::vector<Tool> discovered;
    try {
        std::unordered_set<std::string> seen;
        std::optional<std::string> cursor;
        for (int page = 0;; ++page) {
            if (page >= MaxToolPages) {
                throw BridgeError(ErrorKind::DiscoveryError, "tools/list returned more than " +
                                  std::to_string(MaxToolPages) + " pages", name);
            }
            JSONValue::Object params;
            if (cursor.has_value()) {
                params["cursor"] = std::make_shared<JSONValue>(cursor.value());
            }
            auto resp = co_await async::makeFutureAwaitable(
                t->SendRequest(makeRequest(Methods::ListTools, JSONValue(std::move(params)))));
            if (resp->IsError()) {
                auto cause = errors::bridgeErrorFromResponse(name, *resp, ErrorKind::DiscoveryError);
                throw BridgeError(ErrorKind::DiscoveryError, std::string("tools/list failed: ") + cause.what(), name,
                                  cause.data());
            }
            ToolsListResult pageResult;
            try {
                pageResult = ParseToolsListResult(resp->result.value_or(JSONValue{}));
            } catch (const std::runtime_error& e) {
                throw BridgeError(ErrorKind::DiscoveryError, std::string("tools/list failed: ") + e.what(), name);
            }
            for (auto& tool : pageResult.tools) {
                if (!seen.insert(tool.name).second) {
                    LOG_WARN("[{}] ignoring duplicate tool '{}'", name, tool.name);
                    continue;
                }
                discovered.push_back(std::move(tool));
            }
            if (!pageResult.nextCursor.has_value()) {
                break;
            }
            cursor = std::move(pageResult.nextCursor);
        }
    } catch (const BridgeError& e) {
        failStart(t, e.what());
        throw;
    } catch (const std::exception& e) {
        failStart(t, std::string("tools/list failed: ") + e.what());
        throw BridgeError(ErrorKind::DiscoveryError, std::string("tools/list failed: ") + e.what(), name);
    }

    ServerStatusInfo info;
    std::optional<std::string> lostReason;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (status != ServerStatus::Starting || transport != t) {
            lostReason = lastError.value_or("server '" + name + "' was stopped while starting");
        } else {
            tools = std::move(discovered);
            serverInfo = std::move(reportedInfo);
            status = ServerStatus::Running;
            lastError.reset();
            runningSince = std::chrono::steady_clock::now();
            info = snapshotLocked();
        }
    }
    if (lostReason.has_value()) {
        failStart(t, lostReason.value());
        throw BridgeError(ErrorKind::HandshakeError, lostReason.value(), name);
    }
    LOG_INFO("[{}] running (pid={}, {} tools)", name, static_cast<long>(t->Pid()), info.toolCount);
    co_return info;
}

void ServerSession::wireTransport(const std::shared_ptr<ProcessTransport>& t) {
    std::weak_ptr<ServerSession> weak = weak_from_this();
    const ProcessTransport* raw = t.get();
    t->SetCloseHandler([weak, raw](const std::string& reason) {
        if (auto s = weak.lock()) {
            s->onTransportClosed(raw, reason);
        }
    });
    t->SetNotificationHandler([weak](std::unique_ptr<JSONRPCNotification> n) {
        if (auto s = weak.lock()) {
            s->onNotification(*n);
        }
    });
    t->SetRequestHandler([weak](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        if (auto s = weak.lock()) {
            return s->onServerRequest(req);
        }
        return nullptr;
    });
    t->SetStderrHandler([weak](const std::string& line) {
        if (auto s = weak.lock()) {
            s->appendLog(line);
        }
    });
}

void ServerSession::failStart(const std::shared_ptr<ProcessTransport>& t, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (status != ServerStatus::Stopped) {
            status = ServerStatus::Failed;
            lastError = message;
        }
        if (t && transport == t) {
            requestsBeforeStop = t->RequestsSent();
            transport.reset();
        }
        pid.reset();
        runningSince.reset();
        tools.clear();
    }
    if (t) {
        t->Close();
    }
    LOG_ERROR("[{}] start failed: {}", definition.name, message);
}

void ServerSession::onTransportClosed(const ProcessTransport* t, const std::string& reason) {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (transport.get() != t) {
        return;
    }
    if (status == ServerStatus::Starting || status == ServerStatus::Running) {
        LOG_ERROR("[{}] server exited unexpectedly: {}", definition.name, reason);
        status = ServerStatus::Failed;
        lastError = reason;
        pid.reset();
        runningSince.reset();
        tools.clear();
    }
}

void ServerSession::onNotification(const JSONRPCNotification& notification) {
    if (notification.method == Methods::Log && notification.params.has_value()) {
        const JSONValue& params = notification.params.value();
        const std::string level = getStringMember(params, "level").value_or("info");
        const std::string logger = getStringMember(params, "logger").value_or("");
        const std::string text = logPayloadText(params);
        const std::string& name = definition.name;
        if (level == "debug") {
            LOG_DEBUG("[{}] {}{}", name, logger.empty() ? "" : logger + ": ", text);
        } else if (level == "info" || level == "notice") {
            LOG_INFO("[{}] {}{}", name, logger.empty() ? "" : logger + ": ", text);
        } else if (level == "warning") {
            LOG_WARN("[{}] {}{}", name, logger.empty() ? "" : logger + ": ", text);
        } else {
            LOG_ERROR("[{}] {}{}", name, logger.empty() ? "" : logger + ": ", text);
        }
    } else {
        LOG_DEBUG("[{}] notification {}", definition.name, notification.method);
    }
    if (notificationSink) {
        notificationSink(definition.name, notification);
    }
}

std::unique_ptr<JSONRPCResponse> ServerSession::onServerRequest(const JSONRPCRequest& request) {
    if (request.method == Methods::Ping) {
        return std::make_unique<JSONRPCResponse>(request.id, JSONValue(JSONValue::Object{}));
    }
    if (request.method == Methods::ListRoots) {
        JSONValue::Object result;
        result["roots"] = std::make_shared<JSONValue>(JSONValue::Array{});
        return std::make_unique<JSONRPCResponse>(request.id, JSONValue(std::move(result)));
    }
    LOG_DEBUG("[{}] unsupported server request {}", definition.name, request.method);
    return nullptr;
}

void ServerSession::appendLog(const std::string& line) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (options.logTailLines == 0) {
        return;
    }
    logTail.push_back(line);
    while (logTail.size() > options.logTailLines) {
        logTail.pop_front();
    }
}

std::vector<std::string> ServerSession::RecentLogs(std::size_t lines) const {
    std::lock_guard<std::mutex> lock(logMutex);
    const std::size_t n = std::min(lines, logTail.size());
    return std::vector<std::string>(logTail.end() - static_cast<std::ptrdiff_t>(n), logTail.end());
}

std::shared_ptr<ProcessTransport> ServerSession::runningTransport(const char* operation) const {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (status != ServerStatus::Running || !transport) {
        throw BridgeError(ErrorKind::NotRunning,
                          fmt::format("cannot {}: server '{}' is {}", operation, definition.name,
                                      serverStatusName(status)),
                          definition.name);
    }
    return transport;
}

std::vector<Tool> ServerSession::ListTools() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    if (status != ServerStatus::Running) {
        throw BridgeError(ErrorKind::NotRunning,
                          fmt::format("cannot list tools: server '{}' is {}", definition.name,
                                      serverStatusName(status)),
                          definition.name);
    }
    return tools;
}

std::future<JSONValue> ServerSession::CallTool(const std::string& toolName, const JSONValue& arguments,
                                               std::optional<std::chrono::milliseconds> timeout) {
    return coCallTool(toolName, arguments, timeout).toFuture();
}

async::Task<JSONValue> ServerSession::coCallTool(std::string toolName, JSONValue arguments,
                                                 std::optional<std::chrono::milliseconds> timeout) {
    auto running = inFlight->Enter();
    auto self = shared_from_this();
    std::shared_ptr<ProcessTransport> t = runningTransport("call tool");
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        const bool known = std::any_of(tools.begin(), tools.end(),
                                       [&](const Tool& tool) { return tool.name == toolName; });
        if (!known) {
            throw BridgeError(ErrorKind::ToolNotFound,
                              "tool '" + toolName + "' not found on server '" + definition.name + "'",
                              definition.name);
        }
    }

    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(toolName);
    params["arguments"] = std::make_shared<JSONValue>(arguments.IsNull() ? JSONValue(JSONValue::Object{})
                                                                         : std::move(arguments));
    auto resp = co_await async::makeFutureAwaitable(
        t->SendRequest(makeRequest(Methods::CallTool, JSONValue(std::move(params))),
                       timeout.value_or(options.requestTimeout)));
    if (resp->IsError()) {
        throw errors::bridgeErrorFromResponse(definition.name, *resp, ErrorKind::UpstreamError);
    }
    if (!resp->result.has_value()) {
        throw BridgeError(ErrorKind::UpstreamError, "tools/call response carries no result", definition.name);
    }
    co_return std::move(resp->result.value());
}

std::future<JSONValue> ServerSession::ForwardRequest(const JSONRPCRequest& request) {
    return coForwardRequest(request).toFuture();
}

async::Task<JSONValue> ServerSession::coForwardRequest(JSONRPCRequest request) {
    auto running = inFlight->Enter();
    auto self = shared_from_this();
    std::shared_ptr<ProcessTransport> t = runningTransport("forward request");
    // The wire id is the transport's own; the caller's id is restored on the reply
    auto resp = co_await async::makeFutureAwaitable(
        t->SendRequest(makeRequest(request.method.c_str(), request.params), options.requestTimeout));
    if (resp->IsError()) {
        auto err = errors::bridgeErrorFromResponse(definition.name, *resp, ErrorKind::UpstreamError);
        if (err.kind() == ErrorKind::Timeout || err.kind() == ErrorKind::TransportClosed) {
            throw err;
        }
    }
    resp->id = request.id;
    co_return resp->ToJSONValue();
}

void ServerSession::ForwardNotification(const JSONRPCNotification& notification) {
    auto t = runningTransport("forward notification");
    t->SendNotification(std::make_unique<JSONRPCNotification>(notification.method, notification.params));
}

std::future<void> ServerSession::Ping() {
    return coPing().toFuture();
}

async::Task<void> ServerSession::coPing() {
    auto running = inFlight->Enter();
    auto self = shared_from_this();
    std::shared_ptr<ProcessTransport> t = runningTransport("ping");
    auto resp = co_await async::makeFutureAwaitable(t->SendRequest(makeRequest(Methods::Ping), options.requestTimeout));
    if (resp->IsError()) {
        throw errors::bridgeErrorFromResponse(definition.name, *resp, ErrorKind::UpstreamError);
    }
}

void ServerSession::Stop() {
    std::shared_ptr<ProcessTransport> t;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (status == ServerStatus::Stopped && !transport) {
            return;
        }
        t = std::move(transport);
        transport.reset();
        if (t) {
            requestsBeforeStop = t->RequestsSent();
        }
        status = ServerStatus::Stopped;
        pid.reset();
        runningSince.reset();
        tools.clear();
    }
    if (t) {
        t->Close();
        LOG_INFO("[{}] stopped", definition.name);
    }
}

bool ServerSession::WaitForTasks(std::chrono::milliseconds limit) const {
    return inFlight->WaitIdle(limit);
}

ServerStatus ServerSession::Status() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return status;
}

ServerStatusInfo ServerSession::Snapshot() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return snapshotLocked();
}

ServerStatusInfo ServerSession::snapshotLocked() const {
    ServerStatusInfo info;
    info.name = definition.name;
    info.status = status;
    info.toolCount = status == ServerStatus::Running ? tools.size() : 0;
    info.lastError = lastError;
    info.pid = pid;
    if (runningSince.has_value()) {
        info.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - runningSince.value());
    }
    info.serverInfo = serverInfo;
    info.requestsSent = transport ? transport->RequestsSent() : requestsBeforeStop;
    return info;
}

} // namespace mcpbridge

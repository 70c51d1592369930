//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BridgeRegistry.cpp
// Purpose: Session registry: start deduplication, lookups, aggregated tool catalog, shutdown
//==========================================================================================================

#include <map>
#include <mutex>

#include "logging/Logger.h"
#include "mcpbridge/BridgeRegistry.h"
#include "mcpbridge/async/FutureAwaitable.h"
#include "mcpbridge/async/Task.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

JSONValue QualifiedTool::ToJSON() const {
    JSONValue out = ToolToJSON(tool);
    auto& obj = std::get<JSONValue::Object>(out.value);
    obj["id"] = std::make_shared<JSONValue>(id);
    obj["server"] = std::make_shared<JSONValue>(server);
    return out;
}

class BridgeRegistry::Impl {
public:
    // One entry per server name. `mutex` guards the fields below it and is never held across I/O.
    struct Slot {
        std::mutex mutex;
        std::shared_ptr<ServerSession> session;
        std::optional<std::shared_future<ServerStatusInfo>> pendingStart;
    };

    SessionOptions sessionOptions;

    mutable std::mutex mapMutex;
    std::map<std::string, std::shared_ptr<Slot>> slots;

    std::mutex sinkMutex;
    NotificationSink notificationSink;

    explicit Impl(SessionOptions opts) : sessionOptions(std::move(opts)) {}

    std::shared_ptr<Slot> findSlot(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mapMutex);
        auto it = slots.find(name);
        return it == slots.end() ? nullptr : it->second;
    }

    std::shared_ptr<Slot> getOrCreateSlot(const std::string& name) {
        std::lock_guard<std::mutex> lock(mapMutex);
        auto& slot = slots[name];
        if (!slot) {
            slot = std::make_shared<Slot>();
        }
        return slot;
    }

    std::vector<std::shared_ptr<Slot>> allSlots() const {
        std::lock_guard<std::mutex> lock(mapMutex);
        std::vector<std::shared_ptr<Slot>> out;
        out.reserve(slots.size());
        for (const auto& kv : slots) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::shared_ptr<ServerSession> sessionFor(const std::string& name) const {
        auto slot = findSlot(name);
        std::shared_ptr<ServerSession> session;
        if (slot) {
            std::lock_guard<std::mutex> lock(slot->mutex);
            session = slot->session;
        }
        if (!session) {
            JSONValue::Object data;
            data["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::ServerNotFound));
            throw BridgeError(ErrorKind::NotFound, "server '" + name + "' not found", name, JSONValue(std::move(data)));
        }
        return session;
    }

    // Drives one session's start and publishes the outcome to every waiter of the shared future.
    static async::Task<void> runStart(std::shared_ptr<Slot> slot, std::shared_ptr<ServerSession> session,
                                      std::shared_ptr<std::promise<ServerStatusInfo>> promise) {
        std::exception_ptr failure;
        ServerStatusInfo info;
        try {
            info = co_await async::makeFutureAwaitable(session->Start());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->session == session) {
                slot->pendingStart.reset();
            }
        }
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value(std::move(info));
        }
    }
};

BridgeRegistry::BridgeRegistry(SessionOptions sessionOptions)
    : pImpl(std::make_unique<Impl>(std::move(sessionOptions))) {
    FUNC_SCOPE();
}

BridgeRegistry::~BridgeRegistry() {
    FUNC_SCOPE();
    ShutdownAll();
}

std::shared_future<ServerStatusInfo> BridgeRegistry::StartServer(const std::string& name,
                                                                  const ServerDefinition& definition) {
    FUNC_SCOPE();
    if (definition.name != name) {
        throw BridgeError(ErrorKind::InvalidArgument,
                          "definition name '" + definition.name + "' does not match '" + name + "'", name);
    }
    definition.Validate();

    auto slot = pImpl->getOrCreateSlot(name);
    std::shared_ptr<ServerSession> previous;
    std::shared_ptr<ServerSession> fresh;
    auto promise = std::make_shared<std::promise<ServerStatusInfo>>();
    std::shared_future<ServerStatusInfo> result;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->session) {
            const ServerStatus current = slot->session->Status();
            if (current == ServerStatus::Running) {
                LOG_DEBUG("[{}] already running", name);
                std::promise<ServerStatusInfo> ready;
                ready.set_value(slot->session->Snapshot());
                return ready.get_future().share();
            }
            if (current == ServerStatus::Starting && slot->pendingStart.has_value()) {
                LOG_DEBUG("[{}] start already in flight", name);
                return slot->pendingStart.value();
            }
        }
        previous = std::move(slot->session);
        fresh = ServerSession::Create(definition, pImpl->sessionOptions);
        {
            std::lock_guard<std::mutex> sinkLock(pImpl->sinkMutex);
            fresh->SetNotificationSink(pImpl->notificationSink);
        }
        slot->session = fresh;
        result = promise->get_future().share();
        slot->pendingStart = result;
    }

    if (previous) {
        previous->Stop();
    }
    (void)Impl::runStart(slot, fresh, promise);
    return result;
}

void BridgeRegistry::StopServer(const std::string& name) {
    FUNC_SCOPE();
    auto session = pImpl->sessionFor(name);
    session->Stop();
}

ServerStatusInfo BridgeRegistry::GetStatus(const std::string& name) const {
    return pImpl->sessionFor(name)->Snapshot();
}

std::vector<ServerStatusInfo> BridgeRegistry::ListStatuses() const {
    std::vector<ServerStatusInfo> out;
    for (const auto& slot : pImpl->allSlots()) {
        std::shared_ptr<ServerSession> session;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            session = slot->session;
        }
        if (session) {
            out.push_back(session->Snapshot());
        }
    }
    return out;
}

std::vector<Tool> BridgeRegistry::ListTools(const std::string& name) const {
    return pImpl->sessionFor(name)->ListTools();
}

std::future<JSONValue> BridgeRegistry::ExecuteTool(const std::string& name, const std::string& tool,
                                                   const JSONValue& arguments,
                                                   std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    return pImpl->sessionFor(name)->CallTool(tool, arguments, timeout);
}

std::future<JSONValue> BridgeRegistry::ForwardRawRequest(const std::string& name, const JSONRPCRequest& request) {
    FUNC_SCOPE();
    return pImpl->sessionFor(name)->ForwardRequest(request);
}

void BridgeRegistry::ForwardRawNotification(const std::string& name, const JSONRPCNotification& notification) {
    pImpl->sessionFor(name)->ForwardNotification(notification);
}

std::future<void> BridgeRegistry::Ping(const std::string& name) {
    return pImpl->sessionFor(name)->Ping();
}

std::vector<QualifiedTool> BridgeRegistry::ListAllTools() const {
    std::vector<QualifiedTool> out;
    for (const auto& slot : pImpl->allSlots()) {
        std::shared_ptr<ServerSession> session;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            session = slot->session;
        }
        if (!session || session->Status() != ServerStatus::Running) {
            continue;
        }
        std::vector<Tool> tools;
        try {
            tools = session->ListTools();
        } catch (const BridgeError& e) {
            // Lost a race with a stop or a crash; the server simply drops out of the catalog
            LOG_DEBUG("[{}] skipped in catalog: {}", session->Name(), e.what());
            continue;
        }
        for (auto& tool : tools) {
            QualifiedTool q;
            q.id = session->Name() + TOOL_ID_SEPARATOR + tool.name;
            q.server = session->Name();
            q.tool = std::move(tool);
            out.push_back(std::move(q));
        }
    }
    return out;
}

std::future<JSONValue> BridgeRegistry::ExecuteQualifiedTool(const std::string& qualifiedId, const JSONValue& arguments) {
    const std::string separator(TOOL_ID_SEPARATOR);
    const auto pos = qualifiedId.find(separator);
    if (pos == std::string::npos || pos == 0 || pos + separator.size() >= qualifiedId.size()) {
        throw BridgeError(ErrorKind::InvalidArgument,
                          "tool id '" + qualifiedId + "' is not of the form server" + separator + "tool");
    }
    return ExecuteTool(qualifiedId.substr(0, pos), qualifiedId.substr(pos + separator.size()), arguments);
}

std::vector<std::string> BridgeRegistry::GetServerLogs(const std::string& name, std::size_t lines) const {
    return pImpl->sessionFor(name)->RecentLogs(lines);
}

ServerDefinition BridgeRegistry::GetDefinition(const std::string& name) const {
    return pImpl->sessionFor(name)->Definition();
}

bool BridgeRegistry::Contains(const std::string& name) const {
    auto slot = pImpl->findSlot(name);
    if (!slot) {
        return false;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->session != nullptr;
}

std::size_t BridgeRegistry::Size() const {
    std::size_t n = 0;
    for (const auto& slot : pImpl->allSlots()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->session) {
            ++n;
        }
    }
    return n;
}

void BridgeRegistry::SetNotificationSink(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(pImpl->sinkMutex);
    pImpl->notificationSink = std::move(sink);
}

void BridgeRegistry::ShutdownAll() {
    FUNC_SCOPE();
    std::vector<std::shared_ptr<ServerSession>> sessions;
    std::vector<std::shared_future<ServerStatusInfo>> pending;
    for (const auto& slot : pImpl->allSlots()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->session) {
            sessions.push_back(slot->session);
        }
        if (slot->pendingStart.has_value()) {
            pending.push_back(slot->pendingStart.value());
        }
    }
    if (sessions.empty()) {
        return;
    }
    LOG_INFO("Shutting down {} server(s)", sessions.size());

    std::vector<std::future<void>> stops;
    stops.reserve(sessions.size());
    for (const auto& session : sessions) {
        stops.push_back(std::async(std::launch::async, [this, session]() {
            session->Stop();
            // Stopping failed every pending request, so the coroutines only have their tails left
            const auto limit = pImpl->sessionOptions.terminateGrace + std::chrono::seconds(1);
            if (!session->WaitForTasks(limit)) {
                LOG_WARN("[{}] coroutines still running {} ms after stop", session->Name(), limit.count());
            }
        }));
    }
    for (auto& f : stops) {
        try {
            f.get();
        } catch (const std::exception& e) {
            LOG_ERROR("Error while stopping a server: {}", e.what());
        }
    }
    // Interrupted starts resolve once their transport is closed
    for (auto& p : pending) {
        p.wait();
    }
}

} // namespace mcpbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StartupOrchestrator.cpp
// Purpose: Staggered startup tasks with cooperative cancellation
//==========================================================================================================

#include <condition_variable>
#include <future>
#include <mutex>

#include "logging/Logger.h"
#include "mcpbridge/StartupOrchestrator.h"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

const char* startupStateName(StartupState state) {
    switch (state) {
        case StartupState::Started: return "started";
        case StartupState::Failed: return "failed";
        case StartupState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::vector<std::string> StartupReport::Names(StartupState state) const {
    std::vector<std::string> out;
    for (const auto& o : outcomes) {
        if (o.state == state) {
            out.push_back(o.name);
        }
    }
    return out;
}

JSONValue StartupReport::ToJSON() const {
    JSONValue::Array arr;
    for (const auto& o : outcomes) {
        JSONValue::Object obj;
        obj["name"] = std::make_shared<JSONValue>(o.name);
        obj["state"] = std::make_shared<JSONValue>(startupStateName(o.state));
        if (!o.message.empty()) {
            obj["message"] = std::make_shared<JSONValue>(o.message);
        }
        obj["issuedAfterMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(o.issuedAfter.count()));
        arr.push_back(std::make_shared<JSONValue>(std::move(obj)));
    }
    return JSONValue(std::move(arr));
}

class StartupOrchestrator::Impl {
public:
    BridgeRegistry& registry;
    std::chrono::milliseconds stagger;

    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled{false};
    bool launched{false};
    std::vector<std::future<StartupOutcome>> tasks;
    std::optional<StartupReport> report;

    Impl(BridgeRegistry& reg, std::chrono::milliseconds delay) : registry(reg), stagger(delay) {}

    StartupOutcome runOne(ServerDefinition def, std::chrono::steady_clock::time_point origin,
                          std::chrono::milliseconds delay) {
        StartupOutcome outcome;
        outcome.name = def.name;
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (cv.wait_until(lock, origin + delay, [this] { return cancelled; })) {
                outcome.state = StartupState::Cancelled;
                LOG_DEBUG("[{}] launch cancelled", def.name);
                return outcome;
            }
        }
        outcome.issuedAfter = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - origin);
        try {
            auto info = registry.StartServer(def.name, def).get();
            outcome.state = StartupState::Started;
            LOG_INFO("[{}] started with {} tool(s)", def.name, info.toolCount);
        } catch (const errors::BridgeError& e) {
            outcome.state = StartupState::Failed;
            outcome.message = fmt::format("{}: {}", errors::errorKindName(e.kind()), e.what());
            LOG_WARN("[{}] startup failed: {}", def.name, outcome.message);
        } catch (const std::exception& e) {
            outcome.state = StartupState::Failed;
            outcome.message = e.what();
            LOG_WARN("[{}] startup failed: {}", def.name, outcome.message);
        }
        return outcome;
    }
};

StartupOrchestrator::StartupOrchestrator(BridgeRegistry& registry, std::chrono::milliseconds stagger)
    : pImpl(std::make_unique<Impl>(registry, stagger)) {}

StartupOrchestrator::~StartupOrchestrator() {
    Cancel();
    (void)Wait();
}

std::size_t StartupOrchestrator::Launch(const IDefinitionSource& source) {
    FUNC_SCOPE();
    auto definitions = source.ListDefinitions();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->launched) {
        throw errors::BridgeError(errors::ErrorKind::InvalidArgument, "startup already launched");
    }
    pImpl->launched = true;
    LOG_INFO("Launching {} server(s) with {} ms stagger", definitions.size(), pImpl->stagger.count());
    const auto origin = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        const std::chrono::milliseconds delay = pImpl->stagger * static_cast<std::chrono::milliseconds::rep>(i);
        pImpl->tasks.push_back(std::async(std::launch::async,
            [impl = pImpl.get(), def = std::move(definitions[i]), origin, delay]() mutable {
                return impl->runOne(std::move(def), origin, delay);
            }));
    }
    return pImpl->tasks.size();
}

StartupReport StartupOrchestrator::Wait() {
    std::vector<std::future<StartupOutcome>> pending;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->report.has_value() && pImpl->tasks.empty()) {
            return pImpl->report.value();
        }
        pending.swap(pImpl->tasks);
    }
    StartupReport report;
    for (auto& task : pending) {
        report.outcomes.push_back(task.get());
    }
    const auto started = report.Names(StartupState::Started).size();
    const auto failed = report.Names(StartupState::Failed).size();
    if (!report.outcomes.empty()) {
        LOG_INFO("Startup finished: {} started, {} failed, {} cancelled", started, failed,
                 report.outcomes.size() - started - failed);
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->report = report;
    return report;
}

void StartupOrchestrator::Cancel() {
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->cancelled = true;
    }
    pImpl->cv.notify_all();
}

} // namespace mcpbridge

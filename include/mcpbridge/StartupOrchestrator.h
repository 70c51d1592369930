//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StartupOrchestrator.h
// Purpose: Staggered, best-effort concurrent startup of every defined server
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "mcpbridge/BridgeRegistry.h"
#include "mcpbridge/DefinitionSource.h"

namespace mcpbridge {

enum class StartupState {
    Started,
    Failed,
    Cancelled
};

const char* startupStateName(StartupState state);

// Result of one definition's launch.
struct StartupOutcome {
    std::string name;
    StartupState state{StartupState::Cancelled};
    std::string message;
    // Delay between Launch() and the moment the start was issued.
    std::chrono::milliseconds issuedAfter{0};
};

struct StartupReport {
    std::vector<StartupOutcome> outcomes; // definition order

    std::vector<std::string> Names(StartupState state) const;
    JSONValue ToJSON() const;
};

//==========================================================================================================
// StartupOrchestrator
// Purpose: Issues one independent start per definition, the i-th delayed by i * stagger.
// Notes:
//   A failed start is logged and recorded; it never affects the other launches. There are no retries.
//   Cancel() (and the destructor) abort launches that have not been issued yet; starts already issued
//   keep running inside the registry.
//==========================================================================================================
class StartupOrchestrator {
public:
    StartupOrchestrator(BridgeRegistry& registry, std::chrono::milliseconds stagger = std::chrono::milliseconds(500));
    ~StartupOrchestrator();

    StartupOrchestrator(const StartupOrchestrator&) = delete;
    StartupOrchestrator& operator=(const StartupOrchestrator&) = delete;

    //==========================================================================================================
    // Launch
    // Purpose: Reads all definitions and schedules their starts. Returns without waiting.
    // Returns:
    //   Number of launches scheduled.
    // Throws:
    //   errors::BridgeError when the source cannot be read, or when called twice.
    //==========================================================================================================
    std::size_t Launch(const IDefinitionSource& source);

    // Blocks until every scheduled launch has finished or been cancelled.
    StartupReport Wait();

    void Cancel();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpbridge

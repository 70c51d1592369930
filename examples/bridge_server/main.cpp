//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: MCP bridge daemon: staggered startup of defined servers plus the HTTP gateway
//==========================================================================================================

#include <signal.h>
#include <iostream>
#include <memory>
#include <optional>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpbridge/BridgeConfig.h"
#include "mcpbridge/BridgeRegistry.h"
#include "mcpbridge/DefinitionSource.h"
#include "mcpbridge/GatewayAdapter.h"
#include "mcpbridge/GatewayHTTPServer.hpp"
#include "mcpbridge/StartupOrchestrator.h"
#include "mcpbridge/errors/Errors.h"
#include "mcpbridge/version.h"

using namespace mcpbridge;

//==========================================================================================================
// Blocks SIGINT/SIGTERM in every thread created afterwards so that only sigwait() observes them.
//==========================================================================================================
static sigset_t blockShutdownSignals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);
    return set;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? argv[i] : "";
        if (a == "--help" || a == "-h") {
            std::cout << BridgeConfig::Usage();
            return 0;
        }
        if (a == "--version") {
            std::cout << getVersionString() << std::endl;
            return 0;
        }
    }

    BridgeConfig config;
    try {
        config = BridgeConfig::Load(argc, argv);
    } catch (const errors::BridgeError& e) {
        std::cerr << e.what() << "\n" << BridgeConfig::Usage();
        return 2;
    }
    Logger::setLogLevelFromString(config.logLevel);
    Logger::setColorEnabled(config.logColor);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }
    LOG_INFO("mcp-bridge {} starting", getVersionString());

    const sigset_t shutdownSignals = blockShutdownSignals();

    std::unique_ptr<IDefinitionSource> definitions;
    if (!config.definitionsFile.empty()) {
        definitions = std::make_unique<JsonFileDefinitionSource>(config.definitionsFile);
    } else {
        definitions = std::make_unique<InMemoryDefinitionSource>();
    }

    BridgeRegistry registry(config.ToSessionOptions());
    GatewayAdapter gateway(registry, definitions.get());

    std::unique_ptr<GatewayHTTPServer> http;
    if (config.listen != "none") {
        try {
            auto opts = GatewayHTTPServer::ParseListenUri(config.listen);
            if (!config.tlsCert.empty()) opts.certFile = config.tlsCert;
            if (!config.tlsKey.empty()) opts.keyFile = config.tlsKey;
            opts.threads = config.ioThreads;
            http = std::make_unique<GatewayHTTPServer>(opts, [&gateway](const std::string& method,
                                                                         const std::string& target,
                                                                         const std::string& body) {
                return gateway.Dispatch(method, target, body);
            });
            http->Start().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Gateway could not start on {}: {}", config.listen, e.what());
            return 1;
        }
    }

    std::optional<StartupOrchestrator> startup;
    if (config.autostart) {
        startup.emplace(registry, config.stagger);
        try {
            startup->Launch(*definitions);
        } catch (const errors::BridgeError& e) {
            LOG_ERROR("Cannot read server definitions: {}", e.what());
        }
    }

    int sig = 0;
    sigwait(&shutdownSignals, &sig);
    LOG_INFO("Received signal {}; shutting down", sig);

    if (startup.has_value()) {
        startup->Cancel();
    }
    // Closing the sessions first fails every in-flight call and any start still in its handshake,
    // so gateway handlers waiting on them return at once
    registry.ShutdownAll();
    if (http) {
        http->Stop();
        http.reset();
    }
    if (startup.has_value()) {
        (void)startup->Wait();
    }
    LOG_INFO("mcp-bridge stopped");
    return 0;
}

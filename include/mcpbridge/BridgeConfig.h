//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BridgeConfig.h
// Purpose: Bridge daemon configuration from MCPBRIDGE_* environment variables and --key=value options
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "mcpbridge/ServerSession.h"

namespace mcpbridge {

//==========================================================================================================
// BridgeConfig
// Purpose: Every tunable of the bridge daemon. Environment variables are applied first, then options.
// Fields (environment variable / option):
//   definitionsFile   MCPBRIDGE_DEFINITIONS        --definitions    JSON definitions file
//   listen            MCPBRIDGE_LISTEN             --listen         gateway URI; "none" disables it
//   tlsCert/tlsKey    MCPBRIDGE_TLS_CERT/_KEY      --cert/--key     PEM files for https
//   requestTimeout    MCPBRIDGE_REQUEST_TIMEOUT_MS --request-timeout-ms
//   handshakeTimeout  MCPBRIDGE_HANDSHAKE_TIMEOUT_MS --handshake-timeout-ms
//   terminateGrace    MCPBRIDGE_TERMINATE_GRACE_MS --terminate-grace-ms
//   stagger           MCPBRIDGE_STAGGER_MS         --stagger-ms
//   logTailLines      MCPBRIDGE_LOG_TAIL_LINES     --log-tail-lines
//   ioThreads         MCPBRIDGE_IO_THREADS         --io-threads
//   autostart         MCPBRIDGE_AUTOSTART          --autostart      start every definition at launch
//   logLevel          MCPBRIDGE_LOG_LEVEL          --log-level
//   logFile           MCPBRIDGE_LOG_FILE           --log-file
//   logColor          MCPBRIDGE_LOG_COLOR          --log-color
//==========================================================================================================
struct BridgeConfig {
    std::string definitionsFile;
    std::string listen{"http://127.0.0.1:8765"};
    std::string tlsCert;
    std::string tlsKey;
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds handshakeTimeout{30000};
    std::chrono::milliseconds terminateGrace{2000};
    std::chrono::milliseconds stagger{500};
    std::size_t logTailLines{1000};
    std::size_t ioThreads{4};
    bool autostart{true};
    std::string logLevel{"INFO"};
    std::string logFile;
    bool logColor{false};

    // Defaults overlaid with MCPBRIDGE_* variables. Malformed numbers keep the default.
    static BridgeConfig FromEnvironment();

    //==========================================================================================================
    // ApplyArguments
    // Purpose: Applies --key=value options (argv[0] is skipped).
    // Throws:
    //   errors::BridgeError(InvalidArgument) for unknown options, a missing '=', or malformed numbers.
    //==========================================================================================================
    void ApplyArguments(const std::vector<std::string>& args);

    // FromEnvironment() followed by ApplyArguments(argv).
    static BridgeConfig Load(int argc, char** argv);

    SessionOptions ToSessionOptions() const;

    // Option help text for --help.
    static std::string Usage();
};

} // namespace mcpbridge

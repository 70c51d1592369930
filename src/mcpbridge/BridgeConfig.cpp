//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BridgeConfig.cpp
// Purpose: Environment and command-line parsing for the bridge daemon
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "env/EnvVars.h"
#include "mcpbridge/BridgeConfig.h"
#include "mcpbridge/errors/Errors.h"
#include "mcpbridge/version.h"

namespace mcpbridge {

using errors::BridgeError;
using errors::ErrorKind;

namespace {

bool parseBool(const std::string& key, const std::string& v) {
    std::string s;
    for (char c : v) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw BridgeError(ErrorKind::InvalidArgument, "option " + key + " expects a boolean, got '" + v + "'");
}

std::uint64_t parseUint(const std::string& key, const std::string& v) {
    if (v.empty() || v.size() > 12 ||
        !std::all_of(v.begin(), v.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw BridgeError(ErrorKind::InvalidArgument, "option " + key + " expects a non-negative integer, got '" + v + "'");
    }
    return std::stoull(v);
}

std::chrono::milliseconds envMillis(const char* name, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds(GetEnvUintOrDefault(name, static_cast<std::uint64_t>(fallback.count())));
}

bool envBool(const char* name, bool fallback) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return fallback;
    }
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}

} // namespace

BridgeConfig BridgeConfig::FromEnvironment() {
    BridgeConfig c;
    c.definitionsFile = GetEnvOrDefault("MCPBRIDGE_DEFINITIONS", c.definitionsFile);
    c.listen = GetEnvOrDefault("MCPBRIDGE_LISTEN", c.listen);
    c.tlsCert = GetEnvOrDefault("MCPBRIDGE_TLS_CERT", c.tlsCert);
    c.tlsKey = GetEnvOrDefault("MCPBRIDGE_TLS_KEY", c.tlsKey);
    c.requestTimeout = envMillis("MCPBRIDGE_REQUEST_TIMEOUT_MS", c.requestTimeout);
    c.handshakeTimeout = envMillis("MCPBRIDGE_HANDSHAKE_TIMEOUT_MS", c.handshakeTimeout);
    c.terminateGrace = envMillis("MCPBRIDGE_TERMINATE_GRACE_MS", c.terminateGrace);
    c.stagger = envMillis("MCPBRIDGE_STAGGER_MS", c.stagger);
    c.logTailLines = static_cast<std::size_t>(GetEnvUintOrDefault("MCPBRIDGE_LOG_TAIL_LINES", c.logTailLines));
    c.ioThreads = static_cast<std::size_t>(GetEnvUintOrDefault("MCPBRIDGE_IO_THREADS", c.ioThreads));
    c.autostart = envBool("MCPBRIDGE_AUTOSTART", c.autostart);
    c.logLevel = GetEnvOrDefault("MCPBRIDGE_LOG_LEVEL", c.logLevel);
    c.logFile = GetEnvOrDefault("MCPBRIDGE_LOG_FILE", c.logFile);
    c.logColor = envBool("MCPBRIDGE_LOG_COLOR", c.logColor);
    return c;
}

void BridgeConfig::ApplyArguments(const std::vector<std::string>& args) {
    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& a = args[i];
        const auto eq = a.find('=');
        if (a.rfind("--", 0) != 0 || eq == std::string::npos) {
            throw BridgeError(ErrorKind::InvalidArgument, "expected --key=value, got '" + a + "'");
        }
        const std::string key = a.substr(0, eq);
        const std::string value = a.substr(eq + 1);
        if (key == "--definitions") definitionsFile = value;
        else if (key == "--listen") listen = value;
        else if (key == "--cert") tlsCert = value;
        else if (key == "--key") tlsKey = value;
        else if (key == "--request-timeout-ms") requestTimeout = std::chrono::milliseconds(parseUint(key, value));
        else if (key == "--handshake-timeout-ms") handshakeTimeout = std::chrono::milliseconds(parseUint(key, value));
        else if (key == "--terminate-grace-ms") terminateGrace = std::chrono::milliseconds(parseUint(key, value));
        else if (key == "--stagger-ms") stagger = std::chrono::milliseconds(parseUint(key, value));
        else if (key == "--log-tail-lines") logTailLines = static_cast<std::size_t>(parseUint(key, value));
        else if (key == "--io-threads") ioThreads = static_cast<std::size_t>(parseUint(key, value));
        else if (key == "--autostart") autostart = parseBool(key, value);
        else if (key == "--log-level") logLevel = value;
        else if (key == "--log-file") logFile = value;
        else if (key == "--log-color") logColor = parseBool(key, value);
        else {
            throw BridgeError(ErrorKind::InvalidArgument, "unknown option '" + key + "'");
        }
    }
}

BridgeConfig BridgeConfig::Load(int argc, char** argv) {
    BridgeConfig c = FromEnvironment();
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i] ? argv[i] : "");
    }
    c.ApplyArguments(args);
    return c;
}

SessionOptions BridgeConfig::ToSessionOptions() const {
    SessionOptions o;
    o.requestTimeout = requestTimeout;
    o.handshakeTimeout = handshakeTimeout;
    o.terminateGrace = terminateGrace;
    o.logTailLines = logTailLines;
    o.clientInfo = Implementation("mcp-bridge", getVersionString());
    return o;
}

std::string BridgeConfig::Usage() {
    return
        "Usage: mcp_bridge_server [--key=value ...]\n"
        "  --definitions=<file>          JSON server definitions (servers[] or mcpServers{})\n"
        "  --listen=<uri>                gateway URI, http://host:port or https://host:port (none to disable)\n"
        "  --cert=<pem> --key=<pem>      TLS certificate and key for https\n"
        "  --request-timeout-ms=<n>      per-call deadline (default 30000)\n"
        "  --handshake-timeout-ms=<n>    initialize deadline (default 30000)\n"
        "  --terminate-grace-ms=<n>      SIGTERM to SIGKILL delay (default 2000)\n"
        "  --stagger-ms=<n>              delay between launches at startup (default 500)\n"
        "  --log-tail-lines=<n>          stderr lines kept per server (default 1000)\n"
        "  --io-threads=<n>              gateway I/O threads (default 4)\n"
        "  --autostart=<bool>            start every definition at launch (default true)\n"
        "  --log-level=<level>           DEBUG, INFO, WARN, ERROR\n"
        "  --log-file=<path>             also append log lines to a file\n"
        "  --log-color=<bool>            colour the level label on the console\n"
        "Every option can also be set through MCPBRIDGE_<NAME> (e.g. MCPBRIDGE_STAGGER_MS).\n";
}

} // namespace mcpbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayHTTPServer.hpp
// Purpose: Boost.Beast HTTP/HTTPS listener feeding the bridge gateway (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpbridge/GatewayAdapter.h"

namespace mcpbridge {

class GatewayHTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Bind address/port, scheme and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" picks an ephemeral port (see BoundPort()).
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   threads: I/O threads. Handlers run on a worker thread per request, never on these.
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8765"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
        std::size_t threads{4};
    };

    //==========================================================================================================
    // ParseListenUri
    // Purpose: "http://<address>:<port>" or "https://<address>:<port>?cert=<pem>&key=<pem>".
    //          IPv6 addresses use the [addr]:port form. A missing scheme means http.
    // Throws:
    //   errors::BridgeError(InvalidArgument) for a non-numeric or out of range port.
    //==========================================================================================================
    static Options ParseListenUri(const std::string& uri);

    using Handler = std::function<GatewayResponse(const std::string& method, const std::string& target,
                                                  const std::string& body)>;

    GatewayHTTPServer(Options opts, Handler handler);
    ~GatewayHTTPServer();

    GatewayHTTPServer(const GatewayHTTPServer&) = delete;
    GatewayHTTPServer& operator=(const GatewayHTTPServer&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Binds, listens and runs the accept loop on background I/O threads.
    // Returns:
    //   Future that becomes ready once the acceptor is listening, or holds the bind error.
    //==========================================================================================================
    std::future<void> Start();

    // Closes the acceptor, stops the I/O context and joins the I/O threads. Idempotent.
    // Does not wait for handlers still running; the destructor does.
    void Stop();

    // Port actually bound (useful with port "0"); 0 before Start() succeeds.
    std::uint16_t BoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpbridge

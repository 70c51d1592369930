//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayHTTPServer.cpp
// Purpose: HTTP/HTTPS gateway listener using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "mcpbridge/GatewayHTTPServer.hpp"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

void trim(std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

void validatePort(const std::string& port) {
    const bool allDigits = !port.empty() && port.size() <= 5 &&
        std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
    if (!allDigits || std::stoul(port) > 65535ul) {
        throw errors::BridgeError(errors::ErrorKind::InvalidArgument, "invalid listen port '" + port + "'");
    }
}

} // namespace

class GatewayHTTPServer::Impl {
public:
    Options opts;
    Handler handler;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> boundPort{0};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::vector<std::thread> ioThreads;

    // Handler calls in flight on worker threads; the destructor waits for them to post back.
    std::mutex workerMutex;
    std::condition_variable workerCv;
    std::size_t workersInFlight{0};

    Impl(Options o, Handler h) : opts(std::move(o)), handler(std::move(h)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("Gateway: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw errors::BridgeError(errors::ErrorKind::InvalidArgument, "unsupported scheme '" + opts.scheme + "'");
        }
    }

    ~Impl() {
        std::unique_lock<std::mutex> lock(workerMutex);
        workerCv.wait(lock, [this] { return workersInFlight == 0; });
    }

    void stop() {
        running.store(false);
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        ioc.stop();
        for (auto& t : ioThreads) {
            if (t.joinable()) {
                t.join();
            }
        }
        ioThreads.clear();
    }

    void logSessionError(const char* kind, const std::exception& e) {
        if (running.load()) {
            LOG_WARN("Gateway {} session error: {}", kind, e.what());
        } else {
            LOG_DEBUG("Gateway {} session error during shutdown: {}", kind, e.what());
        }
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        GatewayResponse out = co_await dispatchOnWorker(std::string(req.method_string()),
                                                        std::string(req.target()), std::move(req.body()));
        auto res = makeResponse(req, out);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> sessionPlain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            logSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> sessionTls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            logSessionError("TLS", e);
        }
        co_return;
    }

    //==========================================================================================================
    // dispatchOnWorker
    // Purpose: Runs the handler on its own thread so a request waiting on a slow child never occupies an
    //          I/O thread. The result is posted back to the coroutine's executor.
    //==========================================================================================================
    net::awaitable<GatewayResponse> dispatchOnWorker(std::string method, std::string target, std::string body) {
        auto executor = co_await net::this_coro::executor;
        co_return co_await net::async_initiate<decltype(net::use_awaitable), void(GatewayResponse)>(
            [this, executor, method = std::move(method), target = std::move(target),
             body = std::move(body)](auto completion) mutable {
                {
                    std::lock_guard<std::mutex> lock(workerMutex);
                    ++workersInFlight;
                }
                std::thread([this, executor, completion = std::move(completion), method = std::move(method),
                             target = std::move(target), body = std::move(body)]() mutable {
                    GatewayResponse out = invokeHandler(method, target, body);
                    net::post(executor, [completion = std::move(completion), out = std::move(out)]() mutable {
                        completion(std::move(out));
                    });
                    std::lock_guard<std::mutex> lock(workerMutex);
                    --workersInFlight;
                    workerCv.notify_all();
                }).detach();
            },
            net::use_awaitable);
    }

    GatewayResponse invokeHandler(const std::string& method, const std::string& target, const std::string& body) {
        try {
            GatewayResponse out = handler(method, target, body);
            LOG_DEBUG("Gateway {} {} -> {}", method, target, out.status);
            return out;
        } catch (const std::exception& e) {
            LOG_ERROR("Gateway handler failed for {} {}: {}", method, target, e.what());
            JSONValue::Object err;
            err["kind"] = std::make_shared<JSONValue>("InternalError");
            err["message"] = std::make_shared<JSONValue>(std::string(e.what()));
            JSONValue::Object body;
            body["error"] = std::make_shared<JSONValue>(std::move(err));
            return GatewayResponse{500, JSONValue(std::move(body))};
        }
    }

    static http::response<http::string_body> makeResponse(const http::request<http::string_body>& req,
                                                         const GatewayResponse& out) {
        http::response<http::string_body> res{static_cast<http::status>(out.status), req.version()};
        res.keep_alive(false);
        if (out.body.has_value()) {
            res.set(http::field::content_type, "application/json");
            res.body() = serializeJSONValue(out.body.value());
        }
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (sslCtx) {
                    net::co_spawn(ioc, sessionTls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, sessionPlain(std::move(socket)), net::detached);
                }
            }
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_ERROR("Gateway accept error: {}", e.what());
            } else {
                // operation_aborted once the acceptor is closed
                LOG_DEBUG("Gateway accept loop ended: {}", e.what());
            }
        }
        co_return;
    }

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *results.begin();
        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }
};

GatewayHTTPServer::Options GatewayHTTPServer::ParseListenUri(const std::string& uri) {
    Options opts;
    std::string cfg = uri;
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx) { return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    if (auto qpos = cfg.find('?'); qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }
    std::string hostPort = hostPortPath.substr(0, hostPortPath.find('/'));
    trim(hostPort);

    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
    }
    validatePort(opts.port);

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

GatewayHTTPServer::GatewayHTTPServer(Options opts, Handler handler)
    : pImpl(std::make_unique<Impl>(std::move(opts), std::move(handler))) {}

GatewayHTTPServer::~GatewayHTTPServer() {
    Stop();
}

std::future<void> GatewayHTTPServer::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("Gateway: cannot listen on {}:{}: {}", pImpl->opts.address, pImpl->opts.port, e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    const std::size_t threads = std::max<std::size_t>(1, pImpl->opts.threads);
    for (std::size_t i = 0; i < threads; ++i) {
        pImpl->ioThreads.emplace_back([this]() {
            try {
                pImpl->ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Gateway I/O thread stopped: {}", e.what());
            }
        });
    }
    LOG_INFO("Gateway listening on {}://{}:{}", pImpl->opts.scheme, pImpl->opts.address, pImpl->boundPort.load());
    ready.set_value();
    return fut;
}

void GatewayHTTPServer::Stop() {
    FUNC_SCOPE();
    if (pImpl->ioThreads.empty() && !pImpl->running.load()) {
        return;
    }
    pImpl->stop();
    LOG_INFO("Gateway stopped");
}

std::uint16_t GatewayHTTPServer::BoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace mcpbridge

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process JSON-RPC transport (line framing, id correlation, timeouts, stderr capture)
//==========================================================================================================

#include <fcntl.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "mcpbridge/ProcessTransport.hpp"
#include "mcpbridge/errors/Errors.h"

namespace mcpbridge {

namespace {

constexpr int PollIntervalMs = 100;

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

bool isBlank(const std::string& s) {
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\r') {
            return false;
        }
    }
    return true;
}

//----------------------------------------------------------------------------------------------------------
// LineSplitter: accumulates bytes and yields complete '\n'-terminated lines (CR stripped).
// Lines longer than the cap are discarded up to their terminating newline.
//----------------------------------------------------------------------------------------------------------
class LineSplitter {
public:
    explicit LineSplitter(std::size_t maxBytes) : maxLineBytes(maxBytes) {}

    template <typename Fn>
    void feed(const char* data, std::size_t len, Fn&& onLine, const std::string& server) {
        buffer.append(data, len);
        std::size_t start = 0;
        while (true) {
            std::size_t nl = buffer.find('\n', start);
            if (nl == std::string::npos) {
                break;
            }
            if (discarding) {
                discarding = false;
            } else {
                std::string line = buffer.substr(start, nl - start);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                onLine(line);
            }
            start = nl + 1;
        }
        buffer.erase(0, start);
        if (buffer.size() > maxLineBytes) {
            LOG_WARN("[{}] dropping oversized line (> {} bytes)", server, maxLineBytes);
            buffer.clear();
            discarding = true;
        }
    }

    // Remaining partial line at end of stream.
    std::optional<std::string> flush() {
        if (buffer.empty() || discarding) {
            return std::nullopt;
        }
        std::string rest;
        rest.swap(buffer);
        return rest;
    }

private:
    std::size_t maxLineBytes;
    std::string buffer;
    bool discarding{false};
};

} // namespace

class ProcessTransport::Impl {
public:
    std::string serverName;
    ProcessTransportOptions options;
    std::unique_ptr<ChildProcess> process;

    std::atomic<bool> connected{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closeNotified{false};
    std::mutex closeMutex;
    bool closed{false};
    int stopEventFd{-1};

    NotificationHandler notificationHandler;
    RequestHandler requestHandler;
    StderrHandler stderrHandler;
    CloseHandler closeHandler;

    std::thread readerThread;
    std::thread stderrThread;
    std::thread writerThread;
    std::thread timeoutThread;

    mutable std::mutex requestMutex;
    std::condition_variable cvTimeout;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<std::uint64_t> requestCounter{0};

    // Write queue/backpressure
    std::mutex writeMutex; // protects writeQueue and queuedBytes
    std::condition_variable cvWrite;
    std::deque<std::string> writeQueue;
    std::size_t queuedBytes{0};

    Impl(std::string name, std::unique_ptr<ChildProcess> proc, ProcessTransportOptions opts)
        : serverName(std::move(name)), options(opts), process(std::move(proc)) {
        stopEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (stopEventFd < 0) {
            LOG_ERROR("[{}] failed to create eventfd (errno={} msg={})", serverName, errno, ::strerror(errno));
        }
        setNonBlocking(process->StdinFd());
        setNonBlocking(process->StdoutFd());
        setNonBlocking(process->StderrFd());
    }

    ~Impl() {
        if (stopEventFd >= 0) {
            ::close(stopEventFd);
            stopEventFd = -1;
        }
    }

    void signalStop() {
        if (stopEventFd < 0) {
            return;
        }
        // Never drained: the fd stays readable so every poller observes the stop
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(stopEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN) {
            LOG_WARN("[{}] eventfd write failed (errno={} msg={})", serverName, errno, ::strerror(errno));
        }
    }

    std::string generateRequestId() { return "req-" + std::to_string(++requestCounter); }

    //------------------------------------------------------------------------------------------------------
    // Outbound
    //------------------------------------------------------------------------------------------------------
    bool enqueueLine(std::string payload) {
        payload.push_back('\n');
        {
            std::lock_guard<std::mutex> lk(writeMutex);
            if (queuedBytes + payload.size() > options.writeQueueMaxBytes) {
                LOG_ERROR("[{}] write queue overflow (queued={} add={} max={})", serverName, queuedBytes,
                          payload.size(), options.writeQueueMaxBytes);
                return false;
            }
            queuedBytes += payload.size();
            writeQueue.emplace_back(std::move(payload));
        }
        cvWrite.notify_one();
        return true;
    }

    // Blocks until the fd is writable, the transport stops, or poll fails.
    bool waitWritable(int fd) {
        while (connected) {
            struct pollfd pfds[2];
            pfds[0].fd = fd; pfds[0].events = POLLOUT; pfds[0].revents = 0;
            pfds[1].fd = stopEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
            int rc = ::poll(pfds, stopEventFd >= 0 ? 2 : 1, PollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            if (rc > 0 && stopEventFd >= 0 && (pfds[1].revents & POLLIN)) return false;
            if (pfds[0].revents & (POLLERR | POLLHUP)) return false;
            if (pfds[0].revents & POLLOUT) return true;
        }
        return false;
    }

    void runWriter() {
        const int fd = process->StdinFd();
        while (true) {
            std::string frame;
            {
                std::unique_lock<std::mutex> lk(writeMutex);
                cvWrite.wait_for(lk, std::chrono::milliseconds(PollIntervalMs),
                                 [&]{ return !connected || !writeQueue.empty(); });
                if (!connected) {
                    break;
                }
                if (writeQueue.empty()) {
                    continue;
                }
                frame = std::move(writeQueue.front());
                writeQueue.pop_front();
                queuedBytes -= std::min(queuedBytes, frame.size());
            }
            std::size_t total = 0;
            while (connected && total < frame.size()) {
                ssize_t w = ::write(fd, frame.data() + total, frame.size() - total);
                if (w > 0) {
                    total += static_cast<std::size_t>(w);
                } else if (w < 0 && errno == EINTR) {
                    continue;
                } else if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    if (!waitWritable(fd)) break;
                } else {
                    const int err = errno;
                    LOG_WARN("[{}] write to server failed (errno={} msg={})", serverName, err, ::strerror(err));
                    closeChannel(std::string("write failed: ") + ::strerror(err));
                    return;
                }
            }
        }
    }

    //------------------------------------------------------------------------------------------------------
    // Inbound
    //------------------------------------------------------------------------------------------------------
    void processLine(const std::string& line) {
        if (isBlank(line)) {
            return;
        }
        LOG_DEBUG("[{}] <- {}", serverName, line);
        JSONValue message;
        try {
            message = parseJSON(line);
        } catch (const std::exception& e) {
            LOG_WARN("[{}] skipping malformed line: {}", serverName, e.what());
            return;
        }
        if (!message.IsObject()) {
            LOG_WARN("[{}] skipping non-object JSON-RPC message", serverName);
            return;
        }
        const bool hasMethod = findMember(message, "method") != nullptr;
        const bool hasId = findMember(message, "id") != nullptr;
        if (hasMethod && hasId) {
            JSONRPCRequest request;
            if (request.FromJSONValue(message)) {
                handleIncomingRequest(request);
                return;
            }
        } else if (hasMethod) {
            auto notification = std::make_unique<JSONRPCNotification>();
            if (notification->FromJSONValue(message)) {
                if (notificationHandler) {
                    notificationHandler(std::move(notification));
                }
                return;
            }
        } else if (hasId) {
            JSONRPCResponse response;
            if (response.FromJSONValue(message)) {
                handleResponse(std::move(response));
                return;
            }
        }
        LOG_WARN("[{}] skipping unrecognized JSON-RPC message: {}", serverName, line);
    }

    void handleIncomingRequest(const JSONRPCRequest& request) {
        std::unique_ptr<JSONRPCResponse> response;
        if (requestHandler) {
            try {
                response = requestHandler(request);
            } catch (const std::exception& e) {
                LOG_ERROR("[{}] request handler failed for {}: {}", serverName, request.method, e.what());
                response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
        if (!response) {
            response = CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                           "Method not found: " + request.method);
        }
        response->id = request.id;
        if (!enqueueLine(response->Serialize())) {
            closeChannel("write queue overflow");
        }
    }

    void handleResponse(JSONRPCResponse response) {
        const std::string idStr = JSONRPCIdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            LOG_WARN("[{}] response for unknown or expired id '{}'", serverName, idStr);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pendingRequests.erase(it);
        requestDeadlines.erase(idStr);
    }

    void failAllPending(int code, const std::string& message) {
        std::lock_guard<std::mutex> lock(requestMutex);
        connected = false;
        for (auto& [idStr, prom] : pendingRequests) {
            auto resp = std::make_unique<JSONRPCResponse>();
            resp->id = idStr;
            resp->error = errors::makeLocalErrorValue(code, message);
            prom.set_value(std::move(resp));
        }
        pendingRequests.clear();
        requestDeadlines.clear();
    }

    // Reads one fd until EOF or stop. Returns true on EOF/read error, false when stopped.
    template <typename Fn>
    bool pumpLines(int fd, Fn&& onLine) {
        LineSplitter splitter(options.maxLineBytes);
        std::vector<char> tmp(8192);
        while (!stopping) {
            struct pollfd pfds[2];
            pfds[0].fd = fd; pfds[0].events = POLLIN; pfds[0].revents = 0;
            pfds[1].fd = stopEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
            int rc = ::poll(pfds, stopEventFd >= 0 ? 2 : 1, PollIntervalMs);
            if (rc < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("[{}] poll failed (errno={} msg={})", serverName, errno, ::strerror(errno));
                return true;
            }
            if (rc == 0) {
                continue;
            }
            if (stopEventFd >= 0 && (pfds[1].revents & POLLIN)) {
                return false;
            }
            if (pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
                ssize_t n = ::read(fd, tmp.data(), tmp.size());
                if (n > 0) {
                    splitter.feed(tmp.data(), static_cast<std::size_t>(n), onLine, serverName);
                } else if (n == 0) {
                    if (auto rest = splitter.flush()) {
                        onLine(*rest);
                    }
                    return true;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                    LOG_ERROR("[{}] read failed (errno={} msg={})", serverName, errno, ::strerror(errno));
                    return true;
                }
            }
        }
        return false;
    }

    // Exit status if the child is gone (waiting briefly for it to be reapable), else `fallback`.
    std::string exitReason(const std::string& fallback) {
        std::optional<int> status;
        for (int i = 0; i < 20 && !status.has_value(); ++i) {
            status = process->TryWait();
            if (!status.has_value()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        return status.has_value() ? "server process " + ChildProcess::DescribeStatus(*status) : fallback;
    }

    //------------------------------------------------------------------------------------------------------
    // closeChannel: unexpected end of the channel (EOF, write failure, queue overflow). Fails every
    // pending request with TransportClosed and reports the reason to the close handler exactly once.
    // The process itself is reclaimed by Close().
    //------------------------------------------------------------------------------------------------------
    void closeChannel(const std::string& reason) {
        if (beginClose(reason)) {
            notifyClosed(reason);
        }
    }

    // First half of closeChannel: fails pending requests right away. False if already closed or stopping.
    bool beginClose(const std::string& cause) {
        if (stopping || closeNotified.exchange(true)) {
            return false;
        }
        failAllPending(JSONRPCErrorCodes::TransportClosed, "Transport closed: " + cause);
        cvWrite.notify_all();
        cvTimeout.notify_all();
        return true;
    }

    void notifyClosed(const std::string& reason) {
        LOG_WARN("[{}] {}", serverName, reason);
        // Last statement: the handler may release the final owner of this transport
        auto handler = closeHandler;
        if (handler) {
            handler(reason);
        }
    }

    void runReader() {
        bool eof = pumpLines(process->StdoutFd(), [this](const std::string& line) { processLine(line); });
        if (!eof || stopping) {
            return;
        }
        const std::string cause = "server process closed its output";
        if (!beginClose(cause)) {
            return;
        }
        // The child usually exits right after closing stdout; its status makes a better reason
        notifyClosed(exitReason(cause));
    }

    void runStderr() {
        (void)pumpLines(process->StderrFd(), [this](const std::string& line) {
            if (isBlank(line)) {
                return;
            }
            LOG_INFO("[{}] {}", serverName, line);
            if (stderrHandler) {
                stderrHandler(line);
            }
        });
    }

    void runTimeouts() {
        using clock = std::chrono::steady_clock;
        std::unique_lock<std::mutex> lock(requestMutex);
        while (connected) {
            cvTimeout.wait_for(lock, std::chrono::milliseconds(50));
            auto now = clock::now();
            std::vector<std::string> expired;
            for (const auto& kv : requestDeadlines) {
                if (kv.second <= now) expired.push_back(kv.first);
            }
            for (const auto& idStr : expired) {
                auto it = pendingRequests.find(idStr);
                if (it != pendingRequests.end()) {
                    LOG_WARN("[{}] request {} timed out", serverName, idStr);
                    auto resp = std::make_unique<JSONRPCResponse>();
                    resp->id = idStr;
                    resp->error = errors::makeLocalErrorValue(JSONRPCErrorCodes::RequestTimeout, "Request timed out");
                    it->second.set_value(std::move(resp));
                    pendingRequests.erase(it);
                }
                requestDeadlines.erase(idStr);
            }
        }
    }

    void joinOrDetach(std::thread& t) {
        if (!t.joinable()) {
            return;
        }
        if (t.get_id() == std::this_thread::get_id()) {
            t.detach();
        } else {
            t.join();
        }
    }
};

ProcessTransport::ProcessTransport(std::string serverName, std::unique_ptr<ChildProcess> process,
                                   ProcessTransportOptions options)
    : pImpl(std::make_unique<Impl>(std::move(serverName), std::move(process), options)) {
    FUNC_SCOPE();
}

ProcessTransport::~ProcessTransport() {
    FUNC_SCOPE();
    Close();
}

std::shared_ptr<ProcessTransport> ProcessTransport::Launch(const ServerDefinition& def, ProcessTransportOptions options) {
    auto process = ChildProcess::Spawn(def);
    return std::make_shared<ProcessTransport>(def.name, std::move(process), options);
}

void ProcessTransport::Start() {
    FUNC_SCOPE();
    bool expected = false;
    if (!pImpl->started.compare_exchange_strong(expected, true)) {
        return;
    }
    LOG_DEBUG("[{}] starting transport loops (pid={})", pImpl->serverName, static_cast<long>(pImpl->process->Pid()));
    pImpl->connected = true;
    pImpl->readerThread = std::thread([this]() { pImpl->runReader(); });
    pImpl->stderrThread = std::thread([this]() { pImpl->runStderr(); });
    pImpl->writerThread = std::thread([this]() { pImpl->runWriter(); });
    pImpl->timeoutThread = std::thread([this]() { pImpl->runTimeouts(); });
}

void ProcessTransport::Close() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> guard(pImpl->closeMutex);
    if (pImpl->closed) {
        return;
    }
    pImpl->closed = true;
    pImpl->stopping = true;
    pImpl->connected = false;
    pImpl->signalStop();
    pImpl->cvWrite.notify_all();
    pImpl->cvTimeout.notify_all();

    pImpl->joinOrDetach(pImpl->writerThread);
    pImpl->joinOrDetach(pImpl->readerThread);
    pImpl->joinOrDetach(pImpl->stderrThread);
    pImpl->joinOrDetach(pImpl->timeoutThread);

    const std::string outcome = pImpl->process->Terminate(pImpl->options.terminateGrace);
    pImpl->failAllPending(JSONRPCErrorCodes::TransportClosed, "Transport closed");
    LOG_INFO("[{}] transport closed; server process {}", pImpl->serverName, outcome);
}

bool ProcessTransport::IsConnected() const { return pImpl->connected; }
pid_t ProcessTransport::Pid() const { return pImpl->process->Pid(); }
const std::string& ProcessTransport::ServerName() const { return pImpl->serverName; }

std::future<std::unique_ptr<JSONRPCResponse>> ProcessTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request, std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto future = promise.get_future();
    const std::string requestId = pImpl->generateRequestId();
    request->id = requestId;

    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (!pImpl->connected) {
            auto resp = std::make_unique<JSONRPCResponse>();
            resp->id = requestId;
            resp->error = errors::makeLocalErrorValue(JSONRPCErrorCodes::TransportClosed, "Transport closed");
            promise.set_value(std::move(resp));
            return future;
        }
        pImpl->pendingRequests[requestId] = std::move(promise);
        pImpl->requestDeadlines[requestId] =
            std::chrono::steady_clock::now() + timeout.value_or(pImpl->options.requestTimeout);
    }

    std::string serialized = request->Serialize();
    LOG_DEBUG("[{}] -> {}", pImpl->serverName, serialized);
    if (!pImpl->enqueueLine(std::move(serialized))) {
        pImpl->closeChannel("write queue overflow");
    }
    return future;
}

void ProcessTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!pImpl->connected) {
        LOG_DEBUG("[{}] dropping notification {} (disconnected)", pImpl->serverName, notification->method);
        return;
    }
    if (!pImpl->enqueueLine(notification->Serialize())) {
        pImpl->closeChannel("write queue overflow");
    }
}

void ProcessTransport::SetNotificationHandler(NotificationHandler handler) { pImpl->notificationHandler = std::move(handler); }
void ProcessTransport::SetRequestHandler(RequestHandler handler) { pImpl->requestHandler = std::move(handler); }
void ProcessTransport::SetStderrHandler(StderrHandler handler) { pImpl->stderrHandler = std::move(handler); }
void ProcessTransport::SetCloseHandler(CloseHandler handler) { pImpl->closeHandler = std::move(handler); }

std::uint64_t ProcessTransport::RequestsSent() const { return pImpl->requestCounter.load(); }

std::size_t ProcessTransport::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

} // namespace mcpbridge

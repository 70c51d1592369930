//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_session.cpp
// Purpose: ServerSession handshake, discovery, tool calls and failure transitions against the mock server
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "mcpbridge/ServerSession.h"
#include "mcpbridge/errors/Errors.h"
#include "mock/MockServer.h"

using namespace mcpbridge;
using namespace std::chrono_literals;
using mcpbridge::errors::BridgeError;
using mcpbridge::errors::ErrorKind;

namespace {

SessionOptions fastOptions() {
    SessionOptions o;
    o.handshakeTimeout = 2000ms;
    o.requestTimeout = 2000ms;
    o.terminateGrace = 500ms;
    return o;
}

std::string firstText(const JSONValue& result) {
    const JSONValue* content = findMember(result, "content");
    if (content == nullptr || !content->IsArray() || std::get<JSONValue::Array>(content->value).empty()) {
        return {};
    }
    return getStringMember(*std::get<JSONValue::Array>(content->value).front(), "text").value_or("");
}

JSONValue args(const std::string& json) {
    return parseJSON(json);
}

template <typename T>
ErrorKind futureErrorKind(std::future<T>& fut) {
    return mocksrv::KindOf([&] { (void)fut.get(); });
}

// Polls `pred` for up to `limit`.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds limit = 3000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(10ms);
    }
    return true;
}

} // namespace

TEST(ServerSession, StartReachesRunningWithTools) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    auto info = fut.get();
    EXPECT_EQ(info.status, ServerStatus::Running);
    EXPECT_EQ(info.toolCount, 8u);
    ASSERT_TRUE(info.pid.has_value());
    ASSERT_TRUE(info.serverInfo.has_value());
    EXPECT_EQ(info.serverInfo->name, "mock-server");
    EXPECT_EQ(info.serverInfo->version, "1.2.3");
    EXPECT_FALSE(info.lastError.has_value());

    auto tools = s->ListTools();
    ASSERT_EQ(tools.size(), 8u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[0].description, "mock tool echo");

    auto j = s->Snapshot().ToJSON();
    EXPECT_EQ(getStringMember(j, "status").value_or(""), "running");
    EXPECT_EQ(std::get<int64_t>(findMember(j, "toolCount")->value), 8);
    s->Stop();
}

TEST(ServerSession, StartTwiceIsRejected) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    auto fut = s->Start();
    EXPECT_THROW(s->Start(), BridgeError);
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_NO_THROW(fut.get());
    s->Stop();
}

TEST(ServerSession, PagedToolListIsConcatenated) {
    auto s = ServerSession::Create(mocksrv::Definition("paged", {"--tools=a,b,c,d,e", "--page-size=2"}), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(fut.get().toolCount, 5u);
    auto tools = s->ListTools();
    ASSERT_EQ(tools.size(), 5u);
    EXPECT_EQ(tools[0].name, "a");
    EXPECT_EQ(tools[4].name, "e");
    s->Stop();
}

TEST(ServerSession, MissingExecutableIsSpawnError) {
    auto s = ServerSession::Create(mocksrv::MissingCommand("ghost"), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::SpawnError);
    auto info = s->Snapshot();
    EXPECT_EQ(info.status, ServerStatus::Failed);
    EXPECT_TRUE(info.lastError.has_value());
    EXPECT_FALSE(info.pid.has_value());
}

TEST(ServerSession, HandshakeTimeoutKillsProcess) {
    SessionOptions o = fastOptions();
    o.handshakeTimeout = 200ms;
    auto s = ServerSession::Create(mocksrv::Definition("hang", {"--hang-init"}), o);
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::HandshakeError);
    EXPECT_EQ(s->Status(), ServerStatus::Failed);
    EXPECT_FALSE(s->Snapshot().pid.has_value());
}

TEST(ServerSession, HandshakeErrorResponse) {
    auto s = ServerSession::Create(mocksrv::Definition("reject", {"--fail-init"}), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::HandshakeError);
    EXPECT_EQ(s->Status(), ServerStatus::Failed);
}

TEST(ServerSession, ExitDuringHandshake) {
    auto s = ServerSession::Create(mocksrv::Definition("quitter", {"--exit-on-init"}), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::HandshakeError);
    EXPECT_EQ(s->Status(), ServerStatus::Failed);
}

TEST(ServerSession, ToolListFailureIsDiscoveryError) {
    auto s = ServerSession::Create(mocksrv::Definition("nolist", {"--fail-list"}), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::DiscoveryError);
    EXPECT_EQ(s->Status(), ServerStatus::Failed);
    EXPECT_EQ(mocksrv::KindOf([&] { (void)s->ListTools(); }), ErrorKind::NotRunning);
}

TEST(ServerSession, CallToolReturnsResultVerbatim) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto fut = s->CallTool("echo", args(R"({"text":"hello"})"));
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    auto result = fut.get();
    EXPECT_EQ(firstText(result), "hello");
    const JSONValue* isError = findMember(result, "isError");
    ASSERT_NE(isError, nullptr);
    EXPECT_FALSE(std::get<bool>(isError->value));
    s->Stop();
}

TEST(ServerSession, NullArgumentsBecomeEmptyObject) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto fut = s->CallTool("echo", JSONValue(nullptr));
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(firstText(fut.get()), "{}");
    s->Stop();
}

TEST(ServerSession, UnknownToolFailsWithoutProcessIO) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    const auto before = s->Snapshot().requestsSent;
    auto fut = s->CallTool("does_not_exist", args("{}"));
    ASSERT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::ToolNotFound);
    EXPECT_EQ(s->Snapshot().requestsSent, before);
    EXPECT_EQ(s->Status(), ServerStatus::Running);
    s->Stop();
}

TEST(ServerSession, UpstreamErrorCarriesChildErrorObject) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto fut = s->CallTool("fail", args("{}"));
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected UpstreamError";
    } catch (const BridgeError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UpstreamError);
        EXPECT_EQ(e.server(), "alpha");
        ASSERT_TRUE(e.data().has_value());
        EXPECT_EQ(std::get<int64_t>(findMember(e.data().value(), "code")->value), -32000);
        const JSONValue* data = findMember(e.data().value(), "data");
        ASSERT_NE(data, nullptr);
        EXPECT_EQ(getStringMember(*data, "reason").value_or(""), "requested");
    }
    EXPECT_EQ(s->Status(), ServerStatus::Running);
    s->Stop();
}

TEST(ServerSession, ChildTimeoutCodeIsNotBridgeTimeout) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto fut = s->CallTool("fake_timeout", args("{}"));
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::UpstreamError);
    s->Stop();
}

TEST(ServerSession, CallTimeoutKeepsSessionRunning) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto slow = s->CallTool("sleep", args(R"({"ms":1500,"text":"late"})"), 150ms);
    ASSERT_EQ(slow.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(slow), ErrorKind::Timeout);
    EXPECT_EQ(s->Status(), ServerStatus::Running);

    auto next = s->CallTool("echo", args(R"({"text":"still here"})"));
    ASSERT_EQ(next.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(firstText(next.get()), "still here");
    s->Stop();
}

TEST(ServerSession, ConcurrentCallsAreNotSerialized) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    const auto started = std::chrono::steady_clock::now();
    auto a = s->CallTool("sleep", args(R"({"ms":400,"text":"a"})"));
    auto b = s->CallTool("sleep", args(R"({"ms":400,"text":"b"})"));
    auto c = s->CallTool("sleep", args(R"({"ms":400,"text":"c"})"));
    EXPECT_EQ(firstText(a.get()), "a");
    EXPECT_EQ(firstText(b.get()), "b");
    EXPECT_EQ(firstText(c.get()), "c");
    EXPECT_LT(std::chrono::steady_clock::now() - started, 1100ms);
    s->Stop();
}

TEST(ServerSession, CrashFailsSessionAndPendingCalls) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto pending = s->CallTool("sleep", args(R"({"ms":5000,"text":"never"})"));
    auto crash = s->CallTool("crash", args("{}"));
    ASSERT_EQ(pending.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(pending), ErrorKind::TransportClosed);
    ASSERT_EQ(crash.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(crash), ErrorKind::TransportClosed);

    ASSERT_TRUE(eventually([&] { return s->Status() == ServerStatus::Failed; }));
    auto info = s->Snapshot();
    ASSERT_TRUE(info.lastError.has_value());
    EXPECT_NE(info.lastError->find("exited with code 3"), std::string::npos);

    auto after = s->CallTool("echo", args("{}"));
    EXPECT_EQ(futureErrorKind(after), ErrorKind::NotRunning);
    s->Stop();
}

TEST(ServerSession, ExitRightAfterHandshakeFailsStart) {
    auto s = ServerSession::Create(mocksrv::Definition("brief", {"--exit-after-init"}), fastOptions());
    auto fut = s->Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(fut), ErrorKind::DiscoveryError);
    EXPECT_EQ(s->Status(), ServerStatus::Failed);
}

TEST(ServerSession, StopIsIdempotentAndKillsStubbornChild) {
    SessionOptions o = fastOptions();
    o.terminateGrace = 200ms;
    auto s = ServerSession::Create(mocksrv::Definition("stubborn", {"--ignore-sigterm"}), o);
    auto info = s->Start().get();
    ASSERT_TRUE(info.pid.has_value());
    const pid_t pid = info.pid.value();
    s->Stop();
    EXPECT_EQ(s->Status(), ServerStatus::Stopped);
    EXPECT_FALSE(mocksrv::ProcessAlive(pid));
    EXPECT_NO_THROW(s->Stop());
    EXPECT_EQ(s->Status(), ServerStatus::Stopped);
    EXPECT_EQ(mocksrv::KindOf([&] { (void)s->ListTools(); }), ErrorKind::NotRunning);
}

TEST(ServerSession, StopWhileStartingLeavesStopped) {
    SessionOptions o = fastOptions();
    o.handshakeTimeout = 3000ms;
    auto s = ServerSession::Create(mocksrv::Definition("hang", {"--hang-init"}), o);
    auto fut = s->Start();
    std::this_thread::sleep_for(100ms);
    s->Stop();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(fut.get(), BridgeError);
    EXPECT_EQ(s->Status(), ServerStatus::Stopped);
}

TEST(ServerSession, WaitForTasksCoversInFlightCalls) {
    auto s = ServerSession::Create(mocksrv::Definition("busy", {"--tools=sleep"}), fastOptions());
    ASSERT_EQ(s->Start().get().status, ServerStatus::Running);
    EXPECT_TRUE(s->WaitForTasks(1000ms));

    auto call = s->CallTool("sleep", args(R"({"ms":1500,"text":"late"})"));
    std::this_thread::sleep_for(100ms);
    EXPECT_FALSE(s->WaitForTasks(50ms));

    s->Stop();
    EXPECT_TRUE(s->WaitForTasks(2000ms));
    ASSERT_EQ(call.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(futureErrorKind(call), ErrorKind::TransportClosed);
}

TEST(ServerSession, LogTailIsBounded) {
    SessionOptions o = fastOptions();
    o.logTailLines = 5;
    auto s = ServerSession::Create(mocksrv::Definition("chatty", {"--stderr-lines=20"}), o);
    ASSERT_NO_THROW(s->Start().get());
    ASSERT_TRUE(eventually([&] {
        auto lines = s->RecentLogs(100);
        return !lines.empty() && lines.back() == "mock stderr line 19";
    }));
    auto lines = s->RecentLogs(100);
    ASSERT_EQ(lines.size(), 5u);
    EXPECT_EQ(lines.front(), "mock stderr line 15");
    auto two = s->RecentLogs(2);
    ASSERT_EQ(two.size(), 2u);
    EXPECT_EQ(two[0], "mock stderr line 18");
    s->Stop();
    // The tail survives the process for post-mortem inspection
    EXPECT_EQ(s->RecentLogs(100).size(), 5u);
}

TEST(ServerSession, ChildNotificationsReachSink) {
    auto s = ServerSession::Create(mocksrv::Definition("notifier", {"--notify"}), fastOptions());
    std::promise<std::string> got;
    std::atomic<bool> once{false};
    s->SetNotificationSink([&](const std::string& server, const JSONRPCNotification& n) {
        if (n.method == "notifications/message" && !once.exchange(true)) {
            got.set_value(server);
        }
    });
    ASSERT_NO_THROW(s->Start().get());
    auto fut = got.get_future();
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "notifier");
    s->Stop();
}

TEST(ServerSession, ServerPingDoesNotDisturbSession) {
    auto s = ServerSession::Create(mocksrv::Definition("pinger", {"--server-ping"}), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    auto p = s->Ping();
    ASSERT_EQ(p.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(p.get());
    EXPECT_EQ(s->Status(), ServerStatus::Running);
    s->Stop();
}

TEST(ServerSession, ForwardRequestRestoresCallerId) {
    auto s = ServerSession::Create(mocksrv::Definition("alpha"), fastOptions());
    ASSERT_NO_THROW(s->Start().get());
    JSONRPCRequest req(JSONRPCId{std::string("caller-7")}, "tools/list", JSONValue(JSONValue::Object{}));
    auto fut = s->ForwardRequest(req);
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    auto reply = fut.get();
    EXPECT_EQ(getStringMember(reply, "id").value_or(""), "caller-7");
    EXPECT_NE(findMember(reply, "result"), nullptr);

    // Child error objects are relayed, not raised
    JSONRPCRequest unknown(JSONRPCId{static_cast<int64_t>(11)}, "resources/list");
    auto err = s->ForwardRequest(unknown).get();
    EXPECT_EQ(std::get<int64_t>(findMember(err, "id")->value), 11);
    const JSONValue* e = findMember(err, "error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(std::get<int64_t>(findMember(*e, "code")->value), JSONRPCErrorCodes::MethodNotFound);
    s->Stop();
}

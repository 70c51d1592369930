//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: ProcessTransport correlation, noise tolerance, timeouts and child exit against the mock server
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <cstdlib>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "mcpbridge/ChildProcess.hpp"
#include "mcpbridge/ProcessTransport.hpp"
#include "mcpbridge/errors/Errors.h"
#include "mock/MockServer.h"

using namespace mcpbridge;
using namespace std::chrono_literals;

namespace {

std::unique_ptr<JSONRPCRequest> toolCall(const std::string& tool, JSONValue::Object args = {}) {
    JSONValue::Object params;
    params["name"] = std::make_shared<JSONValue>(tool);
    params["arguments"] = std::make_shared<JSONValue>(std::move(args));
    auto req = std::make_unique<JSONRPCRequest>();
    req->method = "tools/call";
    req->params.emplace(std::move(params));
    return req;
}

JSONValue::Object sleepArgs(int64_t ms, const std::string& text) {
    JSONValue::Object args;
    args["ms"] = std::make_shared<JSONValue>(ms);
    args["text"] = std::make_shared<JSONValue>(text);
    return args;
}

// First text content item of a tools/call result.
std::string resultText(const JSONRPCResponse& resp) {
    if (!resp.result.has_value()) {
        return {};
    }
    const JSONValue* content = findMember(resp.result.value(), "content");
    if (content == nullptr || !content->IsArray() || std::get<JSONValue::Array>(content->value).empty()) {
        return {};
    }
    return getStringMember(*std::get<JSONValue::Array>(content->value).front(), "text").value_or("");
}

int errorCode(const JSONRPCResponse& resp) {
    auto err = errors::mcpErrorFromResponse(resp);
    return err.has_value() ? err->code : 0;
}

} // namespace

TEST(ChildProcess, SpawnMissingCommandThrowsSpawnError) {
    auto kind = mocksrv::KindOf([] { (void)ChildProcess::Spawn(mocksrv::MissingCommand("ghost")); });
    EXPECT_EQ(kind, errors::ErrorKind::SpawnError);
}

TEST(ChildProcess, TerminateEscalatesToSigkill) {
    auto child = ChildProcess::Spawn(mocksrv::Definition("stubborn", {"--ignore-sigterm"}));
    const pid_t pid = child->Pid();
    ASSERT_GT(pid, 0);
    std::this_thread::sleep_for(100ms);
    const std::string reason = child->Terminate(200ms);
    EXPECT_NE(reason.find("signal 9"), std::string::npos) << reason;
    EXPECT_FALSE(mocksrv::ProcessAlive(pid));
}

TEST(ProcessTransport, ResponsesMatchedByIdOutOfOrder) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("ooo"));
    t->Start();

    auto slow = t->SendRequest(toolCall("sleep", sleepArgs(400, "slow")));
    auto fast = t->SendRequest(toolCall("sleep", sleepArgs(10, "fast")));

    ASSERT_EQ(fast.wait_for(3s), std::future_status::ready);
    // The fast reply arrives first while the slow one is still pending
    EXPECT_NE(slow.wait_for(0ms), std::future_status::ready);
    auto fastResp = fast.get();
    EXPECT_EQ(resultText(*fastResp), "fast");

    ASSERT_EQ(slow.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(resultText(*slow.get()), "slow");
    EXPECT_EQ(t->PendingCount(), 0u);
    EXPECT_EQ(t->RequestsSent(), 2u);
    t->Close();
}

TEST(ProcessTransport, MalformedLinesAndUnknownIdsAreIgnored) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("noisy"));
    t->Start();
    auto fut = t->SendRequest(toolCall("noise"));
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    auto resp = fut.get();
    EXPECT_FALSE(resp->IsError());
    EXPECT_EQ(resultText(*resp), "after noise");
    EXPECT_TRUE(t->IsConnected());
    t->Close();
}

TEST(ProcessTransport, TimeoutLeavesChannelUsable) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("slowpoke"));
    t->Start();

    auto timedOut = t->SendRequest(toolCall("sleep", sleepArgs(1000, "late")), 100ms);
    ASSERT_EQ(timedOut.wait_for(3s), std::future_status::ready);
    auto resp = timedOut.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::RequestTimeout);
    EXPECT_EQ(errors::bridgeErrorFromResponse("slowpoke", *resp, errors::ErrorKind::UpstreamError).kind(),
              errors::ErrorKind::Timeout);

    // Later requests still succeed; the late reply for the abandoned id is discarded
    auto next = t->SendRequest(toolCall("echo"));
    ASSERT_EQ(next.wait_for(3s), std::future_status::ready);
    EXPECT_FALSE(next.get()->IsError());
    EXPECT_TRUE(t->IsConnected());
    t->Close();
}

TEST(ProcessTransport, ChildExitFailsPendingWithTransportClosed) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("crasher"));
    std::promise<std::string> closed;
    std::atomic<int> closeCalls{0};
    t->SetCloseHandler([&](const std::string& reason) {
        if (closeCalls.fetch_add(1) == 0) {
            closed.set_value(reason);
        }
    });
    t->Start();

    auto pending = t->SendRequest(toolCall("sleep", sleepArgs(5000, "never")));
    auto crash = t->SendRequest(toolCall("crash"));

    ASSERT_EQ(pending.wait_for(3s), std::future_status::ready);
    auto resp = pending.get();
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(errorCode(*resp), JSONRPCErrorCodes::TransportClosed);
    ASSERT_EQ(crash.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(errorCode(*crash.get()), JSONRPCErrorCodes::TransportClosed);

    auto reasonFut = closed.get_future();
    ASSERT_EQ(reasonFut.wait_for(3s), std::future_status::ready);
    EXPECT_NE(reasonFut.get().find("exited with code 3"), std::string::npos);
    t->Close();
    EXPECT_EQ(closeCalls.load(), 1);
}

TEST(ProcessTransport, AnswersServerPing) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("pinger", {"--server-ping"}));
    std::promise<void> asked;
    std::atomic<bool> once{false};
    t->SetRequestHandler([&](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        if (req.method == "ping" && !once.exchange(true)) {
            asked.set_value();
        }
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue(JSONValue::Object{}));
    });
    t->Start();
    t->SendNotification(std::make_unique<JSONRPCNotification>("notifications/initialized"));
    auto fut = asked.get_future();
    EXPECT_EQ(fut.wait_for(3s), std::future_status::ready);
    t->Close();
}

TEST(ProcessTransport, StderrLinesReachHandler) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("chatty", {"--stderr-lines=3"}));
    std::mutex m;
    std::vector<std::string> lines;
    std::promise<void> gotAll;
    t->SetStderrHandler([&](const std::string& line) {
        std::lock_guard<std::mutex> lock(m);
        lines.push_back(line);
        if (lines.size() == 3) {
            gotAll.set_value();
        }
    });
    t->Start();
    auto fut = gotAll.get_future();
    ASSERT_EQ(fut.wait_for(3s), std::future_status::ready);
    {
        std::lock_guard<std::mutex> lock(m);
        EXPECT_EQ(lines[0], "mock stderr line 0");
        EXPECT_EQ(lines[2], "mock stderr line 2");
    }
    t->Close();
}

TEST(ProcessTransport, CloseTerminatesChildAndIsIdempotent) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("closer"));
    t->Start();
    const pid_t pid = t->Pid();
    auto pending = t->SendRequest(toolCall("sleep", sleepArgs(5000, "never")));
    t->Close();
    ASSERT_EQ(pending.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(errorCode(*pending.get()), JSONRPCErrorCodes::TransportClosed);
    EXPECT_FALSE(t->IsConnected());
    EXPECT_FALSE(mocksrv::ProcessAlive(pid));
    EXPECT_NO_THROW(t->Close());

    auto after = t->SendRequest(toolCall("echo"));
    ASSERT_EQ(after.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(errorCode(*after.get()), JSONRPCErrorCodes::TransportClosed);
}

TEST(ProcessTransport, ClosedOutputFailsPendingWithoutWaitingForExit) {
    auto t = ProcessTransport::Launch(mocksrv::Definition("mute"));
    std::promise<std::string> closed;
    t->SetCloseHandler([&](const std::string& reason) { closed.set_value(reason); });
    t->Start();
    const pid_t pid = t->Pid();

    auto pending = t->SendRequest(toolCall("sleep", sleepArgs(5000, "never")));
    const auto sent = std::chrono::steady_clock::now();
    auto mute = t->SendRequest(toolCall("close_output"));
    ASSERT_EQ(pending.wait_for(2s), std::future_status::ready);
    // The child is still alive here; its exit status must not be awaited first
    EXPECT_LT(std::chrono::steady_clock::now() - sent, 150ms);
    EXPECT_EQ(errorCode(*pending.get()), JSONRPCErrorCodes::TransportClosed);
    ASSERT_EQ(mute.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(errorCode(*mute.get()), JSONRPCErrorCodes::TransportClosed);
    EXPECT_TRUE(mocksrv::ProcessAlive(pid));

    auto reasonFut = closed.get_future();
    ASSERT_EQ(reasonFut.wait_for(2s), std::future_status::ready);
    EXPECT_NE(reasonFut.get().find("closed its output"), std::string::npos);
    t->Close();
}

TEST(ProcessTransport, ChildEnvironmentOverlaysDefinitionOnParent) {
    ::setenv("MCPBRIDGE_TEST_INHERITED", "from-parent", 1);
    ::setenv("MCPBRIDGE_TEST_OVERRIDDEN", "from-parent", 1);
    auto def = mocksrv::Definition("envy");
    def.env["MCPBRIDGE_TEST_OVERRIDDEN"] = "from-definition";
    def.env["MCPBRIDGE_TEST_ADDED"] = "added";
    auto t = ProcessTransport::Launch(def);
    ::unsetenv("MCPBRIDGE_TEST_INHERITED");
    ::unsetenv("MCPBRIDGE_TEST_OVERRIDDEN");
    t->Start();

    auto envOf = [&](const std::string& name) {
        JSONValue::Object args;
        args["name"] = std::make_shared<JSONValue>(name);
        auto fut = t->SendRequest(toolCall("env", std::move(args)));
        return fut.wait_for(2s) == std::future_status::ready ? resultText(*fut.get()) : std::string("<timeout>");
    };
    EXPECT_EQ(envOf("MCPBRIDGE_TEST_INHERITED"), "from-parent");
    EXPECT_EQ(envOf("MCPBRIDGE_TEST_OVERRIDDEN"), "from-definition");
    EXPECT_EQ(envOf("MCPBRIDGE_TEST_ADDED"), "added");
    t->Close();
}

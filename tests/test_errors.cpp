//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for bridge error kinds and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpbridge/JSONRPCTypes.h"
#include "mcpbridge/errors/Errors.h"

using namespace mcpbridge;
using mcpbridge::errors::BridgeError;
using mcpbridge::errors::ErrorKind;

TEST(Errors, CategoryMapping) {
    using mcpbridge::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::RequestTimeout), ErrorCategory::BridgeTimeout);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::TransportClosed), ErrorCategory::BridgeTransportClosed);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, KindNames) {
    EXPECT_STREQ(errors::errorKindName(ErrorKind::SpawnError), "SpawnError");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::HandshakeError), "HandshakeError");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::DiscoveryError), "DiscoveryError");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::Timeout), "Timeout");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::TransportClosed), "TransportClosed");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::NotFound), "NotFound");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::NotRunning), "NotRunning");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::ToolNotFound), "ToolNotFound");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::UpstreamError), "UpstreamError");
    EXPECT_STREQ(errors::errorKindName(ErrorKind::InvalidArgument), "InvalidArgument");
}

TEST(Errors, BridgeErrorToJSON) {
    BridgeError bare(ErrorKind::NotFound, "no such server");
    auto j = bare.ToJSON();
    EXPECT_EQ(getStringMember(j, "kind").value_or(""), "NotFound");
    EXPECT_EQ(getStringMember(j, "message").value_or(""), "no such server");
    EXPECT_EQ(findMember(j, "server"), nullptr);
    EXPECT_EQ(findMember(j, "data"), nullptr);

    BridgeError withData(ErrorKind::UpstreamError, "tool failed", "alpha", parseJSON(R"({"code":-32000})"));
    auto k = withData.ToJSON();
    EXPECT_EQ(getStringMember(k, "server").value_or(""), "alpha");
    const JSONValue* data = findMember(k, "data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(std::get<int64_t>(findMember(*data, "code")->value), -32000);
}

TEST(Errors, ParseErrorObject) {
    auto parsed = errors::mcpErrorFromErrorValue(parseJSON(R"({"code":-32602,"message":"bad","data":{"x":1}})"));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, "bad");
    EXPECT_TRUE(parsed->data.has_value());
    EXPECT_EQ(parsed->category, errors::ErrorCategory::JsonRpcInvalidParams);

    EXPECT_FALSE(errors::mcpErrorFromErrorValue(parseJSON(R"({"message":"no code"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(parseJSON(R"({"code":"x","message":"m"})")).has_value());
}

TEST(Errors, LocalTimeoutMapsToTimeoutKind) {
    JSONRPCResponse resp(JSONRPCId{std::string("1")},
                         errors::makeLocalErrorValue(JSONRPCErrorCodes::RequestTimeout, "Request timed out"), true);
    auto err = errors::bridgeErrorFromResponse("alpha", resp, ErrorKind::UpstreamError);
    EXPECT_EQ(err.kind(), ErrorKind::Timeout);
    EXPECT_EQ(err.server(), "alpha");
    EXPECT_FALSE(err.data().has_value());
}

TEST(Errors, LocalTransportClosedIgnoresUpstreamKind) {
    JSONRPCResponse resp(JSONRPCId{std::string("1")},
                         errors::makeLocalErrorValue(JSONRPCErrorCodes::TransportClosed, "Transport closed"), true);
    auto err = errors::bridgeErrorFromResponse("alpha", resp, ErrorKind::HandshakeError);
    EXPECT_EQ(err.kind(), ErrorKind::TransportClosed);
}

TEST(Errors, ChildErrorWithBridgeCodeStaysUpstream) {
    // A child may use -32001 for its own purposes; without the origin tag it is not a bridge timeout
    JSONRPCResponse resp(JSONRPCId{std::string("1")},
                         CreateErrorObject(JSONRPCErrorCodes::RequestTimeout, "server-side timeout"), true);
    auto err = errors::bridgeErrorFromResponse("alpha", resp, ErrorKind::UpstreamError);
    EXPECT_EQ(err.kind(), ErrorKind::UpstreamError);
    ASSERT_TRUE(err.data().has_value());
    EXPECT_EQ(std::get<int64_t>(findMember(err.data().value(), "code")->value), JSONRPCErrorCodes::RequestTimeout);
    EXPECT_STREQ(err.what(), "server-side timeout");
}

TEST(Errors, MalformedErrorObjectUsesUpstreamKind) {
    JSONRPCResponse resp(JSONRPCId{std::string("1")}, JSONValue("oops"), true);
    auto err = errors::bridgeErrorFromResponse("beta", resp, ErrorKind::DiscoveryError);
    EXPECT_EQ(err.kind(), ErrorKind::DiscoveryError);
    EXPECT_EQ(err.server(), "beta");
}

TEST(Errors, OutOfRangeCodesAreMalformed) {
    for (const char* text : {R"({"code":1e300,"message":"huge"})", R"({"code":4294967296,"message":"wide"})",
                             R"({"code":-3000000000,"message":"wide"})", R"({"code":3.5,"message":"fraction"})"}) {
        EXPECT_FALSE(errors::mcpErrorFromErrorValue(parseJSON(text)).has_value()) << text;
    }
    auto integral = errors::mcpErrorFromErrorValue(parseJSON(R"({"code":-32000.0,"message":"float form"})"));
    ASSERT_TRUE(integral.has_value());
    EXPECT_EQ(integral->code, -32000);

    // A child reply with such a code is reported with the caller's kind, not a bogus category
    JSONRPCResponse resp(JSONRPCId{std::string("1")}, parseJSON(R"({"code":1e300,"message":"huge"})"), true);
    auto err = errors::bridgeErrorFromResponse("gamma", resp, ErrorKind::UpstreamError);
    EXPECT_EQ(err.kind(), ErrorKind::UpstreamError);
}

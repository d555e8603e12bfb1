//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;

TEST(Errors, CategoryNames) {
    using toolhost::errors::ErrorCategory;
    EXPECT_STREQ(errors::toString(ErrorCategory::ValidationRejected), "ValidationRejected");
    EXPECT_STREQ(errors::toString(ErrorCategory::ConnectionFailed), "ConnectionFailed");
    EXPECT_STREQ(errors::toString(ErrorCategory::NotConnected), "NotConnected");
    EXPECT_STREQ(errors::toString(ErrorCategory::ToolExecutionFailed), "ToolExecutionFailed");
    EXPECT_STREQ(errors::toString(ErrorCategory::RegistryUnavailable), "RegistryUnavailable");
    EXPECT_STREQ(errors::toString(ErrorCategory::InvalidArguments), "InvalidArguments");
    EXPECT_STREQ(errors::toString(ErrorCategory::ConfigurationError), "ConfigurationError");
}

TEST(Errors, ToolhostErrorKeepsCategoryAndCode) {
    errors::ToolhostError plain(errors::ErrorCategory::NotConnected, "Server x is not connected");
    EXPECT_EQ(plain.category(), errors::ErrorCategory::NotConnected);
    EXPECT_FALSE(plain.rpcCode().has_value());
    EXPECT_STREQ(plain.what(), "Server x is not connected");

    errors::ToolhostError coded(errors::ErrorCategory::ConnectionFailed, "closed", JSONRPCErrorCodes::ConnectionClosed);
    EXPECT_EQ(coded.rpcCode().value_or(0), JSONRPCErrorCodes::ConnectionClosed);
}

TEST(Errors, FromErrorValue_Valid) {
    JSONValue::Object dataObj; dataObj["foo"] = std::make_shared<JSONValue>(std::string("bar"));
    JSONValue::Object errObj;
    errObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(JSONRPCErrorCodes::MethodNotFound));
    errObj["message"] = std::make_shared<JSONValue>(std::string("Method not found"));
    errObj["data"] = std::make_shared<JSONValue>(JSONValue{dataObj});

    auto parsed = errors::rpcErrorFromValue(JSONValue{errObj});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(parsed->message, std::string("Method not found"));
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(getStringMember(*parsed->data, "foo").value_or(""), "bar");
}

TEST(Errors, FromErrorValue_InvalidShape) {
    // Not an object
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{nullptr}).has_value());

    // Missing code
    JSONValue::Object missCode; missCode["message"] = std::make_shared<JSONValue>(std::string("m"));
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{missCode}).has_value());

    // Missing message
    JSONValue::Object missMsg; missMsg["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(-1));
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{missMsg}).has_value());

    // Wrong types
    JSONValue::Object wrongTypes;
    wrongTypes["code"] = std::make_shared<JSONValue>(std::string("-32601"));
    wrongTypes["message"] = std::make_shared<JSONValue>(static_cast<int64_t>(123));
    EXPECT_FALSE(errors::rpcErrorFromValue(JSONValue{wrongTypes}).has_value());
}

TEST(Errors, FromResponse) {
    auto resp = CreateErrorResponse(std::string("1"), JSONRPCErrorCodes::InvalidParams, "bad args", std::nullopt);
    ASSERT_TRUE(resp != nullptr);
    auto parsed = errors::rpcErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->message, std::string("bad args"));
    EXPECT_FALSE(parsed->data.has_value());

    JSONRPCResponse ok(std::string("2"), JSONValue{JSONValue::Object{}});
    EXPECT_FALSE(errors::rpcErrorFromResponse(ok).has_value());
}

TEST(Errors, TransportAttachedData) {
    JSONValue::Object net;
    net["networkError"] = std::make_shared<JSONValue>(std::string("connection refused"));
    errors::RpcError network{JSONRPCErrorCodes::InternalError, "net", JSONValue{net}};
    EXPECT_TRUE(errors::isNetworkRpcError(network));
    EXPECT_EQ(errors::httpStatusFromRpcError(network), 0);

    JSONValue::Object status;
    status["httpStatus"] = std::make_shared<JSONValue>(static_cast<int64_t>(401));
    errors::RpcError auth{JSONRPCErrorCodes::InternalError, "auth", JSONValue{status}};
    EXPECT_FALSE(errors::isNetworkRpcError(auth));
    EXPECT_EQ(errors::httpStatusFromRpcError(auth), 401);

    errors::RemoteError remote(errors::ErrorCategory::ConnectionFailed, "HTTP 401", auth);
    EXPECT_EQ(remote.rpcCode().value_or(0), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(errors::httpStatusFromRpcError(remote.rpc()), 401);
}

TEST(Errors, RemoteErrorMessageBuiltFromItsOwnRpcError) {
    errors::RpcError rpc{JSONRPCErrorCodes::InvalidParams, "bad path", std::nullopt};
    errors::RemoteError e(errors::ErrorCategory::ToolExecutionFailed, "Tool read failed: " + rpc.message, std::move(rpc));
    EXPECT_EQ(std::string(e.what()), "Tool read failed: bad path");
    EXPECT_EQ(e.rpc().message, "bad path");
    EXPECT_EQ(e.rpcCode().value_or(0), JSONRPCErrorCodes::InvalidParams);
}

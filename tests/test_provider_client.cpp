//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_provider_client.cpp
// Purpose: GoogleTests for the provider session handshake and result normalization
//==========================================================================================================

#include <gtest/gtest.h>
#include "FakeProvider.h"
#include "toolhost/ProviderClient.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace toolhost::fakes;

namespace {
std::unique_ptr<ProviderClient> connectedClient(const std::shared_ptr<FakeProvider>& provider) {
    auto client = std::make_unique<ProviderClient>(Implementation("client-test", "0.0.1"));
    client->Connect(std::make_unique<FakeTransport>(provider)).get();
    return client;
}
} // namespace

TEST(ProviderClient, InitializeSendsRequestThenNotification) {
    auto provider = std::make_shared<FakeProvider>();
    auto client = connectedClient(provider);
    EXPECT_TRUE(client->IsConnected());
    EXPECT_EQ(client->GetSessionId(), "fake-session");

    auto init = client->Initialize().get();
    EXPECT_EQ(init.protocolVersion, PROTOCOL_VERSION);
    EXPECT_EQ(init.serverInfo.name, "fake");
    EXPECT_TRUE(init.hasToolsCapability);

    std::lock_guard<std::mutex> lk(provider->mutex);
    EXPECT_EQ(provider->methods, std::vector<std::string>{Methods::Initialize});
    EXPECT_EQ(provider->notifications, std::vector<std::string>{Methods::Initialized});
}

TEST(ProviderClient, MissingToolsCapabilityIsNotFatal) {
    auto provider = std::make_shared<FakeProvider>();
    provider->advertiseTools = false;
    auto client = connectedClient(provider);
    auto init = client->Initialize().get();
    EXPECT_FALSE(init.hasToolsCapability);
}

TEST(ProviderClient, StartFailureSurfacesFromConnect) {
    auto provider = std::make_shared<FakeProvider>();
    provider->startError = std::make_exception_ptr(std::runtime_error("spawn failed"));
    ProviderClient client(Implementation("client-test", "0.0.1"));
    EXPECT_THROW(client.Connect(std::make_unique<FakeTransport>(provider)).get(), std::runtime_error);
}

TEST(ProviderClient, RequestsBeforeConnectFail) {
    ProviderClient client(Implementation("client-test", "0.0.1"));
    EXPECT_FALSE(client.IsConnected());
    EXPECT_THROW(client.ListTools().get(), errors::ToolhostError);
    EXPECT_NO_THROW(client.Disconnect().get());
}

TEST(ProviderClient, ListToolsErrorIsConnectionFailed) {
    auto provider = std::make_shared<FakeProvider>();
    provider->listError = std::make_pair(JSONRPCErrorCodes::InternalError, std::string("nope"));
    auto client = connectedClient(provider);
    try {
        client->ListTools().get();
        FAIL() << "expected RemoteError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ConnectionFailed);
        EXPECT_EQ(std::string(e.what()), "tools/list failed: nope");
    }
}

TEST(ProviderClient, CallToolForwardsNameAndArguments) {
    auto provider = std::make_shared<FakeProvider>();
    std::string seenName;
    std::string seenPath;
    provider->onCall = [&](const std::string& name, const JSONValue& args) {
        seenName = name;
        seenPath = getStringMember(args, "path").value_or("");
        return textResult("done");
    };
    auto client = connectedClient(provider);
    auto result = client->CallTool("read_file", parseJSONValue(R"({"path":"/etc/hosts"})")).get();
    EXPECT_EQ(seenName, "read_file");
    EXPECT_EQ(seenPath, "/etc/hosts");
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(getStringMember(result.content[0], "text").value_or(""), "done");
    EXPECT_FALSE(result.isError);
}

TEST(ProviderClient, DisconnectClosesTransport) {
    auto provider = std::make_shared<FakeProvider>();
    auto client = connectedClient(provider);
    client->Disconnect().get();
    EXPECT_EQ(provider->closes.load(), 1);
    EXPECT_FALSE(client->IsConnected());
    try {
        client->ListTools().get();
        FAIL() << "expected ConnectionClosed";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.rpc().code, JSONRPCErrorCodes::ConnectionClosed);
    }
}

TEST(ProviderClientNormalization, ToolsList) {
    auto tools = ProviderClient::ParseToolsList(parseJSONValue(R"({"tools":[
        {"name":"a","description":"A","inputSchema":{"type":"object","properties":{"x":{"type":"string"}}}},
        {"name":"b","inputSchema":"not-an-object"},
        {"name":7},
        {"description":"anonymous"}
    ]})"));
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].description, "A");
    EXPECT_NE(findMember(tools[0].inputSchema, "properties"), nullptr);
    EXPECT_EQ(tools[1].description, "");
    EXPECT_EQ(getStringMember(tools[1].inputSchema, "type").value_or(""), "object");

    EXPECT_TRUE(ProviderClient::ParseToolsList(parseJSONValue("{}")).empty());
}

TEST(ProviderClientNormalization, CallResult) {
    auto r = ProviderClient::ParseCallToolResult(parseJSONValue(R"({"content":[{"type":"text","text":"x"}],"isError":true})"));
    EXPECT_EQ(r.content.size(), 1u);
    EXPECT_TRUE(r.isError);

    auto bare = ProviderClient::ParseCallToolResult(parseJSONValue(R"({"isError":"yes"})"));
    EXPECT_TRUE(bare.content.empty());
    EXPECT_FALSE(bare.isError);
}

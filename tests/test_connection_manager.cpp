//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_connection_manager.cpp
// Purpose: GoogleTests for connection lifecycle, per-id serialization, probing and error diagnosis
//==========================================================================================================

#include <gtest/gtest.h>
#include "FakeProvider.h"
#include "toolhost/ConnectionManager.h"
#include "toolhost/TransportFactory.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/PackageRegistry.h"
#include <cerrno>
#include <chrono>
#include <system_error>
#include <thread>

using namespace toolhost;
using namespace toolhost::fakes;
using namespace std::chrono_literals;

namespace {

ConnectionManager::Options testOptions(std::chrono::milliseconds timeout = 2000ms) {
    ConnectionManager::Options o;
    o.clientInfo = Implementation("cm-test", "1.0");
    o.connectTimeout = timeout;
    o.systemProbe = [](const std::string&) { return true; };
    return o;
}

std::shared_ptr<registry::PackageRegistry> fallbackRegistry() {
    return std::make_shared<registry::PackageRegistry>(registry::PackageRegistry::Options{});
}

// Runs f, expecting a ToolhostError of the category; returns its message.
template <typename F>
std::string expectToolhostError(F&& f, errors::ErrorCategory category) {
    try {
        f();
    } catch (const errors::ToolhostError& e) {
        EXPECT_EQ(e.category(), category) << e.what();
        return e.what();
    }
    ADD_FAILURE() << "expected " << errors::toString(category);
    return std::string();
}

} // namespace

TEST(ConnectionManager, ListToolsOnUnknownIdIsNotConnectedWithoutIO) {
    auto factory = std::make_shared<FakeTransportFactory>();
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    auto msg = expectToolhostError([&] { cm.ListTools("missing").get(); }, errors::ErrorCategory::NotConnected);
    EXPECT_NE(msg.find("missing"), std::string::npos);
    expectToolhostError([&] { cm.CallTool("missing", "t", JSONValue{JSONValue::Object{}}).get(); },
                        errors::ErrorCategory::NotConnected);
    EXPECT_EQ(factory->created.load(), 0);
}

TEST(ConnectionManager, ConnectRunsHandshakeAndRegisters) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto b = factory->Add("b");
    factory->Add("a");
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());

    ASSERT_NO_THROW(cm.Connect(stdioConfig("b")).get());
    ASSERT_NO_THROW(cm.Connect(stdioConfig("a")).get());
    EXPECT_TRUE(cm.IsConnected("a"));
    EXPECT_EQ(cm.GetConnectedServers(), (std::vector<std::string>{"a", "b"}));

    std::lock_guard<std::mutex> lk(b->mutex);
    ASSERT_EQ(b->methods.size(), 1u);
    EXPECT_EQ(b->methods[0], Methods::Initialize);
    ASSERT_EQ(b->notifications.size(), 1u);
    EXPECT_EQ(b->notifications[0], Methods::Initialized);
}

TEST(ConnectionManager, SecondConnectIsRejected) {
    auto factory = std::make_shared<FakeTransportFactory>();
    factory->Add("fs");
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    cm.Connect(stdioConfig("fs")).get();
    auto msg = expectToolhostError([&] { cm.Connect(stdioConfig("fs")).get(); },
                                   errors::ErrorCategory::ConnectionFailed);
    EXPECT_NE(msg.find("already connected"), std::string::npos);
    EXPECT_EQ(factory->created.load(), 1);
}

TEST(ConnectionManager, ConnectWhileConnectingIsRejected) {
    auto factory = std::make_shared<FakeTransportFactory>();
    factory->Add("slow")->hangOnStart = true;
    ConnectionManager cm(factory, fallbackRegistry(), testOptions(500ms));

    auto first = cm.Connect(stdioConfig("slow"));
    auto msg = expectToolhostError([&] { cm.Connect(stdioConfig("slow")).get(); },
                                   errors::ErrorCategory::ConnectionFailed);
    EXPECT_NE(msg.find("already in progress"), std::string::npos);
    EXPECT_THROW(first.get(), errors::ToolhostError);
}

TEST(ConnectionManager, TimeoutTearsDownTransport) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto slow = factory->Add("slow");
    slow->hangOnStart = true;
    ConnectionManager cm(factory, fallbackRegistry(), testOptions(100ms));

    auto msg = expectToolhostError([&] { cm.Connect(stdioConfig("slow")).get(); },
                                   errors::ErrorCategory::ConnectionFailed);
    EXPECT_NE(msg.find("timed out after 100 ms"), std::string::npos);
    EXPECT_EQ(slow->closes.load(), 1);
    EXPECT_FALSE(cm.IsConnected("slow"));

    // The id is free again after the failed attempt.
    slow->hangOnStart = false;
    EXPECT_NO_THROW(cm.Connect(stdioConfig("slow")).get());
}

TEST(ConnectionManager, FactoryErrorsPropagateUnchanged) {
    auto factory = std::make_shared<DefaultTransportFactory>();
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    auto msg = expectToolhostError([&] { cm.Connect(stdioConfig("evil", "bash", {"-c", "rm -rf /"})).get(); },
                                   errors::ErrorCategory::ValidationRejected);
    EXPECT_NE(msg.find("bash"), std::string::npos);
    EXPECT_FALSE(cm.IsConnected("evil"));

    ServerConfig noUrl;
    noUrl.id = "remote";
    noUrl.transport = TransportKind::Http;
    expectToolhostError([&] { cm.Connect(noUrl).get(); }, errors::ErrorCategory::ConfigurationError);
}

TEST(ConnectionManager, MissingExecutableIsDiagnosed) {
    auto factory = std::make_shared<FakeTransportFactory>();
    factory->Add("ghost")->startError =
        std::make_exception_ptr(std::system_error(ENOENT, std::generic_category(), "exec /nope"));
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    auto msg = expectToolhostError([&] { cm.Connect(stdioConfig("ghost", "/nope", {})).get(); },
                                   errors::ErrorCategory::ConnectionFailed);
    EXPECT_EQ(msg, "Command not found: /nope. Please ensure Node.js and npm are properly installed and accessible.");
}

TEST(ConnectionManager, NpxClosureUsesRegistry) {
    auto factory = std::make_shared<FakeTransportFactory>();
    factory->Add("sqlite")->startError = std::make_exception_ptr(
        errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, "Connection closed",
                              JSONRPCErrorCodes::ConnectionClosed));
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    auto msg = expectToolhostError(
        [&] { cm.Connect(stdioConfig("sqlite", "npx", {"-y", "@modelcontextprotocol/server-sqlite"})).get(); },
        errors::ErrorCategory::ConnectionFailed);
    EXPECT_EQ(msg.rfind("Package not available: @modelcontextprotocol/server-sqlite.", 0), 0u) << msg;
}

TEST(ConnectionManager, DisconnectAndDisconnectAll) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto a = factory->Add("a");
    auto b = factory->Add("b");
    auto c = factory->Add("c");
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    cm.Connect(stdioConfig("a")).get();
    cm.Connect(stdioConfig("b")).get();
    cm.Connect(stdioConfig("c")).get();

    ASSERT_NO_THROW(cm.Disconnect("a").get());
    EXPECT_FALSE(cm.IsConnected("a"));
    EXPECT_EQ(a->closes.load(), 1);
    ASSERT_NO_THROW(cm.Disconnect("a").get());
    ASSERT_NO_THROW(cm.Disconnect("never").get());

    ASSERT_NO_THROW(cm.DisconnectAll().get());
    EXPECT_TRUE(cm.GetConnectedServers().empty());
    EXPECT_EQ(b->closes.load(), 1);
    EXPECT_EQ(c->closes.load(), 1);
}

TEST(ConnectionManager, ListAndCallNormalizeResults) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto fs = factory->Add("fs");
    fs->tools = {toolEntry("read", "Read"), toolEntry("bare"), parseJSONValue(R"({"description":"no name"})")};
    fs->onCall = [](const std::string&, const JSONValue&) { return parseJSONValue(R"({"content":"oops"})"); };
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    cm.Connect(stdioConfig("fs")).get();

    auto tools = cm.ListTools("fs").get();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[1].name, "bare");
    EXPECT_EQ(tools[1].description, "");
    EXPECT_EQ(getStringMember(tools[1].inputSchema, "type").value_or(""), "object");

    auto result = cm.CallTool("fs", "read", JSONValue{JSONValue::Object{}}).get();
    EXPECT_TRUE(result.content.empty());
    EXPECT_FALSE(result.isError);
}

TEST(ConnectionManager, RemoteToolErrorIsToolExecutionFailed) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto fs = factory->Add("fs");
    fs->callError = std::make_pair(JSONRPCErrorCodes::InvalidParams, std::string("bad path"));
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    cm.Connect(stdioConfig("fs")).get();
    try {
        cm.CallTool("fs", "read", JSONValue{JSONValue::Object{}}).get();
        FAIL() << "expected RemoteError";
    } catch (const errors::RemoteError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ToolExecutionFailed);
        EXPECT_EQ(e.rpc().code, JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(std::string(e.what()), "Tool read failed: bad path");
    }
    EXPECT_TRUE(cm.IsConnected("fs"));
}

TEST(ConnectionManager, PingReportsLivenessAndDropsDeadConnections) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto fs = factory->Add("fs");
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    EXPECT_FALSE(cm.Ping("fs").get());
    cm.Connect(stdioConfig("fs")).get();
    EXPECT_TRUE(cm.Ping("fs").get());

    fs->alive = false;
    EXPECT_FALSE(cm.Ping("fs").get());
    EXPECT_FALSE(cm.IsConnected("fs"));
}

TEST(ConnectionManager, ProbeNeverRegisters) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto fs = factory->Add("fs");
    fs->tools = {toolEntry("a"), toolEntry("b")};
    factory->Add("slow")->hangOnStart = true;
    ConnectionManager cm(factory, fallbackRegistry(), testOptions(150ms));

    auto ok = cm.ProbeConnection(stdioConfig("fs")).get();
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.toolCount, 2u);
    EXPECT_EQ(ok.message, "Connected successfully, 2 tools available");
    EXPECT_FALSE(cm.IsConnected("fs"));
    EXPECT_EQ(fs->closes.load(), 1);

    auto slow = cm.ProbeConnection(stdioConfig("slow")).get();
    EXPECT_FALSE(slow.success);
    EXPECT_NE(slow.message.find("timed out after 150 ms"), std::string::npos);

    auto rejected = cm.ProbeConnection(stdioConfig("unknown")).get();
    EXPECT_FALSE(rejected.success);
    EXPECT_NE(rejected.message.find("unknown"), std::string::npos);
}

TEST(ConnectionManager, RegistryAndDiagnosticsDelegation) {
    auto factory = std::make_shared<FakeTransportFactory>();
    auto options = testOptions();
    options.systemProbe = [](const std::string& tool) { return tool != "pip3"; };
    ConnectionManager cm(factory, fallbackRegistry(), options);

    EXPECT_EQ(cm.GetRegistry().version, "1.0.0");
    auto v = cm.ValidatePackage("@modelcontextprotocol/server-memory");
    EXPECT_TRUE(v.valid);
    EXPECT_EQ(v.status, "active");

    auto diag = cm.DiagnoseSystem();
    bool sawPip = false;
    for (const auto& issue : diag.issues) {
        sawPip = sawPip || issue.find("pip3") != std::string::npos;
    }
    EXPECT_TRUE(sawPip);
    EXPECT_FALSE(diag.success);
}

TEST(ConnectionManager, DifferentIdsConnectConcurrently) {
    auto factory = std::make_shared<FakeTransportFactory>();
    for (int i = 0; i < 8; ++i) {
        factory->Add("s" + std::to_string(i));
    }
    ConnectionManager cm(factory, fallbackRegistry(), testOptions());
    std::vector<std::future<void>> pending;
    for (int i = 0; i < 8; ++i) {
        pending.push_back(cm.Connect(stdioConfig("s" + std::to_string(i))));
    }
    for (auto& f : pending) {
        ASSERT_NO_THROW(f.get());
    }
    EXPECT_EQ(cm.GetConnectedServers().size(), 8u);
}

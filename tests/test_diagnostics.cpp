//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_diagnostics.cpp
// Purpose: GoogleTests for host environment checks and connection failure messages
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/diagnostics/Diagnostics.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/PackageRegistry.h"
#include <cerrno>
#include <set>
#include <system_error>

using namespace toolhost;
using namespace toolhost::diagnostics;

namespace {

ServerConfig stdio(const std::string& command, std::vector<std::string> args = {}) {
    ServerConfig cfg;
    cfg.id = "srv";
    cfg.command = command;
    cfg.args = std::move(args);
    return cfg;
}

ServerConfig remote(TransportKind kind, const std::string& url) {
    ServerConfig cfg;
    cfg.id = "remote";
    cfg.transport = kind;
    cfg.baseUrl = url;
    return cfg;
}

std::exception_ptr errnoFailure(int code) {
    return std::make_exception_ptr(std::system_error(code, std::generic_category(), "spawn"));
}

std::exception_ptr closedFailure() {
    return std::make_exception_ptr(errors::ToolhostError(errors::ErrorCategory::ConnectionFailed,
                                                         "Connection closed", JSONRPCErrorCodes::ConnectionClosed));
}

std::exception_ptr httpFailure(int status, bool network = false) {
    JSONValue::Object data;
    if (network) {
        data["networkError"] = std::make_shared<JSONValue>(std::string("connection refused"));
    } else {
        data["httpStatus"] = std::make_shared<JSONValue>(static_cast<int64_t>(status));
    }
    errors::RpcError rpc{JSONRPCErrorCodes::InternalError, "HTTP failure", JSONValue{data}};
    return std::make_exception_ptr(errors::RemoteError(errors::ErrorCategory::ConnectionFailed, "HTTP failure", rpc));
}

} // namespace

TEST(DiagnoseSystem, EverythingPresent) {
    auto d = DiagnoseSystem([](const std::string&) { return true; }, "/usr/local/bin:/usr/bin");
    EXPECT_TRUE(d.success);
    EXPECT_TRUE(d.issues.empty());
    EXPECT_TRUE(d.recommendations.empty());
}

TEST(DiagnoseSystem, MissingToolsAndPath) {
    std::set<std::string> probed;
    auto d = DiagnoseSystem([&](const std::string& tool) {
        probed.insert(tool);
        return tool == "python3";
    }, "/usr/bin:/bin");
    EXPECT_FALSE(d.success);
    EXPECT_EQ(probed, (std::set<std::string>{"node", "npm", "npx", "python3", "pip3", "uvx"}));
    // node, npm, npx, pip3 and the PATH check; uvx is only a recommendation.
    EXPECT_EQ(d.issues.size(), 5u);
    EXPECT_EQ(d.recommendations.size(), 6u);
    EXPECT_EQ(d.issues.back(), "Common Node.js paths not in PATH environment variable");
}

TEST(DiagnoseSystem, OnlyUvxMissingIsStillSuccess) {
    auto d = DiagnoseSystem([](const std::string& tool) { return tool != "uvx"; }, "/opt/homebrew/bin");
    EXPECT_TRUE(d.success);
    ASSERT_EQ(d.recommendations.size(), 1u);
    EXPECT_NE(d.recommendations[0].find("uv"), std::string::npos);
}

TEST(DiagnoseConnectionFailure, StdioSpawnErrors) {
    registry::PackageRegistry reg(registry::PackageRegistry::Options{});
    EXPECT_EQ(DiagnoseConnectionFailure(stdio("node", {"a.js"}), errnoFailure(ENOENT), reg),
              "Command not found: node. Please ensure Node.js and npm are properly installed and accessible.");
    EXPECT_EQ(DiagnoseConnectionFailure(stdio("/opt/srv"), errnoFailure(EACCES), reg),
              "Permission denied executing: /opt/srv. Please check file permissions.");
}

TEST(DiagnoseConnectionFailure, EarlyExitOfNonNpxServer) {
    registry::PackageRegistry reg(registry::PackageRegistry::Options{});
    EXPECT_EQ(DiagnoseConnectionFailure(stdio("node", {"a.js"}), closedFailure(), reg),
              "MCP server connection failed. The server process may have exited unexpectedly. "
              "Please check the server logs for more details.");
}

TEST(DiagnoseConnectionFailure, NpxClosureConsultsRegistry) {
    registry::PackageRegistry reg(registry::PackageRegistry::Options{});
    auto deprecated = DiagnoseConnectionFailure(stdio("npx", {"-y", "@modelcontextprotocol/server-sqlite"}),
                                                closedFailure(), reg);
    EXPECT_EQ(deprecated.rfind("Package not available: @modelcontextprotocol/server-sqlite. Package never existed.", 0), 0u)
        << deprecated;

    auto active = DiagnoseConnectionFailure(stdio("npx", {"-y", "@modelcontextprotocol/server-memory"}),
                                            closedFailure(), reg);
    EXPECT_EQ(active.rfind("MCP package installation failed: @modelcontextprotocol/server-memory.", 0), 0u) << active;

    auto unknown = DiagnoseConnectionFailure(stdio("npx some-unknown-pkg"), closedFailure(), reg);
    EXPECT_EQ(unknown.rfind("Unknown MCP package: some-unknown-pkg. Available packages: ", 0), 0u) << unknown;
}

TEST(DiagnoseConnectionFailure, NpxCommandFieldSplitOnAnyWhitespace) {
    registry::PackageRegistry reg(registry::PackageRegistry::Options{});
    auto tabbed = DiagnoseConnectionFailure(stdio("npx\t-y  @modelcontextprotocol/server-sqlite"), closedFailure(), reg);
    EXPECT_EQ(tabbed.rfind("Package not available: @modelcontextprotocol/server-sqlite.", 0), 0u) << tabbed;

    auto pathed = DiagnoseConnectionFailure(stdio("/usr/local/bin/npx", {"-y", "@modelcontextprotocol/server-memory"}),
                                            closedFailure(), reg);
    EXPECT_EQ(pathed.rfind("MCP package installation failed: @modelcontextprotocol/server-memory.", 0), 0u) << pathed;
}

TEST(DiagnoseConnectionFailure, RemoteFailures) {
    registry::PackageRegistry reg(registry::PackageRegistry::Options{});
    const std::string url = "https://example.com/mcp";
    EXPECT_EQ(DiagnoseConnectionFailure(remote(TransportKind::Http, url), httpFailure(0, true), reg),
              "Network error connecting to HTTP server at " + url + ". Please check the URL and network connection.");
    EXPECT_EQ(DiagnoseConnectionFailure(remote(TransportKind::Sse, url), httpFailure(401), reg),
              "Authentication failed for SSE server. Please check your API key and permissions.");
    EXPECT_EQ(DiagnoseConnectionFailure(remote(TransportKind::Http, url), httpFailure(403), reg),
              "Authentication failed for HTTP server. Please check your API key and permissions.");
    EXPECT_EQ(DiagnoseConnectionFailure(remote(TransportKind::Http, url), httpFailure(404), reg),
              "HTTP server not found at " + url + ". Please check the URL.");
    EXPECT_EQ(DiagnoseConnectionFailure(remote(TransportKind::Http, url), httpFailure(500), reg), "HTTP failure");
}

TEST(DiagnoseConnectionFailure, UnmatchedFailureReturnsRawMessage) {
    registry::PackageRegistry reg(registry::PackageRegistry::Options{});
    auto raw = std::make_exception_ptr(std::runtime_error("handshake garbage"));
    EXPECT_EQ(DiagnoseConnectionFailure(stdio("node", {"a.js"}), raw, reg), "handshake garbage");
}

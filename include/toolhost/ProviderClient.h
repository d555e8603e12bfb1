//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderClient.h
// Purpose: Protocol client for one tool provider: handshake, tool listing and tool calls over an ITransport
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// ProviderClient
// Purpose: Owns the transport of one connection. All operations are asynchronous; failures are stored in
//          the returned futures as errors::ToolhostError (errors::RemoteError when the provider answered with
//          a JSON-RPC error object).
//==========================================================================================================
class ProviderClient {
public:
    explicit ProviderClient(const Implementation& clientInfo);
    ~ProviderClient();

    ProviderClient(const ProviderClient&) = delete;
    ProviderClient& operator=(const ProviderClient&) = delete;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Connect
    // Purpose: Takes ownership of the transport, installs handlers and starts it.
    // Returns:
    //   Future holding the transport's start failure (std::system_error for spawn errors, RemoteError for
    //   HTTP/SSE failures) when the channel could not be opened.
    //==========================================================================================================
    std::future<void> Connect(std::unique_ptr<ITransport> transport);

    //==========================================================================================================
    // Initialize
    // Purpose: Sends "initialize" (protocolVersion, capabilities, clientInfo), then the
    //          "notifications/initialized" notification.
    // Returns:
    //   Future resolving to the provider's InitializeResult. ConnectionFailed on error responses.
    //==========================================================================================================
    std::future<InitializeResult> Initialize();

    // Closes the transport; in-flight requests complete with ConnectionClosed. Never fails.
    std::future<void> Disconnect();

    bool IsConnected() const;
    std::string GetSessionId() const;

    /////////////////////////////////////////// Tools ///////////////////////////////////////////
    // tools/list, normalized with ParseToolsList.
    std::future<std::vector<Tool>> ListTools();

    //==========================================================================================================
    // CallTool
    // Purpose: tools/call, normalized with ParseCallToolResult.
    // Returns:
    //   Future resolving to the result. A JSON-RPC error yields RemoteError with ToolExecutionFailed.
    //==========================================================================================================
    std::future<CallToolResult> CallTool(const std::string& name, const JSONValue& arguments);

    /////////////////////////////////////////// Normalization ///////////////////////////////////////////
    // Entries without a string name are dropped; description defaults to "" and inputSchema to {type:object}.
    static std::vector<Tool> ParseToolsList(const JSONValue& result);

    // content defaults to an empty array and isError to false.
    static CallToolResult ParseCallToolResult(const JSONValue& result);

    static InitializeResult ParseInitializeResult(const JSONValue& result);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost

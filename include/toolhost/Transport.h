//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - channel abstraction between the host and one tool provider
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <cstdint>

namespace toolhost {

// Forward declarations
class JSONRPCRequest;
class JSONRPCResponse;
class JSONRPCNotification;
struct ServerConfig;

//==========================================================================================================
// Transport interface
// Purpose: One bidirectional JSON-RPC channel (subprocess stdio, streamable HTTP, or server-sent events).
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport (spawns the process or opens the stream).
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the channel is usable; holds an exception when it cannot be opened.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. In-flight requests fail with ConnectionClosed.
    // Args:
    //   (none)
    // Returns:
    //   A future that completes when the transport has closed.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    //==========================================================================================================
    // Indicates whether the transport is currently connected.
    //==========================================================================================================
    virtual bool IsConnected() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Sends a JSON-RPC request and returns a future for the response.
    // Args:
    //   request: Unique pointer to a JSONRPCRequest to send. An empty id is replaced by a generated one.
    // Returns:
    //   Future resolving to a unique_ptr<JSONRPCResponse>; transport failures are encoded as error responses.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) = 0;

    //==========================================================================================================
    // Sends a JSON-RPC notification (no response expected).
    //==========================================================================================================
    virtual std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    using NotificationHandler = std::function<void(std::unique_ptr<JSONRPCNotification>)>;
    virtual void SetNotificationHandler(NotificationHandler handler) = 0;

    // Requests initiated by the provider (e.g. ping); the transport writes the returned response back.
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Builds a transport for a declared server. Implementations validate and resolve launch commands.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance for the given server.
    // Args:
    //   config: Declared server (transport kind, command or base URL).
    // Returns:
    //   A unique_ptr to a newly created, not yet started ITransport. Throws errors::ToolhostError with
    //   ValidationRejected or ConnectionFailed when no transport can be built.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) = 0;
};

//==========================================================================================================
// AnswerInboundRequest
// Purpose: Produces the reply to a request initiated by the provider. Uses the registered handler when
//          present; otherwise answers "ping" with an empty result and anything else with MethodNotFound.
//          Handler exceptions become InternalError responses. The reply always carries the request id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> AnswerInboundRequest(const ITransport::RequestHandler& handler,
                                                      const JSONRPCRequest& request);

} // namespace toolhost

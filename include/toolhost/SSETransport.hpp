//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSETransport.hpp
// Purpose: Server-sent events transport: long-lived GET stream for inbound messages, POST for outbound
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <string>
#include <future>

#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// SSETransport
// Purpose: Opens GET <url> with Accept: text/event-stream and waits for the "endpoint" event naming the URL
//          that accepts POSTed messages. Responses, notifications and provider requests all arrive as
//          "message" events on the stream.
//==========================================================================================================
class SSETransport : public ITransport {
public:
    struct Options {
        std::string url;
        std::map<std::string, std::string> headers;
        std::string caFile;
        unsigned int connectTimeoutMs{15000};  // connect + endpoint event
        unsigned int requestTimeoutMs{60000};  // per request; 0 disables
    };

    explicit SSETransport(const Options& opts);
    ~SSETransport() override;

    //==========================================================================================================
    // Opens the event stream.
    // Returns:
    //   Future that completes once the endpoint event has been received. Holds errors::RemoteError with
    //   data.httpStatus (non-2xx reply) or data.networkError (resolve/connect/TLS failure), or
    //   errors::ToolhostError(ConfigurationError) for an invalid URL.
    //==========================================================================================================
    std::future<void> Start() override;

    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Absolute URL announced by the endpoint event; empty before Start completes.
    std::string GetEndpointUrl() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: Streamable HTTP transport: every JSON-RPC message is POSTed to the server's base URL
//==========================================================================================================
#pragma once

#include <map>
#include <memory>
#include <string>
#include <future>
#include <utility>
#include <vector>

#include "toolhost/Transport.h"

namespace toolhost {

//==========================================================================================================
// HTTPTransport
// Purpose: Client side of the streamable HTTP transport. Replies may be application/json or a short
//          text/event-stream; the Mcp-Session-Id header assigned by the server is echoed on later requests.
//          HTTP statuses >= 400 and network failures are returned as error responses whose data carries
//          "httpStatus" or "networkError".
//==========================================================================================================
class HTTPTransport : public ITransport {
public:
    struct HttpResponseInfo {
        int status{0};
        std::vector<std::pair<std::string, std::string>> headers;
    };

    struct Options {
        std::string baseUrl;
        std::map<std::string, std::string> headers;
        std::string caFile;
        unsigned int connectTimeoutMs{10000};
        unsigned int readTimeoutMs{60000};
    };

    explicit HTTPTransport(const Options& opts);
    ~HTTPTransport() override;

    //==========================================================================================================
    // Starts the I/O thread. The future holds errors::ToolhostError(ConfigurationError) when the base URL is
    // not a valid http(s) URL or the CA file cannot be loaded.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the I/O thread; pending requests complete with ConnectionClosed.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;

    // Server assigned Mcp-Session-Id when present, otherwise a local diagnostic id.
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // QueryLastHttpResponse
    // Purpose: Status and headers of the most recent HTTP response.
    // Returns:
    //   false when no response has been received yet.
    //==========================================================================================================
    bool QueryLastHttpResponse(HttpResponseInfo& out) const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost

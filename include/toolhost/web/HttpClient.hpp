//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: One-shot HTTP(S) POST coroutine shared by the streamable HTTP and SSE transports
//==========================================================================================================
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/web/Url.h"

namespace toolhost {
namespace web {

struct HttpResult {
    unsigned int status{0};
    std::string reason;
    std::string contentType;
    std::string sessionId;  // Mcp-Session-Id response header, empty when absent
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

// Name of the session header echoed on every request once the server assigned one.
constexpr const char* SessionHeader = "Mcp-Session-Id";

//==========================================================================================================
// makeClientTlsContext
// Purpose: TLS client context with peer verification against the system trust store (or caFile when set).
//==========================================================================================================
std::unique_ptr<boost::asio::ssl::context> makeClientTlsContext(const std::string& caFile = std::string());

//==========================================================================================================
// coHttpPost
// Purpose: Opens a connection, POSTs a JSON body with the given headers and reads the full response.
// Args:
//   url: Parsed target.
//   tls: Context used when url.scheme is https (must be non-null then).
//   headers: Extra request headers (user supplied and session header).
//   body: JSON payload.
//   connectTimeout/readTimeout: Stream expiry for connect+handshake and for write+read.
// Returns:
//   HttpResult. Network, TLS and timeout failures propagate as boost::system::system_error.
//==========================================================================================================
boost::asio::awaitable<HttpResult> coHttpPost(UrlParts url,
                                              boost::asio::ssl::context* tls,
                                              std::map<std::string, std::string> headers,
                                              std::string body,
                                              std::chrono::milliseconds connectTimeout,
                                              std::chrono::milliseconds readTimeout);

// Error `data` payloads understood by connection diagnostics.
JSONValue networkErrorData(const std::string& what);
JSONValue httpStatusData(unsigned int status, const std::string& body);

} // namespace web
} // namespace toolhost

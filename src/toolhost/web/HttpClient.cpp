//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.cpp
// Purpose: HTTP/HTTPS POST using Boost.Beast coroutines
//==========================================================================================================

#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolhost/web/HttpClient.hpp"

namespace toolhost {
namespace web {

namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

http::request<http::string_body> buildRequest(const UrlParts& url,
                                              const std::map<std::string, std::string>& headers,
                                              std::string body) {
    http::request<http::string_body> req{http::verb::post, url.target, 11};
    req.set(http::field::host, url.hostHeader());
    req.set(http::field::content_type, "application/json");
    req.set(http::field::accept, "application/json, text/event-stream");
    req.set(http::field::connection, "close");
    for (const auto& [name, value] : headers) {
        req.set(name, value);
    }
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
}

HttpResult toResult(const http::response<http::string_body>& res) {
    HttpResult out;
    out.status = res.result_int();
    out.reason = std::string(res.reason());
    out.contentType = std::string(res[http::field::content_type]);
    for (const auto& field : res) {
        out.headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }
    auto it = res.find(SessionHeader);
    if (it != res.end()) {
        out.sessionId = std::string(it->value());
    }
    out.body = res.body();
    return out;
}

} // namespace

std::unique_ptr<ssl::context> makeClientTlsContext(const std::string& caFile) {
    auto ctx = std::make_unique<ssl::context>(ssl::context::tls_client);
    ::SSL_CTX_set_min_proto_version(ctx->native_handle(), TLS1_2_VERSION);
    ::ERR_clear_error();
    if (!caFile.empty()) {
        ctx->load_verify_file(caFile);
    } else {
        try {
            ctx->set_default_verify_paths();
        } catch (const std::exception& e) {
            LOG_DEBUG("HttpClient: set_default_verify_paths failed: {}", e.what());
        }
    }
    ctx->set_verify_mode(ssl::verify_peer);
    return ctx;
}

net::awaitable<HttpResult> coHttpPost(UrlParts url,
                                      ssl::context* tls,
                                      std::map<std::string, std::string> headers,
                                      std::string body,
                                      std::chrono::milliseconds connectTimeout,
                                      std::chrono::milliseconds readTimeout) {
    auto req = buildRequest(url, headers, std::move(body));

    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(url.host, url.port, net::use_awaitable);
    LOG_DEBUG("HttpClient: resolved {}:{} target={}", url.host, url.port, url.target);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    if (url.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(co_await net::this_coro::executor, *tls);
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            LOG_WARN("HttpClient: failed to set SNI hostname {}", url.host);
        }
        (void)::SSL_set1_host(stream.native_handle(), url.host.c_str());
        stream.next_layer().expires_after(connectTimeout);
        co_await stream.next_layer().async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

        stream.next_layer().expires_after(readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.shutdown(ec);
    } else {
        boost::beast::tcp_stream stream(co_await net::this_coro::executor);
        stream.expires_after(connectTimeout);
        co_await stream.async_connect(results, net::use_awaitable);

        stream.expires_after(readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, res, net::use_awaitable);
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
    LOG_DEBUG("HttpClient: {} {} -> {} ({} bytes)", url.host, url.target, res.result_int(), res.body().size());
    co_return toResult(res);
}

JSONValue networkErrorData(const std::string& what) {
    JSONValue::Object obj;
    obj["networkError"] = std::make_shared<JSONValue>(what);
    return JSONValue{std::move(obj)};
}

JSONValue httpStatusData(unsigned int status, const std::string& body) {
    JSONValue::Object obj;
    obj["httpStatus"] = std::make_shared<JSONValue>(static_cast<int64_t>(status));
    if (!body.empty()) {
        obj["body"] = std::make_shared<JSONValue>(body);
    }
    return JSONValue{std::move(obj)};
}

} // namespace web
} // namespace toolhost

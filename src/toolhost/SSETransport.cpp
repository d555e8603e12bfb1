//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SSETransport.cpp
// Purpose: Server-sent events client transport using Boost.Beast coroutines
//==========================================================================================================

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/SSETransport.hpp"
#include "toolhost/errors/Errors.h"
#include "toolhost/web/HttpClient.hpp"
#include "toolhost/web/SseEventParser.h"
#include "toolhost/web/Url.h"

namespace toolhost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = net::ip::tcp;

namespace {

errors::RemoteError networkFailure(const std::string& what) {
    errors::RpcError err;
    err.code = JSONRPCErrorCodes::InternalError;
    err.message = "Network error: " + what;
    err.data = web::networkErrorData(what);
    return errors::RemoteError(errors::ErrorCategory::ConnectionFailed, "SSE error: " + what, err);
}

errors::RemoteError statusFailure(unsigned int status, const std::string& reason) {
    errors::RpcError err;
    err.code = JSONRPCErrorCodes::InternalError;
    err.message = "HTTP " + std::to_string(status) + " " + reason;
    err.data = web::httpStatusData(status, std::string());
    const std::string what = "SSE error: " + err.message;
    return errors::RemoteError(errors::ErrorCategory::ConnectionFailed, what, err);
}

// Value of the sessionId query parameter of an endpoint URL, empty when absent.
std::string sessionFromEndpoint(const std::string& endpoint) {
    const std::string key = "sessionId=";
    std::size_t q = endpoint.find('?');
    while (q != std::string::npos) {
        std::size_t start = q + 1;
        if (endpoint.compare(start, key.size(), key) == 0) {
            std::size_t end = endpoint.find('&', start);
            return endpoint.substr(start + key.size(), end == std::string::npos ? std::string::npos : end - start - key.size());
        }
        q = endpoint.find('&', start);
    }
    return std::string();
}

} // namespace

class SSETransport::Impl {
public:
    SSETransport::Options opts;
    std::optional<web::UrlParts> streamUrl;
    std::string localSessionId;
    std::atomic<bool> connected{false};
    std::atomic<bool> stopping{false};

    mutable std::mutex endpointMutex;
    std::optional<web::UrlParts> postUrl;
    std::string endpoint;
    std::string remoteSessionId;

    std::mutex startMutex;
    std::promise<void> startPromise;
    bool startSettled{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    SSETransport::ErrorHandler errorHandler;
    SSETransport::NotificationHandler notificationHandler;
    SSETransport::RequestHandler requestHandler;
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;

    explicit Impl(const SSETransport::Options& o) : opts(o) {
        std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
        localSessionId = "sse-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stop();
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    std::string generateRequestId() { return std::string("sse-req-") + std::to_string(++requestCounter); }

    void settleStart(std::exception_ptr eptr) {
        std::lock_guard<std::mutex> lk(startMutex);
        if (startSettled) {
            return;
        }
        startSettled = true;
        if (eptr) {
            startPromise.set_exception(eptr);
        } else {
            startPromise.set_value();
        }
    }

    /////////////////////////////////////////// Event stream ///////////////////////////////////////////
    void onEndpoint(const std::string& data) {
        std::string absolute = web::resolveReference(opts.url, data);
        web::UrlParts parts = web::parseUrl(absolute);
        {
            std::lock_guard<std::mutex> lk(endpointMutex);
            postUrl = std::move(parts);
            endpoint = absolute;
            remoteSessionId = sessionFromEndpoint(absolute);
        }
        LOG_INFO("SSETransport: endpoint {} announced by {}", absolute, opts.url);
        connected.store(true);
        settleStart(nullptr);
    }

    void onEvent(const web::SseEvent& ev) {
        if (ev.event == "endpoint") {
            onEndpoint(ev.data);
        } else if (ev.event == "message") {
            if (!ev.data.empty()) {
                route(ev.data);
            }
        } else {
            LOG_DEBUG("SSETransport: ignoring event type {}", ev.event);
        }
    }

    template <typename Stream>
    net::awaitable<void> readEvents(Stream& stream) {
        http::request<http::empty_body> req{http::verb::get, streamUrl->target, 11};
        req.set(http::field::host, streamUrl->hostHeader());
        req.set(http::field::accept, "text/event-stream");
        req.set(http::field::cache_control, "no-cache");
        for (const auto& [name, value] : opts.headers) {
            req.set(name, value);
        }
        co_await http::async_write(stream, req, net::use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);

        const auto& res = parser.get();
        const unsigned int status = res.result_int();
        if (status < 200 || status >= 300) {
            LOG_WARN("SSETransport: GET {} returned HTTP {}", opts.url, status);
            throw statusFailure(status, std::string(res.reason()));
        }
        const std::string contentType(res[http::field::content_type]);
        if (contentType.rfind("text/event-stream", 0) != 0) {
            throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed,
                                        "SSE error: unexpected content type \"" + contentType + "\"");
        }

        web::SseEventParser events;
        std::array<char, 4096> chunk{};
        while (!parser.is_done()) {
            parser.get().body().data = chunk.data();
            parser.get().body().size = chunk.size();
            boost::system::error_code ec;
            co_await http::async_read_some(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            const std::size_t n = chunk.size() - parser.get().body().size;
            if (n == 0) {
                continue;
            }
            const bool hadEndpoint = connected.load();
            for (const auto& ev : events.Feed(std::string(chunk.data(), n))) {
                onEvent(ev);
            }
            if (!hadEndpoint && connected.load()) {
                // The stream stays open indefinitely once the session is established.
                beast::get_lowest_layer(stream).expires_never();
            }
        }
        for (const auto& ev : events.Finish()) {
            onEvent(ev);
        }
    }

    net::awaitable<void> runStream() {
        const auto connectTimeout = std::chrono::milliseconds(opts.connectTimeoutMs);
        tcp::resolver resolver(co_await net::this_coro::executor);
        auto results = co_await resolver.async_resolve(streamUrl->host, streamUrl->port, net::use_awaitable);

        if (streamUrl->scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(co_await net::this_coro::executor, *sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), streamUrl->host.c_str())) {
                LOG_WARN("SSETransport: failed to set SNI hostname {}", streamUrl->host);
            }
            (void)::SSL_set1_host(stream.native_handle(), streamUrl->host.c_str());
            beast::get_lowest_layer(stream).expires_after(connectTimeout);
            co_await beast::get_lowest_layer(stream).async_connect(results, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
            co_await readEvents(stream);
        } else {
            beast::tcp_stream stream(co_await net::this_coro::executor);
            stream.expires_after(connectTimeout);
            co_await stream.async_connect(results, net::use_awaitable);
            co_await readEvents(stream);
        }
    }

    void onStreamEnded(std::exception_ptr eptr) {
        if (stopping.load()) {
            return;
        }
        std::string what = "event stream closed";
        std::exception_ptr startError = eptr;
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const errors::ToolhostError& e) {
                what = e.what();
            } catch (const std::exception& e) {
                what = e.what();
                startError = std::make_exception_ptr(networkFailure(what));
            }
        } else {
            startError = std::make_exception_ptr(errors::ToolhostError(
                errors::ErrorCategory::ConnectionFailed, "SSE error: stream ended before the endpoint event"));
        }
        LOG_WARN("SSETransport: {} ({})", what, opts.url);
        settleStart(startError);
        connected.store(false);
        failPending(JSONRPCErrorCodes::ConnectionClosed, "Connection closed");
        setError("SSETransport: " + what);
    }

    /////////////////////////////////////////// Messages ///////////////////////////////////////////
    net::awaitable<web::HttpResult> post(web::UrlParts target, std::string payload) {
        const unsigned int readMs = opts.requestTimeoutMs == 0 ? 60000u : opts.requestTimeoutMs;
        return web::coHttpPost(std::move(target), sslCtx.get(), opts.headers, std::move(payload),
                               std::chrono::milliseconds(opts.connectTimeoutMs),
                               std::chrono::milliseconds(readMs));
    }

    std::optional<web::UrlParts> currentPostUrl() const {
        std::lock_guard<std::mutex> lk(endpointMutex);
        return postUrl;
    }

    void postReply(const JSONRPCRequest& request) {
        auto target = currentPostUrl();
        if (!target) {
            LOG_WARN("SSETransport: cannot answer {} before the endpoint is known", request.method);
            return;
        }
        auto reply = AnswerInboundRequest(requestHandler, request);
        const std::string method = request.method;
        net::co_spawn(ioc, post(*target, reply->Serialize()),
            [this, method](std::exception_ptr eptr, web::HttpResult res) {
                if (eptr) {
                    try {
                        std::rethrow_exception(eptr);
                    } catch (const std::exception& e) {
                        LOG_WARN("SSETransport: reply to {} failed: {}", method, e.what());
                        setError(std::string("SSETransport: reply failed: ") + e.what());
                    }
                    return;
                }
                if (res.status >= 400) {
                    LOG_WARN("SSETransport: reply to {} rejected with HTTP {}", method, res.status);
                }
            });
    }

    void route(const std::string& message) {
        JSONValue doc;
        try {
            doc = parseJSONValue(message);
        } catch (const std::runtime_error& e) {
            LOG_WARN("SSETransport: dropping malformed message ({}): {}", e.what(), message);
            return;
        }
        const bool hasMethod = findMember(doc, "method") != nullptr;
        const bool hasId = findMember(doc, "id") != nullptr;
        if (hasMethod && hasId) {
            JSONRPCRequest request;
            if (request.Deserialize(message)) {
                postReply(request);
            }
        } else if (hasMethod) {
            auto notification = std::make_unique<JSONRPCNotification>();
            if (notification->Deserialize(message) && notificationHandler) {
                notificationHandler(std::move(notification));
            }
        } else {
            auto resp = std::make_unique<JSONRPCResponse>();
            if (resp->Deserialize(message)) {
                const std::string idStr = idToString(resp->id);
                deliver(idStr, std::move(resp));
            } else {
                LOG_WARN("SSETransport: failed to parse response: {}", message);
            }
        }
    }

    void deliver(const std::string& idStr, std::unique_ptr<JSONRPCResponse> out) {
        std::promise<std::unique_ptr<JSONRPCResponse>> deliverPromise;
        bool havePromise = false;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            auto it = pendingRequests.find(idStr);
            if (it != pendingRequests.end()) {
                deliverPromise = std::move(it->second);
                pendingRequests.erase(it);
                havePromise = true;
            }
        }
        if (havePromise) {
            deliverPromise.set_value(std::move(out));
        } else {
            LOG_DEBUG("SSETransport: response for unknown id {}", idStr);
        }
    }

    void armTimeout(const JSONRPCId& id, const std::string& idStr) {
        if (opts.requestTimeoutMs == 0) {
            return;
        }
        auto timer = std::make_shared<net::steady_timer>(ioc, std::chrono::milliseconds(opts.requestTimeoutMs));
        timer->async_wait([this, timer, id, idStr](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            bool pending = false;
            {
                std::lock_guard<std::mutex> lk(requestMutex);
                pending = pendingRequests.count(idStr) > 0;
            }
            if (pending) {
                LOG_WARN("SSETransport: request {} timed out after {} ms", idStr, opts.requestTimeoutMs);
                deliver(idStr, CreateErrorResponse(id, JSONRPCErrorCodes::RequestTimeout, "Request timed out"));
            }
        });
    }

    void failPending(int code, const std::string& message) {
        std::lock_guard<std::mutex> lk(requestMutex);
        for (auto& kv : pendingRequests) {
            auto resp = std::make_unique<JSONRPCResponse>();
            resp->id = kv.first;
            resp->error = CreateErrorObject(code, message, std::nullopt);
            kv.second.set_value(std::move(resp));
        }
        pendingRequests.clear();
    }

    void stop() {
        stopping.store(true);
        connected.store(false);
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        settleStart(std::make_exception_ptr(errors::ToolhostError(
            errors::ErrorCategory::ConnectionFailed, "SSE error: transport closed during connect")));
        failPending(JSONRPCErrorCodes::ConnectionClosed, "Connection closed");
    }
};

SSETransport::SSETransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

SSETransport::~SSETransport() = default;

std::future<void> SSETransport::Start() {
    FUNC_SCOPE();
    auto fut = pImpl->startPromise.get_future();
    try {
        pImpl->streamUrl = web::parseUrl(pImpl->opts.url);
        if (pImpl->streamUrl->scheme == "https" && !pImpl->sslCtx) {
            pImpl->sslCtx = web::makeClientTlsContext(pImpl->opts.caFile);
        }
    } catch (const errors::ToolhostError&) {
        pImpl->settleStart(std::current_exception());
        return fut;
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("SSETransport: TLS setup failed for {}: {}", pImpl->opts.url, e.what());
        pImpl->settleStart(std::make_exception_ptr(errors::ToolhostError(
            errors::ErrorCategory::ConfigurationError,
            std::string("HTTPS: failed to load CA file ") + pImpl->opts.caFile + ": " + e.what())));
        return fut;
    }

    LOG_INFO("SSETransport: opening {} (session {})", pImpl->opts.url, pImpl->localSessionId);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->runStream(),
        [impl](std::exception_ptr eptr) {
            impl->onStreamEnded(eptr);
        });
    impl->ioThread = std::thread([impl]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("SSETransport: I/O thread terminated: {}", e.what());
            impl->connected.store(false);
            impl->setError(e.what());
        }
    });
    return fut;
}

std::future<void> SSETransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    LOG_DEBUG("SSETransport: closing {}", pImpl->opts.url);
    pImpl->stop();
    done.set_value();
    return fut;
}

bool SSETransport::IsConnected() const {
    FUNC_SCOPE(); return pImpl->connected.load();
}

std::string SSETransport::GetSessionId() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->endpointMutex);
    return pImpl->remoteSessionId.empty() ? pImpl->localSessionId : pImpl->remoteSessionId;
}

std::string SSETransport::GetEndpointUrl() const {
    std::lock_guard<std::mutex> lk(pImpl->endpointMutex);
    return pImpl->endpoint;
}

std::future<std::unique_ptr<JSONRPCResponse>> SSETransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();

    if (!request) {
        promise.set_value(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Empty request"));
        return fut;
    }
    auto target = pImpl->currentPostUrl();
    if (!pImpl->connected.load() || !target) {
        promise.set_value(CreateErrorResponse(request->id, JSONRPCErrorCodes::ConnectionClosed, "Connection closed"));
        return fut;
    }

    std::string idStr = idToString(request->id);
    if (idStr.empty()) {
        idStr = pImpl->generateRequestId();
        request->id = idStr;
    }
    JSONRPCId id = request->id;
    std::string payload = request->Serialize();
    {
        std::lock_guard<std::mutex> lk(pImpl->requestMutex);
        pImpl->pendingRequests[idStr] = std::move(promise);
    }
    pImpl->armTimeout(id, idStr);
    LOG_DEBUG("SSETransport: POST method={} id={}", request->method, idStr);

    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->post(*target, std::move(payload)),
        [impl, id, idStr](std::exception_ptr eptr, web::HttpResult res) {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    LOG_WARN("SSETransport: POST for {} failed: {}", idStr, e.what());
                    impl->deliver(idStr, CreateErrorResponse(id, JSONRPCErrorCodes::InternalError,
                                                             std::string("Network error: ") + e.what(),
                                                             web::networkErrorData(e.what())));
                }
                return;
            }
            if (res.status >= 400) {
                impl->deliver(idStr, CreateErrorResponse(id, JSONRPCErrorCodes::InternalError,
                                                         "HTTP " + std::to_string(res.status) + " " + res.reason,
                                                         web::httpStatusData(res.status, res.body)));
                return;
            }
            // Usually 202 Accepted; the response arrives on the event stream. Some servers answer inline.
            if (!res.body.empty() && res.contentType.rfind("application/json", 0) == 0) {
                impl->route(res.body);
            }
        });

    return fut;
}

std::future<void> SSETransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    if (!notification) {
        done.set_value();
        return fut;
    }
    auto target = pImpl->currentPostUrl();
    if (!pImpl->connected.load() || !target) {
        done.set_exception(std::make_exception_ptr(errors::ToolhostError(
            errors::ErrorCategory::NotConnected, "SSETransport: not connected")));
        return fut;
    }
    const std::string method = notification->method;

    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->post(*target, notification->Serialize()),
        [impl, method, pr = std::move(done)](std::exception_ptr eptr, web::HttpResult res) mutable {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    LOG_WARN("SSETransport: notification {} failed: {}", method, e.what());
                    impl->setError(e.what());
                }
                pr.set_exception(eptr);
                return;
            }
            if (res.status >= 400) {
                pr.set_exception(std::make_exception_ptr(statusFailure(res.status, res.reason)));
                return;
            }
            pr.set_value();
        });

    return fut;
}

void SSETransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    pImpl->notificationHandler = std::move(handler);
}

void SSETransport::SetRequestHandler(RequestHandler handler) {
    FUNC_SCOPE();
    pImpl->requestHandler = std::move(handler);
}

void SSETransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

} // namespace toolhost

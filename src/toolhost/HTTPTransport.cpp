//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.cpp
// Purpose: Streamable HTTP JSON-RPC client transport using Boost.Beast coroutines
//==========================================================================================================

#include <atomic>
#include <map>
#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>

#include "logging/Logger.h"
#include "toolhost/HTTPTransport.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/web/HttpClient.hpp"
#include "toolhost/web/SseEventParser.h"
#include "toolhost/web/Url.h"

namespace toolhost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

namespace {

bool isEventStream(const std::string& contentType) {
    return contentType.rfind("text/event-stream", 0) == 0;
}

// JSON-RPC messages carried by a POST reply: the JSON body, or every "message" event of an SSE body.
std::vector<std::string> messagesFromBody(const web::HttpResult& res) {
    std::vector<std::string> out;
    if (isEventStream(res.contentType)) {
        web::SseEventParser parser;
        auto events = parser.Feed(res.body);
        auto tail = parser.Finish();
        events.insert(events.end(), tail.begin(), tail.end());
        for (auto& ev : events) {
            if (ev.event == "message" && !ev.data.empty()) {
                out.push_back(std::move(ev.data));
            }
        }
    } else if (!res.body.empty()) {
        out.push_back(res.body);
    }
    return out;
}

} // namespace

class HTTPTransport::Impl {
public:
    HTTPTransport::Options opts;
    std::optional<web::UrlParts> url;
    std::string localSessionId;
    mutable std::mutex sessionMutex;
    std::string serverSessionId;
    std::atomic<bool> connected{false};

    net::io_context ioc;
    std::thread ioThread;
    std::unique_ptr<ssl::context> sslCtx; // present when https
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;

    HTTPTransport::ErrorHandler errorHandler;
    HTTPTransport::NotificationHandler notificationHandler;
    HTTPTransport::RequestHandler requestHandler;
    std::atomic<unsigned int> requestCounter{0u};
    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;

    mutable std::mutex infoMutex;
    std::optional<HTTPTransport::HttpResponseInfo> lastInfo;

    explicit Impl(const HTTPTransport::Options& o) : opts(o) {
        std::random_device rd; std::mt19937 gen(rd()); std::uniform_int_distribution<> dis(1000, 9999);
        localSessionId = "http-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stop();
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    std::string generateRequestId() { return std::string("http-req-") + std::to_string(++requestCounter); }

    std::map<std::string, std::string> requestHeaders() const {
        std::map<std::string, std::string> headers = opts.headers;
        std::lock_guard<std::mutex> lk(sessionMutex);
        if (!serverSessionId.empty()) {
            headers[web::SessionHeader] = serverSessionId;
        }
        return headers;
    }

    net::awaitable<web::HttpResult> post(std::string payload) {
        return web::coHttpPost(*url, sslCtx.get(), requestHeaders(), std::move(payload),
                               std::chrono::milliseconds(opts.connectTimeoutMs),
                               std::chrono::milliseconds(opts.readTimeoutMs));
    }

    void recordResponse(const web::HttpResult& res) {
        {
            std::lock_guard<std::mutex> lk(infoMutex);
            HTTPTransport::HttpResponseInfo info;
            info.status = static_cast<int>(res.status);
            info.headers = res.headers;
            lastInfo = std::move(info);
        }
        if (!res.sessionId.empty()) {
            std::lock_guard<std::mutex> lk(sessionMutex);
            if (serverSessionId != res.sessionId) {
                LOG_DEBUG("HTTPTransport: server assigned session {}", res.sessionId);
                serverSessionId = res.sessionId;
            }
        }
    }

    //==========================================================================================================
    // Replies to a provider-initiated request with a separate POST; the outcome is only logged.
    //==========================================================================================================
    void postReply(const JSONRPCRequest& request) {
        auto reply = AnswerInboundRequest(requestHandler, request);
        const std::string method = request.method;
        net::co_spawn(ioc, post(reply->Serialize()),
            [this, method](std::exception_ptr eptr, web::HttpResult res) {
                if (eptr) {
                    try {
                        std::rethrow_exception(eptr);
                    } catch (const std::exception& e) {
                        LOG_WARN("HTTPTransport: reply to {} failed: {}", method, e.what());
                        setError(std::string("HTTPTransport: reply failed: ") + e.what());
                    }
                    return;
                }
                recordResponse(res);
                if (res.status >= 400) {
                    LOG_WARN("HTTPTransport: reply to {} rejected with HTTP {}", method, res.status);
                }
            });
    }

    // Routes one inbound message; returns the response when it answers expectedId.
    std::unique_ptr<JSONRPCResponse> route(const std::string& message, const std::string& expectedId) {
        JSONValue doc;
        try {
            doc = parseJSONValue(message);
        } catch (const std::runtime_error& e) {
            LOG_WARN("HTTPTransport: dropping malformed message ({}): {}", e.what(), message);
            return nullptr;
        }
        const bool hasMethod = findMember(doc, "method") != nullptr;
        const bool hasId = findMember(doc, "id") != nullptr;
        if (hasMethod && hasId) {
            JSONRPCRequest request;
            if (request.Deserialize(message)) {
                postReply(request);
            }
            return nullptr;
        }
        if (hasMethod) {
            auto notification = std::make_unique<JSONRPCNotification>();
            if (notification->Deserialize(message) && notificationHandler) {
                notificationHandler(std::move(notification));
            }
            return nullptr;
        }
        auto resp = std::make_unique<JSONRPCResponse>();
        if (!resp->Deserialize(message)) {
            LOG_WARN("HTTPTransport: failed to parse response: {}", message);
            return nullptr;
        }
        const std::string respId = idToString(resp->id);
        if (respId != expectedId) {
            LOG_DEBUG("HTTPTransport: response for unexpected id {} (expected {})", respId, expectedId);
            return nullptr;
        }
        return resp;
    }

    std::unique_ptr<JSONRPCResponse> responseFor(const JSONRPCId& id, const std::string& idStr,
                                                 std::exception_ptr eptr, const web::HttpResult& res) {
        if (eptr) {
            try {
                std::rethrow_exception(eptr);
            } catch (const std::exception& e) {
                LOG_WARN("HTTPTransport: POST {} failed: {}", opts.baseUrl, e.what());
                setError(std::string("HTTPTransport: ") + e.what());
                return CreateErrorResponse(id, JSONRPCErrorCodes::InternalError,
                                           std::string("Network error: ") + e.what(), web::networkErrorData(e.what()));
            }
        }
        recordResponse(res);
        if (res.status >= 400) {
            LOG_WARN("HTTPTransport: POST {} returned HTTP {} {}", opts.baseUrl, res.status, res.reason);
            return CreateErrorResponse(id, JSONRPCErrorCodes::InternalError,
                                       "HTTP " + std::to_string(res.status) + " " + res.reason,
                                       web::httpStatusData(res.status, res.body));
        }
        std::unique_ptr<JSONRPCResponse> out;
        for (const auto& message : messagesFromBody(res)) {
            auto resp = route(message, idStr);
            if (resp && !out) {
                out = std::move(resp);
            }
        }
        if (!out) {
            out = CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, "Invalid/empty HTTP response");
        }
        return out;
    }

    void deliver(const std::string& idStr, std::unique_ptr<JSONRPCResponse> out) {
        // Move the promise out under lock, fulfill outside the lock.
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
        }
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
        connected.store(false);
        if (workGuard) {
            workGuard->reset();
            workGuard.reset();
        }
        ioc.stop();
        if (ioThread.joinable()) {
            ioThread.join();
        }
        failPending(JSONRPCErrorCodes::ConnectionClosed, "Connection closed");
    }
};

HTTPTransport::HTTPTransport(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPTransport::~HTTPTransport() = default;

std::future<void> HTTPTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->url = web::parseUrl(pImpl->opts.baseUrl);
        if (pImpl->url->scheme == "https" && !pImpl->sslCtx) {
            pImpl->sslCtx = web::makeClientTlsContext(pImpl->opts.caFile);
        }
    } catch (const errors::ToolhostError&) {
        ready.set_exception(std::current_exception());
        return fut;
    } catch (const boost::system::system_error& e) {
        LOG_ERROR("HTTPTransport: TLS setup failed for {}: {}", pImpl->opts.baseUrl, e.what());
        ready.set_exception(std::make_exception_ptr(errors::ToolhostError(
            errors::ErrorCategory::ConfigurationError,
            std::string("HTTPS: failed to load CA file ") + pImpl->opts.caFile + ": " + e.what())));
        return fut;
    }

    if (pImpl->ioThread.joinable()) {
        ready.set_value();
        return fut;
    }
    pImpl->ioc.restart();
    pImpl->connected.store(true);
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    Impl* impl = pImpl.get();
    impl->ioThread = std::thread([impl]() {
        try {
            impl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("HTTPTransport: I/O thread terminated: {}", e.what());
            impl->connected.store(false);
            impl->setError(e.what());
        }
    });
    LOG_INFO("HTTPTransport: ready for {} (session {})", pImpl->opts.baseUrl, pImpl->localSessionId);
    ready.set_value();
    return fut;
}

std::future<void> HTTPTransport::Close() {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    LOG_DEBUG("HTTPTransport: closing {}", pImpl->opts.baseUrl);
    pImpl->stop();
    done.set_value();
    return fut;
}

bool HTTPTransport::IsConnected() const {
    FUNC_SCOPE(); return pImpl->connected.load();
}

std::string HTTPTransport::GetSessionId() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->sessionMutex);
    return pImpl->serverSessionId.empty() ? pImpl->localSessionId : pImpl->serverSessionId;
}

std::future<std::unique_ptr<JSONRPCResponse>> HTTPTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    std::promise<std::unique_ptr<JSONRPCResponse>> promise;
    auto fut = promise.get_future();

    if (!request) {
        promise.set_value(CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Empty request"));
        return fut;
    }
    if (!pImpl->connected.load()) {
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
    LOG_DEBUG("HTTPTransport: POST {} method={} id={}", pImpl->opts.baseUrl, request->method, idStr);

    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->post(std::move(payload)),
        [impl, id, idStr](std::exception_ptr eptr, web::HttpResult res) {
            impl->deliver(idStr, impl->responseFor(id, idStr, eptr, res));
        });

    return fut;
}

std::future<void> HTTPTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    std::promise<void> done; auto fut = done.get_future();
    if (!notification) {
        done.set_value();
        return fut;
    }
    if (!pImpl->connected.load()) {
        done.set_exception(std::make_exception_ptr(errors::ToolhostError(
            errors::ErrorCategory::NotConnected, "HTTPTransport: not connected")));
        return fut;
    }
    const std::string method = notification->method;

    Impl* impl = pImpl.get();
    net::co_spawn(impl->ioc, impl->post(notification->Serialize()),
        [impl, method, pr = std::move(done)](std::exception_ptr eptr, web::HttpResult res) mutable {
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& e) {
                    LOG_WARN("HTTPTransport: notification {} failed: {}", method, e.what());
                    impl->setError(e.what());
                }
                pr.set_exception(eptr);
                return;
            }
            impl->recordResponse(res);
            if (res.status >= 400) {
                errors::RpcError err;
                err.code = JSONRPCErrorCodes::InternalError;
                err.message = "HTTP " + std::to_string(res.status);
                err.data = web::httpStatusData(res.status, res.body);
                pr.set_exception(std::make_exception_ptr(errors::RemoteError(
                    errors::ErrorCategory::ConnectionFailed, "Notification " + method + " rejected: " + err.message, err)));
                return;
            }
            for (const auto& message : messagesFromBody(res)) {
                (void)impl->route(message, std::string());
            }
            pr.set_value();
        });

    return fut;
}

void HTTPTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    pImpl->notificationHandler = std::move(handler);
}

void HTTPTransport::SetRequestHandler(RequestHandler handler) {
    FUNC_SCOPE();
    pImpl->requestHandler = std::move(handler);
}

void HTTPTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    pImpl->errorHandler = std::move(handler);
}

bool HTTPTransport::QueryLastHttpResponse(HttpResponseInfo& out) const {
    std::lock_guard<std::mutex> lk(pImpl->infoMutex);
    if (!pImpl->lastInfo.has_value()) {
        return false;
    }
    out = *pImpl->lastInfo;
    return true;
}

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeProvider.h
// Purpose: Scripted in-process tool provider (transport + factory) for connection and bridge tests
//==========================================================================================================

#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/Transport.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {
namespace fakes {

inline std::shared_ptr<JSONValue> jstr(const std::string& s) { return std::make_shared<JSONValue>(s); }

// {"name": n, "description": d, "inputSchema": schema}
inline JSONValue toolEntry(const std::string& name, const std::string& description = "",
                           std::optional<JSONValue> schema = std::nullopt) {
    JSONValue::Object obj;
    obj["name"] = jstr(name);
    if (!description.empty()) {
        obj["description"] = jstr(description);
    }
    if (schema.has_value()) {
        obj["inputSchema"] = std::make_shared<JSONValue>(*schema);
    }
    return JSONValue{std::move(obj)};
}

// {"content":[{"type":"text","text":t}], "isError": false}
inline JSONValue textResult(const std::string& text) {
    JSONValue::Object item;
    item["type"] = jstr("text");
    item["text"] = jstr(text);
    JSONValue::Array content;
    content.push_back(std::make_shared<JSONValue>(std::move(item)));
    JSONValue::Object res;
    res["content"] = std::make_shared<JSONValue>(std::move(content));
    res["isError"] = std::make_shared<JSONValue>(false);
    return JSONValue{std::move(res)};
}

//==========================================================================================================
// FakeProvider
// Purpose: Behaviour and counters shared by every transport created for one server id.
//==========================================================================================================
struct FakeProvider {
    std::vector<JSONValue> tools;
    // tools/call: returns the result object, or throws to produce an InternalError response.
    std::function<JSONValue(const std::string& name, const JSONValue& args)> onCall;
    std::optional<std::pair<int, std::string>> callError;   // error response to every tools/call
    std::optional<std::pair<int, std::string>> listError;   // error response to every tools/list
    std::exception_ptr startError;                          // Start() fails with this
    bool hangOnStart{false};                                 // Start() completes only when closed
    bool advertiseTools{true};

    std::atomic<bool> alive{true};  // false: the channel dropped; requests fail with ConnectionClosed
    std::atomic<int> starts{0};
    std::atomic<int> closes{0};
    std::atomic<int> calls{0};
    std::atomic<int> lists{0};

    std::mutex mutex;
    std::vector<std::string> methods;
    std::vector<std::string> notifications;
};

class FakeTransport : public ITransport {
public:
    explicit FakeTransport(std::shared_ptr<FakeProvider> p) : provider(std::move(p)) {}

    std::future<void> Start() override {
        provider->starts++;
        if (provider->startError) {
            std::promise<void> pr;
            pr.set_exception(provider->startError);
            return pr.get_future();
        }
        if (provider->hangOnStart) {
            return startPromise.get_future();
        }
        connected = true;
        std::promise<void> pr;
        pr.set_value();
        return pr.get_future();
    }

    std::future<void> Close() override {
        provider->closes++;
        connected = false;
        if (provider->hangOnStart && !startSettled.exchange(true)) {
            startPromise.set_exception(std::make_exception_ptr(
                errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, "closed while starting")));
        }
        std::promise<void> pr;
        pr.set_value();
        return pr.get_future();
    }

    bool IsConnected() const override { return connected && provider->alive; }
    std::string GetSessionId() const override { return "fake-session"; }

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(std::unique_ptr<JSONRPCRequest> request) override {
        std::promise<std::unique_ptr<JSONRPCResponse>> pr;
        {
            std::lock_guard<std::mutex> lk(provider->mutex);
            provider->methods.push_back(request->method);
        }
        pr.set_value(answer(*request));
        return pr.get_future();
    }

    std::future<void> SendNotification(std::unique_ptr<JSONRPCNotification> notification) override {
        {
            std::lock_guard<std::mutex> lk(provider->mutex);
            provider->notifications.push_back(notification->method);
        }
        std::promise<void> pr;
        pr.set_value();
        return pr.get_future();
    }

    void SetNotificationHandler(NotificationHandler) override {}
    void SetRequestHandler(RequestHandler) override {}
    void SetErrorHandler(ErrorHandler) override {}

private:
    std::unique_ptr<JSONRPCResponse> error(const JSONRPCId& id, int code, const std::string& message) {
        return CreateErrorResponse(id, code, message);
    }

    std::unique_ptr<JSONRPCResponse> answer(const JSONRPCRequest& request) {
        if (!IsConnected()) {
            return error(request.id, JSONRPCErrorCodes::ConnectionClosed, "Connection closed");
        }
        if (request.method == Methods::Initialize) {
            JSONValue::Object caps;
            if (provider->advertiseTools) {
                caps["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
            }
            JSONValue::Object info;
            info["name"] = jstr("fake");
            info["version"] = jstr("0.1");
            JSONValue::Object res;
            res["protocolVersion"] = jstr(PROTOCOL_VERSION);
            res["capabilities"] = std::make_shared<JSONValue>(std::move(caps));
            res["serverInfo"] = std::make_shared<JSONValue>(std::move(info));
            return std::make_unique<JSONRPCResponse>(request.id, JSONValue{std::move(res)});
        }
        if (request.method == Methods::ListTools) {
            provider->lists++;
            if (provider->listError) {
                return error(request.id, provider->listError->first, provider->listError->second);
            }
            JSONValue::Array arr;
            for (const auto& t : provider->tools) {
                arr.push_back(std::make_shared<JSONValue>(t));
            }
            JSONValue::Object res;
            res["tools"] = std::make_shared<JSONValue>(std::move(arr));
            return std::make_unique<JSONRPCResponse>(request.id, JSONValue{std::move(res)});
        }
        if (request.method == Methods::CallTool) {
            provider->calls++;
            if (provider->callError) {
                return error(request.id, provider->callError->first, provider->callError->second);
            }
            std::string name;
            JSONValue args{JSONValue::Object{}};
            if (request.params.has_value()) {
                name = getStringMember(*request.params, "name").value_or("");
                if (const JSONValue* a = findMember(*request.params, "arguments")) {
                    args = *a;
                }
            }
            if (!provider->onCall) {
                return std::make_unique<JSONRPCResponse>(request.id, textResult("ok:" + name));
            }
            try {
                return std::make_unique<JSONRPCResponse>(request.id, provider->onCall(name, args));
            } catch (const std::exception& e) {
                return error(request.id, JSONRPCErrorCodes::InternalError, e.what());
            }
        }
        return error(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
    }

    std::shared_ptr<FakeProvider> provider;
    std::atomic<bool> connected{false};
    std::promise<void> startPromise;
    std::atomic<bool> startSettled{false};
};

//==========================================================================================================
// FakeTransportFactory
// Purpose: Hands out FakeTransports for registered ids; unregistered ids are rejected like a failed launch.
//==========================================================================================================
class FakeTransportFactory : public ITransportFactory {
public:
    std::shared_ptr<FakeProvider> Add(const std::string& id) {
        auto p = std::make_shared<FakeProvider>();
        std::lock_guard<std::mutex> lk(mutex);
        providers[id] = p;
        return p;
    }

    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) override {
        created++;
        std::lock_guard<std::mutex> lk(mutex);
        auto it = providers.find(config.id);
        if (it == providers.end()) {
            throw errors::ToolhostError(errors::ErrorCategory::ValidationRejected,
                                        "no fake provider for " + config.id);
        }
        return std::make_unique<FakeTransport>(it->second);
    }

    std::atomic<int> created{0};

private:
    std::mutex mutex;
    std::map<std::string, std::shared_ptr<FakeProvider>> providers;
};

inline ServerConfig stdioConfig(const std::string& id, const std::string& command = "node",
                                std::vector<std::string> args = {"server.js"}) {
    ServerConfig cfg;
    cfg.id = id;
    cfg.transport = TransportKind::Stdio;
    cfg.command = command;
    cfg.args = std::move(args);
    return cfg;
}

} // namespace fakes
} // namespace toolhost

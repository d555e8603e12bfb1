//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderClient.cpp
// Purpose: Provider client implementation
//==========================================================================================================
#include <atomic>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "toolhost/ProviderClient.h"
#include "toolhost/async/Task.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {

// Error response -> RemoteError of the given category. Responses without an error pass through.
void throwIfError(const JSONRPCResponse& response, errors::ErrorCategory category, const std::string& context) {
    auto err = errors::rpcErrorFromResponse(response);
    if (response.IsError()) {
        const errors::RpcError rpc = err.value_or(errors::RpcError{JSONRPCErrorCodes::InternalError, "Malformed error object", std::nullopt});
        const std::string what = context + ": " + rpc.message;
        throw errors::RemoteError(category, what, rpc);
    }
}

JSONValue defaultInputSchema() {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("object"));
    obj["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    return JSONValue{std::move(obj)};
}

} // namespace

class ProviderClient::Impl {
public:
    std::unique_ptr<ITransport> transport;
    Implementation clientInfo;
    mutable std::mutex transportMutex;

    explicit Impl(const Implementation& info) : clientInfo(info) {}

    JSONValue initializeParams() const {
        JSONValue::Object paramsObj;
        paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        paramsObj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        JSONValue::Object ci;
        ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
        ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
        paramsObj["clientInfo"] = std::make_shared<JSONValue>(ci);
        return JSONValue{paramsObj};
    }

    ITransport& requireTransport() {
        std::lock_guard<std::mutex> lk(transportMutex);
        if (!transport) {
            throw errors::ToolhostError(errors::ErrorCategory::NotConnected, "Provider client has no transport");
        }
        return *transport;
    }

    toolhost::async::Task<void> coConnect(std::unique_ptr<ITransport> t);
    toolhost::async::Task<InitializeResult> coInitialize();
    toolhost::async::Task<void> coDisconnect();
    toolhost::async::Task<std::vector<Tool>> coListTools();
    toolhost::async::Task<CallToolResult> coCallTool(std::string name, JSONValue arguments);
};

toolhost::async::Task<void> ProviderClient::Impl::coConnect(std::unique_ptr<ITransport> t) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(this->transportMutex);
        this->transport = std::move(t);
    }
    ITransport& tr = this->requireTransport();
    const std::string session = tr.GetSessionId();
    tr.SetNotificationHandler([session](std::unique_ptr<JSONRPCNotification> n) {
        if (n) {
            LOG_DEBUG("ProviderClient[{}]: notification {}", session, n->method);
        }
    });
    tr.SetErrorHandler([session](const std::string& err) {
        LOG_DEBUG("ProviderClient[{}]: transport reported: {}", session, err);
    });
    auto fut = tr.Start();
    co_await toolhost::async::makeFutureAwaitable(std::move(fut));
    co_return;
}

toolhost::async::Task<InitializeResult> ProviderClient::Impl::coInitialize() {
    FUNC_SCOPE();
    ITransport& tr = this->requireTransport();
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::Initialize;
    request->params = this->initializeParams();

    LOG_INFO("ProviderClient: initializing session {}", tr.GetSessionId());
    auto response = co_await toolhost::async::makeFutureAwaitable(tr.SendRequest(std::move(request)));
    if (!response) {
        throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, "Initialize failed: no response");
    }
    throwIfError(*response, errors::ErrorCategory::ConnectionFailed, "Initialize failed");
    if (!response->result.has_value()) {
        throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, "Initialize failed: missing result");
    }
    InitializeResult result = ParseInitializeResult(response->result.value());
    if (!result.hasToolsCapability) {
        LOG_WARN("ProviderClient: server {} does not advertise tool support", result.serverInfo.name);
    }

    auto notification = std::make_unique<JSONRPCNotification>(Methods::Initialized);
    co_await toolhost::async::makeFutureAwaitable(tr.SendNotification(std::move(notification)));
    LOG_INFO("ProviderClient: connected to {} {} (protocol {})", result.serverInfo.name,
             result.serverInfo.version, result.protocolVersion);
    co_return result;
}

toolhost::async::Task<void> ProviderClient::Impl::coDisconnect() {
    FUNC_SCOPE();
    // The transport object stays alive until the client is destroyed; in-flight calls may still hold it.
    ITransport* t = nullptr;
    {
        std::lock_guard<std::mutex> lk(this->transportMutex);
        t = this->transport.get();
    }
    if (t == nullptr) co_return;
    auto fut = t->Close();
    try {
        co_await toolhost::async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception& e) {
        LOG_WARN("ProviderClient: close reported: {}", e.what());
    }
    co_return;
}

toolhost::async::Task<std::vector<Tool>> ProviderClient::Impl::coListTools() {
    FUNC_SCOPE();
    ITransport& tr = this->requireTransport();
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::ListTools;
    LOG_DEBUG("ProviderClient: requesting tools list");
    auto response = co_await toolhost::async::makeFutureAwaitable(tr.SendRequest(std::move(request)));
    if (!response) {
        throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, "tools/list failed: no response");
    }
    throwIfError(*response, errors::ErrorCategory::ConnectionFailed, "tools/list failed");
    if (!response->result.has_value()) {
        co_return std::vector<Tool>{};
    }
    co_return ParseToolsList(response->result.value());
}

toolhost::async::Task<CallToolResult> ProviderClient::Impl::coCallTool(std::string name, JSONValue arguments) {
    FUNC_SCOPE();
    ITransport& tr = this->requireTransport();
    auto request = std::make_unique<JSONRPCRequest>();
    request->method = Methods::CallTool;
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(name);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments);
    request->params = JSONValue{paramsObj};
    LOG_DEBUG("ProviderClient: calling tool {}", name);
    auto response = co_await toolhost::async::makeFutureAwaitable(tr.SendRequest(std::move(request)));
    if (!response) {
        throw errors::ToolhostError(errors::ErrorCategory::ToolExecutionFailed, "Tool " + name + " failed: no response");
    }
    throwIfError(*response, errors::ErrorCategory::ToolExecutionFailed, "Tool " + name + " failed");
    if (!response->result.has_value()) {
        co_return CallToolResult{};
    }
    co_return ParseCallToolResult(response->result.value());
}

/////////////////////////////////////////// Normalization ///////////////////////////////////////////
std::vector<Tool> ProviderClient::ParseToolsList(const JSONValue& result) {
    std::vector<Tool> tools;
    const JSONValue* arr = findMember(result, "tools");
    if (arr == nullptr || !arr->isArray()) {
        LOG_WARN("ProviderClient: tools/list result has no tools array");
        return tools;
    }
    for (const auto& entry : std::get<JSONValue::Array>(arr->value)) {
        if (!entry) {
            continue;
        }
        auto name = getStringMember(*entry, "name");
        if (!name.has_value()) {
            LOG_WARN("ProviderClient: dropping tool entry without a name");
            continue;
        }
        Tool tool;
        tool.name = *name;
        tool.description = getStringMember(*entry, "description").value_or(std::string());
        const JSONValue* schema = findMember(*entry, "inputSchema");
        tool.inputSchema = (schema != nullptr && schema->isObject()) ? *schema : defaultInputSchema();
        tools.push_back(std::move(tool));
    }
    return tools;
}

CallToolResult ProviderClient::ParseCallToolResult(const JSONValue& result) {
    CallToolResult out;
    const JSONValue* content = findMember(result, "content");
    if (content != nullptr && content->isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(content->value)) {
            if (item) {
                out.content.push_back(*item);
            }
        }
    }
    const JSONValue* isError = findMember(result, "isError");
    if (isError != nullptr && std::holds_alternative<bool>(isError->value)) {
        out.isError = std::get<bool>(isError->value);
    }
    return out;
}

InitializeResult ProviderClient::ParseInitializeResult(const JSONValue& result) {
    InitializeResult out;
    out.protocolVersion = getStringMember(result, "protocolVersion").value_or(std::string());
    if (const JSONValue* info = findMember(result, "serverInfo")) {
        out.serverInfo.name = getStringMember(*info, "name").value_or(std::string());
        out.serverInfo.version = getStringMember(*info, "version").value_or(std::string());
    }
    if (const JSONValue* caps = findMember(result, "capabilities")) {
        out.hasToolsCapability = findMember(*caps, "tools") != nullptr;
    }
    return out;
}

/////////////////////////////////////////// Public API ///////////////////////////////////////////
ProviderClient::ProviderClient(const Implementation& clientInfo)
    : pImpl(std::make_unique<Impl>(clientInfo)) {
    FUNC_SCOPE();
}

ProviderClient::~ProviderClient() {
    FUNC_SCOPE();
}

std::future<void> ProviderClient::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    return pImpl->coConnect(std::move(transport)).toFuture();
}

std::future<InitializeResult> ProviderClient::Initialize() {
    FUNC_SCOPE();
    return pImpl->coInitialize().toFuture();
}

std::future<void> ProviderClient::Disconnect() {
    FUNC_SCOPE();
    return pImpl->coDisconnect().toFuture();
}

bool ProviderClient::IsConnected() const {
    std::lock_guard<std::mutex> lk(pImpl->transportMutex);
    return pImpl->transport && pImpl->transport->IsConnected();
}

std::string ProviderClient::GetSessionId() const {
    std::lock_guard<std::mutex> lk(pImpl->transportMutex);
    return pImpl->transport ? pImpl->transport->GetSessionId() : std::string();
}

std::future<std::vector<Tool>> ProviderClient::ListTools() {
    FUNC_SCOPE();
    return pImpl->coListTools().toFuture();
}

std::future<CallToolResult> ProviderClient::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    return pImpl->coCallTool(name, arguments).toFuture();
}

} // namespace toolhost

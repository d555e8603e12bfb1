//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.cpp
// Purpose: Connection manager implementation
//==========================================================================================================

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <utility>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ConnectionManager.h"
#include "toolhost/ProviderClient.h"
#include "toolhost/async/Task.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

namespace toolhost {

namespace {

// Transport start + handshake. The client is held by value so an abandoned (timed out) attempt stays valid.
toolhost::async::Task<void> coOpen(std::shared_ptr<ProviderClient> client, std::unique_ptr<ITransport> transport) {
    co_await toolhost::async::makeFutureAwaitable(client->Connect(std::move(transport)));
    (void) co_await toolhost::async::makeFutureAwaitable(client->Initialize());
    co_return;
}

toolhost::async::Task<std::vector<Tool>> coOpenAndList(std::shared_ptr<ProviderClient> client,
                                                       std::unique_ptr<ITransport> transport) {
    co_await toolhost::async::makeFutureAwaitable(client->Connect(std::move(transport)));
    (void) co_await toolhost::async::makeFutureAwaitable(client->Initialize());
    co_return co_await toolhost::async::makeFutureAwaitable(client->ListTools());
}

toolhost::async::Task<void> coClose(std::shared_ptr<ProviderClient> client) {
    co_await toolhost::async::makeFutureAwaitable(client->Disconnect());
    co_return;
}

} // namespace

class ConnectionManager::Impl {
public:
    std::shared_ptr<ITransportFactory> factory;
    std::shared_ptr<registry::PackageRegistry> registry;
    ConnectionManager::Options options;

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<ProviderClient>> connections;
    std::set<std::string> connecting;

    Impl(std::shared_ptr<ITransportFactory> f, std::shared_ptr<registry::PackageRegistry> r, ConnectionManager::Options o)
        : factory(std::move(f)), registry(std::move(r)), options(std::move(o)) {
        if (!options.systemProbe) {
            options.systemProbe = diagnostics::DefaultSystemProbe();
        }
    }

    // Releases the Connecting state of an id when the connect attempt ends, however it ends.
    struct ConnectingGuard {
        Impl* impl;
        std::string id;
        ~ConnectingGuard() {
            std::lock_guard<std::mutex> lk(impl->mutex);
            impl->connecting.erase(id);
        }
    };

    void beginConnect(const std::string& id) {
        std::lock_guard<std::mutex> lk(mutex);
        if (connections.count(id) > 0) {
            throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed,
                                        "Server " + id + " is already connected. Disconnect it first.");
        }
        if (!connecting.insert(id).second) {
            throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed,
                                        "A connection to server " + id + " is already in progress.");
        }
    }

    std::shared_ptr<ProviderClient> findClient(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = connections.find(id);
        return it == connections.end() ? nullptr : it->second;
    }

    std::shared_ptr<ProviderClient> requireClient(const std::string& id) const {
        auto client = findClient(id);
        if (!client) {
            throw errors::ToolhostError(errors::ErrorCategory::NotConnected, "Server " + id + " is not connected");
        }
        return client;
    }

    // A transport that went away (process exit, stream closed) leaves the Connected state.
    void dropIfDead(const std::string& id, const std::shared_ptr<ProviderClient>& client) {
        if (client->IsConnected()) {
            return;
        }
        std::lock_guard<std::mutex> lk(mutex);
        auto it = connections.find(id);
        if (it != connections.end() && it->second == client) {
            LOG_WARN("ConnectionManager: connection to {} lost", id);
            connections.erase(it);
        }
    }

    toolhost::async::Task<void> coConnect(ServerConfig config);
    toolhost::async::Task<void> coDisconnect(std::string id);
    toolhost::async::Task<void> coDisconnectAll();
    toolhost::async::Task<std::vector<Tool>> coListTools(std::string id);
    toolhost::async::Task<CallToolResult> coCallTool(std::string id, std::string toolName, JSONValue arguments);
    toolhost::async::Task<bool> coPing(std::string id);
    toolhost::async::Task<ProbeResult> coProbe(ServerConfig config);
};

/////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
toolhost::async::Task<void> ConnectionManager::Impl::coConnect(ServerConfig config) {
    FUNC_SCOPE();
    this->beginConnect(config.id);
    ConnectingGuard guard{this, config.id};

    LOG_INFO("ConnectionManager: connecting to {} ({})", config.id, toString(config.transport));
    std::unique_ptr<ITransport> transport = this->factory->CreateTransport(config);

    auto client = std::make_shared<ProviderClient>(this->options.clientInfo);
    auto fut = coOpen(client, std::move(transport)).toFuture();
    auto status = co_await toolhost::async::waitFor(fut, this->options.connectTimeout);

    std::exception_ptr failure;
    const bool timedOut = status != std::future_status::ready;
    if (!timedOut) {
        try {
            fut.get();
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    }
    if (timedOut || failure) {
        co_await toolhost::async::makeFutureAwaitable(coClose(client).toFuture());
        if (timedOut) {
            const std::string message = fmt::format(
                "Connection to server {} timed out after {} ms. This may indicate a transport mismatch "
                "(e.g., an HTTP server declared as SSE, or vice versa).",
                config.id, this->options.connectTimeout.count());
            LOG_ERROR("ConnectionManager: {}", message);
            throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, message);
        }
        const std::string message = diagnostics::DiagnoseConnectionFailure(config, failure, *this->registry);
        LOG_ERROR("ConnectionManager: failed to connect to {}: {}", config.id, message);
        throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed, message);
    }

    {
        std::lock_guard<std::mutex> lk(this->mutex);
        this->connections[config.id] = client;
    }
    LOG_INFO("ConnectionManager: connected to {} (session {})", config.id, client->GetSessionId());
    co_return;
}

toolhost::async::Task<void> ConnectionManager::Impl::coDisconnect(std::string id) {
    FUNC_SCOPE();
    std::shared_ptr<ProviderClient> client;
    {
        std::lock_guard<std::mutex> lk(this->mutex);
        auto it = this->connections.find(id);
        if (it != this->connections.end()) {
            client = std::move(it->second);
            this->connections.erase(it);
        }
    }
    if (!client) {
        LOG_DEBUG("ConnectionManager: disconnect of {} ignored, not connected", id);
        co_return;
    }
    try {
        co_await toolhost::async::makeFutureAwaitable(client->Disconnect());
    } catch (const std::exception& e) {
        LOG_WARN("ConnectionManager: error while closing {}: {}", id, e.what());
    }
    LOG_INFO("ConnectionManager: disconnected from {}", id);
    co_return;
}

toolhost::async::Task<void> ConnectionManager::Impl::coDisconnectAll() {
    FUNC_SCOPE();
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(this->mutex);
        for (const auto& kv : this->connections) {
            ids.push_back(kv.first);
        }
    }
    std::vector<std::future<void>> pending;
    pending.reserve(ids.size());
    for (const auto& id : ids) {
        pending.push_back(this->coDisconnect(id).toFuture());
    }
    for (auto& f : pending) {
        try {
            co_await toolhost::async::makeFutureAwaitable(std::move(f));
        } catch (const std::exception& e) {
            LOG_WARN("ConnectionManager: disconnect failed: {}", e.what());
        }
    }
    co_return;
}

/////////////////////////////////////////// Tools ///////////////////////////////////////////
toolhost::async::Task<std::vector<Tool>> ConnectionManager::Impl::coListTools(std::string id) {
    FUNC_SCOPE();
    auto client = this->requireClient(id);
    auto fut = client->ListTools();
    std::vector<Tool> tools;
    std::exception_ptr failure;
    try {
        tools = co_await toolhost::async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    if (failure) {
        this->dropIfDead(id, client);
        std::rethrow_exception(failure);
    }
    LOG_DEBUG("ConnectionManager: {} lists {} tools", id, tools.size());
    co_return tools;
}

toolhost::async::Task<CallToolResult> ConnectionManager::Impl::coCallTool(std::string id, std::string toolName, JSONValue arguments) {
    FUNC_SCOPE();
    auto client = this->requireClient(id);
    auto fut = client->CallTool(toolName, arguments);
    CallToolResult result;
    std::exception_ptr failure;
    try {
        result = co_await toolhost::async::makeFutureAwaitable(std::move(fut));
    } catch (const std::exception&) {
        failure = std::current_exception();
    }
    if (failure) {
        this->dropIfDead(id, client);
        std::rethrow_exception(failure);
    }
    co_return result;
}

toolhost::async::Task<bool> ConnectionManager::Impl::coPing(std::string id) {
    FUNC_SCOPE();
    auto client = this->findClient(id);
    if (!client) {
        co_return false;
    }
    auto fut = client->ListTools();
    auto status = co_await toolhost::async::waitFor(fut, this->options.connectTimeout);
    if (status != std::future_status::ready) {
        LOG_WARN("ConnectionManager: ping of {} timed out", id);
        co_return false;
    }
    try {
        (void) fut.get();
    } catch (const std::exception& e) {
        LOG_DEBUG("ConnectionManager: ping of {} failed: {}", id, e.what());
        this->dropIfDead(id, client);
        co_return false;
    }
    co_return true;
}

toolhost::async::Task<ProbeResult> ConnectionManager::Impl::coProbe(ServerConfig config) {
    FUNC_SCOPE();
    ProbeResult out;
    std::unique_ptr<ITransport> transport;
    try {
        transport = this->factory->CreateTransport(config);
    } catch (const std::exception& e) {
        out.message = e.what();
        co_return out;
    }

    auto client = std::make_shared<ProviderClient>(this->options.clientInfo);
    auto fut = coOpenAndList(client, std::move(transport)).toFuture();
    auto status = co_await toolhost::async::waitFor(fut, this->options.connectTimeout);
    std::exception_ptr failure;
    if (status == std::future_status::ready) {
        try {
            out.tools = fut.get();
            out.toolCount = out.tools.size();
            out.success = true;
            out.message = fmt::format("Connected successfully, {} tools available", out.toolCount);
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
    } else {
        out.message = fmt::format(
            "Connection test timed out after {} ms. This may indicate a transport mismatch "
            "(e.g., an HTTP server declared as SSE, or vice versa).",
            this->options.connectTimeout.count());
    }
    if (failure) {
        out.message = diagnostics::DiagnoseConnectionFailure(config, failure, *this->registry);
    }
    co_await toolhost::async::makeFutureAwaitable(coClose(client).toFuture());
    LOG_INFO("ConnectionManager: probe of {} {}: {}", config.id, out.success ? "succeeded" : "failed", out.message);
    co_return out;
}

/////////////////////////////////////////// Public API ///////////////////////////////////////////
ConnectionManager::ConnectionManager(std::shared_ptr<ITransportFactory> factory,
                                     std::shared_ptr<registry::PackageRegistry> registry,
                                     Options options)
    : pImpl(std::make_unique<Impl>(std::move(factory), std::move(registry), std::move(options))) {
    FUNC_SCOPE();
}

ConnectionManager::~ConnectionManager() {
    FUNC_SCOPE();
    DisconnectAll().wait();
}

ConnectionManager::Options ConnectionManager::OptionsFromEnvironment() {
    Options opts;
    opts.clientInfo = Implementation("toolhost", getVersionString());
    opts.connectTimeout = std::chrono::milliseconds(GetEnvMillisOrDefault("TOOLHOST_CONNECT_TIMEOUT_MS", 15000));
    opts.systemProbe = diagnostics::DefaultSystemProbe();
    return opts;
}

std::future<void> ConnectionManager::Connect(const ServerConfig& config) {
    FUNC_SCOPE();
    return pImpl->coConnect(config).toFuture();
}

std::future<void> ConnectionManager::Disconnect(const std::string& serverId) {
    FUNC_SCOPE();
    return pImpl->coDisconnect(serverId).toFuture();
}

std::future<void> ConnectionManager::DisconnectAll() {
    FUNC_SCOPE();
    return pImpl->coDisconnectAll().toFuture();
}

bool ConnectionManager::IsConnected(const std::string& serverId) const {
    return pImpl->findClient(serverId) != nullptr;
}

std::vector<std::string> ConnectionManager::GetConnectedServers() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<std::string> ids;
    ids.reserve(pImpl->connections.size());
    for (const auto& kv : pImpl->connections) {
        ids.push_back(kv.first);
    }
    return ids;
}

std::future<std::vector<Tool>> ConnectionManager::ListTools(const std::string& serverId) {
    FUNC_SCOPE();
    return pImpl->coListTools(serverId).toFuture();
}

std::future<CallToolResult> ConnectionManager::CallTool(const std::string& serverId,
                                                        const std::string& toolName,
                                                        const JSONValue& arguments) {
    FUNC_SCOPE();
    return pImpl->coCallTool(serverId, toolName, arguments).toFuture();
}

std::future<bool> ConnectionManager::Ping(const std::string& serverId) {
    FUNC_SCOPE();
    return pImpl->coPing(serverId).toFuture();
}

std::future<ProbeResult> ConnectionManager::ProbeConnection(const ServerConfig& config) {
    FUNC_SCOPE();
    return pImpl->coProbe(config).toFuture();
}

registry::RegistryData ConnectionManager::GetRegistry() {
    return pImpl->registry->GetRegistry();
}

registry::PackageValidation ConnectionManager::ValidatePackage(const std::string& packageIdentifier) {
    return pImpl->registry->ValidatePackage(packageIdentifier);
}

diagnostics::SystemDiagnosis ConnectionManager::DiagnoseSystem() {
    return diagnostics::DiagnoseSystem(pImpl->options.systemProbe, GetEnvOrDefault("PATH", ""));
}

} // namespace toolhost

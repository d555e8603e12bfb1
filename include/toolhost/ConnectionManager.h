//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionManager.h
// Purpose: Owns live provider connections: connect/disconnect lifecycle, tool listing and tool calls
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/Transport.h"
#include "toolhost/diagnostics/Diagnostics.h"
#include "toolhost/registry/PackageRegistry.h"

namespace toolhost {

// Outcome of an ad-hoc connection attempt that is never registered.
struct ProbeResult {
    bool success{false};
    std::size_t toolCount{0};
    std::vector<Tool> tools;
    std::string message;
};

//==========================================================================================================
// ConnectionManager
// Purpose: At most one live connection per server id. Per id the states are Disconnected, Connecting and
//          Connected; a second Connect for an id that is connecting or connected is rejected. Operations on
//          different ids never interfere.
//==========================================================================================================
class ConnectionManager {
public:
    struct Options {
        Implementation clientInfo;
        std::chrono::milliseconds connectTimeout{15000};  // transport start + handshake
        diagnostics::SystemProbe systemProbe;              // DiagnoseSystem tool probe
    };

    ConnectionManager(std::shared_ptr<ITransportFactory> factory,
                      std::shared_ptr<registry::PackageRegistry> registry,
                      Options options);

    // Disconnects everything still connected.
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Client info "toolhost"/library version, TOOLHOST_CONNECT_TIMEOUT_MS and the default system probe.
    static Options OptionsFromEnvironment();

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Connect
    // Purpose: Builds the transport (validation happens in the factory), starts it and runs the handshake.
    // Returns:
    //   Future that completes once the connection is registered. Failures:
    //     ValidationRejected / ConfigurationError from the factory, unchanged;
    //     ConnectionFailed naming the id when it is already connected or connecting;
    //     ConnectionFailed with a diagnosed, actionable message when start or handshake fails or times out.
    //==========================================================================================================
    std::future<void> Connect(const ServerConfig& config);

    // Removes the id from the live set, then closes its transport. Unknown ids are ignored. Never fails.
    std::future<void> Disconnect(const std::string& serverId);

    // Disconnects every server concurrently and waits for all of them. Never fails.
    std::future<void> DisconnectAll();

    bool IsConnected(const std::string& serverId) const;

    // Ids with a live connection, ascending.
    std::vector<std::string> GetConnectedServers() const;

    /////////////////////////////////////////// Tools ///////////////////////////////////////////
    // NotConnected when the id has no live connection; no I/O happens in that case.
    std::future<std::vector<Tool>> ListTools(const std::string& serverId);

    //==========================================================================================================
    // CallTool
    // Returns:
    //   Normalized result (content array, isError flag). NotConnected for unknown ids; ToolExecutionFailed
    //   (errors::RemoteError) when the provider answers with a JSON-RPC error.
    //==========================================================================================================
    std::future<CallToolResult> CallTool(const std::string& serverId,
                                         const std::string& toolName,
                                         const JSONValue& arguments);

    // Liveness probe through tools/list, bounded by the connect timeout. Never throws.
    std::future<bool> Ping(const std::string& serverId);

    //==========================================================================================================
    // ProbeConnection
    // Purpose: Connect, list tools and disconnect without registering anything, bounded by the connect
    //          timeout. A timed out attempt is torn down.
    //==========================================================================================================
    std::future<ProbeResult> ProbeConnection(const ServerConfig& config);

    /////////////////////////////////////////// Registry / diagnostics ///////////////////////////////////////////
    registry::RegistryData GetRegistry();
    registry::PackageValidation ValidatePackage(const std::string& packageIdentifier);
    diagnostics::SystemDiagnosis DiagnoseSystem();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolBridge.h
// Purpose: Flat, collision-free namespace of invocable tools across every enabled server
//==========================================================================================================

#pragma once

#include <future>
#include <map>
#include <string>

#include "toolhost/ConnectionManager.h"
#include "toolhost/Protocol.h"
#include "toolhost/bridge/ArgumentValidator.h"
#include "toolhost/config/ConfigurationStore.h"
#include "toolhost/health/HealthMonitor.h"

namespace toolhost {
namespace bridge {

//==========================================================================================================
// ToolHandle
// Purpose: Invocable wrapper of one remote tool, registered under the bridge key "{serverId}_{toolName}".
//          Holds the server id, the tool declaration and its generated validator. The connection manager
//          and health monitor must outlive the handle.
//==========================================================================================================
class ToolHandle {
public:
    ToolHandle(ConnectionManager& connections, health::HealthMonitor& health, std::string serverId, Tool tool);

    const std::string& ServerId() const { return serverId; }
    const std::string& ToolName() const { return tool.name; }
    const std::string& Description() const { return tool.description; }
    const JSONValue& InputSchema() const { return tool.inputSchema; }
    const ArgumentValidator& Validator() const { return validator; }

    //==========================================================================================================
    // Invoke
    // Purpose: Validates, calls the tool on its server and flattens the result to text.
    // Args:
    //   arguments: JSON object; null is treated as an empty object.
    // Returns:
    //   Future with the flattened text. Failures:
    //     InvalidArguments when validation fails (nothing is sent, no health event);
    //     otherwise the connection manager's error, rethrown after it is recorded in the health monitor.
    //==========================================================================================================
    std::future<std::string> Invoke(const JSONValue& arguments) const;

    //==========================================================================================================
    // FlattenResult
    // Purpose: Text items verbatim, resource items as "[Resource: <resource>]", other items as
    //          "[<type>: <data>]", joined with newlines. A result without content is serialized whole.
    //==========================================================================================================
    static std::string FlattenResult(const CallToolResult& result);

private:
    ConnectionManager* connections;
    health::HealthMonitor* health;
    std::string serverId;
    Tool tool;
    ArgumentValidator validator;
};

class ToolBridge {
public:
    ToolBridge(ConnectionManager& connections, health::HealthMonitor& health,
               const config::IConfigurationSource& configuration);

    //==========================================================================================================
    // GetTools
    // Purpose: Reloads the configuration, connects every enabled server that is not connected yet and lists
    //          its tools. A server that fails to connect or list is logged and skipped.
    // Returns:
    //   Map bridge key -> handle. Tools with blank names and keys containing "undefined" or "null" are left
    //   out. Servers are visited in ascending id order and the first handle registered under a key wins.
    //   Never fails.
    //==========================================================================================================
    std::future<std::map<std::string, ToolHandle>> GetTools();

    static std::string BridgeKey(const std::string& serverId, const std::string& toolName);

private:
    ConnectionManager& connections;
    health::HealthMonitor& health;
    const config::IConfigurationSource& configuration;
};

} // namespace bridge
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolBridge.cpp
// Purpose: Tool bridge implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include "logging/Logger.h"
#include "toolhost/async/Task.h"
#include "toolhost/bridge/ToolBridge.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {
namespace bridge {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string renderItem(const JSONValue& item) {
    const std::string type = getStringMember(item, "type").value_or(std::string("unknown"));
    if (type == "text") {
        return getStringMember(item, "text").value_or(std::string());
    }
    if (type == "resource") {
        const JSONValue* res = findMember(item, "resource");
        if (res == nullptr) {
            res = findMember(item, "data");
        }
        return "[Resource: " + (res != nullptr ? serializeJSONValue(*res) : std::string()) + "]";
    }
    const JSONValue* data = findMember(item, "data");
    return "[" + type + ": " + serializeJSONValue(data != nullptr ? *data : item) + "]";
}

JSONValue resultToJSON(const CallToolResult& result) {
    JSONValue::Array content;
    for (const auto& c : result.content) {
        content.push_back(std::make_shared<JSONValue>(c));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue{std::move(obj)};
}

toolhost::async::Task<std::string> coInvoke(ConnectionManager* connections, health::HealthMonitor* health,
                                            std::string serverId, std::string toolName,
                                            ArgumentValidator validator, JSONValue arguments) {
    if (arguments.isNull()) {
        arguments = JSONValue{JSONValue::Object{}};
    }
    const std::string problem = validator.Check(arguments);
    if (!problem.empty()) {
        throw errors::ToolhostError(errors::ErrorCategory::InvalidArguments,
                                    "Invalid arguments for " + ToolBridge::BridgeKey(serverId, toolName) + ": " + problem);
    }

    LOG_DEBUG("ToolBridge: executing {} on {}", toolName, serverId);
    CallToolResult result;
    std::exception_ptr failure;
    try {
        result = co_await toolhost::async::makeFutureAwaitable(connections->CallTool(serverId, toolName, arguments));
    } catch (const std::exception& e) {
        LOG_ERROR("ToolBridge: error executing {} on {}: {}", toolName, serverId, e.what());
        health->RecordError(serverId, toolName, e.what());
        failure = std::current_exception();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    health->RecordSuccess(serverId, toolName);
    if (result.isError) {
        LOG_WARN("ToolBridge: {} on {} reported a tool-level error", toolName, serverId);
    }
    co_return ToolHandle::FlattenResult(result);
}

} // namespace

/////////////////////////////////////////// ToolHandle ///////////////////////////////////////////
ToolHandle::ToolHandle(ConnectionManager& c, health::HealthMonitor& h, std::string id, Tool t)
    : connections(&c), health(&h), serverId(std::move(id)), tool(std::move(t)),
      validator(ArgumentValidator::FromSchema(tool.inputSchema)) {
    if (tool.description.empty()) {
        tool.description = "Tool from server " + serverId;
    }
}

std::future<std::string> ToolHandle::Invoke(const JSONValue& arguments) const {
    FUNC_SCOPE();
    return coInvoke(connections, health, serverId, tool.name, validator, arguments).toFuture();
}

std::string ToolHandle::FlattenResult(const CallToolResult& result) {
    if (result.content.empty()) {
        return serializeJSONValue(resultToJSON(result));
    }
    std::string out;
    bool first = true;
    for (const auto& item : result.content) {
        if (!first) {
            out += "\n";
        }
        first = false;
        out += renderItem(item);
    }
    return out;
}

/////////////////////////////////////////// ToolBridge ///////////////////////////////////////////
namespace {

toolhost::async::Task<std::map<std::string, ToolHandle>> coGetTools(ConnectionManager* connections,
                                                                    health::HealthMonitor* health,
                                                                    config::Configuration configuration) {
    std::map<std::string, ToolHandle> tools;
    for (const auto& [serverId, serverConfig] : configuration.enabledServers) {
        std::vector<Tool> serverTools;
        bool loaded = false;
        try {
            if (!connections->IsConnected(serverId)) {
                co_await toolhost::async::makeFutureAwaitable(connections->Connect(serverConfig));
            }
            serverTools = co_await toolhost::async::makeFutureAwaitable(connections->ListTools(serverId));
            loaded = true;
        } catch (const std::exception& e) {
            LOG_ERROR("ToolBridge: error loading tools from server {}: {}", serverId, e.what());
        }
        if (!loaded) {
            continue;
        }

        for (auto& tool : serverTools) {
            if (isBlank(tool.name)) {
                LOG_ERROR("ToolBridge: invalid tool name from server {}", serverId);
                continue;
            }
            const std::string key = ToolBridge::BridgeKey(serverId, tool.name);
            if (key.find("undefined") != std::string::npos || key.find("null") != std::string::npos) {
                LOG_ERROR("ToolBridge: invalid tool id {} from server {}", key, serverId);
                continue;
            }
            if (tools.count(key) > 0) {
                LOG_ERROR("ToolBridge: duplicate tool id {} (server {}), keeping the handle from server {}",
                          key, serverId, tools.at(key).ServerId());
                continue;
            }
            tools.emplace(key, ToolHandle(*connections, *health, serverId, std::move(tool)));
            LOG_DEBUG("ToolBridge: registered {}", key);
        }
        LOG_INFO("ToolBridge: loaded {} tools from server {}", serverTools.size(), serverId);
    }
    LOG_INFO("ToolBridge: {} tools available ({} enabled servers, {} disabled)", tools.size(),
             configuration.enabledServers.size(), configuration.disabledServers.size());
    co_return tools;
}

} // namespace

ToolBridge::ToolBridge(ConnectionManager& c, health::HealthMonitor& h, const config::IConfigurationSource& cfg)
    : connections(c), health(h), configuration(cfg) {}

std::string ToolBridge::BridgeKey(const std::string& serverId, const std::string& toolName) {
    return serverId + "_" + toolName;
}

std::future<std::map<std::string, ToolHandle>> ToolBridge::GetTools() {
    FUNC_SCOPE();
    config::Configuration cfg;
    try {
        cfg = configuration.LoadConfiguration();
    } catch (const std::exception& e) {
        LOG_ERROR("ToolBridge: error loading configuration: {}", e.what());
    }
    return coGetTools(&connections, &health, std::move(cfg)).toFuture();
}

} // namespace bridge
} // namespace toolhost

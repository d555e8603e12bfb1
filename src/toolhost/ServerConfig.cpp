//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: JSON mapping and invariants of ServerConfig
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "logging/Logger.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

using errors::ErrorCategory;
using errors::ToolhostError;

namespace {
std::map<std::string, std::string> stringMapMember(const std::string& id, const JSONValue& entry, const char* key) {
    std::map<std::string, std::string> out;
    const JSONValue* v = findMember(entry, key);
    if (v == nullptr || v->isNull()) {
        return out;
    }
    if (!v->isObject()) {
        throw ToolhostError(ErrorCategory::ConfigurationError,
                            "Server " + id + ": '" + key + "' must be an object of strings");
    }
    for (const auto& [k, val] : std::get<JSONValue::Object>(v->value)) {
        if (!val || !val->isString()) {
            throw ToolhostError(ErrorCategory::ConfigurationError,
                                "Server " + id + ": '" + key + "." + k + "' must be a string");
        }
        out[k] = std::get<std::string>(val->value);
    }
    return out;
}

JSONValue stringMapToJSON(const std::map<std::string, std::string>& m) {
    JSONValue::Object obj;
    for (const auto& [k, v] : m) {
        obj[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue{std::move(obj)};
}
} // namespace

const char* toString(TransportKind kind) {
    switch (kind) {
        case TransportKind::Stdio: return "stdio";
        case TransportKind::Http: return "http";
        case TransportKind::Sse: return "sse";
    }
    return "stdio";
}

std::optional<TransportKind> transportKindFromString(const std::string& s) {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (lower == "stdio") return TransportKind::Stdio;
    if (lower == "http" || lower == "streamable-http") return TransportKind::Http;
    if (lower == "sse") return TransportKind::Sse;
    return std::nullopt;
}

ServerConfig serverConfigFromJSON(const std::string& id, const JSONValue& entry) {
    FUNC_SCOPE();
    if (!entry.isObject()) {
        throw ToolhostError(ErrorCategory::ConfigurationError, "Server " + id + ": entry must be an object");
    }
    ServerConfig cfg;
    cfg.id = id;

    auto transport = getStringMember(entry, "transport");
    if (!transport.has_value()) {
        transport = getStringMember(entry, "type");
    }
    if (transport.has_value()) {
        auto kind = transportKindFromString(*transport);
        if (!kind.has_value()) {
            throw ToolhostError(ErrorCategory::ConfigurationError, "Unknown transport type: " + *transport);
        }
        cfg.transport = *kind;
    }

    cfg.command = getStringMember(entry, "command");
    if (const JSONValue* args = findMember(entry, "args")) {
        if (!args->isArray()) {
            throw ToolhostError(ErrorCategory::ConfigurationError, "Server " + id + ": 'args' must be an array of strings");
        }
        for (const auto& a : std::get<JSONValue::Array>(args->value)) {
            if (!a || !a->isString()) {
                throw ToolhostError(ErrorCategory::ConfigurationError, "Server " + id + ": 'args' must be an array of strings");
            }
            cfg.args.push_back(std::get<std::string>(a->value));
        }
    }
    cfg.env = stringMapMember(id, entry, "env");

    cfg.baseUrl = getStringMember(entry, "baseUrl");
    if (!cfg.baseUrl.has_value()) {
        cfg.baseUrl = getStringMember(entry, "url");
    }
    cfg.headers = stringMapMember(id, entry, "headers");
    return cfg;
}

JSONValue serverConfigToJSON(const ServerConfig& config) {
    JSONValue::Object obj;
    obj["transport"] = std::make_shared<JSONValue>(toString(config.transport));
    if (config.command.has_value()) {
        obj["command"] = std::make_shared<JSONValue>(config.command.value());
    }
    if (!config.args.empty()) {
        JSONValue::Array arr;
        for (const auto& a : config.args) {
            arr.push_back(std::make_shared<JSONValue>(a));
        }
        obj["args"] = std::make_shared<JSONValue>(std::move(arr));
    }
    if (!config.env.empty()) {
        obj["env"] = std::make_shared<JSONValue>(stringMapToJSON(config.env));
    }
    if (config.baseUrl.has_value()) {
        obj["baseUrl"] = std::make_shared<JSONValue>(config.baseUrl.value());
    }
    if (!config.headers.empty()) {
        obj["headers"] = std::make_shared<JSONValue>(stringMapToJSON(config.headers));
    }
    return JSONValue{std::move(obj)};
}

std::string checkTransportRequirements(const ServerConfig& config) {
    switch (config.transport) {
        case TransportKind::Stdio:
            if (!config.command.has_value() || config.command->empty()) {
                return "Command is required for stdio transport";
            }
            break;
        case TransportKind::Http:
            if (!config.baseUrl.has_value() || config.baseUrl->empty()) {
                return "Base URL is required for HTTP transport";
            }
            break;
        case TransportKind::Sse:
            if (!config.baseUrl.has_value() || config.baseUrl->empty()) {
                return "Base URL is required for SSE transport";
            }
            break;
    }
    return std::string();
}

} // namespace toolhost

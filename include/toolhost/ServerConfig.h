//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Declared tool-provider server configuration and its JSON mapping
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

enum class TransportKind {
    Stdio,
    Http,
    Sse
};

const char* toString(TransportKind kind);

// Parses "stdio" | "http" | "sse" (case-insensitive). Returns std::nullopt for anything else.
std::optional<TransportKind> transportKindFromString(const std::string& s);

//==========================================================================================================
// ServerConfig
// Purpose: One declared tool provider.
// Fields:
//   id: Unique stable key.
//   transport: Channel used to reach the provider.
//   command/args/env: Launch description (stdio only; command required).
//   baseUrl/headers: Endpoint description (http/sse only; baseUrl required).
//==========================================================================================================
struct ServerConfig {
    std::string id;
    TransportKind transport{TransportKind::Stdio};
    std::optional<std::string> command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::optional<std::string> baseUrl;
    std::map<std::string, std::string> headers;
};

//==========================================================================================================
// serverConfigFromJSON
// Purpose: Builds a ServerConfig from a configuration entry. Accepts "type" as an alias of "transport" and
//          "url" as an alias of "baseUrl"; a missing transport means stdio.
// Args:
//   id: Entry key.
//   entry: JSON object describing the server.
// Returns:
//   ServerConfig. Throws errors::ToolhostError(ConfigurationError) for non-object entries, unknown
//   transports, or wrongly typed fields.
//==========================================================================================================
ServerConfig serverConfigFromJSON(const std::string& id, const JSONValue& entry);

// Serializes a ServerConfig without its id (the id is the key in the configuration document).
JSONValue serverConfigToJSON(const ServerConfig& config);

//==========================================================================================================
// checkTransportRequirements
// Purpose: Enforces stdio => command and http/sse => baseUrl.
// Returns:
//   Empty string when satisfied; otherwise the reason.
//==========================================================================================================
std::string checkTransportRequirements(const ServerConfig& config);

} // namespace toolhost

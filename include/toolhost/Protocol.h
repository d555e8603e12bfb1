//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-provider protocol data structures and method names used by the orchestration layer
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>

namespace toolhost {
//==========================================================================================================
// Protocol types and constants
// Purpose: Subset of the provider protocol covered here: handshake, tool listing and tool calls.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Handshake ///////////////////////////////////////////
struct InitializeResult {
    std::string protocolVersion;
    Implementation serverInfo;
    bool hasToolsCapability = false;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: Tool as declared by a provider at discovery time.
// Fields:
//   name: Unique per server.
//   description: Free text; empty when the provider omitted it.
//   inputSchema: JSON schema object (properties + required list).
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolParams {
    std::string name;
    JSONValue arguments;
};

//==========================================================================================================
// CallToolResult
// Purpose: Normalized tool call outcome. content is always an array (possibly empty); isError defaults to false.
//==========================================================================================================
struct CallToolResult {
    std::vector<JSONValue> content;
    bool isError = false;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* Ping = "ping";
}

} // namespace toolhost

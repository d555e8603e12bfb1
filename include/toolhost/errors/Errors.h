//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy of the orchestration layer and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace errors {

// Categories reported to consumers. Each one implies a different recovery strategy.
enum class ErrorCategory {
    ValidationRejected,   // launch refused by the command validator; never retried
    ConnectionFailed,     // transport or handshake failure, message carries a diagnosis
    NotConnected,         // operation against an id with no live connection
    ToolExecutionFailed,  // the remote tool failed; the call alone may be retried
    RegistryUnavailable,  // registry could not be loaded; embedded defaults are used
    InvalidArguments,     // arguments rejected by the generated schema check before any I/O
    ConfigurationError    // malformed or unknown configuration entry
};

inline const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::ValidationRejected: return "ValidationRejected";
        case ErrorCategory::ConnectionFailed: return "ConnectionFailed";
        case ErrorCategory::NotConnected: return "NotConnected";
        case ErrorCategory::ToolExecutionFailed: return "ToolExecutionFailed";
        case ErrorCategory::RegistryUnavailable: return "RegistryUnavailable";
        case ErrorCategory::InvalidArguments: return "InvalidArguments";
        case ErrorCategory::ConfigurationError: return "ConfigurationError";
    }
    return "Unknown";
}

//==========================================================================================================
// ToolhostError
// Purpose: Exception type raised by the validator, connection manager, bridge and configuration store.
// Fields:
//   category: Taxonomy bucket.
//   rpcCode: JSON-RPC error code when the failure originated from a remote error object.
//==========================================================================================================
class ToolhostError : public std::runtime_error {
public:
    ToolhostError(ErrorCategory category, const std::string& message, std::optional<int> rpcCode = std::nullopt)
        : std::runtime_error(message), category_(category), rpcCode_(rpcCode) {}

    ErrorCategory category() const noexcept { return category_; }
    std::optional<int> rpcCode() const noexcept { return rpcCode_; }

private:
    ErrorCategory category_;
    std::optional<int> rpcCode_;
};

// Typed view of a JSON-RPC error object.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<RpcError> populated when shape is valid.
inline std::optional<RpcError> rpcErrorFromValue(const JSONValue& errVal) {
    const JSONValue* code = findMember(errVal, "code");
    auto message = getStringMember(errVal, "message");
    if (code == nullptr || !message.has_value()) {
        return std::nullopt;
    }
    RpcError e;
    if (std::holds_alternative<int64_t>(code->value)) {
        e.code = static_cast<int>(std::get<int64_t>(code->value));
    } else if (std::holds_alternative<double>(code->value)) {
        e.code = static_cast<int>(std::get<double>(code->value));
    } else {
        return std::nullopt;
    }
    e.message = *message;
    if (const JSONValue* data = findMember(errVal, "data")) {
        e.data = *data;
    }
    return e;
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromValue(response.error.value());
}

//==========================================================================================================
// RemoteError
// Purpose: ToolhostError raised from a JSON-RPC error response; keeps the full error object so connection
//          diagnostics can inspect the code and transport-attached data.
//==========================================================================================================
class RemoteError : public ToolhostError {
public:
    RemoteError(ErrorCategory category, const std::string& message, const RpcError& err)
        : ToolhostError(category, message, err.code), rpc_(err) {}

    const RpcError& rpc() const noexcept { return rpc_; }

private:
    RpcError rpc_;
};

// True when data.networkError was attached by the HTTP/SSE transports (resolve/connect/TLS failure).
inline bool isNetworkRpcError(const RpcError& err) {
    return err.data.has_value() && findMember(err.data.value(), "networkError") != nullptr;
}

// Reads data.httpStatus from an error attached by the HTTP/SSE transports (0 when absent).
inline int httpStatusFromRpcError(const RpcError& err) {
    if (!err.data.has_value()) {
        return 0;
    }
    const JSONValue* status = findMember(err.data.value(), "httpStatus");
    if (status == nullptr || !std::holds_alternative<int64_t>(status->value)) {
        return 0;
    }
    return static_cast<int>(std::get<int64_t>(status->value));
}

} // namespace errors
} // namespace toolhost

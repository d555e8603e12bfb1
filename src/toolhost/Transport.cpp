//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Behavior shared by all transports
//==========================================================================================================

#include <memory>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/Transport.h"

namespace toolhost {

std::unique_ptr<JSONRPCResponse> AnswerInboundRequest(const ITransport::RequestHandler& handler,
                                                      const JSONRPCRequest& request) {
    if (handler) {
        try {
            auto resp = handler(request);
            if (resp) {
                resp->id = request.id;
                return resp;
            }
            LOG_WARN("Transport: request handler returned no response for {}", request.method);
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "No response produced");
        } catch (const std::exception& e) {
            LOG_ERROR("Transport: request handler failed for {}: {}", request.method, e.what());
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
        }
    }
    if (request.method == Methods::Ping) {
        return std::make_unique<JSONRPCResponse>(request.id, JSONValue{JSONValue::Object{}});
    }
    LOG_DEBUG("Transport: no handler for inbound request {}", request.method);
    return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + request.method);
}

} // namespace toolhost

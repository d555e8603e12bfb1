//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportFactory.h
// Purpose: Default transport factory: validates launch commands and builds stdio/HTTP/SSE transports
//==========================================================================================================
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "toolhost/Transport.h"
#include "toolhost/resolver/CommandResolver.h"

namespace toolhost {

//==========================================================================================================
// DefaultTransportFactory
// Purpose: Maps a ServerConfig to a concrete, not yet started transport.
//   stdio: runtime-mode command validation, command resolution, then ProcessTransport.
//   http:  HTTPTransport against baseUrl with the configured headers.
//   sse:   SSETransport against baseUrl with the configured headers.
//==========================================================================================================
class DefaultTransportFactory : public ITransportFactory {
public:
    struct Options {
        resolver::CommandResolver::Options resolver;
        uint64_t connectTimeoutMs{15000};
        uint64_t requestTimeoutMs{60000};
        std::string caFile;  // extra trust anchors for https base URLs
    };

    DefaultTransportFactory();
    explicit DefaultTransportFactory(Options options);

    // Resolver snapshot of the process environment plus TOOLHOST_CONNECT_TIMEOUT_MS / TOOLHOST_REQUEST_TIMEOUT_MS.
    static Options OptionsFromEnvironment();

    //==========================================================================================================
    // CreateTransport
    // Throws:
    //   errors::ToolhostError(ConfigurationError) when the transport's required field is missing,
    //   errors::ToolhostError(ValidationRejected) when the stdio command is refused,
    //   errors::ToolhostError(ConnectionFailed) when npx cannot be located.
    //==========================================================================================================
    std::unique_ptr<ITransport> CreateTransport(const ServerConfig& config) override;

private:
    Options options;
    resolver::CommandResolver commandResolver;
};

} // namespace toolhost

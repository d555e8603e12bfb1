//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportFactory.cpp
// Purpose: Default transport factory implementation
//==========================================================================================================

#include <utility>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/HTTPTransport.hpp"
#include "toolhost/ProcessTransport.hpp"
#include "toolhost/SSETransport.hpp"
#include "toolhost/ServerConfig.h"
#include "toolhost/TransportFactory.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/security/CommandValidator.h"

namespace toolhost {

DefaultTransportFactory::DefaultTransportFactory()
    : DefaultTransportFactory(OptionsFromEnvironment()) {}

DefaultTransportFactory::DefaultTransportFactory(Options opts)
    : options(std::move(opts)), commandResolver(options.resolver) {}

DefaultTransportFactory::Options DefaultTransportFactory::OptionsFromEnvironment() {
    Options opts;
    opts.resolver = resolver::CommandResolver::OptionsFromEnvironment();
    opts.connectTimeoutMs = GetEnvMillisOrDefault("TOOLHOST_CONNECT_TIMEOUT_MS", 15000);
    opts.requestTimeoutMs = GetEnvMillisOrDefault("TOOLHOST_REQUEST_TIMEOUT_MS", 60000);
    return opts;
}

std::unique_ptr<ITransport> DefaultTransportFactory::CreateTransport(const ServerConfig& config) {
    FUNC_SCOPE();
    const std::string missing = checkTransportRequirements(config);
    if (!missing.empty()) {
        LOG_ERROR("TransportFactory: {} (server {})", missing, config.id);
        throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, missing);
    }

    switch (config.transport) {
        case TransportKind::Stdio: {
            security::CommandValidator::Validate(*config.command, config.args, security::ValidationMode::Runtime);
            resolver::ResolvedCommand resolved = commandResolver.Resolve(config);
            LOG_INFO("TransportFactory: stdio server {} -> {} ({} args)", config.id, resolved.executable, resolved.args.size());
            auto transport = std::make_unique<ProcessTransport>(std::move(resolved));
            transport->SetRequestTimeoutMs(options.requestTimeoutMs);
            return transport;
        }
        case TransportKind::Http: {
            HTTPTransport::Options http;
            http.baseUrl = *config.baseUrl;
            http.headers = config.headers;
            http.caFile = options.caFile;
            http.connectTimeoutMs = static_cast<unsigned int>(options.connectTimeoutMs);
            http.readTimeoutMs = static_cast<unsigned int>(options.requestTimeoutMs);
            LOG_INFO("TransportFactory: http server {} -> {}", config.id, http.baseUrl);
            return std::make_unique<HTTPTransport>(http);
        }
        case TransportKind::Sse: {
            SSETransport::Options sse;
            sse.url = *config.baseUrl;
            sse.headers = config.headers;
            sse.caFile = options.caFile;
            sse.connectTimeoutMs = static_cast<unsigned int>(options.connectTimeoutMs);
            sse.requestTimeoutMs = static_cast<unsigned int>(options.requestTimeoutMs);
            LOG_INFO("TransportFactory: sse server {} -> {}", config.id, sse.url);
            return std::make_unique<SSETransport>(sse);
        }
    }
    throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError,
                                "Unsupported transport for server " + config.id);
}

} // namespace toolhost

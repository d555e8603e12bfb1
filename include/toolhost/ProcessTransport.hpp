//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that spawns a tool provider subprocess and speaks JSON-RPC over its stdio pipes
//==========================================================================================================
#pragma once

#include "toolhost/Transport.h"
#include "toolhost/resolver/CommandResolver.h"
#include <memory>
#include <cstdint>

namespace toolhost {

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process. Messages are newline-delimited JSON on the child's stdin/stdout; the
//          child's stderr is drained into the debug log.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    explicit ProcessTransport(resolver::ResolvedCommand command);
    virtual ~ProcessTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the child process and starts the reader and timeout loops.
    // Returns:
    //   Future that completes once the executable has been exec'd. Holds std::system_error carrying the
    //   errno of the failed exec (ENOENT, EACCES, ...) when the child could not be started.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes stdin, sends SIGTERM, escalates to SIGKILL after the grace period and reaps the child.
    // Pending requests complete with ConnectionClosed.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Maximum time to wait for a single request/response pair (default TOOLHOST_REQUEST_TIMEOUT_MS
    //          or 60000). 0 disables the timeout.
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    // Time between SIGTERM and SIGKILL on Close (default 2000 ms).
    void SetTerminateGraceMs(uint64_t graceMs);

    // Child process id; -1 before Start or after Close.
    int GetProcessId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace toolhost

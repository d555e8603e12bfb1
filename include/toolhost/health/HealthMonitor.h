//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HealthMonitor.h
// Purpose: Per-server and per-tool reliability bookkeeping with an unhealthy threshold and error decay
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {
namespace health {

enum class HealthStatus {
    Healthy,
    Unhealthy,
    Unknown
};

const char* toString(HealthStatus status);

using TimePoint = std::chrono::system_clock::time_point;

struct ToolStats {
    uint64_t successCount{0};
    uint64_t errorCount{0};
    std::optional<std::string> lastError;
    std::optional<TimePoint> lastErrorTime;
    std::optional<TimePoint> lastSuccess;
};

//==========================================================================================================
// ServerHealth
// Purpose: Health record of one server, created lazily on its first recorded event.
//==========================================================================================================
struct ServerHealth {
    std::string serverId;
    HealthStatus status{HealthStatus::Unknown};
    uint64_t successCount{0};
    uint64_t errorCount{0};
    uint64_t consecutiveErrors{0};
    std::optional<std::string> lastError;
    std::optional<TimePoint> lastErrorTime;
    std::optional<TimePoint> lastSuccess;
    std::map<std::string, ToolStats> tools;
};

//==========================================================================================================
// HealthMonitor
// Purpose: Thread-safe, in-memory and advisory. No operation throws.
//   RecordError marks a server unhealthy once consecutiveErrors reaches the threshold.
//   RecordSuccess resets consecutiveErrors and returns an unhealthy server to healthy. An unknown server
//   stays unknown; status only moves once the error threshold has been crossed.
//   The periodic sweep clears consecutiveErrors when the last error is older than the decay window, and
//   returns an unhealthy server with at least one recorded success to healthy.
//==========================================================================================================
class HealthMonitor {
public:
    struct Options {
        uint64_t errorThreshold{5};
        std::chrono::milliseconds sweepInterval{30000};
        std::chrono::milliseconds decayWindow{std::chrono::hours(1)};
    };

    using Clock = std::function<TimePoint()>;

    HealthMonitor();
    // An empty clock means std::chrono::system_clock::now.
    explicit HealthMonitor(Options options, Clock clock = Clock());
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    // Starts / stops the background sweep thread. Both are idempotent.
    void Start();
    void Stop();

    void RecordSuccess(const std::string& serverId, const std::string& toolName);
    void RecordError(const std::string& serverId, const std::string& toolName, const std::string& message);

    std::optional<ServerHealth> GetServerHealth(const std::string& serverId) const;
    std::map<std::string, ServerHealth> GetHealthReport() const;
    std::vector<std::string> GetUnhealthyServers() const;

    // Discards all history for the server.
    void ResetServerHealth(const std::string& serverId);

    // successCount / (successCount + errorCount); 1.0 when nothing was recorded.
    double GetServerSuccessRate(const std::string& serverId) const;
    double GetToolSuccessRate(const std::string& serverId, const std::string& toolName) const;

    // Unhealthy, or success rate below 0.5. False for unknown servers.
    bool ShouldDeprioritize(const std::string& serverId) const;

    // One decay pass; the sweep thread calls this every sweepInterval.
    void RunSweep();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace health
} // namespace toolhost

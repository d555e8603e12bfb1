//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HealthMonitor.cpp
// Purpose: Health monitor implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

#include "logging/Logger.h"
#include "toolhost/health/HealthMonitor.h"

namespace toolhost {
namespace health {

const char* toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Unhealthy: return "unhealthy";
        case HealthStatus::Unknown: return "unknown";
    }
    return "unknown";
}

namespace {

double rate(uint64_t successes, uint64_t errors) {
    const uint64_t total = successes + errors;
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(successes) / static_cast<double>(total);
}

} // namespace

class HealthMonitor::Impl {
public:
    HealthMonitor::Options options;
    HealthMonitor::Clock clock;

    mutable std::mutex mutex;
    std::map<std::string, ServerHealth> servers;

    std::thread sweepThread;
    std::atomic<bool> sweepStop{false};
    std::mutex sweepMutex;
    std::condition_variable sweepCv;

    Impl(HealthMonitor::Options o, HealthMonitor::Clock c) : options(o), clock(std::move(c)) {
        if (!clock) {
            clock = []() { return std::chrono::system_clock::now(); };
        }
        if (options.errorThreshold == 0) {
            options.errorThreshold = 1;
        }
    }

    ServerHealth& getOrCreate(const std::string& serverId) {
        auto it = servers.find(serverId);
        if (it == servers.end()) {
            ServerHealth h;
            h.serverId = serverId;
            it = servers.emplace(serverId, std::move(h)).first;
        }
        return it->second;
    }

    void sweep() {
        const TimePoint cutoff = clock() - options.decayWindow;
        std::lock_guard<std::mutex> lk(mutex);
        for (auto& [serverId, h] : servers) {
            if (!h.lastErrorTime.has_value() || *h.lastErrorTime >= cutoff) {
                continue;
            }
            h.consecutiveErrors = 0;
            if (h.status == HealthStatus::Unhealthy && h.successCount > 0) {
                h.status = HealthStatus::Healthy;
                LOG_INFO("HealthMonitor: {} reset to healthy, last error is older than the decay window (successes={})",
                         serverId, h.successCount);
            }
        }
    }

    void stopSweep() {
        if (!sweepThread.joinable()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(sweepMutex);
            sweepStop.store(true);
        }
        sweepCv.notify_all();
        sweepThread.join();
        sweepStop.store(false);
    }
};

HealthMonitor::HealthMonitor() : HealthMonitor(Options{}) {}

HealthMonitor::HealthMonitor(Options options, Clock clock)
    : pImpl(std::make_unique<Impl>(options, std::move(clock))) {}

HealthMonitor::~HealthMonitor() {
    pImpl->stopSweep();
}

void HealthMonitor::Start() {
    FUNC_SCOPE();
    if (pImpl->sweepThread.joinable()) {
        return;
    }
    Impl* impl = pImpl.get();
    impl->sweepThread = std::thread([impl]() {
        std::unique_lock<std::mutex> lk(impl->sweepMutex);
        while (!impl->sweepStop.load()) {
            if (impl->sweepCv.wait_for(lk, impl->options.sweepInterval, [impl]() { return impl->sweepStop.load(); })) {
                break;
            }
            lk.unlock();
            impl->sweep();
            lk.lock();
        }
    });
    LOG_DEBUG("HealthMonitor: sweep every {} ms", impl->options.sweepInterval.count());
}

void HealthMonitor::Stop() {
    FUNC_SCOPE();
    pImpl->stopSweep();
}

void HealthMonitor::RecordSuccess(const std::string& serverId, const std::string& toolName) {
    const TimePoint now = pImpl->clock();
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    ServerHealth& h = pImpl->getOrCreate(serverId);
    h.successCount++;
    h.consecutiveErrors = 0;
    h.lastSuccess = now;

    ToolStats& t = h.tools[toolName];
    t.successCount++;
    t.lastSuccess = now;

    if (h.status == HealthStatus::Unhealthy) {
        h.status = HealthStatus::Healthy;
        LOG_INFO("HealthMonitor: {} marked healthy after a successful call to {}", serverId, toolName);
    }
}

void HealthMonitor::RecordError(const std::string& serverId, const std::string& toolName, const std::string& message) {
    const TimePoint now = pImpl->clock();
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    ServerHealth& h = pImpl->getOrCreate(serverId);
    h.errorCount++;
    h.consecutiveErrors++;
    h.lastError = message;
    h.lastErrorTime = now;

    ToolStats& t = h.tools[toolName];
    t.errorCount++;
    t.lastError = message;
    t.lastErrorTime = now;

    if (h.consecutiveErrors >= pImpl->options.errorThreshold && h.status != HealthStatus::Unhealthy) {
        h.status = HealthStatus::Unhealthy;
        LOG_WARN("HealthMonitor: {} marked unhealthy (consecutiveErrors={} threshold={})",
                 serverId, h.consecutiveErrors, pImpl->options.errorThreshold);
    }
    LOG_ERROR("HealthMonitor: error recorded for {}/{}: {}", serverId, toolName, message);
}

std::optional<ServerHealth> HealthMonitor::GetServerHealth(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->servers.find(serverId);
    if (it == pImpl->servers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, ServerHealth> HealthMonitor::GetHealthReport() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->servers;
}

std::vector<std::string> HealthMonitor::GetUnhealthyServers() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<std::string> out;
    for (const auto& [serverId, h] : pImpl->servers) {
        if (h.status == HealthStatus::Unhealthy) {
            out.push_back(serverId);
        }
    }
    return out;
}

void HealthMonitor::ResetServerHealth(const std::string& serverId) {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->servers.erase(serverId);
    }
    LOG_INFO("HealthMonitor: health data reset for {}", serverId);
}

double HealthMonitor::GetServerSuccessRate(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->servers.find(serverId);
    if (it == pImpl->servers.end()) {
        return 1.0;
    }
    return rate(it->second.successCount, it->second.errorCount);
}

double HealthMonitor::GetToolSuccessRate(const std::string& serverId, const std::string& toolName) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->servers.find(serverId);
    if (it == pImpl->servers.end()) {
        return 1.0;
    }
    auto tit = it->second.tools.find(toolName);
    if (tit == it->second.tools.end()) {
        return 1.0;
    }
    return rate(tit->second.successCount, tit->second.errorCount);
}

bool HealthMonitor::ShouldDeprioritize(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->servers.find(serverId);
    if (it == pImpl->servers.end()) {
        return false;
    }
    return it->second.status == HealthStatus::Unhealthy ||
           rate(it->second.successCount, it->second.errorCount) < 0.5;
}

void HealthMonitor::RunSweep() {
    pImpl->sweep();
}

} // namespace health
} // namespace toolhost

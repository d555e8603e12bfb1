//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: toolhostctl: command validation, registry, system diagnosis and bridged tool calls
//==========================================================================================================

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "toolhost/ConnectionManager.h"
#include "toolhost/TransportFactory.h"
#include "toolhost/bridge/ToolBridge.h"
#include "toolhost/config/ConfigurationStore.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/health/HealthMonitor.h"
#include "toolhost/registry/PackageRegistry.h"
#include "toolhost/security/CommandValidator.h"
#include "toolhost/version.h"

using namespace toolhost;

static void printUsage() {
    std::cerr << "toolhostctl " << getVersionString() << "\n"
              << "Usage:\n"
              << "  toolhostctl validate <command> [args...] [--whitelist]\n"
              << "  toolhostctl registry\n"
              << "  toolhostctl diagnose\n"
              << "  toolhostctl tools <config.json>\n"
              << "  toolhostctl call <config.json> <bridgeKey> <jsonArgs>\n";
}

//==========================================================================================================
// runValidate
// Purpose: Prints the verdict for a launch command.
// Returns:
//   0 when allowed, 1 when rejected.
//==========================================================================================================
static int runValidate(const std::vector<std::string>& rest) {
    if (rest.empty()) {
        printUsage();
        return 2;
    }
    security::ValidationMode mode = security::ValidationMode::Runtime;
    std::vector<std::string> args;
    for (size_t i = 1; i < rest.size(); ++i) {
        if (rest[i] == "--whitelist") {
            mode = security::ValidationMode::Whitelist;
        } else {
            args.push_back(rest[i]);
        }
    }
    auto verdict = security::CommandValidator::Check(rest[0], args, mode);
    if (verdict.allowed) {
        std::cout << "allowed\n";
        return 0;
    }
    std::cout << "rejected: " << verdict.reason << "\n";
    return 1;
}

static int runRegistry(ConnectionManager& cm) {
    auto data = cm.GetRegistry();
    std::cout << "registry " << data.version << " (" << data.lastUpdated << ")\n";
    for (const auto& e : data.entries) {
        std::cout << "  " << e.packageIdentifier << " [" << e.status << "] " << e.version.value_or("latest") << "\n";
    }
    for (const auto& d : data.deprecated) {
        std::cout << "  " << d.packageIdentifier << " [deprecated] " << d.reason << " -> " << d.alternative << "\n";
    }
    return 0;
}

static int runDiagnose(ConnectionManager& cm) {
    auto diag = cm.DiagnoseSystem();
    std::cout << (diag.success ? "ok" : "issues found") << "\n";
    for (const auto& i : diag.issues) {
        std::cout << "  issue: " << i << "\n";
    }
    for (const auto& r : diag.recommendations) {
        std::cout << "  recommendation: " << r << "\n";
    }
    return diag.success ? 0 : 1;
}

static int runTools(ConnectionManager& cm, health::HealthMonitor& hm, const std::string& configPath) {
    config::ConfigurationStore store(configPath);
    bridge::ToolBridge toolBridge(cm, hm, store);
    auto tools = toolBridge.GetTools().get();
    for (const auto& [key, handle] : tools) {
        std::cout << key << "  " << handle.Description() << "\n";
    }
    std::cout << tools.size() << " tools\n";
    return 0;
}

static int runCall(ConnectionManager& cm, health::HealthMonitor& hm, const std::string& configPath,
                   const std::string& key, const std::string& jsonArgs) {
    config::ConfigurationStore store(configPath);
    bridge::ToolBridge toolBridge(cm, hm, store);
    auto tools = toolBridge.GetTools().get();
    auto it = tools.find(key);
    if (it == tools.end()) {
        std::cerr << "unknown tool: " << key << "\n";
        return 1;
    }
    JSONValue args = parseJSONValue(jsonArgs);
    std::cout << it->second.Invoke(args).get() << "\n";
    return 0;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();

    std::vector<std::string> argvList(argv + 1, argv + argc);
    if (argvList.empty()) {
        printUsage();
        return 2;
    }
    const std::string cmd = argvList[0];
    std::vector<std::string> rest(argvList.begin() + 1, argvList.end());

    if (cmd == "validate") {
        return runValidate(rest);
    }

    auto packageRegistry = std::make_shared<registry::PackageRegistry>(registry::PackageRegistry::OptionsFromEnvironment());
    auto factory = std::make_shared<DefaultTransportFactory>();
    ConnectionManager cm(factory, packageRegistry, ConnectionManager::OptionsFromEnvironment());
    health::HealthMonitor hm;

    int rc = 0;
    try {
        if (cmd == "registry") {
            rc = runRegistry(cm);
        } else if (cmd == "diagnose") {
            rc = runDiagnose(cm);
        } else if (cmd == "tools" && rest.size() == 1) {
            rc = runTools(cm, hm, rest[0]);
        } else if (cmd == "call" && rest.size() == 3) {
            rc = runCall(cm, hm, rest[0], rest[1], rest[2]);
        } else {
            printUsage();
            rc = 2;
        }
    } catch (const errors::ToolhostError& e) {
        std::cerr << errors::toString(e.category()) << ": " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    cm.DisconnectAll().wait();
    return rc;
}

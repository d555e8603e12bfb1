//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Diagnostics.cpp
// Purpose: Host environment checks and connection failure diagnosis
//==========================================================================================================

#include <cerrno>
#include <cstdio>
#include <optional>
#include <system_error>

#include <sys/wait.h>

#include "logging/Logger.h"
#include "toolhost/diagnostics/Diagnostics.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/PackageRegistry.h"
#include "toolhost/security/CommandValidator.h"

namespace toolhost {
namespace diagnostics {

namespace {

struct ToolCheck {
    const char* tool;
    const char* issue;
    const char* recommendation;
};

constexpr ToolCheck RequiredTools[] = {
    { "node", "Node.js is not installed or not in PATH", "Install Node.js from https://nodejs.org/" },
    { "npm", "npm is not installed or not in PATH", "npm should come with Node.js. Try reinstalling Node.js." },
    { "npx", "npx is not installed or not in PATH",
      "npx should come with npm 5.2.0+. Try updating npm: npm install -g npm@latest" },
    { "python3", "Python 3 is not installed or not in PATH",
      "Install Python 3 from https://www.python.org/ or using Homebrew: brew install python3" },
    { "pip3", "pip3 is not installed or not in PATH",
      "pip3 should come with Python 3. Try reinstalling Python or install pip separately." }
};

// What went wrong, independent of the exception type that carried it.
struct RawFailure {
    std::string message;
    int errnoValue{0};
    bool closed{false};
    bool network{false};
    int httpStatus{0};
};

RawFailure classify(std::exception_ptr failure) {
    RawFailure raw;
    if (!failure) {
        raw.message = "Unknown connection failure";
        return raw;
    }
    try {
        std::rethrow_exception(failure);
    } catch (const std::system_error& e) {
        raw.message = e.what();
        if (e.code().category() == std::generic_category() || e.code().category() == std::system_category()) {
            raw.errnoValue = e.code().value();
        }
    } catch (const errors::RemoteError& e) {
        raw.message = e.what();
        raw.closed = e.rpc().code == JSONRPCErrorCodes::ConnectionClosed;
        raw.network = errors::isNetworkRpcError(e.rpc());
        raw.httpStatus = errors::httpStatusFromRpcError(e.rpc());
    } catch (const errors::ToolhostError& e) {
        raw.message = e.what();
        raw.closed = e.rpcCode() == JSONRPCErrorCodes::ConnectionClosed ||
                     raw.message.find("Connection closed") != std::string::npos;
    } catch (const std::exception& e) {
        raw.message = e.what();
        raw.closed = raw.message.find("Connection closed") != std::string::npos;
    }
    return raw;
}

bool isNpxLaunch(const ServerConfig& config) {
    if (!config.command.has_value()) {
        return false;
    }
    auto launch = security::CommandValidator::SplitCommand(*config.command, config.args);
    return security::CommandValidator::BaseCommand(launch.executable) == "npx";
}

std::string npxPackage(const ServerConfig& config) {
    auto launch = security::CommandValidator::SplitCommand(config.command.value_or(""), config.args);
    return security::CommandValidator::ExtractNpxPackage(launch.args).value_or("");
}

std::string diagnoseNpxClosure(const std::string& package, registry::PackageRegistry& registry) {
    registry::RegistryData data;
    try {
        data = registry.GetRegistry();
    } catch (const errors::ToolhostError& e) {
        LOG_WARN("Diagnostics: registry lookup for {} failed: {}", package, e.what());
        return "MCP package not found: " + package +
               ". Please verify the package name and ensure it's available in the npm registry.";
    }
    for (const auto& d : data.deprecated) {
        if (d.packageIdentifier == package) {
            return "Package not available: " + package + ". " + d.reason + " Alternative: " + d.alternative;
        }
    }
    for (const auto& e : data.entries) {
        if (e.packageIdentifier == package && e.status == "active") {
            return "MCP package installation failed: " + package +
                   ". The package exists but npm couldn't install it. Please check your internet connection and try again.";
        }
    }
    return "Unknown MCP package: " + package + ". Available packages: " +
           registry::PackageRegistry::ActivePackageList(data) +
           ". You can also check: https://www.npmjs.com/search?q=%40modelcontextprotocol";
}

} // namespace

SystemProbe DefaultSystemProbe() {
    return [](const std::string& tool) {
        std::string cmd = tool + " --version >/dev/null 2>&1";
        FILE* pipe = ::popen(cmd.c_str(), "r");
        if (pipe == nullptr) {
            return false;
        }
        int status = ::pclose(pipe);
        return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
    };
}

SystemDiagnosis DiagnoseSystem(const SystemProbe& probe, const std::string& pathValue) {
    FUNC_SCOPE();
    SystemDiagnosis out;
    for (const auto& check : RequiredTools) {
        if (probe(check.tool)) {
            LOG_DEBUG("Diagnostics: {} is available", check.tool);
            continue;
        }
        out.issues.emplace_back(check.issue);
        out.recommendations.emplace_back(check.recommendation);
    }
    if (!probe("uvx")) {
        LOG_DEBUG("Diagnostics: uvx is not available (optional)");
        out.recommendations.emplace_back("Consider installing uv for better Python MCP server support: pip3 install uv");
    }
    if (pathValue.find("/usr/local/bin") == std::string::npos &&
        pathValue.find("/opt/homebrew/bin") == std::string::npos) {
        out.issues.emplace_back("Common Node.js paths not in PATH environment variable");
        out.recommendations.emplace_back("Ensure /usr/local/bin or /opt/homebrew/bin are in your PATH");
    }
    out.success = out.issues.empty();
    return out;
}

std::string DiagnoseConnectionFailure(const ServerConfig& config,
                                      std::exception_ptr failure,
                                      registry::PackageRegistry& registry) {
    FUNC_SCOPE();
    RawFailure raw = classify(failure);
    const std::string command = config.command.value_or("");

    if (config.transport == TransportKind::Stdio) {
        if (raw.errnoValue == ENOENT) {
            return "Command not found: " + command +
                   ". Please ensure Node.js and npm are properly installed and accessible.";
        }
        if (raw.errnoValue == EACCES) {
            return "Permission denied executing: " + command + ". Please check file permissions.";
        }
        if (raw.closed) {
            if (isNpxLaunch(config)) {
                return diagnoseNpxClosure(npxPackage(config), registry);
            }
            return "MCP server connection failed. The server process may have exited unexpectedly. "
                   "Please check the server logs for more details.";
        }
        return raw.message;
    }

    const std::string type = config.transport == TransportKind::Sse ? "SSE" : "HTTP";
    const std::string url = config.baseUrl.value_or("");
    if (raw.network) {
        return "Network error connecting to " + type + " server at " + url +
               ". Please check the URL and network connection.";
    }
    if (raw.httpStatus == 401 || raw.httpStatus == 403) {
        return "Authentication failed for " + type + " server. Please check your API key and permissions.";
    }
    if (raw.httpStatus == 404) {
        return type + " server not found at " + url + ". Please check the URL.";
    }
    return raw.message;
}

} // namespace diagnostics
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandResolver.cpp
// Purpose: Executable lookup, PATH augmentation and child environment construction
//==========================================================================================================

#include <algorithm>
#include <sstream>

#include <sys/stat.h>
#include <unistd.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/resolver/CommandResolver.h"
#include "toolhost/security/CommandValidator.h"

extern char** environ;

namespace toolhost {
namespace resolver {

namespace {

std::vector<std::string> splitPath(const std::string& value) {
    std::vector<std::string> out;
    std::string part;
    std::istringstream iss(value);
    while (std::getline(iss, part, ':')) {
        if (!part.empty()) {
            out.push_back(part);
        }
    }
    return out;
}

std::string joinPath(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) {
            out += ':';
        }
        out += p;
    }
    return out;
}

std::string dirName(const std::string& path) {
    std::size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return ".";
    }
    return pos == 0 ? std::string("/") : path.substr(0, pos);
}

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
        return false;
    }
    return ::access(path.c_str(), X_OK) == 0;
}

} // namespace

CommandResolver::CommandResolver() : CommandResolver(OptionsFromEnvironment()) {}

CommandResolver::CommandResolver(Options opts) : options(std::move(opts)) {
    if (!options.isExecutable) {
        options.isExecutable = isExecutableFile;
    }
}

CommandResolver::Options CommandResolver::OptionsFromEnvironment() {
    Options opts;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        std::size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        opts.processEnvironment[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    opts.home = GetEnvOrDefault("HOME", "");
    opts.isExecutable = isExecutableFile;
    return opts;
}

std::string CommandResolver::processPath() const {
    auto it = options.processEnvironment.find("PATH");
    return it == options.processEnvironment.end() ? std::string() : it->second;
}

std::optional<std::string> CommandResolver::FindOnPath(const std::string& name, const std::string& pathValue) const {
    for (const auto& dir : splitPath(pathValue)) {
        std::string candidate = dir + "/" + name;
        if (options.isExecutable(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CommandResolver::FindNpx() const {
    if (auto found = FindOnPath("npx", processPath())) {
        LOG_DEBUG("CommandResolver: found npx at {}", *found);
        return found;
    }
    LOG_WARN("CommandResolver: npx not found in PATH, trying fallback locations");
    std::vector<std::string> fallbacks = { "/usr/local/bin/npx", "/opt/homebrew/bin/npx" };
    if (!options.home.empty()) {
        fallbacks.push_back(options.home + "/n/bin/npx");
    }
    for (const auto& candidate : fallbacks) {
        if (options.isExecutable(candidate)) {
            LOG_DEBUG("CommandResolver: found npx at fallback location {}", candidate);
            return candidate;
        }
    }
    return std::nullopt;
}

std::vector<std::string> CommandResolver::RuntimeDirectories() const {
    std::vector<std::string> dirs;
    for (const char* tool : { "node", "npm" }) {
        if (auto found = FindOnPath(tool, processPath())) {
            std::string dir = dirName(*found);
            if (std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) {
                dirs.push_back(dir);
            }
        }
    }
    return dirs;
}

std::string CommandResolver::AugmentedPath() const {
    std::vector<std::string> parts = splitPath(processPath());
    std::vector<std::string> extra = RuntimeDirectories();
    extra.push_back("/usr/local/bin");
    extra.push_back("/opt/homebrew/bin");
    if (!options.home.empty()) {
        extra.push_back(options.home + "/n/bin");
    }
    extra.push_back("/usr/bin");
    extra.push_back("/bin");
    for (const auto& dir : extra) {
        if (std::find(parts.begin(), parts.end(), dir) == parts.end()) {
            parts.push_back(dir);
        }
    }
    return joinPath(parts);
}

std::map<std::string, std::string> CommandResolver::BuildEnvironment(const std::map<std::string, std::string>& serverEnv) const {
    std::map<std::string, std::string> env = options.processEnvironment;
    for (const auto& [k, v] : serverEnv) {
        env[k] = v;
    }
    env["PATH"] = AugmentedPath();
    return env;
}

ResolvedCommand CommandResolver::Resolve(const ServerConfig& config) const {
    FUNC_SCOPE();
    if (!config.command.has_value() || config.command->empty()) {
        throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, "Command is required for stdio transport");
    }
    ResolvedCommand out;
    out.environment = BuildEnvironment(config.env);

    security::LaunchCommand launch = security::CommandValidator::SplitCommand(*config.command, config.args);
    if (launch.executable.empty()) {
        throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, "Command is required for stdio transport");
    }
    const std::string& command = launch.executable;
    if (command == "npx") {
        auto npx = FindNpx();
        if (!npx.has_value()) {
            std::string package = security::CommandValidator::ExtractNpxPackage(launch.args)
                                      .value_or(launch.args.empty() ? std::string() : launch.args.front());
            LOG_ERROR("CommandResolver: npx not found. Please ensure Node.js and npm are properly installed");
            throw errors::ToolhostError(errors::ErrorCategory::ConnectionFailed,
                                        "npx command not found. Please install Node.js and npm, then try again. Package: " + package);
        }
        out.executable = *npx;
        out.args = std::move(launch.args);
        return out;
    }

    out.args = std::move(launch.args);
    if (command.find('/') != std::string::npos) {
        out.executable = command;
        return out;
    }
    auto found = FindOnPath(command, out.environment["PATH"]);
    out.executable = found.value_or(command);
    LOG_DEBUG("CommandResolver: {} resolved to {}", command, out.executable);
    return out;
}

} // namespace resolver
} // namespace toolhost

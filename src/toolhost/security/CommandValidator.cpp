//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandValidator.cpp
// Purpose: Deny-lists, runtime-specific launch rules and package whitelists for server commands
//==========================================================================================================

#include <algorithm>
#include <array>
#include <regex>
#include <sstream>
#include <string_view>

#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/security/CommandValidator.h"

namespace toolhost {
namespace security {

namespace {

/////////////////////////////////////////// Rule tables ///////////////////////////////////////////
constexpr std::array<std::string_view, 36> BlockedCommands = {
    // shells
    "bash", "sh", "zsh", "fish", "csh", "tcsh", "ksh",
    // network transfer
    "curl", "wget", "nc", "netcat", "telnet", "ftp", "sftp",
    // destructive filesystem
    "rm", "dd", "mkfs", "fdisk", "mount", "umount",
    // process / system control
    "kill", "killall", "pkill", "shutdown", "reboot", "halt",
    // evaluation and privilege escalation
    "eval", "exec", "sudo", "su", "doas",
    // toolchains
    "gcc", "g++", "cc", "ld", "as"
};

constexpr std::array<std::string_view, 11> VerifiedNpmPackages = {
    "@modelcontextprotocol/server-memory",
    "@modelcontextprotocol/server-filesystem",
    "@modelcontextprotocol/server-sqlite",
    "@modelcontextprotocol/server-postgres",
    "@modelcontextprotocol/server-brave-search",
    "@modelcontextprotocol/server-fetch",
    "@modelcontextprotocol/server-github",
    "@modelcontextprotocol/server-google-maps",
    "@modelcontextprotocol/server-puppeteer",
    "@modelcontextprotocol/server-slack",
    "@modelcontextprotocol/server-everything"
};

constexpr std::array<std::string_view, 6> VerifiedPythonPackages = {
    "mcp-server-git", "mcp-server-time", "mcp-server-fetch",
    "mcp-server-filesystem", "mcp-server-memory", "mcp-server-sequential-thinking"
};

constexpr std::array<std::string_view, 6> SafeNpxFlags = { "-y", "--yes", "-q", "--quiet", "-v", "--version" };
constexpr std::array<std::string_view, 5> BlockedNpxFlags = { "-e", "--eval", "--call", "-c", "--shell-auto-fallback" };

// uvx flags whose value is the following argument (or "=value")
constexpr std::array<std::string_view, 6> UvxValueFlags = { "--from", "--with", "--python", "-p", "--index-url", "--extra-index-url" };
constexpr std::array<std::string_view, 6> UvxSwitches = { "-y", "--yes", "-q", "--quiet", "-v", "--verbose" };

constexpr std::array<std::string_view, 5> BlockedPythonPatterns = { "-c", "--command", "eval(", "exec(", "__import__(" };
constexpr std::array<std::string_view, 6> BlockedPythonModules = { "pip", "pip3", "easy_install", "ensurepip", "venv", "site" };

constexpr std::array<std::string_view, 6> BlockedUvSubcommands = {
    "pip install", "pip uninstall", "tool install", "tool uninstall", "cache clear", "self update"
};
constexpr std::array<std::string_view, 2> SafeUvSubcommands = { "run", "tool run" };

constexpr std::array<std::string_view, 8> BlockedNodeFlags = {
    "-e", "--eval", "-p", "--print", "--inspect", "--inspect-brk", "--require", "-r"
};

template <std::size_t N>
bool contains(const std::array<std::string_view, N>& table, const std::string& value) {
    return std::find(table.begin(), table.end(), std::string_view(value)) != table.end();
}

bool startsWith(const std::string& s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Exact flag or "flag=value".
template <std::size_t N>
std::optional<std::string> findFlag(const std::array<std::string_view, N>& flags, const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        for (auto flag : flags) {
            if (arg == flag || startsWith(arg, std::string(flag) + "=")) {
                return std::string(flag);
            }
        }
    }
    return std::nullopt;
}

std::optional<std::string> findPythonPattern(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        for (auto pattern : BlockedPythonPatterns) {
            if (arg.find(pattern) != std::string::npos) {
                return std::string(pattern);
            }
        }
    }
    return std::nullopt;
}

/////////////////////////////////////////// Per-runtime rules ///////////////////////////////////////////
ValidationVerdict checkNpx(const std::vector<std::string>& args, ValidationMode mode) {
    if (auto flag = findFlag(BlockedNpxFlags, args)) {
        return ValidationVerdict::Reject("Dangerous npx flag \"" + *flag + "\" is not allowed. "
                                         "This flag can execute arbitrary code and poses a security risk.");
    }
    auto package = CommandValidator::ExtractNpxPackage(args);
    if (!package.has_value()) {
        return ValidationVerdict::Reject("No package name found in npx arguments");
    }
    if (mode == ValidationMode::Whitelist) {
        if (!CommandValidator::IsValidNpmPackageName(*package)) {
            return ValidationVerdict::Reject("Invalid package name format: \"" + *package +
                                             "\". Package names must follow npm naming conventions.");
        }
        if (!CommandValidator::IsVerifiedNpmPackage(*package) && !startsWith(*package, CommandValidator::TrustedNpmScope)) {
            return ValidationVerdict::Reject("Package \"" + *package + "\" is not in the verified package whitelist. "
                                             "Only verified packages can be launched from untrusted sources; "
                                             "add the server manually if you trust it.");
        }
    }
    LOG_DEBUG("CommandValidator: npx validation passed (package={})", *package);
    return ValidationVerdict::Allow();
}

ValidationVerdict checkUvx(const std::vector<std::string>& args, ValidationMode mode) {
    if (mode == ValidationMode::Whitelist) {
        auto package = CommandValidator::ExtractUvxPackage(args);
        if (!package.has_value()) {
            return ValidationVerdict::Reject("No package name found in uvx arguments");
        }
        if (!CommandValidator::IsValidPythonPackageName(*package)) {
            return ValidationVerdict::Reject("Invalid Python package name format: \"" + *package +
                                             "\". Package names must follow PyPI naming conventions.");
        }
        if (!CommandValidator::IsVerifiedPythonPackage(*package)) {
            return ValidationVerdict::Reject("Package \"" + *package + "\" is not in the verified Python package whitelist. "
                                             "Only verified packages can be launched from untrusted sources; "
                                             "add the server manually if you trust it.");
        }
    }
    if (auto pattern = findPythonPattern(args)) {
        return ValidationVerdict::Reject("Dangerous Python pattern \"" + *pattern + "\" detected in uvx arguments. "
                                         "This can execute arbitrary code and poses a security risk.");
    }
    return ValidationVerdict::Allow();
}

ValidationVerdict checkUv(const std::vector<std::string>& args) {
    if (args.empty()) {
        return ValidationVerdict::Reject("uv command requires a subcommand (e.g., run, tool).");
    }
    const std::string& subcommand = args[0];
    const std::string full = args.size() > 1 ? subcommand + " " + args[1] : subcommand;

    for (auto blocked : BlockedUvSubcommands) {
        if (startsWith(full, blocked)) {
            return ValidationVerdict::Reject("uv subcommand \"" + std::string(blocked) + "\" is blocked for security reasons. "
                                             "This operation can modify the system or install packages persistently.");
        }
    }
    bool isSafe = false;
    for (auto safe : SafeUvSubcommands) {
        if (startsWith(full, safe) || subcommand == safe) {
            isSafe = true;
        }
    }
    if (!isSafe) {
        LOG_WARN("CommandValidator: unknown uv subcommand '{}'", full);
        if (subcommand.find("install") != std::string::npos) {
            return ValidationVerdict::Reject("uv subcommand \"" + subcommand +
                                             "\" appears to be a package management operation and is blocked.");
        }
    }
    if (subcommand == "run") {
        std::vector<std::string> rest(args.begin() + 1, args.end());
        if (auto pattern = findPythonPattern(rest)) {
            return ValidationVerdict::Reject("Dangerous Python pattern \"" + *pattern + "\" detected in uv run arguments. "
                                             "This can execute arbitrary code and poses a security risk.");
        }
    }
    return ValidationVerdict::Allow();
}

ValidationVerdict checkPython(const std::vector<std::string>& args) {
    if (args.empty()) {
        return ValidationVerdict::Reject("Python command requires arguments (module or script file). "
                                         "Direct code execution is not allowed.");
    }
    if (auto pattern = findPythonPattern(args)) {
        return ValidationVerdict::Reject("Dangerous Python pattern \"" + *pattern + "\" is not allowed. "
                                         "Direct Python code execution poses a security risk.");
    }
    const std::string& first = args[0];
    if (first == "-m" || first == "--module") {
        if (args.size() < 2) {
            return ValidationVerdict::Reject("Python -m flag requires a module name.");
        }
        const std::string& module = args[1];
        for (auto blocked : BlockedPythonModules) {
            if (module == blocked || startsWith(module, std::string(blocked) + " ")) {
                return ValidationVerdict::Reject("Python module \"" + std::string(blocked) + "\" is blocked for security reasons. "
                                                 "This module can install packages or modify the Python environment.");
            }
        }
        return ValidationVerdict::Allow();
    }
    if (!endsWith(first, ".py") && !endsWith(first, ".pyz")) {
        return ValidationVerdict::Reject("Python command must specify either a .py script file or use -m for module execution "
                                         "(got \"" + first + "\"). Direct code execution is not allowed.");
    }
    return ValidationVerdict::Allow();
}

ValidationVerdict checkNode(const std::vector<std::string>& args) {
    if (auto flag = findFlag(BlockedNodeFlags, args)) {
        return ValidationVerdict::Reject("Dangerous Node.js flag \"" + *flag + "\" is not allowed. "
                                         "This flag can execute arbitrary code and poses a security risk.");
    }
    if (args.empty()) {
        return ValidationVerdict::Reject("Node command requires a script file path. Direct code execution is not allowed.");
    }
    const std::string& first = args[0];
    if (!endsWith(first, ".js") && !endsWith(first, ".mjs") && !endsWith(first, ".cjs")) {
        return ValidationVerdict::Reject("Node command must specify a .js/.mjs/.cjs script file (got \"" + first + "\"). "
                                         "Direct code execution is not allowed.");
    }
    return ValidationVerdict::Allow();
}

} // namespace

LaunchCommand CommandValidator::SplitCommand(const std::string& command, const std::vector<std::string>& args) {
    LaunchCommand out;
    std::istringstream iss(command);
    std::string tok;
    while (iss >> tok) {
        if (out.executable.empty()) {
            out.executable = tok;
        } else {
            out.args.push_back(tok);
        }
    }
    out.args.insert(out.args.end(), args.begin(), args.end());
    return out;
}

std::string CommandValidator::BaseCommand(const std::string& command) {
    std::size_t pos = command.find_last_of("/\\");
    if (pos == std::string::npos) {
        return command;
    }
    return command.substr(pos + 1);
}

bool CommandValidator::IsBlockedCommand(const std::string& baseCommand) {
    return contains(BlockedCommands, baseCommand);
}

std::optional<std::string> CommandValidator::ExtractNpxPackage(const std::vector<std::string>& args) {
    for (const auto& arg : args) {
        if (contains(SafeNpxFlags, arg)) {
            continue;
        }
        if (!startsWith(arg, "-")) {
            return arg;
        }
        // Unrecognized dash argument that still looks like a package name
        if (IsValidNpmPackageName(arg)) {
            return arg;
        }
    }
    return std::nullopt;
}

std::optional<std::string> CommandValidator::ExtractUvxPackage(const std::vector<std::string>& args) {
    std::optional<std::string> fromValue;
    std::size_t i = 0;
    while (i < args.size()) {
        const std::string& arg = args[i];
        bool valueFlag = false;
        for (auto flag : UvxValueFlags) {
            if (arg == flag) {
                if (flag == "--from" && i + 1 < args.size()) {
                    fromValue = args[i + 1];
                }
                i += 2;
                valueFlag = true;
                break;
            }
            if (startsWith(arg, std::string(flag) + "=")) {
                if (flag == "--from") {
                    fromValue = arg.substr(flag.size() + 1);
                }
                i += 1;
                valueFlag = true;
                break;
            }
        }
        if (valueFlag) {
            continue;
        }
        if (contains(UvxSwitches, arg) || startsWith(arg, "-")) {
            ++i;
            continue;
        }
        // --from names the package providing the tool
        return fromValue.has_value() ? fromValue : std::optional<std::string>(arg);
    }
    return fromValue;
}

bool CommandValidator::IsValidNpmPackageName(const std::string& name) {
    static const std::regex npmName(R"(^(@[a-z0-9\-~][a-z0-9\-._~]*/)?[a-z0-9\-~][a-z0-9\-._~]*$)");
    return std::regex_match(name, npmName);
}

bool CommandValidator::IsValidPythonPackageName(const std::string& name) {
    static const std::regex pyName(R"(^[a-z0-9]([a-z0-9\-_]*[a-z0-9])?$)", std::regex::icase);
    return std::regex_match(name, pyName);
}

bool CommandValidator::IsVerifiedNpmPackage(const std::string& name) {
    return contains(VerifiedNpmPackages, name);
}

bool CommandValidator::IsVerifiedPythonPackage(const std::string& name) {
    return contains(VerifiedPythonPackages, name);
}

ValidationVerdict CommandValidator::Check(const std::string& rawCommand,
                                          const std::vector<std::string>& rawArgs,
                                          ValidationMode mode) {
    FUNC_SCOPE();
    LaunchCommand launch = SplitCommand(rawCommand, rawArgs);
    const std::string& command = launch.executable;
    const std::vector<std::string>& args = launch.args;

    if (command.empty()) {
        return ValidationVerdict::Reject("Command is empty");
    }
    const std::string base = BaseCommand(command);
    if (IsBlockedCommand(base)) {
        return ValidationVerdict::Reject("Command \"" + base + "\" is blocked for security reasons. "
                                         "This command can be used for malicious purposes and poses a security risk.");
    }
    if (base == "npx") {
        return checkNpx(args, mode);
    }
    if (base == "uvx") {
        return checkUvx(args, mode);
    }
    if (base == "uv") {
        return checkUv(args);
    }
    if (base == "python" || base == "python3" || base == "python2") {
        return checkPython(args);
    }
    if (base == "node" || base == "nodejs") {
        return checkNode(args);
    }

    if (mode == ValidationMode::Whitelist && !startsWith(command, "/") && !startsWith(command, "./")) {
        LOG_WARN("CommandValidator: custom command '{}' from an untrusted origin is not an explicit path", base);
    } else {
        LOG_WARN("CommandValidator: custom executable '{}' allowed", base);
    }
    return ValidationVerdict::Allow();
}

void CommandValidator::Validate(const std::string& command,
                                const std::vector<std::string>& args,
                                ValidationMode mode) {
    FUNC_SCOPE();
    ValidationVerdict verdict = Check(command, args, mode);
    if (!verdict.allowed) {
        LOG_ERROR("CommandValidator: rejected '{}' ({}): {}", command,
                  mode == ValidationMode::Whitelist ? "whitelist" : "runtime", verdict.reason);
        throw errors::ToolhostError(errors::ErrorCategory::ValidationRejected, verdict.reason);
    }
    LOG_DEBUG("CommandValidator: '{}' passed {} validation", command,
              mode == ValidationMode::Whitelist ? "whitelist" : "runtime");
}

} // namespace security
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_command_validator.cpp
// Purpose: GoogleTests for launch command deny-lists, per-runtime rules and package whitelists
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/errors/Errors.h"
#include "toolhost/security/CommandValidator.h"

using namespace toolhost;
using namespace toolhost::security;

namespace {
ValidationVerdict runtime(const std::string& command, const std::vector<std::string>& args) {
    return CommandValidator::Check(command, args, ValidationMode::Runtime);
}
ValidationVerdict whitelist(const std::string& command, const std::vector<std::string>& args) {
    return CommandValidator::Check(command, args, ValidationMode::Whitelist);
}
bool mentions(const ValidationVerdict& v, const std::string& token) {
    return v.reason.find(token) != std::string::npos;
}
} // namespace

TEST(CommandValidator, FilesystemServerThroughNpxPasses) {
    auto v = runtime("npx", {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"});
    EXPECT_TRUE(v.allowed) << v.reason;
    EXPECT_TRUE(whitelist("npx", {"-y", "@modelcontextprotocol/server-filesystem", "/tmp"}).allowed);
}

TEST(CommandValidator, ShellIsBlockedNamingTheCommand) {
    auto v = runtime("bash", {"-c", "rm -rf /"});
    EXPECT_FALSE(v.allowed);
    EXPECT_TRUE(mentions(v, "\"bash\""));
    try {
        CommandValidator::Validate("bash", {"-c", "rm -rf /"}, ValidationMode::Runtime);
        FAIL() << "expected ValidationRejected";
    } catch (const errors::ToolhostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::ValidationRejected);
        EXPECT_NE(std::string(e.what()).find("bash"), std::string::npos);
    }
}

TEST(CommandValidator, DenyListAppliesToPathsInBothModes) {
    for (const char* cmd : {"/bin/sh", "/usr/bin/curl", "sudo", "rm", "C:\\tools\\wget"}) {
        EXPECT_FALSE(runtime(cmd, {}).allowed) << cmd;
        EXPECT_FALSE(whitelist(cmd, {}).allowed) << cmd;
    }
    EXPECT_EQ(CommandValidator::BaseCommand("/usr/local/bin/node"), "node");
    EXPECT_EQ(CommandValidator::BaseCommand("node"), "node");
    EXPECT_TRUE(CommandValidator::IsBlockedCommand("zsh"));
    EXPECT_FALSE(CommandValidator::IsBlockedCommand("node"));
    EXPECT_FALSE(runtime("", {}).allowed);
}

TEST(CommandValidator, NpxDangerousFlagsAnywhere) {
    EXPECT_FALSE(runtime("npx", {"-e", "process.exit()"}).allowed);
    auto late = runtime("npx", {"-y", "@modelcontextprotocol/server-memory", "--eval=1"});
    EXPECT_FALSE(late.allowed);
    EXPECT_TRUE(mentions(late, "--eval"));
    EXPECT_FALSE(runtime("npx", {"--call", "x"}).allowed);
    EXPECT_FALSE(runtime("npx", {"-y"}).allowed);
}

TEST(CommandValidator, NpxWhitelistRequiresVerifiedPackage) {
    EXPECT_TRUE(runtime("npx", {"-y", "some-random-server"}).allowed);
    auto random = whitelist("npx", {"-y", "some-random-server"});
    EXPECT_FALSE(random.allowed);
    EXPECT_TRUE(mentions(random, "some-random-server"));
    // Anything under the trusted scope passes.
    EXPECT_TRUE(whitelist("npx", {"@modelcontextprotocol/server-brand-new"}).allowed);
    auto bad = whitelist("npx", {"Not_A_Valid/Name"});
    EXPECT_FALSE(bad.allowed);
    EXPECT_TRUE(mentions(bad, "Invalid package name"));
}

TEST(CommandValidator, NpxWrittenInCommandField) {
    EXPECT_TRUE(runtime("npx -y @modelcontextprotocol/server-memory", {}).allowed);
    EXPECT_FALSE(runtime("npx -e evil", {}).allowed);
}

TEST(CommandValidator, CommandFieldSplitOnAnyWhitespace) {
    auto tabbed = runtime("npx\t-c", {"touch /tmp/x"});
    EXPECT_FALSE(tabbed.allowed);
    EXPECT_TRUE(mentions(tabbed, "-c"));
    EXPECT_FALSE(runtime(" npx -c", {"touch /tmp/x"}).allowed);
    EXPECT_FALSE(runtime("npx\n--eval=1", {}).allowed);
    EXPECT_FALSE(whitelist("npx  -y\tleft-pad", {}).allowed);
    EXPECT_FALSE(runtime("/bin/bash -c", {"id"}).allowed);
    EXPECT_FALSE(runtime("   ", {}).allowed);

    auto split = CommandValidator::SplitCommand("\tnpx  -y\n@modelcontextprotocol/server-memory ", {"/tmp"});
    EXPECT_EQ(split.executable, "npx");
    EXPECT_EQ(split.args, (std::vector<std::string>{"-y", "@modelcontextprotocol/server-memory", "/tmp"}));
}

TEST(CommandValidator, ExtractPackages) {
    EXPECT_EQ(CommandValidator::ExtractNpxPackage({"-y", "--quiet", "pkg", "arg"}).value_or(""), "pkg");
    EXPECT_FALSE(CommandValidator::ExtractNpxPackage({"-y"}).has_value());
    EXPECT_EQ(CommandValidator::ExtractUvxPackage({"mcp-server-git", "--repository", "."}).value_or(""), "mcp-server-git");
    EXPECT_EQ(CommandValidator::ExtractUvxPackage({"--python", "3.12", "mcp-server-time"}).value_or(""), "mcp-server-time");
    EXPECT_EQ(CommandValidator::ExtractUvxPackage({"--from", "mcp-server-fetch", "fetch-tool"}).value_or(""), "mcp-server-fetch");
    EXPECT_EQ(CommandValidator::ExtractUvxPackage({"--from=mcp-server-git", "git"}).value_or(""), "mcp-server-git");
    EXPECT_FALSE(CommandValidator::ExtractUvxPackage({"-q"}).has_value());
}

TEST(CommandValidator, UvxRules) {
    EXPECT_TRUE(runtime("uvx", {"anything-goes"}).allowed);
    EXPECT_TRUE(whitelist("uvx", {"mcp-server-git"}).allowed);
    EXPECT_FALSE(whitelist("uvx", {"mcp-server-unknown"}).allowed);
    EXPECT_FALSE(whitelist("uvx", {}).allowed);
    auto pattern = runtime("uvx", {"tool", "-c", "print(1)"});
    EXPECT_FALSE(pattern.allowed);
    EXPECT_TRUE(mentions(pattern, "-c"));
}

TEST(CommandValidator, UvSubcommands) {
    EXPECT_TRUE(runtime("uv", {"run", "server.py"}).allowed);
    EXPECT_TRUE(runtime("uv", {"tool", "run", "mcp-server-time"}).allowed);
    EXPECT_FALSE(runtime("uv", {}).allowed);
    auto install = runtime("uv", {"pip", "install", "requests"});
    EXPECT_FALSE(install.allowed);
    EXPECT_TRUE(mentions(install, "pip install"));
    EXPECT_FALSE(runtime("uv", {"self", "update"}).allowed);
    EXPECT_FALSE(runtime("uv", {"reinstall"}).allowed);
    EXPECT_FALSE(runtime("uv", {"run", "python", "-c", "import os"}).allowed);
}

TEST(CommandValidator, PythonRules) {
    EXPECT_TRUE(runtime("python3", {"server.py"}).allowed);
    EXPECT_TRUE(runtime("/usr/bin/python", {"-m", "mcp_server_time"}).allowed);
    EXPECT_FALSE(runtime("python3", {}).allowed);
    EXPECT_FALSE(runtime("python3", {"-c", "print(1)"}).allowed);
    EXPECT_FALSE(runtime("python3", {"-m"}).allowed);
    auto pip = runtime("python3", {"-m", "pip", "install", "x"});
    EXPECT_FALSE(pip.allowed);
    EXPECT_TRUE(mentions(pip, "\"pip\""));
    EXPECT_FALSE(runtime("python", {"script.sh"}).allowed);
    EXPECT_FALSE(runtime("python", {"run.py", "__import__('os')"}).allowed);
}

TEST(CommandValidator, NodeRules) {
    EXPECT_TRUE(runtime("node", {"server.js"}).allowed);
    EXPECT_TRUE(runtime("nodejs", {"dist/index.mjs", "--port", "1"}).allowed);
    EXPECT_FALSE(runtime("node", {}).allowed);
    EXPECT_FALSE(runtime("node", {"-e", "1"}).allowed);
    EXPECT_FALSE(runtime("node", {"--inspect=9229", "server.js"}).allowed);
    EXPECT_FALSE(runtime("node", {"server.ts"}).allowed);
}

TEST(CommandValidator, CustomExecutablesAreAllowedWithWarning) {
    EXPECT_TRUE(runtime("/opt/tools/my-server", {"--stdio"}).allowed);
    EXPECT_TRUE(whitelist("my-server", {}).allowed);
}

TEST(CommandValidator, PackageNameFormats) {
    EXPECT_TRUE(CommandValidator::IsValidNpmPackageName("@scope/pkg.name-1"));
    EXPECT_TRUE(CommandValidator::IsValidNpmPackageName("plain"));
    EXPECT_FALSE(CommandValidator::IsValidNpmPackageName("Upper"));
    EXPECT_FALSE(CommandValidator::IsValidNpmPackageName("@scope/"));
    EXPECT_TRUE(CommandValidator::IsValidPythonPackageName("mcp-server_git2"));
    EXPECT_FALSE(CommandValidator::IsValidPythonPackageName("-leading"));
    EXPECT_FALSE(CommandValidator::IsValidPythonPackageName("has space"));
    EXPECT_TRUE(CommandValidator::IsVerifiedNpmPackage("@modelcontextprotocol/server-memory"));
    EXPECT_TRUE(CommandValidator::IsVerifiedPythonPackage("mcp-server-time"));
}

TEST(CommandValidator, VerdictsAreDeterministic) {
    auto a = runtime("npx", {"--shell-auto-fallback", "x"});
    auto b = runtime("npx", {"--shell-auto-fallback", "x"});
    EXPECT_EQ(a.allowed, b.allowed);
    EXPECT_EQ(a.reason, b.reason);
}

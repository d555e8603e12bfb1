//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandResolver.h
// Purpose: Locates the real executable of a stdio server and builds its child environment
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/ServerConfig.h"

namespace toolhost {
namespace resolver {

//==========================================================================================================
// ResolvedCommand
// Purpose: Everything the process transport needs to spawn a server.
// Fields:
//   executable: Absolute path when it could be located, otherwise the configured token.
//   args: Final argument vector (without argv[0]).
//   environment: Complete child environment.
//==========================================================================================================
struct ResolvedCommand {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> environment;
};

class CommandResolver {
public:
    using ExecutableCheck = std::function<bool(const std::string& path)>;

    struct Options {
        std::map<std::string, std::string> processEnvironment;
        std::string home;
        ExecutableCheck isExecutable;
    };

    CommandResolver();
    explicit CommandResolver(Options options);

    // Snapshot of the current process environment and an access(2) based executable check.
    static Options OptionsFromEnvironment();

    // First PATH entry (of `pathValue`) containing an executable `name`.
    std::optional<std::string> FindOnPath(const std::string& name, const std::string& pathValue) const;

    //==========================================================================================================
    // FindNpx
    // Purpose: Locates npx via PATH, then /usr/local/bin/npx, /opt/homebrew/bin/npx and $HOME/n/bin/npx.
    //==========================================================================================================
    std::optional<std::string> FindNpx() const;

    // Directories holding node and npm on PATH, in that order and without duplicates.
    std::vector<std::string> RuntimeDirectories() const;

    //==========================================================================================================
    // AugmentedPath
    // Purpose: Current PATH followed by the runtime directories and the common install prefixes that are
    //          not already present. Order is preserved and no entry appears twice.
    //==========================================================================================================
    std::string AugmentedPath() const;

    //==========================================================================================================
    // BuildEnvironment
    // Purpose: Process environment overlaid by the server's env; PATH is always the augmented value.
    //==========================================================================================================
    std::map<std::string, std::string> BuildEnvironment(const std::map<std::string, std::string>& serverEnv) const;

    //==========================================================================================================
    // Resolve
    // Purpose: Produces the spawn description for a stdio server. "npx <pkg>" commands are split into npx
    //          plus arguments; npx must be found. Other commands are looked up on the augmented PATH.
    // Args:
    //   config: stdio server declaration (command required).
    // Returns:
    //   ResolvedCommand. Throws errors::ToolhostError(ConnectionFailed) when npx cannot be located.
    //==========================================================================================================
    ResolvedCommand Resolve(const ServerConfig& config) const;

private:
    Options options;

    std::string processPath() const;
};

} // namespace resolver
} // namespace toolhost

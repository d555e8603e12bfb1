//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CommandValidator.h
// Purpose: Rule engine deciding whether a server launch command may be spawned
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace toolhost {
namespace security {

//==========================================================================================================
// ValidationMode
// Purpose: Strictness of a validation pass.
//   Whitelist: launch origin is implicitly untrusted (deep link, extracted text); package must be verified.
//   Runtime:   applied to every launch; blocks categorically dangerous commands and flags only.
//==========================================================================================================
enum class ValidationMode {
    Whitelist,
    Runtime
};

//==========================================================================================================
// ValidationVerdict
// Purpose: Outcome of a validation pass. reason names the offending token, flag or package when rejected.
//==========================================================================================================
struct ValidationVerdict {
    bool allowed{true};
    std::string reason;

    static ValidationVerdict Allow() { return ValidationVerdict{}; }
    static ValidationVerdict Reject(std::string why) { return ValidationVerdict{false, std::move(why)}; }
};

// Executable and argument vector after the command field has been split into words.
struct LaunchCommand {
    std::string executable;
    std::vector<std::string> args;
};

//==========================================================================================================
// CommandValidator
// Purpose: Stateless checks over (command, args, mode). Identical inputs always produce identical verdicts;
//          logging is the only side effect.
//==========================================================================================================
class CommandValidator {
public:
    //==========================================================================================================
    // Check
    // Purpose: Evaluates a launch command without throwing.
    // Args:
    //   command: Command field as configured (a path, a name, or "npx <package>"); split with SplitCommand.
    //   args: Arguments passed to the executable.
    //   mode: Whitelist or Runtime.
    // Returns:
    //   ValidationVerdict; callers must not spawn when allowed == false.
    //==========================================================================================================
    static ValidationVerdict Check(const std::string& command,
                                   const std::vector<std::string>& args,
                                   ValidationMode mode);

    //==========================================================================================================
    // Validate
    // Purpose: Same as Check but throws errors::ToolhostError(ValidationRejected) on rejection.
    //==========================================================================================================
    static void Validate(const std::string& command,
                         const std::vector<std::string>& args,
                         ValidationMode mode);

    //==========================================================================================================
    // SplitCommand
    // Purpose: Splits the command field on any whitespace. The first word is the executable; the remaining
    //          words are placed before args ("npx -y pkg" + ["/tmp"] -> npx [-y, pkg, /tmp]).
    //          Check and CommandResolver::Resolve both go through this, so the validated argument vector is
    //          the one that gets spawned.
    //==========================================================================================================
    static LaunchCommand SplitCommand(const std::string& command, const std::vector<std::string>& args);

    // Final path component of a command token ("/usr/bin/bash" -> "bash").
    static std::string BaseCommand(const std::string& command);

    static bool IsBlockedCommand(const std::string& baseCommand);

    // Package extraction; std::nullopt when no package argument is present.
    static std::optional<std::string> ExtractNpxPackage(const std::vector<std::string>& args);
    static std::optional<std::string> ExtractUvxPackage(const std::vector<std::string>& args);

    static bool IsValidNpmPackageName(const std::string& name);
    static bool IsValidPythonPackageName(const std::string& name);
    static bool IsVerifiedNpmPackage(const std::string& name);
    static bool IsVerifiedPythonPackage(const std::string& name);

    // Trusted npm scope for whitelist mode.
    static constexpr const char* TrustedNpmScope = "@modelcontextprotocol/";
};

} // namespace security
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Diagnostics.h
// Purpose: Host environment checks and mapping of raw connection failures to actionable messages
//==========================================================================================================

#pragma once

#include <exception>
#include <functional>
#include <string>
#include <vector>

#include "toolhost/ServerConfig.h"

namespace toolhost {

namespace registry { class PackageRegistry; }

namespace diagnostics {

//==========================================================================================================
// SystemDiagnosis
// Purpose: Outcome of DiagnoseSystem. success is true when issues is empty; recommendations may still be
//          present for optional tools.
//==========================================================================================================
struct SystemDiagnosis {
    bool success{true};
    std::vector<std::string> issues;
    std::vector<std::string> recommendations;
};

// Returns true when "<tool> --version" runs successfully.
using SystemProbe = std::function<bool(const std::string& tool)>;

// Probe that runs the tool through the shell with output discarded.
SystemProbe DefaultSystemProbe();

//==========================================================================================================
// DiagnoseSystem
// Purpose: Checks the runtimes tool providers are usually launched with (node, npm, npx, python3, pip3,
//          optionally uvx) and that PATH contains a common install prefix.
// Args:
//   probe: Tool availability check.
//   pathValue: PATH value to inspect.
// Returns:
//   SystemDiagnosis. Never throws.
//==========================================================================================================
SystemDiagnosis DiagnoseSystem(const SystemProbe& probe, const std::string& pathValue);

//==========================================================================================================
// DiagnoseConnectionFailure
// Purpose: Converts the failure of a connect attempt into a message naming the likely cause.
//   stdio: missing executable, permission denied, or early process exit. For npx launches the package is
//          looked up in the registry to report deprecation, an unknown package, or an install failure.
//   http/sse: network failure, authentication (401/403) or wrong path (404).
// Args:
//   config: Server whose connect failed.
//   failure: Exception captured from the attempt.
//   registry: Catalog consulted for npx packages.
// Returns:
//   The diagnosis; the raw failure message when no rule matches.
//==========================================================================================================
std::string DiagnoseConnectionFailure(const ServerConfig& config,
                                      std::exception_ptr failure,
                                      registry::PackageRegistry& registry);

} // namespace diagnostics
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.h
// Purpose: Minimal http(s) URL handling for the network transports
//==========================================================================================================

#pragma once

#include <string>

namespace toolhost {
namespace web {

//==========================================================================================================
// UrlParts
// Fields:
//   scheme: "http" or "https".
//   host: Host name or address (IPv6 without brackets).
//   port: Explicit port or the scheme default.
//   target: Path plus query, always starting with '/'.
//==========================================================================================================
struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;

    // host[:port] as sent in the Host header (port omitted when it is the scheme default).
    std::string hostHeader() const;
    // scheme://host[:port] without target.
    std::string origin() const;
};

//==========================================================================================================
// parseUrl
// Purpose: Splits an absolute http(s) URL. The fragment is dropped.
// Returns:
//   UrlParts. Throws errors::ToolhostError(ConfigurationError) for other schemes or an empty host.
//==========================================================================================================
UrlParts parseUrl(const std::string& url);

//==========================================================================================================
// resolveReference
// Purpose: Resolves `reference` (absolute URL, "//host/...", "/path" or relative path) against `base`.
//==========================================================================================================
std::string resolveReference(const std::string& base, const std::string& reference);

} // namespace web
} // namespace toolhost

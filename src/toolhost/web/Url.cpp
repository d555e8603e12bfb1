//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Url.cpp
// Purpose: URL parsing and reference resolution
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "toolhost/errors/Errors.h"
#include "toolhost/web/Url.h"

namespace toolhost {
namespace web {

namespace {
std::string defaultPort(const std::string& scheme) {
    return scheme == "https" ? std::string("443") : std::string("80");
}
} // namespace

std::string UrlParts::hostHeader() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != defaultPort(scheme)) {
        h += ":" + port;
    }
    return h;
}

std::string UrlParts::origin() const {
    return scheme + "://" + hostHeader();
}

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, "Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, "Unsupported URL scheme: " + parts.scheme);
    }

    std::size_t pos = schemeEnd + 3;
    std::size_t slash = url.find_first_of("/?#", pos);
    std::string hostPort = slash == std::string::npos ? url.substr(pos) : url.substr(pos, slash - pos);
    std::string rest = slash == std::string::npos ? std::string() : url.substr(slash);

    std::size_t hash = rest.find('#');
    if (hash != std::string::npos) {
        rest.erase(hash);
    }
    if (rest.empty() || rest.front() != '/') {
        rest.insert(0, "/");
    }
    parts.target = rest;

    std::size_t at = hostPort.rfind('@');
    if (at != std::string::npos) {
        hostPort.erase(0, at + 1);
    }
    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, "Invalid IPv6 host in URL: " + url);
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') {
            parts.port = hostPort.substr(close + 2);
        }
    } else {
        std::size_t colon = hostPort.find(':');
        parts.host = hostPort.substr(0, colon);
        if (colon != std::string::npos) {
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.port.empty()) {
        parts.port = defaultPort(parts.scheme);
    }
    if (parts.host.empty()) {
        throw errors::ToolhostError(errors::ErrorCategory::ConfigurationError, "URL has no host: " + url);
    }
    return parts;
}

std::string resolveReference(const std::string& base, const std::string& reference) {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }
    UrlParts b = parseUrl(base);
    if (reference.rfind("//", 0) == 0) {
        return b.scheme + ":" + reference;
    }
    if (!reference.empty() && reference.front() == '/') {
        return b.origin() + reference;
    }
    std::string path = b.target.substr(0, b.target.find('?'));
    path.erase(path.rfind('/') + 1);
    return b.origin() + path + reference;
}

} // namespace web
} // namespace toolhost

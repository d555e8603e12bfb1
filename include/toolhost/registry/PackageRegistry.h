//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PackageRegistry.h
// Purpose: Read-only catalog of known-good and deprecated tool provider packages
//==========================================================================================================

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {
namespace registry {

struct RegistryEntry {
    std::string id;
    std::string name;
    std::string packageIdentifier;
    std::string status;
    std::optional<std::string> version;
};

struct DeprecatedEntry {
    std::string id;
    std::string name;
    std::string packageIdentifier;
    std::string reason;
    std::string alternative;
};

struct RegistryData {
    std::string version;
    std::string lastUpdated;
    std::vector<RegistryEntry> entries;
    std::vector<DeprecatedEntry> deprecated;
};

//==========================================================================================================
// PackageValidation
// Purpose: Result of ValidatePackage.
// Fields:
//   valid: true only for an active catalog entry.
//   status: "active" | "deprecated" | "unknown" | "error".
//   message: Human readable explanation.
//   alternative: Suggested replacement (deprecated entries only).
//==========================================================================================================
struct PackageValidation {
    bool valid{false};
    std::string status;
    std::string message;
    std::optional<std::string> alternative;
};

//==========================================================================================================
// PackageRegistry
// Purpose: Loads the registry document once and caches it. A missing or malformed document is reported as
//          RegistryUnavailable in the log and the embedded fallback is used instead.
//==========================================================================================================
class PackageRegistry {
public:
    struct Options {
        // Registry JSON file; std::nullopt uses the embedded fallback directly.
        std::optional<std::string> path;
        // When false a load failure is not masked: GetRegistry throws RegistryUnavailable.
        bool allowFallback{true};
    };

    PackageRegistry();
    explicit PackageRegistry(Options options);

    // Options built from TOOLHOST_REGISTRY_PATH.
    static Options OptionsFromEnvironment();

    //==========================================================================================================
    // GetRegistry
    // Purpose: Returns the cached catalog, loading it on first use.
    // Returns:
    //   RegistryData. Throws errors::ToolhostError(RegistryUnavailable) only when the fallback is disabled.
    //==========================================================================================================
    RegistryData GetRegistry();

    //==========================================================================================================
    // ValidatePackage
    // Purpose: Classifies a package identifier against the catalog. Never throws.
    // Args:
    //   packageIdentifier: e.g. "@modelcontextprotocol/server-memory".
    // Returns:
    //   PackageValidation with status active, deprecated, unknown, or error (catalog unavailable).
    //==========================================================================================================
    PackageValidation ValidatePackage(const std::string& packageIdentifier);

    // Comma separated identifiers of all active entries.
    static std::string ActivePackageList(const RegistryData& data);

    static RegistryData FallbackData();

    //==========================================================================================================
    // ParseRegistry
    // Purpose: Maps a registry document onto RegistryData; "npmPackage" is accepted for "packageIdentifier".
    // Returns:
    //   RegistryData. Throws errors::ToolhostError(RegistryUnavailable) when required members are missing.
    //==========================================================================================================
    static RegistryData ParseRegistry(const JSONValue& document);

private:
    Options options;
    std::mutex mutex;
    std::optional<RegistryData> cache;
};

} // namespace registry
} // namespace toolhost

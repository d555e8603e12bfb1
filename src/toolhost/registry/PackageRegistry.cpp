//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PackageRegistry.cpp
// Purpose: Registry loading, embedded fallback catalog and package classification
//==========================================================================================================

#include <fstream>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/PackageRegistry.h"

namespace toolhost {
namespace registry {

using errors::ErrorCategory;
using errors::ToolhostError;

namespace {

std::string requireString(const JSONValue& obj, const char* key, const char* where) {
    auto v = getStringMember(obj, key);
    if (!v.has_value()) {
        throw ToolhostError(ErrorCategory::RegistryUnavailable,
                            std::string("Registry ") + where + " is missing '" + key + "'");
    }
    return *v;
}

std::string packageOf(const JSONValue& obj, const char* where) {
    auto v = getStringMember(obj, "packageIdentifier");
    if (!v.has_value()) {
        v = getStringMember(obj, "npmPackage");
    }
    if (!v.has_value()) {
        throw ToolhostError(ErrorCategory::RegistryUnavailable,
                            std::string("Registry ") + where + " is missing 'packageIdentifier'");
    }
    return *v;
}

const JSONValue::Array& arrayMember(const JSONValue& doc, const char* key) {
    static const JSONValue::Array empty;
    const JSONValue* v = findMember(doc, key);
    if (v == nullptr) {
        return empty;
    }
    if (!v->isArray()) {
        throw ToolhostError(ErrorCategory::RegistryUnavailable, std::string("Registry '") + key + "' must be an array");
    }
    return std::get<JSONValue::Array>(v->value);
}

RegistryData loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ToolhostError(ErrorCategory::RegistryUnavailable, "Cannot open registry file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    JSONValue doc;
    try {
        doc = parseJSONValue(ss.str());
    } catch (const std::runtime_error& e) {
        throw ToolhostError(ErrorCategory::RegistryUnavailable, "Malformed registry file " + path + ": " + e.what());
    }
    return PackageRegistry::ParseRegistry(doc);
}

} // namespace

PackageRegistry::PackageRegistry() : PackageRegistry(OptionsFromEnvironment()) {}

PackageRegistry::PackageRegistry(Options opts) : options(std::move(opts)) {}

PackageRegistry::Options PackageRegistry::OptionsFromEnvironment() {
    Options opts;
    std::string path = GetEnvOrDefault("TOOLHOST_REGISTRY_PATH", "");
    if (!path.empty()) {
        opts.path = path;
    }
    return opts;
}

RegistryData PackageRegistry::FallbackData() {
    RegistryData data;
    data.version = "1.0.0";
    data.lastUpdated = "2025-01-14";
    data.entries = {
        { "filesystem-local", "Local File System", "@modelcontextprotocol/server-filesystem", "active", std::string("2025.8.21") },
        { "memory", "Memory Storage", "@modelcontextprotocol/server-memory", "active", std::string("2025.8.4") },
        { "sequential-thinking", "Sequential Thinking", "@modelcontextprotocol/server-sequential-thinking", "active", std::string("2025.7.1") }
    };
    data.deprecated = {
        { "sqlite", "SQLite Database", "@modelcontextprotocol/server-sqlite", "Package never existed.",
          "@modelcontextprotocol/server-memory or @modelcontextprotocol/server-filesystem" }
    };
    return data;
}

RegistryData PackageRegistry::ParseRegistry(const JSONValue& document) {
    if (!document.isObject()) {
        throw ToolhostError(ErrorCategory::RegistryUnavailable, "Registry document must be an object");
    }
    RegistryData data;
    data.version = getStringMember(document, "version").value_or("");
    data.lastUpdated = getStringMember(document, "lastUpdated").value_or("");

    for (const auto& item : arrayMember(document, "entries")) {
        if (!item || !item->isObject()) {
            throw ToolhostError(ErrorCategory::RegistryUnavailable, "Registry entry must be an object");
        }
        RegistryEntry e;
        e.id = requireString(*item, "id", "entry");
        e.name = getStringMember(*item, "name").value_or(e.id);
        e.packageIdentifier = packageOf(*item, "entry");
        e.status = getStringMember(*item, "status").value_or("active");
        e.version = getStringMember(*item, "version");
        data.entries.push_back(std::move(e));
    }
    for (const auto& item : arrayMember(document, "deprecated")) {
        if (!item || !item->isObject()) {
            throw ToolhostError(ErrorCategory::RegistryUnavailable, "Deprecated registry entry must be an object");
        }
        DeprecatedEntry d;
        d.id = requireString(*item, "id", "deprecated entry");
        d.name = getStringMember(*item, "name").value_or(d.id);
        d.packageIdentifier = packageOf(*item, "deprecated entry");
        d.reason = getStringMember(*item, "reason").value_or("");
        d.alternative = getStringMember(*item, "alternative").value_or("");
        data.deprecated.push_back(std::move(d));
    }
    return data;
}

RegistryData PackageRegistry::GetRegistry() {
    std::lock_guard<std::mutex> lock(mutex);
    if (cache.has_value()) {
        return *cache;
    }
    if (!options.path.has_value()) {
        LOG_DEBUG("PackageRegistry: no registry path configured, using embedded catalog");
        cache = FallbackData();
        return *cache;
    }
    try {
        cache = loadFromFile(*options.path);
        LOG_INFO("PackageRegistry: loaded {} entries ({} deprecated) from {}",
                 cache->entries.size(), cache->deprecated.size(), *options.path);
    } catch (const ToolhostError& e) {
        if (!options.allowFallback) {
            LOG_ERROR("PackageRegistry: {}: {}", errors::toString(e.category()), e.what());
            throw;
        }
        LOG_WARN("PackageRegistry: {}: {}; using fallback data", errors::toString(e.category()), e.what());
        cache = FallbackData();
    }
    return *cache;
}

std::string PackageRegistry::ActivePackageList(const RegistryData& data) {
    std::string out;
    for (const auto& e : data.entries) {
        if (e.status != "active") {
            continue;
        }
        if (!out.empty()) {
            out += ", ";
        }
        out += e.packageIdentifier;
    }
    return out;
}

PackageValidation PackageRegistry::ValidatePackage(const std::string& packageIdentifier) {
    FUNC_SCOPE();
    PackageValidation result;
    RegistryData data;
    try {
        data = GetRegistry();
    } catch (const ToolhostError& e) {
        LOG_ERROR("PackageRegistry: validation of {} failed: {}", packageIdentifier, e.what());
        result.status = "error";
        result.message = "Unable to validate package due to registry loading error";
        return result;
    }

    for (const auto& d : data.deprecated) {
        if (d.packageIdentifier == packageIdentifier) {
            result.status = "deprecated";
            result.message = d.reason;
            result.alternative = d.alternative;
            return result;
        }
    }
    for (const auto& e : data.entries) {
        if (e.packageIdentifier == packageIdentifier && e.status == "active") {
            result.valid = true;
            result.status = "active";
            result.message = "Package " + packageIdentifier + " is available (v" + e.version.value_or("latest") + ")";
            return result;
        }
    }
    result.status = "unknown";
    result.message = "Unknown package. Available packages: " + ActivePackageList(data);
    return result;
}

} // namespace registry
} // namespace toolhost

//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigurationStore.cpp
// Purpose: JSON-file configuration store implementation
//==========================================================================================================

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging/Logger.h"
#include "toolhost/config/ConfigurationStore.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {
namespace config {

using errors::ErrorCategory;
using errors::ToolhostError;

namespace {

constexpr const char* kEnabledKey = "mcpServers";
constexpr const char* kDisabledKey = "disabled";

// Entries are stored without their id; the id is the member name.
JSONValue::Object toSection(const std::map<std::string, ServerConfig>& servers) {
    JSONValue::Object section;
    for (const auto& [id, cfg] : servers) {
        section[id] = std::make_shared<JSONValue>(serverConfigToJSON(cfg));
    }
    return section;
}

std::map<std::string, ServerConfig> fromSection(const JSONValue::Object& section, const char* sectionName) {
    std::map<std::string, ServerConfig> out;
    for (const auto& [id, entry] : section) {
        if (!entry) {
            continue;
        }
        try {
            out.emplace(id, serverConfigFromJSON(id, *entry));
        } catch (const ToolhostError& e) {
            LOG_ERROR("ConfigurationStore: skipping {} entry {}: {}", sectionName, id, e.what());
        }
    }
    return out;
}

JSONValue::Object objectMember(const JSONValue& doc, const char* key) {
    const JSONValue* v = findMember(doc, key);
    if (v == nullptr || !v->isObject()) {
        return JSONValue::Object{};
    }
    return std::get<JSONValue::Object>(v->value);
}

} // namespace

ConfigurationStore::ConfigurationStore(std::string p) : path(std::move(p)) {
    FUNC_SCOPE();
    std::error_code ec;
    const std::filesystem::path dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            LOG_WARN("ConfigurationStore: cannot create {}: {}", dir.string(), ec.message());
        }
    }
}

ConfigurationStore::Document ConfigurationStore::readDocument() const {
    Document doc;
    std::ifstream in(path);
    if (!in) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_INFO("ConfigurationStore: {} does not exist, creating an empty configuration", path);
            try {
                writeDocument(doc);
            } catch (const ToolhostError& e) {
                LOG_ERROR("ConfigurationStore: {}", e.what());
            }
        } else {
            LOG_ERROR("ConfigurationStore: cannot open {}", path);
        }
        return doc;
    }

    std::stringstream ss;
    ss << in.rdbuf();
    JSONValue parsed;
    try {
        parsed = parseJSONValue(ss.str());
    } catch (const std::runtime_error& e) {
        LOG_ERROR("ConfigurationStore: failed to parse {}: {}", path, e.what());
        return doc;
    }

    const JSONValue* servers = findMember(parsed, kEnabledKey);
    if (servers == nullptr || !servers->isObject()) {
        LOG_WARN("ConfigurationStore: invalid configuration format in {}, using empty configuration", path);
        return doc;
    }
    doc.enabled = std::get<JSONValue::Object>(servers->value);
    doc.disabled = objectMember(parsed, kDisabledKey);
    return doc;
}

void ConfigurationStore::writeDocument(const Document& doc) const {
    JSONValue::Object root;
    root[kEnabledKey] = std::make_shared<JSONValue>(doc.enabled);
    root[kDisabledKey] = std::make_shared<JSONValue>(doc.disabled);
    const std::string text = serializeJSONValue(JSONValue{std::move(root)});

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw ToolhostError(ErrorCategory::ConfigurationError, "Failed to save configuration: cannot write " + tmp);
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            throw ToolhostError(ErrorCategory::ConfigurationError, "Failed to save configuration: write error on " + tmp);
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw ToolhostError(ErrorCategory::ConfigurationError, "Failed to save configuration to " + path);
    }
    LOG_DEBUG("ConfigurationStore: saved {}", path);
}

Configuration ConfigurationStore::LoadConfiguration() const {
    FUNC_SCOPE();
    Document doc = readDocument();
    Configuration cfg;
    cfg.enabledServers = fromSection(doc.enabled, kEnabledKey);
    cfg.disabledServers = fromSection(doc.disabled, kDisabledKey);
    return cfg;
}

void ConfigurationStore::SaveConfiguration(const Configuration& configuration) {
    FUNC_SCOPE();
    Document doc;
    doc.enabled = toSection(configuration.enabledServers);
    doc.disabled = toSection(configuration.disabledServers);
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: configuration saved ({} enabled, {} disabled)",
             configuration.enabledServers.size(), configuration.disabledServers.size());
}

void ConfigurationStore::AddServer(const ServerConfig& config) {
    FUNC_SCOPE();
    if (config.id.empty()) {
        throw ToolhostError(ErrorCategory::ConfigurationError, "Server id must not be empty");
    }
    Document doc = readDocument();
    doc.enabled[config.id] = std::make_shared<JSONValue>(serverConfigToJSON(config));
    doc.disabled.erase(config.id);
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: server {} added", config.id);
}

bool ConfigurationStore::RemoveServer(const std::string& serverId) {
    FUNC_SCOPE();
    Document doc = readDocument();
    const bool found = (doc.enabled.erase(serverId) + doc.disabled.erase(serverId)) > 0;
    if (!found) {
        LOG_WARN("ConfigurationStore: server {} not found in configuration", serverId);
        return false;
    }
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: server {} removed", serverId);
    return true;
}

void ConfigurationStore::UpdateServer(const std::string& serverId, const JSONValue& changes) {
    FUNC_SCOPE();
    if (!changes.isObject()) {
        throw ToolhostError(ErrorCategory::ConfigurationError, "Update for server " + serverId + " must be an object");
    }
    Document doc = readDocument();
    auto it = doc.enabled.find(serverId);
    if (it == doc.enabled.end() || !it->second || !it->second->isObject()) {
        throw ToolhostError(ErrorCategory::ConfigurationError, "Server " + serverId + " not found in configuration");
    }
    JSONValue::Object merged = std::get<JSONValue::Object>(it->second->value);
    for (const auto& [k, v] : std::get<JSONValue::Object>(changes.value)) {
        merged[k] = v;
    }
    JSONValue entry{std::move(merged)};
    (void) serverConfigFromJSON(serverId, entry);  // rejects a merge that no longer parses
    it->second = std::make_shared<JSONValue>(std::move(entry));
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: server {} updated", serverId);
}

std::optional<ServerConfig> ConfigurationStore::GetServer(const std::string& serverId) const {
    Configuration cfg = LoadConfiguration();
    auto it = cfg.enabledServers.find(serverId);
    if (it == cfg.enabledServers.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ServerListing> ConfigurationStore::ListServers() const {
    Configuration cfg = LoadConfiguration();
    std::vector<ServerListing> out;
    out.reserve(cfg.enabledServers.size() + cfg.disabledServers.size());
    for (auto& [id, sc] : cfg.enabledServers) {
        out.push_back(ServerListing{sc, true});
    }
    for (auto& [id, sc] : cfg.disabledServers) {
        out.push_back(ServerListing{sc, false});
    }
    return out;
}

void ConfigurationStore::EnableServer(const std::string& serverId) {
    FUNC_SCOPE();
    Document doc = readDocument();
    auto it = doc.disabled.find(serverId);
    if (it == doc.disabled.end()) {
        throw ToolhostError(ErrorCategory::ConfigurationError, "Server " + serverId + " not found in disabled");
    }
    doc.enabled[serverId] = it->second;
    doc.disabled.erase(it);
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: server {} enabled", serverId);
}

void ConfigurationStore::DisableServer(const std::string& serverId) {
    FUNC_SCOPE();
    Document doc = readDocument();
    auto it = doc.enabled.find(serverId);
    if (it == doc.enabled.end()) {
        LOG_WARN("ConfigurationStore: server {} not found in mcpServers, cannot disable", serverId);
        throw ToolhostError(ErrorCategory::ConfigurationError, "Server " + serverId + " not found in mcpServers");
    }
    doc.disabled[serverId] = it->second;
    doc.enabled.erase(it);
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: server {} disabled", serverId);
}

void ConfigurationStore::ImportConfiguration(const JSONValue& document) {
    FUNC_SCOPE();
    const JSONValue* servers = findMember(document, kEnabledKey);
    if (servers == nullptr || !servers->isObject()) {
        throw ToolhostError(ErrorCategory::ConfigurationError, "Invalid configuration format: missing mcpServers object");
    }
    Document doc = readDocument();
    for (const auto& [id, entry] : std::get<JSONValue::Object>(servers->value)) {
        doc.enabled[id] = entry;
        doc.disabled.erase(id);
    }
    for (const auto& [id, entry] : objectMember(document, kDisabledKey)) {
        doc.disabled[id] = entry;
        doc.enabled.erase(id);
    }
    writeDocument(doc);
    LOG_INFO("ConfigurationStore: imported {} server entries", std::get<JSONValue::Object>(servers->value).size());
}

JSONValue ConfigurationStore::ExportConfiguration() const {
    Document doc = readDocument();
    JSONValue::Object root;
    root[kEnabledKey] = std::make_shared<JSONValue>(std::move(doc.enabled));
    root[kDisabledKey] = std::make_shared<JSONValue>(std::move(doc.disabled));
    return JSONValue{std::move(root)};
}

} // namespace config
} // namespace toolhost

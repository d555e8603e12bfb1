//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConfigurationStore.h
// Purpose: Declared server configuration: read-only source interface and its JSON-file implementation
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ServerConfig.h"

namespace toolhost {
namespace config {

//==========================================================================================================
// Configuration
// Purpose: Declared servers split into the enabled and disabled sections, keyed by server id.
//==========================================================================================================
struct Configuration {
    std::map<std::string, ServerConfig> enabledServers;
    std::map<std::string, ServerConfig> disabledServers;
};

struct ServerListing {
    ServerConfig config;
    bool enabled{true};
};

// Read side consumed by the tool bridge.
class IConfigurationSource {
public:
    virtual ~IConfigurationSource() = default;
    virtual Configuration LoadConfiguration() const = 0;
};

//==========================================================================================================
// ConfigurationStore
// Purpose: Persists the configuration as one JSON document:
//            { "mcpServers": { id: entry }, "disabled": { id: entry } }
//          Entries are stored as written; members the store does not model are preserved on rewrite
//          through Update/Enable/Disable/Import.
// Notes:
//   Every operation reads the file, so edits made by other processes are picked up. Mutations rewrite the
//   whole document (temporary file + rename).
//==========================================================================================================
class ConfigurationStore : public IConfigurationSource {
public:
    explicit ConfigurationStore(std::string path);

    const std::string& GetConfigPath() const { return path; }

    //==========================================================================================================
    // LoadConfiguration
    // Returns:
    //   A missing file is created holding the empty configuration. An unreadable document or one whose
    //   mcpServers member is not an object yields the empty configuration. Entries that fail to parse are
    //   skipped with an error log. Never throws.
    //==========================================================================================================
    Configuration LoadConfiguration() const override;

    // Replaces the whole document. Throws ConfigurationError when the file cannot be written.
    void SaveConfiguration(const Configuration& configuration);

    // Adds (or replaces) the entry in the enabled section.
    void AddServer(const ServerConfig& config);

    // Removes the id from both sections. Returns false when it was in neither.
    bool RemoveServer(const std::string& serverId);

    //==========================================================================================================
    // UpdateServer
    // Purpose: Shallow-merges the members of `changes` over an enabled entry.
    // Throws:
    //   ConfigurationError when the id is not in the enabled section, when `changes` is not an object, or
    //   when the merged entry is no longer a valid server entry.
    //==========================================================================================================
    void UpdateServer(const std::string& serverId, const JSONValue& changes);

    // Enabled entry with that id, if any.
    std::optional<ServerConfig> GetServer(const std::string& serverId) const;

    // Enabled servers first, then disabled ones; ascending ids within each section.
    std::vector<ServerListing> ListServers() const;

    // Move an entry between sections. ConfigurationError when it is not in the source section.
    void EnableServer(const std::string& serverId);
    void DisableServer(const std::string& serverId);

    // Merges another document into this one; imported entries win. ConfigurationError when the document has
    // no mcpServers object.
    void ImportConfiguration(const JSONValue& document);

    JSONValue ExportConfiguration() const;

private:
    struct Document {
        JSONValue::Object enabled;
        JSONValue::Object disabled;
    };

    Document readDocument() const;
    void writeDocument(const Document& doc) const;

    std::string path;
};

} // namespace config
} // namespace toolhost

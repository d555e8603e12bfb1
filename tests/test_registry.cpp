//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: GoogleTests for registry loading, fallback and package classification
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/errors/Errors.h"
#include "toolhost/registry/PackageRegistry.h"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace toolhost;
using namespace toolhost::registry;

namespace {

// Writes text to a unique temp file, removed on destruction.
class TempFile {
public:
    explicit TempFile(const std::string& text) {
        static std::atomic<int> counter{0};
        path = (std::filesystem::temp_directory_path() /
                ("toolhost_registry_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".json")).string();
        std::ofstream out(path);
        out << text;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    std::string path;
};

const char* kDocument = R"({
  "version": "2.0.0",
  "lastUpdated": "2025-06-01",
  "entries": [
    {"id": "memory", "name": "Memory", "packageIdentifier": "@modelcontextprotocol/server-memory", "status": "active", "version": "1.2.3"},
    {"id": "legacy", "npmPackage": "@acme/legacy-server", "status": "retired"},
    {"id": "fs", "npmPackage": "@modelcontextprotocol/server-filesystem"}
  ],
  "deprecated": [
    {"id": "old", "packageIdentifier": "@acme/old-server", "reason": "Superseded.", "alternative": "@acme/new-server"}
  ]
})";

} // namespace

TEST(PackageRegistry, LoadsDocumentAndAcceptsNpmPackageAlias) {
    TempFile file(kDocument);
    PackageRegistry reg(PackageRegistry::Options{file.path, true});
    auto data = reg.GetRegistry();
    EXPECT_EQ(data.version, "2.0.0");
    ASSERT_EQ(data.entries.size(), 3u);
    EXPECT_EQ(data.entries[1].packageIdentifier, "@acme/legacy-server");
    EXPECT_EQ(data.entries[2].status, "active");
    EXPECT_EQ(data.entries[2].name, "fs");
    ASSERT_EQ(data.deprecated.size(), 1u);
    EXPECT_EQ(PackageRegistry::ActivePackageList(data),
              "@modelcontextprotocol/server-memory, @modelcontextprotocol/server-filesystem");
}

TEST(PackageRegistry, ClassifiesPackages) {
    TempFile file(kDocument);
    PackageRegistry reg(PackageRegistry::Options{file.path, true});

    auto active = reg.ValidatePackage("@modelcontextprotocol/server-memory");
    EXPECT_TRUE(active.valid);
    EXPECT_EQ(active.status, "active");
    EXPECT_NE(active.message.find("v1.2.3"), std::string::npos);

    auto deprecated = reg.ValidatePackage("@acme/old-server");
    EXPECT_FALSE(deprecated.valid);
    EXPECT_EQ(deprecated.status, "deprecated");
    EXPECT_EQ(deprecated.message, "Superseded.");
    EXPECT_EQ(deprecated.alternative.value_or(""), "@acme/new-server");

    // Listed but not active.
    auto retired = reg.ValidatePackage("@acme/legacy-server");
    EXPECT_FALSE(retired.valid);
    EXPECT_EQ(retired.status, "unknown");

    auto unknown = reg.ValidatePackage("left-pad");
    EXPECT_EQ(unknown.status, "unknown");
    EXPECT_NE(unknown.message.find("@modelcontextprotocol/server-memory"), std::string::npos);
}

TEST(PackageRegistry, MissingFileFallsBackToEmbeddedCatalog) {
    PackageRegistry reg(PackageRegistry::Options{std::string("/nonexistent/registry.json"), true});
    auto data = reg.GetRegistry();
    EXPECT_EQ(data.version, PackageRegistry::FallbackData().version);
    auto sqlite = reg.ValidatePackage("@modelcontextprotocol/server-sqlite");
    EXPECT_EQ(sqlite.status, "deprecated");
    EXPECT_TRUE(sqlite.alternative.has_value());
}

TEST(PackageRegistry, MalformedDocumentsFallBack) {
    for (const char* text : {"{ nope", R"({"entries": {}})", R"({"entries": [{"name": "no id"}]})",
                             R"({"deprecated": [{"id": "x"}]})"}) {
        TempFile file(text);
        PackageRegistry reg(PackageRegistry::Options{file.path, true});
        EXPECT_EQ(reg.GetRegistry().entries.size(), PackageRegistry::FallbackData().entries.size()) << text;
    }
}

TEST(PackageRegistry, WithoutFallbackFailuresSurface) {
    PackageRegistry reg(PackageRegistry::Options{std::string("/nonexistent/registry.json"), false});
    try {
        reg.GetRegistry();
        FAIL() << "expected RegistryUnavailable";
    } catch (const errors::ToolhostError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::RegistryUnavailable);
    }
    auto v = reg.ValidatePackage("@modelcontextprotocol/server-memory");
    EXPECT_FALSE(v.valid);
    EXPECT_EQ(v.status, "error");
}

TEST(PackageRegistry, CatalogIsCachedAfterFirstLoad) {
    auto file = std::make_unique<TempFile>(kDocument);
    PackageRegistry reg(PackageRegistry::Options{file->path, true});
    EXPECT_EQ(reg.GetRegistry().version, "2.0.0");
    file.reset();
    EXPECT_EQ(reg.GetRegistry().version, "2.0.0");
}

TEST(PackageRegistry, NoPathUsesEmbeddedCatalog) {
    PackageRegistry reg(PackageRegistry::Options{});
    auto data = reg.GetRegistry();
    EXPECT_FALSE(data.entries.empty());
    EXPECT_TRUE(reg.ValidatePackage("@modelcontextprotocol/server-filesystem").valid);
}

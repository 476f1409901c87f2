#pragma once

#include "shipyard/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace shipyard {

// ============================================================================
// bundle.json
// ============================================================================

struct ManifestSignature {
    std::string keyid;
    std::string sig;
};

struct ManifestBinaryInfo {
    std::optional<std::string> description;
    std::vector<ManifestSignature> signatures;
};

struct ManifestVersionInfo {
    std::string version;
    std::optional<std::string> description;
    std::map<std::string, ManifestBinaryInfo> binaries;   // by binary id
};

struct ManifestArtifactInfo {
    std::string name;
    std::optional<std::string> description;
    std::map<std::string, ManifestVersionInfo> versions;  // by version id
};

// One payload of the archive, in archive order
struct ManifestItem {
    std::string hash;
    uint64_t size = 0;
    std::string binary_id;
    std::string target;
    std::string artifact_version_id;
    std::string artifact_id;
    nlohmann::json custom_metadata = nlohmann::json::object();
};

struct ManifestBundleInfo {
    std::string id;
    std::optional<std::string> name;
    std::optional<std::string> hash;
    std::vector<ManifestSignature> signatures;
    std::vector<ManifestItem> manifest;
};

struct BundleManifest {
    std::map<std::string, ManifestArtifactInfo> artifacts;   // by artifact id
    ManifestBundleInfo bundle;

    // The binary entry an item refers to, if the artifacts map declares it
    const ManifestBinaryInfo* find_binary(const ManifestItem& item) const;
};

// Parses and checks that every manifest item has its ids, target and hash
Result<BundleManifest> parse_bundle_manifest(const std::string& json_str);

// Pretty-printed with two-space indentation
std::string serialize_bundle_manifest(const BundleManifest& manifest);

} // namespace shipyard

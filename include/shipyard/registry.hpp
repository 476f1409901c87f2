#pragma once

#include "shipyard/result.hpp"
#include "shipyard/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace shipyard {

// ============================================================================
// Request Parameters
// ============================================================================

struct CreateArtifactParams {
    std::optional<std::string> id;
    std::string name;
    std::optional<std::string> description;
    nlohmann::json custom_metadata;
};

struct CreateArtifactVersionParams {
    std::string artifact_prn;
    std::optional<std::string> id;
    std::string version;
    std::optional<std::string> description;
    nlohmann::json custom_metadata;
};

struct CreateBinaryParams {
    std::string artifact_version_prn;
    std::optional<std::string> id;
    std::string target;
    std::string hash;
    uint64_t size = 0;
    std::optional<std::string> description;
    nlohmann::json custom_metadata;
};

// Only the fields that are set are sent
struct UpdateBinaryParams {
    std::string prn;
    std::optional<BinaryState> state;
    std::optional<std::string> hash;
    std::optional<uint64_t> size;
    std::optional<std::string> description;
    std::optional<nlohmann::json> custom_metadata;
};

struct ListBinariesQuery {
    std::string artifact_version_prn;
    std::optional<std::string> target;
};

struct CreateBinaryPartParams {
    std::string binary_prn;
    uint32_t index = 0;
    uint64_t size = 0;
    std::string hash;                 // lowercase hex
    uint64_t expected_binary_size = 0;
};

// Exactly one of signing_key_prn / signing_key_keyid is set
struct CreateBinarySignatureParams {
    std::string binary_prn;
    std::string signature;
    std::optional<std::string> signing_key_prn;
    std::optional<std::string> signing_key_keyid;
};

struct CreateBundleParams {
    int api_version = kDefaultApiVersion;
    std::optional<std::string> id;
    std::optional<std::string> name;
    std::vector<std::string> artifact_version_prns;   // api version 1
    std::vector<BundleBinary> binaries;               // api version 2
};

// ============================================================================
// Registry Interface
// ============================================================================

/**
 * Remote artifact registry.
 *
 * get_* calls report a missing resource as an empty optional; every other
 * failure is an error. Implementations must tolerate concurrent calls, in
 * particular to create_binary_part during uploads.
 */
class Registry {
public:
    virtual ~Registry() = default;

    virtual Result<CurrentUser> get_current_user() = 0;

    virtual Result<std::optional<Artifact>> get_artifact(const std::string& prn) = 0;
    virtual Result<Artifact> create_artifact(const CreateArtifactParams& params) = 0;

    virtual Result<std::optional<ArtifactVersion>> get_artifact_version(const std::string& prn) = 0;
    virtual Result<ArtifactVersion> create_artifact_version(const CreateArtifactVersionParams& params) = 0;

    virtual Result<std::optional<Binary>> get_binary(const std::string& prn) = 0;
    virtual Result<std::vector<Binary>> list_binaries(const ListBinariesQuery& query) = 0;
    virtual Result<Binary> create_binary(const CreateBinaryParams& params) = 0;
    virtual Result<Binary> update_binary(const UpdateBinaryParams& params) = 0;

    virtual Result<std::vector<BinaryPart>> list_binary_parts(const std::string& binary_prn) = 0;
    virtual Result<BinaryPart> create_binary_part(const CreateBinaryPartParams& params) = 0;

    virtual Result<std::vector<Signature>> list_binary_signatures(const std::string& binary_prn) = 0;
    virtual Result<Signature> create_binary_signature(const CreateBinarySignatureParams& params) = 0;

    virtual Result<std::optional<Bundle>> get_bundle(const std::string& prn) = 0;
    virtual Result<Bundle> create_bundle(const CreateBundleParams& params) = 0;

    // Short-lived URL the binary content can be downloaded from
    virtual Result<std::string> get_binary_content_url(const std::string& binary_prn) = 0;
};

} // namespace shipyard

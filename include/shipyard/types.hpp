#pragma once

#include "shipyard/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace shipyard {

// ============================================================================
// Binary Lifecycle
//
//   uploadable -> hashable -> hashing -> signable -> signed
//
// destroyed is terminal and only reached through administrative action.
// ============================================================================

enum class BinaryState {
    Uploadable,
    Hashable,
    Hashing,
    Signable,
    Signed,
    Destroyed,
    Unknown,
};

inline const char* binary_state_to_string(BinaryState s) {
    switch (s) {
        case BinaryState::Uploadable: return "uploadable";
        case BinaryState::Hashable: return "hashable";
        case BinaryState::Hashing: return "hashing";
        case BinaryState::Signable: return "signable";
        case BinaryState::Signed: return "signed";
        case BinaryState::Destroyed: return "destroyed";
        default: return "unknown";
    }
}

// Case-insensitive; unrecognised text maps to Unknown
BinaryState parse_binary_state(const std::string& s);

// The state that follows s on the forward path, if any
std::optional<BinaryState> next_binary_state(BinaryState s);

// True for the four forward edges and for staying in the same state.
// Resets (any non-signed state back to uploadable) go through
// reset_allowed instead.
bool transition_allowed(BinaryState from, BinaryState to);

// A binary whose content changed may be sent back to uploadable
// until it has been signed.
bool reset_allowed(BinaryState from);

enum class BinaryPartState {
    Pending,
    Valid,
    Unknown,
};

BinaryPartState parse_binary_part_state(const std::string& s);
const char* binary_part_state_to_string(BinaryPartState s);

// ============================================================================
// Registry Resources
// ============================================================================

struct Signature {
    std::string prn;
    std::string binary_prn;
    std::string keyid;
    std::string signing_key_prn;
    std::string signature;   // hex
};

struct Binary {
    std::string prn;
    std::string artifact_version_prn;
    std::string organization_prn;
    std::string target;
    std::optional<uint64_t> size;
    std::optional<std::string> hash;     // lowercase hex SHA-256
    BinaryState state = BinaryState::Unknown;
    std::string state_text;              // raw value as reported by the registry
    std::optional<std::string> description;
    nlohmann::json custom_metadata;      // object, or null when absent
    std::vector<Signature> signatures;
    std::string inserted_at;
    std::string updated_at;

    // Matches on either the signature keyid or its signing key PRN
    bool has_signature_for(const std::string& key_id) const;
};

struct BinaryPart {
    std::string binary_prn;
    uint32_t index = 0;
    uint64_t size = 0;
    std::string hash;
    std::string presigned_upload_url;
    BinaryPartState state = BinaryPartState::Unknown;
};

struct Artifact {
    std::string prn;
    std::string organization_prn;
    std::string name;
    std::optional<std::string> description;
    nlohmann::json custom_metadata;
};

struct ArtifactVersion {
    std::string prn;
    std::string artifact_prn;
    std::string version;
    std::optional<std::string> description;
    nlohmann::json custom_metadata;
};

struct CurrentUser {
    std::string email;
    std::string organization_prn;
};

// ============================================================================
// Bundles
//
// Two schema generations coexist. The API version selects which one a
// request produces or a response carries.
// ============================================================================

constexpr int kDefaultApiVersion = 2;

Result<void> validate_api_version(int api_version);

struct BundleBinary {
    std::string prn;
    nlohmann::json custom_metadata;   // null when absent
};

struct BundleV1 {
    std::string prn;
    std::optional<std::string> name;
    std::vector<std::string> artifact_version_prns;
    std::string inserted_at;
    std::string updated_at;
};

struct BundleV2 {
    std::string prn;
    std::optional<std::string> name;
    std::vector<BundleBinary> binaries;
    std::string inserted_at;
    std::string updated_at;
};

using Bundle = std::variant<BundleV1, BundleV2>;

const std::string& bundle_prn(const Bundle& bundle);
const std::optional<std::string>& bundle_name(const Bundle& bundle);
int bundle_api_version(const Bundle& bundle);

} // namespace shipyard

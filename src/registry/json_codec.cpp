#include "shipyard/json_codec.hpp"

namespace shipyard {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string get_string_or(const nlohmann::json& j, const std::string& key,
                          const std::string& fallback = "") {
    auto value = get_string(j, key);
    return value ? *value : fallback;
}

std::optional<uint64_t> get_u64(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_unsigned()) {
        return j[key].get<uint64_t>();
    }
    if (j.contains(key) && j[key].is_number_integer() && j[key].get<int64_t>() >= 0) {
        return static_cast<uint64_t>(j[key].get<int64_t>());
    }
    return std::nullopt;
}

nlohmann::json get_metadata(const nlohmann::json& j) {
    if (j.contains("custom_metadata") && j["custom_metadata"].is_object()) {
        return j["custom_metadata"];
    }
    return nullptr;
}

template<typename T>
Result<T> malformed(const nlohmann::json& j, const char* what) {
    return Result<T>::err(Error(ErrorCode::REGISTRY_ERROR,
        std::string("malformed ") + what + " in registry response: " +
        (j.is_object() ? "missing prn" : "expected an object")));
}

} // namespace

bool has_custom_metadata(const nlohmann::json& j) {
    return j.is_object() && !j.empty();
}

// ============================================================================
// Decoding
// ============================================================================

Result<Signature> signature_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return malformed<Signature>(j, "binary signature");
    }
    Signature sig;
    sig.prn = get_string_or(j, "prn");
    sig.binary_prn = get_string_or(j, "binary_prn");
    sig.keyid = get_string_or(j, "keyid", get_string_or(j, "signing_key_keyid"));
    sig.signing_key_prn = get_string_or(j, "signing_key_prn");
    sig.signature = get_string_or(j, "signature");
    return Result<Signature>::ok(std::move(sig));
}

Result<Binary> binary_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !get_string(j, "prn")) {
        return malformed<Binary>(j, "binary");
    }

    Binary binary;
    binary.prn = *get_string(j, "prn");
    binary.artifact_version_prn = get_string_or(j, "artifact_version_prn");
    binary.organization_prn = get_string_or(j, "organization_prn");
    binary.target = get_string_or(j, "target");
    binary.size = get_u64(j, "size");
    binary.hash = get_string(j, "hash");
    binary.state_text = get_string_or(j, "state");
    binary.state = parse_binary_state(binary.state_text);
    binary.description = get_string(j, "description");
    binary.custom_metadata = get_metadata(j);
    binary.inserted_at = get_string_or(j, "inserted_at");
    binary.updated_at = get_string_or(j, "updated_at");

    if (j.contains("signatures") && j["signatures"].is_array()) {
        for (const auto& elem : j["signatures"]) {
            auto sig = signature_from_json(elem);
            if (sig.isErr()) {
                return Result<Binary>::err(sig.error());
            }
            binary.signatures.push_back(std::move(sig.value()));
        }
    }
    return Result<Binary>::ok(std::move(binary));
}

Result<BinaryPart> binary_part_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return malformed<BinaryPart>(j, "binary part");
    }
    auto index = get_u64(j, "index");
    if (!index) {
        return Result<BinaryPart>::err(Error(ErrorCode::REGISTRY_ERROR,
            "malformed binary part in registry response: missing index"));
    }

    BinaryPart part;
    part.binary_prn = get_string_or(j, "binary_prn");
    part.index = static_cast<uint32_t>(*index);
    part.size = get_u64(j, "size").value_or(0);
    part.hash = get_string_or(j, "hash");
    part.presigned_upload_url = get_string_or(j, "presigned_upload_url");
    part.state = parse_binary_part_state(get_string_or(j, "state"));
    return Result<BinaryPart>::ok(std::move(part));
}

Result<Artifact> artifact_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !get_string(j, "prn")) {
        return malformed<Artifact>(j, "artifact");
    }
    Artifact artifact;
    artifact.prn = *get_string(j, "prn");
    artifact.organization_prn = get_string_or(j, "organization_prn");
    artifact.name = get_string_or(j, "name");
    artifact.description = get_string(j, "description");
    artifact.custom_metadata = get_metadata(j);
    return Result<Artifact>::ok(std::move(artifact));
}

Result<ArtifactVersion> artifact_version_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !get_string(j, "prn")) {
        return malformed<ArtifactVersion>(j, "artifact version");
    }
    ArtifactVersion version;
    version.prn = *get_string(j, "prn");
    version.artifact_prn = get_string_or(j, "artifact_prn");
    version.version = get_string_or(j, "version");
    version.description = get_string(j, "description");
    version.custom_metadata = get_metadata(j);
    return Result<ArtifactVersion>::ok(std::move(version));
}

Result<Bundle> bundle_from_json(const nlohmann::json& j, int api_version_hint) {
    if (!j.is_object() || !get_string(j, "prn")) {
        return malformed<Bundle>(j, "bundle");
    }

    bool has_v1 = j.contains("artifact_version_prns") && j["artifact_version_prns"].is_array();
    bool has_v2 = j.contains("binaries") && j["binaries"].is_array();
    bool as_v1 = has_v1 || (!has_v2 && api_version_hint == 1);

    if (as_v1) {
        BundleV1 bundle;
        bundle.prn = *get_string(j, "prn");
        bundle.name = get_string(j, "name");
        bundle.inserted_at = get_string_or(j, "inserted_at");
        bundle.updated_at = get_string_or(j, "updated_at");
        if (has_v1) {
            for (const auto& elem : j["artifact_version_prns"]) {
                if (elem.is_string()) {
                    bundle.artifact_version_prns.push_back(elem.get<std::string>());
                }
            }
        }
        return Result<Bundle>::ok(Bundle(std::move(bundle)));
    }

    BundleV2 bundle;
    bundle.prn = *get_string(j, "prn");
    bundle.name = get_string(j, "name");
    bundle.inserted_at = get_string_or(j, "inserted_at");
    bundle.updated_at = get_string_or(j, "updated_at");
    if (has_v2) {
        for (const auto& elem : j["binaries"]) {
            if (!elem.is_object() || !get_string(elem, "prn")) {
                return Result<Bundle>::err(Error(ErrorCode::REGISTRY_ERROR,
                    "malformed bundle binary in registry response for " + bundle.prn));
            }
            BundleBinary entry;
            entry.prn = *get_string(elem, "prn");
            entry.custom_metadata = get_metadata(elem);
            bundle.binaries.push_back(std::move(entry));
        }
    }
    return Result<Bundle>::ok(Bundle(std::move(bundle)));
}

// ============================================================================
// Encoding
// ============================================================================

nlohmann::json to_json(const CreateArtifactParams& params) {
    nlohmann::json j;
    j["name"] = params.name;
    if (params.id) j["id"] = *params.id;
    if (params.description) j["description"] = *params.description;
    if (has_custom_metadata(params.custom_metadata)) j["custom_metadata"] = params.custom_metadata;
    return j;
}

nlohmann::json to_json(const CreateArtifactVersionParams& params) {
    nlohmann::json j;
    j["artifact_prn"] = params.artifact_prn;
    j["version"] = params.version;
    if (params.id) j["id"] = *params.id;
    if (params.description) j["description"] = *params.description;
    if (has_custom_metadata(params.custom_metadata)) j["custom_metadata"] = params.custom_metadata;
    return j;
}

nlohmann::json to_json(const CreateBinaryParams& params) {
    nlohmann::json j;
    j["artifact_version_prn"] = params.artifact_version_prn;
    j["target"] = params.target;
    j["hash"] = params.hash;
    j["size"] = params.size;
    if (params.id) j["id"] = *params.id;
    if (params.description) j["description"] = *params.description;
    if (has_custom_metadata(params.custom_metadata)) j["custom_metadata"] = params.custom_metadata;
    return j;
}

nlohmann::json to_json(const UpdateBinaryParams& params) {
    nlohmann::json j = nlohmann::json::object();
    if (params.state) j["state"] = binary_state_to_string(*params.state);
    if (params.hash) j["hash"] = *params.hash;
    if (params.size) j["size"] = *params.size;
    if (params.description) j["description"] = *params.description;
    if (params.custom_metadata) j["custom_metadata"] = *params.custom_metadata;
    return j;
}

nlohmann::json to_json(const CreateBinaryPartParams& params) {
    nlohmann::json j;
    j["expected_binary_size"] = params.expected_binary_size;
    j["hash"] = params.hash;
    j["size"] = params.size;
    return j;
}

nlohmann::json to_json(const CreateBinarySignatureParams& params) {
    nlohmann::json j;
    j["binary_prn"] = params.binary_prn;
    j["signature"] = params.signature;
    if (params.signing_key_prn) j["signing_key_prn"] = *params.signing_key_prn;
    if (params.signing_key_keyid) j["signing_key_keyid"] = *params.signing_key_keyid;
    return j;
}

nlohmann::json to_json(const CreateBundleParams& params) {
    nlohmann::json j;
    if (params.id) j["id"] = *params.id;
    if (params.name) j["name"] = *params.name;
    if (params.api_version == 1) {
        j["artifact_version_prns"] = params.artifact_version_prns;
    } else {
        nlohmann::json binaries = nlohmann::json::array();
        for (const auto& entry : params.binaries) {
            nlohmann::json b;
            b["prn"] = entry.prn;
            if (has_custom_metadata(entry.custom_metadata)) {
                b["custom_metadata"] = entry.custom_metadata;
            }
            binaries.push_back(std::move(b));
        }
        j["binaries"] = std::move(binaries);
    }
    return j;
}

nlohmann::json binary_to_json(const Binary& binary) {
    nlohmann::json j;
    j["prn"] = binary.prn;
    j["artifact_version_prn"] = binary.artifact_version_prn;
    j["target"] = binary.target;
    j["state"] = binary.state == BinaryState::Unknown && !binary.state_text.empty()
        ? binary.state_text
        : std::string(binary_state_to_string(binary.state));
    if (binary.size) j["size"] = *binary.size;
    if (binary.hash) j["hash"] = *binary.hash;
    if (binary.description) j["description"] = *binary.description;
    if (has_custom_metadata(binary.custom_metadata)) j["custom_metadata"] = binary.custom_metadata;
    if (!binary.organization_prn.empty()) j["organization_prn"] = binary.organization_prn;
    if (!binary.signatures.empty()) {
        nlohmann::json sigs = nlohmann::json::array();
        for (const auto& sig : binary.signatures) {
            sigs.push_back({{"prn", sig.prn},
                            {"keyid", sig.keyid},
                            {"signing_key_prn", sig.signing_key_prn},
                            {"signature", sig.signature}});
        }
        j["signatures"] = std::move(sigs);
    }
    return j;
}

} // namespace shipyard

#pragma once

#include "shipyard/registry.hpp"
#include "shipyard/types.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace shipyard {

// ============================================================================
// Registry JSON Codec
//
// Decoders tolerate missing optional fields and unknown keys. They fail
// only when a required field (prn) is absent or a field has the wrong type.
// ============================================================================

Result<Binary> binary_from_json(const nlohmann::json& j);
Result<BinaryPart> binary_part_from_json(const nlohmann::json& j);
Result<Signature> signature_from_json(const nlohmann::json& j);
Result<Artifact> artifact_from_json(const nlohmann::json& j);
Result<ArtifactVersion> artifact_version_from_json(const nlohmann::json& j);

// Decodes by shape: artifact_version_prns means V1, binaries means V2.
// A bundle with neither takes the api_version hint.
Result<Bundle> bundle_from_json(const nlohmann::json& j, int api_version_hint);

nlohmann::json to_json(const CreateArtifactParams& params);
nlohmann::json to_json(const CreateArtifactVersionParams& params);
nlohmann::json to_json(const CreateBinaryParams& params);
nlohmann::json to_json(const UpdateBinaryParams& params);
nlohmann::json to_json(const CreateBinaryPartParams& params);
nlohmann::json to_json(const CreateBinarySignatureParams& params);
nlohmann::json to_json(const CreateBundleParams& params);

nlohmann::json binary_to_json(const Binary& binary);

// True for a JSON object with at least one key
bool has_custom_metadata(const nlohmann::json& j);

} // namespace shipyard

#include "shipyard/bundle_manifest.hpp"

namespace shipyard {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

Result<std::string> require_string(const nlohmann::json& j, const std::string& key,
                                   const std::string& where) {
    auto value = get_string(j, key);
    if (!value) {
        return Result<std::string>::err(Error(ErrorCode::ARCHIVE_INVALID,
            where + ": missing string field \"" + key + "\""));
    }
    return Result<std::string>::ok(*value);
}

std::vector<ManifestSignature> parse_signatures(const nlohmann::json& j) {
    std::vector<ManifestSignature> result;
    if (j.contains("signatures") && j["signatures"].is_array()) {
        for (const auto& elem : j["signatures"]) {
            if (!elem.is_object()) continue;
            ManifestSignature sig;
            sig.keyid = get_string(elem, "keyid").value_or("");
            sig.sig = get_string(elem, "sig").value_or("");
            result.push_back(std::move(sig));
        }
    }
    return result;
}

nlohmann::json signatures_to_json(const std::vector<ManifestSignature>& sigs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& sig : sigs) {
        arr.push_back({{"keyid", sig.keyid}, {"sig", sig.sig}});
    }
    return arr;
}

} // namespace

const ManifestBinaryInfo* BundleManifest::find_binary(const ManifestItem& item) const {
    auto artifact = artifacts.find(item.artifact_id);
    if (artifact == artifacts.end()) return nullptr;
    auto version = artifact->second.versions.find(item.artifact_version_id);
    if (version == artifact->second.versions.end()) return nullptr;
    auto binary = version->second.binaries.find(item.binary_id);
    if (binary == version->second.binaries.end()) return nullptr;
    return &binary->second;
}

Result<BundleManifest> parse_bundle_manifest(const std::string& json_str) {
    using R = Result<BundleManifest>;
    BundleManifest manifest;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            return R::err(Error(ErrorCode::ARCHIVE_INVALID, "bundle.json must be an object"));
        }

        // "artifacts" section
        if (j.contains("artifacts")) {
            if (!j["artifacts"].is_object()) {
                return R::err(Error(ErrorCode::ARCHIVE_INVALID,
                    "bundle.json: artifacts must be an object"));
            }
            for (auto& [artifact_id, a] : j["artifacts"].items()) {
                std::string where = "artifact " + artifact_id;
                if (!a.is_object()) {
                    return R::err(Error(ErrorCode::ARCHIVE_INVALID, where + " must be an object"));
                }
                auto name = require_string(a, "name", where);
                if (name.isErr()) return R::err(name.error());

                ManifestArtifactInfo artifact;
                artifact.name = name.value();
                artifact.description = get_string(a, "description");

                if (a.contains("versions") && a["versions"].is_object()) {
                    for (auto& [version_id, v] : a["versions"].items()) {
                        std::string vwhere = where + " version " + version_id;
                        if (!v.is_object()) {
                            return R::err(Error(ErrorCode::ARCHIVE_INVALID,
                                vwhere + " must be an object"));
                        }
                        auto version_str = require_string(v, "version", vwhere);
                        if (version_str.isErr()) return R::err(version_str.error());

                        ManifestVersionInfo version;
                        version.version = version_str.value();
                        version.description = get_string(v, "description");

                        if (v.contains("binaries") && v["binaries"].is_object()) {
                            for (auto& [binary_id, b] : v["binaries"].items()) {
                                ManifestBinaryInfo binary;
                                if (b.is_object()) {
                                    binary.description = get_string(b, "description");
                                    binary.signatures = parse_signatures(b);
                                }
                                version.binaries[binary_id] = std::move(binary);
                            }
                        }
                        artifact.versions[version_id] = std::move(version);
                    }
                }
                manifest.artifacts[artifact_id] = std::move(artifact);
            }
        }

        // "bundle" section
        if (!j.contains("bundle") || !j["bundle"].is_object()) {
            return R::err(Error(ErrorCode::ARCHIVE_INVALID, "bundle.json: missing bundle section"));
        }
        const auto& b = j["bundle"];
        auto bundle_id = require_string(b, "id", "bundle");
        if (bundle_id.isErr()) return R::err(bundle_id.error());
        manifest.bundle.id = bundle_id.value();
        manifest.bundle.name = get_string(b, "name");
        manifest.bundle.hash = get_string(b, "hash");
        manifest.bundle.signatures = parse_signatures(b);

        if (b.contains("manifest")) {
            if (!b["manifest"].is_array()) {
                return R::err(Error(ErrorCode::ARCHIVE_INVALID,
                    "bundle.json: bundle.manifest must be an array"));
            }
            size_t position = 0;
            for (const auto& m : b["manifest"]) {
                std::string where = "manifest entry " + std::to_string(position++);
                if (!m.is_object()) {
                    return R::err(Error(ErrorCode::ARCHIVE_INVALID, where + " must be an object"));
                }

                ManifestItem item;
                for (auto [key, field] : {std::make_pair("hash", &item.hash),
                                          std::make_pair("binary_id", &item.binary_id),
                                          std::make_pair("target", &item.target),
                                          std::make_pair("artifact_version_id",
                                                         &item.artifact_version_id),
                                          std::make_pair("artifact_id", &item.artifact_id)}) {
                    auto value = require_string(m, key, where);
                    if (value.isErr()) return R::err(value.error());
                    *field = value.value();
                }

                if (!m.contains("size") || !m["size"].is_number_unsigned()) {
                    return R::err(Error(ErrorCode::ARCHIVE_INVALID,
                        where + ": size must be a non-negative integer"));
                }
                item.size = m["size"].get<uint64_t>();

                if (m.contains("custom_metadata") && m["custom_metadata"].is_object()) {
                    item.custom_metadata = m["custom_metadata"];
                }
                manifest.bundle.manifest.push_back(std::move(item));
            }
        }

    } catch (const nlohmann::json::exception& e) {
        return R::err(Error(ErrorCode::ARCHIVE_INVALID,
            std::string("bundle.json parse error: ") + e.what()));
    }

    return R::ok(std::move(manifest));
}

std::string serialize_bundle_manifest(const BundleManifest& manifest) {
    nlohmann::json artifacts = nlohmann::json::object();
    for (const auto& [artifact_id, artifact] : manifest.artifacts) {
        nlohmann::json versions = nlohmann::json::object();
        for (const auto& [version_id, version] : artifact.versions) {
            nlohmann::json binaries = nlohmann::json::object();
            for (const auto& [binary_id, binary] : version.binaries) {
                nlohmann::json b;
                if (binary.description) b["description"] = *binary.description;
                b["signatures"] = signatures_to_json(binary.signatures);
                binaries[binary_id] = std::move(b);
            }
            nlohmann::json v;
            v["version"] = version.version;
            if (version.description) v["description"] = *version.description;
            v["binaries"] = std::move(binaries);
            versions[version_id] = std::move(v);
        }
        nlohmann::json a;
        a["name"] = artifact.name;
        if (artifact.description) a["description"] = *artifact.description;
        a["versions"] = std::move(versions);
        artifacts[artifact_id] = std::move(a);
    }

    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : manifest.bundle.manifest) {
        items.push_back({
            {"hash", item.hash},
            {"size", item.size},
            {"binary_id", item.binary_id},
            {"target", item.target},
            {"artifact_version_id", item.artifact_version_id},
            {"artifact_id", item.artifact_id},
            {"custom_metadata", item.custom_metadata.is_object() ? item.custom_metadata
                                                                 : nlohmann::json::object()},
        });
    }

    nlohmann::json bundle;
    bundle["id"] = manifest.bundle.id;
    if (manifest.bundle.name) bundle["name"] = *manifest.bundle.name;
    if (manifest.bundle.hash) bundle["hash"] = *manifest.bundle.hash;
    bundle["signatures"] = signatures_to_json(manifest.bundle.signatures);
    bundle["manifest"] = std::move(items);

    nlohmann::json j;
    j["artifacts"] = std::move(artifacts);
    j["bundle"] = std::move(bundle);
    return j.dump(2);
}

} // namespace shipyard

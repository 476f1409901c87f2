#include "shipyard/bundle_pull.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/prn.hpp"

#include <cctype>
#include <map>

#include <spdlog/spdlog.h>

namespace shipyard {

std::string archive_file_name(const std::string& base, Compression compression) {
    std::string sanitized;
    sanitized.reserve(base.size());
    for (char c : base) {
        bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
        sanitized.push_back(keep ? c : '_');
    }
    return sanitized + (compression == Compression::Gzip ? ".cpio.gz" : ".cpio.zst");
}

std::string default_output_path(const Bundle& bundle) {
    const auto& name = bundle_name(bundle);
    return archive_file_name(name && !name->empty() ? *name : bundle_prn(bundle));
}

BundlePuller::BundlePuller(Registry& registry, HttpTransport& transport)
    : registry_(registry), transport_(transport) {}

Result<std::vector<BundleBinary>> BundlePuller::bundle_binaries(const Bundle& bundle) {
    using R = Result<std::vector<BundleBinary>>;

    if (const auto* v2 = std::get_if<BundleV2>(&bundle)) {
        return R::ok(v2->binaries);
    }

    // V1 bundles reference artifact versions; expand each to its binaries
    std::vector<BundleBinary> result;
    for (const auto& version_prn : std::get<BundleV1>(bundle).artifact_version_prns) {
        ListBinariesQuery query;
        query.artifact_version_prn = version_prn;
        auto listed = registry_.list_binaries(query);
        if (listed.isErr()) {
            return R::err(listed.error().withContext("listing binaries of " + version_prn));
        }
        for (const auto& binary : listed.value()) {
            BundleBinary entry;
            entry.prn = binary.prn;
            entry.custom_metadata = binary.custom_metadata;
            result.push_back(std::move(entry));
        }
    }
    return R::ok(std::move(result));
}

Result<std::vector<uint8_t>> BundlePuller::download(const Binary& binary) {
    using R = Result<std::vector<uint8_t>>;

    auto url = registry_.get_binary_content_url(binary.prn);
    if (url.isErr()) {
        return R::err(url.error().withContext("content URL for " + binary.prn));
    }

    HttpRequest request;
    request.method = "GET";
    request.url = url.value();
    // Large payloads may take longer than any fixed limit
    request.timeout_seconds = 0;
    HttpResponse response = transport_.perform(request);
    if (!response.ok) {
        return R::err(Error(ErrorCode::TRANSFER_FAILED,
            "downloading " + binary.prn + ": " + response.error));
    }
    if (!response.success()) {
        return R::err(Error(ErrorCode::TRANSFER_FAILED,
            "downloading " + binary.prn + ": HTTP " + std::to_string(response.status)));
    }

    if (binary.size && response.body.size() != *binary.size) {
        return R::err(Error(ErrorCode::INTEGRITY_CONFLICT,
            "downloaded " + std::to_string(response.body.size()) + " bytes for " + binary.prn +
            ", registry records " + std::to_string(*binary.size)));
    }

    HashResult hash = compute_sha256(response.body);
    if (!hash.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, "hashing " + binary.prn + ": " + hash.error));
    }
    if (hash.hex_digest != to_lower_hex(*binary.hash)) {
        return R::err(Error(ErrorCode::INTEGRITY_CONFLICT,
            "content of " + binary.prn + " hashes to " + hash.hex_digest +
            ", registry records " + to_lower_hex(*binary.hash)));
    }

    spdlog::debug("downloaded {} ({} bytes)", binary.prn, response.body.size());
    return R::ok(std::move(response.body));
}

Result<BundlePuller::PlannedBundle> BundlePuller::plan(const std::string& bundle_prn_value) {
    using R = Result<PlannedBundle>;

    auto fetched = registry_.get_bundle(bundle_prn_value);
    if (fetched.isErr()) {
        return R::err(fetched.error().withContext("reading bundle " + bundle_prn_value));
    }
    if (!fetched.value()) {
        return R::err(Error(ErrorCode::NOT_FOUND, "bundle " + bundle_prn_value + " does not exist"));
    }

    PlannedBundle pulled{*fetched.value(), {}, {}};

    auto bundle_id = resource_id_from_prn(bundle_prn(pulled.bundle));
    if (bundle_id.isErr()) {
        return R::err(bundle_id.error().withContext("bundle PRN"));
    }
    pulled.manifest.bundle.id = bundle_id.value();
    pulled.manifest.bundle.name = bundle_name(pulled.bundle);

    auto entries = bundle_binaries(pulled.bundle);
    if (entries.isErr()) {
        return R::err(entries.error());
    }

    std::map<std::string, ArtifactVersion> versions;
    std::map<std::string, Artifact> artifacts;

    for (const auto& entry : entries.value()) {
        auto binary_result = registry_.get_binary(entry.prn);
        if (binary_result.isErr()) {
            return R::err(binary_result.error().withContext("reading binary " + entry.prn));
        }
        if (!binary_result.value()) {
            return R::err(Error(ErrorCode::NOT_FOUND, "binary " + entry.prn + " does not exist"));
        }
        const Binary binary = *binary_result.value();
        if (!binary.hash || !binary.size) {
            return R::err(Error(ErrorCode::INVALID_INPUT,
                "binary " + binary.prn + " has no recorded hash and size, it cannot be pulled"));
        }

        if (versions.find(binary.artifact_version_prn) == versions.end()) {
            auto version = registry_.get_artifact_version(binary.artifact_version_prn);
            if (version.isErr()) {
                return R::err(version.error().withContext(
                    "reading artifact version " + binary.artifact_version_prn));
            }
            if (!version.value()) {
                return R::err(Error(ErrorCode::NOT_FOUND,
                    "artifact version " + binary.artifact_version_prn + " does not exist"));
            }
            versions[binary.artifact_version_prn] = *version.value();
        }
        const ArtifactVersion& version = versions[binary.artifact_version_prn];

        if (artifacts.find(version.artifact_prn) == artifacts.end()) {
            auto artifact = registry_.get_artifact(version.artifact_prn);
            if (artifact.isErr()) {
                return R::err(artifact.error().withContext(
                    "reading artifact " + version.artifact_prn));
            }
            if (!artifact.value()) {
                return R::err(Error(ErrorCode::NOT_FOUND,
                    "artifact " + version.artifact_prn + " does not exist"));
            }
            artifacts[version.artifact_prn] = *artifact.value();
        }
        const Artifact& artifact = artifacts[version.artifact_prn];

        auto binary_id = resource_id_from_prn(binary.prn);
        auto version_id = resource_id_from_prn(version.prn);
        auto artifact_id = resource_id_from_prn(artifact.prn);
        for (const auto* id : {&binary_id, &version_id, &artifact_id}) {
            if (id->isErr()) return R::err(id->error());
        }

        ManifestItem item;
        item.hash = to_lower_hex(*binary.hash);
        item.size = *binary.size;
        item.binary_id = binary_id.value();
        item.target = binary.target;
        item.artifact_version_id = version_id.value();
        item.artifact_id = artifact_id.value();
        if (entry.custom_metadata.is_object()) {
            item.custom_metadata = entry.custom_metadata;
        }

        ManifestArtifactInfo& artifact_info = pulled.manifest.artifacts[item.artifact_id];
        artifact_info.name = artifact.name;
        artifact_info.description = artifact.description;
        ManifestVersionInfo& version_info = artifact_info.versions[item.artifact_version_id];
        version_info.version = version.version;
        version_info.description = version.description;
        ManifestBinaryInfo& binary_info = version_info.binaries[item.binary_id];
        binary_info.description = binary.description;
        binary_info.signatures.clear();
        for (const auto& sig : binary.signatures) {
            binary_info.signatures.push_back(
                {sig.keyid.empty() ? sig.signing_key_prn : sig.keyid, sig.signature});
        }

        pulled.manifest.bundle.manifest.push_back(std::move(item));
        pulled.binaries.push_back(binary);
    }

    return R::ok(std::move(pulled));
}

Result<PulledBundle> BundlePuller::fetch(const std::string& bundle_prn_value) {
    using R = Result<PulledBundle>;

    auto planned = plan(bundle_prn_value);
    if (planned.isErr()) {
        return R::err(planned.error());
    }

    PulledBundle pulled{planned.value().bundle, planned.value().manifest, {}};
    for (const auto& binary : planned.value().binaries) {
        spdlog::info("downloading {} ({}, {} bytes)", binary.prn, binary.target, *binary.size);
        auto content = download(binary);
        if (content.isErr()) {
            return R::err(content.error());
        }
        pulled.payloads.push_back(std::move(content.value()));
    }
    return R::ok(std::move(pulled));
}

Result<PullReport> BundlePuller::pull(const std::string& bundle_prn_value,
                                      const std::optional<std::string>& output,
                                      Compression compression) {
    using R = Result<PullReport>;

    auto planned = plan(bundle_prn_value);
    if (planned.isErr()) {
        return R::err(planned.error());
    }
    const PlannedBundle& bundle = planned.value();

    PullReport report;
    report.bundle_prn = bundle_prn(bundle.bundle);
    report.output_path = output ? *output : default_output_path(bundle.bundle);

    auto writer = ArchiveWriter::create(report.output_path, compression);
    if (writer.isErr()) {
        return R::err(writer.error());
    }

    std::string manifest_json = serialize_bundle_manifest(bundle.manifest);
    auto added = writer.value()->add(kManifestEntryName,
        std::vector<uint8_t>(manifest_json.begin(), manifest_json.end()));
    if (added.isErr()) {
        return R::err(added.error());
    }

    const auto& items = bundle.manifest.bundle.manifest;
    for (size_t i = 0; i < bundle.binaries.size(); i++) {
        const Binary& binary = bundle.binaries[i];
        spdlog::info("downloading {} ({}, {} bytes)", binary.prn, binary.target, *binary.size);
        auto content = download(binary);
        if (content.isErr()) {
            return R::err(content.error());
        }

        added = writer.value()->add(items[i].target, content.value());
        if (added.isErr()) {
            return R::err(added.error());
        }
        report.binary_count++;
        report.payload_bytes += content.value().size();
    }

    auto committed = writer.value()->commit();
    if (committed.isErr()) {
        return R::err(committed.error());
    }

    spdlog::info("wrote bundle {} to {}", report.bundle_prn, report.output_path);
    return R::ok(std::move(report));
}

} // namespace shipyard

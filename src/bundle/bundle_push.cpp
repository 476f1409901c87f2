#include "shipyard/bundle_push.hpp"
#include "shipyard/binary_processor.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/json_codec.hpp"
#include "shipyard/resource_resolver.hpp"

#include <set>
#include <thread>

#include <spdlog/spdlog.h>

namespace shipyard {

BundlePusher::BundlePusher(Registry& registry, HttpTransport& transport, PushOptions options)
    : registry_(registry),
      transport_(transport),
      options_(std::move(options)),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

Result<PushReport> BundlePusher::push(const std::string& archive_path) {
    using R = Result<PushReport>;

    auto version_ok = validate_api_version(options_.api_version);
    if (version_ok.isErr()) {
        return R::err(version_ok.error());
    }

    auto index = index_archive_file(archive_path);
    if (index.isErr()) {
        return R::err(index.error());
    }
    spdlog::info("read bundle archive {} ({} binaries, {} payloads)", archive_path,
                 index.value().manifest.bundle.manifest.size(), index.value().payloads.size());

    return push_payloads(index.value().manifest, index.value().payloads,
        [&archive_path](const std::vector<bool>& wanted, const PayloadVisitor& visit) {
            return visit_archive_payloads(archive_path, wanted, visit);
        });
}

Result<PushReport> BundlePusher::push(const ParsedArchive& archive) {
    using R = Result<PushReport>;

    auto version_ok = validate_api_version(options_.api_version);
    if (version_ok.isErr()) {
        return R::err(version_ok.error());
    }

    auto infos = describe_payloads(archive.payloads);
    if (infos.isErr()) {
        return R::err(infos.error());
    }

    return push_payloads(archive.manifest, infos.value(),
        [&archive](const std::vector<bool>& wanted, const PayloadVisitor& visit) {
            for (size_t p = 0; p < archive.payloads.size(); p++) {
                if (p >= wanted.size() || !wanted[p]) continue;
                auto visited = visit(p, archive.payloads[p]);
                if (visited.isErr()) return visited;
            }
            return Result<void>::ok();
        });
}

Result<PushReport> BundlePusher::push_payloads(const BundleManifest& manifest,
                                               const std::vector<PayloadInfo>& payloads,
                                               const PayloadSource& source) {
    using R = Result<PushReport>;

    auto matched = match_payloads(manifest, payloads, options_.match_policy);
    if (matched.isErr()) {
        return R::err(matched.error());
    }

    auto user = registry_.get_current_user();
    if (user.isErr()) {
        return R::err(user.error().withContext("reading current user"));
    }
    const std::string organization_prn = user.value().organization_prn;

    ResourceResolver resolver(registry_, options_.retry);
    resolver.set_sleep_function(sleep_);

    PushReport report;

    // ========================================================================
    // Artifacts and versions (best effort)
    // ========================================================================

    std::map<std::string, std::string> version_prns;   // version id -> PRN

    for (const auto& [artifact_id, artifact_info] : manifest.artifacts) {
        GetOrCreateArtifactParams artifact_params;
        artifact_params.organization_prn = organization_prn;
        artifact_params.artifact_id = artifact_id;
        artifact_params.name = artifact_info.name;
        artifact_params.description = artifact_info.description;

        auto artifact = resolver.get_or_create_artifact(artifact_params);
        if (artifact.isErr()) {
            spdlog::warn("skipping artifact '{}': {}", artifact_info.name,
                         artifact.error().message());
            report.skipped_artifacts.push_back(artifact_id);
            continue;
        }

        for (const auto& [version_id, version_info] : artifact_info.versions) {
            GetOrCreateArtifactVersionParams version_params;
            version_params.organization_prn = organization_prn;
            version_params.artifact_prn = artifact.value().prn;
            version_params.version_id = version_id;
            version_params.version = version_info.version;
            version_params.description = version_info.description;

            auto version = resolver.get_or_create_artifact_version(version_params);
            if (version.isErr()) {
                spdlog::warn("skipping version '{}' of artifact '{}': {}", version_info.version,
                             artifact_info.name, version.error().message());
                report.skipped_versions.push_back(version_id);
                continue;
            }
            version_prns[version_id] = version.value().prn;
        }
    }

    // ========================================================================
    // Binaries (required)
    // ========================================================================

    const auto& items = manifest.bundle.manifest;

    // Every binary needs its version before any content is read
    for (const auto& match : matched.value()) {
        const ManifestItem& item = items[match.manifest_index];
        if (version_prns.find(item.artifact_version_id) == version_prns.end()) {
            return R::err(Error(ErrorCode::REGISTRY_ERROR,
                "binary " + item.binary_id + " (target '" + item.target +
                "') cannot be pushed because its artifact version " + item.artifact_version_id +
                " was not resolved"));
        }
    }

    // payload index -> position in matched
    std::map<size_t, size_t> match_of_payload;
    std::vector<bool> wanted(payloads.size(), false);
    for (size_t m = 0; m < matched.value().size(); m++) {
        match_of_payload[matched.value()[m].payload_index] = m;
        wanted[matched.value()[m].payload_index] = true;
    }

    std::vector<std::string> binary_prns(matched.value().size());

    auto process_payload = [&](size_t payload_index, const ArchivePayload& payload) -> Result<void> {
        const size_t m = match_of_payload.at(payload_index);
        const MatchedPayload& match = matched.value()[m];
        const ManifestItem& item = items[match.manifest_index];
        const std::vector<uint8_t>& content = payload.data;

        HashResult hash = compute_sha256(content);
        if (!hash.ok) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR,
                "hashing payload " + payload.name + ": " + hash.error));
        }
        if (hash.hex_digest != match.content_hash) {
            return Result<void>::err(Error(ErrorCode::ARCHIVE_INVALID,
                "payload " + payload.name + " changed while the archive was being pushed"));
        }

        const ManifestBinaryInfo* binary_info = manifest.find_binary(item);

        GetOrCreateBinaryParams binary_params;
        binary_params.artifact_version_prn = version_prns.at(item.artifact_version_id);
        binary_params.target = item.target;
        binary_params.hash = match.content_hash;
        binary_params.size = content.size();
        binary_params.id = item.binary_id;
        if (binary_info) binary_params.description = binary_info->description;
        if (has_custom_metadata(item.custom_metadata)) {
            binary_params.custom_metadata = item.custom_metadata;
        }

        auto binary = resolver.get_or_create_binary(binary_params);
        if (binary.isErr()) {
            return Result<void>::err(binary.error().withContext("binary " + item.binary_id));
        }
        if (binary.value().state == BinaryState::Destroyed ||
            binary.value().state == BinaryState::Unknown) {
            return Result<void>::err(Error(ErrorCode::INTEGRITY_CONFLICT,
                "binary " + binary.value().prn + " for target '" + item.target + "' is " +
                (binary.value().state_text.empty()
                     ? binary_state_to_string(binary.value().state)
                     : binary.value().state_text) +
                " and cannot be included in a bundle"));
        }

        std::vector<SignatureConfig> signatures;
        if (binary_info) {
            for (const auto& sig : binary_info->signatures) {
                signatures.push_back(SignatureConfig::pre_computed(sig.keyid, sig.sig));
            }
        }

        ProcessorConfig processor_config = options_.processor;
        processor_config.content_hash = match.content_hash;

        BinaryProcessor processor(registry_, transport_, processor_config, std::move(signatures),
                                  {}, options_.observer);
        processor.set_sleep_function(sleep_);

        auto processed = processor.process(binary.value(), &content);
        if (processed.isErr()) {
            return Result<void>::err(processed.error().withContext(
                "binary " + item.binary_id + " (target '" + item.target + "')"));
        }

        spdlog::info("binary {} ({}) is {}", processed.value().prn, item.target,
                     binary_state_to_string(processed.value().state));
        report.binary_prns[item.binary_id] = processed.value().prn;
        binary_prns[m] = processed.value().prn;
        return Result<void>::ok();
    };

    auto visited = source(wanted, process_payload);
    if (visited.isErr()) {
        return R::err(visited.error());
    }
    for (size_t m = 0; m < binary_prns.size(); m++) {
        if (binary_prns[m].empty()) {
            const ManifestItem& item = items[matched.value()[m].manifest_index];
            return R::err(Error(ErrorCode::ARCHIVE_INVALID,
                "payload for binary " + item.binary_id + " disappeared from the archive"));
        }
    }

    // ========================================================================
    // Bundle
    // ========================================================================

    CreateBundleParams bundle_params;
    bundle_params.api_version = options_.api_version;
    if (!manifest.bundle.id.empty()) bundle_params.id = manifest.bundle.id;
    bundle_params.name = manifest.bundle.name;

    if (options_.api_version == 1) {
        std::set<std::string> seen;
        for (const auto& match : matched.value()) {
            const std::string& prn = version_prns[items[match.manifest_index].artifact_version_id];
            if (seen.insert(prn).second) {
                bundle_params.artifact_version_prns.push_back(prn);
            }
        }
    } else {
        for (size_t i = 0; i < binary_prns.size(); i++) {
            const ManifestItem& item = items[matched.value()[i].manifest_index];
            BundleBinary entry;
            entry.prn = binary_prns[i];
            if (has_custom_metadata(item.custom_metadata)) {
                entry.custom_metadata = item.custom_metadata;
            }
            bundle_params.binaries.push_back(std::move(entry));
        }
    }

    auto bundle = registry_.create_bundle(bundle_params);
    if (bundle.isErr()) {
        return R::err(bundle.error().withContext("creating bundle"));
    }

    report.bundle_prn = bundle_prn(bundle.value());
    spdlog::info("created bundle {} with {} binaries", report.bundle_prn, binary_prns.size());
    return R::ok(std::move(report));
}

} // namespace shipyard

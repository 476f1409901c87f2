#include "shipyard/signature_orchestrator.hpp"
#include "shipyard/signer.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace shipyard {

SignatureConfig SignatureConfig::pre_computed(std::string keyid, std::string signature) {
    SignatureConfig config;
    config.source = SignatureSource::PreComputed;
    config.keyid = std::move(keyid);
    config.signature = std::move(signature);
    return config;
}

SignatureConfig SignatureConfig::key_pair(std::string name) {
    SignatureConfig config;
    config.source = SignatureSource::KeyPair;
    config.keyid = name;
    config.key_pair_name = std::move(name);
    return config;
}

SignatureConfig SignatureConfig::private_key(std::string signing_key_prn, std::string path) {
    SignatureConfig config;
    config.source = SignatureSource::PrivateKey;
    config.keyid = std::move(signing_key_prn);
    config.private_key_path = std::move(path);
    return config;
}

SignatureOrchestrator::SignatureOrchestrator(Registry& registry, SigningKeyPairs key_pairs,
                                             std::optional<std::string> content_hash)
    : registry_(registry),
      key_pairs_(std::move(key_pairs)),
      content_hash_(std::move(content_hash)) {}

Result<SignatureOrchestrator::ResolvedKey>
SignatureOrchestrator::resolve_key(const SignatureConfig& config) const {
    using R = Result<ResolvedKey>;

    switch (config.source) {
        case SignatureSource::KeyPair: {
            auto it = key_pairs_.find(config.key_pair_name);
            if (it == key_pairs_.end()) {
                return R::err(Error(ErrorCode::INVALID_INPUT,
                    "signing key pair '" + config.key_pair_name + "' is not configured"));
            }
            ResolvedKey key;
            key.key_id = it->second.signing_key_prn.empty() ? config.keyid
                                                            : it->second.signing_key_prn;
            key.private_key_path = it->second.signing_key_private_path;
            return R::ok(std::move(key));
        }
        case SignatureSource::PrivateKey: {
            if (config.private_key_path.empty()) {
                return R::err(Error(ErrorCode::INVALID_INPUT,
                    "no private key path for signing key " + config.keyid));
            }
            return R::ok(ResolvedKey{config.keyid, config.private_key_path});
        }
        default:
            return R::ok(ResolvedKey{config.keyid, ""});
    }
}

// key_id is set to the resolved identifier even when signing fails, so
// failures are reported under the name the registry knows
Result<void> SignatureOrchestrator::sign_one(const Binary& binary, const SignatureConfig& config,
                                             std::string& key_id) {
    key_id = config.keyid;

    auto key = resolve_key(config);
    if (key.isErr()) {
        return Result<void>::err(key.error());
    }
    key_id = key.value().key_id;

    if (binary.has_signature_for(key_id)) {
        spdlog::debug("binary {} already signed by {}", binary.prn, key_id);
        return Result<void>::ok();
    }

    CreateBinarySignatureParams params;
    params.binary_prn = binary.prn;

    if (config.needs_computation()) {
        std::optional<std::string> hash = content_hash_ ? content_hash_ : binary.hash;
        if (!hash || hash->empty()) {
            return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
                "no content hash available to sign for " + binary.prn));
        }

        auto signature = sign_content_hash_with_key_file(key.value().private_key_path, *hash);
        if (signature.isErr()) {
            return Result<void>::err(signature.error());
        }
        params.signature = signature.value();
        params.signing_key_prn = key_id;
    } else {
        if (config.signature.empty()) {
            return Result<void>::err(Error(ErrorCode::INVALID_INPUT,
                "pre-computed signature for " + key_id + " is empty"));
        }
        params.signature = config.signature;
        params.signing_key_keyid = key_id;
    }

    auto created = registry_.create_binary_signature(params);
    if (created.isErr()) {
        // Signatures are unique per binary and key
        if (created.error().code() == ErrorCode::CONFLICT) {
            spdlog::debug("binary {} already has a signature for {}", binary.prn, key_id);
            return Result<void>::ok();
        }
        return Result<void>::err(created.error());
    }
    spdlog::info("signed binary {} with {}", binary.prn, key_id);
    return Result<void>::ok();
}

Result<Binary> SignatureOrchestrator::sign(const Binary& binary,
                                           const std::vector<SignatureConfig>& configs) {
    using R = Result<Binary>;

    if (configs.empty()) {
        return R::ok(binary);
    }

    // The binary record may not embed its signatures, so ask for them
    Binary current = binary;
    auto existing = registry_.list_binary_signatures(binary.prn);
    if (existing.isErr()) {
        return R::err(existing.error().withContext("listing signatures of " + binary.prn));
    }
    for (auto& sig : existing.value()) {
        current.signatures.push_back(std::move(sig));
    }

    std::vector<std::pair<std::string, std::string>> failures;
    for (const auto& config : configs) {
        std::string key_id;
        auto result = sign_one(current, config, key_id);
        if (result.isErr()) {
            spdlog::warn("signing {} with {} failed: {}", binary.prn, key_id,
                         result.error().message());
            failures.emplace_back(key_id, result.error().message());
        }
    }

    if (!failures.empty()) {
        std::string ids;
        std::string details;
        for (const auto& [key_id, message] : failures) {
            if (!ids.empty()) ids += ", ";
            ids += key_id;
            details += "; " + key_id + ": " + message;
        }
        return R::err(Error(ErrorCode::SIGNATURE_FAILED,
            "failed to create signatures for binary " + binary.prn +
            " (failed keyids: " + ids + ")" + details));
    }

    if (binary.state == BinaryState::Signed) {
        return R::ok(binary);
    }

    if (!transition_allowed(binary.state, BinaryState::Signed)) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            "cannot mark binary " + binary.prn + " signed from state " +
            binary_state_to_string(binary.state)));
    }

    UpdateBinaryParams update;
    update.prn = binary.prn;
    update.state = BinaryState::Signed;
    auto updated = registry_.update_binary(update);
    if (updated.isErr()) {
        return R::err(updated.error().withContext("marking " + binary.prn + " signed"));
    }
    return updated;
}

} // namespace shipyard

#pragma once

#include "shipyard/config.hpp"
#include "shipyard/registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shipyard {

// ============================================================================
// Signature Configuration
// ============================================================================

enum class SignatureSource {
    PreComputed,   // signature supplied by the caller (bundle archives)
    KeyPair,       // named signing key pair from the config file
    PrivateKey,    // signing key PRN plus a private key path
};

struct SignatureConfig {
    SignatureSource source = SignatureSource::PreComputed;
    std::string keyid;              // key identifier, or signing key PRN
    std::string signature;          // PreComputed only
    std::string key_pair_name;      // KeyPair only
    std::string private_key_path;   // PrivateKey only

    static SignatureConfig pre_computed(std::string keyid, std::string signature);
    static SignatureConfig key_pair(std::string name);
    static SignatureConfig private_key(std::string signing_key_prn, std::string path);

    bool needs_computation() const { return source != SignatureSource::PreComputed; }
};

/**
 * Turns signature configurations into registry signatures.
 *
 * Each configuration is checked against the binary's existing signatures,
 * as listed by the registry, and a CONFLICT on creation counts as already
 * signed, so re-running sign() never fails on a signature it made. Failures are
 * collected across all configurations and reported together; the binary
 * is only moved to signed when every configuration is satisfied.
 */
class SignatureOrchestrator {
public:
    SignatureOrchestrator(Registry& registry, SigningKeyPairs key_pairs,
                          std::optional<std::string> content_hash = std::nullopt);

    Result<Binary> sign(const Binary& binary, const std::vector<SignatureConfig>& configs);

private:
    struct ResolvedKey {
        std::string key_id;
        std::string private_key_path;
    };

    Result<ResolvedKey> resolve_key(const SignatureConfig& config) const;
    Result<void> sign_one(const Binary& binary, const SignatureConfig& config,
                          std::string& key_id);

    Registry& registry_;
    SigningKeyPairs key_pairs_;
    std::optional<std::string> content_hash_;
};

} // namespace shipyard

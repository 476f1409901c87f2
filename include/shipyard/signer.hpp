#pragma once

#include "shipyard/result.hpp"

#include <string>

namespace shipyard {

// ============================================================================
// Ed25519 Content Signatures
//
// The signed message is the ASCII upper-case hex form of the content's
// SHA-256; signatures are exchanged as upper-case hex.
// ============================================================================

// Signs hex_hash with a PEM (PKCS#8) Ed25519 private key
Result<std::string> sign_content_hash(const std::string& private_key_pem,
                                      const std::string& hex_hash);

// Reads the key file, then signs
Result<std::string> sign_content_hash_with_key_file(const std::string& private_key_path,
                                                    const std::string& hex_hash);

// Checks a signature produced by sign_content_hash against a PEM public key
Result<bool> verify_content_hash_signature(const std::string& public_key_pem,
                                           const std::string& hex_hash,
                                           const std::string& signature_hex);

} // namespace shipyard

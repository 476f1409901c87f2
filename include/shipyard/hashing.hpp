#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace shipyard {

// ============================================================================
// SHA-256 Content Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;          // lowercase hex
    std::vector<uint8_t> digest;     // raw 32 bytes
};

HashResult compute_sha256(const uint8_t* data, size_t len);
HashResult compute_sha256(const std::vector<uint8_t>& data);

// Streams the file in fixed-size blocks
HashResult compute_sha256_file(const std::string& file_path);

/**
 * Incremental SHA-256 over a sequence of buffers.
 *
 * Produces the same digest as compute_sha256 over the concatenation
 * of every buffer passed to update().
 */
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    bool update(const uint8_t* data, size_t len);
    HashResult finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string error_;
};

// ============================================================================
// Encodings
// ============================================================================

std::string bytes_to_hex(const uint8_t* data, size_t len);
std::string bytes_to_hex_upper(const uint8_t* data, size_t len);

// Accepts either case; fails on odd length or non-hex characters
bool hex_to_bytes(const std::string& hex, std::vector<uint8_t>& out);

std::string to_upper_hex(const std::string& hex);
std::string to_lower_hex(const std::string& hex);

std::string base64_encode(const std::vector<uint8_t>& data);

} // namespace shipyard

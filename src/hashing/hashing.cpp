#include "shipyard/hashing.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/evp.h>

namespace shipyard {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string encode_hex(const uint8_t* data, size_t len, const char* alphabet) {
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(alphabet[(data[i] >> 4) & 0x0F]);
        result.push_back(alphabet[data[i] & 0x0F]);
    }
    return result;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

struct Sha256Hasher::Impl {
    EvpMdCtx ctx;
    bool initialized = false;
};

Sha256Hasher::Sha256Hasher() : impl_(std::make_unique<Impl>()) {
    if (!impl_->ctx) {
        error_ = "EVP_MD_CTX_new failed";
        return;
    }
    if (EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        error_ = "EVP_DigestInit_ex failed";
        return;
    }
    impl_->initialized = true;
}

Sha256Hasher::~Sha256Hasher() = default;

bool Sha256Hasher::update(const uint8_t* data, size_t len) {
    if (!impl_->initialized) return false;
    if (len == 0) return true;
    if (EVP_DigestUpdate(impl_->ctx.get(), data, len) != 1) {
        error_ = "EVP_DigestUpdate failed";
        impl_->initialized = false;
        return false;
    }
    return true;
}

HashResult Sha256Hasher::finish() {
    HashResult result;
    if (!impl_->initialized) {
        result.error = error_.empty() ? "hasher already finished" : error_;
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(impl_->ctx.get(), hash, &hash_len) != 1) {
        impl_->initialized = false;
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }
    impl_->initialized = false;

    result.digest.assign(hash, hash + hash_len);
    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

HashResult compute_sha256(const uint8_t* data, size_t len) {
    // A failed update leaves the hasher finished, so finish() reports it
    Sha256Hasher hasher;
    hasher.update(data, len);
    return hasher.finish();
}

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    return compute_sha256(data.data(), data.size());
}

HashResult compute_sha256_file(const std::string& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        HashResult result;
        result.error = "failed to open file: " + file_path;
        return result;
    }

    Sha256Hasher hasher;
    char buffer[65536];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (!hasher.update(reinterpret_cast<const uint8_t*>(buffer),
                           static_cast<size_t>(file.gcount()))) {
            break;
        }
    }

    if (file.bad()) {
        HashResult result;
        result.error = "failed to read file: " + file_path;
        return result;
    }
    return hasher.finish();
}

// ============================================================================
// Encodings
// ============================================================================

std::string bytes_to_hex(const uint8_t* data, size_t len) {
    return encode_hex(data, len, "0123456789abcdef");
}

std::string bytes_to_hex_upper(const uint8_t* data, size_t len) {
    return encode_hex(data, len, "0123456789ABCDEF");
}

bool hex_to_bytes(const std::string& hex, std::vector<uint8_t>& out) {
    if (hex.size() % 2 != 0) return false;

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) return false;
        bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    out = std::move(bytes);
    return true;
}

std::string to_upper_hex(const std::string& hex) {
    std::string result = hex;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower_hex(const std::string& hex) {
    std::string result = hex;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";

    // 4 output chars per 3 input bytes, plus NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

} // namespace shipyard

#include "shipyard/signer.hpp"
#include "shipyard/hashing.hpp"
#include "shipyard/platform.hpp"

#include <vector>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace shipyard {

namespace {

class EvpPkey {
public:
    explicit EvpPkey(EVP_PKEY* key) : key_(key) {}
    ~EvpPkey() { if (key_) EVP_PKEY_free(key_); }

    EvpPkey(const EvpPkey&) = delete;
    EvpPkey& operator=(const EvpPkey&) = delete;

    EVP_PKEY* get() { return key_; }
    explicit operator bool() const { return key_ != nullptr; }

private:
    EVP_PKEY* key_;
};

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

class MemBio {
public:
    explicit MemBio(const std::string& data)
        : bio_(BIO_new_mem_buf(data.data(), static_cast<int>(data.size()))) {}
    ~MemBio() { if (bio_) BIO_free(bio_); }

    MemBio(const MemBio&) = delete;
    MemBio& operator=(const MemBio&) = delete;

    BIO* get() { return bio_; }
    explicit operator bool() const { return bio_ != nullptr; }

private:
    BIO* bio_;
};

std::string openssl_error(const std::string& what) {
    unsigned long code = ERR_get_error();
    if (code == 0) return what;
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return what + ": " + buf;
}

Result<std::string> check_hash(const std::string& hex_hash) {
    std::vector<uint8_t> digest;
    if (hex_hash.size() != 64 || !hex_to_bytes(hex_hash, digest)) {
        return Result<std::string>::err(Error(ErrorCode::INVALID_INPUT,
            "content hash must be 64 hex characters: '" + hex_hash + "'"));
    }
    return Result<std::string>::ok(to_upper_hex(hex_hash));
}

} // namespace

Result<std::string> sign_content_hash(const std::string& private_key_pem,
                                      const std::string& hex_hash) {
    using R = Result<std::string>;

    auto message = check_hash(hex_hash);
    if (message.isErr()) return message;

    MemBio bio(private_key_pem);
    if (!bio) {
        return R::err(Error(ErrorCode::INVALID_INPUT, openssl_error("BIO_new_mem_buf failed")));
    }

    EvpPkey key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            openssl_error("failed to parse PEM private key")));
    }
    if (EVP_PKEY_id(key.get()) != EVP_PKEY_ED25519) {
        return R::err(Error(ErrorCode::INVALID_INPUT, "private key is not an Ed25519 key"));
    }

    EvpMdCtx ctx;
    if (!ctx) {
        return R::err(Error(ErrorCode::INVALID_INPUT, "EVP_MD_CTX_new failed"));
    }

    // Ed25519 signs the message directly, so no digest is configured
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return R::err(Error(ErrorCode::INVALID_INPUT, openssl_error("EVP_DigestSignInit failed")));
    }

    const auto& text = message.value();
    const auto* msg = reinterpret_cast<const unsigned char*>(text.data());

    size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, msg, text.size()) != 1) {
        return R::err(Error(ErrorCode::INVALID_INPUT, openssl_error("EVP_DigestSign failed")));
    }

    std::vector<uint8_t> sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, msg, text.size()) != 1) {
        return R::err(Error(ErrorCode::INVALID_INPUT, openssl_error("EVP_DigestSign failed")));
    }
    sig.resize(sig_len);

    return R::ok(bytes_to_hex_upper(sig.data(), sig.size()));
}

Result<std::string> sign_content_hash_with_key_file(const std::string& private_key_path,
                                                    const std::string& hex_hash) {
    auto pem = read_file_text(private_key_path);
    if (pem.isErr()) {
        return Result<std::string>::err(pem.error().withContext("reading signing key"));
    }
    auto signature = sign_content_hash(pem.value(), hex_hash);
    if (signature.isErr()) {
        return Result<std::string>::err(signature.error().withContext(private_key_path));
    }
    return signature;
}

Result<bool> verify_content_hash_signature(const std::string& public_key_pem,
                                           const std::string& hex_hash,
                                           const std::string& signature_hex) {
    using R = Result<bool>;

    auto message = check_hash(hex_hash);
    if (message.isErr()) return R::err(message.error());

    std::vector<uint8_t> sig;
    if (!hex_to_bytes(signature_hex, sig)) {
        return R::err(Error(ErrorCode::INVALID_INPUT, "signature is not valid hex"));
    }

    MemBio bio(public_key_pem);
    if (!bio) {
        return R::err(Error(ErrorCode::INVALID_INPUT, openssl_error("BIO_new_mem_buf failed")));
    }

    EvpPkey key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            openssl_error("failed to parse PEM public key")));
    }

    EvpMdCtx ctx;
    if (!ctx) {
        return R::err(Error(ErrorCode::INVALID_INPUT, "EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return R::err(Error(ErrorCode::INVALID_INPUT,
            openssl_error("EVP_DigestVerifyInit failed")));
    }

    const auto& text = message.value();
    int rc = EVP_DigestVerify(ctx.get(), sig.data(), sig.size(),
                              reinterpret_cast<const unsigned char*>(text.data()), text.size());
    ERR_clear_error();
    return R::ok(rc == 1);
}

} // namespace shipyard

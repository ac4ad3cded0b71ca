#include "tokenkeys/keygen.hpp"

#include <memory>
#include <vector>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>

namespace tokenkeys {

// ============================================================================
// OpenSSL helpers
// ============================================================================

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct BioDeleter {
    void operator()(BIO* p) const { BIO_free(p); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

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

// Drain the thread's OpenSSL error queue into one message
std::string openssl_errors(const std::string& what) {
    std::string message = what;
    unsigned long code = 0;
    bool first = true;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += first ? ": " : "; ";
        message += buf;
        first = false;
    }
    return message;
}

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<size_t>(len));
}

BioPtr bio_from_string(const std::string& s) {
    return BioPtr(BIO_new_mem_buf(s.data(), static_cast<int>(s.size())));
}

Error generation_error(KeyType type, const std::string& message) {
    Error err(ErrorCode::KEY_GENERATION, message);
    err.withContext(std::string(key_type_to_string(type)) + " key generation failed");
    return err;
}

Error validation_error(const std::string& message) {
    return Error(ErrorCode::KEY_VALIDATION, "key validation failed: " + message);
}

Result<PkeyPtr> generate_rsa(int modulus_bits) {
    if (modulus_bits <= 0) {
        return Result<PkeyPtr>::err(Error(ErrorCode::KEY_GENERATION,
                                          "invalid modulus length " + std::to_string(modulus_bits)));
    }

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
    if (!ctx) {
        return Result<PkeyPtr>::err(Error(ErrorCode::KEY_GENERATION,
                                          openssl_errors("EVP_PKEY_CTX_new_id failed")));
    }

    if (EVP_PKEY_keygen_init(ctx.get()) <= 0) {
        return Result<PkeyPtr>::err(Error(ErrorCode::KEY_GENERATION,
                                          openssl_errors("EVP_PKEY_keygen_init failed")));
    }

    if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), modulus_bits) <= 0) {
        return Result<PkeyPtr>::err(Error(ErrorCode::KEY_GENERATION,
                                          openssl_errors("unsupported modulus length " +
                                                         std::to_string(modulus_bits))));
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) <= 0 || raw == nullptr) {
        return Result<PkeyPtr>::err(Error(ErrorCode::KEY_GENERATION,
                                          openssl_errors("EVP_PKEY_keygen failed")));
    }

    return Result<PkeyPtr>::ok(PkeyPtr(raw));
}

} // namespace

// ============================================================================
// Passphrase
// ============================================================================

Result<std::string> generate_passphrase() {
    std::vector<unsigned char> bytes(kPassphraseBytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        return Result<std::string>::err(Error(ErrorCode::KEY_GENERATION,
                                              openssl_errors("RAND_bytes failed")));
    }

    std::string passphrase = bytes_to_hex(bytes.data(), bytes.size());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return Result<std::string>::ok(std::move(passphrase));
}

// ============================================================================
// Generation
// ============================================================================

Result<KeyPair> generate_key_pair(KeyType type, int modulus_bits) {
    return generate_key_pair(type, modulus_bits, validate_key_pair);
}

Result<KeyPair> generate_key_pair(KeyType type, int modulus_bits,
                                  const KeyPairValidator& validate) {
    auto passphrase = generate_passphrase();
    if (passphrase.isErr()) {
        return Result<KeyPair>::err(generation_error(type, passphrase.error().message()));
    }

    auto pkey = generate_rsa(modulus_bits);
    if (pkey.isErr()) {
        return Result<KeyPair>::err(generation_error(type, pkey.error().message()));
    }

    KeyPair pair;
    pair.passphrase = std::move(passphrase.value());

    BioPtr pub_bio(BIO_new(BIO_s_mem()));
    if (!pub_bio || PEM_write_bio_PUBKEY(pub_bio.get(), pkey.value().get()) != 1) {
        return Result<KeyPair>::err(generation_error(
            type, openssl_errors("failed to encode public key")));
    }
    pair.public_key = bio_to_string(pub_bio.get());

    BioPtr priv_bio(BIO_new(BIO_s_mem()));
    if (!priv_bio ||
        PEM_write_bio_PKCS8PrivateKey(priv_bio.get(), pkey.value().get(), EVP_aes_256_cbc(),
                                      pair.passphrase.data(),
                                      static_cast<int>(pair.passphrase.size()),
                                      nullptr, nullptr) != 1) {
        return Result<KeyPair>::err(generation_error(
            type, openssl_errors("failed to encode encrypted private key")));
    }
    pair.private_key = bio_to_string(priv_bio.get());

    if (pair.public_key.empty() || pair.private_key.empty()) {
        return Result<KeyPair>::err(generation_error(type, "PEM encoding produced no output"));
    }

    auto valid = validate(pair);
    if (valid.isErr()) {
        Error err(ErrorCode::KEY_VALIDATION, valid.error().message());
        err.withContext(key_type_to_string(type));
        return Result<KeyPair>::err(err);
    }

    return Result<KeyPair>::ok(std::move(pair));
}

// ============================================================================
// Validation
// ============================================================================

Status validate_key_pair(const KeyPair& pair) {
    // Start from a clean error queue so messages only describe this check
    ERR_clear_error();

    BioPtr priv_bio = bio_from_string(pair.private_key);
    if (!priv_bio) {
        return Status::err(validation_error(openssl_errors("BIO_new_mem_buf failed")));
    }

    // With a null callback, the user pointer is taken as the passphrase
    PkeyPtr private_key(PEM_read_bio_PrivateKey(
        priv_bio.get(), nullptr, nullptr, const_cast<char*>(pair.passphrase.c_str())));
    if (!private_key) {
        return Status::err(validation_error(openssl_errors("cannot decrypt private key")));
    }

    BioPtr pub_bio = bio_from_string(pair.public_key);
    if (!pub_bio) {
        return Status::err(validation_error(openssl_errors("BIO_new_mem_buf failed")));
    }

    PkeyPtr public_key(PEM_read_bio_PUBKEY(pub_bio.get(), nullptr, nullptr, nullptr));
    if (!public_key) {
        return Status::err(validation_error(openssl_errors("cannot parse public key")));
    }

    std::vector<unsigned char> message(kValidationMessageBytes);
    if (RAND_bytes(message.data(), static_cast<int>(message.size())) != 1) {
        return Status::err(validation_error(openssl_errors("RAND_bytes failed")));
    }

    // Sign
    EvpMdCtx sign_ctx;
    if (!sign_ctx) {
        return Status::err(validation_error("EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestSignInit(sign_ctx.get(), nullptr, EVP_sha256(), nullptr,
                           private_key.get()) != 1) {
        return Status::err(validation_error(openssl_errors("EVP_DigestSignInit failed")));
    }

    size_t sig_len = 0;
    if (EVP_DigestSign(sign_ctx.get(), nullptr, &sig_len,
                       message.data(), message.size()) != 1) {
        return Status::err(validation_error(openssl_errors("EVP_DigestSign failed")));
    }
    std::vector<unsigned char> signature(sig_len);
    if (EVP_DigestSign(sign_ctx.get(), signature.data(), &sig_len,
                       message.data(), message.size()) != 1) {
        return Status::err(validation_error(openssl_errors("EVP_DigestSign failed")));
    }
    signature.resize(sig_len);

    // Verify
    EvpMdCtx verify_ctx;
    if (!verify_ctx) {
        return Status::err(validation_error("EVP_MD_CTX_new failed"));
    }
    if (EVP_DigestVerifyInit(verify_ctx.get(), nullptr, EVP_sha256(), nullptr,
                             public_key.get()) != 1) {
        return Status::err(validation_error(openssl_errors("EVP_DigestVerifyInit failed")));
    }

    int verified = EVP_DigestVerify(verify_ctx.get(), signature.data(), signature.size(),
                                    message.data(), message.size());
    if (verified != 1) {
        return Status::err(validation_error(
            verified == 0 ? "signature does not verify against public key"
                          : openssl_errors("EVP_DigestVerify failed")));
    }

    return Status::ok();
}

bool is_pem_block(const std::string& text, const std::string& label) {
    const std::string begin = "-----BEGIN " + label + "-----";
    const std::string end = "-----END " + label + "-----";

    if (text.compare(0, begin.size(), begin) != 0) {
        return false;
    }

    auto end_pos = text.find(end, begin.size());
    if (end_pos == std::string::npos) {
        return false;
    }

    // Only trailing whitespace may follow the END line
    for (size_t i = end_pos + end.size(); i < text.size(); ++i) {
        if (text[i] != '\n' && text[i] != '\r') {
            return false;
        }
    }

    // Body must not contain a second block
    return text.find("-----BEGIN", begin.size()) == std::string::npos;
}

} // namespace tokenkeys

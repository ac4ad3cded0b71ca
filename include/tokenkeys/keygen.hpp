#pragma once

#include "tokenkeys/types.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace tokenkeys {

// ============================================================================
// Key Pair Generation (OpenSSL EVP)
// ============================================================================

// Bytes of CSPRNG output behind each passphrase (256 bits)
constexpr std::size_t kPassphraseBytes = 32;

// Bytes of random test message signed during validation
constexpr std::size_t kValidationMessageBytes = 32;

constexpr const char* kPublicKeyPemLabel = "PUBLIC KEY";
constexpr const char* kEncryptedPrivateKeyPemLabel = "ENCRYPTED PRIVATE KEY";

// Random passphrase: kPassphraseBytes of OpenSSL RAND output, lowercase hex.
// Fails with KEY_GENERATION if the CSPRNG is unavailable.
Result<std::string> generate_passphrase();

/**
 * Generate one validated RSA key pair.
 *
 * The public key is SPKI PEM. The private key is PKCS#8 PEM encrypted with
 * PBES2 (PBKDF2-HMAC-SHA256, AES-256-CBC) under a fresh passphrase. Before
 * returning, the pair is checked with validate_key_pair().
 *
 * Errors:
 * - KEY_GENERATION: passphrase, RSA generation or PEM encoding failed
 * - KEY_VALIDATION: the generated pair did not pass the sign/verify check
 */
Result<KeyPair> generate_key_pair(KeyType type, int modulus_bits);

// Check run on each freshly encoded pair before it is returned
using KeyPairValidator = std::function<Status(const KeyPair&)>;

// As above, with the check supplied by the caller. A failing check is
// reported as KEY_VALIDATION and no pair is returned.
Result<KeyPair> generate_key_pair(KeyType type, int modulus_bits,
                                  const KeyPairValidator& validate);

/**
 * Prove a pair is usable: decrypt the private key with the passphrase, sign
 * a fresh random message with RSA/SHA-256 and verify it with the public key.
 * Any failure along the way is KEY_VALIDATION.
 */
Status validate_key_pair(const KeyPair& pair);

// True if text is a single PEM block with the given label
// ("-----BEGIN <label>-----" ... "-----END <label>-----")
bool is_pem_block(const std::string& text, const std::string& label);

} // namespace tokenkeys

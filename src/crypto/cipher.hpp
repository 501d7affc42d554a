#pragma once

#include "crypto/keys.hpp"
#include "core/envelope.hpp"
#include "core/result.hpp"
#include <span>
#include <string>
#include <vector>

namespace vellum::crypto {

/**
 * Plaintext metadata bound into the authentication tag.
 */
struct EnvelopeHeader {
    std::string id;
    Timestamp modified_at;
};

/**
 * Associated data for an envelope: a domain label, the length-prefixed
 * id and the big-endian timestamp.
 */
[[nodiscard]] std::vector<uint8_t> associated_data(const EnvelopeHeader& header);

/**
 * CipherEngine - XChaCha20-Poly1305 (IETF) with a detached tag.
 *
 * Holds the session key for its lifetime. Every encrypt() draws a fresh
 * random 192-bit nonce, which makes nonce reuse under one key negligible.
 * Ciphertext length equals plaintext length. Error messages name the
 * envelope id only.
 */
class CipherEngine {
public:
    explicit CipherEngine(const EncryptionKey& key) : key_(key) {}

    /**
     * Encrypt `plaintext` for `header`. Fails with Internal only if
     * libsodium refuses the operation.
     */
    [[nodiscard]] Result<EncryptedEnvelope, Error> encrypt(
        const EnvelopeHeader& header,
        std::span<const uint8_t> plaintext) const;

    /**
     * Verify and decrypt. Any tag mismatch, malformed nonce/tag, altered
     * id or timestamp, or wrong key yields Authentication; tombstones
     * yield Format. Never returns partial plaintext.
     */
    [[nodiscard]] Result<SecretBytes, Error> decrypt(const EncryptedEnvelope& envelope) const;

private:
    EncryptionKey key_;
};

} // namespace vellum::crypto

#include "crypto/cipher.hpp"

#include <string_view>

namespace vellum::crypto {

namespace {
constexpr std::string_view AAD_LABEL = "vellum.note.v1";
} // namespace

std::vector<uint8_t> associated_data(const EnvelopeHeader& header) {
    std::vector<uint8_t> ad;
    ad.reserve(AAD_LABEL.size() + 4 + header.id.size() + 8);
    ad.insert(ad.end(), AAD_LABEL.begin(), AAD_LABEL.end());

    const auto id_len = static_cast<uint32_t>(header.id.size());
    for (int shift = 24; shift >= 0; shift -= 8) {
        ad.push_back(static_cast<uint8_t>((id_len >> shift) & 0xFF));
    }
    ad.insert(ad.end(), header.id.begin(), header.id.end());

    const auto millis = static_cast<uint64_t>(header.modified_at.millis());
    for (int shift = 56; shift >= 0; shift -= 8) {
        ad.push_back(static_cast<uint8_t>((millis >> shift) & 0xFF));
    }
    return ad;
}

Result<EncryptedEnvelope, Error> CipherEngine::encrypt(
    const EnvelopeHeader& header,
    std::span<const uint8_t> plaintext
) const {
    EncryptedEnvelope envelope{
        .id = header.id,
        .ciphertext = std::vector<uint8_t>(plaintext.size()),
        .nonce = std::vector<uint8_t>(NONCE_SIZE),
        .tag = std::vector<uint8_t>(TAG_SIZE),
        .modified_at = header.modified_at,
        .deleted = false
    };
    fill_random(envelope.nonce.data(), envelope.nonce.size());

    const auto ad = associated_data(header);
    unsigned long long tag_len = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt_detached(
        envelope.ciphertext.data(),
        envelope.tag.data(), &tag_len,
        plaintext.data(), plaintext.size(),
        ad.data(), ad.size(),
        nullptr,
        envelope.nonce.data(),
        key_.data());

    if (rc != 0 || tag_len != TAG_SIZE) {
        return Result<EncryptedEnvelope, Error>::err(
            Error{ErrorKind::Internal, "Encryption failed for note " + header.id, rc});
    }
    return Result<EncryptedEnvelope, Error>::ok(std::move(envelope));
}

Result<SecretBytes, Error> CipherEngine::decrypt(const EncryptedEnvelope& envelope) const {
    if (envelope.deleted) {
        return Result<SecretBytes, Error>::err(
            Error{ErrorKind::Format, "Envelope " + envelope.id + " is a tombstone"});
    }
    if (envelope.nonce.size() != NONCE_SIZE || envelope.tag.size() != TAG_SIZE) {
        return Result<SecretBytes, Error>::err(
            Error{ErrorKind::Authentication, "Malformed nonce or tag on envelope " + envelope.id});
    }

    const auto ad = associated_data(EnvelopeHeader{envelope.id, envelope.modified_at});
    SecretBytes plaintext(envelope.ciphertext.size());
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt_detached(
        plaintext.data(),
        nullptr,
        envelope.ciphertext.data(), envelope.ciphertext.size(),
        envelope.tag.data(),
        ad.data(), ad.size(),
        envelope.nonce.data(),
        key_.data());

    if (rc != 0) {
        return Result<SecretBytes, Error>::err(Error{
            ErrorKind::Authentication,
            "Decryption failed for envelope " + envelope.id + " (wrong key or corrupted data)"});
    }
    return Result<SecretBytes, Error>::ok(std::move(plaintext));
}

} // namespace vellum::crypto

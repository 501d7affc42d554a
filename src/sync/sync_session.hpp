#pragma once

#include "crypto/cipher.hpp"
#include "crypto/key_derivation.hpp"
#include "crypto/seed_phrase.hpp"
#include "core/result.hpp"
#include <string>

namespace vellum::sync {

/**
 * SyncSession - the key material of one signed-in seed phrase.
 *
 * Built once per phrase (the Argon2 run is the expensive part) and
 * passed to every sync cycle. The key is wiped when the session goes
 * away. Not copyable.
 */
class SyncSession {
public:
    [[nodiscard]] static Result<SyncSession, Error> create(
        const crypto::SeedPhrase& phrase,
        const crypto::KdfParams& params = {});

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;
    SyncSession(SyncSession&&) noexcept = default;
    SyncSession& operator=(SyncSession&&) noexcept = default;

    [[nodiscard]] const crypto::CipherEngine& cipher() const noexcept { return cipher_; }
    [[nodiscard]] const std::string& account_id() const noexcept { return account_id_; }
    [[nodiscard]] int kdf_version() const noexcept { return kdf_version_; }

private:
    SyncSession(crypto::CipherEngine cipher, std::string account_id, int kdf_version)
        : cipher_(std::move(cipher))
        , account_id_(std::move(account_id))
        , kdf_version_(kdf_version) {}

    crypto::CipherEngine cipher_;
    std::string account_id_;
    int kdf_version_;
};

inline Result<SyncSession, Error> SyncSession::create(
    const crypto::SeedPhrase& phrase,
    const crypto::KdfParams& params) {
    auto keys = crypto::derive_session_keys(phrase, params);
    if (keys.is_err()) {
        return Result<SyncSession, Error>::err(keys.unwrap_err());
    }
    const auto& derived = keys.unwrap();
    return Result<SyncSession, Error>::ok(SyncSession(
        crypto::CipherEngine(derived.encryption_key), derived.account_id, params.version));
}

} // namespace vellum::sync

#pragma once

#include "crypto/keys.hpp"
#include "crypto/seed_phrase.hpp"
#include "core/result.hpp"
#include <string>
#include <string_view>

namespace vellum::crypto {

/**
 * KDF schema version. Changing the salt or the Argon2 parameters of a
 * version breaks cross-device sync, so any change gets a new version and
 * the version in use is persisted with the sync settings.
 */
constexpr int CURRENT_KDF_VERSION = 1;

inline constexpr std::string_view CONTEXT_ENCRYPTION = "encryption";
inline constexpr std::string_view CONTEXT_ACCOUNT_ID = "account-id";

/**
 * Argon2id parameters. Tests use minimal() to keep derivation fast.
 */
struct KdfParams {
    int version = CURRENT_KDF_VERSION;
    unsigned long long opslimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    size_t memlimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;

    [[nodiscard]] static KdfParams interactive() { return KdfParams{}; }

    [[nodiscard]] static KdfParams minimal() {
        return KdfParams{
            .version = CURRENT_KDF_VERSION,
            .opslimit = crypto_pwhash_OPSLIMIT_MIN,
            .memlimit = crypto_pwhash_MEMLIMIT_MIN
        };
    }
};

/**
 * Derive a 32-byte key for `context` from the phrase's entropy.
 *
 * master = Argon2id(entropy, salt(version)); key = BLAKE2b(context, key = master).
 * Deterministic in (phrase, context, params); distinct contexts give
 * independent keys. Fails with Derivation only on bad params.
 */
[[nodiscard]] Result<EncryptionKey, Error> derive_key(
    const SeedPhrase& phrase,
    std::string_view context,
    const KdfParams& params = {});

/**
 * Identifier the server scopes storage by: hex of a 128-bit hash of the
 * "account-id" subkey. Reveals nothing about the encryption key.
 */
[[nodiscard]] Result<std::string, Error> derive_account_id(
    const SeedPhrase& phrase,
    const KdfParams& params = {});

/**
 * Both session secrets from a single Argon2 run.
 */
struct SessionKeys {
    EncryptionKey encryption_key;
    std::string account_id;
};

[[nodiscard]] Result<SessionKeys, Error> derive_session_keys(
    const SeedPhrase& phrase,
    const KdfParams& params = {});

} // namespace vellum::crypto

#include "crypto/key_derivation.hpp"
#include "core/logging.hpp"

#include <array>

namespace vellum::crypto {

namespace {

using MasterKey = SecretArray<SYMMETRIC_KEY_SIZE>;

Result<void, Error> check_params(const KdfParams& params) {
    if (params.version != CURRENT_KDF_VERSION) {
        return Result<void, Error>::err(Error{
            ErrorKind::Derivation, "Unknown KDF version " + std::to_string(params.version)});
    }
    if (params.opslimit < crypto_pwhash_OPSLIMIT_MIN ||
        params.opslimit > crypto_pwhash_OPSLIMIT_MAX) {
        return Result<void, Error>::err(
            Error{ErrorKind::Derivation, "KDF opslimit out of range"});
    }
    if (params.memlimit < crypto_pwhash_MEMLIMIT_MIN ||
        params.memlimit > crypto_pwhash_MEMLIMIT_MAX) {
        return Result<void, Error>::err(
            Error{ErrorKind::Derivation, "KDF memlimit out of range"});
    }
    return Result<void, Error>::ok();
}

std::array<uint8_t, SALT_SIZE> salt_for(int version) {
    const std::string label = "vellum.kdf.v" + std::to_string(version);
    const auto digest = hash(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(label.data()), label.size()));
    std::array<uint8_t, SALT_SIZE> salt{};
    std::copy_n(digest.begin(), SALT_SIZE, salt.begin());
    return salt;
}

Result<MasterKey, Error> derive_master(const SeedPhrase& phrase, const KdfParams& params) {
    auto valid = check_params(params);
    if (valid.is_err()) {
        return Result<MasterKey, Error>::err(valid.unwrap_err());
    }
    auto ready = init();
    if (ready.is_err()) {
        return Result<MasterKey, Error>::err(
            Error{ErrorKind::Derivation, ready.unwrap_err().message});
    }

    const auto salt = salt_for(params.version);
    const auto& entropy = phrase.entropy();
    MasterKey master;
    const int rc = crypto_pwhash(
        master.data(), master.size(),
        reinterpret_cast<const char*>(entropy.data()), entropy.size(),
        salt.data(),
        params.opslimit,
        params.memlimit,
        crypto_pwhash_ALG_ARGON2ID13);
    if (rc != 0) {
        // Only fails when Argon2 cannot get its working memory.
        return Result<MasterKey, Error>::err(
            Error{ErrorKind::Derivation, "Argon2id derivation failed (out of memory?)", rc});
    }
    return Result<MasterKey, Error>::ok(master);
}

Result<EncryptionKey, Error> subkey(const MasterKey& master, std::string_view context) {
    if (context.empty()) {
        return Result<EncryptionKey, Error>::err(
            Error{ErrorKind::Derivation, "Empty key derivation context"});
    }
    EncryptionKey key;
    crypto_generichash(key.data(), key.size(),
                       reinterpret_cast<const uint8_t*>(context.data()), context.size(),
                       master.data(), master.size());
    return Result<EncryptionKey, Error>::ok(key);
}

std::string account_id_from(const EncryptionKey& account_key) {
    return to_hex(hash(account_key.span(), 16));
}

} // namespace

Result<EncryptionKey, Error> derive_key(
    const SeedPhrase& phrase,
    std::string_view context,
    const KdfParams& params
) {
    return derive_master(phrase, params).and_then([&](const MasterKey& master) {
        return subkey(master, context);
    });
}

Result<std::string, Error> derive_account_id(const SeedPhrase& phrase, const KdfParams& params) {
    return derive_key(phrase, CONTEXT_ACCOUNT_ID, params).map(account_id_from);
}

Result<SessionKeys, Error> derive_session_keys(const SeedPhrase& phrase, const KdfParams& params) {
    auto master = derive_master(phrase, params);
    if (master.is_err()) {
        qCWarning(vellumCryptoLog) << "key derivation failed:"
                                   << QString::fromStdString(master.unwrap_err().message);
        return Result<SessionKeys, Error>::err(master.unwrap_err());
    }

    auto encryption = subkey(master.unwrap(), CONTEXT_ENCRYPTION);
    auto account = subkey(master.unwrap(), CONTEXT_ACCOUNT_ID);
    if (encryption.is_err()) {
        return Result<SessionKeys, Error>::err(encryption.unwrap_err());
    }
    if (account.is_err()) {
        return Result<SessionKeys, Error>::err(account.unwrap_err());
    }

    qCDebug(vellumCryptoLog) << "derived session keys, kdf version" << params.version;
    return Result<SessionKeys, Error>::ok(SessionKeys{
        .encryption_key = encryption.unwrap(),
        .account_id = account_id_from(account.unwrap())
    });
}

} // namespace vellum::crypto

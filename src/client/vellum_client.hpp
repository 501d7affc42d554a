#pragma once

#include "sync/sync_engine.hpp"
#include "crypto/key_derivation.hpp"
#include "crypto/seed_phrase.hpp"
#include <string>
#include <string_view>

namespace vellum {

/**
 * VellumClient - the operations an application drives sync with.
 *
 *   auto phrase = client.generate_seed_phrase();          // show once, let the user store it
 *   auto session = client.initialize_crypto(phrase_text); // on sign-in
 *   auto outcome = client.run_sync_cycle(session, url);   // on demand or on a timer
 *
 * Holds no key material itself; the SyncSession does.
 */
class VellumClient {
public:
    VellumClient(storage::NoteStore& store,
                 sync::SyncTransport& transport,
                 crypto::KdfParams kdf = {},
                 sync::RetryPolicy retry = {},
                 sync::Sleeper sleeper = sync::thread_sleeper());

    [[nodiscard]] Result<crypto::SeedPhrase, Error> generate_seed_phrase(
        crypto::SeedStrength strength = crypto::SeedStrength::Words12) const;

    /**
     * Validate the phrase and derive the session keys. Format for a bad
     * phrase, Derivation for a KDF failure.
     */
    [[nodiscard]] Result<sync::SyncSession, Error> initialize_crypto(
        std::string_view seed_phrase) const;

    [[nodiscard]] sync::SyncOutcome run_sync_cycle(
        const sync::SyncSession& session,
        const std::string& server,
        const sync::CancellationToken* cancel = nullptr);

    [[nodiscard]] bool health_check(const std::string& server);

    [[nodiscard]] sync::SyncPhase phase() const noexcept { return engine_.phase(); }
    [[nodiscard]] const crypto::KdfParams& kdf_params() const noexcept { return kdf_; }

private:
    crypto::KdfParams kdf_;
    sync::SyncEngine engine_;
};

} // namespace vellum

#include "client/vellum_client.hpp"
#include "core/logging.hpp"

namespace vellum {

VellumClient::VellumClient(storage::NoteStore& store,
                           sync::SyncTransport& transport,
                           crypto::KdfParams kdf,
                           sync::RetryPolicy retry,
                           sync::Sleeper sleeper)
    : kdf_(kdf)
    , engine_(store, transport, retry, std::move(sleeper)) {}

Result<crypto::SeedPhrase, Error> VellumClient::generate_seed_phrase(
    crypto::SeedStrength strength) const {
    return crypto::SeedPhrase::generate(strength);
}

Result<sync::SyncSession, Error> VellumClient::initialize_crypto(
    std::string_view seed_phrase) const {
    auto phrase = crypto::SeedPhrase::parse(seed_phrase);
    if (phrase.is_err()) {
        qCWarning(vellumCryptoLog) << "rejected seed phrase:"
                                   << QString::fromStdString(phrase.unwrap_err().message);
        return Result<sync::SyncSession, Error>::err(phrase.unwrap_err());
    }
    return sync::SyncSession::create(phrase.unwrap(), kdf_);
}

sync::SyncOutcome VellumClient::run_sync_cycle(const sync::SyncSession& session,
                                               const std::string& server,
                                               const sync::CancellationToken* cancel) {
    return engine_.run_cycle(session, server, cancel);
}

bool VellumClient::health_check(const std::string& server) {
    return engine_.health_check(server);
}

} // namespace vellum

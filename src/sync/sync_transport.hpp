#pragma once

#include "core/envelope.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace vellum::sync {

/**
 * SyncTransport - how the engine talks to a sync server.
 *
 * The server only ever stores and returns opaque envelopes, scoped by
 * account id. Failures are reported with:
 *   - ServerUnreachable: network error, timeout, 5xx (retryable)
 *   - Rejected: the server understood and refused (4xx, not retried)
 *   - Format: the response could not be parsed
 */
class SyncTransport {
public:
    virtual ~SyncTransport() = default;

    /**
     * True iff the server answers its health probe.
     */
    [[nodiscard]] virtual bool health_check(const std::string& server) = 0;

    /**
     * Every envelope stored for `account_id`, tombstones included.
     */
    [[nodiscard]] virtual Result<std::vector<EncryptedEnvelope>, Error> pull(
        const std::string& server,
        const std::string& account_id) = 0;

    /**
     * Store or replace the envelope with `envelope.id`.
     */
    [[nodiscard]] virtual Result<void, Error> push(
        const std::string& server,
        const std::string& account_id,
        const EncryptedEnvelope& envelope) = 0;

    /**
     * Replace the note with a tombstone dated `deleted_at`.
     */
    [[nodiscard]] virtual Result<void, Error> remove(
        const std::string& server,
        const std::string& account_id,
        const std::string& id,
        Timestamp deleted_at) = 0;
};

} // namespace vellum::sync

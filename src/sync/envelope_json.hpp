#pragma once

#include "core/envelope.hpp"
#include "core/result.hpp"
#include <QByteArray>
#include <QJsonObject>
#include <vector>

namespace vellum::sync {

/**
 * Wire form of an envelope:
 *
 *   {"id": "...", "ciphertext": "<base64>", "nonce": "<base64>",
 *    "tag": "<base64>", "modified_at": <ms>, "deleted": false}
 *
 * Tombstones omit the three binary fields.
 */
[[nodiscard]] QJsonObject envelope_to_json(const EncryptedEnvelope& envelope);

/**
 * Parse one envelope. Fails with Format on a missing id, a non-integer
 * timestamp or invalid base64.
 */
[[nodiscard]] Result<EncryptedEnvelope, Error> envelope_from_json(const QJsonObject& obj);

/**
 * Parsed pull response: either a bare array or {"notes": [...]}.
 *
 * An entry whose binary fields are damaged but whose id is readable is
 * kept with empty nonce and tag, so decryption reports it for that id
 * alone. Entries without an id are dropped and counted.
 */
struct PullResponse {
    std::vector<EncryptedEnvelope> envelopes;
    int dropped = 0;
};

[[nodiscard]] Result<PullResponse, Error> parse_pull_response(const QByteArray& body);

} // namespace vellum::sync

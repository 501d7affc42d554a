#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace vellum {

/**
 * EncryptedEnvelope - the only representation of a note the server sees.
 *
 * `id` and `modified_at` travel in plaintext (the server indexes by id,
 * the merge compares timestamps) but are bound into the AEAD tag, so a
 * server cannot move ciphertext between ids or rewrite its timestamp.
 *
 * A tombstone envelope records a deletion: `deleted` is set and the
 * ciphertext, nonce and tag are empty.
 */
struct EncryptedEnvelope {
    std::string id;
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> tag;
    Timestamp modified_at;
    bool deleted = false;

    bool operator==(const EncryptedEnvelope&) const = default;
};

[[nodiscard]] inline EncryptedEnvelope tombstone_envelope(std::string id, Timestamp deleted_at) {
    return EncryptedEnvelope{
        .id = std::move(id),
        .ciphertext = {},
        .nonce = {},
        .tag = {},
        .modified_at = deleted_at,
        .deleted = true
    };
}

} // namespace vellum

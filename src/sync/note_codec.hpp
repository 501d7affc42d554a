#pragma once

#include "core/note.hpp"
#include "core/result.hpp"
#include "crypto/keys.hpp"
#include <span>
#include <string>

namespace vellum::sync {

/**
 * Payload schema version written by encode_note().
 *
 * v1: title, body, modified, version
 * v2: adds created
 */
constexpr int NOTE_CODEC_VERSION = 2;

/**
 * Serialize the encrypted part of a note: compact JSON, keys sorted,
 * so equal notes always encode to equal bytes. The id travels in the
 * envelope and the tombstone in the envelope's deleted marker.
 */
[[nodiscard]] crypto::SecretBytes encode_note(const Note& note);

/**
 * Parse a payload written by this or an earlier codec version.
 * Fails with Format on malformed JSON, missing or mistyped fields, or a
 * version newer than NOTE_CODEC_VERSION.
 */
[[nodiscard]] Result<Note, Error> decode_note(std::span<const uint8_t> payload, const std::string& id);

} // namespace vellum::sync

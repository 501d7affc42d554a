#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <algorithm>

namespace vellum {

/**
 * Note - A single note as owned by the local store.
 *
 * `version` is a local edit counter; together with `modified_at` it orders
 * concurrent copies of the same note. `deleted` is a tombstone: deleted
 * notes are kept so the deletion can propagate on the next sync.
 */
struct Note {
    std::string id;
    std::string title;
    std::string body;
    Timestamp created_at;
    Timestamp modified_at;
    uint64_t version = 1;
    bool deleted = false;

    bool operator==(const Note&) const = default;
};

// ============================================================================
// Pure transformation functions
// ============================================================================

/**
 * Create a new note with a fresh random id.
 */
[[nodiscard]] inline Note create_note(std::string title, std::string body) {
    const auto now = Timestamp::now();
    return Note{
        .id = Uuid::generate().to_string(),
        .title = std::move(title),
        .body = std::move(body),
        .created_at = now,
        .modified_at = now,
        .version = 1,
        .deleted = false
    };
}

/**
 * Record a local edit: bump the version and the modification time.
 * The clock never moves a note backwards.
 */
[[nodiscard]] inline Note touched(Note note) {
    note.modified_at = std::max(Timestamp::now(), note.modified_at + Timestamp::Duration(1));
    ++note.version;
    return note;
}

[[nodiscard]] inline Note with_title(Note note, std::string title) {
    note.title = std::move(title);
    return touched(std::move(note));
}

[[nodiscard]] inline Note with_body(Note note, std::string body) {
    note.body = std::move(body);
    return touched(std::move(note));
}

/**
 * Soft-delete a note. Content is kept so a conflicting remote edit can
 * still win over the tombstone.
 */
[[nodiscard]] inline Note tombstoned(Note note) {
    note.deleted = true;
    return touched(std::move(note));
}

/**
 * Live (non-tombstoned) notes, most recently modified first.
 */
[[nodiscard]] inline std::vector<Note> live_notes(const std::vector<Note>& notes) {
    std::vector<Note> out;
    for (const auto& n : notes) {
        if (!n.deleted) out.push_back(n);
    }
    std::sort(out.begin(), out.end(), [](const Note& a, const Note& b) {
        if (a.modified_at != b.modified_at) return a.modified_at > b.modified_at;
        return a.id < b.id;
    });
    return out;
}

} // namespace vellum

#pragma once

#include "core/note.hpp"
#include <string>
#include <vector>

namespace vellum::sync {

/**
 * Change to apply to the local store. `note` is the full resulting row;
 * for Delete it is the local note turned into a tombstone.
 */
enum class LocalAction { Create, Update, Delete };

struct LocalMutation {
    LocalAction action;
    Note note;

    bool operator==(const LocalMutation&) const = default;
};

/**
 * Change to send to the server. Push encrypts `note`; Delete records a
 * tombstone for `note.id` at `note.modified_at`.
 */
enum class RemoteAction { Push, Delete };

struct RemoteOperation {
    RemoteAction action;
    Note note;

    bool operator==(const RemoteOperation&) const = default;
};

/**
 * Emitted when both sides carry the same (modified_at, version) but
 * different content, so the ordering alone cannot pick a winner.
 */
struct ConflictResolved {
    std::string id;
    Note kept;
    Note discarded;
    bool kept_local = false;
};

/**
 * SyncPlan - everything one merge decided, in id order.
 */
struct SyncPlan {
    std::vector<LocalMutation> local;
    std::vector<RemoteOperation> remote;
    std::vector<ConflictResolved> conflicts;

    [[nodiscard]] bool empty() const noexcept {
        return local.empty() && remote.empty();
    }
};

[[nodiscard]] constexpr const char* to_string(LocalAction action) noexcept {
    switch (action) {
        case LocalAction::Create: return "create";
        case LocalAction::Update: return "update";
        case LocalAction::Delete: return "delete";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* to_string(RemoteAction action) noexcept {
    switch (action) {
        case RemoteAction::Push: return "push";
        case RemoteAction::Delete: return "delete";
    }
    return "unknown";
}

/**
 * Deterministic merge of the local store with the decrypted server state.
 *
 * Remote tombstones arrive as notes with `deleted` set. Per id:
 *   - local only: push it (tombstones stay local)
 *   - remote only: create it locally (tombstones are ignored)
 *   - both: the copy with the greater (modified_at, version) wins and is
 *     propagated to the other side; two tombstones need nothing
 *   - equal ordering, different content: a live copy beats a tombstone,
 *     otherwise the larger encoded payload wins, and a ConflictResolved
 *     records both copies
 *
 * Pure: same inputs, same plan. Reconciling again after the plan has been
 * applied on both sides yields an empty plan.
 */
[[nodiscard]] SyncPlan reconcile(const std::vector<Note>& local, const std::vector<Note>& remote);

/**
 * The local note set after applying `plan.local`.
 */
[[nodiscard]] std::vector<Note> apply_local(std::vector<Note> local, const SyncPlan& plan);

/**
 * The remote note set after applying `plan.remote`, in the shape a pull
 * would return it (tombstones carry no content).
 */
[[nodiscard]] std::vector<Note> apply_remote(std::vector<Note> remote, const SyncPlan& plan);

/**
 * A remote tombstone as the reconciler sees it.
 */
[[nodiscard]] Note remote_tombstone(std::string id, Timestamp deleted_at);

} // namespace vellum::sync

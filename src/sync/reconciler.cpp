#include "sync/reconciler.hpp"
#include "sync/note_codec.hpp"

#include <algorithm>
#include <map>
#include <tuple>

namespace vellum::sync {

namespace {

struct Pair {
    const Note* local = nullptr;
    const Note* remote = nullptr;
};

bool same_content(const Note& a, const Note& b) {
    return a.deleted == b.deleted && a.title == b.title && a.body == b.body &&
           a.created_at == b.created_at;
}

// Tie-break for equal (modified_at, version): live beats tombstone, then
// the lexicographically larger payload. True if `local` wins.
bool local_wins_tie(const Note& local, const Note& remote) {
    if (local.deleted != remote.deleted) {
        return !local.deleted;
    }
    const auto a = encode_note(local);
    const auto b = encode_note(remote);
    return std::lexicographical_compare(b.bytes().begin(), b.bytes().end(),
                                        a.bytes().begin(), a.bytes().end());
}

void propagate_local_winner(const Note& local, const Note& remote, SyncPlan& plan) {
    if (local.deleted) {
        if (!remote.deleted) {
            plan.remote.push_back({RemoteAction::Delete, local});
        }
        return;
    }
    plan.remote.push_back({RemoteAction::Push, local});
}

void propagate_remote_winner(const Note& local, const Note& remote, SyncPlan& plan) {
    if (remote.deleted) {
        if (!local.deleted) {
            Note gone = local;
            gone.deleted = true;
            gone.modified_at = remote.modified_at;
            plan.local.push_back({LocalAction::Delete, std::move(gone)});
        }
        return;
    }
    plan.local.push_back({LocalAction::Update, remote});
}

void upsert(std::vector<Note>& notes, const Note& note) {
    auto it = std::find_if(notes.begin(), notes.end(),
                           [&](const Note& n) { return n.id == note.id; });
    if (it == notes.end()) {
        notes.push_back(note);
    } else {
        *it = note;
    }
}

} // namespace

Note remote_tombstone(std::string id, Timestamp deleted_at) {
    return Note{
        .id = std::move(id),
        .title = {},
        .body = {},
        .created_at = deleted_at,
        .modified_at = deleted_at,
        .version = 0,
        .deleted = true
    };
}

SyncPlan reconcile(const std::vector<Note>& local, const std::vector<Note>& remote) {
    std::map<std::string, Pair> by_id;
    for (const auto& n : local) by_id[n.id].local = &n;
    for (const auto& n : remote) by_id[n.id].remote = &n;

    SyncPlan plan;
    for (const auto& [id, pair] : by_id) {
        if (pair.local && !pair.remote) {
            if (!pair.local->deleted) {
                plan.remote.push_back({RemoteAction::Push, *pair.local});
            }
            continue;
        }
        if (pair.remote && !pair.local) {
            if (!pair.remote->deleted) {
                plan.local.push_back({LocalAction::Create, *pair.remote});
            }
            continue;
        }

        const Note& l = *pair.local;
        const Note& r = *pair.remote;
        const auto lkey = std::tie(l.modified_at, l.version);
        const auto rkey = std::tie(r.modified_at, r.version);

        if (lkey > rkey) {
            propagate_local_winner(l, r, plan);
        } else if (rkey > lkey) {
            propagate_remote_winner(l, r, plan);
        } else if (!same_content(l, r)) {
            const bool keep_local = local_wins_tie(l, r);
            if (keep_local) {
                propagate_local_winner(l, r, plan);
            } else {
                propagate_remote_winner(l, r, plan);
            }
            plan.conflicts.push_back(ConflictResolved{
                .id = id,
                .kept = keep_local ? l : r,
                .discarded = keep_local ? r : l,
                .kept_local = keep_local
            });
        }
    }
    return plan;
}

std::vector<Note> apply_local(std::vector<Note> local, const SyncPlan& plan) {
    for (const auto& m : plan.local) {
        upsert(local, m.note);
    }
    return local;
}

std::vector<Note> apply_remote(std::vector<Note> remote, const SyncPlan& plan) {
    for (const auto& op : plan.remote) {
        if (op.action == RemoteAction::Push) {
            upsert(remote, op.note);
        } else {
            upsert(remote, remote_tombstone(op.note.id, op.note.modified_at));
        }
    }
    return remote;
}

} // namespace vellum::sync

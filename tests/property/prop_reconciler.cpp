#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "sync/reconciler.hpp"

#include <set>

using namespace vellum;
using namespace vellum::sync;

namespace {

// One side of a merge: unique ids from a small pool so the sides overlap,
// and timestamps from a small range so ties are common. Remote deletions
// take the shape a pull gives them.
std::vector<Note> draw_side(bool remote) {
    const auto ids = *rc::gen::container<std::set<std::string>>(
        rc::gen::elementOf(std::vector<std::string>{"a", "b", "c", "d", "e"}));

    std::vector<Note> notes;
    for (const auto& id : ids) {
        const bool deleted = *rc::gen::arbitrary<bool>();
        const Timestamp modified(*rc::gen::inRange<int64_t>(1, 6));
        if (remote && deleted) {
            notes.push_back(remote_tombstone(id, modified));
            continue;
        }
        notes.push_back(Note{
            .id = id,
            .title = *rc::gen::elementOf(std::vector<std::string>{"x", "y"}),
            .body = *rc::gen::elementOf(std::vector<std::string>{"", "body"}),
            .created_at = Timestamp(0),
            .modified_at = modified,
            .version = *rc::gen::inRange<uint64_t>(1, 4),
            .deleted = deleted
        });
    }
    return notes;
}

} // namespace

TEST_CASE("Property: applying a plan settles both sides", "[property][merge]") {
    REQUIRE(rc::check("reconcile after apply is empty", [] {
        const auto local = draw_side(false);
        const auto remote = draw_side(true);

        const auto plan = reconcile(local, remote);
        const auto again = reconcile(apply_local(local, plan), apply_remote(remote, plan));
        RC_ASSERT(again.empty());
        RC_ASSERT(again.conflicts.empty());
    }));
}

TEST_CASE("Property: both sides end with the same live notes", "[property][merge]") {
    REQUIRE(rc::check("live notes converge", [] {
        const auto local = draw_side(false);
        const auto remote = draw_side(true);

        const auto plan = reconcile(local, remote);
        RC_ASSERT(live_notes(apply_local(local, plan)) == live_notes(apply_remote(remote, plan)));
    }));
}

TEST_CASE("Property: each id changes on at most one side", "[property][merge]") {
    REQUIRE(rc::check("plan touches an id once", [] {
        const auto plan = reconcile(draw_side(false), draw_side(true));

        std::set<std::string> local_ids;
        for (const auto& m : plan.local) {
            RC_ASSERT(local_ids.insert(m.note.id).second);
        }
        for (const auto& op : plan.remote) {
            RC_ASSERT(local_ids.count(op.note.id) == 0u);
        }
    }));
}

TEST_CASE("Property: reconcile is deterministic", "[property][merge]") {
    REQUIRE(rc::check("same inputs, same plan", [] {
        const auto local = draw_side(false);
        const auto remote = draw_side(true);

        const auto a = reconcile(local, remote);
        const auto b = reconcile(local, remote);
        RC_ASSERT(a.local == b.local);
        RC_ASSERT(a.remote == b.remote);
        RC_ASSERT(a.conflicts.size() == b.conflicts.size());
    }));
}

#include <catch2/catch_test_macros.hpp>
#include "core/note.hpp"

#include <QString>
#include <QUuid>
#include <cmath>
#include <limits>

using namespace vellum;

namespace {

Note make(std::string id, int64_t modified, bool deleted = false) {
    return Note{
        .id = std::move(id),
        .title = "t",
        .body = "b",
        .created_at = Timestamp(modified),
        .modified_at = Timestamp(modified),
        .version = 1,
        .deleted = deleted
    };
}

} // namespace

TEST_CASE("create_note assigns a fresh id and matching timestamps", "[unit][note]") {
    const auto a = create_note("Hi", "world");
    const auto b = create_note("Hi", "world");

    REQUIRE(a.id != b.id);
    const auto parsed = QUuid::fromString(QString::fromStdString(a.id));
    REQUIRE_FALSE(parsed.isNull());
    REQUIRE(parsed.version() == QUuid::Random);
    REQUIRE(parsed.toString(QUuid::WithoutBraces).toStdString() == a.id);
    REQUIRE(a.title == "Hi");
    REQUIRE(a.body == "world");
    REQUIRE(a.created_at == a.modified_at);
    REQUIRE(a.version == 1);
    REQUIRE_FALSE(a.deleted);
}

TEST_CASE("touched bumps version and never moves time backwards", "[unit][note]") {
    // A timestamp far in the future stands in for a skewed clock.
    auto future = make("n1", Timestamp::now().millis() + 3600 * 1000);
    const auto edited = touched(future);

    REQUIRE(edited.version == 2);
    REQUIRE(edited.modified_at > future.modified_at);
    REQUIRE(edited.created_at == future.created_at);

    const auto past = make("n2", 1000);
    const auto before = Timestamp::now();
    REQUIRE(touched(past).modified_at >= before);
}

TEST_CASE("Edits go through touched", "[unit][note]") {
    const auto original = make("n1", 1000);

    const auto renamed = with_title(original, "New");
    REQUIRE(renamed.title == "New");
    REQUIRE(renamed.body == original.body);
    REQUIRE(renamed.version == original.version + 1);

    const auto rewritten = with_body(renamed, "Text");
    REQUIRE(rewritten.body == "Text");
    REQUIRE(rewritten.version == original.version + 2);
}

TEST_CASE("tombstoned keeps content and marks deletion", "[unit][note]") {
    const auto original = make("n1", 1000);
    const auto gone = tombstoned(original);

    REQUIRE(gone.deleted);
    REQUIRE(gone.title == original.title);
    REQUIRE(gone.body == original.body);
    REQUIRE(gone.version == original.version + 1);
    REQUIRE(gone.modified_at > original.modified_at);
}

TEST_CASE("live_notes drops tombstones and sorts newest first", "[unit][note]") {
    const std::vector<Note> notes = {
        make("b", 100),
        make("a", 300),
        make("dead", 500, true),
        make("c", 300),
        make("d", 200),
    };

    const auto live = live_notes(notes);
    REQUIRE(live.size() == 4);
    REQUIRE(live[0].id == "a");
    REQUIRE(live[1].id == "c");
    REQUIRE(live[2].id == "d");
    REQUIRE(live[3].id == "b");
}

TEST_CASE("exact_int64 accepts only integral in-range numbers", "[unit][note]") {
    REQUIRE(exact_int64(0.0) == 0);
    REQUIRE(exact_int64(1700000000123.0) == 1700000000123);
    REQUIRE(exact_int64(-42.0) == -42);
    REQUIRE(exact_int64(-9223372036854775808.0) == std::numeric_limits<int64_t>::min());

    REQUIRE_FALSE(exact_int64(1.5).has_value());
    REQUIRE_FALSE(exact_int64(9223372036854775808.0).has_value());
    REQUIRE_FALSE(exact_int64(1e300).has_value());
    REQUIRE_FALSE(exact_int64(-1e300).has_value());
    REQUIRE_FALSE(exact_int64(std::nan("")).has_value());
    REQUIRE_FALSE(exact_int64(std::numeric_limits<double>::infinity()).has_value());
}

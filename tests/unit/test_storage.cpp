#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/note_repository.hpp"

using namespace vellum;
using namespace vellum::storage;

namespace {

Note note(std::string id, int64_t modified, std::string title = "title") {
    return Note{
        .id = std::move(id),
        .title = std::move(title),
        .body = "body",
        .created_at = Timestamp(modified - 100),
        .modified_at = Timestamp(modified),
        .version = 2,
        .deleted = false
    };
}

int64_t count_rows(Database& db, const std::string& table) {
    auto stmt = db.prepare("SELECT COUNT(*) FROM " + table + ";").unwrap();
    REQUIRE(stmt.step().unwrap());
    return stmt.column_int64(0);
}

} // namespace

TEST_CASE("Database basic operations", "[unit][storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();
    REQUIRE(db.is_open());
    REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());

    SECTION("Prepare, bind and step") {
        auto insert = db.prepare("INSERT INTO test VALUES (?, ?);").unwrap();
        REQUIRE(insert.bind_int64(1, 7).is_ok());
        REQUIRE(insert.bind_text(2, "Alice").is_ok());
        REQUIRE_FALSE(insert.step().unwrap());

        auto stmt = db.prepare("SELECT id, name FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int64(0) == 7);
        REQUIRE(stmt.column_text(1) == "Alice");
        REQUIRE_FALSE(stmt.step().unwrap());
    }

    SECTION("Invalid SQL is a Storage error") {
        auto result = db.execute("NOT SQL AT ALL;");
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Storage));
        REQUIRE(result.unwrap_err().code != 0);

        auto stmt = db.prepare("SELECT * FROM missing;");
        REQUIRE(stmt.is_err());
        REQUIRE(stmt.unwrap_err().is(ErrorKind::Storage));
    }

    SECTION("Transaction commit") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            return db.execute("INSERT INTO test VALUES (1, 'a');")
                .and_then([&] { return db.execute("INSERT INTO test VALUES (2, 'b');"); });
        });
        REQUIRE(result.is_ok());
        REQUIRE(count_rows(db, "test") == 2);
    }

    SECTION("Transaction rolls back on error") {
        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (1, 'a');");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{ErrorKind::Storage, "abort"});
        });
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().message == "abort");
        REQUIRE(count_rows(db, "test") == 0);
    }

    SECTION("Closed database reports it") {
        db.close();
        REQUIRE_FALSE(db.is_open());
        REQUIRE(db.execute("SELECT 1;").is_err());
    }
}

TEST_CASE("Migrations", "[unit][storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);

    SECTION("Fresh database reaches the latest schema") {
        REQUIRE(initialize_database(db).is_ok());
        REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
        REQUIRE(count_rows(db, "schema_migrations") ==
                static_cast<int64_t>(ALL_MIGRATIONS.size()));

        // Re-running is a no-op.
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(count_rows(db, "schema_migrations") ==
                static_cast<int64_t>(ALL_MIGRATIONS.size()));
    }

    SECTION("Upgrading a v1 database backfills created_at") {
        REQUIRE(runner.migrate_to(1).is_ok());
        REQUIRE(runner.current_version().unwrap() == 1);
        REQUIRE(db.execute(
            "INSERT INTO notes (id, title, body, modified_at, version, deleted) "
            "VALUES ('old', 'Old', 'note', 1234, 3, 0);").is_ok());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == 2);

        NoteRepository repo(db);
        auto found = repo.find("old").unwrap();
        REQUIRE(found.has_value());
        REQUIRE(found->created_at == Timestamp(1234));
        REQUIRE(found->modified_at == Timestamp(1234));
        REQUIRE(found->version == 3);
    }
}

TEST_CASE("NoteRepository", "[unit][storage]") {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    NoteRepository repo(db);

    SECTION("Empty store") {
        REQUIRE(repo.load_all().unwrap().empty());
        REQUIRE_FALSE(repo.find("nope").unwrap().has_value());
    }

    SECTION("Saved notes come back exactly, ordered by id") {
        auto gone = note("b", 2000);
        gone.deleted = true;
        REQUIRE(repo.save_all({note("c", 3000), gone, note("a", 1000, "unicode \xE2\x9C\x93")}).is_ok());

        const auto all = repo.load_all().unwrap();
        REQUIRE(all.size() == 3);
        REQUIRE(all[0] == note("a", 1000, "unicode \xE2\x9C\x93"));
        REQUIRE(all[1] == gone);
        REQUIRE(all[2] == note("c", 3000));
    }

    SECTION("Saving again replaces the row") {
        REQUIRE(repo.save(note("a", 1000, "first")).is_ok());
        auto updated = note("a", 2000, "second");
        updated.version = 5;
        REQUIRE(repo.save(updated).is_ok());

        const auto all = repo.load_all().unwrap();
        REQUIRE(all.size() == 1);
        REQUIRE(all[0] == updated);
    }

    SECTION("Batches are all or nothing") {
        REQUIRE(repo.save(note("keep", 1)).is_ok());
        auto result = repo.save_all({note("x", 1), note("", 2)});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::InvalidArgument));
        REQUIRE(repo.load_all().unwrap().size() == 1);
    }

    SECTION("A failing write rolls back the batch") {
        REQUIRE(db.execute(
            "CREATE TRIGGER refuse BEFORE INSERT ON notes WHEN NEW.id = 'bad' "
            "BEGIN SELECT RAISE(ABORT, 'refused'); END;").is_ok());
        auto result = repo.save_all({note("ok", 1), note("bad", 2)});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Storage));
        REQUIRE(repo.load_all().unwrap().empty());
    }

    SECTION("Merge commits against an unchanged base") {
        REQUIRE(repo.save(note("a", 1000, "old")).is_ok());
        const auto base = repo.load_all().unwrap();

        REQUIRE(repo.commit_merge(base, {note("a", 2000, "new"), note("b", 1500)}).is_ok());
        const auto all = repo.load_all().unwrap();
        REQUIRE(all.size() == 2);
        REQUIRE(all[0] == note("a", 2000, "new"));
        REQUIRE(all[1] == note("b", 1500));
    }

    SECTION("Merge refuses rows edited since the base was read") {
        REQUIRE(repo.save(note("a", 1000, "old")).is_ok());
        const auto base = repo.load_all().unwrap();

        const auto edited = note("a", 3000, "edited meanwhile");
        REQUIRE(repo.save(edited).is_ok());
        REQUIRE(repo.save(note("b", 10)).is_ok());

        auto result = repo.commit_merge(base, {note("c", 5), note("a", 2000, "remote")});
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().is(ErrorKind::Conflict));
        REQUIRE(repo.find("a").unwrap() == edited);
        REQUIRE_FALSE(repo.find("c").unwrap().has_value());

        SECTION("A row created since the base was read also conflicts") {
            auto created = repo.commit_merge(base, {note("b", 20)});
            REQUIRE(created.is_err());
            REQUIRE(created.unwrap_err().is(ErrorKind::Conflict));
            REQUIRE(repo.find("b").unwrap() == note("b", 10));
        }
    }
}

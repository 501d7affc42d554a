#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace vellum::storage {

/**
 * Migration - one forward step of the local schema.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

/**
 * All migrations in order. Never edit a shipped entry; append a new one.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "notes",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS notes (
                id TEXT PRIMARY KEY,
                title TEXT NOT NULL DEFAULT '',
                body TEXT NOT NULL DEFAULT '',
                modified_at INTEGER NOT NULL,
                version INTEGER NOT NULL DEFAULT 1,
                deleted INTEGER NOT NULL DEFAULT 0
            );
            CREATE INDEX IF NOT EXISTS idx_notes_modified ON notes(modified_at);
        )SQL"
    },
    {
        .version = 2,
        .name = "notes_created_at",
        .up_sql = R"SQL(
            ALTER TABLE notes ADD COLUMN created_at INTEGER NOT NULL DEFAULT 0;
            UPDATE notes SET created_at = modified_at WHERE created_at = 0;
        )SQL"
    }
};

/**
 * MigrationRunner - brings a database up to a schema version, recording
 * applied steps in schema_migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Apply every pending migration in one transaction.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace vellum::storage

#include "storage/migrations.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"

namespace vellum::storage {

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    auto stmt_result = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(static_cast<int>(stmt.column_int64(0)));
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        const auto& cause = exec_result.unwrap_err();
        return Result<void, Error>::err(Error{
            ErrorKind::Storage,
            "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " + cause.message,
            cause.code});
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = stmt.bind_int64(1, m.version)
        .and_then([&] { return stmt.bind_text(2, m.name); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }

    qCInfo(vellumStorageLog) << "applied migration" << m.version << QString::fromStdString(m.name);
    return Result<void, Error>::ok();
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(current_result.unwrap_err());
    }

    const int current = current_result.unwrap();
    if (current >= target_version) {
        return Result<void, Error>::ok();
    }

    return db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version > current && m.version <= target_version) {
                auto result = run_migration(m);
                if (result.is_err()) {
                    return result;
                }
            }
        }
        return Result<void, Error>::ok();
    });
}

} // namespace vellum::storage

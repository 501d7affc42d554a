#include "storage/database.hpp"
#include "core/logging.hpp"

namespace vellum::storage {

namespace {

Error storage_error(const std::string& what, int rc) {
    return Error{ErrorKind::Storage, what, rc};
}

} // namespace

// ============================================================================
// Statement
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    const int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                                     static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(
            storage_error("Failed to bind text parameter " + std::to_string(index), rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    const int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(
            storage_error("Failed to bind integer parameter " + std::to_string(index), rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const auto* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return {};
    const int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

Result<bool, Error> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    return Result<bool, Error>::err(storage_error(
        std::string("Step failed: ") + sqlite3_errmsg(sqlite3_db_handle(stmt_.get())), rc));
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    const int rc = sqlite3_open(path.c_str(), &handle);
    if (rc != SQLITE_OK) {
        std::string message = handle ? sqlite3_errmsg(handle) : "out of memory";
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(
            storage_error("Cannot open " + path + ": " + message, rc));
    }

    Database db(handle);
    // In-memory databases report "memory" for WAL; only a hard error matters.
    auto wal = db.execute("PRAGMA journal_mode = WAL;");
    if (wal.is_err()) {
        return Result<Database, Error>::err(wal.unwrap_err());
    }
    auto busy = db.execute("PRAGMA busy_timeout = 5000;");
    if (busy.is_err()) {
        return Result<Database, Error>::err(busy.unwrap_err());
    }

    qCDebug(vellumStorageLog) << "opened" << QString::fromStdString(path);
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(storage_error("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                      static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(storage_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(storage_error("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(storage_error(message, rc));
    }
    return Result<void, Error>::ok();
}

void Database::rollback_quietly() {
    auto result = execute("ROLLBACK;");
    if (result.is_err()) {
        qCWarning(vellumStorageLog) << "rollback failed:"
                                    << QString::fromStdString(result.unwrap_err().message);
    }
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace vellum::storage

#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <memory>
#include <string>
#include <string_view>

namespace vellum::storage {

/**
 * Prepared statement, finalized when the last copy goes away.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;

    /**
     * Advance. ok(true) while rows remain, ok(false) when done.
     */
    [[nodiscard]] Result<bool, Error> step();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - one SQLite connection.
 *
 * Every failure comes back as a Storage error carrying SQLite's message
 * and result code.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (creating if needed) the database at `path`, in WAL mode.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Run `f` inside BEGIN/COMMIT. Any error from `f` or from COMMIT
     * rolls the whole transaction back and is returned unchanged.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = execute("BEGIN IMMEDIATE;");
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();
        if (result.is_err()) {
            rollback_quietly();
            return result;
        }

        auto commit_result = execute("COMMIT;");
        if (commit_result.is_err()) {
            rollback_quietly();
            return ResultType::err(commit_result.unwrap_err());
        }
        return result;
    }

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    // Logs instead of returning: the caller is already reporting an error.
    void rollback_quietly();

    sqlite3* db_ = nullptr;
};

} // namespace vellum::storage

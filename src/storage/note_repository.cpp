#include "storage/note_repository.hpp"
#include "core/logging.hpp"

#include <map>

namespace vellum::storage {

namespace {

constexpr const char* SELECT_COLUMNS =
    "SELECT id, title, body, created_at, modified_at, version, deleted FROM notes";

Result<void, Error> require_ids(const std::vector<Note>& notes) {
    for (const auto& note : notes) {
        if (note.id.empty()) {
            return Result<void, Error>::err(
                Error{ErrorKind::InvalidArgument, "Cannot store a note without an id"});
        }
    }
    return Result<void, Error>::ok();
}

} // namespace

Note NoteRepository::row_to_note(const Statement& stmt) {
    return Note{
        .id = stmt.column_text(0),
        .title = stmt.column_text(1),
        .body = stmt.column_text(2),
        .created_at = Timestamp(stmt.column_int64(3)),
        .modified_at = Timestamp(stmt.column_int64(4)),
        .version = static_cast<uint64_t>(stmt.column_int64(5)),
        .deleted = stmt.column_int64(6) != 0
    };
}

Result<std::vector<Note>, Error> NoteRepository::load_all() {
    auto stmt_result = db_.prepare(std::string(SELECT_COLUMNS) + " ORDER BY id;");
    if (stmt_result.is_err()) {
        return Result<std::vector<Note>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    std::vector<Note> notes;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Note>, Error>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        notes.push_back(row_to_note(stmt));
    }
    return Result<std::vector<Note>, Error>::ok(std::move(notes));
}

Result<std::optional<Note>, Error> NoteRepository::find(const std::string& id) {
    auto stmt_result = db_.prepare(std::string(SELECT_COLUMNS) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<std::optional<Note>, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, id);
    if (bound.is_err()) {
        return Result<std::optional<Note>, Error>::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<std::optional<Note>, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<std::optional<Note>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<Note>, Error>::ok(row_to_note(stmt));
}

Result<void, Error> NoteRepository::upsert(const Note& note) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO notes (id, title, body, created_at, modified_at, version, deleted)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            title = excluded.title,
            body = excluded.body,
            created_at = excluded.created_at,
            modified_at = excluded.modified_at,
            version = excluded.version,
            deleted = excluded.deleted;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, note.id)
        .and_then([&] { return stmt.bind_text(2, note.title); })
        .and_then([&] { return stmt.bind_text(3, note.body); })
        .and_then([&] { return stmt.bind_int64(4, note.created_at.millis()); })
        .and_then([&] { return stmt.bind_int64(5, note.modified_at.millis()); })
        .and_then([&] { return stmt.bind_int64(6, static_cast<int64_t>(note.version)); })
        .and_then([&] { return stmt.bind_int64(7, note.deleted ? 1 : 0); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> NoteRepository::save_all(const std::vector<Note>& notes) {
    if (notes.empty()) {
        return Result<void, Error>::ok();
    }
    auto valid = require_ids(notes);
    if (valid.is_err()) {
        return valid;
    }

    std::lock_guard lock(write_mutex_);
    auto result = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& note : notes) {
            auto saved = upsert(note);
            if (saved.is_err()) {
                return saved;
            }
        }
        return Result<void, Error>::ok();
    });
    if (result.is_ok()) {
        qCDebug(vellumStorageLog) << "saved" << notes.size() << "notes";
    }
    return result;
}

Result<void, Error> NoteRepository::commit_merge(const std::vector<Note>& base,
                                                 const std::vector<Note>& changes) {
    if (changes.empty()) {
        return Result<void, Error>::ok();
    }
    auto valid = require_ids(changes);
    if (valid.is_err()) {
        return valid;
    }

    std::map<std::string, const Note*> expected;
    for (const auto& note : base) {
        expected[note.id] = &note;
    }

    std::lock_guard lock(write_mutex_);
    auto result = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& note : changes) {
            auto current = find(note.id);
            if (current.is_err()) {
                return Result<void, Error>::err(current.unwrap_err());
            }
            const auto it = expected.find(note.id);
            const bool unchanged = it == expected.end() ? !current.unwrap().has_value()
                                                        : current.unwrap() == *it->second;
            if (!unchanged) {
                return Result<void, Error>::err(
                    Error{ErrorKind::Conflict, "Note " + note.id + " changed while merging"});
            }
            auto saved = upsert(note);
            if (saved.is_err()) {
                return saved;
            }
        }
        return Result<void, Error>::ok();
    });
    if (result.is_ok()) {
        qCDebug(vellumStorageLog) << "merge committed" << changes.size() << "notes";
    } else {
        qCInfo(vellumStorageLog) << "merge not committed:"
                                 << QString::fromStdString(result.unwrap_err().message);
    }
    return result;
}

} // namespace vellum::storage

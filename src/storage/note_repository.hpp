#pragma once

#include "storage/database.hpp"
#include "storage/note_store.hpp"

#include <mutex>

namespace vellum::storage {

/**
 * NoteRepository - NoteStore over the `notes` table.
 *
 * Expects a database that has been through initialize_database().
 */
class NoteRepository : public NoteStore {
public:
    explicit NoteRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::vector<Note>, Error> load_all() override;

    [[nodiscard]] Result<std::optional<Note>, Error> find(const std::string& id) override;

    [[nodiscard]] Result<void, Error> save_all(const std::vector<Note>& notes) override;

    [[nodiscard]] Result<void, Error> commit_merge(const std::vector<Note>& base,
                                                   const std::vector<Note>& changes) override;

private:
    [[nodiscard]] static Note row_to_note(const Statement& stmt);
    [[nodiscard]] Result<void, Error> upsert(const Note& note);

    Database& db_;
    // Writers on this connection; other connections wait on SQLite's lock.
    std::mutex write_mutex_;
};

} // namespace vellum::storage

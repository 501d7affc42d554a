#pragma once

#include "core/note.hpp"
#include "core/result.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vellum::storage {

/**
 * NoteStore - local persistence the sync engine reads and commits to.
 */
class NoteStore {
public:
    virtual ~NoteStore() = default;

    /**
     * Every note, tombstones included.
     */
    [[nodiscard]] virtual Result<std::vector<Note>, Error> load_all() = 0;

    [[nodiscard]] virtual Result<std::optional<Note>, Error> find(const std::string& id) = 0;

    /**
     * Insert or replace each note by id, all or nothing.
     */
    [[nodiscard]] virtual Result<void, Error> save_all(const std::vector<Note>& notes) = 0;

    /**
     * Commit the local side of a merge computed from `base`. In one write
     * transaction every id in `changes` must still be stored exactly as in
     * `base` (or be absent if `base` lacks it); otherwise nothing is
     * written and the error kind is Conflict.
     */
    [[nodiscard]] virtual Result<void, Error> commit_merge(const std::vector<Note>& base,
                                                           const std::vector<Note>& changes) = 0;

    [[nodiscard]] Result<void, Error> save(const Note& note) {
        return save_all({note});
    }
};

} // namespace vellum::storage

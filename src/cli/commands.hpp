#pragma once

#include <QString>
#include <optional>

#include "core/result.hpp"
#include "crypto/key_derivation.hpp"
#include "storage/note_store.hpp"
#include "storage/settings_store.hpp"
#include "sync/sync_engine.hpp"
#include "sync/sync_transport.hpp"

namespace vellum::cli {

/**
 * Note database location: VELLUM_DB_PATH if set, otherwise vellum.db in
 * the application data directory. Creates the parent directory.
 */
[[nodiscard]] QString default_database_path();

struct CommandContext {
    storage::NoteStore& notes;
    storage::SettingsStore& settings;
    sync::SyncTransport& transport;
    // Argon2 cost; the version comes from the stored settings.
    crypto::KdfParams kdf = crypto::KdfParams::interactive();
    sync::RetryPolicy retry = {};
};

// Seed phrase

[[nodiscard]] Result<QString> generate_phrase(int words);
[[nodiscard]] Result<QString> validate_phrase(const QString& phrase);
/** Validate, derive the account id and remember the phrase. */
[[nodiscard]] Result<QString> login(CommandContext& ctx, const QString& phrase);
/** Generate a phrase and log in with it; prints the phrase and the account. */
[[nodiscard]] Result<QString> generate_and_login(CommandContext& ctx, int words);
[[nodiscard]] Result<QString> logout(CommandContext& ctx);

// Sync

[[nodiscard]] Result<QString> health(CommandContext& ctx, const std::optional<QString>& server);
/** One cycle against the selected (or given) server. Err if the cycle failed. */
[[nodiscard]] Result<QString> sync_now(CommandContext& ctx, const std::optional<QString>& server);
[[nodiscard]] QString format_outcome(const sync::SyncOutcome& outcome);

// Notes

[[nodiscard]] Result<QString> list_notes(CommandContext& ctx, bool include_ids);
[[nodiscard]] Result<QString> add_note(CommandContext& ctx, const QString& title, const QString& body);
[[nodiscard]] Result<QString> edit_note(CommandContext& ctx, const QString& id,
                                        const std::optional<QString>& title,
                                        const std::optional<QString>& body);
[[nodiscard]] Result<QString> delete_note(CommandContext& ctx, const QString& id);

// Servers and settings

[[nodiscard]] Result<QString> list_servers(CommandContext& ctx);
[[nodiscard]] Result<QString> add_server(CommandContext& ctx, const QString& url);
[[nodiscard]] Result<QString> remove_server(CommandContext& ctx, const QString& url);
[[nodiscard]] Result<QString> select_server(CommandContext& ctx, const QString& url);
[[nodiscard]] Result<QString> show_settings(CommandContext& ctx);
[[nodiscard]] Result<QString> set_auto_sync(CommandContext& ctx, bool enabled,
                                            std::optional<int> interval_seconds);

} // namespace vellum::cli

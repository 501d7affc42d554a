#include "cli/commands.hpp"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QStringList>
#include <QTextStream>
#include <functional>

#include "client/vellum_client.hpp"
#include "core/note.hpp"
#include "crypto/seed_phrase.hpp"

namespace vellum::cli {

namespace {

Result<QString> fail(Error error) {
    return Result<QString>::err(std::move(error));
}

QString q(const std::string& s) {
    return QString::fromStdString(s);
}

crypto::KdfParams kdf_for(const CommandContext& ctx, const sync::SyncSettings& settings) {
    auto params = ctx.kdf;
    params.version = settings.kdf_version;
    return params;
}

Result<QString> save_settings(CommandContext& ctx, const sync::SyncSettings& settings,
                              QString message) {
    auto saved = ctx.settings.save(settings);
    if (saved.is_err()) {
        return fail(saved.unwrap_err());
    }
    return Result<QString>::ok(std::move(message));
}

Result<QString> update_settings(
    CommandContext& ctx,
    const std::function<Result<sync::SyncSettings, Error>(sync::SyncSettings)>& change,
    const QString& message) {
    auto loaded = ctx.settings.load();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    auto changed = change(std::move(loaded).unwrap());
    if (changed.is_err()) {
        return fail(changed.unwrap_err());
    }
    return save_settings(ctx, changed.unwrap(), message);
}

Result<std::string> resolve_server(const sync::SyncSettings& settings,
                                   const std::optional<QString>& server) {
    if (!server) {
        return Result<std::string>::ok(settings.server_url);
    }
    const auto url = server->toStdString();
    if (!sync::is_valid_server_url(url)) {
        return Result<std::string>::err(
            Error{ErrorKind::InvalidArgument, "Not a valid http(s) server URL: " + url});
    }
    return Result<std::string>::ok(url);
}

Result<Note> find_live(CommandContext& ctx, const QString& id) {
    auto found = ctx.notes.find(id.toStdString());
    if (found.is_err()) {
        return Result<Note>::err(found.unwrap_err());
    }
    const auto& note = found.unwrap();
    if (!note || note->deleted) {
        return Result<Note>::err(
            Error{ErrorKind::InvalidArgument, "No note with id " + id.toStdString()});
    }
    return Result<Note>::ok(*note);
}

} // namespace

QString default_database_path() {
    const auto override_path = qEnvironmentVariable("VELLUM_DB_PATH");
    if (!override_path.isEmpty()) {
        QFileInfo info(override_path);
        QDir dir(info.absolutePath());
        if (!dir.exists()) {
            dir.mkpath(QStringLiteral("."));
        }
        return info.absoluteFilePath();
    }

    const QString data_path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir dir(data_path);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return data_path + QStringLiteral("/vellum.db");
}

// ============================================================================
// Seed phrase
// ============================================================================

Result<QString> generate_phrase(int words) {
    if (words != 12 && words != 24) {
        return fail(Error{ErrorKind::InvalidArgument, "Word count must be 12 or 24"});
    }
    const auto strength = words == 24 ? crypto::SeedStrength::Words24
                                      : crypto::SeedStrength::Words12;
    auto phrase = crypto::SeedPhrase::generate(strength);
    if (phrase.is_err()) {
        return fail(phrase.unwrap_err());
    }
    return Result<QString>::ok(q(phrase.unwrap().to_string()) + QLatin1Char('\n'));
}

Result<QString> validate_phrase(const QString& phrase) {
    auto parsed = crypto::SeedPhrase::parse(phrase.toStdString());
    if (parsed.is_err()) {
        return fail(parsed.unwrap_err());
    }
    return Result<QString>::ok(QStringLiteral("valid (%1 words)\n").arg(static_cast<qulonglong>(parsed.unwrap().word_count())));
}

Result<QString> login(CommandContext& ctx, const QString& phrase) {
    auto loaded = ctx.settings.load();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    auto settings = std::move(loaded).unwrap();

    auto parsed = crypto::SeedPhrase::parse(phrase.toStdString());
    if (parsed.is_err()) {
        return fail(parsed.unwrap_err());
    }
    auto account = crypto::derive_account_id(parsed.unwrap(), kdf_for(ctx, settings));
    if (account.is_err()) {
        return fail(account.unwrap_err());
    }

    settings.seed_phrase = parsed.unwrap().to_string();
    return save_settings(ctx, settings,
                         QStringLiteral("account %1\n").arg(q(account.unwrap())));
}

Result<QString> generate_and_login(CommandContext& ctx, int words) {
    auto generated = generate_phrase(words);
    if (generated.is_err()) {
        return generated;
    }
    const auto phrase = generated.unwrap().trimmed();
    auto account = login(ctx, phrase);
    if (account.is_err()) {
        return account;
    }
    return Result<QString>::ok(phrase + QLatin1Char('\n') + account.unwrap());
}

Result<QString> logout(CommandContext& ctx) {
    sync::SyncSettingsUpdate update;
    update.seed_phrase = std::string{};
    return update_settings(ctx, [&](sync::SyncSettings s) { return sync::merged(std::move(s), update); },
                           QStringLiteral("logged out\n"));
}

// ============================================================================
// Sync
// ============================================================================

Result<QString> health(CommandContext& ctx, const std::optional<QString>& server) {
    auto loaded = ctx.settings.load();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    auto url = resolve_server(loaded.unwrap(), server);
    if (url.is_err()) {
        return fail(url.unwrap_err());
    }
    if (!ctx.transport.health_check(url.unwrap())) {
        return fail(Error{ErrorKind::ServerUnreachable, url.unwrap() + " is not reachable"});
    }
    return Result<QString>::ok(q(url.unwrap()) + QStringLiteral(" ok\n"));
}

QString format_outcome(const sync::SyncOutcome& outcome) {
    QString out;
    QTextStream ts(&out);
    ts << "sync " << sync::to_string(outcome.kind);
    if (outcome.error) {
        ts << ": " << q(outcome.error->describe());
    }
    ts << '\n';
    if (outcome.merge_committed()) {
        ts << "  local changes:  " << outcome.plan.local.size() << '\n';
        ts << "  remote changes: " << outcome.remote_applied << '/' << outcome.plan.remote.size()
           << '\n';
    }
    for (const auto& c : outcome.plan.conflicts) {
        ts << "  conflict " << q(c.id) << ": kept " << (c.kept_local ? "local" : "remote")
           << " copy \"" << q(c.kept.title) << "\"\n";
    }
    for (const auto& skip : outcome.skipped) {
        ts << "  skipped " << q(skip.id) << ": " << to_string(skip.error.kind) << '\n';
    }
    for (const auto& f : outcome.push_failures) {
        ts << "  " << sync::to_string(f.action) << " " << q(f.id) << " failed: "
           << q(f.error.message) << '\n';
    }
    ts.flush();
    return out;
}

Result<QString> sync_now(CommandContext& ctx, const std::optional<QString>& server) {
    auto loaded = ctx.settings.load();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    const auto settings = std::move(loaded).unwrap();
    if (settings.seed_phrase.empty()) {
        return fail(Error{ErrorKind::InvalidArgument, "No seed phrase stored; run 'vellum login' first"});
    }
    auto url = resolve_server(settings, server);
    if (url.is_err()) {
        return fail(url.unwrap_err());
    }

    VellumClient client(ctx.notes, ctx.transport, kdf_for(ctx, settings), ctx.retry);
    auto session = client.initialize_crypto(settings.seed_phrase);
    if (session.is_err()) {
        return fail(session.unwrap_err());
    }

    const auto outcome = client.run_sync_cycle(session.unwrap(), url.unwrap());
    const auto report = format_outcome(outcome);
    if (outcome.kind == sync::OutcomeKind::Failed) {
        return fail(Error{outcome.error ? outcome.error->kind : ErrorKind::Internal,
                          report.trimmed().toStdString()});
    }
    return Result<QString>::ok(report);
}

// ============================================================================
// Notes
// ============================================================================

Result<QString> list_notes(CommandContext& ctx, bool include_ids) {
    auto loaded = ctx.notes.load_all();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }

    QString out;
    QTextStream ts(&out);
    for (const auto& note : live_notes(loaded.unwrap())) {
        if (include_ids) {
            ts << q(note.id) << "  ";
        }
        ts << q(note.modified_at.to_iso_string()) << "  "
           << (note.title.empty() ? QStringLiteral("(untitled)") : q(note.title)) << '\n';
    }
    ts.flush();
    return Result<QString>::ok(out);
}

Result<QString> add_note(CommandContext& ctx, const QString& title, const QString& body) {
    const auto note = create_note(title.toStdString(), body.toStdString());
    auto saved = ctx.notes.save(note);
    if (saved.is_err()) {
        return fail(saved.unwrap_err());
    }
    return Result<QString>::ok(q(note.id) + QLatin1Char('\n'));
}

Result<QString> edit_note(CommandContext& ctx, const QString& id,
                          const std::optional<QString>& title,
                          const std::optional<QString>& body) {
    if (!title && !body) {
        return fail(Error{ErrorKind::InvalidArgument, "Nothing to change; pass --title or --body"});
    }
    auto found = find_live(ctx, id);
    if (found.is_err()) {
        return fail(found.unwrap_err());
    }
    auto note = std::move(found).unwrap();
    if (title && body) note.body = body->toStdString();
    note = title ? with_title(std::move(note), title->toStdString())
                 : with_body(std::move(note), body->toStdString());

    auto saved = ctx.notes.save(note);
    if (saved.is_err()) {
        return fail(saved.unwrap_err());
    }
    return Result<QString>::ok(QStringLiteral("updated %1 (version %2)\n")
                                   .arg(id)
                                   .arg(static_cast<qulonglong>(note.version)));
}

Result<QString> delete_note(CommandContext& ctx, const QString& id) {
    auto found = find_live(ctx, id);
    if (found.is_err()) {
        return fail(found.unwrap_err());
    }
    auto saved = ctx.notes.save(tombstoned(std::move(found).unwrap()));
    if (saved.is_err()) {
        return fail(saved.unwrap_err());
    }
    return Result<QString>::ok(QStringLiteral("deleted %1\n").arg(id));
}

// ============================================================================
// Servers and settings
// ============================================================================

Result<QString> list_servers(CommandContext& ctx) {
    auto loaded = ctx.settings.load();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    const auto& settings = loaded.unwrap();

    QString out;
    QTextStream ts(&out);
    for (const auto& option : sync::server_options(settings)) {
        ts << (option.url == settings.server_url ? "* " : "  ") << q(option.url);
        if (option.label != option.url) {
            ts << "  (" << q(option.label) << ')';
        }
        ts << '\n';
    }
    ts.flush();
    return Result<QString>::ok(out);
}

Result<QString> add_server(CommandContext& ctx, const QString& url) {
    return update_settings(
        ctx,
        [&](sync::SyncSettings s) { return sync::with_custom_server_added(std::move(s), url.toStdString()); },
        QStringLiteral("added and selected %1\n").arg(url));
}

Result<QString> remove_server(CommandContext& ctx, const QString& url) {
    return update_settings(
        ctx,
        [&](sync::SyncSettings s) { return sync::with_custom_server_removed(std::move(s), url.toStdString()); },
        QStringLiteral("removed %1\n").arg(url));
}

Result<QString> select_server(CommandContext& ctx, const QString& url) {
    return update_settings(
        ctx,
        [&](sync::SyncSettings s) { return sync::with_server_selected(std::move(s), url.toStdString()); },
        QStringLiteral("selected %1\n").arg(url));
}

Result<QString> show_settings(CommandContext& ctx) {
    auto loaded = ctx.settings.load();
    if (loaded.is_err()) {
        return fail(loaded.unwrap_err());
    }
    const auto& s = loaded.unwrap();

    QString out;
    QTextStream ts(&out);
    ts << "server:        " << q(s.server_url) << '\n'
       << "custom:        " << s.custom_servers.size() << '\n'
       << "auto sync:     " << (s.auto_sync ? "on" : "off") << '\n'
       << "interval:      " << static_cast<qlonglong>(s.sync_interval.count()) << "s\n"
       << "kdf version:   " << s.kdf_version << '\n'
       << "seed phrase:   " << (s.seed_phrase.empty() ? "not set" : "stored") << '\n';
    ts.flush();
    return Result<QString>::ok(out);
}

Result<QString> set_auto_sync(CommandContext& ctx, bool enabled,
                              std::optional<int> interval_seconds) {
    sync::SyncSettingsUpdate update;
    update.auto_sync = enabled;
    if (interval_seconds) {
        update.sync_interval = std::chrono::seconds(*interval_seconds);
    }
    return update_settings(ctx, [&](sync::SyncSettings s) { return sync::merged(std::move(s), update); },
                           enabled ? QStringLiteral("auto sync on\n") : QStringLiteral("auto sync off\n"));
}

} // namespace vellum::cli

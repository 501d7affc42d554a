#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <memory>
#include <optional>

#include "cli/commands.hpp"
#include "core/logging.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/note_repository.hpp"
#include "storage/settings_store.hpp"
#include "sync/http_transport.hpp"
#include "sync/memory_transport.hpp"

namespace {

const char* kUsage =
    "Commands:\n"
    "  generate [--words 12|24] [--login]\n"
    "                                  print a new seed phrase, optionally logging in with it\n"
    "  validate <phrase>               check a seed phrase\n"
    "  login <phrase>                  store the seed phrase for sync\n"
    "  logout                          forget the stored seed phrase\n"
    "  health [--server url]           probe the sync server\n"
    "  sync [--server url]             run one sync cycle\n"
    "  list [--ids]                    list notes\n"
    "  add --title t [--body b]        create a note\n"
    "  edit <id> [--title t] [--body b]\n"
    "  delete <id>                     delete a note\n"
    "  servers [list|add|remove|select] [url]\n"
    "  settings                        show sync settings\n"
    "  auto-sync on|off [--interval s]\n";

int report(const vellum::Result<QString>& result) {
    if (result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(result.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    QTextStream(stdout) << result.unwrap();
    return 0;
}

int usage_error(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n') << kUsage;
    return 2;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("vellum"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    app.setOrganizationName(QStringLiteral("Vellum"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Vellum - end-to-end encrypted note sync\n\n") + QString::fromLatin1(kUsage));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets VELLUM_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption serverOption(
        QStringList{QStringLiteral("server")},
        QStringLiteral("Server URL for 'health' and 'sync' instead of the selected one."),
        QStringLiteral("url"));
    parser.addOption(serverOption);

    const QCommandLineOption mockOption(
        QStringList{QStringLiteral("mock")},
        QStringLiteral("Use an in-process server instead of HTTP."));
    parser.addOption(mockOption);

    const QCommandLineOption wordsOption(
        QStringList{QStringLiteral("words")},
        QStringLiteral("Seed phrase length for 'generate' (12 or 24)."),
        QStringLiteral("count"),
        QStringLiteral("12"));
    parser.addOption(wordsOption);

    const QCommandLineOption loginOption(
        QStringList{QStringLiteral("login")},
        QStringLiteral("With 'generate', also store the new phrase for sync."));
    parser.addOption(loginOption);

    const QCommandLineOption idsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include note ids in 'list' output."));
    parser.addOption(idsOption);

    const QCommandLineOption titleOption(
        QStringList{QStringLiteral("title")},
        QStringLiteral("Note title for 'add' and 'edit'."),
        QStringLiteral("title"));
    parser.addOption(titleOption);

    const QCommandLineOption bodyOption(
        QStringList{QStringLiteral("body")},
        QStringLiteral("Note body for 'add' and 'edit'."),
        QStringLiteral("body"));
    parser.addOption(bodyOption);

    const QCommandLineOption intervalOption(
        QStringList{QStringLiteral("interval")},
        QStringLiteral("Auto sync interval in seconds."),
        QStringLiteral("seconds"));
    parser.addOption(intervalOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets VELLUM_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"), QStringLiteral("Command to run."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("VELLUM_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("VELLUM_DEBUG_SYNC", "1");
    }
    vellum::configure_debug_categories(parser.isSet(debugSyncOption));

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        return usage_error(QStringLiteral("No command given."));
    }
    const auto command = positional.first();
    const auto arg = [&](int i) -> std::optional<QString> {
        if (positional.size() > i) return positional.at(i);
        return std::nullopt;
    };
    const auto optional_value = [&](const QCommandLineOption& option) -> std::optional<QString> {
        if (parser.isSet(option)) return parser.value(option);
        return std::nullopt;
    };

    // Commands that need no local state.
    bool words_ok = false;
    const int words = parser.value(wordsOption).toInt(&words_ok);
    if (command == QStringLiteral("generate")) {
        if (!words_ok) {
            return usage_error(QStringLiteral("--words must be a number."));
        }
        if (!parser.isSet(loginOption)) {
            return report(vellum::cli::generate_phrase(words));
        }
    }
    if (command == QStringLiteral("validate")) {
        if (positional.size() < 2) {
            return usage_error(QStringLiteral("validate needs a phrase."));
        }
        return report(vellum::cli::validate_phrase(positional.mid(1).join(QLatin1Char(' '))));
    }

    vellum::install_file_logging();
    qCDebug(vellumSyncLog) << "logging to" << vellum::default_log_file_path();

    auto db_result = vellum::storage::Database::open(vellum::cli::default_database_path().toStdString());
    if (db_result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(db_result.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    auto db = std::move(db_result).unwrap();
    auto migrated = vellum::storage::initialize_database(db);
    if (migrated.is_err()) {
        QTextStream(stderr) << QString::fromStdString(migrated.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }

    vellum::storage::NoteRepository notes(db);
    vellum::storage::QSettingsStore settings;
    std::unique_ptr<vellum::sync::SyncTransport> transport;
    if (parser.isSet(mockOption)) {
        transport = std::make_unique<vellum::sync::MemorySyncTransport>();
    } else {
        transport = std::make_unique<vellum::sync::HttpSyncTransport>();
    }

    vellum::cli::CommandContext ctx{notes, settings, *transport};

    if (command == QStringLiteral("generate")) {
        return report(vellum::cli::generate_and_login(ctx, words));
    }
    if (command == QStringLiteral("login")) {
        if (positional.size() < 2) {
            return usage_error(QStringLiteral("login needs a phrase."));
        }
        return report(vellum::cli::login(ctx, positional.mid(1).join(QLatin1Char(' '))));
    }
    if (command == QStringLiteral("logout")) {
        return report(vellum::cli::logout(ctx));
    }
    if (command == QStringLiteral("health")) {
        return report(vellum::cli::health(ctx, optional_value(serverOption)));
    }
    if (command == QStringLiteral("sync")) {
        return report(vellum::cli::sync_now(ctx, optional_value(serverOption)));
    }
    if (command == QStringLiteral("list")) {
        return report(vellum::cli::list_notes(ctx, parser.isSet(idsOption)));
    }
    if (command == QStringLiteral("add")) {
        if (!parser.isSet(titleOption)) {
            return usage_error(QStringLiteral("add needs --title."));
        }
        return report(vellum::cli::add_note(ctx, parser.value(titleOption), parser.value(bodyOption)));
    }
    if (command == QStringLiteral("edit")) {
        const auto id = arg(1);
        if (!id) {
            return usage_error(QStringLiteral("edit needs a note id."));
        }
        return report(vellum::cli::edit_note(ctx, *id, optional_value(titleOption),
                                             optional_value(bodyOption)));
    }
    if (command == QStringLiteral("delete")) {
        const auto id = arg(1);
        if (!id) {
            return usage_error(QStringLiteral("delete needs a note id."));
        }
        return report(vellum::cli::delete_note(ctx, *id));
    }
    if (command == QStringLiteral("servers")) {
        const auto sub = arg(1).value_or(QStringLiteral("list"));
        if (sub == QStringLiteral("list")) {
            return report(vellum::cli::list_servers(ctx));
        }
        const auto url = arg(2);
        if (!url) {
            return usage_error(QStringLiteral("servers %1 needs a URL.").arg(sub));
        }
        if (sub == QStringLiteral("add")) return report(vellum::cli::add_server(ctx, *url));
        if (sub == QStringLiteral("remove")) return report(vellum::cli::remove_server(ctx, *url));
        if (sub == QStringLiteral("select")) return report(vellum::cli::select_server(ctx, *url));
        return usage_error(QStringLiteral("Unknown servers subcommand '%1'.").arg(sub));
    }
    if (command == QStringLiteral("settings")) {
        return report(vellum::cli::show_settings(ctx));
    }
    if (command == QStringLiteral("auto-sync")) {
        const auto state = arg(1);
        if (!state || (*state != QStringLiteral("on") && *state != QStringLiteral("off"))) {
            return usage_error(QStringLiteral("auto-sync needs on or off."));
        }
        std::optional<int> interval;
        if (parser.isSet(intervalOption)) {
            bool ok = false;
            interval = parser.value(intervalOption).toInt(&ok);
            if (!ok) {
                return usage_error(QStringLiteral("--interval must be a number."));
            }
        }
        return report(vellum::cli::set_auto_sync(ctx, *state == QStringLiteral("on"), interval));
    }

    return usage_error(QStringLiteral("Unknown command '%1'.").arg(command));
}

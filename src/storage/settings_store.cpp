#include "storage/settings_store.hpp"
#include "core/logging.hpp"

#include <QSettings>
#include <QStringList>
#include <memory>

namespace vellum::storage {

namespace {

constexpr const char* kServerUrl = "sync/server_url";
constexpr const char* kCustomServers = "sync/custom_servers";
constexpr const char* kAutoSync = "sync/auto_sync";
constexpr const char* kSyncInterval = "sync/sync_interval";
constexpr const char* kSeedPhrase = "sync/seed_phrase";
constexpr const char* kKdfVersion = "sync/kdf_version";

QString key(const char* name) {
    return QString::fromLatin1(name);
}

std::unique_ptr<QSettings> open_settings(const QString& ini_path) {
    if (ini_path.isEmpty()) {
        return std::make_unique<QSettings>();
    }
    return std::make_unique<QSettings>(ini_path, QSettings::IniFormat);
}

Error settings_error(const QSettings& settings, const std::string& what) {
    const char* reason = settings.status() == QSettings::AccessError ? "access denied"
                                                                     : "file is malformed";
    return Error{ErrorKind::Storage, what + " " + settings.fileName().toStdString() + ": " + reason,
                 static_cast<int>(settings.status())};
}

} // namespace

Result<sync::SyncSettings, Error> QSettingsStore::load() {
    auto settings = open_settings(ini_path_);
    if (settings->status() != QSettings::NoError) {
        return Result<sync::SyncSettings, Error>::err(
            settings_error(*settings, "Cannot read settings"));
    }

    const sync::SyncSettings defaults;
    sync::SyncSettings out;
    out.server_url = settings->value(key(kServerUrl), QString::fromStdString(defaults.server_url))
                         .toString().toStdString();
    for (const auto& url : settings->value(key(kCustomServers)).toStringList()) {
        out.custom_servers.push_back(url.toStdString());
    }
    out.auto_sync = settings->value(key(kAutoSync), defaults.auto_sync).toBool();
    out.sync_interval = std::chrono::seconds(
        settings->value(key(kSyncInterval), static_cast<qlonglong>(defaults.sync_interval.count()))
            .toLongLong());
    out.seed_phrase = settings->value(key(kSeedPhrase)).toString().toStdString();
    out.kdf_version = settings->value(key(kKdfVersion), defaults.kdf_version).toInt();

    auto normalized = sync::normalized(out);
    if (!(normalized == out)) {
        qCWarning(vellumStorageLog) << "stored sync settings were inconsistent, repaired";
    }
    return Result<sync::SyncSettings, Error>::ok(std::move(normalized));
}

Result<void, Error> QSettingsStore::save(const sync::SyncSettings& value) {
    auto settings = open_settings(ini_path_);

    QStringList custom;
    for (const auto& url : value.custom_servers) {
        custom << QString::fromStdString(url);
    }
    settings->setValue(key(kServerUrl), QString::fromStdString(value.server_url));
    if (custom.isEmpty()) {
        settings->remove(key(kCustomServers));
    } else {
        settings->setValue(key(kCustomServers), custom);
    }
    settings->setValue(key(kAutoSync), value.auto_sync);
    settings->setValue(key(kSyncInterval), static_cast<qlonglong>(value.sync_interval.count()));
    settings->setValue(key(kSeedPhrase), QString::fromStdString(value.seed_phrase));
    settings->setValue(key(kKdfVersion), value.kdf_version);
    settings->sync();

    if (settings->status() != QSettings::NoError) {
        return Result<void, Error>::err(settings_error(*settings, "Cannot write settings"));
    }
    return Result<void, Error>::ok();
}

} // namespace vellum::storage

#pragma once

#include "sync/sync_settings.hpp"
#include "core/result.hpp"
#include <QString>

namespace vellum::storage {

/**
 * SettingsStore - persists SyncSettings as one object.
 */
class SettingsStore {
public:
    virtual ~SettingsStore() = default;

    /**
     * Stored settings, normalized. Missing keys take their defaults.
     */
    [[nodiscard]] virtual Result<sync::SyncSettings, Error> load() = 0;

    [[nodiscard]] virtual Result<void, Error> save(const sync::SyncSettings& settings) = 0;
};

/**
 * QSettingsStore - SettingsStore on QSettings, keys under "sync/".
 *
 * The default constructor uses the application's native settings
 * (organization and application name set on the QCoreApplication);
 * the path constructor uses an INI file, which tests rely on.
 */
class QSettingsStore : public SettingsStore {
public:
    QSettingsStore() = default;
    explicit QSettingsStore(QString ini_path) : ini_path_(std::move(ini_path)) {}

    [[nodiscard]] Result<sync::SyncSettings, Error> load() override;
    [[nodiscard]] Result<void, Error> save(const sync::SyncSettings& settings) override;

private:
    QString ini_path_;
};

} // namespace vellum::storage

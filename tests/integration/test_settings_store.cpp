#include <catch2/catch_test_macros.hpp>
#include "storage/settings_store.hpp"

#include <QFile>
#include <QSettings>
#include <QTemporaryDir>

using namespace vellum;
using namespace vellum::storage;
using namespace std::chrono_literals;

TEST_CASE("QSettingsStore persists sync settings", "[integration][settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("vellum.ini"));

    SECTION("Missing file yields defaults") {
        QSettingsStore store(path);
        auto loaded = store.load();
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap() == sync::SyncSettings{});
    }

    SECTION("Saved values survive a new store instance") {
        auto settings = sync::with_custom_server_added(sync::SyncSettings{},
                                                       "https://notes.example.org").unwrap();
        settings.auto_sync = true;
        settings.sync_interval = 90s;
        settings.seed_phrase =
            "abandon ability able about above absent absorb abstract absurd abuse access actress";

        {
            QSettingsStore writer(path);
            REQUIRE(writer.save(settings).is_ok());
        }

        QSettingsStore reader(path);
        auto loaded = reader.load();
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap() == settings);

        SECTION("Removing the last custom server round-trips too") {
            auto removed = sync::with_custom_server_removed(settings, "https://notes.example.org").unwrap();
            REQUIRE(reader.save(removed).is_ok());
            REQUIRE(QSettingsStore(path).load().unwrap() == removed);
        }
    }

    SECTION("Inconsistent files are repaired on load") {
        {
            QSettings raw(path, QSettings::IniFormat);
            raw.setValue("sync/server_url", "https://vanished.example");
            raw.setValue("sync/custom_servers", QStringList{"not a url", "http://localhost:3222"});
            raw.setValue("sync/sync_interval", -1);
            raw.setValue("sync/kdf_version", 42);
            raw.sync();
        }

        auto loaded = QSettingsStore(path).load();
        REQUIRE(loaded.is_ok());
        const auto& settings = loaded.unwrap();
        REQUIRE(settings.server_url == sync::default_servers().front().url);
        REQUIRE(settings.custom_servers.empty());
        REQUIRE(settings.sync_interval == 300s);
        REQUIRE(settings.kdf_version == crypto::CURRENT_KDF_VERSION);
    }
}

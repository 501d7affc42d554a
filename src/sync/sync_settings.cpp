#include "sync/sync_settings.hpp"

#include <QString>
#include <QUrl>
#include <algorithm>

namespace vellum::sync {

namespace {

bool is_default_server(std::string_view url) {
    const auto& defaults = default_servers();
    return std::any_of(defaults.begin(), defaults.end(),
                       [&](const ServerOption& s) { return s.url == url; });
}

Result<SyncSettings, Error> invalid(const std::string& message) {
    return Result<SyncSettings, Error>::err(Error{ErrorKind::InvalidArgument, message});
}

} // namespace

const std::vector<ServerOption>& default_servers() {
    static const std::vector<ServerOption> servers = {
        {"Official Server", "https://notes-sync.0xgingi.com"},
        {"Local Server", "http://localhost:3222"},
    };
    return servers;
}

bool is_valid_server_url(std::string_view url) {
    if (url.empty()) {
        return false;
    }
    const QUrl parsed(QString::fromUtf8(url.data(), static_cast<qsizetype>(url.size())),
                      QUrl::StrictMode);
    if (!parsed.isValid() || parsed.isRelative() || parsed.host().isEmpty()) {
        return false;
    }
    const auto scheme = parsed.scheme();
    return scheme == QLatin1String("http") || scheme == QLatin1String("https");
}

std::vector<ServerOption> server_options(const SyncSettings& settings) {
    auto options = default_servers();
    for (const auto& url : settings.custom_servers) {
        options.push_back(ServerOption{url, url});
    }
    return options;
}

bool is_known_server(const SyncSettings& settings, std::string_view url) {
    return is_default_server(url) ||
           std::find(settings.custom_servers.begin(), settings.custom_servers.end(), url) !=
               settings.custom_servers.end();
}

Result<SyncSettings, Error> with_custom_server_added(SyncSettings settings,
                                                     const std::string& url) {
    if (!is_valid_server_url(url)) {
        return invalid("Not a valid http(s) server URL: " + url);
    }
    if (is_known_server(settings, url)) {
        return invalid("Server already listed: " + url);
    }
    settings.custom_servers.push_back(url);
    settings.server_url = url;
    return Result<SyncSettings, Error>::ok(std::move(settings));
}

Result<SyncSettings, Error> with_custom_server_removed(SyncSettings settings,
                                                       const std::string& url) {
    if (is_default_server(url)) {
        return invalid("Default servers cannot be removed: " + url);
    }
    auto& custom = settings.custom_servers;
    const auto it = std::find(custom.begin(), custom.end(), url);
    if (it == custom.end()) {
        return invalid("Unknown server: " + url);
    }
    custom.erase(it);
    if (settings.server_url == url) {
        settings.server_url = default_servers().front().url;
    }
    return Result<SyncSettings, Error>::ok(std::move(settings));
}

Result<SyncSettings, Error> with_server_selected(SyncSettings settings, const std::string& url) {
    if (!is_known_server(settings, url)) {
        return invalid("Unknown server: " + url);
    }
    settings.server_url = url;
    return Result<SyncSettings, Error>::ok(std::move(settings));
}

Result<SyncSettings, Error> merged(SyncSettings settings, const SyncSettingsUpdate& update) {
    if (update.sync_interval) {
        if (update.sync_interval->count() <= 0) {
            return invalid("Sync interval must be positive");
        }
        settings.sync_interval = *update.sync_interval;
    }
    if (update.kdf_version) {
        if (*update.kdf_version < 1 || *update.kdf_version > crypto::CURRENT_KDF_VERSION) {
            return invalid("Unsupported KDF version " + std::to_string(*update.kdf_version));
        }
        settings.kdf_version = *update.kdf_version;
    }
    if (update.auto_sync) {
        settings.auto_sync = *update.auto_sync;
    }
    if (update.seed_phrase) {
        settings.seed_phrase = *update.seed_phrase;
    }
    if (update.server_url) {
        return with_server_selected(std::move(settings), *update.server_url);
    }
    return Result<SyncSettings, Error>::ok(std::move(settings));
}

SyncSettings normalized(SyncSettings settings) {
    std::vector<std::string> custom;
    for (auto& url : settings.custom_servers) {
        if (!is_valid_server_url(url) || is_default_server(url) ||
            std::find(custom.begin(), custom.end(), url) != custom.end()) {
            continue;
        }
        custom.push_back(std::move(url));
    }
    settings.custom_servers = std::move(custom);

    if (!is_known_server(settings, settings.server_url)) {
        settings.server_url = default_servers().front().url;
    }
    if (settings.sync_interval.count() <= 0) {
        settings.sync_interval = SyncSettings{}.sync_interval;
    }
    if (settings.kdf_version < 1 || settings.kdf_version > crypto::CURRENT_KDF_VERSION) {
        settings.kdf_version = crypto::CURRENT_KDF_VERSION;
    }
    return settings;
}

} // namespace vellum::sync

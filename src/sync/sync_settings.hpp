#pragma once

#include "core/result.hpp"
#include "crypto/key_derivation.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::sync {

struct ServerOption {
    std::string label;
    std::string url;

    bool operator==(const ServerOption&) const = default;
};

/**
 * Built-in servers, official first.
 */
[[nodiscard]] const std::vector<ServerOption>& default_servers();

/**
 * Absolute http or https URL with a host.
 */
[[nodiscard]] bool is_valid_server_url(std::string_view url);

/**
 * SyncSettings - everything persisted about sync.
 *
 * Invariant: `server_url` is a default server or one of
 * `custom_servers`, and `custom_servers` holds unique valid URLs that
 * are not default servers. The helpers below keep it; normalized()
 * restores it for values read from disk.
 */
struct SyncSettings {
    std::string server_url = default_servers().front().url;
    std::vector<std::string> custom_servers;
    bool auto_sync = false;
    std::chrono::seconds sync_interval{300};
    std::string seed_phrase;
    int kdf_version = crypto::CURRENT_KDF_VERSION;

    bool operator==(const SyncSettings&) const = default;
};

/**
 * Fields a caller wants to change; unset fields keep their value.
 */
struct SyncSettingsUpdate {
    std::optional<std::string> server_url;
    std::optional<bool> auto_sync;
    std::optional<std::chrono::seconds> sync_interval;
    std::optional<std::string> seed_phrase;
    std::optional<int> kdf_version;
};

/**
 * Defaults first, then custom servers in insertion order.
 */
[[nodiscard]] std::vector<ServerOption> server_options(const SyncSettings& settings);

[[nodiscard]] bool is_known_server(const SyncSettings& settings, std::string_view url);

/**
 * Add and select a custom server. InvalidArgument if the URL is
 * malformed or already listed.
 */
[[nodiscard]] Result<SyncSettings, Error> with_custom_server_added(SyncSettings settings,
                                                                   const std::string& url);

/**
 * Remove a custom server; if it was selected, fall back to the first
 * default. Default servers cannot be removed.
 */
[[nodiscard]] Result<SyncSettings, Error> with_custom_server_removed(SyncSettings settings,
                                                                     const std::string& url);

[[nodiscard]] Result<SyncSettings, Error> with_server_selected(SyncSettings settings,
                                                               const std::string& url);

/**
 * Apply a partial update. Rejects an unknown server, a non-positive
 * interval and an unsupported KDF version.
 */
[[nodiscard]] Result<SyncSettings, Error> merged(SyncSettings settings,
                                                 const SyncSettingsUpdate& update);

/**
 * Drop invalid or duplicate custom servers, reselect the first
 * default if the selection is unknown and reset out-of-range values.
 */
[[nodiscard]] SyncSettings normalized(SyncSettings settings);

} // namespace vellum::sync

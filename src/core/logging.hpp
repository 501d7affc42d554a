#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(vellumSyncLog)
Q_DECLARE_LOGGING_CATEGORY(vellumCryptoLog)
Q_DECLARE_LOGGING_CATEGORY(vellumStorageLog)

namespace vellum {

// Installs a Qt message handler that appends to a log file in the
// application's local data directory, in addition to stderr.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Enables debug output for vellum.sync when VELLUM_DEBUG_SYNC is set
// or `force` is true.
void configure_debug_categories(bool force = false);

} // namespace vellum

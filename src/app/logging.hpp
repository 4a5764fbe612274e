#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(arborEngineLog)
Q_DECLARE_LOGGING_CATEGORY(arborGatewayLog)
Q_DECLARE_LOGGING_CATEGORY(arborDraftLog)
Q_DECLARE_LOGGING_CATEGORY(arborCacheLog)

namespace arbor::app {

// Installs a Qt message handler that appends every message to the log file
// as "<utc time> <level> <category> <message>".
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on debug output for every arbor.* category.
void enable_debug_logging();

} // namespace arbor::app

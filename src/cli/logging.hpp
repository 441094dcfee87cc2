#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(quidCliLog)

namespace quid::cli {

// Line layout used for every log record: time, severity, category, text.
inline constexpr const char* LOG_PATTERN =
    "%{time yyyy-MM-ddTHH:mm:ss.zzz} %{type} %{category} %{message}";

// Installs LOG_PATTERN and a handler writing formatted records to stderr
// and, when QUID_LOG_FILE is set, appending them to that file. Calling it
// again re-reads QUID_LOG_FILE.
void install_logging();

// Enables quid.cli debug and info output. Warnings and above are always on.
void enable_debug_logging();

// Log file path from QUID_LOG_FILE (empty when unset).
QString log_file_path();

} // namespace quid::cli

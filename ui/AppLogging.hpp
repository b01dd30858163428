// Logging categories of the executable and the file sink behind them.
#pragma once
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(fsSession)
Q_DECLARE_LOGGING_CATEGORY(fsTransfer)
Q_DECLARE_LOGGING_CATEGORY(fsOps)
Q_DECLARE_LOGGING_CATEGORY(fsTui)
Q_DECLARE_LOGGING_CATEGORY(fsCore)

namespace filesshui {

// Routes Qt messages into <data dir>/filessh.log and forwards the core log
// into "filessh.core". Returns the log file path, empty when it could not be
// opened (messages are then dropped so the terminal stays clean).
QString installLogging();

QString dataDirectory();

} // namespace filesshui

// File-backed message handler and the bridge from the core log.
#include "AppLogging.hpp"
#include "filessh/RuntimeLogging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>

#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>

Q_LOGGING_CATEGORY(fsSession, "filessh.session")
Q_LOGGING_CATEGORY(fsTransfer, "filessh.transfer")
Q_LOGGING_CATEGORY(fsOps, "filessh.ops")
Q_LOGGING_CATEGORY(fsTui, "filessh.tui")
Q_LOGGING_CATEGORY(fsCore, "filessh.core")

namespace {

QMutex g_logMutex;
QFile *g_logFile = nullptr;

const char *levelTag(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:
        return "D";
    case QtInfoMsg:
        return "I";
    case QtWarningMsg:
        return "W";
    case QtCriticalMsg:
        return "E";
    case QtFatalMsg:
        return "F";
    }
    return "?";
}

void fileMessageHandler(QtMsgType type, const QMessageLogContext &ctx,
                        const QString &msg) {
    QMutexLocker lock(&g_logMutex);
    if (!g_logFile)
        return;
    QTextStream out(g_logFile);
    out << QDateTime::currentDateTime().toString(Qt::ISODateWithMs) << ' '
        << levelTag(type) << ' ' << (ctx.category ? ctx.category : "default")
        << ": " << msg << '\n';
    out.flush();
}

// Hands the core's spdlog records to the "filessh.core" category.
class CoreLogSink : public spdlog::sinks::base_sink<std::mutex> {
protected:
    void sink_it_(const spdlog::details::log_msg &msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        QString line = QString::fromUtf8(formatted.data(),
                                         static_cast<int>(formatted.size()));
        while (line.endsWith(QLatin1Char('\n')) || line.endsWith(QLatin1Char('\r')))
            line.chop(1);
        switch (msg.level) {
        case spdlog::level::trace:
        case spdlog::level::debug:
            qCDebug(fsCore).noquote() << line;
            break;
        case spdlog::level::info:
            qCInfo(fsCore).noquote() << line;
            break;
        case spdlog::level::warn:
            qCWarning(fsCore).noquote() << line;
            break;
        case spdlog::level::err:
        case spdlog::level::critical:
            qCCritical(fsCore).noquote() << line;
            break;
        default:
            break;
        }
    }
    void flush_() override {}
};

spdlog::level::level_enum spdlogLevel(int level) {
    switch (level) {
    case 0:
        return spdlog::level::debug;
    case 2:
        return spdlog::level::warn;
    case 3:
        return spdlog::level::err;
    default:
        return spdlog::level::info;
    }
}

} // namespace

namespace filesshui {

QString dataDirectory() {
    const QString overridden = qEnvironmentVariable("FILESSH_DATA");
    if (!overridden.isEmpty())
        return overridden;
    return QStandardPaths::writableLocation(
        QStandardPaths::AppLocalDataLocation);
}

QString installLogging() {
    const int level = filessh::envLogLevel();
    QString rules;
    if (level > 0)
        rules += QStringLiteral("filessh.*.debug=false\n");
    if (level > 1)
        rules += QStringLiteral("filessh.*.info=false\n");
    if (level > 2)
        rules += QStringLiteral("filessh.*.warning=false\n");
    if (!rules.isEmpty())
        QLoggingCategory::setFilterRules(rules);

    QString path;
    const QString dir = dataDirectory();
    if (!dir.isEmpty() && QDir().mkpath(dir)) {
        auto *f = new QFile(QDir(dir).filePath(QStringLiteral("filessh.log")));
        if (f->open(QIODevice::WriteOnly | QIODevice::Append |
                    QIODevice::Text)) {
            QMutexLocker lock(&g_logMutex);
            g_logFile = f;
            path = f->fileName();
        } else {
            delete f;
        }
    }
    qInstallMessageHandler(fileMessageHandler);

    const auto sink = std::make_shared<CoreLogSink>();
    sink->set_pattern("%v");
    auto core = std::make_shared<spdlog::logger>("filessh", sink);
    core->set_level(spdlogLevel(level));
    spdlog::set_default_logger(core);
    return path;
}

} // namespace filesshui

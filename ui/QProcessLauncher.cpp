#include "QProcessLauncher.hpp"
#include "AppLogging.hpp"

#include <QProcess>
#include <QStringList>

filessh::ProcessOutcome
QProcessLauncher::run(const std::string &program,
                      const std::vector<std::string> &args) {
    filessh::ProcessOutcome out;
    QStringList qargs;
    for (const auto &a : args)
        qargs << QString::fromStdString(a);

    QProcess proc;
    proc.setProcessChannelMode(QProcess::ForwardedChannels);
    proc.setInputChannelMode(QProcess::ForwardedInputChannel);
    proc.start(QString::fromStdString(program), qargs);
    if (!proc.waitForStarted(-1)) {
        out.error = proc.errorString().toStdString();
        qCWarning(fsOps) << "Could not start" << QString::fromStdString(program)
                         << ":" << proc.errorString();
        return out;
    }
    out.started = true;
    proc.waitForFinished(-1);
    out.normalExit = proc.exitStatus() == QProcess::NormalExit;
    out.exitCode = proc.exitCode();
    if (!out.normalExit) {
        out.error = proc.errorString().toStdString();
        qCWarning(fsOps) << QString::fromStdString(program)
                         << "terminated abnormally:" << proc.errorString();
    } else {
        qCDebug(fsOps) << QString::fromStdString(program) << "exited with"
                       << out.exitCode;
    }
    return out;
}

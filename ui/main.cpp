// filessh entry point: parses the command line, loads settings and starts
// the terminal front end on the Qt event loop.
#include "AppLogging.hpp"
#include "AppSettings.hpp"
#include "QProcessLauncher.hpp"
#include "SessionController.hpp"
#include "TerminalView.hpp"
#include "filessh/RuntimeLogging.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>
#include <memory>

namespace {

int fail(const QString &msg) {
    QTextStream err(stderr);
    err << "filessh: " << msg << '\n';
    return 2;
}

QString expandHome(const QString &p) {
    if (p.startsWith(QLatin1Char('~')))
        return QDir::homePath() + p.mid(1);
    return p;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("filessh"));
    QCoreApplication::setApplicationName(QStringLiteral("filessh"));
    QCoreApplication::setApplicationVersion(QStringLiteral(FILESSH_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Browse, download and change files on a remote host "
                       "over SFTP."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption portOpt(
        {QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("SSH port (default 22)."), QStringLiteral("port"),
        QStringLiteral("22"));
    const QCommandLineOption userOpt(
        {QStringLiteral("u"), QStringLiteral("username")},
        QStringLiteral("Remote user name (default root)."),
        QStringLiteral("name"), QStringLiteral("root"));
    const QCommandLineOption keyOpt(
        {QStringLiteral("k"), QStringLiteral("private-key")},
        QStringLiteral("Private key file (required)."), QStringLiteral("file"));
    const QCommandLineOption certOpt(
        {QStringLiteral("o"), QStringLiteral("openssh-certificate")},
        QStringLiteral("OpenSSH certificate presented with the key."),
        QStringLiteral("file"));
    const QCommandLineOption jobsOpt(
        {QStringLiteral("j"), QStringLiteral("jobs")},
        QStringLiteral("Concurrent transfers per download (1-16)."),
        QStringLiteral("n"));
    const QCommandLineOption hiddenOpt(
        QStringLiteral("show-hidden"),
        QStringLiteral("Show entries whose name starts with a dot."));
    parser.addOption(portOpt);
    parser.addOption(userOpt);
    parser.addOption(keyOpt);
    parser.addOption(certOpt);
    parser.addOption(jobsOpt);
    parser.addOption(hiddenOpt);
    parser.addPositionalArgument(QStringLiteral("host"),
                                 QStringLiteral("Remote host."));
    parser.addPositionalArgument(
        QStringLiteral("path"),
        QStringLiteral("Directory to start in (default: the login directory)."),
        QStringLiteral("[path]"));
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty() || positional.size() > 2)
        return fail(QStringLiteral("expected <host> [path]; see --help"));
    if (!parser.isSet(keyOpt))
        return fail(QStringLiteral("a private key is required (-k)"));

    const QString logFile = filesshui::installLogging();
    filesshui::AppSettings settings = filesshui::loadSettings();

    filessh::SessionOptions opt;
    opt.host = positional.at(0).toStdString();
    bool ok = false;
    const uint port = parser.value(portOpt).toUInt(&ok);
    if (!ok || port == 0 || port > 65535)
        return fail(QStringLiteral("invalid port '%1'").arg(parser.value(portOpt)));
    opt.port = static_cast<std::uint16_t>(port);
    opt.username = parser.value(userOpt).toStdString();
    const QString key = expandHome(parser.value(keyOpt));
    if (!QFileInfo::exists(key))
        return fail(QStringLiteral("private key not found: %1").arg(key));
    opt.private_key_path = key.toStdString();
    const QByteArray passphrase = qgetenv("FILESSH_KEY_PASSPHRASE");
    if (!passphrase.isEmpty())
        opt.private_key_passphrase = passphrase.toStdString();
    if (parser.isSet(certOpt)) {
        const QString cert = expandHome(parser.value(certOpt));
        if (!QFileInfo::exists(cert))
            return fail(QStringLiteral("certificate not found: %1").arg(cert));
        opt.certificate_path = cert.toStdString();
    }
    opt.known_hosts_policy = settings.knownHostsPolicy;

    if (parser.isSet(jobsOpt)) {
        const int n = parser.value(jobsOpt).toInt(&ok);
        if (!ok)
            return fail(QStringLiteral("invalid job count '%1'")
                            .arg(parser.value(jobsOpt)));
        settings.concurrency = filesshui::clampConcurrency(n);
    }
    if (parser.isSet(hiddenOpt))
        settings.showHidden = true;

    qCInfo(fsTui) << "filessh" << FILESSH_VERSION << "starting; log file"
                  << logFile;
    if (filessh::sensitiveLoggingEnabled())
        qCInfo(fsSession) << "Target" << positional.at(0) << "user"
                          << parser.value(userOpt);

    ControllerOptions copt;
    copt.concurrency = settings.concurrency;
    copt.showHidden = settings.showHidden;
    copt.executor.editorCommand = settings.editor.toStdString();
    copt.executor.sshProgram = settings.sshProgram.toStdString();

    const std::string startPath =
        positional.size() > 1 ? positional.at(1).toStdString() : std::string(".");
    SessionController controller(opt, startPath, copt,
                                 std::make_shared<QProcessLauncher>());
    TerminalView view(&controller, settings);
    view.start();
    controller.connectToHost();
    return app.exec();
}

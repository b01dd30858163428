#include "AppSettings.hpp"
#include "AppLogging.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace filesshui {

int clampConcurrency(int n) {
    if (n < 1)
        return 1;
    if (n > 16)
        return 16;
    return n;
}

QString defaultEditor() {
    QString ed = qEnvironmentVariable("VISUAL").trimmed();
    if (ed.isEmpty())
        ed = qEnvironmentVariable("EDITOR").trimmed();
    if (ed.isEmpty())
        ed = QStringLiteral("vi");
    return ed;
}

QString defaultDownloadDir() {
    QString p =
        QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (p.isEmpty())
        p = QDir::homePath() + "/Downloads";
    return p;
}

bool parseKnownHostsPolicy(const QString &text,
                           filessh::KnownHostsPolicy &out) {
    const QString v = text.trimmed().toLower();
    if (v == "strict") {
        out = filessh::KnownHostsPolicy::Strict;
        return true;
    }
    if (v == "accept-new" || v == "acceptnew" || v == "tofu") {
        out = filessh::KnownHostsPolicy::AcceptNew;
        return true;
    }
    if (v == "off" || v == "none") {
        out = filessh::KnownHostsPolicy::Off;
        return true;
    }
    return false;
}

QString knownHostsPolicyName(filessh::KnownHostsPolicy p) {
    switch (p) {
    case filessh::KnownHostsPolicy::Strict:
        return QStringLiteral("strict");
    case filessh::KnownHostsPolicy::AcceptNew:
        return QStringLiteral("accept-new");
    case filessh::KnownHostsPolicy::Off:
        return QStringLiteral("off");
    }
    return QStringLiteral("accept-new");
}

AppSettings loadSettings() {
    AppSettings out;
    QSettings s("filessh", "filessh");
    out.concurrency =
        clampConcurrency(s.value("transfer/concurrency", 4).toInt());
    out.showHidden = s.value("view/showHidden", false).toBool();
    out.editor = s.value("edit/editor").toString().trimmed();
    if (out.editor.isEmpty())
        out.editor = defaultEditor();
    out.downloadDir = s.value("transfer/downloadDir").toString().trimmed();
    if (out.downloadDir.isEmpty())
        out.downloadDir = defaultDownloadDir();
    const QString policy =
        s.value("ssh/knownHostsPolicy", QStringLiteral("accept-new"))
            .toString();
    if (!parseKnownHostsPolicy(policy, out.knownHostsPolicy)) {
        qCWarning(fsSession) << "Unknown ssh/knownHostsPolicy" << policy
                             << "- using accept-new";
        out.knownHostsPolicy = filessh::KnownHostsPolicy::AcceptNew;
    }
    out.sshProgram = s.value("ssh/program", QStringLiteral("ssh"))
                         .toString()
                         .trimmed();
    if (out.sshProgram.isEmpty())
        out.sshProgram = QStringLiteral("ssh");
    return out;
}

void saveShowHidden(bool show) {
    QSettings s("filessh", "filessh");
    s.setValue("view/showHidden", show);
}

} // namespace filesshui

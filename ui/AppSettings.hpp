// Persistent preferences (QSettings "filessh"/"filessh").
#pragma once
#include "filessh/SftpTypes.hpp"

#include <QString>

namespace filesshui {

struct AppSettings {
    int concurrency = 4; // download workers per job, 1..16
    bool showHidden = false;
    QString editor;      // may carry arguments
    QString downloadDir;
    filessh::KnownHostsPolicy knownHostsPolicy =
        filessh::KnownHostsPolicy::AcceptNew;
    QString sshProgram = QStringLiteral("ssh");
};

AppSettings loadSettings();
void saveShowHidden(bool show);

int clampConcurrency(int n);
QString defaultEditor();
QString defaultDownloadDir();

// "strict", "accept-new" or "off".
bool parseKnownHostsPolicy(const QString &text,
                           filessh::KnownHostsPolicy &out);
QString knownHostsPolicyName(filessh::KnownHostsPolicy p);

} // namespace filesshui

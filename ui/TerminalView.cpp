// Command parsing and rendering for the terminal front end.
#include "TerminalView.hpp"
#include "AppLogging.hpp"
#include "SessionController.hpp"
#include "TimeUtils.hpp"
#include "filessh/RemotePath.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QProcess>
#include <QSocketNotifier>
#include <QStringDecoder>
#include <QTextStream>

#include <type_traits>
#include <unistd.h>
#include <variant>

namespace {

QTextStream &out() {
    static QTextStream s(stdout);
    return s;
}

QString q(const std::string &s) { return QString::fromStdString(s); }

QString kindLabel(const filessh::FileInfo &info) {
    switch (info.kind) {
    case filessh::EntryKind::Directory:
        return QStringLiteral("directory");
    case filessh::EntryKind::Symlink:
        return QStringLiteral("symlink");
    case filessh::EntryKind::Other:
        return QStringLiteral("other");
    case filessh::EntryKind::File:
        break;
    }
    return QStringLiteral("file");
}

QString progressLine(const filessh::JobSnapshot &j) {
    const auto &p = j.progress;
    const QString more = p.enumerationDone ? QString() : QStringLiteral("+");
    QString files = QStringLiteral("%1/%2%3 files")
                        .arg(p.filesDone)
                        .arg(p.filesDiscovered)
                        .arg(more);
    if (p.filesFailed)
        files += QStringLiteral(", %1 failed").arg(p.filesFailed);
    return QStringLiteral("[%1] %2: %3, %4 of %5%6")
        .arg(j.workId)
        .arg(q(j.remoteRoot), files, filesshui::humanSize(p.bytesDone),
             filesshui::humanSize(p.bytesDiscovered), more);
}

} // namespace

TerminalView::TerminalView(SessionController *controller,
                           filesshui::AppSettings settings, QObject *parent)
    : QObject(parent), ctl_(controller), settings_(std::move(settings)) {
    connect(ctl_, &SessionController::connected, this,
            &TerminalView::onConnected);
    connect(ctl_, &SessionController::connectFailed, this,
            &TerminalView::onConnectFailed);
    connect(ctl_, &SessionController::viewChanged, this,
            &TerminalView::onViewChanged);
    connect(ctl_, &SessionController::progressTick, this,
            &TerminalView::onProgressTick);
    connect(ctl_, &SessionController::externalProcessStarted, this,
            &TerminalView::onExternalStarted);
    connect(ctl_, &SessionController::externalProcessFinished, this,
            &TerminalView::onExternalFinished);
    connect(ctl_, &SessionController::previewReady, this,
            &TerminalView::onPreview);
    ctl_->setHostKeyPrompt(
        [this](const QString &prompt) { return askYesNo(prompt); });
}

void TerminalView::start() {
    notifier_ = new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this);
    connect(notifier_, &QSocketNotifier::activated, this,
            &TerminalView::onReadable);
    const auto &opt = ctl_->sessionOptions();
    print(tr("Connecting to %1@%2:%3 ...")
              .arg(q(opt.username), q(opt.host))
              .arg(opt.port));
}

void TerminalView::print(const QString &text) {
    out() << text << '\n';
    out().flush();
}

void TerminalView::printPrompt() {
    if (!ready_ || external_)
        return;
    out() << "filessh:" << q(ctl_->currentDirectory()) << "> ";
    out().flush();
}

bool TerminalView::takeLine(QString &line) {
    const int nl = buffer_.indexOf('\n');
    if (nl < 0)
        return false;
    line = QString::fromUtf8(buffer_.left(nl)).trimmed();
    buffer_.remove(0, nl + 1);
    return true;
}

bool TerminalView::askYesNo(const QString &prompt) {
    if (notifier_)
        notifier_->setEnabled(false);
    out() << '\n' << prompt;
    out().flush();
    QString line;
    bool gotLine = takeLine(line);
    while (!gotLine) {
        char buf[256];
        const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0)
            break;
        buffer_.append(buf, static_cast<int>(n));
        gotLine = takeLine(line);
    }
    if (notifier_)
        notifier_->setEnabled(!external_);
    const QString answer = line.toLower();
    return gotLine && (answer == "y" || answer == "yes");
}

void TerminalView::onReadable() {
    char buf[4096];
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n <= 0) {
        qCInfo(fsTui) << "stdin closed";
        quit();
        return;
    }
    buffer_.append(buf, static_cast<int>(n));
    QString line;
    while (!external_ && takeLine(line)) {
        if (!line.isEmpty())
            handleLine(line);
        if (!external_)
            printPrompt();
    }
}

void TerminalView::onConnected(const QString &home) {
    ready_ = true;
    connectedOnce_ = true;
    shownDir_.clear();
    pendingListing_ = home.toStdString();
    print(tr("Connected. Type 'help' for commands."));
    onViewChanged();
}

void TerminalView::onConnectFailed(const QString &message) {
    print(tr("Connection failed: %1").arg(message));
    if (!connectedOnce_) {
        QCoreApplication::exit(1);
        return;
    }
    ready_ = true;
    print(tr("Use 'reconnect' to try again or 'quit' to leave."));
    printPrompt();
}

void TerminalView::onExternalStarted() {
    external_ = true;
    if (notifier_)
        notifier_->setEnabled(false);
}

void TerminalView::onExternalFinished() {
    external_ = false;
    buffer_.clear();
    if (notifier_)
        notifier_->setEnabled(true);
    onViewChanged();
    printPrompt();
}

void TerminalView::onViewChanged() {
    if (external_)
        return;
    for (const auto &m : ctl_->drainMessages())
        print(q(m));

    const filessh::ViewSnapshot v = ctl_->snapshot();
    printState(v);

    if (!ctl_->cache())
        return;
    if (pendingListing_ && ctl_->cache()->isLoaded(*pendingListing_)) {
        const std::string dir = *pendingListing_;
        pendingListing_.reset();
        printListing(dir);
    } else if (v.directory != shownDir_ && v.directoryLoaded) {
        printListing(v.directory);
    }
}

void TerminalView::printState(const filessh::ViewSnapshot &v) {
    std::string key = filessh::stateName(v.state);
    std::visit(
        [&](const auto &st) {
            using T = std::decay_t<decltype(st)>;
            if constexpr (std::is_same_v<T, filessh::ConfirmingDestructiveOp>)
                key += st.prompt;
            else if constexpr (std::is_same_v<T, filessh::ViewingMetadata>)
                key += st.node.path;
            else if constexpr (std::is_same_v<T, filessh::EditingExternally>)
                key += std::to_string(st.workId);
            else if constexpr (std::is_same_v<T, filessh::Downloading>)
                key += std::to_string(st.workId);
            else if constexpr (std::is_same_v<T, filessh::ErrorDisplayed>)
                key += st.message;
        },
        v.state);
    if (key == lastStateKey_)
        return;
    lastStateKey_ = key;

    std::visit(
        [&](const auto &st) {
            using T = std::decay_t<decltype(st)>;
            if constexpr (std::is_same_v<T, filessh::ConfirmingDestructiveOp>) {
                print(q(st.prompt) + tr(" [yes/no]"));
            } else if constexpr (std::is_same_v<T, filessh::ViewingMetadata>) {
                const auto &i = st.node.info;
                print(q(st.node.path));
                print(tr("  type:     %1").arg(kindLabel(i)));
                print(tr("  size:     %1 (%2 bytes)")
                          .arg(filesshui::humanSize(i.size))
                          .arg(i.size));
                print(tr("  modified: %1")
                          .arg(filesshui::localShortTime(i.mtime)));
                print(tr("  mode:     %1 (%2)")
                          .arg(filesshui::modeString(i.mode))
                          .arg(i.mode & 07777, 4, 8, QLatin1Char('0')));
                print(tr("  owner:    %1:%2").arg(i.uid).arg(i.gid));
                print(tr("(ok to close)"));
            } else if constexpr (std::is_same_v<T, filessh::Downloading>) {
                print(tr("Downloading %1 as job %2 ('cancel' to stop)")
                          .arg(q(st.remoteRoot))
                          .arg(st.workId));
            } else if constexpr (std::is_same_v<T, filessh::ErrorDisplayed>) {
                print(tr("error: %1 (ok to dismiss)").arg(q(st.message)));
            }
        },
        v.state);
}

void TerminalView::printListing(const std::string &dir) {
    const filessh::TreeCache *cache = ctl_->cache();
    if (!cache)
        return;
    if (filessh::normalizeRemotePath(dir) == ctl_->currentDirectory())
        shownDir_ = ctl_->currentDirectory();
    print(q(dir) + ":");
    if (cache->children(dir).empty())
        print(cache->nameFilter().empty() ? tr("  (empty)")
                                          : tr("  (nothing matches '%1')")
                                                .arg(q(cache->nameFilter())));
    printTree(dir, 1);
}

void TerminalView::printTree(const std::string &dir, int depth) {
    const filessh::TreeCache *cache = ctl_->cache();
    for (const filessh::RemoteNode *n : cache->children(dir)) {
        const auto &i = n->info;
        QString name = q(i.name);
        if (i.isDir())
            name += '/';
        else if (i.kind == filessh::EntryKind::Symlink)
            name += '@';
        print(QStringLiteral("%1%2 %3 %4  %5")
                  .arg(QString(depth * 2, QLatin1Char(' ')),
                       filesshui::modeString(i.mode),
                       filesshui::humanSize(i.size).rightJustified(10),
                       filesshui::localShortTime(i.mtime).leftJustified(16),
                       name));
        if (i.isDir() && n->childState == filessh::ChildState::Loaded)
            printTree(n->path, depth + 1);
    }
}

void TerminalView::printJobs() {
    const auto jobs = ctl_->jobSnapshots();
    bool any = false;
    for (const auto &j : jobs) {
        print(progressLine(j) + (j.foreground ? tr(" (foreground)") : QString()));
        any = true;
    }
    for (const auto &w : ctl_->machine().activeWork()) {
        if (w.kind != filessh::ActiveWork::Kind::Operation)
            continue;
        print(QStringLiteral("[%1] %2").arg(w.id).arg(q(w.description)));
        any = true;
    }
    if (!any)
        print(tr("No active jobs."));
}

void TerminalView::onProgressTick() {
    if (external_)
        return;
    const auto fg = ctl_->machine().foregroundJob();
    if (!fg || !ctl_->machine().is<filessh::Downloading>())
        return;
    for (const auto &j : ctl_->jobSnapshots()) {
        if (j.workId == *fg)
            print(progressLine(j));
    }
}

void TerminalView::onPreview(const QString &path, const QByteArray &data,
                             bool truncated) {
    if (external_)
        return;
    auto decoder = QStringDecoder(QStringDecoder::Utf8);
    const QString text = decoder(data);
    if (decoder.hasError() || data.contains('\0')) {
        print(tr("%1: binary content, %2 shown")
                  .arg(path, filesshui::humanSize(data.size())));
    } else {
        out() << text;
        if (!text.endsWith('\n'))
            out() << '\n';
        out().flush();
    }
    if (truncated)
        print(tr("-- preview limited to the first %1 --")
                  .arg(filesshui::humanSize(data.size())));
    printPrompt();
}

void TerminalView::printHelp() {
    print(tr("Navigation:  ls [dir]  cd <dir>  up  open <dir>  collapse <dir>  refresh"));
    print(tr("View:        info <name>  cat <name>  hidden  filter [text]"));
    print(tr("Changes:     rm <name>  mv <name> <new>  touch <name>  mkdir <name>"));
    print(tr("External:    edit <name>  shell"));
    print(tr("Transfers:   get <name> [dest]  jobs  cancel [job]"));
    print(tr("Prompts:     yes  no  ok"));
    print(tr("Session:     reconnect  help  quit"));
}

void TerminalView::handleLine(const QString &line) {
    const QStringList args = QProcess::splitCommand(line);
    if (args.isEmpty())
        return;
    const QString cmd = args.front().toLower();
    const auto arg = [&args](int i) {
        return i < args.size() ? args.at(i).toStdString() : std::string();
    };
    const auto need = [&](int n) {
        if (args.size() > n)
            return true;
        print(tr("usage: %1 needs %n argument(s)", nullptr, n).arg(cmd));
        return false;
    };
    qCDebug(fsTui) << "command" << cmd;

    if (cmd == "quit" || cmd == "exit") {
        quit();
        return;
    }
    if (cmd == "help" || cmd == "?") {
        printHelp();
        return;
    }
    if (cmd == "reconnect") {
        ready_ = false;
        lastStateKey_.clear();
        print(tr("Reconnecting ..."));
        ctl_->reconnect();
        return;
    }
    if (!ctl_->cache()) {
        print(ctl_->isConnecting() ? tr("Still connecting.")
                                   : tr("Not connected; use 'reconnect'."));
        return;
    }

    if (cmd == "ls") {
        const std::string dir = ctl_->resolve(arg(1));
        if (ctl_->cache()->isLoaded(dir)) {
            printListing(dir);
        } else {
            pendingListing_ = dir;
            ctl_->expand(dir);
        }
    } else if (cmd == "cd") {
        ctl_->changeDirectory(args.size() > 1 ? arg(1) : std::string("/"));
    } else if (cmd == "up") {
        ctl_->goUp();
    } else if (cmd == "open") {
        if (need(1)) {
            pendingListing_ = ctl_->currentDirectory();
            ctl_->expand(arg(1));
        }
    } else if (cmd == "collapse") {
        if (need(1))
            ctl_->collapse(arg(1));
    } else if (cmd == "refresh") {
        pendingListing_ = ctl_->currentDirectory();
        ctl_->refresh();
    } else if (cmd == "info") {
        if (need(1))
            ctl_->showInfo(arg(1));
    } else if (cmd == "cat") {
        if (need(1))
            ctl_->preview(arg(1));
    } else if (cmd == "get") {
        if (need(1)) {
            QString dest = args.size() > 2 ? args.at(2) : settings_.downloadDir;
            if (dest.startsWith('~'))
                dest = QDir::homePath() + dest.mid(1);
            ctl_->download(arg(1), QDir(dest).absolutePath().toStdString());
        }
    } else if (cmd == "rm") {
        if (need(1))
            ctl_->submit(filessh::DeleteRequest{ctl_->resolve(arg(1))});
    } else if (cmd == "mv") {
        if (need(2))
            ctl_->submit(filessh::MoveRequest{ctl_->resolve(arg(1)),
                                              ctl_->resolve(arg(2)), false});
    } else if (cmd == "touch") {
        if (need(1))
            ctl_->submit(filessh::CreateFileRequest{ctl_->resolve(arg(1))});
    } else if (cmd == "mkdir") {
        if (need(1))
            ctl_->submit(
                filessh::CreateDirectoryRequest{ctl_->resolve(arg(1))});
    } else if (cmd == "edit") {
        if (need(1))
            ctl_->submit(filessh::EditFileRequest{ctl_->resolve(arg(1))});
    } else if (cmd == "shell") {
        ctl_->submit(filessh::SpawnShellRequest{ctl_->currentDirectory()});
    } else if (cmd == "hidden") {
        const bool show = !ctl_->cache()->showHidden();
        filesshui::saveShowHidden(show);
        pendingListing_ = ctl_->currentDirectory();
        ctl_->setShowHidden(show);
        print(show ? tr("Hidden entries shown.") : tr("Hidden entries hidden."));
    } else if (cmd == "filter") {
        pendingListing_ = ctl_->currentDirectory();
        ctl_->setNameFilter(args.size() > 1 ? arg(1) : std::string());
    } else if (cmd == "jobs") {
        printJobs();
    } else if (cmd == "cancel") {
        std::optional<std::uint64_t> id;
        if (args.size() > 1) {
            bool ok = false;
            id = args.at(1).toULongLong(&ok);
            if (!ok) {
                print(tr("cancel: '%1' is not a job number").arg(args.at(1)));
                return;
            }
        }
        if (!ctl_->cancel(id))
            print(tr("Nothing to cancel."));
    } else if (cmd == "yes" || cmd == "y") {
        if (!ctl_->machine().is<filessh::ConfirmingDestructiveOp>())
            print(tr("Nothing to confirm."));
        ctl_->confirm();
    } else if (cmd == "no" || cmd == "n") {
        ctl_->reject();
    } else if (cmd == "ok") {
        ctl_->dismiss();
    } else {
        print(tr("Unknown command '%1'; try 'help'.").arg(cmd));
    }
}

void TerminalView::quit() {
    if (notifier_)
        notifier_->setEnabled(false);
    ready_ = false;
    QCoreApplication::quit();
}

// Connection, directory loads, operations and downloads on worker threads,
// with every result folded back into the cache and the machine on the Qt
// event loop.
#include "SessionController.hpp"
#include "AppLogging.hpp"
#include "filessh/Libssh2SftpClient.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/RuntimeLogging.hpp"

#include <QCoreApplication>
#include <QMetaObject>
#include <QPointer>

#include <exception>
#include <thread>
#include <utility>
#include <variant>

namespace {

constexpr std::size_t kPreviewBytes = 64 * 1024;

bool isExternal(const filessh::OperationRequest &req) {
    return std::holds_alternative<filessh::EditFileRequest>(req) ||
           std::holds_alternative<filessh::SpawnShellRequest>(req);
}

QString logPath(const std::string &p) {
    if (filessh::sensitiveLoggingEnabled())
        return QString::fromStdString(p);
    return QStringLiteral("<redacted>");
}

} // namespace

SessionController::SessionController(
    filessh::SessionOptions opt, std::string initialPath,
    ControllerOptions copt, std::shared_ptr<filessh::ProcessLauncher> launcher,
    QObject *parent)
    : QObject(parent), opt_(std::move(opt)),
      initialPath_(std::move(initialPath)), copt_(std::move(copt)),
      launcher_(std::move(launcher)) {
    if (initialPath_.empty())
        initialPath_ = ".";
    progressTimer_.setInterval(1000);
    connect(&progressTimer_, &QTimer::timeout, this,
            &SessionController::progressTick);
}

SessionController::~SessionController() {
    progressTimer_.stop();
    ++generation_;
    for (auto &kv : opCancel_)
        kv.second->store(true);
    // Each job cancels and joins its workers.
    downloads_.clear();
}

void SessionController::connectToHost() {
    if (connecting_)
        return;
    connecting_ = true;
    const std::uint64_t gen = ++generation_;

    filessh::SessionOptions opt = opt_;
    QPointer<SessionController> self(this);
    opt.hostkey_confirm_cb = [self](const std::string &h, std::uint16_t p,
                                    const std::string &alg,
                                    const std::string &fp) {
        bool accepted = false;
        if (!self)
            return false;
        QMetaObject::invokeMethod(
            self.data(),
            [&] {
                if (self)
                    accepted = self->confirmHostKey(h, p, alg, fp);
            },
            Qt::BlockingQueuedConnection);
        return accepted;
    };

    qCInfo(fsSession) << "Connecting to" << logPath(opt.host) << "port"
                      << opt.port;
    std::thread([self, gen, opt = std::move(opt),
                 path = initialPath_]() mutable {
        filessh::SftpError err;
        std::string home;
        std::shared_ptr<filessh::Session> session;
        try {
            session = filessh::Session::open(
                std::make_unique<filessh::Libssh2SftpClient>(), opt, err);
            if (session && !session->canonicalize(path, home, err)) {
                // A bad start path is not fatal: fall back to the login
                // directory and report it.
                filessh::SftpError fallbackErr;
                if (err.kind == filessh::ErrorKind::Remote &&
                    session->canonicalize(".", home, fallbackErr)) {
                    err.message = path + ": " + err.message;
                } else {
                    if (fallbackErr.isSet())
                        err = fallbackErr;
                    session.reset();
                }
            }
        } catch (const std::exception &ex) {
            err = filessh::SftpError::connection(
                std::string("connection exception: ") + ex.what());
            session.reset();
        }
        QMetaObject::invokeMethod(
            qApp,
            [self, gen, session, home, err]() {
                if (!self || gen != self->generation_)
                    return;
                self->finishConnect(session, home, err);
            },
            Qt::QueuedConnection);
    }).detach();
}

void SessionController::finishConnect(std::shared_ptr<filessh::Session> session,
                                      const std::string &home,
                                      const filessh::SftpError &err) {
    connecting_ = false;
    if (!session) {
        qCWarning(fsSession) << "Connection failed:"
                             << QString::fromStdString(filessh::describe(err));
        emit connectFailed(QString::fromStdString(filessh::describe(err)));
        return;
    }
    session_ = std::move(session);
    executor_ = std::make_shared<filessh::OperationExecutor>(
        session_, launcher_, copt_.executor);
    cache_ = std::make_unique<filessh::TreeCache>(home);
    cache_->setShowHidden(copt_.showHidden);
    cwd_ = cache_->rootPath();
    machine_.reset();
    qCInfo(fsSession) << "Connected; browsing" << logPath(cwd_);
    if (err.isSet())
        machine_.showError("start directory unavailable (" +
                           filessh::describe(err) + "); using " + cwd_);
    emit connected(QString::fromStdString(cwd_));
    loadDirectory(cwd_);
}

void SessionController::reconnect() {
    if (connecting_)
        return;
    qCInfo(fsSession) << "Reconnecting";
    ++generation_;
    for (auto &kv : opCancel_)
        kv.second->store(true);
    opCancel_.clear();
    downloads_.clear();
    loading_.clear();
    updateTimer();
    if (!cwd_.empty())
        initialPath_ = cwd_;
    executor_.reset();
    session_.reset();
    cache_.reset();
    machine_.reset();
    connectToHost();
}

std::string SessionController::resolve(const std::string &nameOrPath) const {
    if (!nameOrPath.empty() && nameOrPath.front() == '/')
        return filessh::normalizeRemotePath(nameOrPath);
    if (nameOrPath.empty() || nameOrPath == ".")
        return cwd_;
    std::string cur = cwd_;
    std::size_t pos = 0;
    while (pos <= nameOrPath.size()) {
        const std::size_t slash = nameOrPath.find('/', pos);
        const std::string part = nameOrPath.substr(
            pos, slash == std::string::npos ? std::string::npos : slash - pos);
        if (part == "..")
            cur = filessh::parentRemotePath(cur);
        else if (!part.empty() && part != ".")
            cur = filessh::joinRemotePath(cur, part);
        if (slash == std::string::npos)
            break;
        pos = slash + 1;
    }
    return filessh::normalizeRemotePath(cur);
}

void SessionController::loadDirectory(const std::string &path,
                                      std::function<void(bool)> then) {
    if (!isConnected()) {
        if (then)
            then(false);
        return;
    }
    const std::string dir = filessh::normalizeRemotePath(path);
    auto it = loading_.find(dir);
    if (it != loading_.end()) {
        if (then)
            it->second.push_back(std::move(then));
        return;
    }
    auto &waiters = loading_[dir];
    if (then)
        waiters.push_back(std::move(then));

    const std::uint64_t gen = generation_;
    QPointer<SessionController> self(this);
    std::shared_ptr<filessh::Session> session = session_;
    qCDebug(fsSession) << "Listing" << logPath(dir);
    std::thread([self, gen, session, dir]() {
        std::vector<filessh::FileInfo> entries;
        filessh::SftpError err;
        session->list(dir, entries, err);
        QMetaObject::invokeMethod(
            qApp,
            [self, gen, dir, entries, err]() {
                if (!self || gen != self->generation_)
                    return;
                self->finishLoad(dir, entries, err);
            },
            Qt::QueuedConnection);
    }).detach();
}

void SessionController::finishLoad(const std::string &path,
                                   const std::vector<filessh::FileInfo> &entries,
                                   const filessh::SftpError &err) {
    std::vector<std::function<void(bool)>> waiters;
    auto it = loading_.find(path);
    if (it != loading_.end()) {
        waiters = std::move(it->second);
        loading_.erase(it);
    }
    const bool ok = !err.isSet();
    if (ok) {
        cache_->applyListing(path, entries);
    } else {
        cache_->markLoadFailed(path);
        qCWarning(fsSession) << "Listing failed for" << logPath(path) << ":"
                             << QString::fromStdString(filessh::describe(err));
        if (err.kind == filessh::ErrorKind::Connection)
            noteConnectionError(err);
        else
            machine_.showError("list " + path + ": " + filessh::describe(err));
    }
    for (auto &w : waiters)
        w(ok);
    emit viewChanged();
}

void SessionController::changeDirectory(const std::string &path) {
    if (!cache_)
        return;
    const std::string target = resolve(path);
    const filessh::RemoteNode *node = cache_->find(target);
    if (node && !node->info.isDir() &&
        node->info.kind != filessh::EntryKind::Symlink) {
        machine_.showError("cd " + target + ": not a directory");
        emit viewChanged();
        return;
    }
    if (node && cache_->isLoaded(target)) {
        cwd_ = target;
        emit viewChanged();
        return;
    }
    if (!node) {
        // Outside the explored tree: start a new tree there.
        auto fresh = std::make_unique<filessh::TreeCache>(target);
        fresh->setShowHidden(cache_->showHidden());
        fresh->setNameFilter(cache_->nameFilter());
        cache_ = std::move(fresh);
    }
    QPointer<SessionController> self(this);
    loadDirectory(target, [self, target](bool ok) {
        if (self && ok)
            self->cwd_ = target;
    });
}

void SessionController::goUp() {
    if (cwd_ == "/")
        return;
    changeDirectory(filessh::parentRemotePath(cwd_));
}

void SessionController::expand(const std::string &path) {
    if (!cache_)
        return;
    const std::string target = resolve(path);
    if (cache_->isLoaded(target)) {
        emit viewChanged();
        return;
    }
    loadDirectory(target);
}

void SessionController::collapse(const std::string &path) {
    if (!cache_)
        return;
    const std::string target = resolve(path);
    if (filessh::remotePathWithin(cwd_, target) && target != cwd_) {
        machine_.showError("collapse " + target + ": current directory is inside it");
        emit viewChanged();
        return;
    }
    cache_->collapse(target);
    if (target == cwd_)
        loadDirectory(cwd_);
    emit viewChanged();
}

void SessionController::refresh() {
    if (!cache_)
        return;
    loadDirectory(cwd_);
}

void SessionController::setShowHidden(bool show) {
    copt_.showHidden = show;
    if (cache_)
        cache_->setShowHidden(show);
    emit viewChanged();
}

void SessionController::setNameFilter(const std::string &needle) {
    if (cache_)
        cache_->setNameFilter(needle);
    emit viewChanged();
}

void SessionController::showInfo(const std::string &path) {
    if (!cache_)
        return;
    const std::string target = resolve(path);
    const filessh::RemoteNode *node = cache_->find(target);
    if (!node) {
        machine_.showError("info " + target + ": not found");
    } else {
        machine_.viewMetadata(*node);
    }
    emit viewChanged();
}

void SessionController::preview(const std::string &path) {
    if (!isConnected()) {
        machine_.showError("not connected; use reconnect");
        emit viewChanged();
        return;
    }
    const std::string target = resolve(path);
    const filessh::RemoteNode *node = cache_ ? cache_->find(target) : nullptr;
    if (node && node->info.isDir()) {
        machine_.showError("cat " + target + ": is a directory");
        emit viewChanged();
        return;
    }
    const std::uint64_t gen = generation_;
    QPointer<SessionController> self(this);
    std::shared_ptr<filessh::Session> session = session_;
    std::thread([self, gen, session, target]() {
        filessh::SftpError err;
        QByteArray data;
        bool truncated = false;
        auto rs = session->read(target, err);
        if (rs) {
            std::vector<char> buf(16 * 1024);
            while (!err.isSet()) {
                const std::int64_t n = rs->read(buf.data(), buf.size(), err);
                if (n <= 0)
                    break;
                data.append(buf.data(), static_cast<int>(n));
                if (static_cast<std::size_t>(data.size()) > kPreviewBytes) {
                    data.truncate(static_cast<int>(kPreviewBytes));
                    truncated = true;
                    break;
                }
            }
        }
        QMetaObject::invokeMethod(
            qApp,
            [self, gen, target, data, truncated, err]() {
                if (!self || gen != self->generation_)
                    return;
                if (err.isSet()) {
                    if (err.kind == filessh::ErrorKind::Connection)
                        self->noteConnectionError(err);
                    else
                        self->machine_.showError("cat " + target + ": " +
                                                 filessh::describe(err));
                    emit self->viewChanged();
                    return;
                }
                emit self->previewReady(QString::fromStdString(target), data,
                                        truncated);
            },
            Qt::QueuedConnection);
    }).detach();
}

void SessionController::submit(const filessh::OperationRequest &req) {
    if (!cache_) {
        machine_.showError("not connected; use reconnect");
        emit viewChanged();
        return;
    }
    handleDispatch(machine_.request(req, *cache_));
    emit viewChanged();
}

void SessionController::download(const std::string &remote,
                                 const std::string &localDest) {
    if (!session_) {
        machine_.showError("not connected; use reconnect");
        emit viewChanged();
        return;
    }
    handleDispatch(machine_.requestDownload(resolve(remote), localDest));
    emit viewChanged();
}

void SessionController::confirm() {
    handleDispatch(machine_.confirm());
    emit viewChanged();
}

void SessionController::reject() {
    machine_.reject();
    emit viewChanged();
}

void SessionController::dismiss() {
    machine_.dismiss();
    emit viewChanged();
}

bool SessionController::cancel(std::optional<std::uint64_t> workId) {
    if (!workId)
        workId = machine_.foregroundJob();
    if (!workId)
        return false;
    auto d = downloads_.find(*workId);
    if (d != downloads_.end()) {
        qCInfo(fsTransfer) << "Cancelling download" << *workId;
        d->second->cancel();
        return true;
    }
    auto o = opCancel_.find(*workId);
    if (o != opCancel_.end()) {
        qCInfo(fsOps) << "Cancelling operation" << *workId;
        o->second->store(true);
        return true;
    }
    return false;
}

void SessionController::handleDispatch(const filessh::Dispatch &d) {
    switch (d.kind) {
    case filessh::Dispatch::Kind::None:
        return;
    case filessh::Dispatch::Kind::RunOperation:
        runOperation(d.workId, d.request);
        return;
    case filessh::Dispatch::Kind::StartDownload:
        startDownload(d.workId, d.remoteRoot, d.localDest);
        return;
    }
}

void SessionController::runOperation(std::uint64_t workId,
                                     const filessh::OperationRequest &req) {
    auto flag = std::make_shared<std::atomic<bool>>(false);
    opCancel_[workId] = flag;
    qCInfo(fsOps) << "Running" << workId
                  << QString::fromStdString(filessh::describeRequest(req));
    if (isExternal(req))
        emit externalProcessStarted();

    const std::uint64_t gen = generation_;
    QPointer<SessionController> self(this);
    std::shared_ptr<filessh::OperationExecutor> exec = executor_;
    std::thread([self, gen, exec, workId, req, flag]() {
        const filessh::OperationResult res =
            exec->execute(req, [flag] { return flag->load(); });
        QMetaObject::invokeMethod(
            qApp,
            [self, gen, workId, res]() {
                if (!self)
                    return;
                if (gen != self->generation_) {
                    if (isExternal(res.request))
                        emit self->externalProcessFinished();
                    return;
                }
                self->finishOperation(workId, res);
            },
            Qt::QueuedConnection);
    }).detach();
}

void SessionController::finishOperation(std::uint64_t workId,
                                        const filessh::OperationResult &result) {
    opCancel_.erase(workId);
    if (result.ok)
        qCInfo(fsOps) << "Finished" << workId
                      << QString::fromStdString(result.summary());
    else
        qCWarning(fsOps) << "Failed" << workId
                         << QString::fromStdString(result.summary());

    executor_->apply(result, *cache_);
    machine_.operationFinished(workId, result);

    // The current directory may have been removed or renamed away.
    while (cwd_ != cache_->rootPath() && !cache_->contains(cwd_))
        cwd_ = filessh::parentRemotePath(cwd_);
    if (isConnected() && !cache_->isLoaded(cwd_))
        loadDirectory(cwd_);

    if (isExternal(result.request))
        emit externalProcessFinished();
    emit viewChanged();
}

void SessionController::startDownload(std::uint64_t workId,
                                      const std::string &remote,
                                      const std::string &localDest) {
    const std::uint64_t gen = generation_;
    QPointer<SessionController> self(this);
    filessh::DownloadOptions o;
    o.concurrency = copt_.concurrency;
    o.chunkSize = copt_.executor.chunkSize;
    o.onFinished = [self, gen, workId](const filessh::JobReport &report) {
        QMetaObject::invokeMethod(
            qApp,
            [self, gen, workId, report]() {
                if (!self || gen != self->generation_)
                    return;
                self->finishDownload(workId, report);
            },
            Qt::QueuedConnection);
    };
    qCInfo(fsTransfer) << "Starting download" << workId << "of"
                       << logPath(remote) << "with" << o.concurrency
                       << "workers";
    downloads_[workId] =
        filessh::DownloadJob::start(session_, remote, localDest, std::move(o));
    updateTimer();
}

void SessionController::finishDownload(std::uint64_t workId,
                                       const filessh::JobReport &report) {
    qCInfo(fsTransfer) << "Download" << workId << "finished:"
                       << QString::fromStdString(report.summary());
    for (const auto &f : report.failures)
        qCWarning(fsTransfer) << "  failed" << logPath(f.path) << ":"
                              << QString::fromStdString(f.reason);
    machine_.downloadFinished(workId, report);
    downloads_.erase(workId);
    updateTimer();
    emit viewChanged();
}

void SessionController::noteConnectionError(const filessh::SftpError &err) {
    if (err.kind != filessh::ErrorKind::Connection)
        return;
    qCWarning(fsSession) << "Connection lost:"
                         << QString::fromStdString(err.message);
    machine_.connectionLost(err.message);
    for (auto &kv : downloads_)
        kv.second->cancel();
}

bool SessionController::confirmHostKey(const std::string &host,
                                       std::uint16_t port,
                                       const std::string &alg,
                                       const std::string &fp) {
    if (!hostKeyPrompt_) {
        qCWarning(fsSession) << "Unknown host key rejected: no prompt available";
        return false;
    }
    const QString prompt =
        QStringLiteral("The host key of %1:%2 is not known.\n%3 fingerprint: %4\n"
                       "Accept and store it? [y/N] ")
            .arg(QString::fromStdString(host))
            .arg(port)
            .arg(QString::fromStdString(alg), QString::fromStdString(fp));
    return hostKeyPrompt_(prompt);
}

void SessionController::updateTimer() {
    if (downloads_.empty())
        progressTimer_.stop();
    else if (!progressTimer_.isActive())
        progressTimer_.start();
}

std::vector<filessh::JobSnapshot> SessionController::jobSnapshots() const {
    std::vector<filessh::JobSnapshot> out;
    const auto fg = machine_.foregroundJob();
    for (const auto &kv : downloads_) {
        filessh::JobSnapshot j;
        j.workId = kv.first;
        j.remoteRoot = kv.second->remoteRoot();
        j.progress = kv.second->progress();
        j.foreground = fg && *fg == kv.first;
        out.push_back(std::move(j));
    }
    return out;
}

filessh::ViewSnapshot SessionController::snapshot() const {
    if (!cache_) {
        filessh::ViewSnapshot v;
        v.state = machine_.state();
        v.directory = cwd_;
        return v;
    }
    return filessh::makeViewSnapshot(machine_, *cache_, cwd_, jobSnapshots());
}

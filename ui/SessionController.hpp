// Foreground owner of one browsing session.
//
// Holds the Session, the TreeCache and the InteractionStateMachine, and runs
// everything that talks to the network on worker threads. Results are
// queued back to the Qt event loop, which is the only place the cache and the
// machine are touched.
#pragma once
#include "filessh/DownloadJob.hpp"
#include "filessh/InteractionStateMachine.hpp"
#include "filessh/OperationExecutor.hpp"
#include "filessh/Session.hpp"
#include "filessh/SftpTypes.hpp"
#include "filessh/TreeCache.hpp"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QTimer>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct ControllerOptions {
    int concurrency = 4;
    bool showHidden = false;
    filessh::ExecutorOptions executor;
};

class SessionController : public QObject {
    Q_OBJECT
public:
    SessionController(filessh::SessionOptions opt, std::string initialPath,
                      ControllerOptions copt,
                      std::shared_ptr<filessh::ProcessLauncher> launcher,
                      QObject *parent = nullptr);
    ~SessionController() override;

    // Asked on the foreground thread when the server key is unknown.
    void setHostKeyPrompt(std::function<bool(const QString &)> prompt) {
        hostKeyPrompt_ = std::move(prompt);
    }

    void connectToHost();
    // Drops every job and opens a fresh Session on the same target.
    void reconnect();
    bool isConnected() const { return session_ && !session_->isLost(); }
    bool isConnecting() const { return connecting_; }

    const filessh::InteractionStateMachine &machine() const {
        return machine_;
    }
    const filessh::TreeCache *cache() const { return cache_.get(); }
    const std::string &currentDirectory() const { return cwd_; }
    const filessh::SessionOptions &sessionOptions() const { return opt_; }

    // Absolute paths are taken as is; anything else is relative to the
    // current directory.
    std::string resolve(const std::string &nameOrPath) const;

    void changeDirectory(const std::string &path);
    void goUp();
    void expand(const std::string &path);
    void collapse(const std::string &path);
    void refresh();

    void setShowHidden(bool show);
    void setNameFilter(const std::string &needle);

    void showInfo(const std::string &path);
    void preview(const std::string &path);

    void submit(const filessh::OperationRequest &req);
    void download(const std::string &remote, const std::string &localDest);
    void confirm();
    void reject();
    void dismiss();
    // Without an id, cancels the foreground download.
    bool cancel(std::optional<std::uint64_t> workId);

    std::vector<filessh::JobSnapshot> jobSnapshots() const;
    filessh::ViewSnapshot snapshot() const;
    std::vector<std::string> drainMessages() { return machine_.drainMessages(); }

signals:
    void connected(const QString &home);
    void connectFailed(const QString &message);
    void viewChanged();
    void externalProcessStarted();
    void externalProcessFinished();
    void progressTick();
    void previewReady(const QString &path, const QByteArray &data,
                      bool truncated);

private:
    void finishConnect(std::shared_ptr<filessh::Session> session,
                       const std::string &home, const filessh::SftpError &err);
    void loadDirectory(const std::string &path,
                       std::function<void(bool)> then = {});
    void finishLoad(const std::string &path,
                    const std::vector<filessh::FileInfo> &entries,
                    const filessh::SftpError &err);
    void handleDispatch(const filessh::Dispatch &d);
    void runOperation(std::uint64_t workId, const filessh::OperationRequest &req);
    void finishOperation(std::uint64_t workId,
                         const filessh::OperationResult &result);
    void startDownload(std::uint64_t workId, const std::string &remote,
                       const std::string &localDest);
    void finishDownload(std::uint64_t workId, const filessh::JobReport &report);
    void noteConnectionError(const filessh::SftpError &err);
    bool confirmHostKey(const std::string &host, std::uint16_t port,
                        const std::string &alg, const std::string &fp);
    void updateTimer();

    filessh::SessionOptions opt_;
    std::string initialPath_;
    ControllerOptions copt_;
    std::shared_ptr<filessh::ProcessLauncher> launcher_;
    std::function<bool(const QString &)> hostKeyPrompt_;

    std::shared_ptr<filessh::Session> session_;
    std::shared_ptr<filessh::OperationExecutor> executor_;
    std::unique_ptr<filessh::TreeCache> cache_;
    filessh::InteractionStateMachine machine_;
    std::string cwd_;
    bool connecting_ = false;
    // Bumped on every (re)connect so late results of an old Session are dropped.
    std::uint64_t generation_ = 0;

    std::map<std::string, std::vector<std::function<void(bool)>>> loading_;
    std::map<std::uint64_t, std::unique_ptr<filessh::DownloadJob>> downloads_;
    std::map<std::uint64_t, std::shared_ptr<std::atomic<bool>>> opCancel_;
    QTimer progressTimer_;
};

// Line-oriented front end on the controlling terminal.
#pragma once
#include "AppSettings.hpp"
#include "filessh/InteractionStateMachine.hpp"

#include <QByteArray>
#include <QObject>
#include <QString>
#include <QStringList>

#include <optional>
#include <string>

class QSocketNotifier;
class SessionController;

class TerminalView : public QObject {
    Q_OBJECT
public:
    TerminalView(SessionController *controller, filesshui::AppSettings settings,
                 QObject *parent = nullptr);

    void start();
    // Reads one answer synchronously; used while connecting.
    bool askYesNo(const QString &prompt);

private slots:
    void onReadable();
    void onConnected(const QString &home);
    void onConnectFailed(const QString &message);
    void onViewChanged();
    void onProgressTick();
    void onExternalStarted();
    void onExternalFinished();
    void onPreview(const QString &path, const QByteArray &data, bool truncated);

private:
    void handleLine(const QString &line);
    bool takeLine(QString &line);
    void printListing(const std::string &dir);
    void printTree(const std::string &dir, int depth);
    void printState(const filessh::ViewSnapshot &v);
    void printJobs();
    void printHelp();
    void printPrompt();
    void print(const QString &text);
    void quit();

    SessionController *ctl_;
    filesshui::AppSettings settings_;
    QSocketNotifier *notifier_ = nullptr;
    QByteArray buffer_;
    bool external_ = false;
    bool ready_ = false;
    bool connectedOnce_ = false;
    std::string lastStateKey_;
    std::string shownDir_;
    // Directory whose listing is printed once it has loaded.
    std::optional<std::string> pendingListing_;
};

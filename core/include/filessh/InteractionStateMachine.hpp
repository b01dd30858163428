// Foreground mode of the browser.
//
// Exactly one InteractionState is active; it says what owns the view, not
// how much runs in the background. Requests go through the machine, which
// validates them against the cache, asks for confirmation when they are
// destructive and hands back a Dispatch telling the caller what to start.
// Background completions come back through operationFinished() and
// downloadFinished(). Only the foreground loop may call into it.
#pragma once
#include "DownloadJob.hpp"
#include "OperationExecutor.hpp"
#include "OperationRequest.hpp"
#include "TreeCache.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace filessh {

struct Browsing {};

struct ConfirmingDestructiveOp {
    OperationRequest request; // what runs on confirm
    std::string prompt;
};

struct ViewingMetadata {
    RemoteNode node;
};

struct EditingExternally {
    std::uint64_t workId = 0;
    std::string path;
};

struct Downloading {
    std::uint64_t workId = 0;
    std::string remoteRoot;
};

struct ErrorDisplayed {
    std::string message;
};

using InteractionState = std::variant<Browsing, ConfirmingDestructiveOp, ViewingMetadata,
                                      EditingExternally, Downloading, ErrorDisplayed>;

const char* stateName(const InteractionState& s);

// What the caller has to start after a transition.
struct Dispatch {
    enum class Kind { None, RunOperation, StartDownload };

    Kind kind = Kind::None;
    std::uint64_t workId = 0;
    OperationRequest request;  // RunOperation
    std::string remoteRoot;    // StartDownload
    std::string localDest;

    explicit operator bool() const { return kind != Kind::None; }
};

struct ActiveWork {
    enum class Kind { Operation, Download };

    std::uint64_t id = 0;
    Kind kind = Kind::Operation;
    std::string description;
    std::vector<std::string> paths; // remote paths it may touch
};

class InteractionStateMachine {
public:
    const InteractionState& state() const { return state_; }
    template <typename S>
    bool is() const { return std::holds_alternative<S>(state_); }

    // False while an external editor or shell owns the terminal.
    bool acceptsInput() const;
    bool connectionLost() const { return lost_; }

    Dispatch request(const OperationRequest& req, const TreeCache& cache);
    Dispatch requestDownload(const std::string& remoteRoot, const std::string& localDest);
    Dispatch confirm();
    void reject();

    void viewMetadata(const RemoteNode& node);
    // Leaves ViewingMetadata or acknowledges the displayed error.
    void dismiss();

    void operationFinished(std::uint64_t workId, const OperationResult& result);
    void downloadFinished(std::uint64_t workId, const JobReport& report);
    void connectionLost(const std::string& reason);
    void showError(const std::string& message);
    // Back to a clean Browsing state on a fresh Session.
    void reset();

    const std::vector<ActiveWork>& activeWork() const { return active_; }
    std::optional<std::uint64_t> foregroundJob() const { return foregroundJob_; }
    std::size_t pendingNotices() const { return notices_.size(); }

    // Informational lines (successes, cancellations) for the front end.
    std::vector<std::string> drainMessages();

private:
    bool acceptsRequests() const;
    bool overlapsActive(const std::vector<std::string>& paths, std::string& busyWith) const;
    Dispatch launch(const OperationRequest& req);
    void finishWork(std::uint64_t workId);
    void notice(const std::string& message);
    void rest();
    bool resting() const;

    InteractionState state_ = Browsing{};
    std::vector<ActiveWork> active_;
    std::optional<std::uint64_t> foregroundJob_;
    std::string foregroundRoot_;
    std::deque<std::string> notices_;
    std::vector<std::string> messages_;
    std::uint64_t nextWorkId_ = 1;
    bool lost_ = false;
    std::string lossMessage_;
};

// Everything the presentation layer renders.
struct JobSnapshot {
    std::uint64_t workId = 0;
    std::string remoteRoot;
    JobProgress progress;
    bool foreground = false;
};

struct ViewSnapshot {
    InteractionState state;
    std::string directory;
    bool directoryLoaded = false;
    std::vector<RemoteNode> listing; // filtered and ordered
    bool showHidden = false;
    std::string nameFilter;
    std::vector<JobSnapshot> jobs;
};

ViewSnapshot makeViewSnapshot(const InteractionStateMachine& machine, const TreeCache& cache,
                              const std::string& directory, std::vector<JobSnapshot> jobs);

} // namespace filessh

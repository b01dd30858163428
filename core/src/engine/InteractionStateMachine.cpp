#include "filessh/InteractionStateMachine.hpp"
#include "filessh/RemotePath.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>

namespace filessh {

const char* stateName(const InteractionState& s) {
    return std::visit(
        [](const auto& st) -> const char* {
            using T = std::decay_t<decltype(st)>;
            if constexpr (std::is_same_v<T, Browsing>)
                return "Browsing";
            else if constexpr (std::is_same_v<T, ConfirmingDestructiveOp>)
                return "ConfirmingDestructiveOp";
            else if constexpr (std::is_same_v<T, ViewingMetadata>)
                return "ViewingMetadata";
            else if constexpr (std::is_same_v<T, EditingExternally>)
                return "EditingExternally";
            else if constexpr (std::is_same_v<T, Downloading>)
                return "Downloading";
            else
                return "ErrorDisplayed";
        },
        s);
}

bool InteractionStateMachine::acceptsInput() const {
    return !is<EditingExternally>();
}

bool InteractionStateMachine::acceptsRequests() const {
    return !lost_ && (is<Browsing>() || is<Downloading>());
}

bool InteractionStateMachine::resting() const {
    return is<Browsing>() || is<Downloading>();
}

bool InteractionStateMachine::overlapsActive(const std::vector<std::string>& paths,
                                             std::string& busyWith) const {
    for (const auto& w : active_) {
        for (const auto& mine : paths) {
            for (const auto& theirs : w.paths) {
                if (remotePathsOverlap(normalizeRemotePath(mine), normalizeRemotePath(theirs))) {
                    busyWith = w.description;
                    return true;
                }
            }
        }
    }
    return false;
}

Dispatch InteractionStateMachine::request(const OperationRequest& req, const TreeCache& cache) {
    if (lost_) {
        showError("not connected; use reconnect");
        return {};
    }
    if (!acceptsRequests()) {
        messages_.push_back("answer or dismiss the current prompt first");
        return {};
    }

    SftpError err;
    if (!OperationExecutor::validate(req, cache, err)) {
        const MoveRequest* mv = std::get_if<MoveRequest>(&req);
        if (mv && err.kind == ErrorKind::Remote && err.remote == RemoteErrorKind::AlreadyExists) {
            std::string busy;
            if (overlapsActive(affectedPaths(req), busy)) {
                state_ = ErrorDisplayed{describeRequest(req) + ": busy with " + busy};
                return {};
            }
            MoveRequest replace = *mv;
            replace.overwrite = true;
            state_ = ConfirmingDestructiveOp{replace, normalizeRemotePath(mv->destination) +
                                                          " exists; replace it?"};
            return {};
        }
        state_ = ErrorDisplayed{describeRequest(req) + ": " + describe(err)};
        return {};
    }

    std::string busy;
    if (overlapsActive(affectedPaths(req), busy)) {
        state_ = ErrorDisplayed{describeRequest(req) + ": busy with " + busy};
        return {};
    }
    if (const DeleteRequest* del = std::get_if<DeleteRequest>(&req)) {
        state_ = ConfirmingDestructiveOp{req, "delete " + normalizeRemotePath(del->path) + "?"};
        return {};
    }
    return launch(req);
}

Dispatch InteractionStateMachine::requestDownload(const std::string& remoteRoot, const std::string& localDest) {
    if (lost_) {
        showError("not connected; use reconnect");
        return {};
    }
    if (!acceptsRequests()) {
        messages_.push_back("answer or dismiss the current prompt first");
        return {};
    }
    const std::string root = normalizeRemotePath(remoteRoot);
    std::string busy;
    if (overlapsActive({root}, busy)) {
        state_ = ErrorDisplayed{"download " + root + ": busy with " + busy};
        return {};
    }

    ActiveWork w;
    w.id = nextWorkId_++;
    w.kind = ActiveWork::Kind::Download;
    w.description = "download " + root;
    w.paths.push_back(root);
    active_.push_back(w);

    foregroundJob_ = w.id;
    foregroundRoot_ = root;
    state_ = Downloading{w.id, root};

    Dispatch d;
    d.kind = Dispatch::Kind::StartDownload;
    d.workId = w.id;
    d.remoteRoot = root;
    d.localDest = localDest;
    return d;
}

Dispatch InteractionStateMachine::launch(const OperationRequest& req) {
    ActiveWork w;
    w.id = nextWorkId_++;
    w.kind = ActiveWork::Kind::Operation;
    w.description = describeRequest(req);
    w.paths = affectedPaths(req);
    active_.push_back(w);

    if (std::holds_alternative<EditFileRequest>(req) || std::holds_alternative<SpawnShellRequest>(req))
        state_ = EditingExternally{w.id, normalizeRemotePath(primaryPath(req))};

    Dispatch d;
    d.kind = Dispatch::Kind::RunOperation;
    d.workId = w.id;
    d.request = req;
    return d;
}

Dispatch InteractionStateMachine::confirm() {
    const auto* c = std::get_if<ConfirmingDestructiveOp>(&state_);
    if (!c)
        return {};
    const OperationRequest req = c->request;
    state_ = Browsing{};
    rest();
    std::string busy;
    if (overlapsActive(affectedPaths(req), busy)) {
        state_ = ErrorDisplayed{describeRequest(req) + ": busy with " + busy};
        return {};
    }
    return launch(req);
}

void InteractionStateMachine::reject() {
    const auto* c = std::get_if<ConfirmingDestructiveOp>(&state_);
    if (!c)
        return;
    messages_.push_back(describeRequest(c->request) + ": not confirmed");
    rest();
}

void InteractionStateMachine::viewMetadata(const RemoteNode& node) {
    if (!acceptsRequests())
        return;
    state_ = ViewingMetadata{node};
}

void InteractionStateMachine::dismiss() {
    if (is<ViewingMetadata>() || is<ErrorDisplayed>())
        rest();
}

void InteractionStateMachine::finishWork(std::uint64_t workId) {
    active_.erase(std::remove_if(active_.begin(), active_.end(),
                                 [&](const ActiveWork& w) { return w.id == workId; }),
                  active_.end());
}

void InteractionStateMachine::operationFinished(std::uint64_t workId, const OperationResult& result) {
    const auto* editing = std::get_if<EditingExternally>(&state_);
    const bool foreground = editing && editing->workId == workId;
    finishWork(workId);

    if (lost_) {
        // The loss was reported while the editor or shell held the terminal.
        if (foreground)
            state_ = ErrorDisplayed{lossMessage_};
        return;
    }
    if (!result.ok && result.error.kind == ErrorKind::Connection) {
        if (foreground)
            state_ = Browsing{};
        connectionLost(result.error.message);
        return;
    }
    if (result.ok || result.error.kind == ErrorKind::Cancelled) {
        messages_.push_back(result.summary());
        if (foreground)
            rest();
        return;
    }
    if (foreground) {
        state_ = ErrorDisplayed{result.summary()};
        return;
    }
    notice(result.summary());
}

void InteractionStateMachine::downloadFinished(std::uint64_t workId, const JobReport& report) {
    std::string what = "download";
    for (const auto& w : active_) {
        if (w.id == workId)
            what = w.description;
    }
    finishWork(workId);
    const bool foreground = foregroundJob_ && *foregroundJob_ == workId;
    if (foreground) {
        foregroundJob_.reset();
        foregroundRoot_.clear();
    }
    if (lost_)
        return;

    const std::string msg = what + ": " + report.summary();
    switch (report.outcome) {
    case JobOutcome::ConnectionLost:
        connectionLost(what + " interrupted");
        return;
    case JobOutcome::Succeeded:
    case JobOutcome::Cancelled:
        messages_.push_back(msg);
        if (foreground && is<Downloading>())
            rest();
        return;
    case JobOutcome::PartiallyFailed:
        if (foreground && is<Downloading>())
            state_ = ErrorDisplayed{msg};
        else
            notice(msg);
        return;
    }
}

void InteractionStateMachine::connectionLost(const std::string& reason) {
    if (lost_)
        return;
    lost_ = true;
    lossMessage_ = "connection lost: " + (reason.empty() ? std::string("transport failure") : reason);
    spdlog::warn("{}", lossMessage_);
    notices_.clear();
    foregroundJob_.reset();
    foregroundRoot_.clear();

    if (const auto* editing = std::get_if<EditingExternally>(&state_)) {
        // The child process still owns the terminal; report once it exits.
        const std::uint64_t keep = editing->workId;
        active_.erase(std::remove_if(active_.begin(), active_.end(),
                                     [&](const ActiveWork& w) { return w.id != keep; }),
                      active_.end());
        return;
    }
    active_.clear();
    state_ = ErrorDisplayed{lossMessage_};
}

void InteractionStateMachine::showError(const std::string& message) {
    if (is<EditingExternally>()) {
        notices_.push_back(message);
        return;
    }
    state_ = ErrorDisplayed{message};
}

void InteractionStateMachine::reset() {
    state_ = Browsing{};
    active_.clear();
    foregroundJob_.reset();
    foregroundRoot_.clear();
    notices_.clear();
    lossMessage_.clear();
    lost_ = false;
}

void InteractionStateMachine::notice(const std::string& message) {
    notices_.push_back(message);
    if (resting())
        rest();
}

void InteractionStateMachine::rest() {
    if (!notices_.empty()) {
        state_ = ErrorDisplayed{notices_.front()};
        notices_.pop_front();
        return;
    }
    if (foregroundJob_)
        state_ = Downloading{*foregroundJob_, foregroundRoot_};
    else
        state_ = Browsing{};
}

std::vector<std::string> InteractionStateMachine::drainMessages() {
    std::vector<std::string> out;
    out.swap(messages_);
    return out;
}

ViewSnapshot makeViewSnapshot(const InteractionStateMachine& machine, const TreeCache& cache,
                              const std::string& directory, std::vector<JobSnapshot> jobs) {
    ViewSnapshot v;
    v.state = machine.state();
    v.directory = normalizeRemotePath(directory);
    v.directoryLoaded = cache.isLoaded(v.directory);
    for (const RemoteNode* n : cache.children(v.directory))
        v.listing.push_back(*n);
    v.showHidden = cache.showHidden();
    v.nameFilter = cache.nameFilter();
    v.jobs = std::move(jobs);
    return v;
}

} // namespace filessh

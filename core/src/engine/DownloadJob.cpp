#include "filessh/DownloadJob.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/Session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace filessh {

namespace {

std::atomic<std::uint64_t> g_nextJobId{1};

const char* kPartSuffix = ".filessh-part";

std::string localRootFor(const std::string& remoteRoot, const std::string& localDest) {
    std::string base = remoteBaseName(remoteRoot);
    if (base == "/" || base == "." || base.empty())
        base = "root";
    return (fs::path(localDest) / base).string();
}

bool localPathWithin(const fs::path& path, const fs::path& root) {
    const fs::path rel = path.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty())
        return false;
    const auto first = *rel.begin();
    return first != ".." && first != ".";
}

} // namespace

const char* taskStatusName(TaskStatus st) {
    switch (st) {
    case TaskStatus::Pending:
        return "Pending";
    case TaskStatus::InProgress:
        return "InProgress";
    case TaskStatus::Completed:
        return "Completed";
    case TaskStatus::Failed:
        return "Failed";
    case TaskStatus::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

const char* jobOutcomeName(JobOutcome o) {
    switch (o) {
    case JobOutcome::Succeeded:
        return "succeeded";
    case JobOutcome::PartiallyFailed:
        return "partially failed";
    case JobOutcome::Cancelled:
        return "cancelled";
    case JobOutcome::ConnectionLost:
        return "connection lost";
    }
    return "unknown";
}

std::string JobReport::summary() const {
    std::ostringstream oss;
    oss << progress.filesDone << "/" << progress.filesDiscovered << " files, "
        << progress.bytesDone << "/" << progress.bytesDiscovered << " bytes ("
        << jobOutcomeName(outcome) << ")";
    if (cancelledTasks)
        oss << ", " << cancelledTasks << " cancelled";
    for (const auto& f : failures)
        oss << "\n  " << f.path << ": " << f.reason;
    return oss.str();
}

DownloadJob::DownloadJob(std::shared_ptr<Session> session, std::string remoteRoot,
                         std::string localDest, DownloadOptions opts)
    : id_(g_nextJobId.fetch_add(1)),
      session_(std::move(session)),
      remoteRoot_(normalizeRemotePath(remoteRoot)),
      localRoot_(localRootFor(remoteRoot_, localDest)),
      opts_(std::move(opts)) {}

std::unique_ptr<DownloadJob> DownloadJob::start(std::shared_ptr<Session> session,
                                                const std::string& remoteRoot,
                                                const std::string& localDest,
                                                DownloadOptions opts) {
    if (opts.concurrency < 1)
        opts.concurrency = 1;
    if (opts.chunkSize == 0)
        opts.chunkSize = 64 * 1024;
    std::unique_ptr<DownloadJob> job(
        new DownloadJob(std::move(session), remoteRoot, localDest, std::move(opts)));
    job->launch();
    return job;
}

void DownloadJob::launch() {
    spdlog::info("job {}: download {} -> {} (concurrency {})", id_, remoteRoot_, localRoot_,
                 opts_.concurrency);
    {
        std::lock_guard<std::mutex> lk(mtx_);
        dirQueue_.push_back(DirItem{remoteRoot_, localRoot_, true});
        dirsPending_ = 1;
        outstanding_ = 1;
        liveWorkers_ = opts_.concurrency * 2;
    }
    std::lock_guard<std::mutex> jl(joinMtx_);
    for (int i = 0; i < opts_.concurrency; ++i) {
        threads_.emplace_back([this] { traversalWorker(); });
        threads_.emplace_back([this] { transferWorker(); });
    }
}

DownloadJob::~DownloadJob() {
    cancel();
    joinAll();
}

void DownloadJob::cancel() {
    if (cancelled_.exchange(true))
        return;
    spdlog::info("job {}: cancel requested", id_);
    std::lock_guard<std::mutex> lk(mtx_);
    cv_.notify_all();
}

bool DownloadJob::isFinished() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return report_.has_value();
}

JobProgress DownloadJob::progress() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return progress_;
}

std::vector<DownloadTask> DownloadJob::tasks() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return std::vector<DownloadTask>(tasks_.begin(), tasks_.end());
}

std::optional<JobReport> DownloadJob::report() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return report_;
}

JobReport DownloadJob::wait() {
    JobReport r;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [&] { return report_.has_value(); });
        r = *report_;
    }
    joinAll();
    return r;
}

void DownloadJob::joinAll() {
    std::lock_guard<std::mutex> jl(joinMtx_);
    for (auto& t : threads_) {
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
            t.join();
    }
}

void DownloadJob::traversalWorker() {
    for (;;) {
        DirItem item;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] {
                return cancelled_.load() || !dirQueue_.empty() || dirsPending_ == 0;
            });
            if (cancelled_.load() || dirQueue_.empty())
                break;
            item = std::move(dirQueue_.front());
            dirQueue_.pop_front();
        }
        processDir(item);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --dirsPending_;
            --outstanding_;
            if (dirsPending_ == 0)
                progress_.enumerationDone = true;
            cv_.notify_all();
        }
    }
    workerExited();
}

void DownloadJob::transferWorker() {
    for (;;) {
        std::size_t idx = 0;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] {
                return cancelled_.load() || !fileQueue_.empty() || outstanding_ == 0;
            });
            if (cancelled_.load() || fileQueue_.empty())
                break;
            idx = fileQueue_.front();
            fileQueue_.pop_front();
            tasks_[idx].status = TaskStatus::InProgress;
        }
        transferFile(idx);
        {
            std::lock_guard<std::mutex> lk(mtx_);
            --outstanding_;
            cv_.notify_all();
        }
    }
    workerExited();
}

void DownloadJob::processDir(const DirItem& item) {
    SftpError err;
    if (item.root) {
        FileInfo st;
        if (!session_->stat(item.remote, st, err)) {
            recordFailure(item.remote, err);
            return;
        }
        if (!st.isDir()) {
            if (st.kind == EntryKind::Other) {
                recordFailure(item.remote, SftpError::remoteError(RemoteErrorKind::Other, "not a regular file"));
                return;
            }
            enqueueFile(item.remote, item.local, st.size);
            return;
        }
    }

    std::error_code ec;
    fs::create_directories(item.local, ec);
    if (ec) {
        recordFailure(item.remote, SftpError::localIO("cannot create " + item.local + ": " + ec.message()));
        return;
    }

    std::vector<FileInfo> entries;
    if (!session_->list(item.remote, entries, err)) {
        recordFailure(item.remote, err);
        return;
    }

    for (const auto& e : entries) {
        if (cancelled_.load())
            return;
        std::string why;
        if (!isValidEntryName(e.name, &why)) {
            recordFailure(joinRemotePath(item.remote, e.name),
                          SftpError::remoteError(RemoteErrorKind::Other, why));
            continue;
        }
        const std::string childRemote = joinRemotePath(item.remote, e.name);
        const fs::path childPath = fs::path(item.local) / e.name;
        if (!localPathWithin(childPath, localRoot_)) {
            recordFailure(childRemote, SftpError::localIO(childPath.string() + " is outside " + localRoot_));
            continue;
        }
        const std::string childLocal = childPath.string();
        switch (e.kind) {
        case EntryKind::Directory:
            enqueueDir(childRemote, childLocal);
            break;
        case EntryKind::File:
            enqueueFile(childRemote, childLocal, e.size);
            break;
        case EntryKind::Symlink: {
            // Links to files are downloaded through the link; links to
            // directories are not followed.
            FileInfo target;
            SftpError lerr;
            if (!session_->stat(childRemote, target, lerr)) {
                if (lerr.kind == ErrorKind::Connection) {
                    recordFailure(childRemote, lerr);
                    return;
                }
                recordFailure(childRemote, SftpError::remoteError(lerr.remote, "broken symbolic link"));
            } else if (target.kind == EntryKind::File) {
                enqueueFile(childRemote, childLocal, target.size);
            } else {
                spdlog::debug("job {}: skipping link {}", id_, childRemote);
            }
            break;
        }
        case EntryKind::Other:
            spdlog::debug("job {}: skipping special file {}", id_, childRemote);
            break;
        }
    }
}

void DownloadJob::transferFile(std::size_t idx) {
    std::string remote;
    std::string local;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        remote = tasks_[idx].remotePath;
        local = tasks_[idx].localPath;
    }
    const std::string part = local + kPartSuffix;

    SftpError failure;
    std::error_code ec;
    fs::create_directories(fs::path(local).parent_path(), ec);
    if (ec) {
        finishTask(idx, SftpError::localIO("cannot create directory for " + local + ": " + ec.message()));
        return;
    }

    auto rs = session_->read(remote, failure);
    if (!rs) {
        finishTask(idx, failure);
        return;
    }

    std::FILE* lf = std::fopen(part.c_str(), "wb");
    if (!lf) {
        finishTask(idx, SftpError::localIO("cannot create " + part + ": " + std::strerror(errno)));
        return;
    }

    std::vector<char> buf(opts_.chunkSize);
    for (;;) {
        if (cancelled_.load()) {
            failure = SftpError::cancelled();
            break;
        }
        SftpError err;
        const std::int64_t n = rs->read(buf.data(), buf.size(), err);
        if (n < 0) {
            failure = err;
            break;
        }
        if (n == 0)
            break;
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), lf) != static_cast<std::size_t>(n)) {
            failure = SftpError::localIO("write failed for " + part + ": " + std::strerror(errno));
            break;
        }
        DownloadTask snapshot;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            DownloadTask& t = tasks_[idx];
            t.transferredBytes += static_cast<std::uint64_t>(n);
            if (t.transferredBytes > t.totalBytes) {
                progress_.bytesDiscovered += t.transferredBytes - t.totalBytes;
                t.totalBytes = t.transferredBytes;
            }
            progress_.bytesDone += static_cast<std::uint64_t>(n);
            snapshot = t;
        }
        if (opts_.onTaskProgress)
            opts_.onTaskProgress(snapshot);
    }
    rs.reset();

    if (std::fclose(lf) != 0 && !failure.isSet())
        failure = SftpError::localIO("close failed for " + part + ": " + std::strerror(errno));
    if (!failure.isSet()) {
        fs::rename(part, local, ec);
        if (ec)
            failure = SftpError::localIO("cannot move " + part + " into place: " + ec.message());
    }
    if (failure.isSet()) {
        std::error_code rmEc;
        fs::remove(part, rmEc);
    }
    finishTask(idx, failure);
}

void DownloadJob::enqueueDir(const std::string& remote, const std::string& local) {
    std::lock_guard<std::mutex> lk(mtx_);
    dirQueue_.push_back(DirItem{remote, local, false});
    ++dirsPending_;
    ++outstanding_;
    cv_.notify_all();
}

void DownloadJob::enqueueFile(const std::string& remote, const std::string& local, std::uint64_t size) {
    std::lock_guard<std::mutex> lk(mtx_);
    DownloadTask t;
    t.id = tasks_.size() + 1;
    t.remotePath = remote;
    t.localPath = local;
    t.totalBytes = size;
    tasks_.push_back(std::move(t));
    fileQueue_.push_back(tasks_.size() - 1);
    ++progress_.filesDiscovered;
    progress_.bytesDiscovered += size;
    ++outstanding_;
    cv_.notify_all();
}

void DownloadJob::recordFailure(const std::string& path, const SftpError& err) {
    spdlog::warn("job {}: {}: {}", id_, path, describe(err));
    std::lock_guard<std::mutex> lk(mtx_);
    failures_.push_back(JobFailure{path, describe(err)});
    if (err.kind == ErrorKind::Connection) {
        connectionLost_ = true;
        cancelled_.store(true);
        cv_.notify_all();
    }
}

void DownloadJob::finishTask(std::size_t idx, const SftpError& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    DownloadTask& t = tasks_[idx];
    if (!err.isSet()) {
        // The file shrank while being read.
        if (t.transferredBytes < t.totalBytes) {
            progress_.bytesDiscovered -= t.totalBytes - t.transferredBytes;
            t.totalBytes = t.transferredBytes;
        }
        t.status = TaskStatus::Completed;
        ++progress_.filesDone;
        return;
    }
    if (err.kind == ErrorKind::Cancelled && !connectionLost_) {
        t.status = TaskStatus::Cancelled;
        return;
    }
    t.status = TaskStatus::Failed;
    t.failureReason = (err.kind == ErrorKind::Cancelled) ? std::string("connection lost") : describe(err);
    ++progress_.filesFailed;
    if (err.kind == ErrorKind::Connection) {
        connectionLost_ = true;
        cancelled_.store(true);
        cv_.notify_all();
    }
}

void DownloadJob::workerExited() {
    JobReport r;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (--liveWorkers_ > 0)
            return;

        std::size_t cancelledTasks = 0;
        bool anyFailed = false;
        for (auto& t : tasks_) {
            if (t.status == TaskStatus::Pending)
                t.status = TaskStatus::Cancelled;
            if (t.status == TaskStatus::Cancelled)
                ++cancelledTasks;
            if (t.status == TaskStatus::Failed) {
                anyFailed = true;
                failures_.push_back(JobFailure{t.remotePath, t.failureReason});
            }
        }
        fileQueue_.clear();
        dirQueue_.clear();

        if (connectionLost_)
            r.outcome = JobOutcome::ConnectionLost;
        else if (cancelled_.load())
            r.outcome = JobOutcome::Cancelled;
        else if (anyFailed || !failures_.empty())
            r.outcome = JobOutcome::PartiallyFailed;
        else
            r.outcome = JobOutcome::Succeeded;
        r.progress = progress_;
        r.cancelledTasks = cancelledTasks;
        r.failures = failures_;
        report_ = r;
        cv_.notify_all();
    }
    spdlog::info("job {} finished: {}", id_, jobOutcomeName(r.outcome));
    if (opts_.onFinished)
        opts_.onFinished(r);
}

} // namespace filessh

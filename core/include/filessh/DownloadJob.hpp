// Recursive download of one remote path (file or directory subtree).
//
// Traversal workers list directories and feed discovered files to transfer
// workers; both share one outstanding-work counter, so transfers start
// before enumeration ends. Files are streamed into "<name>.filessh-part"
// and renamed over the destination only once complete.
#pragma once
#include "SftpTypes.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace filessh {

class Session;

enum class TaskStatus { Pending, InProgress, Completed, Failed, Cancelled };
const char* taskStatusName(TaskStatus st);

struct DownloadTask {
    std::uint64_t id = 0;
    std::string remotePath;
    std::string localPath;
    std::uint64_t totalBytes = 0;       // raised if the file grows mid-transfer
    std::uint64_t transferredBytes = 0; // never above totalBytes
    TaskStatus status = TaskStatus::Pending;
    std::string failureReason;          // Failed only

    bool isTerminal() const {
        return status == TaskStatus::Completed || status == TaskStatus::Failed ||
               status == TaskStatus::Cancelled;
    }
};

struct JobProgress {
    std::size_t filesDone = 0;
    std::size_t filesFailed = 0;
    std::size_t filesDiscovered = 0;
    std::uint64_t bytesDone = 0;
    std::uint64_t bytesDiscovered = 0;
    bool enumerationDone = false;
};

enum class JobOutcome { Succeeded, PartiallyFailed, Cancelled, ConnectionLost };
const char* jobOutcomeName(JobOutcome o);

struct JobFailure {
    std::string path;
    std::string reason;
};

struct JobReport {
    JobOutcome outcome = JobOutcome::Succeeded;
    JobProgress progress;
    std::size_t cancelledTasks = 0;
    std::vector<JobFailure> failures; // failed listings and failed files

    std::string summary() const;
};

struct DownloadOptions {
    int concurrency = 4;
    std::size_t chunkSize = 64 * 1024;
    // Both run on worker threads.
    std::function<void(const DownloadTask&)> onTaskProgress;
    std::function<void(const JobReport&)> onFinished;
};

class DownloadJob {
public:
    // Starts the workers immediately. The local root is
    // localDest/<basename of remoteRoot>.
    static std::unique_ptr<DownloadJob> start(std::shared_ptr<Session> session,
                                              const std::string& remoteRoot,
                                              const std::string& localDest,
                                              DownloadOptions opts = {});
    // Cancels and joins.
    ~DownloadJob();

    DownloadJob(const DownloadJob&) = delete;
    DownloadJob& operator=(const DownloadJob&) = delete;

    std::uint64_t id() const { return id_; }
    const std::string& remoteRoot() const { return remoteRoot_; }
    const std::string& localRoot() const { return localRoot_; }

    void cancel();
    bool isCancelled() const { return cancelled_.load(); }
    bool isFinished() const;

    JobProgress progress() const;
    std::vector<DownloadTask> tasks() const;
    std::optional<JobReport> report() const;

    // Blocks until every worker has stopped.
    JobReport wait();

private:
    struct DirItem {
        std::string remote;
        std::string local;
        bool root = false;
    };

    DownloadJob(std::shared_ptr<Session> session, std::string remoteRoot,
                std::string localDest, DownloadOptions opts);
    void launch();

    void traversalWorker();
    void transferWorker();
    void processDir(const DirItem& item);
    void transferFile(std::size_t idx);

    void enqueueDir(const std::string& remote, const std::string& local);
    void enqueueFile(const std::string& remote, const std::string& local, std::uint64_t size);
    void recordFailure(const std::string& path, const SftpError& err);
    void finishTask(std::size_t idx, const SftpError& err);
    void workerExited();
    void joinAll();

    const std::uint64_t id_;
    std::shared_ptr<Session> session_;
    const std::string remoteRoot_;
    const std::string localRoot_;
    const DownloadOptions opts_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<DirItem> dirQueue_;
    std::deque<std::size_t> fileQueue_;
    std::deque<DownloadTask> tasks_;
    std::size_t outstanding_ = 0;  // queued or in-process dirs and files
    std::size_t dirsPending_ = 0;  // queued or in-process dirs
    int liveWorkers_ = 0;
    std::atomic<bool> cancelled_{false};
    bool connectionLost_ = false;
    std::vector<JobFailure> failures_;
    JobProgress progress_;
    std::optional<JobReport> report_;

    std::mutex joinMtx_;
    std::vector<std::thread> threads_;
};

} // namespace filessh

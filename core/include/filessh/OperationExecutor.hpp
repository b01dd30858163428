// Runs OperationRequests against a Session and patches the TreeCache.
//
// Work is split so that the cache is only touched on the foreground loop:
// validate() checks a request against the cache without any network call,
// execute() does the remote work (background thread, Session only) and
// apply() patches the cache from the result.
#pragma once
#include "OperationRequest.hpp"
#include "ProcessLauncher.hpp"
#include "SftpTypes.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace filessh {

class Session;
class TreeCache;

struct DeleteReport {
    std::vector<std::string> removed;                          // files and directories, depth first
    std::vector<std::pair<std::string, SftpError>> failures;   // path and why it stayed
    bool targetRemoved = false;
};

struct OperationResult {
    OperationRequest request;
    bool ok = false;
    SftpError error;
    DeleteReport deleted;               // Delete only
    bool uploaded = false;              // EditFile only
    std::optional<FileInfo> updatedInfo;
    ProcessOutcome process;             // EditFile and SpawnShell

    std::string summary() const;
};

struct ExecutorOptions {
    std::string editorCommand = "vi";   // may carry arguments, e.g. "code --wait"
    std::string sshProgram = "ssh";
    std::string tempRoot;               // empty: the system temp directory
    std::size_t chunkSize = 64 * 1024;
};

class OperationExecutor {
public:
    OperationExecutor(std::shared_ptr<Session> session, std::shared_ptr<ProcessLauncher> launcher,
                      ExecutorOptions opts = {});

    // Fails fast on what the cache already knows: a missing source, a
    // colliding destination (unless overwrite), an invalid name.
    static bool validate(const OperationRequest& req, const TreeCache& cache, SftpError& err);

    // Blocking; safe to call from several threads at once.
    OperationResult execute(const OperationRequest& req, const std::function<bool()>& shouldCancel = {});

    void apply(const OperationResult& result, TreeCache& cache) const;

    // Argument list for the ssh client, without the program itself.
    std::vector<std::string> shellArguments(const std::string& remoteDir) const;

    const ExecutorOptions& options() const { return opts_; }

private:
    void runDelete(const DeleteRequest& r, OperationResult& res, const std::function<bool()>& cancel);
    bool removeTree(const std::string& dir, DeleteReport& report, const std::function<bool()>& cancel);
    void runMove(const MoveRequest& r, OperationResult& res);
    void runCreateFile(const CreateFileRequest& r, OperationResult& res);
    void runCreateDirectory(const CreateDirectoryRequest& r, OperationResult& res);
    void runEdit(const EditFileRequest& r, OperationResult& res, const std::function<bool()>& cancel);
    void runShell(const SpawnShellRequest& r, OperationResult& res);

    bool downloadTo(const std::string& remote, const std::string& local,
                    const std::function<bool()>& cancel, SftpError& err);
    bool uploadFrom(const std::string& local, const std::string& remote, SftpError& err);

    std::shared_ptr<Session> session_;
    std::shared_ptr<ProcessLauncher> launcher_;
    ExecutorOptions opts_;
};

} // namespace filessh

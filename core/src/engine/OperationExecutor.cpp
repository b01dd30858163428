#include "filessh/OperationExecutor.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/RuntimeLogging.hpp"
#include "filessh/Session.hpp"
#include "filessh/TreeCache.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace filessh {

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

const char* kUploadPartSuffix = ".filessh-part";

// Private scratch directory removed with everything in it on scope exit.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& root) {
        std::error_code ec;
        fs::path base = root.empty() ? fs::temp_directory_path(ec) : fs::path(root);
        if (ec) {
            error_ = ec.message();
            return;
        }
        std::string tmpl = (base / "filessh-edit-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) {
            error_ = std::strerror(errno);
            return;
        }
        path_ = buf.data();
    }
    ~ScopedTempDir() {
        if (path_.empty())
            return;
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec)
            spdlog::warn("could not remove scratch directory {}: {}", path_, ec.message());
    }
    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    bool ok() const { return !path_.empty(); }
    const std::string& path() const { return path_; }
    const std::string& error() const { return error_; }

private:
    std::string path_;
    std::string error_;
};

std::vector<std::string> splitCommand(const std::string& cmd) {
    std::vector<std::string> out;
    std::istringstream in(cmd);
    std::string tok;
    while (in >> tok)
        out.push_back(tok);
    return out;
}

std::string shellQuote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

const char* hostKeyCheckingValue(KnownHostsPolicy p) {
    switch (p) {
    case KnownHostsPolicy::Strict:
        return "yes";
    case KnownHostsPolicy::AcceptNew:
        return "accept-new";
    case KnownHostsPolicy::Off:
        return "no";
    }
    return "accept-new";
}

struct LocalStamp {
    fs::file_time_type mtime;
    std::uintmax_t size = 0;
};

bool stampOf(const std::string& path, LocalStamp& out, std::string& why) {
    std::error_code ec;
    out.mtime = fs::last_write_time(path, ec);
    if (!ec)
        out.size = fs::file_size(path, ec);
    if (ec) {
        why = ec.message();
        return false;
    }
    return true;
}

} // namespace

std::string OperationResult::summary() const {
    std::ostringstream oss;
    oss << describeRequest(request);
    if (ok) {
        oss << ": done";
        if (std::holds_alternative<EditFileRequest>(request))
            oss << (uploaded ? " (uploaded)" : " (unchanged)");
        return oss.str();
    }
    oss << ": " << describe(error);
    if (!deleted.failures.empty()) {
        oss << " (" << deleted.removed.size() << " removed, " << deleted.failures.size() << " failed)";
        for (const auto& f : deleted.failures)
            oss << "\n  " << f.first << ": " << describe(f.second);
    }
    return oss.str();
}

OperationExecutor::OperationExecutor(std::shared_ptr<Session> session,
                                     std::shared_ptr<ProcessLauncher> launcher,
                                     ExecutorOptions opts)
    : session_(std::move(session)), launcher_(std::move(launcher)), opts_(std::move(opts)) {
    if (opts_.chunkSize == 0)
        opts_.chunkSize = 64 * 1024;
}

bool OperationExecutor::validate(const OperationRequest& req, const TreeCache& cache, SftpError& err) {
    auto checkName = [&](const std::string& path) {
        std::string why;
        if (!isValidEntryName(remoteBaseName(path), &why)) {
            err = SftpError::remoteError(RemoteErrorKind::Other, why);
            return false;
        }
        return true;
    };
    auto knownMissing = [&](const std::string& path) {
        auto e = cache.childExists(parentRemotePath(path), remoteBaseName(path));
        return e.has_value() && !*e;
    };
    auto knownPresent = [&](const std::string& path) {
        auto e = cache.childExists(parentRemotePath(path), remoteBaseName(path));
        return e.has_value() && *e;
    };

    return std::visit(
        [&](const auto& r) -> bool {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, DeleteRequest>) {
                const std::string p = normalizeRemotePath(r.path);
                if (p == "/" || p.empty()) {
                    err = SftpError::remoteError(RemoteErrorKind::PermissionDenied, "refusing to delete /");
                    return false;
                }
                if (knownMissing(p)) {
                    err = SftpError::remoteError(RemoteErrorKind::NotFound, p);
                    return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, MoveRequest>) {
                const std::string src = normalizeRemotePath(r.source);
                const std::string dst = normalizeRemotePath(r.destination);
                if (src == dst) {
                    err = SftpError::remoteError(RemoteErrorKind::Other, "source and destination are the same");
                    return false;
                }
                if (remotePathWithin(dst, src)) {
                    err = SftpError::remoteError(RemoteErrorKind::Other, "cannot move " + src + " into itself");
                    return false;
                }
                if (!checkName(dst))
                    return false;
                if (knownMissing(src)) {
                    err = SftpError::remoteError(RemoteErrorKind::NotFound, src);
                    return false;
                }
                if (!r.overwrite && knownPresent(dst)) {
                    err = SftpError::remoteError(RemoteErrorKind::AlreadyExists, dst);
                    return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, CreateFileRequest> ||
                                 std::is_same_v<T, CreateDirectoryRequest>) {
                const std::string p = normalizeRemotePath(r.path);
                if (!checkName(p))
                    return false;
                if (knownPresent(p)) {
                    err = SftpError::remoteError(RemoteErrorKind::AlreadyExists, p);
                    return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, EditFileRequest>) {
                const std::string p = normalizeRemotePath(r.path);
                if (knownMissing(p)) {
                    err = SftpError::remoteError(RemoteErrorKind::NotFound, p);
                    return false;
                }
                const RemoteNode* n = cache.find(p);
                if (n && n->info.isDir()) {
                    err = SftpError::remoteError(RemoteErrorKind::Other, p + " is a directory");
                    return false;
                }
                return true;
            } else if constexpr (std::is_same_v<T, SpawnShellRequest>) {
                const RemoteNode* n = cache.find(r.path);
                if (n && !n->info.isDir()) {
                    err = SftpError::remoteError(RemoteErrorKind::Other, r.path + " is not a directory");
                    return false;
                }
                return true;
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled request type");
            }
        },
        req);
}

OperationResult OperationExecutor::execute(const OperationRequest& req, const std::function<bool()>& shouldCancel) {
    OperationResult res;
    res.request = req;
    const std::function<bool()> cancel = shouldCancel ? shouldCancel : [] { return false; };
    if (sensitiveLoggingEnabled())
        spdlog::info("execute: {}", describeRequest(req));

    std::visit(
        [&](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, DeleteRequest>)
                runDelete(r, res, cancel);
            else if constexpr (std::is_same_v<T, MoveRequest>)
                runMove(r, res);
            else if constexpr (std::is_same_v<T, CreateFileRequest>)
                runCreateFile(r, res);
            else if constexpr (std::is_same_v<T, CreateDirectoryRequest>)
                runCreateDirectory(r, res);
            else if constexpr (std::is_same_v<T, EditFileRequest>)
                runEdit(r, res, cancel);
            else if constexpr (std::is_same_v<T, SpawnShellRequest>)
                runShell(r, res);
            else
                static_assert(kAlwaysFalse<T>, "unhandled request type");
        },
        req);

    if (!res.ok && res.error.kind != ErrorKind::Cancelled)
        spdlog::warn("{} failed: {}", describeRequest(req), describe(res.error));
    return res;
}

void OperationExecutor::runDelete(const DeleteRequest& r, OperationResult& res,
                                  const std::function<bool()>& cancel) {
    const std::string path = normalizeRemotePath(r.path);
    SftpError err;
    if (session_->remove(path, err)) {
        res.deleted.removed.push_back(path);
        res.deleted.targetRemoved = true;
        res.ok = true;
        return;
    }
    if (err.kind == ErrorKind::Connection) {
        res.error = err;
        return;
    }

    // A file-only remove fails on directories: find out whether to recurse.
    FileInfo info;
    SftpError statErr;
    if (!session_->lstat(path, info, statErr)) {
        res.error = statErr.kind == ErrorKind::Connection ? statErr : err;
        return;
    }
    if (!info.isDir()) {
        res.error = err;
        return;
    }

    if (removeTree(path, res.deleted, cancel)) {
        res.deleted.targetRemoved = true;
        res.ok = true;
        return;
    }
    const auto& failures = res.deleted.failures;
    for (const auto& f : failures) {
        if (f.second.kind == ErrorKind::Connection) {
            res.error = f.second;
            return;
        }
    }
    if (failures.size() == 1) {
        res.error = failures.front().second;
    } else {
        res.error = SftpError::remoteError(RemoteErrorKind::Other,
                                           std::to_string(failures.size()) + " entries under " + path +
                                               " could not be deleted");
    }
}

bool OperationExecutor::removeTree(const std::string& dir, DeleteReport& report,
                                   const std::function<bool()>& cancel) {
    if (cancel()) {
        report.failures.emplace_back(dir, SftpError::cancelled());
        return false;
    }
    std::vector<FileInfo> entries;
    SftpError err;
    if (!session_->list(dir, entries, err)) {
        report.failures.emplace_back(dir, err);
        return false;
    }

    bool cleared = true;
    for (const auto& e : entries) {
        if (session_->isLost())
            return false;
        std::string why;
        if (!isValidEntryName(e.name, &why)) {
            report.failures.emplace_back(joinRemotePath(dir, e.name),
                                         SftpError::remoteError(RemoteErrorKind::Other, why));
            cleared = false;
            continue;
        }
        const std::string child = joinRemotePath(dir, e.name);
        if (!remotePathWithin(child, dir) || normalizeRemotePath(child) == normalizeRemotePath(dir)) {
            report.failures.emplace_back(child, SftpError::remoteError(RemoteErrorKind::Other,
                                                                       child + " is outside " + dir));
            cleared = false;
            continue;
        }
        if (e.kind == EntryKind::Directory) {
            if (!removeTree(child, report, cancel))
                cleared = false;
            continue;
        }
        if (cancel()) {
            report.failures.emplace_back(child, SftpError::cancelled());
            return false;
        }
        SftpError rmErr;
        if (session_->remove(child, rmErr)) {
            report.removed.push_back(child);
        } else {
            report.failures.emplace_back(child, rmErr);
            cleared = false;
        }
    }
    if (!cleared)
        return false;

    SftpError rmErr;
    if (!session_->removeDir(dir, rmErr)) {
        report.failures.emplace_back(dir, rmErr);
        return false;
    }
    report.removed.push_back(dir);
    return true;
}

void OperationExecutor::runMove(const MoveRequest& r, OperationResult& res) {
    SftpError err;
    res.ok = session_->rename(normalizeRemotePath(r.source), normalizeRemotePath(r.destination), err,
                              r.overwrite);
    if (!res.ok)
        res.error = err;
}

void OperationExecutor::runCreateFile(const CreateFileRequest& r, OperationResult& res) {
    SftpError err;
    res.ok = session_->touch(normalizeRemotePath(r.path), err);
    if (!res.ok)
        res.error = err;
}

void OperationExecutor::runCreateDirectory(const CreateDirectoryRequest& r, OperationResult& res) {
    SftpError err;
    res.ok = session_->mkdir(normalizeRemotePath(r.path), err);
    if (!res.ok)
        res.error = err;
}

bool OperationExecutor::downloadTo(const std::string& remote, const std::string& local,
                                   const std::function<bool()>& cancel, SftpError& err) {
    auto rs = session_->read(remote, err);
    if (!rs)
        return false;
    std::FILE* f = std::fopen(local.c_str(), "wb");
    if (!f) {
        err = SftpError::localIO("cannot create " + local + ": " + std::strerror(errno));
        return false;
    }
    std::vector<char> buf(opts_.chunkSize);
    bool ok = true;
    for (;;) {
        if (cancel()) {
            err = SftpError::cancelled();
            ok = false;
            break;
        }
        const std::int64_t n = rs->read(buf.data(), buf.size(), err);
        if (n < 0) {
            ok = false;
            break;
        }
        if (n == 0)
            break;
        if (std::fwrite(buf.data(), 1, static_cast<std::size_t>(n), f) != static_cast<std::size_t>(n)) {
            err = SftpError::localIO("write failed for " + local + ": " + std::strerror(errno));
            ok = false;
            break;
        }
    }
    if (std::fclose(f) != 0 && ok) {
        err = SftpError::localIO("close failed for " + local + ": " + std::strerror(errno));
        ok = false;
    }
    return ok;
}

// The new content goes to "<name>.filessh-part" beside the target and only
// replaces it by rename once fully written.
bool OperationExecutor::uploadFrom(const std::string& local, const std::string& remote, SftpError& err) {
    std::FILE* f = std::fopen(local.c_str(), "rb");
    if (!f) {
        err = SftpError::localIO("cannot read " + local + ": " + std::strerror(errno));
        return false;
    }
    const std::string part = remote + kUploadPartSuffix;
    auto ws = session_->write(part, err);
    if (!ws) {
        std::fclose(f);
        return false;
    }
    std::vector<char> buf(opts_.chunkSize);
    bool ok = true;
    for (;;) {
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
        if (n > 0 && !ws->write(buf.data(), n, err)) {
            ok = false;
            break;
        }
        if (n < buf.size()) {
            if (std::ferror(f)) {
                err = SftpError::localIO("read failed for " + local);
                ok = false;
            }
            break;
        }
    }
    std::fclose(f);
    if (ok)
        ok = ws->finish(err);
    ws.reset();
    if (ok)
        ok = session_->rename(part, remote, err, /*overwrite=*/true);
    if (!ok) {
        SftpError cleanupErr;
        if (!session_->remove(part, cleanupErr) && cleanupErr.remote != RemoteErrorKind::NotFound)
            spdlog::warn("could not remove {}: {}", part, describe(cleanupErr));
    }
    return ok;
}

void OperationExecutor::runEdit(const EditFileRequest& r, OperationResult& res,
                                const std::function<bool()>& cancel) {
    const std::string remote = normalizeRemotePath(r.path);
    ScopedTempDir scratch(opts_.tempRoot);
    if (!scratch.ok()) {
        res.error = SftpError::localIO("cannot create scratch directory: " + scratch.error());
        return;
    }
    const std::string local = (fs::path(scratch.path()) / remoteBaseName(remote)).string();

    SftpError err;
    if (!downloadTo(remote, local, cancel, err)) {
        res.error = err;
        return;
    }
    LocalStamp before;
    std::string why;
    if (!stampOf(local, before, why)) {
        res.error = SftpError::localIO(local + ": " + why);
        return;
    }

    std::vector<std::string> cmd = splitCommand(opts_.editorCommand);
    if (cmd.empty())
        cmd.push_back("vi");
    const std::string program = cmd.front();
    std::vector<std::string> args(cmd.begin() + 1, cmd.end());
    args.push_back(local);

    spdlog::debug("launching editor {}", program);
    res.process = launcher_->run(program, args);
    if (!res.process.started || !res.process.normalExit) {
        res.error = SftpError::localIO("editor " + program + " failed: " +
                                       (res.process.error.empty() ? std::string("abnormal exit") : res.process.error));
        return;
    }
    if (res.process.exitCode != 0) {
        res.error = SftpError::cancelled("editor exited with status " + std::to_string(res.process.exitCode) +
                                         "; changes not uploaded");
        return;
    }

    LocalStamp after;
    if (!stampOf(local, after, why)) {
        res.error = SftpError::localIO(local + ": " + why);
        return;
    }
    if (after.mtime == before.mtime && after.size == before.size) {
        res.ok = true;
        return;
    }

    if (!uploadFrom(local, remote, err)) {
        res.error = err;
        return;
    }
    res.uploaded = true;
    FileInfo info;
    SftpError statErr;
    if (session_->stat(remote, info, statErr))
        res.updatedInfo = info;
    res.ok = true;
}

std::vector<std::string> OperationExecutor::shellArguments(const std::string& remoteDir) const {
    const SessionOptions& opt = session_->options();
    std::vector<std::string> args{"-t", "-p", std::to_string(opt.port)};
    if (opt.private_key_path && !opt.private_key_path->empty()) {
        args.push_back("-i");
        args.push_back(*opt.private_key_path);
    }
    if (opt.certificate_path && !opt.certificate_path->empty()) {
        args.push_back("-o");
        args.push_back("CertificateFile=" + *opt.certificate_path);
    }
    if (opt.known_hosts_path && !opt.known_hosts_path->empty()) {
        args.push_back("-o");
        args.push_back("UserKnownHostsFile=" + *opt.known_hosts_path);
    }
    args.push_back("-o");
    args.push_back(std::string("StrictHostKeyChecking=") + hostKeyCheckingValue(opt.known_hosts_policy));
    args.push_back(opt.username + "@" + opt.host);
    args.push_back("cd " + shellQuote(remoteDir) + " && exec \"$SHELL\" -l");
    return args;
}

void OperationExecutor::runShell(const SpawnShellRequest& r, OperationResult& res) {
    res.process = launcher_->run(opts_.sshProgram, shellArguments(normalizeRemotePath(r.path)));
    if (!res.process.started || !res.process.normalExit) {
        res.error = SftpError::localIO(opts_.sshProgram + " failed: " +
                                       (res.process.error.empty() ? std::string("abnormal exit") : res.process.error));
        return;
    }
    // The exit status is that of the last command run in the shell.
    res.ok = true;
}

void OperationExecutor::apply(const OperationResult& result, TreeCache& cache) const {
    std::visit(
        [&](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, DeleteRequest>) {
                if (result.deleted.targetRemoved) {
                    cache.applyRemove(r.path);
                    return;
                }
                for (const auto& p : result.deleted.removed)
                    cache.applyRemove(p);
                if (!result.ok && result.error.kind == ErrorKind::Remote &&
                    result.error.remote == RemoteErrorKind::NotFound && result.deleted.removed.empty())
                    cache.invalidate(parentRemotePath(normalizeRemotePath(r.path)));
            } else if constexpr (std::is_same_v<T, MoveRequest>) {
                if (result.ok) {
                    cache.applyRename(r.source, r.destination);
                } else if (result.error.kind == ErrorKind::Remote &&
                           (result.error.remote == RemoteErrorKind::NotFound ||
                            result.error.remote == RemoteErrorKind::AlreadyExists)) {
                    // The cache disagreed with the server.
                    cache.invalidate(parentRemotePath(normalizeRemotePath(r.source)));
                    cache.invalidate(parentRemotePath(normalizeRemotePath(r.destination)));
                }
            } else if constexpr (std::is_same_v<T, CreateFileRequest> ||
                                 std::is_same_v<T, CreateDirectoryRequest>) {
                if (result.ok || (result.error.kind == ErrorKind::Remote &&
                                  result.error.remote == RemoteErrorKind::AlreadyExists))
                    cache.invalidate(parentRemotePath(normalizeRemotePath(r.path)));
            } else if constexpr (std::is_same_v<T, EditFileRequest>) {
                if (result.updatedInfo)
                    cache.updateInfo(r.path, *result.updatedInfo);
            } else if constexpr (std::is_same_v<T, SpawnShellRequest>) {
                // The shell never touches the cache.
            } else {
                static_assert(kAlwaysFalse<T>, "unhandled request type");
            }
        },
        result.request);
}

} // namespace filessh

#include "filessh/Session.hpp"
#include "filessh/RuntimeLogging.hpp"

#include <spdlog/spdlog.h>

namespace filessh {

namespace {

// Registers one call in the outstanding-request table for its lifetime.
class RequestScope {
public:
    RequestScope(std::mutex& mtx, std::map<std::uint64_t, std::string>& table,
                 std::uint64_t id, const char* op)
        : mtx_(mtx), table_(table), id_(id) {
        std::lock_guard<std::mutex> lk(mtx_);
        table_.emplace(id_, op);
    }
    ~RequestScope() {
        std::lock_guard<std::mutex> lk(mtx_);
        table_.erase(id_);
    }

private:
    std::mutex& mtx_;
    std::map<std::uint64_t, std::string>& table_;
    std::uint64_t id_;
};

} // namespace

Session::Session(std::unique_ptr<SftpClient> client, const SessionOptions& opt)
    : client_(std::move(client)), opt_(opt) {}

Session::~Session() {
    std::lock_guard<std::mutex> lk(wireMtx_);
    if (client_)
        client_->disconnect();
}

std::shared_ptr<Session> Session::open(std::unique_ptr<SftpClient> client,
                                       const SessionOptions& opt,
                                       SftpError& err) {
    if (!client) {
        err = SftpError::connection("no SFTP backend");
        return nullptr;
    }
    if (!client->connect(opt, err)) {
        if (err.kind != ErrorKind::Connection)
            err = SftpError::connection(err.message);
        spdlog::warn("session handshake failed: {}", err.message);
        return nullptr;
    }
    if (sensitiveLoggingEnabled())
        spdlog::info("session open {}@{}:{}", opt.username, opt.host, opt.port);
    else
        spdlog::info("session open");
    return std::shared_ptr<Session>(new Session(std::move(client), opt));
}

template <typename Fn>
bool Session::guarded(const char* op, SftpError& err, Fn&& fn) {
    RequestScope scope(tableMtx_, outstanding_, nextRequestId_.fetch_add(1), op);
    std::lock_guard<std::mutex> lk(wireMtx_);
    if (lost_.load()) {
        err = SftpError::connection(lostReason_);
        return false;
    }
    const bool ok = fn();
    if (!ok && err.kind == ErrorKind::Connection)
        markLost(err.message);
    return ok;
}

// Expects wireMtx_ held.
void Session::markLost(const std::string& reason) {
    if (lost_.exchange(true))
        return;
    lostReason_ = reason.empty() ? std::string("connection lost") : reason;
    spdlog::error("session lost: {}", lostReason_);
}

std::string Session::lostReason() const {
    std::lock_guard<std::mutex> lk(wireMtx_);
    return lostReason_;
}

std::vector<std::pair<std::uint64_t, std::string>> Session::outstanding() const {
    std::lock_guard<std::mutex> lk(tableMtx_);
    return std::vector<std::pair<std::uint64_t, std::string>>(outstanding_.begin(), outstanding_.end());
}

bool Session::list(const std::string& path, std::vector<FileInfo>& out, SftpError& err) {
    return guarded("list", err, [&] { return client_->list(path, out, err); });
}

bool Session::stat(const std::string& path, FileInfo& info, SftpError& err) {
    return guarded("stat", err, [&] { return client_->stat(path, info, err); });
}

bool Session::lstat(const std::string& path, FileInfo& info, SftpError& err) {
    return guarded("lstat", err, [&] { return client_->lstat(path, info, err); });
}

bool Session::canonicalize(const std::string& path, std::string& out, SftpError& err) {
    return guarded("realpath", err, [&] { return client_->realpath(path, out, err); });
}

std::unique_ptr<ReadStream> Session::read(const std::string& path, SftpError& err) {
    std::unique_ptr<RemoteFile> f;
    const bool ok = guarded("open", err, [&] {
        f = client_->open(path, OpenMode::Read, err);
        return static_cast<bool>(f);
    });
    if (!ok)
        return nullptr;
    return std::unique_ptr<ReadStream>(new ReadStream(shared_from_this(), std::move(f), path));
}

std::unique_ptr<WriteStream> Session::write(const std::string& path, SftpError& err) {
    std::unique_ptr<RemoteFile> f;
    const bool ok = guarded("open", err, [&] {
        f = client_->open(path, OpenMode::WriteTruncate, err);
        return static_cast<bool>(f);
    });
    if (!ok)
        return nullptr;
    return std::unique_ptr<WriteStream>(new WriteStream(shared_from_this(), std::move(f), path));
}

bool Session::remove(const std::string& path, SftpError& err) {
    return guarded("remove", err, [&] { return client_->removeFile(path, err); });
}

bool Session::removeDir(const std::string& path, SftpError& err) {
    return guarded("rmdir", err, [&] { return client_->removeDir(path, err); });
}

bool Session::rename(const std::string& src, const std::string& dst, SftpError& err, bool overwrite) {
    return guarded("rename", err, [&] { return client_->rename(src, dst, err, overwrite); });
}

bool Session::mkdir(const std::string& path, SftpError& err) {
    return guarded("mkdir", err, [&] { return client_->mkdir(path, err); });
}

bool Session::touch(const std::string& path, SftpError& err) {
    return guarded("touch", err, [&] {
        auto f = client_->open(path, OpenMode::CreateNoTruncate, err);
        if (!f)
            return false;
        return f->close(err);
    });
}

ReadStream::ReadStream(std::shared_ptr<Session> s, std::unique_ptr<RemoteFile> f, std::string path)
    : session_(std::move(s)), file_(std::move(f)), path_(std::move(path)) {}

ReadStream::~ReadStream() {
    if (!file_)
        return;
    std::lock_guard<std::mutex> lk(session_->wireMtx_);
    SftpError err;
    if (!session_->lost_.load() && !file_->close(err))
        spdlog::debug("close of {} failed: {}", path_, err.message);
    file_.reset();
}

std::int64_t ReadStream::read(char* buf, std::size_t len, SftpError& err) {
    std::int64_t n = -1;
    session_->guarded("read", err, [&] {
        n = file_->read(buf, len, err);
        return n >= 0;
    });
    return n;
}

WriteStream::WriteStream(std::shared_ptr<Session> s, std::unique_ptr<RemoteFile> f, std::string path)
    : session_(std::move(s)), file_(std::move(f)), path_(std::move(path)) {}

WriteStream::~WriteStream() {
    if (!file_)
        return;
    std::lock_guard<std::mutex> lk(session_->wireMtx_);
    SftpError err;
    if (!session_->lost_.load() && !file_->close(err))
        spdlog::debug("close of {} failed: {}", path_, err.message);
    file_.reset();
}

bool WriteStream::write(const char* buf, std::size_t len, SftpError& err) {
    return session_->guarded("write", err, [&] { return file_->write(buf, len, err); });
}

bool WriteStream::finish(SftpError& err) {
    if (!file_)
        return true;
    const bool ok = session_->guarded("close", err, [&] { return file_->close(err); });
    {
        std::lock_guard<std::mutex> lk(session_->wireMtx_);
        file_.reset();
    }
    return ok;
}

} // namespace filessh

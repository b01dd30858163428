// Session: the single owner of one authenticated SFTP connection.
//
// Every component that talks to the remote host goes through a Session. It
// serialises calls on the connection at call and chunk granularity, so many
// workers can share it: a streamed read or write takes the connection only
// for the duration of one chunk. The first transport failure latches the
// Session as lost; every pending and later call then fails with a
// Connection error. There is no reconnect: a new Session is opened instead.
#pragma once
#include "SftpClient.hpp"
#include "SftpTypes.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace filessh {

class Session;

class ReadStream {
public:
    ~ReadStream();
    ReadStream(const ReadStream&) = delete;
    ReadStream& operator=(const ReadStream&) = delete;

    // Returns bytes read (> 0), 0 at end of file, or -1 with err filled.
    std::int64_t read(char* buf, std::size_t len, SftpError& err);

private:
    friend class Session;
    ReadStream(std::shared_ptr<Session> s, std::unique_ptr<RemoteFile> f, std::string path);

    std::shared_ptr<Session> session_;
    std::unique_ptr<RemoteFile> file_;
    std::string path_;
};

class WriteStream {
public:
    ~WriteStream();
    WriteStream(const WriteStream&) = delete;
    WriteStream& operator=(const WriteStream&) = delete;

    bool write(const char* buf, std::size_t len, SftpError& err);
    // Closes the remote handle and reports the close status.
    bool finish(SftpError& err);

private:
    friend class Session;
    WriteStream(std::shared_ptr<Session> s, std::unique_ptr<RemoteFile> f, std::string path);

    std::shared_ptr<Session> session_;
    std::unique_ptr<RemoteFile> file_;
    std::string path_;
};

class Session : public std::enable_shared_from_this<Session> {
public:
    // Performs the single handshake of this instance. Returns null with err
    // filled when connecting or authenticating fails.
    static std::shared_ptr<Session> open(std::unique_ptr<SftpClient> client,
                                         const SessionOptions& opt,
                                         SftpError& err);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    bool list(const std::string& path, std::vector<FileInfo>& out, SftpError& err);
    bool stat(const std::string& path, FileInfo& info, SftpError& err);
    bool lstat(const std::string& path, FileInfo& info, SftpError& err);
    bool canonicalize(const std::string& path, std::string& out, SftpError& err);

    std::unique_ptr<ReadStream> read(const std::string& path, SftpError& err);
    // Creates or truncates the remote file.
    std::unique_ptr<WriteStream> write(const std::string& path, SftpError& err);

    bool remove(const std::string& path, SftpError& err);
    bool removeDir(const std::string& path, SftpError& err);
    bool rename(const std::string& src, const std::string& dst, SftpError& err, bool overwrite = false);
    bool mkdir(const std::string& path, SftpError& err);
    // Creates an empty file when missing; never truncates.
    bool touch(const std::string& path, SftpError& err);

    bool isLost() const { return lost_.load(); }
    std::string lostReason() const;
    const SessionOptions& options() const { return opt_; }

    // Calls issued and not yet completed, oldest first (request id, operation).
    std::vector<std::pair<std::uint64_t, std::string>> outstanding() const;

private:
    friend class ReadStream;
    friend class WriteStream;

    Session(std::unique_ptr<SftpClient> client, const SessionOptions& opt);

    // Runs fn with the connection held, tracking it in the request table.
    template <typename Fn>
    bool guarded(const char* op, SftpError& err, Fn&& fn);
    void markLost(const std::string& reason);

    std::unique_ptr<SftpClient> client_;
    SessionOptions opt_;

    mutable std::mutex wireMtx_;
    std::atomic<bool> lost_{false};
    std::string lostReason_;

    mutable std::mutex tableMtx_;
    std::atomic<std::uint64_t> nextRequestId_{1};
    std::map<std::uint64_t, std::string> outstanding_;
};

} // namespace filessh

// Abstract SFTP backend. Concrete implementations (libssh2, in-memory mock)
// follow this API so the engine stays decoupled from the transport.
// Backends are not thread-safe; Session serialises every call.
#pragma once
#include "SftpTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace filessh {

// Open remote file handle, released by close() or the destructor.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Returns bytes read (> 0), 0 at end of file, or -1 with err filled.
    virtual std::int64_t read(char* buf, std::size_t len, SftpError& err) = 0;
    // Writes the whole buffer or fails.
    virtual bool write(const char* buf, std::size_t len, SftpError& err) = 0;
    virtual bool close(SftpError& err) = 0;
};

enum class OpenMode {
    Read,
    WriteTruncate,    // create or truncate
    CreateNoTruncate  // create if missing, keep existing content
};

class SftpClient {
public:
    virtual ~SftpClient() = default;

    virtual bool connect(const SessionOptions& opt, SftpError& err) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Directory listing without "." and "..". Symlinks are reported as such.
    virtual bool list(const std::string& remote_path,
                      std::vector<FileInfo>& out,
                      SftpError& err) = 0;

    // stat follows symlinks, lstat does not. The name field is left empty.
    virtual bool stat(const std::string& remote_path, FileInfo& info, SftpError& err) = 0;
    virtual bool lstat(const std::string& remote_path, FileInfo& info, SftpError& err) = 0;

    // Absolute, canonical form of a (possibly relative) path.
    virtual bool realpath(const std::string& remote_path, std::string& out, SftpError& err) = 0;

    virtual std::unique_ptr<RemoteFile> open(const std::string& remote_path,
                                             OpenMode mode,
                                             SftpError& err) = 0;

    virtual bool mkdir(const std::string& remote_dir,
                       SftpError& err,
                       unsigned int mode = 0755) = 0;

    virtual bool removeFile(const std::string& remote_path, SftpError& err) = 0;

    virtual bool removeDir(const std::string& remote_dir, SftpError& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        SftpError& err,
                        bool overwrite = false) = 0;
};

} // namespace filessh

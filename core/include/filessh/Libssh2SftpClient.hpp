#pragma once
#include "SftpClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal types
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;
struct _LIBSSH2_SFTP_HANDLE;

namespace filessh {

class Libssh2SftpClient : public SftpClient {
public:
  Libssh2SftpClient();
  ~Libssh2SftpClient() override;

  bool connect(const SessionOptions& opt, SftpError& err) override;
  void disconnect() override;
  bool isConnected() const override { return connected_; }

  bool list(const std::string& remote_path,
            std::vector<FileInfo>& out,
            SftpError& err) override;

  bool stat(const std::string& remote_path, FileInfo& info, SftpError& err) override;
  bool lstat(const std::string& remote_path, FileInfo& info, SftpError& err) override;
  bool realpath(const std::string& remote_path, std::string& out, SftpError& err) override;

  std::unique_ptr<RemoteFile> open(const std::string& remote_path,
                                   OpenMode mode,
                                   SftpError& err) override;

  bool mkdir(const std::string& remote_dir, SftpError& err, unsigned int mode = 0755) override;
  bool removeFile(const std::string& remote_path, SftpError& err) override;
  bool removeDir(const std::string& remote_dir, SftpError& err) override;
  bool rename(const std::string& from,
              const std::string& to,
              SftpError& err,
              bool overwrite = false) override;

  // Maps the session's last error into the error taxonomy. A transport
  // failure also flips the client to disconnected.
  SftpError lastError(const std::string& what);

private:
  bool connected_ = false;
  int  sock_ = -1;
  _LIBSSH2_SESSION* session_ = nullptr;
  _LIBSSH2_SFTP*    sftp_    = nullptr;

  bool tcpConnect(const std::string& host, uint16_t port, SftpError& err);
  bool verifyHostKey(const SessionOptions& opt, SftpError& err);
  bool authenticate(const SessionOptions& opt, SftpError& err);
  bool sshHandshakeAuth(const SessionOptions& opt, SftpError& err);
  bool statImpl(const std::string& remote_path, int statType, FileInfo& info, SftpError& err);
};

} // namespace filessh

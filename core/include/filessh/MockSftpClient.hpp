#pragma once
#include "SftpClient.hpp"
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace filessh {

enum class MockOp {
  Connect, List, Stat, Lstat, Realpath, Open, Read, Write,
  Mkdir, RemoveFile, RemoveDir, Rename
};

// In-memory "remote" filesystem used by the tests. Unlike real backends it
// is safe to poke from a test thread while a Session drives it.
class MockSftpClient : public SftpClient {
public:
  MockSftpClient();

  bool connect(const SessionOptions& opt, SftpError& err) override;
  void disconnect() override;
  bool isConnected() const override;

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

  // Filesystem setup. Parents are created as needed.
  void addDir(const std::string& path);
  void addFile(const std::string& path, const std::string& content, std::uint32_t perms = 0644);
  void addSymlink(const std::string& path, const std::string& target);
  void appendContent(const std::string& path, const std::string& extra);
  void setHome(const std::string& path);

  bool exists(const std::string& path) const;
  std::optional<std::string> content(const std::string& path) const;
  std::optional<FileInfo> entry(const std::string& path) const;

  // Makes the next `times` calls of `op` on `path` fail with `error`
  // (empty path: any path, negative times: forever).
  void failOn(MockOp op, const std::string& path, SftpError error, int times = -1);
  void clearFailures();

  std::size_t calls(MockOp op) const;
  void resetCalls();

  // Transport simulation.
  void setReadDelay(std::chrono::milliseconds delay);
  void setMaxReadChunk(std::size_t bytes);
  void dropConnection();
  void dropAfterReads(std::size_t reads);

private:
  friend class MockRemoteFile;

  struct Node {
    FileInfo info;
    std::string content;
    std::string target; // symlinks only
  };
  struct FailureRule {
    MockOp op;
    std::string path;
    SftpError error;
    int remaining;
  };

  mutable std::mutex mtx_;
  bool connected_ = false;
  bool dropped_ = false;
  std::size_t dropAfterReads_ = 0; // 0 = never
  SessionOptions lastOpt_{};
  std::string home_ = "/root";
  std::map<std::string, Node> nodes_;
  std::vector<FailureRule> failures_;
  std::map<MockOp, std::size_t> calls_;
  std::chrono::milliseconds readDelay_{0};
  std::size_t maxReadChunk_ = 0; // 0 = caller's buffer size
  std::uint64_t clock_ = 1000;

  // All helpers below expect mtx_ to be held.
  bool beginCall(MockOp op, const std::string& path, SftpError& err);
  std::string resolve(const std::string& path) const;
  const Node* follow(const std::string& path) const;
  bool hasChildren(const std::string& path) const;
  void ensureParents(const std::string& path);
  void touchNode(Node& n);

  // Used by open handles; these take the lock themselves.
  std::int64_t readAt(const std::string& path, std::size_t offset,
                      char* buf, std::size_t len, SftpError& err);
  bool writeAt(const std::string& path, std::size_t offset,
               const char* buf, std::size_t len, SftpError& err);
};

} // namespace filessh

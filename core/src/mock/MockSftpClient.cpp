#include "filessh/MockSftpClient.hpp"
#include "filessh/RemotePath.hpp"
#include <algorithm>
#include <thread>

namespace filessh {

class MockRemoteFile : public RemoteFile {
public:
  MockRemoteFile(MockSftpClient* owner, std::string path)
      : owner_(owner), path_(std::move(path)) {}

  std::int64_t read(char* buf, std::size_t len, SftpError& err) override {
    if (closed_) {
      err = SftpError::localIO("file handle already closed");
      return -1;
    }
    std::int64_t n = owner_->readAt(path_, offset_, buf, len, err);
    if (n > 0) offset_ += static_cast<std::size_t>(n);
    return n;
  }

  bool write(const char* buf, std::size_t len, SftpError& err) override {
    if (closed_) {
      err = SftpError::localIO("file handle already closed");
      return false;
    }
    if (!owner_->writeAt(path_, offset_, buf, len, err)) return false;
    offset_ += len;
    return true;
  }

  bool close(SftpError&) override {
    closed_ = true;
    return true;
  }

private:
  MockSftpClient* owner_;
  std::string path_;
  std::size_t offset_ = 0;
  bool closed_ = false;
};

MockSftpClient::MockSftpClient() {
  Node root;
  root.info.name = "/";
  root.info.kind = EntryKind::Directory;
  root.info.mode = 040755;
  nodes_["/"] = root;
}

bool MockSftpClient::connect(const SessionOptions& opt, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  ++calls_[MockOp::Connect];
  for (auto it = failures_.begin(); it != failures_.end(); ++it) {
    if (it->op == MockOp::Connect) {
      err = it->error;
      if (it->remaining > 0 && --it->remaining == 0) failures_.erase(it);
      return false;
    }
  }
  if (opt.host.empty() || opt.username.empty()) {
    err = SftpError::connection("host and user are required");
    return false;
  }
  connected_ = true;
  dropped_ = false;
  lastOpt_ = opt;
  return true;
}

void MockSftpClient::disconnect() {
  std::lock_guard<std::mutex> lk(mtx_);
  connected_ = false;
}

bool MockSftpClient::isConnected() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return connected_ && !dropped_;
}

bool MockSftpClient::beginCall(MockOp op, const std::string& path, SftpError& err) {
  ++calls_[op];
  if (!connected_) {
    err = SftpError::connection("not connected");
    return false;
  }
  if (dropped_) {
    err = SftpError::connection("connection reset by peer");
    return false;
  }
  for (auto it = failures_.begin(); it != failures_.end(); ++it) {
    if (it->op != op) continue;
    if (!it->path.empty() && normalizeRemotePath(it->path) != path) continue;
    err = it->error;
    if (err.kind == ErrorKind::Connection) dropped_ = true;
    if (it->remaining > 0 && --it->remaining == 0) failures_.erase(it);
    return false;
  }
  return true;
}

std::string MockSftpClient::resolve(const std::string& path) const {
  if (path.empty()) return home_;
  if (path.front() == '/') return normalizeRemotePath(path);
  return normalizeRemotePath(joinRemotePath(home_, path));
}

const MockSftpClient::Node* MockSftpClient::follow(const std::string& path) const {
  std::string cur = path;
  for (int hops = 0; hops < 8; ++hops) {
    auto it = nodes_.find(cur);
    if (it == nodes_.end()) return nullptr;
    if (it->second.info.kind != EntryKind::Symlink) return &it->second;
    const std::string& t = it->second.target;
    cur = (!t.empty() && t.front() == '/')
              ? normalizeRemotePath(t)
              : normalizeRemotePath(joinRemotePath(parentRemotePath(cur), t));
  }
  return nullptr;
}

bool MockSftpClient::hasChildren(const std::string& path) const {
  for (const auto& kv : nodes_) {
    if (kv.first != path && parentRemotePath(kv.first) == path) return true;
  }
  return false;
}

void MockSftpClient::ensureParents(const std::string& path) {
  const std::string parent = parentRemotePath(path);
  if (parent == path || nodes_.count(parent)) return;
  ensureParents(parent);
  Node n;
  n.info.name = remoteBaseName(parent);
  n.info.kind = EntryKind::Directory;
  n.info.mode = 040755;
  touchNode(n);
  nodes_[parent] = n;
}

void MockSftpClient::touchNode(Node& n) {
  n.info.mtime = ++clock_;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_path.empty() ? "/" : remote_path);
  if (!beginCall(MockOp::List, path, err)) return false;

  const Node* dir = follow(path);
  if (!dir) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such directory: " + path);
    return false;
  }
  if (!dir->info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::Other, "not a directory: " + path);
    return false;
  }
  std::string real = path;
  for (const auto& kv : nodes_) {
    if (&kv.second == dir) {
      real = kv.first;
      break;
    }
  }
  out.clear();
  for (const auto& kv : nodes_) {
    if (kv.first == real || parentRemotePath(kv.first) != real) continue;
    out.push_back(kv.second.info);
  }
  std::sort(out.begin(), out.end(), [](const FileInfo& a, const FileInfo& b) {
    if (a.isDir() != b.isDir()) return a.isDir(); // directories first
    return a.name < b.name;
  });
  return true;
}

bool MockSftpClient::stat(const std::string& remote_path, FileInfo& info, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_path);
  if (!beginCall(MockOp::Stat, path, err)) return false;
  const Node* n = follow(path);
  if (!n) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such file: " + path);
    return false;
  }
  info = n->info;
  info.name.clear();
  return true;
}

bool MockSftpClient::lstat(const std::string& remote_path, FileInfo& info, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_path);
  if (!beginCall(MockOp::Lstat, path, err)) return false;
  auto it = nodes_.find(path);
  if (it == nodes_.end()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such file: " + path);
    return false;
  }
  info = it->second.info;
  info.name.clear();
  return true;
}

bool MockSftpClient::realpath(const std::string& remote_path, std::string& out, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_path);
  if (!beginCall(MockOp::Realpath, path, err)) return false;
  if (!nodes_.count(path)) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such file: " + path);
    return false;
  }
  out = path;
  return true;
}

std::unique_ptr<RemoteFile> MockSftpClient::open(const std::string& remote_path,
                                                 OpenMode mode,
                                                 SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_path);
  if (!beginCall(MockOp::Open, path, err)) return nullptr;

  if (mode == OpenMode::Read) {
    const Node* n = follow(path);
    if (!n) {
      err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such file: " + path);
      return nullptr;
    }
    if (n->info.isDir()) {
      err = SftpError::remoteError(RemoteErrorKind::Other, "is a directory: " + path);
      return nullptr;
    }
    return std::make_unique<MockRemoteFile>(this, path);
  }

  const Node* parent = follow(parentRemotePath(path));
  if (!parent || !parent->info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such directory: " + parentRemotePath(path));
    return nullptr;
  }
  auto it = nodes_.find(path);
  if (it != nodes_.end() && it->second.info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::Other, "is a directory: " + path);
    return nullptr;
  }
  if (it == nodes_.end()) {
    Node n;
    n.info.name = remoteBaseName(path);
    n.info.kind = EntryKind::File;
    n.info.mode = 0100644;
    touchNode(n);
    nodes_[path] = n;
  } else if (mode == OpenMode::WriteTruncate) {
    it->second.content.clear();
    it->second.info.size = 0;
    touchNode(it->second);
  }
  return std::make_unique<MockRemoteFile>(this, path);
}

std::int64_t MockSftpClient::readAt(const std::string& path, std::size_t offset,
                                    char* buf, std::size_t len, SftpError& err) {
  std::chrono::milliseconds delay{0};
  {
    std::lock_guard<std::mutex> lk(mtx_);
    delay = readDelay_;
  }
  if (delay.count() > 0) std::this_thread::sleep_for(delay);

  std::lock_guard<std::mutex> lk(mtx_);
  if (!beginCall(MockOp::Read, path, err)) return -1;
  if (dropAfterReads_ > 0 && calls_[MockOp::Read] > dropAfterReads_) {
    dropped_ = true;
    err = SftpError::connection("connection reset by peer");
    return -1;
  }
  const Node* n = follow(path);
  if (!n) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "file vanished: " + path);
    return -1;
  }
  if (offset >= n->content.size()) return 0;
  std::size_t take = std::min(len, n->content.size() - offset);
  if (maxReadChunk_ > 0) take = std::min(take, maxReadChunk_);
  std::copy_n(n->content.data() + offset, take, buf);
  return static_cast<std::int64_t>(take);
}

bool MockSftpClient::writeAt(const std::string& path, std::size_t offset,
                             const char* buf, std::size_t len, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!beginCall(MockOp::Write, path, err)) return false;
  auto it = nodes_.find(path);
  if (it == nodes_.end()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "file vanished: " + path);
    return false;
  }
  std::string& c = it->second.content;
  if (c.size() < offset + len) c.resize(offset + len);
  std::copy_n(buf, len, c.begin() + static_cast<std::ptrdiff_t>(offset));
  it->second.info.size = c.size();
  touchNode(it->second);
  return true;
}

bool MockSftpClient::mkdir(const std::string& remote_dir, SftpError& err, unsigned int mode) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_dir);
  if (!beginCall(MockOp::Mkdir, path, err)) return false;
  if (nodes_.count(path)) {
    err = SftpError::remoteError(RemoteErrorKind::AlreadyExists, "already exists: " + path);
    return false;
  }
  const Node* parent = follow(parentRemotePath(path));
  if (!parent || !parent->info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such directory: " + parentRemotePath(path));
    return false;
  }
  Node n;
  n.info.name = remoteBaseName(path);
  n.info.kind = EntryKind::Directory;
  n.info.mode = 040000 | (mode & 07777);
  touchNode(n);
  nodes_[path] = n;
  return true;
}

bool MockSftpClient::removeFile(const std::string& remote_path, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_path);
  if (!beginCall(MockOp::RemoveFile, path, err)) return false;
  auto it = nodes_.find(path);
  if (it == nodes_.end()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such file: " + path);
    return false;
  }
  if (it->second.info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::Other, "is a directory: " + path);
    return false;
  }
  nodes_.erase(it);
  return true;
}

bool MockSftpClient::removeDir(const std::string& remote_dir, SftpError& err) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string path = resolve(remote_dir);
  if (!beginCall(MockOp::RemoveDir, path, err)) return false;
  auto it = nodes_.find(path);
  if (it == nodes_.end()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such directory: " + path);
    return false;
  }
  if (!it->second.info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::Other, "not a directory: " + path);
    return false;
  }
  if (hasChildren(path)) {
    err = SftpError::remoteError(RemoteErrorKind::NotEmpty, "directory not empty: " + path);
    return false;
  }
  nodes_.erase(it);
  return true;
}

bool MockSftpClient::rename(const std::string& from,
                            const std::string& to,
                            SftpError& err,
                            bool overwrite) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string src = resolve(from);
  const std::string dst = resolve(to);
  if (!beginCall(MockOp::Rename, src, err)) return false;
  if (src == dst) return nodes_.count(src) > 0;
  if (!nodes_.count(src)) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such file: " + src);
    return false;
  }
  const Node* parent = follow(parentRemotePath(dst));
  if (!parent || !parent->info.isDir()) {
    err = SftpError::remoteError(RemoteErrorKind::NotFound, "no such directory: " + parentRemotePath(dst));
    return false;
  }
  if (remotePathWithin(dst, src) && dst != src) {
    err = SftpError::remoteError(RemoteErrorKind::Other, "cannot move a directory into itself");
    return false;
  }
  auto existing = nodes_.find(dst);
  if (existing != nodes_.end()) {
    if (!overwrite) {
      err = SftpError::remoteError(RemoteErrorKind::AlreadyExists, "already exists: " + dst);
      return false;
    }
    if (existing->second.info.isDir() && hasChildren(dst)) {
      err = SftpError::remoteError(RemoteErrorKind::NotEmpty, "directory not empty: " + dst);
      return false;
    }
    nodes_.erase(existing);
  }

  std::vector<std::pair<std::string, Node>> moved;
  for (auto it = nodes_.begin(); it != nodes_.end();) {
    if (remotePathWithin(it->first, src)) {
      moved.emplace_back(dst + it->first.substr(src.size()), std::move(it->second));
      it = nodes_.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& m : moved) {
    if (m.first == dst) m.second.info.name = remoteBaseName(dst);
    nodes_[m.first] = std::move(m.second);
  }
  return true;
}

void MockSftpClient::addDir(const std::string& path) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string p = normalizeRemotePath(path);
  if (nodes_.count(p)) return;
  ensureParents(p);
  Node n;
  n.info.name = remoteBaseName(p);
  n.info.kind = EntryKind::Directory;
  n.info.mode = 040755;
  touchNode(n);
  nodes_[p] = n;
}

void MockSftpClient::addFile(const std::string& path, const std::string& content, std::uint32_t perms) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string p = normalizeRemotePath(path);
  ensureParents(p);
  Node n;
  n.info.name = remoteBaseName(p);
  n.info.kind = EntryKind::File;
  n.info.mode = 0100000 | (perms & 07777);
  n.info.size = content.size();
  n.content = content;
  touchNode(n);
  nodes_[p] = n;
}

void MockSftpClient::addSymlink(const std::string& path, const std::string& target) {
  std::lock_guard<std::mutex> lk(mtx_);
  const std::string p = normalizeRemotePath(path);
  ensureParents(p);
  Node n;
  n.info.name = remoteBaseName(p);
  n.info.kind = EntryKind::Symlink;
  n.info.mode = 0120777;
  n.info.size = target.size();
  n.target = target;
  touchNode(n);
  nodes_[p] = n;
}

void MockSftpClient::appendContent(const std::string& path, const std::string& extra) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = nodes_.find(normalizeRemotePath(path));
  if (it == nodes_.end()) return;
  it->second.content += extra;
  it->second.info.size = it->second.content.size();
  touchNode(it->second);
}

void MockSftpClient::setHome(const std::string& path) {
  std::lock_guard<std::mutex> lk(mtx_);
  home_ = normalizeRemotePath(path);
}

bool MockSftpClient::exists(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return nodes_.count(normalizeRemotePath(path)) > 0;
}

std::optional<std::string> MockSftpClient::content(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = nodes_.find(normalizeRemotePath(path));
  if (it == nodes_.end() || it->second.info.kind != EntryKind::File) return std::nullopt;
  return it->second.content;
}

std::optional<FileInfo> MockSftpClient::entry(const std::string& path) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = nodes_.find(normalizeRemotePath(path));
  if (it == nodes_.end()) return std::nullopt;
  return it->second.info;
}

void MockSftpClient::failOn(MockOp op, const std::string& path, SftpError error, int times) {
  std::lock_guard<std::mutex> lk(mtx_);
  failures_.push_back(FailureRule{op, path, std::move(error), times});
}

void MockSftpClient::clearFailures() {
  std::lock_guard<std::mutex> lk(mtx_);
  failures_.clear();
}

std::size_t MockSftpClient::calls(MockOp op) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = calls_.find(op);
  return it == calls_.end() ? 0 : it->second;
}

void MockSftpClient::resetCalls() {
  std::lock_guard<std::mutex> lk(mtx_);
  calls_.clear();
}

void MockSftpClient::setReadDelay(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lk(mtx_);
  readDelay_ = delay;
}

void MockSftpClient::setMaxReadChunk(std::size_t bytes) {
  std::lock_guard<std::mutex> lk(mtx_);
  maxReadChunk_ = bytes;
}

void MockSftpClient::dropConnection() {
  std::lock_guard<std::mutex> lk(mtx_);
  dropped_ = true;
}

void MockSftpClient::dropAfterReads(std::size_t reads) {
  std::lock_guard<std::mutex> lk(mtx_);
  dropAfterReads_ = reads;
}

} // namespace filessh

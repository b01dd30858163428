// libssh2 backend: owns the TCP socket, the SSH session and the SFTP channel.
// Includes TCP/SSH keepalive, known_hosts validation and key/certificate auth.
#include "filessh/Libssh2SftpClient.hpp"
#include "filessh/RuntimeLogging.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace filessh {

namespace {

std::once_flag g_libssh2_once;

EntryKind kindFromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    if (!(a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS))
        return EntryKind::File;
    switch (a.permissions & LIBSSH2_SFTP_S_IFMT) {
    case LIBSSH2_SFTP_S_IFDIR:
        return EntryKind::Directory;
    case LIBSSH2_SFTP_S_IFLNK:
        return EntryKind::Symlink;
    case LIBSSH2_SFTP_S_IFREG:
        return EntryKind::File;
    default:
        return EntryKind::Other;
    }
}

FileInfo infoFromAttrs(const LIBSSH2_SFTP_ATTRIBUTES& a) {
    FileInfo fi{};
    fi.kind = kindFromAttrs(a);
    if (a.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = a.filesize;
    if (a.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = a.mtime;
    if (a.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = static_cast<std::uint32_t>(a.permissions);
    if (a.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        fi.uid = static_cast<std::uint32_t>(a.uid);
        fi.gid = static_cast<std::uint32_t>(a.gid);
    }
    return fi;
}

std::string hexFingerprint(const unsigned char* h, int len, const char* prefix) {
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < len; ++i) {
        if (i) oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
        oss << b;
    }
    return oss.str();
}

} // namespace

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(Libssh2SftpClient* owner, LIBSSH2_SFTP_HANDLE* h, std::string path)
        : owner_(owner), handle_(h), path_(std::move(path)) {}

    ~Libssh2RemoteFile() override {
        if (handle_)
            libssh2_sftp_close(handle_);
    }

    std::int64_t read(char* buf, std::size_t len, SftpError& err) override {
        if (!handle_) {
            err = SftpError::localIO("file handle already closed");
            return -1;
        }
        ssize_t n = libssh2_sftp_read(handle_, buf, len);
        if (n < 0) {
            err = owner_->lastError("read failed for " + path_);
            return -1;
        }
        return static_cast<std::int64_t>(n);
    }

    bool write(const char* buf, std::size_t len, SftpError& err) override {
        if (!handle_) {
            err = SftpError::localIO("file handle already closed");
            return false;
        }
        std::size_t remain = len;
        const char* p = buf;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(handle_, p, remain);
            if (w < 0) {
                err = owner_->lastError("write failed for " + path_);
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
        }
        return true;
    }

    bool close(SftpError& err) override {
        if (!handle_)
            return true;
        int rc = libssh2_sftp_close(handle_);
        handle_ = nullptr;
        if (rc != 0) {
            err = owner_->lastError("close failed for " + path_);
            return false;
        }
        return true;
    }

private:
    Libssh2SftpClient* owner_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        int rc = libssh2_init(0);
        if (rc != 0)
            spdlog::error("libssh2_init failed rc={}", rc);
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

SftpError Libssh2SftpClient::lastError(const std::string& what) {
    if (!session_)
        return SftpError::connection(what + ": not connected");
    char* emsg = nullptr;
    int elen = 0;
    const int rc = libssh2_session_last_error(session_, &emsg, &elen, 0);
    const std::string detail = (emsg && elen > 0) ? std::string(emsg, static_cast<std::size_t>(elen)) : std::string();

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        const unsigned long fx = libssh2_sftp_last_error(sftp_);
        switch (fx) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:
            return SftpError::remoteError(RemoteErrorKind::NotFound, what);
        case LIBSSH2_FX_PERMISSION_DENIED:
            return SftpError::remoteError(RemoteErrorKind::PermissionDenied, what);
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:
            return SftpError::remoteError(RemoteErrorKind::AlreadyExists, what);
        case LIBSSH2_FX_DIR_NOT_EMPTY:
            return SftpError::remoteError(RemoteErrorKind::NotEmpty, what);
        case LIBSSH2_FX_NO_CONNECTION:
        case LIBSSH2_FX_CONNECTION_LOST:
            connected_ = false;
            return SftpError::connection(what + " (SFTP channel lost)");
        default:
            return SftpError::remoteError(RemoteErrorKind::Other,
                                          what + " (SFTP status " + std::to_string(fx) + ")");
        }
    }

    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_TIMEOUT:
    case LIBSSH2_ERROR_TIMEOUT:
        connected_ = false;
        return SftpError::connection(what + (detail.empty() ? std::string() : ": " + detail));
    default:
        break;
    }
    return SftpError::remoteError(RemoteErrorKind::Other,
                                  what + (detail.empty() ? std::string() : ": " + detail));
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, SftpError& err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = SftpError::connection(std::string("could not resolve host: ") + gai_strerror(gai));
        return false;
    }

    int s = -1;
    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // No SO_RCVTIMEO/SO_SNDTIMEO: they break userauth on some servers.
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
        s = -1;
    }
    freeaddrinfo(res);
    err = SftpError::connection("could not connect to " + host + ":" + portStr);
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, SftpError& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = SftpError::connection("could not initialise known_hosts");
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char* home = std::getenv("HOME");
        if (home) khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("known_hosts missing or unreadable (strict policy)");
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("could not read the server host key");
        return false;
    }

    int alg = 0;
    std::string algName;
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        algName = "RSA";
        break;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        algName = "DSA";
        break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        algName = "ECDSA-256";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        algName = "ECDSA-384";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        algName = "ECDSA-521";
        break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        algName = "ED25519";
        break;
#endif
    default:
        algName = "UNKNOWN";
        break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("host key for " + opt.host + " does not match known_hosts");
        return false;
    }
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("host " + opt.host + " is not in known_hosts");
        return false;
    }

    // AcceptNew: confirm through the callback when one is set, then store.
    std::string fpStr;
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
    if (h) fpStr = hexFingerprint(h, 32, "SHA256:");
#else
    const unsigned char* h = reinterpret_cast<const unsigned char*>(
        libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA1));
    if (h) fpStr = hexFingerprint(h, 20, "SHA1:");
#endif
    if (opt.hostkey_confirm_cb && !opt.hostkey_confirm_cb(opt.host, opt.port, algName, fpStr)) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("unknown host key rejected by user");
        return false;
    }
    spdlog::info("accepting new {} host key {}", algName, fpStr);
    if (khPath.empty()) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("known_hosts path is not defined");
        return false;
    }
    const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                             hostkey, keylen,
                                             nullptr, 0, addMask, nullptr);
    if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        libssh2_knownhost_free(nh);
        err = SftpError::connection("could not store the host key in " + khPath);
        return false;
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::authenticate(const SessionOptions& opt, SftpError& err) {
    // Explicit key first. With a certificate, libssh2 sends the certificate
    // blob as the public key and signs with the private key.
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        const char* pubkey = opt.certificate_path ? opt.certificate_path->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile_ex(session_,
                                                        opt.username.c_str(),
                                                        static_cast<unsigned>(opt.username.size()),
                                                        pubkey,
                                                        opt.private_key_path->c_str(),
                                                        passphrase);
        if (rc == 0)
            return true;
        char* emsg = nullptr;
        int elen = 0;
        libssh2_session_last_error(session_, &emsg, &elen, 0);
        err = SftpError::connection(std::string(opt.certificate_path ? "certificate" : "public key") +
                                    " authentication failed" +
                                    ((emsg && elen > 0) ? ": " + std::string(emsg, static_cast<std::size_t>(elen)) : std::string()));
        return false;
    }

    // No key given: try ssh-agent if the server accepts publickey.
    char* methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                          static_cast<unsigned>(opt.username.size()));
    const std::string authlist = methods ? std::string(methods) : std::string();
    if (authlist.find("publickey") == std::string::npos) {
        err = SftpError::connection("no private key given and the server does not accept public keys"
                                    + (authlist.empty() ? std::string() : " (methods: " + authlist + ")"));
        return false;
    }

    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0) {
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0 && tries < kMaxAgentTries) {
                prev = identity;
                ++tries;
                int arc = -1;
                for (;;) {
                    arc = libssh2_agent_userauth(agent, opt.username.c_str(), identity);
                    if (arc != LIBSSH2_ERROR_EAGAIN) break;
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                if (arc == 0) {
                    authed = true;
                    break;
                }
            }
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    if (!authed) {
        err = SftpError::connection("no credentials: no private key given and ssh-agent had no usable identity");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, SftpError& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = SftpError::connection("libssh2_session_init failed");
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = SftpError::connection("SSH handshake failed");
        return false;
    }

    libssh2_session_set_blocking(session_, 1);
#ifdef LIBSSH2_SESSION_TIMEOUT
    libssh2_session_set_timeout(session_, 20000); // 20s
#endif
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;
    if (!authenticate(opt, err)) return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = SftpError::connection("could not start the SFTP subsystem");
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, SftpError& err) {
    if (connected_) {
        err = SftpError::connection("already connected");
        return false;
    }
    if (sensitiveLoggingEnabled())
        spdlog::info("connecting to {}@{}:{}", opt.username, opt.host, opt.port);
    else
        spdlog::info("connecting (port {})", opt.port);
    if (!tcpConnect(opt.host, opt.port, err)) return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

bool Libssh2SftpClient::list(const std::string& remote_path,
                             std::vector<FileInfo>& out,
                             SftpError& err) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = lastError("cannot open directory " + path);
        return false;
    }

    out.clear();
    out.reserve(64);

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi = infoFromAttrs(attrs);
            fi.name = std::string(filename, static_cast<std::size_t>(rc));
            if (fi.name == "." || fi.name == "..") continue;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break;
        } else {
            err = lastError("cannot read directory " + path);
            libssh2_sftp_closedir(dir);
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::statImpl(const std::string& remote_path, int statType,
                                 FileInfo& info, SftpError& err) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }
    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(sftp_, remote_path.c_str(),
                                  static_cast<unsigned>(remote_path.size()),
                                  statType, &st);
    if (rc != 0) {
        err = lastError("stat failed for " + remote_path);
        return false;
    }
    info = infoFromAttrs(st);
    return true;
}

bool Libssh2SftpClient::stat(const std::string& remote_path, FileInfo& info, SftpError& err) {
    return statImpl(remote_path, LIBSSH2_SFTP_STAT, info, err);
}

bool Libssh2SftpClient::lstat(const std::string& remote_path, FileInfo& info, SftpError& err) {
    return statImpl(remote_path, LIBSSH2_SFTP_LSTAT, info, err);
}

bool Libssh2SftpClient::realpath(const std::string& remote_path, std::string& out, SftpError& err) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }
    char target[4096];
    int rc = libssh2_sftp_realpath(sftp_, remote_path.c_str(), target, sizeof(target));
    if (rc < 0) {
        err = lastError("cannot resolve " + remote_path);
        return false;
    }
    out.assign(target, static_cast<std::size_t>(rc));
    return true;
}

std::unique_ptr<RemoteFile> Libssh2SftpClient::open(const std::string& remote_path,
                                                    OpenMode mode,
                                                    SftpError& err) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return nullptr;
    }
    unsigned long flags = LIBSSH2_FXF_READ;
    switch (mode) {
    case OpenMode::Read:
        flags = LIBSSH2_FXF_READ;
        break;
    case OpenMode::WriteTruncate:
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
        break;
    case OpenMode::CreateNoTruncate:
        flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT;
        break;
    }
    LIBSSH2_SFTP_HANDLE* h = libssh2_sftp_open_ex(
        sftp_, remote_path.c_str(), static_cast<unsigned>(remote_path.size()),
        flags, 0644, LIBSSH2_SFTP_OPENFILE);
    if (!h) {
        err = lastError("cannot open " + remote_path);
        return nullptr;
    }
    return std::make_unique<Libssh2RemoteFile>(this, h, remote_path);
}

bool Libssh2SftpClient::mkdir(const std::string& remote_dir, SftpError& err, unsigned int mode) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }
    if (libssh2_sftp_mkdir(sftp_, remote_dir.c_str(), mode) != 0) {
        err = lastError("mkdir failed for " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path, SftpError& err) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = lastError("unlink failed for " + remote_path);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string& remote_dir, SftpError& err) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }
    if (libssh2_sftp_rmdir(sftp_, remote_dir.c_str()) != 0) {
        err = lastError("rmdir failed for " + remote_dir);
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               SftpError& err,
                               bool overwrite) {
    if (!connected_ || !sftp_) {
        err = SftpError::connection("not connected");
        return false;
    }
    long flags = LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (overwrite) flags |= LIBSSH2_SFTP_RENAME_OVERWRITE;
    int rc = libssh2_sftp_rename_ex(
        sftp_,
        from.c_str(), static_cast<unsigned>(from.size()),
        to.c_str(), static_cast<unsigned>(to.size()),
        flags);
    if (rc != 0) {
        err = lastError("rename " + from + " -> " + to + " failed");
        return false;
    }
    return true;
}

} // namespace filessh

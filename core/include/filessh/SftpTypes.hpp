// Basic types shared between the engine and the front end: connection
// options, remote entry metadata and the error taxonomy.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace filessh {

// known_hosts validation policy for the server key.
enum class KnownHostsPolicy {
    Strict,    // Requires an exact match in known_hosts.
    AcceptNew, // TOFU: accept and store new hosts; reject changed keys.
    Off        // No verification.
};

enum class EntryKind { File, Directory, Symlink, Other };

struct FileInfo {
    std::string   name;      // base name
    EntryKind     kind  = EntryKind::File;
    std::uint64_t size  = 0; // bytes
    std::uint64_t mtime = 0; // epoch seconds
    std::uint32_t mode  = 0; // POSIX bits (type + permissions)
    std::uint32_t uid   = 0;
    std::uint32_t gid   = 0;

    bool isDir() const { return kind == EntryKind::Directory; }
};

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username = "root";

    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;
    // OpenSSH certificate (<key>-cert.pub) presented together with the key.
    std::optional<std::string> certificate_path;

    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::AcceptNew;

    // Fingerprint confirmation when known_hosts has no entry for the host.
    // Returns true to accept and store the key.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
};

enum class ErrorKind {
    None,
    Connection, // transport-level; the Session is unusable afterwards
    Remote,     // the server rejected one call
    LocalIO,    // local filesystem or child process failure
    Cancelled   // cooperative abort, not a failure
};

enum class RemoteErrorKind { NotFound, PermissionDenied, AlreadyExists, NotEmpty, Other };

struct SftpError {
    ErrorKind kind = ErrorKind::None;
    RemoteErrorKind remote = RemoteErrorKind::Other;
    std::string message;

    bool isSet() const { return kind != ErrorKind::None; }
    void clear() {
        kind = ErrorKind::None;
        remote = RemoteErrorKind::Other;
        message.clear();
    }

    static SftpError connection(std::string msg) {
        return SftpError{ErrorKind::Connection, RemoteErrorKind::Other, std::move(msg)};
    }
    static SftpError remoteError(RemoteErrorKind rk, std::string msg) {
        return SftpError{ErrorKind::Remote, rk, std::move(msg)};
    }
    static SftpError localIO(std::string msg) {
        return SftpError{ErrorKind::LocalIO, RemoteErrorKind::Other, std::move(msg)};
    }
    static SftpError cancelled(std::string msg = "cancelled by user") {
        return SftpError{ErrorKind::Cancelled, RemoteErrorKind::Other, std::move(msg)};
    }
};

inline const char* remoteErrorName(RemoteErrorKind k) {
    switch (k) {
    case RemoteErrorKind::NotFound:
        return "not found";
    case RemoteErrorKind::PermissionDenied:
        return "permission denied";
    case RemoteErrorKind::AlreadyExists:
        return "already exists";
    case RemoteErrorKind::NotEmpty:
        return "directory not empty";
    case RemoteErrorKind::Other:
        return "remote error";
    }
    return "remote error";
}

// One-line, user-facing rendering of an error.
inline std::string describe(const SftpError& e) {
    switch (e.kind) {
    case ErrorKind::None:
        return {};
    case ErrorKind::Connection:
        return "connection lost: " + e.message;
    case ErrorKind::Remote:
        if (e.message.empty())
            return remoteErrorName(e.remote);
        return std::string(remoteErrorName(e.remote)) + ": " + e.message;
    case ErrorKind::LocalIO:
        return "local I/O: " + e.message;
    case ErrorKind::Cancelled:
        return e.message.empty() ? std::string("cancelled") : e.message;
    }
    return e.message;
}

} // namespace filessh

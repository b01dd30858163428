// Integration tests for the real Libssh2SftpClient behind a Session against
// a test SFTP server. The test is skipped (exit code 77) unless the required
// FILESSH_IT_* env vars exist.
#include "filessh/DownloadJob.hpp"
#include "filessh/Libssh2SftpClient.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/Session.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

bool listContainsName(const std::vector<filessh::FileInfo> &entries,
                      const std::string &name) {
    return std::any_of(entries.begin(), entries.end(),
                       [&name](const filessh::FileInfo &e) {
                           return e.name == name;
                       });
}

bool writeRemote(filessh::Session &s, const std::string &path,
                 const std::string &payload, filessh::SftpError &err) {
    auto ws = s.write(path, err);
    if (!ws)
        return false;
    if (!ws->write(payload.data(), payload.size(), err))
        return false;
    return ws->finish(err);
}

} // namespace

int main() {
    const auto host = envValue("FILESSH_IT_SFTP_HOST");
    const auto user = envValue("FILESSH_IT_SFTP_USER");
    const auto keyPath = envValue("FILESSH_IT_SFTP_KEY");
    const auto keyPassphrase = envValue("FILESSH_IT_SFTP_KEY_PASSPHRASE");
    const auto certPath = envValue("FILESSH_IT_SFTP_CERT");
    const std::string remoteBase =
        envValue("FILESSH_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() || !keyPath.has_value()) {
        std::cout << "[SKIP] filessh_sftp_integration_tests requires env vars: "
                  << "FILESSH_IT_SFTP_HOST, FILESSH_IT_SFTP_USER and "
                     "FILESSH_IT_SFTP_KEY\n";
        return kSkipExitCode;
    }
    if (!fs::exists(*keyPath)) {
        std::cerr << "[FAIL] FILESSH_IT_SFTP_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("FILESSH_IT_SFTP_PORT"), port)) {
        std::cerr << "[FAIL] FILESSH_IT_SFTP_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    filessh::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    opt.private_key_path = *keyPath;
    if (keyPassphrase.has_value())
        opt.private_key_passphrase = *keyPassphrase;
    if (certPath.has_value())
        opt.certificate_path = *certPath;
    opt.known_hosts_policy = filessh::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteSuiteDir =
        filessh::joinRemotePath(remoteBase, "filessh-it-" + token);
    const std::string remoteSub = filessh::joinRemotePath(remoteSuiteDir, "sub");
    const std::string remoteSrc =
        filessh::joinRemotePath(remoteSuiteDir, "payload.txt");
    const std::string remoteNested = filessh::joinRemotePath(remoteSub, "nested.txt");
    const std::string remoteMoved =
        filessh::joinRemotePath(remoteSuiteDir, "payload-moved.txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("filessh-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const std::string payload = "filessh integration payload\nline-2\n";
    const std::string nested = "nested";

    filessh::SftpError err;
    auto session = filessh::Session::open(
        std::make_unique<filessh::Libssh2SftpClient>(), opt, err);
    t.check(session != nullptr,
            std::string("connect should succeed: ") + err.message);
    if (!session) {
        fs::remove_all(localTmpRoot, ec);
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }

    if (t.failures == 0) {
        std::string home;
        err.clear();
        t.check(session->canonicalize(".", home, err) && !home.empty() &&
                    home.front() == '/',
                std::string("canonicalize('.') should be absolute: ") + err.message);
    }
    if (t.failures == 0) {
        err.clear();
        t.check(session->mkdir(remoteSuiteDir, err) && session->mkdir(remoteSub, err),
                std::string("mkdir should succeed: ") + err.message);
    }
    if (t.failures == 0) {
        err.clear();
        t.check(writeRemote(*session, remoteSrc, payload, err) &&
                    writeRemote(*session, remoteNested, nested, err),
                std::string("write should succeed: ") + err.message);
    }
    if (t.failures == 0) {
        filessh::FileInfo st{};
        err.clear();
        t.check(session->stat(remoteSrc, st, err),
                std::string("stat(remoteSrc) should succeed: ") + err.message);
        t.check(st.size == payload.size(),
                "remote file size should match payload size");
    }
    if (t.failures == 0) {
        std::vector<filessh::FileInfo> entries;
        err.clear();
        t.check(session->list(remoteSuiteDir, entries, err),
                std::string("list(remoteSuiteDir) should succeed: ") + err.message);
        t.check(listContainsName(entries, "payload.txt"),
                "list should include payload.txt");
    }
    if (t.failures == 0) {
        auto job = filessh::DownloadJob::start(session, remoteSuiteDir,
                                               localTmpRoot.string());
        const auto report = job->wait();
        t.check(report.outcome == filessh::JobOutcome::Succeeded,
                "download should succeed: " + report.summary());
        const fs::path localRoot(job->localRoot());
        std::string got;
        t.check(readFile(localRoot / "payload.txt", got) && got == payload,
                "downloaded payload should match");
        t.check(readFile(localRoot / "sub" / "nested.txt", got) && got == nested,
                "downloaded nested file should match");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(session->touch(remoteSrc, err),
                std::string("touch on existing file should succeed: ") + err.message);
        filessh::FileInfo st{};
        t.check(session->stat(remoteSrc, st, err) && st.size == payload.size(),
                "touch should not truncate");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(session->rename(remoteSrc, remoteMoved, err),
                std::string("rename should succeed: ") + err.message);
        filessh::FileInfo st{};
        err.clear();
        t.check(!session->stat(remoteSrc, st, err) &&
                    err.remote == filessh::RemoteErrorKind::NotFound,
                "old path should be NotFound after rename");
    }
    if (t.failures == 0) {
        err.clear();
        t.check(!session->removeDir(remoteSuiteDir, err),
                "removeDir of a non-empty directory should fail");
        t.check(!session->isLost(), "a remote error must not drop the session");
    }

    // Best-effort cleanup regardless of test result.
    filessh::SftpError cleanupErr;
    for (const auto &p : {remoteSrc, remoteMoved, remoteNested}) {
        if (!session->remove(p, cleanupErr))
            cleanupErr.clear();
    }
    for (const auto &p : {remoteSub, remoteSuiteDir}) {
        if (!session->removeDir(p, cleanupErr))
            cleanupErr.clear();
    }
    session.reset();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] filessh_sftp_integration_tests\n";
    return EXIT_SUCCESS;
}

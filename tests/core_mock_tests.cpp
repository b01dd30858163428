// Core unit tests without external framework (run via CTest).
#include "filessh/MockSftpClient.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/Session.hpp"

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }

    void checkContains(const std::string &haystack, const std::string &needle,
                       const std::string &msg) {
        check(haystack.find(needle) != std::string::npos, msg);
    }
};

filessh::SessionOptions validOptions() {
    filessh::SessionOptions opt;
    opt.host = "example.test";
    opt.username = "alice";
    return opt;
}

// Opens a Session over a mock and hands back a raw pointer for setup.
std::shared_ptr<filessh::Session> openMock(filessh::MockSftpClient *&mock) {
    auto client = std::make_unique<filessh::MockSftpClient>();
    mock = client.get();
    filessh::SftpError err;
    return filessh::Session::open(std::move(client), validOptions(), err);
}

std::string readAll(filessh::ReadStream &rs, filessh::SftpError &err) {
    std::string out;
    char buf[7];
    for (;;) {
        const std::int64_t n = rs.read(buf, sizeof(buf), err);
        if (n <= 0)
            break;
        out.append(buf, static_cast<std::size_t>(n));
    }
    return out;
}

void test_session_defaults(TestContext &t) {
    filessh::SessionOptions o;
    t.check(o.port == 22, "default port should be 22");
    t.check(o.username == "root", "default username should be root");
    t.check(o.known_hosts_policy == filessh::KnownHostsPolicy::AcceptNew,
            "default known_hosts_policy should be AcceptNew");
    t.check(!o.private_key_path.has_value(),
            "private_key_path should be empty by default");
    t.check(!o.certificate_path.has_value(),
            "certificate_path should be empty by default");
}

void test_open_validation(TestContext &t) {
    filessh::SftpError err;
    filessh::SessionOptions bad;
    bad.host = "";
    auto s = filessh::Session::open(std::make_unique<filessh::MockSftpClient>(),
                                    bad, err);
    t.check(!s, "open should fail when host is empty");
    t.check(err.kind == filessh::ErrorKind::Connection,
            "handshake failure should be a Connection error");

    err.clear();
    s = filessh::Session::open(nullptr, validOptions(), err);
    t.check(!s, "open should fail without a backend");

    err.clear();
    auto client = std::make_unique<filessh::MockSftpClient>();
    client->failOn(filessh::MockOp::Connect, "",
                   filessh::SftpError::remoteError(
                       filessh::RemoteErrorKind::PermissionDenied,
                       "authentication failed"),
                   1);
    s = filessh::Session::open(std::move(client), validOptions(), err);
    t.check(!s, "open should fail when authentication is rejected");
    t.check(err.kind == filessh::ErrorKind::Connection,
            "rejected authentication is reported as Connection");
    t.checkContains(err.message, "authentication failed",
                    "the backend reason should be kept");
}

void test_list_sorting(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    t.check(s != nullptr, "open should succeed on the mock");
    if (!s)
        return;
    mock->addFile("/home/notes.md", "x");
    mock->addDir("/home/luis");
    mock->addDir("/home/guest");

    std::vector<filessh::FileInfo> out;
    filessh::SftpError err;
    t.check(s->list("/home", out, err), "list('/home') should succeed");
    t.check(out.size() == 3, "list('/home') should return 3 entries");
    if (out.size() == 3) {
        t.check(out[0].isDir() && out[0].name == "guest",
                "first entry should be dir 'guest'");
        t.check(out[1].isDir() && out[1].name == "luis",
                "second entry should be dir 'luis'");
        t.check(!out[2].isDir() && out[2].name == "notes.md",
                "third entry should be file 'notes.md'");
    }
}

void test_remote_error_kinds(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/d/f", "data");

    std::vector<filessh::FileInfo> out;
    filessh::SftpError err;
    t.check(!s->list("/missing", out, err), "list of a missing path fails");
    t.check(err.kind == filessh::ErrorKind::Remote &&
                err.remote == filessh::RemoteErrorKind::NotFound,
            "missing path should be Remote/NotFound");

    err.clear();
    t.check(!s->removeDir("/d", err), "rmdir of a non-empty dir fails");
    t.check(err.remote == filessh::RemoteErrorKind::NotEmpty,
            "non-empty rmdir should be NotEmpty");

    err.clear();
    t.check(!s->mkdir("/d", err), "mkdir on existing path fails");
    t.check(err.remote == filessh::RemoteErrorKind::AlreadyExists,
            "existing mkdir should be AlreadyExists");
    t.checkContains(filessh::describe(err), "already exists",
                    "describe should name the remote error kind");
    t.check(!s->isLost(), "remote errors must not latch the session");
}

void test_touch_and_write(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/d/keep.txt", "keep me");

    filessh::SftpError err;
    t.check(s->touch("/d/keep.txt", err), "touch on existing file succeeds");
    t.check(mock->content("/d/keep.txt").value_or("") == "keep me",
            "touch must not truncate");
    t.check(s->touch("/d/new.txt", err), "touch creates a missing file");
    t.check(mock->content("/d/new.txt").has_value(), "new file should exist");

    auto ws = s->write("/d/keep.txt", err);
    t.check(ws != nullptr, "write should open the file");
    if (ws) {
        t.check(ws->write("abc", 3, err), "write chunk");
        t.check(ws->finish(err), "finish should close cleanly");
    }
    t.check(mock->content("/d/keep.txt").value_or("") == "abc",
            "write should truncate and replace the content");
}

void test_rename_overwrite(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/d/a", "A");
    mock->addFile("/d/b", "B");

    filessh::SftpError err;
    t.check(!s->rename("/d/a", "/d/b", err), "rename onto existing fails");
    t.check(err.remote == filessh::RemoteErrorKind::AlreadyExists,
            "collision should be AlreadyExists");
    err.clear();
    t.check(s->rename("/d/a", "/d/b", err, true),
            "rename with overwrite succeeds");
    t.check(!mock->exists("/d/a"), "source is gone after rename");
    t.check(mock->content("/d/b").value_or("") == "A",
            "destination has the source content");
}

void test_connection_loss_latches(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/d/f", "data");
    mock->failOn(filessh::MockOp::List, "/d",
                 filessh::SftpError::connection("connection reset by peer"), 1);

    std::vector<filessh::FileInfo> out;
    filessh::SftpError err;
    t.check(!s->list("/d", out, err), "list should fail on transport error");
    t.check(err.kind == filessh::ErrorKind::Connection,
            "transport error should be Connection");
    t.check(s->isLost(), "session should be latched lost");
    t.checkContains(s->lostReason(), "reset", "lost reason is kept");

    mock->resetCalls();
    filessh::FileInfo info;
    err.clear();
    t.check(!s->stat("/d/f", info, err), "later calls fail");
    t.check(err.kind == filessh::ErrorKind::Connection,
            "later calls fail with Connection");
    t.check(mock->calls(filessh::MockOp::Stat) == 0,
            "a lost session must not reach the wire");
}

void test_outstanding_requests(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/slow.bin", "0123456789");
    mock->setReadDelay(std::chrono::milliseconds(300));
    t.check(s->outstanding().empty(), "no calls outstanding when idle");

    filessh::SftpError err;
    auto rs = s->read("/slow.bin", err);
    t.check(rs != nullptr, "read should open the file");
    if (!rs)
        return;
    std::thread reader([&] {
        char buf[4];
        filessh::SftpError rerr;
        (void)rs->read(buf, sizeof(buf), rerr);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    const auto pending = s->outstanding();
    reader.join();
    t.check(std::any_of(pending.begin(), pending.end(),
                        [](const std::pair<std::uint64_t, std::string> &p) {
                            return p.second == "read";
                        }),
            "an in-flight read should be listed as outstanding");
    t.check(s->outstanding().empty(), "table drains once the call returns");
}

void test_concurrent_streams(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    const std::string a(1000, 'a');
    std::string b;
    for (int i = 0; i < 200; ++i)
        b += "b" + std::to_string(i);
    mock->addFile("/a", a);
    mock->addFile("/b", b);
    mock->setMaxReadChunk(5);

    std::string gotA, gotB;
    std::thread ta([&] {
        filessh::SftpError err;
        auto rs = s->read("/a", err);
        if (rs)
            gotA = readAll(*rs, err);
    });
    std::thread tb([&] {
        filessh::SftpError err;
        auto rs = s->read("/b", err);
        if (rs)
            gotB = readAll(*rs, err);
    });
    ta.join();
    tb.join();
    t.check(gotA == a, "first stream should be intact");
    t.check(gotB == b, "second stream should be intact");
}

void test_remote_path_helpers(TestContext &t) {
    t.check(filessh::normalizeRemotePath("/a//b/./c/../d/") == "/a/b/d",
            "normalize collapses separators, dots and trailing slash");
    t.check(filessh::parentRemotePath("/a/b") == "/a", "parent of /a/b");
    t.check(filessh::parentRemotePath("/a") == "/", "parent of /a");
    t.check(filessh::remoteBaseName("/a/b.txt") == "b.txt", "basename");
    t.check(filessh::joinRemotePath("/", "x") == "/x", "join under root");
    t.check(filessh::remotePathWithin("/data/sub", "/data"), "within child");
    t.check(!filessh::remotePathWithin("/database", "/data"),
            "prefix without separator is not within");
    t.check(filessh::remotePathsOverlap("/data", "/data/sub/c.txt"),
            "ancestor overlaps descendant");
    t.check(!filessh::remotePathsOverlap("/data/a", "/data/b"),
            "siblings do not overlap");
    t.check(filessh::isHiddenName(".bashrc") && !filessh::isHiddenName("a"),
            "dotfiles are hidden");
    std::string why;
    t.check(!filessh::isValidEntryName("a/b", &why), "separator rejected");
    t.check(!why.empty(), "rejection carries a reason");
    t.check(!filessh::isValidEntryName("..", nullptr), "dot-dot rejected");
    t.check(filessh::isValidEntryName("report 2.txt", nullptr),
            "plain names accepted");
}

void test_core_log_records_session_loss(TestContext &t) {
    std::ostringstream captured;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    sink->set_pattern("%l %v");
    auto capture = std::make_shared<spdlog::logger>("capture", sink);
    capture->set_level(spdlog::level::info);
    const auto previous = spdlog::default_logger();
    spdlog::set_default_logger(capture);

    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (s) {
        mock->addDir("/d");
        mock->failOn(filessh::MockOp::List, "/d",
                     filessh::SftpError::connection("broken pipe"), 1);
        std::vector<filessh::FileInfo> out;
        filessh::SftpError err;
        t.check(!s->list("/d", out, err), "list should fail on transport error");
    } else {
        t.check(false, "open should succeed on the mock");
    }
    spdlog::debug("below the logger level");
    capture->flush();
    spdlog::set_default_logger(previous);

    const std::string text = captured.str();
    t.checkContains(text, "info session open", "open is logged at info");
    t.checkContains(text, "error session lost: broken pipe",
                    "loss is logged at error with its reason");
    t.check(text.find("below the logger level") == std::string::npos,
            "debug records are filtered by the logger level");
}

} // namespace

int main() {
    TestContext t;
    test_session_defaults(t);
    test_open_validation(t);
    test_list_sorting(t);
    test_remote_error_kinds(t);
    test_touch_and_write(t);
    test_rename_overwrite(t);
    test_connection_loss_latches(t);
    test_outstanding_requests(t);
    test_concurrent_streams(t);
    test_remote_path_helpers(t);
    test_core_log_records_session_loss(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] filessh_core_tests\n";
    return EXIT_SUCCESS;
}

// DownloadJob tests against the mock backend (run via CTest).
#include "filessh/DownloadJob.hpp"
#include "filessh/MockSftpClient.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/Session.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

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

// Fresh local directory removed on scope exit.
struct LocalDir {
    fs::path path;

    explicit LocalDir(const std::string &tag) {
        const auto now =
            std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() /
               ("filessh-test-" + tag + "-" + std::to_string(now));
        fs::create_directories(path);
    }
    ~LocalDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::shared_ptr<filessh::Session> openMock(filessh::MockSftpClient *&mock) {
    auto client = std::make_unique<filessh::MockSftpClient>();
    mock = client.get();
    filessh::SessionOptions opt;
    opt.host = "example.test";
    filessh::SftpError err;
    return filessh::Session::open(std::move(client), opt, err);
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

std::size_t countPartFiles(const fs::path &root) {
    std::size_t n = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        if (it->path().extension() == ".filessh-part")
            ++n;
    }
    return n;
}

// Server that answers a listing of /data with names a client must not trust.
class HostileNamesClient : public filessh::MockSftpClient {
public:
    bool list(const std::string &remote_path, std::vector<filessh::FileInfo> &out,
              filessh::SftpError &err) override {
        if (!MockSftpClient::list(remote_path, out, err))
            return false;
        if (filessh::normalizeRemotePath(remote_path) == "/data") {
            filessh::FileInfo up;
            up.name = "../../escaped.txt";
            up.size = 7;
            out.push_back(up);
            filessh::FileInfo nested;
            nested.name = "sub/../../../escaped.txt";
            nested.size = 7;
            out.push_back(nested);
        }
        return true;
    }
};

void seedData(filessh::MockSftpClient &mock) {
    mock.addFile("/data/a.txt", "0123456789");
    mock.addFile("/data/b.txt", "abcdefghijklmnopqrst");
    mock.addFile("/data/sub/c.txt", "vwxyz");
}

void test_example_directory(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    seedData(*mock);
    mock->setMaxReadChunk(3);
    LocalDir dest("example");

    filessh::DownloadOptions opts;
    opts.concurrency = 2;
    auto job = filessh::DownloadJob::start(s, "/data", dest.path.string(), opts);
    const filessh::JobReport r = job->wait();

    t.check(r.outcome == filessh::JobOutcome::Succeeded, "job succeeds");
    t.check(r.progress.filesDone == 3, "files done = 3");
    t.check(r.progress.filesDiscovered == 3, "files discovered = 3");
    t.check(r.progress.bytesDone == 35, "bytes done = 35");
    t.check(r.progress.bytesDiscovered == 35, "bytes discovered = 35");
    t.check(r.progress.enumerationDone, "enumeration finished");
    t.check(r.failures.empty(), "no failures");
    t.check(job->localRoot() == (dest.path / "data").string(),
            "local root is dest/<basename>");

    const std::map<std::string, std::string> expected{
        {"a.txt", "0123456789"},
        {"b.txt", "abcdefghijklmnopqrst"},
        {"sub/c.txt", "vwxyz"}};
    for (const auto &kv : expected) {
        std::string got;
        t.check(readFile(dest.path / "data" / kv.first, got),
                kv.first + " should exist locally");
        t.check(got == kv.second, kv.first + " should be byte-identical");
    }
    t.check(countPartFiles(dest.path) == 0, "no partial artifacts remain");
    for (const auto &task : job->tasks())
        t.check(task.status == filessh::TaskStatus::Completed,
                task.remotePath + " should be Completed");
}

void test_single_file_and_empty_dirs(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    seedData(*mock);
    mock->addDir("/data/empty");
    mock->addSymlink("/data/link.txt", "a.txt");
    mock->addSymlink("/data/linkdir", "sub");
    LocalDir dest("single");

    auto one = filessh::DownloadJob::start(s, "/data/a.txt", dest.path.string());
    const auto r1 = one->wait();
    std::string got;
    t.check(r1.outcome == filessh::JobOutcome::Succeeded,
            "single file download succeeds");
    t.check(readFile(dest.path / "a.txt", got) && got == "0123456789",
            "single file lands at dest/<name>");

    auto all = filessh::DownloadJob::start(s, "/data", dest.path.string());
    const auto r2 = all->wait();
    t.check(r2.outcome == filessh::JobOutcome::Succeeded, "tree download");
    t.check(fs::is_directory(dest.path / "data" / "empty"),
            "empty remote directory is reproduced");
    t.check(readFile(dest.path / "data" / "link.txt", got) && got == "0123456789",
            "symlink to a file is downloaded through the link");
    t.check(!fs::exists(dest.path / "data" / "linkdir"),
            "symlink to a directory is not followed");
    t.check(r2.progress.filesDone == 4, "three files plus the file link");
}

void test_progress_monotonic(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/big/one.bin", std::string(4096, 'x'));
    mock->addFile("/big/two.bin", std::string(3000, 'y'));
    mock->setMaxReadChunk(100);
    LocalDir dest("progress");

    std::mutex mtx;
    std::map<std::uint64_t, std::uint64_t> last;
    bool monotonic = true;
    bool bounded = true;
    std::size_t events = 0;

    filessh::DownloadOptions opts;
    opts.concurrency = 2;
    opts.chunkSize = 256;
    opts.onTaskProgress = [&](const filessh::DownloadTask &task) {
        std::lock_guard<std::mutex> lk(mtx);
        ++events;
        if (task.transferredBytes < last[task.id])
            monotonic = false;
        if (task.transferredBytes > task.totalBytes)
            bounded = false;
        last[task.id] = task.transferredBytes;
    };
    auto job = filessh::DownloadJob::start(s, "/big", dest.path.string(), opts);
    const auto r = job->wait();
    t.check(r.outcome == filessh::JobOutcome::Succeeded, "job succeeds");
    t.check(events > 2, "progress is reported per chunk, not once per file");
    t.check(monotonic, "transferred bytes never decrease");
    t.check(bounded, "transferred bytes never exceed total bytes");
}

void test_partial_failure(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    seedData(*mock);
    mock->failOn(filessh::MockOp::Open, "/data/b.txt",
                 filessh::SftpError::remoteError(
                     filessh::RemoteErrorKind::PermissionDenied,
                     "permission denied"));
    LocalDir dest("partial");

    auto job = filessh::DownloadJob::start(s, "/data", dest.path.string());
    const auto r = job->wait();
    t.check(r.outcome == filessh::JobOutcome::PartiallyFailed,
            "one failed file makes the job partially failed");
    t.check(r.progress.filesDone == 2, "the other files complete");
    t.check(r.failures.size() == 1, "exactly one failure is listed");
    if (!r.failures.empty()) {
        t.check(r.failures.front().path == "/data/b.txt",
                "the failure names the file");
        t.checkContains(r.failures.front().reason, "permission denied",
                        "the failure carries the reason");
    }
    t.check(!fs::exists(dest.path / "data" / "b.txt"),
            "no local file for the failed task");
    t.check(countPartFiles(dest.path) == 0, "no partial artifacts remain");
    t.checkContains(r.summary(), "/data/b.txt", "summary lists the failure");
}

void test_cancel(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    for (int i = 0; i < 6; ++i)
        mock->addFile("/many/f" + std::to_string(i), std::string(200, 'z'));
    mock->setMaxReadChunk(10);
    mock->setReadDelay(std::chrono::milliseconds(5));
    LocalDir dest("cancel");

    std::atomic<bool> cancelled{false};
    filessh::DownloadJob *raw = nullptr;
    std::atomic<bool> ready{false};
    filessh::DownloadOptions opts;
    opts.concurrency = 1;
    opts.chunkSize = 10;
    opts.onTaskProgress = [&](const filessh::DownloadTask &) {
        if (ready.load() && !cancelled.exchange(true))
            raw->cancel();
    };
    auto job = filessh::DownloadJob::start(s, "/many", dest.path.string(), opts);
    raw = job.get();
    ready.store(true);
    const auto r = job->wait();

    t.check(r.outcome == filessh::JobOutcome::Cancelled, "job reports Cancelled");
    t.check(job->isFinished(), "cancelled job is terminal");
    std::size_t started = 0;
    for (const auto &task : job->tasks()) {
        t.check(task.isTerminal(), task.remotePath + " should be terminal");
        t.check(task.status != filessh::TaskStatus::Failed,
                "cancellation is not a failure");
        if (task.transferredBytes > 0)
            ++started;
        if (task.status == filessh::TaskStatus::Cancelled &&
            task.transferredBytes == 0)
            t.check(!fs::exists(task.localPath),
                    "never-started task leaves no file");
    }
    t.check(started <= 1, "with one transfer worker at most one task started");
    t.check(countPartFiles(dest.path) == 0, "cancelled transfers leave no .part");
}

void test_hostile_entry_names(TestContext &t) {
    auto client = std::make_unique<HostileNamesClient>();
    HostileNamesClient *mock = client.get();
    filessh::SessionOptions opt;
    opt.host = "example.test";
    filessh::SftpError err;
    auto s = filessh::Session::open(std::move(client), opt, err);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/data/a.txt", "0123456789");
    mock->addFile("/escaped.txt", "outside");
    LocalDir base("hostile");
    const fs::path dest = base.path / "inner" / "dest";
    fs::create_directories(dest);

    auto job = filessh::DownloadJob::start(s, "/data", dest.string());
    const auto r = job->wait();

    t.check(r.outcome == filessh::JobOutcome::PartiallyFailed,
            "rejected names make the job partially failed");
    t.check(r.failures.size() == 2, "each rejected name is a failure");
    for (const auto &f : r.failures)
        t.checkContains(f.reason, "cannot contain '/'",
                        f.path + " is rejected for its separator");
    std::string got;
    t.check(readFile(dest / "data" / "a.txt", got) && got == "0123456789",
            "well-formed siblings still download");
    t.check(!fs::exists(base.path / "inner" / "escaped.txt"),
            "nothing is written next to the destination");
    t.check(!fs::exists(base.path / "escaped.txt"),
            "nothing is written above the destination");
    std::size_t outside = 0;
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(base.path, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec)
            break;
        if (it->path().filename() == "escaped.txt")
            ++outside;
    }
    t.check(outside == 0, "the escaping file exists nowhere locally");
    t.check(mock->calls(filessh::MockOp::Open) == 1,
            "only the valid file is opened on the server");
    for (const auto &task : job->tasks())
        t.check(task.localPath.find("..") == std::string::npos,
                task.localPath + " stays under the destination");
}

void test_cancel_with_parallel_transfers(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    for (int i = 0; i < 8; ++i)
        mock->addFile("/wide/f" + std::to_string(i), std::string(400, 'w'));
    mock->setMaxReadChunk(10);
    mock->setReadDelay(std::chrono::milliseconds(5));
    LocalDir dest("cancel-wide");

    std::mutex mtx;
    std::set<std::uint64_t> moving;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> ready{false};
    filessh::DownloadJob *raw = nullptr;
    filessh::DownloadOptions opts;
    opts.concurrency = 4;
    opts.chunkSize = 10;
    opts.onTaskProgress = [&](const filessh::DownloadTask &task) {
        std::size_t seen = 0;
        {
            std::lock_guard<std::mutex> lk(mtx);
            moving.insert(task.id);
            seen = moving.size();
        }
        if (seen < 3 || !ready.load())
            return;
        std::size_t inProgress = 0;
        for (const auto &other : raw->tasks())
            if (other.status == filessh::TaskStatus::InProgress)
                ++inProgress;
        if (inProgress >= 3 && !cancelled.exchange(true))
            raw->cancel();
    };
    auto job = filessh::DownloadJob::start(s, "/wide", dest.path.string(), opts);
    raw = job.get();
    ready.store(true);
    const auto r = job->wait();

    t.check(cancelled.load(), "cancel fired while several transfers ran");
    t.check(r.outcome == filessh::JobOutcome::Cancelled, "job reports Cancelled");
    t.check(r.failures.empty(), "cancellation lists no failures");
    std::size_t started = 0;
    for (const auto &task : job->tasks()) {
        t.check(task.status != filessh::TaskStatus::Failed,
                task.remotePath + " is not Failed after a cancel");
        if (task.transferredBytes > 0) {
            ++started;
            t.check(task.status == filessh::TaskStatus::Cancelled,
                    task.remotePath + " was interrupted and ends Cancelled");
        } else {
            t.check(task.status == filessh::TaskStatus::Cancelled,
                    task.remotePath + " never started and ends Cancelled");
        }
        t.check(!fs::exists(task.localPath),
                task.remotePath + " leaves no local file");
    }
    t.check(started >= 3, "at least three transfers had made progress");
    t.check(started <= 4, "no more transfers start than the concurrency");
    t.check(countPartFiles(dest.path) == 0, "cancelled transfers leave no .part");
}

void test_existing_file_kept_on_failure(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    mock->addFile("/doc.txt", std::string(50, 'n'));
    mock->setMaxReadChunk(10);
    mock->failOn(filessh::MockOp::Read, "/doc.txt",
                 filessh::SftpError::remoteError(
                     filessh::RemoteErrorKind::Other, "i/o error"));
    LocalDir dest("keep");
    {
        std::ofstream out(dest.path / "doc.txt", std::ios::binary);
        out << "previous complete copy";
    }
    auto job = filessh::DownloadJob::start(s, "/doc.txt", dest.path.string());
    const auto r = job->wait();
    std::string got;
    t.check(r.outcome == filessh::JobOutcome::PartiallyFailed,
            "read error fails the task");
    t.check(readFile(dest.path / "doc.txt", got) &&
                got == "previous complete copy",
            "an earlier local copy is never truncated");
}

void test_connection_loss(TestContext &t) {
    filessh::MockSftpClient *mock = nullptr;
    auto s = openMock(mock);
    if (!s) {
        t.check(false, "open should succeed on the mock");
        return;
    }
    for (int i = 0; i < 4; ++i)
        mock->addFile("/net/f" + std::to_string(i), std::string(100, 'q'));
    mock->setMaxReadChunk(10);
    mock->dropAfterReads(5);
    LocalDir dest("lost");

    filessh::DownloadOptions opts;
    opts.concurrency = 2;
    auto job = filessh::DownloadJob::start(s, "/net", dest.path.string(), opts);
    const auto r = job->wait();
    t.check(r.outcome == filessh::JobOutcome::ConnectionLost,
            "job reports ConnectionLost");
    t.check(s->isLost(), "session is latched lost");
    for (const auto &task : job->tasks())
        t.check(task.isTerminal(), task.remotePath + " should be terminal");
    t.check(countPartFiles(dest.path) == 0, "no partial artifacts remain");
}

} // namespace

int main() {
    TestContext t;
    test_example_directory(t);
    test_single_file_and_empty_dirs(t);
    test_progress_monotonic(t);
    test_partial_failure(t);
    test_cancel(t);
    test_cancel_with_parallel_transfers(t);
    test_hostile_entry_names(t);
    test_existing_file_kept_on_failure(t);
    test_connection_loss(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] filessh_transfer_engine_tests\n";
    return EXIT_SUCCESS;
}

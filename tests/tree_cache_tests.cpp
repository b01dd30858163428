// TreeCache tests against the mock backend (run via CTest).
#include "filessh/MockSftpClient.hpp"
#include "filessh/Session.hpp"
#include "filessh/TreeCache.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
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
};

struct Fixture {
    filessh::MockSftpClient *mock = nullptr;
    std::shared_ptr<filessh::Session> session;

    Fixture() {
        auto client = std::make_unique<filessh::MockSftpClient>();
        mock = client.get();
        mock->addFile("/data/a.txt", "0123456789");
        mock->addFile("/data/b.txt", "01234567890123456789");
        mock->addFile("/data/.hidden", "h");
        mock->addFile("/data/sub/c.txt", "01234");
        mock->addDir("/data/zdir");
        filessh::SessionOptions opt;
        opt.host = "example.test";
        filessh::SftpError err;
        session = filessh::Session::open(std::move(client), opt, err);
    }
};

std::vector<std::string> names(const std::vector<const filessh::RemoteNode *> &nodes) {
    std::vector<std::string> out;
    for (const auto *n : nodes)
        out.push_back(n->info.name);
    return out;
}

void test_lazy_load(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    t.check(!cache.isLoaded("/data"), "root starts NotLoaded");
    t.check(cache.children("/data").empty(), "unloaded view is empty");

    filessh::SftpError err;
    t.check(cache.getOrLoad("/data", *f.session, err), "first load succeeds");
    t.check(cache.isLoaded("/data"), "root is Loaded after listing");
    t.check(!cache.isLoaded("/data/sub"), "subdirectory stays NotLoaded");

    f.mock->resetCalls();
    t.check(cache.getOrLoad("/data", *f.session, err), "second load succeeds");
    t.check(f.mock->calls(filessh::MockOp::List) == 0,
            "a loaded directory must not be listed again");
}

void test_empty_vs_unloaded(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);
    t.check(cache.getOrLoad("/data/zdir", *f.session, err),
            "empty directory loads");
    t.check(cache.isLoaded("/data/zdir"), "fetched-empty is Loaded");
    t.check(cache.children("/data/zdir").empty(), "and has no children");
    t.check(!cache.isLoaded("/data/sub"), "never-fetched stays NotLoaded");
}

void test_view_order_and_filters(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);

    const auto v = names(cache.children("/data"));
    const std::vector<std::string> expect{"sub", "zdir", "a.txt", "b.txt"};
    t.check(v == expect, "directories first, then by name, hidden excluded");

    f.mock->resetCalls();
    cache.setShowHidden(true);
    const auto withHidden = names(cache.children("/data"));
    t.check(withHidden.size() == 5, "hidden entry appears when toggled on");
    t.check(f.mock->calls(filessh::MockOp::List) == 0,
            "toggling hidden entries never refetches");

    cache.setNameFilter("b");
    const auto filtered = names(cache.children("/data"));
    t.check(filtered.size() == 1 && filtered.front() == "b.txt",
            "name filter narrows the view");
    cache.setNameFilter("");
    t.check(cache.children("/data").size() == 5, "clearing the filter");
}

void test_load_failure_isolated(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);
    cache.getOrLoad("/data/zdir", *f.session, err);

    f.mock->failOn(filessh::MockOp::List, "/data/sub",
                   filessh::SftpError::remoteError(
                       filessh::RemoteErrorKind::PermissionDenied, "denied"),
                   1);
    err.clear();
    t.check(!cache.getOrLoad("/data/sub", *f.session, err), "load fails");
    t.check(err.remote == filessh::RemoteErrorKind::PermissionDenied,
            "the remote reason is returned");
    t.check(!cache.isLoaded("/data/sub"), "failed node stays NotLoaded");
    t.check(cache.isLoaded("/data/zdir"), "siblings are untouched");
    t.check(cache.contains("/data/a.txt"), "parent listing is untouched");

    err.clear();
    t.check(cache.getOrLoad("/data/sub", *f.session, err),
            "a retry after the failure loads");
}

void test_relisting_keeps_subtrees(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);
    cache.getOrLoad("/data/sub", *f.session, err);

    f.mock->addFile("/data/d.txt", "new");
    std::vector<filessh::FileInfo> fresh;
    f.session->list("/data", fresh, err);
    cache.applyListing("/data", fresh);
    t.check(cache.contains("/data/d.txt"), "new entry appears after relist");
    t.check(cache.isLoaded("/data/sub"), "loaded subdirectory is kept");
    t.check(cache.contains("/data/sub/c.txt"), "its children are kept");
}

void test_invalidate_and_collapse(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);
    cache.getOrLoad("/data/sub", *f.session, err);

    cache.collapse("/data/sub");
    t.check(!cache.isLoaded("/data/sub"), "collapsed directory is NotLoaded");
    t.check(!cache.contains("/data/sub/c.txt"), "its children are evicted");
    t.check(cache.contains("/data/sub"), "the node itself stays");

    cache.invalidate("/data");
    t.check(!cache.isLoaded("/data"), "invalidated root is NotLoaded");
    t.check(cache.size() == 1, "only the root node remains");
}

void test_rename_and_remove(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);
    cache.getOrLoad("/data/sub", *f.session, err);

    cache.applyRename("/data/sub", "/data/renamed");
    t.check(!cache.contains("/data/sub"), "old path is gone");
    t.check(cache.contains("/data/renamed/c.txt"), "subtree is re-keyed");
    t.check(cache.isLoaded("/data/renamed"), "loaded state moves along");
    const auto *n = cache.find("/data/renamed");
    t.check(n && n->info.name == "renamed", "display name follows");
    t.check(cache.childExists("/data", "renamed").value_or(false),
            "parent lists the new name");

    cache.applyRemove("/data/renamed");
    t.check(!cache.contains("/data/renamed"), "removed node is gone");
    t.check(!cache.contains("/data/renamed/c.txt"), "descendants are gone");
    t.check(!cache.childExists("/data", "renamed").value_or(true),
            "parent no longer lists it");
    t.check(!cache.childExists("/elsewhere", "x").has_value(),
            "unknown parent yields no answer");
}

void test_update_info(TestContext &t) {
    Fixture f;
    filessh::TreeCache cache("/data");
    filessh::SftpError err;
    cache.getOrLoad("/data", *f.session, err);
    filessh::FileInfo info;
    info.size = 99;
    info.mtime = 42;
    cache.updateInfo("/data/a.txt", info);
    const auto *n = cache.find("/data/a.txt");
    t.check(n && n->info.size == 99 && n->info.mtime == 42,
            "metadata is replaced");
    t.check(n && n->info.name == "a.txt", "name is kept");
}

} // namespace

int main() {
    TestContext t;
    test_lazy_load(t);
    test_empty_vs_unloaded(t);
    test_view_order_and_filters(t);
    test_load_failure_isolated(t);
    test_relisting_keeps_subtrees(t);
    test_invalidate_and_collapse(t);
    test_rename_and_remove(t);
    test_update_info(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] filessh_tree_cache_tests\n";
    return EXIT_SUCCESS;
}

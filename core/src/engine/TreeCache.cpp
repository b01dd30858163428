#include "filessh/TreeCache.hpp"
#include "filessh/RemotePath.hpp"
#include "filessh/Session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_set>

namespace filessh {

TreeCache::TreeCache(const std::string& rootPath)
    : root_(normalizeRemotePath(rootPath)) {
    RemoteNode root;
    root.path = root_;
    root.info.name = remoteBaseName(root_);
    root.info.kind = EntryKind::Directory;
    nodes_.emplace(root_, std::move(root));
}

const RemoteNode* TreeCache::find(const std::string& path) const {
    auto it = nodes_.find(normalizeRemotePath(path));
    return it == nodes_.end() ? nullptr : &it->second;
}

RemoteNode* TreeCache::findMutable(const std::string& path) {
    auto it = nodes_.find(normalizeRemotePath(path));
    return it == nodes_.end() ? nullptr : &it->second;
}

bool TreeCache::isLoaded(const std::string& path) const {
    const RemoteNode* n = find(path);
    return n && n->childState == ChildState::Loaded;
}

bool TreeCache::getOrLoad(const std::string& path, Session& session, SftpError& err) {
    if (isLoaded(path))
        return true;
    std::vector<FileInfo> entries;
    if (!session.list(normalizeRemotePath(path), entries, err)) {
        markLoadFailed(path);
        return false;
    }
    applyListing(path, entries);
    return true;
}

void TreeCache::applyListing(const std::string& dirPath, const std::vector<FileInfo>& entries) {
    const std::string dir = normalizeRemotePath(dirPath);
    RemoteNode* node = findMutable(dir);
    if (!node) {
        // Listing for a path outside the known tree (e.g. after a rename
        // raced with the load): keep it only when its parent is known.
        RemoteNode* parent = findMutable(parentRemotePath(dir));
        if (dir != root_ && !parent)
            return;
        RemoteNode fresh;
        fresh.path = dir;
        fresh.info.name = remoteBaseName(dir);
        fresh.info.kind = EntryKind::Directory;
        node = &nodes_.emplace(dir, std::move(fresh)).first->second;
        if (parent && parent->childState == ChildState::Loaded)
            parent->children.push_back(dir);
    }

    std::unordered_set<std::string> keep;
    std::vector<std::string> newChildren;
    newChildren.reserve(entries.size());
    for (const auto& e : entries) {
        if (e.name.empty() || e.name == "." || e.name == "..")
            continue;
        const std::string childPath = joinRemotePath(dir, e.name);
        newChildren.push_back(childPath);
        keep.insert(childPath);
    }

    // Children that disappeared, or stopped being directories, lose their subtree.
    const std::vector<std::string> oldChildren = node->children;
    for (const auto& old : oldChildren) {
        auto it = nodes_.find(old);
        if (it == nodes_.end())
            continue;
        bool stillDir = false;
        if (keep.count(old)) {
            for (const auto& e : entries) {
                if (joinRemotePath(dir, e.name) == old) {
                    stillDir = e.isDir() && it->second.info.isDir();
                    break;
                }
            }
        }
        if (!stillDir) {
            evictDescendants(old);
            if (!keep.count(old))
                nodes_.erase(old);
        }
    }

    for (const auto& e : entries) {
        if (e.name.empty() || e.name == "." || e.name == "..")
            continue;
        const std::string childPath = joinRemotePath(dir, e.name);
        auto it = nodes_.find(childPath);
        if (it == nodes_.end()) {
            RemoteNode child;
            child.path = childPath;
            child.info = e;
            nodes_.emplace(childPath, std::move(child));
        } else {
            const bool keepSubtree = it->second.info.isDir() && e.isDir();
            it->second.info = e;
            if (!keepSubtree) {
                it->second.childState = ChildState::NotLoaded;
                it->second.children.clear();
            }
        }
    }

    node->children = std::move(newChildren);
    node->childState = ChildState::Loaded;
}

void TreeCache::markLoadFailed(const std::string& dirPath) {
    RemoteNode* node = findMutable(dirPath);
    if (!node)
        return;
    evictDescendants(node->path);
}

void TreeCache::evictDescendants(const std::string& path) {
    auto it = nodes_.find(path);
    if (it == nodes_.end())
        return;
    std::vector<std::string> stack = it->second.children;
    it->second.children.clear();
    it->second.childState = ChildState::NotLoaded;
    while (!stack.empty()) {
        const std::string cur = stack.back();
        stack.pop_back();
        auto c = nodes_.find(cur);
        if (c == nodes_.end())
            continue;
        stack.insert(stack.end(), c->second.children.begin(), c->second.children.end());
        nodes_.erase(c);
    }
}

void TreeCache::detachFromParent(const std::string& path) {
    if (path == root_)
        return;
    RemoteNode* parent = findMutable(parentRemotePath(path));
    if (!parent)
        return;
    auto& kids = parent->children;
    kids.erase(std::remove(kids.begin(), kids.end(), path), kids.end());
}

void TreeCache::invalidate(const std::string& path) {
    const std::string p = normalizeRemotePath(path);
    if (!nodes_.count(p))
        return;
    evictDescendants(p);
}

void TreeCache::collapse(const std::string& path) {
    const std::string p = normalizeRemotePath(path);
    spdlog::debug("collapse {}", p);
    invalidate(p);
}

void TreeCache::applyRemove(const std::string& path) {
    const std::string p = normalizeRemotePath(path);
    if (p == root_) {
        // The explored root itself went away: forget its contents.
        evictDescendants(p);
        return;
    }
    if (!nodes_.count(p))
        return;
    evictDescendants(p);
    detachFromParent(p);
    nodes_.erase(p);
}

void TreeCache::applyRename(const std::string& src, const std::string& dst) {
    const std::string from = normalizeRemotePath(src);
    const std::string to = normalizeRemotePath(dst);
    if (from == to || from == root_)
        return;

    // A replaced destination loses its old subtree.
    if (nodes_.count(to))
        applyRemove(to);

    auto it = nodes_.find(from);
    if (it == nodes_.end()) {
        // Not cached: the destination listing is stale either way.
        invalidate(parentRemotePath(to));
        return;
    }

    // Collect the subtree and re-key it under the new prefix.
    std::vector<RemoteNode> moved;
    std::vector<std::string> stack{from};
    while (!stack.empty()) {
        const std::string cur = stack.back();
        stack.pop_back();
        auto n = nodes_.find(cur);
        if (n == nodes_.end())
            continue;
        stack.insert(stack.end(), n->second.children.begin(), n->second.children.end());
        moved.push_back(std::move(n->second));
        nodes_.erase(n);
    }
    detachFromParent(from);

    RemoteNode* newParent = findMutable(parentRemotePath(to));
    if (!newParent || newParent->childState != ChildState::Loaded) {
        // Destination directory is not expanded: nothing to attach to.
        return;
    }

    auto rekey = [&](const std::string& p) { return to + p.substr(from.size()); };
    for (auto& n : moved) {
        n.path = rekey(n.path);
        for (auto& c : n.children)
            c = rekey(c);
        if (n.path == to)
            n.info.name = remoteBaseName(to);
        nodes_.emplace(n.path, std::move(n));
    }
    newParent = findMutable(parentRemotePath(to));
    newParent->children.push_back(to);
}

void TreeCache::updateInfo(const std::string& path, const FileInfo& info) {
    RemoteNode* n = findMutable(path);
    if (!n)
        return;
    const std::string name = n->info.name;
    n->info = info;
    n->info.name = name;
}

std::optional<bool> TreeCache::childExists(const std::string& parent, const std::string& name) const {
    const RemoteNode* p = find(parent);
    if (!p || p->childState != ChildState::Loaded)
        return std::nullopt;
    const std::string child = joinRemotePath(p->path, name);
    return std::find(p->children.begin(), p->children.end(), child) != p->children.end();
}

std::vector<const RemoteNode*> TreeCache::children(const std::string& path) const {
    std::vector<const RemoteNode*> out;
    const RemoteNode* p = find(path);
    if (!p || p->childState != ChildState::Loaded)
        return out;
    out.reserve(p->children.size());
    for (const auto& c : p->children) {
        const RemoteNode* n = find(c);
        if (!n)
            continue;
        if (!showHidden_ && isHiddenName(n->info.name))
            continue;
        if (!nameFilter_.empty() && n->info.name.find(nameFilter_) == std::string::npos)
            continue;
        out.push_back(n);
    }
    std::sort(out.begin(), out.end(), [](const RemoteNode* a, const RemoteNode* b) {
        if (a->info.isDir() != b->info.isDir())
            return a->info.isDir(); // directories first
        return a->info.name < b->info.name;
    });
    return out;
}

} // namespace filessh

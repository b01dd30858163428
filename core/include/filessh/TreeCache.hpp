// Lazily populated, path-keyed mirror of the remote directory tree.
// Not thread-safe: only the foreground loop mutates it.
#pragma once
#include "SftpTypes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace filessh {

class Session;

enum class ChildState {
    NotLoaded, // never listed, invalidated, collapsed or failed to load
    Loaded     // children reflect a completed listing (possibly empty)
};

struct RemoteNode {
    std::string path; // absolute, normalized
    FileInfo info;    // info.name is the display name
    ChildState childState = ChildState::NotLoaded;
    std::vector<std::string> children; // child paths, only meaningful when Loaded
};

class TreeCache {
public:
    explicit TreeCache(const std::string& rootPath);

    const std::string& rootPath() const { return root_; }
    std::size_t size() const { return nodes_.size(); }

    const RemoteNode* find(const std::string& path) const;
    bool contains(const std::string& path) const { return find(path) != nullptr; }
    bool isLoaded(const std::string& path) const;

    // Lists through the session when the node is not loaded yet. On failure
    // the node stays NotLoaded and err is filled.
    bool getOrLoad(const std::string& path, Session& session, SftpError& err);

    // Replaces the children of a directory with a fresh listing. Children
    // that are still directories keep their own loaded subtree.
    void applyListing(const std::string& dirPath, const std::vector<FileInfo>& entries);
    void markLoadFailed(const std::string& dirPath);

    // Children become NotLoaded; the node itself stays.
    void invalidate(const std::string& path);
    // Drops the children of an expanded directory from memory.
    void collapse(const std::string& path);

    void applyRename(const std::string& src, const std::string& dst);
    void applyRemove(const std::string& path);
    void updateInfo(const std::string& path, const FileInfo& info);

    // Whether name is a child of parent: nullopt when the parent is not loaded.
    std::optional<bool> childExists(const std::string& parent, const std::string& name) const;

    // View of a directory: hidden entries and the name filter applied,
    // directories first, then by name. Empty when not loaded.
    std::vector<const RemoteNode*> children(const std::string& path) const;

    void setShowHidden(bool show) { showHidden_ = show; }
    bool showHidden() const { return showHidden_; }
    void setNameFilter(const std::string& needle) { nameFilter_ = needle; }
    const std::string& nameFilter() const { return nameFilter_; }

private:
    RemoteNode* findMutable(const std::string& path);
    void evictDescendants(const std::string& path);
    void detachFromParent(const std::string& path);

    std::string root_;
    std::unordered_map<std::string, RemoteNode> nodes_;
    bool showHidden_ = false;
    std::string nameFilter_;
};

} // namespace filessh

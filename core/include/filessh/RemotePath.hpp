// POSIX-style path helpers for remote paths (always '/'-separated).
#pragma once
#include <string>

namespace filessh {

std::string joinRemotePath(const std::string& base, const std::string& name);

// "/a/b" -> "/a", "/a" -> "/", "/" -> "/"
std::string parentRemotePath(const std::string& path);

// "/a/b" -> "b", "/" -> "/"
std::string remoteBaseName(const std::string& path);

// Collapses repeated separators, "." and ".." and drops the trailing slash.
// Relative input stays relative.
std::string normalizeRemotePath(const std::string& path);

// True when path equals root or lies below it.
bool remotePathWithin(const std::string& path, const std::string& root);

// True when one path is equal to, an ancestor of, or a descendant of the other.
bool remotePathsOverlap(const std::string& a, const std::string& b);

// Dotfile convention for hidden entries.
bool isHiddenName(const std::string& name);

// Rejects ".", "..", separators and control characters.
bool isValidEntryName(const std::string& name, std::string* why = nullptr);

} // namespace filessh

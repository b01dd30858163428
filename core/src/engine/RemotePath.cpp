#include "filessh/RemotePath.hpp"

#include <vector>

namespace filessh {

std::string joinRemotePath(const std::string& base, const std::string& name) {
    if (base.empty())
        return "/" + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

std::string parentRemotePath(const std::string& path) {
    const std::string p = normalizeRemotePath(path);
    const auto pos = p.find_last_of('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::string remoteBaseName(const std::string& path) {
    const std::string p = normalizeRemotePath(path);
    if (p == "/")
        return p;
    const auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string normalizeRemotePath(const std::string& path) {
    if (path.empty())
        return ".";
    const bool absolute = path.front() == '/';
    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= path.size()) {
        const std::size_t next = path.find('/', i);
        const std::size_t end = next == std::string::npos ? path.size() : next;
        std::string seg = path.substr(i, end - i);
        if (seg.empty() || seg == ".") {
            // skip
        } else if (seg == "..") {
            if (!parts.empty() && parts.back() != "..")
                parts.pop_back();
            else if (!absolute)
                parts.push_back(seg);
        } else {
            parts.push_back(std::move(seg));
        }
        if (next == std::string::npos)
            break;
        i = next + 1;
    }
    std::string out = absolute ? "/" : "";
    for (std::size_t k = 0; k < parts.size(); ++k) {
        if (k)
            out += '/';
        out += parts[k];
    }
    if (out.empty())
        return ".";
    return out;
}

bool remotePathWithin(const std::string& path, const std::string& root) {
    const std::string p = normalizeRemotePath(path);
    const std::string r = normalizeRemotePath(root);
    if (p == r)
        return true;
    if (r == "/")
        return p.size() > 1 && p.front() == '/';
    return p.size() > r.size() && p.compare(0, r.size(), r) == 0 &&
           p[r.size()] == '/';
}

bool remotePathsOverlap(const std::string& a, const std::string& b) {
    return remotePathWithin(a, b) || remotePathWithin(b, a);
}

bool isHiddenName(const std::string& name) {
    return !name.empty() && name.front() == '.';
}

bool isValidEntryName(const std::string& name, std::string* why) {
    if (name.empty()) {
        if (why)
            *why = "Invalid name: cannot be empty.";
        return false;
    }
    if (name == "." || name == "..") {
        if (why)
            *why = "Invalid name: cannot be '.' or '..'.";
        return false;
    }
    for (char ch : name) {
        const auto u = static_cast<unsigned char>(ch);
        if (ch == '/') {
            if (why)
                *why = "Invalid name: cannot contain '/'.";
            return false;
        }
        if (u < 0x20u || u == 0x7Fu) { // ASCII control characters
            if (why)
                *why = "Invalid name: cannot contain control characters.";
            return false;
        }
    }
    return true;
}

} // namespace filessh

// User-initiated remote operations as a closed set of request types.
#pragma once
#include <string>
#include <variant>
#include <vector>

namespace filessh {

struct DeleteRequest {
    std::string path;
};

struct MoveRequest {
    std::string source;
    std::string destination;
    bool overwrite = false; // set once the user confirmed replacing the target
};

struct CreateFileRequest {
    std::string path;
};

struct CreateDirectoryRequest {
    std::string path;
};

struct EditFileRequest {
    std::string path;
};

struct SpawnShellRequest {
    std::string path; // remote working directory
};

using OperationRequest = std::variant<DeleteRequest, MoveRequest, CreateFileRequest,
                                      CreateDirectoryRequest, EditFileRequest, SpawnShellRequest>;

// One-line human description, e.g. "delete /data/a.txt".
std::string describeRequest(const OperationRequest& req);

// The path the request is about (source for a move).
std::string primaryPath(const OperationRequest& req);

// Every remote path the request may change; empty for a shell.
std::vector<std::string> affectedPaths(const OperationRequest& req);

// False only for requests that leave the remote tree untouched.
bool isMutating(const OperationRequest& req);

} // namespace filessh

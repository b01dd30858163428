#include "filessh/OperationRequest.hpp"

#include <type_traits>

namespace filessh {

namespace {

template <class> inline constexpr bool kAlwaysFalse = false;

} // namespace

std::string describeRequest(const OperationRequest& req) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, DeleteRequest>)
                return "delete " + r.path;
            else if constexpr (std::is_same_v<T, MoveRequest>)
                return std::string(r.overwrite ? "replace " : "move ") + r.source + " -> " + r.destination;
            else if constexpr (std::is_same_v<T, CreateFileRequest>)
                return "create file " + r.path;
            else if constexpr (std::is_same_v<T, CreateDirectoryRequest>)
                return "create directory " + r.path;
            else if constexpr (std::is_same_v<T, EditFileRequest>)
                return "edit " + r.path;
            else if constexpr (std::is_same_v<T, SpawnShellRequest>)
                return "shell in " + r.path;
            else
                static_assert(kAlwaysFalse<T>, "unhandled request type");
        },
        req);
}

std::string primaryPath(const OperationRequest& req) {
    return std::visit(
        [](const auto& r) -> std::string {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, MoveRequest>)
                return r.source;
            else
                return r.path;
        },
        req);
}

std::vector<std::string> affectedPaths(const OperationRequest& req) {
    return std::visit(
        [](const auto& r) -> std::vector<std::string> {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, MoveRequest>)
                return {r.source, r.destination};
            else if constexpr (std::is_same_v<T, SpawnShellRequest>)
                return {};
            else
                return {r.path};
        },
        req);
}

bool isMutating(const OperationRequest& req) {
    return !std::holds_alternative<SpawnShellRequest>(req);
}

} // namespace filessh

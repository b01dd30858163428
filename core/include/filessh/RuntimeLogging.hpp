// Runtime policy helpers for diagnostics and sensitive logging.
#pragma once

#include <cctype>
#include <cstdlib>
#include <string>

namespace filessh {

inline std::string normalizedEnv(const char *name) {
    if (!name)
        return {};
    const char *raw = std::getenv(name);
    if (!raw || !*raw)
        return {};
    std::string out(raw);
    std::size_t start = 0;
    while (start < out.size() &&
           std::isspace(static_cast<unsigned char>(out[start]))) {
        ++start;
    }
    std::size_t end = out.size();
    while (end > start &&
           std::isspace(static_cast<unsigned char>(out[end - 1]))) {
        --end;
    }
    out = out.substr(start, end - start);
    for (char &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

inline bool envFlagEnabled(const char *name) {
    const std::string v = normalizedEnv(name);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

// FILESSH_LOG_LEVEL: "debug", "info" (default), "warning" or "error".
inline int envLogLevel() {
    const std::string v = normalizedEnv("FILESSH_LOG_LEVEL");
    if (v == "debug" || v == "trace")
        return 0;
    if (v == "warning" || v == "warn")
        return 2;
    if (v == "error")
        return 3;
    return 1;
}

// User names, hosts and key paths only reach the logs when explicitly asked.
inline bool sensitiveLoggingEnabled() {
    return envFlagEnabled("FILESSH_LOG_SENSITIVE");
}

} // namespace filessh

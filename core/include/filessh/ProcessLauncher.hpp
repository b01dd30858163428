// Seam for running the external editor and the remote shell as blocking
// child processes attached to the user's terminal.
#pragma once
#include <string>
#include <vector>

namespace filessh {

struct ProcessOutcome {
    bool started = false;
    bool normalExit = false; // false when the child crashed or was killed
    int exitCode = -1;
    std::string error;       // why it failed to start or crashed

    bool succeeded() const { return started && normalExit && exitCode == 0; }
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Blocks until the child exits.
    virtual ProcessOutcome run(const std::string& program, const std::vector<std::string>& args) = 0;
};

} // namespace filessh

// ProcessLauncher backed by QProcess with the terminal handed to the child.
#pragma once
#include "filessh/ProcessLauncher.hpp"

class QProcessLauncher : public filessh::ProcessLauncher {
public:
    // Runs on the calling thread; no event loop needed.
    filessh::ProcessOutcome run(const std::string &program,
                                const std::vector<std::string> &args) override;
};

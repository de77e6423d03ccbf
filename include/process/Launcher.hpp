#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace ppt::process {

using Environment = std::vector<std::pair<std::string, std::string>>;

struct Command {
    std::vector<std::string> argv;
    std::filesystem::path cwd;      // empty: inherit
    Environment env;                // added to (or overriding) the inherited environment
    bool captureOutput = false;     // false: child writes straight to our stdout/stderr
};

struct Result {
    int exitCode = -1;
    std::string output;             // combined stdout+stderr, only when captured

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// The program could not be started at all (not found, not executable).
struct LaunchError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

class Launcher {
public:
    virtual ~Launcher() = default;

    // Blocks until the child exits. Throws LaunchError when it never ran.
    virtual Result run(const Command& cmd) = 0;
};

class PosixLauncher : public Launcher {
public:
    Result run(const Command& cmd) override;
};

// Space-joined argv for log lines.
[[nodiscard]] std::string describe(const Command& cmd);

}

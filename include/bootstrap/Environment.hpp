#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ppt::process { class Launcher; }

namespace ppt::bootstrap {

namespace fs = std::filesystem;

// Node.js, the cloned Playwright framework, its npm packages and one browser.
// Every failure that leaves the environment unusable is a BootstrapError.
class Environment {
public:
    using Downloader = std::function<void(const std::string& url, const fs::path& dest)>;

    Environment(std::shared_ptr<process::Launcher> launcher,
                config::RuntimeConfig runtime,
                Downloader downloader = {});

    // Returns the verified `node --version`.
    std::string ensureRuntimeInstalled();

    void fetchTestFramework(const std::string& repositoryUrl, const std::string& ref, const fs::path& dest);

    // npm packages (reproducible install first), then binaries and OS
    // dependencies for this one browser only.
    void installFrameworkDependencies(config::Browser browser, const fs::path& frameworkRoot);

    [[nodiscard]] std::optional<std::string> probeVersion(const std::string& program) const;

    // e.g. node-v20.11.1-linux-x64; throws BootstrapError on an unsupported host.
    [[nodiscard]] static std::string nodeDistributionName(const std::string& version,
                                                          const std::string& sysname,
                                                          const std::string& machine);

    [[nodiscard]] static bool looksLikeCommitSha(const std::string& ref);

private:
    std::shared_ptr<process::Launcher> launcher_;
    config::RuntimeConfig runtime_;
    Downloader downloader_;

    void installRuntime();
    int runStep(const std::vector<std::string>& argv, const fs::path& cwd = {}) const;
};

}

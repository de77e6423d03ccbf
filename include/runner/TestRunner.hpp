#pragma once

#include "process/Launcher.hpp"
#include "runner/FailureAnalyzer.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>

namespace ppt::config { struct RunConfiguration; }

namespace ppt::runner {

namespace fs = std::filesystem;

inline constexpr auto TEST_RESULTS_DIR = "test-results";
inline constexpr auto REPORT_DIR = "playwright-report";
inline constexpr auto TESTS_DIR = "tests";
inline constexpr auto JSON_RESULTS_FILE = "test-results/results.json";

inline constexpr int WORKERS = 2;
inline constexpr int MAX_FAILURES = 5;

struct TestRunResult {
    int exitCode = 1;
    std::optional<FailureReport> failure;   // only for a non-zero exit

    [[nodiscard]] bool passed() const { return exitCode == 0; }
};

// Copies every file under sourceDir into frameworkTestsDir keeping relative
// paths. A missing sourceDir is created empty and 0 is returned.
std::size_t stageTests(const fs::path& sourceDir, const fs::path& frameworkTestsDir);

// The only place configuration becomes environment variables.
[[nodiscard]] process::Environment buildTestEnvironment(const config::RunConfiguration& cfg);

[[nodiscard]] process::Command buildTestCommand(const config::RunConfiguration& cfg, const fs::path& frameworkRoot);

class TestRunner {
public:
    TestRunner(std::shared_ptr<process::Launcher> launcher, fs::path frameworkRoot);

    // The exit code decides pass or fail; reports are a side effect.
    // Throws TestExecutionError when the runner never started.
    TestRunResult run(const config::RunConfiguration& cfg);

    [[nodiscard]] const fs::path& frameworkRoot() const { return root_; }

private:
    std::shared_ptr<process::Launcher> launcher_;
    fs::path root_;
};

}

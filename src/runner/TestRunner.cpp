#include "runner/TestRunner.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"
#include "util/DirectoryWalker.hpp"

#include <fmt/format.h>

using namespace ppt::log;

namespace ppt::runner {

std::size_t stageTests(const fs::path& sourceDir, const fs::path& frameworkTestsDir) {
    if (!fs::exists(sourceDir)) {
        Registry::runner()->warn("[TestRunner] Test source {} does not exist; created it empty, nothing to stage",
                                 sourceDir.string());
        fs::create_directories(sourceDir);
        return 0;
    }

    fs::create_directories(frameworkTestsDir);

    std::size_t copied = 0;
    for (const auto& entry : util::DirectoryWalker().walk(sourceDir)) {
        const auto target = frameworkTestsDir / entry.relative;
        if (entry.is_directory) {
            fs::create_directories(target);
            continue;
        }
        fs::create_directories(target.parent_path());
        fs::copy_file(entry.path, target, fs::copy_options::overwrite_existing);
        Registry::runner()->debug("[TestRunner] Staged {}", entry.relative.string());
        ++copied;
    }

    Registry::runner()->info("[TestRunner] Staged {} file(s) from {} into {}",
                             copied, sourceDir.string(), frameworkTestsDir.string());
    return copied;
}

process::Environment buildTestEnvironment(const config::RunConfiguration& cfg) {
    process::Environment env{
        {"APP_URL", cfg.app_url},
        {"APP_NAME", cfg.app_name},
        {"APP_USERNAME", cfg.username},
        {"APP_PASSWORD", cfg.password},
        {"PLAYWRIGHT_JSON_OUTPUT_NAME", JSON_RESULTS_FILE},
        {"PLAYWRIGHT_HTML_OPEN", "never"},
        {"PW_TEST_HTML_REPORT_OPEN", "never"},
    };

    if (cfg.advancedConfigured()) {
        env.emplace_back("TENANT_ID", cfg.advanced.tenant_id);
        env.emplace_back("DYNAMICS_URL", cfg.advanced.dynamics_url);
        env.emplace_back("CLIENT_ID", cfg.advanced.client_id);
        env.emplace_back("ROLE_NAME", cfg.advanced.role_name);
        env.emplace_back("TEAM_NAME", cfg.advanced.team_name);
        env.emplace_back("BUSINESS_UNIT_NAME", cfg.advanced.business_unit_name);
    }

    return env;
}

process::Command buildTestCommand(const config::RunConfiguration& cfg, const fs::path& frameworkRoot) {
    process::Command cmd;
    cmd.argv = {
        "npx", "playwright", "test",
        "--project=" + config::to_string(cfg.browser),
        fmt::format("--workers={}", WORKERS),
        fmt::format("--max-failures={}", MAX_FAILURES),
        "--reporter=list,html,json",
    };
    if (cfg.trace_mode != config::TraceMode::Off)
        cmd.argv.push_back("--trace=" + config::to_string(cfg.trace_mode));

    cmd.cwd = frameworkRoot;
    cmd.env = buildTestEnvironment(cfg);
    return cmd;
}

TestRunner::TestRunner(std::shared_ptr<process::Launcher> launcher, fs::path frameworkRoot)
    : launcher_(std::move(launcher)), root_(std::move(frameworkRoot)) {
    if (!launcher_) throw std::invalid_argument("TestRunner requires a process launcher");
}

TestRunResult TestRunner::run(const config::RunConfiguration& cfg) {
    const auto cmd = buildTestCommand(cfg, root_);
    Registry::runner()->info("[TestRunner] $ {}", process::describe(cmd));

    TestRunResult result;
    try {
        result.exitCode = launcher_->run(cmd).exitCode;
    } catch (const process::LaunchError& e) {
        throw TestExecutionError(fmt::format("Could not start the Playwright runner: {}", e.what()));
    }

    if (result.passed()) {
        Registry::runner()->info("[TestRunner] All tests passed");
        return result;
    }

    Registry::runner()->error("[TestRunner] Playwright exited with code {}", result.exitCode);
    result.failure = analyzeFailure(root_, cfg);
    logFailureReport(*result.failure);
    return result;
}

}

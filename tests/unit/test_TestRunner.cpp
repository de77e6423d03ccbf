#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "runner/ArtifactCollector.hpp"
#include "runner/FailureAnalyzer.hpp"
#include "runner/TestRunner.hpp"
#include "types/errors.hpp"
#include "FakeLauncher.hpp"

#include <algorithm>
#include <cstdlib>

using namespace ppt;
using namespace ppt::runner;
using ppt::test::FakeLauncher;
using ppt::test::TempDir;

namespace {

bool hasArg(const process::Command& cmd, const std::string& arg) {
    return std::ranges::find(cmd.argv, arg) != cmd.argv.end();
}

std::string envValue(const process::Environment& env, const std::string& key) {
    for (const auto& [k, v] : env)
        if (k == key) return v;
    return "<unset>";
}

config::RunConfiguration baseConfig() {
    config::RunConfiguration cfg;
    cfg.app_url = "https://apps.powerapps.com/play/app";
    cfg.app_name = "Expenses";
    cfg.username = "tester@contoso.com";
    cfg.password = "p4ssw0rd!";
    return cfg;
}

}

class TestRunnerTest : public ::testing::Test {
protected:
    TempDir dir;
    std::shared_ptr<FakeLauncher> launcher = std::make_shared<FakeLauncher>();
};

TEST_F(TestRunnerTest, StagesNestedFilesPreservingLayout) {
    fs::create_directories(dir / "src" / "flows" / "admin");
    std::ofstream(dir / "src" / "login.spec.ts") << "test()";
    std::ofstream(dir / "src" / "flows" / "admin" / "roles.spec.ts") << "test()";

    EXPECT_EQ(stageTests(dir / "src", dir / "fw" / "tests"), 2u);
    EXPECT_TRUE(fs::exists(dir / "fw" / "tests" / "login.spec.ts"));
    EXPECT_TRUE(fs::exists(dir / "fw" / "tests" / "flows" / "admin" / "roles.spec.ts"));
}

TEST_F(TestRunnerTest, MissingSourceIsCreatedAndSkipped) {
    EXPECT_EQ(stageTests(dir / "nothing-here", dir / "fw" / "tests"), 0u);
    EXPECT_TRUE(fs::is_directory(dir / "nothing-here"));
}

TEST_F(TestRunnerTest, CommandIsScopedToOneBrowser) {
    auto cfg = baseConfig();
    cfg.browser = config::Browser::Firefox;

    const auto cmd = buildTestCommand(cfg, dir.path());
    EXPECT_EQ(cmd.argv[0], "npx");
    EXPECT_TRUE(hasArg(cmd, "--project=firefox"));
    EXPECT_TRUE(hasArg(cmd, "--workers=2"));
    EXPECT_TRUE(hasArg(cmd, "--max-failures=5"));
    EXPECT_TRUE(hasArg(cmd, "--reporter=list,html,json"));
    EXPECT_FALSE(std::ranges::any_of(cmd.argv, [](const auto& a) { return a.starts_with("--trace"); }));
    EXPECT_EQ(cmd.cwd, dir.path());

    cfg.trace_mode = config::TraceMode::OnFirstRetry;
    EXPECT_TRUE(hasArg(buildTestCommand(cfg, dir.path()), "--trace=on-first-retry"));
}

TEST_F(TestRunnerTest, EnvironmentCarriesAdvancedValuesOnlyWhenConfigured) {
    auto cfg = baseConfig();
    auto env = buildTestEnvironment(cfg);
    EXPECT_EQ(envValue(env, "APP_URL"), cfg.app_url);
    EXPECT_EQ(envValue(env, "APP_PASSWORD"), "p4ssw0rd!");
    EXPECT_EQ(envValue(env, "PLAYWRIGHT_JSON_OUTPUT_NAME"), "test-results/results.json");
    EXPECT_EQ(envValue(env, "TENANT_ID"), "<unset>");

    cfg.advanced.tenant_id = "tenant";
    cfg.advanced.dynamics_url = "https://contoso.crm.dynamics.com";
    cfg.advanced.client_id = "client";
    cfg.advanced.client_secret = "secret";
    cfg.advanced.role_name = "Tester";
    env = buildTestEnvironment(cfg);
    EXPECT_EQ(envValue(env, "TENANT_ID"), "tenant");
    EXPECT_EQ(envValue(env, "ROLE_NAME"), "Tester");
    EXPECT_EQ(envValue(env, "CLIENT_SECRET"), "<unset>");
}

TEST_F(TestRunnerTest, PassingRunHasNoFailureReport) {
    TestRunner runner(launcher, dir.path());
    const auto result = runner.run(baseConfig());

    EXPECT_TRUE(result.passed());
    EXPECT_FALSE(result.failure.has_value());
    ASSERT_EQ(launcher->commands.size(), 1u);
    EXPECT_EQ(envValue(launcher->commands[0].env, "APP_USERNAME"), "tester@contoso.com");
}

TEST_F(TestRunnerTest, FailingRunKeepsExitCodeAndListsScreenshot) {
    launcher->testExitCode = 3;
    TestRunner runner(launcher, dir.path());
    const auto result = runner.run(baseConfig());

    EXPECT_EQ(result.exitCode, 3);
    ASSERT_TRUE(result.failure.has_value());
    ASSERT_EQ(result.failure->screenshots.size(), 1u);
    EXPECT_EQ(result.failure->screenshots[0].filename(), "test-failed-1.png");
    ASSERT_EQ(result.failure->logExcerpts.size(), 1u);
    EXPECT_NE(result.failure->logExcerpts[0].text.find("Timeout waiting"), std::string::npos);
}

TEST_F(TestRunnerTest, LaunchFailureIsTestExecutionError) {
    launcher->missingPrograms.insert("npx");
    TestRunner runner(launcher, dir.path());
    EXPECT_THROW((void)runner.run(baseConfig()), TestExecutionError);
}

TEST_F(TestRunnerTest, AnalyzerCapsEachCategory) {
    const auto results = dir / "test-results";
    fs::create_directories(results);
    for (int i = 0; i < 8; ++i) {
        std::ofstream(results / ("shot-" + std::to_string(i) + ".png")) << "PNG";
        std::ofstream(results / ("case-" + std::to_string(i) + "-trace.zip")) << "ZIP";
        std::ofstream(results / ("video-" + std::to_string(i) + ".webm")) << "WEBM";
        std::ofstream(results / ("out-" + std::to_string(i) + ".json")) << "{}";
        std::ofstream(results / ("log-" + std::to_string(i) + ".txt")) << std::string(5000, 'x');
    }

    const auto report = analyzeFailure(dir.path(), baseConfig());
    EXPECT_EQ(report.screenshots.size(), ArtifactLimits::SCREENSHOTS);
    EXPECT_EQ(report.screenshotsFound, 8u);
    EXPECT_EQ(report.traces.size(), ArtifactLimits::TRACES);
    EXPECT_EQ(report.videos.size(), ArtifactLimits::VIDEOS);
    EXPECT_EQ(report.jsonResults.size(), ArtifactLimits::JSON_RESULTS);
    ASSERT_EQ(report.logExcerpts.size(), ArtifactLimits::LOG_EXCERPTS);
    EXPECT_EQ(report.logExcerpts[0].text.size(), ArtifactLimits::EXCERPT_BYTES);
    EXPECT_TRUE(report.logExcerpts[0].truncated);
}

TEST_F(TestRunnerTest, AnalyzerReportsPresenceNotValues) {
    auto cfg = baseConfig();
    cfg.app_name.clear();
    const auto report = analyzeFailure(dir / "missing-root", cfg);

    EXPECT_TRUE(report.empty());
    bool sawPassword = false, sawAppName = false;
    for (const auto& [name, set] : report.environmentHints) {
        EXPECT_EQ(name.find("p4ssw0rd"), std::string::npos);
        if (name == "APP_PASSWORD") { sawPassword = true; EXPECT_TRUE(set); }
        if (name == "APP_NAME" && !std::getenv("APP_NAME")) { sawAppName = true; EXPECT_FALSE(set); }
    }
    EXPECT_TRUE(sawPassword);
    if (!std::getenv("APP_NAME")) EXPECT_TRUE(sawAppName);
}

TEST_F(TestRunnerTest, CollectorMirrorsBothFolders) {
    fs::create_directories(dir / "fw" / "test-results" / "case-1");
    fs::create_directories(dir / "fw" / "playwright-report");
    std::ofstream(dir / "fw" / "test-results" / "case-1" / "trace.zip") << "ZIP";
    std::ofstream(dir / "fw" / "playwright-report" / "index.html") << "<html/>";

    const auto report = collectArtifacts(dir / "fw", dir / "out");

    EXPECT_TRUE(report.warnings.empty());
    EXPECT_EQ(report.copied.size(), 2u);
    EXPECT_TRUE(fs::exists(dir / "out" / "test-results" / "case-1" / "trace.zip"));
    EXPECT_TRUE(fs::exists(dir / "out" / "playwright-report" / "index.html"));
}

TEST_F(TestRunnerTest, CollectorWarnsOnMissingFolder) {
    fs::create_directories(dir / "fw" / "playwright-report");

    const auto report = collectArtifacts(dir / "fw", dir / "out");

    EXPECT_EQ(report.copied.size(), 1u);
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_NE(report.warnings[0].find("test-results"), std::string::npos);
}

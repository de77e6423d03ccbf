#include "runner/FailureAnalyzer.hpp"
#include "runner/TestRunner.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "util/DirectoryWalker.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string_view>

using namespace ppt::log;

namespace ppt::runner {

namespace {

constexpr std::string_view KNOWN_VARIABLES[] = {
    "APP_URL", "APP_NAME", "APP_USERNAME", "APP_PASSWORD",
    "TENANT_ID", "DYNAMICS_URL", "CLIENT_ID", "ROLE_NAME", "TEAM_NAME", "BUSINESS_UNIT_NAME"
};

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void keep(std::vector<fs::path>& into, const fs::path& p, const std::size_t cap) {
    if (into.size() < cap) into.push_back(p);
}

LogExcerpt readExcerpt(const fs::path& p) {
    LogExcerpt ex{p};
    std::ifstream in(p, std::ios::binary);
    if (!in) return ex;

    std::string buf(ArtifactLimits::EXCERPT_BYTES + 1, '\0');
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    buf.resize(static_cast<std::size_t>(in.gcount()));

    ex.truncated = buf.size() > ArtifactLimits::EXCERPT_BYTES;
    if (ex.truncated) buf.resize(ArtifactLimits::EXCERPT_BYTES);
    ex.text = std::move(buf);
    return ex;
}

bool isSet(const process::Environment& env, const std::string_view name) {
    for (const auto& [k, v] : env)
        if (k == name) return !v.empty();
    const char* value = std::getenv(std::string(name).c_str());
    return value && *value;
}

void scan(const fs::path& dir, FailureReport& report) {
    const auto entries = util::DirectoryWalker().walk(dir, [](const fs::directory_entry& de) {
        std::error_code ec;
        return de.is_regular_file(ec);
    });

    for (const auto& e : entries) {
        const auto name = lower(e.path.filename().string());
        const auto ext = lower(e.path.extension().string());

        if (name.ends_with("trace.zip")) {
            ++report.tracesFound;
            keep(report.traces, e.path, ArtifactLimits::TRACES);
        } else if (ext == ".png") {
            ++report.screenshotsFound;
            keep(report.screenshots, e.path, ArtifactLimits::SCREENSHOTS);
        } else if (ext == ".webm") {
            keep(report.videos, e.path, ArtifactLimits::VIDEOS);
        } else if (ext == ".json") {
            keep(report.jsonResults, e.path, ArtifactLimits::JSON_RESULTS);
        } else if ((ext == ".md" || ext == ".txt" || ext == ".log") &&
                   report.logExcerpts.size() < ArtifactLimits::LOG_EXCERPTS) {
            report.logExcerpts.push_back(readExcerpt(e.path));
        }
    }
}

}

FailureReport analyzeFailure(const fs::path& frameworkRoot, const config::RunConfiguration& cfg) noexcept {
    FailureReport report;
    try {
        scan(frameworkRoot / TEST_RESULTS_DIR, report);
        scan(frameworkRoot / REPORT_DIR, report);

        const auto env = buildTestEnvironment(cfg);
        for (const auto name : KNOWN_VARIABLES)
            report.environmentHints.emplace_back(std::string(name), isSet(env, name));
    } catch (const std::exception& e) {
        Registry::runner()->warn("[FailureAnalyzer] Artifact discovery stopped early: {}", e.what());
    }
    return report;
}

void logFailureReport(const FailureReport& report) {
    const auto log = Registry::runner();

    if (report.empty()) {
        log->warn("[FailureAnalyzer] No result files, traces, screenshots or videos were produced; "
                  "the runner probably failed before any test started");
    }

    for (const auto& p : report.jsonResults) log->info("[FailureAnalyzer] Result JSON: {}", p.string());

    if (!report.traces.empty())
        log->info("[FailureAnalyzer] Traces ({} of {}):", report.traces.size(), report.tracesFound);
    for (const auto& p : report.traces) log->info("[FailureAnalyzer]   {}", p.string());

    if (!report.screenshots.empty())
        log->info("[FailureAnalyzer] Screenshots ({} of {}):", report.screenshots.size(), report.screenshotsFound);
    for (const auto& p : report.screenshots) log->info("[FailureAnalyzer]   {}", p.string());

    for (const auto& p : report.videos) log->info("[FailureAnalyzer] Video: {}", p.string());

    for (const auto& ex : report.logExcerpts)
        log->info("[FailureAnalyzer] {}{}:\n{}", ex.path.string(), ex.truncated ? " (truncated)" : "", ex.text);

    for (const auto& [name, set] : report.environmentHints)
        log->info("[FailureAnalyzer] {} is {}", name, set ? "set" : "NOT set");
}

}

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace ppt::config { struct RunConfiguration; }

namespace ppt::runner {

namespace fs = std::filesystem;

struct ArtifactLimits {
    static constexpr std::size_t JSON_RESULTS = 3;
    static constexpr std::size_t TRACES = 5;
    static constexpr std::size_t SCREENSHOTS = 5;
    static constexpr std::size_t VIDEOS = 3;
    static constexpr std::size_t LOG_EXCERPTS = 3;
    static constexpr std::size_t EXCERPT_BYTES = 2048;
};

struct LogExcerpt {
    fs::path path;
    std::string text;
    bool truncated = false;
};

struct FailureReport {
    std::vector<fs::path> jsonResults;
    std::vector<fs::path> traces;
    std::vector<fs::path> screenshots;
    std::vector<fs::path> videos;
    std::vector<LogExcerpt> logExcerpts;

    // Totals before capping, so the summary can say "5 of 12".
    std::size_t screenshotsFound = 0;
    std::size_t tracesFound = 0;

    // Variable name and whether it is set. Values are never read into here.
    std::vector<std::pair<std::string, bool>> environmentHints;

    [[nodiscard]] bool empty() const {
        return jsonResults.empty() && traces.empty() && screenshots.empty() && videos.empty() && logExcerpts.empty();
    }
};

// Best-effort walk of test-results and playwright-report under the framework
// root. Never throws.
[[nodiscard]] FailureReport analyzeFailure(const fs::path& frameworkRoot, const config::RunConfiguration& cfg) noexcept;

void logFailureReport(const FailureReport& report);

}

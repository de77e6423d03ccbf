#include "runner/ArtifactCollector.hpp"
#include "runner/TestRunner.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace ppt::log;

namespace ppt::runner {

CollectionReport collectArtifacts(const fs::path& frameworkRoot, const fs::path& outputPath) {
    CollectionReport report;

    for (const auto* folder : {TEST_RESULTS_DIR, REPORT_DIR}) {
        const auto src = frameworkRoot / folder;
        const auto dst = outputPath / folder;

        std::error_code ec;
        if (!fs::is_directory(src, ec)) {
            report.warnings.push_back(fmt::format("{} not found under {}", folder, frameworkRoot.string()));
            Registry::runner()->warn("[ArtifactCollector] {}", report.warnings.back());
            continue;
        }

        fs::create_directories(dst, ec);
        if (!ec)
            fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);

        if (ec) {
            report.warnings.push_back(fmt::format("Copying {} to {} failed: {}", src.string(), dst.string(), ec.message()));
            Registry::runner()->warn("[ArtifactCollector] {}", report.warnings.back());
            continue;
        }

        report.copied.push_back(dst);
        Registry::runner()->info("[ArtifactCollector] Copied {} to {}", folder, dst.string());
    }

    return report;
}

}

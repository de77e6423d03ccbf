#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ppt::runner {

namespace fs = std::filesystem;

struct CollectionReport {
    std::vector<fs::path> copied;     // destination folders
    std::vector<std::string> warnings;
};

// Mirrors test-results and playwright-report from the framework root into
// outputPath. Missing folders and copy errors are warnings.
CollectionReport collectArtifacts(const fs::path& frameworkRoot, const fs::path& outputPath);

}

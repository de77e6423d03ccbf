#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace ppt::log {

// Process-wide list of values that must never reach a log line. Every sink
// built by Registry runs its payload through mask().
class Secrets {
public:
    static constexpr std::string_view MASK = "***";

    // Values shorter than MIN_LENGTH are only masked by the pipeline agent,
    // masking them here would shred ordinary output.
    static constexpr size_t MIN_LENGTH = 3;

    // A multi-line value is registered one line at a time.
    static void add(const std::string& value);
    static void clear();

    [[nodiscard]] static std::string mask(std::string_view text);
    [[nodiscard]] static size_t size();

    // True when running on an Azure Pipelines agent (TF_BUILD is set).
    [[nodiscard]] static bool underPipelineAgent();

private:
    static void addLine(const std::string& line);

    static inline std::mutex mutex_;
    static inline std::vector<std::string> values_;
};

}

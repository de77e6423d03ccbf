#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>

namespace ppt::config { struct LoggingConfig; }

namespace ppt::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels. A second call is ignored.
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> ppt()        { return get("ppt"); }
    static std::shared_ptr<spdlog::logger> http()       { return get("http"); }
    static std::shared_ptr<spdlog::logger> auth()       { return get("auth"); }
    static std::shared_ptr<spdlog::logger> dataverse()  { return get("dataverse"); }
    static std::shared_ptr<spdlog::logger> provision()  { return get("provision"); }
    static std::shared_ptr<spdlog::logger> bootstrap()  { return get("bootstrap"); }
    static std::shared_ptr<spdlog::logger> runner()     { return get("runner"); }

    [[nodiscard]] static bool isInitialized();

    [[nodiscard]] static std::filesystem::path mainLogPath() { return main_log_path_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static inline std::shared_ptr<spdlog::sinks::sink> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::sink> main_file_sink_;
};

}

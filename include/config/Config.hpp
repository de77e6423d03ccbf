#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ppt::config {

inline constexpr auto DEFAULT_FRAMEWORK_REPOSITORY = "https://github.com/mightora/playwright-power-platform-framework.git";
inline constexpr auto DEFAULT_NODE_VERSION = "20.11.1";

enum class Browser { Chromium, Firefox, Webkit, MsEdge };

enum class TraceMode { Off, On, RetainOnFailure, OnFirstRetry };

[[nodiscard]] std::string to_string(Browser b);
[[nodiscard]] std::string to_string(TraceMode t);
[[nodiscard]] Browser parseBrowser(const std::string& s);
[[nodiscard]] TraceMode parseTraceMode(const std::string& s);

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum ppt        = spdlog::level::info;   // Stage transitions, final outcome
    spdlog::level::level_enum http       = spdlog::level::warn;   // Transport failures only
    spdlog::level::level_enum auth       = spdlog::level::info;
    spdlog::level::level_enum dataverse  = spdlog::level::info;
    spdlog::level::level_enum provision  = spdlog::level::info;
    spdlog::level::level_enum bootstrap  = spdlog::level::info;
    spdlog::level::level_enum runner     = spdlog::level::info;
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    std::filesystem::path log_dir;   // empty: console only
    SubsystemLogLevelsConfig subsystem_levels;
};

struct FrameworkConfig {
    std::string repository_url = DEFAULT_FRAMEWORK_REPOSITORY;
    std::string ref;                                   // branch, tag or commit; empty = default branch
    std::filesystem::path work_dir = "playwright-framework";
};

struct RuntimeConfig {
    std::string node_version = DEFAULT_NODE_VERSION;
    std::filesystem::path install_dir = ".ppt-runtime";
};

struct AdvancedConfig {
    std::string tenant_id;
    std::string dynamics_url;
    std::string client_id;
    std::string client_secret;
    std::string role_name;
    std::string team_name;
    std::string business_unit_name;
};

struct DataverseConfig {
    std::string api_version = "v9.2";
};

struct AuthConfig {
    std::string authority_host = "https://login.microsoftonline.com";
};

struct RunConfiguration {
    std::filesystem::path test_source_path;
    Browser browser = Browser::Chromium;
    TraceMode trace_mode = TraceMode::Off;
    std::filesystem::path output_path;

    std::string app_url;
    std::string app_name;
    std::string username;
    std::string password;

    FrameworkConfig framework;
    RuntimeConfig runtime;
    AdvancedConfig advanced;
    DataverseConfig dataverse;
    AuthConfig auth;
    LoggingConfig logging;

    // Provisioning runs only when every one of these is present. There is no
    // partial activation.
    [[nodiscard]] bool advancedConfigured() const;

    // Throws ConfigError describing the first missing required field.
    void validate() const;
};

RunConfiguration loadConfig(const std::filesystem::path& path);
RunConfiguration loadConfigFromString(const std::string& yaml);

// Secrets may come from the environment instead of the config file:
// PPT_PASSWORD and PPT_CLIENT_SECRET fill empty fields.
void applyEnvironmentFallbacks(RunConfiguration& cfg);

void to_json(nlohmann::json& j, const RunConfiguration& c);
void to_json(nlohmann::json& j, const FrameworkConfig& c);
void to_json(nlohmann::json& j, const AdvancedConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace ppt::config

#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "types/errors.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace ppt::config {

namespace {

std::string masked(const std::string& secret) { return secret.empty() ? "" : "***"; }

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

template <class T>
void section(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node) return;
    if (!YAML::convert<T>::decode(node, out)) throw ConfigError("Configuration section '" + key + "' must be a mapping");
}

RunConfiguration decodeRoot(const YAML::Node& root) {
    if (!root.IsMap()) throw ConfigError("Configuration root must be a mapping");

    RunConfiguration cfg;

    try {
        cfg.test_source_path = root["test_source_path"].as<std::string>("");
        cfg.output_path = root["output_path"].as<std::string>("");
        cfg.browser = parseBrowser(root["browser"].as<std::string>("chromium"));
        cfg.trace_mode = parseTraceMode(root["trace"].as<std::string>("off"));
        cfg.app_url = root["app_url"].as<std::string>("");
        cfg.app_name = root["app_name"].as<std::string>("");
        cfg.username = root["username"].as<std::string>("");
        cfg.password = root["password"].as<std::string>("");

        section(root, "framework", cfg.framework);
        section(root, "runtime", cfg.runtime);
        section(root, "advanced", cfg.advanced);
        section(root, "dataverse", cfg.dataverse);
        section(root, "auth", cfg.auth);
        section(root, "logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Malformed configuration: ") + e.what());
    }

    return cfg;
}

}

std::string to_string(const Browser b) {
    switch (b) {
        case Browser::Chromium: return "chromium";
        case Browser::Firefox: return "firefox";
        case Browser::Webkit: return "webkit";
        case Browser::MsEdge: return "msedge";
    }
    return "chromium";
}

std::string to_string(const TraceMode t) {
    switch (t) {
        case TraceMode::Off: return "off";
        case TraceMode::On: return "on";
        case TraceMode::RetainOnFailure: return "retain-on-failure";
        case TraceMode::OnFirstRetry: return "on-first-retry";
    }
    return "off";
}

Browser parseBrowser(const std::string& s) {
    if (s == "chromium") return Browser::Chromium;
    if (s == "firefox") return Browser::Firefox;
    if (s == "webkit") return Browser::Webkit;
    if (s == "msedge" || s == "edge") return Browser::MsEdge;
    throw ConfigError("Invalid browser: '" + s + "' (expected chromium, firefox, webkit or msedge)");
}

TraceMode parseTraceMode(const std::string& s) {
    if (s == "off") return TraceMode::Off;
    if (s == "on") return TraceMode::On;
    if (s == "retain-on-failure") return TraceMode::RetainOnFailure;
    if (s == "on-first-retry") return TraceMode::OnFirstRetry;
    throw ConfigError("Invalid trace mode: '" + s + "' (expected off, on, retain-on-failure or on-first-retry)");
}

bool RunConfiguration::advancedConfigured() const {
    return !advanced.tenant_id.empty() && !advanced.dynamics_url.empty() &&
           !advanced.client_id.empty() && !advanced.client_secret.empty() && !username.empty();
}

void RunConfiguration::validate() const {
    if (test_source_path.empty()) throw ConfigError("test_source_path is required");
    if (output_path.empty()) throw ConfigError("output_path is required");
    if (framework.repository_url.empty()) throw ConfigError("framework.repository_url must not be empty");
    if (framework.work_dir.empty()) throw ConfigError("framework.work_dir must not be empty");
    if (runtime.node_version.empty()) throw ConfigError("runtime.node_version must not be empty");
}

RunConfiguration loadConfig(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to read configuration " + path.string() + ": " + e.what());
    }
    return decodeRoot(root);
}

RunConfiguration loadConfigFromString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Failed to parse configuration: ") + e.what());
    }
    return decodeRoot(root);
}

void applyEnvironmentFallbacks(RunConfiguration& cfg) {
    if (cfg.password.empty())
        if (const char* v = std::getenv("PPT_PASSWORD")) cfg.password = v;
    if (cfg.advanced.client_secret.empty())
        if (const char* v = std::getenv("PPT_CLIENT_SECRET")) cfg.advanced.client_secret = v;
}

void to_json(nlohmann::json& j, const RunConfiguration& c) {
    j = {
        {"test_source_path", c.test_source_path.string()},
        {"browser", to_string(c.browser)},
        {"trace", to_string(c.trace_mode)},
        {"output_path", c.output_path.string()},
        {"app_url", c.app_url},
        {"app_name", c.app_name},
        {"username", c.username},
        {"password", masked(c.password)},
        {"framework", c.framework},
        {"runtime", {{"node_version", c.runtime.node_version}, {"install_dir", c.runtime.install_dir.string()}}},
        {"advanced", c.advanced},
        {"advanced_configured", c.advancedConfigured()},
        {"dataverse", {{"api_version", c.dataverse.api_version}}},
        {"auth", {{"authority_host", c.auth.authority_host}}},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const FrameworkConfig& c) {
    j = {
        {"repository_url", c.repository_url},
        {"ref", c.ref},
        {"work_dir", c.work_dir.string()}
    };
}

void to_json(nlohmann::json& j, const AdvancedConfig& c) {
    j = {
        {"tenant_id", c.tenant_id},
        {"dynamics_url", c.dynamics_url},
        {"client_id", c.client_id},
        {"client_secret", masked(c.client_secret)},
        {"role", c.role_name},
        {"team", c.team_name},
        {"business_unit", c.business_unit_name}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"log_dir", c.log_dir.string()}
    };
}

} // namespace ppt::config

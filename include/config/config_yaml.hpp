#pragma once

#include "config/Config.hpp"
#include "types/errors.hpp"

#include <array>
#include <algorithm>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ppt::config;

// spdlog::level::from_str maps unknown names to off, so names are checked first.
inline spdlog::level::level_enum levelOr(const Node& node, const std::string& def) {
    static constexpr std::array<std::string_view, 9> names{
        "trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"};

    const auto name = node ? node.as<std::string>(def) : def;
    if (std::ranges::find(names, name) == names.end())
        throw ppt::ConfigError("Invalid log level: '" + name + "' (expected trace, debug, info, warn, error, critical or off)");
    return spdlog::level::from_str(name);
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.ppt = levelOr(node["ppt"], "info");
        rhs.http = levelOr(node["http"], "warn");
        rhs.auth = levelOr(node["auth"], "info");
        rhs.dataverse = levelOr(node["dataverse"], "info");
        rhs.provision = levelOr(node["provision"], "info");
        rhs.bootstrap = levelOr(node["bootstrap"], "info");
        rhs.runner = levelOr(node["runner"], "info");
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], "info");
        rhs.file_log_level = levelOr(node["file_log_level"], "debug");
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<FrameworkConfig> {
    static bool decode(const Node& node, FrameworkConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.repository_url = node["repository_url"].as<std::string>(DEFAULT_FRAMEWORK_REPOSITORY);
        rhs.ref = node["ref"].as<std::string>("");
        rhs.work_dir = node["work_dir"].as<std::string>("playwright-framework");
        return true;
    }
};

template<>
struct convert<RuntimeConfig> {
    static bool decode(const Node& node, RuntimeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.node_version = node["node_version"].as<std::string>(DEFAULT_NODE_VERSION);
        rhs.install_dir = node["install_dir"].as<std::string>(".ppt-runtime");
        return true;
    }
};

template<>
struct convert<AdvancedConfig> {
    static bool decode(const Node& node, AdvancedConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tenant_id = node["tenant_id"].as<std::string>("");
        rhs.dynamics_url = node["dynamics_url"].as<std::string>("");
        rhs.client_id = node["client_id"].as<std::string>("");
        rhs.client_secret = node["client_secret"].as<std::string>("");
        rhs.role_name = node["role"].as<std::string>("");
        rhs.team_name = node["team"].as<std::string>("");
        rhs.business_unit_name = node["business_unit"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<DataverseConfig> {
    static bool decode(const Node& node, DataverseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.api_version = node["api_version"].as<std::string>("v9.2");
        return true;
    }
};

template<>
struct convert<AuthConfig> {
    static bool decode(const Node& node, AuthConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.authority_host = node["authority_host"].as<std::string>("https://login.microsoftonline.com");
        return true;
    }
};

}

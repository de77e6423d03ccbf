#include "config/Config.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"
#include "log/Secrets.hpp"
#include "orchestrator/Orchestrator.hpp"
#include "process/Launcher.hpp"

#include <fmt/core.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using namespace ppt;

namespace {

constexpr int EXIT_USAGE = 2;

struct Arguments {
    std::string configPath;
    std::optional<std::string> logDir;
    bool dryConfig = false;
};

void usage() {
    std::cerr << "Usage: ppt-runner --config <file.yaml> [--log-dir <dir>] [--dry-config]\n"
                 "\n"
                 "  --config <file>   run configuration (YAML)\n"
                 "  --log-dir <dir>   also write a rotating log file into <dir>\n"
                 "  --dry-config      print the effective configuration (secrets masked) and exit\n"
                 "\n"
                 "PPT_PASSWORD and PPT_CLIENT_SECRET fill password and advanced.client_secret when the file omits them.\n";
}

std::optional<Arguments> parseArgs(const int argc, char** argv) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        const auto value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (a == "--config") {
            const auto v = value();
            if (!v) return std::nullopt;
            args.configPath = *v;
        } else if (a == "--log-dir") {
            args.logDir = value();
            if (!args.logDir) return std::nullopt;
        } else if (a == "--dry-config") {
            args.dryConfig = true;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            return std::nullopt;
        }
    }
    if (args.configPath.empty()) return std::nullopt;
    return args;
}

}

int main(const int argc, char** argv) {
    const auto args = parseArgs(argc, argv);
    if (!args) {
        usage();
        return EXIT_USAGE;
    }

    config::RunConfiguration cfg;
    try {
        cfg = config::loadConfig(args->configPath);
        if (args->logDir) cfg.logging.log_dir = *args->logDir;
        config::applyEnvironmentFallbacks(cfg);
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "[ppt-runner] Invalid configuration: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    log::Secrets::add(cfg.password);
    log::Secrets::add(cfg.advanced.client_secret);

    if (args->dryConfig) {
        const nlohmann::json j = cfg;
        fmt::print("{}\n", j.dump(2));
        return 0;
    }

    try {
        log::Registry::init(cfg.logging);
        log::Registry::ppt()->info("[*] ppt-runner starting: browser={}, trace={}, provisioning={}",
                                   config::to_string(cfg.browser), config::to_string(cfg.trace_mode),
                                   cfg.advancedConfigured() ? "enabled" : "skipped");

        orchestrator::Orchestrator orchestrator(cfg, {
            std::make_shared<http::CurlTransport>(),
            std::make_shared<process::PosixLauncher>(),
            {}
        });
        const int code = orchestrator.run();
        spdlog::shutdown();
        return code;
    } catch (const std::exception& e) {
        std::cerr << "[ppt-runner] Fatal: " << log::Secrets::mask(e.what()) << "\n";
        return 1;
    }
}

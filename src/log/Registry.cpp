#include "log/Registry.hpp"
#include "log/MaskingSink.hpp"
#include "config/Config.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <filesystem>
#include <vector>

namespace ppt::log {

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    namespace fs = std::filesystem;

    // console
    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console->set_color_mode(spdlog::color_mode::automatic);
    console_sink_ = std::make_shared<MaskingSinkMt>(console);
    console_sink_->set_level(cfg.console_log_level);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating), only when a log dir was given
    if (!cfg.log_dir.empty()) {
        if (!fs::exists(cfg.log_dir)) fs::create_directories(cfg.log_dir);
        main_log_path_ = cfg.log_dir / "ppt-runner.log";

        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_ = std::make_shared<MaskingSinkMt>(file);
        main_file_sink_->set_level(cfg.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cfg.subsystem_levels;
    makeLogger("ppt",       sub.ppt);
    makeLogger("http",      sub.http);
    makeLogger("auth",      sub.auth);
    makeLogger("dataverse", sub.dataverse);
    makeLogger("provision", sub.provision);
    makeLogger("bootstrap", sub.bootstrap);
    makeLogger("runner",    sub.runner);

    initialized_ = true;
    ppt()->debug("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

}

#include "log/Diagnostic.hpp"
#include "log/Registry.hpp"
#include "log/Secrets.hpp"

#include <cstdio>
#include <fmt/core.h>

namespace ppt::log {

void emit(const std::shared_ptr<spdlog::logger>& logger, const Diagnostic& d) {
    logger->error("================ {} ================", d.title);
    if (d.status != 0) logger->error("  HTTP status : {}", d.status);
    if (!d.url.empty()) logger->error("  Request     : {} {}", d.method.empty() ? "GET" : d.method, d.url);
    if (!d.detail.empty()) logger->error("  Detail      : {}", d.detail);
    if (!d.checklist.empty()) {
        logger->error("  Check:");
        for (size_t i = 0; i < d.checklist.size(); ++i)
            logger->error("    {}. {}", i + 1, d.checklist[i]);
    }
    logger->error("================{}================", std::string(d.title.size() + 2, '='));
}

void beginGroup(const std::string& name) {
    if (Secrets::underPipelineAgent()) {
        Registry::ppt()->flush();
        fmt::print("##[group]{}\n", Secrets::mask(name));
        std::fflush(stdout);
        return;
    }
    Registry::ppt()->info("---- {} ----", name);
}

void endGroup() {
    if (!Secrets::underPipelineAgent()) return;
    Registry::ppt()->flush();
    fmt::print("##[endgroup]\n");
    std::fflush(stdout);
}

}

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <spdlog/logger.h>

namespace ppt::log {

// Structured block printed before a fatal error surfaces. Goes through the
// masking sinks like every other line, so secrets never reach it.
struct Diagnostic {
    std::string title;
    long status = 0;
    std::string method;
    std::string url;
    std::string detail;
    std::vector<std::string> checklist;
};

void emit(const std::shared_ptr<spdlog::logger>& logger, const Diagnostic& d);

// Collapsible sections in the Azure Pipelines log view; a plain banner
// elsewhere.
void beginGroup(const std::string& name);
void endGroup();

}

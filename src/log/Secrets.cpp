#include "log/Secrets.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fmt/core.h>

namespace ppt::log {

void Secrets::add(const std::string& value) {
    size_t start = 0;
    while (start <= value.size()) {
        const auto end = value.find_first_of("\r\n", start);
        const auto line = value.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty()) addLine(line);
        if (end == std::string::npos) break;
        start = end + 1;
    }
}

void Secrets::addLine(const std::string& line) {
    if (line.size() >= MIN_LENGTH) {
        std::lock_guard lock(mutex_);
        if (std::ranges::find(values_, line) != values_.end()) return;
        values_.push_back(line);
        // longest first, so a secret containing another is masked whole
        std::ranges::sort(values_, [](const auto& a, const auto& b) { return a.size() > b.size(); });
    }

    // The agent masks registered values in its own log stream too. Printed
    // straight to stdout: routing it through a logger would mask it.
    if (underPipelineAgent()) {
        fmt::print("##vso[task.setsecret]{}\n", line);
        std::fflush(stdout);
    }
}

void Secrets::clear() {
    std::lock_guard lock(mutex_);
    values_.clear();
}

std::string Secrets::mask(const std::string_view text) {
    std::string out(text);
    std::lock_guard lock(mutex_);
    for (const auto& secret : values_) {
        size_t pos = 0;
        while ((pos = out.find(secret, pos)) != std::string::npos) {
            out.replace(pos, secret.size(), MASK);
            pos += MASK.size();
        }
    }
    return out;
}

size_t Secrets::size() {
    std::lock_guard lock(mutex_);
    return values_.size();
}

bool Secrets::underPipelineAgent() {
    const char* tf = std::getenv("TF_BUILD");
    return tf && *tf;
}

}

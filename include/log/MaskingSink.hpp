#pragma once

#include "log/Secrets.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>

namespace ppt::log {

// Wraps another sink and replaces registered secrets in the payload before
// forwarding. Level filtering happens on this sink, not the wrapped one.
template <typename Mutex>
class MaskingSink final : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit MaskingSink(spdlog::sink_ptr inner) : inner_(std::move(inner)) {}

    [[nodiscard]] const spdlog::sink_ptr& inner() const { return inner_; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        const std::string masked = Secrets::mask(std::string_view(msg.payload.data(), msg.payload.size()));
        spdlog::details::log_msg copy(msg);
        copy.payload = spdlog::string_view_t(masked.data(), masked.size());
        inner_->log(copy);
    }

    void flush_() override { inner_->flush(); }

    void set_pattern_(const std::string& pattern) override { inner_->set_pattern(pattern); }

    void set_formatter_(std::unique_ptr<spdlog::formatter> formatter) override {
        inner_->set_formatter(std::move(formatter));
    }

private:
    spdlog::sink_ptr inner_;
};

using MaskingSinkMt = MaskingSink<std::mutex>;
using MaskingSinkSt = MaskingSink<spdlog::details::null_mutex>;

}

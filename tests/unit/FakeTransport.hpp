#pragma once

#include "http/Transport.hpp"

#include <string>
#include <vector>

namespace ppt::test {

// Answers requests from a route table: first route whose method matches and
// whose pattern is a substring of the URL wins. Unrouted requests get a 404.
class FakeTransport : public http::Transport {
public:
    struct Route {
        std::string method;
        std::string pattern;
        long status;
        std::string body;
        int remaining;   // -1: unlimited
    };

    FakeTransport& on(const std::string& method, const std::string& pattern, const long status,
                      const std::string& body = "", const int times = -1) {
        routes_.push_back({method, pattern, status, body, times});
        return *this;
    }

    http::HttpResponse send(const http::Request& req) override {
        calls.push_back(req);
        for (auto& r : routes_) {
            if (r.method != req.method || !req.url.contains(r.pattern) || r.remaining == 0) continue;
            if (r.remaining > 0) --r.remaining;
            return {CURLE_OK, r.status, r.body, ""};
        }
        return {CURLE_OK, 404, R"({"error":{"code":"0x80060888","message":"Resource not found for the segment"}})", ""};
    }

    [[nodiscard]] size_t count(const std::string& method, const std::string& pattern = "") const {
        size_t n = 0;
        for (const auto& c : calls)
            if (c.method == method && c.url.contains(pattern)) ++n;
        return n;
    }

    // Position of the first matching call, -1 when there is none.
    [[nodiscard]] long indexOf(const std::string& method, const std::string& pattern) const {
        for (size_t i = 0; i < calls.size(); ++i)
            if (calls[i].method == method && calls[i].url.contains(pattern)) return static_cast<long>(i);
        return -1;
    }

    std::vector<http::Request> calls;

private:
    std::vector<Route> routes_;
};

inline constexpr auto ENV_URL = "https://contoso.crm.dynamics.com";
inline constexpr auto API = "https://contoso.crm.dynamics.com/api/data/v9.2/";

inline std::string valueOf(const std::string& rows) { return R"({"value":[)" + rows + "]}"; }

inline std::string duplicateError() {
    return R"({"error":{"code":"0x80040237","message":"Cannot insert duplicate key."}})";
}

inline std::string tokenResponse(const std::string& token = "eyJ0eXAi.test-token") {
    return R"({"token_type":"Bearer","expires_in":3599,"access_token":")" + token + R"("})";
}

}

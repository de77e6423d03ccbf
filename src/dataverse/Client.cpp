#include "dataverse/Client.hpp"
#include "auth/TokenClient.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"
#include "util/url.hpp"

#include <fmt/format.h>

using namespace ppt::log;

namespace ppt::dataverse {

namespace {

constexpr size_t MAX_ERROR_BODY = 512;

nlohmann::json parseErrorObject(const std::string& body) {
    const auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error") || !j["error"].is_object()) return nullptr;
    return j["error"];
}

}

Client::Client(std::shared_ptr<http::Transport> transport, const std::string& environmentUrl, std::string apiVersion)
    : transport_(std::move(transport)),
      environmentUrl_(util::normalizeBaseUrl(environmentUrl)),
      apiVersion_(std::move(apiVersion)) {
    if (!transport_) throw std::invalid_argument("dataverse::Client requires a transport");
    if (environmentUrl_.empty()) throw std::invalid_argument("dataverse::Client requires an environment URL");
}

std::string Client::apiBase() const {
    return fmt::format("{}/api/data/{}", environmentUrl_, apiVersion_);
}

std::string Client::entityUrl(const std::string& path) const {
    return apiBase() + "/" + path;
}

nlohmann::json Client::call(const std::string& method,
                            const std::string& path,
                            const auth::AccessToken& token,
                            const std::optional<nlohmann::json>& body,
                            const Headers& extraHeaders) const {
    http::Request req;
    req.method = method;
    req.url = entityUrl(path);
    req.headers = {
        {"Authorization", "Bearer " + token.value},
        {"OData-MaxVersion", "4.0"},
        {"OData-Version", "4.0"},
        {"Accept", "application/json"},
        {"Content-Type", "application/json; charset=utf-8"}
    };
    for (const auto& h : extraHeaders) req.headers.push_back(h);
    if (body) req.body = body->dump();

    Registry::dataverse()->debug("[Client] {} {}", method, req.url);

    const auto resp = transport_->send(req);

    if (resp.curl != CURLE_OK) throw ApiError(
        fmt::format("Dataverse {} {} failed: {}", method, path, curl_easy_strerror(resp.curl)),
        0, "", method, req.url);

    if (!resp.ok()) {
        auto detail = odataErrorMessage(resp.body);
        if (detail.empty()) detail = resp.body.substr(0, MAX_ERROR_BODY);
        const auto msg = fmt::format("Dataverse {} {} failed with HTTP {}: {}", method, path, resp.http, detail);

        if (resp.http == 401) throw UnauthorizedError(msg, resp.http, resp.body, method, req.url);
        throw ApiError(msg, resp.http, resp.body, method, req.url);
    }

    if (resp.body.empty()) return nlohmann::json::object();

    auto parsed = nlohmann::json::parse(resp.body, nullptr, false);
    if (parsed.is_discarded()) {
        Registry::dataverse()->warn("[Client] {} {} returned a non-JSON body, ignoring it", method, path);
        return nlohmann::json::object();
    }
    return parsed;
}

std::string odataErrorMessage(const std::string& body) {
    const auto err = parseErrorObject(body);
    if (err.is_null()) return {};
    return err.value("message", "");
}

std::string odataErrorCode(const std::string& body) {
    const auto err = parseErrorObject(body);
    if (err.is_null()) return {};
    return err.value("code", "");
}

}

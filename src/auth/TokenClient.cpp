#include "auth/TokenClient.hpp"
#include "http/Transport.hpp"
#include "log/Registry.hpp"
#include "log/Secrets.hpp"
#include "types/errors.hpp"
#include "util/url.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace ppt::log;

namespace ppt::auth {

std::string normalizeResourceUrl(const std::string_view url) {
    return util::normalizeBaseUrl(url);
}

TokenClient::TokenClient(std::shared_ptr<http::Transport> transport, std::string authorityHost)
    : transport_(std::move(transport)), authorityHost_(util::normalizeBaseUrl(authorityHost)) {
    if (!transport_) throw std::invalid_argument("TokenClient requires a transport");
}

std::string TokenClient::tokenEndpoint(const std::string& tenantId) const {
    return fmt::format("{}/{}/oauth2/v2.0/token", authorityHost_, util::urlEncode(tenantId));
}

AccessToken TokenClient::getAccessToken(const std::string& tenantId,
                                        const std::string& clientId,
                                        const std::string& clientSecret,
                                        const std::string& resourceUrl) const {
    if (tenantId.empty()) throw AuthError("Token request needs a tenant id");
    if (clientId.empty()) throw AuthError("Token request needs a client id");
    if (clientSecret.empty()) throw AuthError("Token request needs a client secret");
    if (resourceUrl.empty()) throw AuthError("Token request needs a Dataverse resource URL");

    Secrets::add(clientSecret);

    const auto resource = normalizeResourceUrl(resourceUrl);
    const auto scope = resource + "/.default";

    http::Request req;
    req.method = "POST";
    req.url = tokenEndpoint(tenantId);
    req.headers = {{"Content-Type", "application/x-www-form-urlencoded"}, {"Accept", "application/json"}};
    req.body = util::formEncode({
        {"client_id", clientId},
        {"client_secret", clientSecret},
        {"grant_type", "client_credentials"},
        {"scope", scope}
    });

    Registry::auth()->info("[TokenClient] Requesting token for {} (client {})", scope, clientId);

    const auto resp = transport_->send(req);

    if (resp.curl != CURLE_OK)
        throw AuthError(fmt::format("Token request to {} failed: {}", req.url, curl_easy_strerror(resp.curl)));

    if (!resp.ok()) {
        std::string oauthError, description;
        const auto body = nlohmann::json::parse(resp.body, nullptr, false);
        if (!body.is_discarded() && body.is_object()) {
            oauthError = body.value("error", "");
            description = body.value("error_description", "");
            if (const auto nl = description.find_first_of("\r\n"); nl != std::string::npos)
                description.resize(nl);
        }

        auto msg = fmt::format("Token request failed with HTTP {}", resp.http);
        if (!oauthError.empty()) msg += fmt::format(" ({})", oauthError);
        if (!description.empty()) msg += ": " + description;

        throw AuthError(Secrets::mask(msg), resp.http, oauthError);
    }

    const auto body = nlohmann::json::parse(resp.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("access_token"))
        throw AuthError("Token endpoint returned HTTP " + std::to_string(resp.http) + " without an access_token", resp.http);

    AccessToken token;
    token.value = body.at("access_token").get<std::string>();
    if (body.contains("expires_in")) {
        const auto& exp = body.at("expires_in");
        // AAD has historically sent this as a string on the v1 endpoint
        token.expiresIn = std::chrono::seconds(exp.is_string() ? std::stoll(exp.get<std::string>()) : exp.get<long long>());
    }
    token.acquiredAt = std::chrono::steady_clock::now();

    Secrets::add(token.value);

    Registry::auth()->info("[TokenClient] Token acquired, expires in {}s", token.expiresIn.count());
    return token;
}

std::vector<std::string> TokenClient::remediationFor(const std::string& oauthError) {
    if (oauthError == "invalid_scope") return {
        "The Dataverse URL must be the environment root, e.g. https://yourorg.crm.dynamics.com",
        "Remove any path such as /main.aspx or /api/data from the URL",
        "Confirm the environment exists in the tenant the app registration belongs to"
    };
    if (oauthError == "invalid_client") return {
        "Check the client id matches the app registration",
        "The client secret may be wrong or expired; create a new one in Entra ID",
        "Use the secret value, not the secret id"
    };
    if (oauthError == "invalid_request") return {
        "Check the tenant id (directory id GUID or verified domain)",
        "Make sure no input contains stray whitespace or quotes"
    };
    if (oauthError == "unauthorized_client") return {
        "The app registration is not enabled for the client-credentials flow in this tenant"
    };
    return {
        "Verify tenant id, client id and client secret",
        "Verify the Dataverse URL points at the environment root"
    };
}

}

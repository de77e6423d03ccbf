#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace ppt::http { class Transport; }

namespace ppt::auth {

struct AccessToken {
    std::string value;
    std::chrono::seconds expiresIn{0};
    std::chrono::steady_clock::time_point acquiredAt{};

    [[nodiscard]] bool empty() const { return value.empty(); }

    [[nodiscard]] bool expired(const std::chrono::seconds skew = std::chrono::seconds(60)) const {
        return std::chrono::steady_clock::now() + skew >= acquiredAt + expiresIn;
    }
};

// Always https://, never a trailing slash.
[[nodiscard]] std::string normalizeResourceUrl(std::string_view url);

class TokenClient {
public:
    explicit TokenClient(std::shared_ptr<http::Transport> transport,
                         std::string authorityHost = "https://login.microsoftonline.com");

    // OAuth2 client-credentials grant, scope "{resource}/.default".
    // Throws AuthError; the client secret never appears in the message.
    [[nodiscard]] AccessToken getAccessToken(const std::string& tenantId,
                                             const std::string& clientId,
                                             const std::string& clientSecret,
                                             const std::string& resourceUrl) const;

    [[nodiscard]] std::string tokenEndpoint(const std::string& tenantId) const;

    static std::vector<std::string> remediationFor(const std::string& oauthError);

private:
    std::shared_ptr<http::Transport> transport_;
    std::string authorityHost_;
};

}

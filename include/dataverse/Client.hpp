#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace ppt::http { class Transport; }
namespace ppt::auth { struct AccessToken; }

namespace ppt::dataverse {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Dataverse Web API over OData 4.0. Paths are relative to
// {environment}/api/data/{version}/.
class Client {
public:
    Client(std::shared_ptr<http::Transport> transport, const std::string& environmentUrl,
           std::string apiVersion = "v9.2");

    // One authenticated call. Non-2xx throws ApiError, 401 throws
    // UnauthorizedError. Empty bodies (204) come back as an empty object.
    nlohmann::json call(const std::string& method,
                        const std::string& path,
                        const auth::AccessToken& token,
                        const std::optional<nlohmann::json>& body = std::nullopt,
                        const Headers& extraHeaders = {}) const;

    [[nodiscard]] const std::string& environmentUrl() const { return environmentUrl_; }
    [[nodiscard]] std::string apiBase() const;

    // Absolute URL of an entity, as used in @odata.id references.
    [[nodiscard]] std::string entityUrl(const std::string& path) const;

private:
    std::shared_ptr<http::Transport> transport_;
    std::string environmentUrl_;
    std::string apiVersion_;
};

// "error.message" / "error.code" out of an OData error body, empty when absent.
[[nodiscard]] std::string odataErrorMessage(const std::string& body);
[[nodiscard]] std::string odataErrorCode(const std::string& body);

}

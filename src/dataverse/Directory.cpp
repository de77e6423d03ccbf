#include "dataverse/Directory.hpp"
#include "dataverse/Client.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"
#include "util/url.hpp"

#include <fmt/format.h>

using namespace ppt::log;

namespace ppt::dataverse {

namespace {

std::string stringField(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || !j[key].is_string()) return {};
    return j[key].get<std::string>();
}

}

Directory::Directory(std::shared_ptr<const Client> client, auth::AccessToken token)
    : client_(std::move(client)), token_(std::move(token)) {
    if (!client_) throw std::invalid_argument("Directory requires a Dataverse client");
}

std::optional<std::string> Directory::firstId(const std::string& entitySet,
                                              const std::string& idField,
                                              const std::string& filter) const {
    const auto path = fmt::format("{}?$select={}&$filter={}", entitySet, idField, util::urlEncode(filter));
    const auto result = client_->call("GET", path, token_);

    if (!result.contains("value") || !result["value"].is_array() || result["value"].empty()) return std::nullopt;

    const auto& first = result["value"].front();
    if (!first.contains(idField) || !first[idField].is_string()) return std::nullopt;
    return first[idField].get<std::string>();
}

EntityRef Directory::lookup(const std::string& kind,
                            const std::string& entitySet,
                            const std::string& idField,
                            const std::string& nameField,
                            const std::string& name) const {
    const auto id = firstId(entitySet, idField, fmt::format("{} eq {}", nameField, util::odataLiteral(name)));
    if (!id) throw NotFoundError(kind, name);

    Registry::dataverse()->info("[Directory] Resolved {} '{}' -> {}", kind, name, *id);
    return {kind, *id, name};
}

EntityRef Directory::resolveUser(const std::string& username) const {
    return lookup("user", "systemusers", "systemuserid", "domainname", username);
}

EntityRef Directory::resolveRole(const std::string& roleName,
                                 const std::optional<std::string>& businessUnitId) const {
    if (businessUnitId && !businessUnitId->empty()) {
        const auto filter = fmt::format("name eq {} and _businessunitid_value eq {}",
                                        util::odataLiteral(roleName), *businessUnitId);
        if (const auto id = firstId("roles", "roleid", filter)) {
            Registry::dataverse()->info("[Directory] Resolved role '{}' in business unit {} -> {}",
                                        roleName, *businessUnitId, *id);
            return {"role", *id, roleName};
        }
        Registry::dataverse()->warn("[Directory] Role '{}' has no copy in business unit {}, using first match",
                                    roleName, *businessUnitId);
    }
    return lookup("role", "roles", "roleid", "name", roleName);
}

EntityRef Directory::resolveTeam(const std::string& teamName) const {
    return lookup("team", "teams", "teamid", "name", teamName);
}

EntityRef Directory::resolveBusinessUnit(const std::string& buName) const {
    return lookup("business unit", "businessunits", "businessunitid", "name", buName);
}

std::string Directory::userBusinessUnitId(const std::string& userId) const {
    const auto result = client_->call("GET", fmt::format("systemusers({})?$select=_businessunitid_value", userId), token_);
    return stringField(result, "_businessunitid_value");
}

std::string Directory::roleBusinessUnitId(const std::string& roleId) const {
    const auto result = client_->call("GET", fmt::format("roles({})?$select=_businessunitid_value", roleId), token_);
    return stringField(result, "_businessunitid_value");
}

}

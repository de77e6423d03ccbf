#include "provision/UserProvisioner.hpp"
#include "dataverse/Client.hpp"
#include "log/Registry.hpp"
#include "types/errors.hpp"
#include "util/url.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace ppt::log;
using namespace ppt::dataverse;

namespace ppt::provision {

UserProvisioner::UserProvisioner(std::shared_ptr<const Client> client,
                                 auth::AccessToken token,
                                 std::vector<RoleAssignmentStrategy> strategies)
    : client_(std::move(client)),
      token_(std::move(token)),
      directory_(client_, token_),
      strategies_(std::move(strategies)) {}

std::vector<EntityRef> UserProvisioner::currentRoles(const std::string& userId) const {
    const auto result = client_->call(
        "GET", fmt::format("systemusers({})/systemuserroles_association?$select=roleid,name", userId), token_);

    std::vector<EntityRef> roles;
    if (!result.contains("value") || !result["value"].is_array()) return roles;

    for (const auto& row : result["value"]) {
        if (!row.contains("roleid") || !row["roleid"].is_string()) continue;
        const auto name = row.contains("name") && row["name"].is_string() ? row["name"].get<std::string>() : "";
        roles.push_back({"role", row["roleid"].get<std::string>(), name});
    }
    return roles;
}

bool UserProvisioner::hasRole(const std::string& userId, const std::string& roleId) const {
    for (const auto& r : currentRoles(userId))
        if (r.id == roleId) return true;
    return false;
}

RemovalReport UserProvisioner::removeAllSecurityRoles(const std::string& userId) const {
    const auto roles = currentRoles(userId);
    Registry::provision()->info("[UserProvisioner] Removing {} existing security role(s) from user {}", roles.size(), userId);

    RemovalReport report;
    for (const auto& role : roles) {
        try {
            removeSecurityRole(userId, role.id);
            report.removed.push_back(role);
        } catch (const ApiError& e) {
            Registry::provision()->warn("[UserProvisioner] Could not remove role '{}' ({}): {}", role.name, role.id, e.what());
            report.failed.push_back(role);
        }
    }

    if (!report.failed.empty())
        Registry::provision()->warn("[UserProvisioner] Removed {}/{} role(s); {} still assigned",
                                    report.removed.size(), report.attempted(), report.failed.size());
    return report;
}

void UserProvisioner::removeSecurityRole(const std::string& userId, const std::string& roleId) const {
    client_->call("DELETE", fmt::format("systemusers({})/systemuserroles_association({})/$ref", userId, roleId), token_);
    Registry::provision()->info("[UserProvisioner] Removed role {} from user {}", roleId, userId);
}

void UserProvisioner::checkBusinessUnitCompatibility(const std::string& userId, const std::string& roleId) const {
    try {
        const auto userBu = directory_.userBusinessUnitId(userId);
        const auto roleBu = directory_.roleBusinessUnitId(roleId);
        if (!userBu.empty() && !roleBu.empty() && userBu != roleBu)
            Registry::provision()->warn(
                "[UserProvisioner] User {} is in business unit {} but role {} belongs to {}; assignment may be rejected",
                userId, userBu, roleId, roleBu);
    } catch (const std::exception& e) {
        Registry::provision()->warn("[UserProvisioner] Business unit compatibility check skipped: {}", e.what());
    }
}

AssignmentResult UserProvisioner::assignSecurityRole(const std::string& userId, const std::string& roleId) const {
    checkBusinessUnitCompatibility(userId, roleId);

    const AttemptContext ctx{*client_, token_, userId, roleId};
    AssignmentResult result;
    long lastStatus = 0;

    for (size_t i = 0; i < strategies_.size(); ++i) {
        const auto& strategy = strategies_[i];
        Registry::provision()->info("[UserProvisioner] Role assignment method {}/{}: {}", i + 1, strategies_.size(), strategy.name);

        const auto outcome = strategy.attempt(ctx);
        if (outcome.ok()) {
            Registry::provision()->info("[UserProvisioner] Role {} assigned to user {} via {}", roleId, userId, strategy.name);
            result.strategy = strategy.name;
            return result;
        }

        const auto& err = *outcome.error;
        lastStatus = err.status;
        result.attempts.push_back(fmt::format("{}: HTTP {}: {}", strategy.name, err.status, err.what()));
        Registry::provision()->warn("[UserProvisioner] Method {} failed with HTTP {}", strategy.name, err.status);

        if (strategy.confirmDuplicates && isDuplicateSignal(err)) {
            try {
                if (hasRole(userId, roleId)) {
                    Registry::provision()->info("[UserProvisioner] Role {} already assigned to user {}", roleId, userId);
                    result.strategy = strategy.name;
                    result.alreadyPresent = true;
                    return result;
                }
            } catch (const ApiError& e) {
                Registry::provision()->warn("[UserProvisioner] Could not re-read roles after duplicate response: {}", e.what());
            }
        }
    }

    throw RoleAssignmentError(
        fmt::format("All {} role assignment methods failed for role {} (last HTTP {})", strategies_.size(), roleId, lastStatus),
        lastStatus, result.attempts);
}

void UserProvisioner::updateBusinessUnit(const std::string& userId, const std::string& businessUnitId) const {
    client_->call("PATCH", fmt::format("systemusers({})", userId), token_,
                  nlohmann::json{{"businessunitid@odata.bind", fmt::format("/businessunits({})", businessUnitId)}});
    Registry::provision()->info("[UserProvisioner] Moved user {} to business unit {}", userId, businessUnitId);
}

bool UserProvisioner::isTeamMember(const std::string& userId, const std::string& teamId) const {
    const auto filter = fmt::format("systemuserid eq {}", userId);
    const auto result = client_->call(
        "GET",
        fmt::format("teams({})/teammembership_association?$select=systemuserid&$filter={}", teamId, util::urlEncode(filter)),
        token_);
    return result.contains("value") && result["value"].is_array() && !result["value"].empty();
}

bool UserProvisioner::addUserToTeam(const std::string& userId, const std::string& teamId) const {
    try {
        if (isTeamMember(userId, teamId)) {
            Registry::provision()->info("[UserProvisioner] User {} is already a member of team {}", userId, teamId);
            return false;
        }
    } catch (const ApiError& e) {
        Registry::provision()->warn("[UserProvisioner] Team membership pre-check failed, adding anyway: {}", e.what());
    }

    try {
        client_->call("POST", fmt::format("teams({})/teammembership_association/$ref", teamId), token_,
                      nlohmann::json{{"@odata.id", client_->entityUrl(fmt::format("systemusers({})", userId))}});
    } catch (const ApiError& e) {
        if (!isDuplicateSignal(e)) throw;
        Registry::provision()->info("[UserProvisioner] User {} was already in team {}", userId, teamId);
        return false;
    }

    Registry::provision()->info("[UserProvisioner] Added user {} to team {}", userId, teamId);
    return true;
}

void UserProvisioner::removeUserFromTeam(const std::string& userId, const std::string& teamId) const {
    try {
        client_->call("DELETE", fmt::format("teams({})/teammembership_association({})/$ref", teamId, userId), token_);
        Registry::provision()->info("[UserProvisioner] Removed user {} from team {}", userId, teamId);
    } catch (const ApiError& e) {
        if (e.status == 404)
            Registry::provision()->info("[UserProvisioner] User {} was not a member of team {}", userId, teamId);
        else
            Registry::provision()->warn("[UserProvisioner] Could not remove user {} from team {}: {}", userId, teamId, e.what());
    } catch (const std::exception& e) {
        Registry::provision()->warn("[UserProvisioner] Could not remove user {} from team {}: {}", userId, teamId, e.what());
    }
}

}

#include "provision/RoleAssignment.hpp"
#include "auth/TokenClient.hpp"
#include "dataverse/Client.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace ppt::provision {

namespace {

AttemptResult attemptCall(const AttemptContext& ctx,
                          const std::string& method,
                          const std::string& path,
                          const nlohmann::json& body,
                          const dataverse::Headers& headers = {}) {
    try {
        ctx.client.call(method, path, ctx.token, body, headers);
        return AttemptResult::success();
    } catch (const ApiError& e) {
        return AttemptResult::failure(e);
    }
}

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

AttemptResult userRolesRef(const AttemptContext& ctx, const dataverse::Headers& headers = {}) {
    return attemptCall(ctx, "POST",
                       fmt::format("systemusers({})/systemuserroles_association/$ref", ctx.userId),
                       {{"@odata.id", ctx.client.entityUrl(fmt::format("roles({})", ctx.roleId))}},
                       headers);
}

}

std::vector<RoleAssignmentStrategy> defaultRoleAssignmentStrategies() {
    return {
        {"user role association $ref", [](const AttemptContext& ctx) {
            return userRolesRef(ctx);
        }, true},

        {"role user association $ref", [](const AttemptContext& ctx) {
            return attemptCall(ctx, "POST",
                               fmt::format("roles({})/systemuserroles_association/$ref", ctx.roleId),
                               {{"@odata.id", ctx.client.entityUrl(fmt::format("systemusers({})", ctx.userId))}});
        }},

        {"Associate action", [](const AttemptContext& ctx) {
            return attemptCall(ctx, "POST", "Associate", {
                {"Target", {
                    {"@odata.type", "Microsoft.Dynamics.CRM.systemuser"},
                    {"systemuserid", ctx.userId}
                }},
                {"Relationship", "systemuserroles_association"},
                {"RelatedEntities", nlohmann::json::array({{
                    {"@odata.type", "Microsoft.Dynamics.CRM.role"},
                    {"roleid", ctx.roleId}
                }})}
            });
        }},

        {"systemuserroles join collection", [](const AttemptContext& ctx) {
            return attemptCall(ctx, "POST", "systemuserroles", {
                {"systemuserid", ctx.userId},
                {"roleid", ctx.roleId}
            });
        }},

        {"AddUserToRole action", [](const AttemptContext& ctx) {
            return attemptCall(ctx, "POST", "AddUserToRole", {
                {"UserId", ctx.userId},
                {"RoleId", ctx.roleId}
            });
        }},

        {"user role association $ref (If-None-Match)", [](const AttemptContext& ctx) {
            return userRolesRef(ctx, {{"If-None-Match", "null"}});
        }}
    };
}

bool isDuplicateSignal(const ApiError& e) {
    if (e.status != 400 && e.status != 409 && e.status != 412) return false;

    const auto body = lower(e.body + " " + e.what());
    return body.find("duplicate") != std::string::npos ||
           body.find("already exists") != std::string::npos ||
           body.find("matching key values") != std::string::npos ||
           body.find("0x80040237") != std::string::npos;
}

std::vector<std::string> roleAssignmentRemediation(const long status) {
    switch (status) {
        case 400: return {
            "The user id or role id is malformed or refers to a deleted record",
            "The role must belong to the user's business unit; set the business unit first or pick the role copy from that unit",
            "Role names are matched exactly, including case and spacing"
        };
        case 401: return {
            "The application user is missing or admin consent was not granted for Dynamics CRM",
            "Create an application user for this client id in the Power Platform admin center"
        };
        case 403: return {
            "The application user lacks the privilege to assign security roles (prvAssignRole)",
            "Give the application user System Administrator, or a custom role with Assign Role and Read User privileges",
            "An application user cannot grant a role with more privileges than it holds itself"
        };
        case 404: return {
            "The association route or action is not supported by this environment's Web API version",
            "The user or role id no longer exists"
        };
        default: return {
            "Check the Dataverse environment is reachable and healthy",
            "Retry the run; transient 5xx responses are common during environment maintenance"
        };
    }
}

std::vector<std::string> businessUnitRemediation(const long status) {
    switch (status) {
        case 400: return {
            "The user id or business unit id is invalid",
            "The business unit may be disabled"
        };
        case 403: return {
            "The application user lacks the privilege to change a user's business unit (prvWriteUser, prvChangeBusinessUnit)",
            "Give the application user System Administrator in this environment"
        };
        default: return {
            "Check the business unit name and that the application user can update users"
        };
    }
}

}

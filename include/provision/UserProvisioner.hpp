#pragma once

#include "auth/TokenClient.hpp"
#include "dataverse/Directory.hpp"
#include "provision/RoleAssignment.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ppt::dataverse { class Client; }

namespace ppt::provision {

struct RemovalReport {
    std::vector<dataverse::EntityRef> removed;
    std::vector<dataverse::EntityRef> failed;

    [[nodiscard]] size_t attempted() const { return removed.size() + failed.size(); }
};

struct AssignmentResult {
    std::string strategy;             // the strategy that succeeded
    bool alreadyPresent = false;      // duplicate confirmed by re-query, nothing was added
    std::vector<std::string> attempts;
};

class UserProvisioner {
public:
    UserProvisioner(std::shared_ptr<const dataverse::Client> client,
                    auth::AccessToken token,
                    std::vector<RoleAssignmentStrategy> strategies = defaultRoleAssignmentStrategies());

    // Best effort: a failed delete is logged and the loop moves on. Only the
    // initial listing can throw.
    RemovalReport removeAllSecurityRoles(const std::string& userId) const;

    [[nodiscard]] std::vector<dataverse::EntityRef> currentRoles(const std::string& userId) const;
    [[nodiscard]] bool hasRole(const std::string& userId, const std::string& roleId) const;

    // Runs the strategy chain. Throws RoleAssignmentError once every strategy
    // has failed.
    AssignmentResult assignSecurityRole(const std::string& userId, const std::string& roleId) const;

    // Warns when user and role live in different business units. Never
    // throws and never blocks the assignment.
    void checkBusinessUnitCompatibility(const std::string& userId, const std::string& roleId) const;

    void removeSecurityRole(const std::string& userId, const std::string& roleId) const;

    void updateBusinessUnit(const std::string& userId, const std::string& businessUnitId) const;

    // False when the user already was a member, so nothing of ours to undo.
    bool addUserToTeam(const std::string& userId, const std::string& teamId) const;

    [[nodiscard]] bool isTeamMember(const std::string& userId, const std::string& teamId) const;

    // Never throws; a 404 means the user was not a member.
    void removeUserFromTeam(const std::string& userId, const std::string& teamId) const;

private:
    std::shared_ptr<const dataverse::Client> client_;
    auth::AccessToken token_;
    dataverse::Directory directory_;
    std::vector<RoleAssignmentStrategy> strategies_;
};

}

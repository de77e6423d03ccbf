#pragma once

#include "auth/TokenClient.hpp"
#include "dataverse/Directory.hpp"

#include <string>
#include <vector>

namespace ppt::provision {

// What this run changed on the target user, and what cleanup needs to undo
// it. Cleanup reads nothing else.
struct ProvisioningState {
    bool configured = false;

    auth::AccessToken token;
    dataverse::EntityRef user;

    bool roleAssigned = false;
    dataverse::EntityRef role;

    bool teamJoined = false;
    dataverse::EntityRef team;

    bool businessUnitChanged = false;
    dataverse::EntityRef businessUnit;
    std::string previousBusinessUnitId;

    // Pre-existing roles stripped before assignment. Not restored.
    std::vector<dataverse::EntityRef> removedRoles;

    [[nodiscard]] bool cleanupEligible() const { return configured && !token.empty() && !user.empty(); }

    void reset() { *this = ProvisioningState{}; }
};

}

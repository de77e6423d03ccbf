#include "provision/CleanupLease.hpp"
#include "provision/Outcome.hpp"
#include "provision/UserProvisioner.hpp"
#include "log/Diagnostic.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace ppt::log;

namespace ppt::provision {

CleanupLease::CleanupLease(const ProvisioningState& state,
                           std::shared_ptr<const dataverse::Client> client,
                           TokenRefresher refresh)
    : state_(state), client_(std::move(client)), refresh_(std::move(refresh)) {}

CleanupLease::~CleanupLease() { release(); }

void CleanupLease::release() noexcept {
    if (released_) return;
    released_ = true;

    try {
        releaseImpl();
    } catch (const std::exception& e) {
        report_.warnings.emplace_back(e.what());
        Registry::provision()->warn("[CleanupLease] Cleanup failed: {}", e.what());
    }
}

auth::AccessToken CleanupLease::usableToken() {
    if (!state_.token.expired() || !refresh_) return state_.token;

    Registry::provision()->info("[CleanupLease] Access token expired during the run, requesting a new one");
    try {
        return refresh_();
    } catch (const std::exception& e) {
        report_.warnings.push_back(fmt::format("token refresh failed: {}", e.what()));
        Registry::provision()->warn("[CleanupLease] Token refresh failed, trying the old token: {}", e.what());
        return state_.token;
    }
}

void CleanupLease::releaseImpl() {
    if (!state_.cleanupEligible() || !client_) {
        Registry::provision()->info("[CleanupLease] Provisioning was not configured, nothing to clean up");
        return;
    }

    beginGroup("Cleanup");
    report_.ran = true;

    const UserProvisioner users(client_, usableToken());

    if (state_.roleAssigned) {
        const auto outcome = runStep(OperationKind::RemoveRole, [&] {
            users.removeSecurityRole(state_.user.id, state_.role.id);
        });
        report_.roleRemoved = outcome.ok;
        if (!outcome.ok) report_.warnings.push_back(outcome.error);
    } else {
        Registry::provision()->info("[CleanupLease] No role was assigned by this run");
    }

    if (state_.teamJoined) {
        report_.teamRemovalAttempted = true;
        const auto outcome = runStep(OperationKind::RemoveFromTeam, [&] {
            users.removeUserFromTeam(state_.user.id, state_.team.id);
        });
        if (!outcome.ok) report_.warnings.push_back(outcome.error);
    }

    if (state_.businessUnitChanged)
        Registry::provision()->warn(
            "[CleanupLease] User {} stays in business unit '{}'; business unit changes are not reverted (previous: {})",
            state_.user.name, state_.businessUnit.name,
            state_.previousBusinessUnitId.empty() ? "unknown" : state_.previousBusinessUnitId);

    if (!state_.removedRoles.empty()) {
        std::string names;
        for (const auto& r : state_.removedRoles) {
            if (!names.empty()) names += ", ";
            names += r.name.empty() ? r.id : r.name;
        }
        Registry::provision()->warn("[CleanupLease] Roles removed before assignment are not restored: {}", names);
    }

    Registry::provision()->info("[CleanupLease] Cleanup finished with {} warning(s)", report_.warnings.size());
    endGroup();
}

}

#include <gtest/gtest.h>
#include "dataverse/Client.hpp"
#include "provision/CleanupLease.hpp"
#include "FakeTransport.hpp"

#include <chrono>
#include <stdexcept>

using namespace ppt;
using namespace ppt::provision;
using ppt::test::FakeTransport;

namespace {

auth::AccessToken freshToken(const std::string& value = "tok") {
    return {value, std::chrono::seconds(3600), std::chrono::steady_clock::now()};
}

}

class CleanupLeaseTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<const dataverse::Client> client = std::make_shared<const dataverse::Client>(transport, test::ENV_URL);
    ProvisioningState state;

    void provisioned(const bool role, const bool team) {
        state.configured = true;
        state.token = freshToken();
        state.user = {"user", "u1", "tester@contoso.com"};
        state.roleAssigned = role;
        state.role = {"role", "r1", "Tester"};
        state.teamJoined = team;
        state.team = {"team", "t1", "QA"};
    }
};

TEST_F(CleanupLeaseTest, NothingHappensWhenNotConfigured) {
    {
        CleanupLease lease(state, client);
        lease.release();
        EXPECT_FALSE(lease.report().ran);
    }
    EXPECT_TRUE(transport->calls.empty());
}

TEST_F(CleanupLeaseTest, NothingHappensWithoutUserId) {
    provisioned(true, true);
    state.user = {};
    CleanupLease lease(state, client);
    lease.release();
    EXPECT_EQ(transport->count("DELETE"), 0u);
}

TEST_F(CleanupLeaseTest, RemovesRoleAndTeamCreatedByThisRun) {
    provisioned(true, true);
    transport->on("DELETE", "systemusers(u1)/systemuserroles_association(r1)/$ref", 204);
    transport->on("DELETE", "teams(t1)/teammembership_association(u1)/$ref", 204);

    CleanupLease lease(state, client);
    lease.release();

    EXPECT_TRUE(lease.report().ran);
    EXPECT_TRUE(lease.report().roleRemoved);
    EXPECT_TRUE(lease.report().teamRemovalAttempted);
    EXPECT_TRUE(lease.report().warnings.empty());
    EXPECT_EQ(transport->count("DELETE"), 2u);
}

TEST_F(CleanupLeaseTest, LeavesPreexistingAssignmentsAlone) {
    provisioned(false, false);
    CleanupLease lease(state, client);
    lease.release();

    EXPECT_TRUE(lease.report().ran);
    EXPECT_EQ(transport->count("DELETE"), 0u);
}

TEST_F(CleanupLeaseTest, RoleRemovalFailureIsAWarning) {
    provisioned(true, true);
    transport->on("DELETE", "systemuserroles_association(r1)", 500, "");
    transport->on("DELETE", "teammembership_association(u1)", 204);

    CleanupLease lease(state, client);
    EXPECT_NO_THROW(lease.release());

    EXPECT_FALSE(lease.report().roleRemoved);
    EXPECT_EQ(lease.report().warnings.size(), 1u);
    EXPECT_EQ(transport->count("DELETE", "teammembership_association(u1)"), 1u);
}

TEST_F(CleanupLeaseTest, ReleasesOnceFromDestructorDuringUnwind) {
    provisioned(true, false);
    transport->on("DELETE", "systemuserroles_association(r1)", 204);

    EXPECT_THROW({
        CleanupLease lease(state, client);
        throw std::runtime_error("bootstrap exploded");
    }, std::runtime_error);

    EXPECT_EQ(transport->count("DELETE"), 1u);
}

TEST_F(CleanupLeaseTest, ExplicitReleaseIsNotRepeated) {
    provisioned(true, false);
    transport->on("DELETE", "systemuserroles_association(r1)", 204);

    {
        CleanupLease lease(state, client);
        lease.release();
        lease.release();
        EXPECT_TRUE(lease.released());
    }
    EXPECT_EQ(transport->count("DELETE"), 1u);
}

TEST_F(CleanupLeaseTest, ExpiredTokenIsRefreshed) {
    provisioned(true, false);
    state.token = {"old-token", std::chrono::seconds(0), std::chrono::steady_clock::now()};
    transport->on("DELETE", "systemuserroles_association(r1)", 204);

    int refreshes = 0;
    CleanupLease lease(state, client, [&] {
        ++refreshes;
        return freshToken("new-token");
    });
    lease.release();

    EXPECT_EQ(refreshes, 1);
    bool usedNew = false;
    for (const auto& [k, v] : transport->calls.at(0).headers)
        if (k == "Authorization" && v == "Bearer new-token") usedNew = true;
    EXPECT_TRUE(usedNew);
}

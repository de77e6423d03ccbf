#include <gtest/gtest.h>
#include "dataverse/Client.hpp"
#include "provision/RoleAssignment.hpp"
#include "provision/UserProvisioner.hpp"
#include "types/errors.hpp"
#include "FakeTransport.hpp"

#include <nlohmann/json.hpp>

using namespace ppt;
using namespace ppt::provision;
using ppt::test::FakeTransport;
using ppt::test::valueOf;

class UserProvisionerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<const dataverse::Client> client = std::make_shared<const dataverse::Client>(transport, test::ENV_URL);
    UserProvisioner users{client, auth::AccessToken{"tok"}};
};

TEST_F(UserProvisionerTest, RemoveAllContinuesPastFailure) {
    transport->on("GET", "systemusers(u1)/systemuserroles_association?", 200,
                  valueOf(R"({"roleid":"r1","name":"Basic User"},{"roleid":"r2","name":"Locked"},{"roleid":"r3","name":"Sales"})"));
    transport->on("DELETE", "systemuserroles_association(r2)", 500,
                  R"({"error":{"code":"0x80040216","message":"An unexpected error occurred."}})");
    transport->on("DELETE", "systemuserroles_association(", 204);

    const auto report = users.removeAllSecurityRoles("u1");

    EXPECT_EQ(transport->count("DELETE"), 3u);
    ASSERT_EQ(report.removed.size(), 2u);
    EXPECT_EQ(report.removed[0].id, "r1");
    EXPECT_EQ(report.removed[1].id, "r3");
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].id, "r2");
    EXPECT_EQ(report.attempted(), 3u);
}

TEST_F(UserProvisionerTest, RemoveAllListingFailureThrows) {
    transport->on("GET", "systemuserroles_association?", 403, "");
    EXPECT_THROW((void)users.removeAllSecurityRoles("u1"), ApiError);
}

TEST_F(UserProvisionerTest, FirstStrategyWins) {
    transport->on("POST", "systemusers(u1)/systemuserroles_association/$ref", 204);

    const auto result = users.assignSecurityRole("u1", "r1");

    EXPECT_EQ(result.strategy, "user role association $ref");
    EXPECT_FALSE(result.alreadyPresent);
    EXPECT_EQ(transport->count("POST"), 1u);

    const auto body = nlohmann::json::parse(transport->calls.back().body);
    EXPECT_EQ(body["@odata.id"], std::string(test::API) + "roles(r1)");
}

TEST_F(UserProvisionerTest, DuplicateConfirmedByRequeryShortCircuits) {
    transport->on("POST", "systemusers(u1)/systemuserroles_association/$ref", 400, test::duplicateError());
    transport->on("GET", "systemusers(u1)/systemuserroles_association?", 200, valueOf(R"({"roleid":"r1","name":"Tester"})"));

    const auto result = users.assignSecurityRole("u1", "r1");

    EXPECT_TRUE(result.alreadyPresent);
    EXPECT_EQ(transport->count("POST"), 1u);
    EXPECT_EQ(transport->count("GET", "systemuserroles_association?"), 1u);
}

TEST_F(UserProvisionerTest, DuplicateWithoutRoleKeepsTrying) {
    transport->on("POST", "systemusers(u1)/systemuserroles_association/$ref", 400, test::duplicateError(), 1);
    transport->on("GET", "systemusers(u1)/systemuserroles_association?", 200, valueOf(""));
    transport->on("POST", "roles(r1)/systemuserroles_association/$ref", 204);

    const auto result = users.assignSecurityRole("u1", "r1");

    EXPECT_FALSE(result.alreadyPresent);
    EXPECT_EQ(result.strategy, "role user association $ref");
    EXPECT_EQ(result.attempts.size(), 1u);
}

TEST_F(UserProvisionerTest, FallsThroughToActionStrategies) {
    transport->on("POST", "AddUserToRole", 204);

    const auto result = users.assignSecurityRole("u1", "r1");

    EXPECT_EQ(result.strategy, "AddUserToRole action");
    EXPECT_EQ(transport->count("POST"), 5u);
    EXPECT_EQ(result.attempts.size(), 4u);
}

TEST_F(UserProvisionerTest, AllStrategiesExhausted) {
    transport->on("POST", "", 403, R"({"error":{"message":"missing prvAssignRole"}})");

    try {
        (void)users.assignSecurityRole("u1", "r1");
        FAIL() << "expected RoleAssignmentError";
    } catch (const RoleAssignmentError& e) {
        EXPECT_EQ(e.lastStatus, 403);
        EXPECT_EQ(e.attempts.size(), 6u);
    }
    EXPECT_EQ(transport->count("POST"), 6u);

    bool conditional = false;
    for (const auto& [k, v] : transport->calls.back().headers)
        if (k == "If-None-Match" && v == "null") conditional = true;
    EXPECT_TRUE(conditional);
}

TEST_F(UserProvisionerTest, DuplicateSignalClassification) {
    const ApiError dup("x", 409, test::duplicateError(), "POST", "u");
    const ApiError keys("x", 412, "A record with matching key values already exists.", "POST", "u");
    const ApiError forbidden("x", 403, "duplicate", "POST", "u");
    const ApiError plain("x", 400, "Bad request", "POST", "u");

    EXPECT_TRUE(isDuplicateSignal(dup));
    EXPECT_TRUE(isDuplicateSignal(keys));
    EXPECT_FALSE(isDuplicateSignal(forbidden));
    EXPECT_FALSE(isDuplicateSignal(plain));
}

TEST_F(UserProvisionerTest, UpdateBusinessUnitBindsEntity) {
    transport->on("PATCH", "systemusers(u1)", 204);
    users.updateBusinessUnit("u1", "bu-9");

    const auto body = nlohmann::json::parse(transport->calls.at(0).body);
    EXPECT_EQ(body["businessunitid@odata.bind"], "/businessunits(bu-9)");
}

TEST_F(UserProvisionerTest, ExistingTeamMemberIsNotAdded) {
    transport->on("GET", "teams(t1)/teammembership_association?", 200, valueOf(R"({"systemuserid":"u1"})"));

    EXPECT_FALSE(users.addUserToTeam("u1", "t1"));
    EXPECT_EQ(transport->count("POST"), 0u);
}

TEST_F(UserProvisionerTest, AddsNewTeamMember) {
    transport->on("GET", "teams(t1)/teammembership_association?", 200, valueOf(""));
    transport->on("POST", "teams(t1)/teammembership_association/$ref", 204);

    EXPECT_TRUE(users.addUserToTeam("u1", "t1"));
    const auto body = nlohmann::json::parse(transport->calls.back().body);
    EXPECT_EQ(body["@odata.id"], std::string(test::API) + "systemusers(u1)");
}

TEST_F(UserProvisionerTest, TeamDuplicateMeansAlreadyMember) {
    transport->on("GET", "teams(t1)/teammembership_association?", 500, "");
    transport->on("POST", "teams(t1)/teammembership_association/$ref", 400, test::duplicateError());

    EXPECT_FALSE(users.addUserToTeam("u1", "t1"));
}

TEST_F(UserProvisionerTest, TeamAddFailurePropagates) {
    transport->on("GET", "teams(t1)/teammembership_association?", 200, valueOf(""));
    transport->on("POST", "teams(t1)/teammembership_association/$ref", 403, "");

    EXPECT_THROW((void)users.addUserToTeam("u1", "t1"), ApiError);
}

TEST_F(UserProvisionerTest, RemoveFromTeamNeverThrows) {
    transport->on("DELETE", "teams(t1)/teammembership_association(u1)/$ref", 404, "");
    EXPECT_NO_THROW(users.removeUserFromTeam("u1", "t1"));
    EXPECT_EQ(transport->count("DELETE"), 1u);
}

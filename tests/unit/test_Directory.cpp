#include <gtest/gtest.h>
#include "dataverse/Client.hpp"
#include "dataverse/Directory.hpp"
#include "types/errors.hpp"
#include "FakeTransport.hpp"

using namespace ppt;
using namespace ppt::dataverse;
using ppt::test::FakeTransport;
using ppt::test::valueOf;

class DirectoryTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
    std::shared_ptr<const Client> client = std::make_shared<const Client>(transport, test::ENV_URL);
    Directory directory{client, auth::AccessToken{"tok"}};
};

TEST_F(DirectoryTest, ResolvesUserByDomainName) {
    transport->on("GET", "systemusers?$select=systemuserid", 200,
                  valueOf(R"({"systemuserid":"00000000-0000-0000-0000-0000000000aa"})"));

    const auto user = directory.resolveUser("tester@contoso.onmicrosoft.com");
    EXPECT_EQ(user.kind, "user");
    EXPECT_EQ(user.id, "00000000-0000-0000-0000-0000000000aa");
    EXPECT_EQ(user.name, "tester@contoso.onmicrosoft.com");

    const auto& url = transport->calls.at(0).url;
    EXPECT_NE(url.find("domainname%20eq%20%27tester%40contoso.onmicrosoft.com%27"), std::string::npos);
}

TEST_F(DirectoryTest, EmptyResultIsNotFound) {
    transport->on("GET", "systemusers?", 200, valueOf(""));

    try {
        (void)directory.resolveUser("ghost@contoso.com");
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.kind, "user");
        EXPECT_EQ(e.name, "ghost@contoso.com");
        EXPECT_STREQ(e.what(), "user not found: 'ghost@contoso.com'");
    }
}

TEST_F(DirectoryTest, QuotesAreEscapedInFilters) {
    transport->on("GET", "teams?", 200, valueOf(R"({"teamid":"t1"})"));
    EXPECT_EQ(directory.resolveTeamId("O'Brien's Team"), "t1");
    EXPECT_NE(transport->calls.at(0).url.find("O%27%27Brien%27%27s"), std::string::npos);
}

TEST_F(DirectoryTest, FirstRowWins) {
    transport->on("GET", "businessunits?", 200, valueOf(R"({"businessunitid":"bu1"},{"businessunitid":"bu2"})"));
    EXPECT_EQ(directory.resolveBusinessUnitId("Sales"), "bu1");
}

TEST_F(DirectoryTest, RolePrefersBusinessUnitCopy) {
    transport->on("GET", "_businessunitid_value%20eq%20bu-7", 200, valueOf(R"({"roleid":"role-in-bu7"})"));
    transport->on("GET", "roles?", 200, valueOf(R"({"roleid":"role-root"})"));

    EXPECT_EQ(directory.resolveRole("Basic User", std::string("bu-7")).id, "role-in-bu7");
    EXPECT_EQ(directory.resolveRole("Basic User").id, "role-root");
}

TEST_F(DirectoryTest, RoleFallsBackWhenUnitHasNoCopy) {
    transport->on("GET", "_businessunitid_value%20eq%20bu-7", 200, valueOf(""));
    transport->on("GET", "roles?", 200, valueOf(R"({"roleid":"role-root"})"));

    EXPECT_EQ(directory.resolveRole("Basic User", std::string("bu-7")).id, "role-root");
    EXPECT_EQ(transport->count("GET", "roles?"), 2u);
}

TEST_F(DirectoryTest, BusinessUnitOfUserToleratesNull) {
    transport->on("GET", "systemusers(u1)?$select=_businessunitid_value", 200, R"({"_businessunitid_value":null})");
    EXPECT_EQ(directory.userBusinessUnitId("u1"), "");
}

#pragma once

#include "auth/TokenClient.hpp"

#include <memory>
#include <optional>
#include <string>

namespace ppt::dataverse {

class Client;

struct EntityRef {
    std::string kind;   // "user", "role", "team", "business unit"
    std::string id;
    std::string name;   // the name the id was resolved from

    [[nodiscard]] bool empty() const { return id.empty(); }
};

// Exact-match name lookups. Each throws NotFoundError{kind, name} on an empty
// result and takes the first row, in the order Dataverse returns them.
class Directory {
public:
    Directory(std::shared_ptr<const Client> client, auth::AccessToken token);

    [[nodiscard]] EntityRef resolveUser(const std::string& username) const;

    // Role names repeat once per business unit. With a business unit id the
    // lookup prefers the copy owned by that unit, falling back to any unit.
    [[nodiscard]] EntityRef resolveRole(const std::string& roleName,
                                        const std::optional<std::string>& businessUnitId = std::nullopt) const;

    [[nodiscard]] EntityRef resolveTeam(const std::string& teamName) const;
    [[nodiscard]] EntityRef resolveBusinessUnit(const std::string& buName) const;

    [[nodiscard]] std::string resolveUserId(const std::string& username) const { return resolveUser(username).id; }
    [[nodiscard]] std::string resolveRoleId(const std::string& roleName,
                                            const std::optional<std::string>& businessUnitId = std::nullopt) const {
        return resolveRole(roleName, businessUnitId).id;
    }
    [[nodiscard]] std::string resolveTeamId(const std::string& teamName) const { return resolveTeam(teamName).id; }
    [[nodiscard]] std::string resolveBusinessUnitId(const std::string& buName) const { return resolveBusinessUnit(buName).id; }

    // Owning business unit of a user or role; empty when Dataverse omits it.
    [[nodiscard]] std::string userBusinessUnitId(const std::string& userId) const;
    [[nodiscard]] std::string roleBusinessUnitId(const std::string& roleId) const;

private:
    std::shared_ptr<const Client> client_;
    auth::AccessToken token_;

    [[nodiscard]] std::optional<std::string> firstId(const std::string& entitySet,
                                                     const std::string& idField,
                                                     const std::string& filter) const;

    [[nodiscard]] EntityRef lookup(const std::string& kind,
                                   const std::string& entitySet,
                                   const std::string& idField,
                                   const std::string& nameField,
                                   const std::string& name) const;
};

}

#pragma once

#include "types/errors.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ppt::auth { struct AccessToken; }
namespace ppt::dataverse { class Client; }

namespace ppt::provision {

struct AttemptContext {
    const dataverse::Client& client;
    const auth::AccessToken& token;
    const std::string& userId;
    const std::string& roleId;
};

struct AttemptResult {
    std::optional<ApiError> error;

    [[nodiscard]] bool ok() const { return !error.has_value(); }

    static AttemptResult success() { return {}; }
    static AttemptResult failure(const ApiError& e) { return {e}; }
};

struct RoleAssignmentStrategy {
    std::string name;
    std::function<AttemptResult(const AttemptContext&)> attempt;

    // A duplicate-key failure from this strategy is confirmed by re-reading
    // the user's roles; a confirmed role ends the chain as a success.
    bool confirmDuplicates = false;
};

// The six ways of associating a role with a user, in the order they are
// tried. Adding or dropping one is a change to this list only.
[[nodiscard]] std::vector<RoleAssignmentStrategy> defaultRoleAssignmentStrategies();

// Dataverse answers a repeated association with 400/409/412 and a
// duplicate-key message (0x80040237).
[[nodiscard]] bool isDuplicateSignal(const ApiError& e);

[[nodiscard]] std::vector<std::string> roleAssignmentRemediation(long status);
[[nodiscard]] std::vector<std::string> businessUnitRemediation(long status);

}

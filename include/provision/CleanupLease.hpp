#pragma once

#include "provision/ProvisioningState.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace ppt::dataverse { class Client; }

namespace ppt::provision {

struct CleanupReport {
    bool ran = false;
    bool roleRemoved = false;
    bool teamRemovalAttempted = false;
    std::vector<std::string> warnings;
};

// Holds the reversible provisioning state for the lifetime of the test run.
// release() undoes it exactly once: explicitly on the normal path, from the
// destructor on any other. Cleanup failures are warnings and never escape.
class CleanupLease {
public:
    using TokenRefresher = std::function<auth::AccessToken()>;

    CleanupLease(const ProvisioningState& state,
                 std::shared_ptr<const dataverse::Client> client,
                 TokenRefresher refresh = {});

    ~CleanupLease();

    CleanupLease(const CleanupLease&) = delete;
    CleanupLease& operator=(const CleanupLease&) = delete;

    void release() noexcept;

    [[nodiscard]] bool released() const { return released_; }
    [[nodiscard]] const CleanupReport& report() const { return report_; }

private:
    const ProvisioningState& state_;
    std::shared_ptr<const dataverse::Client> client_;
    TokenRefresher refresh_;
    bool released_ = false;
    CleanupReport report_;

    void releaseImpl();
    [[nodiscard]] auth::AccessToken usableToken();
};

}

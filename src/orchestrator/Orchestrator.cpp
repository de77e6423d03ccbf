#include "orchestrator/Orchestrator.hpp"
#include "auth/TokenClient.hpp"
#include "dataverse/Client.hpp"
#include "dataverse/Directory.hpp"
#include "log/Registry.hpp"
#include "provision/RoleAssignment.hpp"
#include "provision/UserProvisioner.hpp"
#include "runner/ArtifactCollector.hpp"
#include "types/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace ppt::log;
using namespace ppt::provision;

namespace ppt::orchestrator {

std::string_view to_string(const RunStage stage) {
    switch (stage) {
        case RunStage::Init: return "Init";
        case RunStage::ProvisionOrSkip: return "ProvisionOrSkip";
        case RunStage::Bootstrap: return "Bootstrap";
        case RunStage::StageTests: return "StageTests";
        case RunStage::Execute: return "Execute";
        case RunStage::CollectArtifacts: return "CollectArtifacts";
        case RunStage::Cleanup: return "Cleanup";
        case RunStage::Done: return "Done";
    }
    return "Unknown";
}

Orchestrator::Orchestrator(const config::RunConfiguration& cfg, Dependencies deps)
    : cfg_(cfg), deps_(std::move(deps)) {
    if (!deps_.transport) throw std::invalid_argument("Orchestrator requires an HTTP transport");
    if (!deps_.launcher) throw std::invalid_argument("Orchestrator requires a process launcher");
}

void Orchestrator::enter(const RunStage stage) {
    trace_.push_back(stage);
    Registry::ppt()->info("[Orchestrator] Stage: {}", to_string(stage));
}

bool Orchestrator::abortProvisioning(const StepOutcome& outcome) {
    if (!outcome.fatal()) return false;

    emit(Registry::provision(), diagnose(outcome.cause, outcome.kind));
    Registry::provision()->warn("[Orchestrator] Provisioning aborted at {}; tests run without provisioning "
                                "and nothing will be cleaned up", provision::to_string(outcome.kind));
    state_.reset();
    endGroup();
    return true;
}

auth::AccessToken Orchestrator::refreshToken() const {
    const auth::TokenClient tokens(deps_.transport, cfg_.auth.authority_host);
    return tokens.getAccessToken(cfg_.advanced.tenant_id, cfg_.advanced.client_id,
                                 cfg_.advanced.client_secret, cfg_.advanced.dynamics_url);
}

void Orchestrator::provisionOrSkip() {
    state_.reset();
    client_.reset();

    if (!cfg_.advancedConfigured()) {
        Registry::provision()->info("[Orchestrator] Advanced configuration incomplete, skipping user provisioning");
        return;
    }

    beginGroup("Provisioning");
    state_.configured = true;
    const auto& adv = cfg_.advanced;

    auto outcome = runStep(OperationKind::AcquireToken, [&] {
        client_ = std::make_shared<const dataverse::Client>(deps_.transport, adv.dynamics_url, cfg_.dataverse.api_version);
        state_.token = refreshToken();
    });
    if (abortProvisioning(outcome)) return;

    const dataverse::Directory directory(client_, state_.token);
    const UserProvisioner users(client_, state_.token);

    outcome = runStep(OperationKind::ResolveUser, [&] { state_.user = directory.resolveUser(cfg_.username); });
    if (abortProvisioning(outcome)) return;

    // Business unit first: Dataverse rejects a role that belongs to a
    // different unit than the user.
    std::string currentBusinessUnitId;
    if (!adv.business_unit_name.empty()) {
        dataverse::EntityRef bu;
        outcome = runStep(OperationKind::ResolveBusinessUnit, [&] {
            bu = directory.resolveBusinessUnit(adv.business_unit_name);
            currentBusinessUnitId = directory.userBusinessUnitId(state_.user.id);
        });
        if (abortProvisioning(outcome)) return;

        if (bu.id == currentBusinessUnitId) {
            Registry::provision()->info("[Orchestrator] User {} already in business unit '{}'",
                                        state_.user.name, bu.name);
        } else {
            outcome = runStep(OperationKind::UpdateBusinessUnit, [&] {
                users.updateBusinessUnit(state_.user.id, bu.id);
            });
            if (abortProvisioning(outcome)) return;

            state_.businessUnitChanged = true;
            state_.previousBusinessUnitId = currentBusinessUnitId;
            currentBusinessUnitId = bu.id;
        }
        state_.businessUnit = bu;
    }

    if (!adv.team_name.empty()) {
        outcome = runStep(OperationKind::ResolveTeam, [&] { state_.team = directory.resolveTeam(adv.team_name); });
        if (abortProvisioning(outcome)) return;

        bool added = false;
        outcome = runStep(OperationKind::AddToTeam, [&] { added = users.addUserToTeam(state_.user.id, state_.team.id); });
        if (abortProvisioning(outcome)) return;
        state_.teamJoined = added;
    }

    if (!adv.role_name.empty()) {
        // the user's unit only narrows the role lookup, an unreadable one is not fatal
        if (currentBusinessUnitId.empty()) {
            try {
                currentBusinessUnitId = directory.userBusinessUnitId(state_.user.id);
            } catch (const std::exception& e) {
                Registry::provision()->warn("[Orchestrator] Could not read business unit of user {}, "
                                            "looking up role '{}' in any unit: {}",
                                            state_.user.id, adv.role_name, e.what());
            }
        }

        outcome = runStep(OperationKind::ResolveRole, [&] {
            state_.role = directory.resolveRole(adv.role_name, currentBusinessUnitId.empty()
                                                                   ? std::nullopt
                                                                   : std::optional(currentBusinessUnitId));
        });
        if (abortProvisioning(outcome)) return;

        runStep(OperationKind::RemoveAllRoles, [&] {
            state_.removedRoles = users.removeAllSecurityRoles(state_.user.id).removed;
        });

        AssignmentResult assigned;
        outcome = runStep(OperationKind::AssignRole, [&] {
            assigned = users.assignSecurityRole(state_.user.id, state_.role.id);
        });
        if (abortProvisioning(outcome)) return;
        state_.roleAssigned = !assigned.alreadyPresent;
    }

    Registry::provision()->info("[Orchestrator] Provisioning complete for {} (role: {}, team: {}, business unit: {})",
                                state_.user.name,
                                state_.roleAssigned ? state_.role.name : "unchanged",
                                state_.teamJoined ? state_.team.name : "unchanged",
                                state_.businessUnitChanged ? state_.businessUnit.name : "unchanged");
    endGroup();
}

void Orchestrator::runPipeline(const std::filesystem::path& frameworkRoot) {
    enter(RunStage::Bootstrap);
    beginGroup("Environment setup");
    bootstrap::Environment env(deps_.launcher, cfg_.runtime, deps_.downloader);
    env.ensureRuntimeInstalled();
    env.fetchTestFramework(cfg_.framework.repository_url, cfg_.framework.ref, frameworkRoot);
    env.installFrameworkDependencies(cfg_.browser, frameworkRoot);
    endGroup();

    enter(RunStage::StageTests);
    runner::stageTests(cfg_.test_source_path, frameworkRoot / runner::TESTS_DIR);

    enter(RunStage::Execute);
    runner::TestRunner testRunner(deps_.launcher, frameworkRoot);
    result_ = testRunner.run(cfg_);

    enter(RunStage::CollectArtifacts);
    runner::collectArtifacts(frameworkRoot, cfg_.output_path);
}

int Orchestrator::run() {
    trace_.clear();
    result_.reset();
    cleanup_.reset();

    enter(RunStage::Init);
    const auto frameworkRoot = std::filesystem::absolute(cfg_.framework.work_dir);

    enter(RunStage::ProvisionOrSkip);
    provisionOrSkip();

    int exitCode = 1;
    {
        CleanupLease lease(state_, client_, [this] { return refreshToken(); });

        try {
            runPipeline(frameworkRoot);
        } catch (const std::exception& e) {
            emit(Registry::ppt(), diagnose(std::current_exception()));
            Registry::ppt()->error("[Orchestrator] Run failed: {}", e.what());
        }

        if (result_) exitCode = result_->exitCode;

        enter(RunStage::Cleanup);
        lease.release();
        cleanup_ = lease.report();
    }

    enter(RunStage::Done);
    if (exitCode == 0) Registry::ppt()->info("[Orchestrator] Run succeeded");
    else Registry::ppt()->error("[Orchestrator] Run finished with exit code {}", exitCode);
    return exitCode;
}

Diagnostic diagnose(std::exception_ptr error, const std::optional<OperationKind> kind) {
    Diagnostic d;
    try {
        std::rethrow_exception(std::move(error));
    } catch (const AuthError& e) {
        d.title = "Access token request failed";
        d.status = e.status;
        d.method = "POST";
        d.detail = e.what();
        d.checklist = auth::TokenClient::remediationFor(e.oauthError);
    } catch (const UnauthorizedError& e) {
        d.title = "Dataverse rejected the access token";
        d.status = e.status;
        d.method = e.method;
        d.url = e.url;
        d.detail = e.what();
        d.checklist = {
            "Create an application user for the client id in this environment (Power Platform admin center)",
            "Give the application user a security role such as System Administrator",
            "Check that the Dataverse URL points at the intended environment"
        };
    } catch (const ApiError& e) {
        d.title = "Dataverse request failed";
        d.status = e.status;
        d.method = e.method;
        d.url = e.url;
        d.detail = e.what();
        if (kind == OperationKind::UpdateBusinessUnit) {
            d.checklist = businessUnitRemediation(e.status);
        } else if (kind == OperationKind::AssignRole) {
            d.checklist = roleAssignmentRemediation(e.status);
        } else {
            d.checklist = {
                "Check the application user's security role grants read and write on users, roles and teams",
                "Retry once; Dataverse throttling (429) and transient 5xx responses clear on their own"
            };
        }
    } catch (const NotFoundError& e) {
        d.title = fmt::format("{} lookup failed", e.kind);
        d.detail = e.what();
        d.checklist = {
            fmt::format("Check the {} name '{}' is spelled exactly as it appears in Dataverse", e.kind, e.name),
            "Check the Dataverse URL points at the environment that contains it",
            fmt::format("Check the application user can read {} records", e.kind)
        };
    } catch (const RoleAssignmentError& e) {
        d.title = "Security role could not be assigned";
        d.status = e.lastStatus;
        d.detail = fmt::format("{} (tried: {})", e.what(), fmt::join(e.attempts, ", "));
        d.checklist = roleAssignmentRemediation(e.lastStatus);
    } catch (const BootstrapError& e) {
        d.title = "Test environment setup failed";
        d.detail = e.what();
        d.checklist = {
            "Check the agent can reach nodejs.org, the npm registry and the framework repository",
            "Check git and tar are installed on the agent",
            "Check framework.ref names an existing branch, tag or commit"
        };
    } catch (const TestExecutionError& e) {
        d.title = "Playwright could not be started";
        d.detail = e.what();
        d.checklist = {
            "Check npx is on PATH after the Node.js install",
            "Check the framework's package.json lists @playwright/test"
        };
    } catch (const std::exception& e) {
        d.title = "Unexpected error";
        d.detail = e.what();
    }
    return d;
}

}

#pragma once

#include "bootstrap/Environment.hpp"
#include "config/Config.hpp"
#include "log/Diagnostic.hpp"
#include "provision/CleanupLease.hpp"
#include "provision/Outcome.hpp"
#include "provision/ProvisioningState.hpp"
#include "runner/TestRunner.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace ppt::http { class Transport; }
namespace ppt::process { class Launcher; }
namespace ppt::dataverse { class Client; }

namespace ppt::orchestrator {

enum class RunStage {
    Init,
    ProvisionOrSkip,
    Bootstrap,
    StageTests,
    Execute,
    CollectArtifacts,
    Cleanup,
    Done
};

[[nodiscard]] std::string_view to_string(RunStage stage);

struct Dependencies {
    std::shared_ptr<http::Transport> transport;
    std::shared_ptr<process::Launcher> launcher;
    bootstrap::Environment::Downloader downloader;   // empty: http::download
};

// One run, start to finish. The configuration is borrowed and must outlive
// the orchestrator.
class Orchestrator {
public:
    Orchestrator(const config::RunConfiguration& cfg, Dependencies deps);

    // Process exit code: the runner's code, or 1 when the run failed before
    // the runner produced one. Cleanup never changes it.
    int run();

    // Skipped without a single HTTP call unless every advanced field is set.
    // A fatal step resets the state so nothing is cleaned up. Never throws.
    void provisionOrSkip();

    [[nodiscard]] const std::vector<RunStage>& trace() const { return trace_; }
    [[nodiscard]] const provision::ProvisioningState& provisioning() const { return state_; }
    [[nodiscard]] const std::optional<runner::TestRunResult>& testResult() const { return result_; }
    [[nodiscard]] const std::optional<provision::CleanupReport>& cleanupReport() const { return cleanup_; }

private:
    const config::RunConfiguration& cfg_;
    Dependencies deps_;

    std::vector<RunStage> trace_;
    provision::ProvisioningState state_;
    std::shared_ptr<const dataverse::Client> client_;
    std::optional<runner::TestRunResult> result_;
    std::optional<provision::CleanupReport> cleanup_;

    void enter(RunStage stage);
    void runPipeline(const std::filesystem::path& frameworkRoot);
    bool abortProvisioning(const provision::StepOutcome& outcome);
    [[nodiscard]] auth::AccessToken refreshToken() const;
};

// Maps a failure to the block printed before it surfaces. kind picks the
// remediation list for generic Dataverse errors.
[[nodiscard]] log::Diagnostic diagnose(std::exception_ptr error,
                                       std::optional<provision::OperationKind> kind = std::nullopt);

}

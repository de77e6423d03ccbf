#pragma once

#include "log/Registry.hpp"

#include <exception>
#include <string>
#include <string_view>

namespace ppt::provision {

enum class OperationKind {
    AcquireToken,
    ResolveUser,
    ResolveBusinessUnit,
    UpdateBusinessUnit,
    ResolveTeam,
    AddToTeam,
    ResolveRole,
    RemoveAllRoles,
    AssignRole,
    RemoveRole,
    RemoveFromTeam
};

// Fatal aborts the provisioning phase (the run itself continues).
// Recoverable is logged and the phase carries on.
enum class Severity { Fatal, Recoverable };

[[nodiscard]] Severity policyFor(OperationKind kind);
[[nodiscard]] std::string_view to_string(OperationKind kind);

struct StepOutcome {
    OperationKind kind;
    bool ok = true;
    Severity severity = Severity::Recoverable;
    std::string error;
    std::exception_ptr cause;

    [[nodiscard]] bool fatal() const { return !ok && severity == Severity::Fatal; }
};

// Runs one provisioning operation and classifies any failure through
// policyFor(). Never throws std::exception-derived errors.
template <class Fn>
StepOutcome runStep(const OperationKind kind, Fn&& fn) {
    StepOutcome out{kind};
    try {
        fn();
        return out;
    } catch (const std::exception& e) {
        out.ok = false;
        out.severity = policyFor(kind);
        out.error = e.what();
        out.cause = std::current_exception();
    }

    if (out.severity == Severity::Recoverable)
        log::Registry::provision()->warn("[Provision] {} failed, continuing: {}", to_string(kind), out.error);
    else
        log::Registry::provision()->error("[Provision] {} failed: {}", to_string(kind), out.error);

    return out;
}

}

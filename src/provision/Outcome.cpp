#include "provision/Outcome.hpp"

namespace ppt::provision {

Severity policyFor(const OperationKind kind) {
    switch (kind) {
        case OperationKind::AcquireToken:
        case OperationKind::ResolveUser:
        case OperationKind::ResolveBusinessUnit:
        case OperationKind::UpdateBusinessUnit:
        case OperationKind::ResolveTeam:
        case OperationKind::AddToTeam:
        case OperationKind::ResolveRole:
        case OperationKind::AssignRole:
            return Severity::Fatal;
        case OperationKind::RemoveAllRoles:
        case OperationKind::RemoveRole:
        case OperationKind::RemoveFromTeam:
            return Severity::Recoverable;
    }
    return Severity::Fatal;
}

std::string_view to_string(const OperationKind kind) {
    switch (kind) {
        case OperationKind::AcquireToken: return "AcquireToken";
        case OperationKind::ResolveUser: return "ResolveUser";
        case OperationKind::ResolveBusinessUnit: return "ResolveBusinessUnit";
        case OperationKind::UpdateBusinessUnit: return "UpdateBusinessUnit";
        case OperationKind::ResolveTeam: return "ResolveTeam";
        case OperationKind::AddToTeam: return "AddToTeam";
        case OperationKind::ResolveRole: return "ResolveRole";
        case OperationKind::RemoveAllRoles: return "RemoveAllRoles";
        case OperationKind::AssignRole: return "AssignRole";
        case OperationKind::RemoveRole: return "RemoveRole";
        case OperationKind::RemoveFromTeam: return "RemoveFromTeam";
    }
    return "Unknown";
}

}

#include "onboarding/grant_executor.hpp"
#include "onboarding/scope_resolver.hpp"

#include <exception>
#include <utility>

namespace onboarding {

namespace {

GrantOutcome failed(const GrantRequest& request, ErrorCode error, std::string detail) {
    GrantOutcome outcome;
    outcome.request = request;
    outcome.status  = GrantStatus::Failed;
    outcome.error   = error;
    outcome.detail  = std::move(detail);
    return outcome;
}

} // namespace

// ── GrantExecutor ─────────────────────────────────────────────────────────────

GrantExecutor::GrantExecutor(Collaborators collaborators)
    : collaborators_(std::move(collaborators)) {}

PrincipalResolution GrantExecutor::resolve_principal(const std::string& user_principal_name) const {
    PrincipalResolution result;
    if (!collaborators_.resolve_principal) {
        result.detail = "Identity directory unavailable.";
        return result;
    }

    try {
        result.object_id = collaborators_.resolve_principal(user_principal_name);
    } catch (const std::exception& e) {
        result.detail = std::string("Identity directory error: ") + e.what();
        return result;
    }

    if (!result.object_id)
        result.detail = "User '" + user_principal_name + "' not found in directory.";
    return result;
}

GrantOutcome GrantExecutor::execute(const GrantRequest& request,
                                    const std::string& user_principal_name,
                                    const std::string& subscription_id) const {
    return execute_for(request, resolve_principal(user_principal_name),
                       user_principal_name, subscription_id);
}

GrantOutcome GrantExecutor::execute_for(const GrantRequest& request,
                                        const PrincipalResolution& principal,
                                        const std::string& user_principal_name,
                                        const std::string& subscription_id) const {
    const auto type = parse_resource_type(request.resource_type);
    const GrantRequest canonical = canonical_request(request);

    if (!principal.resolved())
        return failed(canonical, ErrorCode::UnknownPrincipal, principal.detail);

    if (!type) {
        return failed(canonical, ErrorCode::UnknownResourceType,
                      "Unsupported resource type '" + request.resource_type + "'.");
    }
    const std::string scope = scope_for(*type, subscription_id,
                                        request.resource_group_name, request.resource_name);

    if (!collaborators_.assign_role) {
        auto outcome = failed(canonical, ErrorCode::RoleAssignmentFailed,
                              "Role assignment service unavailable.");
        outcome.scope = scope;
        return outcome;
    }

    AssignmentResult result;
    try {
        result = collaborators_.assign_role(*principal.object_id, request.role, scope);
    } catch (const std::exception& e) {
        result = { false, e.what() };
    }

    if (!result.ok) {
        auto outcome  = failed(canonical, ErrorCode::RoleAssignmentFailed, result.detail);
        outcome.scope = scope;
        return outcome;
    }

    GrantOutcome outcome;
    outcome.request = canonical;
    outcome.scope   = scope;
    outcome.status  = GrantStatus::Granted;
    outcome.detail  = "Assigned '" + request.role + "' to " + user_principal_name +
                      " on " + scope;
    return outcome;
}

GrantRequest canonical_request(const GrantRequest& request) {
    GrantRequest canonical = request;
    if (auto type = parse_resource_type(request.resource_type))
        canonical.resource_type = to_string(*type);
    return canonical;
}

GrantOutcome malformed_outcome(const GrantRequest& request, const std::string& reason) {
    return failed(canonical_request(request), ErrorCode::MalformedRow, "Malformed row: " + reason);
}

} // namespace onboarding

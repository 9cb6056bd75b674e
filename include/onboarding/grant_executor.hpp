#pragma once

#include "onboarding/collaborators.hpp"
#include "onboarding/types.hpp"

#include <optional>
#include <string>

namespace onboarding {

/**
 * PrincipalResolution
 *
 * Result of one directory lookup. `detail` explains a failure, including
 * a directory error surfaced as an exception.
 */
struct PrincipalResolution {
    std::optional<std::string> object_id;
    std::string                detail;

    bool resolved() const { return object_id.has_value(); }
};

/**
 * GrantExecutor
 *
 * Applies one GrantRequest:
 *   1. Resolve the principal (skipped by execute_for when the caller already did).
 *   2. Unresolved principal -> Failed / UnknownPrincipal, no assignment call.
 *   3. Resolve the scope; unknown tag -> Failed / UnknownResourceType.
 *   4. Call the role-assignment API exactly once; any failure comes back
 *      verbatim as Failed / RoleAssignmentFailed. No retries.
 */
class GrantExecutor {
public:
    explicit GrantExecutor(Collaborators collaborators);

    /// Looks the principal up for this request alone.
    GrantOutcome execute(const GrantRequest& request,
                         const std::string& user_principal_name,
                         const std::string& subscription_id) const;

    /// Uses an identity resolved once for the whole run.
    GrantOutcome execute_for(const GrantRequest& request,
                             const PrincipalResolution& principal,
                             const std::string& user_principal_name,
                             const std::string& subscription_id) const;

    PrincipalResolution resolve_principal(const std::string& user_principal_name) const;

private:
    Collaborators collaborators_;
};

/// Copy of `request` with a recognised resource-type tag replaced by its
/// canonical spelling; unknown tags are left as written.
GrantRequest canonical_request(const GrantRequest& request);

/// A Failed outcome for a row rejected by the manifest loader.
GrantOutcome malformed_outcome(const GrantRequest& request, const std::string& reason);

} // namespace onboarding

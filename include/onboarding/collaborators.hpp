#pragma once

#include <functional>
#include <optional>
#include <string>

namespace onboarding {

struct AssignmentResult {
    bool        ok = false;
    std::string detail;   // upstream message, passed through verbatim on failure
};

// Directory lookup: principal name -> object id, nullopt when not found.
using ResolvePrincipalFn = std::function<std::optional<std::string>(const std::string& principal_name)>;

// Role-assignment API: (object id, role definition name, scope).
using AssignRoleFn = std::function<AssignmentResult(const std::string& object_id,
                                                    const std::string& role,
                                                    const std::string& scope)>;

/**
 * Collaborators
 *
 * The two external services a run talks to. An empty function is treated
 * as an unavailable service, not as a programming error.
 */
struct Collaborators {
    ResolvePrincipalFn resolve_principal;
    AssignRoleFn       assign_role;
};

} // namespace onboarding

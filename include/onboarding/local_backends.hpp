#pragma once

#include "onboarding/collaborators.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace onboarding {

/**
 * DirectoryFile
 *
 * Identity directory backed by a CSV with columns UserPrincipalName,ObjectId.
 * Principal names match case-insensitively. A missing file is an empty
 * directory.
 */
class DirectoryFile {
public:
    explicit DirectoryFile(const std::string& path);

    std::optional<std::string> resolve(const std::string& principal_name) const;

    bool        found() const { return found_; }
    std::size_t size() const { return ids_.size(); }

    ResolvePrincipalFn resolver() const;

private:
    std::unordered_map<std::string, std::string> ids_;  // lower-cased UPN -> object id
    bool found_ = false;
};

struct RoleAssignment {
    std::string object_id;
    std::string role;
    std::string scope;
};

/**
 * AssignmentLedger
 *
 * Role-assignment store backed by a CSV with columns
 * ObjectId,RoleDefinitionName,Scope. Existing entries are read on
 * construction; each new assignment is appended immediately. Assigning a
 * (principal, role, scope) that is already present fails the way the
 * platform reports a conflict.
 */
class AssignmentLedger {
public:
    explicit AssignmentLedger(std::string path);

    AssignmentResult assign(const std::string& object_id,
                            const std::string& role,
                            const std::string& scope);

    bool contains(const std::string& object_id,
                  const std::string& role,
                  const std::string& scope) const;

    const std::vector<RoleAssignment>& assignments() const { return assignments_; }

    /// Binds to this ledger; the ledger must outlive the returned function.
    AssignRoleFn assigner();

private:
    std::string                 path_;
    std::vector<RoleAssignment> assignments_;
};

} // namespace onboarding

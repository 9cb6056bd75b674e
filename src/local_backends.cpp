#include "onboarding/local_backends.hpp"
#include "onboarding/csv.hpp"
#include "onboarding/strings.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace onboarding {

// ── DirectoryFile ─────────────────────────────────────────────────────────────

DirectoryFile::DirectoryFile(const std::string& path) {
    auto text = read_text_file(path);
    if (!text) return;
    found_ = true;

    const auto table = parse_csv_table(*text);
    for (const auto& record : table.records) {
        const auto upn = table.get(record, "UserPrincipalName");
        const auto id  = table.get(record, "ObjectId");
        if (upn.empty() || id.empty()) continue;
        ids_.emplace(to_lower(upn), id);
    }
}

std::optional<std::string> DirectoryFile::resolve(const std::string& principal_name) const {
    auto it = ids_.find(to_lower(trim(principal_name)));
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

ResolvePrincipalFn DirectoryFile::resolver() const {
    // Copied so the function does not depend on this object's lifetime.
    auto ids = ids_;
    return [ids](const std::string& principal_name) -> std::optional<std::string> {
        auto it = ids.find(to_lower(trim(principal_name)));
        if (it == ids.end()) return std::nullopt;
        return it->second;
    };
}

// ── AssignmentLedger ──────────────────────────────────────────────────────────

static const std::vector<std::string> ledger_header = { "ObjectId", "RoleDefinitionName", "Scope" };

AssignmentLedger::AssignmentLedger(std::string path) : path_(std::move(path)) {
    auto text = read_text_file(path_);
    if (!text) return;

    const auto table = parse_csv_table(*text);
    for (const auto& record : table.records) {
        assignments_.push_back({ table.get(record, "ObjectId"),
                                 table.get(record, "RoleDefinitionName"),
                                 table.get(record, "Scope") });
    }
}

bool AssignmentLedger::contains(const std::string& object_id,
                                const std::string& role,
                                const std::string& scope) const {
    for (const auto& a : assignments_) {
        if (iequals(a.object_id, object_id) && iequals(a.role, role) && iequals(a.scope, scope))
            return true;
    }
    return false;
}

AssignmentResult AssignmentLedger::assign(const std::string& object_id,
                                          const std::string& role,
                                          const std::string& scope) {
    if (contains(object_id, role, scope))
        return { false, "RoleAssignmentExists: The role assignment already exists." };

    std::error_code ec;
    const bool fresh = !fs::exists(path_, ec) || fs::file_size(path_, ec) == 0;

    std::ofstream out(path_, std::ios::app);
    if (!out)
        return { false, "Cannot write role assignment ledger: " + path_ };

    if (fresh) out << csv_line(ledger_header) << "\n";
    out << csv_line({ object_id, role, scope }) << "\n";
    out.flush();
    if (!out)
        return { false, "Cannot write role assignment ledger: " + path_ };

    assignments_.push_back({ object_id, role, scope });
    return { true, "Created role assignment." };
}

AssignRoleFn AssignmentLedger::assigner() {
    return [this](const std::string& object_id, const std::string& role, const std::string& scope) {
        return assign(object_id, role, scope);
    };
}

} // namespace onboarding

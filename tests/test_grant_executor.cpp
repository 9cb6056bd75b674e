#include "onboarding/grant_executor.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace onboarding;

static const std::string sub = "00000000-0000-0000-0000-000000000000";
static const std::string upn = "jane.doe@company.com";

static int passed = 0;
static int failed = 0;

#define ASSERT_EQ(label, expected, actual)                                  \
    do {                                                                    \
        if ((expected) == (actual)) {                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label                              \
                      << "  (expected=" << (expected)                      \
                      << " got=" << (actual) << ")\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

#define ASSERT_TRUE(label, expr)                                            \
    do {                                                                    \
        if ((expr)) {                                                       \
            std::cout << "  [PASS] " << label << "\n";                     \
            ++passed;                                                       \
        } else {                                                            \
            std::cout << "  [FAIL] " << label << "\n";                     \
            ++failed;                                                       \
        }                                                                   \
    } while (0)

// ── Fakes ─────────────────────────────────────────────────────────────────────

struct Call {
    std::string object_id;
    std::string role;
    std::string scope;
};

struct FakeServices {
    int               lookups = 0;
    std::vector<Call> calls;
    bool              known_user = true;
    std::string       reject_role;   // assignments for this role fail

    Collaborators collaborators() {
        return {
            [this](const std::string& name) -> std::optional<std::string> {
                ++lookups;
                if (!known_user || name != upn) return std::nullopt;
                return std::string("U1");
            },
            [this](const std::string& id, const std::string& role, const std::string& scope) {
                calls.push_back({ id, role, scope });
                if (role == reject_role)
                    return AssignmentResult{ false, "AuthorizationFailed: caller lacks write access" };
                return AssignmentResult{ true, "" };
            }
        };
    }
};

static GrantRequest request(const std::string& type, const std::string& name,
                            const std::string& role, const std::string& rg) {
    return { type, name, role, rg };
}

// ── Suites ────────────────────────────────────────────────────────────────────

void test_granted() {
    std::cout << "\n[Granted]\n";
    FakeServices fake;
    GrantExecutor executor(fake.collaborators());

    auto o = executor.execute(request("VirtualMachine", "VM1", "Reader", "RG1"), upn, sub);
    ASSERT_EQ("status Granted", GrantStatus::Granted, o.status);
    ASSERT_EQ("no error", ErrorCode::None, o.error);
    ASSERT_EQ("scope recorded",
              "/subscriptions/" + sub + "/resourceGroups/RG1/providers/Microsoft.Compute/virtualMachines/VM1",
              o.scope);
    ASSERT_EQ("one lookup", 1, fake.lookups);
    ASSERT_EQ("one assignment call", static_cast<std::size_t>(1), fake.calls.size());
    if (!fake.calls.empty()) {
        ASSERT_EQ("called with object id", std::string("U1"), fake.calls[0].object_id);
        ASSERT_EQ("called with role", std::string("Reader"), fake.calls[0].role);
        ASSERT_EQ("called with resolved scope", o.scope, fake.calls[0].scope);
    }
}

void test_unknown_principal() {
    std::cout << "\n[UnknownPrincipal]\n";
    FakeServices fake;
    fake.known_user = false;
    GrantExecutor executor(fake.collaborators());

    auto o = executor.execute(request("KeyVault", "kv1", "Reader", "RG1"), upn, sub);
    ASSERT_EQ("status Failed", GrantStatus::Failed, o.status);
    ASSERT_EQ("UnknownPrincipal", ErrorCode::UnknownPrincipal, o.error);
    ASSERT_EQ("no assignment call", static_cast<std::size_t>(0), fake.calls.size());
    ASSERT_TRUE("detail names the user", o.detail.find(upn) != std::string::npos);
}

void test_unknown_resource_type() {
    std::cout << "\n[UnknownResourceType]\n";
    FakeServices fake;
    GrantExecutor executor(fake.collaborators());

    auto o = executor.execute(request("VM", "VM1", "Reader", "RG1"), upn, sub);
    ASSERT_EQ("UnknownResourceType", ErrorCode::UnknownResourceType, o.error);
    ASSERT_TRUE("detail carries the tag", o.detail.find("'VM'") != std::string::npos);
    ASSERT_TRUE("no scope", o.scope.empty());
    ASSERT_EQ("no assignment call", static_cast<std::size_t>(0), fake.calls.size());
}

void test_upstream_failure_verbatim() {
    std::cout << "\n[RoleAssignmentFailed]\n";
    FakeServices fake;
    fake.reject_role = "Owner";
    GrantExecutor executor(fake.collaborators());

    auto o = executor.execute(request("ResourceGroup", "RG1", "Owner", ""), upn, sub);
    ASSERT_EQ("RoleAssignmentFailed", ErrorCode::RoleAssignmentFailed, o.error);
    ASSERT_EQ("upstream detail verbatim",
              std::string("AuthorizationFailed: caller lacks write access"), o.detail);
    ASSERT_EQ("scope still reported", "/subscriptions/" + sub + "/resourceGroups/RG1", o.scope);
    ASSERT_EQ("exactly one call, no retry", static_cast<std::size_t>(1), fake.calls.size());
}

void test_throwing_collaborators() {
    std::cout << "\n[ThrowingCollaborators]\n";
    Collaborators throwing {
        [](const std::string&) -> std::optional<std::string> {
            throw std::runtime_error("directory timeout");
        },
        [](const std::string&, const std::string&, const std::string&) -> AssignmentResult {
            throw std::runtime_error("TooManyRequests");
        }
    };
    GrantExecutor executor(throwing);

    auto o = executor.execute(request("KeyVault", "kv1", "Reader", "RG1"), upn, sub);
    ASSERT_EQ("directory exception -> UnknownPrincipal", ErrorCode::UnknownPrincipal, o.error);
    ASSERT_TRUE("exception text kept", o.detail.find("directory timeout") != std::string::npos);

    PrincipalResolution resolved;
    resolved.object_id = "U1";
    auto o2 = executor.execute_for(request("KeyVault", "kv1", "Reader", "RG1"), resolved, upn, sub);
    ASSERT_EQ("assignment exception -> RoleAssignmentFailed",
              ErrorCode::RoleAssignmentFailed, o2.error);
    ASSERT_EQ("exception text verbatim", std::string("TooManyRequests"), o2.detail);
}

void test_missing_collaborators() {
    std::cout << "\n[MissingCollaborators]\n";
    GrantExecutor executor(Collaborators{});

    auto o = executor.execute(request("KeyVault", "kv1", "Reader", "RG1"), upn, sub);
    ASSERT_EQ("no directory -> UnknownPrincipal", ErrorCode::UnknownPrincipal, o.error);

    PrincipalResolution resolved;
    resolved.object_id = "U1";
    auto o2 = executor.execute_for(request("KeyVault", "kv1", "Reader", "RG1"), resolved, upn, sub);
    ASSERT_EQ("no assignment API -> RoleAssignmentFailed",
              ErrorCode::RoleAssignmentFailed, o2.error);
}

void test_execute_for_skips_lookup() {
    std::cout << "\n[HoistedIdentity]\n";
    FakeServices fake;
    GrantExecutor executor(fake.collaborators());

    auto principal = executor.resolve_principal(upn);
    ASSERT_TRUE("resolved", principal.resolved());
    for (int i = 0; i < 3; ++i)
        executor.execute_for(request("AKS", "aks1", "Reader", "RG1"), principal, upn, sub);
    ASSERT_EQ("single lookup for three rows", 1, fake.lookups);
    ASSERT_EQ("three assignment calls", static_cast<std::size_t>(3), fake.calls.size());
}

void test_malformed_outcome() {
    std::cout << "\n[MalformedOutcome]\n";
    auto o = malformed_outcome(request("KeyVault", "", "Reader", "RG1"), "missing ResourceName");
    ASSERT_EQ("Failed", GrantStatus::Failed, o.status);
    ASSERT_EQ("MalformedRow", ErrorCode::MalformedRow, o.error);
    ASSERT_TRUE("reason kept", o.detail.find("missing ResourceName") != std::string::npos);
}

// ── Main ──────────────────────────────────────────────────────────────────────

int main() {
    std::cout << "=== Grant Executor Tests ===\n";

    test_granted();
    test_unknown_principal();
    test_unknown_resource_type();
    test_upstream_failure_verbatim();
    test_throwing_collaborators();
    test_missing_collaborators();
    test_execute_for_skips_lookup();
    test_malformed_outcome();

    std::cout << "\n--- Results: "
              << passed << " passed, " << failed << " failed ---\n";
    return failed == 0 ? 0 : 1;
}

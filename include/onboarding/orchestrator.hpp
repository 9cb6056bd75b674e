#pragma once

#include "onboarding/collaborators.hpp"
#include "onboarding/grant_executor.hpp"
#include "onboarding/types.hpp"

#include <optional>
#include <string>

namespace onboarding {

class Transcript;

enum class IdentityMode {
    PerRun,   // one directory lookup for the whole manifest
    PerRow    // one lookup per request
};

struct OrchestratorOptions {
    std::string  manifest_root = ".";
    IdentityMode identity_mode = IdentityMode::PerRun;
};

/// nullopt when the job is usable, otherwise a message naming the first bad field.
std::optional<std::string> validate_job(const OnboardingJob& job);

/// 8-4-4-4-12 hexadecimal digits.
bool is_subscription_id(const std::string& value);

/**
 * OnboardingOrchestrator
 *
 * Runs one onboarding job end to end:
 *   validate -> load manifest -> resolve identity -> one outcome per row.
 *
 * Only InvalidJob and ManifestNotFound stop a run. Every row-level problem
 * becomes a Failed outcome and the next row is still processed, so a
 * completed run has exactly one outcome per manifest row, in file order.
 */
class OnboardingOrchestrator {
public:
    OnboardingOrchestrator(Collaborators collaborators,
                           OrchestratorOptions options = {},
                           Transcript* transcript = nullptr);

    RunReport run(const OnboardingJob& job) const;

    const OrchestratorOptions& options() const { return options_; }

private:
    void log_info(const std::string& message) const;
    void log_error(const std::string& message) const;

    GrantExecutor       executor_;
    OrchestratorOptions options_;
    Transcript*         transcript_;
};

} // namespace onboarding

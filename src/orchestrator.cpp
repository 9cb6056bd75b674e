#include "onboarding/orchestrator.hpp"
#include "onboarding/manifest.hpp"
#include "onboarding/strings.hpp"
#include "onboarding/transcript.hpp"

#include <cctype>
#include <utility>

namespace onboarding {

// ── Job validation ────────────────────────────────────────────────────────────

bool is_subscription_id(const std::string& value) {
    static const std::size_t groups[] = { 8, 4, 4, 4, 12 };

    std::size_t pos = 0;
    for (std::size_t g = 0; g < 5; ++g) {
        if (g > 0) {
            if (pos >= value.size() || value[pos] != '-') return false;
            ++pos;
        }
        for (std::size_t i = 0; i < groups[g]; ++i, ++pos) {
            if (pos >= value.size() || !std::isxdigit(static_cast<unsigned char>(value[pos])))
                return false;
        }
    }
    return pos == value.size();
}

std::optional<std::string> validate_job(const OnboardingJob& job) {
    const std::pair<const char*, const std::string*> fields[] = {
        { "userPrincipalName", &job.user_principal_name },
        { "position",          &job.position            },
        { "client",            &job.client              },
        { "subscriptionId",    &job.subscription_id     },
    };
    for (const auto& f : fields) {
        if (trim(*f.second).empty())
            return std::string(f.first) + " must not be empty.";
    }
    if (!is_subscription_id(job.subscription_id))
        return "subscriptionId '" + job.subscription_id + "' is not a subscription GUID.";
    return std::nullopt;
}

// ── OnboardingOrchestrator ────────────────────────────────────────────────────

OnboardingOrchestrator::OnboardingOrchestrator(Collaborators collaborators,
                                               OrchestratorOptions options,
                                               Transcript* transcript)
    : executor_(std::move(collaborators)),
      options_(std::move(options)),
      transcript_(transcript) {}

void OnboardingOrchestrator::log_info(const std::string& message) const {
    if (transcript_) transcript_->info(message);
}

void OnboardingOrchestrator::log_error(const std::string& message) const {
    if (transcript_) transcript_->error(message);
}

RunReport OnboardingOrchestrator::run(const OnboardingJob& job) const {
    RunReport report;
    report.job_id = job_id(job);

    if (auto problem = validate_job(job)) {
        report.status = RunStatus::InvalidJob;
        report.detail = *problem;
        log_error("Invalid job: " + *problem);
        return report;
    }

    log_info("Onboarding " + job.user_principal_name + " as " + job.position +
             " for " + job.client + " in subscription " + job.subscription_id);

    const auto manifest = load_manifest(job.client, job.position, options_.manifest_root);
    report.manifest_path = manifest.path;
    if (!manifest.loaded()) {
        report.status = RunStatus::ManifestNotFound;
        report.detail = manifest.detail;
        log_error(manifest.detail);
        return report;
    }
    log_info("Loaded " + std::to_string(manifest.rows.size()) + " row(s) from " + manifest.path);

    PrincipalResolution principal;
    const bool per_run = options_.identity_mode == IdentityMode::PerRun;
    if (per_run) {
        principal = executor_.resolve_principal(job.user_principal_name);
        if (principal.resolved())
            log_info("Resolved " + job.user_principal_name + " to " + *principal.object_id);
        else
            log_error(principal.detail);
    }

    report.outcomes.reserve(manifest.rows.size());
    for (const auto& row : manifest.rows) {
        GrantOutcome outcome;
        if (row.malformed())
            outcome = malformed_outcome(row.request, row.malformed_reason);
        else if (per_run)
            outcome = executor_.execute_for(row.request, principal,
                                            job.user_principal_name, job.subscription_id);
        else
            outcome = executor_.execute(row.request, job.user_principal_name, job.subscription_id);
        outcome.line_number = row.line_number;

        const std::string where = "line " + std::to_string(row.line_number) + " " +
                                  row.request.resource_type + "/" + row.request.resource_name +
                                  " [" + row.request.role + "]";
        if (outcome.granted())
            log_info(where + ": " + outcome.detail);
        else
            log_error(where + ": " + to_string(outcome.error) + ": " + outcome.detail);

        report.outcomes.push_back(std::move(outcome));
    }

    report.status = RunStatus::Completed;
    log_info("Granted: " + std::to_string(report.granted_count()) +
             "  Failed: " + std::to_string(report.failed_count()));
    return report;
}

} // namespace onboarding
